// include/aes_file_encryptor.hpp
#pragma once

#include <array>
#include <filesystem>
#include <string>

#include "file_transform.hpp"

namespace MediaVault
{
    namespace Crypto
    {

        // AES-256-GCM file encryption with OpenSSL EVP.
        // Output layout: "MVE1" | 12-byte IV | ciphertext | 16-byte tag.
        // Encrypted copies mirror the archive layout under output_root.
        class AesFileEncryptor : public FileTransform
        {
        public:
            static const size_t KEY_SIZE = 32;
            static const size_t IV_SIZE = 12;
            static const size_t TAG_SIZE = 16;
            static const std::string MAGIC;
            static const std::string ENCRYPTED_SUFFIX;

            // Loads the key at key_path, generating and saving one (mode 0600) if absent.
            // archive_root is used to mirror relative paths under output_root.
            AesFileEncryptor(const std::filesystem::path &key_path,
                             const std::filesystem::path &archive_root,
                             const std::filesystem::path &output_root);

            std::filesystem::path apply(const std::filesystem::path &stored_file) override;

            std::string name() const override { return "aes-256-gcm"; }

            void encryptFile(const std::filesystem::path &input, const std::filesystem::path &output) const;

            // Throws Errors::EncryptionError if the file was tampered with or the key is wrong.
            void decryptFile(const std::filesystem::path &input, const std::filesystem::path &output) const;

        private:
            void loadOrCreateKey(const std::filesystem::path &key_path);

            std::array<unsigned char, KEY_SIZE> key;
            std::filesystem::path archive_root;
            std::filesystem::path output_root;
        };

    } // namespace Crypto
} // namespace MediaVault
