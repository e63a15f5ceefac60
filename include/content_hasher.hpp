// include/content_hasher.hpp
#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <memory>
#include <filesystem>

#include <openssl/evp.h>
#include <openssl/sha.h>

#include "vault_config.hpp"

namespace MediaVault
{
    namespace Hashing
    {

        // Length of a fingerprint in hex characters (SHA-256).
        static const size_t FINGERPRINT_HEX_LENGTH = SHA256_DIGEST_LENGTH * 2;

        struct HashResult
        {
            std::string digest;       // Lowercase hex SHA-256
            uint64_t bytes_hashed = 0; // Content bytes consumed (excludes fast-key metadata)
        };

        // Incremental SHA-256 over a sequence of buffers.
        class Sha256Stream
        {
        public:
            Sha256Stream();

            void update(const char *data, size_t length);
            void update(const std::vector<char> &data) { update(data.data(), data.size()); }

            // Finalizes the context. The stream cannot be updated afterwards.
            std::string finalHex();

            uint64_t bytesHashed() const { return total_bytes; }

        private:
            struct CtxDeleter
            {
                void operator()(EVP_MD_CTX *ctx) const { EVP_MD_CTX_free(ctx); }
            };

            std::unique_ptr<EVP_MD_CTX, CtxDeleter> ctx;
            uint64_t total_bytes = 0;
            bool finished = false;
        };

        class ContentHasher
        {
        public:
            // Generates SHA-256 of an in-memory buffer and returns it as hex string.
            static std::string generateSHA256(const std::vector<char> &data_buffer);

            // Full-content fingerprint. This is the dedup key.
            // Throws Errors::ReadError if the file cannot be opened or read to the end.
            static HashResult fullFingerprint(const std::filesystem::path &file_path);

            // Pre-filter key over size, mtime and the first sample_size bytes.
            // Equal keys do NOT prove equal content; a differing key proves different content.
            static std::string fastKey(const std::filesystem::path &file_path,
                                       uint64_t file_size,
                                       int64_t mtime,
                                       size_t sample_size);

            // Dispatches on mode: Full returns the full digest, Fast returns the fast key.
            static std::string fingerprint(const std::filesystem::path &file_path,
                                           Config::HashMode mode,
                                           uint64_t file_size,
                                           int64_t mtime,
                                           size_t sample_size);

            static std::string toHex(const unsigned char *bytes, size_t length);

            static const size_t READ_BUFFER_SIZE = 64 * 1024;
        };

    } // namespace Hashing
} // namespace MediaVault
