// src/aes_file_encryptor.cpp
#include "aes_file_encryptor.hpp"
#include "content_hasher.hpp"
#include "vault_config.hpp"
#include "vault_errors.hpp"
#include <cstdio>
#include <fstream>
#include <iostream> // For logging
#include <memory>
#include <vector>

#include <openssl/evp.h>
#include <openssl/rand.h>

namespace fs = std::filesystem;

namespace MediaVault
{
    namespace Crypto
    {

        const std::string AesFileEncryptor::MAGIC = "MVE1";
        const std::string AesFileEncryptor::ENCRYPTED_SUFFIX = ".enc";

        namespace
        {
            struct CipherCtxDeleter
            {
                void operator()(EVP_CIPHER_CTX *ctx) const { EVP_CIPHER_CTX_free(ctx); }
            };
            using CipherCtx = std::unique_ptr<EVP_CIPHER_CTX, CipherCtxDeleter>;

            CipherCtx newContext()
            {
                CipherCtx ctx(EVP_CIPHER_CTX_new());
                if (!ctx)
                {
                    throw Errors::EncryptionError("Failed to create EVP_CIPHER_CTX");
                }
                return ctx;
            }

            // Sibling used while writing, renamed into place once complete.
            fs::path partialPath(const fs::path &output)
            {
                return output.parent_path() / (output.filename().string() + ".tmp");
            }

            void removeQuietly(const fs::path &p)
            {
                std::error_code ec;
                fs::remove(p, ec);
            }
        } // namespace

        AesFileEncryptor::AesFileEncryptor(const fs::path &key_path,
                                           const fs::path &archive_root,
                                           const fs::path &output_root)
            : archive_root(archive_root), output_root(output_root)
        {
            loadOrCreateKey(key_path);
            Config::ensureDirectoryExists(output_root);
        }

        void AesFileEncryptor::loadOrCreateKey(const fs::path &key_path)
        {
            if (fs::exists(key_path))
            {
                std::ifstream ifs(key_path, std::ios::binary);
                if (!ifs.read(reinterpret_cast<char *>(key.data()), KEY_SIZE) || ifs.peek() != EOF)
                {
                    throw Errors::EncryptionError("Encryption key at " + key_path.string() + " is not " +
                                                  std::to_string(KEY_SIZE) + " bytes");
                }
                std::cout << "Loaded encryption key from " << key_path << std::endl;
                return;
            }

            if (RAND_bytes(key.data(), KEY_SIZE) != 1)
            {
                throw Errors::EncryptionError("RAND_bytes failed while generating the encryption key");
            }
            if (key_path.has_parent_path())
            {
                Config::ensureDirectoryExists(key_path.parent_path());
            }
            {
                std::ofstream ofs(key_path, std::ios::binary | std::ios::trunc);
                if (!ofs.write(reinterpret_cast<const char *>(key.data()), KEY_SIZE))
                {
                    throw Errors::EncryptionError("Failed to save encryption key to " + key_path.string());
                }
            }
            std::error_code ec;
            fs::permissions(key_path, fs::perms::owner_read | fs::perms::owner_write, fs::perm_options::replace, ec);
            if (ec)
            {
                std::cerr << "Warning: could not restrict permissions on " << key_path << ": " << ec.message() << std::endl;
            }
            std::cout << "Generated new encryption key at " << key_path << std::endl;
        }

        fs::path AesFileEncryptor::apply(const fs::path &stored_file)
        {
            fs::path relative = stored_file.lexically_relative(archive_root);
            if (relative.empty() || *relative.begin() == "..")
            {
                relative = stored_file.filename();
            }
            fs::path output = output_root / relative;
            output += ENCRYPTED_SUFFIX;
            encryptFile(stored_file, output);
            return output;
        }

        void AesFileEncryptor::encryptFile(const fs::path &input, const fs::path &output) const
        {
            std::ifstream ifs(input, std::ios::binary);
            if (!ifs.is_open())
            {
                throw Errors::EncryptionError("Failed to open file for encryption: " + input.string());
            }
            if (output.has_parent_path())
            {
                Config::ensureDirectoryExists(output.parent_path());
            }
            const fs::path tmp = partialPath(output);
            std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
            if (!ofs.is_open())
            {
                throw Errors::EncryptionError("Failed to open encryption output: " + tmp.string());
            }

            unsigned char iv[IV_SIZE];
            if (RAND_bytes(iv, IV_SIZE) != 1)
            {
                removeQuietly(tmp);
                throw Errors::EncryptionError("RAND_bytes failed while generating an IV");
            }

            CipherCtx ctx = newContext();
            if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
                EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, IV_SIZE, nullptr) != 1 ||
                EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), iv) != 1)
            {
                removeQuietly(tmp);
                throw Errors::EncryptionError("Failed to initialise AES-256-GCM");
            }

            ofs.write(MAGIC.data(), static_cast<std::streamsize>(MAGIC.size()));
            ofs.write(reinterpret_cast<const char *>(iv), IV_SIZE);

            std::vector<char> in_buf(Hashing::ContentHasher::READ_BUFFER_SIZE);
            std::vector<unsigned char> out_buf(in_buf.size() + EVP_MAX_BLOCK_LENGTH);
            int out_len = 0;
            while (ifs)
            {
                ifs.read(in_buf.data(), static_cast<std::streamsize>(in_buf.size()));
                const std::streamsize got = ifs.gcount();
                if (got <= 0)
                {
                    continue;
                }
                if (EVP_EncryptUpdate(ctx.get(), out_buf.data(), &out_len,
                                      reinterpret_cast<const unsigned char *>(in_buf.data()), static_cast<int>(got)) != 1)
                {
                    removeQuietly(tmp);
                    throw Errors::EncryptionError("EVP_EncryptUpdate failed for " + input.string());
                }
                ofs.write(reinterpret_cast<const char *>(out_buf.data()), out_len);
            }
            if (ifs.bad())
            {
                removeQuietly(tmp);
                throw Errors::EncryptionError("I/O error while reading " + input.string());
            }

            unsigned char tag[TAG_SIZE];
            if (EVP_EncryptFinal_ex(ctx.get(), out_buf.data(), &out_len) != 1 ||
                EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, TAG_SIZE, tag) != 1)
            {
                removeQuietly(tmp);
                throw Errors::EncryptionError("Failed to finish encryption of " + input.string());
            }
            ofs.write(reinterpret_cast<const char *>(out_buf.data()), out_len);
            ofs.write(reinterpret_cast<const char *>(tag), TAG_SIZE);
            ofs.close();
            if (!ofs)
            {
                removeQuietly(tmp);
                throw Errors::EncryptionError("Failed to write encrypted file " + tmp.string());
            }

            std::error_code ec;
            fs::rename(tmp, output, ec);
            if (ec)
            {
                removeQuietly(tmp);
                throw Errors::EncryptionError("Failed to move encrypted file into place: " + ec.message());
            }
        }

        void AesFileEncryptor::decryptFile(const fs::path &input, const fs::path &output) const
        {
            std::error_code ec;
            const uintmax_t total = fs::file_size(input, ec);
            if (ec || total < MAGIC.size() + IV_SIZE + TAG_SIZE)
            {
                throw Errors::EncryptionError("Not an encrypted file: " + input.string());
            }
            std::ifstream ifs(input, std::ios::binary);
            if (!ifs.is_open())
            {
                throw Errors::EncryptionError("Failed to open encrypted file: " + input.string());
            }

            std::string magic(MAGIC.size(), '\0');
            unsigned char iv[IV_SIZE];
            ifs.read(&magic[0], static_cast<std::streamsize>(magic.size()));
            ifs.read(reinterpret_cast<char *>(iv), IV_SIZE);
            if (!ifs || magic != MAGIC)
            {
                throw Errors::EncryptionError("Bad header in encrypted file: " + input.string());
            }

            CipherCtx ctx = newContext();
            if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
                EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, IV_SIZE, nullptr) != 1 ||
                EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), iv) != 1)
            {
                throw Errors::EncryptionError("Failed to initialise AES-256-GCM");
            }

            if (output.has_parent_path())
            {
                Config::ensureDirectoryExists(output.parent_path());
            }
            const fs::path tmp = partialPath(output);
            std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
            if (!ofs.is_open())
            {
                throw Errors::EncryptionError("Failed to open decryption output: " + tmp.string());
            }

            uint64_t remaining = total - MAGIC.size() - IV_SIZE - TAG_SIZE;
            std::vector<char> in_buf(Hashing::ContentHasher::READ_BUFFER_SIZE);
            std::vector<unsigned char> out_buf(in_buf.size() + EVP_MAX_BLOCK_LENGTH);
            int out_len = 0;
            while (remaining > 0)
            {
                const size_t want = remaining < in_buf.size() ? static_cast<size_t>(remaining) : in_buf.size();
                if (!ifs.read(in_buf.data(), static_cast<std::streamsize>(want)))
                {
                    removeQuietly(tmp);
                    throw Errors::EncryptionError("Truncated encrypted file: " + input.string());
                }
                if (EVP_DecryptUpdate(ctx.get(), out_buf.data(), &out_len,
                                      reinterpret_cast<const unsigned char *>(in_buf.data()), static_cast<int>(want)) != 1)
                {
                    removeQuietly(tmp);
                    throw Errors::EncryptionError("EVP_DecryptUpdate failed for " + input.string());
                }
                ofs.write(reinterpret_cast<const char *>(out_buf.data()), out_len);
                remaining -= want;
            }

            unsigned char tag[TAG_SIZE];
            if (!ifs.read(reinterpret_cast<char *>(tag), TAG_SIZE))
            {
                removeQuietly(tmp);
                throw Errors::EncryptionError("Missing authentication tag in " + input.string());
            }
            if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, TAG_SIZE, tag) != 1 ||
                EVP_DecryptFinal_ex(ctx.get(), out_buf.data(), &out_len) != 1)
            {
                removeQuietly(tmp);
                throw Errors::EncryptionError("Authentication failed for " + input.string());
            }
            ofs.write(reinterpret_cast<const char *>(out_buf.data()), out_len);
            ofs.close();
            if (!ofs)
            {
                removeQuietly(tmp);
                throw Errors::EncryptionError("Failed to write decrypted file " + tmp.string());
            }

            fs::rename(tmp, output, ec);
            if (ec)
            {
                removeQuietly(tmp);
                throw Errors::EncryptionError("Failed to move decrypted file into place: " + ec.message());
            }
        }

    } // namespace Crypto
} // namespace MediaVault
