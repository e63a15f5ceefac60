// src/content_hasher.cpp
#include "content_hasher.hpp"
#include "vault_errors.hpp"
#include <algorithm>
#include <fstream>
#include <iomanip>   // For std::hex, std::setw, std::setfill
#include <sstream>   // For std::stringstream

#include <openssl/evp.h>

namespace fs = std::filesystem;

namespace MediaVault
{
    namespace Hashing
    {

        Sha256Stream::Sha256Stream()
            : ctx(EVP_MD_CTX_new())
        {
            if (!ctx)
            {
                throw std::runtime_error("Failed to allocate EVP_MD_CTX.");
            }
            if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1)
            {
                throw std::runtime_error("Failed to initialize SHA256 digest.");
            }
        }

        void Sha256Stream::update(const char *data, size_t length)
        {
            if (finished)
            {
                throw std::logic_error("Sha256Stream updated after finalHex()");
            }
            if (length == 0)
            {
                return;
            }
            if (EVP_DigestUpdate(ctx.get(), data, length) != 1)
            {
                throw std::runtime_error("Failed to update SHA256 context with data.");
            }
            total_bytes += length;
        }

        std::string Sha256Stream::finalHex()
        {
            if (finished)
            {
                throw std::logic_error("Sha256Stream finalized twice");
            }
            unsigned char hash[EVP_MAX_MD_SIZE];
            unsigned int hash_len = 0;
            if (EVP_DigestFinal_ex(ctx.get(), hash, &hash_len) != 1)
            {
                throw std::runtime_error("Failed to finalize SHA256 hash calculation.");
            }
            finished = true;
            return ContentHasher::toHex(hash, hash_len);
        }

        std::string ContentHasher::toHex(const unsigned char *bytes, size_t length)
        {
            std::stringstream ss;
            for (size_t i = 0; i < length; i++)
            {
                ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(bytes[i]);
            }
            return ss.str();
        }

        std::string ContentHasher::generateSHA256(const std::vector<char> &data_buffer)
        {
            // SHA256("") = e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855
            Sha256Stream stream;
            stream.update(data_buffer);
            return stream.finalHex();
        }

        HashResult ContentHasher::fullFingerprint(const fs::path &file_path)
        {
            std::ifstream ifs(file_path, std::ios::binary);
            if (!ifs.is_open())
            {
                throw Errors::ReadError("Failed to open file for hashing: " + file_path.string());
            }

            Sha256Stream stream;
            std::vector<char> buffer(READ_BUFFER_SIZE);
            while (ifs)
            {
                ifs.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
                const std::streamsize got = ifs.gcount();
                if (got > 0)
                {
                    stream.update(buffer.data(), static_cast<size_t>(got));
                }
            }
            if (ifs.bad())
            {
                throw Errors::ReadError("I/O error while hashing: " + file_path.string());
            }

            HashResult result;
            result.bytes_hashed = stream.bytesHashed();
            result.digest = stream.finalHex();
            return result;
        }

        std::string ContentHasher::fastKey(const fs::path &file_path,
                                           uint64_t file_size,
                                           int64_t mtime,
                                           size_t sample_size)
        {
            std::ifstream ifs(file_path, std::ios::binary);
            if (!ifs.is_open())
            {
                throw Errors::ReadError("Failed to open file for fast hashing: " + file_path.string());
            }

            Sha256Stream stream;
            const std::string header = "size=" + std::to_string(file_size) + ";mtime=" + std::to_string(mtime) + ";";
            stream.update(header.data(), header.size());

            const uint64_t want = std::min<uint64_t>(file_size, sample_size);
            std::vector<char> buffer(static_cast<size_t>(want));
            if (want > 0)
            {
                ifs.read(buffer.data(), static_cast<std::streamsize>(want));
                if (static_cast<uint64_t>(ifs.gcount()) != want)
                {
                    throw Errors::ReadError("Short read while fast hashing: " + file_path.string());
                }
                stream.update(buffer);
            }
            return stream.finalHex();
        }

        std::string ContentHasher::fingerprint(const fs::path &file_path,
                                               Config::HashMode mode,
                                               uint64_t file_size,
                                               int64_t mtime,
                                               size_t sample_size)
        {
            if (mode == Config::HashMode::Fast)
            {
                return fastKey(file_path, file_size, mtime, sample_size);
            }
            return fullFingerprint(file_path).digest;
        }

    } // namespace Hashing
} // namespace MediaVault
