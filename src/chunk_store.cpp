// src/chunk_store.cpp
#include "chunk_store.hpp"
#include "vault_config.hpp"
#include "vault_errors.hpp"
#include <fstream>
#include <iostream> // For logging

namespace fs = std::filesystem;

namespace MediaVault
{
    namespace Chunks
    {

        const std::string ChunkStore::STAGING_SUFFIX = ".part";

        ChunkStore::ChunkStore(fs::path staging_dir) : staging_root(std::move(staging_dir))
        {
            Config::ensureDirectoryExists(staging_root);
        }

        fs::path ChunkStore::stagingPath(const std::string &token) const
        {
            return staging_root / (token + STAGING_SUFFIX);
        }

        bool ChunkStore::exists(const std::string &token) const
        {
            return fs::exists(stagingPath(token));
        }

        void ChunkStore::prepare(const std::string &token, uint64_t declared_size)
        {
            fs::path part_path = stagingPath(token);
            try
            {
                if (!fs::exists(part_path))
                {
                    std::ofstream ofs(part_path, std::ios::binary);
                    if (!ofs.is_open())
                    {
                        throw Errors::StorageWriteError("Failed to create staging file: " + part_path.string());
                    }
                }
                if (fs::file_size(part_path) != declared_size)
                {
                    fs::resize_file(part_path, declared_size);
                }
            }
            catch (const fs::filesystem_error &e)
            {
                throw Errors::StorageWriteError("Failed to size staging file " + part_path.string() + ": " + e.what());
            }
        }

        void ChunkStore::writeRange(const std::string &token, uint64_t offset, const char *data, size_t length)
        {
            fs::path part_path = stagingPath(token);
            if (!fs::exists(part_path))
            {
                throw Errors::StorageWriteError("Staging file missing for session " + token);
            }

            std::fstream fs_out(part_path, std::ios::in | std::ios::out | std::ios::binary);
            if (!fs_out.is_open())
            {
                throw Errors::StorageWriteError("Failed to open staging file for writing: " + part_path.string());
            }
            fs_out.seekp(static_cast<std::streamoff>(offset));
            fs_out.write(data, static_cast<std::streamsize>(length));
            fs_out.flush();
            if (!fs_out.good())
            {
                throw Errors::StorageWriteError("Failed to write all data to staging file: " + part_path.string());
            }
        }

        std::vector<char> ChunkStore::readRange(const std::string &token, uint64_t offset, size_t length) const
        {
            fs::path part_path = stagingPath(token);
            std::ifstream ifs(part_path, std::ios::binary);
            if (!ifs.is_open())
            {
                throw Errors::ReadError("Failed to open staging file for reading: " + part_path.string());
            }
            ifs.seekg(static_cast<std::streamoff>(offset));
            std::vector<char> buffer(length);
            if (!ifs.read(buffer.data(), static_cast<std::streamsize>(length)))
            {
                throw Errors::ReadError("Failed to read all data from staging file: " + part_path.string());
            }
            return buffer;
        }

        Hashing::HashResult ChunkStore::stageFromSource(const std::string &token,
                                                        const fs::path &source,
                                                        uint64_t expected_size)
        {
            std::ifstream ifs(source, std::ios::binary);
            if (!ifs.is_open())
            {
                throw Errors::ReadError("Failed to open source file: " + source.string());
            }

            fs::path part_path = stagingPath(token);
            std::ofstream ofs(part_path, std::ios::binary | std::ios::trunc);
            if (!ofs.is_open())
            {
                throw Errors::StorageWriteError("Failed to open staging file for writing: " + part_path.string());
            }

            Hashing::Sha256Stream stream;
            std::vector<char> buffer(Hashing::ContentHasher::READ_BUFFER_SIZE);
            while (ifs)
            {
                ifs.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
                const std::streamsize got = ifs.gcount();
                if (got <= 0)
                {
                    continue;
                }
                stream.update(buffer.data(), static_cast<size_t>(got));
                ofs.write(buffer.data(), got);
                if (!ofs.good())
                {
                    throw Errors::StorageWriteError("Failed to write all data to staging file: " + part_path.string());
                }
                if (stream.bytesHashed() > expected_size)
                {
                    break;
                }
            }
            if (ifs.bad())
            {
                throw Errors::ReadError("I/O error while reading source: " + source.string());
            }
            ofs.flush();
            if (!ofs.good())
            {
                throw Errors::StorageWriteError("Failed to flush staging file: " + part_path.string());
            }

            if (stream.bytesHashed() != expected_size)
            {
                throw Errors::SizeMismatch("Source " + source.string() + " declared " + std::to_string(expected_size) +
                                           " bytes but " + (stream.bytesHashed() > expected_size ? "more" : std::to_string(stream.bytesHashed())) +
                                           " were read");
            }

            Hashing::HashResult result;
            result.bytes_hashed = stream.bytesHashed();
            result.digest = stream.finalHex();
            return result;
        }

        bool ChunkStore::discard(const std::string &token)
        {
            std::error_code ec;
            bool removed = fs::remove(stagingPath(token), ec);
            if (ec)
            {
                std::cerr << "Error removing staging file for session " << token << ": " << ec.message() << std::endl;
                return false;
            }
            return removed;
        }

        std::vector<std::string> ChunkStore::listStagedTokens() const
        {
            std::vector<std::string> tokens;
            std::error_code ec;
            for (const auto &entry : fs::directory_iterator(staging_root, ec))
            {
                if (!entry.is_regular_file())
                {
                    continue;
                }
                const fs::path &p = entry.path();
                if (p.extension() == STAGING_SUFFIX)
                {
                    tokens.push_back(p.stem().string());
                }
            }
            if (ec)
            {
                std::cerr << "Error listing staging directory " << staging_root << ": " << ec.message() << std::endl;
            }
            return tokens;
        }

    } // namespace Chunks
} // namespace MediaVault
