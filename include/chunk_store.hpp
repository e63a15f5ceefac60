// include/chunk_store.hpp
#pragma once

#include <vector>
#include <string>
#include <cstdint>
#include <filesystem>

#include "chunk.hpp"
#include "content_hasher.hpp"

namespace MediaVault
{
    namespace Chunks
    {

        // Staging area for in-flight uploads. Each session owns one sparse
        // file named after its token; byte ranges are written in place at
        // their offsets and the finished file is handed to the archive.
        class ChunkStore
        {
        public:
            explicit ChunkStore(std::filesystem::path staging_dir);

            std::filesystem::path stagingPath(const std::string &token) const;

            // Creates the staging file sized to declared_size. Keeps existing bytes on resume.
            void prepare(const std::string &token, uint64_t declared_size);

            // Writes bytes at offset. Throws Errors::StorageWriteError on I/O failure.
            void writeRange(const std::string &token, uint64_t offset, const char *data, size_t length);

            std::vector<char> readRange(const std::string &token, uint64_t offset, size_t length) const;

            // Copies a whole source file into staging and hashes it in the same pass.
            // Throws Errors::ReadError if the source is unreadable and
            // Errors::SizeMismatch if it does not hold exactly expected_size bytes.
            Hashing::HashResult stageFromSource(const std::string &token,
                                                const std::filesystem::path &source,
                                                uint64_t expected_size);

            bool exists(const std::string &token) const;

            // Removes the staging file. Returns false if there was nothing to remove.
            bool discard(const std::string &token);

            // Tokens of every staging file currently on disk.
            std::vector<std::string> listStagedTokens() const;

            const std::filesystem::path &directory() const { return staging_root; }

            static const std::string STAGING_SUFFIX;

        private:
            std::filesystem::path staging_root;
        };

    } // namespace Chunks
} // namespace MediaVault
