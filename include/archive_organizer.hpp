// include/archive_organizer.hpp
#pragma once

#include <string>
#include <cstdint>
#include <filesystem>

namespace MediaVault
{
    namespace Archive
    {

        // Dated archive layout: root/YEAR/MM_MonthName/filename.
        class ArchiveOrganizer
        {
        public:
            explicit ArchiveOrganizer(std::filesystem::path archive_root);

            // "01_January" ... "12_December". Throws std::out_of_range for other months.
            static std::string monthDirectoryName(int month);

            // Capture time when known, else ingestion time.
            static int64_t archiveTimestamp(int64_t capture_time, int64_t ingested_at);

            // Strips any directory part and rejects names that would escape the archive.
            static std::string sanitizeFilename(const std::string &filename);

            // root/YEAR/MM_MonthName for a UTC timestamp.
            std::filesystem::path directoryFor(int64_t timestamp) const;

            // Name used when `filename` is already taken by different content:
            // stem_<first prefix_length hex chars of fingerprint>.ext
            static std::string disambiguatedName(const std::string &filename,
                                                 const std::string &fingerprint,
                                                 size_t prefix_length);

            // Moves a fully staged file to its final place. The file either appears
            // complete at the returned path or not at all, and an existing file is
            // never replaced. Throws Errors::StorageWriteError on failure.
            std::filesystem::path commit(const std::filesystem::path &staged_file,
                                         const std::string &filename,
                                         const std::string &fingerprint,
                                         int64_t timestamp);

            const std::filesystem::path &root() const { return archive_root; }

            static const size_t SUFFIX_PREFIX_LENGTH = 8;

        private:
            // Publishes `from` at `to` without clobbering. Returns false if `to` already exists.
            bool publishNoClobber(const std::filesystem::path &from, const std::filesystem::path &to,
                                  const std::string &fingerprint);

            std::filesystem::path archive_root;
        };

    } // namespace Archive
} // namespace MediaVault
