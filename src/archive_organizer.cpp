// src/archive_organizer.cpp
#include "archive_organizer.hpp"
#include "vault_config.hpp"
#include "vault_errors.hpp"
#include <ctime>
#include <iostream> // For logging
#include <stdexcept>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

namespace MediaVault
{
    namespace Archive
    {

        namespace
        {
            const char *MONTH_NAMES[12] = {
                "January", "February", "March", "April", "May", "June",
                "July", "August", "September", "October", "November", "December"};
        }

        ArchiveOrganizer::ArchiveOrganizer(fs::path archive_root) : archive_root(std::move(archive_root))
        {
            Config::ensureDirectoryExists(this->archive_root);
        }

        std::string ArchiveOrganizer::monthDirectoryName(int month)
        {
            if (month < 1 || month > 12)
            {
                throw std::out_of_range("Month out of range: " + std::to_string(month));
            }
            std::string prefix = month < 10 ? "0" + std::to_string(month) : std::to_string(month);
            return prefix + "_" + MONTH_NAMES[month - 1];
        }

        int64_t ArchiveOrganizer::archiveTimestamp(int64_t capture_time, int64_t ingested_at)
        {
            return capture_time > 0 ? capture_time : ingested_at;
        }

        std::string ArchiveOrganizer::sanitizeFilename(const std::string &filename)
        {
            std::string name = fs::path(filename).filename().string();
            // Clients on Windows send backslash paths.
            size_t slash = name.find_last_of('\\');
            if (slash != std::string::npos)
            {
                name = name.substr(slash + 1);
            }
            if (name.empty() || name == "." || name == "..")
            {
                return "unnamed";
            }
            return name;
        }

        fs::path ArchiveOrganizer::directoryFor(int64_t timestamp) const
        {
            std::time_t t = static_cast<std::time_t>(timestamp);
            std::tm tm_utc{};
            if (!gmtime_r(&t, &tm_utc))
            {
                throw std::out_of_range("Timestamp cannot be converted to a date: " + std::to_string(timestamp));
            }
            return archive_root / std::to_string(tm_utc.tm_year + 1900) / monthDirectoryName(tm_utc.tm_mon + 1);
        }

        std::string ArchiveOrganizer::disambiguatedName(const std::string &filename,
                                                        const std::string &fingerprint,
                                                        size_t prefix_length)
        {
            fs::path p(filename);
            return p.stem().string() + "_" + fingerprint.substr(0, prefix_length) + p.extension().string();
        }

        bool ArchiveOrganizer::publishNoClobber(const fs::path &from, const fs::path &to, const std::string &fingerprint)
        {
            std::error_code ec;
            fs::create_hard_link(from, to, ec);
            if (!ec)
            {
                return true;
            }
            if (ec == std::errc::file_exists)
            {
                return false;
            }

            if (ec == std::errc::cross_device_link)
            {
                // Staging lives on another filesystem: copy next to the target first,
                // then publish the complete copy with a link.
                fs::path tmp = to.parent_path() / ("." + to.filename().string() + "." + fingerprint.substr(0, SUFFIX_PREFIX_LENGTH) + ".tmp");
                std::error_code copy_ec;
                fs::copy_file(from, tmp, fs::copy_options::overwrite_existing, copy_ec);
                if (copy_ec)
                {
                    std::error_code rm_ec;
                    fs::remove(tmp, rm_ec);
                    throw Errors::StorageWriteError("Failed to copy " + from.string() + " into archive: " + copy_ec.message());
                }
                std::error_code link_ec;
                fs::create_hard_link(tmp, to, link_ec);
                std::error_code rm_ec;
                fs::remove(tmp, rm_ec);
                if (!link_ec)
                {
                    return true;
                }
                if (link_ec == std::errc::file_exists)
                {
                    return false;
                }
                throw Errors::StorageWriteError("Failed to publish " + to.string() + ": " + link_ec.message());
            }

            if (ec == std::errc::operation_not_permitted || ec == std::errc::operation_not_supported ||
                ec == std::errc::function_not_supported)
            {
                // Filesystems without hard links (exFAT, FAT32): fall back to rename.
                if (fs::exists(to))
                {
                    return false;
                }
                std::error_code rename_ec;
                fs::rename(from, to, rename_ec);
                if (rename_ec)
                {
                    throw Errors::StorageWriteError("Failed to move " + from.string() + " to " + to.string() + ": " + rename_ec.message());
                }
                return true;
            }

            throw Errors::StorageWriteError("Failed to publish " + to.string() + ": " + ec.message());
        }

        fs::path ArchiveOrganizer::commit(const fs::path &staged_file,
                                          const std::string &filename,
                                          const std::string &fingerprint,
                                          int64_t timestamp)
        {
            if (!fs::exists(staged_file))
            {
                throw Errors::StorageWriteError("Staged file missing at finalize: " + staged_file.string());
            }

            fs::path dir = Config::ensureDirectoryExists(directoryFor(timestamp));
            const std::string clean_name = sanitizeFilename(filename);

            std::vector<std::string> candidates;
            candidates.push_back(clean_name);
            candidates.push_back(disambiguatedName(clean_name, fingerprint, SUFFIX_PREFIX_LENGTH));
            candidates.push_back(disambiguatedName(clean_name, fingerprint, SUFFIX_PREFIX_LENGTH * 2));
            candidates.push_back(disambiguatedName(clean_name, fingerprint, fingerprint.size()));

            fs::path final_path;
            bool published = false;
            for (const auto &candidate : candidates)
            {
                fs::path target = dir / candidate;
                if (publishNoClobber(staged_file, target, fingerprint))
                {
                    final_path = target;
                    published = true;
                    break;
                }
            }
            // The full-fingerprint name is taken too; only a leftover of the same content can do that.
            for (int counter = 2; !published && counter < 1000; ++counter)
            {
                fs::path p(candidates.back());
                fs::path target = dir / (p.stem().string() + "_" + std::to_string(counter) + p.extension().string());
                if (publishNoClobber(staged_file, target, fingerprint))
                {
                    final_path = target;
                    published = true;
                }
            }
            if (!published)
            {
                throw Errors::StorageWriteError("No free archive name for " + clean_name + " in " + dir.string());
            }

            std::error_code ec;
            if (fs::exists(staged_file))
            {
                fs::remove(staged_file, ec);
                if (ec)
                {
                    std::cerr << "Warning: could not remove staged file " << staged_file << ": " << ec.message() << std::endl;
                }
            }
            if (final_path.filename().string() != clean_name)
            {
                std::cout << "Name collision for " << clean_name << ", stored as " << final_path.filename() << std::endl;
            }
            return final_path;
        }

    } // namespace Archive
} // namespace MediaVault
