// include/source_scanner.hpp
#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <filesystem>

namespace MediaVault
{
    namespace Sources
    {

        // One candidate file handed to the engine.
        struct SourceFile
        {
            std::filesystem::path path;
            uint64_t size = 0;
            int64_t mtime = 0; // Seconds since the epoch
            // EXIF capture date for photos that carry one, mtime otherwise.
            int64_t capture_time = 0;
        };

        // Lower-cased extension including the dot, e.g. ".jpg".
        std::string normalizedExtension(const std::filesystem::path &path);

        bool isPhoto(const std::filesystem::path &path);
        bool isVideo(const std::filesystem::path &path);
        bool isSupportedMedia(const std::filesystem::path &path);

        // "photo", "video" or "other".
        std::string mediaTypeFor(const std::filesystem::path &path);

        // MIME type by extension, application/octet-stream when unknown.
        std::string mimeTypeFor(const std::filesystem::path &path);

        // Stats a single file and reads its capture date.
        // Throws Errors::ReadError if it can't be stat'ed or opened.
        SourceFile describe(const std::filesystem::path &path);

        // Recursively lists supported photo and video files under root, sorted by path.
        // Unreadable entries are logged and skipped. Throws Errors::ReadError if root is not a directory.
        std::vector<SourceFile> scanDirectory(const std::filesystem::path &root, bool media_only = true);

    } // namespace Sources
} // namespace MediaVault
