// src/source_scanner.cpp
#include "source_scanner.hpp"
#include "exif_reader.hpp"
#include "vault_errors.hpp"
#include <algorithm>
#include <cctype>
#include <iostream> // For logging
#include <map>
#include <optional>
#include <set>
#include <system_error>

#include <sys/stat.h>

namespace fs = std::filesystem;

namespace MediaVault
{
    namespace Sources
    {

        namespace
        {
            const std::set<std::string> PHOTO_EXTENSIONS = {
                ".jpg", ".jpeg", ".png", ".heic", ".heif",
                ".gif", ".bmp", ".webp", ".tiff", ".raw", ".cr2", ".nef", ".dng"};

            const std::set<std::string> VIDEO_EXTENSIONS = {
                ".mp4", ".mov", ".avi", ".mkv", ".m4v",
                ".mpg", ".mpeg", ".wmv", ".flv", ".webm"};

            const std::map<std::string, std::string> MIME_TYPES = {
                {".jpg", "image/jpeg"},
                {".jpeg", "image/jpeg"},
                {".png", "image/png"},
                {".heic", "image/heic"},
                {".heif", "image/heif"},
                {".gif", "image/gif"},
                {".bmp", "image/bmp"},
                {".webp", "image/webp"},
                {".tiff", "image/tiff"},
                {".dng", "image/x-adobe-dng"},
                {".mp4", "video/mp4"},
                {".mov", "video/quicktime"},
                {".m4v", "video/x-m4v"},
                {".avi", "video/x-msvideo"},
                {".mkv", "video/x-matroska"},
                {".mpg", "video/mpeg"},
                {".mpeg", "video/mpeg"},
                {".webm", "video/webm"}};
        } // namespace

        std::string normalizedExtension(const fs::path &path)
        {
            std::string ext = path.extension().string();
            std::transform(ext.begin(), ext.end(), ext.begin(),
                           [](unsigned char c)
                           { return static_cast<char>(std::tolower(c)); });
            return ext;
        }

        bool isPhoto(const fs::path &path)
        {
            return PHOTO_EXTENSIONS.count(normalizedExtension(path)) > 0;
        }

        bool isVideo(const fs::path &path)
        {
            return VIDEO_EXTENSIONS.count(normalizedExtension(path)) > 0;
        }

        bool isSupportedMedia(const fs::path &path)
        {
            return isPhoto(path) || isVideo(path);
        }

        std::string mediaTypeFor(const fs::path &path)
        {
            if (isPhoto(path))
                return "photo";
            if (isVideo(path))
                return "video";
            return "other";
        }

        std::string mimeTypeFor(const fs::path &path)
        {
            auto it = MIME_TYPES.find(normalizedExtension(path));
            return it == MIME_TYPES.end() ? "application/octet-stream" : it->second;
        }

        SourceFile describe(const fs::path &path)
        {
            // stat() rather than last_write_time: file_time_type has no portable epoch in C++17.
            struct stat st;
            if (::stat(path.c_str(), &st) != 0 || !S_ISREG(st.st_mode))
            {
                throw Errors::ReadError("Cannot stat source file: " + path.string());
            }
            SourceFile source;
            source.path = path;
            source.size = static_cast<uint64_t>(st.st_size);
            source.mtime = static_cast<int64_t>(st.st_mtime);
            source.capture_time = source.mtime;
            if (isPhoto(path))
            {
                std::optional<int64_t> taken = Exif::readCaptureTime(path);
                if (taken)
                {
                    source.capture_time = *taken;
                }
            }
            return source;
        }

        std::vector<SourceFile> scanDirectory(const fs::path &root, bool media_only)
        {
            std::error_code ec;
            if (!fs::is_directory(root, ec))
            {
                throw Errors::ReadError("Not a directory: " + root.string());
            }

            std::vector<SourceFile> found;
            fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
            if (ec)
            {
                throw Errors::ReadError("Cannot scan " + root.string() + ": " + ec.message());
            }
            const fs::recursive_directory_iterator end;
            while (it != end)
            {
                const fs::path p = it->path();
                bool regular = it->is_regular_file(ec);
                if (!ec && regular && (!media_only || isSupportedMedia(p)))
                {
                    try
                    {
                        found.push_back(describe(p));
                    }
                    catch (const Errors::ReadError &e)
                    {
                        std::cerr << "Skipping " << p << ": " << e.what() << std::endl;
                    }
                }
                ec.clear();
                it.increment(ec);
                if (ec)
                {
                    std::cerr << "Error scanning " << root << ", stopping early: " << ec.message() << std::endl;
                    break;
                }
            }

            std::sort(found.begin(), found.end(),
                      [](const SourceFile &a, const SourceFile &b)
                      { return a.path < b.path; });
            std::cout << "Found " << found.size() << " media file(s) under " << root << std::endl;
            return found;
        }

    } // namespace Sources
} // namespace MediaVault
