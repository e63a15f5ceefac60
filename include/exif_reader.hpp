// include/exif_reader.hpp
#pragma once

#include <string>
#include <cstdint>
#include <cstddef>
#include <optional>
#include <filesystem>

namespace MediaVault
{
    namespace Exif
    {

        // Tags read from IFD0 and the Exif sub-IFD.
        static const uint16_t TAG_DATE_TIME = 0x0132;
        static const uint16_t TAG_EXIF_IFD_POINTER = 0x8769;
        static const uint16_t TAG_DATE_TIME_ORIGINAL = 0x9003;

        // Parses an EXIF "YYYY:MM:DD HH:MM:SS" stamp as UTC seconds since the epoch.
        // Zeroed placeholders and out-of-range fields give std::nullopt.
        std::optional<int64_t> parseDateTime(const std::string &stamp);

        // Walks a TIFF structure (byte order mark first) and returns
        // DateTimeOriginal, or DateTime when that is absent. Every offset is
        // bounds-checked against size; malformed data gives std::nullopt.
        std::optional<int64_t> captureTimeFromTiff(const unsigned char *data, size_t size);

        // Capture time of a JPEG (APP1 Exif segment) or TIFF-based file.
        // Files without a usable stamp give std::nullopt.
        // Throws Errors::ReadError if the file can't be opened.
        std::optional<int64_t> readCaptureTime(const std::filesystem::path &path);

    } // namespace Exif
} // namespace MediaVault
