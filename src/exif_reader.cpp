// src/exif_reader.cpp
#include "exif_reader.hpp"
#include "vault_errors.hpp"
#include <cstdio>
#include <cstring>
#include <ctime>
#include <fstream>
#include <vector>

namespace fs = std::filesystem;

namespace MediaVault
{
    namespace Exif
    {

        namespace
        {
            const uint16_t TYPE_ASCII = 2;
            const uint16_t TYPE_LONG = 4;
            const size_t IFD_ENTRY_SIZE = 12;
            const size_t DATE_TIME_LENGTH = 19; // "YYYY:MM:DD HH:MM:SS"

            // TIFF-based raw formats keep IFD0 near the start of the file.
            const size_t MAX_TIFF_SCAN = 1024 * 1024;

            const char EXIF_HEADER[] = {'E', 'x', 'i', 'f', '\0', '\0'};

            class TiffView
            {
            public:
                TiffView(const unsigned char *data, size_t size) : data(data), size(size) {}

                bool readHeader(uint32_t &ifd0)
                {
                    if (size < 8)
                    {
                        return false;
                    }
                    if (data[0] == 'I' && data[1] == 'I')
                    {
                        little_endian = true;
                    }
                    else if (data[0] == 'M' && data[1] == 'M')
                    {
                        little_endian = false;
                    }
                    else
                    {
                        return false;
                    }
                    uint16_t magic = 0;
                    return u16(2, magic) && magic == 42 && u32(4, ifd0);
                }

                bool u16(size_t at, uint16_t &out) const
                {
                    if (at > size || size - at < 2)
                    {
                        return false;
                    }
                    out = little_endian ? static_cast<uint16_t>(data[at] | (data[at + 1] << 8))
                                        : static_cast<uint16_t>((data[at] << 8) | data[at + 1]);
                    return true;
                }

                bool u32(size_t at, uint32_t &out) const
                {
                    if (at > size || size - at < 4)
                    {
                        return false;
                    }
                    const uint32_t b0 = data[at], b1 = data[at + 1], b2 = data[at + 2], b3 = data[at + 3];
                    out = little_endian ? (b0 | (b1 << 8) | (b2 << 16) | (b3 << 24))
                                        : ((b0 << 24) | (b1 << 16) | (b2 << 8) | b3);
                    return true;
                }

                // Finds tag in the IFD at ifd_offset. entry is the offset of its 12-byte record.
                bool findTag(uint32_t ifd_offset, uint16_t tag, size_t &entry) const
                {
                    uint16_t count = 0;
                    if (!u16(ifd_offset, count))
                    {
                        return false;
                    }
                    for (uint16_t i = 0; i < count; ++i)
                    {
                        const size_t at = static_cast<size_t>(ifd_offset) + 2 + i * IFD_ENTRY_SIZE;
                        uint16_t entry_tag = 0;
                        if (!u16(at, entry_tag))
                        {
                            return false;
                        }
                        if (entry_tag == tag)
                        {
                            entry = at;
                            return true;
                        }
                    }
                    return false;
                }

                std::optional<std::string> ascii(uint32_t ifd_offset, uint16_t tag) const
                {
                    size_t entry = 0;
                    uint16_t type = 0;
                    uint32_t count = 0;
                    if (!findTag(ifd_offset, tag, entry) || !u16(entry + 2, type) || !u32(entry + 4, count) ||
                        type != TYPE_ASCII || count == 0)
                    {
                        return std::nullopt;
                    }
                    size_t value_at = entry + 8;
                    if (count > 4)
                    {
                        uint32_t pointer = 0;
                        if (!u32(entry + 8, pointer))
                        {
                            return std::nullopt;
                        }
                        value_at = pointer;
                    }
                    if (value_at > size || size - value_at < count)
                    {
                        return std::nullopt;
                    }
                    const char *text = reinterpret_cast<const char *>(data + value_at);
                    return std::string(text, strnlen(text, count));
                }

                std::optional<uint32_t> pointer(uint32_t ifd_offset, uint16_t tag) const
                {
                    size_t entry = 0;
                    uint16_t type = 0;
                    uint32_t value = 0;
                    if (!findTag(ifd_offset, tag, entry) || !u16(entry + 2, type) || type != TYPE_LONG ||
                        !u32(entry + 8, value))
                    {
                        return std::nullopt;
                    }
                    return value;
                }

            private:
                const unsigned char *data;
                size_t size;
                bool little_endian = true;
            };

            std::optional<int64_t> captureTimeFromJpeg(std::ifstream &ifs)
            {
                unsigned char header[4];
                for (;;)
                {
                    if (!ifs.read(reinterpret_cast<char *>(header), 2) || header[0] != 0xFF)
                    {
                        return std::nullopt;
                    }
                    const unsigned char marker = header[1];
                    if (marker == 0xFF)
                    {
                        // Fill byte; the marker follows.
                        ifs.seekg(-1, std::ios::cur);
                        continue;
                    }
                    if (marker == 0xD9 || marker == 0xDA)
                    {
                        // End of image or start of scan: no metadata past this point.
                        return std::nullopt;
                    }
                    if (marker == 0x01 || (marker >= 0xD0 && marker <= 0xD7))
                    {
                        continue;
                    }
                    if (!ifs.read(reinterpret_cast<char *>(header + 2), 2))
                    {
                        return std::nullopt;
                    }
                    const size_t length = static_cast<size_t>((header[2] << 8) | header[3]);
                    if (length < 2)
                    {
                        return std::nullopt;
                    }
                    const size_t body_size = length - 2;
                    if (marker != 0xE1)
                    {
                        ifs.seekg(static_cast<std::streamoff>(body_size), std::ios::cur);
                        continue;
                    }

                    std::vector<unsigned char> body(body_size);
                    if (!ifs.read(reinterpret_cast<char *>(body.data()), static_cast<std::streamsize>(body_size)))
                    {
                        return std::nullopt;
                    }
                    // APP1 also carries XMP; only the Exif flavour holds a TIFF block.
                    if (body_size > sizeof(EXIF_HEADER) && std::memcmp(body.data(), EXIF_HEADER, sizeof(EXIF_HEADER)) == 0)
                    {
                        return captureTimeFromTiff(body.data() + sizeof(EXIF_HEADER), body_size - sizeof(EXIF_HEADER));
                    }
                }
            }
        } // namespace

        std::optional<int64_t> parseDateTime(const std::string &stamp)
        {
            if (stamp.size() < DATE_TIME_LENGTH)
            {
                return std::nullopt;
            }
            int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
            if (std::sscanf(stamp.c_str(), "%4d:%2d:%2d %2d:%2d:%2d", &year, &month, &day, &hour, &minute, &second) != 6)
            {
                return std::nullopt;
            }
            if (year < 1900 || month < 1 || month > 12 || day < 1 || day > 31 ||
                hour > 23 || minute > 59 || second > 60)
            {
                return std::nullopt;
            }

            std::tm tm_utc = {};
            tm_utc.tm_year = year - 1900;
            tm_utc.tm_mon = month - 1;
            tm_utc.tm_mday = day;
            tm_utc.tm_hour = hour;
            tm_utc.tm_min = minute;
            tm_utc.tm_sec = second;
            const time_t t = timegm(&tm_utc);
            if (t == static_cast<time_t>(-1))
            {
                return std::nullopt;
            }
            return static_cast<int64_t>(t);
        }

        std::optional<int64_t> captureTimeFromTiff(const unsigned char *data, size_t size)
        {
            TiffView tiff(data, size);
            uint32_t ifd0 = 0;
            if (!tiff.readHeader(ifd0))
            {
                return std::nullopt;
            }

            std::optional<uint32_t> exif_ifd = tiff.pointer(ifd0, TAG_EXIF_IFD_POINTER);
            if (exif_ifd)
            {
                std::optional<std::string> original = tiff.ascii(*exif_ifd, TAG_DATE_TIME_ORIGINAL);
                if (original)
                {
                    std::optional<int64_t> t = parseDateTime(*original);
                    if (t)
                    {
                        return t;
                    }
                }
            }

            std::optional<std::string> modified = tiff.ascii(ifd0, TAG_DATE_TIME);
            return modified ? parseDateTime(*modified) : std::nullopt;
        }

        std::optional<int64_t> readCaptureTime(const fs::path &path)
        {
            std::ifstream ifs(path, std::ios::binary);
            if (!ifs.is_open())
            {
                throw Errors::ReadError("Failed to open file for EXIF: " + path.string());
            }

            unsigned char magic[2];
            if (!ifs.read(reinterpret_cast<char *>(magic), 2))
            {
                return std::nullopt;
            }
            if (magic[0] == 0xFF && magic[1] == 0xD8)
            {
                return captureTimeFromJpeg(ifs);
            }
            if ((magic[0] == 'I' && magic[1] == 'I') || (magic[0] == 'M' && magic[1] == 'M'))
            {
                std::vector<unsigned char> head(MAX_TIFF_SCAN);
                head[0] = magic[0];
                head[1] = magic[1];
                ifs.read(reinterpret_cast<char *>(head.data() + 2), static_cast<std::streamsize>(head.size() - 2));
                if (ifs.bad())
                {
                    throw Errors::ReadError("I/O error while reading EXIF: " + path.string());
                }
                head.resize(2 + static_cast<size_t>(ifs.gcount()));
                return captureTimeFromTiff(head.data(), head.size());
            }
            return std::nullopt;
        }

    } // namespace Exif
} // namespace MediaVault
