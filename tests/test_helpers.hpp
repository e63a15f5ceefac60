// tests/test_helpers.hpp
#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <random>
#include <string>
#include <system_error>
#include <vector>

static int tests_failed = 0;

#define TEST_ASSERT(cond, msg) \
    do { \
        if (!(cond)) { \
            std::cerr << "FAIL: " << msg << " [" << __FILE__ << ":" << __LINE__ << "]" << std::endl; \
            tests_failed++; \
            return false; \
        } \
    } while (0)

// Passes only if expr throws exactly_type (or a subclass).
#define TEST_THROWS(expr, exception_type, msg) \
    do { \
        bool thrown_ = false; \
        try { \
            expr; \
        } catch (const exception_type&) { \
            thrown_ = true; \
        } \
        TEST_ASSERT(thrown_, msg); \
    } while (0)

namespace fs = std::filesystem;

// Fresh directory under the system temp dir, removed on destruction.
class ScratchDir {
public:
    explicit ScratchDir(const std::string& name) {
        auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        dir_ = fs::temp_directory_path() / ("media_vault_" + name + "_" + std::to_string(stamp));
        fs::create_directories(dir_);
    }
    ~ScratchDir() {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }
    const fs::path& path() const { return dir_; }

private:
    fs::path dir_;
};

// Deterministic pseudo-random bytes; different seeds give different content.
inline std::vector<char> makeBytes(size_t size, uint32_t seed) {
    std::mt19937 rng(seed);
    std::vector<char> bytes(size);
    for (auto& b : bytes) {
        b = static_cast<char>(rng() & 0xFF);
    }
    return bytes;
}

inline void writeFile(const fs::path& path, const std::vector<char>& bytes) {
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path());
    }
    std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
    ofs.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
}

inline std::vector<char> readFile(const fs::path& path) {
    std::ifstream ifs(path, std::ios::binary);
    return std::vector<char>((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
}

namespace detail {

inline void putLe16(std::vector<char>& out, uint32_t v) {
    out.push_back(static_cast<char>(v & 0xFF));
    out.push_back(static_cast<char>((v >> 8) & 0xFF));
}

inline void putLe32(std::vector<char>& out, uint32_t v) {
    putLe16(out, v & 0xFFFF);
    putLe16(out, v >> 16);
}

} // namespace detail

// Minimal JPEG whose APP1 segment holds a little-endian TIFF block with
// DateTime in IFD0 and DateTimeOriginal in the Exif sub-IFD. Empty stamps
// are left out. seed varies the scan data so fixtures differ in content.
inline std::vector<char> makeExifJpeg(const std::string& date_time,
                                      const std::string& date_time_original = "",
                                      uint32_t seed = 1) {
    const uint32_t ifd0_entries = (date_time.empty() ? 0 : 1) + (date_time_original.empty() ? 0 : 1);
    const uint32_t exif_ifd_at = 8 + 2 + 12 * ifd0_entries + 4;
    const uint32_t data_at = exif_ifd_at + (date_time_original.empty() ? 0 : 18);
    const uint32_t date_time_at = data_at;
    const uint32_t original_at = data_at + (date_time.empty() ? 0 : static_cast<uint32_t>(date_time.size() + 1));

    std::vector<char> tiff = {'I', 'I', 42, 0, 8, 0, 0, 0};
    detail::putLe16(tiff, ifd0_entries);
    if (!date_time.empty()) {
        detail::putLe16(tiff, 0x0132);
        detail::putLe16(tiff, 2);
        detail::putLe32(tiff, static_cast<uint32_t>(date_time.size() + 1));
        detail::putLe32(tiff, date_time_at);
    }
    if (!date_time_original.empty()) {
        detail::putLe16(tiff, 0x8769);
        detail::putLe16(tiff, 4);
        detail::putLe32(tiff, 1);
        detail::putLe32(tiff, exif_ifd_at);
    }
    detail::putLe32(tiff, 0);
    if (!date_time_original.empty()) {
        detail::putLe16(tiff, 1);
        detail::putLe16(tiff, 0x9003);
        detail::putLe16(tiff, 2);
        detail::putLe32(tiff, static_cast<uint32_t>(date_time_original.size() + 1));
        detail::putLe32(tiff, original_at);
        detail::putLe32(tiff, 0);
    }
    for (const std::string& stamp : {date_time, date_time_original}) {
        if (!stamp.empty()) {
            tiff.insert(tiff.end(), stamp.begin(), stamp.end());
            tiff.push_back('\0');
        }
    }

    std::vector<char> jpeg = {'\xFF', '\xD8'};
    // APP0 JFIF segment ahead of the Exif one.
    const char app0[] = {'\xFF', '\xE0', 0, 16, 'J', 'F', 'I', 'F', 0, 1, 1, 0, 0, 1, 0, 1, 0, 0};
    jpeg.insert(jpeg.end(), app0, app0 + sizeof(app0));
    const size_t app1_length = 2 + 6 + tiff.size();
    const char app1[] = {'\xFF', '\xE1', static_cast<char>(app1_length >> 8), static_cast<char>(app1_length & 0xFF),
                         'E', 'x', 'i', 'f', 0, 0};
    jpeg.insert(jpeg.end(), app1, app1 + sizeof(app1));
    jpeg.insert(jpeg.end(), tiff.begin(), tiff.end());

    const char sos[] = {'\xFF', '\xDA', 0, 2};
    jpeg.insert(jpeg.end(), sos, sos + sizeof(sos));
    std::vector<char> scan = makeBytes(256, seed);
    jpeg.insert(jpeg.end(), scan.begin(), scan.end());
    jpeg.push_back('\xFF');
    jpeg.push_back('\xD9');
    return jpeg;
}

inline int reportResults(const std::string& suite) {
    if (tests_failed == 0) {
        std::cout << "ALL " << suite << " TESTS PASSED" << std::endl;
        return 0;
    }
    std::cerr << tests_failed << " TESTS FAILED" << std::endl;
    return 1;
}
