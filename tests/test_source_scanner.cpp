// tests/test_source_scanner.cpp
#include "source_scanner.hpp"
#include "vault_errors.hpp"
#include "test_helpers.hpp"

using namespace MediaVault;

bool test_media_classification() {
    std::cout << "Testing media classification..." << std::endl;
    TEST_ASSERT(Sources::normalizedExtension("DCIM/IMG_1.JPG") == ".jpg", "Extension should be lower-cased");
    TEST_ASSERT(Sources::isPhoto("a.HEIC"), "HEIC is a photo");
    TEST_ASSERT(Sources::isVideo("b.Mov"), "MOV is a video");
    TEST_ASSERT(!Sources::isSupportedMedia("notes.txt"), "Text files are not media");
    TEST_ASSERT(!Sources::isSupportedMedia("README"), "Files without extension are not media");

    TEST_ASSERT(Sources::mediaTypeFor("x.dng") == "photo", "DNG should be a photo");
    TEST_ASSERT(Sources::mediaTypeFor("x.mkv") == "video", "MKV should be a video");
    TEST_ASSERT(Sources::mediaTypeFor("x.pdf") == "other", "PDF should be other");

    TEST_ASSERT(Sources::mimeTypeFor("x.jpeg") == "image/jpeg", "JPEG MIME type mismatch");
    TEST_ASSERT(Sources::mimeTypeFor("x.MOV") == "video/quicktime", "MOV MIME type mismatch");
    TEST_ASSERT(Sources::mimeTypeFor("x.xyz") == "application/octet-stream", "Unknown types fall back to octet-stream");
    std::cout << "PASS: media classification" << std::endl;
    return true;
}

bool test_scan_directory(const fs::path& dir) {
    std::cout << "Testing recursive scan..." << std::endl;
    fs::path card = dir / "card";
    writeFile(card / "DCIM" / "100CANON" / "IMG_0002.JPG", makeBytes(300, 41));
    writeFile(card / "DCIM" / "100CANON" / "IMG_0001.CR2", makeBytes(200, 42));
    writeFile(card / "DCIM" / "101CANON" / "MVI_0003.MP4", makeBytes(500, 43));
    writeFile(card / "MISC" / "autorun.inf", makeBytes(10, 44));
    fs::create_directories(card / "EMPTY");

    std::vector<Sources::SourceFile> media = Sources::scanDirectory(card);
    TEST_ASSERT(media.size() == 3, "Expected three media files, got " << media.size());
    TEST_ASSERT(media[0].path.filename() == "IMG_0001.CR2", "Results should be sorted by path");
    TEST_ASSERT(media[1].path.filename() == "IMG_0002.JPG", "Results should be sorted by path");
    TEST_ASSERT(media[2].path.filename() == "MVI_0003.MP4", "Results should be sorted by path");
    TEST_ASSERT(media[0].size == 200 && media[2].size == 500, "Sizes should come from the file system");
    TEST_ASSERT(media[1].mtime > 0, "Modification time should be filled in");

    std::vector<Sources::SourceFile> everything = Sources::scanDirectory(card, false);
    TEST_ASSERT(everything.size() == 4, "Without the media filter every file is listed, got " << everything.size());

    TEST_THROWS(Sources::scanDirectory(card / "MISC" / "autorun.inf"), Errors::ReadError, "A file is not a scan root");
    TEST_THROWS(Sources::scanDirectory(dir / "no_such_card"), Errors::ReadError, "Missing root must raise ReadError");
    TEST_THROWS(Sources::describe(dir / "no_such_file.jpg"), Errors::ReadError, "Missing file cannot be described");
    std::cout << "PASS: recursive scan" << std::endl;
    return true;
}

bool test_capture_time_prefers_exif(const fs::path& dir) {
    std::cout << "Testing capture time from EXIF..." << std::endl;
    fs::path tagged = dir / "dated" / "IMG_0100.JPG";
    writeFile(tagged, makeExifJpeg("2019:07:04 12:30:00"));
    Sources::SourceFile photo = Sources::describe(tagged);
    TEST_ASSERT(photo.capture_time == 1562243400, "EXIF DateTime should be the capture time, got " << photo.capture_time);
    TEST_ASSERT(photo.mtime > photo.capture_time, "mtime should still be the file system time");

    fs::path plain = dir / "dated" / "IMG_0101.jpg";
    writeFile(plain, makeBytes(300, 45));
    Sources::SourceFile untagged = Sources::describe(plain);
    TEST_ASSERT(untagged.capture_time == untagged.mtime, "Photo without EXIF should fall back to mtime");

    // EXIF bytes in a video are not consulted.
    fs::path clip = dir / "dated" / "MVI_0102.mp4";
    writeFile(clip, makeExifJpeg("2019:07:04 12:30:00"));
    Sources::SourceFile video = Sources::describe(clip);
    TEST_ASSERT(video.capture_time == video.mtime, "Videos are dated by mtime");
    std::cout << "PASS: capture time from EXIF" << std::endl;
    return true;
}

int main() {
    std::cout << "Running SourceScanner Tests..." << std::endl;
    ScratchDir scratch("scanner");

    test_media_classification();
    test_scan_directory(scratch.path());
    test_capture_time_prefers_exif(scratch.path());

    return reportResults("SOURCE SCANNER");
}
