// tests/test_aes_file_encryptor.cpp
#include "aes_file_encryptor.hpp"
#include "vault_errors.hpp"
#include "test_helpers.hpp"

using namespace MediaVault;
using Crypto::AesFileEncryptor;

bool test_round_trip(const fs::path& dir) {
    std::cout << "Testing encrypt/decrypt round trip..." << std::endl;
    fs::path archive = dir / "archive";
    AesFileEncryptor encryptor(dir / "keys" / "vault.key", archive, dir / "encrypted");

    std::vector<char> data = makeBytes(70000, 31);
    fs::path stored = archive / "2023" / "11_November" / "IMG_0001.jpg";
    writeFile(stored, data);

    fs::path encrypted = encryptor.apply(stored);
    TEST_ASSERT(encrypted == dir / "encrypted" / "2023" / "11_November" / "IMG_0001.jpg.enc",
                "Encrypted copy should mirror the archive layout, got " << encrypted);
    std::vector<char> blob = readFile(encrypted);
    TEST_ASSERT(blob.size() == AesFileEncryptor::MAGIC.size() + AesFileEncryptor::IV_SIZE + data.size() + AesFileEncryptor::TAG_SIZE,
                "Unexpected encrypted size " << blob.size());
    TEST_ASSERT(std::string(blob.begin(), blob.begin() + 4) == AesFileEncryptor::MAGIC, "Encrypted file should start with the magic");
    TEST_ASSERT(readFile(stored) == data, "Stored file must be left untouched");

    fs::path restored = dir / "restored.jpg";
    encryptor.decryptFile(encrypted, restored);
    TEST_ASSERT(readFile(restored) == data, "Decrypted bytes should equal the original");
    TEST_ASSERT(encryptor.name() == "aes-256-gcm", "Transform name mismatch");
    std::cout << "PASS: encrypt/decrypt round trip" << std::endl;
    return true;
}

bool test_tampering_is_detected(const fs::path& dir) {
    std::cout << "Testing tamper detection..." << std::endl;
    AesFileEncryptor encryptor(dir / "tamper.key", dir, dir / "tamper_out");
    fs::path plain = dir / "clip.mov";
    writeFile(plain, makeBytes(4096, 32));
    fs::path encrypted = dir / "clip.mov.enc";
    encryptor.encryptFile(plain, encrypted);

    std::vector<char> blob = readFile(encrypted);
    blob[blob.size() / 2] ^= 0x01;
    writeFile(encrypted, blob);
    TEST_THROWS(encryptor.decryptFile(encrypted, dir / "clip_out.mov"), Errors::EncryptionError,
                "Flipped ciphertext bit must fail authentication");
    TEST_ASSERT(!fs::exists(dir / "clip_out.mov"), "No plaintext should be published after a failed check");

    writeFile(dir / "not_encrypted.bin", makeBytes(100, 33));
    TEST_THROWS(encryptor.decryptFile(dir / "not_encrypted.bin", dir / "junk.out"), Errors::EncryptionError,
                "File without the magic must be rejected");
    std::cout << "PASS: tamper detection" << std::endl;
    return true;
}

bool test_key_is_persisted(const fs::path& dir) {
    std::cout << "Testing key persistence..." << std::endl;
    fs::path key = dir / "persist.key";
    fs::path plain = dir / "photo.png";
    writeFile(plain, makeBytes(1000, 34));
    {
        AesFileEncryptor first(key, dir, dir / "persist_out");
        first.encryptFile(plain, dir / "photo.png.enc");
    }
    TEST_ASSERT(fs::file_size(key) == AesFileEncryptor::KEY_SIZE, "Key file should hold 32 bytes");
    fs::perms perms = fs::status(key).permissions();
    TEST_ASSERT((perms & (fs::perms::group_all | fs::perms::others_all)) == fs::perms::none,
                "Key file must only be readable by its owner");

    AesFileEncryptor second(key, dir, dir / "persist_out");
    second.decryptFile(dir / "photo.png.enc", dir / "photo_back.png");
    TEST_ASSERT(readFile(dir / "photo_back.png") == readFile(plain), "A reloaded key should decrypt earlier output");

    AesFileEncryptor other(dir / "other.key", dir, dir / "persist_out");
    TEST_THROWS(other.decryptFile(dir / "photo.png.enc", dir / "photo_wrong.png"), Errors::EncryptionError,
                "A different key must fail authentication");
    std::cout << "PASS: key persistence" << std::endl;
    return true;
}

int main() {
    std::cout << "Running AesFileEncryptor Tests..." << std::endl;
    ScratchDir scratch("crypto");

    test_round_trip(scratch.path());
    test_tampering_is_detected(scratch.path());
    test_key_is_persisted(scratch.path());

    return reportResults("AES FILE ENCRYPTOR");
}
