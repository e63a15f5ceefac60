// include/chunk.hpp
#pragma once

#include <vector>
#include <string>
#include <cstdint>

#include "content_hasher.hpp"

namespace MediaVault {
namespace Chunks {

// One byte range of an upload, as handed over by the transport layer.
class Chunk {
public:
    uint64_t offset = 0;    // Position of data[0] within the file
    std::vector<char> data; // The actual content of the chunk

    Chunk(uint64_t chunk_offset, std::vector<char> chunk_data)
        : offset(chunk_offset), data(std::move(chunk_data)) {}

    Chunk() = default;

    uint64_t length() const { return data.size(); }
    uint64_t end() const { return offset + data.size(); }

    // SHA-256 of data as hex string.
    std::string checksum() const { return Hashing::ContentHasher::generateSHA256(data); }

    // Compares against a checksum supplied by the sender. An empty expectation always matches.
    bool matches(const std::string& expected_checksum) const {
        return expected_checksum.empty() || expected_checksum == checksum();
    }
};

} // namespace Chunks
} // namespace MediaVault
