// include/file_transform.hpp
#pragma once

#include <filesystem>
#include <string>

namespace MediaVault {
namespace Crypto {

// Post-store step applied to a file that is already in the archive.
// Returns the path of the transformed artifact. Failures are thrown and
// degrade the outcome; they never undo the stored record.
class FileTransform {
public:
    virtual ~FileTransform() = default;

    virtual std::filesystem::path apply(const std::filesystem::path& stored_file) = 0;

    virtual std::string name() const = 0;
};

} // namespace Crypto
} // namespace MediaVault
