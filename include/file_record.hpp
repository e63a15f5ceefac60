// include/file_record.hpp
#pragma once

#include <string>
#include <cstdint>
#include <chrono> // For timestamps

#include <nlohmann/json.hpp>

#include "byte_range_set.hpp"

namespace MediaVault {
namespace Metadata {

// Seconds since the Unix epoch, UTC.
int64_t nowSeconds();

// Formats as YYYY-MM-DDTHH:MM:SSZ
std::string toIso8601(int64_t epoch_seconds);

// A unique piece of content that has been stored in the archive.
class FileRecord {
public:
    std::string fingerprint;        // SHA-256 of the content; unique
    std::string storage_path;       // Final location inside the archive
    std::string original_filename;
    uint64_t file_size_bytes = 0;
    int64_t capture_time = 0;       // Capture/modification time, 0 if unknown
    int64_t ingested_at = 0;
    std::string source_device;
    std::string fast_key;
    std::string media_type;         // photo, video or other
    std::string mime_type;
    std::string upload_session;     // Token of the session that stored it

    FileRecord() = default;

    nlohmann::json toJson() const;
};

enum class SessionState {
    Open,
    Assembling,
    Completed,
    Failed,
    Expired
};

std::string toString(SessionState state);
SessionState sessionStateFromString(const std::string& name);
bool isTerminal(SessionState state);

enum class Outcome {
    None,       // Not finished yet
    Stored,
    Duplicate,
    Failed,
    Expired
};

std::string toString(Outcome outcome);
Outcome outcomeFromString(const std::string& name);

// Persisted view of one upload session.
struct UploadSessionRecord {
    std::string token;
    std::string target_name;
    uint64_t declared_size = 0;
    uint64_t chunk_size = 0;
    Sessions::ByteRangeSet received;
    SessionState state = SessionState::Open;
    int64_t created_at = 0;
    int64_t last_activity = 0;
    int64_t expires_at = 0;
    int64_t capture_time = 0;
    std::string source_device;
    std::string fingerprint;
    Outcome outcome = Outcome::None;
    std::string error_message;
    int retry_count = 0;

    uint64_t bytesReceived() const { return received.totalBytes(); }
    uint64_t bytesRemaining() const { return declared_size - received.totalBytes(); }
};

// Append-only audit entry for one finished submission.
struct SyncHistoryEntry {
    int64_t id = 0;
    std::string fingerprint;
    std::string session_token;
    Outcome outcome = Outcome::None;
    int64_t recorded_at = 0;
    std::string detail;
};

void to_json(nlohmann::json& j, const FileRecord& r);
void to_json(nlohmann::json& j, const UploadSessionRecord& s);
void to_json(nlohmann::json& j, const SyncHistoryEntry& e);

} // namespace Metadata
} // namespace MediaVault
