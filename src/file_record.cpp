// src/file_record.cpp
#include "file_record.hpp"
#include <ctime>
#include <stdexcept> // For std::invalid_argument

namespace MediaVault {
namespace Metadata {

int64_t nowSeconds() {
    return std::chrono::duration_cast<std::chrono::seconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

std::string toIso8601(int64_t epoch_seconds) {
    std::time_t t = static_cast<std::time_t>(epoch_seconds);
    std::tm tm_utc{};
    gmtime_r(&t, &tm_utc);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm_utc);
    return buf;
}

void to_json(nlohmann::json& j, const FileRecord& r) {
    j = nlohmann::json{
        {"fingerprint", r.fingerprint},
        {"storage_path", r.storage_path},
        {"filename", r.original_filename},
        {"size", r.file_size_bytes},
        {"capture_time", r.capture_time},
        {"ingested_at", toIso8601(r.ingested_at)},
        {"source_device", r.source_device},
        {"media_type", r.media_type},
        {"mime_type", r.mime_type}
    };
}

nlohmann::json FileRecord::toJson() const {
    return *this; // Uses the to_json helper function
}

std::string toString(SessionState state) {
    switch (state) {
        case SessionState::Open: return "open";
        case SessionState::Assembling: return "assembling";
        case SessionState::Completed: return "completed";
        case SessionState::Failed: return "failed";
        case SessionState::Expired: return "expired";
    }
    return "unknown";
}

SessionState sessionStateFromString(const std::string& name) {
    if (name == "open") return SessionState::Open;
    if (name == "assembling") return SessionState::Assembling;
    if (name == "completed") return SessionState::Completed;
    if (name == "failed") return SessionState::Failed;
    if (name == "expired") return SessionState::Expired;
    throw std::invalid_argument("Unknown session state: " + name);
}

bool isTerminal(SessionState state) {
    return state == SessionState::Completed || state == SessionState::Failed || state == SessionState::Expired;
}

std::string toString(Outcome outcome) {
    switch (outcome) {
        case Outcome::None: return "none";
        case Outcome::Stored: return "stored";
        case Outcome::Duplicate: return "duplicate";
        case Outcome::Failed: return "failed";
        case Outcome::Expired: return "expired";
    }
    return "unknown";
}

Outcome outcomeFromString(const std::string& name) {
    if (name == "none" || name.empty()) return Outcome::None;
    if (name == "stored") return Outcome::Stored;
    if (name == "duplicate") return Outcome::Duplicate;
    if (name == "failed") return Outcome::Failed;
    if (name == "expired") return Outcome::Expired;
    throw std::invalid_argument("Unknown outcome: " + name);
}

void to_json(nlohmann::json& j, const UploadSessionRecord& s) {
    j = nlohmann::json{
        {"token", s.token},
        {"filename", s.target_name},
        {"declared_size", s.declared_size},
        {"chunk_size", s.chunk_size},
        {"state", toString(s.state)},
        {"bytes_received", s.bytesReceived()},
        {"bytes_remaining", s.bytesRemaining()},
        {"received_ranges", s.received.toJson()},
        {"created_at", toIso8601(s.created_at)},
        {"last_activity", toIso8601(s.last_activity)},
        {"expires_at", toIso8601(s.expires_at)},
        {"outcome", toString(s.outcome)}
    };
    if (!s.fingerprint.empty()) {
        j["fingerprint"] = s.fingerprint;
    }
    if (!s.error_message.empty()) {
        j["error"] = s.error_message;
    }
}

void to_json(nlohmann::json& j, const SyncHistoryEntry& e) {
    j = nlohmann::json{
        {"fingerprint", e.fingerprint},
        {"session", e.session_token},
        {"outcome", toString(e.outcome)},
        {"at", toIso8601(e.recorded_at)},
        {"detail", e.detail}
    };
}

} // namespace Metadata
} // namespace MediaVault
