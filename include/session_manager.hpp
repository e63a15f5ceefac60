// include/session_manager.hpp
#pragma once

#include <string>
#include <vector>
#include <memory>
#include <mutex>
#include <cstdint>
#include <functional>
#include <unordered_map>
#include <filesystem>

#include "file_record.hpp"
#include "metadata_store.hpp"
#include "chunk_store.hpp"
#include "content_hasher.hpp"
#include "storage_retry.hpp"
#include "vault_config.hpp"

namespace MediaVault
{
    namespace Sessions
    {

        // Returns seconds since the epoch. Tests swap in a manual clock.
        using Clock = std::function<int64_t()>;

        // Called with the token of every session that expires, whichever path expired it.
        using ExpiryListener = std::function<void(const std::string &token)>;

        enum class ChunkResult
        {
            Accepted, // New bytes were written
            Ignored,  // Every byte of the range had already arrived
            Complete  // New bytes were written and the file is now whole (ASSEMBLING)
        };

        // What the finalize step decided for an ASSEMBLING session.
        struct FinalizeDecision
        {
            Metadata::Outcome outcome = Metadata::Outcome::None;
            std::string fingerprint;
            std::string detail; // Stored in the sync history
        };

        using FinalizeWork = std::function<FinalizeDecision(const Metadata::UploadSessionRecord &)>;

        // Owns the upload session state machine:
        //   OPEN -> ASSEMBLING -> COMPLETED | FAILED | EXPIRED
        // Every session has its own mutex; the map lock is only held to find
        // or erase an entry. The in-memory state is a cache over the
        // MetadataStore and is persisted after every accepted chunk.
        class SessionManager
        {
        public:
            SessionManager(Metadata::MetadataStore &store,
                           Chunks::ChunkStore &chunks,
                           const Config::EngineConfig &config,
                           Clock clock = nullptr);

            // Set before any session can expire; runs with the session locked.
            void onExpired(ExpiryListener listener) { expiry_listener = std::move(listener); }

            // Creates an OPEN session and its staging file. Returns the new token.
            std::string open(const std::string &target_name,
                             uint64_t declared_size,
                             int64_t capture_time = 0,
                             const std::string &source_device = "");

            // Records one byte range of at most chunk_size bytes. Only the parts not
            // received before are written.
            // Throws SessionNotFound, ExpiredSession, SessionClosed, InvalidRange,
            // ChecksumMismatch or StorageWriteError; the last two fail the session.
            ChunkResult receiveChunk(const std::string &token,
                                     const Chunks::Chunk &chunk,
                                     const std::string &expected_checksum = "");

            // Fills the whole session from a local file in one pass and returns its
            // full-content hash. The session ends up ASSEMBLING, or FAILED on error.
            Hashing::HashResult receiveFromSource(const std::string &token, const std::filesystem::path &source);

            // Runs work against an ASSEMBLING session with the session locked, then
            // records the decision (COMPLETED) or the thrown error (FAILED).
            // Staging bytes are reclaimed in both cases.
            FinalizeDecision finalize(const std::string &token, const FinalizeWork &work);

            // Completes an OPEN session as a duplicate without receiving any bytes.
            void completeAsDuplicate(const std::string &token, const std::string &fingerprint, const std::string &detail);

            // Marks the session FAILED. Returns false if it was already terminal.
            bool fail(const std::string &token, const std::string &reason);
            bool abort(const std::string &token) { return fail(token, "aborted"); }

            // Snapshot of the session, live or historical.
            Metadata::UploadSessionRecord status(const std::string &token);

            // Expires every idle OPEN/ASSEMBLING session. Returns the expired tokens.
            std::vector<std::string> sweepExpired();

            // Reloads OPEN/ASSEMBLING sessions after a restart and drops orphaned
            // staging files. Returns the number of sessions resumed.
            size_t recover();

            size_t activeCount();
            std::vector<std::string> activeTokens();

            int64_t now() const { return clock(); }

            static std::string generateToken();
            static const size_t TOKEN_BYTES = 16;

        private:
            struct Entry
            {
                std::mutex mtx;
                Metadata::UploadSessionRecord record;
            };

            std::shared_ptr<Entry> find(const std::string &token);
            void forget(const std::string &token);

            // Throws if the session can't take more work. Expires it first if it's idle.
            // Must be called with the entry locked.
            void requireLive(Entry &entry);
            bool isIdle(const Metadata::UploadSessionRecord &record) const;
            void touch(Metadata::UploadSessionRecord &record);

            // Moves a locked entry to a terminal state, persists it, records history
            // and reclaims staging.
            void terminate(Entry &entry, Metadata::SessionState state, Metadata::Outcome outcome,
                           const std::string &detail);

            Metadata::MetadataStore &store;
            Chunks::ChunkStore &chunks;
            int64_t session_timeout;
            uint64_t chunk_size;
            uint64_t max_upload_size;
            Concurrency::RetryPolicy retry_policy;
            Clock clock;
            ExpiryListener expiry_listener;

            std::mutex map_mutex;
            std::unordered_map<std::string, std::shared_ptr<Entry>> sessions;
        };

    } // namespace Sessions
} // namespace MediaVault
