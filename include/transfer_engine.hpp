// include/transfer_engine.hpp
#pragma once

#include <atomic>
#include <condition_variable>
#include <filesystem>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

#include "archive_organizer.hpp"
#include "chunk_store.hpp"
#include "dedup_index.hpp"
#include "file_record.hpp"
#include "file_transform.hpp"
#include "metadata_store.hpp"
#include "session_manager.hpp"
#include "source_scanner.hpp"
#include "thread_pool.hpp"
#include "vault_config.hpp"

namespace MediaVault
{
    namespace Engine
    {

        // Result of one submission (whole file or finalized upload).
        struct SubmitResult
        {
            Metadata::Outcome outcome = Metadata::Outcome::None;
            std::string source;        // Source path or upload target name
            std::string session_token;
            std::string fingerprint;
            std::string storage_path;  // Where the content lives, ours or the earlier copy
            std::string encrypted_path;
            bool degraded = false;     // Stored, but the post-store transform failed
            std::string message;

            nlohmann::json toJson() const;
        };

        struct ChunkAck
        {
            Sessions::ChunkResult result = Sessions::ChunkResult::Accepted;
            Metadata::SessionState state = Metadata::SessionState::Open;
            uint64_t bytes_received = 0;
            uint64_t bytes_remaining = 0;

            nlohmann::json toJson() const;
        };

        // Eventually consistent counters, safe to poll from any thread.
        struct ProgressSnapshot
        {
            uint64_t queued_files = 0;
            uint64_t in_flight_files = 0;
            uint64_t stored_files = 0;
            uint64_t duplicate_files = 0;
            uint64_t failed_files = 0;

            nlohmann::json toJson() const;
        };

        struct BatchSummary
        {
            size_t backed_up = 0;
            size_t skipped_duplicates = 0;
            size_t failed = 0;
            std::vector<SubmitResult> results; // In submission order

            nlohmann::json toJson() const;
        };

        struct PoolLoad
        {
            std::string name;
            size_t workers = 0;
            size_t active = 0;
            size_t queued = 0;

            nlohmann::json toJson() const;
        };

        struct Statistics
        {
            int64_t stored_files = 0;
            int64_t stored_bytes = 0;
            std::map<Metadata::Outcome, int64_t> history;
            size_t active_sessions = 0;
            ProgressSnapshot progress;
            std::vector<PoolLoad> pools;

            nlohmann::json toJson() const;
        };

        // Orchestrates submissions: fingerprints, deduplicates and commits files
        // into the archive through upload sessions. Two pools bound the work:
        // finalize/whole-file transfers and raw file operations. Callers block
        // on their own result; saturation only makes them wait longer.
        class TransferEngine
        {
        public:
            explicit TransferEngine(Config::EngineConfig config,
                                    Sessions::Clock clock = nullptr,
                                    std::unique_ptr<Crypto::FileTransform> transform = nullptr);
            ~TransferEngine();

            TransferEngine(const TransferEngine &) = delete;
            TransferEngine &operator=(const TransferEngine &) = delete;

            // --- Local files ---

            // Backs up one file as a single-chunk session. Never throws for per-file errors.
            SubmitResult submitWhole(const Sources::SourceFile &source, const std::string &source_device = "");
            std::future<SubmitResult> submitWholeAsync(const Sources::SourceFile &source, const std::string &source_device = "");
            BatchSummary submitBatch(const std::vector<Sources::SourceFile> &sources, const std::string &source_device = "");

            // --- Chunked uploads ---

            std::string openSession(uint64_t declared_size,
                                    const std::string &target_name,
                                    int64_t capture_time = 0,
                                    const std::string &source_device = "");

            ChunkAck writeChunk(const std::string &token,
                                uint64_t offset,
                                std::vector<char> bytes,
                                const std::string &expected_checksum = "");

            // Finalizes an ASSEMBLING session. Session errors (not found, expired,
            // closed, incomplete) are thrown; everything else becomes a Failed result.
            SubmitResult finalize(const std::string &token);

            bool abortSession(const std::string &token);
            Metadata::UploadSessionRecord sessionStatus(const std::string &token);

            // --- Monitoring and maintenance ---

            ProgressSnapshot progress() const;
            Statistics statistics();
            std::vector<Metadata::SyncHistoryEntry> recentHistory(int limit);
            std::vector<std::string> sweepExpired();

            // Re-hashes the archived copy. False if it is missing or differs.
            bool verifyStored(const std::string &fingerprint);

            // Copies a stored file into destination_dir. Never overwrites.
            std::filesystem::path restore(const std::string &fingerprint, const std::filesystem::path &destination_dir);

            // Drops terminal session rows older than days. History entries are kept.
            int purgeSessionHistory(int days);

            const Config::EngineConfig &config() const { return engine_config; }

        private:
            SubmitResult runWhole(const Sources::SourceFile &source, const std::string &source_device);

            // Finalize body, run with the session locked: hash, dedup, commit, transform.
            Sessions::FinalizeDecision commitStaged(const Metadata::UploadSessionRecord &session,
                                                    const std::optional<Hashing::HashResult> &staged_hash,
                                                    SubmitResult &out);

            void count(const SubmitResult &result);
            void sweeperLoop();

            Config::EngineConfig engine_config;
            Sessions::Clock clock;
            Concurrency::RetryPolicy retry_policy;

            Metadata::MetadataStore store;
            Chunks::ChunkStore chunks;
            Index::DeduplicationIndex index;
            Archive::ArchiveOrganizer archive;
            Sessions::SessionManager sessions;
            std::unique_ptr<Crypto::FileTransform> transform;

            std::atomic<uint64_t> queued_files{0};
            std::atomic<uint64_t> in_flight_files{0};
            std::atomic<uint64_t> stored_files{0};
            std::atomic<uint64_t> duplicate_files{0};
            std::atomic<uint64_t> failed_files{0};

            Concurrency::ThreadPool transfers;
            Concurrency::ThreadPool file_ops;

            std::mutex sweeper_mutex;
            std::condition_variable sweeper_cv;
            bool stopping = false;
            std::thread sweeper;
        };

    } // namespace Engine
} // namespace MediaVault
