// include/metadata_store.hpp
#pragma once

#include <string>
#include <vector>
#include <map>
#include <mutex>
#include <optional>
#include <filesystem>

#include "file_record.hpp"

struct sqlite3;

namespace MediaVault
{
    namespace Metadata
    {

        // SQLite-backed persistence for file records, upload sessions and the
        // sync history. One connection is shared by every component; each
        // public call runs a single short statement under the store lock.
        class MetadataStore
        {
        public:
            explicit MetadataStore(const std::filesystem::path &db_path);
            ~MetadataStore();

            MetadataStore(const MetadataStore &) = delete;
            MetadataStore &operator=(const MetadataStore &) = delete;

            // --- File records ---

            // Atomic test-and-set on the fingerprint primary key.
            // Returns false, leaving the table untouched, if the fingerprint is already present.
            bool insertFileRecordIfAbsent(const FileRecord &record);
            std::optional<FileRecord> findFileByFingerprint(const std::string &fingerprint);
            bool hasFastKey(const std::string &fast_key);
            int64_t countFiles();
            int64_t totalStoredBytes();

            // --- Upload sessions ---

            void insertSession(const UploadSessionRecord &session);
            void updateSession(const UploadSessionRecord &session);
            std::optional<UploadSessionRecord> findSession(const std::string &token);
            // Sessions still in OPEN or ASSEMBLING.
            std::vector<UploadSessionRecord> loadActiveSessions();
            // Deletes terminal sessions whose last activity is before cutoff. Returns rows removed.
            int purgeTerminalSessions(int64_t cutoff);

            // --- Sync history (append-only) ---

            void appendHistory(const SyncHistoryEntry &entry);
            std::vector<SyncHistoryEntry> historyForSession(const std::string &token);
            std::vector<SyncHistoryEntry> recentHistory(int limit);
            std::map<Outcome, int64_t> historyCounts();

        private:
            void exec(const std::string &sql);
            void applySchema();

            sqlite3 *db = nullptr;
            std::mutex mtx; // Serializes use of the connection
        };

    } // namespace Metadata
} // namespace MediaVault
