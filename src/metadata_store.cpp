// src/metadata_store.cpp
#include "metadata_store.hpp"
#include "vault_config.hpp"
#include "vault_errors.hpp"
#include <sqlite3.h>
#include <iostream> // For logging

namespace fs = std::filesystem;

namespace MediaVault
{
    namespace Metadata
    {

        namespace
        {

            const char *SCHEMA_SQL = R"SQL(
CREATE TABLE IF NOT EXISTS file_records (
    fingerprint       TEXT PRIMARY KEY NOT NULL,
    storage_path      TEXT NOT NULL,
    original_filename TEXT NOT NULL,
    file_size         INTEGER NOT NULL,
    capture_time      INTEGER NOT NULL DEFAULT 0,
    ingested_at       INTEGER NOT NULL,
    source_device     TEXT,
    fast_key          TEXT,
    media_type        TEXT,
    mime_type         TEXT,
    upload_session    TEXT
);
CREATE INDEX IF NOT EXISTS idx_file_records_fast_key ON file_records(fast_key);

CREATE TABLE IF NOT EXISTS upload_sessions (
    token           TEXT PRIMARY KEY NOT NULL,
    target_name     TEXT NOT NULL,
    declared_size   INTEGER NOT NULL,
    chunk_size      INTEGER NOT NULL,
    received_ranges TEXT NOT NULL DEFAULT '[]',
    state           TEXT NOT NULL,
    created_at      INTEGER NOT NULL,
    last_activity   INTEGER NOT NULL,
    expires_at      INTEGER NOT NULL,
    capture_time    INTEGER NOT NULL DEFAULT 0,
    source_device   TEXT,
    fingerprint     TEXT,
    outcome         TEXT,
    error_message   TEXT,
    retry_count     INTEGER NOT NULL DEFAULT 0
);
CREATE INDEX IF NOT EXISTS idx_upload_sessions_state ON upload_sessions(state);

CREATE TABLE IF NOT EXISTS sync_history (
    id            INTEGER PRIMARY KEY AUTOINCREMENT,
    fingerprint   TEXT,
    session_token TEXT,
    outcome       TEXT NOT NULL,
    recorded_at   INTEGER NOT NULL,
    detail        TEXT
);
CREATE INDEX IF NOT EXISTS idx_sync_history_recorded_at ON sync_history(recorded_at);
CREATE INDEX IF NOT EXISTS idx_sync_history_session ON sync_history(session_token);

CREATE TRIGGER IF NOT EXISTS sync_history_no_update
BEFORE UPDATE ON sync_history
BEGIN
    SELECT RAISE(ABORT, 'sync_history is append-only');
END;
)SQL";

            // Owns one prepared statement.
            class Statement
            {
            public:
                Statement(sqlite3 *db, const char *sql) : db(db)
                {
                    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
                    {
                        throw Errors::DatabaseError(std::string("Failed to prepare statement: ") + sqlite3_errmsg(db));
                    }
                }

                ~Statement()
                {
                    sqlite3_finalize(st);
                }

                Statement(const Statement &) = delete;
                Statement &operator=(const Statement &) = delete;

                void bind(int index, const std::string &value)
                {
                    check(sqlite3_bind_text(st, index, value.c_str(), -1, SQLITE_TRANSIENT));
                }

                void bind(int index, int64_t value)
                {
                    check(sqlite3_bind_int64(st, index, value));
                }

                // Returns true while a row is available.
                bool step()
                {
                    int rc = sqlite3_step(st);
                    if (rc == SQLITE_ROW)
                    {
                        return true;
                    }
                    if (rc == SQLITE_DONE)
                    {
                        return false;
                    }
                    throw Errors::DatabaseError(std::string("Statement failed: ") + sqlite3_errmsg(db));
                }

                std::string text(int column) const
                {
                    const unsigned char *p = sqlite3_column_text(st, column);
                    return p ? reinterpret_cast<const char *>(p) : std::string();
                }

                int64_t int64(int column) const
                {
                    return sqlite3_column_int64(st, column);
                }

            private:
                void check(int rc)
                {
                    if (rc != SQLITE_OK)
                    {
                        throw Errors::DatabaseError(std::string("Failed to bind parameter: ") + sqlite3_errmsg(db));
                    }
                }

                sqlite3 *db;
                sqlite3_stmt *st = nullptr;
            };

            const char *FILE_COLUMNS =
                "fingerprint, storage_path, original_filename, file_size, capture_time, ingested_at, "
                "source_device, fast_key, media_type, mime_type, upload_session";

            FileRecord readFileRecord(const Statement &st)
            {
                FileRecord r;
                r.fingerprint = st.text(0);
                r.storage_path = st.text(1);
                r.original_filename = st.text(2);
                r.file_size_bytes = static_cast<uint64_t>(st.int64(3));
                r.capture_time = st.int64(4);
                r.ingested_at = st.int64(5);
                r.source_device = st.text(6);
                r.fast_key = st.text(7);
                r.media_type = st.text(8);
                r.mime_type = st.text(9);
                r.upload_session = st.text(10);
                return r;
            }

            const char *SESSION_COLUMNS =
                "token, target_name, declared_size, chunk_size, received_ranges, state, created_at, "
                "last_activity, expires_at, capture_time, source_device, fingerprint, outcome, "
                "error_message, retry_count";

            UploadSessionRecord readSession(const Statement &st)
            {
                UploadSessionRecord s;
                s.token = st.text(0);
                s.target_name = st.text(1);
                s.declared_size = static_cast<uint64_t>(st.int64(2));
                s.chunk_size = static_cast<uint64_t>(st.int64(3));
                try
                {
                    s.received = Sessions::ByteRangeSet::fromJson(nlohmann::json::parse(st.text(4)));
                }
                catch (const std::exception &e)
                {
                    throw Errors::DatabaseError("Corrupt received_ranges for session " + s.token + ": " + e.what());
                }
                s.state = sessionStateFromString(st.text(5));
                s.created_at = st.int64(6);
                s.last_activity = st.int64(7);
                s.expires_at = st.int64(8);
                s.capture_time = st.int64(9);
                s.source_device = st.text(10);
                s.fingerprint = st.text(11);
                s.outcome = outcomeFromString(st.text(12));
                s.error_message = st.text(13);
                s.retry_count = static_cast<int>(st.int64(14));
                return s;
            }

            SyncHistoryEntry readHistory(const Statement &st)
            {
                SyncHistoryEntry e;
                e.id = st.int64(0);
                e.fingerprint = st.text(1);
                e.session_token = st.text(2);
                e.outcome = outcomeFromString(st.text(3));
                e.recorded_at = st.int64(4);
                e.detail = st.text(5);
                return e;
            }

        } // namespace

        MetadataStore::MetadataStore(const fs::path &db_path)
        {
            if (db_path.has_parent_path())
            {
                Config::ensureDirectoryExists(db_path.parent_path());
            }

            int rc = sqlite3_open_v2(db_path.string().c_str(),
                                     &db,
                                     SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                                     nullptr);
            if (rc != SQLITE_OK)
            {
                std::string msg = db ? sqlite3_errmsg(db) : "out of memory";
                sqlite3_close(db);
                db = nullptr;
                throw Errors::DatabaseError("Failed to open DB " + db_path.string() + ": " + msg);
            }

            try
            {
                // Pragmas: concurrency + durability
                exec("PRAGMA journal_mode=WAL;");
                exec("PRAGMA synchronous=NORMAL;");
                exec("PRAGMA busy_timeout=5000;");
                applySchema();
            }
            catch (const Errors::DatabaseError &)
            {
                sqlite3_close(db);
                db = nullptr;
                throw;
            }
            std::cout << "MetadataStore opened at " << db_path << std::endl;
        }

        MetadataStore::~MetadataStore()
        {
            if (db)
            {
                sqlite3_close(db);
            }
        }

        void MetadataStore::exec(const std::string &sql)
        {
            char *err = nullptr;
            if (sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK)
            {
                std::string msg = err ? err : "unknown error";
                sqlite3_free(err);
                throw Errors::DatabaseError("SQLite exec failed: " + msg);
            }
        }

        void MetadataStore::applySchema()
        {
            exec(SCHEMA_SQL);
            exec("PRAGMA user_version=1;");
        }

        bool MetadataStore::insertFileRecordIfAbsent(const FileRecord &r)
        {
            std::lock_guard<std::mutex> lock(mtx);
            Statement st(db, R"SQL(
                INSERT INTO file_records
                    (fingerprint, storage_path, original_filename, file_size, capture_time, ingested_at,
                     source_device, fast_key, media_type, mime_type, upload_session)
                VALUES (?,?,?,?,?,?,?,?,?,?,?)
                ON CONFLICT(fingerprint) DO NOTHING
            )SQL");
            int i = 1;
            st.bind(i++, r.fingerprint);
            st.bind(i++, r.storage_path);
            st.bind(i++, r.original_filename);
            st.bind(i++, static_cast<int64_t>(r.file_size_bytes));
            st.bind(i++, r.capture_time);
            st.bind(i++, r.ingested_at);
            st.bind(i++, r.source_device);
            st.bind(i++, r.fast_key);
            st.bind(i++, r.media_type);
            st.bind(i++, r.mime_type);
            st.bind(i++, r.upload_session);
            st.step();
            return sqlite3_changes(db) == 1;
        }

        std::optional<FileRecord> MetadataStore::findFileByFingerprint(const std::string &fingerprint)
        {
            std::lock_guard<std::mutex> lock(mtx);
            const std::string sql = std::string("SELECT ") + FILE_COLUMNS + " FROM file_records WHERE fingerprint = ?";
            Statement st(db, sql.c_str());
            st.bind(1, fingerprint);
            if (!st.step())
            {
                return std::nullopt;
            }
            return readFileRecord(st);
        }

        bool MetadataStore::hasFastKey(const std::string &fast_key)
        {
            std::lock_guard<std::mutex> lock(mtx);
            Statement st(db, "SELECT 1 FROM file_records WHERE fast_key = ? LIMIT 1");
            st.bind(1, fast_key);
            return st.step();
        }

        int64_t MetadataStore::countFiles()
        {
            std::lock_guard<std::mutex> lock(mtx);
            Statement st(db, "SELECT COUNT(*) FROM file_records");
            st.step();
            return st.int64(0);
        }

        int64_t MetadataStore::totalStoredBytes()
        {
            std::lock_guard<std::mutex> lock(mtx);
            Statement st(db, "SELECT COALESCE(SUM(file_size), 0) FROM file_records");
            st.step();
            return st.int64(0);
        }

        void MetadataStore::insertSession(const UploadSessionRecord &s)
        {
            std::lock_guard<std::mutex> lock(mtx);
            Statement st(db, R"SQL(
                INSERT INTO upload_sessions
                    (token, target_name, declared_size, chunk_size, received_ranges, state, created_at,
                     last_activity, expires_at, capture_time, source_device, fingerprint, outcome,
                     error_message, retry_count)
                VALUES (?,?,?,?,?,?,?,?,?,?,?,?,?,?,?)
            )SQL");
            int i = 1;
            st.bind(i++, s.token);
            st.bind(i++, s.target_name);
            st.bind(i++, static_cast<int64_t>(s.declared_size));
            st.bind(i++, static_cast<int64_t>(s.chunk_size));
            st.bind(i++, s.received.toJson().dump());
            st.bind(i++, toString(s.state));
            st.bind(i++, s.created_at);
            st.bind(i++, s.last_activity);
            st.bind(i++, s.expires_at);
            st.bind(i++, s.capture_time);
            st.bind(i++, s.source_device);
            st.bind(i++, s.fingerprint);
            st.bind(i++, toString(s.outcome));
            st.bind(i++, s.error_message);
            st.bind(i++, static_cast<int64_t>(s.retry_count));
            st.step();
        }

        void MetadataStore::updateSession(const UploadSessionRecord &s)
        {
            std::lock_guard<std::mutex> lock(mtx);
            Statement st(db, R"SQL(
                UPDATE upload_sessions SET
                    received_ranges = ?, state = ?, last_activity = ?, expires_at = ?,
                    fingerprint = ?, outcome = ?, error_message = ?, retry_count = ?
                WHERE token = ?
            )SQL");
            int i = 1;
            st.bind(i++, s.received.toJson().dump());
            st.bind(i++, toString(s.state));
            st.bind(i++, s.last_activity);
            st.bind(i++, s.expires_at);
            st.bind(i++, s.fingerprint);
            st.bind(i++, toString(s.outcome));
            st.bind(i++, s.error_message);
            st.bind(i++, static_cast<int64_t>(s.retry_count));
            st.bind(i++, s.token);
            st.step();
            if (sqlite3_changes(db) != 1)
            {
                throw Errors::DatabaseError("updateSession: no row for session " + s.token);
            }
        }

        std::optional<UploadSessionRecord> MetadataStore::findSession(const std::string &token)
        {
            std::lock_guard<std::mutex> lock(mtx);
            const std::string sql = std::string("SELECT ") + SESSION_COLUMNS + " FROM upload_sessions WHERE token = ?";
            Statement st(db, sql.c_str());
            st.bind(1, token);
            if (!st.step())
            {
                return std::nullopt;
            }
            return readSession(st);
        }

        std::vector<UploadSessionRecord> MetadataStore::loadActiveSessions()
        {
            std::lock_guard<std::mutex> lock(mtx);
            const std::string sql = std::string("SELECT ") + SESSION_COLUMNS +
                                    " FROM upload_sessions WHERE state IN ('open', 'assembling') ORDER BY created_at";
            Statement st(db, sql.c_str());
            std::vector<UploadSessionRecord> sessions;
            while (st.step())
            {
                sessions.push_back(readSession(st));
            }
            return sessions;
        }

        int MetadataStore::purgeTerminalSessions(int64_t cutoff)
        {
            std::lock_guard<std::mutex> lock(mtx);
            Statement st(db, R"SQL(
                DELETE FROM upload_sessions
                WHERE state IN ('completed', 'failed', 'expired') AND last_activity < ?
            )SQL");
            st.bind(1, cutoff);
            st.step();
            return sqlite3_changes(db);
        }

        void MetadataStore::appendHistory(const SyncHistoryEntry &e)
        {
            std::lock_guard<std::mutex> lock(mtx);
            Statement st(db, R"SQL(
                INSERT INTO sync_history (fingerprint, session_token, outcome, recorded_at, detail)
                VALUES (?,?,?,?,?)
            )SQL");
            st.bind(1, e.fingerprint);
            st.bind(2, e.session_token);
            st.bind(3, toString(e.outcome));
            st.bind(4, e.recorded_at);
            st.bind(5, e.detail);
            st.step();
        }

        std::vector<SyncHistoryEntry> MetadataStore::historyForSession(const std::string &token)
        {
            std::lock_guard<std::mutex> lock(mtx);
            Statement st(db, R"SQL(
                SELECT id, fingerprint, session_token, outcome, recorded_at, detail
                FROM sync_history WHERE session_token = ? ORDER BY id
            )SQL");
            st.bind(1, token);
            std::vector<SyncHistoryEntry> entries;
            while (st.step())
            {
                entries.push_back(readHistory(st));
            }
            return entries;
        }

        std::vector<SyncHistoryEntry> MetadataStore::recentHistory(int limit)
        {
            std::lock_guard<std::mutex> lock(mtx);
            Statement st(db, R"SQL(
                SELECT id, fingerprint, session_token, outcome, recorded_at, detail
                FROM sync_history ORDER BY id DESC LIMIT ?
            )SQL");
            st.bind(1, static_cast<int64_t>(limit));
            std::vector<SyncHistoryEntry> entries;
            while (st.step())
            {
                entries.push_back(readHistory(st));
            }
            return entries;
        }

        std::map<Outcome, int64_t> MetadataStore::historyCounts()
        {
            std::lock_guard<std::mutex> lock(mtx);
            Statement st(db, "SELECT outcome, COUNT(*) FROM sync_history GROUP BY outcome");
            std::map<Outcome, int64_t> counts;
            while (st.step())
            {
                counts[outcomeFromString(st.text(0))] = st.int64(1);
            }
            return counts;
        }

    } // namespace Metadata
} // namespace MediaVault
