// src/session_manager.cpp
#include "session_manager.hpp"
#include "vault_errors.hpp"
#include <iostream> // For logging

#include <openssl/rand.h>

namespace MediaVault
{
    namespace Sessions
    {

        using Metadata::Outcome;
        using Metadata::SessionState;
        using Metadata::UploadSessionRecord;

        SessionManager::SessionManager(Metadata::MetadataStore &store,
                                       Chunks::ChunkStore &chunks,
                                       const Config::EngineConfig &config,
                                       Clock clock)
            : store(store),
              chunks(chunks),
              session_timeout(config.session_timeout_seconds),
              chunk_size(config.chunk_size),
              max_upload_size(config.max_upload_size),
              clock(clock ? std::move(clock) : Clock(&Metadata::nowSeconds))
        {
            retry_policy.attempts = config.storage_retry_limit;
            retry_policy.backoff_ms = config.storage_retry_backoff_ms;
        }

        std::string SessionManager::generateToken()
        {
            unsigned char bytes[TOKEN_BYTES];
            if (RAND_bytes(bytes, sizeof(bytes)) != 1)
            {
                throw Errors::VaultError("Failed to generate session token: RAND_bytes failed");
            }
            return Hashing::ContentHasher::toHex(bytes, sizeof(bytes));
        }

        std::string SessionManager::open(const std::string &target_name,
                                         uint64_t declared_size,
                                         int64_t capture_time,
                                         const std::string &source_device)
        {
            if (declared_size > max_upload_size)
            {
                throw Errors::InvalidRange("", "Declared size " + std::to_string(declared_size) +
                                                   " exceeds the upload limit of " + std::to_string(max_upload_size));
            }

            auto entry = std::make_shared<Entry>();
            UploadSessionRecord &rec = entry->record;
            rec.token = generateToken();
            rec.target_name = target_name;
            rec.declared_size = declared_size;
            rec.chunk_size = chunk_size;
            rec.created_at = clock();
            rec.capture_time = capture_time;
            rec.source_device = source_device;
            touch(rec);
            // An empty file is complete the moment it is declared.
            rec.state = declared_size == 0 ? SessionState::Assembling : SessionState::Open;

            Concurrency::withStorageRetry(retry_policy, "staging file for " + rec.token,
                                          [&]
                                          { chunks.prepare(rec.token, declared_size); });
            try
            {
                store.insertSession(rec);
            }
            catch (const Errors::DatabaseError &)
            {
                chunks.discard(rec.token);
                throw;
            }

            {
                std::lock_guard<std::mutex> lock(map_mutex);
                sessions.emplace(rec.token, entry);
            }
            std::cout << "Opened session " << rec.token << " for " << target_name
                      << " (" << declared_size << " bytes)" << std::endl;
            return rec.token;
        }

        std::shared_ptr<SessionManager::Entry> SessionManager::find(const std::string &token)
        {
            {
                std::lock_guard<std::mutex> lock(map_mutex);
                auto it = sessions.find(token);
                if (it != sessions.end())
                {
                    return it->second;
                }
            }

            std::optional<UploadSessionRecord> rec = store.findSession(token);
            if (!rec)
            {
                throw Errors::SessionNotFound(token);
            }
            if (rec->state == SessionState::Expired)
            {
                throw Errors::ExpiredSession(token);
            }
            if (Metadata::isTerminal(rec->state))
            {
                throw Errors::SessionClosed(token, Metadata::toString(rec->state));
            }

            // Active in the store but not loaded yet.
            auto entry = std::make_shared<Entry>();
            entry->record = *rec;
            std::lock_guard<std::mutex> lock(map_mutex);
            return sessions.emplace(token, entry).first->second;
        }

        void SessionManager::forget(const std::string &token)
        {
            std::lock_guard<std::mutex> lock(map_mutex);
            sessions.erase(token);
        }

        bool SessionManager::isIdle(const UploadSessionRecord &record) const
        {
            return clock() - record.last_activity > session_timeout;
        }

        void SessionManager::touch(UploadSessionRecord &record)
        {
            record.last_activity = clock();
            record.expires_at = record.last_activity + session_timeout;
        }

        void SessionManager::requireLive(Entry &entry)
        {
            UploadSessionRecord &rec = entry.record;
            if (rec.state == SessionState::Expired)
            {
                throw Errors::ExpiredSession(rec.token);
            }
            if (Metadata::isTerminal(rec.state))
            {
                throw Errors::SessionClosed(rec.token, Metadata::toString(rec.state));
            }
            if (isIdle(rec))
            {
                terminate(entry, SessionState::Expired, Outcome::Expired,
                          "no activity for " + std::to_string(clock() - rec.last_activity) + "s");
                throw Errors::ExpiredSession(rec.token);
            }
        }

        void SessionManager::terminate(Entry &entry, SessionState state, Outcome outcome, const std::string &detail)
        {
            UploadSessionRecord &rec = entry.record;
            rec.state = state;
            rec.outcome = outcome;
            rec.last_activity = clock();
            if (state == SessionState::Failed || state == SessionState::Expired)
            {
                rec.error_message = detail;
            }

            // Reclaim staging first so a failing database write can't leak it.
            chunks.discard(rec.token);
            store.updateSession(rec);

            Metadata::SyncHistoryEntry history;
            history.fingerprint = rec.fingerprint;
            history.session_token = rec.token;
            history.outcome = outcome;
            history.recorded_at = rec.last_activity;
            history.detail = detail;
            store.appendHistory(history);
            // Only after the store says terminal, or find() would reload it as active.
            forget(rec.token);

            std::ostream &log = state == SessionState::Failed ? std::cerr : std::cout;
            log << "Session " << rec.token << " " << Metadata::toString(state)
                << " (" << Metadata::toString(outcome) << ")";
            if (!detail.empty())
            {
                log << ": " << detail;
            }
            log << std::endl;

            if (state == SessionState::Expired && expiry_listener)
            {
                expiry_listener(rec.token);
            }
        }

        ChunkResult SessionManager::receiveChunk(const std::string &token,
                                                 const Chunks::Chunk &chunk,
                                                 const std::string &expected_checksum)
        {
            std::shared_ptr<Entry> entry = find(token);
            std::lock_guard<std::mutex> lock(entry->mtx);
            requireLive(*entry);
            UploadSessionRecord &rec = entry->record;

            const uint64_t offset = chunk.offset;
            const uint64_t length = chunk.length();
            if (offset > rec.declared_size || length > rec.declared_size - offset)
            {
                throw Errors::InvalidRange(token, "Range [" + std::to_string(offset) + ", " + std::to_string(offset + length) +
                                                      ") is outside the declared size " + std::to_string(rec.declared_size));
            }
            if (length > rec.chunk_size)
            {
                throw Errors::InvalidRange(token, "Chunk of " + std::to_string(length) + " bytes exceeds the session chunk size of " +
                                                      std::to_string(rec.chunk_size));
            }

            if (rec.received.covers(offset, length))
            {
                touch(rec);
                store.updateSession(rec);
                return ChunkResult::Ignored;
            }

            if (!chunk.matches(expected_checksum))
            {
                const std::string reason = "checksum mismatch for range at offset " + std::to_string(offset);
                terminate(*entry, SessionState::Failed, Outcome::Failed, reason);
                throw Errors::ChecksumMismatch(token, reason);
            }

            // Overlapping retries only fill the gaps.
            std::vector<ByteRange> missing = rec.received.missingWithin(offset, length);
            int retries = 0;
            try
            {
                Concurrency::withStorageRetry(retry_policy, "staging write for " + token,
                                              [&]
                                              {
                                                  for (const ByteRange &r : missing)
                                                  {
                                                      chunks.writeRange(token, r.begin, chunk.data.data() + (r.begin - offset), r.length());
                                                  }
                                              },
                                              &retries);
            }
            catch (const Errors::StorageWriteError &e)
            {
                rec.retry_count += retries;
                terminate(*entry, SessionState::Failed, Outcome::Failed, e.what());
                throw;
            }
            rec.retry_count += retries;

            for (const ByteRange &r : missing)
            {
                rec.received.add(r.begin, r.length());
            }
            touch(rec);

            const bool complete = rec.received.isComplete(rec.declared_size);
            if (complete)
            {
                rec.state = SessionState::Assembling;
            }
            store.updateSession(rec);

            if (complete)
            {
                std::cout << "Session " << token << " received all " << rec.declared_size << " bytes" << std::endl;
                return ChunkResult::Complete;
            }
            return ChunkResult::Accepted;
        }

        Hashing::HashResult SessionManager::receiveFromSource(const std::string &token, const std::filesystem::path &source)
        {
            std::shared_ptr<Entry> entry = find(token);
            std::lock_guard<std::mutex> lock(entry->mtx);
            requireLive(*entry);
            UploadSessionRecord &rec = entry->record;

            Hashing::HashResult result;
            int retries = 0;
            try
            {
                result = Concurrency::withStorageRetry(retry_policy, "staging copy of " + source.string(),
                                                       [&]
                                                       { return chunks.stageFromSource(token, source, rec.declared_size); },
                                                       &retries);
            }
            catch (const Errors::VaultError &e)
            {
                rec.retry_count += retries;
                terminate(*entry, SessionState::Failed, Outcome::Failed, e.what());
                throw;
            }
            rec.retry_count += retries;

            rec.received.clear();
            rec.received.add(0, rec.declared_size);
            rec.state = SessionState::Assembling;
            touch(rec);
            store.updateSession(rec);
            return result;
        }

        FinalizeDecision SessionManager::finalize(const std::string &token, const FinalizeWork &work)
        {
            std::shared_ptr<Entry> entry = find(token);
            std::lock_guard<std::mutex> lock(entry->mtx);
            requireLive(*entry);
            UploadSessionRecord &rec = entry->record;

            if (rec.state != SessionState::Assembling)
            {
                throw Errors::IncompleteSession(token, rec.bytesRemaining());
            }

            FinalizeDecision decision;
            try
            {
                decision = work(rec);
            }
            catch (const std::exception &e)
            {
                terminate(*entry, SessionState::Failed, Outcome::Failed, e.what());
                throw;
            }

            rec.fingerprint = decision.fingerprint;
            SessionState final_state = decision.outcome == Outcome::Failed ? SessionState::Failed : SessionState::Completed;
            terminate(*entry, final_state, decision.outcome, decision.detail);
            return decision;
        }

        void SessionManager::completeAsDuplicate(const std::string &token, const std::string &fingerprint, const std::string &detail)
        {
            std::shared_ptr<Entry> entry = find(token);
            std::lock_guard<std::mutex> lock(entry->mtx);
            requireLive(*entry);
            entry->record.fingerprint = fingerprint;
            terminate(*entry, SessionState::Completed, Outcome::Duplicate, detail);
        }

        bool SessionManager::fail(const std::string &token, const std::string &reason)
        {
            std::shared_ptr<Entry> entry;
            try
            {
                entry = find(token);
            }
            catch (const Errors::SessionClosed &)
            {
                return false;
            }
            catch (const Errors::ExpiredSession &)
            {
                return false;
            }

            std::lock_guard<std::mutex> lock(entry->mtx);
            if (Metadata::isTerminal(entry->record.state))
            {
                return false;
            }
            terminate(*entry, SessionState::Failed, Outcome::Failed, reason);
            return true;
        }

        UploadSessionRecord SessionManager::status(const std::string &token)
        {
            std::shared_ptr<Entry> entry;
            {
                std::lock_guard<std::mutex> lock(map_mutex);
                auto it = sessions.find(token);
                if (it != sessions.end())
                {
                    entry = it->second;
                }
            }

            if (entry)
            {
                std::lock_guard<std::mutex> lock(entry->mtx);
                if (!Metadata::isTerminal(entry->record.state) && isIdle(entry->record))
                {
                    terminate(*entry, SessionState::Expired, Outcome::Expired, "expired on status check");
                }
                return entry->record;
            }

            std::optional<UploadSessionRecord> rec = store.findSession(token);
            if (!rec)
            {
                throw Errors::SessionNotFound(token);
            }
            return *rec;
        }

        std::vector<std::string> SessionManager::sweepExpired()
        {
            std::vector<std::pair<std::string, std::shared_ptr<Entry>>> snapshot;
            {
                std::lock_guard<std::mutex> lock(map_mutex);
                snapshot.assign(sessions.begin(), sessions.end());
            }

            std::vector<std::string> expired;
            for (auto &item : snapshot)
            {
                // A busy session is active by definition.
                std::unique_lock<std::mutex> lock(item.second->mtx, std::try_to_lock);
                if (!lock.owns_lock())
                {
                    continue;
                }
                UploadSessionRecord &rec = item.second->record;
                if (Metadata::isTerminal(rec.state) || !isIdle(rec))
                {
                    continue;
                }
                terminate(*item.second, SessionState::Expired, Outcome::Expired,
                          "no activity for " + std::to_string(clock() - rec.last_activity) + "s");
                expired.push_back(item.first);
            }
            if (!expired.empty())
            {
                std::cout << "Expiry sweep reclaimed " << expired.size() << " session(s)" << std::endl;
            }
            return expired;
        }

        size_t SessionManager::recover()
        {
            std::vector<UploadSessionRecord> active = store.loadActiveSessions();
            size_t resumed = 0;
            for (UploadSessionRecord &rec : active)
            {
                auto entry = std::make_shared<Entry>();
                entry->record = rec;
                UploadSessionRecord &live = entry->record;
                {
                    std::lock_guard<std::mutex> lock(map_mutex);
                    if (sessions.count(live.token))
                    {
                        continue;
                    }
                    sessions.emplace(live.token, entry);
                }

                std::lock_guard<std::mutex> lock(entry->mtx);
                if (!chunks.exists(live.token) && !live.received.empty())
                {
                    std::cerr << "Staging bytes for session " << live.token << " are gone, restarting it from zero" << std::endl;
                    live.received.clear();
                    if (live.declared_size > 0)
                    {
                        live.state = SessionState::Open;
                    }
                    store.updateSession(live);
                }
                try
                {
                    Concurrency::withStorageRetry(retry_policy, "staging file for " + live.token,
                                                  [&]
                                                  { chunks.prepare(live.token, live.declared_size); });
                }
                catch (const Errors::StorageWriteError &e)
                {
                    terminate(*entry, SessionState::Failed, Outcome::Failed, e.what());
                    continue;
                }
                ++resumed;
            }

            size_t orphans = 0;
            for (const std::string &token : chunks.listStagedTokens())
            {
                bool known;
                {
                    std::lock_guard<std::mutex> lock(map_mutex);
                    known = sessions.count(token) > 0;
                }
                if (!known && chunks.discard(token))
                {
                    ++orphans;
                }
            }

            std::cout << "Recovered " << resumed << " upload session(s)";
            if (orphans > 0)
            {
                std::cout << ", removed " << orphans << " orphaned staging file(s)";
            }
            std::cout << std::endl;
            return resumed;
        }

        size_t SessionManager::activeCount()
        {
            std::lock_guard<std::mutex> lock(map_mutex);
            return sessions.size();
        }

        std::vector<std::string> SessionManager::activeTokens()
        {
            std::lock_guard<std::mutex> lock(map_mutex);
            std::vector<std::string> tokens;
            tokens.reserve(sessions.size());
            for (const auto &item : sessions)
            {
                tokens.push_back(item.first);
            }
            return tokens;
        }

    } // namespace Sessions
} // namespace MediaVault
