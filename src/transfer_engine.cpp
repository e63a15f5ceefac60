// src/transfer_engine.cpp
#include "transfer_engine.hpp"
#include "aes_file_encryptor.hpp"
#include "content_hasher.hpp"
#include "storage_retry.hpp"
#include "vault_errors.hpp"
#include <chrono>
#include <iostream> // For logging
#include <system_error>

namespace fs = std::filesystem;

namespace MediaVault
{
    namespace Engine
    {

        using Metadata::Outcome;
        using Metadata::UploadSessionRecord;

        namespace
        {
            Config::EngineConfig validatedConfig(const Config::EngineConfig &config)
            {
                config.validate();
                return config;
            }

            Sessions::Clock defaultClock(Sessions::Clock clock)
            {
                return clock ? clock : Sessions::Clock(&Metadata::nowSeconds);
            }

            std::string chunkResultName(Sessions::ChunkResult result)
            {
                switch (result)
                {
                case Sessions::ChunkResult::Accepted:
                    return "accepted";
                case Sessions::ChunkResult::Ignored:
                    return "ignored";
                case Sessions::ChunkResult::Complete:
                    return "complete";
                }
                return "unknown";
            }
        } // namespace

        // --- JSON views ---

        nlohmann::json SubmitResult::toJson() const
        {
            nlohmann::json j = {
                {"outcome", Metadata::toString(outcome)},
                {"source", source},
                {"session_token", session_token},
                {"fingerprint", fingerprint},
                {"storage_path", storage_path},
                {"degraded", degraded}};
            if (!encrypted_path.empty())
                j["encrypted_path"] = encrypted_path;
            if (!message.empty())
                j["message"] = message;
            return j;
        }

        nlohmann::json ChunkAck::toJson() const
        {
            return {
                {"result", chunkResultName(result)},
                {"state", Metadata::toString(state)},
                {"bytes_received", bytes_received},
                {"bytes_remaining", bytes_remaining}};
        }

        nlohmann::json ProgressSnapshot::toJson() const
        {
            return {
                {"queued_files", queued_files},
                {"in_flight_files", in_flight_files},
                {"stored_files", stored_files},
                {"duplicate_files", duplicate_files},
                {"failed_files", failed_files}};
        }

        nlohmann::json BatchSummary::toJson() const
        {
            nlohmann::json files = nlohmann::json::array();
            for (const auto &r : results)
            {
                files.push_back(r.toJson());
            }
            return {
                {"backed_up", backed_up},
                {"skipped_duplicates", skipped_duplicates},
                {"failed", failed},
                {"files", files}};
        }

        nlohmann::json PoolLoad::toJson() const
        {
            return {
                {"name", name},
                {"workers", workers},
                {"active", active},
                {"queued", queued}};
        }

        nlohmann::json Statistics::toJson() const
        {
            nlohmann::json outcomes = nlohmann::json::object();
            for (const auto &item : history)
            {
                outcomes[Metadata::toString(item.first)] = item.second;
            }
            nlohmann::json pool_list = nlohmann::json::array();
            for (const auto &pool : pools)
            {
                pool_list.push_back(pool.toJson());
            }
            return {
                {"stored_files", stored_files},
                {"stored_bytes", stored_bytes},
                {"history", outcomes},
                {"active_sessions", active_sessions},
                {"progress", progress.toJson()},
                {"pools", pool_list}};
        }

        // --- Engine ---

        TransferEngine::TransferEngine(Config::EngineConfig config,
                                       Sessions::Clock clock,
                                       std::unique_ptr<Crypto::FileTransform> transform)
            : engine_config(validatedConfig(config)),
              clock(defaultClock(std::move(clock))),
              store(engine_config.databaseFilePath()),
              chunks(engine_config.stagingDirPath()),
              index(store),
              archive(engine_config.archive_root),
              sessions(store, chunks, engine_config, this->clock),
              transform(std::move(transform)),
              transfers("transfers", engine_config.max_concurrent_transfers),
              file_ops("file-ops", engine_config.max_concurrent_file_ops)
        {
            retry_policy.attempts = engine_config.storage_retry_limit;
            retry_policy.backoff_ms = engine_config.storage_retry_backoff_ms;

            if (!this->transform && engine_config.encryption_enabled)
            {
                this->transform = std::make_unique<Crypto::AesFileEncryptor>(engine_config.encryptionKeyPath(),
                                                                             engine_config.archive_root,
                                                                             engine_config.encryptedRootPath());
            }

            // Sweeper, lazy and status-check expiries all land here.
            sessions.onExpired([this](const std::string &)
                               { ++failed_files; });
            sessions.recover();

            // Zero turns the background sweep off; expiry stays lazy.
            if (engine_config.sweep_interval_seconds > 0)
            {
                sweeper = std::thread(&TransferEngine::sweeperLoop, this);
            }
            std::cout << "TransferEngine initialized (archive " << engine_config.archive_root
                      << ", hash mode " << Config::toString(engine_config.hash_mode) << ")." << std::endl;
        }

        TransferEngine::~TransferEngine()
        {
            {
                std::lock_guard<std::mutex> lock(sweeper_mutex);
                stopping = true;
            }
            sweeper_cv.notify_all();
            if (sweeper.joinable())
            {
                sweeper.join();
            }
            // Transfers wait on file ops, so they drain first.
            transfers.shutdown();
            file_ops.shutdown();
        }

        void TransferEngine::sweeperLoop()
        {
            std::unique_lock<std::mutex> lock(sweeper_mutex);
            while (!stopping)
            {
                sweeper_cv.wait_for(lock, std::chrono::seconds(engine_config.sweep_interval_seconds),
                                    [this]
                                    { return stopping; });
                if (stopping)
                {
                    break;
                }
                lock.unlock();
                try
                {
                    sessions.sweepExpired();
                }
                catch (const std::exception &e)
                {
                    std::cerr << "Expiry sweep failed: " << e.what() << std::endl;
                }
                lock.lock();
            }
        }

        void TransferEngine::count(const SubmitResult &result)
        {
            switch (result.outcome)
            {
            case Outcome::Stored:
                ++stored_files;
                break;
            case Outcome::Duplicate:
                ++duplicate_files;
                break;
            case Outcome::Failed:
                ++failed_files;
                break;
            case Outcome::Expired: // Counted by the expiry listener
            case Outcome::None:
                break;
            }
        }

        Sessions::FinalizeDecision TransferEngine::commitStaged(const UploadSessionRecord &session,
                                                                const std::optional<Hashing::HashResult> &staged_hash,
                                                                SubmitResult &out)
        {
            const fs::path staged = chunks.stagingPath(session.token);
            Hashing::HashResult hash = staged_hash ? *staged_hash : Hashing::ContentHasher::fullFingerprint(staged);
            if (hash.bytes_hashed != session.declared_size)
            {
                throw Errors::SizeMismatch("Session " + session.token + " declared " + std::to_string(session.declared_size) +
                                           " bytes but staged " + std::to_string(hash.bytes_hashed));
            }
            out.fingerprint = hash.digest;

            Sessions::FinalizeDecision decision;
            decision.fingerprint = hash.digest;

            std::optional<Metadata::FileRecord> existing = index.lookup(hash.digest);
            if (existing)
            {
                out.outcome = Outcome::Duplicate;
                out.storage_path = existing->storage_path;
                decision.outcome = Outcome::Duplicate;
                decision.detail = "duplicate of " + existing->storage_path;
                return decision;
            }

            Metadata::FileRecord record;
            record.fingerprint = hash.digest;
            record.original_filename = Archive::ArchiveOrganizer::sanitizeFilename(session.target_name);
            record.file_size_bytes = session.declared_size;
            record.capture_time = session.capture_time;
            record.ingested_at = clock();
            record.source_device = session.source_device;
            record.fast_key = Hashing::ContentHasher::fastKey(staged, session.declared_size, session.capture_time,
                                                              engine_config.fast_hash_sample_size);
            record.media_type = Sources::mediaTypeFor(record.original_filename);
            record.mime_type = Sources::mimeTypeFor(record.original_filename);
            record.upload_session = session.token;

            const int64_t archive_time = Archive::ArchiveOrganizer::archiveTimestamp(record.capture_time, record.ingested_at);
            const fs::path final_path = Concurrency::withStorageRetry(retry_policy, "archive commit for " + session.token,
                                                                      [&]
                                                                      { return archive.commit(staged, record.original_filename, hash.digest, archive_time); });
            record.storage_path = final_path.string();

            Index::InsertResult inserted;
            try
            {
                inserted = index.insert(record);
            }
            catch (const Errors::DatabaseError &)
            {
                std::error_code ec;
                fs::remove(final_path, ec);
                throw;
            }

            if (inserted.status == Index::InsertStatus::AlreadyExists)
            {
                // Another finalize of the same content won; our copy was never referenced.
                std::error_code ec;
                fs::remove(final_path, ec);
                if (ec)
                {
                    std::cerr << "Failed to remove redundant copy " << final_path << ": " << ec.message() << std::endl;
                }
                out.outcome = Outcome::Duplicate;
                out.storage_path = inserted.record.storage_path;
                decision.outcome = Outcome::Duplicate;
                decision.detail = "duplicate of " + inserted.record.storage_path + " (concurrent insert)";
                return decision;
            }

            out.outcome = Outcome::Stored;
            out.storage_path = record.storage_path;
            decision.outcome = Outcome::Stored;
            decision.detail = "stored at " + record.storage_path;

            if (transform)
            {
                try
                {
                    fs::path transformed = transform->apply(final_path);
                    out.encrypted_path = transformed.string();
                    decision.detail += "; " + transform->name() + " copy at " + out.encrypted_path;
                }
                catch (const std::exception &e)
                {
                    // The record stays; only the post-store step is missing.
                    out.degraded = true;
                    out.message = std::string(transform->name()) + " failed: " + e.what();
                    decision.detail += "; " + out.message;
                    std::cerr << "Post-store transform failed for " << final_path << ": " << e.what() << std::endl;
                }
            }
            return decision;
        }

        SubmitResult TransferEngine::runWhole(const Sources::SourceFile &source, const std::string &source_device)
        {
            SubmitResult out;
            out.source = source.path.string();
            try
            {
                out.session_token = sessions.open(source.path.filename().string(), source.size, source.capture_time, source_device);

                // Pre-hash the source when it may already be stored, so duplicates skip the copy.
                std::optional<Hashing::HashResult> pre_hash = file_ops.enqueue([this, &source]() -> std::optional<Hashing::HashResult>
                                                                               {
                    if (engine_config.hash_mode == Config::HashMode::Fast)
                    {
                        // Same inputs as the key commitStaged stores.
                        std::string key = Hashing::ContentHasher::fastKey(source.path, source.size, source.capture_time,
                                                                          engine_config.fast_hash_sample_size);
                        if (!index.mayContainFastKey(key))
                        {
                            return std::nullopt;
                        }
                    }
                    return Hashing::ContentHasher::fullFingerprint(source.path); })
                                                                  .get();
                if (pre_hash)
                {
                    std::optional<Metadata::FileRecord> existing = index.lookup(pre_hash->digest);
                    if (existing)
                    {
                        sessions.completeAsDuplicate(out.session_token, pre_hash->digest, "duplicate of " + existing->storage_path);
                        out.outcome = Outcome::Duplicate;
                        out.fingerprint = pre_hash->digest;
                        out.storage_path = existing->storage_path;
                        return out;
                    }
                }

                // Copy and hash in one pass; the staged hash is what gets stored.
                Hashing::HashResult staged_hash = file_ops.enqueue([this, &source, &out]
                                                                   { return sessions.receiveFromSource(out.session_token, source.path); })
                                                      .get();

                sessions.finalize(out.session_token, [this, &staged_hash, &out](const UploadSessionRecord &session)
                                  { return commitStaged(session, staged_hash, out); });
            }
            catch (const Errors::ExpiredSession &e)
            {
                out.outcome = Outcome::Expired;
                out.message = e.what();
                std::cerr << "Backup of " << source.path << " expired: " << e.what() << std::endl;
            }
            catch (const std::exception &e)
            {
                out.outcome = Outcome::Failed;
                out.message = e.what();
                if (!out.session_token.empty())
                {
                    sessions.fail(out.session_token, e.what());
                }
                std::cerr << "Backup of " << source.path << " failed: " << e.what() << std::endl;
            }
            return out;
        }

        std::future<SubmitResult> TransferEngine::submitWholeAsync(const Sources::SourceFile &source, const std::string &source_device)
        {
            ++queued_files;
            return transfers.enqueue([this, source, source_device]
                                     {
                --queued_files;
                ++in_flight_files;
                SubmitResult result;
                try
                {
                    result = runWhole(source, source_device);
                }
                catch (const std::exception &)
                {
                    --in_flight_files;
                    ++failed_files;
                    throw;
                }
                --in_flight_files;
                count(result);
                return result; });
        }

        SubmitResult TransferEngine::submitWhole(const Sources::SourceFile &source, const std::string &source_device)
        {
            return submitWholeAsync(source, source_device).get();
        }

        BatchSummary TransferEngine::submitBatch(const std::vector<Sources::SourceFile> &sources, const std::string &source_device)
        {
            std::vector<std::future<SubmitResult>> futures;
            futures.reserve(sources.size());
            for (const auto &source : sources)
            {
                futures.push_back(submitWholeAsync(source, source_device));
            }

            BatchSummary summary;
            for (size_t i = 0; i < futures.size(); ++i)
            {
                SubmitResult result;
                try
                {
                    result = futures[i].get();
                }
                catch (const std::exception &e)
                {
                    result.source = sources[i].path.string();
                    result.outcome = Outcome::Failed;
                    result.message = e.what();
                }
                switch (result.outcome)
                {
                case Outcome::Stored:
                    ++summary.backed_up;
                    break;
                case Outcome::Duplicate:
                    ++summary.skipped_duplicates;
                    break;
                default:
                    ++summary.failed;
                    break;
                }
                summary.results.push_back(std::move(result));
            }
            std::cout << "Batch complete: " << summary.backed_up << " backed up, "
                      << summary.skipped_duplicates << " duplicates skipped, "
                      << summary.failed << " failed." << std::endl;
            return summary;
        }

        std::string TransferEngine::openSession(uint64_t declared_size,
                                                const std::string &target_name,
                                                int64_t capture_time,
                                                const std::string &source_device)
        {
            return sessions.open(target_name, declared_size, capture_time, source_device);
        }

        ChunkAck TransferEngine::writeChunk(const std::string &token,
                                            uint64_t offset,
                                            std::vector<char> bytes,
                                            const std::string &expected_checksum)
        {
            Chunks::Chunk chunk(offset, std::move(bytes));
            ChunkAck ack;
            try
            {
                ack.result = file_ops.enqueue([this, &token, &chunk, &expected_checksum]
                                              { return sessions.receiveChunk(token, chunk, expected_checksum); })
                                 .get();
            }
            catch (const Errors::ChecksumMismatch &)
            {
                ++failed_files;
                throw;
            }
            catch (const Errors::StorageWriteError &)
            {
                ++failed_files;
                throw;
            }

            UploadSessionRecord session = sessions.status(token);
            ack.state = session.state;
            ack.bytes_received = session.bytesReceived();
            ack.bytes_remaining = session.bytesRemaining();
            return ack;
        }

        SubmitResult TransferEngine::finalize(const std::string &token)
        {
            ++queued_files;
            std::future<SubmitResult> pending = transfers.enqueue([this, token]
                                                                  {
                --queued_files;
                ++in_flight_files;
                SubmitResult out;
                out.session_token = token;
                try
                {
                    sessions.finalize(token, [this, &out](const UploadSessionRecord &session)
                                      {
                                          out.source = session.target_name;
                                          return commitStaged(session, std::nullopt, out);
                                      });
                }
                catch (const Errors::SessionError &)
                {
                    --in_flight_files;
                    throw;
                }
                catch (const std::exception &e)
                {
                    out.outcome = Outcome::Failed;
                    out.message = e.what();
                    std::cerr << "Finalize of session " << token << " failed: " << e.what() << std::endl;
                }
                --in_flight_files;
                count(out);
                return out; });
            return pending.get();
        }

        bool TransferEngine::abortSession(const std::string &token)
        {
            bool aborted = sessions.abort(token);
            if (aborted)
            {
                ++failed_files;
            }
            return aborted;
        }

        UploadSessionRecord TransferEngine::sessionStatus(const std::string &token)
        {
            return sessions.status(token);
        }

        ProgressSnapshot TransferEngine::progress() const
        {
            ProgressSnapshot snapshot;
            snapshot.queued_files = queued_files.load();
            snapshot.in_flight_files = in_flight_files.load();
            snapshot.stored_files = stored_files.load();
            snapshot.duplicate_files = duplicate_files.load();
            snapshot.failed_files = failed_files.load();
            return snapshot;
        }

        Statistics TransferEngine::statistics()
        {
            Statistics stats;
            stats.stored_files = store.countFiles();
            stats.stored_bytes = store.totalStoredBytes();
            stats.history = store.historyCounts();
            stats.active_sessions = sessions.activeCount();
            stats.progress = progress();
            for (Concurrency::ThreadPool *pool : {&transfers, &file_ops})
            {
                PoolLoad load;
                load.name = pool->name();
                load.workers = pool->size();
                load.active = pool->active();
                load.queued = pool->queued();
                stats.pools.push_back(load);
            }
            return stats;
        }

        std::vector<Metadata::SyncHistoryEntry> TransferEngine::recentHistory(int limit)
        {
            return store.recentHistory(limit);
        }

        std::vector<std::string> TransferEngine::sweepExpired()
        {
            return sessions.sweepExpired();
        }

        bool TransferEngine::verifyStored(const std::string &fingerprint)
        {
            std::optional<Metadata::FileRecord> record = index.lookup(fingerprint);
            if (!record)
            {
                throw Errors::RecordNotFound(fingerprint);
            }
            try
            {
                Hashing::HashResult actual = file_ops.enqueue([&record]
                                                              { return Hashing::ContentHasher::fullFingerprint(record->storage_path); })
                                                 .get();
                if (actual.digest != fingerprint)
                {
                    std::cerr << "Verification failed for " << record->storage_path << ": content changed" << std::endl;
                    return false;
                }
            }
            catch (const Errors::ReadError &e)
            {
                std::cerr << "Verification failed for " << record->storage_path << ": " << e.what() << std::endl;
                return false;
            }
            return true;
        }

        fs::path TransferEngine::restore(const std::string &fingerprint, const fs::path &destination_dir)
        {
            std::optional<Metadata::FileRecord> record = index.lookup(fingerprint);
            if (!record)
            {
                throw Errors::RecordNotFound(fingerprint);
            }
            Config::ensureDirectoryExists(destination_dir);
            fs::path target = destination_dir / fs::path(record->storage_path).filename();

            std::error_code ec;
            if (!fs::copy_file(record->storage_path, target, fs::copy_options::none, ec) || ec)
            {
                throw Errors::StorageWriteError("Failed to restore " + record->storage_path + " to " + target.string() +
                                                ": " + (ec ? ec.message() : std::string("copy refused")));
            }
            std::cout << "Restored " << record->storage_path << " to " << target << std::endl;
            return target;
        }

        int TransferEngine::purgeSessionHistory(int days)
        {
            const int64_t cutoff = clock() - static_cast<int64_t>(days) * 24 * 60 * 60;
            int removed = store.purgeTerminalSessions(cutoff);
            std::cout << "Purged " << removed << " finished session(s) older than " << days << " day(s)" << std::endl;
            return removed;
        }

    } // namespace Engine
} // namespace MediaVault
