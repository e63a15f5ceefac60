// tests/test_metadata_store.cpp
#include "metadata_store.hpp"
#include "dedup_index.hpp"
#include "vault_errors.hpp"
#include "test_helpers.hpp"

#include <atomic>
#include <thread>

using namespace MediaVault;
using Metadata::FileRecord;
using Metadata::MetadataStore;
using Metadata::Outcome;
using Metadata::SessionState;
using Metadata::SyncHistoryEntry;
using Metadata::UploadSessionRecord;

static FileRecord makeRecord(const std::string& fingerprint, uint64_t size, const std::string& path) {
    FileRecord r;
    r.fingerprint = fingerprint;
    r.storage_path = path;
    r.original_filename = "IMG_0001.jpg";
    r.file_size_bytes = size;
    r.capture_time = 1700000000;
    r.ingested_at = 1700000100;
    r.source_device = "camera-a";
    r.fast_key = "fast-" + fingerprint;
    r.media_type = "photo";
    r.mime_type = "image/jpeg";
    r.upload_session = "tok-" + fingerprint;
    return r;
}

static UploadSessionRecord makeSession(const std::string& token, SessionState state, int64_t last_activity) {
    UploadSessionRecord s;
    s.token = token;
    s.target_name = token + ".jpg";
    s.declared_size = 1000;
    s.chunk_size = 256;
    s.state = state;
    s.created_at = last_activity - 10;
    s.last_activity = last_activity;
    s.expires_at = last_activity + 3600;
    return s;
}

bool test_file_record_insert_and_conflict(const fs::path& dir) {
    std::cout << "Testing file record insert and conflict..." << std::endl;
    MetadataStore store(dir / "records.db");

    FileRecord first = makeRecord("aa11", 1234, "/archive/2023/11_November/IMG_0001.jpg");
    TEST_ASSERT(store.insertFileRecordIfAbsent(first), "First insert should succeed");

    FileRecord second = makeRecord("aa11", 1234, "/archive/elsewhere.jpg");
    TEST_ASSERT(!store.insertFileRecordIfAbsent(second), "Duplicate fingerprint must be refused");

    auto found = store.findFileByFingerprint("aa11");
    TEST_ASSERT(found.has_value(), "Stored record should be found");
    TEST_ASSERT(found->storage_path == first.storage_path, "Refused insert must not overwrite the first record");
    TEST_ASSERT(found->source_device == "camera-a", "Device should round-trip");
    TEST_ASSERT(found->mime_type == "image/jpeg", "MIME type should round-trip");
    TEST_ASSERT(!store.findFileByFingerprint("bb22").has_value(), "Unknown fingerprint should be absent");

    TEST_ASSERT(store.insertFileRecordIfAbsent(makeRecord("bb22", 766, "/archive/b.jpg")), "Second fingerprint should insert");
    TEST_ASSERT(store.countFiles() == 2, "Expected two records, got " << store.countFiles());
    TEST_ASSERT(store.totalStoredBytes() == 2000, "Expected 2000 stored bytes, got " << store.totalStoredBytes());

    TEST_ASSERT(store.hasFastKey("fast-aa11"), "Fast key of a stored record should be known");
    TEST_ASSERT(!store.hasFastKey("fast-cc33"), "Unseen fast key should be unknown");
    std::cout << "PASS: file record insert and conflict" << std::endl;
    return true;
}

bool test_concurrent_index_inserts(const fs::path& dir) {
    std::cout << "Testing concurrent index inserts of one fingerprint..." << std::endl;
    MetadataStore store(dir / "race.db");
    Index::DeduplicationIndex index(store);

    const int threads = 8;
    std::atomic<int> inserted{0};
    std::atomic<int> existing{0};
    std::atomic<int> mismatched{0};
    std::vector<std::thread> workers;
    for (int i = 0; i < threads; ++i) {
        workers.emplace_back([&, i] {
            FileRecord r = makeRecord("race", 42, "/archive/copy_" + std::to_string(i) + ".jpg");
            Index::InsertResult result = index.insert(r);
            if (result.status == Index::InsertStatus::Inserted) {
                inserted++;
            } else {
                existing++;
            }
            if (result.record.fingerprint != "race") {
                mismatched++;
            }
        });
    }
    for (auto& t : workers) {
        t.join();
    }

    TEST_ASSERT(inserted == 1, "Exactly one insert should win, got " << inserted);
    TEST_ASSERT(existing == threads - 1, "Every other insert should see AlreadyExists");
    TEST_ASSERT(mismatched == 0, "Every result should carry the race fingerprint");

    auto winner = index.lookup("race");
    TEST_ASSERT(winner.has_value(), "Winner should be visible through lookup");
    Index::InsertResult late = index.insert(makeRecord("race", 42, "/archive/late.jpg"));
    TEST_ASSERT(late.status == Index::InsertStatus::AlreadyExists, "Late insert should be a duplicate");
    TEST_ASSERT(late.record.storage_path == winner->storage_path, "Late insert should report the winning path");
    TEST_ASSERT(index.mayContainFastKey("fast-race"), "Fast key of the winner should be known");
    std::cout << "PASS: concurrent index inserts" << std::endl;
    return true;
}

bool test_session_persistence(const fs::path& dir) {
    std::cout << "Testing session persistence across reopen..." << std::endl;
    fs::path db = dir / "sessions.db";
    {
        MetadataStore store(db);
        UploadSessionRecord open = makeSession("t-open", SessionState::Open, 1000);
        open.received.add(0, 256);
        open.received.add(512, 256);
        open.source_device = "phone";
        store.insertSession(open);

        store.insertSession(makeSession("t-assembling", SessionState::Assembling, 1000));

        UploadSessionRecord done = makeSession("t-done", SessionState::Open, 1000);
        store.insertSession(done);
        done.state = SessionState::Completed;
        done.outcome = Outcome::Stored;
        done.fingerprint = "ffee";
        store.updateSession(done);
    }

    MetadataStore reopened(db);
    auto open = reopened.findSession("t-open");
    TEST_ASSERT(open.has_value(), "Open session should survive a reopen");
    TEST_ASSERT(open->received.totalBytes() == 512, "Received ranges should survive, got " << open->received.totalBytes());
    TEST_ASSERT(open->received.covers(512, 256), "Second range should be kept");
    TEST_ASSERT(!open->received.covers(256, 1), "Gap should still be missing");
    TEST_ASSERT(open->source_device == "phone", "Device should round-trip");

    auto done = reopened.findSession("t-done");
    TEST_ASSERT(done && done->state == SessionState::Completed, "Completed state should persist");
    TEST_ASSERT(done->outcome == Outcome::Stored && done->fingerprint == "ffee", "Outcome should persist");

    std::vector<UploadSessionRecord> active = reopened.loadActiveSessions();
    TEST_ASSERT(active.size() == 2, "Only open and assembling sessions are active, got " << active.size());
    for (const auto& s : active) {
        TEST_ASSERT(!Metadata::isTerminal(s.state), "Active list must not contain terminal sessions");
    }

    TEST_ASSERT(!reopened.findSession("missing").has_value(), "Unknown token should be absent");
    TEST_THROWS(reopened.updateSession(makeSession("missing", SessionState::Failed, 1)), Errors::DatabaseError,
                "Updating an unknown session must throw");
    std::cout << "PASS: session persistence" << std::endl;
    return true;
}

bool test_purge_keeps_active_sessions(const fs::path& dir) {
    std::cout << "Testing purge of finished sessions..." << std::endl;
    MetadataStore store(dir / "purge.db");
    store.insertSession(makeSession("old-active", SessionState::Open, 100));

    UploadSessionRecord old_done = makeSession("old-done", SessionState::Open, 100);
    store.insertSession(old_done);
    old_done.state = SessionState::Failed;
    old_done.outcome = Outcome::Failed;
    store.updateSession(old_done);

    UploadSessionRecord new_done = makeSession("new-done", SessionState::Open, 5000);
    store.insertSession(new_done);
    new_done.state = SessionState::Expired;
    new_done.outcome = Outcome::Expired;
    store.updateSession(new_done);

    int removed = store.purgeTerminalSessions(1000);
    TEST_ASSERT(removed == 1, "Only the old finished session should go, removed " << removed);
    TEST_ASSERT(store.findSession("old-active").has_value(), "Active sessions are never purged");
    TEST_ASSERT(!store.findSession("old-done").has_value(), "Old finished session should be gone");
    TEST_ASSERT(store.findSession("new-done").has_value(), "Recent finished session should stay");
    std::cout << "PASS: purge of finished sessions" << std::endl;
    return true;
}

bool test_history_is_append_only_log(const fs::path& dir) {
    std::cout << "Testing sync history..." << std::endl;
    MetadataStore store(dir / "history.db");
    const Outcome outcomes[] = {Outcome::Stored, Outcome::Duplicate, Outcome::Stored, Outcome::Failed};
    for (int i = 0; i < 4; ++i) {
        SyncHistoryEntry e;
        e.fingerprint = "fp" + std::to_string(i);
        e.session_token = i < 2 ? "tok-a" : "tok-b";
        e.outcome = outcomes[i];
        e.recorded_at = 1000 + i;
        e.detail = "entry " + std::to_string(i);
        store.appendHistory(e);
    }

    auto for_a = store.historyForSession("tok-a");
    TEST_ASSERT(for_a.size() == 2, "tok-a should have two entries, got " << for_a.size());
    TEST_ASSERT(for_a[0].id > 0 && for_a[1].id > for_a[0].id, "Entries should get increasing ids");

    auto recent = store.recentHistory(3);
    TEST_ASSERT(recent.size() == 3, "Limit should cap the result");
    TEST_ASSERT(recent[0].detail == "entry 3", "Newest entry should come first, got " << recent[0].detail);

    auto counts = store.historyCounts();
    TEST_ASSERT(counts[Outcome::Stored] == 2, "Two stored entries expected");
    TEST_ASSERT(counts[Outcome::Duplicate] == 1, "One duplicate entry expected");
    TEST_ASSERT(counts[Outcome::Failed] == 1, "One failed entry expected");
    std::cout << "PASS: sync history" << std::endl;
    return true;
}

int main() {
    std::cout << "Running MetadataStore Tests..." << std::endl;
    ScratchDir scratch("metadata");

    test_file_record_insert_and_conflict(scratch.path());
    test_concurrent_index_inserts(scratch.path());
    test_session_persistence(scratch.path());
    test_purge_keeps_active_sessions(scratch.path());
    test_history_is_append_only_log(scratch.path());

    return reportResults("METADATA STORE");
}
