// src/dedup_index.cpp
#include "dedup_index.hpp"
#include "vault_errors.hpp"
#include <iostream> // For logging

namespace MediaVault
{
    namespace Index
    {

        DeduplicationIndex::DeduplicationIndex(Metadata::MetadataStore &store) : store(store)
        {
        }

        std::optional<Metadata::FileRecord> DeduplicationIndex::lookup(const std::string &fingerprint)
        {
            return store.findFileByFingerprint(fingerprint);
        }

        InsertResult DeduplicationIndex::insert(const Metadata::FileRecord &record)
        {
            if (store.insertFileRecordIfAbsent(record))
            {
                return InsertResult{InsertStatus::Inserted, record};
            }

            // Lost the race (or the content was stored earlier): report the winner.
            std::optional<Metadata::FileRecord> winner = store.findFileByFingerprint(record.fingerprint);
            if (!winner)
            {
                // Rows are never deleted by the engine, so this means the store is inconsistent.
                throw Errors::DatabaseError("Fingerprint " + record.fingerprint + " conflicted but no record was found");
            }
            std::cout << "Index conflict on " << record.fingerprint.substr(0, 12)
                      << ", existing copy at " << winner->storage_path << std::endl;
            return InsertResult{InsertStatus::AlreadyExists, *winner};
        }

        bool DeduplicationIndex::mayContainFastKey(const std::string &fast_key)
        {
            return store.hasFastKey(fast_key);
        }

    } // namespace Index
} // namespace MediaVault
