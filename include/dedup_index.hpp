// include/dedup_index.hpp
#pragma once

#include <string>
#include <optional>

#include "file_record.hpp"
#include "metadata_store.hpp"

namespace MediaVault
{
    namespace Index
    {

        enum class InsertStatus
        {
            Inserted,
            AlreadyExists
        };

        struct InsertResult
        {
            InsertStatus status;
            Metadata::FileRecord record; // The caller's record, or the one that won the race
        };

        // Fingerprint -> FileRecord mapping realized as the primary key of the
        // file_records table. Concurrent inserts of one fingerprint resolve to
        // exactly one Inserted; every other caller gets AlreadyExists plus the
        // winning record.
        class DeduplicationIndex
        {
        public:
            explicit DeduplicationIndex(Metadata::MetadataStore &store);

            std::optional<Metadata::FileRecord> lookup(const std::string &fingerprint);

            InsertResult insert(const Metadata::FileRecord &record);

            // Pre-filter only. A miss proves the content is new; a hit proves nothing.
            bool mayContainFastKey(const std::string &fast_key);

        private:
            Metadata::MetadataStore &store;
        };

    } // namespace Index
} // namespace MediaVault
