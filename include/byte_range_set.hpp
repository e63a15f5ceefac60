// include/byte_range_set.hpp
#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

namespace MediaVault
{
    namespace Sessions
    {

        // Half-open byte interval [begin, end).
        struct ByteRange
        {
            uint64_t begin = 0;
            uint64_t end = 0;

            uint64_t length() const { return end - begin; }
            bool operator==(const ByteRange &other) const { return begin == other.begin && end == other.end; }
        };

        // Set of received byte ranges. Ranges are kept non-overlapping and
        // coalesced: adjacent or overlapping inserts merge into one interval.
        class ByteRangeSet
        {
        public:
            ByteRangeSet() = default;

            // Adds [offset, offset + length). Returns the number of bytes that were new.
            uint64_t add(uint64_t offset, uint64_t length);

            bool covers(uint64_t offset, uint64_t length) const;

            // Sub-ranges of [offset, offset + length) not yet in the set, in order.
            std::vector<ByteRange> missingWithin(uint64_t offset, uint64_t length) const;

            // True when the set is exactly [0, total). A zero total is always complete.
            bool isComplete(uint64_t total) const;

            uint64_t totalBytes() const { return total_bytes; }
            size_t rangeCount() const { return ranges.size(); }
            bool empty() const { return ranges.empty(); }
            void clear();

            std::vector<ByteRange> toVector() const;

            // Persisted form: [[begin, end], ...]
            nlohmann::json toJson() const;
            static ByteRangeSet fromJson(const nlohmann::json &j);

            bool operator==(const ByteRangeSet &other) const { return ranges == other.ranges; }

        private:
            std::map<uint64_t, uint64_t> ranges; // begin -> end
            uint64_t total_bytes = 0;
        };

    } // namespace Sessions
} // namespace MediaVault
