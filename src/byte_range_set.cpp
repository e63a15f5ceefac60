// src/byte_range_set.cpp
#include "byte_range_set.hpp"
#include <algorithm>
#include <iterator>
#include <stdexcept>

namespace MediaVault
{
    namespace Sessions
    {

        uint64_t ByteRangeSet::add(uint64_t offset, uint64_t length)
        {
            if (length == 0)
            {
                return 0;
            }
            uint64_t begin = offset;
            uint64_t end = offset + length;
            if (end < begin)
            {
                throw std::overflow_error("Byte range overflows 64-bit offset space");
            }

            uint64_t already_present = 0;

            // Step back to a range that may touch or overlap begin.
            auto it = ranges.upper_bound(begin);
            if (it != ranges.begin())
            {
                auto prev = std::prev(it);
                if (prev->second >= begin)
                {
                    it = prev;
                }
            }

            while (it != ranges.end() && it->first <= end)
            {
                const uint64_t overlap_begin = std::max(it->first, offset);
                const uint64_t overlap_end = std::min(it->second, offset + length);
                if (overlap_end > overlap_begin)
                {
                    already_present += overlap_end - overlap_begin;
                }
                begin = std::min(begin, it->first);
                end = std::max(end, it->second);
                total_bytes -= it->second - it->first;
                it = ranges.erase(it);
            }

            ranges.emplace(begin, end);
            total_bytes += end - begin;
            return length - already_present;
        }

        bool ByteRangeSet::covers(uint64_t offset, uint64_t length) const
        {
            if (length == 0)
            {
                return true;
            }
            auto it = ranges.upper_bound(offset);
            if (it == ranges.begin())
            {
                return false;
            }
            --it;
            return it->first <= offset && it->second >= offset + length;
        }

        std::vector<ByteRange> ByteRangeSet::missingWithin(uint64_t offset, uint64_t length) const
        {
            std::vector<ByteRange> gaps;
            const uint64_t end = offset + length;
            uint64_t cursor = offset;

            auto it = ranges.upper_bound(offset);
            if (it != ranges.begin())
            {
                auto prev = std::prev(it);
                if (prev->second > offset)
                {
                    cursor = std::min(prev->second, end);
                }
            }

            for (; it != ranges.end() && it->first < end && cursor < end; ++it)
            {
                if (it->first > cursor)
                {
                    gaps.push_back(ByteRange{cursor, it->first});
                }
                cursor = std::max(cursor, std::min(it->second, end));
            }
            if (cursor < end)
            {
                gaps.push_back(ByteRange{cursor, end});
            }
            return gaps;
        }

        bool ByteRangeSet::isComplete(uint64_t total) const
        {
            if (total == 0)
            {
                return true;
            }
            return ranges.size() == 1 && ranges.begin()->first == 0 && ranges.begin()->second == total;
        }

        void ByteRangeSet::clear()
        {
            ranges.clear();
            total_bytes = 0;
        }

        std::vector<ByteRange> ByteRangeSet::toVector() const
        {
            std::vector<ByteRange> out;
            out.reserve(ranges.size());
            for (const auto &r : ranges)
            {
                out.push_back(ByteRange{r.first, r.second});
            }
            return out;
        }

        nlohmann::json ByteRangeSet::toJson() const
        {
            nlohmann::json j = nlohmann::json::array();
            for (const auto &r : ranges)
            {
                j.push_back(nlohmann::json::array({r.first, r.second}));
            }
            return j;
        }

        ByteRangeSet ByteRangeSet::fromJson(const nlohmann::json &j)
        {
            ByteRangeSet set;
            for (const auto &entry : j)
            {
                const uint64_t begin = entry.at(0).get<uint64_t>();
                const uint64_t end = entry.at(1).get<uint64_t>();
                if (end < begin)
                {
                    throw std::invalid_argument("Persisted byte range has end before begin");
                }
                set.add(begin, end - begin);
            }
            return set;
        }

    } // namespace Sessions
} // namespace MediaVault
