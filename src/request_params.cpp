// src/request_params.cpp
#include "request_params.hpp"

#include <limits>

namespace MediaVault
{
    namespace Requests
    {

        std::optional<uint64_t> parseOffset(const std::string &text)
        {
            if (text.empty())
            {
                return std::nullopt;
            }
            const uint64_t max = std::numeric_limits<uint64_t>::max();
            uint64_t value = 0;
            for (char c : text)
            {
                if (c < '0' || c > '9')
                {
                    return std::nullopt;
                }
                const uint64_t digit = static_cast<uint64_t>(c - '0');
                if (value > (max - digit) / 10)
                {
                    return std::nullopt;
                }
                value = value * 10 + digit;
            }
            return value;
        }

    } // namespace Requests
} // namespace MediaVault
