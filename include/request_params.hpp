// include/request_params.hpp
#pragma once

#include <string>
#include <cstdint>
#include <optional>

namespace MediaVault
{
    namespace Requests
    {

        // Parses a byte offset from a query parameter. Only plain decimal digits
        // are accepted; signs, whitespace, empty input and values past
        // UINT64_MAX give std::nullopt.
        std::optional<uint64_t> parseOffset(const std::string &text);

    } // namespace Requests
} // namespace MediaVault
