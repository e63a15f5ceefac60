// tests/test_request_params.cpp
#include "request_params.hpp"
#include "test_helpers.hpp"

using namespace MediaVault;

bool test_parse_offset() {
    std::cout << "Testing offset parameter parsing..." << std::endl;
    TEST_ASSERT(Requests::parseOffset("0") == uint64_t(0), "Zero is a valid offset");
    TEST_ASSERT(Requests::parseOffset("1048576") == uint64_t(1048576), "Plain digits should parse");
    TEST_ASSERT(Requests::parseOffset("18446744073709551615") == UINT64_MAX, "Largest offset should parse");

    TEST_ASSERT(!Requests::parseOffset(""), "Empty offset must be rejected");
    TEST_ASSERT(!Requests::parseOffset("abc"), "Letters must be rejected");
    TEST_ASSERT(!Requests::parseOffset("-5"), "Negative offset must be rejected");
    TEST_ASSERT(!Requests::parseOffset("+5"), "Signed offset must be rejected");
    TEST_ASSERT(!Requests::parseOffset(" 5"), "Whitespace must be rejected");
    TEST_ASSERT(!Requests::parseOffset("12ab"), "Trailing garbage must be rejected");
    TEST_ASSERT(!Requests::parseOffset("18446744073709551616"), "Offset past 64 bits must be rejected");
    std::cout << "PASS: offset parameter parsing" << std::endl;
    return true;
}

int main() {
    std::cout << "Running RequestParams Tests..." << std::endl;

    test_parse_offset();

    return reportResults("REQUEST PARAMS");
}
