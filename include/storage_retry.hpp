// include/storage_retry.hpp
#pragma once

#include <chrono>
#include <iostream> // For logging
#include <string>
#include <thread>

#include "vault_errors.hpp"

namespace MediaVault {
namespace Concurrency {

struct RetryPolicy {
    int attempts = 3;       // Total tries, including the first
    int backoff_ms = 50;    // Delay before the second try; doubles after each failure
};

// Runs op, retrying on Errors::StorageWriteError with exponential backoff.
// Other exceptions pass straight through. The last StorageWriteError is
// rethrown once the attempts are used up. retries, if given, receives the
// number of failed tries.
template<class Op>
auto withStorageRetry(const RetryPolicy& policy, const std::string& what, Op&& op, int* retries = nullptr)
    -> decltype(op())
{
    int delay_ms = policy.backoff_ms;
    for (int attempt = 1;; ++attempt) {
        try {
            return op();
        } catch (const Errors::StorageWriteError& e) {
            if (retries) {
                *retries = attempt;
            }
            if (attempt >= policy.attempts) {
                std::cerr << "Giving up on " << what << " after " << attempt << " attempts: " << e.what() << std::endl;
                throw;
            }
            std::cerr << "Retrying " << what << " in " << delay_ms << "ms: " << e.what() << std::endl;
            std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms));
            delay_ms *= 2;
        }
    }
}

} // namespace Concurrency
} // namespace MediaVault
