#pragma once

#include "cancellation.hpp"
#include "errors.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <string>
#include <thread>

#include <spdlog/spdlog.h>

namespace turbofetch {

struct RetryPolicy {
    int max_attempts{3};
    std::chrono::milliseconds base_delay{4000};
    double multiplier{2.0};
    std::chrono::milliseconds max_delay{10000};

    // Delay before attempt `failed_attempts + 1`.
    [[nodiscard]] std::chrono::milliseconds delayAfter(int failed_attempts) const {
        const double scaled = static_cast<double>(base_delay.count()) *
                              std::pow(multiplier, std::max(0, failed_attempts - 1));
        const double capped = std::min(scaled, static_cast<double>(max_delay.count()));
        return std::chrono::milliseconds(static_cast<std::chrono::milliseconds::rep>(capped));
    }
};

inline RetryPolicy segmentRetryPolicy() {
    return RetryPolicy{3, std::chrono::milliseconds(4000), 2.0, std::chrono::milliseconds(10000)};
}

inline RetryPolicy metadataRetryPolicy() {
    return RetryPolicy{3, std::chrono::milliseconds(2000), 2.0, std::chrono::milliseconds(5000)};
}

// Runs `operation(attempt)` until it returns without a RetryableError or the
// policy is exhausted, in which case the last RetryableError propagates.
// Anything not derived from RetryableError propagates immediately. A cancelled
// token interrupts the backoff sleep with TransferCancelled.
template <typename Operation>
auto retryWithBackoff(const RetryPolicy& policy, const CancellationToken* token,
                      const std::string& what, Operation&& operation)
    -> decltype(operation(1)) {
    const int attempts = std::max(1, policy.max_attempts);
    for (int attempt = 1;; ++attempt) {
        if (token && token->isCancelled()) {
            throw TransferCancelled();
        }
        try {
            return operation(attempt);
        } catch (const RetryableError& e) {
            if (attempt >= attempts) {
                spdlog::error("{}: giving up after {} attempts: {}", what, attempt, e.what());
                throw;
            }
            const auto delay = policy.delayAfter(attempt);
            spdlog::warn("{}: attempt {}/{} failed ({}), retrying in {} ms", what, attempt,
                         attempts, e.what(), delay.count());
            if (token) {
                if (token->waitFor(delay)) {
                    throw TransferCancelled();
                }
            } else {
                std::this_thread::sleep_for(delay);
            }
        }
    }
}

} // namespace turbofetch
