#pragma once

/**
 * @file RetryPolicy.hpp
 * @brief Predicates bounding how many reconnection attempts are made.
 *
 * A retry policy is asked before every connection attempt, with the
 * 1-based attempt number. Returning false ends the reconnection with
 * ConnectionExhausted. Policies may block (sleep) before answering; that
 * is how delays between attempts are implemented.
 */

#include <chrono>
#include <functional>

namespace safedb {

struct ReconnectConfig;

using RetryPolicy = std::function<bool(int attempt)>;

class RetryPolicies {
public:
    // Exactly one attempt, no delay
    static RetryPolicy once();

    // Up to maxAttempts attempts, sleeping delay before each one after the first
    static RetryPolicy limited(int maxAttempts,
                               std::chrono::milliseconds delay = std::chrono::milliseconds{0});

    // Up to maxAttempts attempts; delays grow by multiplier, capped at maxDelay
    static RetryPolicy exponentialBackoff(int maxAttempts,
                                          std::chrono::milliseconds initialDelay,
                                          double multiplier,
                                          std::chrono::milliseconds maxDelay);

    static RetryPolicy fromConfig(const ReconnectConfig& config);

    /**
     * @brief Delay to wait before the given attempt.
     * @param attempt 1-based attempt number; attempt 1 never waits.
     * @return initialDelay * multiplier^(attempt - 2), capped at maxDelay.
     */
    static std::chrono::milliseconds backoffDelay(int attempt,
                                                  std::chrono::milliseconds initialDelay,
                                                  double multiplier,
                                                  std::chrono::milliseconds maxDelay);
};

}  // namespace safedb
