#include "RetryPolicy.hpp"
#include "Config.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <thread>

namespace safedb {

RetryPolicy RetryPolicies::once() {
    return [](int attempt) { return attempt == 1; };
}

RetryPolicy RetryPolicies::limited(int maxAttempts, std::chrono::milliseconds delay) {
    return exponentialBackoff(maxAttempts, delay, 1.0, std::max(delay, std::chrono::milliseconds{0}));
}

RetryPolicy RetryPolicies::exponentialBackoff(int maxAttempts,
                                              std::chrono::milliseconds initialDelay,
                                              double multiplier,
                                              std::chrono::milliseconds maxDelay) {
    return [=](int attempt) {
        if (attempt > maxAttempts) {
            return false;
        }

        auto delay = backoffDelay(attempt, initialDelay, multiplier, maxDelay);
        if (delay.count() > 0) {
            spdlog::debug("Waiting {} ms before connection attempt {}/{}",
                          delay.count(), attempt, maxAttempts);
            std::this_thread::sleep_for(delay);
        }
        return true;
    };
}

RetryPolicy RetryPolicies::fromConfig(const ReconnectConfig& config) {
    if (config.max_attempts <= 1) {
        return once();
    }
    return exponentialBackoff(config.max_attempts, config.retry_delay,
                              config.backoff_multiplier, config.max_delay);
}

std::chrono::milliseconds RetryPolicies::backoffDelay(int attempt,
                                                      std::chrono::milliseconds initialDelay,
                                                      double multiplier,
                                                      std::chrono::milliseconds maxDelay) {
    if (attempt <= 1 || initialDelay.count() <= 0) {
        return std::chrono::milliseconds{0};
    }

    double delayMs = static_cast<double>(initialDelay.count()) *
                     std::pow(multiplier, attempt - 2);
    delayMs = std::min(delayMs, static_cast<double>(maxDelay.count()));

    return std::chrono::milliseconds(static_cast<int64_t>(delayMs));
}

}  // namespace safedb
