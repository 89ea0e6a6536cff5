#pragma once

/**
 * @file SafeOptions.hpp
 * @brief Construction-time configuration of a SafeConnection.
 *
 * Usage:
 * @code
 *   SafeOptions options;
 *   options.dsn_args = DsnArgs{"sqlite:/var/lib/app/app.db"};
 *   options.retry_policy = RetryPolicies::limited(5, std::chrono::milliseconds(200));
 *   options.reconnect_period = std::chrono::minutes(30);
 *
 *   SafeConnection db(std::move(options));
 *   db.execute("INSERT INTO log VALUES ('started')");
 * @endcode
 */

#include "ConnectFactory.hpp"
#include "ConnectionState.hpp"
#include "RetryPolicy.hpp"
#include "StalenessPolicy.hpp"
#include <functional>
#include <optional>

namespace safedb {

using IdentitySource = std::function<OwnershipToken()>;

struct SafeOptions {
    ConnectFactory connect_factory;     ///< Required unless dsn_args is given
    std::optional<DsnArgs> dsn_args;    ///< Used when connect_factory is empty

    RetryPolicy retry_policy;           ///< Empty = RetryPolicies::once()
    StalenessPolicy staleness_policy;   ///< Empty = never stale
    std::optional<Clock::duration> reconnect_period;

    ClockSource clock;                  ///< Empty = steady_clock::now
    IdentitySource identity;            ///< Empty = OwnershipToken::current

    /**
     * @brief Build options from a shell/application configuration.
     * @throws ConfigurationError for an unknown database type.
     */
    static SafeOptions fromConfig(const Config& config);
};

}  // namespace safedb
