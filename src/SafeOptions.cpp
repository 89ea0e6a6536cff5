#include "SafeOptions.hpp"
#include "ErrorHandler.hpp"

namespace safedb {

SafeOptions SafeOptions::fromConfig(const Config& config) {
    SafeOptions options;

    if (!config.dsn.empty()) {
        options.dsn_args = DsnArgs{config.dsn, config.connection.user, config.connection.password};
    } else {
        options.connect_factory = ConnectFactoryAdapter::fromConfig(config.database_type, config.connection);
    }

    options.retry_policy = RetryPolicies::fromConfig(config.reconnect);

    if (config.reconnect.reconnect_period.count() > 0) {
        options.reconnect_period = config.reconnect.reconnect_period;
    }

    return options;
}

}  // namespace safedb
