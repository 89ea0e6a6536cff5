#include "LivenessProbe.hpp"
#include "ErrorHandler.hpp"
#include <spdlog/spdlog.h>

namespace safedb {

bool LivenessProbe::isAlive(Connection& conn) noexcept {
    try {
        if (!conn.isActive()) {
            spdlog::debug("Liveness probe: {} connection is not active", conn.driverName());
            return false;
        }
        if (!conn.ping()) {
            spdlog::debug("Liveness probe: {} ping failed", conn.driverName());
            return false;
        }
        return true;
    } catch (const std::exception& e) {
        spdlog::debug("Liveness probe: ping raised: {}", ErrorHandler::describe(e));
        return false;
    } catch (...) {
        spdlog::debug("Liveness probe: ping raised a non-standard exception");
        return false;
    }
}

}  // namespace safedb
