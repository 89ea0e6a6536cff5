#pragma once

#include "Connection.hpp"

namespace safedb {

// Cheap round-trip check that detects silently dead sessions
class LivenessProbe {
public:
    /**
     * @brief Check if a physical connection still answers.
     * @return false if the connection reports itself inactive, the ping
     *         fails, or the ping throws. Never throws.
     */
    static bool isAlive(Connection& conn) noexcept;
};

}  // namespace safedb
