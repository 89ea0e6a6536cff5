#pragma once

#include <string>
#include <string_view>

namespace safedb {

enum class AttributeScope {
    Local,   // proxy bookkeeping, never forwarded
    Remote   // read/written on the live physical connection
};

class AttributeRouter {
public:
    static constexpr std::string_view kPrefix = "x_safe_";

    AttributeRouter() = default;

    AttributeScope route(std::string_view name) const;

    // Local keys maintained by the proxy itself; writes are rejected
    bool isReadOnly(std::string_view name) const;

    static std::string scopeToString(AttributeScope scope);
};

}  // namespace safedb
