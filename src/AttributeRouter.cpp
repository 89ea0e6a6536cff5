#include "AttributeRouter.hpp"

namespace safedb {

AttributeScope AttributeRouter::route(std::string_view name) const {
    if (name == "Active" || name == "AutoCommit" ||
        name == "PrintError" || name == "RaiseError") {
        return AttributeScope::Local;
    }
    if (name.substr(0, kPrefix.size()) == kPrefix) {
        return AttributeScope::Local;
    }
    return AttributeScope::Remote;
}

bool AttributeRouter::isReadOnly(std::string_view name) const {
    return name == "AutoCommit" ||
           name == "x_safe_in_transaction" ||
           name == "x_safe_last_error" ||
           name == "x_safe_reconnect_count" ||
           name == "x_safe_last_connected";
}

std::string AttributeRouter::scopeToString(AttributeScope scope) {
    switch (scope) {
        case AttributeScope::Local: return "Local";
        case AttributeScope::Remote: return "Remote";
    }
    return "Unknown";
}

}  // namespace safedb
