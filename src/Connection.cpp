#include "Connection.hpp"
#include "ErrorHandler.hpp"

namespace safedb {

SqlValue Connection::invoke(const std::string& operation, const std::vector<std::string>& /*args*/) {
    throw UnsupportedOperation(driverName(), operation);
}

}  // namespace safedb
