#include "ConnectionState.hpp"
#include <unistd.h>

namespace safedb {

OwnershipToken OwnershipToken::current() {
    return OwnershipToken{::getpid(), std::this_thread::get_id()};
}

}  // namespace safedb
