#include "ErrorHandler.hpp"

namespace safedb {

thread_local std::string ErrorContext::s_currentContext;

SafeError::SafeError(ErrorKind kind, const std::string& message)
    : std::runtime_error(message)
    , m_kind(kind) {
}

ConfigurationError::ConfigurationError(const std::string& message)
    : SafeError(ErrorKind::Configuration, message) {
}

TransactionViolation::TransactionViolation(TransactionFault fault, const std::string& message)
    : SafeError(ErrorKind::TransactionViolation, message)
    , m_fault(fault) {
}

ConnectionExhausted::ConnectionExhausted(int attempts, const std::string& lastError)
    : SafeError(ErrorKind::ConnectionExhausted,
                "All tries to connect is ended, can't connect: [" + lastError + "]")
    , m_attempts(attempts)
    , m_lastError(lastError) {
}

DriverError::DriverError(const std::string& driver, int64_t errorCode, const std::string& message)
    : SafeError(ErrorKind::Driver, driver + " error " + std::to_string(errorCode) + ": " + message)
    , m_driver(driver)
    , m_errorCode(errorCode) {
}

UnsupportedOperation::UnsupportedOperation(const std::string& driver, const std::string& operation)
    : SafeError(ErrorKind::Unsupported,
                "Operation '" + operation + "' is not supported by the " + driver + " driver")
    , m_operation(operation) {
}

std::string ErrorHandler::kindToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Configuration:
            return "ConfigurationError";
        case ErrorKind::TransactionViolation:
            return "TransactionViolation";
        case ErrorKind::ConnectionExhausted:
            return "ConnectionExhausted";
        case ErrorKind::Driver:
            return "DriverError";
        case ErrorKind::Unsupported:
            return "UnsupportedOperation";
    }
    return "Unknown";
}

std::string ErrorHandler::faultToString(TransactionFault fault) {
    switch (fault) {
        case TransactionFault::ReconnectInTransaction:
            return "reconnect needed when db in transaction";
        case TransactionFault::AlreadyInTransaction:
            return "already in a transaction";
        case TransactionFault::CommitWithoutBegin:
            return "commit without begin";
        case TransactionFault::RollbackWithoutBegin:
            return "rollback without begin";
        case TransactionFault::DisconnectDuringTransaction:
            return "disconnect occurred during transaction";
    }
    return "unknown transaction fault";
}

std::string ErrorHandler::describe(const std::exception& e) {
    std::string message = e.what();

    // Driver messages (libpq in particular) end with a newline
    while (!message.empty() && (message.back() == '\n' || message.back() == '\r')) {
        message.pop_back();
    }

    if (auto* safe = dynamic_cast<const SafeError*>(&e)) {
        if (safe->kind() != ErrorKind::Driver) {
            return kindToString(safe->kind()) + ": " + message;
        }
    }
    return message;
}

ErrorContext::ErrorContext(const std::string& context)
    : m_previous(s_currentContext) {
    if (s_currentContext.empty()) {
        s_currentContext = context;
    } else {
        s_currentContext = s_currentContext + " > " + context;
    }
}

ErrorContext::~ErrorContext() {
    s_currentContext = m_previous;
}

std::string ErrorContext::current() {
    return s_currentContext;
}

}  // namespace safedb
