#pragma once

#include <cstdint>
#include <exception>
#include <stdexcept>
#include <string>

namespace safedb {

enum class ErrorKind {
    Configuration,
    TransactionViolation,
    ConnectionExhausted,
    Driver,
    Unsupported
};

enum class TransactionFault {
    ReconnectInTransaction,
    AlreadyInTransaction,
    CommitWithoutBegin,
    RollbackWithoutBegin,
    DisconnectDuringTransaction
};

// Base of every error raised by the proxy and the backends
class SafeError : public std::runtime_error {
public:
    SafeError(ErrorKind kind, const std::string& message);

    ErrorKind kind() const { return m_kind; }

private:
    ErrorKind m_kind;
};

// No usable connect mechanism, or a write to a proxy-managed attribute
class ConfigurationError : public SafeError {
public:
    explicit ConfigurationError(const std::string& message);
};

class TransactionViolation : public SafeError {
public:
    TransactionViolation(TransactionFault fault, const std::string& message);

    TransactionFault fault() const { return m_fault; }

private:
    TransactionFault m_fault;
};

// The retry policy declined another connection attempt
class ConnectionExhausted : public SafeError {
public:
    ConnectionExhausted(int attempts, const std::string& lastError);

    int attempts() const { return m_attempts; }
    const std::string& lastError() const { return m_lastError; }

private:
    int m_attempts;
    std::string m_lastError;
};

// Failure reported by a database driver (sqlite3, libmysqlclient, libpq)
class DriverError : public SafeError {
public:
    DriverError(const std::string& driver, int64_t errorCode, const std::string& message);

    const std::string& driver() const { return m_driver; }
    int64_t errorCode() const { return m_errorCode; }

private:
    std::string m_driver;
    int64_t m_errorCode;
};

class UnsupportedOperation : public SafeError {
public:
    UnsupportedOperation(const std::string& driver, const std::string& operation);

    const std::string& operation() const { return m_operation; }

private:
    std::string m_operation;
};

class ErrorHandler {
public:
    static std::string kindToString(ErrorKind kind);
    static std::string faultToString(TransactionFault fault);

    // Describe an exception for last_error bookkeeping and log lines
    static std::string describe(const std::exception& e);
};

// RAII wrapper for setting/clearing error context
class ErrorContext {
public:
    explicit ErrorContext(const std::string& context);
    ~ErrorContext();

    ErrorContext(const ErrorContext&) = delete;
    ErrorContext& operator=(const ErrorContext&) = delete;

    static std::string current();

private:
    static thread_local std::string s_currentContext;
    std::string m_previous;
};

}  // namespace safedb
