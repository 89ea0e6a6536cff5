#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "ErrorHandler.hpp"

using namespace safedb;
using ::testing::HasSubstr;

class ErrorHandlerTest : public ::testing::Test {
};

TEST_F(ErrorHandlerTest, KindToString) {
    EXPECT_EQ(ErrorHandler::kindToString(ErrorKind::Configuration), "ConfigurationError");
    EXPECT_EQ(ErrorHandler::kindToString(ErrorKind::TransactionViolation), "TransactionViolation");
    EXPECT_EQ(ErrorHandler::kindToString(ErrorKind::ConnectionExhausted), "ConnectionExhausted");
    EXPECT_EQ(ErrorHandler::kindToString(ErrorKind::Driver), "DriverError");
    EXPECT_EQ(ErrorHandler::kindToString(ErrorKind::Unsupported), "UnsupportedOperation");
}

TEST_F(ErrorHandlerTest, FaultToString) {
    EXPECT_EQ(ErrorHandler::faultToString(TransactionFault::ReconnectInTransaction),
              "reconnect needed when db in transaction");
    EXPECT_EQ(ErrorHandler::faultToString(TransactionFault::CommitWithoutBegin),
              "commit without begin");
    EXPECT_EQ(ErrorHandler::faultToString(TransactionFault::DisconnectDuringTransaction),
              "disconnect occurred during transaction");
}

// Driver messages are reported as the driver wrote them
TEST_F(ErrorHandlerTest, DescribeDriverError) {
    DriverError err("PostgreSQL", 7, "server closed the connection unexpectedly\n");

    EXPECT_EQ(ErrorHandler::describe(err),
              "PostgreSQL error 7: server closed the connection unexpectedly");
}

TEST_F(ErrorHandlerTest, DescribeProxyErrorNamesKind) {
    TransactionViolation err(TransactionFault::CommitWithoutBegin, "commit() without begin()");

    EXPECT_EQ(ErrorHandler::describe(err), "TransactionViolation: commit() without begin()");
}

TEST_F(ErrorHandlerTest, DescribeForeignException) {
    std::invalid_argument err("bad input");

    EXPECT_EQ(ErrorHandler::describe(err), "bad input");
}

// Exception types
TEST_F(ErrorHandlerTest, ConnectionExhaustedCarriesLastError) {
    ConnectionExhausted err(3, "Connection refused");

    EXPECT_EQ(err.kind(), ErrorKind::ConnectionExhausted);
    EXPECT_EQ(err.attempts(), 3);
    EXPECT_EQ(err.lastError(), "Connection refused");
    EXPECT_THAT(err.what(), HasSubstr("can't connect"));
    EXPECT_THAT(err.what(), HasSubstr("[Connection refused]"));
}

TEST_F(ErrorHandlerTest, DriverErrorFields) {
    DriverError err("MySQL", 2006, "MySQL server has gone away");

    EXPECT_EQ(err.kind(), ErrorKind::Driver);
    EXPECT_EQ(err.driver(), "MySQL");
    EXPECT_EQ(err.errorCode(), 2006);
    EXPECT_STREQ(err.what(), "MySQL error 2006: MySQL server has gone away");
}

TEST_F(ErrorHandlerTest, UnsupportedOperationNamesDriver) {
    UnsupportedOperation err("SQLite", "select_db");

    EXPECT_EQ(err.operation(), "select_db");
    EXPECT_THAT(err.what(), HasSubstr("'select_db'"));
    EXPECT_THAT(err.what(), HasSubstr("SQLite"));
}

TEST_F(ErrorHandlerTest, AllErrorsCatchableAsSafeError) {
    bool caught = false;

    try {
        throw TransactionViolation(TransactionFault::AlreadyInTransaction, "Already in a transaction");
    } catch (const SafeError& ex) {
        caught = true;
        EXPECT_EQ(ex.kind(), ErrorKind::TransactionViolation);
    }

    EXPECT_TRUE(caught);
}

TEST_F(ErrorHandlerTest, CanBeCaughtAsRuntimeError) {
    bool caught = false;

    try {
        throw ConfigurationError("No connect way defined");
    } catch (const std::runtime_error& ex) {
        caught = true;
        EXPECT_STREQ(ex.what(), "No connect way defined");
    }

    EXPECT_TRUE(caught);
}

// ErrorContext tests
class ErrorContextTest : public ::testing::Test {
};

TEST_F(ErrorContextTest, SetAndGetContext) {
    EXPECT_TRUE(ErrorContext::current().empty());

    {
        ErrorContext ctx("reconnect");
        EXPECT_EQ(ErrorContext::current(), "reconnect");
    }

    EXPECT_TRUE(ErrorContext::current().empty());
}

TEST_F(ErrorContextTest, NestedContext) {
    {
        ErrorContext ctx1("level1");
        {
            ErrorContext ctx2("level2");
            EXPECT_EQ(ErrorContext::current(), "level1 > level2");
        }
        EXPECT_EQ(ErrorContext::current(), "level1");
    }

    EXPECT_TRUE(ErrorContext::current().empty());
}

TEST_F(ErrorContextTest, ContextRestoredOnException) {
    try {
        ErrorContext ctx1("outer");
        ErrorContext ctx2("inner");
        throw std::runtime_error("test");
    } catch (const std::runtime_error&) {
        EXPECT_TRUE(ErrorContext::current().empty());
    }
}
