#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "ReconnectionEngine.hpp"
#include "ErrorHandler.hpp"
#include "FakeConnection.hpp"
#include <sys/wait.h>
#include <unistd.h>
#include <thread>

using namespace safedb;
using namespace safedb::fakes;
using namespace std::chrono_literals;
using ::testing::HasSubstr;

class ReconnectionEngineTest : public ::testing::Test {
protected:
    SafeOptions options() {
        SafeOptions opts;
        opts.connect_factory = factory_.factory();
        opts.clock = clock_.source();
        opts.identity = identity_.source();
        return opts;
    }

    std::thread::id otherThreadId() {
        std::thread::id id;
        std::thread t([&id] { id = std::this_thread::get_id(); });
        t.join();
        return id;
    }

    FakeFactory factory_;
    FakeClock clock_;
    FakeIdentity identity_;
    ConnectionState state_;
};

// Lazy connect
TEST_F(ReconnectionEngineTest, ConnectsOnFirstUse) {
    ReconnectionEngine engine(options());
    EXPECT_EQ(factory_.calls, 0);

    Connection& conn = engine.ensureConnected(state_);

    EXPECT_EQ(tagOf(conn), 1);
    EXPECT_EQ(factory_.calls, 1);
    EXPECT_EQ(state_.reconnect_count, 1u);
    EXPECT_EQ(state_.owner(), identity_.token);
    ASSERT_TRUE(state_.last_connected_at.has_value());
    EXPECT_EQ(*state_.last_connected_at, clock_.now);
    ASSERT_TRUE(state_.last_reconnect_at.has_value());
    EXPECT_EQ(*state_.last_reconnect_at, clock_.now);
}

TEST_F(ReconnectionEngineTest, NoConnectWayIsConfigurationError) {
    SafeOptions opts;
    EXPECT_THROW(ReconnectionEngine engine(std::move(opts)), ConfigurationError);
}

// Idempotent liveness
TEST_F(ReconnectionEngineTest, AliveConnectionIsReused) {
    ReconnectionEngine engine(options());

    Connection* first = &engine.ensureConnected(state_);
    for (int i = 0; i < 5; ++i) {
        EXPECT_EQ(&engine.ensureConnected(state_), first);
    }
    EXPECT_EQ(factory_.calls, 1);
    EXPECT_EQ(factory_.journal->closed, 0);
}

// Ping-triggered reconnect
TEST_F(ReconnectionEngineTest, FailedPingReconnects) {
    ReconnectionEngine engine(options());
    engine.ensureConnected(state_);
    factory_.last->alive = false;

    Connection& conn = engine.ensureConnected(state_);

    EXPECT_EQ(tagOf(conn), 2);
    EXPECT_EQ(state_.reconnect_count, 2u);
    EXPECT_EQ(factory_.journal->closed, 1);
}

TEST_F(ReconnectionEngineTest, InactiveConnectionReconnectsWithoutPing) {
    ReconnectionEngine engine(options());
    engine.ensureConnected(state_);
    factory_.last->active = false;

    EXPECT_EQ(engine.checkConnection(state_), ReconnectReason::Dead);
    EXPECT_THAT(factory_.journal->calls, ::testing::Not(::testing::Contains("1:ping")));
    EXPECT_EQ(tagOf(engine.ensureConnected(state_)), 2);
}

TEST_F(ReconnectionEngineTest, ThrowingPingCountsAsDead) {
    ReconnectionEngine engine(options());
    engine.ensureConnected(state_);
    factory_.last->throwOnPing = true;

    EXPECT_EQ(tagOf(engine.ensureConnected(state_)), 2);
}

// Fork isolation, simulated
TEST_F(ReconnectionEngineTest, ProcessChangeReconnectsAndLeavesInheritedSessionOpen) {
    ReconnectionEngine engine(options());
    engine.ensureConnected(state_);

    identity_.token.process_id += 1;
    Connection& conn = engine.ensureConnected(state_);

    EXPECT_EQ(tagOf(conn), 2);
    EXPECT_EQ(state_.owner_process_id, identity_.token.process_id);
    EXPECT_EQ(factory_.journal->leftOpen, 1);
    EXPECT_EQ(factory_.journal->closed, 0);
    // The probe never touched the inherited session
    EXPECT_THAT(factory_.journal->calls, ::testing::Not(::testing::Contains("1:ping")));
}

// Thread isolation
TEST_F(ReconnectionEngineTest, ThreadChangeReconnects) {
    ReconnectionEngine engine(options());
    engine.ensureConnected(state_);

    identity_.token.thread_id = otherThreadId();
    EXPECT_EQ(engine.checkConnection(state_), ReconnectReason::ThreadChanged);

    Connection& conn = engine.ensureConnected(state_);
    EXPECT_EQ(tagOf(conn), 2);
    EXPECT_EQ(state_.owner_thread_id, identity_.token.thread_id);
    EXPECT_EQ(factory_.journal->closed, 1);
}

TEST_F(ReconnectionEngineTest, ThreadAndProcessChangeStillLeavesSessionOpen) {
    ReconnectionEngine engine(options());
    engine.ensureConnected(state_);

    identity_.token.thread_id = otherThreadId();
    identity_.token.process_id += 1;
    EXPECT_EQ(engine.checkConnection(state_), ReconnectReason::ThreadChanged);

    engine.ensureConnected(state_);
    EXPECT_EQ(factory_.journal->leftOpen, 1);
}

TEST_F(ReconnectionEngineTest, StalenessPolicyForcesReconnect) {
    bool stale = false;
    SafeOptions opts = options();
    opts.staleness_policy = [&stale](const ConnectionState&) { return stale; };
    ReconnectionEngine engine(std::move(opts));

    engine.ensureConnected(state_);
    EXPECT_EQ(tagOf(engine.ensureConnected(state_)), 1);

    stale = true;
    EXPECT_EQ(engine.checkConnection(state_), ReconnectReason::Stale);
    EXPECT_EQ(tagOf(engine.ensureConnected(state_)), 2);
}

TEST_F(ReconnectionEngineTest, ReconnectPeriodExpires) {
    SafeOptions opts = options();
    opts.reconnect_period = std::chrono::seconds(60);
    ReconnectionEngine engine(std::move(opts));

    engine.ensureConnected(state_);
    clock_.advance(60s);
    EXPECT_EQ(tagOf(engine.ensureConnected(state_)), 1);

    clock_.advance(1s);
    EXPECT_EQ(engine.checkConnection(state_), ReconnectReason::PeriodExpired);
    EXPECT_EQ(tagOf(engine.ensureConnected(state_)), 2);

    // The period restarts from the new connect
    clock_.advance(30s);
    EXPECT_EQ(tagOf(engine.ensureConnected(state_)), 2);
}

TEST_F(ReconnectionEngineTest, PeriodAndPolicyAreIndependentTriggers) {
    SafeOptions opts = options();
    opts.staleness_policy = StalenessPolicies::never();
    opts.reconnect_period = std::chrono::seconds(10);
    ReconnectionEngine engine(std::move(opts));

    engine.ensureConnected(state_);
    clock_.advance(11s);
    EXPECT_EQ(tagOf(engine.ensureConnected(state_)), 2);
}

// Transaction guard
TEST_F(ReconnectionEngineTest, ReconnectInsideTransactionIsRefused) {
    ReconnectionEngine engine(options());
    engine.ensureConnected(state_);
    Connection* before = state_.physical.get();

    state_.transaction_depth = 1;
    state_.autocommit = false;
    factory_.last->alive = false;

    try {
        engine.ensureConnected(state_);
        FAIL() << "Expected TransactionViolation";
    } catch (const TransactionViolation& e) {
        EXPECT_EQ(e.fault(), TransactionFault::ReconnectInTransaction);
        EXPECT_THAT(e.what(), HasSubstr("Reconnect needed when db in transaction"));
    }

    EXPECT_EQ(state_.physical.get(), before);
    EXPECT_EQ(factory_.calls, 1);
    EXPECT_EQ(state_.reconnect_count, 1u);
}

TEST_F(ReconnectionEngineTest, HealthyConnectionInsideTransactionIsReturned) {
    ReconnectionEngine engine(options());
    Connection* first = &engine.ensureConnected(state_);
    state_.transaction_depth = 1;

    EXPECT_EQ(&engine.ensureConnected(state_), first);
}

// Retry exhaustion
TEST_F(ReconnectionEngineTest, RefusingRetryPolicyExhaustsImmediately) {
    SafeOptions opts = options();
    opts.retry_policy = [](int) { return false; };
    ReconnectionEngine engine(std::move(opts));

    try {
        engine.ensureConnected(state_);
        FAIL() << "Expected ConnectionExhausted";
    } catch (const ConnectionExhausted& e) {
        EXPECT_EQ(e.attempts(), 0);
        EXPECT_THAT(e.what(), HasSubstr("All tries to connect is ended"));
    }

    EXPECT_FALSE(state_.last_error.empty());
    EXPECT_EQ(factory_.calls, 0);
    EXPECT_EQ(state_.physical.get(), nullptr);
}

TEST_F(ReconnectionEngineTest, DefaultPolicyTriesOnce) {
    factory_.failAlways = true;
    ReconnectionEngine engine(options());

    try {
        engine.ensureConnected(state_);
        FAIL() << "Expected ConnectionExhausted";
    } catch (const ConnectionExhausted& e) {
        EXPECT_EQ(e.attempts(), 1);
        EXPECT_THAT(e.lastError(), HasSubstr("Can't connect to server"));
        EXPECT_THAT(e.what(), HasSubstr("Can't connect to server (attempt 1)"));
    }
    EXPECT_EQ(factory_.calls, 1);
    EXPECT_THAT(state_.last_error, HasSubstr("attempt 1"));
}

TEST_F(ReconnectionEngineTest, RetriesUntilFactorySucceeds) {
    factory_.failNext = 2;
    SafeOptions opts = options();
    opts.retry_policy = RetryPolicies::limited(3);
    ReconnectionEngine engine(std::move(opts));

    Connection& conn = engine.ensureConnected(state_);

    EXPECT_EQ(tagOf(conn), 1);
    EXPECT_EQ(factory_.calls, 3);
    EXPECT_THAT(state_.last_error, HasSubstr("attempt 2"));
}

TEST_F(ReconnectionEngineTest, RetryPolicySeesIncreasingAttempts) {
    std::vector<int> seen;
    factory_.failAlways = true;
    SafeOptions opts = options();
    opts.retry_policy = [&seen](int attempt) {
        seen.push_back(attempt);
        return attempt <= 3;
    };
    ReconnectionEngine engine(std::move(opts));

    EXPECT_THROW(engine.ensureConnected(state_), ConnectionExhausted);
    EXPECT_EQ(seen, (std::vector<int>{1, 2, 3, 4}));
    EXPECT_EQ(factory_.calls, 3);
}

TEST_F(ReconnectionEngineTest, NullFactoryResultIsAFailedAttempt) {
    SafeOptions opts = options();
    opts.connect_factory = [] { return std::unique_ptr<Connection>(); };
    ReconnectionEngine engine(std::move(opts));

    EXPECT_THROW(engine.ensureConnected(state_), ConnectionExhausted);
    EXPECT_THAT(state_.last_error, HasSubstr("no connection"));
}

TEST_F(ReconnectionEngineTest, FailedReconnectKeepsOldConnection) {
    ReconnectionEngine engine(options());
    engine.ensureConnected(state_);
    Connection* before = state_.physical.get();

    factory_.last->alive = false;
    factory_.failAlways = true;

    EXPECT_THROW(engine.ensureConnected(state_), ConnectionExhausted);
    EXPECT_EQ(state_.physical.get(), before);

    // Recovers once the server is back
    factory_.failAlways = false;
    EXPECT_EQ(tagOf(engine.ensureConnected(state_)), 2);
}

// Setup errors are not retried
TEST_F(ReconnectionEngineTest, ConfigurationErrorFromFactoryIsNotRetried) {
    int calls = 0;
    SafeOptions opts = options();
    opts.connect_factory = [&calls]() -> std::unique_ptr<Connection> {
        ++calls;
        throw ConfigurationError("Unsupported DSN scheme: foo://x");
    };
    opts.retry_policy = RetryPolicies::limited(5);
    ReconnectionEngine engine(std::move(opts));

    try {
        engine.ensureConnected(state_);
        FAIL() << "Expected ConfigurationError";
    } catch (const ConfigurationError& e) {
        EXPECT_THAT(e.what(), HasSubstr("Unsupported DSN scheme"));
    }
    EXPECT_EQ(calls, 1);
    EXPECT_THAT(state_.last_error, HasSubstr("Unsupported DSN scheme"));
}

TEST_F(ReconnectionEngineTest, UnsupportedDsnFailsBeforeAnyAttempt) {
    SafeOptions opts;
    opts.dsn_args = DsnArgs{"foo://x", "", ""};
    opts.retry_policy = RetryPolicies::limited(5);

    EXPECT_THROW(ReconnectionEngine engine(std::move(opts)), ConfigurationError);
}

// last_error describes the latest reconnect only
TEST_F(ReconnectionEngineTest, LastErrorResetsOnEachReconnect) {
    bool allow = true;
    SafeOptions opts = options();
    opts.retry_policy = [&allow](int attempt) { return allow && attempt <= 2; };
    ReconnectionEngine engine(std::move(opts));

    factory_.failNext = 1;
    engine.ensureConnected(state_);
    EXPECT_THAT(state_.last_error, HasSubstr("Can't connect"));

    factory_.last->alive = false;
    engine.ensureConnected(state_);
    EXPECT_TRUE(state_.last_error.empty());

    factory_.last->alive = false;
    allow = false;
    try {
        engine.ensureConnected(state_);
        FAIL() << "Expected ConnectionExhausted";
    } catch (const ConnectionExhausted& e) {
        EXPECT_EQ(e.lastError(), "retry policy allowed no connection attempt");
    }
    EXPECT_EQ(state_.last_error, "retry policy allowed no connection attempt");
}

// Counter-tagged scenario
TEST_F(ReconnectionEngineTest, TaggedScenario) {
    ReconnectionEngine engine(options());

    EXPECT_EQ(tagOf(engine.ensureConnected(state_)), 1);
    EXPECT_EQ(tagOf(engine.ensureConnected(state_)), 1);

    factory_.last->alive = false;
    EXPECT_EQ(tagOf(engine.ensureConnected(state_)), 2);
}

TEST_F(ReconnectionEngineTest, ReasonToString) {
    EXPECT_EQ(ReconnectionEngine::reasonToString(ReconnectReason::None), "none");
    EXPECT_EQ(ReconnectionEngine::reasonToString(ReconnectReason::ProcessChanged), "process changed");
    EXPECT_EQ(ReconnectionEngine::reasonToString(ReconnectReason::PeriodExpired), "reconnect period expired");
}

// Fork isolation with a real child process
TEST_F(ReconnectionEngineTest, RealForkReconnectsInChildOnly) {
    SafeOptions opts;
    opts.connect_factory = factory_.factory();
    ReconnectionEngine engine(std::move(opts));

    Connection* parentConn = &engine.ensureConnected(state_);
    ASSERT_EQ(tagOf(*parentConn), 1);

    pid_t pid = fork();
    ASSERT_NE(pid, -1);

    if (pid == 0) {
        // Child: exit code reports the first failed check
        int code = 0;
        try {
            Connection& childConn = engine.ensureConnected(state_);
            if (tagOf(childConn) != 2) code = 2;
            else if (factory_.journal->leftOpen != 1) code = 3;
            else if (factory_.journal->closed != 0) code = 4;
            else if (state_.owner_process_id != getpid()) code = 5;
        } catch (const std::exception&) {
            code = 6;
        }
        _exit(code);
    }

    int status = 0;
    ASSERT_EQ(waitpid(pid, &status, 0), pid);
    ASSERT_TRUE(WIFEXITED(status));
    EXPECT_EQ(WEXITSTATUS(status), 0);

    // Parent keeps its original connection
    EXPECT_EQ(&engine.ensureConnected(state_), parentConn);
    EXPECT_EQ(tagOf(*parentConn), 1);
    EXPECT_EQ(factory_.calls, 1);
}
