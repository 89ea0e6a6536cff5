#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "Shell.hpp"
#include "FakeConnection.hpp"
#include <cstdio>
#include <filesystem>
#include <sstream>
#include <unistd.h>

using namespace safedb;
using ::testing::HasSubstr;
using ::testing::Not;

class ShellTest : public ::testing::Test {
protected:
    void SetUp() override {
        path_ = (std::filesystem::temp_directory_path() /
                 ("safedb_shell_" + std::to_string(::getpid()) + ".db")).string();
        std::remove(path_.c_str());

        SafeOptions opts;
        opts.dsn_args = DsnArgs{"sqlite:" + path_, "", ""};
        db_ = std::make_unique<SafeConnection>(std::move(opts));
        shell_ = std::make_unique<Shell>(*db_, OutputConfig{}, out_, err_);
    }

    void TearDown() override {
        shell_.reset();
        db_.reset();
        std::remove(path_.c_str());
    }

    std::string path_;
    std::ostringstream out_;
    std::ostringstream err_;
    std::unique_ptr<SafeConnection> db_;
    std::unique_ptr<Shell> shell_;
};

TEST_F(ShellTest, IsQuery) {
    EXPECT_TRUE(Shell::isQuery("SELECT 1"));
    EXPECT_TRUE(Shell::isQuery("  select * from t"));
    EXPECT_TRUE(Shell::isQuery("WITH x AS (SELECT 1) SELECT * FROM x"));
    EXPECT_TRUE(Shell::isQuery("pragma table_info(t)"));
    EXPECT_FALSE(Shell::isQuery("INSERT INTO t VALUES (1)"));
    EXPECT_FALSE(Shell::isQuery("SELECTED"));
    EXPECT_FALSE(Shell::isQuery(""));
}

TEST_F(ShellTest, StatementsAndQueries) {
    EXPECT_TRUE(shell_->runLine("CREATE TABLE users (id INTEGER PRIMARY KEY, name TEXT);"));
    EXPECT_TRUE(shell_->runLine("INSERT INTO users (name) VALUES ('alice')"));
    EXPECT_TRUE(shell_->runLine("SELECT id, name FROM users"));

    EXPECT_THAT(out_.str(), HasSubstr("OK, 1 row affected"));
    EXPECT_THAT(out_.str(), HasSubstr("id | name\n"));
    EXPECT_THAT(out_.str(), HasSubstr("1  | alice\n"));
    EXPECT_THAT(out_.str(), HasSubstr("(1 row)"));
    EXPECT_TRUE(err_.str().empty());
}

TEST_F(ShellTest, CommentsAndBlankLinesAreSkipped) {
    EXPECT_TRUE(shell_->runLine(""));
    EXPECT_TRUE(shell_->runLine("   "));
    EXPECT_TRUE(shell_->runLine("-- comment"));
    EXPECT_TRUE(shell_->runLine("# comment"));

    EXPECT_TRUE(out_.str().empty());
    EXPECT_EQ(db_->attribute("x_safe_reconnect_count"), SqlValue("0"));
}

TEST_F(ShellTest, ErrorsGoToErrorStream) {
    EXPECT_FALSE(shell_->runLine("SELECT * FROM missing"));

    EXPECT_THAT(err_.str(), HasSubstr("Error: "));
    EXPECT_THAT(err_.str(), HasSubstr("no such table"));
}

TEST_F(ShellTest, TransactionMetaCommands) {
    shell_->runLine("CREATE TABLE t (x INTEGER)");

    EXPECT_TRUE(shell_->runLine("\\begin"));
    EXPECT_TRUE(shell_->runLine("INSERT INTO t VALUES (1)"));
    EXPECT_TRUE(shell_->runLine("\\rollback"));
    EXPECT_TRUE(shell_->runLine("SELECT COUNT(*) AS n FROM t"));

    EXPECT_THAT(out_.str(), HasSubstr("BEGIN\n"));
    EXPECT_THAT(out_.str(), HasSubstr("ROLLBACK\n"));
    EXPECT_THAT(out_.str(), HasSubstr("n\n-\n0\n"));
}

TEST_F(ShellTest, CommitWithoutBeginFails) {
    EXPECT_FALSE(shell_->runLine("\\commit"));

    EXPECT_THAT(err_.str(), HasSubstr("TransactionViolation: commit() without begin()"));
}

TEST_F(ShellTest, MetadataCommands) {
    shell_->runLine("CREATE TABLE users (id INTEGER PRIMARY KEY, name TEXT)");

    EXPECT_TRUE(shell_->runLine("\\tables"));
    EXPECT_TRUE(shell_->runLine("\\columns users"));
    EXPECT_FALSE(shell_->runLine("\\columns"));

    EXPECT_THAT(out_.str(), HasSubstr("users"));
    EXPECT_THAT(out_.str(), HasSubstr("PRI"));
    EXPECT_THAT(err_.str(), HasSubstr("needs a table name"));
}

TEST_F(ShellTest, PingAndStatus) {
    EXPECT_TRUE(shell_->runLine("\\ping"));
    EXPECT_TRUE(shell_->runLine("\\status"));

    EXPECT_THAT(out_.str(), HasSubstr("alive\n"));
    EXPECT_THAT(out_.str(), HasSubstr("x_safe_reconnect_count"));
    EXPECT_THAT(out_.str(), HasSubstr("AutoCommit"));
}

TEST_F(ShellTest, ReconnectCommand) {
    shell_->runLine("CREATE TABLE t (x INTEGER)");

    EXPECT_TRUE(shell_->runLine("\\reconnect"));
    EXPECT_FALSE(db_->isActive());
    EXPECT_TRUE(shell_->runLine("INSERT INTO t VALUES (1)"));

    EXPECT_TRUE(db_->isActive());
    EXPECT_EQ(db_->attribute("x_safe_reconnect_count"), SqlValue("2"));
}

TEST_F(ShellTest, UnknownMetaCommand) {
    EXPECT_FALSE(shell_->runLine("\\frobnicate"));

    EXPECT_THAT(err_.str(), HasSubstr("Unknown command: \\frobnicate"));
}

TEST_F(ShellTest, RunScriptCountsFailures) {
    std::istringstream script(
        "CREATE TABLE t (x INTEGER);\n"
        "INSERT INTO t VALUES (1);\n"
        "INSERT INTO nowhere VALUES (1);\n"
        "-- done\n"
        "SELECT x FROM t;\n");

    EXPECT_EQ(shell_->runScript(script), 1);
    EXPECT_THAT(out_.str(), HasSubstr("(1 row)"));
}

TEST_F(ShellTest, JsonOutput) {
    OutputConfig output;
    output.format = "json";
    output.pretty_json = false;
    Shell shell(*db_, output, out_, err_);

    shell.runLine("CREATE TABLE t (x INTEGER)");
    shell.runLine("INSERT INTO t VALUES (5)");
    out_.str("");
    EXPECT_TRUE(shell.runLine("SELECT x FROM t"));

    EXPECT_EQ(out_.str(), "[{\"x\":\"5\"}]\n");
}
