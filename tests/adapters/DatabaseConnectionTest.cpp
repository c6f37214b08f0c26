/**
 * @file DatabaseConnectionTest.cpp
 * @brief Tests for SqliteSession, DatabaseConnection and schema migrations
 */

#include <gtest/gtest.h>
#include "adapters/secondary/persistence/DatabaseConnection.hpp"
#include "adapters/secondary/persistence/SchemaMigrations.hpp"
#include "adapters/secondary/persistence/SqlFilter.hpp"
#include "ports/output/PersistenceErrors.hpp"
#include "mocks/TempDatabase.hpp"
#include <filesystem>
#include <fstream>

using namespace stockbook;
using namespace stockbook::adapters::secondary;
using namespace stockbook::ports::output;
using namespace stockbook::tests;

class DatabaseConnectionTest : public ::testing::Test {
protected:
    void SetUp() override {
        connection_ = db_.connection();
        connection_->initializeSchema();
    }

    static int64_t countRows(SqliteSession& session, const std::string& table) {
        auto stmt = session.prepare("SELECT COUNT(*) AS n FROM " + table);
        stmt.step();
        return stmt.get<int64_t>("n");
    }

    TempDatabase db_;
    std::shared_ptr<DatabaseConnection> connection_;
};

// ============================================================================
// SCHEMA
// ============================================================================

TEST_F(DatabaseConnectionTest, InitializeSchema_FreshFile_CreatesAllTables) {
    auto session = connection_->acquire();
    auto stmt = session->prepare(
        "SELECT COUNT(*) AS n FROM sqlite_master WHERE type = 'table' AND name IN "
        "('stock', 'portfolio', 'stock_transaction', 'target', 'portfolio_balance', 'journal_entry')");
    ASSERT_TRUE(stmt.step());

    EXPECT_EQ(stmt.get<int>("n"), 6);
    EXPECT_EQ(schemaVersion(*session), static_cast<int>(schemaMigrations().size()));
}

TEST_F(DatabaseConnectionTest, ApplyMigrations_AlreadyCurrent_AppliesNothing) {
    auto session = connection_->acquire();

    EXPECT_EQ(applyMigrations(*session), 0);
}

TEST_F(DatabaseConnectionTest, InitializeSchema_SecondConnection_KeepsData) {
    connection_->withinTransaction([](SqliteSession& session) {
        session.execute("INSERT INTO stock (symbol, name) VALUES ('AAPL', 'Apple')");
    });

    auto other = db_.connection();
    other->initializeSchema();
    auto session = other->acquire();

    EXPECT_EQ(countRows(*session, "stock"), 1);
}

// ============================================================================
// SESSION SETUP
// ============================================================================

TEST_F(DatabaseConnectionTest, Acquire_File_AppliesPragmas) {
    auto session = connection_->acquire();

    auto fk = session->prepare("PRAGMA foreign_keys");
    ASSERT_TRUE(fk.step());
    EXPECT_EQ(fk.get<int>("foreign_keys"), 1);

    auto mode = session->prepare("PRAGMA journal_mode");
    ASSERT_TRUE(mode.step());
    EXPECT_EQ(mode.get<std::string>("journal_mode"), "wal");
}

TEST_F(DatabaseConnectionTest, Acquire_File_OpensNewSessionEachTime) {
    EXPECT_NE(connection_->acquire(), connection_->acquire());
}

TEST_F(DatabaseConnectionTest, Acquire_InMemory_SharesOneSession) {
    auto memory = std::make_shared<DatabaseConnection>(
        std::make_shared<settings::DbSettings>(settings::DbSettings::MEMORY_PATH));
    memory->initializeSchema();

    memory->withinTransaction([](SqliteSession& session) {
        session.execute("INSERT INTO stock (symbol, name) VALUES ('MSFT', 'Microsoft')");
    });

    EXPECT_EQ(memory->acquire(), memory->acquire());
    EXPECT_EQ(countRows(*memory->acquire(), "stock"), 1);
}

TEST_F(DatabaseConnectionTest, Constructor_MissingDirectory_IsCreated) {
    auto dir = std::filesystem::temp_directory_path() /
               ("stockbook_dir_" + std::to_string(reinterpret_cast<std::uintptr_t>(this)));
    auto path = dir / "nested" / "book.db";

    DatabaseConnection connection(std::make_shared<settings::DbSettings>(path.string()));

    EXPECT_TRUE(std::filesystem::is_directory(path.parent_path()));
    std::filesystem::remove_all(dir);
}

TEST_F(DatabaseConnectionTest, Constructor_ParentIsFile_ThrowsConnectionUnavailable) {
    std::string blocker = db_.path() + ".blocker";
    std::ofstream(blocker) << "not a directory";

    EXPECT_THROW(
        DatabaseConnection(std::make_shared<settings::DbSettings>(blocker + "/sub/book.db")),
        ConnectionUnavailableError);
    std::filesystem::remove(blocker);
}

TEST_F(DatabaseConnectionTest, Acquire_NotADatabase_ThrowsConnectionUnavailable) {
    std::string garbage = db_.path() + ".garbage";
    std::ofstream(garbage) << std::string(4096, 'x');

    DatabaseConnection connection(std::make_shared<settings::DbSettings>(garbage, 1, true, "DELETE"));

    EXPECT_THROW(connection.initializeSchema(), ConnectionUnavailableError);
    std::filesystem::remove(garbage);
}

// ============================================================================
// TRANSACTIONS AND ERROR MAPPING
// ============================================================================

TEST_F(DatabaseConnectionTest, WithinTransaction_Exception_RollsBackAndRethrows) {
    EXPECT_THROW(connection_->withinTransaction([](SqliteSession& session) {
        session.execute("INSERT INTO stock (symbol, name) VALUES ('AAPL', 'Apple')");
        throw std::runtime_error("boom");
    }), std::runtime_error);

    auto session = connection_->acquire();
    EXPECT_EQ(countRows(*session, "stock"), 0);
    EXPECT_FALSE(session->inTransaction());
}

TEST_F(DatabaseConnectionTest, Insert_DuplicateSymbol_ThrowsDuplicateKey) {
    connection_->withinTransaction([](SqliteSession& session) {
        session.execute("INSERT INTO stock (symbol, name) VALUES ('AAPL', 'Apple')");
    });

    EXPECT_THROW(connection_->withinTransaction([](SqliteSession& session) {
        session.execute("INSERT INTO stock (symbol, name) VALUES ('AAPL', 'Apple again')");
    }), DuplicateKeyError);
}

TEST_F(DatabaseConnectionTest, Insert_CheckViolation_ThrowsConstraintViolation) {
    EXPECT_THROW(connection_->withinTransaction([](SqliteSession& session) {
        session.execute("INSERT INTO stock (symbol, name, grade) VALUES ('AAPL', 'Apple', 'Z')");
    }), ConstraintViolationError);
}

TEST_F(DatabaseConnectionTest, Insert_MissingForeignKey_ThrowsConstraintViolation) {
    EXPECT_THROW(connection_->withinTransaction([](SqliteSession& session) {
        session.execute(
            "INSERT INTO portfolio_balance (portfolio_id, balance_date, final_balance) "
            "VALUES (999, '2024-01-31', '100.00')");
    }), ConstraintViolationError);
}

TEST_F(DatabaseConnectionTest, Statement_UnknownColumn_ThrowsPersistenceError) {
    auto session = connection_->acquire();
    auto stmt = session->prepare("SELECT 1 AS one");
    ASSERT_TRUE(stmt.step());

    EXPECT_EQ(stmt.get<int>("one"), 1);
    EXPECT_THROW(stmt.get<int>("two"), PersistenceError);
}

TEST_F(DatabaseConnectionTest, Session_RollbackOutsideTransaction_IsNoop) {
    auto session = connection_->acquire();

    EXPECT_NO_THROW(session->rollback());
    EXPECT_THROW(session->commit(), TransactionError);
}

TEST(SqlFilterTest, LikePattern_EscapesWildcards) {
    EXPECT_EQ(SqlFilter::likePattern("50%_off"), "%50\\%\\_off%");
}

TEST(SqlFilterTest, Clause_JoinsWithAnd) {
    SqlFilter filter;
    filter.equals("portfolio_id", int64_t{1}).containsAny({"title", "content"}, "cup");

    EXPECT_EQ(filter.clause(),
              " WHERE portfolio_id = ? AND (title LIKE ? ESCAPE '\\' OR content LIKE ? ESCAPE '\\')");
}
