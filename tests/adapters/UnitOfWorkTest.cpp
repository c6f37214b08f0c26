/**
 * @file UnitOfWorkTest.cpp
 * @brief Tests for SqliteUnitOfWork, UnitOfWorkScope and runInUnitOfWork
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "adapters/secondary/persistence/SqliteUnitOfWorkFactory.hpp"
#include "ports/output/PersistenceErrors.hpp"
#include "ports/output/UnitOfWorkScope.hpp"
#include "mocks/MockDatabaseConnection.hpp"
#include "mocks/TempDatabase.hpp"

using namespace stockbook;
using namespace stockbook::domain;
using namespace stockbook::adapters::secondary;
using namespace stockbook::ports::output;
using namespace stockbook::tests;
using ::testing::NiceMock;

class UnitOfWorkTest : public ::testing::Test {
protected:
    void SetUp() override {
        connection_ = db_.connection();
        factory_ = std::make_shared<SqliteUnitOfWorkFactory>(connection_, TempDatabase::rules());
    }

    size_t committedStocks() {
        auto reader = factory_->create();
        return reader->stocks().list().size();
    }

    size_t committedPortfolios() {
        auto reader = factory_->create();
        return reader->portfolios().list().size();
    }

    TempDatabase db_;
    std::shared_ptr<DatabaseConnection> connection_;
    std::shared_ptr<SqliteUnitOfWorkFactory> factory_;
};

// ============================================================================
// COMMIT / ROLLBACK ON SCOPE EXIT
// ============================================================================

TEST_F(UnitOfWorkTest, Scope_NormalExit_Commits) {
    auto uow = factory_->create();
    {
        UnitOfWorkScope scope(*uow);
        EXPECT_EQ(uow->state(), UnitOfWorkState::ACTIVE);
        uow->stocks().create(Stock(Symbol("AAPL"), "Apple"));
    }

    EXPECT_EQ(uow->state(), UnitOfWorkState::IDLE);
    EXPECT_EQ(uow->lastOutcome(), UnitOfWorkState::COMMITTED);
    EXPECT_EQ(committedStocks(), 1u);
}

TEST_F(UnitOfWorkTest, Scope_Exception_RollsBackAllRepositories) {
    auto uow = factory_->create();

    EXPECT_THROW({
        UnitOfWorkScope scope(*uow);
        uow->portfolios().create(Portfolio("Growth"));
        uow->stocks().create(Stock(Symbol("AAPL"), "Apple"));
        throw std::runtime_error("broker rejected order");
    }, std::runtime_error);

    EXPECT_EQ(uow->lastOutcome(), UnitOfWorkState::ROLLED_BACK);
    EXPECT_EQ(committedStocks(), 0u);
    EXPECT_EQ(committedPortfolios(), 0u);
}

TEST_F(UnitOfWorkTest, Scope_DuplicateSymbol_RaisesDuplicateKeyAndRollsBack) {
    auto uow = factory_->create();
    {
        UnitOfWorkScope scope(*uow);
        uow->stocks().create(Stock(Symbol("aapl "), "Apple"));
    }

    EXPECT_THROW({
        UnitOfWorkScope scope(*uow);
        uow->portfolios().create(Portfolio("Growth"));
        uow->stocks().create(Stock(Symbol("AAPL"), "Apple duplicate"));
    }, DuplicateKeyError);

    auto reader = factory_->create();
    auto stored = reader->stocks().getBySymbol(Symbol("AAPL"));
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->symbol().value(), "AAPL");
    EXPECT_EQ(stored->name(), "Apple");
    EXPECT_EQ(committedPortfolios(), 0u);
}

TEST_F(UnitOfWorkTest, Scope_InvalidTarget_FailsBeforeAnyWrite) {
    auto uow = factory_->create();

    EXPECT_THROW({
        UnitOfWorkScope scope(*uow);
        EntityId portfolioId = uow->portfolios().create(Portfolio("Growth"));
        EntityId stockId = uow->stocks().create(Stock(Symbol("NVDA"), "NVIDIA"));
        uow->targets().create(Target(portfolioId, stockId, Money::parse("100"), Money::parse("150")));
    }, ValidationError);

    EXPECT_EQ(committedPortfolios(), 0u);
    EXPECT_EQ(committedStocks(), 0u);
}

TEST_F(UnitOfWorkTest, Scope_UpdateMissingId_ReturnsFalseAndCommits) {
    auto uow = factory_->create();
    {
        UnitOfWorkScope scope(*uow);
        EXPECT_FALSE(uow->stocks().update(12345, Stock(Symbol("NONE"), "Nothing")));
        EXPECT_FALSE(uow->portfolios().deleteById(12345));
    }

    EXPECT_EQ(uow->lastOutcome(), UnitOfWorkState::COMMITTED);
}

// ============================================================================
// EXPLICIT COMMIT / ROLLBACK
// ============================================================================

TEST_F(UnitOfWorkTest, Commit_Twice_IsNoop) {
    auto uow = factory_->create();
    {
        UnitOfWorkScope scope(*uow);
        uow->stocks().create(Stock(Symbol("MSFT"), "Microsoft"));
        uow->commit();
        EXPECT_EQ(uow->state(), UnitOfWorkState::COMMITTED);
        EXPECT_NO_THROW(uow->commit());
        EXPECT_NO_THROW(uow->rollback());
        EXPECT_EQ(uow->state(), UnitOfWorkState::COMMITTED);
    }

    EXPECT_EQ(committedStocks(), 1u);
}

TEST_F(UnitOfWorkTest, Rollback_Twice_IsNoop) {
    auto uow = factory_->create();
    {
        UnitOfWorkScope scope(*uow);
        uow->stocks().create(Stock(Symbol("MSFT"), "Microsoft"));
        uow->rollback();
        EXPECT_NO_THROW(uow->rollback());
        EXPECT_NO_THROW(uow->commit());
        EXPECT_EQ(uow->state(), UnitOfWorkState::ROLLED_BACK);
    }

    EXPECT_EQ(uow->lastOutcome(), UnitOfWorkState::ROLLED_BACK);
    EXPECT_EQ(committedStocks(), 0u);
}

TEST_F(UnitOfWorkTest, ExplicitCommit_ThenException_KeepsCommittedWork) {
    auto uow = factory_->create();

    EXPECT_THROW({
        UnitOfWorkScope scope(*uow);
        uow->stocks().create(Stock(Symbol("AMZN"), "Amazon"));
        uow->commit();
        throw std::runtime_error("after commit");
    }, std::runtime_error);

    EXPECT_EQ(uow->lastOutcome(), UnitOfWorkState::COMMITTED);
    EXPECT_EQ(committedStocks(), 1u);
}

TEST_F(UnitOfWorkTest, CommitAndRollback_OutsideScope_AreNoops) {
    auto uow = factory_->create();

    EXPECT_NO_THROW(uow->commit());
    EXPECT_NO_THROW(uow->rollback());
    EXPECT_EQ(uow->state(), UnitOfWorkState::IDLE);
    EXPECT_FALSE(uow->lastOutcome().has_value());
}

TEST_F(UnitOfWorkTest, Exit_WithoutEnter_ThrowsLogicError) {
    auto uow = factory_->create();

    EXPECT_THROW(uow->exit(false), std::logic_error);
}

// ============================================================================
// NESTING
// ============================================================================

TEST_F(UnitOfWorkTest, NestedScopes_ShareOneSession) {
    auto mock = std::make_shared<NiceMock<MockDatabaseConnection>>(connection_);
    SqliteUnitOfWorkFactory factory(mock, TempDatabase::rules());
    auto uow = factory.create();

    EXPECT_CALL(*mock, acquire()).Times(1);
    EXPECT_CALL(*mock, withinTransaction(::testing::_)).Times(0);
    {
        UnitOfWorkScope outer(*uow);
        uow->stocks().create(Stock(Symbol("AAPL"), "Apple"));
        {
            UnitOfWorkScope inner(*uow);
            EXPECT_EQ(uow->nestingLevel(), 2);
            uow->stocks().create(Stock(Symbol("MSFT"), "Microsoft"));
        }
        EXPECT_EQ(uow->nestingLevel(), 1);
        EXPECT_EQ(uow->state(), UnitOfWorkState::ACTIVE);
    }
    ::testing::Mock::VerifyAndClearExpectations(mock.get());

    EXPECT_EQ(uow->nestingLevel(), 0);
    EXPECT_EQ(committedStocks(), 2u);
}

TEST_F(UnitOfWorkTest, NestedFailure_Caught_OuterStillRollsBack) {
    auto uow = factory_->create();
    {
        UnitOfWorkScope outer(*uow);
        uow->stocks().create(Stock(Symbol("AAPL"), "Apple"));
        try {
            UnitOfWorkScope inner(*uow);
            uow->stocks().create(Stock(Symbol("MSFT"), "Microsoft"));
            throw std::runtime_error("inner failure");
        } catch (const std::runtime_error&) {
            // обработано на месте, но транзакция уже помечена rollback-only
        }
    }

    EXPECT_EQ(uow->lastOutcome(), UnitOfWorkState::ROLLED_BACK);
    EXPECT_EQ(committedStocks(), 0u);
}

TEST_F(UnitOfWorkTest, Commit_AfterNestedFailure_ThrowsTransactionError) {
    auto uow = factory_->create();
    {
        UnitOfWorkScope outer(*uow);
        uow->stocks().create(Stock(Symbol("AAPL"), "Apple"));
        try {
            UnitOfWorkScope inner(*uow);
            throw std::runtime_error("inner failure");
        } catch (const std::runtime_error&) {
        }

        EXPECT_THROW(uow->commit(), TransactionError);
        EXPECT_EQ(uow->state(), UnitOfWorkState::ROLLED_BACK);
    }

    EXPECT_EQ(committedStocks(), 0u);
}

// ============================================================================
// ISOLATION AND STANDALONE USE
// ============================================================================

TEST_F(UnitOfWorkTest, Isolation_UncommittedWritesInvisibleToOtherInstance) {
    auto writer = factory_->create();
    auto reader = factory_->create();

    {
        UnitOfWorkScope scope(*writer);
        writer->stocks().create(Stock(Symbol("AAPL"), "Apple"));

        EXPECT_TRUE(reader->stocks().list().empty());
        EXPECT_FALSE(reader->stocks().existsBySymbol(Symbol("AAPL")));
    }

    EXPECT_TRUE(reader->stocks().existsBySymbol(Symbol("AAPL")));
}

TEST_F(UnitOfWorkTest, Isolation_SecondWriterTimesOutWhileFirstHoldsLock) {
    auto first = factory_->create();
    auto second = factory_->create();

    UnitOfWorkScope scope(*first);
    first->stocks().create(Stock(Symbol("AAPL"), "Apple"));

    EXPECT_THROW({
        UnitOfWorkScope other(*second);
        second->stocks().create(Stock(Symbol("MSFT"), "Microsoft"));
    }, PersistenceError);
    EXPECT_EQ(second->lastOutcome(), UnitOfWorkState::ROLLED_BACK);
}

TEST_F(UnitOfWorkTest, Standalone_OutsideScope_EachWriteCommitsImmediately) {
    auto uow = factory_->create();

    EntityId id = uow->stocks().create(Stock(Symbol("IBM"), "IBM"));

    EXPECT_GT(id, 0);
    EXPECT_EQ(uow->state(), UnitOfWorkState::IDLE);
    EXPECT_EQ(committedStocks(), 1u);
}

TEST_F(UnitOfWorkTest, SameInstance_ReusedForSeveralScopes) {
    auto uow = factory_->create();

    for (const char* symbol : {"AAPL", "MSFT", "NVDA"}) {
        UnitOfWorkScope scope(*uow);
        uow->stocks().create(Stock(Symbol(symbol), symbol));
    }

    EXPECT_EQ(committedStocks(), 3u);
}

// ============================================================================
// runInUnitOfWork
// ============================================================================

TEST_F(UnitOfWorkTest, RunInUnitOfWork_ReturnsResultAndCommits) {
    auto uow = factory_->create();

    EntityId id = runInUnitOfWork(*uow, [](IUnitOfWork& work) {
        return work.portfolios().create(Portfolio("Growth"));
    });

    EXPECT_GT(id, 0);
    EXPECT_EQ(uow->lastOutcome(), UnitOfWorkState::COMMITTED);
    EXPECT_EQ(committedPortfolios(), 1u);
}

TEST_F(UnitOfWorkTest, RunInUnitOfWork_Exception_PropagatesUnchanged) {
    auto uow = factory_->create();

    EXPECT_THROW(runInUnitOfWork(*uow, [](IUnitOfWork& work) {
        work.portfolios().create(Portfolio("Growth"));
        throw NegativeResultError("quantity");
    }), NegativeResultError);

    EXPECT_EQ(uow->lastOutcome(), UnitOfWorkState::ROLLED_BACK);
    EXPECT_EQ(committedPortfolios(), 0u);
}

TEST(UnitOfWorkStateTest, ToString_AllStates) {
    EXPECT_EQ(toString(UnitOfWorkState::IDLE), "IDLE");
    EXPECT_EQ(toString(UnitOfWorkState::ACTIVE), "ACTIVE");
    EXPECT_EQ(toString(UnitOfWorkState::COMMITTED), "COMMITTED");
    EXPECT_EQ(toString(UnitOfWorkState::ROLLED_BACK), "ROLLED_BACK");
}
