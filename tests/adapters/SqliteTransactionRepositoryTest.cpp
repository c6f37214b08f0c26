/**
 * @file SqliteTransactionRepositoryTest.cpp
 * @brief Tests for SqliteTransactionRepository
 */

#include "SqliteRepositoryTest.hpp"
#include "ports/output/PersistenceErrors.hpp"

using namespace stockbook;
using namespace stockbook::domain;
using namespace stockbook::adapters::secondary;
using namespace stockbook::ports::output;
using namespace stockbook::tests;

class SqliteTransactionRepositoryTest : public SqliteRepositoryTest {
protected:
    void SetUp() override {
        SqliteRepositoryTest::SetUp();
        repository_ = std::make_unique<SqliteTransactionRepository>(connection_, rules_);
        portfolioId_ = createPortfolio();
        aaplId_ = createStock("AAPL");
        msftId_ = createStock("MSFT");
    }

    Transaction trade(EntityId stockId, TransactionType type, const char* quantity,
                      const char* price, const Date& date) {
        return Transaction(portfolioId_, stockId, type, Quantity::parse(quantity),
                           Money::parse(price), date);
    }

    std::unique_ptr<SqliteTransactionRepository> repository_;
    EntityId portfolioId_ = 0;
    EntityId aaplId_ = 0;
    EntityId msftId_ = 0;
};

TEST_F(SqliteTransactionRepositoryTest, Create_ThenGetById_KeepsExactValues) {
    Transaction tx(portfolioId_, aaplId_, TransactionType::BUY, Quantity::parse("10.5"),
                   Money::parse("185.27"), Date(2024, 2, 1), std::string("Pocket pivot"));

    EntityId id = repository_->create(tx);
    auto loaded = repository_->getById(id);

    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->type(), TransactionType::BUY);
    EXPECT_EQ(loaded->quantity(), Quantity::parse("10.5"));
    EXPECT_EQ(loaded->price(), Money::parse("185.27"));
    EXPECT_EQ(loaded->transactionDate(), Date(2024, 2, 1));
    EXPECT_EQ(loaded->notes(), "Pocket pivot");
    EXPECT_EQ(loaded->totalValue(), Money::parse("1945.34"));
}

TEST_F(SqliteTransactionRepositoryTest, Create_OtherCurrency_ThrowsCurrencyMismatch) {
    Transaction tx(portfolioId_, aaplId_, TransactionType::BUY, Quantity::of(1),
                   Money(Decimal(100), "EUR"), Date(2024, 2, 1));

    EXPECT_THROW(repository_->create(tx), CurrencyMismatchError);
    EXPECT_TRUE(repository_->list().empty());
}

TEST_F(SqliteTransactionRepositoryTest, Create_UnknownPortfolio_ThrowsConstraintViolation) {
    Transaction tx(9999, aaplId_, TransactionType::BUY, Quantity::of(1), Money::parse("1"),
                   Date(2024, 2, 1));

    EXPECT_THROW(repository_->create(tx), ConstraintViolationError);
}

TEST_F(SqliteTransactionRepositoryTest, GetByPortfolio_OrderedByDate) {
    repository_->create(trade(aaplId_, TransactionType::SELL, "5", "190", Date(2024, 3, 1)));
    repository_->create(trade(aaplId_, TransactionType::BUY, "10", "180", Date(2024, 1, 10)));
    EntityId other = createPortfolio("Other");
    repository_->create(Transaction(other, msftId_, TransactionType::BUY, Quantity::of(1),
                                    Money::parse("400"), Date(2024, 1, 5)));

    auto history = repository_->getByPortfolio(portfolioId_);

    ASSERT_EQ(history.size(), 2u);
    EXPECT_EQ(history[0].transactionDate(), Date(2024, 1, 10));
    EXPECT_TRUE(history[1].isSell());
}

TEST_F(SqliteTransactionRepositoryTest, List_FilterByTypeStockAndDateRange) {
    repository_->create(trade(aaplId_, TransactionType::BUY, "10", "180", Date(2024, 1, 10)));
    repository_->create(trade(aaplId_, TransactionType::SELL, "10", "200", Date(2024, 2, 10)));
    repository_->create(trade(msftId_, TransactionType::BUY, "3", "400", Date(2024, 2, 15)));
    repository_->create(trade(msftId_, TransactionType::BUY, "2", "410", Date(2024, 4, 1)));

    EXPECT_EQ(repository_->list({.type = TransactionType::BUY}).size(), 3u);
    EXPECT_EQ(repository_->list({.stockId = msftId_}).size(), 2u);

    auto february = repository_->list({
        .portfolioId = portfolioId_,
        .fromDate = Date(2024, 2, 1),
        .toDate = Date(2024, 2, 29)
    });
    ASSERT_EQ(february.size(), 2u);
    EXPECT_EQ(february[0].stockId(), aaplId_);
    EXPECT_EQ(february[1].stockId(), msftId_);
}

TEST_F(SqliteTransactionRepositoryTest, Update_ChangesNotesAndPrice) {
    EntityId id = repository_->create(trade(aaplId_, TransactionType::BUY, "10", "180", Date(2024, 1, 10)));

    Transaction changed(portfolioId_, aaplId_, TransactionType::BUY, Quantity::of(12),
                        Money::parse("179.50"), Date(2024, 1, 11), std::string("Corrected fill"));
    EXPECT_TRUE(repository_->update(id, changed));
    EXPECT_FALSE(repository_->update(id + 100, changed));

    auto loaded = repository_->getById(id);
    EXPECT_EQ(loaded->quantity(), Quantity::of(12));
    EXPECT_EQ(loaded->price(), Money::parse("179.50"));
    EXPECT_EQ(loaded->notes(), "Corrected fill");
}

TEST_F(SqliteTransactionRepositoryTest, DeleteById_RemovesRow) {
    EntityId id = repository_->create(trade(aaplId_, TransactionType::BUY, "1", "1", Date(2024, 1, 10)));

    EXPECT_TRUE(repository_->deleteById(id));
    EXPECT_FALSE(repository_->getById(id).has_value());
}
