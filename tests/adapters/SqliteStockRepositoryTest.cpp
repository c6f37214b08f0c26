/**
 * @file SqliteStockRepositoryTest.cpp
 * @brief Tests for SqliteStockRepository
 */

#include "SqliteRepositoryTest.hpp"
#include "ports/output/PersistenceErrors.hpp"

using namespace stockbook;
using namespace stockbook::domain;
using namespace stockbook::adapters::secondary;
using namespace stockbook::ports::output;
using namespace stockbook::tests;

class SqliteStockRepositoryTest : public SqliteRepositoryTest {
protected:
    void SetUp() override {
        SqliteRepositoryTest::SetUp();
        repository_ = std::make_unique<SqliteStockRepository>(connection_);
    }

    std::unique_ptr<SqliteStockRepository> repository_;
};

TEST_F(SqliteStockRepositoryTest, Create_ThenGetById_ReturnsAllFields) {
    Stock stock(Symbol("aapl "), "Apple Inc.", "Technology", Grade::A, "Cup with handle");

    EntityId id = repository_->create(stock);
    auto loaded = repository_->getById(id);

    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->id(), id);
    EXPECT_EQ(loaded->symbol().value(), "AAPL");
    EXPECT_EQ(loaded->name(), "Apple Inc.");
    EXPECT_EQ(loaded->industryGroup(), "Technology");
    EXPECT_EQ(loaded->grade(), Grade::A);
    EXPECT_EQ(loaded->notes(), "Cup with handle");
}

TEST_F(SqliteStockRepositoryTest, Create_DuplicateSymbol_ThrowsDuplicateKey) {
    repository_->create(Stock(Symbol("AAPL"), "Apple"));

    EXPECT_THROW(repository_->create(Stock(Symbol("aapl"), "Apple again")), DuplicateKeyError);
    EXPECT_EQ(repository_->list().size(), 1u);
}

TEST_F(SqliteStockRepositoryTest, GetBySymbol_Missing_ReturnsNullopt) {
    repository_->create(Stock(Symbol("MSFT"), "Microsoft"));

    EXPECT_TRUE(repository_->getBySymbol(Symbol("msft")).has_value());
    EXPECT_FALSE(repository_->getBySymbol(Symbol("GOOG")).has_value());
    EXPECT_TRUE(repository_->existsBySymbol(Symbol("MSFT")));
    EXPECT_FALSE(repository_->existsBySymbol(Symbol("GOOG")));
    EXPECT_FALSE(repository_->getById(999).has_value());
}

TEST_F(SqliteStockRepositoryTest, List_FilterByIndustryAndGrade_OrderedBySymbol) {
    repository_->create(Stock(Symbol("NVDA"), "NVIDIA", "Semiconductors", Grade::A));
    repository_->create(Stock(Symbol("AMD"), "Advanced Micro Devices", "Semiconductors", Grade::B));
    repository_->create(Stock(Symbol("KO"), "Coca-Cola", "Beverages", Grade::A));

    auto semis = repository_->list({.industryGroup = "semi"});
    ASSERT_EQ(semis.size(), 2u);
    EXPECT_EQ(semis[0].symbol().value(), "AMD");
    EXPECT_EQ(semis[1].symbol().value(), "NVDA");

    auto gradeA = repository_->list({.grade = Grade::A});
    ASSERT_EQ(gradeA.size(), 2u);
    EXPECT_EQ(gradeA[0].symbol().value(), "KO");

    EXPECT_EQ(repository_->list({.name = "cola"}).size(), 1u);
}

TEST_F(SqliteStockRepositoryTest, Update_Existing_ChangesDetails) {
    EntityId id = repository_->create(Stock(Symbol("TSLA"), "Tesla", "Autos", Grade::C));
    auto stock = repository_->getById(id);
    ASSERT_TRUE(stock.has_value());

    stock->updateDetails("Tesla Inc.", std::nullopt, Grade::B, "Base breakout");
    EXPECT_TRUE(repository_->update(id, *stock));

    auto reloaded = repository_->getById(id);
    EXPECT_EQ(reloaded->name(), "Tesla Inc.");
    EXPECT_FALSE(reloaded->industryGroup().has_value());
    EXPECT_EQ(reloaded->grade(), Grade::B);
    EXPECT_EQ(reloaded->notes(), "Base breakout");
}

TEST_F(SqliteStockRepositoryTest, Update_MissingId_ReturnsFalse) {
    EXPECT_FALSE(repository_->update(424242, Stock(Symbol("NONE"), "Nothing")));
}

TEST_F(SqliteStockRepositoryTest, DeleteById_RemovesRow) {
    EntityId id = repository_->create(Stock(Symbol("IBM"), "IBM"));

    EXPECT_TRUE(repository_->deleteById(id));
    EXPECT_FALSE(repository_->deleteById(id));
    EXPECT_FALSE(repository_->getById(id).has_value());
}

TEST_F(SqliteStockRepositoryTest, DeleteById_ReferencedByTransaction_ThrowsConstraintViolation) {
    EntityId stockId = repository_->create(Stock(Symbol("META"), "Meta"));
    createTransaction(createPortfolio(), stockId);

    EXPECT_THROW(repository_->deleteById(stockId), ConstraintViolationError);
    EXPECT_TRUE(repository_->getById(stockId).has_value());
}
