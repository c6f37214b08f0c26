/**
 * @file StockServiceTest.cpp
 * @brief Unit tests for StockService
 */

#include <gtest/gtest.h>
#include "adapters/secondary/persistence/SqliteUnitOfWorkFactory.hpp"
#include "application/StockService.hpp"
#include "ports/output/PersistenceErrors.hpp"
#include "mocks/TempDatabase.hpp"

using namespace stockbook;
using namespace stockbook::domain;
using namespace stockbook::application;
using namespace stockbook::tests;

class StockServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto factory = std::make_shared<adapters::secondary::SqliteUnitOfWorkFactory>(
            db_.connection(), TempDatabase::rules());
        stockService_ = std::make_shared<StockService>(factory);
    }

    Stock createNvidia() {
        return stockService_->createStock({
            .symbol = " nvda",
            .name = "NVIDIA",
            .industryGroup = "Semiconductors",
            .grade = "a",
            .notes = "Leader"
        });
    }

    TempDatabase db_;
    std::shared_ptr<StockService> stockService_;
};

// ============================================================================
// CREATE
// ============================================================================

TEST_F(StockServiceTest, CreateStock_ValidRequest_NormalizesAndAssignsId) {
    Stock stock = createNvidia();

    ASSERT_TRUE(stock.id().has_value());
    EXPECT_EQ(stock.symbol().value(), "NVDA");
    EXPECT_EQ(stock.grade(), Grade::A);
    EXPECT_TRUE(stockService_->stockExists("nvda"));
}

TEST_F(StockServiceTest, CreateStock_DuplicateSymbol_ThrowsDuplicateKey) {
    createNvidia();

    EXPECT_THROW(stockService_->createStock({.symbol = "NVDA", .name = "Again"}),
                 ports::output::DuplicateKeyError);
}

TEST_F(StockServiceTest, CreateStock_InvalidInput_ThrowsValidation) {
    EXPECT_THROW(stockService_->createStock({.symbol = "TOOLONG", .name = "x"}), ValidationError);
    EXPECT_THROW(stockService_->createStock({.symbol = "AAPL", .name = "Apple", .grade = "Z"}),
                 ValidationError);
    EXPECT_FALSE(stockService_->stockExists("AAPL"));
}

// ============================================================================
// UPDATE
// ============================================================================

TEST_F(StockServiceTest, UpdateStock_PartialRequest_KeepsOtherFields) {
    Stock created = createNvidia();

    auto updated = stockService_->updateStock({.stockId = *created.id(), .grade = "B"});

    ASSERT_TRUE(updated.has_value());
    EXPECT_EQ(updated->grade(), Grade::B);
    EXPECT_EQ(updated->name(), "NVIDIA");
    EXPECT_EQ(updated->industryGroup(), "Semiconductors");
    EXPECT_EQ(updated->notes(), "Leader");

    auto reloaded = stockService_->getStockBySymbol("NVDA");
    ASSERT_TRUE(reloaded.has_value());
    EXPECT_EQ(reloaded->grade(), Grade::B);
}

TEST_F(StockServiceTest, UpdateStock_BlankGradeAndIndustry_ClearsThem) {
    Stock created = createNvidia();

    auto updated = stockService_->updateStock({
        .stockId = *created.id(),
        .industryGroup = "",
        .grade = ""
    });

    ASSERT_TRUE(updated.has_value());
    EXPECT_FALSE(updated->grade().has_value());
    EXPECT_FALSE(updated->industryGroup().has_value());
}

TEST_F(StockServiceTest, UpdateStock_NoChanges_ThrowsValidation) {
    Stock created = createNvidia();

    EXPECT_THROW(stockService_->updateStock({.stockId = *created.id()}), ValidationError);
}

TEST_F(StockServiceTest, UpdateStock_MissingId_ReturnsNullopt) {
    EXPECT_FALSE(stockService_->updateStock({.stockId = 777, .name = "Ghost"}).has_value());
}

// ============================================================================
// QUERIES
// ============================================================================

TEST_F(StockServiceTest, GetStockBySymbol_Unknown_ReturnsNullopt) {
    EXPECT_FALSE(stockService_->getStockBySymbol("MSFT").has_value());
    EXPECT_THROW(stockService_->getStockBySymbol("123"), ValidationError);
}

TEST_F(StockServiceTest, SearchStocks_ByGrade) {
    createNvidia();
    stockService_->createStock({.symbol = "KO", .name = "Coca-Cola", .grade = "C"});

    auto gradeA = stockService_->searchStocks({.grade = Grade::A});

    ASSERT_EQ(gradeA.size(), 1u);
    EXPECT_EQ(gradeA[0].symbol().value(), "NVDA");
    EXPECT_EQ(stockService_->searchStocks({}).size(), 2u);
}
