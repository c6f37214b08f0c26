#pragma once

#include <gtest/gtest.h>

#include "adapters/secondary/persistence/DatabaseConnection.hpp"
#include "adapters/secondary/persistence/SqlitePortfolioRepository.hpp"
#include "adapters/secondary/persistence/SqliteStockRepository.hpp"
#include "adapters/secondary/persistence/SqliteTransactionRepository.hpp"
#include "mocks/TempDatabase.hpp"
#include <memory>

namespace stockbook::tests {

/**
 * @brief Общая фикстура для тестов SQLite-репозиториев
 *
 * Каждый тест получает свой файл БД с применёнными миграциями.
 */
class SqliteRepositoryTest : public ::testing::Test {
protected:
    void SetUp() override {
        connection_ = db_.connection();
        connection_->initializeSchema();
        rules_ = TempDatabase::rules();
    }

    domain::EntityId createPortfolio(const std::string& name = "Growth") {
        adapters::secondary::SqlitePortfolioRepository portfolios(connection_, rules_);
        return portfolios.create(domain::Portfolio(name));
    }

    domain::EntityId createStock(const std::string& symbol, const std::string& name = "Company") {
        adapters::secondary::SqliteStockRepository stocks(connection_);
        return stocks.create(domain::Stock(domain::Symbol(symbol), name));
    }

    domain::EntityId createTransaction(domain::EntityId portfolioId, domain::EntityId stockId,
                                       const domain::Date& date = domain::Date(2024, 1, 15)) {
        adapters::secondary::SqliteTransactionRepository transactions(connection_, rules_);
        return transactions.create(domain::Transaction(
            portfolioId, stockId, domain::TransactionType::BUY, domain::Quantity::of(10),
            domain::Money::parse("100.00"), date));
    }

    TempDatabase db_;
    std::shared_ptr<adapters::secondary::DatabaseConnection> connection_;
    std::shared_ptr<settings::BusinessRules> rules_;
};

} // namespace stockbook::tests
