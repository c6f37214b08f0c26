#pragma once

#include "IDatabaseConnection.hpp"
#include "SqlFilter.hpp"
#include "domain/exceptions/DomainExceptions.hpp"
#include "ports/output/ITransactionRepository.hpp"
#include "settings/BusinessRules.hpp"
#include <iostream>
#include <memory>

namespace stockbook::adapters::secondary {

/**
 * @brief SQLite реализация репозитория сделок
 *
 * Количество и цена хранятся десятичной строкой (TEXT). Валюта в схеме
 * не хранится: цены восстанавливаются в валюте по умолчанию.
 */
class SqliteTransactionRepository : public ports::output::ITransactionRepository {
public:
    SqliteTransactionRepository(
        std::shared_ptr<IDatabaseConnection> connection,
        std::shared_ptr<const settings::BusinessRules> rules
    ) : connection_(std::move(connection))
      , rules_(std::move(rules)) {}

    /**
     * @brief Сохранить сделку
     */
    domain::EntityId create(const domain::Transaction& transaction) override {
        requireDefaultCurrency(transaction.price());
        try {
            domain::EntityId id = 0;
            connection_->withinTransaction([&](SqliteSession& session) {
                session.prepare(R"(
                        INSERT INTO stock_transaction
                            (portfolio_id, stock_id, type, quantity, price, transaction_date, notes)
                        VALUES (?, ?, ?, ?, ?, ?, ?)
                    )")
                    .bindAll(transaction.portfolioId(), transaction.stockId(),
                             domain::toString(transaction.type()),
                             transaction.quantity().toString(),
                             transaction.price().amount().toString(2),
                             transaction.transactionDate().toString(),
                             transaction.notes())
                    .run();
                id = session.lastInsertId();
            });
            std::cout << "[SqliteTransactionRepository] Recorded " << domain::toString(transaction.type())
                      << " of " << transaction.quantity() << " @ " << transaction.price()
                      << " (id=" << id << ")" << std::endl;
            return id;
        } catch (const std::exception& e) {
            std::cerr << "[SqliteTransactionRepository] create() failed: " << e.what() << std::endl;
            throw;
        }
    }

    /**
     * @brief Найти сделку по ID
     */
    std::optional<domain::Transaction> getById(domain::EntityId id) override {
        auto session = connection_->acquire();
        auto stmt = session->prepare(SELECT_TRANSACTION + " WHERE id = ?");
        stmt.bind(1, id);
        if (!stmt.step()) {
            return std::nullopt;
        }
        return rowToTransaction(stmt);
    }

    /**
     * @brief История сделок портфеля по дате
     */
    std::vector<domain::Transaction> getByPortfolio(domain::EntityId portfolioId) override {
        return list({.portfolioId = portfolioId});
    }

    /**
     * @brief Сделки по фильтру
     */
    std::vector<domain::Transaction> list(const ports::output::TransactionFilter& filter = {}) override {
        SqlFilter where;
        if (filter.portfolioId) where.equals("portfolio_id", *filter.portfolioId);
        if (filter.stockId) where.equals("stock_id", *filter.stockId);
        if (filter.type) where.equals("type", domain::toString(*filter.type));
        if (filter.fromDate) where.atLeast("transaction_date", filter.fromDate->toString());
        if (filter.toDate) where.atMost("transaction_date", filter.toDate->toString());

        auto session = connection_->acquire();
        auto stmt = session->prepare(SELECT_TRANSACTION + where.clause() +
                                     " ORDER BY transaction_date, id");
        where.bind(stmt);

        std::vector<domain::Transaction> transactions;
        while (stmt.step()) {
            transactions.push_back(rowToTransaction(stmt));
        }
        return transactions;
    }

    /**
     * @brief Обновить сделку; false, если её нет
     */
    bool update(domain::EntityId id, const domain::Transaction& transaction) override {
        requireDefaultCurrency(transaction.price());
        try {
            bool updated = false;
            connection_->withinTransaction([&](SqliteSession& session) {
                session.prepare(R"(
                        UPDATE stock_transaction
                        SET portfolio_id = ?, stock_id = ?, type = ?, quantity = ?, price = ?,
                            transaction_date = ?, notes = ?
                        WHERE id = ?
                    )")
                    .bindAll(transaction.portfolioId(), transaction.stockId(),
                             domain::toString(transaction.type()),
                             transaction.quantity().toString(),
                             transaction.price().amount().toString(2),
                             transaction.transactionDate().toString(),
                             transaction.notes(), id)
                    .run();
                updated = session.changes() > 0;
            });
            return updated;
        } catch (const std::exception& e) {
            std::cerr << "[SqliteTransactionRepository] update() failed: " << e.what() << std::endl;
            throw;
        }
    }

    /**
     * @brief Удалить сделку
     */
    bool deleteById(domain::EntityId id) override {
        try {
            bool deleted = false;
            connection_->withinTransaction([&](SqliteSession& session) {
                session.prepare("DELETE FROM stock_transaction WHERE id = ?").bind(1, id).run();
                deleted = session.changes() > 0;
            });
            return deleted;
        } catch (const std::exception& e) {
            std::cerr << "[SqliteTransactionRepository] deleteById() failed: " << e.what() << std::endl;
            throw;
        }
    }

private:
    inline static const std::string SELECT_TRANSACTION = R"(
        SELECT id, portfolio_id, stock_id, type, quantity, price, transaction_date, notes
        FROM stock_transaction)";

    void requireDefaultCurrency(const domain::Money& price) const {
        if (price.currency() != rules_->getDefaultCurrency()) {
            throw domain::CurrencyMismatchError("store", rules_->getDefaultCurrency(), price.currency());
        }
    }

    domain::Transaction rowToTransaction(const SqliteStatement& row) const {
        return domain::Transaction(
            row.get<int64_t>("portfolio_id"),
            row.get<int64_t>("stock_id"),
            domain::transactionTypeFromString(row.get<std::string>("type")),
            domain::Quantity::parse(row.get<std::string>("quantity")),
            domain::Money::parse(row.get<std::string>("price"), rules_->getDefaultCurrency()),
            domain::Date::parse(row.get<std::string>("transaction_date")),
            row.getOptional<std::string>("notes"),
            row.get<int64_t>("id")
        );
    }

    std::shared_ptr<IDatabaseConnection> connection_;
    std::shared_ptr<const settings::BusinessRules> rules_;
};

} // namespace stockbook::adapters::secondary
