#pragma once

#include "IDatabaseConnection.hpp"
#include "SqlFilter.hpp"
#include "domain/exceptions/DomainExceptions.hpp"
#include "ports/output/IPortfolioBalanceRepository.hpp"
#include "ports/output/PersistenceErrors.hpp"
#include "settings/BusinessRules.hpp"
#include <iostream>
#include <memory>

namespace stockbook::adapters::secondary {

/**
 * @brief SQLite реализация репозитория снимков баланса
 *
 * create() — upsert по (portfolio_id, balance_date).
 */
class SqlitePortfolioBalanceRepository : public ports::output::IPortfolioBalanceRepository {
public:
    SqlitePortfolioBalanceRepository(
        std::shared_ptr<IDatabaseConnection> connection,
        std::shared_ptr<const settings::BusinessRules> rules
    ) : connection_(std::move(connection))
      , rules_(std::move(rules)) {}

    /**
     * @brief Сохранить снимок; повтор за ту же дату заменяет существующий
     */
    domain::EntityId create(const domain::PortfolioBalance& balance) override {
        requireDefaultCurrency(balance);
        try {
            domain::EntityId id = 0;
            connection_->withinTransaction([&](SqliteSession& session) {
                auto stmt = session.prepare(R"(
                    INSERT INTO portfolio_balance
                        (portfolio_id, balance_date, withdrawals, deposits, final_balance, index_change)
                    VALUES (?, ?, ?, ?, ?, ?)
                    ON CONFLICT(portfolio_id, balance_date) DO UPDATE SET
                        withdrawals = excluded.withdrawals,
                        deposits = excluded.deposits,
                        final_balance = excluded.final_balance,
                        index_change = excluded.index_change
                    RETURNING id
                )");
                bindValues(stmt, balance);
                if (!stmt.step()) {
                    throw ports::output::PersistenceError("Balance upsert returned no id");
                }
                id = stmt.get<int64_t>("id");
                stmt.run();
            });
            std::cout << "[SqlitePortfolioBalanceRepository] Saved balance for portfolio "
                      << balance.portfolioId() << " on " << balance.balanceDate()
                      << " (id=" << id << ")" << std::endl;
            return id;
        } catch (const std::exception& e) {
            std::cerr << "[SqlitePortfolioBalanceRepository] create() failed: " << e.what() << std::endl;
            throw;
        }
    }

    /**
     * @brief Найти снимок по ID
     */
    std::optional<domain::PortfolioBalance> getById(domain::EntityId id) override {
        auto session = connection_->acquire();
        auto stmt = session->prepare(SELECT_BALANCE + " WHERE id = ?");
        stmt.bind(1, id);
        if (!stmt.step()) {
            return std::nullopt;
        }
        return rowToBalance(stmt);
    }

    /**
     * @brief Найти снимок портфеля за дату
     */
    std::optional<domain::PortfolioBalance> getByPortfolioAndDate(
        domain::EntityId portfolioId,
        const domain::Date& date
    ) override {
        auto session = connection_->acquire();
        auto stmt = session->prepare(SELECT_BALANCE + " WHERE portfolio_id = ? AND balance_date = ?");
        stmt.bindAll(portfolioId, date.toString());
        if (!stmt.step()) {
            return std::nullopt;
        }
        return rowToBalance(stmt);
    }

    /**
     * @brief Последний снимок портфеля
     */
    std::optional<domain::PortfolioBalance> getLatest(domain::EntityId portfolioId) override {
        auto history = getHistory(portfolioId, 1);
        if (history.empty()) {
            return std::nullopt;
        }
        return history.front();
    }

    /**
     * @brief История снимков, новые первыми
     */
    std::vector<domain::PortfolioBalance> getHistory(domain::EntityId portfolioId, int limit) override {
        if (limit <= 0) {
            throw domain::ValidationError("History limit must be positive");
        }
        auto session = connection_->acquire();
        auto stmt = session->prepare(SELECT_BALANCE +
            " WHERE portfolio_id = ? ORDER BY balance_date DESC, id DESC LIMIT ?");
        stmt.bindAll(portfolioId, limit);

        std::vector<domain::PortfolioBalance> balances;
        while (stmt.step()) {
            balances.push_back(rowToBalance(stmt));
        }
        return balances;
    }

    /**
     * @brief Снимки по фильтру
     */
    std::vector<domain::PortfolioBalance> list(const ports::output::BalanceFilter& filter = {}) override {
        SqlFilter where;
        if (filter.portfolioId) where.equals("portfolio_id", *filter.portfolioId);
        if (filter.fromDate) where.atLeast("balance_date", filter.fromDate->toString());
        if (filter.toDate) where.atMost("balance_date", filter.toDate->toString());

        auto session = connection_->acquire();
        auto stmt = session->prepare(SELECT_BALANCE + where.clause() + " ORDER BY balance_date, id");
        where.bind(stmt);

        std::vector<domain::PortfolioBalance> balances;
        while (stmt.step()) {
            balances.push_back(rowToBalance(stmt));
        }
        return balances;
    }

    /**
     * @brief Обновить снимок; false, если его нет
     */
    bool update(domain::EntityId id, const domain::PortfolioBalance& balance) override {
        requireDefaultCurrency(balance);
        try {
            bool updated = false;
            connection_->withinTransaction([&](SqliteSession& session) {
                auto stmt = session.prepare(R"(
                    UPDATE portfolio_balance
                    SET portfolio_id = ?, balance_date = ?, withdrawals = ?, deposits = ?,
                        final_balance = ?, index_change = ?
                    WHERE id = ?
                )");
                int next = bindValues(stmt, balance);
                stmt.bind(next, id);
                stmt.run();
                updated = session.changes() > 0;
            });
            return updated;
        } catch (const std::exception& e) {
            std::cerr << "[SqlitePortfolioBalanceRepository] update() failed: " << e.what() << std::endl;
            throw;
        }
    }

    /**
     * @brief Удалить снимок
     */
    bool deleteById(domain::EntityId id) override {
        try {
            bool deleted = false;
            connection_->withinTransaction([&](SqliteSession& session) {
                session.prepare("DELETE FROM portfolio_balance WHERE id = ?").bind(1, id).run();
                deleted = session.changes() > 0;
            });
            return deleted;
        } catch (const std::exception& e) {
            std::cerr << "[SqlitePortfolioBalanceRepository] deleteById() failed: " << e.what() << std::endl;
            throw;
        }
    }

private:
    inline static const std::string SELECT_BALANCE = R"(
        SELECT id, portfolio_id, balance_date, withdrawals, deposits, final_balance, index_change
        FROM portfolio_balance)";

    /**
     * @return индекс следующего параметра
     */
    static int bindValues(SqliteStatement& stmt, const domain::PortfolioBalance& balance) {
        std::optional<std::string> indexChange;
        if (balance.indexChange()) {
            indexChange = balance.indexChange()->toString(2);
        }
        stmt.bindAll(balance.portfolioId(),
                     balance.balanceDate().toString(),
                     balance.withdrawals().amount().toString(2),
                     balance.deposits().amount().toString(2),
                     balance.finalBalance().amount().toString(2),
                     indexChange);
        return 7;
    }

    void requireDefaultCurrency(const domain::PortfolioBalance& balance) const {
        const auto& currency = rules_->getDefaultCurrency();
        if (balance.finalBalance().currency() != currency) {
            throw domain::CurrencyMismatchError("store", currency, balance.finalBalance().currency());
        }
    }

    domain::PortfolioBalance rowToBalance(const SqliteStatement& row) const {
        const auto& currency = rules_->getDefaultCurrency();
        std::optional<domain::Decimal> indexChange;
        if (!row.isNull("index_change")) {
            indexChange = domain::Decimal::parse(row.get<std::string>("index_change"));
        }
        return domain::PortfolioBalance(
            row.get<int64_t>("portfolio_id"),
            domain::Date::parse(row.get<std::string>("balance_date")),
            domain::Money::parse(row.get<std::string>("final_balance"), currency),
            domain::Money::parse(row.get<std::string>("withdrawals"), currency),
            domain::Money::parse(row.get<std::string>("deposits"), currency),
            indexChange,
            row.get<int64_t>("id")
        );
    }

    std::shared_ptr<IDatabaseConnection> connection_;
    std::shared_ptr<const settings::BusinessRules> rules_;
};

} // namespace stockbook::adapters::secondary
