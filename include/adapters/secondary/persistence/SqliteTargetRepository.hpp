#pragma once

#include "IDatabaseConnection.hpp"
#include "SqlFilter.hpp"
#include "domain/exceptions/DomainExceptions.hpp"
#include "ports/output/ITargetRepository.hpp"
#include "settings/BusinessRules.hpp"
#include <iostream>
#include <memory>

namespace stockbook::adapters::secondary {

/**
 * @brief SQLite реализация репозитория ценовых целей
 */
class SqliteTargetRepository : public ports::output::ITargetRepository {
public:
    SqliteTargetRepository(
        std::shared_ptr<IDatabaseConnection> connection,
        std::shared_ptr<const settings::BusinessRules> rules
    ) : connection_(std::move(connection))
      , rules_(std::move(rules)) {}

    /**
     * @brief Сохранить цель
     */
    domain::EntityId create(const domain::Target& target) override {
        requireDefaultCurrency(target);
        try {
            domain::EntityId id = 0;
            connection_->withinTransaction([&](SqliteSession& session) {
                session.prepare(R"(
                        INSERT INTO target (stock_id, portfolio_id, pivot_price, failure_price, notes, status)
                        VALUES (?, ?, ?, ?, ?, ?)
                    )")
                    .bindAll(target.stockId(), target.portfolioId(),
                             target.pivotPrice().amount().toString(2),
                             target.failurePrice().amount().toString(2),
                             target.notes(), domain::toString(target.status()))
                    .run();
                id = session.lastInsertId();
            });
            std::cout << "[SqliteTargetRepository] Created target pivot=" << target.pivotPrice()
                      << " failure=" << target.failurePrice() << " (id=" << id << ")" << std::endl;
            return id;
        } catch (const std::exception& e) {
            std::cerr << "[SqliteTargetRepository] create() failed: " << e.what() << std::endl;
            throw;
        }
    }

    /**
     * @brief Найти цель по ID
     */
    std::optional<domain::Target> getById(domain::EntityId id) override {
        auto session = connection_->acquire();
        auto stmt = session->prepare(SELECT_TARGET + " WHERE id = ?");
        stmt.bind(1, id);
        if (!stmt.step()) {
            return std::nullopt;
        }
        return rowToTarget(stmt);
    }

    /**
     * @brief Активные цели портфеля
     */
    std::vector<domain::Target> getActiveByPortfolio(domain::EntityId portfolioId) override {
        return list({.portfolioId = portfolioId, .status = domain::TargetStatus::ACTIVE});
    }

    /**
     * @brief Цели по фильтру
     */
    std::vector<domain::Target> list(const ports::output::TargetFilter& filter = {}) override {
        SqlFilter where;
        if (filter.portfolioId) where.equals("portfolio_id", *filter.portfolioId);
        if (filter.stockId) where.equals("stock_id", *filter.stockId);
        if (filter.status) where.equals("status", domain::toString(*filter.status));

        auto session = connection_->acquire();
        auto stmt = session->prepare(SELECT_TARGET + where.clause() + " ORDER BY id");
        where.bind(stmt);

        std::vector<domain::Target> targets;
        while (stmt.step()) {
            targets.push_back(rowToTarget(stmt));
        }
        return targets;
    }

    /**
     * @brief Обновить цель; false, если её нет
     */
    bool update(domain::EntityId id, const domain::Target& target) override {
        requireDefaultCurrency(target);
        try {
            bool updated = false;
            connection_->withinTransaction([&](SqliteSession& session) {
                session.prepare(R"(
                        UPDATE target
                        SET stock_id = ?, portfolio_id = ?, pivot_price = ?, failure_price = ?,
                            notes = ?, status = ?
                        WHERE id = ?
                    )")
                    .bindAll(target.stockId(), target.portfolioId(),
                             target.pivotPrice().amount().toString(2),
                             target.failurePrice().amount().toString(2),
                             target.notes(), domain::toString(target.status()), id)
                    .run();
                updated = session.changes() > 0;
            });
            return updated;
        } catch (const std::exception& e) {
            std::cerr << "[SqliteTargetRepository] update() failed: " << e.what() << std::endl;
            throw;
        }
    }

    /**
     * @brief Сменить только статус цели
     */
    bool updateStatus(domain::EntityId id, domain::TargetStatus status) override {
        try {
            bool updated = false;
            connection_->withinTransaction([&](SqliteSession& session) {
                session.prepare("UPDATE target SET status = ? WHERE id = ?")
                    .bindAll(domain::toString(status), id)
                    .run();
                updated = session.changes() > 0;
            });
            return updated;
        } catch (const std::exception& e) {
            std::cerr << "[SqliteTargetRepository] updateStatus() failed: " << e.what() << std::endl;
            throw;
        }
    }

    /**
     * @brief Удалить цель
     */
    bool deleteById(domain::EntityId id) override {
        try {
            bool deleted = false;
            connection_->withinTransaction([&](SqliteSession& session) {
                session.prepare("DELETE FROM target WHERE id = ?").bind(1, id).run();
                deleted = session.changes() > 0;
            });
            return deleted;
        } catch (const std::exception& e) {
            std::cerr << "[SqliteTargetRepository] deleteById() failed: " << e.what() << std::endl;
            throw;
        }
    }

private:
    inline static const std::string SELECT_TARGET = R"(
        SELECT id, stock_id, portfolio_id, pivot_price, failure_price, notes, status
        FROM target)";

    void requireDefaultCurrency(const domain::Target& target) const {
        const auto& currency = rules_->getDefaultCurrency();
        if (target.pivotPrice().currency() != currency) {
            throw domain::CurrencyMismatchError("store", currency, target.pivotPrice().currency());
        }
        if (target.failurePrice().currency() != currency) {
            throw domain::CurrencyMismatchError("store", currency, target.failurePrice().currency());
        }
    }

    domain::Target rowToTarget(const SqliteStatement& row) const {
        const auto& currency = rules_->getDefaultCurrency();
        return domain::Target(
            row.get<int64_t>("portfolio_id"),
            row.get<int64_t>("stock_id"),
            domain::Money::parse(row.get<std::string>("pivot_price"), currency),
            domain::Money::parse(row.get<std::string>("failure_price"), currency),
            domain::targetStatusFromString(row.get<std::string>("status")),
            row.getOptional<std::string>("notes"),
            row.get<int64_t>("id")
        );
    }

    std::shared_ptr<IDatabaseConnection> connection_;
    std::shared_ptr<const settings::BusinessRules> rules_;
};

} // namespace stockbook::adapters::secondary
