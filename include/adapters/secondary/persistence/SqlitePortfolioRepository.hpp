#pragma once

#include "IDatabaseConnection.hpp"
#include "SqlFilter.hpp"
#include "domain/exceptions/DomainExceptions.hpp"
#include "ports/output/IPortfolioRepository.hpp"
#include "settings/BusinessRules.hpp"
#include <iostream>
#include <memory>

namespace stockbook::adapters::secondary {

/**
 * @brief SQLite реализация репозитория портфелей
 *
 * Незаданные лимиты портфеля заполняются из BusinessRules.
 */
class SqlitePortfolioRepository : public ports::output::IPortfolioRepository {
public:
    SqlitePortfolioRepository(
        std::shared_ptr<IDatabaseConnection> connection,
        std::shared_ptr<const settings::BusinessRules> rules
    ) : connection_(std::move(connection))
      , rules_(std::move(rules)) {}

    /**
     * @brief Сохранить портфель, пустые лимиты берутся из BusinessRules
     */
    domain::EntityId create(const domain::Portfolio& portfolio) override {
        const Limits limits = resolveLimits(portfolio);
        try {
            domain::EntityId id = 0;
            connection_->withinTransaction([&](SqliteSession& session) {
                session.prepare(R"(
                        INSERT INTO portfolio (name, description, max_positions, max_risk_per_trade, is_active)
                        VALUES (?, ?, ?, ?, ?)
                    )")
                    .bindAll(portfolio.name(), portfolio.description(), limits.maxPositions,
                             limits.maxRiskPerTrade.toString(1), portfolio.isActive())
                    .run();
                id = session.lastInsertId();
            });
            std::cout << "[SqlitePortfolioRepository] Created portfolio '" << portfolio.name()
                      << "' (id=" << id << ")" << std::endl;
            return id;
        } catch (const std::exception& e) {
            std::cerr << "[SqlitePortfolioRepository] create() failed: " << e.what() << std::endl;
            throw;
        }
    }

    /**
     * @brief Найти портфель по ID
     */
    std::optional<domain::Portfolio> getById(domain::EntityId id) override {
        auto session = connection_->acquire();
        auto stmt = session->prepare(SELECT_PORTFOLIO + " WHERE id = ?");
        stmt.bind(1, id);
        if (!stmt.step()) {
            return std::nullopt;
        }
        return rowToPortfolio(stmt);
    }

    /**
     * @brief Портфели по фильтру
     */
    std::vector<domain::Portfolio> list(const ports::output::PortfolioFilter& filter = {}) override {
        SqlFilter where;
        if (filter.name) where.contains("name", *filter.name);
        if (filter.isActive) where.equals("is_active", static_cast<int64_t>(*filter.isActive ? 1 : 0));

        auto session = connection_->acquire();
        auto stmt = session->prepare(SELECT_PORTFOLIO + where.clause() + " ORDER BY name, id");
        where.bind(stmt);

        std::vector<domain::Portfolio> portfolios;
        while (stmt.step()) {
            portfolios.push_back(rowToPortfolio(stmt));
        }
        return portfolios;
    }

    /**
     * @brief Все активные портфели
     */
    std::vector<domain::Portfolio> getAllActive() override {
        return list({.isActive = true});
    }

    /**
     * @brief Обновить портфель; false, если его нет
     */
    bool update(domain::EntityId id, const domain::Portfolio& portfolio) override {
        const Limits limits = resolveLimits(portfolio);
        try {
            bool updated = false;
            connection_->withinTransaction([&](SqliteSession& session) {
                session.prepare(R"(
                        UPDATE portfolio
                        SET name = ?, description = ?, max_positions = ?, max_risk_per_trade = ?, is_active = ?
                        WHERE id = ?
                    )")
                    .bindAll(portfolio.name(), portfolio.description(), limits.maxPositions,
                             limits.maxRiskPerTrade.toString(1), portfolio.isActive(), id)
                    .run();
                updated = session.changes() > 0;
            });
            return updated;
        } catch (const std::exception& e) {
            std::cerr << "[SqlitePortfolioRepository] update() failed: " << e.what() << std::endl;
            throw;
        }
    }

    /**
     * @brief Пометить портфель неактивным
     */
    bool deactivate(domain::EntityId id) override {
        try {
            bool updated = false;
            connection_->withinTransaction([&](SqliteSession& session) {
                session.prepare("UPDATE portfolio SET is_active = 0 WHERE id = ?").bind(1, id).run();
                updated = session.changes() > 0;
            });
            return updated;
        } catch (const std::exception& e) {
            std::cerr << "[SqlitePortfolioRepository] deactivate() failed: " << e.what() << std::endl;
            throw;
        }
    }

    /**
     * @brief Удалить портфель
     */
    bool deleteById(domain::EntityId id) override {
        try {
            bool deleted = false;
            connection_->withinTransaction([&](SqliteSession& session) {
                session.prepare("DELETE FROM portfolio WHERE id = ?").bind(1, id).run();
                deleted = session.changes() > 0;
            });
            return deleted;
        } catch (const std::exception& e) {
            std::cerr << "[SqlitePortfolioRepository] deleteById() failed: " << e.what() << std::endl;
            throw;
        }
    }

private:
    struct Limits {
        int maxPositions;
        domain::Decimal maxRiskPerTrade;
    };

    inline static const std::string SELECT_PORTFOLIO =
        "SELECT id, name, description, max_positions, max_risk_per_trade, is_active FROM portfolio";

    /**
     * @throws ValidationError если риск на сделку выше общего лимита
     */
    Limits resolveLimits(const domain::Portfolio& portfolio) const {
        Limits limits{
            portfolio.maxPositions().value_or(rules_->getMaxPositions()),
            portfolio.maxRiskPerTrade().value_or(rules_->getMaxRiskPerTrade())
        };
        if (limits.maxRiskPerTrade > rules_->getMaxRiskLimit()) {
            throw domain::ValidationError("Max risk per trade " + limits.maxRiskPerTrade.toString() +
                                          " exceeds the limit of " + rules_->getMaxRiskLimit().toString());
        }
        return limits;
    }

    static domain::Portfolio rowToPortfolio(const SqliteStatement& row) {
        return domain::Portfolio(
            row.get<std::string>("name"),
            row.getOptional<std::string>("description").value_or(""),
            row.get<int>("max_positions"),
            domain::Decimal::parse(row.get<std::string>("max_risk_per_trade")),
            row.get<bool>("is_active"),
            row.get<int64_t>("id")
        );
    }

    std::shared_ptr<IDatabaseConnection> connection_;
    std::shared_ptr<const settings::BusinessRules> rules_;
};

} // namespace stockbook::adapters::secondary
