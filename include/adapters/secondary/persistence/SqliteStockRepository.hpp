#pragma once

#include "IDatabaseConnection.hpp"
#include "SqlFilter.hpp"
#include "ports/output/IStockRepository.hpp"
#include <iostream>
#include <memory>

namespace stockbook::adapters::secondary {

/**
 * @brief SQLite реализация репозитория бумаг
 */
class SqliteStockRepository : public ports::output::IStockRepository {
public:
    /**
     * @brief Конструктор с соединением (самостоятельным или транзакционным)
     */
    explicit SqliteStockRepository(std::shared_ptr<IDatabaseConnection> connection)
        : connection_(std::move(connection)) {}

    /**
     * @brief Сохранить бумагу
     */
    domain::EntityId create(const domain::Stock& stock) override {
        try {
            domain::EntityId id = 0;
            connection_->withinTransaction([&](SqliteSession& session) {
                session.prepare(R"(
                        INSERT INTO stock (symbol, name, industry_group, grade, notes)
                        VALUES (?, ?, ?, ?, ?)
                    )")
                    .bindAll(stock.symbol().value(), stock.name(), stock.industryGroup(),
                             gradeText(stock.grade()), stock.notes())
                    .run();
                id = session.lastInsertId();
            });
            std::cout << "[SqliteStockRepository] Created stock " << stock.symbol()
                      << " (id=" << id << ")" << std::endl;
            return id;
        } catch (const std::exception& e) {
            std::cerr << "[SqliteStockRepository] create() failed: " << e.what() << std::endl;
            throw;
        }
    }

    /**
     * @brief Найти бумагу по ID
     */
    std::optional<domain::Stock> getById(domain::EntityId id) override {
        auto session = connection_->acquire();
        auto stmt = session->prepare(SELECT_STOCK + " WHERE id = ?");
        stmt.bind(1, id);
        if (!stmt.step()) {
            return std::nullopt;
        }
        return rowToStock(stmt);
    }

    /**
     * @brief Найти бумагу по тикеру
     */
    std::optional<domain::Stock> getBySymbol(const domain::Symbol& symbol) override {
        auto session = connection_->acquire();
        auto stmt = session->prepare(SELECT_STOCK + " WHERE symbol = ?");
        stmt.bind(1, symbol.value());
        if (!stmt.step()) {
            return std::nullopt;
        }
        return rowToStock(stmt);
    }

    /**
     * @brief Заведена ли бумага с таким тикером
     */
    bool existsBySymbol(const domain::Symbol& symbol) override {
        auto session = connection_->acquire();
        auto stmt = session->prepare("SELECT 1 AS found FROM stock WHERE symbol = ? LIMIT 1");
        stmt.bind(1, symbol.value());
        return stmt.step();
    }

    /**
     * @brief Бумаги по фильтру, в порядке тикера
     */
    std::vector<domain::Stock> list(const ports::output::StockFilter& filter = {}) override {
        SqlFilter where;
        if (filter.symbol) where.contains("symbol", *filter.symbol);
        if (filter.name) where.contains("name", *filter.name);
        if (filter.industryGroup) where.contains("industry_group", *filter.industryGroup);
        if (filter.grade) where.equals("grade", domain::toString(*filter.grade));

        auto session = connection_->acquire();
        auto stmt = session->prepare(SELECT_STOCK + where.clause() + " ORDER BY symbol");
        where.bind(stmt);

        std::vector<domain::Stock> stocks;
        while (stmt.step()) {
            stocks.push_back(rowToStock(stmt));
        }
        return stocks;
    }

    /**
     * @brief Обновить бумагу; тикер не меняется
     */
    bool update(domain::EntityId id, const domain::Stock& stock) override {
        try {
            bool updated = false;
            connection_->withinTransaction([&](SqliteSession& session) {
                session.prepare(R"(
                        UPDATE stock
                        SET name = ?, industry_group = ?, grade = ?, notes = ?
                        WHERE id = ?
                    )")
                    .bindAll(stock.name(), stock.industryGroup(), gradeText(stock.grade()),
                             stock.notes(), id)
                    .run();
                updated = session.changes() > 0;
            });
            return updated;
        } catch (const std::exception& e) {
            std::cerr << "[SqliteStockRepository] update() failed: " << e.what() << std::endl;
            throw;
        }
    }

    /**
     * @brief Удалить бумагу
     */
    bool deleteById(domain::EntityId id) override {
        try {
            bool deleted = false;
            connection_->withinTransaction([&](SqliteSession& session) {
                session.prepare("DELETE FROM stock WHERE id = ?").bind(1, id).run();
                deleted = session.changes() > 0;
            });
            return deleted;
        } catch (const std::exception& e) {
            std::cerr << "[SqliteStockRepository] deleteById() failed: " << e.what() << std::endl;
            throw;
        }
    }

private:
    inline static const std::string SELECT_STOCK =
        "SELECT id, symbol, name, industry_group, grade, notes FROM stock";

    static std::optional<std::string> gradeText(const std::optional<domain::Grade>& grade) {
        if (!grade) return std::nullopt;
        return domain::toString(*grade);
    }

    /**
     * @brief Преобразовать строку результата в Stock
     */
    static domain::Stock rowToStock(const SqliteStatement& row) {
        std::optional<domain::Grade> grade;
        if (!row.isNull("grade")) {
            grade = domain::gradeFromString(row.get<std::string>("grade"));
        }
        return domain::Stock(
            domain::Symbol(row.get<std::string>("symbol")),
            row.get<std::string>("name"),
            row.getOptional<std::string>("industry_group"),
            grade,
            row.getOptional<std::string>("notes").value_or(""),
            row.get<int64_t>("id")
        );
    }

    std::shared_ptr<IDatabaseConnection> connection_;
};

} // namespace stockbook::adapters::secondary
