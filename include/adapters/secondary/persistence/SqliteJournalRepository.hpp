#pragma once

#include "IDatabaseConnection.hpp"
#include "SqlFilter.hpp"
#include "domain/exceptions/DomainExceptions.hpp"
#include "ports/output/IJournalRepository.hpp"
#include "ports/output/PersistenceErrors.hpp"
#include <nlohmann/json.hpp>
#include <iostream>
#include <memory>

namespace stockbook::adapters::secondary {

/**
 * @brief SQLite реализация репозитория торгового дневника
 *
 * Теги хранятся JSON-массивом строк в колонке tags.
 */
class SqliteJournalRepository : public ports::output::IJournalRepository {
public:
    /**
     * @brief Конструктор с соединением (самостоятельным или транзакционным)
     */
    explicit SqliteJournalRepository(std::shared_ptr<IDatabaseConnection> connection)
        : connection_(std::move(connection)) {}

    /**
     * @brief Сохранить запись дневника, теги пишутся JSON-массивом
     */
    domain::EntityId create(const domain::JournalEntry& entry) override {
        try {
            domain::EntityId id = 0;
            connection_->withinTransaction([&](SqliteSession& session) {
                session.prepare(R"(
                        INSERT INTO journal_entry
                            (entry_date, title, content, tags, portfolio_id, stock_id, transaction_id)
                        VALUES (?, ?, ?, ?, ?, ?, ?)
                    )")
                    .bindAll(entry.entryDate().toString(), entry.title(), entry.content(),
                             tagsToJson(entry.tags()), entry.portfolioId(), entry.stockId(),
                             entry.transactionId())
                    .run();
                id = session.lastInsertId();
            });
            std::cout << "[SqliteJournalRepository] Created entry on " << entry.entryDate()
                      << " (id=" << id << ")" << std::endl;
            return id;
        } catch (const std::exception& e) {
            std::cerr << "[SqliteJournalRepository] create() failed: " << e.what() << std::endl;
            throw;
        }
    }

    /**
     * @brief Найти запись по ID
     */
    std::optional<domain::JournalEntry> getById(domain::EntityId id) override {
        auto session = connection_->acquire();
        auto stmt = session->prepare(SELECT_ENTRY + " WHERE id = ?");
        stmt.bind(1, id);
        if (!stmt.step()) {
            return std::nullopt;
        }
        return rowToEntry(stmt);
    }

    /**
     * @brief Последние записи, новые первыми
     */
    std::vector<domain::JournalEntry> getRecent(int limit) override {
        if (limit <= 0) {
            throw domain::ValidationError("Limit must be positive");
        }
        auto session = connection_->acquire();
        auto stmt = session->prepare(SELECT_ENTRY + " ORDER BY entry_date DESC, id DESC LIMIT ?");
        stmt.bind(1, limit);

        std::vector<domain::JournalEntry> entries;
        while (stmt.step()) {
            entries.push_back(rowToEntry(stmt));
        }
        return entries;
    }

    /**
     * @brief Записи по фильтру (связи, диапазон дат, подстрока текста)
     */
    std::vector<domain::JournalEntry> list(const ports::output::JournalFilter& filter = {}) override {
        SqlFilter where;
        if (filter.portfolioId) where.equals("portfolio_id", *filter.portfolioId);
        if (filter.stockId) where.equals("stock_id", *filter.stockId);
        if (filter.transactionId) where.equals("transaction_id", *filter.transactionId);
        if (filter.fromDate) where.atLeast("entry_date", filter.fromDate->toString());
        if (filter.toDate) where.atMost("entry_date", filter.toDate->toString());
        if (filter.text) where.containsAny({"title", "content"}, *filter.text);

        auto session = connection_->acquire();
        auto stmt = session->prepare(SELECT_ENTRY + where.clause() + " ORDER BY entry_date, id");
        where.bind(stmt);

        std::vector<domain::JournalEntry> entries;
        while (stmt.step()) {
            entries.push_back(rowToEntry(stmt));
        }
        return entries;
    }

    /**
     * @brief Обновить запись; false, если её нет
     */
    bool update(domain::EntityId id, const domain::JournalEntry& entry) override {
        try {
            bool updated = false;
            connection_->withinTransaction([&](SqliteSession& session) {
                session.prepare(R"(
                        UPDATE journal_entry
                        SET entry_date = ?, title = ?, content = ?, tags = ?,
                            portfolio_id = ?, stock_id = ?, transaction_id = ?
                        WHERE id = ?
                    )")
                    .bindAll(entry.entryDate().toString(), entry.title(), entry.content(),
                             tagsToJson(entry.tags()), entry.portfolioId(), entry.stockId(),
                             entry.transactionId(), id)
                    .run();
                updated = session.changes() > 0;
            });
            return updated;
        } catch (const std::exception& e) {
            std::cerr << "[SqliteJournalRepository] update() failed: " << e.what() << std::endl;
            throw;
        }
    }

    /**
     * @brief Удалить запись
     */
    bool deleteById(domain::EntityId id) override {
        try {
            bool deleted = false;
            connection_->withinTransaction([&](SqliteSession& session) {
                session.prepare("DELETE FROM journal_entry WHERE id = ?").bind(1, id).run();
                deleted = session.changes() > 0;
            });
            return deleted;
        } catch (const std::exception& e) {
            std::cerr << "[SqliteJournalRepository] deleteById() failed: " << e.what() << std::endl;
            throw;
        }
    }

private:
    inline static const std::string SELECT_ENTRY = R"(
        SELECT id, entry_date, title, content, tags, portfolio_id, stock_id, transaction_id
        FROM journal_entry)";

    static std::string tagsToJson(const std::vector<std::string>& tags) {
        return nlohmann::json(tags).dump();
    }

    /**
     * @throws PersistenceError если в колонке не JSON-массив строк
     */
    static std::vector<std::string> tagsFromJson(const std::string& text) {
        if (text.empty()) {
            return {};
        }
        try {
            return nlohmann::json::parse(text).get<std::vector<std::string>>();
        } catch (const nlohmann::json::exception& e) {
            throw ports::output::PersistenceError("Corrupt tags column '" + text + "': " + e.what());
        }
    }

    static domain::JournalEntry rowToEntry(const SqliteStatement& row) {
        return domain::JournalEntry(
            domain::Date::parse(row.get<std::string>("entry_date")),
            row.get<std::string>("content"),
            row.getOptional<std::string>("title"),
            row.getOptional<int64_t>("portfolio_id"),
            row.getOptional<int64_t>("stock_id"),
            row.getOptional<int64_t>("transaction_id"),
            tagsFromJson(row.getOptional<std::string>("tags").value_or("")),
            row.get<int64_t>("id")
        );
    }

    std::shared_ptr<IDatabaseConnection> connection_;
};

} // namespace stockbook::adapters::secondary
