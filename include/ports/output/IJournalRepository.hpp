#pragma once

#include "domain/Date.hpp"
#include "domain/EntityId.hpp"
#include "domain/JournalEntry.hpp"
#include <optional>
#include <string>
#include <vector>

namespace stockbook::ports::output {

/**
 * @brief Критерии поиска записей дневника
 */
struct JournalFilter {
    domain::OptionalId portfolioId;
    domain::OptionalId stockId;
    domain::OptionalId transactionId;
    std::optional<domain::Date> fromDate;
    std::optional<domain::Date> toDate;
    std::optional<std::string> text;    ///< Подстрока заголовка или текста
};

/**
 * @brief Интерфейс репозитория торгового дневника
 *
 * Output Port. Списки упорядочены по дате записи, затем по id.
 */
class IJournalRepository {
public:
    virtual ~IJournalRepository() = default;

    virtual domain::EntityId create(const domain::JournalEntry& entry) = 0;

    virtual std::optional<domain::JournalEntry> getById(domain::EntityId id) = 0;

    /**
     * @brief Последние записи, новые первыми
     */
    virtual std::vector<domain::JournalEntry> getRecent(int limit) = 0;

    virtual std::vector<domain::JournalEntry> list(const JournalFilter& filter = {}) = 0;

    virtual bool update(domain::EntityId id, const domain::JournalEntry& entry) = 0;

    virtual bool deleteById(domain::EntityId id) = 0;
};

} // namespace stockbook::ports::output
