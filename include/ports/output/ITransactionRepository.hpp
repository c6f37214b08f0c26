#pragma once

#include "domain/Date.hpp"
#include "domain/EntityId.hpp"
#include "domain/Transaction.hpp"
#include "domain/enums/TransactionType.hpp"
#include <optional>
#include <vector>

namespace stockbook::ports::output {

/**
 * @brief Критерии поиска сделок (даты включительно)
 */
struct TransactionFilter {
    domain::OptionalId portfolioId;
    domain::OptionalId stockId;
    std::optional<domain::TransactionType> type;
    std::optional<domain::Date> fromDate;
    std::optional<domain::Date> toDate;
};

/**
 * @brief Интерфейс репозитория сделок
 *
 * Output Port. Списки упорядочены по дате сделки, затем по id.
 */
class ITransactionRepository {
public:
    virtual ~ITransactionRepository() = default;

    virtual domain::EntityId create(const domain::Transaction& transaction) = 0;

    virtual std::optional<domain::Transaction> getById(domain::EntityId id) = 0;

    virtual std::vector<domain::Transaction> getByPortfolio(domain::EntityId portfolioId) = 0;

    virtual std::vector<domain::Transaction> list(const TransactionFilter& filter = {}) = 0;

    virtual bool update(domain::EntityId id, const domain::Transaction& transaction) = 0;

    virtual bool deleteById(domain::EntityId id) = 0;
};

} // namespace stockbook::ports::output
