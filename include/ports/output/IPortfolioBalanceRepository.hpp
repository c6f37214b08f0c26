#pragma once

#include "domain/Date.hpp"
#include "domain/EntityId.hpp"
#include "domain/PortfolioBalance.hpp"
#include <optional>
#include <vector>

namespace stockbook::ports::output {

/**
 * @brief Критерии поиска снимков баланса (даты включительно)
 */
struct BalanceFilter {
    domain::OptionalId portfolioId;
    std::optional<domain::Date> fromDate;
    std::optional<domain::Date> toDate;
};

/**
 * @brief Интерфейс репозитория снимков баланса
 *
 * Output Port. Одна запись на (portfolio, date).
 */
class IPortfolioBalanceRepository {
public:
    virtual ~IPortfolioBalanceRepository() = default;

    /**
     * @brief Создать или заменить снимок за дату (upsert)
     * @return id строки (существующей при замене)
     */
    virtual domain::EntityId create(const domain::PortfolioBalance& balance) = 0;

    virtual std::optional<domain::PortfolioBalance> getById(domain::EntityId id) = 0;

    virtual std::optional<domain::PortfolioBalance> getByPortfolioAndDate(
        domain::EntityId portfolioId,
        const domain::Date& date
    ) = 0;

    /**
     * @brief Последний по дате снимок портфеля
     */
    virtual std::optional<domain::PortfolioBalance> getLatest(domain::EntityId portfolioId) = 0;

    /**
     * @brief История снимков, новые первыми
     */
    virtual std::vector<domain::PortfolioBalance> getHistory(
        domain::EntityId portfolioId,
        int limit
    ) = 0;

    /**
     * @brief Снимки по фильтру, упорядочены по дате, затем по id
     */
    virtual std::vector<domain::PortfolioBalance> list(const BalanceFilter& filter = {}) = 0;

    virtual bool update(domain::EntityId id, const domain::PortfolioBalance& balance) = 0;

    virtual bool deleteById(domain::EntityId id) = 0;
};

} // namespace stockbook::ports::output
