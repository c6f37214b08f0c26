#pragma once

#include "domain/PortfolioBalance.hpp"
#include "domain/TradeRequest.hpp"

namespace stockbook::ports::input {

/**
 * @brief Интерфейс сервиса учёта сделок и балансов
 *
 * Input Port. Все записи одного вызова фиксируются атомарно.
 */
class ILedgerService {
public:
    virtual ~ILedgerService() = default;

    /**
     * @brief Записать сделку и, при наличии, заметку в дневник
     *
     * @throws ValidationError если портфель не найден, неактивен
     *         или бумага не заведена
     */
    virtual domain::TradeResult recordTrade(const domain::TradeRequest& request) = 0;

    /**
     * @brief Записать (или заменить) снимок баланса за дату
     * @return id снимка
     */
    virtual domain::EntityId recordBalance(const domain::PortfolioBalance& balance) = 0;
};

} // namespace stockbook::ports::input
