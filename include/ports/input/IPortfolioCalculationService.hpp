#pragma once

#include "domain/EntityId.hpp"
#include "domain/Money.hpp"
#include "domain/PortfolioValuation.hpp"
#include <vector>

namespace stockbook::ports::input {

/**
 * @brief Интерфейс расчётов по портфелю
 *
 * Input Port. Позиции читаются из истории сделок в одном Unit of Work,
 * цены передаёт вызывающий.
 */
class IPortfolioCalculationService {
public:
    virtual ~IPortfolioCalculationService() = default;

    /**
     * @brief Открытые позиции портфеля в порядке тикера
     * @throws ValidationError если портфель не найден
     */
    virtual std::vector<domain::Holding> getHoldings(domain::EntityId portfolioId) = 0;

    /**
     * @brief Рыночная стоимость всех открытых позиций
     * @throws CalculationError если нет цены по одной из бумаг
     */
    virtual domain::Money calculateTotalValue(domain::EntityId portfolioId,
                                              const domain::PriceMap& prices) = 0;

    /**
     * @brief Стоимость и доля каждой позиции; пусто при нулевой стоимости
     */
    virtual std::vector<domain::PositionAllocation> calculatePositionAllocations(
        domain::EntityId portfolioId,
        const domain::PriceMap& prices) = 0;

    /**
     * @brief Доли отраслей; бумаги без отрасли идут в "Unknown"
     */
    virtual domain::IndustryAllocation calculateIndustryAllocations(
        domain::EntityId portfolioId,
        const domain::PriceMap& prices) = 0;

    /**
     * @brief Разложить сумму по позициям пропорционально их стоимости
     *
     * Сумма частей всегда равна cash.
     */
    virtual std::vector<domain::CashAllocation> allocateCash(
        domain::EntityId portfolioId,
        const domain::Money& cash,
        const domain::PriceMap& prices) = 0;
};

} // namespace stockbook::ports::input
