#pragma once

#include "Decimal.hpp"
#include "EntityId.hpp"
#include "Money.hpp"
#include "Quantity.hpp"
#include "Symbol.hpp"
#include <map>
#include <optional>
#include <string>

namespace stockbook::domain {

/**
 * @brief Текущие цены: тикер → цена одной бумаги
 */
using PriceMap = std::map<std::string, Money>;

/**
 * @brief Открытая позиция вместе с данными бумаги
 */
struct Holding {
    EntityId stockId = 0;
    Symbol symbol;
    std::optional<std::string> industryGroup;
    Quantity quantity;              ///< Покупки минус продажи, > 0
};

/**
 * @brief Стоимость позиции и её доля в портфеле
 */
struct PositionAllocation {
    Symbol symbol;
    Quantity quantity;
    Money value;                    ///< price * quantity
    Decimal percentage;             ///< Доля от общей стоимости, %
};

/**
 * @brief Распределение стоимости портфеля по отраслям
 */
struct IndustryAllocation {
    std::map<std::string, Decimal> percentages;     ///< Отрасль → доля, %
    Money totalValue;
};

/**
 * @brief Часть свободных денег, приходящаяся на позицию
 */
struct CashAllocation {
    Symbol symbol;
    Money amount;
};

} // namespace stockbook::domain
