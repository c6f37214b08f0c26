#pragma once

#include "EntityId.hpp"
#include "Quantity.hpp"
#include "Transaction.hpp"
#include <map>
#include <vector>

namespace stockbook::domain {

/**
 * @brief Позиция по бумаге в портфеле
 *
 * Итог по всей истории: сумма покупок минус сумма продаж.
 * Порядок и даты сделок на результат не влияют.
 */
struct Position {
    EntityId stockId = 0;   ///< Бумага
    Quantity bought;        ///< Всего куплено
    Quantity sold;          ///< Всего продано

    /**
     * @brief Чистое количество (может быть отрицательным для несогласованной истории)
     */
    Quantity net() const {
        return Quantity(bought.value() - sold.value(), true);
    }

    bool isOpen() const { return net().isPositive(); }
};

/**
 * @brief Позиции портфеля, собранные из истории сделок
 */
class PositionBook {
public:
    explicit PositionBook(const std::vector<Transaction>& history) {
        for (const auto& tx : history) {
            auto& position = positions_[tx.stockId()];
            position.stockId = tx.stockId();
            if (tx.isBuy()) {
                position.bought = position.bought.add(tx.quantity());
            } else {
                position.sold = position.sold.add(tx.quantity());
            }
        }
    }

    /**
     * @brief Чистое количество по бумаге; ноль, если сделок не было
     */
    Quantity netOf(EntityId stockId) const {
        auto it = positions_.find(stockId);
        return it == positions_.end() ? Quantity(Decimal(0), true) : it->second.net();
    }

    bool isOpen(EntityId stockId) const {
        return netOf(stockId).isPositive();
    }

    /**
     * @brief Открытые позиции (net > 0) в порядке stockId
     */
    std::vector<Position> openPositions() const {
        std::vector<Position> result;
        for (const auto& [stockId, position] : positions_) {
            if (position.isOpen()) {
                result.push_back(position);
            }
        }
        return result;
    }

    size_t openCount() const {
        size_t count = 0;
        for (const auto& entry : positions_) {
            if (entry.second.isOpen()) ++count;
        }
        return count;
    }

private:
    std::map<EntityId, Position> positions_;
};

} // namespace stockbook::domain
