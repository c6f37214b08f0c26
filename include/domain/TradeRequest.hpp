#pragma once

#include "Date.hpp"
#include "EntityId.hpp"
#include "Money.hpp"
#include "Quantity.hpp"
#include "enums/TransactionType.hpp"
#include <optional>
#include <string>
#include <vector>

namespace stockbook::domain {

/**
 * @brief Запрос на запись сделки
 *
 * Если задан journalNote, вместе со сделкой создаётся запись дневника,
 * ссылающаяся на неё.
 */
struct TradeRequest {
    EntityId portfolioId = 0;
    std::string symbol;                         ///< Тикер уже заведённой бумаги
    TransactionType type = TransactionType::BUY;
    Quantity quantity;
    Money price;
    Date transactionDate = Date::today();
    std::optional<std::string> notes;

    std::optional<std::string> journalNote;     ///< Текст записи дневника
    std::optional<std::string> journalTitle;
    std::vector<std::string> journalTags;
};

/**
 * @brief Результат записи сделки
 */
struct TradeResult {
    EntityId transactionId = 0;
    std::optional<EntityId> journalEntryId;
};

} // namespace stockbook::domain
