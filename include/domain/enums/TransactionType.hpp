#pragma once

#include <string>
#include <stdexcept>

namespace stockbook::domain {

/**
 * @brief Сторона сделки
 */
enum class TransactionType {
    BUY,    ///< Покупка
    SELL    ///< Продажа
};

/**
 * @brief Преобразовать в строку (значение колонки stock_transaction.type)
 */
inline std::string toString(TransactionType type) {
    switch (type) {
        case TransactionType::BUY:  return "buy";
        case TransactionType::SELL: return "sell";
    }
    return "unknown";
}

/**
 * @brief Создать из строки
 * @throws std::invalid_argument если строка не распознана
 */
inline TransactionType transactionTypeFromString(const std::string& str) {
    if (str == "buy" || str == "BUY")   return TransactionType::BUY;
    if (str == "sell" || str == "SELL") return TransactionType::SELL;
    throw std::invalid_argument("Unknown TransactionType: " + str);
}

} // namespace stockbook::domain
