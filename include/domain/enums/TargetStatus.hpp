#pragma once

#include <string>
#include <stdexcept>

namespace stockbook::domain {

/**
 * @brief Статус ценовой цели
 */
enum class TargetStatus {
    ACTIVE,     ///< Отслеживается
    HIT,        ///< Цена достигла pivot
    FAILED,     ///< Цена пробила failure
    CANCELLED   ///< Снята вручную
};

inline std::string toString(TargetStatus status) {
    switch (status) {
        case TargetStatus::ACTIVE:    return "active";
        case TargetStatus::HIT:       return "hit";
        case TargetStatus::FAILED:    return "failed";
        case TargetStatus::CANCELLED: return "cancelled";
    }
    return "unknown";
}

/**
 * @brief Создать из строки
 * @throws std::invalid_argument если строка не распознана
 */
inline TargetStatus targetStatusFromString(const std::string& str) {
    if (str == "active")    return TargetStatus::ACTIVE;
    if (str == "hit")       return TargetStatus::HIT;
    if (str == "failed")    return TargetStatus::FAILED;
    if (str == "cancelled") return TargetStatus::CANCELLED;
    throw std::invalid_argument("Unknown TargetStatus: " + str);
}

/**
 * @brief Финальный ли статус
 */
inline bool isFinalStatus(TargetStatus status) {
    return status != TargetStatus::ACTIVE;
}

} // namespace stockbook::domain
