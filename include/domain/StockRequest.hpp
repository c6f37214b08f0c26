#pragma once

#include "EntityId.hpp"
#include <optional>
#include <string>

namespace stockbook::domain {

/**
 * @brief Запрос на создание бумаги
 */
struct CreateStockRequest {
    std::string symbol;                         ///< Тикер (будет нормализован)
    std::string name;                           ///< Название компании
    std::optional<std::string> industryGroup;   ///< Отрасль
    std::optional<std::string> grade;           ///< "A" / "B" / "C"
    std::string notes;
};

/**
 * @brief Запрос на изменение бумаги
 *
 * Незаданные поля не меняются.
 */
struct UpdateStockRequest {
    EntityId stockId = 0;
    std::optional<std::string> name;
    std::optional<std::string> industryGroup;
    std::optional<std::string> grade;
    std::optional<std::string> notes;

    bool hasChanges() const {
        return name || industryGroup || grade || notes;
    }
};

} // namespace stockbook::domain
