#pragma once

#include "domain/EntityId.hpp"
#include "domain/Portfolio.hpp"
#include <optional>
#include <string>
#include <vector>

namespace stockbook::ports::output {

/**
 * @brief Критерии поиска портфелей
 */
struct PortfolioFilter {
    std::optional<std::string> name;    ///< Подстрока имени
    std::optional<bool> isActive;
};

/**
 * @brief Интерфейс репозитория портфелей
 *
 * Output Port. Списки упорядочены по имени, затем по id.
 */
class IPortfolioRepository {
public:
    virtual ~IPortfolioRepository() = default;

    /**
     * @brief Сохранить новый портфель
     *
     * Незаданные лимиты заполняются из BusinessRules.
     */
    virtual domain::EntityId create(const domain::Portfolio& portfolio) = 0;

    virtual std::optional<domain::Portfolio> getById(domain::EntityId id) = 0;

    virtual std::vector<domain::Portfolio> list(const PortfolioFilter& filter = {}) = 0;

    virtual std::vector<domain::Portfolio> getAllActive() = 0;

    virtual bool update(domain::EntityId id, const domain::Portfolio& portfolio) = 0;

    /**
     * @brief Пометить портфель неактивным
     * @return false если портфеля нет
     */
    virtual bool deactivate(domain::EntityId id) = 0;

    virtual bool deleteById(domain::EntityId id) = 0;
};

} // namespace stockbook::ports::output
