#pragma once

#include "domain/EntityId.hpp"
#include "domain/Stock.hpp"
#include "domain/Symbol.hpp"
#include "domain/enums/Grade.hpp"
#include <optional>
#include <string>
#include <vector>

namespace stockbook::ports::output {

/**
 * @brief Критерии поиска бумаг
 *
 * Незаданные поля не участвуют в фильтре, заданные объединяются через AND.
 * Строковые поля — поиск подстроки без учёта регистра.
 */
struct StockFilter {
    std::optional<std::string> symbol;
    std::optional<std::string> name;
    std::optional<std::string> industryGroup;
    std::optional<domain::Grade> grade;
};

/**
 * @brief Интерфейс репозитория бумаг
 *
 * Output Port. Результаты списков упорядочены по symbol.
 */
class IStockRepository {
public:
    virtual ~IStockRepository() = default;

    /**
     * @brief Сохранить новую бумагу
     *
     * @return id созданной строки
     * @throws DuplicateKeyError если тикер уже существует
     */
    virtual domain::EntityId create(const domain::Stock& stock) = 0;

    virtual std::optional<domain::Stock> getById(domain::EntityId id) = 0;

    virtual std::optional<domain::Stock> getBySymbol(const domain::Symbol& symbol) = 0;

    virtual bool existsBySymbol(const domain::Symbol& symbol) = 0;

    virtual std::vector<domain::Stock> list(const StockFilter& filter = {}) = 0;

    /**
     * @brief Обновить изменяемые поля (тикер не меняется)
     *
     * @return false если строки с таким id нет
     */
    virtual bool update(domain::EntityId id, const domain::Stock& stock) = 0;

    virtual bool deleteById(domain::EntityId id) = 0;
};

} // namespace stockbook::ports::output
