#pragma once

#include "domain/Stock.hpp"
#include "domain/StockRequest.hpp"
#include "ports/output/IStockRepository.hpp"
#include <optional>
#include <string>
#include <vector>

namespace stockbook::ports::input {

/**
 * @brief Интерфейс сервиса справочника бумаг
 *
 * Input Port. Каждый вызов выполняется в отдельном Unit of Work.
 */
class IStockService {
public:
    virtual ~IStockService() = default;

    /**
     * @brief Завести новую бумагу
     *
     * @return Сохранённая бумага с присвоенным id
     * @throws ValidationError при некорректных данных
     * @throws DuplicateKeyError если тикер уже заведён
     */
    virtual domain::Stock createStock(const domain::CreateStockRequest& request) = 0;

    /**
     * @brief Изменить поля бумаги
     *
     * @return Обновлённая бумага или nullopt, если id не найден
     * @throws ValidationError если изменений нет или данные некорректны
     */
    virtual std::optional<domain::Stock> updateStock(const domain::UpdateStockRequest& request) = 0;

    virtual std::optional<domain::Stock> getStockBySymbol(const std::string& symbol) = 0;

    virtual bool stockExists(const std::string& symbol) = 0;

    virtual std::vector<domain::Stock> searchStocks(const ports::output::StockFilter& filter) = 0;
};

} // namespace stockbook::ports::input
