#pragma once

#include "domain/Symbol.hpp"
#include "domain/exceptions/DomainExceptions.hpp"
#include "ports/input/IStockService.hpp"
#include "ports/output/IUnitOfWorkFactory.hpp"
#include "ports/output/PersistenceErrors.hpp"
#include "ports/output/UnitOfWorkScope.hpp"
#include <iostream>
#include <memory>
#include <stdexcept>

namespace stockbook::application {

/**
 * @brief Сервис справочника бумаг
 *
 * Реализует IStockService. Каждый метод открывает свой Unit of Work.
 */
class StockService : public ports::input::IStockService {
public:
    explicit StockService(std::shared_ptr<ports::output::IUnitOfWorkFactory> unitOfWorkFactory)
        : unitOfWorkFactory_(std::move(unitOfWorkFactory)) {}

    domain::Stock createStock(const domain::CreateStockRequest& request) override {
        // Валидация до открытия транзакции
        domain::Stock stock(
            domain::Symbol(request.symbol),
            request.name,
            request.industryGroup,
            parseGrade(request.grade),
            request.notes
        );

        auto uow = unitOfWorkFactory_->create();
        return ports::output::runInUnitOfWork(*uow, [&](ports::output::IUnitOfWork& work) {
            if (work.stocks().existsBySymbol(stock.symbol())) {
                throw ports::output::DuplicateKeyError(
                    "Stock with symbol " + stock.symbol().value() + " already exists");
            }
            stock.assignId(work.stocks().create(stock));
            std::cout << "[StockService] Created stock " << stock.symbol() << std::endl;
            return stock;
        });
    }

    std::optional<domain::Stock> updateStock(const domain::UpdateStockRequest& request) override {
        if (!request.hasChanges()) {
            throw domain::ValidationError("No fields to update");
        }
        std::optional<domain::Grade> newGrade;
        if (request.grade) {
            newGrade = parseGrade(request.grade);
        }

        auto uow = unitOfWorkFactory_->create();
        return ports::output::runInUnitOfWork(*uow, [&](ports::output::IUnitOfWork& work) {
            auto stock = work.stocks().getById(request.stockId);
            if (!stock) {
                return stock;
            }
            stock->updateDetails(
                request.name.value_or(stock->name()),
                request.industryGroup ? request.industryGroup : stock->industryGroup(),
                request.grade ? newGrade : stock->grade(),
                request.notes.value_or(stock->notes())
            );
            work.stocks().update(request.stockId, *stock);
            return stock;
        });
    }

    std::optional<domain::Stock> getStockBySymbol(const std::string& symbol) override {
        domain::Symbol normalized(symbol);
        auto uow = unitOfWorkFactory_->create();
        return ports::output::runInUnitOfWork(*uow, [&](ports::output::IUnitOfWork& work) {
            return work.stocks().getBySymbol(normalized);
        });
    }

    bool stockExists(const std::string& symbol) override {
        domain::Symbol normalized(symbol);
        auto uow = unitOfWorkFactory_->create();
        return ports::output::runInUnitOfWork(*uow, [&](ports::output::IUnitOfWork& work) {
            return work.stocks().existsBySymbol(normalized);
        });
    }

    std::vector<domain::Stock> searchStocks(const ports::output::StockFilter& filter) override {
        auto uow = unitOfWorkFactory_->create();
        return ports::output::runInUnitOfWork(*uow, [&](ports::output::IUnitOfWork& work) {
            return work.stocks().list(filter);
        });
    }

private:
    /**
     * @brief "A"/"B"/"C" → Grade, пустая строка → без оценки
     * @throws ValidationError для других значений
     */
    static std::optional<domain::Grade> parseGrade(const std::optional<std::string>& grade) {
        if (!grade || domain::rules::isBlank(*grade)) {
            return std::nullopt;
        }
        try {
            return domain::gradeFromString(domain::rules::trimmed(*grade));
        } catch (const std::invalid_argument&) {
            throw domain::ValidationError("Grade must be one of A, B, C, got '" + *grade + "'");
        }
    }

    std::shared_ptr<ports::output::IUnitOfWorkFactory> unitOfWorkFactory_;
};

} // namespace stockbook::application
