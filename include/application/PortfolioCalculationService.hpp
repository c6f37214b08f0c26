#pragma once

#include "domain/Position.hpp"
#include "domain/exceptions/DomainExceptions.hpp"
#include "ports/input/IPortfolioCalculationService.hpp"
#include "ports/output/IUnitOfWorkFactory.hpp"
#include "ports/output/UnitOfWorkScope.hpp"
#include <algorithm>
#include <memory>

namespace stockbook::application {

/**
 * @brief Расчёты стоимости и структуры портфеля
 *
 * Реализует IPortfolioCalculationService. Позиции берутся из истории
 * сделок (PositionBook), стоимость считается по переданным ценам.
 */
class PortfolioCalculationService : public ports::input::IPortfolioCalculationService {
public:
    static constexpr const char* UNKNOWN_INDUSTRY = "Unknown";

    explicit PortfolioCalculationService(
        std::shared_ptr<ports::output::IUnitOfWorkFactory> unitOfWorkFactory)
        : unitOfWorkFactory_(std::move(unitOfWorkFactory)) {}

    std::vector<domain::Holding> getHoldings(domain::EntityId portfolioId) override {
        auto uow = unitOfWorkFactory_->create();
        return ports::output::runInUnitOfWork(*uow, [&](ports::output::IUnitOfWork& work) {
            if (!work.portfolios().getById(portfolioId)) {
                throw domain::ValidationError(
                    "Portfolio " + std::to_string(portfolioId) + " not found");
            }

            domain::PositionBook book(work.transactions().getByPortfolio(portfolioId));
            std::vector<domain::Holding> holdings;
            for (const auto& position : book.openPositions()) {
                auto stock = work.stocks().getById(position.stockId);
                if (!stock) {
                    throw domain::CalculationError(
                        "Stock " + std::to_string(position.stockId) + " not found", "holdings");
                }
                holdings.push_back(domain::Holding{
                    .stockId = position.stockId,
                    .symbol = stock->symbol(),
                    .industryGroup = stock->industryGroup(),
                    .quantity = domain::Quantity(position.net().value())
                });
            }
            std::sort(holdings.begin(), holdings.end(),
                      [](const domain::Holding& a, const domain::Holding& b) {
                          return a.symbol < b.symbol;
                      });
            return holdings;
        });
    }

    domain::Money calculateTotalValue(domain::EntityId portfolioId,
                                      const domain::PriceMap& prices) override {
        return totalOf(valuePositions(getHoldings(portfolioId), prices));
    }

    std::vector<domain::PositionAllocation> calculatePositionAllocations(
        domain::EntityId portfolioId,
        const domain::PriceMap& prices) override
    {
        auto allocations = valuePositions(getHoldings(portfolioId), prices);
        domain::Money total = totalOf(allocations);
        if (total.isZero()) {
            return {};
        }
        for (auto& allocation : allocations) {
            allocation.percentage = percentOf(allocation.value, total);
        }
        return allocations;
    }

    domain::IndustryAllocation calculateIndustryAllocations(
        domain::EntityId portfolioId,
        const domain::PriceMap& prices) override
    {
        auto holdings = getHoldings(portfolioId);
        auto positions = valuePositions(holdings, prices);

        domain::IndustryAllocation result;
        result.totalValue = totalOf(positions);

        std::map<std::string, domain::Money> industryValues;
        for (size_t i = 0; i < holdings.size(); ++i) {
            const std::string industry = holdings[i].industryGroup.value_or(UNKNOWN_INDUSTRY);
            auto it = industryValues.find(industry);
            if (it == industryValues.end()) {
                industryValues.emplace(industry, positions[i].value);
            } else {
                it->second = it->second.add(positions[i].value);
            }
        }

        for (const auto& [industry, value] : industryValues) {
            result.percentages[industry] = result.totalValue.isPositive()
                ? percentOf(value, result.totalValue)
                : domain::Decimal(0);
        }
        return result;
    }

    std::vector<domain::CashAllocation> allocateCash(
        domain::EntityId portfolioId,
        const domain::Money& cash,
        const domain::PriceMap& prices) override
    {
        auto allocations = calculatePositionAllocations(portfolioId, prices);

        std::vector<domain::Decimal> ratios;
        ratios.reserve(allocations.size());
        for (const auto& allocation : allocations) {
            ratios.push_back(allocation.value.amount());
        }

        auto parts = cash.allocate(ratios);
        std::vector<domain::CashAllocation> result;
        result.reserve(parts.size());
        for (size_t i = 0; i < parts.size(); ++i) {
            result.push_back(domain::CashAllocation{
                .symbol = allocations[i].symbol,
                .amount = parts[i]
            });
        }
        return result;
    }

private:
    /**
     * @brief Оценить позиции; percentage остаётся нулевым
     * @throws CalculationError если нет цены
     */
    static std::vector<domain::PositionAllocation> valuePositions(
        const std::vector<domain::Holding>& holdings,
        const domain::PriceMap& prices)
    {
        domain::PriceMap normalized;
        for (const auto& [symbol, price] : prices) {
            normalized.emplace(domain::Symbol(symbol).value(), price);
        }

        std::vector<domain::PositionAllocation> result;
        result.reserve(holdings.size());
        for (const auto& holding : holdings) {
            auto price = normalized.find(holding.symbol.value());
            if (price == normalized.end()) {
                throw domain::CalculationError(
                    "Stock " + holding.symbol.value() + " missing current price", "total_value");
            }
            result.push_back(domain::PositionAllocation{
                .symbol = holding.symbol,
                .quantity = holding.quantity,
                .value = price->second.multiply(holding.quantity.value()),
                .percentage = domain::Decimal(0)
            });
        }
        return result;
    }

    static domain::Money totalOf(const std::vector<domain::PositionAllocation>& positions) {
        if (positions.empty()) {
            return domain::Money::zero();
        }
        domain::Money total = domain::Money::zero(positions.front().value.currency());
        for (const auto& position : positions) {
            total = total.add(position.value);
        }
        return total;
    }

    static domain::Decimal percentOf(const domain::Money& part, const domain::Money& total) {
        return part.amount() / total.amount() * domain::Decimal(100);
    }

    std::shared_ptr<ports::output::IUnitOfWorkFactory> unitOfWorkFactory_;
};

} // namespace stockbook::application
