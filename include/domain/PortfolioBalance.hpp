#pragma once

#include "Date.hpp"
#include "Decimal.hpp"
#include "EntityId.hpp"
#include "Money.hpp"
#include "TextRules.hpp"
#include <optional>

namespace stockbook::domain {

/**
 * @brief Снимок баланса портфеля на дату
 *
 * Одна запись на (portfolio, date). indexChange — изменение
 * бенчмарка в процентах, [-100, 100].
 */
class PortfolioBalance {
public:
    PortfolioBalance(
        EntityId portfolioId,
        Date balanceDate,
        Money finalBalance,
        std::optional<Money> withdrawals = std::nullopt,
        std::optional<Money> deposits = std::nullopt,
        std::optional<Decimal> indexChange = std::nullopt,
        OptionalId id = std::nullopt
    ) : portfolioId_(portfolioId)
      , balanceDate_(balanceDate)
      , finalBalance_(finalBalance)
      , withdrawals_(withdrawals.value_or(Money::zero(finalBalance.currency())))
      , deposits_(deposits.value_or(Money::zero(finalBalance.currency())))
      , indexChange_(indexChange)
    {
        rules::requirePositiveId(portfolioId_, "Portfolio ID");
        if (withdrawals_.isNegative()) {
            throw ValidationError("Withdrawals cannot be negative");
        }
        if (deposits_.isNegative()) {
            throw ValidationError("Deposits cannot be negative");
        }
        if (withdrawals_.currency() != finalBalance_.currency() ||
            deposits_.currency() != finalBalance_.currency()) {
            throw CurrencyMismatchError("record", finalBalance_.currency(),
                withdrawals_.currency() != finalBalance_.currency() ? withdrawals_.currency()
                                                                    : deposits_.currency());
        }
        if (indexChange_ && (*indexChange_ < Decimal(-100) || *indexChange_ > Decimal(100))) {
            throw ValidationError("Index change must be between -100 and 100 percent");
        }
        if (id) assignId(*id);
    }

    const OptionalId& id() const { return id_; }
    EntityId portfolioId() const { return portfolioId_; }
    const Date& balanceDate() const { return balanceDate_; }
    const Money& finalBalance() const { return finalBalance_; }
    const Money& withdrawals() const { return withdrawals_; }
    const Money& deposits() const { return deposits_; }
    const std::optional<Decimal>& indexChange() const { return indexChange_; }

    void assignId(EntityId id) { rules::assignOnce(id_, id, "PortfolioBalance"); }

    /**
     * @brief Чистый поток средств: deposits - withdrawals (со знаком)
     */
    Money netFlow() const { return deposits_.difference(withdrawals_); }

private:
    OptionalId id_;
    EntityId portfolioId_;
    Date balanceDate_;
    Money finalBalance_;
    Money withdrawals_;
    Money deposits_;
    std::optional<Decimal> indexChange_;
};

} // namespace stockbook::domain
