#pragma once

#include "EntityId.hpp"
#include "Money.hpp"
#include "TextRules.hpp"
#include "enums/TargetStatus.hpp"
#include <optional>
#include <string>

namespace stockbook::domain {

/**
 * @brief Ценовая цель по бумаге в портфеле
 *
 * pivot — цена входа/выхода, failure — стоп. pivot всегда выше failure.
 */
class Target {
public:
    static constexpr size_t MAX_NOTES_LENGTH = 1000;

    Target(
        EntityId portfolioId,
        EntityId stockId,
        Money pivotPrice,
        Money failurePrice,
        TargetStatus status = TargetStatus::ACTIVE,
        std::optional<std::string> notes = std::nullopt,
        OptionalId id = std::nullopt
    ) : portfolioId_(portfolioId)
      , stockId_(stockId)
      , pivotPrice_(pivotPrice)
      , failurePrice_(failurePrice)
      , status_(status)
    {
        rules::requirePositiveId(portfolioId_, "Portfolio ID");
        rules::requirePositiveId(stockId_, "Stock ID");
        validatePrices(pivotPrice_, failurePrice_);
        setNotes(std::move(notes));
        if (id) assignId(*id);
    }

    const OptionalId& id() const { return id_; }
    EntityId portfolioId() const { return portfolioId_; }
    EntityId stockId() const { return stockId_; }
    const Money& pivotPrice() const { return pivotPrice_; }
    const Money& failurePrice() const { return failurePrice_; }
    TargetStatus status() const { return status_; }
    const std::optional<std::string>& notes() const { return notes_; }

    void assignId(EntityId id) { rules::assignOnce(id_, id, "Target"); }

    bool isActive() const { return status_ == TargetStatus::ACTIVE; }

    void updatePrices(const Money& pivotPrice, const Money& failurePrice) {
        validatePrices(pivotPrice, failurePrice);
        pivotPrice_ = pivotPrice;
        failurePrice_ = failurePrice;
    }

    void setNotes(std::optional<std::string> notes) {
        rules::requireMaxLength(notes, MAX_NOTES_LENGTH, "Notes");
        notes_ = std::move(notes);
    }

    // Переходы из ACTIVE в финальный статус
    void markHit() { finish(TargetStatus::HIT); }
    void markFailed() { finish(TargetStatus::FAILED); }
    void cancel() { finish(TargetStatus::CANCELLED); }

    /**
     * @brief Вернуть цель в отслеживание
     */
    void activate() { status_ = TargetStatus::ACTIVE; }

    /**
     * @brief Разница pivot - failure (ширина стопа)
     */
    Money riskPerShare() const { return pivotPrice_ - failurePrice_; }

private:
    static void validatePrices(const Money& pivot, const Money& failure) {
        if (!pivot.isPositive()) {
            throw ValidationError("Pivot price must be positive");
        }
        if (!failure.isPositive()) {
            throw ValidationError("Failure price must be positive");
        }
        if (pivot <= failure) {
            throw ValidationError("Pivot price must exceed failure price");
        }
    }

    void finish(TargetStatus next) {
        if (status_ != TargetStatus::ACTIVE) {
            throw ValidationError("Cannot change target status from " + toString(status_) +
                                  " to " + toString(next));
        }
        status_ = next;
    }

    OptionalId id_;
    EntityId portfolioId_;
    EntityId stockId_;
    Money pivotPrice_;
    Money failurePrice_;
    TargetStatus status_;
    std::optional<std::string> notes_;
};

} // namespace stockbook::domain
