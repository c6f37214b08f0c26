#pragma once

#include "Date.hpp"
#include "EntityId.hpp"
#include "Money.hpp"
#include "Quantity.hpp"
#include "TextRules.hpp"
#include "enums/TransactionType.hpp"
#include <optional>
#include <string>

namespace stockbook::domain {

/**
 * @brief Сделка покупки/продажи
 *
 * Количество и цена строго положительные, дата не в будущем.
 */
class Transaction {
public:
    static constexpr size_t MAX_NOTES_LENGTH = 1000;

    Transaction(
        EntityId portfolioId,
        EntityId stockId,
        TransactionType type,
        Quantity quantity,
        Money price,
        Date transactionDate,
        std::optional<std::string> notes = std::nullopt,
        OptionalId id = std::nullopt
    ) : portfolioId_(portfolioId)
      , stockId_(stockId)
      , type_(type)
      , quantity_(std::move(quantity))
      , price_(std::move(price))
      , transactionDate_(transactionDate)
      , notes_(std::move(notes))
    {
        rules::requirePositiveId(portfolioId_, "Portfolio ID");
        rules::requirePositiveId(stockId_, "Stock ID");
        if (!quantity_.isPositive()) {
            throw ValidationError("Quantity must be positive");
        }
        if (!price_.isPositive()) {
            throw ValidationError("Price must be positive");
        }
        if (transactionDate_ > Date::today()) {
            throw ValidationError("Transaction date cannot be in the future");
        }
        rules::requireMaxLength(notes_, MAX_NOTES_LENGTH, "Notes");
        if (id) assignId(*id);
    }

    const OptionalId& id() const { return id_; }
    EntityId portfolioId() const { return portfolioId_; }
    EntityId stockId() const { return stockId_; }
    TransactionType type() const { return type_; }
    const Quantity& quantity() const { return quantity_; }
    const Money& price() const { return price_; }
    const Date& transactionDate() const { return transactionDate_; }
    const std::optional<std::string>& notes() const { return notes_; }

    void assignId(EntityId id) { rules::assignOnce(id_, id, "Transaction"); }

    bool isBuy() const { return type_ == TransactionType::BUY; }
    bool isSell() const { return type_ == TransactionType::SELL; }

    /**
     * @brief Общая стоимость сделки: price * quantity
     */
    Money totalValue() const {
        return price_ * quantity_.value();
    }

    void setNotes(std::optional<std::string> notes) {
        rules::requireMaxLength(notes, MAX_NOTES_LENGTH, "Notes");
        notes_ = std::move(notes);
    }

private:
    OptionalId id_;
    EntityId portfolioId_;
    EntityId stockId_;
    TransactionType type_;
    Quantity quantity_;
    Money price_;
    Date transactionDate_;
    std::optional<std::string> notes_;
};

} // namespace stockbook::domain
