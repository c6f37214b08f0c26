#pragma once

#include "Decimal.hpp"
#include "EntityId.hpp"
#include "TextRules.hpp"
#include <optional>
#include <string>

namespace stockbook::domain {

/**
 * @brief Портфель (брокерский счёт)
 *
 * Лимиты позиций и риска могут быть не заданы: тогда при сохранении
 * подставляются значения по умолчанию из BusinessRules.
 */
class Portfolio {
public:
    static constexpr size_t MAX_NAME_LENGTH = 100;
    static constexpr size_t MAX_DESCRIPTION_LENGTH = 1000;

    explicit Portfolio(
        std::string name,
        std::string description = "",
        std::optional<int> maxPositions = std::nullopt,
        std::optional<Decimal> maxRiskPerTrade = std::nullopt,
        bool isActive = true,
        OptionalId id = std::nullopt
    ) : isActive_(isActive)
    {
        rename(std::move(name));
        setDescription(std::move(description));
        setLimits(maxPositions, maxRiskPerTrade);
        if (id) assignId(*id);
    }

    const OptionalId& id() const { return id_; }
    const std::string& name() const { return name_; }
    const std::string& description() const { return description_; }
    const std::optional<int>& maxPositions() const { return maxPositions_; }
    const std::optional<Decimal>& maxRiskPerTrade() const { return maxRiskPerTrade_; }
    bool isActive() const { return isActive_; }

    void assignId(EntityId id) { rules::assignOnce(id_, id, "Portfolio"); }

    /**
     * @throws ValidationError если имя пустое или длиннее 100 символов
     */
    void rename(std::string name) {
        std::string value = rules::trimmed(name);
        rules::requireNotBlank(value, "Portfolio name");
        rules::requireMaxLength(value, MAX_NAME_LENGTH, "Portfolio name");
        name_ = std::move(value);
    }

    void setDescription(std::string description) {
        rules::requireMaxLength(description, MAX_DESCRIPTION_LENGTH, "Description");
        description_ = std::move(description);
    }

    /**
     * @throws ValidationError если лимит не положительный
     */
    void setLimits(std::optional<int> maxPositions, std::optional<Decimal> maxRiskPerTrade) {
        if (maxPositions && *maxPositions <= 0) {
            throw ValidationError("Max positions must be positive");
        }
        if (maxRiskPerTrade && !maxRiskPerTrade->isPositive()) {
            throw ValidationError("Max risk per trade must be positive");
        }
        maxPositions_ = maxPositions;
        maxRiskPerTrade_ = maxRiskPerTrade;
    }

    void activate() { isActive_ = true; }
    void deactivate() { isActive_ = false; }

private:
    OptionalId id_;
    std::string name_;
    std::string description_;
    std::optional<int> maxPositions_;
    std::optional<Decimal> maxRiskPerTrade_;
    bool isActive_ = true;
};

} // namespace stockbook::domain
