#pragma once

#include "EntityId.hpp"
#include "Money.hpp"
#include "Quantity.hpp"
#include "Symbol.hpp"
#include "TextRules.hpp"
#include "enums/Grade.hpp"
#include <functional>
#include <optional>
#include <string>

namespace stockbook::domain {

/**
 * @brief Бумага (акция)
 *
 * Бизнес-идентичность — тикер: равенство и хеш считаются по symbol,
 * а не по суррогатному id, поэтому сравнивать можно и до сохранения.
 */
class Stock {
public:
    static constexpr size_t MAX_NAME_LENGTH = 200;
    static constexpr size_t MAX_INDUSTRY_GROUP_LENGTH = 100;
    static constexpr size_t MAX_NOTES_LENGTH = 1000;

    Stock(
        Symbol symbol,
        std::string name,
        std::optional<std::string> industryGroup = std::nullopt,
        std::optional<Grade> grade = std::nullopt,
        std::string notes = "",
        OptionalId id = std::nullopt
    ) : symbol_(std::move(symbol))
    {
        updateDetails(std::move(name), std::move(industryGroup), grade, std::move(notes));
        if (id) assignId(*id);
    }

    const OptionalId& id() const { return id_; }
    const Symbol& symbol() const { return symbol_; }
    const std::string& name() const { return name_; }
    const std::optional<std::string>& industryGroup() const { return industryGroup_; }
    const std::optional<Grade>& grade() const { return grade_; }
    const std::string& notes() const { return notes_; }

    /**
     * @throws std::logic_error если id уже присвоен
     */
    void assignId(EntityId id) { rules::assignOnce(id_, id, "Stock"); }

    /**
     * @brief Обновить изменяемые поля целиком (тикер неизменяем)
     *
     * Всё проверяется до присваивания: при ошибке объект не меняется.
     */
    void updateDetails(std::string name,
                       std::optional<std::string> industryGroup,
                       std::optional<Grade> grade,
                       std::string notes) {
        rules::requireMaxLength(name, MAX_NAME_LENGTH, "Company name");
        if (industryGroup && rules::isBlank(*industryGroup)) {
            industryGroup.reset();
        }
        rules::requireMaxLength(industryGroup, MAX_INDUSTRY_GROUP_LENGTH, "Industry group");
        rules::requireMaxLength(notes, MAX_NOTES_LENGTH, "Notes");

        name_ = rules::trimmed(name);
        industryGroup_ = industryGroup ? std::optional<std::string>(rules::trimmed(*industryGroup))
                                       : std::nullopt;
        grade_ = grade;
        notes_ = std::move(notes);
    }

    bool hasNotes() const { return !rules::isBlank(notes_); }

    /**
     * @brief Стоимость позиции: price * quantity
     */
    Money positionValue(const Quantity& quantity, const Money& price) const {
        return price * quantity.value();
    }

    bool operator==(const Stock& other) const { return symbol_ == other.symbol_; }
    bool operator!=(const Stock& other) const { return !(*this == other); }

private:
    OptionalId id_;
    Symbol symbol_;
    std::string name_;
    std::optional<std::string> industryGroup_;
    std::optional<Grade> grade_;
    std::string notes_;
};

} // namespace stockbook::domain

template <>
struct std::hash<stockbook::domain::Stock> {
    size_t operator()(const stockbook::domain::Stock& stock) const noexcept {
        return std::hash<stockbook::domain::Symbol>{}(stock.symbol());
    }
};
