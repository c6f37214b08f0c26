// src/domain/Quantity.cpp
#include "domain/Quantity.hpp"
#include "domain/exceptions/DomainExceptions.hpp"

namespace stockbook::domain {

Quantity::Quantity(const Decimal& value, bool allowNegative)
    : value_(value)
    , allowNegative_(allowNegative)
{
    if (!allowNegative_ && value_.isNegative()) {
        throw ValidationError("Quantity cannot be negative");
    }
}

Quantity Quantity::parse(std::string_view text, bool allowNegative) {
    return Quantity(Decimal::parse(text), allowNegative);
}

Quantity Quantity::sum(const std::vector<Quantity>& values, bool allowNegative) {
    Decimal total;
    for (const auto& value : values) {
        total = total + value.value_;
    }
    return Quantity(total, allowNegative);
}

Quantity Quantity::add(const Quantity& other) const {
    return Quantity(value_ + other.value_, allowNegative_);
}

Quantity Quantity::subtract(const Quantity& other) const {
    Decimal result = value_ - other.value_;
    if (!allowNegative_ && result.isNegative()) {
        throw NegativeResultError("quantity");
    }
    return Quantity(result, allowNegative_);
}

Quantity Quantity::multiply(const Decimal& factor) const {
    return Quantity(value_ * factor, allowNegative_);
}

Quantity Quantity::divide(const Decimal& divisor) const {
    if (divisor.isZero()) {
        throw DivisionByZeroError();
    }
    return Quantity(value_ / divisor, allowNegative_);
}

Quantity Quantity::divideWhole(int64_t divisor) const {
    Quantity result = divide(Decimal(divisor));
    if (!result.isWhole()) {
        throw ValidationError("Dividing " + value_.toString() + " by " +
                              std::to_string(divisor) + " does not give a whole number of units");
    }
    return result;
}

Quantity Quantity::negate() const {
    if (!allowNegative_) {
        throw ValidationError("Negation would result in negative quantity");
    }
    return Quantity(-value_, true);
}

Quantity Quantity::abs() const {
    return Quantity(value_.abs(), allowNegative_);
}

Quantity Quantity::round(int places) const {
    return Quantity(value_.rounded(places), allowNegative_);
}

Quantity Quantity::floor() const {
    return Quantity(value_.floor(), allowNegative_);
}

Quantity Quantity::ceiling() const {
    return Quantity(value_.ceil(), allowNegative_);
}

std::vector<Quantity> Quantity::split(int parts) const {
    if (parts <= 0) {
        throw ValidationError("Number of parts must be positive");
    }
    if (parts == 1) {
        return {*this};
    }

    Decimal base = (value_ / Decimal(parts)).truncated(SPLIT_PRECISION);

    std::vector<Quantity> result;
    result.reserve(static_cast<size_t>(parts));
    Decimal allocated;
    for (int i = 0; i < parts - 1; ++i) {
        result.emplace_back(base, allowNegative_);
        allocated = allocated + base;
    }
    result.emplace_back(value_ - allocated, allowNegative_);
    return result;
}

std::vector<Quantity> Quantity::distributeByRatio(const std::vector<Decimal>& ratios) const {
    std::vector<Quantity> result;
    if (ratios.empty()) {
        return result;
    }

    Decimal totalRatio;
    for (const auto& ratio : ratios) {
        if (ratio.isNegative()) {
            throw ValidationError("Distribution ratios cannot be negative");
        }
        totalRatio = totalRatio + ratio;
    }

    result.reserve(ratios.size());
    if (totalRatio.isZero()) {
        result.assign(ratios.size(), zero());
        return result;
    }

    Decimal remaining = value_;
    for (size_t i = 0; i + 1 < ratios.size(); ++i) {
        Decimal portion = (value_ * ratios[i] / totalRatio).truncated(SPLIT_PRECISION);
        result.emplace_back(portion, allowNegative_);
        remaining = remaining - portion;
    }
    result.emplace_back(remaining, allowNegative_);
    return result;
}

Decimal Quantity::percentageOf(const Quantity& total) const {
    if (total.isZero()) {
        return Decimal(0);
    }
    return value_ / total.value_ * Decimal(100);
}

} // namespace stockbook::domain
