// src/domain/Money.cpp
#include "domain/Money.hpp"
#include "domain/exceptions/DomainExceptions.hpp"
#include <algorithm>
#include <array>
#include <cctype>

namespace stockbook::domain {

namespace {

constexpr std::array<std::string_view, 5> SUPPORTED_CURRENCIES = {
    "USD", "CAD", "EUR", "GBP", "JPY"
};

const Decimal HUNDRED(100);

} // namespace

Money::Money()
    : amount_()
    , currency_(DEFAULT_CURRENCY) {}

Money::Money(const Decimal& amount, std::string_view currency)
    : amount_(amount.rounded(CURRENCY_PRECISION))
    , currency_(normalizeCurrency(currency)) {}

Money Money::zero(std::string_view currency) {
    return Money(Decimal(0), currency);
}

Money Money::fromCents(int64_t cents, std::string_view currency) {
    return Money(Decimal(cents) / HUNDRED, currency);
}

Money Money::parse(std::string_view text, std::string_view currency) {
    return Money(Decimal::parse(text), currency);
}

Money Money::sum(const std::vector<Money>& values, std::string_view currency) {
    Money total = zero(currency);
    for (const auto& value : values) {
        total.requireSameCurrency(value, "sum");
        total = Money(total.amount_ + value.amount_, total.currency_);
    }
    return total;
}

std::string Money::normalizeCurrency(std::string_view currency) {
    std::string code;
    for (char c : currency) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            code += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        }
    }
    if (!isSupportedCurrency(code)) {
        throw ValidationError("Unsupported currency: '" + std::string(currency) + "'");
    }
    return code;
}

bool Money::isSupportedCurrency(std::string_view currency) {
    return std::find(SUPPORTED_CURRENCIES.begin(), SUPPORTED_CURRENCIES.end(), currency)
        != SUPPORTED_CURRENCIES.end();
}

int64_t Money::toCents() const {
    return (amount_ * HUNDRED).units();
}

void Money::requireSameCurrency(const Money& other, const char* operation) const {
    if (currency_ != other.currency_) {
        throw CurrencyMismatchError(operation, currency_, other.currency_);
    }
}

Money Money::add(const Money& other) const {
    requireSameCurrency(other, "add");
    return Money(amount_ + other.amount_, currency_);
}

Money Money::subtract(const Money& other) const {
    requireSameCurrency(other, "subtract");
    Decimal result = amount_ - other.amount_;
    if (result.isNegative()) {
        throw NegativeResultError("amount");
    }
    return Money(result, currency_);
}

Money Money::difference(const Money& other) const {
    requireSameCurrency(other, "subtract");
    return Money(amount_ - other.amount_, currency_);
}

Money Money::multiply(const Decimal& factor) const {
    return Money(amount_ * factor, currency_);
}

Money Money::divide(const Decimal& divisor) const {
    if (divisor.isZero()) {
        throw DivisionByZeroError();
    }
    return Money(amount_ / divisor, currency_);
}

Money Money::abs() const {
    return Money(amount_.abs(), currency_);
}

Money Money::percentage(const Decimal& percent) const {
    return Money(amount_ * percent / HUNDRED, currency_);
}

Money Money::roundToCurrencyPrecision(int places) const {
    if (places < 0 || places > CURRENCY_PRECISION) {
        throw ValidationError("Currency precision must be between 0 and 2");
    }
    return Money(amount_.rounded(places), currency_);
}

std::vector<Money> Money::allocate(const std::vector<Decimal>& ratios) const {
    std::vector<Money> parts;
    if (ratios.empty()) {
        return parts;
    }

    Decimal totalRatio;
    for (const auto& ratio : ratios) {
        if (ratio.isNegative()) {
            throw ValidationError("Allocation ratios cannot be negative");
        }
        totalRatio = totalRatio + ratio;
    }

    parts.reserve(ratios.size());
    if (totalRatio.isZero()) {
        parts.assign(ratios.size(), zero(currency_));
        return parts;
    }

    Decimal allocated;
    for (size_t i = 0; i + 1 < ratios.size(); ++i) {
        Decimal share = (amount_ * ratios[i] / totalRatio).truncated(CURRENCY_PRECISION);
        parts.emplace_back(share, currency_);
        allocated = allocated + share;
    }
    // Части усечены к нулю, поэтому остаток имеет знак суммы
    parts.emplace_back(amount_ - allocated, currency_);
    return parts;
}

std::string Money::toString() const {
    return amount_.toString(CURRENCY_PRECISION) + " " + currency_;
}

bool Money::operator<(const Money& other) const {
    requireSameCurrency(other, "compare");
    return amount_ < other.amount_;
}

bool Money::operator<=(const Money& other) const {
    requireSameCurrency(other, "compare");
    return amount_ <= other.amount_;
}

bool Money::operator>(const Money& other) const {
    requireSameCurrency(other, "compare");
    return amount_ > other.amount_;
}

bool Money::operator>=(const Money& other) const {
    requireSameCurrency(other, "compare");
    return amount_ >= other.amount_;
}

} // namespace stockbook::domain
