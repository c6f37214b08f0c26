// src/domain/Decimal.cpp
#include "domain/Decimal.hpp"
#include "domain/exceptions/DomainExceptions.hpp"
#include <cctype>
#include <cstdint>
#include <stdexcept>

namespace stockbook::domain {

namespace {

constexpr NanoInt NANO = Decimal::NANO_FACTOR;
constexpr NanoInt MAX_NANOS = static_cast<NanoInt>(INT64_MAX) * NANO + (NANO - 1);

NanoInt absNano(NanoInt value) {
    return value < 0 ? -value : value;
}

NanoInt pow10(int exponent) {
    NanoInt result = 1;
    for (int i = 0; i < exponent; ++i) {
        result *= 10;
    }
    return result;
}

// Целочисленное деление с округлением ROUND_HALF_UP (половина — от нуля)
NanoInt divideHalfUp(NanoInt numerator, NanoInt denominator) {
    NanoInt quotient = numerator / denominator;
    NanoInt remainder = numerator % denominator;
    if (remainder != 0 && absNano(remainder) * 2 >= absNano(denominator)) {
        quotient += ((numerator < 0) != (denominator < 0)) ? -1 : 1;
    }
    return quotient;
}

std::string_view trim(std::string_view text) {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.remove_suffix(1);
    }
    return text;
}

} // namespace

Decimal::Decimal(int64_t units, int32_t nano) {
    if (nano <= -NANO_FACTOR || nano >= NANO_FACTOR) {
        throw ValidationError("Decimal nano part out of range: " + std::to_string(nano));
    }
    // Нормализация знаков: {1, -500000000} → 0.5
    *this = fromNanos(static_cast<NanoInt>(units) * NANO + nano);
}

Decimal Decimal::fromNanos(NanoInt nanos) {
    if (absNano(nanos) > MAX_NANOS) {
        throw std::overflow_error("Decimal overflow");
    }
    Decimal result;
    result.units_ = static_cast<int64_t>(nanos / NANO);
    result.nano_ = static_cast<int32_t>(nanos % NANO);
    return result;
}

Decimal Decimal::parse(std::string_view text) {
    const std::string original(text);
    text = trim(text);

    bool negative = false;
    if (!text.empty() && (text.front() == '-' || text.front() == '+')) {
        negative = text.front() == '-';
        text.remove_prefix(1);
    }

    NanoInt integerPart = 0;
    NanoInt fraction = 0;
    int fractionDigits = 0;
    int roundingDigit = -1;
    int digitsSeen = 0;
    bool inFraction = false;

    for (char c : text) {
        if (c == '.' && !inFraction) {
            inFraction = true;
            continue;
        }
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            throw ValidationError("Value must be numeric, got '" + original + "'");
        }
        int digit = c - '0';
        ++digitsSeen;
        if (!inFraction) {
            integerPart = integerPart * 10 + digit;
            if (integerPart > INT64_MAX) {
                throw std::overflow_error("Decimal overflow: " + original);
            }
        } else if (fractionDigits < SCALE) {
            fraction = fraction * 10 + digit;
            ++fractionDigits;
        } else if (roundingDigit < 0) {
            roundingDigit = digit;
        }
    }

    if (digitsSeen == 0) {
        throw ValidationError("Value must be numeric, got '" + original + "'");
    }

    NanoInt nanos = integerPart * NANO + fraction * pow10(SCALE - fractionDigits);
    if (roundingDigit >= 5) {
        nanos += 1;
    }
    return fromNanos(negative ? -nanos : nanos);
}

std::string Decimal::toString(int minFractionDigits) const {
    if (minFractionDigits < 0) minFractionDigits = 0;
    if (minFractionDigits > SCALE) minFractionDigits = SCALE;

    std::string result;
    if (isNegative()) {
        result += '-';
    }

    // units_ может быть INT64_MIN только вместе с nano_ == 0
    uint64_t wholePart = units_ < 0 ? static_cast<uint64_t>(-(units_ + 1)) + 1
                                    : static_cast<uint64_t>(units_);
    result += std::to_string(wholePart);

    std::string fractionText = std::to_string(nano_ < 0 ? -nano_ : nano_);
    fractionText.insert(0, static_cast<size_t>(SCALE) - fractionText.size(), '0');
    while (static_cast<int>(fractionText.size()) > minFractionDigits && fractionText.back() == '0') {
        fractionText.pop_back();
    }
    if (!fractionText.empty()) {
        result += '.';
        result += fractionText;
    }
    return result;
}

Decimal Decimal::rounded(int places) const {
    if (places < 0 || places > SCALE) {
        throw ValidationError("Decimal places must be between 0 and 9");
    }
    NanoInt factor = pow10(SCALE - places);
    return fromNanos(divideHalfUp(toNanos(), factor) * factor);
}

Decimal Decimal::truncated(int places) const {
    if (places < 0 || places > SCALE) {
        throw ValidationError("Decimal places must be between 0 and 9");
    }
    NanoInt factor = pow10(SCALE - places);
    return fromNanos(toNanos() / factor * factor);
}

Decimal Decimal::floor() const {
    NanoInt nanos = toNanos();
    NanoInt whole = nanos / NANO;
    if (nanos % NANO != 0 && nanos < 0) {
        whole -= 1;
    }
    return fromNanos(whole * NANO);
}

Decimal Decimal::ceil() const {
    NanoInt nanos = toNanos();
    NanoInt whole = nanos / NANO;
    if (nanos % NANO != 0 && nanos > 0) {
        whole += 1;
    }
    return fromNanos(whole * NANO);
}

Decimal Decimal::operator-() const {
    return fromNanos(-toNanos());
}

Decimal Decimal::operator+(const Decimal& other) const {
    return fromNanos(toNanos() + other.toNanos());
}

Decimal Decimal::operator-(const Decimal& other) const {
    return fromNanos(toNanos() - other.toNanos());
}

Decimal Decimal::operator*(const Decimal& other) const {
    NanoInt product = 0;
    if (__builtin_mul_overflow(toNanos(), other.toNanos(), &product)) {
        throw std::overflow_error("Decimal overflow in multiplication");
    }
    return fromNanos(divideHalfUp(product, NANO));
}

Decimal Decimal::operator/(const Decimal& other) const {
    if (other.isZero()) {
        throw DivisionByZeroError();
    }
    NanoInt numerator = 0;
    if (__builtin_mul_overflow(toNanos(), NANO, &numerator)) {
        throw std::overflow_error("Decimal overflow in division");
    }
    return fromNanos(divideHalfUp(numerator, other.toNanos()));
}

} // namespace stockbook::domain
