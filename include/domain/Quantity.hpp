#pragma once

#include "Decimal.hpp"
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace stockbook::domain {

/**
 * @brief Количество бумаг
 *
 * Неизменяемый value object. По умолчанию не может быть отрицательным;
 * allowNegative включается только для корректирующих записей и
 * наследуется результатами арифметики.
 */
class Quantity {
public:
    static constexpr int SPLIT_PRECISION = 2;

    Quantity() = default;

    /**
     * @throws ValidationError если значение отрицательное и allowNegative == false
     */
    explicit Quantity(const Decimal& value, bool allowNegative = false);

    static Quantity of(int64_t shares) { return Quantity(Decimal(shares)); }
    static Quantity zero() { return Quantity(); }

    /**
     * @throws ValidationError
     */
    static Quantity parse(std::string_view text, bool allowNegative = false);

    static Quantity sum(const std::vector<Quantity>& values, bool allowNegative = false);

    const Decimal& value() const { return value_; }
    bool allowsNegative() const { return allowNegative_; }

    Quantity add(const Quantity& other) const;

    /**
     * @throws NegativeResultError если остаток ушёл бы ниже нуля
     */
    Quantity subtract(const Quantity& other) const;

    Quantity multiply(const Decimal& factor) const;

    /**
     * @brief Деление с дробным результатом
     * @throws DivisionByZeroError
     */
    Quantity divide(const Decimal& divisor) const;

    /**
     * @brief Деление на целое число лотов, результат обязан быть целым
     * @throws ValidationError если результат дробный
     * @throws DivisionByZeroError
     */
    Quantity divideWhole(int64_t divisor) const;

    /**
     * @throws ValidationError если отрицательные значения не разрешены
     */
    Quantity negate() const;

    Quantity abs() const;
    Quantity round(int places = 0) const;
    Quantity floor() const;
    Quantity ceiling() const;

    /**
     * @brief Разбить на n частей, сумма частей равна исходному количеству
     *
     * Каждая часть кроме последней — value / n, усечённое до 0.01,
     * последняя получает остаток и не бывает отрицательной.
     *
     * @throws ValidationError если n <= 0
     */
    std::vector<Quantity> split(int parts) const;

    /**
     * @brief Распределить пропорционально ratios (правило остатка как в split)
     */
    std::vector<Quantity> distributeByRatio(const std::vector<Decimal>& ratios) const;

    /**
     * @brief Доля от total в процентах; для нулевого total — 0
     */
    Decimal percentageOf(const Quantity& total) const;

    bool isZero() const { return value_.isZero(); }
    bool isPositive() const { return value_.isPositive(); }
    bool isNegative() const { return value_.isNegative(); }
    bool isWhole() const { return value_.isWhole(); }

    std::string toString() const { return value_.toString(); }

    Quantity operator+(const Quantity& other) const { return add(other); }
    Quantity operator-(const Quantity& other) const { return subtract(other); }
    Quantity operator*(const Decimal& factor) const { return multiply(factor); }
    Quantity operator/(const Decimal& divisor) const { return divide(divisor); }
    Quantity operator-() const { return negate(); }

    bool operator==(const Quantity& other) const { return value_ == other.value_; }
    bool operator!=(const Quantity& other) const { return !(*this == other); }
    bool operator<(const Quantity& other) const { return value_ < other.value_; }
    bool operator<=(const Quantity& other) const { return value_ <= other.value_; }
    bool operator>(const Quantity& other) const { return value_ > other.value_; }
    bool operator>=(const Quantity& other) const { return value_ >= other.value_; }

private:
    Decimal value_;
    bool allowNegative_ = false;
};

inline std::ostream& operator<<(std::ostream& os, const Quantity& quantity) {
    return os << quantity.toString();
}

} // namespace stockbook::domain
