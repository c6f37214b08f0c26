#pragma once

#include "Decimal.hpp"
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace stockbook::domain {

/**
 * @brief Денежная сумма с валютой
 *
 * Неизменяемый value object. Сумма всегда округлена до 0.01 (ROUND_HALF_UP),
 * валюта — трёхбуквенный код из разрешённого списка (USD, CAD, EUR, GBP, JPY).
 * Арифметика между разными валютами запрещена.
 */
class Money {
public:
    static constexpr int CURRENCY_PRECISION = 2;
    static constexpr const char* DEFAULT_CURRENCY = "USD";

    Money();

    /**
     * @throws ValidationError если валюта не поддерживается
     */
    explicit Money(const Decimal& amount, std::string_view currency = DEFAULT_CURRENCY);

    static Money zero(std::string_view currency = DEFAULT_CURRENCY);
    static Money fromCents(int64_t cents, std::string_view currency = DEFAULT_CURRENCY);

    /**
     * @brief Разобрать сумму из строки ("125.5" → 125.50)
     * @throws ValidationError
     */
    static Money parse(std::string_view text, std::string_view currency = DEFAULT_CURRENCY);

    /**
     * @brief Сумма списка; пустой список даёт ноль в указанной валюте
     * @throws CurrencyMismatchError если в списке разные валюты
     */
    static Money sum(const std::vector<Money>& values, std::string_view currency = DEFAULT_CURRENCY);

    /**
     * @brief Проверить и нормализовать код валюты (trim + upper)
     * @throws ValidationError
     */
    static std::string normalizeCurrency(std::string_view currency);

    static bool isSupportedCurrency(std::string_view currency);

    const Decimal& amount() const { return amount_; }
    const std::string& currency() const { return currency_; }
    int64_t toCents() const;

    Money add(const Money& other) const;

    /**
     * @throws CurrencyMismatchError
     * @throws NegativeResultError если результат меньше нуля
     */
    Money subtract(const Money& other) const;

    /**
     * @brief Знаковая разность (для отчётов: чистый поток средств и т.п.)
     */
    Money difference(const Money& other) const;

    Money multiply(const Decimal& factor) const;

    /**
     * @throws DivisionByZeroError
     */
    Money divide(const Decimal& divisor) const;

    Money abs() const;

    /**
     * @brief p процентов от суммы: amount * p / 100
     */
    Money percentage(const Decimal& percent) const;

    /**
     * @brief Округлить до places знаков (0..2)
     */
    Money roundToCurrencyPrecision(int places = CURRENCY_PRECISION) const;

    /**
     * @brief Распределить сумму пропорционально ratios
     *
     * Все части, кроме последней, усекаются до 0.01 к нулю; последняя получает
     * точный остаток того же знака, что и сумма, поэтому сумма частей всегда
     * равна исходной.
     * Пустой список → пустой результат; сумма ratios == 0 → нулевые части.
     *
     * @throws ValidationError при отрицательном ratio
     */
    std::vector<Money> allocate(const std::vector<Decimal>& ratios) const;

    bool isZero() const { return amount_.isZero(); }
    bool isPositive() const { return amount_.isPositive(); }
    bool isNegative() const { return amount_.isNegative(); }

    /**
     * @brief "125.50 USD"
     */
    std::string toString() const;

    Money operator+(const Money& other) const { return add(other); }
    Money operator-(const Money& other) const { return subtract(other); }
    Money operator*(const Decimal& factor) const { return multiply(factor); }
    Money operator/(const Decimal& divisor) const { return divide(divisor); }

    bool operator==(const Money& other) const {
        return amount_ == other.amount_ && currency_ == other.currency_;
    }
    bool operator!=(const Money& other) const { return !(*this == other); }

    // Сравнение по величине требует одной валюты (CurrencyMismatchError)
    bool operator<(const Money& other) const;
    bool operator<=(const Money& other) const;
    bool operator>(const Money& other) const;
    bool operator>=(const Money& other) const;

private:
    void requireSameCurrency(const Money& other, const char* operation) const;

    Decimal amount_;
    std::string currency_;
};

inline std::ostream& operator<<(std::ostream& os, const Money& money) {
    return os << money.toString();
}

} // namespace stockbook::domain
