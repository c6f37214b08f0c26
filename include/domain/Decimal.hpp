#pragma once

#include <concepts>
#include <cstdint>
#include <ostream>
#include <string>
#include <string_view>

namespace stockbook::domain {

__extension__ typedef __int128 NanoInt;

/**
 * @brief Точное десятичное число с фиксированной точкой
 *
 * Хранит значение как целую часть (units) и дробную часть в нано-единицах
 * (nano, 10^-9). Знаки units и nano всегда совпадают: -1.5 = {-1, -500000000}.
 * Вся арифметика выполняется в 128-битных целых, без double.
 */
class Decimal {
public:
    static constexpr int SCALE = 9;
    static constexpr int64_t NANO_FACTOR = 1000000000;

    Decimal() = default;

    template <std::integral T>
    Decimal(T units) : units_(static_cast<int64_t>(units)), nano_(0) {}

    // Неявное приведение double → int64 потеряло бы дробь
    template <std::floating_point T>
    Decimal(T) = delete;

    Decimal(int64_t units, int32_t nano);

    /**
     * @brief Разобрать строку вида "-123.45"
     *
     * Пробелы по краям игнорируются. Более 9 знаков после точки
     * округляются ROUND_HALF_UP.
     *
     * @throws ValidationError если строка не является числом
     */
    static Decimal parse(std::string_view text);

    static Decimal fromNanos(NanoInt nanos);

    int64_t units() const { return units_; }
    int32_t nano() const { return nano_; }

    NanoInt toNanos() const {
        return static_cast<NanoInt>(units_) * NANO_FACTOR + nano_;
    }

    double toDouble() const {
        return static_cast<double>(units_) + static_cast<double>(nano_) / 1e9;
    }

    /**
     * @brief Каноническая строка: без лишних нулей, минимум minFractionDigits знаков
     */
    std::string toString(int minFractionDigits = 0) const;

    /**
     * @brief Округление до places знаков, ROUND_HALF_UP (половина — от нуля)
     */
    Decimal rounded(int places) const;

    /**
     * @brief Отбросить знаки после places (округление к нулю)
     */
    Decimal truncated(int places) const;

    Decimal floor() const;
    Decimal ceil() const;

    bool isZero() const { return units_ == 0 && nano_ == 0; }
    bool isPositive() const { return units_ > 0 || nano_ > 0; }
    bool isNegative() const { return units_ < 0 || nano_ < 0; }
    bool isWhole() const { return nano_ == 0; }

    Decimal abs() const { return isNegative() ? -*this : *this; }

    Decimal operator-() const;
    Decimal operator+(const Decimal& other) const;
    Decimal operator-(const Decimal& other) const;
    Decimal operator*(const Decimal& other) const;

    /**
     * @brief Деление с округлением до 9 знаков
     * @throws DivisionByZeroError
     */
    Decimal operator/(const Decimal& other) const;

    bool operator==(const Decimal& other) const {
        return units_ == other.units_ && nano_ == other.nano_;
    }
    bool operator!=(const Decimal& other) const { return !(*this == other); }
    bool operator<(const Decimal& other) const { return toNanos() < other.toNanos(); }
    bool operator<=(const Decimal& other) const { return toNanos() <= other.toNanos(); }
    bool operator>(const Decimal& other) const { return toNanos() > other.toNanos(); }
    bool operator>=(const Decimal& other) const { return toNanos() >= other.toNanos(); }

private:
    int64_t units_ = 0;
    int32_t nano_ = 0;
};

inline std::ostream& operator<<(std::ostream& os, const Decimal& value) {
    return os << value.toString();
}

} // namespace stockbook::domain
