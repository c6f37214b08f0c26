#pragma once

#include <chrono>
#include <ostream>
#include <string>
#include <string_view>

namespace stockbook::domain {

/**
 * @brief Календарная дата без времени (YYYY-MM-DD)
 *
 * В БД хранится ISO-строкой, поэтому лексикографический порядок
 * совпадает с хронологическим.
 */
class Date {
public:
    Date() = default;

    /**
     * @throws ValidationError если дата не существует (2024-02-30)
     */
    Date(int year, unsigned month, unsigned day);

    explicit Date(std::chrono::year_month_day ymd);

    /**
     * @brief Текущая дата в локальной временной зоне
     */
    static Date today();

    /**
     * @brief Разобрать "2024-03-15"
     * @throws ValidationError
     */
    static Date parse(std::string_view text);

    int year() const { return static_cast<int>(ymd_.year()); }
    unsigned month() const { return static_cast<unsigned>(ymd_.month()); }
    unsigned day() const { return static_cast<unsigned>(ymd_.day()); }

    Date addDays(int days) const;

    std::string toString() const;

    bool operator==(const Date& other) const { return ymd_ == other.ymd_; }
    bool operator!=(const Date& other) const { return !(*this == other); }
    bool operator<(const Date& other) const { return ymd_ < other.ymd_; }
    bool operator<=(const Date& other) const { return ymd_ <= other.ymd_; }
    bool operator>(const Date& other) const { return ymd_ > other.ymd_; }
    bool operator>=(const Date& other) const { return ymd_ >= other.ymd_; }

private:
    std::chrono::year_month_day ymd_{std::chrono::year{1970}, std::chrono::January, std::chrono::day{1}};
};

inline std::ostream& operator<<(std::ostream& os, const Date& date) {
    return os << date.toString();
}

} // namespace stockbook::domain
