// src/domain/Date.cpp
#include "domain/Date.hpp"
#include "domain/exceptions/DomainExceptions.hpp"
#include <cctype>
#include <cstdio>
#include <ctime>
#include <stdexcept>

namespace stockbook::domain {

namespace {

bool parseNumber(std::string_view text, int& out) {
    if (text.empty()) return false;
    int value = 0;
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
        value = value * 10 + (c - '0');
    }
    out = value;
    return true;
}

} // namespace

Date::Date(int year, unsigned month, unsigned day)
    : ymd_(std::chrono::year{year}, std::chrono::month{month}, std::chrono::day{day})
{
    if (!ymd_.ok()) {
        throw ValidationError("Invalid date: " + std::to_string(year) + "-" +
                              std::to_string(month) + "-" + std::to_string(day));
    }
}

Date::Date(std::chrono::year_month_day ymd)
    : ymd_(ymd)
{
    if (!ymd_.ok()) {
        throw ValidationError("Invalid date");
    }
}

Date Date::today() {
    // Календарная дата в локальной зоне: сделка "сегодня" не должна
    // оказаться в будущем около полуночи
    std::time_t now = std::time(nullptr);
    std::tm local{};
    if (localtime_r(&now, &local) == nullptr) {
        throw std::runtime_error("Cannot determine local date");
    }
    return Date(local.tm_year + 1900,
                static_cast<unsigned>(local.tm_mon + 1),
                static_cast<unsigned>(local.tm_mday));
}

Date Date::parse(std::string_view text) {
    // YYYY-MM-DD, остальное (время у TIMESTAMP) не допускается
    int year = 0;
    int month = 0;
    int day = 0;
    if (text.size() != 10 || text[4] != '-' || text[7] != '-' ||
        !parseNumber(text.substr(0, 4), year) ||
        !parseNumber(text.substr(5, 2), month) ||
        !parseNumber(text.substr(8, 2), day)) {
        throw ValidationError("Invalid date format, expected YYYY-MM-DD: '" +
                              std::string(text) + "'");
    }
    return Date(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
}

Date Date::addDays(int days) const {
    std::chrono::sys_days base{ymd_};
    return Date(std::chrono::year_month_day{base + std::chrono::days{days}});
}

std::string Date::toString() const {
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02u-%02u", year(), month(), day());
    return buffer;
}

} // namespace stockbook::domain
