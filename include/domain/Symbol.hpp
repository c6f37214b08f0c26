#pragma once

#include "exceptions/DomainExceptions.hpp"
#include <cctype>
#include <functional>
#include <ostream>
#include <string>
#include <string_view>

namespace stockbook::domain {

/**
 * @brief Тикер бумаги
 *
 * Пробелы по краям отбрасываются, буквы приводятся к верхнему регистру.
 * Допустимы только 1-5 латинских букв.
 */
class Symbol {
public:
    static constexpr size_t MAX_LENGTH = 5;

    /**
     * @throws ValidationError
     */
    explicit Symbol(std::string_view raw)
        : value_(normalize(raw))
    {
        if (value_.empty()) {
            throw ValidationError("Stock symbol cannot be empty");
        }
        if (value_.size() > MAX_LENGTH) {
            throw ValidationError("Stock symbol must be between 1 and 5 characters");
        }
        for (char c : value_) {
            if (c < 'A' || c > 'Z') {
                throw ValidationError("Stock symbol must contain only letters: '" +
                                      std::string(raw) + "'");
            }
        }
    }

    static std::string normalize(std::string_view raw) {
        size_t begin = 0;
        size_t end = raw.size();
        while (begin < end && std::isspace(static_cast<unsigned char>(raw[begin]))) ++begin;
        while (end > begin && std::isspace(static_cast<unsigned char>(raw[end - 1]))) --end;

        std::string result;
        result.reserve(end - begin);
        for (size_t i = begin; i < end; ++i) {
            result += static_cast<char>(std::toupper(static_cast<unsigned char>(raw[i])));
        }
        return result;
    }

    const std::string& value() const { return value_; }

    bool operator==(const Symbol& other) const { return value_ == other.value_; }
    bool operator!=(const Symbol& other) const { return value_ != other.value_; }
    bool operator<(const Symbol& other) const { return value_ < other.value_; }

private:
    std::string value_;
};

inline std::ostream& operator<<(std::ostream& os, const Symbol& symbol) {
    return os << symbol.value();
}

} // namespace stockbook::domain

template <>
struct std::hash<stockbook::domain::Symbol> {
    size_t operator()(const stockbook::domain::Symbol& symbol) const noexcept {
        return std::hash<std::string>{}(symbol.value());
    }
};
