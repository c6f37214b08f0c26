#pragma once

#include "SqliteSession.hpp"
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace stockbook::adapters::secondary {

/**
 * @brief Построитель WHERE из необязательных критериев фильтра
 *
 * Условия объединяются через AND, значения биндятся параметрами.
 */
class SqlFilter {
public:
    using Param = std::variant<int64_t, std::string>;

    SqlFilter& equals(const std::string& column, Param value) {
        conditions_.push_back(column + " = ?");
        params_.push_back(std::move(value));
        return *this;
    }

    SqlFilter& atLeast(const std::string& column, Param value) {
        conditions_.push_back(column + " >= ?");
        params_.push_back(std::move(value));
        return *this;
    }

    SqlFilter& atMost(const std::string& column, Param value) {
        conditions_.push_back(column + " <= ?");
        params_.push_back(std::move(value));
        return *this;
    }

    /**
     * @brief Подстрока без учёта регистра (LIKE, ASCII)
     */
    SqlFilter& contains(const std::string& column, const std::string& text) {
        return containsAny({column}, text);
    }

    /**
     * @brief Подстрока хотя бы в одной из колонок
     */
    SqlFilter& containsAny(const std::vector<std::string>& columns, const std::string& text) {
        std::string condition;
        for (const auto& column : columns) {
            if (!condition.empty()) condition += " OR ";
            condition += column + " LIKE ? ESCAPE '\\'";
            params_.push_back(likePattern(text));
        }
        conditions_.push_back(columns.size() > 1 ? "(" + condition + ")" : condition);
        return *this;
    }

    /**
     * @brief " WHERE a AND b" или пустая строка
     */
    std::string clause() const {
        std::string sql;
        for (const auto& condition : conditions_) {
            sql += sql.empty() ? " WHERE " : " AND ";
            sql += condition;
        }
        return sql;
    }

    /**
     * @return индекс следующего свободного параметра
     */
    int bind(SqliteStatement& stmt, int firstIndex = 1) const {
        int index = firstIndex;
        for (const auto& param : params_) {
            std::visit([&](const auto& value) { stmt.bind(index, value); }, param);
            ++index;
        }
        return index;
    }

    static std::string likePattern(const std::string& text) {
        std::string pattern = "%";
        for (char c : text) {
            if (c == '%' || c == '_' || c == '\\') pattern += '\\';
            pattern += c;
        }
        pattern += '%';
        return pattern;
    }

private:
    std::vector<std::string> conditions_;
    std::vector<Param> params_;
};

} // namespace stockbook::adapters::secondary
