#pragma once

#include <stdexcept>
#include <string>

namespace stockbook::domain {

/**
 * @brief Базовое исключение библиотеки
 */
class StockbookException : public std::runtime_error {
public:
    explicit StockbookException(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Некорректные входные данные
 *
 * Бросается при создании value object / сущности, до любого обращения к БД.
 */
class ValidationError : public StockbookException {
public:
    explicit ValidationError(const std::string& message)
        : StockbookException(message) {}
};

/**
 * @brief Операция над суммами в разных валютах
 */
class CurrencyMismatchError : public ValidationError {
public:
    CurrencyMismatchError(const std::string& operation,
                          const std::string& left,
                          const std::string& right)
        : ValidationError("Cannot " + operation + " money with different currencies: " +
                          left + " and " + right)
        , left_(left)
        , right_(right) {}

    const std::string& left() const { return left_; }
    const std::string& right() const { return right_; }

private:
    std::string left_;
    std::string right_;
};

/**
 * @brief Деление на ноль
 */
class DivisionByZeroError : public ValidationError {
public:
    DivisionByZeroError()
        : ValidationError("Cannot divide by zero") {}
};

/**
 * @brief Результат вычитания ушёл бы ниже нуля
 */
class NegativeResultError : public ValidationError {
public:
    explicit NegativeResultError(const std::string& what)
        : ValidationError("Resulting " + what + " cannot be negative") {}
};

/**
 * @brief Расчёт по портфелю невозможен (например, нет цены по бумаге)
 */
class CalculationError : public StockbookException {
public:
    CalculationError(const std::string& message, const std::string& operation)
        : StockbookException(message)
        , operation_(operation) {}

    const std::string& operation() const { return operation_; }

private:
    std::string operation_;
};

} // namespace stockbook::domain
