#pragma once

#include "domain/exceptions/DomainExceptions.hpp"
#include <string>

namespace stockbook::ports::output {

/**
 * @brief Ошибка хранилища
 *
 * Хранит код результата SQLite (extended result code), если он известен.
 */
class PersistenceError : public domain::StockbookException {
public:
    explicit PersistenceError(const std::string& message, int resultCode = 0)
        : domain::StockbookException(message)
        , resultCode_(resultCode) {}

    int resultCode() const { return resultCode_; }

private:
    int resultCode_;
};

/**
 * @brief Нарушение UNIQUE / PRIMARY KEY при create()
 */
class DuplicateKeyError : public PersistenceError {
public:
    using PersistenceError::PersistenceError;
};

/**
 * @brief Нарушение FOREIGN KEY / CHECK / NOT NULL
 */
class ConstraintViolationError : public PersistenceError {
public:
    using PersistenceError::PersistenceError;
};

/**
 * @brief Сбой BEGIN / COMMIT / ROLLBACK
 */
class TransactionError : public PersistenceError {
public:
    using PersistenceError::PersistenceError;
};

/**
 * @brief Хранилище недоступно (файл не открывается и т.п.)
 */
class ConnectionUnavailableError : public PersistenceError {
public:
    using PersistenceError::PersistenceError;
};

} // namespace stockbook::ports::output
