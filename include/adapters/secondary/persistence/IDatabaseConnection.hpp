#pragma once

#include "SqliteSession.hpp"
#include <functional>
#include <memory>

namespace stockbook::adapters::secondary {

/**
 * @brief Интерфейс соединения, которым пользуются репозитории
 *
 * Две реализации:
 * - DatabaseConnection — самостоятельное соединение, каждая запись
 *   идёт в собственной короткой транзакции;
 * - TransactionalDatabaseConnection — сессия, уже находящаяся в
 *   транзакции Unit of Work; commit/rollback не выполняет.
 */
class IDatabaseConnection {
public:
    virtual ~IDatabaseConnection() = default;

    /**
     * @brief Получить сессию с применёнными PRAGMA
     * @throws ConnectionUnavailableError
     */
    virtual std::shared_ptr<SqliteSession> acquire() = 0;

    /**
     * @brief Выполнить work в транзакции
     *
     * Для самостоятельного соединения: BEGIN, work, COMMIT либо ROLLBACK
     * с пробросом исключения. Для транзакционного: просто вызвать work.
     */
    virtual void withinTransaction(const std::function<void(SqliteSession&)>& work) = 0;

    virtual bool isTransactional() const = 0;

    /**
     * @brief Применить миграции схемы (идемпотентно)
     */
    virtual void initializeSchema() = 0;
};

} // namespace stockbook::adapters::secondary
