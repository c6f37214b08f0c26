#pragma once

#include "IDatabaseConnection.hpp"
#include <memory>
#include <stdexcept>

namespace stockbook::adapters::secondary {

/**
 * @brief Сессия, привязанная к открытой транзакции Unit of Work
 *
 * Все репозитории внутри одного scope получают один экземпляр.
 * Транзакцией управляет только SqliteUnitOfWork.
 */
class TransactionalDatabaseConnection : public IDatabaseConnection {
public:
    explicit TransactionalDatabaseConnection(std::shared_ptr<SqliteSession> session)
        : session_(std::move(session)) {}

    std::shared_ptr<SqliteSession> acquire() override {
        return session_;
    }

    void withinTransaction(const std::function<void(SqliteSession&)>& work) override {
        work(*session_);
    }

    bool isTransactional() const override { return true; }

    void initializeSchema() override {
        throw std::logic_error("Schema migrations cannot run inside a unit of work");
    }

private:
    std::shared_ptr<SqliteSession> session_;
};

} // namespace stockbook::adapters::secondary
