#pragma once

#include "IDatabaseConnection.hpp"
#include "SqliteUnitOfWork.hpp"
#include "ports/output/IUnitOfWorkFactory.hpp"
#include "settings/BusinessRules.hpp"
#include <memory>
#include <stdexcept>

namespace stockbook::adapters::secondary {

/**
 * @brief Фабрика SqliteUnitOfWork
 *
 * Создаётся один раз при старте: применяет миграции схемы и раздаёт
 * новые Unit of Work поверх общего соединения и правил.
 */
class SqliteUnitOfWorkFactory : public ports::output::IUnitOfWorkFactory {
public:
    SqliteUnitOfWorkFactory(
        std::shared_ptr<IDatabaseConnection> connection,
        std::shared_ptr<const settings::BusinessRules> rules
    ) : connection_(std::move(connection))
      , rules_(std::move(rules))
    {
        if (!connection_ || !rules_) {
            throw std::invalid_argument("SqliteUnitOfWorkFactory requires a connection and business rules");
        }
        connection_->initializeSchema();
    }

    std::unique_ptr<ports::output::IUnitOfWork> create() override {
        return std::make_unique<SqliteUnitOfWork>(connection_, rules_);
    }

private:
    std::shared_ptr<IDatabaseConnection> connection_;
    std::shared_ptr<const settings::BusinessRules> rules_;
};

} // namespace stockbook::adapters::secondary
