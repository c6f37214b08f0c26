// src/adapters/secondary/persistence/SqliteUnitOfWork.cpp
#include "adapters/secondary/persistence/SqliteUnitOfWork.hpp"
#include "ports/output/PersistenceErrors.hpp"
#include <iostream>
#include <stdexcept>

namespace stockbook::adapters::secondary {

using ports::output::UnitOfWorkState;

SqliteUnitOfWork::SqliteUnitOfWork(
    std::shared_ptr<IDatabaseConnection> connection,
    std::shared_ptr<const settings::BusinessRules> rules
) : connection_(std::move(connection))
  , rules_(std::move(rules))
{
    if (!connection_ || !rules_) {
        throw std::invalid_argument("SqliteUnitOfWork requires a connection and business rules");
    }
}

SqliteUnitOfWork::~SqliteUnitOfWork() {
    if (state_ == UnitOfWorkState::ACTIVE && session_) {
        std::cerr << "[SqliteUnitOfWork] Destroyed inside an open scope, rolling back" << std::endl;
        try {
            session_->rollback();
        } catch (const std::exception& e) {
            std::cerr << "[SqliteUnitOfWork] Rollback failed: " << e.what() << std::endl;
        }
    }
}

void SqliteUnitOfWork::enter() {
    if (nesting_ == 0) {
        auto session = connection_->acquire();
        session->begin();

        session_ = std::move(session);
        transactional_ = std::make_shared<TransactionalDatabaseConnection>(session_);
        rollbackOnly_ = false;
        state_ = UnitOfWorkState::ACTIVE;
        clearRepositories();
    }
    ++nesting_;
}

void SqliteUnitOfWork::exit(bool failed) {
    if (nesting_ == 0) {
        throw std::logic_error("SqliteUnitOfWork::exit() called without matching enter()");
    }
    if (failed) {
        rollbackOnly_ = true;
    }
    if (--nesting_ > 0) {
        return;
    }

    try {
        if (state_ == UnitOfWorkState::ACTIVE) {
            if (rollbackOnly_) {
                rollback();
            } else {
                commit();
            }
        }
    } catch (...) {
        release();
        throw;
    }
    release();
}

void SqliteUnitOfWork::commit() {
    if (state_ != UnitOfWorkState::ACTIVE) {
        return;
    }
    if (rollbackOnly_) {
        rollback();
        throw ports::output::TransactionError(
            "Transaction was marked rollback-only by a failed nested scope");
    }
    try {
        session_->commit();
    } catch (const std::exception& e) {
        std::cerr << "[SqliteUnitOfWork] Commit failed: " << e.what() << std::endl;
        state_ = UnitOfWorkState::ROLLED_BACK;
        try {
            session_->rollback();
        } catch (const std::exception& rollbackError) {
            std::cerr << "[SqliteUnitOfWork] Rollback after failed commit failed: "
                      << rollbackError.what() << std::endl;
        }
        throw;
    }
    state_ = UnitOfWorkState::COMMITTED;
    std::cout << "[SqliteUnitOfWork] Committed" << std::endl;
}

void SqliteUnitOfWork::rollback() {
    if (state_ != UnitOfWorkState::ACTIVE) {
        return;
    }
    // Статус меняется до ROLLBACK: при сбое SQLite всё равно откатит
    // транзакцию при закрытии сессии
    state_ = UnitOfWorkState::ROLLED_BACK;
    session_->rollback();
    std::cout << "[SqliteUnitOfWork] Rolled back" << std::endl;
}

void SqliteUnitOfWork::release() {
    lastOutcome_ = state_ == UnitOfWorkState::COMMITTED ? UnitOfWorkState::COMMITTED
                                                        : UnitOfWorkState::ROLLED_BACK;
    clearRepositories();
    transactional_.reset();
    session_.reset();
    rollbackOnly_ = false;
    state_ = UnitOfWorkState::IDLE;
}

void SqliteUnitOfWork::clearRepositories() {
    stocks_.reset();
    portfolios_.reset();
    transactions_.reset();
    targets_.reset();
    balances_.reset();
    journal_.reset();
}

std::shared_ptr<IDatabaseConnection> SqliteUnitOfWork::boundConnection() const {
    if (nesting_ > 0 && transactional_) {
        return transactional_;
    }
    return connection_;
}

ports::output::IStockRepository& SqliteUnitOfWork::stocks() {
    if (!stocks_) {
        stocks_ = std::make_unique<SqliteStockRepository>(boundConnection());
    }
    return *stocks_;
}

ports::output::IPortfolioRepository& SqliteUnitOfWork::portfolios() {
    if (!portfolios_) {
        portfolios_ = std::make_unique<SqlitePortfolioRepository>(boundConnection(), rules_);
    }
    return *portfolios_;
}

ports::output::ITransactionRepository& SqliteUnitOfWork::transactions() {
    if (!transactions_) {
        transactions_ = std::make_unique<SqliteTransactionRepository>(boundConnection(), rules_);
    }
    return *transactions_;
}

ports::output::ITargetRepository& SqliteUnitOfWork::targets() {
    if (!targets_) {
        targets_ = std::make_unique<SqliteTargetRepository>(boundConnection(), rules_);
    }
    return *targets_;
}

ports::output::IPortfolioBalanceRepository& SqliteUnitOfWork::balances() {
    if (!balances_) {
        balances_ = std::make_unique<SqlitePortfolioBalanceRepository>(boundConnection(), rules_);
    }
    return *balances_;
}

ports::output::IJournalRepository& SqliteUnitOfWork::journal() {
    if (!journal_) {
        journal_ = std::make_unique<SqliteJournalRepository>(boundConnection());
    }
    return *journal_;
}

} // namespace stockbook::adapters::secondary
