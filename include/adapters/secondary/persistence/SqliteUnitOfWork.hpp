#pragma once

#include "IDatabaseConnection.hpp"
#include "SqliteJournalRepository.hpp"
#include "SqlitePortfolioBalanceRepository.hpp"
#include "SqlitePortfolioRepository.hpp"
#include "SqliteStockRepository.hpp"
#include "SqliteTargetRepository.hpp"
#include "SqliteTransactionRepository.hpp"
#include "TransactionalDatabaseConnection.hpp"
#include "ports/output/IUnitOfWork.hpp"
#include "settings/BusinessRules.hpp"
#include <memory>

namespace stockbook::adapters::secondary {

/**
 * @brief Unit of Work поверх SQLite
 *
 * Внешний enter() берёт одну сессию у соединения и открывает транзакцию.
 * Репозитории создаются лениво и кешируются до выхода из scope; все они
 * работают через один TransactionalDatabaseConnection.
 *
 * Вне scope репозитории привязаны к исходному соединению и каждая запись
 * выполняется в своей короткой транзакции.
 *
 * Вложенный выход с ошибкой помечает транзакцию rollback-only: внешний
 * выход откатит её, даже если исключение было перехвачено.
 *
 * Экземпляр не потокобезопасен: один Unit of Work на логическую транзакцию.
 */
class SqliteUnitOfWork : public ports::output::IUnitOfWork {
public:
    SqliteUnitOfWork(
        std::shared_ptr<IDatabaseConnection> connection,
        std::shared_ptr<const settings::BusinessRules> rules
    );

    ~SqliteUnitOfWork() override;

    SqliteUnitOfWork(const SqliteUnitOfWork&) = delete;
    SqliteUnitOfWork& operator=(const SqliteUnitOfWork&) = delete;

    void enter() override;
    void exit(bool failed) override;

    /**
     * @throws TransactionError если транзакция помечена rollback-only
     *         (транзакция при этом откатывается) или COMMIT не прошёл
     */
    void commit() override;
    void rollback() override;

    ports::output::UnitOfWorkState state() const override { return state_; }
    std::optional<ports::output::UnitOfWorkState> lastOutcome() const override { return lastOutcome_; }
    int nestingLevel() const override { return nesting_; }

    ports::output::IStockRepository& stocks() override;
    ports::output::IPortfolioRepository& portfolios() override;
    ports::output::ITransactionRepository& transactions() override;
    ports::output::ITargetRepository& targets() override;
    ports::output::IPortfolioBalanceRepository& balances() override;
    ports::output::IJournalRepository& journal() override;

private:
    /**
     * @brief Соединение для новых репозиториев: транзакционное внутри scope
     */
    std::shared_ptr<IDatabaseConnection> boundConnection() const;

    void clearRepositories();
    void release();

    std::shared_ptr<IDatabaseConnection> connection_;
    std::shared_ptr<const settings::BusinessRules> rules_;

    std::shared_ptr<SqliteSession> session_;
    std::shared_ptr<TransactionalDatabaseConnection> transactional_;

    int nesting_ = 0;
    bool rollbackOnly_ = false;
    ports::output::UnitOfWorkState state_ = ports::output::UnitOfWorkState::IDLE;
    std::optional<ports::output::UnitOfWorkState> lastOutcome_;

    std::unique_ptr<SqliteStockRepository> stocks_;
    std::unique_ptr<SqlitePortfolioRepository> portfolios_;
    std::unique_ptr<SqliteTransactionRepository> transactions_;
    std::unique_ptr<SqliteTargetRepository> targets_;
    std::unique_ptr<SqlitePortfolioBalanceRepository> balances_;
    std::unique_ptr<SqliteJournalRepository> journal_;
};

} // namespace stockbook::adapters::secondary
