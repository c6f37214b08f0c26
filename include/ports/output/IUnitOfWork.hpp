#pragma once

#include "IJournalRepository.hpp"
#include "IPortfolioBalanceRepository.hpp"
#include "IPortfolioRepository.hpp"
#include "IStockRepository.hpp"
#include "ITargetRepository.hpp"
#include "ITransactionRepository.hpp"
#include <optional>
#include <string>

namespace stockbook::ports::output {

/**
 * @brief Состояние Unit of Work
 */
enum class UnitOfWorkState {
    IDLE,           ///< Нет открытого scope
    ACTIVE,         ///< Транзакция открыта
    COMMITTED,      ///< Транзакция зафиксирована, scope ещё не закрыт
    ROLLED_BACK     ///< Транзакция откачена, scope ещё не закрыт
};

inline std::string toString(UnitOfWorkState state) {
    switch (state) {
        case UnitOfWorkState::IDLE:        return "IDLE";
        case UnitOfWorkState::ACTIVE:      return "ACTIVE";
        case UnitOfWorkState::COMMITTED:   return "COMMITTED";
        case UnitOfWorkState::ROLLED_BACK: return "ROLLED_BACK";
    }
    return "UNKNOWN";
}

/**
 * @brief Unit of Work: одна транзакция на набор репозиториев
 *
 * Output Port. Использование:
 *   UnitOfWorkScope scope(uow);
 *   uow.stocks().create(stock);
 *   uow.transactions().create(tx);
 *   // выход без исключения → commit, с исключением → rollback
 *
 * Вложенные enter() разделяют внешнюю транзакцию (без savepoint).
 * Ссылки на репозитории действительны только до выхода из scope.
 */
class IUnitOfWork {
public:
    virtual ~IUnitOfWork() = default;

    /**
     * @brief Войти в scope; внешний вход открывает соединение и транзакцию
     */
    virtual void enter() = 0;

    /**
     * @brief Выйти из scope
     *
     * @param failed true если scope покидается из-за ошибки
     * @throws std::logic_error если enter() не вызывался
     */
    virtual void exit(bool failed) = 0;

    /**
     * @brief Зафиксировать транзакцию; повторный вызов — no-op
     */
    virtual void commit() = 0;

    /**
     * @brief Откатить транзакцию; повторный вызов — no-op
     */
    virtual void rollback() = 0;

    virtual UnitOfWorkState state() const = 0;

    /**
     * @brief Итог последнего закрытого scope (COMMITTED / ROLLED_BACK)
     */
    virtual std::optional<UnitOfWorkState> lastOutcome() const = 0;

    virtual int nestingLevel() const = 0;

    virtual IStockRepository& stocks() = 0;
    virtual IPortfolioRepository& portfolios() = 0;
    virtual ITransactionRepository& transactions() = 0;
    virtual ITargetRepository& targets() = 0;
    virtual IPortfolioBalanceRepository& balances() = 0;
    virtual IJournalRepository& journal() = 0;
};

} // namespace stockbook::ports::output
