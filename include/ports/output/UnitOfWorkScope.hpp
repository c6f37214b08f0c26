#pragma once

#include "IUnitOfWork.hpp"
#include <exception>
#include <iostream>
#include <optional>
#include <type_traits>
#include <utility>

namespace stockbook::ports::output {

/**
 * @brief RAII-scope для IUnitOfWork
 *
 * Конструктор вызывает enter(), деструктор — exit(). Выход считается
 * неудачным, если scope покидается из-за исключения.
 */
class UnitOfWorkScope {
public:
    explicit UnitOfWorkScope(IUnitOfWork& uow)
        : uow_(uow)
        , uncaughtOnEnter_(std::uncaught_exceptions())
    {
        uow_.enter();
    }

    // Ошибка commit при нормальном выходе пробрасывается из деструктора
    ~UnitOfWorkScope() noexcept(false) {
        if (std::uncaught_exceptions() > uncaughtOnEnter_) {
            try {
                uow_.exit(true);
            } catch (const std::exception& e) {
                std::cerr << "[UnitOfWorkScope] Rollback failed while unwinding: "
                          << e.what() << std::endl;
            }
            return;
        }
        uow_.exit(false);
    }

    UnitOfWorkScope(const UnitOfWorkScope&) = delete;
    UnitOfWorkScope& operator=(const UnitOfWorkScope&) = delete;

    IUnitOfWork& operator*() const { return uow_; }
    IUnitOfWork* operator->() const { return &uow_; }

private:
    IUnitOfWork& uow_;
    int uncaughtOnEnter_;
};

/**
 * @brief Выполнить work(uow) в одном scope
 *
 * При исключении транзакция откатывается и исключение пробрасывается дальше
 * без изменений.
 */
template <typename Work>
auto runInUnitOfWork(IUnitOfWork& uow, Work&& work) -> std::invoke_result_t<Work, IUnitOfWork&> {
    using Result = std::invoke_result_t<Work, IUnitOfWork&>;

    auto exitAfterFailure = [&uow]() {
        try {
            uow.exit(true);
        } catch (const std::exception& e) {
            std::cerr << "[UnitOfWork] Rollback failed: " << e.what() << std::endl;
        }
    };

    uow.enter();
    if constexpr (std::is_void_v<Result>) {
        try {
            std::forward<Work>(work)(uow);
        } catch (...) {
            exitAfterFailure();
            throw;
        }
        uow.exit(false);
    } else {
        std::optional<Result> result;
        try {
            result.emplace(std::forward<Work>(work)(uow));
        } catch (...) {
            exitAfterFailure();
            throw;
        }
        uow.exit(false);
        return std::move(*result);
    }
}

} // namespace stockbook::ports::output
