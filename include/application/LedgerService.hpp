#pragma once

#include "domain/JournalEntry.hpp"
#include "domain/Position.hpp"
#include "domain/Symbol.hpp"
#include "domain/Transaction.hpp"
#include "domain/exceptions/DomainExceptions.hpp"
#include "ports/input/ILedgerService.hpp"
#include "ports/output/IUnitOfWorkFactory.hpp"
#include "ports/output/UnitOfWorkScope.hpp"
#include <iostream>
#include <memory>

namespace stockbook::application {

/**
 * @brief Сервис учёта сделок и снимков баланса
 *
 * Сделка и заметка в дневник пишутся в одном Unit of Work: ошибка
 * второй записи откатывает первую.
 */
class LedgerService : public ports::input::ILedgerService {
public:
    explicit LedgerService(std::shared_ptr<ports::output::IUnitOfWorkFactory> unitOfWorkFactory)
        : unitOfWorkFactory_(std::move(unitOfWorkFactory)) {}

    domain::TradeResult recordTrade(const domain::TradeRequest& request) override {
        domain::Symbol symbol(request.symbol);

        auto uow = unitOfWorkFactory_->create();
        return ports::output::runInUnitOfWork(*uow, [&](ports::output::IUnitOfWork& work) {
            auto portfolio = requireActivePortfolio(work, request.portfolioId);

            auto stock = work.stocks().getBySymbol(symbol);
            if (!stock) {
                throw domain::ValidationError("Stock " + symbol.value() + " not found");
            }
            const domain::EntityId stockId = *stock->id();

            domain::Transaction transaction(
                request.portfolioId,
                stockId,
                request.type,
                request.quantity,
                request.price,
                request.transactionDate,
                request.notes
            );

            domain::PositionBook book(work.transactions().getByPortfolio(request.portfolioId));
            if (transaction.isSell()) {
                checkSellCovered(book, transaction);
            } else {
                checkPositionLimit(portfolio, book, stockId);
            }

            domain::TradeResult result;
            result.transactionId = work.transactions().create(transaction);

            if (request.journalNote) {
                domain::JournalEntry entry(
                    request.transactionDate,
                    *request.journalNote,
                    request.journalTitle,
                    request.portfolioId,
                    stockId,
                    result.transactionId,
                    request.journalTags
                );
                result.journalEntryId = work.journal().create(entry);
            }

            std::cout << "[LedgerService] Recorded " << domain::toString(request.type) << " "
                      << symbol << " x" << request.quantity << " in portfolio "
                      << request.portfolioId << std::endl;
            return result;
        });
    }

    domain::EntityId recordBalance(const domain::PortfolioBalance& balance) override {
        auto uow = unitOfWorkFactory_->create();
        return ports::output::runInUnitOfWork(*uow, [&](ports::output::IUnitOfWork& work) {
            if (!work.portfolios().getById(balance.portfolioId())) {
                throw domain::ValidationError(
                    "Portfolio " + std::to_string(balance.portfolioId()) + " not found");
            }
            return work.balances().create(balance);
        });
    }

private:
    static domain::Portfolio requireActivePortfolio(ports::output::IUnitOfWork& work,
                                                    domain::EntityId portfolioId) {
        auto portfolio = work.portfolios().getById(portfolioId);
        if (!portfolio) {
            throw domain::ValidationError("Portfolio " + std::to_string(portfolioId) + " not found");
        }
        if (!portfolio->isActive()) {
            throw domain::ValidationError("Portfolio " + portfolio->name() + " is not active");
        }
        return *portfolio;
    }

    /**
     * @brief Продать можно не больше, чем куплено минус уже продано
     * @throws NegativeResultError
     */
    static void checkSellCovered(const domain::PositionBook& book,
                                 const domain::Transaction& sell) {
        if (book.netOf(sell.stockId()).value() < sell.quantity().value()) {
            throw domain::NegativeResultError("quantity");
        }
    }

    /**
     * @brief Покупка новой бумаги не должна превышать max_positions
     */
    static void checkPositionLimit(const domain::Portfolio& portfolio,
                                   const domain::PositionBook& book,
                                   domain::EntityId stockId) {
        if (book.isOpen(stockId)) {
            return;
        }
        const size_t open = book.openCount();
        int limit = portfolio.maxPositions().value_or(0);
        if (limit > 0 && static_cast<int>(open) >= limit) {
            throw domain::ValidationError("Portfolio " + portfolio.name() + " already holds " +
                                          std::to_string(open) + " positions (limit " +
                                          std::to_string(limit) + ")");
        }
    }

    std::shared_ptr<ports::output::IUnitOfWorkFactory> unitOfWorkFactory_;
};

} // namespace stockbook::application
