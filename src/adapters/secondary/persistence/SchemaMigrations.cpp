// src/adapters/secondary/persistence/SchemaMigrations.cpp
#include "adapters/secondary/persistence/SchemaMigrations.hpp"
#include <iostream>

namespace stockbook::adapters::secondary {

const std::vector<Migration>& schemaMigrations() {
    static const std::vector<Migration> migrations = {
        {1, "create core tables", R"(
            CREATE TABLE IF NOT EXISTS stock (
                id INTEGER PRIMARY KEY AUTOINCREMENT,
                symbol TEXT NOT NULL UNIQUE,
                name TEXT NOT NULL,
                industry_group TEXT,
                grade TEXT CHECK(grade IN ('A', 'B', 'C')),
                notes TEXT,
                created_at TIMESTAMP DEFAULT CURRENT_TIMESTAMP,
                updated_at TIMESTAMP DEFAULT CURRENT_TIMESTAMP
            );

            CREATE TABLE IF NOT EXISTS portfolio (
                id INTEGER PRIMARY KEY AUTOINCREMENT,
                name TEXT NOT NULL CHECK(length(name) BETWEEN 1 AND 100),
                description TEXT,
                max_positions INTEGER NOT NULL DEFAULT 10 CHECK(max_positions > 0),
                max_risk_per_trade TEXT NOT NULL DEFAULT '2.0',
                is_active INTEGER NOT NULL DEFAULT 1,
                created_at TIMESTAMP DEFAULT CURRENT_TIMESTAMP,
                updated_at TIMESTAMP DEFAULT CURRENT_TIMESTAMP
            );

            CREATE TABLE IF NOT EXISTS stock_transaction (
                id INTEGER PRIMARY KEY AUTOINCREMENT,
                portfolio_id INTEGER NOT NULL,
                stock_id INTEGER NOT NULL,
                type TEXT NOT NULL CHECK(type IN ('buy', 'sell')),
                quantity TEXT NOT NULL,
                price TEXT NOT NULL,
                transaction_date TEXT NOT NULL,
                notes TEXT,
                created_at TIMESTAMP DEFAULT CURRENT_TIMESTAMP,
                FOREIGN KEY (portfolio_id) REFERENCES portfolio(id),
                FOREIGN KEY (stock_id) REFERENCES stock(id)
            );

            CREATE TABLE IF NOT EXISTS target (
                id INTEGER PRIMARY KEY AUTOINCREMENT,
                stock_id INTEGER NOT NULL,
                portfolio_id INTEGER NOT NULL,
                pivot_price TEXT NOT NULL,
                failure_price TEXT NOT NULL,
                notes TEXT,
                status TEXT NOT NULL DEFAULT 'active'
                    CHECK(status IN ('active', 'hit', 'failed', 'cancelled')),
                created_at TIMESTAMP DEFAULT CURRENT_TIMESTAMP,
                updated_at TIMESTAMP DEFAULT CURRENT_TIMESTAMP,
                FOREIGN KEY (stock_id) REFERENCES stock(id),
                FOREIGN KEY (portfolio_id) REFERENCES portfolio(id)
            );

            CREATE TABLE IF NOT EXISTS portfolio_balance (
                id INTEGER PRIMARY KEY AUTOINCREMENT,
                portfolio_id INTEGER NOT NULL,
                balance_date TEXT NOT NULL,
                withdrawals TEXT NOT NULL DEFAULT '0.00',
                deposits TEXT NOT NULL DEFAULT '0.00',
                final_balance TEXT NOT NULL,
                index_change TEXT,
                created_at TIMESTAMP DEFAULT CURRENT_TIMESTAMP,
                FOREIGN KEY (portfolio_id) REFERENCES portfolio(id),
                UNIQUE(portfolio_id, balance_date)
            );

            CREATE TABLE IF NOT EXISTS journal_entry (
                id INTEGER PRIMARY KEY AUTOINCREMENT,
                entry_date TEXT NOT NULL,
                title TEXT,
                content TEXT NOT NULL,
                tags TEXT NOT NULL DEFAULT '[]',
                stock_id INTEGER,
                portfolio_id INTEGER,
                transaction_id INTEGER,
                created_at TIMESTAMP DEFAULT CURRENT_TIMESTAMP,
                updated_at TIMESTAMP DEFAULT CURRENT_TIMESTAMP,
                FOREIGN KEY (stock_id) REFERENCES stock(id) ON DELETE SET NULL,
                FOREIGN KEY (portfolio_id) REFERENCES portfolio(id) ON DELETE SET NULL,
                FOREIGN KEY (transaction_id) REFERENCES stock_transaction(id) ON DELETE SET NULL
            );
        )"},
        {2, "add lookup indexes", R"(
            CREATE INDEX IF NOT EXISTS idx_transaction_portfolio ON stock_transaction(portfolio_id);
            CREATE INDEX IF NOT EXISTS idx_transaction_stock ON stock_transaction(stock_id);
            CREATE INDEX IF NOT EXISTS idx_transaction_date ON stock_transaction(transaction_date);
            CREATE INDEX IF NOT EXISTS idx_target_status ON target(status);
            CREATE INDEX IF NOT EXISTS idx_portfolio_balance_date ON portfolio_balance(balance_date);
            CREATE INDEX IF NOT EXISTS idx_journal_entry_date ON journal_entry(entry_date);
        )"},
        {3, "maintain updated_at", R"(
            CREATE TRIGGER IF NOT EXISTS update_stock_timestamp
            AFTER UPDATE ON stock
            BEGIN
                UPDATE stock SET updated_at = CURRENT_TIMESTAMP WHERE id = NEW.id;
            END;

            CREATE TRIGGER IF NOT EXISTS update_portfolio_timestamp
            AFTER UPDATE ON portfolio
            BEGIN
                UPDATE portfolio SET updated_at = CURRENT_TIMESTAMP WHERE id = NEW.id;
            END;

            CREATE TRIGGER IF NOT EXISTS update_target_timestamp
            AFTER UPDATE ON target
            BEGIN
                UPDATE target SET updated_at = CURRENT_TIMESTAMP WHERE id = NEW.id;
            END;

            CREATE TRIGGER IF NOT EXISTS update_journal_entry_timestamp
            AFTER UPDATE ON journal_entry
            BEGIN
                UPDATE journal_entry SET updated_at = CURRENT_TIMESTAMP WHERE id = NEW.id;
            END;
        )"},
    };
    return migrations;
}

int schemaVersion(SqliteSession& session) {
    auto stmt = session.prepare("PRAGMA user_version");
    stmt.step();
    return stmt.get<int>("user_version");
}

int applyMigrations(SqliteSession& session) {
    int current = schemaVersion(session);
    int applied = 0;

    for (const auto& migration : schemaMigrations()) {
        if (migration.version <= current) {
            continue;
        }
        session.begin();
        try {
            session.execute(migration.sql);
            session.execute("PRAGMA user_version = " + std::to_string(migration.version));
            session.commit();
        } catch (const std::exception& e) {
            std::cerr << "[SchemaMigrations] Migration " << migration.version
                      << " failed: " << e.what() << std::endl;
            session.rollback();
            throw;
        }
        std::cout << "[SchemaMigrations] Applied migration " << migration.version
                  << ": " << migration.description << std::endl;
        ++applied;
    }
    return applied;
}

} // namespace stockbook::adapters::secondary
