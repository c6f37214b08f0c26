#pragma once

#include "IDatabaseConnection.hpp"
#include "settings/DbSettings.hpp"
#include <memory>
#include <mutex>

namespace stockbook::adapters::secondary {

/**
 * @brief Самостоятельное соединение с SQLite
 *
 * Для файловой БД каждый acquire() открывает новую сессию.
 * Для ":memory:" используется одна постоянная сессия: каждое открытие
 * ":memory:" — отдельная пустая база.
 */
class DatabaseConnection : public IDatabaseConnection {
public:
    /**
     * @throws ConnectionUnavailableError если каталог БД нельзя создать
     */
    explicit DatabaseConnection(std::shared_ptr<const settings::DbSettings> settings);

    std::shared_ptr<SqliteSession> acquire() override;

    void withinTransaction(const std::function<void(SqliteSession&)>& work) override;

    bool isTransactional() const override { return false; }

    /**
     * @brief Миграции выполняются не более одного раза на объект соединения
     */
    void initializeSchema() override;

    const settings::DbSettings& settings() const { return *settings_; }

private:
    std::shared_ptr<SqliteSession> openSession() const;

    std::shared_ptr<const settings::DbSettings> settings_;
    std::shared_ptr<SqliteSession> memorySession_;
    std::once_flag schemaOnce_;
    std::mutex mutex_;
};

} // namespace stockbook::adapters::secondary
