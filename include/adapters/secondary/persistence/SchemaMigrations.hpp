#pragma once

#include "SqliteSession.hpp"
#include <string>
#include <vector>

namespace stockbook::adapters::secondary {

/**
 * @brief Версионированная миграция схемы
 */
struct Migration {
    int version;
    std::string description;
    std::string sql;
};

/**
 * @brief Упорядоченный список миграций
 */
const std::vector<Migration>& schemaMigrations();

/**
 * @brief Текущая версия схемы (PRAGMA user_version)
 */
int schemaVersion(SqliteSession& session);

/**
 * @brief Применить миграции новее сохранённой версии
 *
 * Каждая миграция — в своей транзакции вместе с обновлением user_version.
 *
 * @return количество применённых миграций
 */
int applyMigrations(SqliteSession& session);

} // namespace stockbook::adapters::secondary
