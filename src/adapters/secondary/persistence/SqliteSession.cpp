// src/adapters/secondary/persistence/SqliteSession.cpp
#include "adapters/secondary/persistence/SqliteSession.hpp"
#include "ports/output/PersistenceErrors.hpp"
#include <iostream>

namespace stockbook::adapters::secondary {

using namespace ports::output;

// ============================================================================
// SqliteSession
// ============================================================================

SqliteSession::SqliteSession(const std::string& path, int busyTimeoutMs)
    : path_(path)
{
    int rc = sqlite3_open_v2(path.c_str(), &db_,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                             nullptr);
    if (rc != SQLITE_OK) {
        std::string message = db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc);
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
        std::cerr << "[SqliteSession] Cannot open " << path << ": " << message << std::endl;
        throw ConnectionUnavailableError("Cannot open database '" + path + "': " + message, rc);
    }
    sqlite3_extended_result_codes(db_, 1);
    sqlite3_busy_timeout(db_, busyTimeoutMs);
}

SqliteSession::~SqliteSession() {
    if (db_) {
        sqlite3_close_v2(db_);
    }
}

void SqliteSession::execute(const std::string& sql) {
    char* error = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &error);
    if (rc != SQLITE_OK) {
        std::string detail = error ? error : sqlite3_errstr(rc);
        sqlite3_free(error);
        raise(rc, "execute failed (" + detail + ")");
    }
}

void SqliteSession::begin() {
    int rc = sqlite3_exec(db_, "BEGIN", nullptr, nullptr, nullptr);
    if (rc != SQLITE_OK) {
        throw TransactionError("BEGIN failed: " + std::string(sqlite3_errmsg(db_)), rc);
    }
}

void SqliteSession::commit() {
    int rc = sqlite3_exec(db_, "COMMIT", nullptr, nullptr, nullptr);
    if (rc != SQLITE_OK) {
        throw TransactionError("COMMIT failed: " + std::string(sqlite3_errmsg(db_)), rc);
    }
}

void SqliteSession::rollback() {
    // SQLite мог уже откатить транзакцию сам (например, после SQLITE_FULL)
    if (!inTransaction()) {
        return;
    }
    int rc = sqlite3_exec(db_, "ROLLBACK", nullptr, nullptr, nullptr);
    if (rc != SQLITE_OK) {
        throw TransactionError("ROLLBACK failed: " + std::string(sqlite3_errmsg(db_)), rc);
    }
}

bool SqliteSession::inTransaction() const {
    return sqlite3_get_autocommit(db_) == 0;
}

int64_t SqliteSession::lastInsertId() const {
    return sqlite3_last_insert_rowid(db_);
}

int SqliteSession::changes() const {
    return sqlite3_changes(db_);
}

void SqliteSession::raise(int rc, const std::string& context) const {
    std::string message = context + ": " + (db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc));

    switch (rc) {
        case SQLITE_CONSTRAINT_UNIQUE:
        case SQLITE_CONSTRAINT_PRIMARYKEY:
            throw DuplicateKeyError(message, rc);
        default:
            break;
    }

    switch (rc & 0xff) {
        case SQLITE_CONSTRAINT:
            throw ConstraintViolationError(message, rc);
        case SQLITE_CANTOPEN:
        case SQLITE_NOTADB:
            throw ConnectionUnavailableError(message, rc);
        default:
            throw PersistenceError(message, rc);
    }
}

// ============================================================================
// SqliteStatement
// ============================================================================

SqliteStatement::SqliteStatement(SqliteSession& session, const std::string& sql)
    : session_(&session)
    , sql_(sql)
{
    int rc = sqlite3_prepare_v2(session.handle(), sql.c_str(), -1, &stmt_, nullptr);
    if (rc != SQLITE_OK) {
        session.raise(rc, "prepare failed");
    }
    int count = sqlite3_column_count(stmt_);
    for (int i = 0; i < count; ++i) {
        columns_.emplace(sqlite3_column_name(stmt_, i), i);
    }
}

SqliteStatement::SqliteStatement(SqliteStatement&& other) noexcept
    : session_(other.session_)
    , stmt_(other.stmt_)
    , sql_(std::move(other.sql_))
    , columns_(std::move(other.columns_))
{
    other.stmt_ = nullptr;
}

SqliteStatement::~SqliteStatement() {
    if (stmt_) {
        sqlite3_finalize(stmt_);
    }
}

void SqliteStatement::check(int rc, const char* operation) const {
    if (rc != SQLITE_OK) {
        session_->raise(rc, std::string(operation) + " failed");
    }
}

SqliteStatement& SqliteStatement::bind(int index, std::nullopt_t) {
    check(sqlite3_bind_null(stmt_, index), "bind");
    return *this;
}

SqliteStatement& SqliteStatement::bind(int index, const std::string& value) {
    check(sqlite3_bind_text(stmt_, index, value.c_str(), static_cast<int>(value.size()),
                            SQLITE_TRANSIENT), "bind");
    return *this;
}

SqliteStatement& SqliteStatement::bind(int index, const char* value) {
    if (!value) return bind(index, std::nullopt);
    check(sqlite3_bind_text(stmt_, index, value, -1, SQLITE_TRANSIENT), "bind");
    return *this;
}

SqliteStatement& SqliteStatement::bind(int index, double value) {
    check(sqlite3_bind_double(stmt_, index, value), "bind");
    return *this;
}

SqliteStatement& SqliteStatement::bindInt64(int index, int64_t value) {
    check(sqlite3_bind_int64(stmt_, index, value), "bind");
    return *this;
}

bool SqliteStatement::step() {
    int rc = sqlite3_step(stmt_);
    if (rc == SQLITE_ROW) return true;
    if (rc == SQLITE_DONE) return false;
    session_->raise(rc, "step failed");
}

void SqliteStatement::run() {
    while (step()) {
    }
}

void SqliteStatement::reset() {
    sqlite3_reset(stmt_);
    sqlite3_clear_bindings(stmt_);
}

int SqliteStatement::columnIndex(const std::string& column) const {
    auto it = columns_.find(column);
    if (it == columns_.end()) {
        throw PersistenceError("Unknown column '" + column + "' in: " + sql_);
    }
    return it->second;
}

bool SqliteStatement::isNull(const std::string& column) const {
    return sqlite3_column_type(stmt_, columnIndex(column)) == SQLITE_NULL;
}

} // namespace stockbook::adapters::secondary
