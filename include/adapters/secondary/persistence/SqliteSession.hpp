#pragma once

#include <sqlite3.h>
#include <concepts>
#include <cstdint>
#include <optional>
#include <string>
#include <type_traits>
#include <unordered_map>

namespace stockbook::adapters::secondary {

class SqliteSession;

/**
 * @brief Подготовленный запрос SQLite (RAII над sqlite3_stmt)
 *
 * Параметры биндятся по позиции (с 1), колонки результата читаются
 * по имени: stmt.get<std::string>("symbol"), stmt.isNull("grade").
 */
class SqliteStatement {
public:
    SqliteStatement(SqliteSession& session, const std::string& sql);
    ~SqliteStatement();

    SqliteStatement(const SqliteStatement&) = delete;
    SqliteStatement& operator=(const SqliteStatement&) = delete;
    SqliteStatement(SqliteStatement&& other) noexcept;
    SqliteStatement& operator=(SqliteStatement&&) = delete;

    SqliteStatement& bind(int index, std::nullopt_t);
    SqliteStatement& bind(int index, const std::string& value);
    SqliteStatement& bind(int index, const char* value);
    SqliteStatement& bind(int index, double value);

    template <std::integral T>
    SqliteStatement& bind(int index, T value) {
        return bindInt64(index, static_cast<int64_t>(value));
    }

    template <typename T>
    SqliteStatement& bind(int index, const std::optional<T>& value) {
        if (!value) return bind(index, std::nullopt);
        return bind(index, *value);
    }

    /**
     * @brief Забиндить все параметры по порядку
     */
    template <typename... Args>
    SqliteStatement& bindAll(const Args&... args) {
        int index = 1;
        (bind(index++, args), ...);
        return *this;
    }

    /**
     * @brief Выполнить шаг
     * @return true если получена строка, false если запрос завершён
     * @throws PersistenceError (и наследники) при ошибке
     */
    bool step();

    /**
     * @brief Выполнить запрос, не возвращающий строк
     */
    void run();

    void reset();

    bool isNull(const std::string& column) const;

    template <typename T>
    T get(const std::string& column) const {
        int index = columnIndex(column);
        if constexpr (std::is_same_v<T, std::string>) {
            const unsigned char* text = sqlite3_column_text(stmt_, index);
            return text ? std::string(reinterpret_cast<const char*>(text)) : std::string();
        } else if constexpr (std::is_same_v<T, bool>) {
            return sqlite3_column_int64(stmt_, index) != 0;
        } else if constexpr (std::is_integral_v<T>) {
            return static_cast<T>(sqlite3_column_int64(stmt_, index));
        } else if constexpr (std::is_floating_point_v<T>) {
            return static_cast<T>(sqlite3_column_double(stmt_, index));
        } else {
            static_assert(sizeof(T) == 0, "Unsupported column type");
        }
    }

    template <typename T>
    std::optional<T> getOptional(const std::string& column) const {
        if (isNull(column)) return std::nullopt;
        return get<T>(column);
    }

private:
    SqliteStatement& bindInt64(int index, int64_t value);
    void check(int rc, const char* operation) const;
    int columnIndex(const std::string& column) const;

    SqliteSession* session_;
    sqlite3_stmt* stmt_ = nullptr;
    std::string sql_;
    std::unordered_map<std::string, int> columns_;
};

/**
 * @brief Физическое соединение с файлом SQLite (RAII над sqlite3*)
 *
 * Закрывается в деструкторе. Незавершённая транзакция при закрытии
 * откатывается самим SQLite.
 */
class SqliteSession {
public:
    /**
     * @throws ConnectionUnavailableError если файл не открывается
     */
    SqliteSession(const std::string& path, int busyTimeoutMs);
    ~SqliteSession();

    SqliteSession(const SqliteSession&) = delete;
    SqliteSession& operator=(const SqliteSession&) = delete;

    /**
     * @brief Выполнить один или несколько SQL-операторов без параметров
     */
    void execute(const std::string& sql);

    SqliteStatement prepare(const std::string& sql) { return SqliteStatement(*this, sql); }

    void begin();
    void commit();
    void rollback();

    /**
     * @brief Открыта ли явная транзакция (sqlite3_get_autocommit == 0)
     */
    bool inTransaction() const;

    int64_t lastInsertId() const;
    int changes() const;

    const std::string& path() const { return path_; }
    sqlite3* handle() const { return db_; }

    /**
     * @brief Преобразовать код ошибки SQLite в исключение PersistenceError
     */
    [[noreturn]] void raise(int rc, const std::string& context) const;

private:
    std::string path_;
    sqlite3* db_ = nullptr;
};

} // namespace stockbook::adapters::secondary
