// ==============================================================================
// dds/store.hpp - Встроенное хранилище (SQLite)
// ==============================================================================
//
// Назначение:
// - RAII-обёртки над sqlite3: Database, Statement, Transaction
// - Единая схема (directory_cache, work_queue, search_sessions, found_files)
// - Версионирование схемы через PRAGMA user_version, миграции при открытии
// - Ошибки хранилища -> StoreError (код SQLite + текст запроса)
//
// Потоки: одно соединение может использоваться из нескольких потоков;
// Database::lock() сериализует обращения, Transaction держит блокировку
// на всё время жизни. Вложенная Transaction превращается в SAVEPOINT.
//
// ==============================================================================

#ifndef DDS_STORE_HPP
#define DDS_STORE_HPP

#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

struct sqlite3;
struct sqlite3_stmt;

namespace dds::store {

/// Текущая версия схемы (PRAGMA user_version)
constexpr int SCHEMA_VERSION = 1;

// ----------------------------------------------------------------------------
// StoreError
// ----------------------------------------------------------------------------

class StoreError : public std::runtime_error {
public:
    StoreError(const std::string& message, int code, std::string sql = {});

    /// Код результата SQLite (SQLITE_BUSY, SQLITE_CORRUPT, ...)
    int code() const noexcept { return code_; }

    /// Текст запроса, на котором произошла ошибка (может быть пустым)
    const std::string& sql() const noexcept { return sql_; }

private:
    int code_;
    std::string sql_;
};

class Database;

// ----------------------------------------------------------------------------
// Statement - подготовленный запрос
// ----------------------------------------------------------------------------

class Statement {
public:
    Statement(Database& db, std::string_view sql);
    ~Statement();

    Statement(Statement&& other) noexcept;
    Statement& operator=(Statement&&) = delete;
    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    // Параметры нумеруются с 1, как в sqlite3_bind_*
    Statement& bind(int index, std::int64_t value);
    Statement& bind(int index, bool value);
    Statement& bind(int index, std::string_view value);
    Statement& bind(int index, const std::optional<std::string>& value);
    Statement& bind_null(int index);

    /// Сделать шаг: true - есть строка, false - выполнение завершено
    bool step();

    /// Выполнить до конца (для INSERT/UPDATE/DELETE); возвращает sqlite3_changes
    int execute();

    /// Сбросить для повторного использования с новыми параметрами
    void reset();

    // Колонки нумеруются с 0
    std::int64_t column_int64(int col) const;
    bool column_bool(int col) const { return column_int64(col) != 0; }
    std::string column_text(int col) const;
    std::optional<std::string> column_optional_text(int col) const;
    bool column_is_null(int col) const;

private:
    Database* db_;
    sqlite3_stmt* stmt_ = nullptr;
    std::string sql_;
};

// ----------------------------------------------------------------------------
// Database - соединение с файлом хранилища
// ----------------------------------------------------------------------------

class Database {
public:
    /// Открыть (создать) файл, применить pragma и миграции.
    /// Родительский каталог создаётся при необходимости.
    /// @throws StoreError
    static std::unique_ptr<Database> open(const std::filesystem::path& path);

    ~Database();

    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    /// Выполнить один или несколько SQL-операторов без результата
    void exec(std::string_view sql);

    Statement prepare(std::string_view sql) { return Statement(*this, sql); }

    /// Блокировка соединения (рекурсивная: Transaction + методы компонентов)
    std::unique_lock<std::recursive_mutex> lock() {
        return std::unique_lock<std::recursive_mutex>(mutex_);
    }

    /// Число строк, изменённых последним оператором
    int changes() const;

    /// true, если открытой транзакции нет
    bool autocommit() const;

    /// Версия схемы из PRAGMA user_version
    int schema_version();

    /// PRAGMA integrity_check: "ok" или первое сообщение о повреждении
    std::string integrity_check();

    const std::filesystem::path& path() const { return path_; }

    sqlite3* handle() const { return db_; }

    /// Сообщение последней ошибки соединения
    std::string last_error() const;

private:
    Database(sqlite3* db, std::filesystem::path path);

    /// Применить недостающие миграции до SCHEMA_VERSION
    void migrate();

    sqlite3* db_;
    std::filesystem::path path_;
    std::recursive_mutex mutex_;
    int savepoint_depth_ = 0;

    friend class Transaction;
};

// ----------------------------------------------------------------------------
// Transaction - RAII транзакция
// ----------------------------------------------------------------------------
//
// Внешний уровень: BEGIN IMMEDIATE / COMMIT / ROLLBACK.
// Вложенный уровень: SAVEPOINT / RELEASE / ROLLBACK TO.
// Деструктор без commit() откатывает изменения: запись "всё или ничего".
//

class Transaction {
public:
    explicit Transaction(Database& db);
    ~Transaction();

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    /// @throws StoreError (после ошибки транзакция уже откачена)
    void commit();

private:
    void rollback() noexcept;

    Database& db_;
    std::unique_lock<std::recursive_mutex> lock_;
    std::string savepoint_;  // пусто для внешнего уровня
    bool done_ = false;
};

}  // namespace dds::store

#endif  // DDS_STORE_HPP
