/**
 * @file database.hpp
 * @brief Thin RAII wrapper around a sqlite3 connection and its statements.
 */

#ifndef SONORA_DATABASE_HPP
#define SONORA_DATABASE_HPP

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

struct sqlite3;
struct sqlite3_stmt;

namespace sonora {

/**
 * @brief A prepared statement bound to a Database.
 *
 * Bind indices are 1-based, column indices are 0-based, as in sqlite3.
 * Failures throw StorageError, constraint failures throw ConstraintViolation.
 */
class Statement {
public:
    Statement(sqlite3* db, std::string_view sql);
    ~Statement();

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;
    Statement(Statement&& other) noexcept;
    Statement& operator=(Statement&& other) noexcept;

    Statement& bind(int index, std::string_view value);
    Statement& bind(int index, std::int64_t value);
    Statement& bind(int index, int value) { return bind(index, static_cast<std::int64_t>(value)); }

    /**
     * @brief Advance the statement.
     * @return true while a result row is available, false once done.
     */
    bool step();

    /// Run the statement to completion, ignoring any result rows.
    void run();

    [[nodiscard]] std::string column_text(int index) const;
    [[nodiscard]] std::int64_t column_int(int index) const;

private:
    sqlite3* db_ = nullptr;
    sqlite3_stmt* stmt_ = nullptr;
};

/**
 * @brief Owns one sqlite3 connection.
 *
 * @details The connection is opened with foreign-key enforcement enabled,
 * so ON DELETE CASCADE clauses of the schema are honoured.
 */
class Database {
public:
    /**
     * @brief Open or create the database at @p location.
     *
     * The parent directory is created when missing. The special location
     * ":memory:" opens a private in-memory database.
     * @throws StorageError if the file cannot be opened or created.
     */
    explicit Database(const std::filesystem::path& location);
    ~Database();

    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    /// Execute one or more SQL statements without results.
    void exec(std::string_view sql);

    [[nodiscard]] Statement prepare(std::string_view sql);

    [[nodiscard]] const std::filesystem::path& location() const noexcept { return location_; }

private:
    std::filesystem::path location_;
    sqlite3* db_ = nullptr;
};

/**
 * @brief Scoped BEGIN/COMMIT. Rolls back unless commit() was called.
 */
class Transaction {
public:
    explicit Transaction(Database& db);
    ~Transaction();

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    void commit();

private:
    Database& db_;
    bool done_ = false;
};

} // namespace sonora

#endif // SONORA_DATABASE_HPP
