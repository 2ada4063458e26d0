#include "../../include/database.hpp"
#include "../../include/codec_error.hpp"
#include "../../include/logger.hpp"
#include <sqlite3.h>
#include <system_error>
#include <utility>

namespace sonora {

namespace {

[[noreturn]] void throw_sqlite_error(sqlite3* db, const int rc, const std::string& what) {
    std::string msg = what + ": " + (db ? sqlite3_errmsg(db) : sqlite3_errstr(rc));
    if ((rc & 0xff) == SQLITE_CONSTRAINT) {
        throw ConstraintViolation(msg);
    }
    throw StorageError(msg);
}

} // namespace

Statement::Statement(sqlite3* db, const std::string_view sql) : db_(db) {
    const int rc = sqlite3_prepare_v2(db_, sql.data(), static_cast<int>(sql.size()), &stmt_, nullptr);
    if (rc != SQLITE_OK) {
        sqlite3_finalize(stmt_);
        stmt_ = nullptr;
        throw_sqlite_error(db_, rc, "Cannot prepare statement '" + std::string(sql) + "'");
    }
}

Statement::~Statement() {
    if (stmt_) {
        sqlite3_finalize(stmt_);
    }
}

Statement::Statement(Statement&& other) noexcept
    : db_(std::exchange(other.db_, nullptr)), stmt_(std::exchange(other.stmt_, nullptr)) {}

Statement& Statement::operator=(Statement&& other) noexcept {
    if (this != &other) {
        if (stmt_) sqlite3_finalize(stmt_);
        db_ = std::exchange(other.db_, nullptr);
        stmt_ = std::exchange(other.stmt_, nullptr);
    }
    return *this;
}

Statement& Statement::bind(const int index, const std::string_view value) {
    const int rc = sqlite3_bind_text(stmt_, index, value.data(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
    if (rc != SQLITE_OK) {
        throw_sqlite_error(db_, rc, "Cannot bind text parameter");
    }
    return *this;
}

Statement& Statement::bind(const int index, const std::int64_t value) {
    const int rc = sqlite3_bind_int64(stmt_, index, value);
    if (rc != SQLITE_OK) {
        throw_sqlite_error(db_, rc, "Cannot bind integer parameter");
    }
    return *this;
}

bool Statement::step() {
    const int rc = sqlite3_step(stmt_);
    if (rc == SQLITE_ROW) return true;
    if (rc == SQLITE_DONE) return false;
    throw_sqlite_error(db_, rc, "Statement failed");
}

void Statement::run() {
    while (step()) {}
}

std::string Statement::column_text(const int index) const {
    const auto* text = sqlite3_column_text(stmt_, index);
    if (!text) return {};
    return {reinterpret_cast<const char*>(text), static_cast<size_t>(sqlite3_column_bytes(stmt_, index))};
}

std::int64_t Statement::column_int(const int index) const {
    return sqlite3_column_int64(stmt_, index);
}

Database::Database(const std::filesystem::path& location) : location_(location) {
    const bool in_memory = location.string() == ":memory:";
    if (!in_memory && location.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(location.parent_path(), ec);
        if (ec) {
            throw StorageError("Error initializing database " + location.string() + ": " + ec.message());
        }
    }

    const int rc = sqlite3_open_v2(location.string().c_str(), &db_,
                                   SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr);
    if (rc != SQLITE_OK) {
        std::string msg = db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc);
        if (db_) sqlite3_close(db_);
        db_ = nullptr;
        Logger::log(LogLevel::Error, "Cannot open database " + location.string() + ": " + msg, "database");
        throw StorageError("Error initializing database " + location.string() + ": " + msg);
    }

    try {
        exec("PRAGMA foreign_keys = ON;");
    } catch (const StorageError&) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }
    Logger::log(LogLevel::Debug, "Opened database " + location.string(), "database");
}

Database::~Database() {
    if (db_) {
        sqlite3_close(db_);
    }
}

void Database::exec(const std::string_view sql) {
    char* err_msg = nullptr;
    const std::string stmt(sql);
    const int rc = sqlite3_exec(db_, stmt.c_str(), nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK) {
        std::string msg = err_msg ? err_msg : sqlite3_errstr(rc);
        sqlite3_free(err_msg);
        if ((rc & 0xff) == SQLITE_CONSTRAINT) {
            throw ConstraintViolation(msg);
        }
        throw StorageError("SQL error on " + location_.string() + ": " + msg);
    }
}

Statement Database::prepare(const std::string_view sql) {
    return Statement(db_, sql);
}

Transaction::Transaction(Database& db) : db_(db) {
    db_.exec("BEGIN;");
}

Transaction::~Transaction() {
    if (!done_) {
        try {
            db_.exec("ROLLBACK;");
        } catch (const StorageError& e) {
            Logger::log(LogLevel::Error, std::string("Rollback failed: ") + e.what(), "database");
        }
    }
}

void Transaction::commit() {
    db_.exec("COMMIT;");
    done_ = true;
}

} // namespace sonora
