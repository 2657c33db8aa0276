/**
 * @file SqliteDatabase.cpp
 * @brief Implementation of SqliteDatabase and SqliteStatement.
 */

#include "infrastructure/SqliteDatabase.hpp"
#include "domain/Errors.hpp"
#include <sqlite3.h>
#include <utility>

namespace coversync::infrastructure {

namespace {
constexpr int kBusyTimeoutMs = 5000;
}

SqliteStatement::SqliteStatement(sqlite3* db, const std::string& sql) : m_db(db) {
    if (sqlite3_prepare_v2(m_db, sql.c_str(), -1, &m_stmt, nullptr) != SQLITE_OK) {
        std::string message = "Failed to prepare statement: ";
        message += sqlite3_errmsg(m_db);
        throw domain::LedgerError(message);
    }
}

SqliteStatement::~SqliteStatement() {
    if (m_stmt) {
        sqlite3_finalize(m_stmt);
    }
}

SqliteStatement::SqliteStatement(SqliteStatement&& other) noexcept
    : m_db(other.m_db), m_stmt(std::exchange(other.m_stmt, nullptr)) {}

SqliteStatement& SqliteStatement::operator=(SqliteStatement&& other) noexcept {
    if (this != &other) {
        if (m_stmt) {
            sqlite3_finalize(m_stmt);
        }
        m_db = other.m_db;
        m_stmt = std::exchange(other.m_stmt, nullptr);
    }
    return *this;
}

void SqliteStatement::bindText(int index, const std::string& value) {
    sqlite3_bind_text(m_stmt, index, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
}

void SqliteStatement::bindInt64(int index, std::int64_t value) {
    sqlite3_bind_int64(m_stmt, index, static_cast<sqlite3_int64>(value));
}

void SqliteStatement::bindNull(int index) {
    sqlite3_bind_null(m_stmt, index);
}

bool SqliteStatement::step() {
    int rc = sqlite3_step(m_stmt);
    if (rc == SQLITE_ROW) return true;
    if (rc == SQLITE_DONE) return false;

    std::string message = sqlite3_errmsg(m_db);
    if ((rc & 0xff) == SQLITE_CONSTRAINT) {
        throw domain::ConflictError("Constraint violation: " + message);
    }
    throw domain::LedgerError("SQLite step failed: " + message);
}

void SqliteStatement::reset() {
    sqlite3_reset(m_stmt);
    sqlite3_clear_bindings(m_stmt);
}

std::int64_t SqliteStatement::columnInt64(int column) const {
    return static_cast<std::int64_t>(sqlite3_column_int64(m_stmt, column));
}

std::string SqliteStatement::columnText(int column) const {
    const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(m_stmt, column));
    if (!text) return {};
    return std::string(text, static_cast<std::size_t>(sqlite3_column_bytes(m_stmt, column)));
}

bool SqliteStatement::columnIsNull(int column) const {
    return sqlite3_column_type(m_stmt, column) == SQLITE_NULL;
}

SqliteDatabase::SqliteDatabase(const std::string& path, bool readOnly) : m_path(path) {
    int flags = SQLITE_OPEN_FULLMUTEX;
    flags |= readOnly ? SQLITE_OPEN_READONLY : (SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE);

    if (sqlite3_open_v2(path.c_str(), &m_db, flags, nullptr) != SQLITE_OK) {
        std::string message = "Failed to open database " + path + ": ";
        message += m_db ? sqlite3_errmsg(m_db) : "out of memory";
        if (m_db) {
            sqlite3_close(m_db);
            m_db = nullptr;
        }
        throw domain::LedgerError(message);
    }
    sqlite3_busy_timeout(m_db, kBusyTimeoutMs);
}

SqliteDatabase::~SqliteDatabase() {
    if (m_db) {
        sqlite3_close(m_db);
    }
}

void SqliteDatabase::exec(const std::string& sql) {
    char* error = nullptr;
    if (sqlite3_exec(m_db, sql.c_str(), nullptr, nullptr, &error) != SQLITE_OK) {
        std::string message = "SQLite exec failed on " + m_path + ": ";
        message += error ? error : "unknown error";
        sqlite3_free(error);
        throw domain::LedgerError(message);
    }
}

SqliteStatement SqliteDatabase::prepare(const std::string& sql) {
    return SqliteStatement(m_db, sql);
}

std::int64_t SqliteDatabase::lastInsertRowId() const {
    return static_cast<std::int64_t>(sqlite3_last_insert_rowid(m_db));
}

int SqliteDatabase::changes() const {
    return sqlite3_changes(m_db);
}

} // namespace coversync::infrastructure
