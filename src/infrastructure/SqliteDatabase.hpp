/**
 * @file SqliteDatabase.hpp
 * @brief RAII wrappers over the sqlite3 C API.
 */

#pragma once

#include <cstdint>
#include <string>

struct sqlite3;
struct sqlite3_stmt;

namespace coversync::infrastructure {

/**
 * @class SqliteStatement
 * @brief Prepared statement, finalized on destruction. Parameter indexes are 1-based.
 */
class SqliteStatement {
public:
    SqliteStatement(sqlite3* db, const std::string& sql);
    ~SqliteStatement();

    SqliteStatement(const SqliteStatement&) = delete;
    SqliteStatement& operator=(const SqliteStatement&) = delete;
    SqliteStatement(SqliteStatement&& other) noexcept;
    SqliteStatement& operator=(SqliteStatement&& other) noexcept;

    void bindText(int index, const std::string& value);
    void bindInt64(int index, std::int64_t value);
    void bindNull(int index);

    /**
     * @brief Advances the statement.
     * @return True if a row is available, false when done.
     * @throws domain::ConflictError on constraint violations, domain::LedgerError otherwise.
     */
    bool step();

    void reset();

    std::int64_t columnInt64(int column) const;
    std::string columnText(int column) const;
    bool columnIsNull(int column) const;

private:
    sqlite3* m_db;
    sqlite3_stmt* m_stmt = nullptr;
};

/**
 * @class SqliteDatabase
 * @brief Owns one sqlite3 connection.
 */
class SqliteDatabase {
public:
    /**
     * @param path File path, or ":memory:".
     * @param readOnly Opens without write access and without creating the file.
     * @throws domain::LedgerError if the database cannot be opened.
     */
    SqliteDatabase(const std::string& path, bool readOnly = false);
    ~SqliteDatabase();

    SqliteDatabase(const SqliteDatabase&) = delete;
    SqliteDatabase& operator=(const SqliteDatabase&) = delete;

    /** @brief Runs one or more statements without results. */
    void exec(const std::string& sql);

    SqliteStatement prepare(const std::string& sql);

    std::int64_t lastInsertRowId() const;
    int changes() const;

private:
    sqlite3* m_db = nullptr;
    std::string m_path;
};

} // namespace coversync::infrastructure
