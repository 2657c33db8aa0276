/**
 * @file SqliteProcessedFileRepository.cpp
 * @brief Implementation of SqliteProcessedFileRepository.
 */

#include "infrastructure/SqliteProcessedFileRepository.hpp"
#include "domain/Errors.hpp"
#include <deque>

namespace coversync::infrastructure {

using domain::ProcessedFile;
using domain::ProcessingState;

namespace {

constexpr const char* kColumns =
    "id, session_id, series_id, file_name, file_path, file_etag, file_size, "
    "processing_state, processed_at, error_message, detail, version";

std::int64_t ToEpochMs(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

std::chrono::system_clock::time_point FromEpochMs(std::int64_t ms) {
    return std::chrono::system_clock::time_point(std::chrono::milliseconds(ms));
}

ProcessedFile ReadRow(const SqliteStatement& stmt) {
    ProcessedFile row;
    row.id = stmt.columnInt64(0);
    row.sessionId = stmt.columnText(1);
    row.seriesId = stmt.columnInt64(2);
    row.fileName = stmt.columnText(3);
    row.filePath = stmt.columnText(4);
    row.fileEtag = stmt.columnText(5);
    row.fileSize = stmt.columnInt64(6);
    std::string state = stmt.columnText(7);
    auto parsed = domain::StateFromString(state);
    if (!parsed) {
        throw domain::LedgerError("Unknown processing_state '" + state + "' in row " + std::to_string(row.id));
    }
    row.state = *parsed;
    if (!stmt.columnIsNull(8)) {
        row.processedAt = FromEpochMs(stmt.columnInt64(8));
    }
    row.errorMessage = stmt.columnText(9);
    row.detailJson = stmt.columnText(10);
    row.version = stmt.columnInt64(11);
    return row;
}

void BindProcessedAt(SqliteStatement& stmt, int index, const ProcessedFile& file) {
    if (file.processedAt) {
        stmt.bindInt64(index, ToEpochMs(*file.processedAt));
    } else {
        stmt.bindNull(index);
    }
}

/**
 * Pages through the repository by (processed_at, id). Holding only the last
 * position keeps the cursor valid while rows are deleted under it.
 */
class SqliteStaleFileCursor : public domain::StaleFileCursor {
public:
    SqliteStaleFileCursor(SqliteProcessedFileRepository& repo, std::int64_t cutoffMs, std::size_t pageSize)
        : m_repo(repo), m_cutoffMs(cutoffMs), m_pageSize(pageSize) {}

    std::optional<ProcessedFile> next() override {
        if (m_buffer.empty() && !m_exhausted) {
            auto page = m_repo.fetchStalePage(m_cutoffMs, m_fetchedUpTo, m_pageSize);
            if (page.size() < m_pageSize) {
                m_exhausted = true;
            }
            for (auto& row : page) {
                m_fetchedUpTo = {row.processedAt ? ToEpochMs(*row.processedAt) : 0, row.id, true};
                m_buffer.push_back(std::move(row));
            }
        }
        if (m_buffer.empty()) {
            return std::nullopt;
        }
        ProcessedFile row = std::move(m_buffer.front());
        m_buffer.pop_front();
        m_position = {row.processedAt ? ToEpochMs(*row.processedAt) : 0, row.id, true};
        return row;
    }

    void restart() override {
        seek(domain::CursorPosition{});
    }

    domain::CursorPosition position() const override {
        return m_position;
    }

    void seek(const domain::CursorPosition& position) override {
        m_buffer.clear();
        m_exhausted = false;
        m_position = position;
        m_fetchedUpTo = position;
    }

private:
    SqliteProcessedFileRepository& m_repo;
    std::int64_t m_cutoffMs;
    std::size_t m_pageSize;
    std::deque<ProcessedFile> m_buffer;
    domain::CursorPosition m_position;
    domain::CursorPosition m_fetchedUpTo;
    bool m_exhausted = false;
};

} // namespace

SqliteProcessedFileRepository::SqliteProcessedFileRepository(const std::string& dbPath, std::size_t stalePageSize)
    : m_db(dbPath), m_pageSize(stalePageSize == 0 ? 1 : stalePageSize) {
    ensureSchema();
}

void SqliteProcessedFileRepository::ensureSchema() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_db.exec(
        "PRAGMA journal_mode=WAL;"
        "CREATE TABLE IF NOT EXISTS processed_files ("
        "  id INTEGER PRIMARY KEY AUTOINCREMENT,"
        "  session_id TEXT NOT NULL,"
        "  series_id INTEGER NOT NULL DEFAULT 0,"
        "  file_name TEXT NOT NULL,"
        "  file_path TEXT NOT NULL DEFAULT '',"
        "  file_etag TEXT NOT NULL UNIQUE,"
        "  file_size INTEGER NOT NULL DEFAULT 0,"
        "  processing_state TEXT NOT NULL,"
        "  processed_at INTEGER,"
        "  error_message TEXT NOT NULL DEFAULT '',"
        "  detail TEXT NOT NULL DEFAULT '',"
        "  version INTEGER NOT NULL DEFAULT 1,"
        "  UNIQUE (session_id, file_name)"
        ");"
        "CREATE INDEX IF NOT EXISTS idx_processed_files_processed_at ON processed_files (processed_at, id);"
        "CREATE INDEX IF NOT EXISTS idx_processed_files_series ON processed_files (series_id);");
}

std::optional<ProcessedFile> SqliteProcessedFileRepository::lookupByEtag(const std::string& etag) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto stmt = m_db.prepare(std::string("SELECT ") + kColumns + " FROM processed_files WHERE file_etag = ?1");
    stmt.bindText(1, etag);
    if (stmt.step()) {
        return ReadRow(stmt);
    }
    return std::nullopt;
}

std::optional<ProcessedFile> SqliteProcessedFileRepository::lookupBySessionAndFileName(const std::string& sessionId,
                                                                                       const std::string& fileName) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto stmt = m_db.prepare(std::string("SELECT ") + kColumns +
                             " FROM processed_files WHERE session_id = ?1 AND file_name = ?2");
    stmt.bindText(1, sessionId);
    stmt.bindText(2, fileName);
    if (stmt.step()) {
        return ReadRow(stmt);
    }
    return std::nullopt;
}

std::optional<ProcessedFile> SqliteProcessedFileRepository::selectById(std::int64_t id) {
    auto stmt = m_db.prepare(std::string("SELECT ") + kColumns + " FROM processed_files WHERE id = ?1");
    stmt.bindInt64(1, id);
    if (stmt.step()) {
        return ReadRow(stmt);
    }
    return std::nullopt;
}

ProcessedFile SqliteProcessedFileRepository::upsert(const ProcessedFile& file) {
    std::lock_guard<std::mutex> lock(m_mutex);
    ProcessedFile stored = file;

    if (!file.isPersisted()) {
        auto stmt = m_db.prepare(
            "INSERT INTO processed_files (session_id, series_id, file_name, file_path, file_etag, file_size, "
            "processing_state, processed_at, error_message, detail, version) "
            "VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10, 1)");
        stmt.bindText(1, file.sessionId);
        stmt.bindInt64(2, file.seriesId);
        stmt.bindText(3, file.fileName);
        stmt.bindText(4, file.filePath);
        stmt.bindText(5, file.fileEtag);
        stmt.bindInt64(6, file.fileSize);
        stmt.bindText(7, domain::StateToString(file.state));
        BindProcessedAt(stmt, 8, file);
        stmt.bindText(9, file.errorMessage);
        stmt.bindText(10, file.detailJson);
        stmt.step();
        stored.id = m_db.lastInsertRowId();
        stored.version = 1;
        return stored;
    }

    auto current = selectById(file.id);
    if (!current) {
        throw domain::ConflictError("Ledger row " + std::to_string(file.id) + " no longer exists");
    }
    if (current->version != file.version) {
        throw domain::ConflictError("Stale write to ledger row " + std::to_string(file.id) + ": expected version " +
                                    std::to_string(file.version) + ", found " + std::to_string(current->version));
    }
    if (current->state != file.state && !domain::IsForwardTransition(current->state, file.state)) {
        throw domain::ConflictError("Illegal transition " + domain::StateToString(current->state) + " -> " +
                                    domain::StateToString(file.state) + " for " + file.fileName);
    }

    auto stmt = m_db.prepare(
        "UPDATE processed_files SET session_id = ?1, series_id = ?2, file_name = ?3, file_path = ?4, "
        "file_etag = ?5, file_size = ?6, processing_state = ?7, processed_at = ?8, error_message = ?9, "
        "detail = ?10, version = version + 1 WHERE id = ?11 AND version = ?12");
    stmt.bindText(1, file.sessionId);
    stmt.bindInt64(2, file.seriesId);
    stmt.bindText(3, file.fileName);
    stmt.bindText(4, file.filePath);
    stmt.bindText(5, file.fileEtag);
    stmt.bindInt64(6, file.fileSize);
    stmt.bindText(7, domain::StateToString(file.state));
    BindProcessedAt(stmt, 8, file);
    stmt.bindText(9, file.errorMessage);
    stmt.bindText(10, file.detailJson);
    stmt.bindInt64(11, file.id);
    stmt.bindInt64(12, file.version);
    stmt.step();
    if (m_db.changes() == 0) {
        throw domain::ConflictError("Concurrent update of ledger row " + std::to_string(file.id));
    }
    stored.version = file.version + 1;
    return stored;
}

std::set<std::string> SqliteProcessedFileRepository::listProcessedPaths(std::int64_t seriesId) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto stmt = m_db.prepare(
        "SELECT file_path FROM processed_files WHERE series_id = ?1 AND processing_state = 'PROCESSED'");
    stmt.bindInt64(1, seriesId);
    std::set<std::string> paths;
    while (stmt.step()) {
        paths.insert(stmt.columnText(0));
    }
    return paths;
}

std::int64_t SqliteProcessedFileRepository::countProcessed(std::int64_t seriesId) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto stmt = m_db.prepare(
        "SELECT COUNT(*) FROM processed_files WHERE series_id = ?1 AND processing_state = 'PROCESSED'");
    stmt.bindInt64(1, seriesId);
    return stmt.step() ? stmt.columnInt64(0) : 0;
}

std::vector<ProcessedFile> SqliteProcessedFileRepository::findBySession(const std::string& sessionId) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto stmt = m_db.prepare(std::string("SELECT ") + kColumns +
                             " FROM processed_files WHERE session_id = ?1 ORDER BY id");
    stmt.bindText(1, sessionId);
    std::vector<ProcessedFile> rows;
    while (stmt.step()) {
        rows.push_back(ReadRow(stmt));
    }
    return rows;
}

std::int64_t SqliteProcessedFileRepository::deleteBySession(const std::string& sessionId) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto stmt = m_db.prepare("DELETE FROM processed_files WHERE session_id = ?1");
    stmt.bindText(1, sessionId);
    stmt.step();
    return m_db.changes();
}

std::int64_t SqliteProcessedFileRepository::deleteBySeries(std::int64_t seriesId) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto stmt = m_db.prepare("DELETE FROM processed_files WHERE series_id = ?1");
    stmt.bindInt64(1, seriesId);
    stmt.step();
    return m_db.changes();
}

bool SqliteProcessedFileRepository::deleteById(std::int64_t id) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto stmt = m_db.prepare("DELETE FROM processed_files WHERE id = ?1");
    stmt.bindInt64(1, id);
    stmt.step();
    return m_db.changes() > 0;
}

std::vector<ProcessedFile> SqliteProcessedFileRepository::fetchStalePage(std::int64_t cutoffMs,
                                                                        const domain::CursorPosition& after,
                                                                        std::size_t limit) {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::string sql = std::string("SELECT ") + kColumns +
                      " FROM processed_files WHERE processed_at IS NOT NULL AND processed_at < ?1";
    if (after.started) {
        sql += " AND (processed_at > ?2 OR (processed_at = ?2 AND id > ?3))";
    }
    sql += " ORDER BY processed_at ASC, id ASC LIMIT ?4";

    auto stmt = m_db.prepare(sql);
    stmt.bindInt64(1, cutoffMs);
    if (after.started) {
        stmt.bindInt64(2, after.processedAtMs);
        stmt.bindInt64(3, after.id);
    }
    stmt.bindInt64(4, static_cast<std::int64_t>(limit));

    std::vector<ProcessedFile> rows;
    while (stmt.step()) {
        rows.push_back(ReadRow(stmt));
    }
    return rows;
}

std::unique_ptr<domain::StaleFileCursor> SqliteProcessedFileRepository::findStale(
    std::chrono::system_clock::time_point cutoff) {
    return std::make_unique<SqliteStaleFileCursor>(*this, ToEpochMs(cutoff), m_pageSize);
}

} // namespace coversync::infrastructure
