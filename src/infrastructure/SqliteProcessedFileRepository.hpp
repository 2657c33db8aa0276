/**
 * @file SqliteProcessedFileRepository.hpp
 * @brief SQLite implementation of the dedup ledger.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>
#include "domain/ProcessedFileRepository.hpp"
#include "infrastructure/SqliteDatabase.hpp"

namespace coversync::infrastructure {

/**
 * @class SqliteProcessedFileRepository
 * @brief Ledger rows in a `processed_files` table.
 *
 * All statements on the connection are serialized by one mutex. Row-level
 * concurrency is optimistic: every update must carry the version it read.
 * Cursors returned by findStale() borrow the repository and must not outlive it.
 */
class SqliteProcessedFileRepository : public domain::ProcessedFileRepository {
public:
    /**
     * @param dbPath Database file, or ":memory:" for a private in-memory ledger.
     * @param stalePageSize Rows fetched per page by stale cursors.
     */
    explicit SqliteProcessedFileRepository(const std::string& dbPath, std::size_t stalePageSize = 100);

    std::optional<domain::ProcessedFile> lookupByEtag(const std::string& etag) override;
    std::optional<domain::ProcessedFile> lookupBySessionAndFileName(const std::string& sessionId,
                                                                    const std::string& fileName) override;
    domain::ProcessedFile upsert(const domain::ProcessedFile& file) override;
    std::set<std::string> listProcessedPaths(std::int64_t seriesId) override;
    std::int64_t countProcessed(std::int64_t seriesId) override;
    std::vector<domain::ProcessedFile> findBySession(const std::string& sessionId) override;
    std::int64_t deleteBySession(const std::string& sessionId) override;
    std::int64_t deleteBySeries(std::int64_t seriesId) override;
    bool deleteById(std::int64_t id) override;
    std::unique_ptr<domain::StaleFileCursor> findStale(std::chrono::system_clock::time_point cutoff) override;

    /** @brief One keyset page of stale rows strictly after @p after. */
    std::vector<domain::ProcessedFile> fetchStalePage(std::int64_t cutoffMs,
                                                      const domain::CursorPosition& after,
                                                      std::size_t limit);

private:
    void ensureSchema();
    std::optional<domain::ProcessedFile> selectById(std::int64_t id);

    std::mutex m_mutex;
    SqliteDatabase m_db;
    std::size_t m_pageSize;
};

} // namespace coversync::infrastructure
