/**
 * @file ProcessedFileRepository.hpp
 * @brief Interface of the dedup ledger.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include "ProcessedFile.hpp"

namespace coversync::domain {

/**
 * @struct CursorPosition
 * @brief Keyset position of a stale-file cursor: last (processedAt, id) returned.
 */
struct CursorPosition {
    std::int64_t processedAtMs = 0;
    std::int64_t id = 0;
    bool started = false;
};

/**
 * @class StaleFileCursor
 * @brief Lazy sequence of rows older than a cutoff, ordered by processedAt ascending.
 *
 * Rows are fetched in pages as the caller advances. A cursor can be restarted
 * from the beginning or resumed from a previously exported position.
 */
class StaleFileCursor {
public:
    virtual ~StaleFileCursor() = default;

    /** @brief Returns the next stale row, or nullopt once exhausted. */
    virtual std::optional<ProcessedFile> next() = 0;

    /** @brief Rewinds to the first stale row. */
    virtual void restart() = 0;

    /** @brief Position after the last row returned by next(). */
    virtual CursorPosition position() const = 0;

    /** @brief Continues after @p position on the next call to next(). */
    virtual void seek(const CursorPosition& position) = 0;
};

/**
 * @class ProcessedFileRepository
 * @brief Durable record of which files were processed, for which session, with what outcome.
 */
class ProcessedFileRepository {
public:
    virtual ~ProcessedFileRepository() = default;

    /** @brief Dedup fast path: the row holding this content fingerprint. */
    virtual std::optional<ProcessedFile> lookupByEtag(const std::string& etag) = 0;

    virtual std::optional<ProcessedFile> lookupBySessionAndFileName(const std::string& sessionId,
                                                                    const std::string& fileName) = 0;

    /**
     * @brief Inserts a new row (id == 0) or updates an existing one.
     *
     * Updates succeed only when @p file.version matches the stored version and
     * the state move is forward. Uniqueness violations, stale versions and
     * backward moves raise ConflictError.
     * @return The stored row with its new id and version.
     */
    virtual ProcessedFile upsert(const ProcessedFile& file) = 0;

    /** @brief Paths of PROCESSED rows for a series. */
    virtual std::set<std::string> listProcessedPaths(std::int64_t seriesId) = 0;

    /** @brief Number of PROCESSED rows for a series. */
    virtual std::int64_t countProcessed(std::int64_t seriesId) = 0;

    virtual std::vector<ProcessedFile> findBySession(const std::string& sessionId) = 0;

    /** @return Number of removed rows. */
    virtual std::int64_t deleteBySession(const std::string& sessionId) = 0;

    /** @return Number of removed rows. */
    virtual std::int64_t deleteBySeries(std::int64_t seriesId) = 0;

    virtual bool deleteById(std::int64_t id) = 0;

    /** @brief Retention sweep input: rows with processedAt < cutoff. */
    virtual std::unique_ptr<StaleFileCursor> findStale(std::chrono::system_clock::time_point cutoff) = 0;
};

} // namespace coversync::domain
