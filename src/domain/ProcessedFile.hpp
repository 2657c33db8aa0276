/**
 * @file ProcessedFile.hpp
 * @brief Domain entity representing one row of the dedup ledger.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include "ProcessingState.hpp"

namespace coversync::domain {

/**
 * @struct ProcessedFile
 * @brief One ingested file within one session, keyed by its content fingerprint.
 */
struct ProcessedFile {
    std::int64_t id = 0;            ///< Ledger key, 0 until first persisted.
    std::string sessionId;          ///< Submission grouping key.
    std::int64_t seriesId = 0;      ///< Weak reference to the owning catalog series.
    std::string fileName;
    std::string filePath;
    std::string fileEtag;           ///< SHA-256 of the file bytes (globally unique).
    std::int64_t fileSize = 0;
    ProcessingState state = ProcessingState::Queued;
    std::optional<std::chrono::system_clock::time_point> processedAt; ///< Set on terminal states.
    std::string errorMessage;
    std::string detailJson;         ///< Terminal payload, replayed on dedup hits.
    std::int64_t version = 0;       ///< Optimistic concurrency counter.

    bool isPersisted() const { return id != 0; }
};

} // namespace coversync::domain
