/**
 * @file SeriesRegistry.hpp
 * @brief Narrow interface to the external Series collaborator.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace coversync::domain {

/**
 * @struct SeriesIdentifiers
 * @brief External identifiers accumulated for one series, kept apart by provenance.
 */
struct SeriesIdentifiers {
    std::set<std::string> mirrorIds;    ///< Offline mirror (authoritative).
    std::set<std::string> catalogIds;   ///< Live catalog API (provisional).
};

/**
 * @class SeriesRegistry
 * @brief The part of the Series entity the pipeline reads and writes.
 */
class SeriesRegistry {
public:
    virtual ~SeriesRegistry() = default;

    /** @brief Display name of a series, used as a recognition hint. */
    virtual std::optional<std::string> seriesName(std::int64_t seriesId) const = 0;

    /** @brief Adds identifiers to a series; existing ones are kept. */
    virtual void recordIdentifiers(std::int64_t seriesId,
                                   const std::vector<std::string>& mirrorIds,
                                   const std::vector<std::string>& catalogIds) = 0;

    virtual SeriesIdentifiers identifiers(std::int64_t seriesId) const = 0;

    /** @brief Stores a generated description for a series. */
    virtual void recordDescription(std::int64_t seriesId, const std::string& description) = 0;
};

} // namespace coversync::domain
