/**
 * @file SeriesRegistryFs.hpp
 * @brief JSON-file implementation of the SeriesRegistry.
 */

#pragma once
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include "domain/SeriesRegistry.hpp"
#include "infrastructure/PersistenceService.hpp"

namespace coversync::infrastructure {

/**
 * @class SeriesRegistryFs
 * @brief Keeps series names, identifiers and descriptions in memory and
 * snapshots them to a JSON file after every change.
 */
class SeriesRegistryFs : public domain::SeriesRegistry {
public:
    /**
     * @param path JSON file; loaded if present.
     * @param persistence Writer used for the snapshots. Must outlive the registry.
     */
    SeriesRegistryFs(std::string path, PersistenceService& persistence);

    /** @brief Creates or renames a series. */
    void registerSeries(std::int64_t seriesId, const std::string& name);

    /** @see domain::SeriesRegistry::seriesName */
    std::optional<std::string> seriesName(std::int64_t seriesId) const override;

    /** @see domain::SeriesRegistry::recordIdentifiers */
    void recordIdentifiers(std::int64_t seriesId,
                           const std::vector<std::string>& mirrorIds,
                           const std::vector<std::string>& catalogIds) override;

    domain::SeriesIdentifiers identifiers(std::int64_t seriesId) const override;

    void recordDescription(std::int64_t seriesId, const std::string& description) override;

    std::optional<std::string> description(std::int64_t seriesId) const;

private:
    struct Entry {
        std::string name;
        domain::SeriesIdentifiers ids;
        std::string description;
    };

    void load();
    void saveLocked();

    const std::string m_path;
    PersistenceService& m_persistence;
    mutable std::mutex m_mutex;
    std::map<std::int64_t, Entry> m_series;
};

} // namespace coversync::infrastructure
