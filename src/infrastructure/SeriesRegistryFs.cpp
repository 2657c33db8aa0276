/**
 * @file SeriesRegistryFs.cpp
 * @brief Implementation of SeriesRegistryFs.
 */

#include "infrastructure/SeriesRegistryFs.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>
#include "domain/Errors.hpp"

namespace coversync::infrastructure {

using json = nlohmann::json;

SeriesRegistryFs::SeriesRegistryFs(std::string path, PersistenceService& persistence)
    : m_path(std::move(path)), m_persistence(persistence) {
    load();
}

void SeriesRegistryFs::load() {
    if (!std::filesystem::exists(m_path)) {
        return;
    }

    std::ifstream f(m_path);
    json j;
    try {
        f >> j;
        for (const auto& item : j.at("series")) {
            Entry entry;
            entry.name = item.value("name", "");
            entry.description = item.value("description", "");
            for (const auto& id : item.value("mirrorIds", json::array())) {
                entry.ids.mirrorIds.insert(id.get<std::string>());
            }
            for (const auto& id : item.value("catalogIds", json::array())) {
                entry.ids.catalogIds.insert(id.get<std::string>());
            }
            m_series[item.at("id").get<std::int64_t>()] = std::move(entry);
        }
    } catch (const json::exception& e) {
        throw domain::ConfigError("Series registry " + m_path + " is malformed: " + e.what());
    }
    std::cout << "[SeriesRegistry] Loaded " << m_series.size() << " series from " << m_path << std::endl;
}

void SeriesRegistryFs::saveLocked() {
    json series = json::array();
    for (const auto& [id, entry] : m_series) {
        series.push_back({
            {"id", id},
            {"name", entry.name},
            {"mirrorIds", entry.ids.mirrorIds},
            {"catalogIds", entry.ids.catalogIds},
            {"description", entry.description}
        });
    }
    m_persistence.saveTextAsync(m_path, json{{"series", series}}.dump(2));
}

void SeriesRegistryFs::registerSeries(std::int64_t seriesId, const std::string& name) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_series[seriesId].name = name;
    saveLocked();
}

std::optional<std::string> SeriesRegistryFs::seriesName(std::int64_t seriesId) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_series.find(seriesId);
    if (it == m_series.end() || it->second.name.empty()) {
        return std::nullopt;
    }
    return it->second.name;
}

void SeriesRegistryFs::recordIdentifiers(std::int64_t seriesId,
                                         const std::vector<std::string>& mirrorIds,
                                         const std::vector<std::string>& catalogIds) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto& ids = m_series[seriesId].ids;
    const auto before = ids.mirrorIds.size() + ids.catalogIds.size();
    ids.mirrorIds.insert(mirrorIds.begin(), mirrorIds.end());
    ids.catalogIds.insert(catalogIds.begin(), catalogIds.end());
    if (ids.mirrorIds.size() + ids.catalogIds.size() != before) {
        saveLocked();
    }
}

domain::SeriesIdentifiers SeriesRegistryFs::identifiers(std::int64_t seriesId) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_series.find(seriesId);
    return it == m_series.end() ? domain::SeriesIdentifiers{} : it->second.ids;
}

void SeriesRegistryFs::recordDescription(std::int64_t seriesId, const std::string& description) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_series[seriesId].description = description;
    saveLocked();
}

std::optional<std::string> SeriesRegistryFs::description(std::int64_t seriesId) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_series.find(seriesId);
    if (it == m_series.end() || it->second.description.empty()) {
        return std::nullopt;
    }
    return it->second.description;
}

} // namespace coversync::infrastructure
