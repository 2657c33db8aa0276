/**
 * @file ReconciliationEngine.cpp
 * @brief Implementation of ReconciliationEngine.
 */

#include "application/ReconciliationEngine.hpp"
#include <algorithm>
#include <iostream>

namespace coversync::application {

std::string MatchSourceToString(MatchSource source) {
    switch (source) {
        case MatchSource::Mirror: return "MIRROR";
        case MatchSource::LiveCatalog: return "LIVE_CATALOG";
        case MatchSource::None: return "NONE";
    }
    return "NONE";
}

std::string ReconciliationOutcome::seriesName() const {
    if (mirrorSeries) return mirrorSeries->name;
    if (catalogHit) return catalogHit->name;
    return recognition.seriesName;
}

ReconciliationEngine::ReconciliationEngine(domain::CatalogRepository& mirror,
                                           domain::LiveCatalogService& liveCatalog,
                                           domain::SeriesRegistry* registry)
    : m_mirror(mirror), m_liveCatalog(liveCatalog), m_registry(registry) {}

ReconciliationOutcome ReconciliationEngine::reconcile(const domain::RecognitionResult& recognition,
                                                      std::int64_t seriesId) {
    ReconciliationOutcome outcome;
    outcome.recognition = recognition;

    if (!recognition.hasCandidate()) {
        std::cout << "[ReconciliationEngine] No candidate reported, unresolved." << std::endl;
        return outcome;
    }

    // 1. Offline mirror, authoritative.
    auto mirrorHit = lookupMirror(recognition, outcome.mirrorCandidates);
    if (mirrorHit) {
        outcome.source = MatchSource::Mirror;
        outcome.mirrorSeries = mirrorHit;
        outcome.secondaryCatalogId = recognition.catalogId;
        recordIdentifiers(outcome, seriesId);
        return outcome;
    }

    // 2. Live catalog, provisional.
    auto hits = m_liveCatalog.searchSeriesAsync(recognition.seriesName, recognition.inferredYear).get();
    if (!hits.empty()) {
        auto best = std::find_if(hits.begin(), hits.end(), [&](const domain::LiveSeriesHit& hit) {
            return hit.issueCount == recognition.inferredIssueCount;
        });
        outcome.source = MatchSource::LiveCatalog;
        outcome.catalogHit = best != hits.end() ? *best : hits.front();
        recordIdentifiers(outcome, seriesId);
        return outcome;
    }

    std::cout << "[ReconciliationEngine] '" << recognition.seriesName << "' (" << recognition.inferredYear
              << ") not found in mirror or live catalog." << std::endl;
    return outcome;
}

std::optional<domain::CatalogSeries> ReconciliationEngine::lookupMirror(const domain::RecognitionResult& recognition,
                                                                        std::size_t& candidates) {
    auto rows = m_mirror.findSeriesExact(recognition.seriesName, recognition.inferredYear,
                                         recognition.inferredIssueCount);
    candidates = rows.size();
    if (rows.empty()) {
        return std::nullopt;
    }

    auto lowest = std::min_element(rows.begin(), rows.end(),
                                   [](const auto& a, const auto& b) { return a.id < b.id; });
    if (rows.size() > 1) {
        std::cerr << "[ReconciliationEngine] Ambiguous mirror match for '" << recognition.seriesName << "' ("
                  << recognition.inferredYear << ", " << recognition.inferredIssueCount << " issues): "
                  << rows.size() << " rows, using id " << lowest->id << std::endl;
    }
    return *lowest;
}

void ReconciliationEngine::recordIdentifiers(const ReconciliationOutcome& outcome, std::int64_t seriesId) {
    if (!m_registry || seriesId == 0) return;

    std::vector<std::string> mirrorIds;
    std::vector<std::string> catalogIds;
    if (outcome.mirrorSeries) {
        mirrorIds.push_back(std::to_string(outcome.mirrorSeries->id));
    }
    if (outcome.catalogHit) {
        catalogIds.push_back(outcome.catalogHit->id);
    }
    if (outcome.secondaryCatalogId) {
        catalogIds.push_back(*outcome.secondaryCatalogId);
    }
    m_registry->recordIdentifiers(seriesId, mirrorIds, catalogIds);
}

std::vector<domain::CatalogIssue> ReconciliationEngine::listIssues(std::int64_t mirrorSeriesId) {
    auto issues = m_mirror.findActiveIssues(mirrorSeriesId);
    issues.erase(std::remove_if(issues.begin(), issues.end(),
                                [](const domain::CatalogIssue& issue) { return !issue.active; }),
                 issues.end());
    std::stable_sort(issues.begin(), issues.end(),
                     [](const auto& a, const auto& b) { return a.sortCode < b.sortCode; });
    return issues;
}

} // namespace coversync::application
