/**
 * @file ReconciliationEngine.hpp
 * @brief Turns a recognition result into a catalog identity.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "domain/Catalog.hpp"
#include "domain/LiveCatalogService.hpp"
#include "domain/ProcessingState.hpp"
#include "domain/RecognitionResult.hpp"
#include "domain/SeriesRegistry.hpp"

namespace coversync::application {

enum class MatchSource {
    Mirror,       ///< Authoritative offline mirror hit.
    LiveCatalog,  ///< Provisional hit from the live API.
    None          ///< No source matched; the file ends UNRESOLVED.
};

std::string MatchSourceToString(MatchSource source);

/**
 * @struct ReconciliationOutcome
 * @brief Which source confirmed the candidate, with identifiers kept per provenance.
 */
struct ReconciliationOutcome {
    MatchSource source = MatchSource::None;
    domain::RecognitionResult recognition;
    std::optional<domain::CatalogSeries> mirrorSeries;
    std::optional<domain::LiveSeriesHit> catalogHit;
    std::optional<std::string> secondaryCatalogId;  ///< Recognition's own catalog id on a mirror hit.
    std::size_t mirrorCandidates = 0;               ///< >1 means the mirror held duplicate rows.

    bool resolved() const { return source != MatchSource::None; }

    domain::ProcessingState terminalState() const {
        return resolved() ? domain::ProcessingState::Processed : domain::ProcessingState::Unresolved;
    }

    /** @brief Display name of the confirmed series, or the raw candidate name when unresolved. */
    std::string seriesName() const;
};

/**
 * @class ReconciliationEngine
 * @brief Mirror first, live catalog second, UNRESOLVED otherwise.
 *
 * Gateway errors from the live catalog are not caught here.
 */
class ReconciliationEngine {
public:
    /** @param registry May be null when no series collaborator is wired. */
    ReconciliationEngine(domain::CatalogRepository& mirror,
                         domain::LiveCatalogService& liveCatalog,
                         domain::SeriesRegistry* registry);

    /**
     * @brief Resolves @p recognition and folds the identifiers into @p seriesId (0 = no series).
     */
    ReconciliationOutcome reconcile(const domain::RecognitionResult& recognition, std::int64_t seriesId);

    /** @brief Active issues of a mirror series ordered by sort code. */
    std::vector<domain::CatalogIssue> listIssues(std::int64_t mirrorSeriesId);

private:
    std::optional<domain::CatalogSeries> lookupMirror(const domain::RecognitionResult& recognition,
                                                      std::size_t& candidates);
    void recordIdentifiers(const ReconciliationOutcome& outcome, std::int64_t seriesId);

    domain::CatalogRepository& m_mirror;
    domain::LiveCatalogService& m_liveCatalog;
    domain::SeriesRegistry* m_registry;
};

} // namespace coversync::application
