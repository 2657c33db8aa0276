/**
 * @file RecognitionResult.hpp
 * @brief Transient output of the recognition engine for one file.
 */

#pragma once

#include <optional>
#include <string>

namespace coversync::domain {

/**
 * @struct RecognitionResult
 * @brief Best candidate reported for a cover image.
 */
struct RecognitionResult {
    std::string seriesName;                 ///< Candidate series name.
    int inferredYear = 0;
    int inferredIssueCount = 0;
    double confidence = 0.0;                ///< Similarity score in [0, 1].
    std::optional<std::string> catalogId;   ///< Live-catalog id of the matched candidate, if reported.
    int totalMatches = 0;

    bool hasCandidate() const { return !seriesName.empty(); }
};

} // namespace coversync::domain
