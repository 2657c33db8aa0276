/**
 * @file PipelineContext.hpp
 * @brief Collaborators and tuning of the pipeline, wired once at startup.
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include "application/ProgressBroadcaster.hpp"
#include "application/ReconciliationEngine.hpp"
#include "domain/DescriptionService.hpp"
#include "domain/FileStore.hpp"
#include "domain/ProcessedFileRepository.hpp"
#include "domain/RecognitionService.hpp"
#include "domain/SeriesRegistry.hpp"

namespace coversync::application {

struct PipelineSettings {
    int maxConcurrentFiles = 4;                          ///< Worker threads per session.
    int maxAttempts = 3;                                 ///< Per gateway call, first try included.
    std::chrono::milliseconds initialBackoff{500};
    double backoffMultiplier = 2.0;
    std::chrono::milliseconds maxBackoff{8000};
    std::chrono::milliseconds cancellationPoll{50};
    std::size_t maxUploadBytes = 500ull * 1024 * 1024;   ///< Larger files are rejected at submission.
    bool generateDescriptions = false;
    std::string archivePrefix;                           ///< Uploaded bytes are copied to the file store below it; empty disables.
};

/**
 * @struct PipelineContext
 * @brief Everything the orchestrator talks to. Optional collaborators may be null.
 *
 * All referenced objects must outlive the components built from the context.
 */
struct PipelineContext {
    domain::ProcessedFileRepository& ledger;
    domain::RecognitionService& recognition;
    ReconciliationEngine& reconciliation;
    ProgressBroadcaster& broadcaster;
    domain::FileStore* fileStore = nullptr;
    domain::DescriptionService* descriptions = nullptr;
    domain::SeriesRegistry* seriesRegistry = nullptr;
    PipelineSettings settings;
};

} // namespace coversync::application
