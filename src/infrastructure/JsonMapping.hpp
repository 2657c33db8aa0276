/**
 * @file JsonMapping.hpp
 * @brief Explicit conversions between pipeline types and their JSON shapes.
 *
 * Every field is listed by hand. Optional fields are omitted when absent
 * rather than written as null.
 */

#pragma once

#include <chrono>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "application/PipelineOrchestrator.hpp"
#include "application/ReconciliationEngine.hpp"
#include "domain/Catalog.hpp"
#include "domain/ProcessedFile.hpp"
#include "domain/ProgressEvent.hpp"
#include "domain/RecognitionResult.hpp"

namespace coversync::infrastructure {

/** @brief ISO-8601 UTC with milliseconds, e.g. 2024-05-01T12:00:00.250Z. */
std::string FormatTimestamp(std::chrono::system_clock::time_point time);

/**
 * @brief Stream payload `{type, sessionId, fileName, state, previousState?, timestamp, detail?}`.
 * A detail that is not valid JSON is sent as a string.
 */
nlohmann::json ToJson(const domain::ProgressEvent& event);

nlohmann::json HeartbeatJson(std::chrono::system_clock::time_point time);

/** @brief Ledger row for reporting. `version` stays internal. */
nlohmann::json ToJson(const domain::ProcessedFile& file);

nlohmann::json ToJson(const domain::RecognitionResult& result);
domain::RecognitionResult RecognitionResultFromJson(const nlohmann::json& json);

nlohmann::json ToJson(const domain::CatalogIssue& issue);

/**
 * @brief Terminal payload of a reconciled file.
 * @param issues Active issues of the mirror series; written as `issues` when not empty.
 */
nlohmann::json ToJson(const application::ReconciliationOutcome& outcome,
                      const std::vector<domain::CatalogIssue>& issues = {});

nlohmann::json ToJson(const application::SubmissionReceipt& receipt);

/** @brief `{"reason": reason}`, the detail carried by FAILED rows. */
std::string FailureDetail(const std::string& reason);

} // namespace coversync::infrastructure
