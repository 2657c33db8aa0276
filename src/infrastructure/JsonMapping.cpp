/**
 * @file JsonMapping.cpp
 * @brief Implementation of the JSON mapping functions.
 */

#include "infrastructure/JsonMapping.hpp"
#include <ctime>
#include <iomanip>
#include <sstream>

namespace coversync::infrastructure {

using json = nlohmann::json;

namespace {

std::tm ToUtcTime(std::time_t tt) {
    std::tm tm = {};
#if defined(_WIN32)
    gmtime_s(&tm, &tt);
#else
    gmtime_r(&tt, &tm);
#endif
    return tm;
}

json ParseOrString(const std::string& text) {
    auto parsed = json::parse(text, nullptr, false);
    if (parsed.is_discarded()) {
        return text;
    }
    return parsed;
}

} // namespace

std::string FormatTimestamp(std::chrono::system_clock::time_point time) {
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(time.time_since_epoch()).count() % 1000;
    if (ms < 0) ms += 1000;
    std::tm tm = ToUtcTime(std::chrono::system_clock::to_time_t(time));

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << ms << 'Z';
    return oss.str();
}

json ToJson(const domain::ProgressEvent& event) {
    json j = {
        {"type", domain::ProgressEvent::Type},
        {"sessionId", event.sessionId},
        {"fileName", event.fileName},
        {"state", domain::StateToString(event.newState)},
        {"timestamp", FormatTimestamp(event.timestamp)}
    };
    if (event.oldState) {
        j["previousState"] = domain::StateToString(*event.oldState);
    }
    if (event.detailJson && !event.detailJson->empty()) {
        j["detail"] = ParseOrString(*event.detailJson);
    }
    return j;
}

json HeartbeatJson(std::chrono::system_clock::time_point time) {
    return {{"type", "heartbeat"}, {"timestamp", FormatTimestamp(time)}};
}

json ToJson(const domain::ProcessedFile& file) {
    json j = {
        {"id", file.id},
        {"sessionId", file.sessionId},
        {"seriesId", file.seriesId},
        {"fileName", file.fileName},
        {"filePath", file.filePath},
        {"fileEtag", file.fileEtag},
        {"fileSize", file.fileSize},
        {"processingState", domain::StateToString(file.state)}
    };
    if (file.processedAt) {
        j["processedAt"] = FormatTimestamp(*file.processedAt);
    }
    if (!file.errorMessage.empty()) {
        j["errorMessage"] = file.errorMessage;
    }
    if (!file.detailJson.empty()) {
        j["detail"] = ParseOrString(file.detailJson);
    }
    return j;
}

json ToJson(const domain::RecognitionResult& result) {
    json j = {
        {"seriesName", result.seriesName},
        {"inferredYear", result.inferredYear},
        {"inferredIssueCount", result.inferredIssueCount},
        {"confidence", result.confidence},
        {"totalMatches", result.totalMatches}
    };
    if (result.catalogId) {
        j["catalogId"] = *result.catalogId;
    }
    return j;
}

domain::RecognitionResult RecognitionResultFromJson(const json& j) {
    domain::RecognitionResult result;
    result.seriesName = j.value("seriesName", std::string());
    result.inferredYear = j.value("inferredYear", 0);
    result.inferredIssueCount = j.value("inferredIssueCount", 0);
    result.confidence = j.value("confidence", 0.0);
    result.totalMatches = j.value("totalMatches", 0);
    if (j.contains("catalogId") && j["catalogId"].is_string()) {
        result.catalogId = j["catalogId"].get<std::string>();
    }
    return result;
}

json ToJson(const domain::CatalogIssue& issue) {
    return {
        {"id", issue.id},
        {"number", issue.number},
        {"keyDate", issue.keyDate},
        {"publicationDate", issue.publicationDate},
        {"sortCode", issue.sortCode}
    };
}

json ToJson(const application::ReconciliationOutcome& outcome, const std::vector<domain::CatalogIssue>& issues) {
    json j = {
        {"outcome", outcome.resolved() ? "MATCHED" : "UNRESOLVED"},
        {"source", application::MatchSourceToString(outcome.source)},
        {"seriesName", outcome.seriesName()},
        {"confidence", outcome.recognition.confidence},
        {"recognition", ToJson(outcome.recognition)}
    };
    if (outcome.mirrorSeries) {
        j["mirrorSeriesId"] = outcome.mirrorSeries->id;
        j["yearBegan"] = outcome.mirrorSeries->yearBegan;
        j["issueCount"] = outcome.mirrorSeries->issueCount;
    }
    if (outcome.mirrorCandidates > 1) {
        j["mirrorCandidates"] = outcome.mirrorCandidates;
    }
    if (outcome.catalogHit) {
        j["catalogId"] = outcome.catalogHit->id;
        j["yearBegan"] = outcome.catalogHit->startYear;
        j["issueCount"] = outcome.catalogHit->issueCount;
        if (!outcome.catalogHit->publisher.empty()) {
            j["publisher"] = outcome.catalogHit->publisher;
        }
    }
    if (outcome.secondaryCatalogId) {
        j["secondaryCatalogId"] = *outcome.secondaryCatalogId;
    }
    if (!issues.empty()) {
        json list = json::array();
        for (const auto& issue : issues) {
            list.push_back(ToJson(issue));
        }
        j["issues"] = list;
    }
    return j;
}

json ToJson(const application::SubmissionReceipt& receipt) {
    json j = {{"fileName", receipt.fileName}, {"accepted", receipt.accepted}};
    if (!receipt.reason.empty()) {
        j["reason"] = receipt.reason;
    }
    return j;
}

std::string FailureDetail(const std::string& reason) {
    return json{{"reason", reason}}.dump();
}

} // namespace coversync::infrastructure
