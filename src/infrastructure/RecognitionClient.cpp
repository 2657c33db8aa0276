/**
 * @file RecognitionClient.cpp
 * @brief Implementation of RecognitionClient.
 */

#include "infrastructure/RecognitionClient.hpp"
#include "domain/Errors.hpp"
#include <iostream>

namespace coversync::infrastructure {

using json = nlohmann::json;

namespace {

// Ids arrive as numbers or strings depending on the catalog the cover came from.
std::optional<std::string> ReadId(const json& node, const char* key) {
    if (!node.contains(key)) return std::nullopt;
    const auto& value = node[key];
    if (value.is_string() && !value.get<std::string>().empty()) return value.get<std::string>();
    if (value.is_number_integer()) return std::to_string(value.get<long long>());
    return std::nullopt;
}

int ReadInt(const json& node, const char* key) {
    if (!node.contains(key)) return 0;
    const auto& value = node[key];
    if (value.is_number()) return value.get<int>();
    if (value.is_string()) {
        try {
            return std::stoi(value.get<std::string>());
        } catch (const std::exception&) {
            return 0;
        }
    }
    return 0;
}

} // namespace

RecognitionClient::RecognitionClient(ServiceEndpoint endpoint)
    : m_http(endpoint), m_executor(endpoint.name, endpoint.concurrency) {}

std::future<domain::RecognitionResult> RecognitionClient::recognizeAsync(const domain::RecognitionRequest& request) {
    return m_executor.submit([this, request]() { return recognize(request); }, request.cancelled);
}

domain::RecognitionResult RecognitionClient::recognize(const domain::RecognitionRequest& request) {
    std::vector<MultipartPart> parts;
    parts.push_back({"image", request.content, request.fileName, request.contentType});
    parts.push_back({"session_id", std::make_shared<const std::string>(request.sessionId), "", ""});
    if (request.seriesNameHint) {
        parts.push_back({"series_name", std::make_shared<const std::string>(*request.seriesNameHint), "", ""});
    }

    auto response = m_http.postMultipart("/image-matcher", parts);
    try {
        return ParseResponse(json::parse(response.body));
    } catch (const json::exception& e) {
        std::cerr << "[RecognitionClient] JSON Parse Error: " << e.what() << std::endl;
        throw domain::GatewayError(domain::GatewayError::Kind::HttpStatus, m_http.endpoint().name,
                                   std::string("Malformed recognition response: ") + e.what(), response.status);
    }
}

domain::RecognitionResult RecognitionClient::ParseResponse(const json& body) {
    domain::RecognitionResult result;
    result.totalMatches = ReadInt(body, "total_matches");

    if (!body.contains("top_matches") || !body["top_matches"].is_array()) {
        return result;
    }

    const json* best = nullptr;
    double bestSimilarity = -1.0;
    for (const auto& match : body["top_matches"]) {
        double similarity = match.value("similarity", 0.0);
        if (similarity > bestSimilarity) {
            best = &match;
            bestSimilarity = similarity;
        }
    }
    if (!best) {
        return result;
    }

    result.seriesName = best->value("comic_name", std::string());
    if (result.seriesName == "Unknown") {
        result.seriesName.clear();
    }
    result.confidence = bestSimilarity;
    result.inferredYear = ReadInt(*best, "year");
    result.inferredIssueCount = ReadInt(*best, "issue_count");
    result.catalogId = ReadId(*best, "parent_comic_vine_id");
    if (!result.catalogId) {
        result.catalogId = ReadId(*best, "comic_vine_id");
    }
    if (result.totalMatches == 0) {
        result.totalMatches = static_cast<int>(body["top_matches"].size());
    }
    return result;
}

} // namespace coversync::infrastructure
