/**
 * @file LiveCatalogClient.cpp
 * @brief Implementation of LiveCatalogClient.
 */

#include "infrastructure/LiveCatalogClient.hpp"
#include "domain/Errors.hpp"
#include <algorithm>
#include <cctype>
#include <iostream>
#include <optional>

namespace coversync::infrastructure {

using json = nlohmann::json;

namespace {

constexpr int kSearchLimit = 25;
constexpr int kInvalidApiKeyStatus = 100;

std::string ToLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

int ReadYear(const json& node) {
    if (!node.contains("start_year")) return 0;
    const auto& value = node["start_year"];
    if (value.is_number_integer()) return value.get<int>();
    if (value.is_string()) {
        try {
            return std::stoi(value.get<std::string>());
        } catch (const std::exception&) {
            return 0;
        }
    }
    return 0;
}

std::optional<std::string> ReadId(const json& node) {
    if (!node.contains("id")) return std::nullopt;
    const auto& value = node["id"];
    if (value.is_number_integer()) return std::to_string(value.get<long long>());
    if (value.is_string() && !value.get<std::string>().empty()) return value.get<std::string>();
    return std::nullopt;
}

std::string ReadString(const json& node, const char* key) {
    if (!node.is_object() || !node.contains(key) || !node[key].is_string()) return std::string();
    return node[key].get<std::string>();
}

} // namespace

LiveCatalogClient::LiveCatalogClient(ServiceEndpoint endpoint)
    : m_http(endpoint), m_executor(endpoint.name, endpoint.concurrency) {}

std::future<std::vector<domain::LiveSeriesHit>> LiveCatalogClient::searchSeriesAsync(const std::string& name, int year) {
    return m_executor.submit([this, name, year]() { return searchSeries(name, year); });
}

std::vector<domain::LiveSeriesHit> LiveCatalogClient::searchSeries(const std::string& name, int year) {
    auto response = m_http.get("/search/", {
        {"format", "json"},
        {"query", name},
        {"resources", "volume"},
        {"limit", std::to_string(kSearchLimit)}
    });

    json body;
    try {
        body = json::parse(response.body);
    } catch (const json::exception& e) {
        std::cerr << "[LiveCatalogClient] JSON Parse Error: " << e.what() << std::endl;
        throw domain::GatewayError(domain::GatewayError::Kind::HttpStatus, m_http.endpoint().name,
                                   std::string("Malformed search response: ") + e.what(), response.status);
    }

    if (!body.is_object()) {
        throw domain::GatewayError(domain::GatewayError::Kind::HttpStatus, m_http.endpoint().name,
                                   "Malformed search response: not a JSON object", response.status);
    }
    const auto status = body.find("status_code");
    if (status != body.end() && status->is_number_integer() && status->get<int>() == kInvalidApiKeyStatus) {
        std::cerr << "[LiveCatalogClient] Authentication failed. Please check the API key." << std::endl;
        throw domain::GatewayError(domain::GatewayError::Kind::Unauthorized, m_http.endpoint().name,
                                   "Invalid API key", response.status);
    }

    auto hits = FilterResults(body, name, year);
    std::cout << "[LiveCatalogClient] '" << name << "' (" << year << "): " << hits.size() << " hit(s)" << std::endl;
    return hits;
}

std::vector<domain::LiveSeriesHit> LiveCatalogClient::FilterResults(const json& body,
                                                                    const std::string& name, int year) {
    std::vector<domain::LiveSeriesHit> hits;
    if (!body.contains("results") || !body["results"].is_array()) {
        return hits;
    }

    const std::string wanted = ToLower(name);
    for (const auto& item : body["results"]) {
        if (!item.is_object()) continue;
        if (item.contains("resource_type") && ReadString(item, "resource_type") != "volume") continue;

        auto id = ReadId(item);
        if (!id || !item.contains("name") || !item["name"].is_string()) {
            std::cerr << "[LiveCatalogClient] Skipping result without usable id or name" << std::endl;
            continue;
        }

        domain::LiveSeriesHit hit;
        hit.name = item["name"].get<std::string>();
        hit.startYear = ReadYear(item);
        if (ToLower(hit.name) != wanted || hit.startYear != year) continue;

        hit.id = *id;
        if (item.contains("count_of_issues") && item["count_of_issues"].is_number_integer()) {
            hit.issueCount = item["count_of_issues"].get<int>();
        }
        if (item.contains("publisher")) {
            hit.publisher = ReadString(item["publisher"], "name");
        }
        hits.push_back(std::move(hit));
    }
    return hits;
}

} // namespace coversync::infrastructure
