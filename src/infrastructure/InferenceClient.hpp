/**
 * @file InferenceClient.hpp
 * @brief Client for an OpenAI-compatible chat-completion API.
 */

#pragma once

#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "domain/DescriptionService.hpp"
#include "infrastructure/BackendExecutor.hpp"
#include "infrastructure/RemoteServiceClient.hpp"

namespace coversync::infrastructure {

class InferenceClient : public domain::DescriptionService {
public:
    InferenceClient(ServiceEndpoint endpoint, std::string model);

    std::future<std::optional<std::string>> describeSeriesAsync(const std::string& seriesName,
                                                                 int yearBegan) override;

    /** @brief Sends a POST request to /chat/completions and returns the first choice. */
    std::optional<std::string> chat(const nlohmann::json& messages, int maxTokens = 200);

private:
    RemoteServiceClient m_http;
    BackendExecutor m_executor;
    std::string m_model;
};

} // namespace coversync::infrastructure
