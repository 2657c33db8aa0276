#include "infrastructure/InferenceClient.hpp"
#include <iostream>

namespace coversync::infrastructure {

using json = nlohmann::json;

namespace {
constexpr double kDescriptionTemperature = 0.7;
constexpr const char* kSystemPrompt =
    "You are a comic book expert who writes engaging, concise descriptions for comic book series. "
    "Keep descriptions under 150 words and focus on plot and characters.";
}

InferenceClient::InferenceClient(ServiceEndpoint endpoint, std::string model)
    : m_http(endpoint), m_executor(endpoint.name, endpoint.concurrency), m_model(std::move(model)) {}

std::future<std::optional<std::string>> InferenceClient::describeSeriesAsync(const std::string& seriesName,
                                                                              int yearBegan) {
    return m_executor.submit([this, seriesName, yearBegan]() {
        std::string prompt = "Generate a concise, engaging description for this comic book series:\n\n";
        prompt += "Series: " + seriesName + "\n";
        if (yearBegan > 0) {
            prompt += "Started: " + std::to_string(yearBegan) + "\n";
        }
        prompt += "\nWrite a 2-3 sentence description. Do not include publication details or meta information.";

        json messages = json::array({
            {{"role", "system"}, {"content", kSystemPrompt}},
            {{"role", "user"}, {"content", prompt}}
        });
        return chat(messages);
    });
}

std::optional<std::string> InferenceClient::chat(const json& messages, int maxTokens) {
    json requestData = {
        {"model", m_model},
        {"messages", messages},
        {"max_tokens", maxTokens},
        {"temperature", kDescriptionTemperature}
    };

    auto res = m_http.postJson("/chat/completions", requestData.dump());
    try {
        auto body = json::parse(res.body);
        if (body.contains("choices") && body["choices"].is_array() && !body["choices"].empty()) {
            const auto& message = body["choices"][0]["message"];
            if (message.contains("content") && message["content"].is_string()) {
                return message["content"].get<std::string>();
            }
        }
    } catch (const json::exception& e) {
        std::cerr << "[InferenceClient] JSON Parse Error: " << e.what() << std::endl;
    }
    return std::nullopt;
}

} // namespace coversync::infrastructure
