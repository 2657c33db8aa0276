/**
 * @file RecognitionClient.hpp
 * @brief HTTP client for the cover-recognition engine.
 */

#pragma once

#include <nlohmann/json.hpp>
#include "domain/RecognitionService.hpp"
#include "infrastructure/BackendExecutor.hpp"
#include "infrastructure/RemoteServiceClient.hpp"

namespace coversync::infrastructure {

/**
 * @class RecognitionClient
 * @brief Uploads cover images to `<prefix>/image-matcher` and reads back `top_matches`.
 *
 * Calls run on the client's own BackendExecutor.
 */
class RecognitionClient : public domain::RecognitionService {
public:
    explicit RecognitionClient(ServiceEndpoint endpoint);

    std::future<domain::RecognitionResult> recognizeAsync(const domain::RecognitionRequest& request) override;

    /** @brief Blocking variant of recognizeAsync(). */
    domain::RecognitionResult recognize(const domain::RecognitionRequest& request);

    /** @brief Picks the best entry of `top_matches`; an empty list yields a result without candidate. */
    static domain::RecognitionResult ParseResponse(const nlohmann::json& body);

private:
    RemoteServiceClient m_http;
    BackendExecutor m_executor;
};

} // namespace coversync::infrastructure
