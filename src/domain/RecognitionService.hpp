/**
 * @file RecognitionService.hpp
 * @brief Interface for the external cover-recognition engine.
 */

#pragma once

#include <future>
#include <memory>
#include <optional>
#include <string>
#include "Cancellation.hpp"
#include "RecognitionResult.hpp"

namespace coversync::domain {

/**
 * @struct RecognitionRequest
 * @brief One cover image to identify.
 */
struct RecognitionRequest {
    std::string sessionId;
    std::string fileName;
    std::string contentType = "image/jpeg";
    std::shared_ptr<const std::string> content;     ///< Raw image bytes.
    std::optional<std::string> seriesNameHint;      ///< Name of the owning series, if known.
    CancellationToken cancelled;                    ///< Skip the call if set before it starts.
};

/**
 * @class RecognitionService
 * @brief Abstract interface for services that identify a comic cover from its image.
 */
class RecognitionService {
public:
    virtual ~RecognitionService() = default;

    /**
     * @brief Dispatches one image for recognition.
     * @return Future holding the best candidate. The future rethrows
     *         GatewayError or OversizedPayloadError on failure.
     */
    virtual std::future<RecognitionResult> recognizeAsync(const RecognitionRequest& request) = 0;
};

} // namespace coversync::domain
