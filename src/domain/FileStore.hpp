/**
 * @file FileStore.hpp
 * @brief Interface for the remote store holding original cover images.
 */

#pragma once

#include <future>
#include <memory>
#include <string>
#include "Cancellation.hpp"

namespace coversync::domain {

/**
 * @class FileStore
 * @brief Fetches and stores files outside the pipeline's own storage.
 */
class FileStore {
public:
    virtual ~FileStore() = default;

    /**
     * @brief Downloads a file. The future rethrows GatewayError or OversizedPayloadError,
     * or SessionAborted when @p cancelled was set before the download started.
     */
    virtual std::future<std::shared_ptr<const std::string>> fetchAsync(const std::string& remotePath,
                                                                       CancellationToken cancelled) = 0;

    /** @brief Uploads a file, replacing any existing content at @p remotePath. */
    virtual std::future<void> storeAsync(const std::string& remotePath,
                                         std::shared_ptr<const std::string> content,
                                         CancellationToken cancelled) = 0;
};

} // namespace coversync::domain
