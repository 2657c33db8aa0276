/**
 * @file FileStoreClient.hpp
 * @brief WebDAV client for the remote cover store.
 */

#pragma once

#include "domain/FileStore.hpp"
#include "infrastructure/BackendExecutor.hpp"
#include "infrastructure/RemoteServiceClient.hpp"

namespace coversync::infrastructure {

/**
 * @class FileStoreClient
 * @brief GET/PUT of original cover images with Basic credentials.
 *
 * Downloads stream through RemoteServiceClient::download(); the collected
 * body is still limited by the endpoint's `maxBufferBytes`.
 */
class FileStoreClient : public domain::FileStore {
public:
    explicit FileStoreClient(ServiceEndpoint endpoint);

    std::future<std::shared_ptr<const std::string>> fetchAsync(const std::string& remotePath,
                                                               domain::CancellationToken cancelled) override;
    std::future<void> storeAsync(const std::string& remotePath, std::shared_ptr<const std::string> content,
                                 domain::CancellationToken cancelled) override;

    std::shared_ptr<const std::string> fetch(const std::string& remotePath);

    /** @brief PUTs @p content, streaming it from the shared buffer. */
    void store(const std::string& remotePath, const std::shared_ptr<const std::string>& content);

    /** @brief Percent-encodes every segment of @p remotePath, keeping the separators. */
    static std::string EncodePath(const std::string& remotePath);

private:
    RemoteServiceClient m_http;
    BackendExecutor m_executor;
};

} // namespace coversync::infrastructure
