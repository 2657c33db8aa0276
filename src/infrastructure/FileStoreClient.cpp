/**
 * @file FileStoreClient.cpp
 * @brief Implementation of FileStoreClient.
 */

#include "infrastructure/FileStoreClient.hpp"
#include "domain/Errors.hpp"
#include <iostream>

namespace coversync::infrastructure {

FileStoreClient::FileStoreClient(ServiceEndpoint endpoint)
    : m_http(endpoint), m_executor(endpoint.name, endpoint.concurrency) {}

std::string FileStoreClient::EncodePath(const std::string& remotePath) {
    std::string encoded;
    std::size_t start = 0;
    while (start <= remotePath.size()) {
        auto slash = remotePath.find('/', start);
        auto end = slash == std::string::npos ? remotePath.size() : slash;
        encoded += RemoteServiceClient::EncodeComponent(remotePath.substr(start, end - start));
        if (slash == std::string::npos) break;
        encoded += '/';
        start = slash + 1;
    }
    if (encoded.empty() || encoded.front() != '/') {
        encoded.insert(encoded.begin(), '/');
    }
    return encoded;
}

std::future<std::shared_ptr<const std::string>> FileStoreClient::fetchAsync(const std::string& remotePath,
                                                                            domain::CancellationToken cancelled) {
    return m_executor.submit([this, remotePath]() { return fetch(remotePath); }, std::move(cancelled));
}

std::future<void> FileStoreClient::storeAsync(const std::string& remotePath,
                                              std::shared_ptr<const std::string> content,
                                              domain::CancellationToken cancelled) {
    return m_executor.submit([this, remotePath, content]() { store(remotePath, content); }, std::move(cancelled));
}

std::shared_ptr<const std::string> FileStoreClient::fetch(const std::string& remotePath) {
    const std::size_t limit = m_http.endpoint().maxBufferBytes;
    auto content = std::make_shared<std::string>();
    std::size_t seen = 0;
    bool oversized = false;

    m_http.download(EncodePath(remotePath), [&](const char* data, std::size_t length) {
        seen += length;
        if (seen > limit) {
            oversized = true;
            return false;
        }
        content->append(data, length);
        return true;
    });

    if (oversized) {
        throw domain::OversizedPayloadError(m_http.endpoint().name, seen, limit);
    }
    std::cout << "[FileStoreClient] Fetched " << remotePath << " (" << content->size() << " bytes)" << std::endl;
    return content;
}

void FileStoreClient::store(const std::string& remotePath, const std::shared_ptr<const std::string>& content) {
    m_http.put(EncodePath(remotePath), content, "application/octet-stream");
    std::cout << "[FileStoreClient] Stored " << remotePath << " (" << content->size() << " bytes)" << std::endl;
}

} // namespace coversync::infrastructure
