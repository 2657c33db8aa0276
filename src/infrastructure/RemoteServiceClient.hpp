/**
 * @file RemoteServiceClient.hpp
 * @brief Uniform HTTP access to one remote backend.
 */

#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>
#include "infrastructure/ServiceEndpoint.hpp"

namespace coversync::infrastructure {

struct RemoteResponse {
    int status = 0;
    std::string body;
    std::string contentType;
    std::size_t bytesReceived = 0;
};

/** @brief One field of a multipart/form-data request. Plain fields leave `filename` empty. */
struct MultipartPart {
    std::string name;
    std::shared_ptr<const std::string> content;
    std::string filename;
    std::string contentType;
};

using QueryParams = std::vector<std::pair<std::string, std::string>>;

/** @brief Receives downloaded chunks. Returning false cancels the transfer. */
using ChunkSink = std::function<bool(const char* data, std::size_t length)>;

/**
 * @class RemoteServiceClient
 * @brief Applies an endpoint's address, auth and size policy to every call.
 *
 * Payloads are not interpreted. Failures surface as domain::GatewayError:
 * 401/403 map to Unauthorized, timeouts to Timeout, connection failures to
 * Unreachable and any other non-2xx status to HttpStatus. Request bodies
 * larger than `maxBufferBytes` are rejected with domain::OversizedPayloadError
 * before anything is sent, and buffered responses are cut off as soon as they
 * pass the same cap. Multipart and PUT bodies are written straight from the
 * caller's shared buffers. A new connection is opened per call, so one
 * instance may be shared between threads.
 */
class RemoteServiceClient {
public:
    explicit RemoteServiceClient(ServiceEndpoint endpoint);

    RemoteResponse get(const std::string& path, const QueryParams& query = {});
    RemoteResponse postJson(const std::string& path, const std::string& jsonBody);
    RemoteResponse postMultipart(const std::string& path, const std::vector<MultipartPart>& parts);
    RemoteResponse put(const std::string& path, std::shared_ptr<const std::string> body,
                       const std::string& contentType);

    /**
     * @brief Streams a GET response into @p sink without buffering it.
     * @return Number of bytes delivered to the sink.
     */
    std::size_t download(const std::string& path, const ChunkSink& sink);

    const ServiceEndpoint& endpoint() const { return m_endpoint; }

    /** @brief Percent-encodes a query component (RFC 3986 unreserved set kept). */
    static std::string EncodeComponent(const std::string& value);

private:
    struct Call {
        std::string method;
        std::string path;
        QueryParams query;
        std::vector<std::shared_ptr<const std::string>> body;   ///< Sent back to back, never joined.
        std::string contentType;
        const ChunkSink* sink = nullptr;
    };

    RemoteResponse execute(const Call& call);
    std::string buildTarget(const std::string& path, const QueryParams& query) const;
    void checkRequestSize(std::size_t size) const;

    ServiceEndpoint m_endpoint;
    std::string m_origin;
    std::string m_prefix;
};

} // namespace coversync::infrastructure
