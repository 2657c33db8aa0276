/**
 * @file RemoteServiceClient.cpp
 * @brief Implementation of RemoteServiceClient on cpp-httplib.
 */

#include "infrastructure/RemoteServiceClient.hpp"
#include "domain/Errors.hpp"
#include <httplib.h>
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <iostream>
#include <random>
#include <sstream>

namespace coversync::infrastructure {

namespace {

constexpr std::size_t kErrorBodyLimit = 4096;
constexpr std::size_t kUploadChunk = 64 * 1024;

bool IsTimeout(httplib::Error error) {
    switch (error) {
        case httplib::Error::ConnectionTimeout:
        case httplib::Error::Read:
        case httplib::Error::Write:
            return true;
        default:
            return false;
    }
}

using BodyPieces = std::vector<std::shared_ptr<const std::string>>;

/** Serves [offset, offset + length) of the concatenated pieces, one chunk per call. */
bool WritePieces(const BodyPieces& pieces, std::size_t offset, std::size_t length, httplib::DataSink& sink) {
    std::size_t start = 0;
    for (const auto& piece : pieces) {
        if (offset < start + piece->size()) {
            const std::size_t from = offset - start;
            const std::size_t count = std::min({length, piece->size() - from, kUploadChunk});
            return sink.write(piece->data() + from, count);
        }
        start += piece->size();
    }
    return false;
}

std::shared_ptr<const std::string> Text(std::string value) {
    return std::make_shared<const std::string>(std::move(value));
}

std::string MakeBoundary() {
    std::random_device rd;
    std::mt19937_64 gen(rd());
    std::ostringstream oss;
    oss << "----CoverSyncBoundary" << std::hex << gen() << gen();
    return oss.str();
}

} // namespace

RemoteServiceClient::RemoteServiceClient(ServiceEndpoint endpoint) : m_endpoint(std::move(endpoint)) {
    std::string url = m_endpoint.baseUrl;
    if (url.find("://") == std::string::npos) {
        url = "http://" + url;
    }
    auto hostStart = url.find("://") + 3;
    auto pathStart = url.find('/', hostStart);
    if (pathStart == std::string::npos) {
        m_origin = url;
    } else {
        m_origin = url.substr(0, pathStart);
        m_prefix = url.substr(pathStart);
        while (!m_prefix.empty() && m_prefix.back() == '/') {
            m_prefix.pop_back();
        }
    }
}

std::string RemoteServiceClient::EncodeComponent(const std::string& value) {
    std::ostringstream oss;
    oss << std::uppercase << std::hex;
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            oss << c;
        } else {
            oss << '%' << std::setw(2) << std::setfill('0') << static_cast<int>(c);
        }
    }
    return oss.str();
}

std::string RemoteServiceClient::buildTarget(const std::string& path, const QueryParams& query) const {
    std::string target = m_prefix + path;
    QueryParams params = query;
    if (m_endpoint.auth == AuthScheme::ApiKey && !m_endpoint.secret.empty()) {
        params.emplace_back(m_endpoint.apiKeyParam, m_endpoint.secret);
    }

    char separator = target.find('?') == std::string::npos ? '?' : '&';
    for (const auto& [key, value] : params) {
        target += separator;
        target += EncodeComponent(key) + "=" + EncodeComponent(value);
        separator = '&';
    }
    return target;
}

void RemoteServiceClient::checkRequestSize(std::size_t size) const {
    if (size > m_endpoint.maxBufferBytes) {
        throw domain::OversizedPayloadError(m_endpoint.name, size, m_endpoint.maxBufferBytes);
    }
}

RemoteResponse RemoteServiceClient::get(const std::string& path, const QueryParams& query) {
    Call call;
    call.method = "GET";
    call.path = path;
    call.query = query;
    return execute(call);
}

RemoteResponse RemoteServiceClient::postJson(const std::string& path, const std::string& jsonBody) {
    checkRequestSize(jsonBody.size());
    Call call;
    call.method = "POST";
    call.path = path;
    call.body.push_back(Text(jsonBody));
    call.contentType = "application/json";
    return execute(call);
}

RemoteResponse RemoteServiceClient::postMultipart(const std::string& path, const std::vector<MultipartPart>& parts) {
    std::size_t payload = 0;
    for (const auto& part : parts) {
        payload += part.content ? part.content->size() : 0;
    }
    checkRequestSize(payload);

    const std::string boundary = MakeBoundary();
    Call call;
    call.method = "POST";
    call.path = path;
    call.contentType = "multipart/form-data; boundary=" + boundary;

    std::string head;
    for (const auto& part : parts) {
        head += "--" + boundary + "\r\n";
        head += "Content-Disposition: form-data; name=\"" + part.name + "\"";
        if (!part.filename.empty()) {
            head += "; filename=\"" + part.filename + "\"";
        }
        head += "\r\n";
        if (!part.contentType.empty()) {
            head += "Content-Type: " + part.contentType + "\r\n";
        }
        head += "\r\n";
        call.body.push_back(Text(std::move(head)));
        head.clear();
        if (part.content) {
            call.body.push_back(part.content);
        }
        head = "\r\n";
    }
    call.body.push_back(Text(head + "--" + boundary + "--\r\n"));
    return execute(call);
}

RemoteResponse RemoteServiceClient::put(const std::string& path, std::shared_ptr<const std::string> body,
                                        const std::string& contentType) {
    checkRequestSize(body->size());
    Call call;
    call.method = "PUT";
    call.path = path;
    call.body.push_back(std::move(body));
    call.contentType = contentType;
    return execute(call);
}

std::size_t RemoteServiceClient::download(const std::string& path, const ChunkSink& sink) {
    Call call;
    call.method = "GET";
    call.path = path;
    call.sink = &sink;
    return execute(call).bytesReceived;
}

RemoteResponse RemoteServiceClient::execute(const Call& call) {
    httplib::Client cli(m_origin);
    cli.set_connection_timeout(m_endpoint.connectTimeoutSeconds, 0);
    cli.set_read_timeout(m_endpoint.readTimeoutSeconds, 0);
    cli.set_write_timeout(m_endpoint.readTimeoutSeconds, 0);

    httplib::Request req;
    req.method = call.method;
    req.path = buildTarget(call.path, call.query);
    req.set_header("User-Agent", m_endpoint.userAgent);
    if (m_endpoint.auth == AuthScheme::Basic) {
        req.headers.insert(httplib::make_basic_authentication_header(m_endpoint.username, m_endpoint.secret));
    } else if (m_endpoint.auth == AuthScheme::Bearer) {
        req.headers.insert(httplib::make_bearer_token_authentication_header(m_endpoint.secret));
    }
    if (!call.body.empty()) {
        std::size_t length = 0;
        for (const auto& piece : call.body) {
            length += piece->size();
        }
        req.set_header("Content-Type", call.contentType);
        req.content_length_ = length;
        req.content_provider_ = [pieces = call.body](std::size_t offset, std::size_t size, httplib::DataSink& sink) {
            return WritePieces(pieces, offset, size, sink);
        };
    }

    int status = 0;
    std::size_t received = 0;
    bool oversized = false;
    bool sinkStopped = false;
    std::string buffer;

    req.response_handler = [&status](const httplib::Response& head) {
        status = head.status;
        return true;
    };
    req.content_receiver = [&](const char* data, std::size_t length, uint64_t, uint64_t) {
        const bool success = status >= 200 && status < 300;
        if (call.sink && success) {
            received += length;
            if (!(*call.sink)(data, length)) {
                sinkStopped = true;
                return false;
            }
            return true;
        }
        received += length;
        const std::size_t limit = success ? m_endpoint.maxBufferBytes : kErrorBodyLimit;
        if (buffer.size() + length > limit) {
            if (success) {
                oversized = true;
                return false;
            }
            buffer.append(data, limit - buffer.size());
            return true;
        }
        buffer.append(data, length);
        return true;
    };

    auto result = cli.send(req);

    if (oversized) {
        std::cerr << "[RemoteServiceClient] " << m_endpoint.name << " response passed "
                  << m_endpoint.maxBufferBytes << " bytes, aborted." << std::endl;
        throw domain::OversizedPayloadError(m_endpoint.name, received, m_endpoint.maxBufferBytes);
    }
    if (!result && !sinkStopped) {
        auto error = result.error();
        std::string message = call.method + " " + call.path + ": " + httplib::to_string(error);
        std::cerr << "[RemoteServiceClient] " << m_endpoint.name << " " << message << std::endl;
        if (IsTimeout(error)) {
            throw domain::GatewayError(domain::GatewayError::Kind::Timeout, m_endpoint.name, message);
        }
        throw domain::GatewayError(domain::GatewayError::Kind::Unreachable, m_endpoint.name, message);
    }

    if (result) {
        status = result->status;
    }
    if (status == 401 || status == 403) {
        throw domain::GatewayError(domain::GatewayError::Kind::Unauthorized, m_endpoint.name,
                                   call.method + " " + call.path + " rejected credentials", status);
    }
    if (status < 200 || status >= 300) {
        std::cerr << "[RemoteServiceClient] " << m_endpoint.name << " HTTP Error " << status << ": "
                  << buffer << std::endl;
        throw domain::GatewayError(domain::GatewayError::Kind::HttpStatus, m_endpoint.name,
                                   call.method + " " + call.path + " returned HTTP " + std::to_string(status),
                                   status);
    }

    RemoteResponse response;
    response.status = status;
    if (result) {
        response.contentType = result->get_header_value("Content-Type");
    }
    response.bytesReceived = received;
    if (!call.sink) {
        response.body = std::move(buffer);
    }
    return response;
}

} // namespace coversync::infrastructure
