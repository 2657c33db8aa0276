/**
 * @file ServiceEndpoint.hpp
 * @brief Connection policy for one remote backend.
 */

#pragma once

#include <cstddef>
#include <string>

namespace coversync::infrastructure {

enum class AuthScheme {
    None,
    ApiKey,  ///< Key appended as a query parameter.
    Basic,   ///< Authorization: Basic base64(username:password)
    Bearer   ///< Authorization: Bearer <secret>
};

/**
 * @struct ServiceEndpoint
 * @brief Base address, credentials and limits of a backend.
 *
 * `baseUrl` is `scheme://host[:port][/prefix]`; request paths are appended to the prefix.
 */
struct ServiceEndpoint {
    std::string name;
    std::string baseUrl;
    AuthScheme auth = AuthScheme::None;
    std::string apiKeyParam = "api_key";
    std::string username;
    std::string secret;  ///< API key, password or bearer token depending on `auth`.
    std::string userAgent = "CoverSync/1.0";
    std::size_t maxBufferBytes = 1024 * 1024;
    int connectTimeoutSeconds = 10;
    int readTimeoutSeconds = 60;
    int concurrency = 4;
};

} // namespace coversync::infrastructure
