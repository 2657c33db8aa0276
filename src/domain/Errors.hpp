/**
 * @file Errors.hpp
 * @brief Exception taxonomy shared by the pipeline components.
 */

#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>

namespace coversync::domain {

/**
 * @class GatewayError
 * @brief Failure of a call to a remote backend.
 */
class GatewayError : public std::runtime_error {
public:
    enum class Kind {
        Unauthorized,   ///< 401/403, fatal for the call.
        Timeout,        ///< Connect/read timeout, transient.
        Unreachable,    ///< Connection refused or DNS failure, transient.
        HttpStatus      ///< Any other non-2xx answer, not retried.
    };

    GatewayError(Kind kind, std::string service, const std::string& message, int status = 0)
        : std::runtime_error(message), m_kind(kind), m_service(std::move(service)), m_status(status) {}

    Kind kind() const { return m_kind; }
    const std::string& service() const { return m_service; }
    int status() const { return m_status; }

    bool isTransient() const {
        return m_kind == Kind::Timeout || m_kind == Kind::Unreachable;
    }

    static std::string KindToString(Kind kind) {
        switch (kind) {
            case Kind::Unauthorized: return "Unauthorized";
            case Kind::Timeout: return "Timeout";
            case Kind::Unreachable: return "Unreachable";
            case Kind::HttpStatus: return "HttpStatus";
        }
        return "HttpStatus";
    }

private:
    Kind m_kind;
    std::string m_service;
    int m_status;
};

/**
 * @class OversizedPayloadError
 * @brief A body exceeded the configured in-memory cap of a backend.
 */
class OversizedPayloadError : public std::runtime_error {
public:
    OversizedPayloadError(const std::string& service, std::size_t size, std::size_t limit)
        : std::runtime_error("Payload of " + std::to_string(size) + " bytes exceeds the " +
                             std::to_string(limit) + " byte limit of " + service),
          m_size(size), m_limit(limit) {}

    std::size_t size() const { return m_size; }
    std::size_t limit() const { return m_limit; }

private:
    std::size_t m_size;
    std::size_t m_limit;
};

/**
 * @class ConflictError
 * @brief Concurrent or non-monotonic write to the same ledger row.
 */
class ConflictError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/** @brief Storage failure in the ledger or the catalog mirror. */
class LedgerError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/** @brief The session owning a file or a queued call was aborted. */
class SessionAborted : public std::runtime_error {
public:
    SessionAborted() : std::runtime_error("session aborted") {}
};

/** @brief Missing or malformed configuration. */
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace coversync::domain
