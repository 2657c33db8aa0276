/**
 * @file Cancellation.hpp
 * @brief Shared abort flag handed to queued backend calls.
 */

#pragma once

#include <atomic>
#include <memory>

namespace coversync::domain {

/** @brief Set once by the owner; a null token never cancels. */
using CancellationToken = std::shared_ptr<const std::atomic<bool>>;

inline bool IsCancelled(const CancellationToken& token) {
    return token && token->load();
}

} // namespace coversync::domain
