/**
 * @file Fingerprint.hpp
 * @brief Content fingerprints used as ledger etags.
 */

#pragma once

#include <string>
#include <string_view>

namespace coversync::infrastructure {

/**
 * @brief SHA-256 of @p bytes as 64 lowercase hex characters.
 * @throws std::runtime_error if the digest cannot be computed.
 */
std::string Sha256Hex(std::string_view bytes);

} // namespace coversync::infrastructure
