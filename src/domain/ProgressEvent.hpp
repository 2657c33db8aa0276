/**
 * @file ProgressEvent.hpp
 * @brief Domain event emitted on every state transition of a file.
 */

#pragma once

#include <chrono>
#include <optional>
#include <string>
#include "ProcessingState.hpp"

namespace coversync::domain {

struct ProgressEvent {
    static constexpr const char* Type = "FileStateChanged";
    std::string sessionId;
    std::string fileName;
    std::optional<ProcessingState> oldState;    ///< Absent for the initial QUEUED event.
    ProcessingState newState = ProcessingState::Queued;
    std::chrono::system_clock::time_point timestamp;
    std::optional<std::string> detailJson;      ///< Serialized JSON payload, if any.
};

} // namespace coversync::domain
