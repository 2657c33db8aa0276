/**
 * @file ProcessingState.hpp
 * @brief Value Object defining the lifecycle states of an ingested file.
 */

#pragma once

#include <optional>
#include <string>

namespace coversync::domain {

/**
 * @enum ProcessingState
 * @brief Position of a file in the ingestion pipeline.
 */
enum class ProcessingState {
    Queued,         ///< Accepted into a session, not yet fingerprinted.
    Uploaded,       ///< Bytes accepted and fingerprinted.
    Recognizing,    ///< Dispatched to the recognition engine.
    Matching,       ///< Recognition result handed to reconciliation.
    Processed,      ///< Confirmed catalog identity (terminal).
    Unresolved,     ///< No catalog source matched (terminal).
    Failed          ///< Fatal error or retries exhausted (terminal).
};

/**
 * @brief Helper to convert state to its wire/storage name.
 */
inline std::string StateToString(ProcessingState state) {
    switch (state) {
        case ProcessingState::Queued: return "QUEUED";
        case ProcessingState::Uploaded: return "UPLOADED";
        case ProcessingState::Recognizing: return "RECOGNIZING";
        case ProcessingState::Matching: return "MATCHING";
        case ProcessingState::Processed: return "PROCESSED";
        case ProcessingState::Unresolved: return "UNRESOLVED";
        case ProcessingState::Failed: return "FAILED";
        default: return "UNKNOWN";
    }
}

inline std::optional<ProcessingState> StateFromString(const std::string& value) {
    if (value == "QUEUED") return ProcessingState::Queued;
    if (value == "UPLOADED") return ProcessingState::Uploaded;
    if (value == "RECOGNIZING") return ProcessingState::Recognizing;
    if (value == "MATCHING") return ProcessingState::Matching;
    if (value == "PROCESSED") return ProcessingState::Processed;
    if (value == "UNRESOLVED") return ProcessingState::Unresolved;
    if (value == "FAILED") return ProcessingState::Failed;
    return std::nullopt;
}

inline bool IsTerminal(ProcessingState state) {
    return state == ProcessingState::Processed ||
           state == ProcessingState::Unresolved ||
           state == ProcessingState::Failed;
}

/**
 * @brief Position in the partial order QUEUED < UPLOADED < RECOGNIZING < MATCHING < terminal.
 */
inline int StateRank(ProcessingState state) {
    switch (state) {
        case ProcessingState::Queued: return 0;
        case ProcessingState::Uploaded: return 1;
        case ProcessingState::Recognizing: return 2;
        case ProcessingState::Matching: return 3;
        default: return 4;
    }
}

/**
 * @brief True if moving from @p current to @p target never goes backwards
 * and never leaves a terminal state.
 */
inline bool IsForwardTransition(ProcessingState current, ProcessingState target) {
    if (IsTerminal(current)) {
        return false;
    }
    return StateRank(target) > StateRank(current);
}

} // namespace coversync::domain
