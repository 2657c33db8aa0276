/**
 * @file RetentionSweeper.hpp
 * @brief Periodic removal of old ledger rows and idle progress sessions.
 */

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <thread>
#include "application/ProgressBroadcaster.hpp"
#include "domain/ProcessedFileRepository.hpp"

namespace coversync::application {

struct SweepReport {
    std::int64_t rowsDeleted = 0;
    std::size_t sessionsClosed = 0;
    std::size_t sessionsReaped = 0;   ///< Idle pipeline sessions forgotten by the reaper.
    bool completed = true;  ///< False when stop() interrupted the pass.
};

/**
 * @class RetentionSweeper
 * @brief Deletes rows with `processedAt < now - retention` and closes idle sessions.
 *
 * Each periodic pass also runs the session reaper, if one is set, so finished
 * pipeline sessions release their worker threads.
 *
 * An interrupted pass remembers its cursor position and the next pass
 * continues from there.
 */
class RetentionSweeper {
public:
    RetentionSweeper(domain::ProcessedFileRepository& ledger,
                     ProgressBroadcaster& broadcaster,
                     std::chrono::hours retention,
                     std::chrono::minutes idleSessionCutoff,
                     std::chrono::minutes interval);
    ~RetentionSweeper();

    /** @brief Removes all and only the rows processed before @p cutoff. */
    SweepReport sweep(std::chrono::system_clock::time_point cutoff);

    /** @brief One pass with the configured retention, plus idle-session cleanup. */
    SweepReport sweepNow();

    /** @brief Called on every sweepNow(); returns the number of sessions it dropped. Set before start(). */
    void setSessionReaper(std::function<std::size_t()> reaper);

    void start();
    void stop();

private:
    void workerLoop();

    domain::ProcessedFileRepository& m_ledger;
    ProgressBroadcaster& m_broadcaster;
    const std::chrono::hours m_retention;
    const std::chrono::minutes m_idleCutoff;
    const std::chrono::minutes m_interval;

    std::function<std::size_t()> m_reaper;
    std::optional<domain::CursorPosition> m_resumeAt;
    std::mutex m_sweepMutex;

    std::mutex m_mutex;
    std::condition_variable m_cv;
    std::thread m_worker;
    std::atomic<bool> m_running{false};
};

} // namespace coversync::application
