/**
 * @file RetentionSweeper.cpp
 * @brief Implementation of RetentionSweeper.
 */

#include "application/RetentionSweeper.hpp"
#include <iostream>

namespace coversync::application {

RetentionSweeper::RetentionSweeper(domain::ProcessedFileRepository& ledger,
                                   ProgressBroadcaster& broadcaster,
                                   std::chrono::hours retention,
                                   std::chrono::minutes idleSessionCutoff,
                                   std::chrono::minutes interval)
    : m_ledger(ledger), m_broadcaster(broadcaster), m_retention(retention),
      m_idleCutoff(idleSessionCutoff), m_interval(interval) {}

RetentionSweeper::~RetentionSweeper() {
    stop();
}

SweepReport RetentionSweeper::sweep(std::chrono::system_clock::time_point cutoff) {
    std::lock_guard<std::mutex> sweepLock(m_sweepMutex);
    SweepReport report;

    auto cursor = m_ledger.findStale(cutoff);
    if (m_resumeAt) {
        cursor->seek(*m_resumeAt);
        m_resumeAt.reset();
    }

    while (auto row = cursor->next()) {
        if (m_ledger.deleteById(row->id)) {
            ++report.rowsDeleted;
        }
        // stop() only interrupts a background pass.
        if (m_worker.joinable() && !m_running) {
            m_resumeAt = cursor->position();
            report.completed = false;
            break;
        }
    }

    if (report.rowsDeleted > 0 || !report.completed) {
        std::cout << "[RetentionSweeper] Removed " << report.rowsDeleted << " ledger row(s)"
                  << (report.completed ? "" : ", pass interrupted") << std::endl;
    }
    return report;
}

SweepReport RetentionSweeper::sweepNow() {
    auto report = sweep(std::chrono::system_clock::now() - m_retention);
    report.sessionsClosed = m_broadcaster.closeIdleSessions(m_idleCutoff);
    if (report.sessionsClosed > 0) {
        std::cout << "[RetentionSweeper] Closed " << report.sessionsClosed << " idle session(s)" << std::endl;
    }
    if (m_reaper) {
        report.sessionsReaped = m_reaper();
    }
    return report;
}

void RetentionSweeper::setSessionReaper(std::function<std::size_t()> reaper) {
    m_reaper = std::move(reaper);
}

void RetentionSweeper::start() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_running) return;
    m_running = true;
    m_worker = std::thread(&RetentionSweeper::workerLoop, this);
}

void RetentionSweeper::stop() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_running) return;
        m_running = false;
    }
    m_cv.notify_all();

    if (m_worker.joinable()) {
        m_worker.join();
    }
}

void RetentionSweeper::workerLoop() {
    while (true) {
        try {
            sweepNow();
        } catch (const std::exception& e) {
            std::cerr << "[RetentionSweeper] Sweep failed: " << e.what() << std::endl;
        }

        std::unique_lock<std::mutex> lock(m_mutex);
        if (m_cv.wait_for(lock, m_interval, [this] { return !m_running; })) {
            return;
        }
    }
}

} // namespace coversync::application
