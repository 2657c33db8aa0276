/**
 * @file BackendExecutor.cpp
 * @brief Implementation of BackendExecutor.
 */

#include "infrastructure/BackendExecutor.hpp"
#include <algorithm>

namespace coversync::infrastructure {

BackendExecutor::BackendExecutor(std::string name, int threads)
    : m_name(std::move(name)), m_running(true) {
    const int count = std::max(1, threads);
    for (int i = 0; i < count; ++i) {
        m_workers.emplace_back(&BackendExecutor::workerLoop, this);
    }
}

BackendExecutor::~BackendExecutor() {
    stop();
}

void BackendExecutor::stop() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_running) return;
        m_running = false;
    }
    m_cv.notify_all();

    for (auto& worker : m_workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

void BackendExecutor::workerLoop() {
    while (true) {
        std::function<void()> job;

        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_cv.wait(lock, [this] {
                return !m_queue.empty() || !m_running;
            });

            if (!m_running && m_queue.empty()) {
                return;
            }

            job = std::move(m_queue.front());
            m_queue.pop();
        }

        // packaged_task stores any exception in the future.
        job();
    }
}

} // namespace coversync::infrastructure
