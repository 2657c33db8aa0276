/**
 * @file PersistenceService.hpp
 * @brief Serialized, atomic file writes on a background thread.
 */

#pragma once
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <queue>
#include <string>
#include <thread>

namespace coversync::infrastructure {

/**
 * @struct SaveTask
 * @brief One pending file write.
 */
struct SaveTask {
    std::string filename;
    std::string content;
};

/**
 * @class PersistenceService
 * @brief Writes files one at a time (temp file, then rename).
 *
 * Writers never block on disk I/O. When several snapshots of the same file
 * are queued they are written in submission order, so the last one wins.
 */
class PersistenceService {
public:
    PersistenceService();
    ~PersistenceService();

    PersistenceService(const PersistenceService&) = delete;
    PersistenceService& operator=(const PersistenceService&) = delete;

    /**
     * @brief Queues @p content to replace @p filename.
     * @param filename Absolute path to the file.
     */
    void saveTextAsync(const std::string& filename, const std::string& content);

    /** @brief Blocks until every write queued so far has been attempted. */
    void flush();

    /** @brief Number of writes that could not be completed. */
    std::size_t failedWrites() const { return m_failedWrites; }

    /** @brief Processes the remaining queue, then stops the worker. */
    void stop();

private:
    void workerLoop();

    /** @return false if the file could not be written. */
    bool performAtomicWrite(const SaveTask& task);

    std::queue<SaveTask> m_queue;
    std::mutex m_mutex;
    std::condition_variable m_cv;
    std::condition_variable m_drained;
    bool m_writing = false;

    std::thread m_worker;
    std::atomic<bool> m_running;
    std::atomic<std::size_t> m_failedWrites{0};
};

} // namespace coversync::infrastructure
