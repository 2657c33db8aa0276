/**
 * @file PersistenceService.cpp
 * @brief Implementation of PersistenceService.
 */

#include "infrastructure/PersistenceService.hpp"
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace coversync::infrastructure {

namespace fs = std::filesystem;

PersistenceService::PersistenceService() : m_running(true) {
    m_worker = std::thread(&PersistenceService::workerLoop, this);
}

PersistenceService::~PersistenceService() {
    stop();
}

void PersistenceService::stop() {
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

void PersistenceService::saveTextAsync(const std::string& filename, const std::string& content) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_running) {
            std::cerr << "[PersistenceService] Stopped, dropping write of " << filename << std::endl;
            ++m_failedWrites;
            return;
        }
        m_queue.push(SaveTask{filename, content});
    }
    m_cv.notify_one();
}

void PersistenceService::flush() {
    std::unique_lock<std::mutex> lock(m_mutex);
    m_drained.wait(lock, [this] { return m_queue.empty() && !m_writing; });
}

void PersistenceService::workerLoop() {
    while (true) {
        SaveTask task;

        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_cv.wait(lock, [this] {
                return !m_queue.empty() || !m_running;
            });

            if (m_queue.empty()) {
                if (!m_running) {
                    m_drained.notify_all();
                    return;
                }
                continue;
            }

            task = std::move(m_queue.front());
            m_queue.pop();
            m_writing = true;
        }

        const bool ok = performAtomicWrite(task);

        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_writing = false;
            if (!ok) ++m_failedWrites;
        }
        m_drained.notify_all();
    }
}

bool PersistenceService::performAtomicWrite(const SaveTask& task) {
    fs::path finalPath = task.filename;

    auto timestamp = std::chrono::steady_clock::now().time_since_epoch().count();
    fs::path tempPath = finalPath;
    tempPath += "." + std::to_string(timestamp) + ".tmp";

    std::error_code ec;
    if (finalPath.has_parent_path()) {
        fs::create_directories(finalPath.parent_path(), ec);
        if (ec) {
            std::cerr << "[PersistenceService] Error creating directories: " << ec.message() << std::endl;
            return false;
        }
    }

    {
        std::ofstream ofs(tempPath, std::ios::binary | std::ios::trunc);
        if (!ofs.is_open()) {
            std::cerr << "[PersistenceService] Failed to open temp file: " << tempPath << std::endl;
            return false;
        }
        ofs << task.content;
        ofs.flush();
        if (ofs.fail()) {
            std::cerr << "[PersistenceService] Write failed during output: " << tempPath << std::endl;
            ofs.close();
            fs::remove(tempPath, ec);
            return false;
        }
    }

    fs::rename(tempPath, finalPath, ec);
    if (ec) {
        std::cerr << "[PersistenceService] Rename failed: " << ec.message() << std::endl;
        fs::remove(tempPath, ec);
        return false;
    }
    return true;
}

} // namespace coversync::infrastructure
