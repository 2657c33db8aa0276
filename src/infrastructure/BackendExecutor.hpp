/**
 * @file BackendExecutor.hpp
 * @brief Dedicated worker threads for the calls of one remote backend.
 */

#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <string>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>
#include "domain/Cancellation.hpp"
#include "domain/Errors.hpp"

namespace coversync::infrastructure {

/**
 * @class BackendExecutor
 * @brief Runs blocking gateway calls off the pipeline workers.
 *
 * Every backend owns one executor, so a hung call only occupies that
 * backend's threads. Callers get a std::future and decide themselves how
 * long to wait for it. stop() drains the queue before joining.
 *
 * A call submitted with a cancellation token is skipped when the token is
 * set by the time a worker picks it up; its future then holds
 * domain::SessionAborted.
 */
class BackendExecutor {
public:
    BackendExecutor(std::string name, int threads);
    ~BackendExecutor();

    BackendExecutor(const BackendExecutor&) = delete;
    BackendExecutor& operator=(const BackendExecutor&) = delete;

    template <typename F>
    auto submit(F&& fn, domain::CancellationToken cancelled = nullptr)
        -> std::future<std::invoke_result_t<std::decay_t<F>>> {
        using Result = std::invoke_result_t<std::decay_t<F>>;
        auto task = std::make_shared<std::packaged_task<Result()>>(
            [call = std::forward<F>(fn), cancelled]() mutable -> Result {
                if (domain::IsCancelled(cancelled)) {
                    throw domain::SessionAborted();
                }
                return call();
            });
        auto future = task->get_future();
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (!m_running) {
                throw std::runtime_error("BackendExecutor " + m_name + " is stopped");
            }
            m_queue.push([task]() { (*task)(); });
        }
        m_cv.notify_one();
        return future;
    }

    void stop();

    const std::string& name() const { return m_name; }

private:
    void workerLoop();

    std::string m_name;
    std::queue<std::function<void()>> m_queue;
    std::mutex m_mutex;
    std::condition_variable m_cv;
    std::vector<std::thread> m_workers;
    std::atomic<bool> m_running;
};

} // namespace coversync::infrastructure
