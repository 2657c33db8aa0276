/**
 * @file ProgressBroadcaster.hpp
 * @brief Per-session fan-out of file state transitions.
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "domain/ProgressEvent.hpp"

namespace coversync::application {

/**
 * @class Subscription
 * @brief One listener of one session, with its own bounded event queue.
 *
 * When the queue is full the oldest event is discarded and counted. The
 * relative order of the remaining events is never changed.
 */
class Subscription {
public:
    Subscription(std::uint64_t id, std::string sessionId, std::size_t capacity);

    std::uint64_t id() const { return m_id; }
    const std::string& sessionId() const { return m_sessionId; }

    /**
     * @brief Waits up to @p timeout for the next event.
     * @return nullopt on timeout or once the subscription is closed and drained.
     */
    std::optional<domain::ProgressEvent> next(std::chrono::milliseconds timeout);

    /** @brief Queues an event without blocking. Ignored after close(). */
    void push(const domain::ProgressEvent& event);

    void close();
    bool isClosed() const;
    std::size_t droppedCount() const;

private:
    const std::uint64_t m_id;
    const std::string m_sessionId;
    const std::size_t m_capacity;

    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    std::deque<domain::ProgressEvent> m_queue;
    std::size_t m_dropped = 0;
    bool m_closed = false;
};

/**
 * @class ProgressBroadcaster
 * @brief Registry of session -> subscriptions.
 *
 * The registry lock only guards the subscriber set. publish() copies the
 * current listeners and delivers outside the lock, so a slow consumer can
 * never stall the pipeline. Events reach each subscriber in publish order,
 * which keeps the transitions of a file in sequence as long as one thread
 * publishes them.
 */
class ProgressBroadcaster {
public:
    explicit ProgressBroadcaster(std::size_t queueCapacity = 256);

    std::shared_ptr<Subscription> subscribe(const std::string& sessionId);
    void unsubscribe(const std::shared_ptr<Subscription>& subscription);

    /** @brief No-op when nobody listens to @p sessionId. */
    void publish(const std::string& sessionId, const domain::ProgressEvent& event);

    /** @brief Closes and removes every listener of a session. */
    void closeSession(const std::string& sessionId);

    /**
     * @brief Closes sessions whose last subscribe or publish is older than @p maxAge.
     * @return Number of sessions closed.
     */
    std::size_t closeIdleSessions(std::chrono::steady_clock::duration maxAge);

    /** @brief Closes everything, used on shutdown. */
    void closeAll();

    std::size_t subscriberCount(const std::string& sessionId) const;

private:
    struct SessionEntry {
        std::vector<std::shared_ptr<Subscription>> subscribers;
        std::chrono::steady_clock::time_point lastActivity;
    };

    const std::size_t m_queueCapacity;
    mutable std::mutex m_mutex;
    std::map<std::string, SessionEntry> m_sessions;
    std::uint64_t m_nextId = 1;
};

} // namespace coversync::application
