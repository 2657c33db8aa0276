/**
 * @file ProgressBroadcaster.cpp
 * @brief Implementation of ProgressBroadcaster and Subscription.
 */

#include "application/ProgressBroadcaster.hpp"
#include <algorithm>
#include <iostream>

namespace coversync::application {

Subscription::Subscription(std::uint64_t id, std::string sessionId, std::size_t capacity)
    : m_id(id), m_sessionId(std::move(sessionId)), m_capacity(std::max<std::size_t>(1, capacity)) {}

std::optional<domain::ProgressEvent> Subscription::next(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(m_mutex);
    m_cv.wait_for(lock, timeout, [this] { return !m_queue.empty() || m_closed; });
    if (m_queue.empty() || m_closed) {
        return std::nullopt;
    }
    auto event = std::move(m_queue.front());
    m_queue.pop_front();
    return event;
}

void Subscription::push(const domain::ProgressEvent& event) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_closed) return;
        if (m_queue.size() >= m_capacity) {
            m_queue.pop_front();
            ++m_dropped;
        }
        m_queue.push_back(event);
    }
    m_cv.notify_one();
}

void Subscription::close() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_closed = true;
        m_queue.clear();
    }
    m_cv.notify_all();
}

bool Subscription::isClosed() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_closed;
}

std::size_t Subscription::droppedCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_dropped;
}

ProgressBroadcaster::ProgressBroadcaster(std::size_t queueCapacity) : m_queueCapacity(queueCapacity) {}

std::shared_ptr<Subscription> ProgressBroadcaster::subscribe(const std::string& sessionId) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto subscription = std::make_shared<Subscription>(m_nextId++, sessionId, m_queueCapacity);
    auto& entry = m_sessions[sessionId];
    entry.subscribers.push_back(subscription);
    entry.lastActivity = std::chrono::steady_clock::now();
    std::cout << "[ProgressBroadcaster] Session " << sessionId << ": subscriber " << subscription->id()
              << " connected (" << entry.subscribers.size() << " total)" << std::endl;
    return subscription;
}

void ProgressBroadcaster::unsubscribe(const std::shared_ptr<Subscription>& subscription) {
    if (!subscription) return;
    subscription->close();

    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_sessions.find(subscription->sessionId());
    if (it == m_sessions.end()) return;

    auto& subscribers = it->second.subscribers;
    subscribers.erase(std::remove(subscribers.begin(), subscribers.end(), subscription), subscribers.end());
    if (subscription->droppedCount() > 0) {
        std::cerr << "[ProgressBroadcaster] Subscriber " << subscription->id() << " dropped "
                  << subscription->droppedCount() << " event(s)" << std::endl;
    }
    if (subscribers.empty()) {
        m_sessions.erase(it);
    }
}

void ProgressBroadcaster::publish(const std::string& sessionId, const domain::ProgressEvent& event) {
    std::vector<std::shared_ptr<Subscription>> targets;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_sessions.find(sessionId);
        if (it == m_sessions.end()) return;
        it->second.lastActivity = std::chrono::steady_clock::now();
        targets = it->second.subscribers;
    }

    for (const auto& subscription : targets) {
        subscription->push(event);
    }
}

void ProgressBroadcaster::closeSession(const std::string& sessionId) {
    std::vector<std::shared_ptr<Subscription>> closing;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_sessions.find(sessionId);
        if (it == m_sessions.end()) return;
        closing = std::move(it->second.subscribers);
        m_sessions.erase(it);
    }

    for (const auto& subscription : closing) {
        subscription->close();
    }
    std::cout << "[ProgressBroadcaster] Session " << sessionId << " closed (" << closing.size()
              << " subscriber(s))" << std::endl;
}

std::size_t ProgressBroadcaster::closeIdleSessions(std::chrono::steady_clock::duration maxAge) {
    const auto cutoff = std::chrono::steady_clock::now() - maxAge;
    std::vector<std::string> idle;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (const auto& [sessionId, entry] : m_sessions) {
            if (entry.lastActivity < cutoff) {
                idle.push_back(sessionId);
            }
        }
    }

    for (const auto& sessionId : idle) {
        closeSession(sessionId);
    }
    return idle.size();
}

void ProgressBroadcaster::closeAll() {
    std::map<std::string, SessionEntry> sessions;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        sessions.swap(m_sessions);
    }
    for (const auto& [sessionId, entry] : sessions) {
        for (const auto& subscription : entry.subscribers) {
            subscription->close();
        }
    }
}

std::size_t ProgressBroadcaster::subscriberCount(const std::string& sessionId) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_sessions.find(sessionId);
    return it == m_sessions.end() ? 0 : it->second.subscribers.size();
}

} // namespace coversync::application
