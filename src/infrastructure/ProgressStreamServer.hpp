/**
 * @file ProgressStreamServer.hpp
 * @brief HTTP surface: batch submission, session control and the progress stream.
 */

#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <set>
#include <thread>
#include <httplib.h>
#include "application/PipelineOrchestrator.hpp"
#include "application/ProgressBroadcaster.hpp"
#include "domain/ProcessedFileRepository.hpp"
#include "infrastructure/ConfigLoader.hpp"

namespace coversync::infrastructure {

/**
 * @class ProgressStreamServer
 * @brief Routes:
 *
 * - `GET /socket-handler/update?sessionId=` server-sent events, one per transition, plus heartbeats.
 * - `POST /api/v1/sessions/<id>/files` multipart batch, optional `series_id` field.
 * - `GET /api/v1/sessions/<id>/files` ledger rows of the session.
 * - `POST /api/v1/sessions/<id>/abort`
 * - `DELETE /api/v1/sessions/<id>`
 * - `GET /api/v1/series/<id>/processed`, `DELETE /api/v1/series/<id>/files`
 *
 * JSON answers use the `{code, message, data}` envelope.
 *
 * Each open stream holds one server thread, so the pool is sized
 * `workerThreads + maxStreams` and streams past `maxStreams` get 503.
 */
class ProgressStreamServer {
public:
    ProgressStreamServer(ServerConfig config,
                         application::PipelineOrchestrator& orchestrator,
                         application::ProgressBroadcaster& broadcaster,
                         domain::ProcessedFileRepository& ledger);
    ~ProgressStreamServer();

    /**
     * @brief Binds and starts listening on a background thread.
     * @return The bound port (useful when the configured port is 0).
     * @throws std::runtime_error if the address cannot be bound.
     */
    int start();

    /** @brief Ends open streams and stops listening. */
    void stop();

    bool isRunning() const { return m_server.is_running(); }

    std::size_t openStreams();

private:
    void registerRoutes();

    void handleStream(const httplib::Request& req, httplib::Response& res);
    void handleSubmit(const httplib::Request& req, httplib::Response& res);
    void handleListSession(const httplib::Request& req, httplib::Response& res);
    void handleAbort(const httplib::Request& req, httplib::Response& res);
    void handleDeleteSession(const httplib::Request& req, httplib::Response& res);
    void handleSeriesProcessed(const httplib::Request& req, httplib::Response& res);
    void handleDeleteSeries(const httplib::Request& req, httplib::Response& res);

    /** @brief Subscribes and tracks a stream, or returns null when all stream slots are taken. */
    std::shared_ptr<application::Subscription> track(const std::string& sessionId);
    void release(const std::shared_ptr<application::Subscription>& subscription);

    const ServerConfig m_config;
    application::PipelineOrchestrator& m_orchestrator;
    application::ProgressBroadcaster& m_broadcaster;
    domain::ProcessedFileRepository& m_ledger;

    httplib::Server m_server;
    std::thread m_listener;

    std::mutex m_streamsMutex;
    std::set<std::shared_ptr<application::Subscription>> m_streams;
    std::atomic<bool> m_stopping{false};
};

} // namespace coversync::infrastructure
