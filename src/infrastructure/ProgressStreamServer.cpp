/**
 * @file ProgressStreamServer.cpp
 * @brief Implementation of ProgressStreamServer.
 */

#include "infrastructure/ProgressStreamServer.hpp"
#include <algorithm>
#include <functional>
#include <iostream>
#include <stdexcept>
#include <nlohmann/json.hpp>
#include "domain/Errors.hpp"
#include "infrastructure/ApiResponse.hpp"
#include "infrastructure/JsonMapping.hpp"

namespace coversync::infrastructure {

using json = nlohmann::json;

namespace {

void Reply(httplib::Response& res, int code, const std::string& message, json data = nullptr) {
    ApiResponse<json> body{code, message, std::move(data)};
    res.status = code;
    res.set_content(json(body).dump(), "application/json");
}

/** Runs a handler and turns escaping exceptions into an error envelope. */
void Guarded(const char* route, httplib::Response& res, const std::function<void()>& handler) {
    try {
        handler();
    } catch (const std::invalid_argument& e) {
        Reply(res, 400, e.what());
    } catch (const std::exception& e) {
        std::cerr << "[ProgressStreamServer] " << route << " failed: " << e.what() << std::endl;
        Reply(res, 500, e.what());
    }
}

std::int64_t ParseId(const std::string& text, const char* what) {
    std::size_t used = 0;
    long long value = 0;
    try {
        value = std::stoll(text, &used);
    } catch (const std::logic_error&) {
        used = 0;
    }
    if (used == 0 || used != text.size()) {
        throw std::invalid_argument(std::string("Invalid ") + what + ": '" + text + "'");
    }
    return value;
}

std::string SseFrame(const char* event, const json& data) {
    std::string frame;
    if (event) {
        frame += "event: ";
        frame += event;
        frame += "\n";
    }
    frame += "data: " + data.dump() + "\n\n";
    return frame;
}

std::string BaseName(const std::string& path) {
    const auto slash = path.find_last_of('/');
    return slash == std::string::npos ? path : path.substr(slash + 1);
}

} // namespace

ProgressStreamServer::ProgressStreamServer(ServerConfig config,
                                           application::PipelineOrchestrator& orchestrator,
                                           application::ProgressBroadcaster& broadcaster,
                                           domain::ProcessedFileRepository& ledger)
    : m_config(std::move(config)), m_orchestrator(orchestrator), m_broadcaster(broadcaster), m_ledger(ledger) {
    const auto threads = static_cast<std::size_t>(std::max(1, m_config.workerThreads) + std::max(1, m_config.maxStreams));
    m_server.new_task_queue = [threads] { return new httplib::ThreadPool(threads); };
    registerRoutes();
}

ProgressStreamServer::~ProgressStreamServer() {
    stop();
}

void ProgressStreamServer::registerRoutes() {
    m_server.Get("/socket-handler/update", [this](const httplib::Request& req, httplib::Response& res) {
        Guarded("stream", res, [&] { handleStream(req, res); });
    });
    m_server.Post(R"(/api/v1/sessions/([^/]+)/files)", [this](const httplib::Request& req, httplib::Response& res) {
        Guarded("submit", res, [&] { handleSubmit(req, res); });
    });
    m_server.Get(R"(/api/v1/sessions/([^/]+)/files)", [this](const httplib::Request& req, httplib::Response& res) {
        Guarded("list", res, [&] { handleListSession(req, res); });
    });
    m_server.Post(R"(/api/v1/sessions/([^/]+)/abort)", [this](const httplib::Request& req, httplib::Response& res) {
        Guarded("abort", res, [&] { handleAbort(req, res); });
    });
    m_server.Delete(R"(/api/v1/sessions/([^/]+))", [this](const httplib::Request& req, httplib::Response& res) {
        Guarded("delete session", res, [&] { handleDeleteSession(req, res); });
    });
    m_server.Get(R"(/api/v1/series/(-?\d+)/processed)", [this](const httplib::Request& req, httplib::Response& res) {
        Guarded("series processed", res, [&] { handleSeriesProcessed(req, res); });
    });
    m_server.Delete(R"(/api/v1/series/(-?\d+)/files)", [this](const httplib::Request& req, httplib::Response& res) {
        Guarded("delete series", res, [&] { handleDeleteSeries(req, res); });
    });
}

int ProgressStreamServer::start() {
    int port = m_config.port;
    if (port == 0) {
        port = m_server.bind_to_any_port(m_config.host);
        if (port < 0) {
            throw std::runtime_error("Cannot bind " + m_config.host);
        }
    } else if (!m_server.bind_to_port(m_config.host, port)) {
        throw std::runtime_error("Cannot bind " + m_config.host + ":" + std::to_string(port));
    }

    m_stopping = false;
    m_listener = std::thread([this] { m_server.listen_after_bind(); });
    m_server.wait_until_ready();
    std::cout << "[ProgressStreamServer] Listening on " << m_config.host << ":" << port << std::endl;
    return port;
}

void ProgressStreamServer::stop() {
    m_stopping = true;
    {
        std::lock_guard<std::mutex> lock(m_streamsMutex);
        for (const auto& subscription : m_streams) {
            subscription->close();
        }
    }

    m_server.stop();
    if (m_listener.joinable()) {
        m_listener.join();
        std::cout << "[ProgressStreamServer] Stopped" << std::endl;
    }
}

std::shared_ptr<application::Subscription> ProgressStreamServer::track(const std::string& sessionId) {
    std::lock_guard<std::mutex> lock(m_streamsMutex);
    if (m_streams.size() >= static_cast<std::size_t>(m_config.maxStreams)) {
        return nullptr;
    }
    auto subscription = m_broadcaster.subscribe(sessionId);
    m_streams.insert(subscription);
    return subscription;
}

std::size_t ProgressStreamServer::openStreams() {
    std::lock_guard<std::mutex> lock(m_streamsMutex);
    return m_streams.size();
}

void ProgressStreamServer::release(const std::shared_ptr<application::Subscription>& subscription) {
    m_broadcaster.unsubscribe(subscription);
    std::lock_guard<std::mutex> lock(m_streamsMutex);
    m_streams.erase(subscription);
}

void ProgressStreamServer::handleStream(const httplib::Request& req, httplib::Response& res) {
    const std::string sessionId = req.get_param_value("sessionId");
    if (sessionId.empty()) {
        Reply(res, 400, "sessionId is required");
        return;
    }
    if (m_stopping) {
        Reply(res, 503, "Server is stopping");
        return;
    }

    auto subscription = track(sessionId);
    if (!subscription) {
        std::cerr << "[ProgressStreamServer] Refusing stream for session " << sessionId << ": "
                  << m_config.maxStreams << " streams already open" << std::endl;
        Reply(res, 503, "Too many open progress streams");
        return;
    }
    std::cout << "[ProgressStreamServer] Stream opened for session " << sessionId << std::endl;

    const auto heartbeat = std::chrono::duration_cast<std::chrono::milliseconds>(m_config.heartbeat);
    res.set_header("Cache-Control", "no-cache");
    res.set_chunked_content_provider(
        "text/event-stream",
        [subscription, heartbeat, greeted = false](std::size_t, httplib::DataSink& sink) mutable {
            if (!sink.is_writable()) {
                return false;
            }
            std::string frame;
            if (!greeted) {
                greeted = true;
                frame = SseFrame("heartbeat", HeartbeatJson(std::chrono::system_clock::now()));
            } else if (auto event = subscription->next(heartbeat)) {
                frame = SseFrame(domain::ProgressEvent::Type, ToJson(*event));
            } else if (subscription->isClosed()) {
                sink.done();
                return true;
            } else {
                frame = SseFrame("heartbeat", HeartbeatJson(std::chrono::system_clock::now()));
            }
            sink.write(frame.data(), frame.size());
            return true;
        },
        [this, subscription, sessionId](bool) {
            release(subscription);
            std::cout << "[ProgressStreamServer] Stream closed for session " << sessionId << std::endl;
        });
}

void ProgressStreamServer::handleSubmit(const httplib::Request& req, httplib::Response& res) {
    const std::string sessionId = req.matches[1].str();
    if (!req.is_multipart_form_data()) {
        Reply(res, 400, "Expected multipart/form-data");
        return;
    }

    std::int64_t seriesId = 0;
    if (req.has_file("series_id")) {
        seriesId = ParseId(req.get_file_value("series_id").content, "series_id");
    }

    std::vector<application::FileSubmission> files;
    for (const auto& [field, part] : req.files) {
        if (field == "series_id") {
            continue;
        }
        application::FileSubmission submission;
        submission.seriesId = seriesId;
        if (field == "path") {
            // Remote file, fetched from the file store by the pipeline.
            submission.filePath = part.content;
            submission.fileName = BaseName(part.content);
        } else if (!part.filename.empty()) {
            submission.fileName = part.filename;
            submission.filePath = part.filename;
            submission.content = std::make_shared<const std::string>(part.content);
            if (!part.content_type.empty()) {
                submission.contentType = part.content_type;
            }
        } else {
            continue;
        }
        if (submission.fileName.empty()) {
            throw std::invalid_argument("File parts need a file name");
        }
        files.push_back(std::move(submission));
    }

    if (files.empty()) {
        Reply(res, 400, "No files in request");
        return;
    }

    json receipts = json::array();
    for (const auto& receipt : m_orchestrator.submit(sessionId, files)) {
        receipts.push_back(ToJson(receipt));
    }
    Reply(res, 200, "OK", std::move(receipts));
}

void ProgressStreamServer::handleListSession(const httplib::Request& req, httplib::Response& res) {
    json rows = json::array();
    for (const auto& row : m_ledger.findBySession(req.matches[1].str())) {
        rows.push_back(ToJson(row));
    }
    Reply(res, 200, "OK", std::move(rows));
}

void ProgressStreamServer::handleAbort(const httplib::Request& req, httplib::Response& res) {
    const std::string sessionId = req.matches[1].str();
    m_orchestrator.abortSession(sessionId);
    Reply(res, 200, "Session aborted", json{{"sessionId", sessionId}});
}

void ProgressStreamServer::handleDeleteSession(const httplib::Request& req, httplib::Response& res) {
    const std::string sessionId = req.matches[1].str();
    const auto removed = m_orchestrator.deleteSession(sessionId);
    Reply(res, 200, "Session deleted", json{{"sessionId", sessionId}, {"removed", removed}});
}

void ProgressStreamServer::handleSeriesProcessed(const httplib::Request& req, httplib::Response& res) {
    const auto seriesId = ParseId(req.matches[1].str(), "series id");
    Reply(res, 200, "OK", json{
        {"seriesId", seriesId},
        {"processedCount", m_ledger.countProcessed(seriesId)},
        {"paths", m_ledger.listProcessedPaths(seriesId)}
    });
}

void ProgressStreamServer::handleDeleteSeries(const httplib::Request& req, httplib::Response& res) {
    const auto seriesId = ParseId(req.matches[1].str(), "series id");
    const auto removed = m_orchestrator.deleteSeries(seriesId);
    Reply(res, 200, "Series files deleted", json{{"seriesId", seriesId}, {"removed", removed}});
}

} // namespace coversync::infrastructure
