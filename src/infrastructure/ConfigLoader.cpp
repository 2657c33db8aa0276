/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include "domain/Errors.hpp"
#include "infrastructure/PathUtils.hpp"

namespace coversync::infrastructure {

using json = nlohmann::json;

namespace {

constexpr std::size_t kMegabyte = 1024 * 1024;
const char* kRecognitionPrefix = "/inferno-comics-recognition/api/v1";

std::string RecognitionUrl(const std::string& host, const std::string& port) {
    return "http://" + host + ":" + port + kRecognitionPrefix;
}

std::string Env(const char* name) {
    const char* value = std::getenv(name);
    return (value && *value) ? std::string(value) : std::string();
}

template <typename T>
void Read(const json& j, const char* key, T& target) {
    if (j.contains(key) && !j.at(key).is_null()) {
        target = j.at(key).get<T>();
    }
}

void ReadEndpoint(const json& j, const char* key, ServiceEndpoint& endpoint) {
    if (!j.contains(key)) return;
    const json& e = j.at(key);
    if (!e.is_object()) {
        throw domain::ConfigError(std::string("'") + key + "' must be an object");
    }
    Read(e, "base_url", endpoint.baseUrl);
    Read(e, "username", endpoint.username);
    Read(e, "secret", endpoint.secret);
    Read(e, "user_agent", endpoint.userAgent);
    Read(e, "max_buffer_bytes", endpoint.maxBufferBytes);
    Read(e, "connect_timeout_seconds", endpoint.connectTimeoutSeconds);
    Read(e, "read_timeout_seconds", endpoint.readTimeoutSeconds);
    Read(e, "concurrency", endpoint.concurrency);
}

void ValidateEndpoint(const ServiceEndpoint& endpoint, bool required) {
    if (required && endpoint.baseUrl.empty()) {
        throw domain::ConfigError(endpoint.name + ": base_url is required");
    }
    if (!endpoint.baseUrl.empty() &&
        endpoint.baseUrl.rfind("http://", 0) != 0 && endpoint.baseUrl.rfind("https://", 0) != 0) {
        throw domain::ConfigError(endpoint.name + ": base_url must start with http:// or https://");
    }
    if (endpoint.maxBufferBytes == 0 || endpoint.concurrency < 1 ||
        endpoint.connectTimeoutSeconds < 1 || endpoint.readTimeoutSeconds < 1) {
        throw domain::ConfigError(endpoint.name + ": limits and timeouts must be positive");
    }
}

} // namespace

AppConfig ConfigLoader::Defaults() {
    AppConfig config;

    const auto dataDir = PathUtils::GetDataDir();
    config.ledgerPath = (dataDir / "ledger.db").string();
    config.mirrorPath = (dataDir / "gcd.db").string();
    config.seriesRegistryPath = (dataDir / "series.json").string();

    config.recognition.name = "recognition";
    config.recognition.baseUrl = RecognitionUrl("localhost", "5000");
    config.recognition.maxBufferBytes = 500 * kMegabyte;
    config.recognition.readTimeoutSeconds = 300;
    config.recognition.concurrency = 4;

    config.liveCatalog.name = "comicvine";
    config.liveCatalog.baseUrl = "https://comicvine.gamespot.com/api";
    config.liveCatalog.auth = AuthScheme::ApiKey;
    config.liveCatalog.apiKeyParam = "api_key";
    config.liveCatalog.maxBufferBytes = kMegabyte;
    config.liveCatalog.concurrency = 2;

    config.inference.name = "groq";
    config.inference.baseUrl = "https://api.groq.com/openai/v1";
    config.inference.auth = AuthScheme::Bearer;
    config.inference.maxBufferBytes = kMegabyte;
    config.inference.concurrency = 2;

    config.fileStore.name = "nextcloud";
    config.fileStore.auth = AuthScheme::Basic;
    config.fileStore.maxBufferBytes = 500 * kMegabyte;
    config.fileStore.readTimeoutSeconds = 300;
    config.fileStore.concurrency = 4;

    return config;
}

AppConfig ConfigLoader::Load(const std::string& path) {
    AppConfig config = Defaults();

    if (!path.empty() && std::filesystem::exists(path)) {
        std::ifstream f(path);
        if (!f.is_open()) {
            throw domain::ConfigError("Cannot open " + path);
        }
        json j;
        try {
            f >> j;
        } catch (const json::parse_error& e) {
            throw domain::ConfigError("Malformed " + path + ": " + e.what());
        }
        config = FromJson(j, std::move(config));
        std::cout << "[ConfigLoader] Loaded " << path << std::endl;
    } else {
        std::cout << "[ConfigLoader] No settings file at '" << path << "', using defaults" << std::endl;
    }

    ApplyEnvironment(config);
    Validate(config);
    return config;
}

AppConfig ConfigLoader::FromJson(const json& j, AppConfig config) {
    if (!j.is_object()) {
        throw domain::ConfigError("settings must be a JSON object");
    }

    try {
        if (j.contains("server")) {
            const json& s = j.at("server");
            Read(s, "host", config.server.host);
            Read(s, "port", config.server.port);
            if (s.contains("heartbeat_seconds")) {
                config.server.heartbeat = std::chrono::seconds(s.at("heartbeat_seconds").get<int>());
            }
            Read(s, "worker_threads", config.server.workerThreads);
            Read(s, "max_streams", config.server.maxStreams);
        }

        Read(j, "ledger_path", config.ledgerPath);
        Read(j, "mirror_path", config.mirrorPath);
        Read(j, "mirror_active_deleted_value", config.mirrorActiveDeletedValue);
        Read(j, "series_registry_path", config.seriesRegistryPath);

        if (j.contains("retention_days")) {
            config.retention = std::chrono::hours(24 * j.at("retention_days").get<int>());
        }
        if (j.contains("idle_session_minutes")) {
            config.idleSessionCutoff = std::chrono::minutes(j.at("idle_session_minutes").get<int>());
        }
        if (j.contains("sweep_interval_minutes")) {
            config.sweepInterval = std::chrono::minutes(j.at("sweep_interval_minutes").get<int>());
        }

        if (j.contains("pipeline")) {
            const json& p = j.at("pipeline");
            auto& settings = config.pipeline;
            Read(p, "max_concurrent_files", settings.maxConcurrentFiles);
            Read(p, "max_attempts", settings.maxAttempts);
            Read(p, "backoff_multiplier", settings.backoffMultiplier);
            Read(p, "max_upload_bytes", settings.maxUploadBytes);
            Read(p, "generate_descriptions", settings.generateDescriptions);
            Read(p, "archive_prefix", settings.archivePrefix);
            if (p.contains("initial_backoff_ms")) {
                settings.initialBackoff = std::chrono::milliseconds(p.at("initial_backoff_ms").get<long long>());
            }
            if (p.contains("max_backoff_ms")) {
                settings.maxBackoff = std::chrono::milliseconds(p.at("max_backoff_ms").get<long long>());
            }
        }

        ReadEndpoint(j, "recognition", config.recognition);
        ReadEndpoint(j, "live_catalog", config.liveCatalog);
        ReadEndpoint(j, "inference", config.inference);
        ReadEndpoint(j, "file_store", config.fileStore);
        if (j.contains("inference")) {
            Read(j.at("inference"), "model", config.inferenceModel);
        }
    } catch (const json::exception& e) {
        throw domain::ConfigError(std::string("Invalid setting: ") + e.what());
    }

    return config;
}

void ConfigLoader::ApplyEnvironment(AppConfig& config) {
    const std::string host = Env("RECOGNITION_SERVER_HOST");
    const std::string port = Env("RECOGNITION_SERVER_PORT");
    if (!host.empty() || !port.empty()) {
        config.recognition.baseUrl = RecognitionUrl(host.empty() ? "localhost" : host,
                                                    port.empty() ? "5000" : port);
    }

    if (auto key = Env("COMIC_VINE_API_KEY"); !key.empty()) config.liveCatalog.secret = key;
    if (auto key = Env("GROQ_API_KEY"); !key.empty()) config.inference.secret = key;

    if (auto url = Env("NEXTCLOUD_URL"); !url.empty()) config.fileStore.baseUrl = url;
    if (auto user = Env("NEXTCLOUD_USERNAME"); !user.empty()) config.fileStore.username = user;
    if (auto password = Env("NEXTCLOUD_PASSWORD"); !password.empty()) config.fileStore.secret = password;

    if (auto path = Env("LEDGER_PATH"); !path.empty()) config.ledgerPath = path;
    if (auto path = Env("MIRROR_PATH"); !path.empty()) config.mirrorPath = path;
}

void ConfigLoader::Validate(const AppConfig& config) {
    if (config.server.port < 1 || config.server.port > 65535) {
        throw domain::ConfigError("server.port out of range: " + std::to_string(config.server.port));
    }
    if (config.server.heartbeat.count() < 1) {
        throw domain::ConfigError("server.heartbeat_seconds must be positive");
    }
    if (config.server.workerThreads < 1 || config.server.maxStreams < 1) {
        throw domain::ConfigError("server.worker_threads and server.max_streams must be positive");
    }
    if (config.ledgerPath.empty() || config.mirrorPath.empty()) {
        throw domain::ConfigError("ledger_path and mirror_path are required");
    }
    if (config.retention.count() < 1 || config.sweepInterval.count() < 1) {
        throw domain::ConfigError("retention_days and sweep_interval_minutes must be positive");
    }

    const auto& p = config.pipeline;
    if (p.maxConcurrentFiles < 1 || p.maxAttempts < 1) {
        throw domain::ConfigError("pipeline.max_concurrent_files and pipeline.max_attempts must be positive");
    }
    if (p.backoffMultiplier < 1.0 || p.initialBackoff.count() < 0 || p.maxBackoff < p.initialBackoff) {
        throw domain::ConfigError("pipeline backoff settings are inconsistent");
    }

    ValidateEndpoint(config.recognition, true);
    ValidateEndpoint(config.liveCatalog, true);
    ValidateEndpoint(config.inference, p.generateDescriptions);
    ValidateEndpoint(config.fileStore, false);
}

} // namespace coversync::infrastructure
