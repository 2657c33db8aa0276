/**
 * @file ConfigLoader.hpp
 * @brief Loads the service configuration (settings.json plus environment overrides).
 *
 * Keeps JSON parsing of the configuration in one place; the rest of the
 * codebase receives typed values.
 */

#pragma once

#include <chrono>
#include <string>
#include <nlohmann/json.hpp>
#include "application/PipelineContext.hpp"
#include "infrastructure/ServiceEndpoint.hpp"

namespace coversync::infrastructure {

struct ServerConfig {
    std::string host = "0.0.0.0";
    int port = 8080;
    std::chrono::seconds heartbeat{30};
    int workerThreads = 8;      ///< Threads left for ordinary requests while streams are open.
    int maxStreams = 32;        ///< Progress streams beyond this are refused with 503.
};

/**
 * @struct AppConfig
 * @brief Everything the composition root needs to wire the service.
 */
struct AppConfig {
    ServerConfig server;
    std::string ledgerPath;
    std::string mirrorPath;
    int mirrorActiveDeletedValue = 0;   ///< Value of gcd_series.deleted / gcd_issue.deleted meaning "active".
    std::string seriesRegistryPath;

    std::chrono::hours retention{24 * 30};
    std::chrono::minutes idleSessionCutoff{120};
    std::chrono::minutes sweepInterval{30};

    application::PipelineSettings pipeline;

    ServiceEndpoint recognition;
    ServiceEndpoint liveCatalog;
    ServiceEndpoint inference;
    std::string inferenceModel = "llama-3.1-8b-instant";
    ServiceEndpoint fileStore;          ///< Disabled when baseUrl is empty.
};

class ConfigLoader {
public:
    /** @brief Built-in defaults, matching the reference deployment. */
    static AppConfig Defaults();

    /**
     * @brief Reads @p path (when it exists) over the defaults, then applies the environment.
     * @throws domain::ConfigError if the file is unreadable or a value has the wrong type or range.
     */
    static AppConfig Load(const std::string& path);

    /** @brief Applies the keys present in @p j over @p base. */
    static AppConfig FromJson(const nlohmann::json& j, AppConfig base);

    /**
     * @brief Overrides hosts, ports, secrets and paths from environment variables:
     * RECOGNITION_SERVER_HOST, RECOGNITION_SERVER_PORT, COMIC_VINE_API_KEY,
     * GROQ_API_KEY, NEXTCLOUD_URL, NEXTCLOUD_USERNAME, NEXTCLOUD_PASSWORD,
     * LEDGER_PATH, MIRROR_PATH.
     */
    static void ApplyEnvironment(AppConfig& config);

    /** @brief Rejects values the service cannot run with. */
    static void Validate(const AppConfig& config);
};

} // namespace coversync::infrastructure
