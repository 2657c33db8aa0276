/**
 * @file CoverSyncApp.hpp
 * @brief Composition root of the CoverSync service.
 */

#pragma once

#include <memory>
#include <string>
#include "infrastructure/ConfigLoader.hpp"

namespace coversync::infrastructure {
class SqliteProcessedFileRepository;
class SqliteCatalogMirror;
class RecognitionClient;
class LiveCatalogClient;
class InferenceClient;
class FileStoreClient;
class PersistenceService;
class SeriesRegistryFs;
class ProgressStreamServer;
}

namespace coversync::application {
class ProgressBroadcaster;
class ReconciliationEngine;
class PipelineOrchestrator;
class RetentionSweeper;
}

namespace coversync::app {

/**
 * @class CoverSyncApp
 * @brief Wires configuration, storage, backends and the pipeline, then serves until SIGINT/SIGTERM.
 */
class CoverSyncApp {
public:
    explicit CoverSyncApp(std::string settingsPath);
    ~CoverSyncApp();

    /**
     * @brief Starts every component and blocks until a termination signal arrives.
     * @return Exit code (0 for success).
     */
    int Run();

private:
    /**
     * @brief Loads the configuration and builds the object graph.
     * @return True if initialization succeeded.
     */
    bool Init();

    /** @brief Stops components in reverse dependency order. */
    void Shutdown();

    std::string m_settingsPath;
    infrastructure::AppConfig m_config;

    std::unique_ptr<infrastructure::PersistenceService> m_persistence;
    std::unique_ptr<infrastructure::SqliteProcessedFileRepository> m_ledger;
    std::unique_ptr<infrastructure::SqliteCatalogMirror> m_mirror;
    std::unique_ptr<infrastructure::SeriesRegistryFs> m_seriesRegistry;
    std::unique_ptr<infrastructure::RecognitionClient> m_recognition;
    std::unique_ptr<infrastructure::LiveCatalogClient> m_liveCatalog;
    std::unique_ptr<infrastructure::InferenceClient> m_inference;
    std::unique_ptr<infrastructure::FileStoreClient> m_fileStore;
    std::unique_ptr<application::ProgressBroadcaster> m_broadcaster;
    std::unique_ptr<application::ReconciliationEngine> m_reconciliation;
    std::unique_ptr<application::PipelineOrchestrator> m_orchestrator;
    std::unique_ptr<application::RetentionSweeper> m_sweeper;
    std::unique_ptr<infrastructure::ProgressStreamServer> m_server;
};

} // namespace coversync::app
