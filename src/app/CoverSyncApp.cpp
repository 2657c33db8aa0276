/**
 * @file CoverSyncApp.cpp
 * @brief Implementation of the CoverSyncApp class.
 */
#include "app/CoverSyncApp.hpp"

#include <csignal>
#include <pthread.h>

#include <iostream>
#include "application/PipelineOrchestrator.hpp"
#include "application/ProgressBroadcaster.hpp"
#include "application/ReconciliationEngine.hpp"
#include "application/RetentionSweeper.hpp"
#include "domain/Errors.hpp"
#include "infrastructure/FileStoreClient.hpp"
#include "infrastructure/InferenceClient.hpp"
#include "infrastructure/LiveCatalogClient.hpp"
#include "infrastructure/PersistenceService.hpp"
#include "infrastructure/ProgressStreamServer.hpp"
#include "infrastructure/RecognitionClient.hpp"
#include "infrastructure/SeriesRegistryFs.hpp"
#include "infrastructure/SqliteCatalogMirror.hpp"
#include "infrastructure/SqliteProcessedFileRepository.hpp"

namespace coversync::app {

CoverSyncApp::CoverSyncApp(std::string settingsPath) : m_settingsPath(std::move(settingsPath)) {}

CoverSyncApp::~CoverSyncApp() {
    Shutdown();
}

bool CoverSyncApp::Init() {
    try {
        m_config = infrastructure::ConfigLoader::Load(m_settingsPath);

        m_persistence = std::make_unique<infrastructure::PersistenceService>();
        m_ledger = std::make_unique<infrastructure::SqliteProcessedFileRepository>(m_config.ledgerPath);
        m_mirror = std::make_unique<infrastructure::SqliteCatalogMirror>(m_config.mirrorPath,
                                                                         m_config.mirrorActiveDeletedValue);
        m_seriesRegistry = std::make_unique<infrastructure::SeriesRegistryFs>(m_config.seriesRegistryPath,
                                                                              *m_persistence);

        m_recognition = std::make_unique<infrastructure::RecognitionClient>(m_config.recognition);
        m_liveCatalog = std::make_unique<infrastructure::LiveCatalogClient>(m_config.liveCatalog);
        if (m_config.pipeline.generateDescriptions) {
            if (m_config.inference.secret.empty()) {
                std::cerr << "[CoverSyncApp] GROQ_API_KEY not set, description generation disabled" << std::endl;
                m_config.pipeline.generateDescriptions = false;
            } else {
                m_inference = std::make_unique<infrastructure::InferenceClient>(m_config.inference,
                                                                                m_config.inferenceModel);
            }
        }
        if (!m_config.fileStore.baseUrl.empty()) {
            m_fileStore = std::make_unique<infrastructure::FileStoreClient>(m_config.fileStore);
        }
        if (m_config.liveCatalog.secret.empty()) {
            std::cerr << "[CoverSyncApp] COMIC_VINE_API_KEY not set, live catalog lookups will be rejected" << std::endl;
        }

        m_broadcaster = std::make_unique<application::ProgressBroadcaster>();
        m_reconciliation = std::make_unique<application::ReconciliationEngine>(*m_mirror, *m_liveCatalog,
                                                                               m_seriesRegistry.get());

        application::PipelineContext context{*m_ledger, *m_recognition, *m_reconciliation, *m_broadcaster};
        context.fileStore = m_fileStore.get();
        context.descriptions = m_inference.get();
        context.seriesRegistry = m_seriesRegistry.get();
        context.settings = m_config.pipeline;
        m_orchestrator = std::make_unique<application::PipelineOrchestrator>(std::move(context));

        m_sweeper = std::make_unique<application::RetentionSweeper>(*m_ledger, *m_broadcaster, m_config.retention,
                                                                    m_config.idleSessionCutoff, m_config.sweepInterval);
        m_sweeper->setSessionReaper([this] { return m_orchestrator->reapIdleSessions(); });
        m_server = std::make_unique<infrastructure::ProgressStreamServer>(m_config.server, *m_orchestrator,
                                                                          *m_broadcaster, *m_ledger);

        m_sweeper->start();
        m_server->start();
    } catch (const domain::ConfigError& e) {
        std::cerr << "[CoverSyncApp] Configuration error: " << e.what() << std::endl;
        return false;
    } catch (const std::exception& e) {
        std::cerr << "[CoverSyncApp] Startup failed: " << e.what() << std::endl;
        return false;
    }

    std::cout << "[CoverSyncApp] Ready (ledger " << m_config.ledgerPath << ", mirror " << m_config.mirrorPath << ")"
              << std::endl;
    return true;
}

void CoverSyncApp::Shutdown() {
    if (m_server) m_server->stop();
    if (m_sweeper) m_sweeper->stop();
    if (m_orchestrator) m_orchestrator->shutdown();
    if (m_broadcaster) m_broadcaster->closeAll();
    if (m_persistence) m_persistence->stop();

    m_server.reset();
    m_sweeper.reset();
    m_orchestrator.reset();
    m_reconciliation.reset();
    m_broadcaster.reset();
    m_fileStore.reset();
    m_inference.reset();
    m_liveCatalog.reset();
    m_recognition.reset();
    m_seriesRegistry.reset();
    m_mirror.reset();
    m_ledger.reset();
    m_persistence.reset();
}

int CoverSyncApp::Run() {
    // Blocked before any thread exists so only sigwait below sees them.
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);

    if (!Init()) {
        Shutdown();
        return -1;
    }

    int received = 0;
    if (sigwait(&signals, &received) != 0) {
        std::cerr << "[CoverSyncApp] sigwait failed" << std::endl;
    } else {
        std::cout << "[CoverSyncApp] Signal " << received << " received, shutting down" << std::endl;
    }

    Shutdown();
    return 0;
}

} // namespace coversync::app
