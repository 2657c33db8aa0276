/**
 * @file PipelineOrchestrator.cpp
 * @brief Implementation of PipelineOrchestrator.
 */

#include "application/PipelineOrchestrator.hpp"
#include "domain/Errors.hpp"
#include "infrastructure/Fingerprint.hpp"
#include "infrastructure/JsonMapping.hpp"
#include <algorithm>
#include <iostream>
#include <nlohmann/json.hpp>

namespace coversync::application {

using domain::ProcessingState;

namespace {

constexpr const char* kAbortReason = "session aborted";

using domain::SessionAborted;

/** A row left behind by an aborted session says nothing about the content. */
bool IsAbandoned(const domain::ProcessedFile& row) {
    return row.state == ProcessingState::Failed && row.errorMessage == kAbortReason;
}

std::string JoinRemotePath(std::string prefix, const std::string& sessionId, const std::string& fileName) {
    while (!prefix.empty() && prefix.back() == '/') {
        prefix.pop_back();
    }
    return prefix + "/" + sessionId + "/" + fileName;
}

} // namespace

PipelineOrchestrator::PipelineOrchestrator(PipelineContext context) : m_ctx(std::move(context)) {}

PipelineOrchestrator::~PipelineOrchestrator() {
    shutdown();
}

// --- Waiting and retries ----------------------------------------------------

template <typename T>
T PipelineOrchestrator::await(std::future<T>& future, const Tracker& tracker, bool cancellable) {
    while (future.wait_for(m_ctx.settings.cancellationPoll) != std::future_status::ready) {
        if (cancellable && tracker.session->aborted->load()) {
            throw SessionAborted();
        }
    }
    return future.get();
}

template <typename T, typename Fn>
T PipelineOrchestrator::withRetries(const Tracker& tracker, const char* what, Fn fn, bool cancellable) {
    const int attempts = std::max(1, m_ctx.settings.maxAttempts);
    auto delay = m_ctx.settings.initialBackoff;

    for (int attempt = 1;; ++attempt) {
        try {
            return fn();
        } catch (const domain::GatewayError& e) {
            if (!e.isTransient()) throw;
            if (attempt >= attempts) {
                throw domain::GatewayError(e.kind(), e.service(),
                                           std::string(what) + " failed after " + std::to_string(attempts) +
                                               " attempt(s): " + e.what(),
                                           e.status());
            }
            std::cerr << "[PipelineOrchestrator] " << tracker.fileName << ": " << what << " attempt " << attempt
                      << " failed (" << e.what() << "), retrying in " << delay.count() << " ms" << std::endl;
        }
        backoff(tracker, delay, cancellable);
        auto scaled = std::chrono::milliseconds(
            static_cast<std::chrono::milliseconds::rep>(delay.count() * m_ctx.settings.backoffMultiplier));
        delay = std::min(scaled, m_ctx.settings.maxBackoff);
    }
}

void PipelineOrchestrator::backoff(const Tracker& tracker, std::chrono::milliseconds delay, bool cancellable) {
    const auto deadline = std::chrono::steady_clock::now() + delay;
    while (true) {
        if (cancellable && tracker.session->aborted->load()) {
            throw SessionAborted();
        }
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) return;
        std::this_thread::sleep_for(std::min(remaining, m_ctx.settings.cancellationPoll));
    }
}

// --- Sessions and workers ---------------------------------------------------

std::shared_ptr<PipelineOrchestrator::Session> PipelineOrchestrator::sessionFor(const std::string& sessionId,
                                                                              bool create) {
    std::lock_guard<std::mutex> lock(m_sessionsMutex);
    auto it = m_sessions.find(sessionId);
    if (it != m_sessions.end()) {
        return it->second;
    }
    if (!create) {
        return nullptr;
    }
    auto session = std::make_shared<Session>(sessionId);
    m_sessions.emplace(sessionId, session);
    return session;
}

std::vector<SubmissionReceipt> PipelineOrchestrator::submit(const std::string& sessionId,
                                                            const std::vector<FileSubmission>& files) {
    auto session = sessionFor(sessionId, true);
    std::vector<SubmissionReceipt> receipts;
    receipts.reserve(files.size());

    for (const auto& submitted : files) {
        FileSubmission file = submitted;
        if (file.filePath.empty()) {
            file.filePath = file.fileName;
        }

        SubmissionReceipt receipt;
        receipt.fileName = file.fileName;
        publish(sessionId, file.fileName, std::nullopt, ProcessingState::Queued, "");

        if (file.content && file.content->size() > m_ctx.settings.maxUploadBytes) {
            receipt.reason = domain::OversizedPayloadError("upload", file.content->size(),
                                                           m_ctx.settings.maxUploadBytes).what();
            rejectAtSubmission(sessionId, file, receipt.reason, true);
        } else if (!file.content && !m_ctx.fileStore) {
            receipt.reason = "no content supplied and no file store configured";
            rejectAtSubmission(sessionId, file, receipt.reason, false);
        } else {
            receipt.accepted = enqueue(session, file);
            if (!receipt.accepted) {
                receipt.reason = kAbortReason;
                rejectAtSubmission(sessionId, file, receipt.reason, false);
            }
        }
        receipts.push_back(receipt);
    }

    spawnWorkers(session);
    return receipts;
}

bool PipelineOrchestrator::enqueue(std::shared_ptr<Session>& session, const FileSubmission& file) {
    while (true) {
        {
            std::lock_guard<std::mutex> lock(session->mutex);
            if (!session->retired) {
                if (session->aborted->load() || m_shuttingDown) {
                    return false;
                }
                session->queue.push_back(Job{file});
                ++session->pending;
                return true;
            }
        }
        session = sessionFor(session->id, true);
    }
}

void PipelineOrchestrator::spawnWorkers(const std::shared_ptr<Session>& session) {
    std::lock_guard<std::mutex> lock(session->mutex);

    auto& workers = session->workers;
    for (auto it = workers.begin(); it != workers.end();) {
        if (it->finished->load()) {
            if (it->thread.joinable()) it->thread.join();
            it = workers.erase(it);
        } else {
            ++it;
        }
    }

    const int limit = std::max(1, m_ctx.settings.maxConcurrentFiles);
    while (session->liveWorkers < limit && static_cast<std::size_t>(session->liveWorkers) < session->pending) {
        auto finished = std::make_shared<std::atomic<bool>>(false);
        ++session->liveWorkers;
        workers.push_back(Worker{std::thread(&PipelineOrchestrator::workerLoop, this, session, finished), finished});
    }
}

void PipelineOrchestrator::workerLoop(std::shared_ptr<Session> session, std::shared_ptr<std::atomic<bool>> finished) {
    while (true) {
        std::optional<Job> job;
        {
            std::lock_guard<std::mutex> lock(session->mutex);
            if (session->queue.empty()) {
                --session->liveWorkers;
            } else {
                job = std::move(session->queue.front());
                session->queue.pop_front();
            }
        }
        if (!job) break;
        runJob(session, *job);
    }
    finished->store(true);
}

void PipelineOrchestrator::finishJob(const std::shared_ptr<Session>& session) {
    std::lock_guard<std::mutex> lock(session->mutex);
    if (session->pending > 0) {
        --session->pending;
    }
    if (session->pending == 0) {
        session->idle.notify_all();
    }
}

void PipelineOrchestrator::joinWorkers(const std::shared_ptr<Session>& session) {
    std::vector<Worker> workers;
    {
        std::lock_guard<std::mutex> lock(session->mutex);
        workers.swap(session->workers);
    }
    for (auto& worker : workers) {
        if (worker.thread.joinable()) {
            worker.thread.join();
        }
    }
}

void PipelineOrchestrator::waitForSession(const std::string& sessionId) {
    auto session = sessionFor(sessionId, false);
    if (!session) return;
    {
        std::unique_lock<std::mutex> lock(session->mutex);
        session->idle.wait(lock, [&session] { return session->pending == 0; });
    }
    joinWorkers(session);
}

void PipelineOrchestrator::abortSession(const std::string& sessionId) {
    auto session = sessionFor(sessionId, false);
    if (!session) return;

    std::deque<Job> dropped;
    {
        std::lock_guard<std::mutex> lock(session->mutex);
        session->aborted->store(true);
        dropped.swap(session->queue);
    }
    std::cout << "[PipelineOrchestrator] Aborting session " << sessionId << " (" << dropped.size()
              << " queued file(s) dropped)" << std::endl;

    for (const auto& job : dropped) {
        publish(sessionId, job.file.fileName, ProcessingState::Queued, ProcessingState::Failed,
                infrastructure::FailureDetail(kAbortReason));
        finishJob(session);
    }
    waitForSession(sessionId);
}

std::int64_t PipelineOrchestrator::deleteSession(const std::string& sessionId) {
    abortSession(sessionId);
    auto removed = m_ctx.ledger.deleteBySession(sessionId);
    m_ctx.broadcaster.closeSession(sessionId);
    {
        std::lock_guard<std::mutex> lock(m_sessionsMutex);
        m_sessions.erase(sessionId);
    }
    std::cout << "[PipelineOrchestrator] Session " << sessionId << " deleted, " << removed
              << " ledger row(s) removed" << std::endl;
    return removed;
}

std::int64_t PipelineOrchestrator::deleteSeries(std::int64_t seriesId) {
    auto removed = m_ctx.ledger.deleteBySeries(seriesId);
    std::cout << "[PipelineOrchestrator] Series " << seriesId << ": " << removed << " ledger row(s) removed"
              << std::endl;
    return removed;
}

std::size_t PipelineOrchestrator::reapIdleSessions() {
    std::vector<Worker> exited;
    std::size_t reaped = 0;
    {
        std::lock_guard<std::mutex> lock(m_sessionsMutex);
        for (auto it = m_sessions.begin(); it != m_sessions.end();) {
            const auto held = it->second;
            auto& session = *held;
            std::lock_guard<std::mutex> sessionLock(session.mutex);

            // With no live worker left, every remaining thread is past its loop.
            const bool idle = session.pending == 0 && session.liveWorkers == 0;
            auto& workers = session.workers;
            for (auto w = workers.begin(); w != workers.end();) {
                if (idle || w->finished->load()) {
                    exited.push_back(std::move(*w));
                    w = workers.erase(w);
                } else {
                    ++w;
                }
            }

            if (idle && !session.aborted->load()) {
                session.retired = true;
                it = m_sessions.erase(it);
                ++reaped;
            } else {
                ++it;
            }
        }
    }

    for (auto& worker : exited) {
        if (worker.thread.joinable()) {
            worker.thread.join();
        }
    }
    if (reaped > 0) {
        std::cout << "[PipelineOrchestrator] Reaped " << reaped << " idle session(s), joined " << exited.size()
                  << " worker(s)" << std::endl;
    }
    return reaped;
}

std::size_t PipelineOrchestrator::sessionCount() {
    std::lock_guard<std::mutex> lock(m_sessionsMutex);
    return m_sessions.size();
}

void PipelineOrchestrator::shutdown() {
    if (m_shuttingDown.exchange(true)) return;

    std::vector<std::string> sessionIds;
    {
        std::lock_guard<std::mutex> lock(m_sessionsMutex);
        for (const auto& [sessionId, session] : m_sessions) {
            sessionIds.push_back(sessionId);
        }
    }
    for (const auto& sessionId : sessionIds) {
        abortSession(sessionId);
    }
}

// --- Per-file pipeline ------------------------------------------------------

void PipelineOrchestrator::runJob(const std::shared_ptr<Session>& session, const Job& job) {
    Tracker tracker;
    tracker.session = session;
    tracker.fileName = job.file.fileName;

    try {
        process(tracker, job);
    } catch (const SessionAborted&) {
        failFile(tracker, kAbortReason);
    } catch (const domain::GatewayError& e) {
        failFile(tracker, e.service() + " " + domain::GatewayError::KindToString(e.kind()) + ": " + e.what());
    } catch (const std::exception& e) {
        failFile(tracker, e.what());
    }

    if (tracker.ownsEtag) {
        releaseEtag(tracker.etag, tracker.terminal.value_or(
            Terminal{ProcessingState::Failed, infrastructure::FailureDetail("processing interrupted"), false}));
    }
    finishJob(session);
}

void PipelineOrchestrator::process(Tracker& tracker, const Job& job) {
    const auto& file = job.file;
    auto content = file.content;
    if (!content) {
        content = withRetries<std::shared_ptr<const std::string>>(tracker, "fetch", [&]() {
            auto future = m_ctx.fileStore->fetchAsync(file.filePath, tracker.session->aborted);
            return await(future, tracker, true);
        }, true);
    }
    if (content->size() > m_ctx.settings.maxUploadBytes) {
        throw domain::OversizedPayloadError("upload", content->size(), m_ctx.settings.maxUploadBytes);
    }

    tracker.etag = infrastructure::Sha256Hex(*content);

    if (waitForInFlightCopy(tracker)) {
        return;
    }
    tracker.ownsEtag = true;

    auto existing = m_ctx.ledger.lookupByEtag(tracker.etag);
    if (existing && IsAbandoned(*existing)) {
        std::cout << "[PipelineOrchestrator] " << tracker.session->id << "/" << tracker.fileName
                  << ": superseding row " << existing->id << " left by aborted session " << existing->sessionId
                  << std::endl;
        m_ctx.ledger.deleteById(existing->id);
        existing.reset();
    }
    if (!existing) {
        domain::ProcessedFile row;
        row.sessionId = tracker.session->id;
        row.seriesId = file.seriesId;
        row.fileName = file.fileName;
        row.filePath = file.filePath;
        row.fileEtag = tracker.etag;
        row.fileSize = static_cast<std::int64_t>(content->size());
        row.state = ProcessingState::Queued;
        existing = insertRow(tracker, row);
    }

    if (existing) {
        if (domain::IsTerminal(existing->state)) {
            replayTerminal(tracker, Terminal{existing->state, existing->detailJson});
            return;
        }
        std::cout << "[PipelineOrchestrator] " << tracker.session->id << "/" << tracker.fileName
                  << ": resuming ledger row " << existing->id << " at " << domain::StateToString(existing->state)
                  << std::endl;
        tracker.row = existing;
        if (existing->state != ProcessingState::Queued) {
            publish(tracker.session->id, tracker.fileName, tracker.published, existing->state, "");
            tracker.published = existing->state;
        }
    }

    if (tracker.row->state == ProcessingState::Queued) {
        if (file.content) {
            archive(tracker, job, content);
        }
        advance(tracker, ProcessingState::Uploaded, "");
    }
    recognizeAndMatch(tracker, job, content);
}

bool PipelineOrchestrator::waitForInFlightCopy(Tracker& tracker) {
    while (auto inFlight = claimEtag(tracker.etag)) {
        std::cout << "[PipelineOrchestrator] " << tracker.session->id << "/" << tracker.fileName
                  << ": identical content in flight, waiting" << std::endl;
        while (inFlight->wait_for(m_ctx.settings.cancellationPoll) != std::future_status::ready) {
            if (tracker.session->aborted->load()) throw SessionAborted();
        }
        const Terminal terminal = inFlight->get();
        if (terminal.settled) {
            replayTerminal(tracker, terminal);
            return true;
        }
        std::cout << "[PipelineOrchestrator] " << tracker.session->id << "/" << tracker.fileName
                  << ": in-flight copy ended without an outcome, taking over" << std::endl;
    }
    return false;
}

std::optional<domain::ProcessedFile> PipelineOrchestrator::insertRow(Tracker& tracker,
                                                                     const domain::ProcessedFile& row) {
    try {
        tracker.row = m_ctx.ledger.upsert(row);
        return std::nullopt;
    } catch (const domain::ConflictError& e) {
        std::cerr << "[PipelineOrchestrator] " << tracker.fileName << ": " << e.what()
                  << ", retrying with fresh read" << std::endl;
    }

    if (auto sameContent = m_ctx.ledger.lookupByEtag(row.fileEtag)) {
        return sameContent;
    }
    auto sameName = m_ctx.ledger.lookupBySessionAndFileName(row.sessionId, row.fileName);
    if (!sameName) {
        throw domain::ConflictError("Ledger rejected " + row.fileName + " but holds no conflicting row");
    }
    if (!domain::IsTerminal(sameName->state)) {
        throw domain::ConflictError(row.fileName + " is still being processed with other content in session " +
                                    row.sessionId);
    }

    std::cout << "[PipelineOrchestrator] " << tracker.session->id << "/" << tracker.fileName
              << ": new content replaces " << domain::StateToString(sameName->state) << " row " << sameName->id
              << std::endl;
    m_ctx.ledger.deleteById(sameName->id);
    tracker.row = m_ctx.ledger.upsert(row);
    return std::nullopt;
}

void PipelineOrchestrator::archive(const Tracker& tracker, const Job& job,
                                   const std::shared_ptr<const std::string>& content) {
    if (m_ctx.settings.archivePrefix.empty() || !m_ctx.fileStore) {
        return;
    }
    const std::string remotePath = JoinRemotePath(m_ctx.settings.archivePrefix, tracker.session->id,
                                                  job.file.fileName);
    withRetries<bool>(tracker, "archive", [&]() {
        auto future = m_ctx.fileStore->storeAsync(remotePath, content, tracker.session->aborted);
        await(future, tracker, true);
        return true;
    }, true);
    std::cout << "[PipelineOrchestrator] " << tracker.session->id << "/" << tracker.fileName << ": archived to "
              << remotePath << std::endl;
}

void PipelineOrchestrator::recognizeAndMatch(Tracker& tracker, const Job& job,
                                             const std::shared_ptr<const std::string>& content) {
    const std::int64_t seriesId = job.file.seriesId != 0 ? job.file.seriesId : tracker.row->seriesId;

    if (tracker.row->state == ProcessingState::Uploaded) {
        advance(tracker, ProcessingState::Recognizing, "");
    }

    domain::RecognitionResult recognition;
    if (tracker.row->state == ProcessingState::Recognizing) {
        domain::RecognitionRequest request;
        request.sessionId = tracker.session->id;
        request.fileName = job.file.fileName;
        request.contentType = job.file.contentType;
        request.content = content;
        request.cancelled = tracker.session->aborted;
        if (m_ctx.seriesRegistry && seriesId != 0) {
            request.seriesNameHint = m_ctx.seriesRegistry->seriesName(seriesId);
        }

        recognition = withRetries<domain::RecognitionResult>(tracker, "recognition", [&]() {
            auto future = m_ctx.recognition.recognizeAsync(request);
            return await(future, tracker, true);
        }, true);
        advance(tracker, ProcessingState::Matching, infrastructure::ToJson(recognition).dump());
    } else {
        auto stored = nlohmann::json::parse(tracker.row->detailJson, nullptr, false);
        if (stored.is_discarded() || !stored.is_object()) {
            throw std::runtime_error("recognition result of resumed file is missing");
        }
        recognition = infrastructure::RecognitionResultFromJson(stored);
    }

    // From MATCHING on the file always runs to completion, even in an aborted session.
    auto outcome = withRetries<ReconciliationOutcome>(tracker, "reconciliation", [&]() {
        return m_ctx.reconciliation.reconcile(recognition, seriesId);
    }, false);

    std::vector<domain::CatalogIssue> issues;
    if (outcome.mirrorSeries) {
        issues = m_ctx.reconciliation.listIssues(outcome.mirrorSeries->id);
    }
    advance(tracker, outcome.terminalState(), infrastructure::ToJson(outcome, issues).dump());

    releaseEtag(tracker.etag, *tracker.terminal);
    tracker.ownsEtag = false;

    if (outcome.resolved()) {
        int yearBegan = outcome.mirrorSeries ? outcome.mirrorSeries->yearBegan : outcome.catalogHit->startYear;
        describeSeries(outcome.seriesName(), yearBegan, seriesId);
    }
}

void PipelineOrchestrator::describeSeries(const std::string& seriesName, int yearBegan, std::int64_t seriesId) {
    if (!m_ctx.settings.generateDescriptions || !m_ctx.descriptions || !m_ctx.seriesRegistry || seriesId == 0) {
        return;
    }
    try {
        auto text = m_ctx.descriptions->describeSeriesAsync(seriesName, yearBegan).get();
        if (text && !text->empty()) {
            m_ctx.seriesRegistry->recordDescription(seriesId, *text);
            std::cout << "[PipelineOrchestrator] Description stored for series " << seriesId << std::endl;
        }
    } catch (const std::exception& e) {
        std::cerr << "[PipelineOrchestrator] Description generation failed for '" << seriesName << "': "
                  << e.what() << std::endl;
    }
}

// --- Ledger and events ------------------------------------------------------

void PipelineOrchestrator::advance(Tracker& tracker, ProcessingState next, const std::string& detailJson,
                                   const std::string& errorMessage) {
    domain::ProcessedFile row = *tracker.row;
    row.state = next;
    row.detailJson = detailJson;
    row.errorMessage = errorMessage;
    if (domain::IsTerminal(next)) {
        row.processedAt = std::chrono::system_clock::now();
    }
    tracker.row = writeRow(tracker, row);

    const auto previous = tracker.published;
    tracker.published = next;
    if (domain::IsTerminal(next)) {
        tracker.terminal = Terminal{next, detailJson};
    }
    publish(tracker.session->id, tracker.fileName, previous, next, detailJson);
    std::cout << "[PipelineOrchestrator] " << tracker.session->id << "/" << tracker.fileName << ": "
              << domain::StateToString(previous) << " -> " << domain::StateToString(next) << std::endl;
}

domain::ProcessedFile PipelineOrchestrator::writeRow(const Tracker& tracker, domain::ProcessedFile next) {
    try {
        return m_ctx.ledger.upsert(next);
    } catch (const domain::ConflictError& e) {
        std::cerr << "[PipelineOrchestrator] " << tracker.fileName << ": " << e.what()
                  << ", retrying with fresh read" << std::endl;
        auto fresh = m_ctx.ledger.lookupByEtag(next.fileEtag);
        if (!fresh || fresh->state != tracker.row->state) {
            throw;
        }
        next.id = fresh->id;
        next.version = fresh->version;
        return m_ctx.ledger.upsert(next);
    }
}

void PipelineOrchestrator::failFile(Tracker& tracker, const std::string& reason) {
    if (tracker.terminal) return;

    const std::string detail = infrastructure::FailureDetail(reason);
    std::cerr << "[PipelineOrchestrator] " << tracker.session->id << "/" << tracker.fileName << " FAILED: "
              << reason << std::endl;

    if (tracker.row && !domain::IsTerminal(tracker.row->state)) {
        domain::ProcessedFile row = *tracker.row;
        row.state = ProcessingState::Failed;
        row.processedAt = std::chrono::system_clock::now();
        row.errorMessage = reason;
        row.detailJson = detail;
        try {
            tracker.row = writeRow(tracker, row);
        } catch (const domain::ConflictError& e) {
            std::cerr << "[PipelineOrchestrator] Could not record failure of " << tracker.fileName << ": "
                      << e.what() << std::endl;
        } catch (const domain::LedgerError& e) {
            std::cerr << "[PipelineOrchestrator] Could not record failure of " << tracker.fileName << ": "
                      << e.what() << std::endl;
        }
    }

    const bool recorded = tracker.row && tracker.row->state == ProcessingState::Failed;
    const auto previous = tracker.published;
    tracker.published = ProcessingState::Failed;
    tracker.terminal = Terminal{ProcessingState::Failed, detail, recorded && reason != kAbortReason};
    publish(tracker.session->id, tracker.fileName, previous, ProcessingState::Failed, detail);
}

void PipelineOrchestrator::replayTerminal(Tracker& tracker, const Terminal& terminal) {
    std::cout << "[PipelineOrchestrator] " << tracker.session->id << "/" << tracker.fileName
              << ": duplicate content, replaying " << domain::StateToString(terminal.state) << std::endl;
    const auto previous = tracker.published;
    tracker.published = terminal.state;
    tracker.terminal = terminal;
    publish(tracker.session->id, tracker.fileName, previous, terminal.state, terminal.detailJson);
}

void PipelineOrchestrator::rejectAtSubmission(const std::string& sessionId, const FileSubmission& file,
                                              const std::string& reason, bool recordInLedger) {
    const std::string detail = infrastructure::FailureDetail(reason);
    std::cerr << "[PipelineOrchestrator] Rejected " << sessionId << "/" << file.fileName << ": " << reason
              << std::endl;

    if (recordInLedger && file.content) {
        domain::ProcessedFile row;
        row.sessionId = sessionId;
        row.seriesId = file.seriesId;
        row.fileName = file.fileName;
        row.filePath = file.filePath;
        row.fileEtag = infrastructure::Sha256Hex(*file.content);
        row.fileSize = static_cast<std::int64_t>(file.content->size());
        row.state = ProcessingState::Failed;
        row.processedAt = std::chrono::system_clock::now();
        row.errorMessage = reason;
        row.detailJson = detail;
        try {
            m_ctx.ledger.upsert(row);
        } catch (const domain::ConflictError& e) {
            std::cerr << "[PipelineOrchestrator] Rejection of " << file.fileName << " not recorded: " << e.what()
                      << std::endl;
        } catch (const domain::LedgerError& e) {
            std::cerr << "[PipelineOrchestrator] Rejection of " << file.fileName << " not recorded: " << e.what()
                      << std::endl;
        }
    }
    publish(sessionId, file.fileName, ProcessingState::Queued, ProcessingState::Failed, detail);
}

void PipelineOrchestrator::publish(const std::string& sessionId, const std::string& fileName,
                                   std::optional<ProcessingState> oldState, ProcessingState newState,
                                   const std::string& detailJson) {
    domain::ProgressEvent event;
    event.sessionId = sessionId;
    event.fileName = fileName;
    event.oldState = oldState;
    event.newState = newState;
    event.timestamp = std::chrono::system_clock::now();
    if (!detailJson.empty()) {
        event.detailJson = detailJson;
    }
    m_ctx.broadcaster.publish(sessionId, event);
}

// --- In-flight coalescing ---------------------------------------------------

std::optional<std::shared_future<PipelineOrchestrator::Terminal>> PipelineOrchestrator::claimEtag(
    const std::string& etag) {
    std::lock_guard<std::mutex> lock(m_inflightMutex);
    auto it = m_inflight.find(etag);
    if (it != m_inflight.end()) {
        return it->second->future;
    }
    auto entry = std::make_shared<InFlight>();
    entry->future = entry->promise.get_future().share();
    m_inflight.emplace(etag, entry);
    return std::nullopt;
}

void PipelineOrchestrator::releaseEtag(const std::string& etag, const Terminal& terminal) {
    std::shared_ptr<InFlight> entry;
    {
        std::lock_guard<std::mutex> lock(m_inflightMutex);
        auto it = m_inflight.find(etag);
        if (it == m_inflight.end()) return;
        entry = it->second;
        m_inflight.erase(it);
    }
    entry->promise.set_value(terminal);
}

} // namespace coversync::application
