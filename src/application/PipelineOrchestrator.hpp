/**
 * @file PipelineOrchestrator.hpp
 * @brief Drives every submitted file through the processing state machine.
 */

#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include "application/PipelineContext.hpp"
#include "domain/ProcessedFile.hpp"

namespace coversync::application {

/**
 * @struct FileSubmission
 * @brief One file of a batch. Without `content` the bytes are fetched from the file store at `filePath`.
 */
struct FileSubmission {
    std::string fileName;
    std::string filePath;                        ///< Defaults to fileName.
    std::string contentType = "image/jpeg";
    std::shared_ptr<const std::string> content;
    std::int64_t seriesId = 0;
};

/** @brief Synchronous answer for one submitted file. */
struct SubmissionReceipt {
    std::string fileName;
    bool accepted = false;
    std::string reason;
};

/**
 * @class PipelineOrchestrator
 * @brief QUEUED -> UPLOADED -> RECOGNIZING -> MATCHING -> PROCESSED | UNRESOLVED | FAILED.
 *
 * Each session owns a queue and at most `maxConcurrentFiles` worker threads.
 * The ledger is written when a stage is entered and when it completes, and
 * every transition is published exactly once. Identical bytes are processed
 * once: a second copy either replays the recorded terminal state or waits for
 * the copy that is in flight. When that copy ends without a recorded outcome
 * (its session was aborted, or its row could not be written) a waiter takes
 * the content over and processes it for its own session.
 *
 * A row whose session was aborted is superseded by the next submission of
 * the same bytes. A terminal row is superseded by new content submitted under
 * the same file name in the same session.
 */
class PipelineOrchestrator {
public:
    explicit PipelineOrchestrator(PipelineContext context);
    ~PipelineOrchestrator();

    PipelineOrchestrator(const PipelineOrchestrator&) = delete;
    PipelineOrchestrator& operator=(const PipelineOrchestrator&) = delete;

    /**
     * @brief Queues a batch. Publishes QUEUED for every file before returning.
     *
     * Oversized files and submissions to an aborted session are rejected in
     * their receipt and end FAILED immediately.
     */
    std::vector<SubmissionReceipt> submit(const std::string& sessionId, const std::vector<FileSubmission>& files);

    /**
     * @brief Stops scheduling and fails every file that has not reached MATCHING.
     * Returns once all files of the session are terminal.
     */
    void abortSession(const std::string& sessionId);

    /**
     * @brief Aborts the session, removes its ledger rows and closes its subscribers.
     * @return Number of ledger rows removed.
     */
    std::int64_t deleteSession(const std::string& sessionId);

    /** @brief Removes the ledger rows of a series. */
    std::int64_t deleteSeries(std::int64_t seriesId);

    /** @brief Blocks until every file submitted to the session so far is terminal. */
    void waitForSession(const std::string& sessionId);

    /**
     * @brief Joins exited workers and forgets sessions with nothing queued or running.
     * Aborted sessions are kept so later submissions to them are still refused.
     * @return Number of sessions forgotten.
     */
    std::size_t reapIdleSessions();

    /** @brief Number of sessions currently tracked. */
    std::size_t sessionCount();

    /** @brief Aborts all sessions and joins their workers. */
    void shutdown();

private:
    struct Terminal {
        domain::ProcessingState state = domain::ProcessingState::Failed;
        std::string detailJson;
        bool settled = true;    ///< False when nothing was recorded for the content.
    };

    struct Job {
        FileSubmission file;
    };

    struct Worker {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> finished;
    };

    struct Session {
        explicit Session(std::string sessionId) : id(std::move(sessionId)) {}

        const std::string id;
        std::mutex mutex;
        std::condition_variable idle;
        std::deque<Job> queue;
        std::vector<Worker> workers;
        int liveWorkers = 0;
        std::size_t pending = 0;
        bool retired = false;   ///< Dropped from the session map; submit() must look again.
        std::shared_ptr<std::atomic<bool>> aborted = std::make_shared<std::atomic<bool>>(false);
    };

    struct InFlight {
        std::promise<Terminal> promise;
        std::shared_future<Terminal> future;
    };

    /** Per-file progress as seen by the worker processing it. */
    struct Tracker {
        std::shared_ptr<Session> session;
        std::string fileName;
        domain::ProcessingState published = domain::ProcessingState::Queued;
        std::optional<domain::ProcessedFile> row;
        std::string etag;
        bool ownsEtag = false;
        std::optional<Terminal> terminal;   ///< Set once the terminal event is published.
    };

    std::shared_ptr<Session> sessionFor(const std::string& sessionId, bool create);
    bool enqueue(std::shared_ptr<Session>& session, const FileSubmission& file);
    void spawnWorkers(const std::shared_ptr<Session>& session);
    void workerLoop(std::shared_ptr<Session> session, std::shared_ptr<std::atomic<bool>> finished);
    void joinWorkers(const std::shared_ptr<Session>& session);
    void finishJob(const std::shared_ptr<Session>& session);

    void runJob(const std::shared_ptr<Session>& session, const Job& job);
    void process(Tracker& tracker, const Job& job);
    bool waitForInFlightCopy(Tracker& tracker);
    std::optional<domain::ProcessedFile> insertRow(Tracker& tracker, const domain::ProcessedFile& row);
    void archive(const Tracker& tracker, const Job& job, const std::shared_ptr<const std::string>& content);
    void recognizeAndMatch(Tracker& tracker, const Job& job, const std::shared_ptr<const std::string>& content);
    void describeSeries(const std::string& seriesName, int yearBegan, std::int64_t seriesId);

    void advance(Tracker& tracker, domain::ProcessingState next, const std::string& detailJson,
                 const std::string& errorMessage = "");
    domain::ProcessedFile writeRow(const Tracker& tracker, domain::ProcessedFile next);
    void failFile(Tracker& tracker, const std::string& reason);
    void replayTerminal(Tracker& tracker, const Terminal& terminal);
    void rejectAtSubmission(const std::string& sessionId, const FileSubmission& file, const std::string& reason,
                            bool recordInLedger);

    void publish(const std::string& sessionId, const std::string& fileName,
                 std::optional<domain::ProcessingState> oldState, domain::ProcessingState newState,
                 const std::string& detailJson);

    std::optional<std::shared_future<Terminal>> claimEtag(const std::string& etag);
    void releaseEtag(const std::string& etag, const Terminal& terminal);

    template <typename T>
    T await(std::future<T>& future, const Tracker& tracker, bool cancellable);

    template <typename T, typename Fn>
    T withRetries(const Tracker& tracker, const char* what, Fn fn, bool cancellable);

    void backoff(const Tracker& tracker, std::chrono::milliseconds delay, bool cancellable);

    PipelineContext m_ctx;

    std::mutex m_sessionsMutex;
    std::map<std::string, std::shared_ptr<Session>> m_sessions;

    std::mutex m_inflightMutex;
    std::map<std::string, std::shared_ptr<InFlight>> m_inflight;

    std::atomic<bool> m_shuttingDown{false};
};

} // namespace coversync::application
