#include <cassert>
#include <chrono>
#include <iostream>
#include <thread>
#include "application/ProgressBroadcaster.hpp"
#include "application/RetentionSweeper.hpp"
#include "infrastructure/SqliteProcessedFileRepository.hpp"

using namespace coversync;
using application::ProgressBroadcaster;
using application::RetentionSweeper;
using domain::ProcessingState;
using infrastructure::SqliteProcessedFileRepository;

namespace {

using Clock = std::chrono::system_clock;

void AddFinished(SqliteProcessedFileRepository& ledger, const std::string& name, Clock::time_point at) {
    domain::ProcessedFile row;
    row.sessionId = "archive";
    row.seriesId = 3;
    row.fileName = name;
    row.filePath = "covers/" + name;
    row.fileEtag = "etag-" + name;
    row.state = ProcessingState::Processed;
    row.processedAt = at;
    ledger.upsert(row);
}

void AddInProgress(SqliteProcessedFileRepository& ledger, const std::string& name) {
    domain::ProcessedFile row;
    row.sessionId = "live";
    row.fileName = name;
    row.filePath = name;
    row.fileEtag = "etag-" + name;
    row.state = ProcessingState::Recognizing;
    ledger.upsert(row);
}

} // namespace

int main() {
    std::cout << "[Test] Starting Retention Sweeper Test..." << std::endl;
    const auto now = Clock::now();

    // Only rows finished before the cutoff go; unfinished rows have no processedAt and stay.
    {
        SqliteProcessedFileRepository ledger(":memory:");
        ProgressBroadcaster broadcaster;
        for (int i = 0; i < 5; ++i) {
            AddFinished(ledger, "old" + std::to_string(i) + ".jpg", now - std::chrono::hours(24 * 40));
        }
        AddFinished(ledger, "recent.jpg", now - std::chrono::hours(2));
        AddInProgress(ledger, "busy.jpg");

        RetentionSweeper sweeper(ledger, broadcaster, std::chrono::hours(24 * 30),
                                 std::chrono::minutes(120), std::chrono::minutes(30));
        auto report = sweeper.sweepNow();
        assert(report.completed);
        assert(report.rowsDeleted == 5);
        assert(ledger.findBySession("archive").size() == 1);
        assert(ledger.lookupByEtag("etag-recent.jpg"));
        assert(ledger.lookupByEtag("etag-busy.jpg"));

        // Nothing left to do.
        assert(sweeper.sweepNow().rowsDeleted == 0);
        std::cout << "[PASS] Rows older than the retention window removed." << std::endl;
    }

    // An explicit cutoff removes everything finished before it.
    {
        SqliteProcessedFileRepository ledger(":memory:");
        ProgressBroadcaster broadcaster;
        AddFinished(ledger, "a.jpg", now - std::chrono::minutes(10));
        AddFinished(ledger, "b.jpg", now + std::chrono::minutes(10));

        RetentionSweeper sweeper(ledger, broadcaster, std::chrono::hours(1),
                                 std::chrono::minutes(1), std::chrono::minutes(1));
        assert(sweeper.sweep(now).rowsDeleted == 1);
        assert(!ledger.lookupByEtag("etag-a.jpg"));
        assert(ledger.lookupByEtag("etag-b.jpg"));
        std::cout << "[PASS] Sweep honours an explicit cutoff." << std::endl;
    }

    // Idle progress sessions are closed and their subscribers woken.
    {
        SqliteProcessedFileRepository ledger(":memory:");
        ProgressBroadcaster broadcaster;
        auto idle = broadcaster.subscribe("idle-session");
        std::this_thread::sleep_for(std::chrono::milliseconds(20));

        RetentionSweeper sweeper(ledger, broadcaster, std::chrono::hours(1),
                                 std::chrono::minutes(0), std::chrono::minutes(1));
        auto report = sweeper.sweepNow();
        assert(report.sessionsClosed == 1);
        assert(idle->isClosed());
        assert(broadcaster.subscriberCount("idle-session") == 0);
        std::cout << "[PASS] Idle sessions closed." << std::endl;
    }

    // The background worker sweeps on start and stops promptly.
    {
        SqliteProcessedFileRepository ledger(":memory:");
        ProgressBroadcaster broadcaster;
        AddFinished(ledger, "stale.jpg", now - std::chrono::hours(24 * 60));

        RetentionSweeper sweeper(ledger, broadcaster, std::chrono::hours(24),
                                 std::chrono::minutes(120), std::chrono::minutes(60));
        sweeper.start();
        for (int i = 0; i < 100 && ledger.lookupByEtag("etag-stale.jpg"); ++i) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        assert(!ledger.lookupByEtag("etag-stale.jpg"));

        auto started = std::chrono::steady_clock::now();
        sweeper.stop();
        assert(std::chrono::steady_clock::now() - started < std::chrono::seconds(5));
        std::cout << "[PASS] Background sweeper starts and stops." << std::endl;
    }

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
