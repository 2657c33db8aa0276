#include <cassert>
#include <chrono>
#include <iostream>
#include <atomic>
#include <set>
#include <thread>
#include "domain/Errors.hpp"
#include "domain/ProcessingState.hpp"
#include "infrastructure/SqliteProcessedFileRepository.hpp"

using namespace coversync::domain;
using coversync::infrastructure::SqliteProcessedFileRepository;

namespace {

ProcessedFile MakeRow(const std::string& session, const std::string& name, const std::string& etag,
                      ProcessingState state = ProcessingState::Queued) {
    ProcessedFile row;
    row.sessionId = session;
    row.seriesId = 7;
    row.fileName = name;
    row.filePath = "covers/" + name;
    row.fileEtag = etag;
    row.fileSize = 1024;
    row.state = state;
    return row;
}

ProcessedFile MakeFinished(const std::string& name, const std::string& etag,
                           std::chrono::system_clock::time_point processedAt) {
    ProcessedFile row = MakeRow("old-session", name, etag, ProcessingState::Processed);
    row.processedAt = processedAt;
    return row;
}

bool ThrowsConflict(SqliteProcessedFileRepository& repo, const ProcessedFile& row) {
    try {
        repo.upsert(row);
    } catch (const ConflictError&) {
        return true;
    }
    return false;
}

void TestStateMachineHelpers() {
    assert(StateToString(ProcessingState::Matching) == "MATCHING");
    assert(StateFromString("UNRESOLVED") == ProcessingState::Unresolved);
    assert(!StateFromString("DONE"));
    assert(IsTerminal(ProcessingState::Failed));
    assert(!IsTerminal(ProcessingState::Recognizing));
    assert(IsForwardTransition(ProcessingState::Queued, ProcessingState::Uploaded));
    assert(IsForwardTransition(ProcessingState::Uploaded, ProcessingState::Failed));
    assert(!IsForwardTransition(ProcessingState::Matching, ProcessingState::Recognizing));
    assert(!IsForwardTransition(ProcessingState::Processed, ProcessingState::Failed));
    std::cout << "[PASS] State machine helpers." << std::endl;
}

void TestUpsertAndVersioning() {
    SqliteProcessedFileRepository repo(":memory:");

    ProcessedFile row = repo.upsert(MakeRow("s1", "a.jpg", "etag-a"));
    assert(row.isPersisted());
    assert(row.version == 1);

    row.state = ProcessingState::Uploaded;
    ProcessedFile uploaded = repo.upsert(row);
    assert(uploaded.version == 2);

    // Writing with the version read before the last update is rejected.
    ProcessedFile stale = row;
    stale.state = ProcessingState::Recognizing;
    assert(ThrowsConflict(repo, stale));

    // So is going backwards.
    ProcessedFile backwards = uploaded;
    backwards.state = ProcessingState::Queued;
    assert(ThrowsConflict(repo, backwards));

    uploaded.state = ProcessingState::Failed;
    uploaded.errorMessage = "boom";
    uploaded.processedAt = std::chrono::system_clock::now();
    ProcessedFile failed = repo.upsert(uploaded);

    // Terminal rows never change state again.
    ProcessedFile revived = failed;
    revived.state = ProcessingState::Processed;
    assert(ThrowsConflict(repo, revived));

    auto stored = repo.lookupByEtag("etag-a");
    assert(stored && stored->state == ProcessingState::Failed);
    assert(stored->errorMessage == "boom");
    assert(stored->version == 3);
    assert(stored->processedAt.has_value());

    std::cout << "[PASS] Upsert honours versions and forward-only transitions." << std::endl;
}

void TestUniqueness() {
    SqliteProcessedFileRepository repo(":memory:");
    repo.upsert(MakeRow("s1", "a.jpg", "etag-a"));

    // Same bytes under another name, and another file under the same name.
    assert(ThrowsConflict(repo, MakeRow("s2", "b.jpg", "etag-a")));
    assert(ThrowsConflict(repo, MakeRow("s1", "a.jpg", "etag-z")));

    auto byName = repo.lookupBySessionAndFileName("s1", "a.jpg");
    assert(byName && byName->fileEtag == "etag-a");
    assert(!repo.lookupBySessionAndFileName("s1", "b.jpg"));
    std::cout << "[PASS] Etag and (session, file name) are unique." << std::endl;
}

void TestConcurrentTransitions() {
    SqliteProcessedFileRepository repo(":memory:");

    for (int round = 0; round < 50; ++round) {
        const std::string etag = "race-" + std::to_string(round);
        const ProcessedFile read = repo.upsert(MakeRow("s1", "race" + std::to_string(round) + ".jpg", etag));

        std::atomic<int> ready{0};
        std::atomic<int> conflicts{0};
        std::atomic<int> written{0};
        auto writer = [&](ProcessingState target) {
            ProcessedFile next = read;
            next.state = target;
            if (target == ProcessingState::Failed) {
                next.processedAt = std::chrono::system_clock::now();
            }
            ++ready;
            while (ready.load() < 2) {
                std::this_thread::yield();
            }
            try {
                repo.upsert(next);
                ++written;
            } catch (const ConflictError&) {
                ++conflicts;
            }
        };

        std::thread uploader(writer, ProcessingState::Uploaded);
        std::thread failer(writer, ProcessingState::Failed);
        uploader.join();
        failer.join();

        assert(written == 1);
        assert(conflicts == 1);
        auto stored = repo.lookupByEtag(etag);
        assert(stored && stored->version == 2);
        assert(stored->state == ProcessingState::Uploaded || stored->state == ProcessingState::Failed);
    }
    std::cout << "[PASS] Concurrent moves of one row: exactly one wins." << std::endl;
}

void TestQueriesAndDeletes() {
    SqliteProcessedFileRepository repo(":memory:");
    auto now = std::chrono::system_clock::now();

    ProcessedFile a = MakeRow("s1", "a.jpg", "etag-a", ProcessingState::Processed);
    a.processedAt = now;
    repo.upsert(a);
    ProcessedFile b = MakeRow("s1", "b.jpg", "etag-b", ProcessingState::Unresolved);
    b.processedAt = now;
    repo.upsert(b);
    ProcessedFile c = MakeRow("s2", "c.jpg", "etag-c", ProcessingState::Processed);
    c.seriesId = 9;
    c.processedAt = now;
    repo.upsert(c);

    assert(repo.countProcessed(7) == 1);
    assert(repo.listProcessedPaths(7) == std::set<std::string>{"covers/a.jpg"});
    assert(repo.findBySession("s1").size() == 2);

    assert(repo.deleteBySession("s1") == 2);
    assert(repo.findBySession("s1").empty());
    assert(!repo.lookupByEtag("etag-a"));
    assert(repo.lookupByEtag("etag-c"));

    assert(repo.deleteBySeries(9) == 1);
    assert(repo.deleteBySeries(9) == 0);
    std::cout << "[PASS] Session and series cleanup." << std::endl;
}

void TestStaleCursor() {
    // Page size 2 forces several round trips.
    SqliteProcessedFileRepository repo(":memory:", 2);
    auto now = std::chrono::system_clock::now();
    using std::chrono::hours;

    for (int i = 0; i < 5; ++i) {
        repo.upsert(MakeFinished("old" + std::to_string(i) + ".jpg", "old-" + std::to_string(i),
                                 now - hours(24 * 40) + hours(i)));
    }
    repo.upsert(MakeFinished("recent.jpg", "recent", now - hours(1)));
    repo.upsert(MakeRow("live", "pending.jpg", "pending"));  // no processedAt

    const auto cutoff = now - hours(24 * 30);
    auto cursor = repo.findStale(cutoff);

    std::vector<std::string> seen;
    while (auto row = cursor->next()) {
        seen.push_back(row->fileName);
        if (seen.size() == 2) break;
    }
    assert(seen.size() == 2);
    assert(seen[0] == "old0.jpg" && seen[1] == "old1.jpg");

    // Resume from an exported position in a fresh cursor.
    const CursorPosition position = cursor->position();
    auto resumed = repo.findStale(cutoff);
    resumed->seek(position);
    while (auto row = resumed->next()) {
        seen.push_back(row->fileName);
    }
    assert(seen.size() == 5);
    assert(seen[4] == "old4.jpg");

    // Restart yields the whole sequence again, in order.
    resumed->restart();
    int count = 0;
    while (auto row = resumed->next()) {
        ++count;
    }
    assert(count == 5);

    // Deleting while iterating does not skip rows.
    auto sweeping = repo.findStale(cutoff);
    int deleted = 0;
    while (auto row = sweeping->next()) {
        assert(repo.deleteById(row->id));
        ++deleted;
    }
    assert(deleted == 5);
    assert(repo.lookupByEtag("recent"));
    assert(repo.lookupByEtag("pending"));
    assert(!repo.findStale(cutoff)->next());
    std::cout << "[PASS] Stale cursor pages, resumes, restarts and survives deletes." << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting Ledger Test..." << std::endl;
    TestStateMachineHelpers();
    TestUpsertAndVersioning();
    TestUniqueness();
    TestConcurrentTransitions();
    TestQueriesAndDeletes();
    TestStaleCursor();
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
