#include <cassert>
#include <filesystem>
#include <iostream>
#include "application/ReconciliationEngine.hpp"
#include "domain/Errors.hpp"
#include "infrastructure/SqliteCatalogMirror.hpp"
#include "infrastructure/SqliteDatabase.hpp"
#include "test/TestDoubles.hpp"

using namespace coversync;
using application::MatchSource;
using application::ReconciliationEngine;

namespace {

// Mirror dump with the layout of the gcd_* tables. deleted = 0 means active.
std::string CreateMirror(const std::filesystem::path& path) {
    std::filesystem::remove(path);
    infrastructure::SqliteDatabase db(path.string());
    db.exec(
        "CREATE TABLE gcd_series (id INTEGER PRIMARY KEY, name TEXT, year_began INTEGER, issue_count INTEGER,"
        "  deleted INTEGER);"
        "CREATE TABLE gcd_issue (id INTEGER PRIMARY KEY, series_id INTEGER, number TEXT, key_date TEXT,"
        "  publication_date TEXT, sort_code INTEGER, deleted INTEGER);"
        "INSERT INTO gcd_series VALUES (10, 'Amazing Spider-Man', 1963, 441, 0);"
        "INSERT INTO gcd_series VALUES (11, 'Saga', 2012, 66, 1);"          // deleted
        "INSERT INTO gcd_series VALUES (21, 'Hellboy', 1994, 12, 0);"
        "INSERT INTO gcd_series VALUES (20, 'HELLBOY', 1994, 12, 0);"       // duplicate, lower id
        "INSERT INTO gcd_issue VALUES (100, 10, '3', '1963-07-00', 'July 1963', 3, 0);"
        "INSERT INTO gcd_issue VALUES (101, 10, '1', '1963-03-00', 'March 1963', 1, 0);"
        "INSERT INTO gcd_issue VALUES (102, 10, '2', '1963-05-00', 'May 1963', 2, 1);"  // withdrawn
        "INSERT INTO gcd_issue VALUES (103, 10, '1A', '1963-03-00', 'March 1963', 1, 0);");
    return path.string();
}

domain::RecognitionResult Candidate(const std::string& name, int year, int issues,
                                    std::optional<std::string> catalogId = std::nullopt) {
    domain::RecognitionResult r;
    r.seriesName = name;
    r.inferredYear = year;
    r.inferredIssueCount = issues;
    r.confidence = 0.8;
    r.catalogId = std::move(catalogId);
    r.totalMatches = 3;
    return r;
}

} // namespace

int main() {
    std::cout << "[Test] Starting Reconciliation Test..." << std::endl;

    const auto dbPath = std::filesystem::temp_directory_path() / "coversync_mirror_test.db";
    infrastructure::SqliteCatalogMirror mirror(CreateMirror(dbPath));
    test::FakeLiveCatalog live;
    test::FakeRegistry registry;
    ReconciliationEngine engine(mirror, live, &registry);

    // Mirror hit wins, live catalog is not consulted, case is ignored.
    {
        auto outcome = engine.reconcile(Candidate("amazing spider-man", 1963, 441, "cv-2127"), 5);
        assert(outcome.source == MatchSource::Mirror);
        assert(outcome.mirrorSeries && outcome.mirrorSeries->id == 10);
        assert(outcome.terminalState() == domain::ProcessingState::Processed);
        assert(outcome.secondaryCatalogId == std::string("cv-2127"));
        assert(live.calls == 0);

        auto ids = registry.identifiers(5);
        assert(ids.mirrorIds.count("10") == 1);
        assert(ids.catalogIds.count("cv-2127") == 1);
        std::cout << "[PASS] Mirror match is authoritative." << std::endl;
    }

    // Only active issues, ordered by sort code (ties by id).
    {
        auto issues = engine.listIssues(10);
        assert(issues.size() == 3);
        assert(issues[0].id == 101 && issues[1].id == 103 && issues[2].id == 100);
        std::cout << "[PASS] Active issues ordered by sort code." << std::endl;
    }

    // Duplicate mirror rows resolve to the lowest id.
    {
        auto outcome = engine.reconcile(Candidate("Hellboy", 1994, 12), 0);
        assert(outcome.source == MatchSource::Mirror);
        assert(outcome.mirrorSeries->id == 20);
        assert(outcome.mirrorCandidates == 2);
        std::cout << "[PASS] Ambiguous mirror rows pick the lowest id." << std::endl;
    }

    // Deleted mirror rows fall through to the live catalog.
    {
        domain::LiveSeriesHit other{"cv-1", "Saga", 2012, 54, "Image"};
        domain::LiveSeriesHit exact{"cv-2", "Saga", 2012, 66, "Image"};
        live.hits[{"Saga", 2012}] = {other, exact};

        auto outcome = engine.reconcile(Candidate("Saga", 2012, 66), 6);
        assert(outcome.source == MatchSource::LiveCatalog);
        assert(outcome.catalogHit && outcome.catalogHit->id == "cv-2");
        assert(live.calls == 1);
        auto ids = registry.identifiers(6);
        assert(ids.mirrorIds.empty());
        assert(ids.catalogIds.count("cv-2") == 1);
        std::cout << "[PASS] Live catalog is consulted when the mirror misses." << std::endl;
    }

    // Nothing anywhere: UNRESOLVED, not a failure.
    {
        auto outcome = engine.reconcile(Candidate("Nonexistent Comics", 2099, 1), 7);
        assert(!outcome.resolved());
        assert(outcome.terminalState() == domain::ProcessingState::Unresolved);
        assert(registry.identifiers(7).catalogIds.empty());

        auto empty = engine.reconcile(domain::RecognitionResult{}, 7);
        assert(empty.source == MatchSource::None);
        std::cout << "[PASS] No match anywhere is unresolved." << std::endl;
    }

    // Live catalog errors propagate.
    {
        live.failure = std::make_exception_ptr(
            domain::GatewayError(domain::GatewayError::Kind::Unauthorized, "comicvine", "bad key", 401));
        bool thrown = false;
        try {
            engine.reconcile(Candidate("Unknown Title", 2001, 4), 0);
        } catch (const domain::GatewayError& e) {
            thrown = e.kind() == domain::GatewayError::Kind::Unauthorized;
        }
        assert(thrown);
        std::cout << "[PASS] Live catalog errors reach the caller." << std::endl;
    }

    std::filesystem::remove(dbPath);
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
