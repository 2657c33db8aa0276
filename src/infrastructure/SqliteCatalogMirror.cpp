/**
 * @file SqliteCatalogMirror.cpp
 * @brief Implementation of SqliteCatalogMirror.
 */

#include "infrastructure/SqliteCatalogMirror.hpp"

namespace coversync::infrastructure {

namespace {

domain::CatalogSeries ReadSeries(const SqliteStatement& stmt) {
    domain::CatalogSeries series;
    series.id = stmt.columnInt64(0);
    series.name = stmt.columnText(1);
    series.yearBegan = static_cast<int>(stmt.columnInt64(2));
    series.issueCount = static_cast<int>(stmt.columnInt64(3));
    return series;
}

} // namespace

SqliteCatalogMirror::SqliteCatalogMirror(const std::string& dbPath, int activeDeletedValue)
    : m_db(dbPath, true), m_activeDeletedValue(activeDeletedValue) {}

std::vector<domain::CatalogSeries> SqliteCatalogMirror::findSeriesExact(const std::string& name,
                                                                        int yearBegan,
                                                                        int issueCount) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto stmt = m_db.prepare(
        "SELECT id, name, year_began, issue_count FROM gcd_series "
        "WHERE name = ?1 COLLATE NOCASE AND year_began = ?2 AND issue_count = ?3 AND deleted = ?4 "
        "ORDER BY id ASC");
    stmt.bindText(1, name);
    stmt.bindInt64(2, yearBegan);
    stmt.bindInt64(3, issueCount);
    stmt.bindInt64(4, m_activeDeletedValue);

    std::vector<domain::CatalogSeries> result;
    while (stmt.step()) {
        result.push_back(ReadSeries(stmt));
    }
    return result;
}

std::vector<domain::CatalogIssue> SqliteCatalogMirror::findActiveIssues(std::int64_t seriesId) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto stmt = m_db.prepare(
        "SELECT id, series_id, number, key_date, publication_date, sort_code FROM gcd_issue "
        "WHERE series_id = ?1 AND deleted = ?2 ORDER BY sort_code ASC, id ASC");
    stmt.bindInt64(1, seriesId);
    stmt.bindInt64(2, m_activeDeletedValue);

    std::vector<domain::CatalogIssue> issues;
    while (stmt.step()) {
        domain::CatalogIssue issue;
        issue.id = stmt.columnInt64(0);
        issue.seriesId = stmt.columnInt64(1);
        issue.number = stmt.columnText(2);
        issue.keyDate = stmt.columnText(3);
        issue.publicationDate = stmt.columnText(4);
        issue.sortCode = static_cast<int>(stmt.columnInt64(5));
        issue.active = true;
        issues.push_back(std::move(issue));
    }
    return issues;
}

} // namespace coversync::infrastructure
