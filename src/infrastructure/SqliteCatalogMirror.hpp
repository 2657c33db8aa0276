/**
 * @file SqliteCatalogMirror.hpp
 * @brief Read-only access to the offline bibliographic mirror.
 */

#pragma once

#include <mutex>
#include <string>
#include "domain/Catalog.hpp"
#include "infrastructure/SqliteDatabase.hpp"

namespace coversync::infrastructure {

/**
 * @class SqliteCatalogMirror
 * @brief Reads `gcd_series` and `gcd_issue` from an imported mirror database.
 *
 * Both tables carry a `deleted` flag. Rows are treated as active when the flag
 * equals @p activeDeletedValue (0 in the imported dumps).
 */
class SqliteCatalogMirror : public domain::CatalogRepository {
public:
    explicit SqliteCatalogMirror(const std::string& dbPath, int activeDeletedValue = 0);

    std::vector<domain::CatalogSeries> findSeriesExact(const std::string& name,
                                                       int yearBegan,
                                                       int issueCount) override;
    std::vector<domain::CatalogIssue> findActiveIssues(std::int64_t seriesId) override;

private:
    std::mutex m_mutex;
    SqliteDatabase m_db;
    int m_activeDeletedValue;
};

} // namespace coversync::infrastructure
