/**
 * @file Catalog.hpp
 * @brief Read-only bibliographic records of the offline catalog mirror.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace coversync::domain {

/**
 * @struct CatalogSeries
 * @brief A series row of the mirror.
 */
struct CatalogSeries {
    std::int64_t id = 0;
    std::string name;
    int yearBegan = 0;
    int issueCount = 0;
};

/**
 * @struct CatalogIssue
 * @brief An issue row, exclusively owned by its series.
 */
struct CatalogIssue {
    std::int64_t id = 0;
    std::int64_t seriesId = 0;
    std::string number;
    std::string keyDate;
    std::string publicationDate;
    int sortCode = 0;       ///< Canonical in-series ordering.
    bool active = true;     ///< False for withdrawn or merged records.
};

/**
 * @class CatalogRepository
 * @brief Read path of the offline mirror.
 */
class CatalogRepository {
public:
    virtual ~CatalogRepository() = default;

    /**
     * @brief Series whose name matches case-insensitively and whose year and issue count are equal.
     * @return Matching rows ordered by id ascending (normally zero or one).
     */
    virtual std::vector<CatalogSeries> findSeriesExact(const std::string& name,
                                                       int yearBegan,
                                                       int issueCount) = 0;

    /** @brief Active issues of a series ordered by sortCode ascending. */
    virtual std::vector<CatalogIssue> findActiveIssues(std::int64_t seriesId) = 0;
};

} // namespace coversync::domain
