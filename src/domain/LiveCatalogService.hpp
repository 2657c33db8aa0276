/**
 * @file LiveCatalogService.hpp
 * @brief Interface for the live catalog API.
 */

#pragma once

#include <future>
#include <string>
#include <vector>

namespace coversync::domain {

/**
 * @struct LiveSeriesHit
 * @brief A series ("volume") returned by the live catalog.
 */
struct LiveSeriesHit {
    std::string id;
    std::string name;
    int startYear = 0;
    int issueCount = 0;
    std::string publisher;
};

/**
 * @class LiveCatalogService
 * @brief Online catalog consulted when the offline mirror has no match.
 */
class LiveCatalogService {
public:
    virtual ~LiveCatalogService() = default;

    /**
     * @brief Series whose name equals @p name case-insensitively and whose start year equals @p year.
     * The future rethrows GatewayError on failure.
     */
    virtual std::future<std::vector<LiveSeriesHit>> searchSeriesAsync(const std::string& name, int year) = 0;
};

} // namespace coversync::domain
