/**
 * @file LiveCatalogClient.hpp
 * @brief Client for the live catalog search API.
 */

#pragma once

#include <nlohmann/json.hpp>
#include "domain/LiveCatalogService.hpp"
#include "infrastructure/BackendExecutor.hpp"
#include "infrastructure/RemoteServiceClient.hpp"

namespace coversync::infrastructure {

/**
 * @class LiveCatalogClient
 * @brief Volume search against a ComicVine-style `/search/` endpoint.
 */
class LiveCatalogClient : public domain::LiveCatalogService {
public:
    explicit LiveCatalogClient(ServiceEndpoint endpoint);

    std::future<std::vector<domain::LiveSeriesHit>> searchSeriesAsync(const std::string& name, int year) override;

    std::vector<domain::LiveSeriesHit> searchSeries(const std::string& name, int year);

    /** @brief Keeps the `volume` results whose name and start year both match. */
    static std::vector<domain::LiveSeriesHit> FilterResults(const nlohmann::json& body,
                                                            const std::string& name, int year);

private:
    RemoteServiceClient m_http;
    BackendExecutor m_executor;
};

} // namespace coversync::infrastructure
