/**
 * @file DescriptionService.hpp
 * @brief Interface for the auxiliary inference API.
 */

#pragma once

#include <future>
#include <optional>
#include <string>

namespace coversync::domain {

/**
 * @class DescriptionService
 * @brief Generates a short prose description of a matched series.
 */
class DescriptionService {
public:
    virtual ~DescriptionService() = default;

    /** @brief Returns nullopt when the model produced no usable text. */
    virtual std::future<std::optional<std::string>> describeSeriesAsync(const std::string& seriesName,
                                                                         int yearBegan) = 0;
};

} // namespace coversync::domain
