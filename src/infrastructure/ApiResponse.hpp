/**
 * @file ApiResponse.hpp
 * @brief `{code, message, data}` envelope returned by the HTTP surface.
 */

#pragma once

#include <string>
#include <nlohmann/json.hpp>

namespace coversync::infrastructure {

template <typename T>
struct ApiResponse {
    int code = 200;
    std::string message = "OK";
    T data{};
};

template <typename T>
void to_json(nlohmann::json& j, const ApiResponse<T>& response) {
    j = nlohmann::json{{"code", response.code}, {"message", response.message}, {"data", response.data}};
}

} // namespace coversync::infrastructure
