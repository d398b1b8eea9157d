#pragma once

#include "client/api/ApiError.h"
#include "core/Result.h"

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>
#include <type_traits>
#include <variant>

namespace RNodeClient {
namespace Network {

/**
 * @brief Build a JSON request: the command's fields plus "command" and "id".
 */
template <typename CommandT>
nlohmann::json makeJsonCommand(uint64_t id, const CommandT& cmd)
{
    nlohmann::json json = cmd.toJson();
    json["command"] = std::string(CommandT::name());
    json["id"] = id;
    return json;
}

inline nlohmann::json makeJsonErrorResponse(uint64_t id, const std::string& message)
{
    return nlohmann::json{ { "id", id }, { "error", message } };
}

template <typename ResponseT>
nlohmann::json makeJsonResponse(uint64_t id, const ResponseT& resp)
{
    nlohmann::json output;
    output["id"] = id;
    if (resp.isError()) {
        output["error"] = resp.errorValue().message;
        return output;
    }

    output["success"] = true;
    using ValueType = std::decay_t<decltype(resp.value())>;
    if constexpr (std::is_same_v<ValueType, std::monostate>) {
        output["value"] = nlohmann::json::object();
    }
    else {
        output["value"] = resp.value().toJson();
    }
    return output;
}

/**
 * @brief Decode a JSON response into the node's typed answer.
 *
 * The outer error is a protocol failure (unparseable text, missing value).
 * An "error" member from the node becomes the inner ApiError.
 */
template <typename Okay>
Result<Result<Okay, ApiError>, std::string> parseJsonResponse(const std::string& text)
{
    using Outer = Result<Result<Okay, ApiError>, std::string>;

    nlohmann::json responseJson;
    try {
        responseJson = nlohmann::json::parse(text);
    }
    catch (const std::exception& e) {
        return Outer::error(std::string("Invalid JSON response: ") + e.what());
    }

    if (responseJson.contains("error")) {
        std::string errorMsg = "Unknown error";
        if (responseJson["error"].is_string()) {
            errorMsg = responseJson["error"].get<std::string>();
        }
        else if (responseJson["error"].is_object() && responseJson["error"].contains("message")
                 && responseJson["error"]["message"].is_string()) {
            errorMsg = responseJson["error"]["message"].get<std::string>();
        }
        return Outer::okay(Result<Okay, ApiError>::error(ApiError{ errorMsg }));
    }

    if (!responseJson.contains("value")) {
        return Outer::error("Response missing 'value' field");
    }

    try {
        return Outer::okay(Result<Okay, ApiError>::okay(Okay::fromJson(responseJson["value"])));
    }
    catch (const std::exception& e) {
        return Outer::error(std::string("Failed to deserialize response: ") + e.what());
    }
}

} // namespace Network
} // namespace RNodeClient
