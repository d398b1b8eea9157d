#pragma once

#include <string>
#include <utility>
#include <zpp_bits.h>

namespace RNodeClient {

/**
 * @brief Application-level fault reported by the node for a single command.
 */
struct ApiError {
    std::string message;

    ApiError() = default;
    ApiError(std::string msg) : message(std::move(msg)) {}

    using serialize = zpp::bits::members<1>;
};

} // namespace RNodeClient
