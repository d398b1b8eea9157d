#pragma once

#include "ApiError.h"
#include "ApiMacros.h"
#include "core/Result.h"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include <zpp_bits.h>

namespace RNodeClient {
namespace Api {

namespace ListPeers {

DEFINE_API_NAME("Diagnostics.ListPeers");

struct Okay; // Forward declaration for API_COMMAND() macro.

struct Command {
    API_COMMAND();
    nlohmann::json toJson() const;
    static Command fromJson(const nlohmann::json& j);

    // zpp_bits serialization (command has no fields).
    using serialize = zpp::bits::members<0>;
};

struct Okay {
    std::vector<std::string> peers; // In the order the node reports them.

    API_COMMAND_NAME();
    nlohmann::json toJson() const;
    static Okay fromJson(const nlohmann::json& j);

    using serialize = zpp::bits::members<1>;
};

API_STANDARD_TYPES()

} // namespace ListPeers
} // namespace Api
} // namespace RNodeClient
