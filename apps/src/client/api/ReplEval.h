#pragma once

#include "ApiError.h"
#include "ApiMacros.h"
#include "core/Result.h"
#include <nlohmann/json.hpp>
#include <string>
#include <zpp_bits.h>

namespace RNodeClient {
namespace Api {

namespace ReplEval {

DEFINE_API_NAME("Repl.Eval");

struct Okay; // Forward declaration for API_COMMAND() macro.

/**
 * @brief Evaluate a source file on the node.
 *
 * The path is resolved by the node, not the client; the client never opens it.
 */
struct Command {
    std::string fileName;

    API_COMMAND();
    nlohmann::json toJson() const;
    static Command fromJson(const nlohmann::json& j);

    using serialize = zpp::bits::members<1>;
};

struct Okay {
    std::string output;

    API_COMMAND_NAME();
    nlohmann::json toJson() const;
    static Okay fromJson(const nlohmann::json& j);

    using serialize = zpp::bits::members<1>;
};

API_STANDARD_TYPES()

} // namespace ReplEval
} // namespace Api
} // namespace RNodeClient
