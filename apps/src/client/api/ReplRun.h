#pragma once

#include "ApiError.h"
#include "ApiMacros.h"
#include "core/Result.h"
#include <nlohmann/json.hpp>
#include <string>
#include <zpp_bits.h>

namespace RNodeClient {
namespace Api {

namespace ReplRun {

DEFINE_API_NAME("Repl.Run");

struct Okay; // Forward declaration for API_COMMAND() macro.

/**
 * @brief Execute a line of code on the node.
 *
 * The node evaluates the code against its store and answers with a textual
 * dump of the store contents.
 */
struct Command {
    std::string line;

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

} // namespace ReplRun
} // namespace Api
} // namespace RNodeClient
