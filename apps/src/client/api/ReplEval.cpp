#include "ReplEval.h"

namespace RNodeClient {
namespace Api {
namespace ReplEval {

nlohmann::json Command::toJson() const
{
    return nlohmann::json{ { "fileName", fileName } };
}

Command Command::fromJson(const nlohmann::json& j)
{
    return Command{ .fileName = j.at("fileName").get<std::string>() };
}

nlohmann::json Okay::toJson() const
{
    return nlohmann::json{ { "output", output } };
}

Okay Okay::fromJson(const nlohmann::json& j)
{
    return Okay{ .output = j.at("output").get<std::string>() };
}

} // namespace ReplEval
} // namespace Api
} // namespace RNodeClient
