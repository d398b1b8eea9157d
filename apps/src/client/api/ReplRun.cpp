#include "ReplRun.h"

namespace RNodeClient {
namespace Api {
namespace ReplRun {

nlohmann::json Command::toJson() const
{
    return nlohmann::json{ { "line", line } };
}

Command Command::fromJson(const nlohmann::json& j)
{
    return Command{ .line = j.at("line").get<std::string>() };
}

nlohmann::json Okay::toJson() const
{
    return nlohmann::json{ { "output", output } };
}

Okay Okay::fromJson(const nlohmann::json& j)
{
    return Okay{ .output = j.at("output").get<std::string>() };
}

} // namespace ReplRun
} // namespace Api
} // namespace RNodeClient
