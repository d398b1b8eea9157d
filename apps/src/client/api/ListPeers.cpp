#include "ListPeers.h"

namespace RNodeClient {
namespace Api {
namespace ListPeers {

nlohmann::json Command::toJson() const
{
    return nlohmann::json::object();
}

Command Command::fromJson(const nlohmann::json& /*j*/)
{
    return Command{};
}

nlohmann::json Okay::toJson() const
{
    return nlohmann::json{ { "peers", peers } };
}

Okay Okay::fromJson(const nlohmann::json& j)
{
    Okay okay;
    if (j.contains("peers")) {
        okay.peers = j.at("peers").get<std::vector<std::string>>();
    }
    return okay;
}

} // namespace ListPeers
} // namespace Api
} // namespace RNodeClient
