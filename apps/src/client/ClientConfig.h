#pragma once

#include "core/Result.h"
#include "core/network/WebSocketServiceInterface.h"

#include <nlohmann/json_fwd.hpp>
#include <optional>
#include <string>

namespace RNodeClient {

inline constexpr const char* kClientConfigFile = "rnode-client.json";

struct ClientConfig {
    std::string host = "127.0.0.1";
    int port = 50000;
    int webPort = 8888;
    std::string webBindAddress = "0.0.0.0";
    Network::Protocol protocol = Network::Protocol::BINARY;
    int connectTimeoutMs = 5000;
    int responseTimeoutMs = 0; // 0 waits for the node indefinitely.
    bool escapeHtml = false;
};

void from_json(const nlohmann::json& j, ClientConfig& cfg);

// The node must be addressed on a real port; the web UI may ask for 0 (any free port).
inline bool isValidNodePort(int port)
{
    return port >= 1 && port <= 65535;
}

inline bool isValidWebPort(int port)
{
    return port >= 0 && port <= 65535;
}

Result<Network::Protocol, std::string> parseProtocol(const std::string& name);
const char* toString(Network::Protocol protocol);

/**
 * @brief Load rnode-client.json from the ConfigLoader search paths.
 *
 * Defaults are returned when no file exists; a file that cannot be read or
 * parsed is an error.
 */
Result<ClientConfig, std::string> loadClientConfig(
    const std::optional<std::string>& configDir = std::nullopt);

} // namespace RNodeClient
