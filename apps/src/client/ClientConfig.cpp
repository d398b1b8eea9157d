#include "ClientConfig.h"
#include "core/ConfigLoader.h"

#include <algorithm>
#include <cctype>
#include <nlohmann/json.hpp>
#include <stdexcept>

namespace RNodeClient {

namespace {
void requirePort(bool valid, const char* field, int port)
{
    if (!valid) {
        throw std::out_of_range(std::string(field) + " out of range: " + std::to_string(port));
    }
}
} // namespace

Result<Network::Protocol, std::string> parseProtocol(const std::string& name)
{
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });

    if (lower == "binary") {
        return Result<Network::Protocol, std::string>::okay(Network::Protocol::BINARY);
    }
    if (lower == "json") {
        return Result<Network::Protocol, std::string>::okay(Network::Protocol::JSON);
    }
    return Result<Network::Protocol, std::string>::error(
        "Unknown protocol '" + name + "' (expected 'binary' or 'json')");
}

const char* toString(Network::Protocol protocol)
{
    switch (protocol) {
        case Network::Protocol::BINARY:
            return "binary";
        case Network::Protocol::JSON:
            return "json";
    }
    return "";
}

void from_json(const nlohmann::json& j, ClientConfig& cfg)
{
    const ClientConfig defaults;

    cfg.host = j.value("host", defaults.host);
    cfg.port = j.value("port", defaults.port);
    cfg.webPort = j.value("web_port", defaults.webPort);
    cfg.webBindAddress = j.value("web_bind_address", defaults.webBindAddress);
    cfg.connectTimeoutMs = j.value("connect_timeout_ms", defaults.connectTimeoutMs);
    cfg.responseTimeoutMs = j.value("response_timeout_ms", defaults.responseTimeoutMs);
    cfg.escapeHtml = j.value("escape_html", defaults.escapeHtml);

    cfg.protocol = defaults.protocol;
    if (j.contains("protocol")) {
        auto protocol = parseProtocol(j.at("protocol").get<std::string>());
        if (protocol.isError()) {
            throw std::invalid_argument(protocol.errorValue());
        }
        cfg.protocol = protocol.value();
    }

    requirePort(isValidNodePort(cfg.port), "port", cfg.port);
    requirePort(isValidWebPort(cfg.webPort), "web_port", cfg.webPort);
}

Result<ClientConfig, std::string> loadClientConfig(const std::optional<std::string>& configDir)
{
    if (configDir.has_value()) {
        ConfigLoader::setConfigDir(configDir.value());
    }

    auto loaded = ConfigLoader::loadIfPresent<ClientConfig>(kClientConfigFile);
    if (loaded.isError()) {
        return Result<ClientConfig, std::string>::error(loaded.errorValue());
    }
    return Result<ClientConfig, std::string>::okay(loaded.value().value_or(ClientConfig{}));
}

} // namespace RNodeClient
