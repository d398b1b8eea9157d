#pragma once

#include "ClientError.h"
#include "core/LoggingChannels.h"
#include "core/Result.h"
#include "core/network/WebSocketServiceInterface.h"

#include <memory>
#include <mutex>
#include <string>
#include <variant>

namespace RNodeClient {

inline constexpr const char* kDefaultNodeHost = "127.0.0.1";
inline constexpr int kDefaultNodePort = 50000;

struct ConnectionOptions {
    Network::Protocol protocol = Network::Protocol::BINARY;
    int connectTimeoutMs = 5000;
    int responseTimeoutMs = 0; // <= 0 waits indefinitely.
};

/**
 * @brief Transport handle bound to one node address.
 *
 * Opening is lazy: nothing touches the network until the first RPC calls
 * ensureOpen(), so an unreachable node is reported by that call. A dropped
 * connection is reopened by the next call; nothing is retried within a call.
 */
class Connection {
public:
    Connection(
        std::shared_ptr<Network::WebSocketServiceInterface> service,
        std::string host,
        int port,
        ConnectionOptions options = {});

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    const std::string& host() const { return host_; }
    int port() const { return port_; }
    std::string url() const;
    const ConnectionOptions& options() const { return options_; }

    Result<std::monostate, std::string> ensureOpen();

    Network::WebSocketServiceInterface& service() { return *service_; }

    /**
     * @brief Open if needed, send one command and wait for its typed answer.
     *
     * Transport failures and node faults are both reported as RpcFailure.
     */
    template <typename Okay, typename Command>
    Result<Okay, ClientError> call(const Command& cmd);

private:
    std::shared_ptr<Network::WebSocketServiceInterface> service_;
    std::string host_;
    int port_;
    ConnectionOptions options_;
    std::mutex openMutex_;
};

template <typename Okay, typename Command>
Result<Okay, ClientError> Connection::call(const Command& cmd)
{
    const std::string commandName(Command::name());

    auto openResult = ensureOpen();
    if (openResult.isError()) {
        LOG_WARN(Network, "{} not sent: {}", commandName, openResult.errorValue());
        return Result<Okay, ClientError>::error(ClientError::rpcFailure(
            "Cannot reach node at " + url() + ": " + openResult.errorValue()));
    }

    auto response =
        service_->sendCommandAndGetResponse<Okay>(cmd, options_.responseTimeoutMs);
    if (response.isError()) {
        LOG_WARN(Network, "{} failed: {}", commandName, response.errorValue());
        return Result<Okay, ClientError>::error(
            ClientError::rpcFailure(commandName + " failed: " + response.errorValue()));
    }

    auto& answer = response.value();
    if (answer.isError()) {
        LOG_WARN(Network, "{} rejected by node: {}", commandName, answer.errorValue().message);
        return Result<Okay, ClientError>::error(ClientError::rpcFailure(
            commandName + " rejected by node: " + answer.errorValue().message));
    }

    return Result<Okay, ClientError>::okay(std::move(answer.value()));
}

/**
 * @brief Build a Connection to host:port backed by a real WebSocketService.
 */
std::shared_ptr<Connection> openConnection(
    const std::string& host = kDefaultNodeHost,
    int port = kDefaultNodePort,
    const ConnectionOptions& options = {});

} // namespace RNodeClient
