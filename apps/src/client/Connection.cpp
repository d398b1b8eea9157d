#include "Connection.h"
#include "core/LoggingChannels.h"
#include "core/network/WebSocketService.h"

namespace RNodeClient {

Connection::Connection(
    std::shared_ptr<Network::WebSocketServiceInterface> service,
    std::string host,
    int port,
    ConnectionOptions options)
    : service_(std::move(service)), host_(std::move(host)), port_(port), options_(options)
{}

std::string Connection::url() const
{
    return "ws://" + host_ + ":" + std::to_string(port_);
}

Result<std::monostate, std::string> Connection::ensureOpen()
{
    std::lock_guard<std::mutex> lock(openMutex_);
    if (service_->isConnected()) {
        return Result<std::monostate, std::string>::okay(std::monostate{});
    }

    LOG_DEBUG(Network, "Opening connection to {}", url());
    return service_->connect(url(), options_.connectTimeoutMs);
}

std::shared_ptr<Connection> openConnection(
    const std::string& host, int port, const ConnectionOptions& options)
{
    auto service = std::make_shared<Network::WebSocketService>();
    service->setProtocol(options.protocol);
    return std::make_shared<Connection>(std::move(service), host, port, options);
}

} // namespace RNodeClient
