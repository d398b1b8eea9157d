#include "DiagnosticsClient.h"

namespace RNodeClient {

DiagnosticsClient::DiagnosticsClient(std::shared_ptr<Connection> connection)
    : connection_(std::move(connection))
{}

Result<Api::ListPeers::Okay, ClientError> DiagnosticsClient::listPeers()
{
    return connection_->call<Api::ListPeers::Okay>(Api::ListPeers::Command{});
}

} // namespace RNodeClient
