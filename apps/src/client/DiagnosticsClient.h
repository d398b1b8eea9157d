#pragma once

#include "ClientError.h"
#include "Connection.h"
#include "client/api/ListPeers.h"
#include "core/Result.h"

#include <memory>

namespace RNodeClient {

/**
 * @brief Typed handle for the node's diagnostics service (Diagnostics.ListPeers).
 */
class DiagnosticsClient {
public:
    explicit DiagnosticsClient(std::shared_ptr<Connection> connection);

    Result<Api::ListPeers::Okay, ClientError> listPeers();

private:
    std::shared_ptr<Connection> connection_;
};

} // namespace RNodeClient
