#include "ReplClient.h"
#include "core/LoggingChannels.h"

namespace RNodeClient {

ReplClient::ReplClient(std::shared_ptr<Connection> connection) : connection_(std::move(connection))
{}

Result<Api::ReplRun::Okay, ClientError> ReplClient::run(const std::string& line)
{
    LOG_DEBUG(Repl, "Run ({} bytes of code)", line.size());
    return connection_->call<Api::ReplRun::Okay>(Api::ReplRun::Command{ .line = line });
}

Result<Api::ReplEval::Okay, ClientError> ReplClient::eval(const std::string& fileName)
{
    LOG_DEBUG(Repl, "Eval {}", fileName);
    return connection_->call<Api::ReplEval::Okay>(Api::ReplEval::Command{ .fileName = fileName });
}

} // namespace RNodeClient
