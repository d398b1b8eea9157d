#pragma once

#include "ClientError.h"
#include "Connection.h"
#include "client/api/ReplEval.h"
#include "client/api/ReplRun.h"
#include "core/Result.h"

#include <memory>
#include <string>

namespace RNodeClient {

/**
 * @brief Typed handle for the node's REPL service (Repl.Run, Repl.Eval).
 */
class ReplClient {
public:
    explicit ReplClient(std::shared_ptr<Connection> connection);

    Result<Api::ReplRun::Okay, ClientError> run(const std::string& line);
    Result<Api::ReplEval::Okay, ClientError> eval(const std::string& fileName);

private:
    std::shared_ptr<Connection> connection_;
};

} // namespace RNodeClient
