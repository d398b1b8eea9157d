#pragma once

#include "CommandDispatcher.h"
#include "client/Connection.h"
#include "web/ReplPage.h"

#include <functional>
#include <memory>
#include <ostream>
#include <string>
#include <vector>

namespace RNodeClient {
namespace Cli {

/**
 * @brief The pieces of a CLI run that touch the outside world.
 *
 * main() uses realServices(); tests substitute a mock transport and a web UI
 * that does not open a socket.
 */
struct CliServices {
    std::function<std::shared_ptr<Connection>(
        const std::string& host, int port, const ConnectionOptions& options)>
        openConnection;

    std::function<std::unique_ptr<Web::WebUiServerInterface>(
        DiagnosticsClient&, ReplClient&, const Web::PageOptions&)>
        makeWebUi;
};

CliServices realServices();

/**
 * @brief Strip the options runCli() handles itself, keeping everything else in place.
 *
 * "--host 1.2.3.4", "--port=1", "-t500" and "-v" disappear; grouped short
 * flags such as "-wc" are split into "-w" "-c". Expects argv that has already
 * parsed cleanly.
 */
std::vector<std::string> modeArguments(const std::vector<std::string>& argv);

/**
 * @brief Run one invocation end to end and return the process exit code.
 *
 * Results go to out. Usage problems, config errors and RPC failures are
 * written to err as "Error: <message>" and give exit code 1.
 */
int runCli(
    const std::vector<std::string>& argv,
    std::ostream& out,
    std::ostream& err,
    const CliServices& services);

} // namespace Cli
} // namespace RNodeClient
