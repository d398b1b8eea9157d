#pragma once

#include "client/ClientError.h"
#include "client/Connection.h"
#include "client/DiagnosticsClient.h"
#include "client/ReplClient.h"
#include "core/Result.h"
#include "web/WebUiServerInterface.h"

#include <functional>
#include <memory>
#include <ostream>
#include <string>
#include <variant>
#include <vector>

namespace RNodeClient {
namespace Cli {

inline constexpr const char* kWebUiFlag = "-w";
inline constexpr const char* kInlineEvalFlag = "-c";
inline constexpr const char* kDefaultWebBindAddress = "0.0.0.0";
inline constexpr int kDefaultWebPort = 8888;

enum class Mode { WebUi, InlineEval, FileEval };

const char* toString(Mode mode);

/**
 * @brief Pick the mode for an invocation; first match wins.
 *
 * "-w" anywhere selects the web UI, otherwise "-c" anywhere selects inline
 * eval, otherwise the invocation evaluates the file named by args[1].
 */
Mode selectMode(const std::vector<std::string>& args);

/**
 * @brief Runs one CLI invocation against a node.
 *
 * The argument sequence is the invocation's argv in its original order, with
 * only the connection, config and logging options taken out. Results are
 * written to the output sink only on success; failures come back as a
 * ClientError for the caller to report.
 */
class CommandDispatcher {
public:
    using WebUiFactory = std::function<std::unique_ptr<Web::WebUiServerInterface>(
        DiagnosticsClient&, ReplClient&)>;

    CommandDispatcher(std::shared_ptr<Connection> connection, WebUiFactory webUiFactory);

    /**
     * @brief Execute the invocation.
     *
     * In web UI mode this blocks in the server loop and returns only when the
     * server stops or fails to bind.
     */
    Result<std::monostate, ClientError> run(
        const std::vector<std::string>& args,
        std::ostream& out,
        int webPort = kDefaultWebPort,
        const std::string& bindAddress = kDefaultWebBindAddress);

private:
    Result<std::monostate, ClientError> runWebUi(
        std::ostream& out, int webPort, const std::string& bindAddress);
    Result<std::monostate, ClientError> runInline(const std::string& code, std::ostream& out);
    Result<std::monostate, ClientError> runFile(const std::string& path, std::ostream& out);

    ReplClient repl_;
    DiagnosticsClient diagnostics_;
    WebUiFactory webUiFactory_;
};

} // namespace Cli
} // namespace RNodeClient
