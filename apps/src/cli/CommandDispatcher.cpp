#include "CommandDispatcher.h"
#include "core/LoggingChannels.h"

#include <algorithm>

namespace RNodeClient {
namespace Cli {

namespace {
bool hasFlag(const std::vector<std::string>& args, const char* flag)
{
    return std::find(args.begin(), args.end(), flag) != args.end();
}
} // namespace

const char* toString(Mode mode)
{
    switch (mode) {
        case Mode::WebUi:
            return "web-ui";
        case Mode::InlineEval:
            return "inline-eval";
        case Mode::FileEval:
            return "file-eval";
    }
    return "";
}

Mode selectMode(const std::vector<std::string>& args)
{
    if (hasFlag(args, kWebUiFlag)) {
        return Mode::WebUi;
    }
    if (hasFlag(args, kInlineEvalFlag)) {
        return Mode::InlineEval;
    }
    return Mode::FileEval;
}

CommandDispatcher::CommandDispatcher(
    std::shared_ptr<Connection> connection, WebUiFactory webUiFactory)
    : repl_(connection),
      diagnostics_(connection),
      webUiFactory_(std::move(webUiFactory))
{}

Result<std::monostate, ClientError> CommandDispatcher::run(
    const std::vector<std::string>& args,
    std::ostream& out,
    int webPort,
    const std::string& bindAddress)
{
    const Mode mode = selectMode(args);
    LOG_DEBUG(Cli, "Mode {} with {} argument(s)", toString(mode), args.size());

    switch (mode) {
        case Mode::WebUi:
            return runWebUi(out, webPort, bindAddress);
        case Mode::InlineEval:
            // The code is the last argument, even when other arguments follow "-c".
            return runInline(args.back(), out);
        case Mode::FileEval:
            if (args.size() < 2) {
                return Result<std::monostate, ClientError>::error(
                    ClientError::invalidUsage("No file to evaluate (usage: rnode-client <path>)"));
            }
            return runFile(args[1], out);
    }

    return Result<std::monostate, ClientError>::error(
        ClientError::invalidUsage("Unknown mode"));
}

Result<std::monostate, ClientError> CommandDispatcher::runWebUi(
    std::ostream& out, int webPort, const std::string& bindAddress)
{
    auto server = webUiFactory_(diagnostics_, repl_);

    auto bindResult = server->bind(bindAddress, webPort);
    if (bindResult.isError()) {
        LOG_ERROR(Cli, "Web UI bind failed: {}", bindResult.errorValue());
        return Result<std::monostate, ClientError>::error(
            ClientError::serverFailure(bindResult.errorValue()));
    }

    out << "rnode web UI at " << server->url() << std::endl;

    server->run();
    return Result<std::monostate, ClientError>::okay(std::monostate{});
}

Result<std::monostate, ClientError> CommandDispatcher::runInline(
    const std::string& code, std::ostream& out)
{
    auto result = repl_.run(code);
    if (result.isError()) {
        return Result<std::monostate, ClientError>::error(result.errorValue());
    }

    out << result.value().output << "\n";
    return Result<std::monostate, ClientError>::okay(std::monostate{});
}

Result<std::monostate, ClientError> CommandDispatcher::runFile(
    const std::string& path, std::ostream& out)
{
    auto result = repl_.eval(path);
    if (result.isError()) {
        return Result<std::monostate, ClientError>::error(result.errorValue());
    }

    out << result.value().output << "\n";
    return Result<std::monostate, ClientError>::okay(std::monostate{});
}

} // namespace Cli
} // namespace RNodeClient
