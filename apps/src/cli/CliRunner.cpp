#include "CliRunner.h"
#include "client/ClientConfig.h"
#include "core/LoggingChannels.h"
#include "web/WebUiServer.h"

#include <args.hxx>
#include <optional>
#include <set>
#include <spdlog/spdlog.h>

namespace RNodeClient {
namespace Cli {

namespace {

// Long options whose value may be the following token (-t is handled with the short flags).
const std::set<std::string> kValueOptions = {
    "--log-channels", "--log-file", "--config-dir", "--host",
    "--port",         "--web-port", "--protocol",   "--timeout",
};

std::string getExamplesHelp()
{
    std::string help = "Examples:\n";
    help += "  rnode-client -c 'new x in { x!(1 + 1) }'    Run inline code\n";
    help += "  rnode-client contract.rho                 Evaluate a file on the node\n";
    help += "  rnode-client -w                           Serve the diagnostics page\n";
    help += "  rnode-client --host 10.0.0.5 --port 40401 -c '@0!(1)'\n\n";
    help += "The node is reached through its WebSocket command endpoint (binary or JSON\n";
    help += "framing, see --protocol). The client does not speak gRPC.\n";
    return help;
}

int reportError(const ClientError& error, std::ostream& err)
{
    SLOG_DEBUG("{}: {}", toString(error.kind), error.message);
    err << "Error: " << error.message << std::endl;
    return 1;
}

} // namespace

CliServices realServices()
{
    CliServices services;
    services.openConnection =
        [](const std::string& host, int port, const ConnectionOptions& options) {
            return openConnection(host, port, options);
        };
    services.makeWebUi = [](DiagnosticsClient& diagnostics,
                            ReplClient& repl,
                            const Web::PageOptions& pageOptions) {
        return std::make_unique<Web::WebUiServer>(diagnostics, repl, pageOptions);
    };
    return services;
}

std::vector<std::string> modeArguments(const std::vector<std::string>& argv)
{
    std::vector<std::string> result;
    if (argv.empty()) {
        return result;
    }
    result.push_back(argv[0]);

    bool positionalOnly = false;
    for (size_t i = 1; i < argv.size(); ++i) {
        const std::string& arg = argv[i];

        if (positionalOnly || arg == "-" || arg.empty() || arg[0] != '-') {
            result.push_back(arg);
            continue;
        }
        if (arg == "--") {
            positionalOnly = true;
            continue;
        }

        if (arg.rfind("--", 0) == 0) {
            // Long options here are all ambient; a bare value option eats the next token.
            if (arg.find('=') == std::string::npos && kValueOptions.count(arg) > 0) {
                ++i;
            }
            continue;
        }

        // Short flag cluster: keep the mode flags, drop -v and -h, and stop at -t.
        for (size_t k = 1; k < arg.size(); ++k) {
            const char flag = arg[k];
            if (flag == 't') {
                if (k + 1 == arg.size()) {
                    ++i;
                }
                break;
            }
            if (flag == 'w') {
                result.push_back(kWebUiFlag);
            }
            else if (flag == 'c') {
                result.push_back(kInlineEvalFlag);
            }
        }
    }
    return result;
}

int runCli(
    const std::vector<std::string>& argv,
    std::ostream& out,
    std::ostream& err,
    const CliServices& services)
{
    args::ArgumentParser parser(
        "rnode remote-control client",
        "Runs code on an rnode node through its REPL service, or serves a diagnostics page.\n\n"
            + getExamplesHelp());

    args::HelpFlag help(parser, "help", "Display this help menu", { 'h', "help" });
    args::Flag verbose(parser, "verbose", "Enable debug logging", { 'v', "verbose" });
    args::ValueFlag<std::string> logChannels(
        parser,
        "channels",
        "Per-channel log levels, e.g. 'network:trace,*:warn'",
        { "log-channels" });
    args::ValueFlag<std::string> logFile(
        parser, "path", "Also append debug logs to this file", { "log-file" });
    args::ValueFlag<std::string> configDir(
        parser, "dir", "Directory searched first for rnode-client.json", { "config-dir" });
    args::ValueFlag<std::string> hostOverride(
        parser, "host", "Node host (default: 127.0.0.1)", { "host" });
    args::ValueFlag<int> portOverride(parser, "port", "Node port (default: 50000)", { "port" });
    args::ValueFlag<int> webPortOverride(
        parser, "web-port", "Web UI port (default: 8888)", { "web-port" });
    args::ValueFlag<std::string> protocolOverride(
        parser, "protocol", "Wire protocol: 'binary' or 'json'", { "protocol" });
    args::ValueFlag<int> timeout(
        parser,
        "timeout",
        "Response timeout in milliseconds (default: wait indefinitely)",
        { 't', "timeout" });

    // Mode flags; their positions matter, so the dispatcher reads them from argv.
    args::Flag webUi(parser, "web", "Serve the diagnostics/REPL page", { 'w' });
    args::Flag inlineEval(parser, "code", "Run the last argument as code", { 'c' });
    args::PositionalList<std::string> positionals(
        parser, "args", "Code (with -c) or the path of a file to evaluate");

    std::vector<std::string> arguments;
    if (!argv.empty()) {
        parser.Prog(argv[0]);
        arguments.assign(argv.begin() + 1, argv.end());
    }
    try {
        parser.ParseArgs(arguments);
    }
    catch (const args::Help&) {
        out << parser;
        return 0;
    }
    catch (const args::Error& e) {
        err << e.what() << std::endl;
        err << parser;
        return 1;
    }

    // Logs go to stderr so stdout carries only the result line.
    const std::string logPath = logFile ? args::get(logFile) : std::string();
    LoggingChannels::initialize(spdlog::level::trace, spdlog::level::debug, "cli", true, logPath);
    spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::err);
    if (logChannels) {
        LoggingChannels::configureFromString(args::get(logChannels));
    }

    std::optional<std::string> explicitConfigDir;
    if (configDir) {
        explicitConfigDir = args::get(configDir);
    }
    auto configResult = loadClientConfig(explicitConfigDir);
    if (configResult.isError()) {
        return reportError(ClientError::invalidUsage(configResult.errorValue()), err);
    }
    ClientConfig config = configResult.value();

    if (hostOverride) {
        config.host = args::get(hostOverride);
    }
    if (portOverride) {
        config.port = args::get(portOverride);
        if (!isValidNodePort(config.port)) {
            return reportError(
                ClientError::invalidUsage(
                    "--port must be between 1 and 65535, got " + std::to_string(config.port)),
                err);
        }
    }
    if (webPortOverride) {
        config.webPort = args::get(webPortOverride);
        if (!isValidWebPort(config.webPort)) {
            return reportError(
                ClientError::invalidUsage(
                    "--web-port must be between 0 and 65535, got "
                    + std::to_string(config.webPort)),
                err);
        }
    }
    if (protocolOverride) {
        auto protocol = parseProtocol(args::get(protocolOverride));
        if (protocol.isError()) {
            return reportError(ClientError::invalidUsage(protocol.errorValue()), err);
        }
        config.protocol = protocol.value();
    }
    if (timeout) {
        config.responseTimeoutMs = args::get(timeout);
        if (config.responseTimeoutMs < 0) {
            return reportError(
                ClientError::invalidUsage("--timeout must not be negative"), err);
        }
    }

    LOG_DEBUG(
        Cli,
        "Node {}:{} ({}), web UI {}:{}",
        config.host,
        config.port,
        toString(config.protocol),
        config.webBindAddress,
        config.webPort);

    ConnectionOptions options;
    options.protocol = config.protocol;
    options.connectTimeoutMs = config.connectTimeoutMs;
    options.responseTimeoutMs = config.responseTimeoutMs;
    auto connection = services.openConnection(config.host, config.port, options);

    const Web::PageOptions pageOptions{ .escapeHtml = config.escapeHtml };
    CommandDispatcher dispatcher(
        connection,
        [&services, pageOptions](DiagnosticsClient& diagnostics, ReplClient& repl) {
            return services.makeWebUi(diagnostics, repl, pageOptions);
        });

    auto result = dispatcher.run(modeArguments(argv), out, config.webPort, config.webBindAddress);
    if (result.isError()) {
        return reportError(result.errorValue(), err);
    }
    return 0;
}

} // namespace Cli
} // namespace RNodeClient
