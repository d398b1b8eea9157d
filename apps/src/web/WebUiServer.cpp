#include "WebUiServer.h"
#include "core/LoggingChannels.h"

#include <httplib.h>

#include <atomic>
#include <optional>
#include <string>

namespace RNodeClient {
namespace Web {

namespace {

int statusFor(const ClientError& error)
{
    switch (error.kind) {
        case ClientError::Kind::MissingField:
        case ClientError::Kind::InvalidUsage:
            return 400;
        case ClientError::Kind::RpcFailure:
            return 502;
        case ClientError::Kind::ServerFailure:
            return 500;
    }
    return 500;
}

// Reads a urlencoded form field from the body; query-string parameters do not count.
std::optional<std::string> formField(const httplib::Request& req, const std::string& name)
{
    httplib::Params fields;
    httplib::detail::parse_query_text(req.body, fields);
    auto it = fields.find(name);
    if (it == fields.end()) {
        return std::nullopt;
    }
    return it->second;
}

void writeResult(const Result<std::string, ClientError>& result, httplib::Response& res)
{
    if (result.isError()) {
        res.status = statusFor(result.errorValue());
        res.set_content(result.errorValue().message, "text/plain");
        return;
    }
    res.set_content(result.value(), "text/html; charset=utf-8");
}

} // namespace

struct WebUiServer::Impl {
    Impl(DiagnosticsClient& diagnostics, ReplClient& repl, PageOptions options)
        : page_(diagnostics, repl, options)
    {
        server_.Get("/", [this](const httplib::Request&, httplib::Response& res) {
            LOG_DEBUG(Web, "GET /");
            writeResult(page_.get(), res);
        });

        server_.Post("/", [this](const httplib::Request& req, httplib::Response& res) {
            LOG_DEBUG(Web, "POST /");
            writeResult(page_.post(formField(req, kCodeField)), res);
        });
    }

    ReplPage page_;
    httplib::Server server_;
    std::string address_;
    int port_ = 0;
    std::atomic<bool> bound_{ false };
};

WebUiServer::WebUiServer(DiagnosticsClient& diagnostics, ReplClient& repl, PageOptions options)
    : pImpl_(std::make_unique<Impl>(diagnostics, repl, options))
{}

WebUiServer::~WebUiServer()
{
    stop();
}

Result<std::monostate, std::string> WebUiServer::bind(const std::string& address, int port)
{
    int boundPort = port;
    if (port == 0) {
        boundPort = pImpl_->server_.bind_to_any_port(address);
        if (boundPort < 0) {
            return Result<std::monostate, std::string>::error(
                "Failed to bind " + address + " to any port");
        }
    }
    else if (!pImpl_->server_.bind_to_port(address, port)) {
        return Result<std::monostate, std::string>::error(
            "Failed to bind " + address + ":" + std::to_string(port));
    }

    pImpl_->address_ = address;
    pImpl_->port_ = boundPort;
    pImpl_->bound_ = true;
    LOG_INFO(Web, "Bound to {}", url());
    return Result<std::monostate, std::string>::okay(std::monostate{});
}

std::string WebUiServer::url() const
{
    return "http://" + pImpl_->address_ + ":" + std::to_string(pImpl_->port_);
}

void WebUiServer::run()
{
    if (!pImpl_->bound_) {
        LOG_ERROR(Web, "run() called before bind()");
        return;
    }

    LOG_INFO(Web, "Serving on {}", url());
    if (!pImpl_->server_.listen_after_bind()) {
        LOG_ERROR(Web, "Listener on {} stopped with an error", url());
    }
    LOG_INFO(Web, "Stopped");
}

void WebUiServer::stop()
{
    if (pImpl_->server_.is_running()) {
        pImpl_->server_.stop();
    }
}

ReplPage& WebUiServer::page()
{
    return pImpl_->page_;
}

} // namespace Web
} // namespace RNodeClient
