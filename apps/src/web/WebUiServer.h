#pragma once

#include "ReplPage.h"
#include "WebUiServerInterface.h"

#include <memory>
#include <string>

namespace RNodeClient {
namespace Web {

class WebUiServer : public WebUiServerInterface {
public:
    WebUiServer(DiagnosticsClient& diagnostics, ReplClient& repl, PageOptions options = {});
    ~WebUiServer() override;

    WebUiServer(const WebUiServer&) = delete;
    WebUiServer& operator=(const WebUiServer&) = delete;

    Result<std::monostate, std::string> bind(const std::string& address, int port) override;
    std::string url() const override;
    void run() override;
    void stop() override;

    ReplPage& page();

private:
    struct Impl;
    std::unique_ptr<Impl> pImpl_;
};

} // namespace Web
} // namespace RNodeClient
