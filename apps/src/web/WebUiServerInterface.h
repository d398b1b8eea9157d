#pragma once

#include "core/Result.h"

#include <string>
#include <variant>

namespace RNodeClient {
namespace Web {

/**
 * @brief HTTP front end for the diagnostics page.
 *
 * Binding is split from serving so the caller can report the address before
 * run() blocks.
 */
class WebUiServerInterface {
public:
    virtual ~WebUiServerInterface() = default;

    // Port 0 binds an ephemeral port; url() reports the one chosen.
    virtual Result<std::monostate, std::string> bind(const std::string& address, int port) = 0;

    virtual std::string url() const = 0;

    // Serves until stop() is called.
    virtual void run() = 0;

    virtual void stop() = 0;
};

} // namespace Web
} // namespace RNodeClient
