#pragma once

#include "WebResources.h"
#include "client/ClientError.h"
#include "client/DiagnosticsClient.h"
#include "client/ReplClient.h"
#include "core/Result.h"

#include <array>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace RNodeClient {
namespace Web {

// Form field carrying the submitted code.
inline constexpr const char* kCodeField = "rho1";

// Insertion point marker in the page template (exactly three expected).
inline constexpr std::string_view kTemplateMarker = "<!-- PART -->";

/**
 * @brief What the page remembers between requests.
 *
 * Starts idle (empty strings, hasResult false). The first successful POST
 * moves it to has-result; later POSTs overwrite it. Nothing resets it short
 * of restarting the server.
 */
struct SessionState {
    std::string lastSubmittedCode;
    std::string lastStoreContents;
    bool hasResult = false;
};

struct PageOptions {
    bool escapeHtml = false;
};

/**
 * @brief Insert a line break after every " | " separator of a store dump.
 */
std::string formatStoreContents(const std::string& output);

std::string escapeHtml(std::string_view text);

/**
 * @brief The diagnostics/REPL page behind "/".
 *
 * get() lists the node's peers and shows the session; post() runs the
 * submitted code and then renders like get(). Errors abort only the request
 * that hit them.
 */
class ReplPage {
public:
    /**
     * @throws std::invalid_argument if pageTemplate lacks exactly three markers.
     */
    ReplPage(
        DiagnosticsClient& diagnostics,
        ReplClient& repl,
        PageOptions options = {},
        std::string_view pageTemplate = WebResources::kReplPageHtml);

    Result<std::string, ClientError> get();

    /**
     * @param code The posted form field; nullopt when the form lacked it.
     */
    Result<std::string, ClientError> post(const std::optional<std::string>& code);

    SessionState session() const;

private:
    Result<std::string, ClientError> render(const SessionState& state);
    std::string insert(const std::string& text) const;

    DiagnosticsClient& diagnostics_;
    ReplClient& repl_;
    PageOptions options_;
    std::array<std::string, 4> parts_;

    // Serializes POSTs so one submission's render never shows another's output.
    std::mutex postMutex_;
    mutable std::mutex sessionMutex_;
    SessionState session_;
};

} // namespace Web
} // namespace RNodeClient
