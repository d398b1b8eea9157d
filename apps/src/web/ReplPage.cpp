#include "ReplPage.h"
#include "core/LoggingChannels.h"

#include <stdexcept>

namespace RNodeClient {
namespace Web {

std::string formatStoreContents(const std::string& output)
{
    static constexpr std::string_view separator = " | ";

    std::string formatted;
    formatted.reserve(output.size());

    size_t pos = 0;
    while (true) {
        const size_t found = output.find(separator, pos);
        if (found == std::string::npos) {
            formatted.append(output, pos, std::string::npos);
            break;
        }
        formatted.append(output, pos, found - pos);
        formatted += " |\n";
        pos = found + separator.size();
    }
    return formatted;
}

std::string escapeHtml(std::string_view text)
{
    std::string escaped;
    escaped.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '&':
                escaped += "&amp;";
                break;
            case '<':
                escaped += "&lt;";
                break;
            case '>':
                escaped += "&gt;";
                break;
            case '"':
                escaped += "&quot;";
                break;
            case '\'':
                escaped += "&#39;";
                break;
            default:
                escaped += c;
        }
    }
    return escaped;
}

ReplPage::ReplPage(
    DiagnosticsClient& diagnostics,
    ReplClient& repl,
    PageOptions options,
    std::string_view pageTemplate)
    : diagnostics_(diagnostics), repl_(repl), options_(options)
{
    size_t pos = 0;
    for (size_t i = 0; i < parts_.size() - 1; ++i) {
        const size_t found = pageTemplate.find(kTemplateMarker, pos);
        if (found == std::string_view::npos) {
            throw std::invalid_argument("Page template has fewer than 3 insertion points");
        }
        parts_[i] = std::string(pageTemplate.substr(pos, found - pos));
        pos = found + kTemplateMarker.size();
    }
    if (pageTemplate.find(kTemplateMarker, pos) != std::string_view::npos) {
        throw std::invalid_argument("Page template has more than 3 insertion points");
    }
    parts_.back() = std::string(pageTemplate.substr(pos));
}

Result<std::string, ClientError> ReplPage::get()
{
    return render(session());
}

Result<std::string, ClientError> ReplPage::post(const std::optional<std::string>& code)
{
    if (!code.has_value()) {
        LOG_WARN(Web, "POST without '{}' field rejected", kCodeField);
        return Result<std::string, ClientError>::error(
            ClientError::missingField(std::string("Missing form field '") + kCodeField + "'"));
    }

    std::lock_guard<std::mutex> postLock(postMutex_);

    // The code is shown again even when the run below fails.
    {
        std::lock_guard<std::mutex> lock(sessionMutex_);
        session_.lastSubmittedCode = code.value();
    }

    auto result = repl_.run(code.value());
    if (result.isError()) {
        LOG_WARN(Web, "Run failed: {}", result.errorValue().message);
        return Result<std::string, ClientError>::error(result.errorValue());
    }

    SessionState snapshot;
    {
        std::lock_guard<std::mutex> lock(sessionMutex_);
        session_.lastStoreContents = formatStoreContents(result.value().output);
        session_.hasResult = true;
        snapshot = session_;
    }

    LOG_DEBUG(Web, "Stored {} bytes of store contents", snapshot.lastStoreContents.size());
    return render(snapshot);
}

SessionState ReplPage::session() const
{
    std::lock_guard<std::mutex> lock(sessionMutex_);
    return session_;
}

Result<std::string, ClientError> ReplPage::render(const SessionState& state)
{
    auto peersResult = diagnostics_.listPeers();
    if (peersResult.isError()) {
        LOG_WARN(Web, "ListPeers failed: {}", peersResult.errorValue().message);
        return Result<std::string, ClientError>::error(peersResult.errorValue());
    }

    std::string page = parts_[0];
    for (const auto& peer : peersResult.value().peers) {
        page += "<li>" + insert(peer) + "</li>";
    }
    page += parts_[1];
    page += insert(state.lastSubmittedCode);
    page += parts_[2];
    page += insert(state.lastStoreContents);
    page += parts_[3];
    return Result<std::string, ClientError>::okay(std::move(page));
}

std::string ReplPage::insert(const std::string& text) const
{
    return options_.escapeHtml ? escapeHtml(text) : text;
}

} // namespace Web
} // namespace RNodeClient
