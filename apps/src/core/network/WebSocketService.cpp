#include "WebSocketService.h"
#include "core/LoggingChannels.h"
#include <chrono>
#include <nlohmann/json.hpp>
#include <string_view>
#include <thread>

namespace RNodeClient {
namespace Network {

namespace {

// Store dumps can be large; libdatachannel's default 256 KB limit is too small.
constexpr size_t kMaxMessageSize = 16 * 1024 * 1024;

bool isResponseMessageType(const std::string& messageType)
{
    constexpr std::string_view suffix = kResponseSuffix;
    return messageType.size() >= suffix.size()
        && messageType.compare(messageType.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

WebSocketService::WebSocketService()
{
    LOG_DEBUG(Network, "WebSocketService created");
}

WebSocketService::~WebSocketService()
{
    disconnect();
}

Result<std::monostate, std::string> WebSocketService::connect(const std::string& url, int timeoutMs)
{
    disconnect();

    LOG_INFO(Network, "Connecting to {}", url);
    connectionFailed_ = false;

    std::shared_ptr<rtc::WebSocket> ws;
    try {
        rtc::WebSocketConfiguration config;
        config.maxMessageSize = kMaxMessageSize;
        ws = std::make_shared<rtc::WebSocket>(config);

        ws->onMessage([this](std::variant<rtc::binary, rtc::string> data) {
            if (auto* text = std::get_if<rtc::string>(&data)) {
                handleText(*text);
            }
            else {
                handleBinary(std::get<rtc::binary>(data));
            }
        });

        ws->onOpen([url]() { LOG_DEBUG(Network, "Connection to {} opened", url); });

        ws->onClosed([this, url]() {
            LOG_INFO(Network, "Connection to {} closed", url);
            connectionFailed_ = true;
            failPendingRequests();
        });

        ws->onError([this, url](std::string error) {
            LOG_ERROR(Network, "WebSocket error on {}: {}", url, error);
            connectionFailed_ = true;
            failPendingRequests();
        });

        {
            std::lock_guard<std::mutex> lock(wsMutex_);
            ws_ = ws;
        }
        ws->open(url);
    }
    catch (const std::exception& e) {
        return Result<std::monostate, std::string>::error(
            std::string("Connection error: ") + e.what());
    }

    // libdatachannel opens asynchronously; poll until open, failed or out of time.
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs);
    while (!ws->isOpen() && !connectionFailed_) {
        if (timeoutMs > 0 && std::chrono::steady_clock::now() > deadline) {
            return Result<std::monostate, std::string>::error("Connection timeout (" + url + ")");
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    if (connectionFailed_) {
        return Result<std::monostate, std::string>::error("Connection failed (" + url + ")");
    }

    LOG_INFO(Network, "Connected to {}", url);
    return Result<std::monostate, std::string>::okay(std::monostate{});
}

void WebSocketService::disconnect()
{
    std::shared_ptr<rtc::WebSocket> ws;
    {
        std::lock_guard<std::mutex> lock(wsMutex_);
        ws.swap(ws_);
    }

    if (ws) {
        // Detach callbacks first so a late close cannot reach a dying object.
        ws->onOpen([]() {});
        ws->onClosed([]() {});
        ws->onError([](std::string) {});
        ws->onMessage([](std::variant<rtc::binary, rtc::string>) {});
        if (ws->isOpen()) {
            ws->close();
        }
    }
    failPendingRequests();
}

bool WebSocketService::isConnected() const
{
    auto ws = socket();
    return ws && ws->isOpen();
}

std::shared_ptr<rtc::WebSocket> WebSocketService::socket() const
{
    std::lock_guard<std::mutex> lock(wsMutex_);
    return ws_;
}

void WebSocketService::handleText(const std::string& message)
{
    LOG_TRACE(Network, "Received text ({} bytes)", message.size());

    uint64_t id = 0;
    try {
        const auto json = nlohmann::json::parse(message);
        if (json.contains("id") && json["id"].is_number_unsigned()) {
            id = json["id"].get<uint64_t>();
        }
    }
    catch (const nlohmann::json::exception& e) {
        LOG_WARN(Network, "Dropping unparseable text message: {}", e.what());
        return;
    }

    if (id == 0) {
        LOG_WARN(Network, "Dropping text message without correlation id");
        return;
    }
    deliver(id, message);
}

void WebSocketService::handleBinary(const rtc::binary& data)
{
    LOG_TRACE(Network, "Received binary ({} bytes)", data.size());

    std::vector<std::byte> bytes(data.begin(), data.end());

    MessageEnvelope envelope;
    try {
        envelope = deserialize_envelope(bytes);
    }
    catch (const std::exception& e) {
        LOG_ERROR(Network, "Failed to deserialize envelope: {}", e.what());
        return;
    }

    if (envelope.id == 0 || !isResponseMessageType(envelope.message_type)) {
        LOG_WARN(Network, "Dropping unsolicited '{}' message", envelope.message_type);
        return;
    }
    deliver(envelope.id, std::move(bytes));
}

void WebSocketService::deliver(
    uint64_t id, std::variant<std::string, std::vector<std::byte>> response)
{
    std::lock_guard<std::mutex> lock(pendingMutex_);
    auto it = pendingRequests_.find(id);
    if (it == pendingRequests_.end()) {
        LOG_DEBUG(Network, "No pending request {} (timed out or already answered)", id);
        return;
    }

    auto& pending = it->second;
    std::lock_guard<std::mutex> reqLock(pending->mutex);
    pending->response = std::move(response);
    pending->received = true;
    pending->cv.notify_one();
}

void WebSocketService::failPendingRequests()
{
    std::lock_guard<std::mutex> lock(pendingMutex_);
    for (auto& [id, pending] : pendingRequests_) {
        std::lock_guard<std::mutex> reqLock(pending->mutex);
        pending->closed = true;
        pending->cv.notify_one();
    }
}

std::shared_ptr<WebSocketService::PendingRequest> WebSocketService::registerPending(uint64_t id)
{
    auto pending = std::make_shared<PendingRequest>();
    std::lock_guard<std::mutex> lock(pendingMutex_);
    pendingRequests_[id] = pending;
    return pending;
}

bool WebSocketService::waitForResponse(
    uint64_t id, const std::shared_ptr<PendingRequest>& pending, int timeoutMs)
{
    bool received = false;
    {
        std::unique_lock<std::mutex> reqLock(pending->mutex);
        auto ready = [&pending]() { return pending->received || pending->closed; };
        if (timeoutMs > 0) {
            pending->cv.wait_for(reqLock, std::chrono::milliseconds(timeoutMs), ready);
        }
        else {
            pending->cv.wait(reqLock, ready);
        }
        received = pending->received;
    }

    std::lock_guard<std::mutex> lock(pendingMutex_);
    pendingRequests_.erase(id);
    return received;
}

Result<std::monostate, std::string> WebSocketService::sendFrame(const std::vector<std::byte>& data)
{
    auto ws = socket();
    if (!ws || !ws->isOpen()) {
        return Result<std::monostate, std::string>::error("Not connected");
    }

    try {
        ws->send(rtc::binary(data.begin(), data.end()));
        return Result<std::monostate, std::string>::okay(std::monostate{});
    }
    catch (const std::exception& e) {
        return Result<std::monostate, std::string>::error(std::string("Send failed: ") + e.what());
    }
}

Result<MessageEnvelope, std::string> WebSocketService::sendBinaryAndReceive(
    const MessageEnvelope& envelope, int timeoutMs)
{
    using EnvelopeResult = Result<MessageEnvelope, std::string>;

    const uint64_t id = envelope.id;
    auto pending = registerPending(id);

    const auto bytes = serialize_envelope(envelope);
    LOG_DEBUG(
        Network, "Sending {} (id={}, {} bytes)", envelope.message_type, id, bytes.size());

    auto sendResult = sendFrame(bytes);
    if (sendResult.isError()) {
        std::lock_guard<std::mutex> lock(pendingMutex_);
        pendingRequests_.erase(id);
        return EnvelopeResult::error(sendResult.errorValue());
    }

    if (!waitForResponse(id, pending, timeoutMs)) {
        if (pending->closed) {
            return EnvelopeResult::error(
                "Connection closed before response to " + envelope.message_type);
        }
        return EnvelopeResult::error("Response timeout");
    }

    const auto* responseBytes = std::get_if<std::vector<std::byte>>(&pending->response);
    if (responseBytes == nullptr) {
        return EnvelopeResult::error("Received text response when expecting binary");
    }

    try {
        MessageEnvelope response = deserialize_envelope(*responseBytes);
        LOG_DEBUG(
            Network,
            "Received {} (id={}, {} bytes)",
            response.message_type,
            response.id,
            responseBytes->size());
        return EnvelopeResult::okay(std::move(response));
    }
    catch (const std::exception& e) {
        return EnvelopeResult::error(std::string("Failed to deserialize response: ") + e.what());
    }
}

Result<std::string, ApiError> WebSocketService::sendJsonAndReceive(
    const std::string& message, int timeoutMs)
{
    using TextResult = Result<std::string, ApiError>;

    auto ws = socket();
    if (!ws || !ws->isOpen()) {
        return TextResult::error(ApiError{ "Not connected" });
    }

    uint64_t id = 0;
    std::string request;
    try {
        auto json = nlohmann::json::parse(message);
        if (json.contains("id") && json["id"].is_number_unsigned()) {
            id = json["id"].get<uint64_t>();
        }
        else {
            id = allocateRequestId();
            json["id"] = id;
        }
        request = json.dump();
    }
    catch (const nlohmann::json::exception& e) {
        return TextResult::error(ApiError{ std::string("Invalid JSON request: ") + e.what() });
    }

    auto pending = registerPending(id);

    LOG_DEBUG(Network, "Sending JSON (id={}): {}", id, request);
    try {
        ws->send(request);
    }
    catch (const std::exception& e) {
        std::lock_guard<std::mutex> lock(pendingMutex_);
        pendingRequests_.erase(id);
        return TextResult::error(ApiError{ std::string("Send failed: ") + e.what() });
    }

    if (!waitForResponse(id, pending, timeoutMs)) {
        if (pending->closed) {
            return TextResult::error(ApiError{ "Connection closed before response" });
        }
        return TextResult::error(ApiError{ "Response timeout" });
    }

    const auto* text = std::get_if<std::string>(&pending->response);
    if (text == nullptr) {
        return TextResult::error(ApiError{ "Received binary response when expecting text" });
    }

    LOG_DEBUG(Network, "Received JSON response (id={}, {} bytes)", id, text->size());
    return TextResult::okay(*text);
}

} // namespace Network
} // namespace RNodeClient
