#pragma once

#include "BinaryProtocol.h"
#include "WebSocketServiceInterface.h"
#include "client/api/ApiError.h"
#include "core/Result.h"
#include <atomic>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <rtc/rtc.hpp>
#include <string>
#include <variant>
#include <vector>

namespace RNodeClient {
namespace Network {

/**
 * @brief libdatachannel WebSocket client for the node's command endpoint.
 *
 * Each request registers a pending slot under its correlation id and blocks
 * until the matching reply arrives, the deadline passes, or the socket goes
 * away. A lost connection fails every pending slot at once. Messages that
 * match no pending request are logged and dropped.
 *
 * Safe to call from several threads: senders work on a snapshot of the socket,
 * so a concurrent reconnect cannot pull it out from under them.
 */
class WebSocketService : public WebSocketServiceInterface {
public:
    WebSocketService();
    virtual ~WebSocketService();

    WebSocketService(const WebSocketService&) = delete;
    WebSocketService& operator=(const WebSocketService&) = delete;

    Result<std::monostate, std::string> connect(
        const std::string& url, int timeoutMs = 5000) override;

    void disconnect() override;

    bool isConnected() const override;

    void setProtocol(Protocol protocol) { protocol_ = protocol; }

    Protocol getProtocol() const override { return protocol_; }

    uint64_t allocateRequestId() override
    {
        return nextId_.fetch_add(1, std::memory_order_relaxed);
    }

    Result<MessageEnvelope, std::string> sendBinaryAndReceive(
        const MessageEnvelope& envelope, int timeoutMs = 5000) override;

    /**
     * @brief Send JSON and receive response.
     *
     * Uses the message's "id" for correlation, injecting a fresh one if absent.
     */
    Result<std::string, ApiError> sendJsonAndReceive(
        const std::string& message, int timeoutMs = 5000) override;

private:
    struct PendingRequest {
        std::variant<std::string, std::vector<std::byte>> response;
        bool received = false;
        bool closed = false;
        std::mutex mutex;
        std::condition_variable cv;
    };

    void handleText(const std::string& message);
    void handleBinary(const rtc::binary& data);
    void deliver(uint64_t id, std::variant<std::string, std::vector<std::byte>> response);
    void failPendingRequests();

    Result<std::monostate, std::string> sendFrame(const std::vector<std::byte>& data);
    std::shared_ptr<PendingRequest> registerPending(uint64_t id);
    std::shared_ptr<rtc::WebSocket> socket() const;

    // Waits for the response or connection loss; removes the pending entry.
    bool waitForResponse(
        uint64_t id, const std::shared_ptr<PendingRequest>& pending, int timeoutMs);

    std::shared_ptr<rtc::WebSocket> ws_;
    mutable std::mutex wsMutex_;
    Protocol protocol_ = Protocol::BINARY;

    std::atomic<bool> connectionFailed_{ false };

    std::atomic<uint64_t> nextId_{ 1 };
    std::map<uint64_t, std::shared_ptr<PendingRequest>> pendingRequests_;
    std::mutex pendingMutex_;
};

} // namespace Network
} // namespace RNodeClient
