#pragma once

#include "BinaryProtocol.h"
#include "JsonProtocol.h"
#include "client/api/ApiError.h"
#include "core/Result.h"
#include <atomic>
#include <exception>
#include <string>
#include <variant>

namespace RNodeClient {
namespace Network {

// Wire encoding spoken on the command socket.
enum class Protocol {
    BINARY, // zpp_bits envelopes.
    JSON    // {"command": ..., "id": ...} text frames.
};

/**
 * @brief Request/response transport to a node.
 *
 * The typed entry point is the non-virtual sendCommandAndGetResponse(); concrete
 * transports (and test doubles) only supply the raw send-and-wait hooks.
 */
class WebSocketServiceInterface {
public:
    virtual ~WebSocketServiceInterface() = default;

    virtual Result<std::monostate, std::string> connect(
        const std::string& url, int timeoutMs = 5000) = 0;
    virtual void disconnect() = 0;
    virtual bool isConnected() const = 0;

    virtual Protocol getProtocol() const { return Protocol::BINARY; }

    virtual uint64_t allocateRequestId()
    {
        static std::atomic<uint64_t> nextId{ 1 };
        return nextId.fetch_add(1, std::memory_order_relaxed);
    }

    /**
     * @brief Send typed command and receive typed response.
     *
     * Handles envelope creation, request ID management, and response extraction
     * for whichever protocol the service speaks.
     *
     * @tparam Okay The success response type (e.g., Api::ReplRun::Okay).
     * @tparam Command The command type (e.g., Api::ReplRun::Command).
     * @param timeoutMs Response timeout in milliseconds; <= 0 waits indefinitely.
     * @return Outer error for transport/protocol failures; inner ApiError for node faults.
     */
    template <typename Okay, typename Command>
    Result<Result<Okay, ApiError>, std::string> sendCommandAndGetResponse(
        const Command& cmd, int timeoutMs = 5000)
    {
        using Outer = Result<Result<Okay, ApiError>, std::string>;

        uint64_t requestId = allocateRequestId();

        if (getProtocol() == Protocol::JSON) {
            auto textResult = sendJsonAndReceive(makeJsonCommand(requestId, cmd).dump(), timeoutMs);
            if (textResult.isError()) {
                return Outer::error(textResult.errorValue().message);
            }
            return parseJsonResponse<Okay>(textResult.value());
        }

        auto envelope = make_command_envelope(requestId, cmd);

        auto envResult = sendBinaryAndReceive(envelope, timeoutMs);
        if (envResult.isError()) {
            return Outer::error(envResult.errorValue());
        }

        const MessageEnvelope& responseEnvelope = envResult.value();
        const std::string expectedType = std::string(Command::name()) + kResponseSuffix;
        if (responseEnvelope.message_type != expectedType) {
            return Outer::error(
                "Unexpected response type: " + responseEnvelope.message_type + " (expected "
                + expectedType + ")");
        }

        try {
            return Outer::okay(extract_result<Okay, ApiError>(responseEnvelope));
        }
        catch (const std::exception& e) {
            return Outer::error(std::string("Failed to extract result: ") + e.what());
        }
    }

    virtual Result<MessageEnvelope, std::string> sendBinaryAndReceive(
        const MessageEnvelope& envelope, int timeoutMs = 5000) = 0;

    /**
     * @brief Send a JSON request (which already carries its "id") and wait for the reply.
     */
    virtual Result<std::string, ApiError> sendJsonAndReceive(
        const std::string& message, int timeoutMs = 5000) = 0;
};

} // namespace Network
} // namespace RNodeClient
