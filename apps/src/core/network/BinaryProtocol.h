#pragma once

#include "core/Result.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>
#include <zpp_bits.h>

namespace RNodeClient {
namespace Network {

/**
 * @brief Wrapper carried by every binary WebSocket message.
 *
 * Requests use the command name as message_type; responses append "_response".
 * The id correlates a response with its request (0 means uncorrelated).
 */
struct MessageEnvelope {
    uint64_t id = 0;
    std::string message_type;
    std::vector<std::byte> payload;

    using serialize = zpp::bits::members<3>;
};

inline constexpr const char* kResponseSuffix = "_response";

/**
 * @throws std::system_error on zpp_bits failure (both directions).
 */
template <typename T>
std::vector<std::byte> serialize_payload(const T& value)
{
    auto [data, out] = zpp::bits::data_out();
    out(value).or_throw();
    return data;
}

template <typename T>
T deserialize_payload(const std::vector<std::byte>& bytes)
{
    T value{};
    zpp::bits::in in{ bytes };
    in(value).or_throw();
    return value;
}

inline std::vector<std::byte> serialize_envelope(const MessageEnvelope& envelope)
{
    return serialize_payload(envelope);
}

inline MessageEnvelope deserialize_envelope(const std::vector<std::byte>& bytes)
{
    return deserialize_payload<MessageEnvelope>(bytes);
}

template <typename Command>
MessageEnvelope make_command_envelope(uint64_t id, const Command& cmd)
{
    return MessageEnvelope{
        .id = id,
        .message_type = std::string(Command::name()),
        .payload = serialize_payload(cmd),
    };
}

/**
 * @brief Build a response envelope; the payload is a variant<Okay, Error>.
 */
template <typename Okay, typename Error>
MessageEnvelope make_response_envelope(
    uint64_t id, const std::string& commandName, const Result<Okay, Error>& response)
{
    std::variant<Okay, Error> body;
    if (response.isError()) {
        body.template emplace<1>(response.errorValue());
    }
    else {
        body.template emplace<0>(response.value());
    }

    return MessageEnvelope{
        .id = id,
        .message_type = commandName + kResponseSuffix,
        .payload = serialize_payload(body),
    };
}

/**
 * @brief Decode the variant<Okay, Error> payload of a response envelope.
 * @throws std::system_error if the payload does not decode.
 */
template <typename Okay, typename Error>
Result<Okay, Error> extract_result(const MessageEnvelope& envelope)
{
    auto body = deserialize_payload<std::variant<Okay, Error>>(envelope.payload);
    if (body.index() == 1) {
        return Result<Okay, Error>::error(std::get<1>(std::move(body)));
    }
    return Result<Okay, Error>::okay(std::get<0>(std::move(body)));
}

} // namespace Network
} // namespace RNodeClient
