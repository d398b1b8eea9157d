#pragma once

#include <string>
#include <utility>

namespace RNodeClient {

/**
 * @brief Error surfaced to the user by the CLI or the web UI.
 */
struct ClientError {
    enum class Kind {
        InvalidUsage,  // Missing or malformed command-line input; no RPC was sent.
        MissingField,  // Web form posted without the code field; no RPC was sent.
        RpcFailure,    // Transport failure or a fault reported by the node.
        ServerFailure, // The web UI could not bind its port.
    };

    Kind kind = Kind::RpcFailure;
    std::string message;

    static ClientError invalidUsage(std::string message)
    {
        return ClientError{ Kind::InvalidUsage, std::move(message) };
    }

    static ClientError missingField(std::string message)
    {
        return ClientError{ Kind::MissingField, std::move(message) };
    }

    static ClientError rpcFailure(std::string message)
    {
        return ClientError{ Kind::RpcFailure, std::move(message) };
    }

    static ClientError serverFailure(std::string message)
    {
        return ClientError{ Kind::ServerFailure, std::move(message) };
    }
};

inline const char* toString(ClientError::Kind kind)
{
    switch (kind) {
        case ClientError::Kind::InvalidUsage:
            return "InvalidUsage";
        case ClientError::Kind::MissingField:
            return "MissingField";
        case ClientError::Kind::RpcFailure:
            return "RpcFailure";
        case ClientError::Kind::ServerFailure:
            return "ServerFailure";
    }
    return "";
}

} // namespace RNodeClient
