#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Client Error
// ═══════════════════════════════════════════════════════════════════════════
// Shared by Session, ConnectionRegistry and ClientManager.
//
// Per-server codes (SpawnError, HandshakeTimeout, HandshakeError) are
// absorbed by ClientManager::connect_to_all(); the rest reach the caller of
// the operation that produced them.

#include "mcpmux/protocol/mcp_types.hpp"

#include <tl/expected.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace mcpmux {

enum class ClientErrorCode {
    SpawnError,        ///< Executable not found, permission denied, fork failure
    HandshakeTimeout,  ///< Process started but did not answer initialize in time
    HandshakeError,    ///< Process started but the handshake failed
    NotReady,          ///< Session is not in the Ready state
    DuplicateServer,   ///< A session with this name is already registered
    TransportError,    ///< I/O failure talking to the process
    ProtocolError,     ///< Malformed response or JSON-RPC error
    Timeout,           ///< Request timed out; the process may still be running
    ToolNotFound,      ///< No connected server advertises the tool
    ResourceNotFound,  ///< No connected server lists the resource
    InvalidArguments,  ///< Tool arguments are not a JSON object
    ToolCallFailed     ///< The owning server failed the call
};

[[nodiscard]] constexpr std::string_view to_string(ClientErrorCode code) noexcept {
    switch (code) {
        case ClientErrorCode::SpawnError:       return "SpawnError";
        case ClientErrorCode::HandshakeTimeout: return "HandshakeTimeout";
        case ClientErrorCode::HandshakeError:   return "HandshakeError";
        case ClientErrorCode::NotReady:         return "NotReady";
        case ClientErrorCode::DuplicateServer:  return "DuplicateServer";
        case ClientErrorCode::TransportError:   return "TransportError";
        case ClientErrorCode::ProtocolError:    return "ProtocolError";
        case ClientErrorCode::Timeout:          return "Timeout";
        case ClientErrorCode::ToolNotFound:     return "ToolNotFound";
        case ClientErrorCode::ResourceNotFound: return "ResourceNotFound";
        case ClientErrorCode::InvalidArguments: return "InvalidArguments";
        case ClientErrorCode::ToolCallFailed:   return "ToolCallFailed";
    }
    return "Unknown";
}

struct ClientError {
    ClientErrorCode code;
    std::string message;
    std::string server;                 ///< Server the error came from, if any
    std::optional<McpError> rpc_error;  ///< Remote error payload, intact

    // ─────────────────────────────────────────────────────────────────────────
    // Factory Methods
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] static ClientError spawn_error(std::string server, std::string msg) {
        return {ClientErrorCode::SpawnError, std::move(msg), std::move(server), std::nullopt};
    }

    [[nodiscard]] static ClientError handshake_timeout(std::string server, std::string msg) {
        return {ClientErrorCode::HandshakeTimeout, std::move(msg), std::move(server), std::nullopt};
    }

    [[nodiscard]] static ClientError handshake_error(std::string server, std::string msg,
                                                     std::optional<McpError> rpc = std::nullopt) {
        return {ClientErrorCode::HandshakeError, std::move(msg), std::move(server), std::move(rpc)};
    }

    [[nodiscard]] static ClientError not_ready(std::string server) {
        return {ClientErrorCode::NotReady, "Session is not ready", std::move(server), std::nullopt};
    }

    [[nodiscard]] static ClientError duplicate_server(std::string server) {
        std::string msg = "A session named '" + server + "' is already registered";
        return {ClientErrorCode::DuplicateServer, std::move(msg), std::move(server), std::nullopt};
    }

    [[nodiscard]] static ClientError transport_error(std::string server, std::string msg) {
        return {ClientErrorCode::TransportError, std::move(msg), std::move(server), std::nullopt};
    }

    [[nodiscard]] static ClientError protocol_error(std::string server, std::string msg) {
        return {ClientErrorCode::ProtocolError, std::move(msg), std::move(server), std::nullopt};
    }

    [[nodiscard]] static ClientError timeout(std::string server, std::string msg) {
        return {ClientErrorCode::Timeout, std::move(msg), std::move(server), std::nullopt};
    }

    [[nodiscard]] static ClientError from_rpc_error(std::string server, const McpError& err) {
        return {ClientErrorCode::ProtocolError, err.message, std::move(server), err};
    }

    [[nodiscard]] static ClientError tool_not_found(const std::string& tool) {
        return {ClientErrorCode::ToolNotFound,
                "Tool " + tool + " not found on any active server session", {}, std::nullopt};
    }

    [[nodiscard]] static ClientError resource_not_found(const std::string& uri) {
        return {ClientErrorCode::ResourceNotFound,
                "Resource " + uri + " not found on any active server session", {}, std::nullopt};
    }

    [[nodiscard]] static ClientError invalid_arguments(std::string msg) {
        return {ClientErrorCode::InvalidArguments, std::move(msg), {}, std::nullopt};
    }

    /// Wrap whatever the owning server reported, keeping its payload
    [[nodiscard]] static ClientError tool_call_failed(const std::string& tool, const ClientError& cause) {
        return {ClientErrorCode::ToolCallFailed,
                "Tool " + tool + " failed on server '" + cause.server + "': " + cause.message,
                cause.server, cause.rpc_error};
    }

    /// "[server] Code: message", for log lines
    [[nodiscard]] std::string describe() const {
        std::string out;
        if (!server.empty()) {
            out += "[" + server + "] ";
        }
        out += std::string(to_string(code)) + ": " + message;
        return out;
    }
};

template <typename T>
using ClientResult = tl::expected<T, ClientError>;

}  // namespace mcpmux
