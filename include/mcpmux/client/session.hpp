#pragma once

#include "mcpmux/client/client_error.hpp"
#include "mcpmux/config/server_config.hpp"
#include "mcpmux/log/logger.hpp"
#include "mcpmux/protocol/mcp_types.hpp"
#include "mcpmux/transport/process_transport.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace mcpmux {

// ═══════════════════════════════════════════════════════════════════════════
// Session Configuration
// ═══════════════════════════════════════════════════════════════════════════

enum class SessionState {
    Connecting,  // Process spawned, handshake in progress
    Ready,       // Handshake complete; requests accepted
    Failed,      // Spawn or handshake failed; transport stopped
    Closed       // close() ran; transport stopped
};

[[nodiscard]] constexpr std::string_view to_string(SessionState state) noexcept {
    switch (state) {
        case SessionState::Connecting: return "Connecting";
        case SessionState::Ready:      return "Ready";
        case SessionState::Failed:     return "Failed";
        case SessionState::Closed:     return "Closed";
    }
    return "Unknown";
}

struct SessionOptions {
    // Client identification sent in initialize
    Implementation client_info{"mcpmux", "0.1.0"};
    ClientCapabilities capabilities;

    // initialize must be answered within this window
    std::chrono::milliseconds handshake_timeout{10000};

    // Every later request (0 = wait forever)
    std::chrono::milliseconds request_timeout{30000};

    StderrHandling stderr_handling{StderrHandling::Passthrough};
    std::size_t max_message_size{1 << 20};
    std::chrono::milliseconds shutdown_grace{500};

    /// Raised to abandon whatever request is waiting (see ProcessTransportConfig)
    const std::atomic<bool>* cancel_flag{nullptr};
};

// ═══════════════════════════════════════════════════════════════════════════
// Session
// ═══════════════════════════════════════════════════════════════════════════
// One connected stdio server: a ProcessTransport plus request/response
// correlation and the MCP handshake.
//
// Usage:
//   auto session = Session::connect(descriptor, options, logger);
//   if (!session) { /* SpawnError, HandshakeTimeout or HandshakeError */ }
//
//   auto tools = (*session)->list_tools();
//   auto result = (*session)->call_tool("echo_tool", {{"text", "hi"}});
//   (*session)->close();
//
// One request is in flight at a time; concurrent callers queue on an
// internal mutex. While a response is awaited, notifications are skipped
// and requests initiated by the server are answered with MethodNotFound
// (ping is answered with an empty result).
//
// A request that times out returns Timeout and leaves the process running.
// A late response to it is discarded when it eventually arrives.

class Session {
public:
    /// Spawn the server, run the handshake and return a Ready session.
    /// On failure the process has already been stopped and reaped.
    [[nodiscard]] static ClientResult<std::unique_ptr<Session>> connect(
        const ServerDescriptor& descriptor,
        const SessionOptions& options = {},
        LoggerPtr logger = nullptr
    );

    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;
    Session(Session&&) = delete;
    Session& operator=(Session&&) = delete;

    // ─────────────────────────────────────────────────────────────────────────
    // Introspection
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] const std::string& name() const noexcept { return descriptor_.name; }
    [[nodiscard]] const ServerDescriptor& descriptor() const noexcept { return descriptor_; }
    [[nodiscard]] SessionState state() const noexcept { return state_.load(); }
    [[nodiscard]] bool is_ready() const noexcept { return state() == SessionState::Ready; }

    /// Available once Ready
    [[nodiscard]] const Implementation& server_info() const noexcept { return init_result_.server_info; }
    [[nodiscard]] const ServerCapabilities& capabilities() const noexcept { return init_result_.capabilities; }
    [[nodiscard]] const std::optional<std::string>& instructions() const noexcept {
        return init_result_.instructions;
    }
    [[nodiscard]] const std::string& protocol_version() const noexcept {
        return init_result_.protocol_version;
    }

    /// Child pid, or -1 once closed
    [[nodiscard]] pid_t pid() const;

    // ─────────────────────────────────────────────────────────────────────────
    // Requests
    // ─────────────────────────────────────────────────────────────────────────

    /// All tools, following nextCursor until the server stops returning one
    [[nodiscard]] ClientResult<std::vector<Tool>> list_tools();

    /// The result is returned as-is, including isError results
    [[nodiscard]] ClientResult<CallToolResult> call_tool(const std::string& name, const Json& arguments);

    [[nodiscard]] ClientResult<std::vector<Resource>> list_resources();

    [[nodiscard]] ClientResult<ReadResourceResult> read_resource(const std::string& uri);

    [[nodiscard]] ClientResult<void> ping();

    // ─────────────────────────────────────────────────────────────────────────
    // Teardown
    // ─────────────────────────────────────────────────────────────────────────

    /// Stop the transport (closing stdin first) and mark the session Closed.
    /// Waits for an in-flight request to finish. Safe to call repeatedly.
    void close();

private:
    Session(ServerDescriptor descriptor, SessionOptions options, LoggerPtr logger);

    [[nodiscard]] ClientResult<void> start_transport();
    [[nodiscard]] ClientResult<void> handshake();

    /// Requires Ready; applies request_timeout
    [[nodiscard]] ClientResult<Json> request(const std::string& method, Json params);

    /// Send one request and wait for the matching response. Caller holds io_mutex_.
    [[nodiscard]] ClientResult<Json> send_and_receive(
        const std::string& method,
        Json params,
        std::chrono::milliseconds timeout
    );

    [[nodiscard]] ClientResult<void> send_notification(const std::string& method, std::optional<Json> params);

    void answer_server_request(const Json& message);

    /// Run `parse` on a result, turning nlohmann exceptions into ProtocolError
    template <typename T, typename Parse>
    [[nodiscard]] ClientResult<T> decode(const std::string& method, const Json& result, Parse&& parse) const;

    ServerDescriptor descriptor_;
    SessionOptions options_;
    LoggerPtr logger_;

    std::unique_ptr<ProcessTransport> transport_;
    std::atomic<SessionState> state_{SessionState::Connecting};
    InitializeResult init_result_;

    std::mutex io_mutex_;
    std::int64_t next_id_{0};
};

}  // namespace mcpmux
