#pragma once

#include "mcpmux/client/client_error.hpp"
#include "mcpmux/client/connection_registry.hpp"
#include "mcpmux/client/session.hpp"
#include "mcpmux/config/server_config.hpp"
#include "mcpmux/log/logger.hpp"
#include "mcpmux/protocol/mcp_types.hpp"

#include <atomic>
#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace mcpmux {

// ═══════════════════════════════════════════════════════════════════════════
// Client Manager Configuration
// ═══════════════════════════════════════════════════════════════════════════

struct ManagerOptions {
    // Client identification
    std::string client_name = "mcpmux";
    std::string client_version = "0.1.0";

    // Per-server timeouts
    std::chrono::milliseconds handshake_timeout{10000};
    std::chrono::milliseconds request_timeout{30000};

    StderrHandling stderr_handling{StderrHandling::Passthrough};

    // How long the tool-name index from the last discovery is trusted for
    // dispatch (0 = re-query every server on every call)
    std::chrono::milliseconds tool_index_ttl{0};

    std::size_t max_message_size{1 << 20};
    std::chrono::milliseconds shutdown_grace{500};

    // Outstanding requests fail with TransportError once this is raised, so
    // a signal handler can unblock a caller before shutdown()
    const std::atomic<bool>* cancel_flag{nullptr};

    ConfigLoadOptions config;

    [[nodiscard]] SessionOptions session_options() const {
        SessionOptions out;
        out.client_info = {client_name, client_version};
        out.handshake_timeout = handshake_timeout;
        out.request_timeout = request_timeout;
        out.stderr_handling = stderr_handling;
        out.max_message_size = max_message_size;
        out.shutdown_grace = shutdown_grace;
        out.cancel_flag = cancel_flag;
        return out;
    }
};

// ═══════════════════════════════════════════════════════════════════════════
// Aggregated views
// ═══════════════════════════════════════════════════════════════════════════

/// A tool together with the server that advertised it
struct ToolDescriptor {
    std::string name;
    std::optional<std::string> description;
    Json input_schema;
    std::string server;
};

/// A resource together with the server that listed it
struct ResourceDescriptor {
    std::string uri;
    std::string name;
    std::optional<std::string> description;
    std::optional<std::string> mime_type;
    std::string server;
};

struct ConnectReport {
    std::vector<std::string> connected;
    std::vector<std::pair<std::string, ClientError>> failed;

    [[nodiscard]] bool all_connected() const noexcept { return failed.empty(); }
};

// ═══════════════════════════════════════════════════════════════════════════
// Client Manager
// ═══════════════════════════════════════════════════════════════════════════
// Launches a set of stdio servers, aggregates their tools and resources, and
// routes calls by name.
//
// Usage:
//   ClientManager manager(ManagerOptions{}, logger);
//   if (auto loaded = manager.load_config("config.json"); !loaded) { ... }
//
//   manager.connect_to_all();              // failures are logged and skipped
//   auto tools = manager.list_all_tools();
//   auto result = manager.call_tool("echo_tool", {{"text", "hi"}});
//
//   manager.shutdown();                    // also run by the destructor
//
// Dispatch is first-match: servers are searched in acquisition order and the
// first one advertising the tool gets the call. Its outcome is final.

class ClientManager {
public:
    explicit ClientManager(ManagerOptions options = {}, LoggerPtr logger = nullptr);
    ~ClientManager();

    ClientManager(const ClientManager&) = delete;
    ClientManager& operator=(const ClientManager&) = delete;
    ClientManager(ClientManager&&) = delete;
    ClientManager& operator=(ClientManager&&) = delete;

    // ─────────────────────────────────────────────────────────────────────────
    // Configuration
    // ─────────────────────────────────────────────────────────────────────────

    /// Replace the descriptor set from a file. On error the previous set is kept.
    [[nodiscard]] ConfigResult<std::size_t> load_config(const std::string& path);

    void set_servers(ServerMap servers);

    [[nodiscard]] const ServerMap& servers() const noexcept { return servers_; }
    [[nodiscard]] const ManagerOptions& options() const noexcept { return options_; }

    // ─────────────────────────────────────────────────────────────────────────
    // Connection Lifecycle
    // ─────────────────────────────────────────────────────────────────────────

    /// Connect to every configured server that is not already connected.
    /// Attempts run concurrently; each failure is logged as a warning and
    /// skipped. Never retries.
    ConnectReport connect_to_all();

    /// Close every session in reverse acquisition order. Safe to call twice.
    /// May run while another thread is inside call_tool() or a listing: a
    /// request already in flight completes before its server is stopped.
    void shutdown();

    [[nodiscard]] std::vector<std::string> connected_servers() const;
    [[nodiscard]] std::size_t session_count() const;

    /// Pids of the running server processes, in acquisition order
    [[nodiscard]] std::vector<pid_t> server_pids() const;

    // ─────────────────────────────────────────────────────────────────────────
    // Tools
    // ─────────────────────────────────────────────────────────────────────────

    /// Every tool of every session, in acquisition order then each server's
    /// own order. A server whose listing fails contributes nothing.
    [[nodiscard]] std::vector<ToolDescriptor> list_all_tools();

    /// Route to the first session advertising `name`. `arguments` must be a
    /// JSON object (null is treated as {}).
    [[nodiscard]] ClientResult<CallToolResult> call_tool(
        const std::string& name,
        const Json& arguments = Json::object()
    );

    // ─────────────────────────────────────────────────────────────────────────
    // Resources
    // ─────────────────────────────────────────────────────────────────────────

    /// Resources of every session that advertises the resources capability
    [[nodiscard]] std::vector<ResourceDescriptor> list_all_resources();

    /// Route to the first session that lists `uri`
    [[nodiscard]] ClientResult<ReadResourceResult> read_resource(const std::string& uri);

private:
    struct ToolIndex {
        std::unordered_map<std::string, std::string> owner;  // tool -> server
        std::chrono::steady_clock::time_point built_at;
        bool valid = false;
    };

    [[nodiscard]] ClientResult<CallToolResult> dispatch(
        Session& session,
        const std::string& name,
        const Json& arguments
    );

    [[nodiscard]] std::optional<std::string> cached_owner(const std::string& tool);
    void rebuild_index(const std::vector<ToolDescriptor>& tools);
    void invalidate_index();

    ManagerOptions options_;
    LoggerPtr logger_;
    ServerMap servers_;
    ConnectionRegistry registry_;

    std::mutex index_mutex_;
    ToolIndex index_;
};

}  // namespace mcpmux
