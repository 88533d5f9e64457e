#pragma once

#include "mcpmux/log/logger.hpp"
#include "mcpmux/protocol/json_rpc.hpp"
#include "mcpmux/protocol/mcp_types.hpp"

#include <tl/expected.hpp>

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <unistd.h>

namespace mcpmux {

// ═══════════════════════════════════════════════════════════════════════════
// Tool Server Definitions
// ═══════════════════════════════════════════════════════════════════════════

/// Either a result or a message that becomes an isError text result
using ToolHandlerResult = tl::expected<CallToolResult, std::string>;
using ToolHandler = std::function<ToolHandlerResult(const Json& arguments)>;

struct ToolDefinition {
    std::string name;
    std::string description;
    Json input_schema;
    ToolHandler handler;
};

using ResourceReader = std::function<tl::expected<std::string, std::string>()>;

struct ResourceDefinition {
    std::string uri;
    std::string name;
    std::optional<std::string> description;
    std::optional<std::string> mime_type{"text/plain"};
    ResourceReader reader;
};

struct ToolServerOptions {
    Implementation server_info{"mcpmux-server", "0.1.0"};
    std::optional<std::string> instructions;

    // Tools per tools/list page (0 = everything in one page)
    std::size_t tools_page_size{0};

    std::size_t max_message_size{1 << 20};
};

/// Application-level error code for an unknown resource URI
inline constexpr int kResourceNotFoundCode = -32002;

// ═══════════════════════════════════════════════════════════════════════════
// Tool Server
// ═══════════════════════════════════════════════════════════════════════════
// A minimal MCP server over a pair of file descriptors, newline-delimited
// JSON-RPC. Used by the reference servers and test fixtures.
//
// Usage:
//   ToolServer server({{"echo_server", "1.0.0"}}, logger);
//   server.add_tool({"echo_tool", "Echo text back", schema, handler});
//   return server.serve();  // until stdin reaches EOF
//
// handle_message()/handle_line() process one message without any I/O so the
// dispatch logic can be exercised directly.

class ToolServer {
public:
    explicit ToolServer(ToolServerOptions options, LoggerPtr logger = nullptr);

    ToolServer(const ToolServer&) = delete;
    ToolServer& operator=(const ToolServer&) = delete;

    /// A later definition with the same name replaces the earlier one
    void add_tool(ToolDefinition tool);
    void add_resource(ResourceDefinition resource);

    [[nodiscard]] const ToolServerOptions& options() const noexcept { return options_; }
    [[nodiscard]] bool initialized() const noexcept { return initialized_; }

    /// Response to write back, or nullopt when the message needs none
    [[nodiscard]] std::optional<Json> handle_message(const Json& message);

    /// Same, starting from raw text. Unparsable input yields a ParseError response.
    [[nodiscard]] std::optional<Json> handle_line(std::string_view line);

    /// Serve until EOF on `in_fd`. Returns 0 on EOF, 1 on an I/O error.
    int serve(int in_fd = STDIN_FILENO, int out_fd = STDOUT_FILENO);

private:
    [[nodiscard]] Json dispatch(const JsonRpcRequest& request);

    [[nodiscard]] tl::expected<Json, JsonRpcError> on_initialize(const Json& params);
    [[nodiscard]] tl::expected<Json, JsonRpcError> on_tools_list(const Json& params) const;
    [[nodiscard]] tl::expected<Json, JsonRpcError> on_tools_call(const Json& params);
    [[nodiscard]] tl::expected<Json, JsonRpcError> on_resources_list() const;
    [[nodiscard]] tl::expected<Json, JsonRpcError> on_resources_read(const Json& params);

    [[nodiscard]] bool write_line(int fd, const std::string& text);

    ToolServerOptions options_;
    LoggerPtr logger_;
    std::vector<ToolDefinition> tools_;
    std::vector<ResourceDefinition> resources_;
    bool initialized_ = false;
};

}  // namespace mcpmux
