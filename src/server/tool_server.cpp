#include "mcpmux/server/tool_server.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>

namespace mcpmux {

namespace {

JsonRpcError make_rpc_error(int code, std::string message, std::optional<Json> data = std::nullopt) {
    return JsonRpcError{code, std::move(message), std::move(data)};
}

std::string_view trim(std::string_view text) {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

/// Best-effort id recovery for error responses to invalid requests
std::optional<JsonRpcId> recover_id(const Json& message) {
    if (!message.is_object() || !message.contains("id")) {
        return std::nullopt;
    }
    auto id = JsonRpcId::from_json(message.at("id"));
    if (!id) {
        return std::nullopt;
    }
    return *id;
}

std::string serialize(const Json& message) {
    return message.dump(-1, ' ', false, Json::error_handler_t::replace);
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// Registration
// ─────────────────────────────────────────────────────────────────────────────

ToolServer::ToolServer(ToolServerOptions options, LoggerPtr logger)
    : options_(std::move(options))
    , logger_(logger_or_default(logger))
{}

void ToolServer::add_tool(ToolDefinition tool) {
    auto it = std::find_if(tools_.begin(), tools_.end(),
        [&tool](const ToolDefinition& existing) { return existing.name == tool.name; });
    if (it != tools_.end()) {
        *it = std::move(tool);
        return;
    }
    tools_.push_back(std::move(tool));
}

void ToolServer::add_resource(ResourceDefinition resource) {
    auto it = std::find_if(resources_.begin(), resources_.end(),
        [&resource](const ResourceDefinition& existing) { return existing.uri == resource.uri; });
    if (it != resources_.end()) {
        *it = std::move(resource);
        return;
    }
    resources_.push_back(std::move(resource));
}

// ─────────────────────────────────────────────────────────────────────────────
// Message handling
// ─────────────────────────────────────────────────────────────────────────────

std::optional<Json> ToolServer::handle_line(std::string_view line) {
    const auto text = trim(line);
    if (text.empty()) {
        return std::nullopt;
    }

    Json message;
    try {
        message = Json::parse(text.begin(), text.end());
    } catch (const Json::parse_error& e) {
        logger_->warn(std::string("Unparsable message: ") + e.what());
        return JsonRpcResponse::failure(std::nullopt,
            make_rpc_error(ErrorCode::ParseError, "Parse error")).to_json();
    }
    return handle_message(message);
}

std::optional<Json> ToolServer::handle_message(const Json& message) {
    switch (classify_message(message)) {
        case MessageKind::Notification: {
            const auto method = message.value("method", std::string{});
            if (method == "notifications/initialized") {
                initialized_ = true;
                logger_->info("Client completed initialization");
            } else {
                logger_->debug("Ignoring notification " + method);
            }
            return std::nullopt;
        }

        case MessageKind::Response:
            logger_->debug("Ignoring unsolicited response");
            return std::nullopt;

        case MessageKind::Invalid:
            return JsonRpcResponse::failure(recover_id(message),
                make_rpc_error(ErrorCode::InvalidRequest, "Invalid Request")).to_json();

        case MessageKind::Request:
            break;
    }

    auto request = JsonRpcRequest::from_json(message);
    if (!request) {
        return JsonRpcResponse::failure(recover_id(message),
            make_rpc_error(ErrorCode::InvalidRequest, request.error().message)).to_json();
    }
    return dispatch(*request);
}

Json ToolServer::dispatch(const JsonRpcRequest& request) {
    const auto& method = request.method();
    const Json params = request.params().value_or(Json::object());

    logger_->debug("Handling " + method);

    if (!params.is_object()) {
        return JsonRpcResponse::failure(request.id(),
            make_rpc_error(ErrorCode::InvalidParams, "params must be an object")).to_json();
    }

    tl::expected<Json, JsonRpcError> result = tl::unexpected(
        make_rpc_error(ErrorCode::MethodNotFound, "Method not found: " + method));

    try {
        if (method == "initialize") {
            result = on_initialize(params);
        } else if (method == "ping") {
            result = Json::object();
        } else if (method == "tools/list") {
            result = on_tools_list(params);
        } else if (method == "tools/call") {
            result = on_tools_call(params);
        } else if (method == "resources/list") {
            result = on_resources_list();
        } else if (method == "resources/read") {
            result = on_resources_read(params);
        }
    } catch (const Json::exception& e) {
        result = tl::unexpected(make_rpc_error(ErrorCode::InvalidParams, e.what()));
    }

    if (!result) {
        return JsonRpcResponse::failure(request.id(), std::move(result.error())).to_json();
    }
    return JsonRpcResponse::success(request.id(), std::move(*result)).to_json();
}

tl::expected<Json, JsonRpcError> ToolServer::on_initialize(const Json& params) {
    const auto client = InitializeParams::from_json(params);
    logger_->info("Initialize from " + client.client_info.name + " " + client.client_info.version);

    InitializeResult result;
    result.protocol_version = MCP_PROTOCOL_VERSION;
    result.server_info = options_.server_info;
    result.instructions = options_.instructions;
    result.capabilities.tools = ServerCapabilities::Tools{false};
    if (!resources_.empty()) {
        result.capabilities.resources = ServerCapabilities::Resources{false, false};
    }
    return result.to_json();
}

tl::expected<Json, JsonRpcError> ToolServer::on_tools_list(const Json& params) const {
    std::size_t start = 0;
    if (params.contains("cursor") && !params["cursor"].is_null()) {
        const auto& cursor = params["cursor"];
        if (!cursor.is_string()) {
            return tl::unexpected(make_rpc_error(ErrorCode::InvalidParams, "cursor must be a string"));
        }
        const auto& text = cursor.get_ref<const std::string&>();
        const bool numeric = !text.empty() && std::all_of(text.begin(), text.end(),
            [](char c) { return c >= '0' && c <= '9'; });
        if (!numeric || text.size() > 9 || std::stoul(text) > tools_.size()) {
            return tl::unexpected(make_rpc_error(ErrorCode::InvalidParams, "Invalid cursor: " + text));
        }
        start = std::stoul(text);
    }

    const std::size_t page = options_.tools_page_size == 0 ? tools_.size() : options_.tools_page_size;
    const std::size_t end = std::min(tools_.size(), start + page);

    ListToolsResult result;
    for (std::size_t i = start; i < end; ++i) {
        const auto& def = tools_[i];
        Tool tool;
        tool.name = def.name;
        if (!def.description.empty()) {
            tool.description = def.description;
        }
        tool.input_schema = def.input_schema;
        result.tools.push_back(std::move(tool));
    }
    if (end < tools_.size()) {
        result.next_cursor = std::to_string(end);
    }
    return result.to_json();
}

tl::expected<Json, JsonRpcError> ToolServer::on_tools_call(const Json& params) {
    if (!params.contains("name") || !params["name"].is_string()) {
        return tl::unexpected(make_rpc_error(ErrorCode::InvalidParams, "tools/call requires a string 'name'"));
    }
    const auto name = params["name"].get<std::string>();

    Json arguments = Json::object();
    if (params.contains("arguments") && !params["arguments"].is_null()) {
        if (!params["arguments"].is_object()) {
            return tl::unexpected(make_rpc_error(ErrorCode::InvalidParams, "arguments must be an object"));
        }
        arguments = params["arguments"];
    }

    auto it = std::find_if(tools_.begin(), tools_.end(),
        [&name](const ToolDefinition& tool) { return tool.name == name; });
    if (it == tools_.end() || !it->handler) {
        return tl::unexpected(make_rpc_error(ErrorCode::InvalidParams, "Unknown tool: " + name));
    }

    ToolHandlerResult outcome = tl::unexpected(std::string{});
    try {
        outcome = it->handler(arguments);
    } catch (const std::exception& e) {
        logger_->error("Tool " + name + " threw: " + e.what());
        outcome = tl::unexpected("Error executing tool " + name + ": " + e.what());
    }

    if (!outcome) {
        logger_->warn("Tool " + name + " failed: " + outcome.error());
        return CallToolResult::text(outcome.error(), true).to_json();
    }
    return outcome->to_json();
}

tl::expected<Json, JsonRpcError> ToolServer::on_resources_list() const {
    ListResourcesResult result;
    for (const auto& def : resources_) {
        result.resources.push_back(Resource{def.uri, def.name, def.description, def.mime_type});
    }
    return result.to_json();
}

tl::expected<Json, JsonRpcError> ToolServer::on_resources_read(const Json& params) {
    if (!params.contains("uri") || !params["uri"].is_string()) {
        return tl::unexpected(make_rpc_error(ErrorCode::InvalidParams, "resources/read requires a string 'uri'"));
    }
    const auto uri = params["uri"].get<std::string>();

    auto it = std::find_if(resources_.begin(), resources_.end(),
        [&uri](const ResourceDefinition& resource) { return resource.uri == uri; });
    if (it == resources_.end() || !it->reader) {
        return tl::unexpected(make_rpc_error(kResourceNotFoundCode, "Resource not found", Json{{"uri", uri}}));
    }

    tl::expected<std::string, std::string> text = tl::unexpected(std::string{});
    try {
        text = it->reader();
    } catch (const std::exception& e) {
        text = tl::unexpected(std::string(e.what()));
    }
    if (!text) {
        logger_->error("Reading " + uri + " failed: " + text.error());
        return tl::unexpected(make_rpc_error(ErrorCode::InternalError, "Failed to read " + uri + ": " + text.error()));
    }

    ReadResourceResult result;
    result.contents.push_back(ResourceContents{uri, it->mime_type, std::move(*text), std::nullopt});
    return result.to_json();
}

// ─────────────────────────────────────────────────────────────────────────────
// Serve loop
// ─────────────────────────────────────────────────────────────────────────────

bool ToolServer::write_line(int fd, const std::string& text) {
    std::string line = text;
    line += '\n';

    std::size_t written = 0;
    while (written < line.size()) {
        const ssize_t n = ::write(fd, line.data() + written, line.size() - written);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            logger_->error(std::string("Failed to write response: ") + std::strerror(errno));
            return false;
        }
        written += static_cast<std::size_t>(n);
    }
    return true;
}

int ToolServer::serve(int in_fd, int out_fd) {
    logger_->info("Serving " + options_.server_info.name + " on stdio");

    std::string pending;
    bool discarding = false;  // Inside an oversized line, waiting for its newline
    char buffer[4096];

    auto respond = [&](std::string_view line) {
        auto response = handle_line(line);
        return !response || write_line(out_fd, serialize(*response));
    };

    auto reject_oversized = [&] {
        logger_->error("Message exceeds " + std::to_string(options_.max_message_size) + " bytes");
        auto error = JsonRpcResponse::failure(std::nullopt,
            make_rpc_error(ErrorCode::ParseError, "Message too large"));
        return write_line(out_fd, serialize(error.to_json()));
    };

    while (true) {
        const ssize_t n = ::read(in_fd, buffer, sizeof(buffer));
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            logger_->error(std::string("Failed to read request: ") + std::strerror(errno));
            return 1;
        }
        if (n == 0) {
            if (!discarding && !pending.empty() && !respond(pending)) {
                return 1;
            }
            logger_->info("Input closed, shutting down");
            return 0;
        }

        pending.append(buffer, static_cast<std::size_t>(n));

        std::size_t pos = 0;
        while (true) {
            const auto newline = pending.find('\n', pos);
            if (newline == std::string::npos) {
                break;
            }
            const auto length = newline - pos;
            if (discarding) {
                discarding = false;
            } else if (length > options_.max_message_size) {
                if (!reject_oversized()) {
                    return 1;
                }
            } else if (!respond(std::string_view(pending).substr(pos, length))) {
                return 1;
            }
            pos = newline + 1;
        }
        pending.erase(0, pos);

        if (pending.size() > options_.max_message_size) {
            if (!discarding && !reject_oversized()) {
                return 1;
            }
            discarding = true;
            pending.clear();
        }
    }
}

}  // namespace mcpmux
