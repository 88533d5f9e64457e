#include "mcpmux/client/session.hpp"

#include "mcpmux/protocol/json_rpc.hpp"

#include <set>

namespace mcpmux {

namespace {

std::string describe_transport_error(const TransportError& err) {
    return std::string(to_string(err.category)) + ": " + err.message;
}

std::string millis(std::chrono::milliseconds ms) {
    return std::to_string(ms.count()) + "ms";
}

}  // namespace

template <typename T, typename Parse>
ClientResult<T> Session::decode(const std::string& method, const Json& result, Parse&& parse) const {
    try {
        return parse(result);
    } catch (const Json::exception& e) {
        return tl::unexpected(ClientError::protocol_error(
            descriptor_.name, "Malformed " + method + " result: " + e.what()));
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// Construction
// ─────────────────────────────────────────────────────────────────────────────

Session::Session(ServerDescriptor descriptor, SessionOptions options, LoggerPtr logger)
    : descriptor_(std::move(descriptor))
    , options_(std::move(options))
    , logger_(logger_or_default(logger))
{}

Session::~Session() {
    close();
}

ClientResult<std::unique_ptr<Session>> Session::connect(
    const ServerDescriptor& descriptor,
    const SessionOptions& options,
    LoggerPtr logger
) {
    std::unique_ptr<Session> session(new Session(descriptor, options, std::move(logger)));

    auto started = session->start_transport();
    if (!started) {
        session->state_ = SessionState::Failed;
        session->transport_->stop();
        return tl::unexpected(started.error());
    }

    auto handshake = session->handshake();
    if (!handshake) {
        session->state_ = SessionState::Failed;
        session->transport_->stop();
        session->logger_->debug("[" + descriptor.name + "] handshake failed: " + handshake.error().message);
        return tl::unexpected(handshake.error());
    }

    session->state_ = SessionState::Ready;
    session->logger_->info("[" + descriptor.name + "] connected to " +
                           session->init_result_.server_info.name + " " +
                           session->init_result_.server_info.version +
                           " (pid " + std::to_string(session->pid()) + ")");
    return session;
}

ClientResult<void> Session::start_transport() {
    ProcessTransportConfig config;
    config.command = descriptor_.command;
    config.args = descriptor_.args;
    if (descriptor_.env) {
        config.env = *descriptor_.env;
    }
    config.stderr_handling = options_.stderr_handling;
    config.max_message_size = options_.max_message_size;
    config.shutdown_grace = options_.shutdown_grace;
    config.cancel_flag = options_.cancel_flag;

    if (options_.stderr_handling == StderrHandling::Capture) {
        config.stderr_callback = [logger = logger_, name = descriptor_.name](std::string_view line) {
            logger->info("[" + name + "] stderr: " + std::string(line));
        };
    }

    transport_ = std::make_unique<ProcessTransport>(std::move(config));

    logger_->debug("[" + descriptor_.name + "] spawning " + descriptor_.command_line());
    auto started = transport_->start();
    if (!started) {
        return tl::unexpected(ClientError::spawn_error(
            descriptor_.name, "Failed to start '" + descriptor_.command + "': " + started.error().message));
    }
    return {};
}

ClientResult<void> Session::handshake() {
    InitializeParams params;
    params.protocol_version = MCP_PROTOCOL_VERSION;
    params.client_info = options_.client_info;
    params.capabilities = options_.capabilities;

    std::lock_guard<std::mutex> lock(io_mutex_);

    auto result = send_and_receive("initialize", params.to_json(), options_.handshake_timeout);
    if (!result) {
        const auto& err = result.error();
        if (err.code == ClientErrorCode::Timeout) {
            return tl::unexpected(ClientError::handshake_timeout(
                descriptor_.name,
                "No initialize response within " + millis(options_.handshake_timeout)));
        }
        return tl::unexpected(ClientError::handshake_error(
            descriptor_.name, "initialize failed: " + err.message, err.rpc_error));
    }

    if (!result->is_object()) {
        return tl::unexpected(ClientError::handshake_error(
            descriptor_.name, "initialize result must be an object, got " + result->dump()));
    }
    auto init = decode<InitializeResult>("initialize", *result, [](const Json& j) {
        return InitializeResult::from_json(j);
    });
    if (!init) {
        return tl::unexpected(ClientError::handshake_error(descriptor_.name, init.error().message));
    }
    init_result_ = std::move(*init);

    if (init_result_.protocol_version != MCP_PROTOCOL_VERSION) {
        logger_->debug("[" + descriptor_.name + "] server answered with protocol version " +
                       init_result_.protocol_version);
    }

    auto notified = send_notification("notifications/initialized", std::nullopt);
    if (!notified) {
        return tl::unexpected(ClientError::handshake_error(
            descriptor_.name, "Failed to send initialized notification: " + notified.error().message));
    }
    return {};
}

pid_t Session::pid() const {
    return transport_ ? transport_->pid() : -1;
}

// ─────────────────────────────────────────────────────────────────────────────
// Requests
// ─────────────────────────────────────────────────────────────────────────────

ClientResult<std::vector<Tool>> Session::list_tools() {
    std::vector<Tool> tools;
    std::set<std::string> seen_cursors;
    std::optional<std::string> cursor;

    do {
        Json params = Json::object();
        if (cursor) {
            params["cursor"] = *cursor;
        }

        auto result = request("tools/list", std::move(params));
        if (!result) {
            return tl::unexpected(result.error());
        }

        auto page = decode<ListToolsResult>("tools/list", *result, [](const Json& j) {
            return ListToolsResult::from_json(j);
        });
        if (!page) {
            return tl::unexpected(page.error());
        }

        for (auto& tool : page->tools) {
            tools.push_back(std::move(tool));
        }

        cursor = std::move(page->next_cursor);
        if (cursor && !seen_cursors.insert(*cursor).second) {
            return tl::unexpected(ClientError::protocol_error(
                descriptor_.name, "tools/list repeated cursor '" + *cursor + "'"));
        }
    } while (cursor);

    return tools;
}

ClientResult<CallToolResult> Session::call_tool(const std::string& name, const Json& arguments) {
    CallToolParams params;
    params.name = name;
    params.arguments = arguments.is_null() ? Json::object() : arguments;

    auto result = request("tools/call", params.to_json());
    if (!result) {
        return tl::unexpected(result.error());
    }

    return decode<CallToolResult>("tools/call", *result, [](const Json& j) {
        return CallToolResult::from_json(j);
    });
}

ClientResult<std::vector<Resource>> Session::list_resources() {
    std::vector<Resource> resources;
    std::set<std::string> seen_cursors;
    std::optional<std::string> cursor;

    do {
        Json params = Json::object();
        if (cursor) {
            params["cursor"] = *cursor;
        }

        auto result = request("resources/list", std::move(params));
        if (!result) {
            return tl::unexpected(result.error());
        }

        auto page = decode<ListResourcesResult>("resources/list", *result, [](const Json& j) {
            return ListResourcesResult::from_json(j);
        });
        if (!page) {
            return tl::unexpected(page.error());
        }

        for (auto& resource : page->resources) {
            resources.push_back(std::move(resource));
        }

        cursor = std::move(page->next_cursor);
        if (cursor && !seen_cursors.insert(*cursor).second) {
            return tl::unexpected(ClientError::protocol_error(
                descriptor_.name, "resources/list repeated cursor '" + *cursor + "'"));
        }
    } while (cursor);

    return resources;
}

ClientResult<ReadResourceResult> Session::read_resource(const std::string& uri) {
    auto result = request("resources/read", Json{{"uri", uri}});
    if (!result) {
        return tl::unexpected(result.error());
    }

    return decode<ReadResourceResult>("resources/read", *result, [](const Json& j) {
        return ReadResourceResult::from_json(j);
    });
}

ClientResult<void> Session::ping() {
    auto result = request("ping", Json::object());
    if (!result) {
        return tl::unexpected(result.error());
    }
    return {};
}

ClientResult<Json> Session::request(const std::string& method, Json params) {
    if (!is_ready()) {
        return tl::unexpected(ClientError::not_ready(descriptor_.name));
    }

    std::lock_guard<std::mutex> lock(io_mutex_);

    // close() may have run while this caller waited for the lock
    if (!is_ready()) {
        return tl::unexpected(ClientError::not_ready(descriptor_.name));
    }

    return send_and_receive(method, std::move(params), options_.request_timeout);
}

ClientResult<Json> Session::send_and_receive(
    const std::string& method,
    Json params,
    std::chrono::milliseconds timeout
) {
    const JsonRpcRequest request(method, ++next_id_, std::move(params));
    const JsonRpcId expected_id = request.id();

    logger_->trace("[" + descriptor_.name + "] -> " + method + " #" + std::to_string(next_id_));

    auto sent = transport_->send(request.to_json());
    if (!sent) {
        return tl::unexpected(ClientError::transport_error(
            descriptor_.name, "Failed to send " + method + ": " + describe_transport_error(sent.error())));
    }

    const bool has_timeout = timeout.count() > 0;
    const auto deadline = std::chrono::steady_clock::now() + timeout;

    while (true) {
        auto remaining = std::chrono::milliseconds{0};
        if (has_timeout) {
            remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now());
            if (remaining.count() <= 0) {
                return tl::unexpected(ClientError::timeout(
                    descriptor_.name, method + " timed out after " + millis(timeout)));
            }
        }

        auto received = transport_->receive(remaining);
        if (!received) {
            const auto& err = received.error();
            switch (err.category) {
                case TransportError::Category::Timeout:
                    return tl::unexpected(ClientError::timeout(
                        descriptor_.name, method + " timed out after " + millis(timeout)));
                case TransportError::Category::Protocol:
                    // The offending line is consumed; keep waiting for our response
                    logger_->warn("[" + descriptor_.name + "] discarding unreadable message: " + err.message);
                    continue;
                default:
                    return tl::unexpected(ClientError::transport_error(
                        descriptor_.name, method + " failed: " + describe_transport_error(err)));
            }
        }

        const Json& message = *received;
        switch (classify_message(message)) {
            case MessageKind::Notification:
                logger_->trace("[" + descriptor_.name + "] <- notification " +
                               message.value("method", std::string{}));
                continue;

            case MessageKind::Request:
                answer_server_request(message);
                continue;

            case MessageKind::Invalid:
                logger_->warn("[" + descriptor_.name + "] ignoring invalid message: " + message.dump());
                continue;

            case MessageKind::Response:
                break;
        }

        auto response = JsonRpcResponse::from_json(message);
        if (!response) {
            return tl::unexpected(ClientError::protocol_error(
                descriptor_.name, "Malformed response to " + method + ": " + response.error().message));
        }

        if (!response->id() || !(*response->id() == expected_id)) {
            logger_->debug("[" + descriptor_.name + "] discarding stale response " + message.dump());
            continue;
        }

        if (response->is_error()) {
            const auto& rpc = response->error();
            McpError err;
            err.code = static_cast<int>(rpc.code);
            err.message = rpc.message;
            err.data = rpc.data;
            return tl::unexpected(ClientError::from_rpc_error(descriptor_.name, err));
        }

        logger_->trace("[" + descriptor_.name + "] <- " + method + " #" + std::to_string(next_id_));
        return response->result();
    }
}

ClientResult<void> Session::send_notification(const std::string& method, std::optional<Json> params) {
    const JsonRpcNotification notification(method, std::move(params));
    auto sent = transport_->send(notification.to_json());
    if (!sent) {
        return tl::unexpected(ClientError::transport_error(
            descriptor_.name, "Failed to send " + method + ": " + describe_transport_error(sent.error())));
    }
    return {};
}

void Session::answer_server_request(const Json& message) {
    auto parsed = JsonRpcRequest::from_json(message);
    if (!parsed) {
        logger_->warn("[" + descriptor_.name + "] ignoring malformed server request: " + parsed.error().message);
        return;
    }

    const auto& method = parsed->method();
    auto response = method == "ping"
        ? JsonRpcResponse::success(parsed->id(), Json::object())
        : JsonRpcResponse::failure(parsed->id(), JsonRpcError{
              ErrorCode::MethodNotFound, "Method not found: " + method, std::nullopt});

    logger_->debug("[" + descriptor_.name + "] answered server request " + method);

    auto sent = transport_->send(response.to_json());
    if (!sent) {
        logger_->warn("[" + descriptor_.name + "] failed to answer server request: " + sent.error().message);
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// Teardown
// ─────────────────────────────────────────────────────────────────────────────

void Session::close() {
    std::lock_guard<std::mutex> lock(io_mutex_);

    const auto previous = state_.load();
    if (previous == SessionState::Closed) {
        return;
    }
    state_ = SessionState::Closed;

    if (!transport_) {
        return;
    }

    const pid_t child = transport_->pid();
    transport_->stop();

    if (previous == SessionState::Ready) {
        std::string msg = "[" + descriptor_.name + "] closed (pid " + std::to_string(child);
        if (auto code = transport_->exit_code()) {
            msg += ", exit " + std::to_string(*code);
        }
        logger_->debug(msg + ")");
    }
}

}  // namespace mcpmux
