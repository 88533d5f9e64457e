#include "mcpmux/client/client_manager.hpp"

#include <algorithm>
#include <future>
#include <system_error>

namespace mcpmux {

namespace {

/// isError results carry their content as the error payload
McpError tool_error_payload(const CallToolResult& result) {
    McpError err;
    err.code = 0;
    for (const auto& text : result.texts()) {
        if (!err.message.empty()) {
            err.message += '\n';
        }
        err.message += text;
    }
    if (err.message.empty()) {
        err.message = "Tool reported an error";
    }
    err.data = result.to_json()["content"];
    return err;
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// Construction
// ─────────────────────────────────────────────────────────────────────────────

ClientManager::ClientManager(ManagerOptions options, LoggerPtr logger)
    : options_(std::move(options))
    , logger_(logger_or_default(logger))
    , registry_(logger_)
{}

ClientManager::~ClientManager() {
    shutdown();
}

// ─────────────────────────────────────────────────────────────────────────────
// Configuration
// ─────────────────────────────────────────────────────────────────────────────

ConfigResult<std::size_t> ClientManager::load_config(const std::string& path) {
    auto loaded = load_server_config(path, options_.config);
    if (!loaded) {
        logger_->error(std::string(to_string(loaded.error().code)) + ": " + loaded.error().message);
        return tl::unexpected(loaded.error());
    }

    servers_ = std::move(*loaded);
    logger_->info("Loaded " + std::to_string(servers_.size()) + " server(s) from " + path);
    return servers_.size();
}

void ClientManager::set_servers(ServerMap servers) {
    servers_ = std::move(servers);
}

// ─────────────────────────────────────────────────────────────────────────────
// Connection Lifecycle
// ─────────────────────────────────────────────────────────────────────────────

ConnectReport ClientManager::connect_to_all() {
    invalidate_index();

    const SessionOptions session_options = options_.session_options();

    struct Attempt {
        std::string name;
        std::future<ClientResult<std::unique_ptr<Session>>> future;
    };
    std::vector<Attempt> attempts;
    ConnectReport report;

    for (const auto& entry : servers_) {
        const std::string& name = entry.first;
        const ServerDescriptor& descriptor = entry.second;
        if (registry_.find(name) != nullptr) {
            logger_->debug("Server '" + name + "' is already connected");
            continue;
        }
        try {
            attempts.push_back({name, std::async(std::launch::async,
                [&descriptor, &session_options, logger = logger_]() {
                    return Session::connect(descriptor, session_options, logger);
                })});
        } catch (const std::system_error& e) {
            auto err = ClientError::spawn_error(name, std::string("Failed to start connection task: ") + e.what());
            logger_->warn("Failed to connect to server '" + name + "': " + err.describe());
            report.failed.emplace_back(name, std::move(err));
        }
    }

    // Results are inserted one at a time, in descriptor order
    for (auto& attempt : attempts) {
        auto session = attempt.future.get();
        if (!session) {
            logger_->warn("Failed to connect to server '" + attempt.name + "': " + session.error().describe());
            report.failed.emplace_back(attempt.name, session.error());
            continue;
        }

        auto inserted = registry_.insert(std::move(*session));
        if (!inserted) {
            logger_->warn("Failed to connect to server '" + attempt.name + "': " + inserted.error().describe());
            report.failed.emplace_back(attempt.name, inserted.error());
            continue;
        }
        report.connected.push_back(attempt.name);
    }

    logger_->info("Connected to " + std::to_string(report.connected.size()) + " of " +
                  std::to_string(report.connected.size() + report.failed.size()) + " server(s)");
    return report;
}

void ClientManager::shutdown() {
    invalidate_index();

    if (registry_.empty()) {
        return;
    }

    logger_->info("Shutting down " + std::to_string(registry_.size()) + " session(s)");
    const auto closed = registry_.close_all();
    logger_->debug("Closed " + std::to_string(closed) + " session(s)");
}

std::vector<std::string> ClientManager::connected_servers() const {
    return registry_.names();
}

std::size_t ClientManager::session_count() const {
    return registry_.size();
}

std::vector<pid_t> ClientManager::server_pids() const {
    std::vector<pid_t> pids;
    registry_.for_each([&pids](Session& session) {
        pids.push_back(session.pid());
    });
    return pids;
}

// ─────────────────────────────────────────────────────────────────────────────
// Tools
// ─────────────────────────────────────────────────────────────────────────────

std::vector<ToolDescriptor> ClientManager::list_all_tools() {
    std::vector<ToolDescriptor> all;

    for (const auto& session : registry_.sessions()) {
        auto tools = session->list_tools();
        if (!tools) {
            logger_->error("Failed to list tools from server '" + session->name() + "': " +
                           tools.error().describe());
            continue;
        }
        for (auto& tool : *tools) {
            all.push_back(ToolDescriptor{
                std::move(tool.name),
                std::move(tool.description),
                std::move(tool.input_schema),
                session->name()
            });
        }
    }

    if (options_.tool_index_ttl.count() > 0) {
        rebuild_index(all);
    }
    return all;
}

ClientResult<CallToolResult> ClientManager::call_tool(const std::string& name, const Json& arguments) {
    if (!arguments.is_null() && !arguments.is_object()) {
        return tl::unexpected(ClientError::invalid_arguments(
            "Arguments for tool " + name + " must be a JSON object, got " + arguments.type_name()));
    }
    const Json args = arguments.is_null() ? Json::object() : arguments;

    if (auto owner = cached_owner(name)) {
        if (auto session = registry_.find(*owner)) {
            logger_->debug("Dispatching " + name + " to '" + *owner + "' from the tool index");
            return dispatch(*session, name, args);
        }
        invalidate_index();
    }

    for (const auto& session : registry_.sessions()) {
        auto tools = session->list_tools();
        if (!tools) {
            logger_->warn("Failed to list tools from server '" + session->name() + "': " +
                          tools.error().describe());
            continue;
        }

        const bool advertised = std::any_of(tools->begin(), tools->end(),
            [&name](const Tool& tool) { return tool.name == name; });
        if (advertised) {
            return dispatch(*session, name, args);
        }
    }

    return tl::unexpected(ClientError::tool_not_found(name));
}

ClientResult<CallToolResult> ClientManager::dispatch(Session& session, const std::string& name, const Json& arguments) {
    logger_->info("Calling tool " + name + " on server '" + session.name() + "'");

    auto result = session.call_tool(name, arguments);
    if (!result) {
        auto err = ClientError::tool_call_failed(name, result.error());
        logger_->error(err.describe());
        return tl::unexpected(std::move(err));
    }

    if (result->is_error) {
        ClientError cause{ClientErrorCode::ToolCallFailed, {}, session.name(), tool_error_payload(*result)};
        cause.message = cause.rpc_error->message;
        auto err = ClientError::tool_call_failed(name, cause);
        logger_->error(err.describe());
        return tl::unexpected(std::move(err));
    }

    return result;
}

// ─────────────────────────────────────────────────────────────────────────────
// Tool index
// ─────────────────────────────────────────────────────────────────────────────

std::optional<std::string> ClientManager::cached_owner(const std::string& tool) {
    if (options_.tool_index_ttl.count() <= 0) {
        return std::nullopt;
    }

    std::lock_guard<std::mutex> lock(index_mutex_);
    if (!index_.valid) {
        return std::nullopt;
    }
    if (std::chrono::steady_clock::now() - index_.built_at >= options_.tool_index_ttl) {
        index_ = ToolIndex{};
        return std::nullopt;
    }
    auto it = index_.owner.find(tool);
    if (it == index_.owner.end()) {
        return std::nullopt;
    }
    return it->second;
}

void ClientManager::rebuild_index(const std::vector<ToolDescriptor>& tools) {
    ToolIndex fresh;
    for (const auto& tool : tools) {
        // First advertiser wins, matching the uncached search order
        fresh.owner.emplace(tool.name, tool.server);
    }
    fresh.built_at = std::chrono::steady_clock::now();
    fresh.valid = true;

    std::lock_guard<std::mutex> lock(index_mutex_);
    index_ = std::move(fresh);
}

void ClientManager::invalidate_index() {
    std::lock_guard<std::mutex> lock(index_mutex_);
    index_ = ToolIndex{};
}

// ─────────────────────────────────────────────────────────────────────────────
// Resources
// ─────────────────────────────────────────────────────────────────────────────

std::vector<ResourceDescriptor> ClientManager::list_all_resources() {
    std::vector<ResourceDescriptor> all;

    for (const auto& session : registry_.sessions()) {
        if (!session->capabilities().resources) {
            continue;
        }
        auto resources = session->list_resources();
        if (!resources) {
            logger_->error("Failed to list resources from server '" + session->name() + "': " +
                           resources.error().describe());
            continue;
        }
        for (auto& resource : *resources) {
            all.push_back(ResourceDescriptor{
                std::move(resource.uri),
                std::move(resource.name),
                std::move(resource.description),
                std::move(resource.mime_type),
                session->name()
            });
        }
    }
    return all;
}

ClientResult<ReadResourceResult> ClientManager::read_resource(const std::string& uri) {
    for (const auto& session : registry_.sessions()) {
        if (!session->capabilities().resources) {
            continue;
        }
        auto resources = session->list_resources();
        if (!resources) {
            logger_->warn("Failed to list resources from server '" + session->name() + "': " +
                          resources.error().describe());
            continue;
        }

        const bool listed = std::any_of(resources->begin(), resources->end(),
            [&uri](const Resource& resource) { return resource.uri == uri; });
        if (!listed) {
            continue;
        }

        auto contents = session->read_resource(uri);
        if (!contents) {
            logger_->error("Failed to read " + uri + " from server '" + session->name() + "': " +
                           contents.error().describe());
        }
        return contents;
    }

    return tl::unexpected(ClientError::resource_not_found(uri));
}

}  // namespace mcpmux
