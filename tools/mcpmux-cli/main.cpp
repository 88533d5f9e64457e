// ─────────────────────────────────────────────────────────────────────────────
// mcpmux-cli - drive several stdio MCP servers from one configuration
// ─────────────────────────────────────────────────────────────────────────────
// Loads an mcpServers configuration, connects to every server, and prints
// the aggregated tools. Then either performs one action or runs an
// interactive echo loop against `echo_tool`.
//
// Usage:
//   mcpmux-cli --config config.json --list-tools
//   mcpmux-cli --config config.json --call echo_tool --args '{"text":"hi"}'
//   mcpmux-cli --config config.json --read-resource echo://status
//   mcpmux-cli --config config.json --interactive
//
// Results go to stdout; logs go to stderr (and --log-file when given).

#include <cxxopts.hpp>
#include <nlohmann/json.hpp>

#include "mcpmux/client/client_manager.hpp"
#include "mcpmux/log/spdlog_logger.hpp"

#include <atomic>
#include <cctype>
#include <exception>
#include <iostream>
#include <string>
#include <variant>

#include <signal.h>

using namespace mcpmux;
using Json = nlohmann::json;

// ═══════════════════════════════════════════════════════════════════════════
// ANSI Color Codes
// ═══════════════════════════════════════════════════════════════════════════

namespace color {
    const char* reset   = "\033[0m";
    const char* bold    = "\033[1m";
    const char* dim     = "\033[2m";
    const char* red     = "\033[31m";
    const char* green   = "\033[32m";
    const char* yellow  = "\033[33m";
    const char* blue    = "\033[34m";
    const char* cyan    = "\033[36m";

    bool enabled = true;

    std::string c(const char* code) {
        return enabled ? code : "";
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Signals
// ═══════════════════════════════════════════════════════════════════════════

namespace {

std::atomic<bool> g_stop_requested{false};

void on_stop_signal(int /*signo*/) {
    g_stop_requested.store(true);
}

// No SA_RESTART: a blocked read on stdin returns so the loop can exit
void install_signal_handlers() {
    struct sigaction action {};
    action.sa_handler = on_stop_signal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    ::sigaction(SIGINT, &action, nullptr);
    ::sigaction(SIGTERM, &action, nullptr);
}

// ═══════════════════════════════════════════════════════════════════════════
// Output Helpers
// ═══════════════════════════════════════════════════════════════════════════

void print_error(const std::string& msg) {
    std::cerr << color::c(color::red) << "Error: " << color::c(color::reset) << msg << "\n";
}

void print_header(const std::string& title) {
    std::cout << "\n" << color::c(color::bold) << color::c(color::cyan)
              << "═══ " << title << " ═══" << color::c(color::reset) << "\n\n";
}

void print_json(const Json& j) {
    std::cout << j.dump(2, ' ', false, Json::error_handler_t::replace) << "\n";
}

void print_content(const CallToolResult& result) {
    if (result.content.empty()) {
        std::cout << color::c(color::dim) << "(tool returned no content)" << color::c(color::reset) << "\n";
        return;
    }
    for (const auto& content : result.content) {
        if (const auto* text = std::get_if<TextContent>(&content)) {
            std::cout << text->text << "\n";
        } else if (const auto* image = std::get_if<ImageContent>(&content)) {
            std::cout << color::c(color::dim) << "[Image: " << image->mime_type << "]"
                      << color::c(color::reset) << "\n";
        } else if (const auto* audio = std::get_if<AudioContent>(&content)) {
            std::cout << color::c(color::dim) << "[Audio: " << audio->mime_type << "]"
                      << color::c(color::reset) << "\n";
        } else if (const auto* res = std::get_if<EmbeddedResource>(&content)) {
            std::cout << color::c(color::dim) << "[Resource: " << res->uri << "]"
                      << color::c(color::reset) << "\n";
        } else if (const auto* other = std::get_if<OtherContent>(&content)) {
            std::cout << color::c(color::dim) << "[" << other->type() << "] "
                      << other->raw.dump(-1, ' ', false, Json::error_handler_t::replace)
                      << color::c(color::reset) << "\n";
        }
    }
}

void print_client_error(const ClientError& err) {
    print_error(err.describe());
    if (err.rpc_error && err.rpc_error->data) {
        std::cerr << color::c(color::dim) << err.rpc_error->data->dump(2) << color::c(color::reset) << "\n";
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Command Handlers
// ═══════════════════════════════════════════════════════════════════════════

int cmd_list_tools(ClientManager& manager, bool json_output) {
    const auto tools = manager.list_all_tools();

    if (json_output) {
        Json output = Json::array();
        for (const auto& tool : tools) {
            Json entry = {{"name", tool.name}, {"server", tool.server}, {"inputSchema", tool.input_schema}};
            if (tool.description) {
                entry["description"] = *tool.description;
            }
            output.push_back(std::move(entry));
        }
        print_json(output);
        return 0;
    }

    print_header("Tools");
    if (tools.empty()) {
        std::cout << color::c(color::dim) << "(no tools found on the connected servers)"
                  << color::c(color::reset) << "\n";
        return 0;
    }
    for (const auto& tool : tools) {
        std::cout << color::c(color::bold) << color::c(color::yellow) << "• " << tool.name
                  << color::c(color::reset) << color::c(color::dim) << "  [" << tool.server << "]"
                  << color::c(color::reset) << "\n  " << tool.description.value_or("No description")
                  << "\n\n";
    }
    return 0;
}

int cmd_list_resources(ClientManager& manager, bool json_output) {
    const auto resources = manager.list_all_resources();

    if (json_output) {
        Json output = Json::array();
        for (const auto& res : resources) {
            Json entry = {{"uri", res.uri}, {"name", res.name}, {"server", res.server}};
            if (res.description) entry["description"] = *res.description;
            if (res.mime_type) entry["mimeType"] = *res.mime_type;
            output.push_back(std::move(entry));
        }
        print_json(output);
        return 0;
    }

    print_header("Resources");
    if (resources.empty()) {
        std::cout << color::c(color::dim) << "(no resources available)" << color::c(color::reset) << "\n";
        return 0;
    }
    for (const auto& res : resources) {
        std::cout << color::c(color::bold) << color::c(color::blue) << "• " << res.uri
                  << color::c(color::reset) << color::c(color::dim) << "  [" << res.server << "]"
                  << color::c(color::reset) << "\n  " << res.name;
        if (res.description) {
            std::cout << " - " << *res.description;
        }
        std::cout << "\n\n";
    }
    return 0;
}

int cmd_call_tool(ClientManager& manager, const std::string& tool_name,
                  const std::string& args_json, bool json_output) {
    Json args = Json::object();
    if (!args_json.empty()) {
        try {
            args = Json::parse(args_json);
        } catch (const Json::parse_error& e) {
            print_error("Invalid JSON arguments: " + std::string(e.what()));
            return 1;
        }
    }

    auto result = manager.call_tool(tool_name, args);
    if (!result) {
        print_client_error(result.error());
        return 1;
    }

    if (json_output) {
        print_json(result->to_json());
    } else {
        print_content(*result);
    }
    return 0;
}

int cmd_read_resource(ClientManager& manager, const std::string& uri, bool json_output) {
    auto result = manager.read_resource(uri);
    if (!result) {
        print_client_error(result.error());
        return 1;
    }

    if (json_output) {
        print_json(result->to_json());
        return 0;
    }
    for (const auto& contents : result->contents) {
        if (contents.text) {
            std::cout << *contents.text << "\n";
        } else if (contents.blob) {
            std::cout << color::c(color::dim) << "[Binary: " << contents.blob->size() << " bytes]"
                      << color::c(color::reset) << "\n";
        }
    }
    return 0;
}

// ═══════════════════════════════════════════════════════════════════════════
// Interactive echo loop
// ═══════════════════════════════════════════════════════════════════════════

int run_echo_loop(ClientManager& manager) {
    std::cout << "\n" << color::c(color::bold) << color::c(color::green)
              << "Ready to execute tools!" << color::c(color::reset) << "\n";

    std::string line;
    while (!g_stop_requested.load()) {
        std::cout << color::c(color::blue) << "Enter text to echo (or 'exit' to quit): "
                  << color::c(color::reset) << std::flush;
        if (!std::getline(std::cin, line)) {
            break;
        }

        std::string lowered = line;
        for (auto& ch : lowered) {
            ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
        }
        if (lowered == "exit" || lowered == "quit") {
            break;
        }
        if (line.find_first_not_of(" \t\r") == std::string::npos) {
            continue;
        }

        std::cout << color::c(color::cyan) << "Calling 'echo_tool' with argument: '" << line << "'..."
                  << color::c(color::reset) << "\n";

        auto result = manager.call_tool("echo_tool", Json{{"text", line}});
        if (!result) {
            print_client_error(result.error());
            continue;
        }
        std::cout << color::c(color::green) << "Server response:" << color::c(color::reset) << "\n";
        print_content(*result);
    }
    return 0;
}

StderrHandling parse_stderr_handling(const std::string& name) {
    if (name == "discard") return StderrHandling::Discard;
    if (name == "capture") return StderrHandling::Capture;
    return StderrHandling::Passthrough;
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Main
// ═══════════════════════════════════════════════════════════════════════════

int main(int argc, char* argv[]) {
    cxxopts::Options options("mcpmux-cli", "Connect to several stdio MCP servers at once");

    options.add_options()
        ("c,config", "Path to the mcpServers configuration file",
            cxxopts::value<std::string>()->default_value("config.json"))

        ("l,list-tools", "List the tools of every connected server")
        ("list-resources", "List the resources of every connected server")
        ("call", "Call a tool by name", cxxopts::value<std::string>())
        ("args", "JSON arguments for --call", cxxopts::value<std::string>()->default_value("{}"))
        ("read-resource", "Read a resource by URI", cxxopts::value<std::string>())
        ("i,interactive", "Interactive echo loop against echo_tool")

        ("handshake-timeout", "Handshake timeout in milliseconds",
            cxxopts::value<int>()->default_value("10000"))
        ("request-timeout", "Request timeout in milliseconds (0 = none)",
            cxxopts::value<int>()->default_value("30000"))
        ("server-stderr", "Server stderr: passthrough, discard or capture",
            cxxopts::value<std::string>()->default_value("passthrough"))
        ("allow-duplicate-names", "Let a repeated server name replace the earlier entry")

        ("log-level", "Log level (trace, debug, info, warn, error, off)",
            cxxopts::value<std::string>()->default_value("info"))
        ("log-file", "Also write logs to this file", cxxopts::value<std::string>())
        ("j,json", "Output results as JSON")
        ("no-color", "Disable colored output")
        ("h,help", "Print usage");

    cxxopts::ParseResult result;
    try {
        result = options.parse(argc, argv);
    } catch (const cxxopts::exceptions::exception& e) {
        print_error(e.what());
        return 1;
    }

    if (result.count("help")) {
        std::cout << options.help() << "\n";
        return 0;
    }

    color::enabled = !result.count("no-color");
    const bool json_output = result.count("json") > 0;

    const LogLevel level = parse_log_level(result["log-level"].as<std::string>());
    std::shared_ptr<SpdlogLogger> logger;
    try {
        logger = result.count("log-file")
            ? make_spdlog_stderr_file_logger(result["log-file"].as<std::string>(), level)
            : make_spdlog_stderr_logger(level);
    } catch (const spdlog::spdlog_ex& e) {
        print_error(std::string("Failed to open log file: ") + e.what());
        return 1;
    }
    set_default_logger(logger);

    install_signal_handlers();

    ManagerOptions manager_options;
    manager_options.handshake_timeout = std::chrono::milliseconds(result["handshake-timeout"].as<int>());
    manager_options.request_timeout = std::chrono::milliseconds(result["request-timeout"].as<int>());
    manager_options.stderr_handling = parse_stderr_handling(result["server-stderr"].as<std::string>());
    manager_options.config.allow_duplicate_names = result.count("allow-duplicate-names") > 0;
    manager_options.cancel_flag = &g_stop_requested;

    ClientManager manager(manager_options, logger);
    int exit_code = 0;

    try {
        const auto config_path = result["config"].as<std::string>();
        auto loaded = manager.load_config(config_path);
        if (!loaded) {
            print_error(std::string(to_string(loaded.error().code)) + ": " + loaded.error().message);
            return 1;
        }

        manager.connect_to_all();
        if (manager.session_count() == 0) {
            print_error("No MCP servers connected. Check " + config_path + " and the server paths.");
            manager.shutdown();
            return 1;
        }

        if (g_stop_requested.load()) {
            exit_code = 130;
        } else if (result.count("list-tools")) {
            exit_code = cmd_list_tools(manager, json_output);
        } else if (result.count("list-resources")) {
            exit_code = cmd_list_resources(manager, json_output);
        } else if (result.count("call")) {
            exit_code = cmd_call_tool(manager, result["call"].as<std::string>(),
                                      result["args"].as<std::string>(), json_output);
        } else if (result.count("read-resource")) {
            exit_code = cmd_read_resource(manager, result["read-resource"].as<std::string>(), json_output);
        } else if (result.count("interactive")) {
            exit_code = run_echo_loop(manager);
        } else {
            // Default: discovery, then the echo loop
            cmd_list_tools(manager, json_output);
            exit_code = run_echo_loop(manager);
        }
    } catch (const std::exception& e) {
        logger->error(std::string("Unexpected error: ") + e.what());
        exit_code = 1;
    }

    if (!json_output) {
        std::cerr << color::c(color::yellow) << "Shutting down connections..." << color::c(color::reset) << "\n";
    }
    manager.shutdown();
    logger->flush();
    return exit_code;
}
