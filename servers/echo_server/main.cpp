// ─────────────────────────────────────────────────────────────────────────────
// mcpmux-echo-server - reference stdio MCP server
// ─────────────────────────────────────────────────────────────────────────────
// Tools:
//   echo_tool(text)   -> "Echo: <text>"
// Resources:
//   echo://status     -> "Successfully connected to Echo Server"
//
// stdout carries the protocol; all logging goes to stderr.

#include <cxxopts.hpp>

#include "mcpmux/log/spdlog_logger.hpp"
#include "mcpmux/server/tool_server.hpp"

#include <exception>
#include <iostream>
#include <string>

using namespace mcpmux;

namespace {

ToolHandlerResult echo(const Json& arguments) {
    if (!arguments.contains("text") || !arguments["text"].is_string()) {
        return tl::unexpected(std::string("echo_tool requires a string argument 'text'"));
    }
    return CallToolResult::text("Echo: " + arguments["text"].get<std::string>());
}

}  // namespace

int main(int argc, char* argv[]) {
    cxxopts::Options options("mcpmux-echo-server", "Echo MCP server over stdio");
    options.add_options()
        ("log-level", "Log level (trace, debug, info, warn, error, off)",
            cxxopts::value<std::string>()->default_value("info"))
        ("h,help", "Print usage");

    LogLevel level = LogLevel::Info;
    try {
        auto parsed = options.parse(argc, argv);
        if (parsed.count("help")) {
            std::cerr << options.help() << "\n";
            return 0;
        }
        level = parse_log_level(parsed["log-level"].as<std::string>());
    } catch (const cxxopts::exceptions::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    auto logger = make_spdlog_stderr_logger(level);
    set_default_logger(logger);

    ToolServerOptions server_options;
    server_options.server_info = {"echo_server", "1.0.0"};
    server_options.instructions = "Echoes text back to the caller.";

    ToolServer server(server_options, logger);

    server.add_tool({
        "echo_tool",
        "Returns the input text prefixed with 'Echo: '.",
        Json{
            {"type", "object"},
            {"properties", {{"text", {{"type", "string"}, {"description", "The text to be echoed."}}}}},
            {"required", Json::array({"text"})}
        },
        echo
    });

    server.add_resource({
        "echo://status",
        "status",
        "Reports that the server is operational",
        "text/plain",
        [] { return tl::expected<std::string, std::string>("Successfully connected to Echo Server"); }
    });

    const int rc = server.serve();
    logger->flush();
    return rc;
}
