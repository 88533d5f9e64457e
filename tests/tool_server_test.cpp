// ─────────────────────────────────────────────────────────────────────────────
// Tool Server Tests
// ─────────────────────────────────────────────────────────────────────────────
// Exercises dispatch through handle_message()/handle_line(), and serve() over
// a pair of pipes.

#include <catch2/catch_test_macros.hpp>

#include "mcpmux/server/tool_server.hpp"
#include "support/test_logger.hpp"

#include <stdexcept>
#include <string>
#include <thread>

#include <unistd.h>

using namespace mcpmux;
using mcpmux::testing::TestLogger;

namespace {

Json request(std::int64_t id, const std::string& method, Json params = Json::object()) {
    return JsonRpcRequest(method, id, std::move(params)).to_json();
}

ToolServer make_server(std::size_t page_size = 0) {
    ToolServerOptions options;
    options.server_info = {"test_server", "9.9.9"};
    options.instructions = "For tests.";
    options.tools_page_size = page_size;
    return ToolServer(options, std::make_shared<NullLogger>());
}

void add_echo_tool(ToolServer& server, const std::string& name = "echo") {
    server.add_tool({name, "Echo text", Json{{"type", "object"}},
        [](const Json& args) -> ToolHandlerResult {
            return CallToolResult::text("Echo: " + args.value("text", std::string{}));
        }});
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Initialize
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("ToolServer answers initialize", "[server][initialize]") {
    ToolServer server({{"test_server", "9.9.9"}, "For tests."});
    add_echo_tool(server);

    InitializeParams params;
    params.client_info = {"mcpmux", "0.1.0"};
    auto response = server.handle_message(request(1, "initialize", params.to_json()));

    REQUIRE(response.has_value());
    REQUIRE((*response)["id"] == 1);
    const auto& result = (*response)["result"];
    REQUIRE(result["protocolVersion"] == MCP_PROTOCOL_VERSION);
    REQUIRE(result["serverInfo"]["name"] == "test_server");
    REQUIRE(result["instructions"] == "For tests.");
    REQUIRE(result["capabilities"].contains("tools"));
    REQUIRE_FALSE(result["capabilities"].contains("resources"));
}

TEST_CASE("ToolServer advertises resources once one is registered", "[server][initialize]") {
    auto server = make_server();
    server.add_resource({"mem://a", "a", std::nullopt, "text/plain",
        [] { return tl::expected<std::string, std::string>("A"); }});

    auto response = server.handle_message(request(1, "initialize"));
    REQUIRE((*response)["result"]["capabilities"].contains("resources"));
}

TEST_CASE("ToolServer records the initialized notification", "[server][initialize]") {
    auto server = make_server();
    REQUIRE_FALSE(server.initialized());

    auto response = server.handle_message(JsonRpcNotification("notifications/initialized").to_json());
    REQUIRE_FALSE(response.has_value());
    REQUIRE(server.initialized());
}

TEST_CASE("ToolServer answers ping with an empty object", "[server]") {
    auto server = make_server();
    auto response = server.handle_message(request(5, "ping"));
    REQUIRE((*response)["result"] == Json::object());
}

// ═══════════════════════════════════════════════════════════════════════════
// Tools
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("ToolServer lists tools in registration order", "[server][tools]") {
    auto server = make_server();
    add_echo_tool(server, "zeta");
    add_echo_tool(server, "alpha");

    auto response = server.handle_message(request(2, "tools/list"));
    const auto& tools = (*response)["result"]["tools"];

    REQUIRE(tools.size() == 2);
    REQUIRE(tools[0]["name"] == "zeta");
    REQUIRE(tools[1]["name"] == "alpha");
    REQUIRE(tools[0]["description"] == "Echo text");
    REQUIRE_FALSE((*response)["result"].contains("nextCursor"));
}

TEST_CASE("ToolServer replaces a tool registered twice", "[server][tools]") {
    auto server = make_server();
    add_echo_tool(server, "echo");
    server.add_tool({"echo", "Second", Json{{"type", "object"}},
        [](const Json&) -> ToolHandlerResult { return CallToolResult::text("second"); }});

    auto list = server.handle_message(request(1, "tools/list"));
    REQUIRE((*list)["result"]["tools"].size() == 1);

    auto call = server.handle_message(request(2, "tools/call", {{"name", "echo"}}));
    REQUIRE((*call)["result"]["content"][0]["text"] == "second");
}

TEST_CASE("ToolServer paginates tools/list", "[server][tools]") {
    auto server = make_server(2);
    for (const char* name : {"a", "b", "c"}) {
        add_echo_tool(server, name);
    }

    auto first = server.handle_message(request(1, "tools/list"));
    REQUIRE((*first)["result"]["tools"].size() == 2);
    REQUIRE((*first)["result"]["nextCursor"] == "2");

    auto second = server.handle_message(request(2, "tools/list", {{"cursor", "2"}}));
    REQUIRE((*second)["result"]["tools"].size() == 1);
    REQUIRE((*second)["result"]["tools"][0]["name"] == "c");
    REQUIRE_FALSE((*second)["result"].contains("nextCursor"));
}

TEST_CASE("ToolServer rejects a bad cursor", "[server][tools]") {
    auto server = make_server(2);
    add_echo_tool(server);

    for (const Json& cursor : {Json("abc"), Json("99"), Json(3)}) {
        auto response = server.handle_message(request(1, "tools/list", {{"cursor", cursor}}));
        REQUIRE((*response)["error"]["code"] == ErrorCode::InvalidParams);
    }
}

TEST_CASE("ToolServer calls a tool", "[server][tools]") {
    auto server = make_server();
    add_echo_tool(server);

    auto response = server.handle_message(request(3, "tools/call",
        {{"name", "echo"}, {"arguments", {{"text", "hi \"there\"\n{}"}}}}));

    const auto& result = (*response)["result"];
    REQUIRE(result["content"][0]["type"] == "text");
    REQUIRE(result["content"][0]["text"] == "Echo: hi \"there\"\n{}");
    REQUIRE_FALSE(result.contains("isError"));
}

TEST_CASE("ToolServer reports an unknown tool as InvalidParams", "[server][tools]") {
    auto server = make_server();
    auto response = server.handle_message(request(4, "tools/call", {{"name", "nope"}}));

    REQUIRE((*response)["error"]["code"] == ErrorCode::InvalidParams);
    REQUIRE((*response)["error"]["message"] == "Unknown tool: nope");
}

TEST_CASE("ToolServer rejects non-object tool arguments", "[server][tools]") {
    auto server = make_server();
    add_echo_tool(server);

    auto response = server.handle_message(request(4, "tools/call", {{"name", "echo"}, {"arguments", Json::array()}}));
    REQUIRE((*response)["error"]["code"] == ErrorCode::InvalidParams);
}

TEST_CASE("ToolServer turns handler failures into isError results", "[server][tools]") {
    auto logger = std::make_shared<TestLogger>();
    ToolServer server({{"s", "1"}}, logger);
    server.add_tool({"refuse", "", Json::object(),
        [](const Json&) -> ToolHandlerResult { return tl::unexpected(std::string("not today")); }});
    server.add_tool({"explode", "", Json::object(),
        [](const Json&) -> ToolHandlerResult { throw std::runtime_error("kaboom"); }});

    auto refused = server.handle_message(request(1, "tools/call", {{"name", "refuse"}}));
    REQUIRE((*refused)["result"]["isError"] == true);
    REQUIRE((*refused)["result"]["content"][0]["text"] == "not today");

    auto exploded = server.handle_message(request(2, "tools/call", {{"name", "explode"}}));
    REQUIRE((*exploded)["result"]["isError"] == true);
    REQUIRE((*exploded)["result"]["content"][0]["text"].get<std::string>().find("kaboom") != std::string::npos);
    REQUIRE(logger->contains(LogLevel::Error, "kaboom"));
}

// ═══════════════════════════════════════════════════════════════════════════
// Resources
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("ToolServer lists and reads resources", "[server][resources]") {
    auto server = make_server();
    server.add_resource({"mem://status", "status", "Status text", "text/plain",
        [] { return tl::expected<std::string, std::string>("all good"); }});

    auto list = server.handle_message(request(1, "resources/list"));
    const auto& resources = (*list)["result"]["resources"];
    REQUIRE(resources.size() == 1);
    REQUIRE(resources[0]["uri"] == "mem://status");
    REQUIRE(resources[0]["description"] == "Status text");

    auto read = server.handle_message(request(2, "resources/read", {{"uri", "mem://status"}}));
    REQUIRE((*read)["result"]["contents"][0]["text"] == "all good");
    REQUIRE((*read)["result"]["contents"][0]["mimeType"] == "text/plain");
}

TEST_CASE("ToolServer reports an unknown resource", "[server][resources]") {
    auto server = make_server();
    auto response = server.handle_message(request(1, "resources/read", {{"uri", "mem://missing"}}));

    REQUIRE((*response)["error"]["code"] == kResourceNotFoundCode);
    REQUIRE((*response)["error"]["data"]["uri"] == "mem://missing");
}

TEST_CASE("ToolServer reports a failing reader as InternalError", "[server][resources]") {
    auto server = make_server();
    server.add_resource({"mem://broken", "broken", std::nullopt, "text/plain",
        [] { return tl::expected<std::string, std::string>(tl::unexpect, "disk on fire"); }});

    auto response = server.handle_message(request(1, "resources/read", {{"uri", "mem://broken"}}));
    REQUIRE((*response)["error"]["code"] == ErrorCode::InternalError);
    REQUIRE((*response)["error"]["message"].get<std::string>().find("disk on fire") != std::string::npos);
}

// ═══════════════════════════════════════════════════════════════════════════
// Malformed Input
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("ToolServer answers garbage with ParseError and a null id", "[server][errors]") {
    auto server = make_server();
    auto response = server.handle_line("{this is not json");

    REQUIRE(response.has_value());
    REQUIRE((*response)["id"].is_null());
    REQUIRE((*response)["error"]["code"] == ErrorCode::ParseError);
}

TEST_CASE("ToolServer ignores blank lines", "[server][errors]") {
    auto server = make_server();
    REQUIRE_FALSE(server.handle_line("").has_value());
    REQUIRE_FALSE(server.handle_line("   \r\n").has_value());
}

TEST_CASE("ToolServer answers invalid requests with InvalidRequest", "[server][errors]") {
    auto server = make_server();

    auto no_version = server.handle_message({{"id", 3}, {"method", "ping"}});
    REQUIRE((*no_version)["id"] == 3);
    REQUIRE((*no_version)["error"]["code"] == ErrorCode::InvalidRequest);

    auto shapeless = server.handle_message(Json::array({1, 2}));
    REQUIRE((*shapeless)["id"].is_null());
    REQUIRE((*shapeless)["error"]["code"] == ErrorCode::InvalidRequest);
}

TEST_CASE("ToolServer answers unknown methods with MethodNotFound", "[server][errors]") {
    auto server = make_server();
    auto response = server.handle_message(request(9, "prompts/list"));
    REQUIRE((*response)["error"]["code"] == ErrorCode::MethodNotFound);
}

TEST_CASE("ToolServer ignores unsolicited responses", "[server][errors]") {
    auto server = make_server();
    auto response = server.handle_message({{"jsonrpc", "2.0"}, {"id", 1}, {"result", Json::object()}});
    REQUIRE_FALSE(response.has_value());
}

// ═══════════════════════════════════════════════════════════════════════════
// Serve Loop
// ═══════════════════════════════════════════════════════════════════════════

namespace {

struct PipePair {
    int read_fd = -1;
    int write_fd = -1;

    PipePair() {
        int fds[2];
        REQUIRE(::pipe(fds) == 0);
        read_fd = fds[0];
        write_fd = fds[1];
    }

    ~PipePair() {
        close_read();
        close_write();
    }

    void close_read() {
        if (read_fd >= 0) {
            ::close(read_fd);
            read_fd = -1;
        }
    }

    void close_write() {
        if (write_fd >= 0) {
            ::close(write_fd);
            write_fd = -1;
        }
    }
};

void write_all(int fd, const std::string& text) {
    std::size_t written = 0;
    while (written < text.size()) {
        const ssize_t n = ::write(fd, text.data() + written, text.size() - written);
        REQUIRE(n > 0);
        written += static_cast<std::size_t>(n);
    }
}

std::string read_all(int fd) {
    std::string out;
    char buffer[1024];
    ssize_t n;
    while ((n = ::read(fd, buffer, sizeof(buffer))) > 0) {
        out.append(buffer, static_cast<std::size_t>(n));
    }
    return out;
}

std::vector<Json> parse_lines(const std::string& text) {
    std::vector<Json> out;
    std::size_t pos = 0;
    while (pos < text.size()) {
        const auto newline = text.find('\n', pos);
        out.push_back(Json::parse(text.substr(pos, newline - pos)));
        pos = newline + 1;
    }
    return out;
}

}  // namespace

TEST_CASE("ToolServer serve answers line by line until EOF", "[server][serve]") {
    auto server = make_server();
    add_echo_tool(server);

    PipePair input;
    PipePair output;

    const std::string requests =
        request(1, "initialize").dump() + "\n" +
        JsonRpcNotification("notifications/initialized").to_json().dump() + "\n" +
        "\n" +
        request(2, "tools/call", {{"name", "echo"}, {"arguments", {{"text", "line\nbreak"}}}}).dump() + "\n" +
        "garbage\n" +
        request(3, "ping").dump();  // final line without a newline

    write_all(input.write_fd, requests);
    input.close_write();

    int rc = -1;
    std::thread serving([&] {
        rc = server.serve(input.read_fd, output.write_fd);
        output.close_write();
    });
    const auto written = read_all(output.read_fd);
    serving.join();

    REQUIRE(rc == 0);
    REQUIRE(server.initialized());

    const auto responses = parse_lines(written);
    REQUIRE(responses.size() == 4);
    REQUIRE(responses[0]["id"] == 1);
    REQUIRE(responses[1]["result"]["content"][0]["text"] == "Echo: line\nbreak");
    REQUIRE(responses[2]["error"]["code"] == ErrorCode::ParseError);
    REQUIRE(responses[3]["id"] == 3);
}

TEST_CASE("ToolServer serve discards oversized lines", "[server][serve]") {
    ToolServerOptions options;
    options.max_message_size = 256;
    ToolServer server(options, std::make_shared<NullLogger>());
    add_echo_tool(server);

    PipePair input;
    PipePair output;

    const std::string big = request(1, "tools/call",
        {{"name", "echo"}, {"arguments", {{"text", std::string(2000, 'x')}}}}).dump();

    int rc = -1;
    std::thread serving([&] {
        rc = server.serve(input.read_fd, output.write_fd);
        output.close_write();
    });

    write_all(input.write_fd, big + "\n" + request(2, "ping").dump() + "\n");
    input.close_write();

    const auto written = read_all(output.read_fd);
    serving.join();

    REQUIRE(rc == 0);
    const auto responses = parse_lines(written);
    REQUIRE(responses.size() == 2);
    REQUIRE(responses[0]["error"]["code"] == ErrorCode::ParseError);
    REQUIRE(responses[0]["error"]["message"] == "Message too large");
    REQUIRE(responses[1]["id"] == 2);
}
