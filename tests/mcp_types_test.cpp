// ─────────────────────────────────────────────────────────────────────────────
// MCP Types Tests
// ─────────────────────────────────────────────────────────────────────────────

#include <catch2/catch_test_macros.hpp>
#include <nlohmann/json.hpp>

#include "mcpmux/protocol/mcp_types.hpp"

using namespace mcpmux;
using Json = nlohmann::json;

// ═══════════════════════════════════════════════════════════════════════════
// Initialize
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("InitializeParams serialization", "[mcp][types]") {
    InitializeParams params;
    params.client_info = {"mcpmux", "0.1.0"};

    auto json = params.to_json();

    REQUIRE(json["protocolVersion"] == "2024-11-05");
    REQUIRE(json["clientInfo"]["name"] == "mcpmux");
    REQUIRE(json["clientInfo"]["version"] == "0.1.0");
    REQUIRE(json["capabilities"].is_object());
    REQUIRE(json["capabilities"].empty());
}

TEST_CASE("InitializeResult deserialization", "[mcp][types]") {
    Json json = {
        {"protocolVersion", "2024-11-05"},
        {"capabilities", {{"tools", {{"listChanged", true}}}, {"logging", Json::object()}}},
        {"serverInfo", {{"name", "echo_server"}, {"version", "1.0.0"}}},
        {"instructions", "Echoes text."}
    };

    auto result = InitializeResult::from_json(json);

    REQUIRE(result.protocol_version == "2024-11-05");
    REQUIRE(result.server_info.name == "echo_server");
    REQUIRE(result.capabilities.tools.has_value());
    REQUIRE(result.capabilities.tools->list_changed);
    REQUIRE_FALSE(result.capabilities.resources.has_value());
    REQUIRE(result.capabilities.logging);
    REQUIRE_FALSE(result.capabilities.prompts);
    REQUIRE(result.instructions == "Echoes text.");
}

TEST_CASE("ServerCapabilities ignores non-object input", "[mcp][types]") {
    auto caps = ServerCapabilities::from_json(Json("nope"));
    REQUIRE_FALSE(caps.tools.has_value());
    REQUIRE_FALSE(caps.resources.has_value());
}

// ═══════════════════════════════════════════════════════════════════════════
// Tools
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Tool deserialization", "[mcp][types]") {
    Json json = {
        {"name", "run_command"},
        {"description", "Execute a shell command"},
        {"inputSchema", {{"type", "object"}, {"required", {"command"}}}}
    };

    auto tool = Tool::from_json(json);

    REQUIRE(tool.name == "run_command");
    REQUIRE(tool.description == "Execute a shell command");
    REQUIRE(tool.input_schema["required"][0] == "command");
}

TEST_CASE("Tool serialization supplies a default schema", "[mcp][types]") {
    Tool tool{"noop", std::nullopt, Json()};
    auto json = tool.to_json();

    REQUIRE(json["name"] == "noop");
    REQUIRE_FALSE(json.contains("description"));
    REQUIRE(json["inputSchema"]["type"] == "object");
}

TEST_CASE("ListToolsResult reads nextCursor and skips junk entries", "[mcp][types]") {
    Json json = {
        {"tools", {{{"name", "a"}}, 42, {{"name", "b"}}}},
        {"nextCursor", "2"}
    };

    auto result = ListToolsResult::from_json(json);

    REQUIRE(result.tools.size() == 2);
    REQUIRE(result.tools[0].name == "a");
    REQUIRE(result.tools[1].name == "b");
    REQUIRE(result.next_cursor == "2");
}

TEST_CASE("CallToolParams defaults arguments to an object", "[mcp][types]") {
    auto params = CallToolParams::from_json({{"name", "echo_tool"}});
    REQUIRE(params.name == "echo_tool");
    REQUIRE(params.arguments.is_object());
    REQUIRE(params.arguments.empty());
}

// ═══════════════════════════════════════════════════════════════════════════
// Content
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("CallToolResult keeps every content block in order", "[mcp][types]") {
    Json json = {
        {"content", {
            {{"type", "text"}, {"text", "first"}},
            {{"type", "image"}, {"data", "aGk="}, {"mimeType", "image/png"}},
            {{"type", "hologram"}},
            {{"type", "text"}, {"text", "second"}}
        }}
    };

    auto result = CallToolResult::from_json(json);

    REQUIRE_FALSE(result.is_error);
    REQUIRE(result.content.size() == 4);
    REQUIRE(std::holds_alternative<ImageContent>(result.content[1]));
    REQUIRE(std::holds_alternative<OtherContent>(result.content[2]));
    REQUIRE(result.texts() == std::vector<std::string>{"first", "second"});
}

TEST_CASE("Unrecognized content blocks survive a round trip", "[mcp][types]") {
    const Json link = {
        {"type", "resource_link"},
        {"uri", "file:///tmp/report.csv"},
        {"name", "report"},
        {"annotations", {{"priority", 0.5}}}
    };
    const Json payload = {{"content", Json::array({link})}, {"isError", true}};

    auto result = CallToolResult::from_json(payload);

    REQUIRE(result.is_error);
    REQUIRE(result.content.size() == 1);
    const auto* other = std::get_if<OtherContent>(&result.content[0]);
    REQUIRE(other != nullptr);
    REQUIRE(other->type() == "resource_link");
    REQUIRE(result.texts().empty());

    REQUIRE(result.to_json() == payload);
}

TEST_CASE("CallToolResult carries isError", "[mcp][types]") {
    auto result = CallToolResult::from_json({
        {"content", {{{"type", "text"}, {"text", "boom"}}}},
        {"isError", true}
    });
    REQUIRE(result.is_error);
    REQUIRE(result.texts().front() == "boom");

    auto json = CallToolResult::text("boom", true).to_json();
    REQUIRE(json["isError"] == true);
    REQUIRE(json["content"][0]["type"] == "text");

    REQUIRE_FALSE(CallToolResult::text("fine").to_json().contains("isError"));
}

TEST_CASE("EmbeddedResource round trip", "[mcp][types]") {
    EmbeddedResource res{"file:///tmp/a.txt", "text/plain", "hello", std::nullopt};
    auto parsed = EmbeddedResource::from_json(res.to_json());

    REQUIRE(parsed.uri == "file:///tmp/a.txt");
    REQUIRE(parsed.mime_type == "text/plain");
    REQUIRE(parsed.text == "hello");
    REQUIRE_FALSE(parsed.blob.has_value());
}

// ═══════════════════════════════════════════════════════════════════════════
// Resources
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("ListResourcesResult deserialization", "[mcp][types]") {
    Json json = {
        {"resources", {{
            {"uri", "echo://status"},
            {"name", "status"},
            {"description", "Connection status"},
            {"mimeType", "text/plain"}
        }}}
    };

    auto result = ListResourcesResult::from_json(json);

    REQUIRE(result.resources.size() == 1);
    REQUIRE(result.resources[0].uri == "echo://status");
    REQUIRE(result.resources[0].mime_type == "text/plain");
    REQUIRE_FALSE(result.next_cursor.has_value());
}

TEST_CASE("ReadResourceResult deserialization", "[mcp][types]") {
    Json json = {
        {"contents", {{{"uri", "echo://status"}, {"text", "Successfully connected to Echo Server"}}}}
    };

    auto result = ReadResourceResult::from_json(json);

    REQUIRE(result.contents.size() == 1);
    REQUIRE(result.contents[0].text == "Successfully connected to Echo Server");
    REQUIRE_FALSE(result.contents[0].blob.has_value());
}

// ═══════════════════════════════════════════════════════════════════════════
// Errors
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("McpError deserialization", "[mcp][types]") {
    auto err = McpError::from_json({{"code", -32602}, {"message", "Unknown tool: x"}, {"data", {{"tool", "x"}}}});
    REQUIRE(err.code == -32602);
    REQUIRE(err.message == "Unknown tool: x");
    REQUIRE(err.data->at("tool") == "x");

    auto loose = McpError::from_json(Json("just a string"));
    REQUIRE(loose.code == 0);
    REQUIRE(loose.message == "just a string");
}
