#ifndef MCPMUX_PROTOCOL_MCP_TYPES_HPP
#define MCPMUX_PROTOCOL_MCP_TYPES_HPP

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace mcpmux {

using Json = nlohmann::json;

// ═══════════════════════════════════════════════════════════════════════════
// MCP Protocol Version
// ═══════════════════════════════════════════════════════════════════════════

inline constexpr const char* MCP_PROTOCOL_VERSION = "2024-11-05";

// ═══════════════════════════════════════════════════════════════════════════
// Client/Server Info
// ═══════════════════════════════════════════════════════════════════════════

struct Implementation {
    std::string name;
    std::string version;

    [[nodiscard]] Json to_json() const {
        return {{"name", name}, {"version", version}};
    }

    static Implementation from_json(const Json& j) {
        return {j.value("name", ""), j.value("version", "")};
    }
};

// ═══════════════════════════════════════════════════════════════════════════
// Capabilities
// ═══════════════════════════════════════════════════════════════════════════
// The manager only consumes tools and resources, so the client advertises
// nothing beyond the (optional) experimental block.

struct ClientCapabilities {
    Json experimental;

    [[nodiscard]] Json to_json() const {
        Json j = Json::object();
        if (!experimental.is_null() && !experimental.empty()) {
            j["experimental"] = experimental;
        }
        return j;
    }
};

struct ServerCapabilities {
    struct Tools {
        bool list_changed = false;
    };
    struct Resources {
        bool subscribe = false;
        bool list_changed = false;
    };

    std::optional<Tools> tools;
    std::optional<Resources> resources;
    bool prompts = false;
    bool logging = false;

    [[nodiscard]] Json to_json() const {
        Json j = Json::object();
        if (tools) {
            j["tools"] = {{"listChanged", tools->list_changed}};
        }
        if (resources) {
            j["resources"] = {
                {"subscribe", resources->subscribe},
                {"listChanged", resources->list_changed}
            };
        }
        if (prompts) {
            j["prompts"] = Json::object();
        }
        if (logging) {
            j["logging"] = Json::object();
        }
        return j;
    }

    static ServerCapabilities from_json(const Json& j) {
        ServerCapabilities caps;
        if (!j.is_object()) {
            return caps;
        }
        if (j.contains("tools") && j["tools"].is_object()) {
            caps.tools = Tools{j["tools"].value("listChanged", false)};
        }
        if (j.contains("resources") && j["resources"].is_object()) {
            caps.resources = Resources{
                j["resources"].value("subscribe", false),
                j["resources"].value("listChanged", false)
            };
        }
        caps.prompts = j.contains("prompts");
        caps.logging = j.contains("logging");
        return caps;
    }
};

// ═══════════════════════════════════════════════════════════════════════════
// Initialize Request/Response
// ═══════════════════════════════════════════════════════════════════════════

struct InitializeParams {
    std::string protocol_version = MCP_PROTOCOL_VERSION;
    ClientCapabilities capabilities;
    Implementation client_info;

    [[nodiscard]] Json to_json() const {
        return {
            {"protocolVersion", protocol_version},
            {"capabilities", capabilities.to_json()},
            {"clientInfo", client_info.to_json()}
        };
    }

    static InitializeParams from_json(const Json& j) {
        InitializeParams params;
        params.protocol_version = j.value("protocolVersion", "");
        if (j.contains("clientInfo") && j["clientInfo"].is_object()) {
            params.client_info = Implementation::from_json(j["clientInfo"]);
        }
        if (j.contains("capabilities") && j["capabilities"].is_object()) {
            params.capabilities.experimental = j["capabilities"].value("experimental", Json());
        }
        return params;
    }
};

struct InitializeResult {
    std::string protocol_version;
    ServerCapabilities capabilities;
    Implementation server_info;
    std::optional<std::string> instructions;

    [[nodiscard]] Json to_json() const {
        Json j = {
            {"protocolVersion", protocol_version},
            {"capabilities", capabilities.to_json()},
            {"serverInfo", server_info.to_json()}
        };
        if (instructions) {
            j["instructions"] = *instructions;
        }
        return j;
    }

    static InitializeResult from_json(const Json& j) {
        InitializeResult result;
        result.protocol_version = j.value("protocolVersion", "");
        if (j.contains("capabilities")) {
            result.capabilities = ServerCapabilities::from_json(j["capabilities"]);
        }
        if (j.contains("serverInfo") && j["serverInfo"].is_object()) {
            result.server_info = Implementation::from_json(j["serverInfo"]);
        }
        if (j.contains("instructions") && j["instructions"].is_string()) {
            result.instructions = j["instructions"].get<std::string>();
        }
        return result;
    }
};

// ═══════════════════════════════════════════════════════════════════════════
// Tools
// ═══════════════════════════════════════════════════════════════════════════

struct Tool {
    std::string name;
    std::optional<std::string> description;
    Json input_schema;  // JSON Schema for tool arguments

    static Tool from_json(const Json& j) {
        Tool tool;
        tool.name = j.value("name", "");
        if (j.contains("description") && j["description"].is_string()) {
            tool.description = j["description"].get<std::string>();
        }
        if (j.contains("inputSchema")) {
            tool.input_schema = j["inputSchema"];
        }
        return tool;
    }

    [[nodiscard]] Json to_json() const {
        Json j = {{"name", name}};
        if (description) {
            j["description"] = *description;
        }
        j["inputSchema"] = input_schema.is_null()
            ? Json{{"type", "object"}, {"properties", Json::object()}}
            : input_schema;
        return j;
    }
};

struct ListToolsResult {
    std::vector<Tool> tools;
    std::optional<std::string> next_cursor;

    static ListToolsResult from_json(const Json& j) {
        ListToolsResult result;
        if (j.contains("tools") && j["tools"].is_array()) {
            for (const auto& t : j["tools"]) {
                if (t.is_object()) {
                    result.tools.push_back(Tool::from_json(t));
                }
            }
        }
        if (j.contains("nextCursor") && j["nextCursor"].is_string()) {
            result.next_cursor = j["nextCursor"].get<std::string>();
        }
        return result;
    }

    [[nodiscard]] Json to_json() const {
        Json arr = Json::array();
        for (const auto& t : tools) {
            arr.push_back(t.to_json());
        }
        Json j = {{"tools", arr}};
        if (next_cursor) {
            j["nextCursor"] = *next_cursor;
        }
        return j;
    }
};

struct CallToolParams {
    std::string name;
    Json arguments = Json::object();

    [[nodiscard]] Json to_json() const {
        return {{"name", name}, {"arguments", arguments}};
    }

    static CallToolParams from_json(const Json& j) {
        CallToolParams params;
        params.name = j.value("name", "");
        if (j.contains("arguments") && j["arguments"].is_object()) {
            params.arguments = j["arguments"];
        }
        return params;
    }
};

// ═══════════════════════════════════════════════════════════════════════════
// Content Types
// ═══════════════════════════════════════════════════════════════════════════

struct TextContent {
    std::string text;

    static TextContent from_json(const Json& j) {
        return {j.value("text", "")};
    }

    [[nodiscard]] Json to_json() const {
        return {{"type", "text"}, {"text", text}};
    }
};

struct ImageContent {
    std::string data;  // Base64 encoded
    std::string mime_type;

    static ImageContent from_json(const Json& j) {
        return {j.value("data", ""), j.value("mimeType", "")};
    }

    [[nodiscard]] Json to_json() const {
        return {{"type", "image"}, {"data", data}, {"mimeType", mime_type}};
    }
};

struct AudioContent {
    std::string data;  // Base64 encoded
    std::string mime_type;

    static AudioContent from_json(const Json& j) {
        return {j.value("data", ""), j.value("mimeType", "")};
    }

    [[nodiscard]] Json to_json() const {
        return {{"type", "audio"}, {"data", data}, {"mimeType", mime_type}};
    }
};

struct EmbeddedResource {
    std::string uri;
    std::optional<std::string> mime_type;
    std::optional<std::string> text;
    std::optional<std::string> blob;  // Base64 encoded

    static EmbeddedResource from_json(const Json& j) {
        EmbeddedResource res;
        if (j.contains("resource") && j["resource"].is_object()) {
            const auto& r = j["resource"];
            res.uri = r.value("uri", "");
            if (r.contains("mimeType")) res.mime_type = r["mimeType"].get<std::string>();
            if (r.contains("text")) res.text = r["text"].get<std::string>();
            if (r.contains("blob")) res.blob = r["blob"].get<std::string>();
        }
        return res;
    }

    [[nodiscard]] Json to_json() const {
        Json r = {{"uri", uri}};
        if (mime_type) r["mimeType"] = *mime_type;
        if (text) r["text"] = *text;
        if (blob) r["blob"] = *blob;
        return {{"type", "resource"}, {"resource", r}};
    }
};

/// Any block type this client does not model (resource_link, newer media
/// types). Kept verbatim so it survives a round trip.
struct OtherContent {
    Json raw = Json::object();

    [[nodiscard]] std::string type() const {
        return raw.value("type", "");
    }

    static OtherContent from_json(const Json& j) {
        OtherContent block;
        block.raw = j;
        return block;
    }

    [[nodiscard]] Json to_json() const {
        return raw;
    }
};

using Content = std::variant<TextContent, ImageContent, AudioContent, EmbeddedResource, OtherContent>;

[[nodiscard]] inline Json content_to_json(const Content& content) {
    return std::visit([](const auto& block) { return block.to_json(); }, content);
}

[[nodiscard]] inline Content content_from_json(const Json& j) {
    const auto type = j.value("type", "");
    if (type == "text") return TextContent::from_json(j);
    if (type == "image") return ImageContent::from_json(j);
    if (type == "audio") return AudioContent::from_json(j);
    if (type == "resource") return EmbeddedResource::from_json(j);
    return OtherContent::from_json(j);
}

struct CallToolResult {
    std::vector<Content> content;
    bool is_error = false;

    static CallToolResult from_json(const Json& j) {
        CallToolResult result;
        result.is_error = j.value("isError", false);
        if (j.contains("content") && j["content"].is_array()) {
            for (const auto& c : j["content"]) {
                if (!c.is_object()) {
                    continue;
                }
                result.content.push_back(content_from_json(c));
            }
        }
        return result;
    }

    [[nodiscard]] Json to_json() const {
        Json arr = Json::array();
        for (const auto& c : content) {
            arr.push_back(content_to_json(c));
        }
        Json j = {{"content", arr}};
        if (is_error) {
            j["isError"] = true;
        }
        return j;
    }

    /// Text blocks only, in order
    [[nodiscard]] std::vector<std::string> texts() const {
        std::vector<std::string> out;
        for (const auto& c : content) {
            if (const auto* text = std::get_if<TextContent>(&c)) {
                out.push_back(text->text);
            }
        }
        return out;
    }

    static CallToolResult text(std::string value, bool error = false) {
        CallToolResult result;
        result.content.push_back(TextContent{std::move(value)});
        result.is_error = error;
        return result;
    }
};

// ═══════════════════════════════════════════════════════════════════════════
// Resources
// ═══════════════════════════════════════════════════════════════════════════

struct Resource {
    std::string uri;
    std::string name;
    std::optional<std::string> description;
    std::optional<std::string> mime_type;

    static Resource from_json(const Json& j) {
        Resource res;
        res.uri = j.value("uri", "");
        res.name = j.value("name", "");
        if (j.contains("description") && j["description"].is_string()) {
            res.description = j["description"].get<std::string>();
        }
        if (j.contains("mimeType") && j["mimeType"].is_string()) {
            res.mime_type = j["mimeType"].get<std::string>();
        }
        return res;
    }

    [[nodiscard]] Json to_json() const {
        Json j = {{"uri", uri}, {"name", name}};
        if (description) j["description"] = *description;
        if (mime_type) j["mimeType"] = *mime_type;
        return j;
    }
};

struct ListResourcesResult {
    std::vector<Resource> resources;
    std::optional<std::string> next_cursor;

    static ListResourcesResult from_json(const Json& j) {
        ListResourcesResult result;
        if (j.contains("resources") && j["resources"].is_array()) {
            for (const auto& r : j["resources"]) {
                if (r.is_object()) {
                    result.resources.push_back(Resource::from_json(r));
                }
            }
        }
        if (j.contains("nextCursor") && j["nextCursor"].is_string()) {
            result.next_cursor = j["nextCursor"].get<std::string>();
        }
        return result;
    }

    [[nodiscard]] Json to_json() const {
        Json arr = Json::array();
        for (const auto& r : resources) {
            arr.push_back(r.to_json());
        }
        Json j = {{"resources", arr}};
        if (next_cursor) {
            j["nextCursor"] = *next_cursor;
        }
        return j;
    }
};

struct ResourceContents {
    std::string uri;
    std::optional<std::string> mime_type;
    std::optional<std::string> text;
    std::optional<std::string> blob;

    static ResourceContents from_json(const Json& j) {
        ResourceContents c;
        c.uri = j.value("uri", "");
        if (j.contains("mimeType") && j["mimeType"].is_string()) c.mime_type = j["mimeType"].get<std::string>();
        if (j.contains("text") && j["text"].is_string()) c.text = j["text"].get<std::string>();
        if (j.contains("blob") && j["blob"].is_string()) c.blob = j["blob"].get<std::string>();
        return c;
    }

    [[nodiscard]] Json to_json() const {
        Json j = {{"uri", uri}};
        if (mime_type) j["mimeType"] = *mime_type;
        if (text) j["text"] = *text;
        if (blob) j["blob"] = *blob;
        return j;
    }
};

struct ReadResourceResult {
    std::vector<ResourceContents> contents;

    static ReadResourceResult from_json(const Json& j) {
        ReadResourceResult result;
        if (j.contains("contents") && j["contents"].is_array()) {
            for (const auto& c : j["contents"]) {
                if (c.is_object()) {
                    result.contents.push_back(ResourceContents::from_json(c));
                }
            }
        }
        return result;
    }

    [[nodiscard]] Json to_json() const {
        Json arr = Json::array();
        for (const auto& c : contents) {
            arr.push_back(c.to_json());
        }
        return {{"contents", arr}};
    }
};

// ═══════════════════════════════════════════════════════════════════════════
// Errors
// ═══════════════════════════════════════════════════════════════════════════

/// Error payload as returned by a remote server
struct McpError {
    int code = 0;
    std::string message;
    std::optional<Json> data;

    static McpError from_json(const Json& j) {
        McpError err;
        if (!j.is_object()) {
            err.message = j.is_string() ? j.get<std::string>() : j.dump();
            return err;
        }
        err.code = j.contains("code") && j["code"].is_number_integer() ? j["code"].get<int>() : 0;
        err.message = j.contains("message") && j["message"].is_string()
            ? j["message"].get<std::string>()
            : std::string{};
        if (j.contains("data")) {
            err.data = j["data"];
        }
        return err;
    }

    [[nodiscard]] Json to_json() const {
        Json j = {{"code", code}, {"message", message}};
        if (data) j["data"] = *data;
        return j;
    }
};

}  // namespace mcpmux

#endif  // MCPMUX_PROTOCOL_MCP_TYPES_HPP
