#include <catch2/catch_test_macros.hpp>
#include <nlohmann/json.hpp>

#include "mcpmux/protocol/json_rpc.hpp"

using json = nlohmann::json;

// ─────────────────────────────────────────────────────────────────────────────
// Requests
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("JsonRpcRequest serializes ids and params deterministically", "[json-rpc][request]") {
    auto params = json::object({{"name", "echo_tool"}, {"arguments", {{"text", "hi"}}}});
    mcpmux::JsonRpcRequest request{"tools/call", std::int64_t{42}, params};

    auto j = request.to_json();

    REQUIRE(j["jsonrpc"] == "2.0");
    REQUIRE(j["method"] == "tools/call");
    REQUIRE(j["id"] == 42);
    REQUIRE(j["params"] == params);
}

TEST_CASE("JsonRpcRequest omits params when not provided", "[json-rpc][request]") {
    mcpmux::JsonRpcRequest request{"ping", std::int64_t{7}};
    auto j = request.to_json();

    REQUIRE(j["method"] == "ping");
    REQUIRE_FALSE(j.contains("params"));
}

TEST_CASE("JsonRpcRequest parses string ids", "[json-rpc][request]") {
    json payload = {
        {"jsonrpc", "2.0"},
        {"method", "initialize"},
        {"id", "req-001"},
        {"params", {{"protocolVersion", "2024-11-05"}}}
    };

    auto parsed = mcpmux::JsonRpcRequest::from_json(payload);
    REQUIRE(parsed.has_value());
    REQUIRE(parsed->method() == "initialize");
    REQUIRE(parsed->id() == mcpmux::JsonRpcId::string("req-001"));
    REQUIRE(parsed->params().has_value());
    REQUIRE(parsed->params()->at("protocolVersion") == "2024-11-05");
}

TEST_CASE("JsonRpcRequest parsing surfaces detailed errors", "[json-rpc][request][error]") {
    using Code = mcpmux::JsonError::Code;

    auto bad_version = mcpmux::JsonRpcRequest::from_json(
        {{"jsonrpc", "1.0"}, {"method", "tools/list"}, {"id", 1}});
    REQUIRE_FALSE(bad_version.has_value());
    REQUIRE(bad_version.error().code == Code::InvalidVersion);

    auto no_version = mcpmux::JsonRpcRequest::from_json({{"method", "tools/list"}, {"id", 1}});
    REQUIRE_FALSE(no_version.has_value());
    REQUIRE(no_version.error().code == Code::MissingField);

    auto no_method = mcpmux::JsonRpcRequest::from_json({{"jsonrpc", "2.0"}, {"id", 1}});
    REQUIRE_FALSE(no_method.has_value());
    REQUIRE(no_method.error().code == Code::MissingField);

    auto numeric_method = mcpmux::JsonRpcRequest::from_json(
        {{"jsonrpc", "2.0"}, {"method", 5}, {"id", 1}});
    REQUIRE_FALSE(numeric_method.has_value());
    REQUIRE(numeric_method.error().code == Code::InvalidParams);

    auto float_id = mcpmux::JsonRpcRequest::from_json(
        {{"jsonrpc", "2.0"}, {"method", "ping"}, {"id", 1.5}});
    REQUIRE_FALSE(float_id.has_value());
    REQUIRE(float_id.error().code == Code::InvalidId);

    auto scalar_params = mcpmux::JsonRpcRequest::from_json(
        {{"jsonrpc", "2.0"}, {"method", "ping"}, {"id", 1}, {"params", "oops"}});
    REQUIRE_FALSE(scalar_params.has_value());
    REQUIRE(scalar_params.error().code == Code::InvalidParams);

    auto not_object = mcpmux::JsonRpcRequest::from_json(json::array());
    REQUIRE_FALSE(not_object.has_value());
}

// ─────────────────────────────────────────────────────────────────────────────
// Notifications
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("JsonRpcNotification omits id and params when not provided", "[json-rpc][notification]") {
    mcpmux::JsonRpcNotification notification{"notifications/initialized"};
    auto j = notification.to_json();

    REQUIRE(j["jsonrpc"] == "2.0");
    REQUIRE(j["method"] == "notifications/initialized");
    REQUIRE_FALSE(j.contains("id"));
    REQUIRE_FALSE(j.contains("params"));
}

TEST_CASE("JsonRpcNotification parses params", "[json-rpc][notification]") {
    auto parsed = mcpmux::JsonRpcNotification::from_json(
        {{"jsonrpc", "2.0"}, {"method", "notifications/message"}, {"params", {{"level", "info"}}}});
    REQUIRE(parsed.has_value());
    REQUIRE(parsed->method() == "notifications/message");
    REQUIRE(parsed->params()->at("level") == "info");
}

// ─────────────────────────────────────────────────────────────────────────────
// Responses
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("JsonRpcResponse success serializes result", "[json-rpc][response]") {
    auto response = mcpmux::JsonRpcResponse::success(mcpmux::JsonRpcId::integer(3), {{"tools", json::array()}});
    auto j = response.to_json();

    REQUIRE(j["jsonrpc"] == "2.0");
    REQUIRE(j["id"] == 3);
    REQUIRE(j["result"]["tools"].is_array());
    REQUIRE_FALSE(j.contains("error"));
}

TEST_CASE("JsonRpcResponse failure without id serializes null id", "[json-rpc][response]") {
    auto response = mcpmux::JsonRpcResponse::failure(
        std::nullopt, {mcpmux::ErrorCode::ParseError, "Parse error", std::nullopt});
    auto j = response.to_json();

    REQUIRE(j["id"].is_null());
    REQUIRE(j["error"]["code"] == -32700);
    REQUIRE(j["error"]["message"] == "Parse error");
    REQUIRE_FALSE(j["error"].contains("data"));
    REQUIRE_FALSE(j.contains("result"));
}

TEST_CASE("JsonRpcResponse parses errors with data", "[json-rpc][response]") {
    json payload = {
        {"jsonrpc", "2.0"},
        {"id", "abc"},
        {"error", {{"code", -32002}, {"message", "Resource not found"}, {"data", {{"uri", "x://y"}}}}}
    };

    auto parsed = mcpmux::JsonRpcResponse::from_json(payload);
    REQUIRE(parsed.has_value());
    REQUIRE(parsed->is_error());
    REQUIRE(parsed->id() == mcpmux::JsonRpcId::string("abc"));
    REQUIRE(parsed->error().code == -32002);
    REQUIRE(parsed->error().message == "Resource not found");
    REQUIRE(parsed->error().data->at("uri") == "x://y");
}

TEST_CASE("JsonRpcResponse tolerates malformed error objects", "[json-rpc][response]") {
    auto parsed = mcpmux::JsonRpcResponse::from_json(
        {{"jsonrpc", "2.0"}, {"id", 1}, {"error", "plain text"}});
    REQUIRE(parsed.has_value());
    REQUIRE(parsed->is_error());
    REQUIRE(parsed->error().code == mcpmux::ErrorCode::InternalError);
    REQUIRE(parsed->error().message == "plain text");
}

TEST_CASE("JsonRpcResponse requires result or error", "[json-rpc][response][error]") {
    auto parsed = mcpmux::JsonRpcResponse::from_json({{"jsonrpc", "2.0"}, {"id", 1}});
    REQUIRE_FALSE(parsed.has_value());
    REQUIRE(parsed.error().code == mcpmux::JsonError::Code::MissingField);
}

// ─────────────────────────────────────────────────────────────────────────────
// Classification
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("classify_message distinguishes message kinds", "[json-rpc][classify]") {
    using mcpmux::MessageKind;
    using mcpmux::classify_message;

    REQUIRE(classify_message({{"jsonrpc", "2.0"}, {"id", 1}, {"method", "ping"}}) == MessageKind::Request);
    REQUIRE(classify_message({{"jsonrpc", "2.0"}, {"method", "notifications/progress"}}) == MessageKind::Notification);
    REQUIRE(classify_message({{"jsonrpc", "2.0"}, {"id", nullptr}, {"method", "x"}}) == MessageKind::Notification);
    REQUIRE(classify_message({{"jsonrpc", "2.0"}, {"id", 1}, {"result", json::object()}}) == MessageKind::Response);
    REQUIRE(classify_message({{"jsonrpc", "2.0"}, {"id", nullptr}, {"error", {{"code", -32700}}}}) == MessageKind::Response);
    REQUIRE(classify_message({{"jsonrpc", "2.0"}, {"id", 1}}) == MessageKind::Invalid);
    REQUIRE(classify_message(json::array({1, 2})) == MessageKind::Invalid);
    REQUIRE(classify_message("string") == MessageKind::Invalid);
}
