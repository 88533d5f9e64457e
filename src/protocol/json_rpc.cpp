#include "mcpmux/protocol/json_rpc.hpp"

namespace mcpmux {
namespace {

bool is_valid_params_type(const Json& node) {
    return node.is_object() || node.is_array();
}

JsonResult<void> check_version(const Json& payload) {
    if (payload.is_object() == false) {
        return tl::unexpected(JsonError{
            JsonError::Code::InvalidParams,
            "payload must be a JSON object"});
    }
    if (payload.contains("jsonrpc") == false) {
        return tl::unexpected(JsonError{
            JsonError::Code::MissingField,
            "missing jsonrpc version field"});
    }
    const Json& version_node = payload.at("jsonrpc");
    if ((version_node.is_string() == false) || (version_node != kJsonRpcVersion)) {
        return tl::unexpected(JsonError{
            JsonError::Code::InvalidVersion,
            "jsonrpc must equal \"2.0\""});
    }
    return {};
}

JsonResult<std::string> parse_method(const Json& payload) {
    if (payload.contains("method") == false) {
        return tl::unexpected(JsonError{
            JsonError::Code::MissingField,
            "missing method field"});
    }
    const Json& method_node = payload.at("method");
    if (method_node.is_string() == false) {
        return tl::unexpected(JsonError{
            JsonError::Code::InvalidParams,
            "method must be a string"});
    }
    return method_node.get<std::string>();
}

JsonResult<std::optional<Json>> parse_params(const Json& payload) {
    if (payload.contains("params") == false) {
        return std::optional<Json>{};
    }
    const Json& params_node = payload.at("params");
    if (is_valid_params_type(params_node) == false) {
        return tl::unexpected(JsonError{
            JsonError::Code::InvalidParams,
            "params must be an object or array"});
    }
    return std::optional<Json>{params_node};
}

bool has_id(const Json& message) {
    return message.contains("id") && (message.at("id").is_null() == false);
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// JsonRpcId
// ─────────────────────────────────────────────────────────────────────────────

JsonRpcId JsonRpcId::integer(std::int64_t value) {
    return JsonRpcId{value};
}

JsonRpcId JsonRpcId::string(std::string value) {
    return JsonRpcId{std::move(value)};
}

Json JsonRpcId::to_json() const {
    return std::visit([](const auto& v) { return Json(v); }, value);
}

JsonResult<JsonRpcId> JsonRpcId::from_json(const Json& node) {
    if (node.is_number_integer()) {
        return JsonRpcId::integer(node.get<std::int64_t>());
    }
    if (node.is_string()) {
        return JsonRpcId::string(node.get<std::string>());
    }
    return tl::unexpected(JsonError{
        JsonError::Code::InvalidId,
        "id must be an integer or string"});
}

MessageKind classify_message(const Json& message) noexcept {
    if (message.is_object() == false) {
        return MessageKind::Invalid;
    }
    const bool with_method = message.contains("method");
    const bool with_id = has_id(message);

    if (with_method && with_id) {
        return MessageKind::Request;
    }
    if (with_method) {
        return MessageKind::Notification;
    }
    if (message.contains("id") && (message.contains("result") || message.contains("error"))) {
        return MessageKind::Response;
    }
    return MessageKind::Invalid;
}

// ─────────────────────────────────────────────────────────────────────────────
// JsonRpcRequest
// ─────────────────────────────────────────────────────────────────────────────

JsonRpcRequest::JsonRpcRequest(std::string method,
                               std::int64_t id,
                               std::optional<Json> params)
    : JsonRpcRequest(std::move(method), JsonRpcId::integer(id), std::move(params)) {}

JsonRpcRequest::JsonRpcRequest(std::string method,
                               JsonRpcId id,
                               std::optional<Json> params)
    : method_(std::move(method)),
      id_(std::move(id)),
      params_(std::move(params)) {}

const std::string& JsonRpcRequest::method() const noexcept {
    return method_;
}

const JsonRpcId& JsonRpcRequest::id() const noexcept {
    return id_;
}

const std::optional<Json>& JsonRpcRequest::params() const noexcept {
    return params_;
}

Json JsonRpcRequest::to_json() const {
    Json payload = Json::object();
    payload["jsonrpc"] = kJsonRpcVersion;
    payload["id"] = id_.to_json();
    payload["method"] = method_;
    if (params_.has_value()) {
        payload["params"] = *params_;
    }
    return payload;
}

JsonResult<JsonRpcRequest> JsonRpcRequest::from_json(const Json& payload) {
    auto version = check_version(payload);
    if (!version) {
        return tl::unexpected(version.error());
    }

    auto method = parse_method(payload);
    if (!method) {
        return tl::unexpected(method.error());
    }

    if (payload.contains("id") == false) {
        return tl::unexpected(JsonError{
            JsonError::Code::InvalidId,
            "missing id field"});
    }
    auto id = JsonRpcId::from_json(payload.at("id"));
    if (!id) {
        return tl::unexpected(id.error());
    }

    auto params = parse_params(payload);
    if (!params) {
        return tl::unexpected(params.error());
    }

    return JsonRpcRequest(std::move(*method), std::move(*id), std::move(*params));
}

// ─────────────────────────────────────────────────────────────────────────────
// JsonRpcNotification
// ─────────────────────────────────────────────────────────────────────────────

JsonRpcNotification::JsonRpcNotification(std::string method,
                                         std::optional<Json> params)
    : method_(std::move(method)),
      params_(std::move(params)) {}

const std::string& JsonRpcNotification::method() const noexcept {
    return method_;
}

const std::optional<Json>& JsonRpcNotification::params() const noexcept {
    return params_;
}

Json JsonRpcNotification::to_json() const {
    Json payload = Json::object();
    payload["jsonrpc"] = kJsonRpcVersion;
    payload["method"] = method_;
    if (params_.has_value()) {
        payload["params"] = *params_;
    }
    return payload;
}

JsonResult<JsonRpcNotification> JsonRpcNotification::from_json(const Json& payload) {
    auto version = check_version(payload);
    if (!version) {
        return tl::unexpected(version.error());
    }
    auto method = parse_method(payload);
    if (!method) {
        return tl::unexpected(method.error());
    }
    auto params = parse_params(payload);
    if (!params) {
        return tl::unexpected(params.error());
    }
    return JsonRpcNotification(std::move(*method), std::move(*params));
}

// ─────────────────────────────────────────────────────────────────────────────
// JsonRpcError / JsonRpcResponse
// ─────────────────────────────────────────────────────────────────────────────

Json JsonRpcError::to_json() const {
    Json payload;
    payload["code"] = code;
    payload["message"] = message;
    if (data.has_value()) {
        payload["data"] = *data;
    }
    return payload;
}

JsonRpcError JsonRpcError::from_json(const Json& node) {
    JsonRpcError err;
    if (node.is_object() == false) {
        err.code = ErrorCode::InternalError;
        err.message = node.is_string() ? node.get<std::string>() : node.dump();
        return err;
    }
    err.code = node.contains("code") && node["code"].is_number_integer()
        ? node["code"].get<std::int64_t>()
        : ErrorCode::InternalError;
    err.message = node.contains("message") && node["message"].is_string()
        ? node["message"].get<std::string>()
        : std::string{};
    if (node.contains("data")) {
        err.data = node["data"];
    }
    return err;
}

JsonRpcResponse JsonRpcResponse::success(std::optional<JsonRpcId> id, Json result) {
    JsonRpcResponse response;
    response.id_ = std::move(id);
    response.result_ = std::move(result);
    return response;
}

JsonRpcResponse JsonRpcResponse::failure(std::optional<JsonRpcId> id, JsonRpcError error) {
    JsonRpcResponse response;
    response.id_ = std::move(id);
    response.error_ = std::move(error);
    return response;
}

const std::optional<JsonRpcId>& JsonRpcResponse::id() const noexcept {
    return id_;
}

bool JsonRpcResponse::is_error() const noexcept {
    return error_.has_value();
}

const Json& JsonRpcResponse::result() const noexcept {
    return result_;
}

const JsonRpcError& JsonRpcResponse::error() const noexcept {
    static const JsonRpcError kNoError{};
    return error_.has_value() ? *error_ : kNoError;
}

Json JsonRpcResponse::to_json() const {
    Json payload = Json::object();
    payload["jsonrpc"] = kJsonRpcVersion;
    payload["id"] = id_.has_value() ? id_->to_json() : Json(nullptr);
    if (error_.has_value()) {
        payload["error"] = error_->to_json();
    } else {
        payload["result"] = result_;
    }
    return payload;
}

JsonResult<JsonRpcResponse> JsonRpcResponse::from_json(const Json& payload) {
    auto version = check_version(payload);
    if (!version) {
        return tl::unexpected(version.error());
    }

    std::optional<JsonRpcId> id;
    if (has_id(payload)) {
        auto parsed = JsonRpcId::from_json(payload.at("id"));
        if (!parsed) {
            return tl::unexpected(parsed.error());
        }
        id = std::move(*parsed);
    }

    if (payload.contains("error")) {
        return failure(std::move(id), JsonRpcError::from_json(payload.at("error")));
    }
    if (payload.contains("result")) {
        return success(std::move(id), payload.at("result"));
    }
    return tl::unexpected(JsonError{
        JsonError::Code::MissingField,
        "response carries neither result nor error"});
}

}  // namespace mcpmux
