#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <variant>

#include <tl/expected.hpp>

namespace mcpmux {

using Json = nlohmann::json;

inline constexpr const char* kJsonRpcVersion = "2.0";

// Standard JSON-RPC error codes
namespace ErrorCode {
    inline constexpr int ParseError = -32700;
    inline constexpr int InvalidRequest = -32600;
    inline constexpr int MethodNotFound = -32601;
    inline constexpr int InvalidParams = -32602;
    inline constexpr int InternalError = -32603;
}

struct JsonError {
    enum class Code {
        InvalidVersion,
        MissingField,
        InvalidId,
        InvalidParams,
        Internal
    };

    Code code{Code::Internal};
    std::string message;
};

template <typename T>
using JsonResult = tl::expected<T, JsonError>;

struct JsonRpcId {
    std::variant<std::int64_t, std::string> value;

    static JsonRpcId integer(std::int64_t v);
    static JsonRpcId string(std::string v);

    [[nodiscard]] Json to_json() const;
    static JsonResult<JsonRpcId> from_json(const Json& node);

    friend bool operator==(const JsonRpcId&, const JsonRpcId&) = default;
};

/// What a decoded line on the wire turned out to be
enum class MessageKind {
    Request,       // method + id
    Notification,  // method, no id
    Response,      // id + (result | error)
    Invalid
};

[[nodiscard]] MessageKind classify_message(const Json& message) noexcept;

// ─────────────────────────────────────────────────────────────────────────────
// Requests and notifications
// ─────────────────────────────────────────────────────────────────────────────

class JsonRpcRequest {
public:
    JsonRpcRequest(std::string method, std::int64_t id, std::optional<Json> params = std::nullopt);
    JsonRpcRequest(std::string method, JsonRpcId id, std::optional<Json> params = std::nullopt);

    [[nodiscard]] const std::string& method() const noexcept;
    [[nodiscard]] const JsonRpcId& id() const noexcept;
    [[nodiscard]] const std::optional<Json>& params() const noexcept;

    [[nodiscard]] Json to_json() const;
    static JsonResult<JsonRpcRequest> from_json(const Json& payload);

private:
    std::string method_;
    JsonRpcId id_;
    std::optional<Json> params_;
};

class JsonRpcNotification {
public:
    explicit JsonRpcNotification(std::string method, std::optional<Json> params = std::nullopt);

    [[nodiscard]] const std::string& method() const noexcept;
    [[nodiscard]] const std::optional<Json>& params() const noexcept;

    [[nodiscard]] Json to_json() const;
    static JsonResult<JsonRpcNotification> from_json(const Json& payload);

private:
    std::string method_;
    std::optional<Json> params_;
};

// ─────────────────────────────────────────────────────────────────────────────
// Responses
// ─────────────────────────────────────────────────────────────────────────────

struct JsonRpcError {
    std::int64_t code{};
    std::string message;
    std::optional<Json> data{};

    [[nodiscard]] Json to_json() const;
    static JsonRpcError from_json(const Json& node);
};

class JsonRpcResponse {
public:
    static JsonRpcResponse success(std::optional<JsonRpcId> id, Json result);
    static JsonRpcResponse failure(std::optional<JsonRpcId> id, JsonRpcError error);

    /// id is nullopt only for errors answering an unparsable request
    [[nodiscard]] const std::optional<JsonRpcId>& id() const noexcept;
    [[nodiscard]] bool is_error() const noexcept;
    [[nodiscard]] const Json& result() const noexcept;
    [[nodiscard]] const JsonRpcError& error() const noexcept;

    [[nodiscard]] Json to_json() const;
    static JsonResult<JsonRpcResponse> from_json(const Json& payload);

private:
    JsonRpcResponse() = default;

    std::optional<JsonRpcId> id_;
    Json result_;
    std::optional<JsonRpcError> error_;
};

}  // namespace mcpmux
