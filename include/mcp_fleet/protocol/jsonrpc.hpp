#pragma once

#include <mcp_fleet/core/result.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include <nlohmann/json.hpp>

namespace mcp_fleet {
namespace protocol {

// JSON-RPC 2.0 error codes used by the gateway.
constexpr int kParseError = -32700;
constexpr int kInvalidRequest = -32600;
constexpr int kMethodNotFound = -32601;
constexpr int kInvalidParams = -32602;
constexpr int kInternalError = -32603;
constexpr int kServerError = -32000;

// ---------------------------------------------------------------------------
// Message kinds. A line is decoded into exactly one of these at the
// transport boundary; nothing downstream inspects raw JSON maps.
// ---------------------------------------------------------------------------
struct Request {
    nlohmann::json id;       // string or number
    std::string method;
    nlohmann::json params;   // null when absent
};

struct Notification {
    std::string method;
    nlohmann::json params;
};

struct Response {
    nlohmann::json id;
    nlohmann::json result;
};

struct ErrorResponse {
    nlohmann::json id;       // null when the peer could not determine it
    int code = kInternalError;
    std::string message;
    nlohmann::json data;
};

using Message = std::variant<Request, Notification, Response, ErrorResponse>;

/// Decode one line of text. Rejects non-JSON, batches and non-2.0 objects.
[[nodiscard]] Result<Message, Error> Decode(std::string_view text);

/// Decode an already-parsed JSON value.
[[nodiscard]] Result<Message, Error> FromJson(const nlohmann::json& value);

[[nodiscard]] nlohmann::json ToJson(const Message& message);

/// Single-line encoding without the trailing newline.
[[nodiscard]] std::string Encode(const Message& message);

/// Stable correlation key for an id value ("42" and 42 differ).
[[nodiscard]] std::string IdKey(const nlohmann::json& id);

/// Correlation key of a request or (error) response; nullopt otherwise.
[[nodiscard]] std::optional<std::string> IdKeyOf(const Message& message);

/// Method name of a request or notification.
[[nodiscard]] std::optional<std::string> MethodOf(const Message& message);

[[nodiscard]] bool IsRequest(const Message& message);
[[nodiscard]] bool IsNotification(const Message& message);
[[nodiscard]] bool IsReply(const Message& message);

inline Message MakeRequest(nlohmann::json id, std::string method,
                           nlohmann::json params = nullptr) {
    return Request{std::move(id), std::move(method), std::move(params)};
}

inline Message MakeNotification(std::string method, nlohmann::json params = nullptr) {
    return Notification{std::move(method), std::move(params)};
}

inline Message MakeResponse(nlohmann::json id, nlohmann::json result) {
    return Response{std::move(id), std::move(result)};
}

inline Message MakeErrorResponse(nlohmann::json id, int code, std::string message,
                                 nlohmann::json data = nullptr) {
    return ErrorResponse{std::move(id), code, std::move(message), std::move(data)};
}

} // namespace protocol
} // namespace mcp_fleet
