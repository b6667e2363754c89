#include <mcp_fleet/protocol/jsonrpc.hpp>

namespace mcp_fleet {
namespace protocol {

namespace {

template <class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

Error MakeParseError(const std::string& message) {
    return Error::Make(ErrorCategory::ProtocolParseError, "Decode", "", message);
}

bool IsValidId(const nlohmann::json& id) {
    return id.is_string() || id.is_number_integer() || id.is_number_unsigned() ||
           id.is_number_float();
}

nlohmann::json ParamsOrNull(const nlohmann::json& value) {
    auto it = value.find("params");
    if (it == value.end()) {
        return nullptr;
    }
    return *it;
}

} // anonymous namespace

Result<Message, Error> Decode(std::string_view text) {
    nlohmann::json value;
    try {
        value = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        return Result<Message, Error>::Err(MakeParseError(
            std::string("invalid JSON: ") + e.what()));
    }
    return FromJson(value);
}

Result<Message, Error> FromJson(const nlohmann::json& value) {
    if (value.is_array()) {
        return Result<Message, Error>::Err(MakeParseError("batch messages are not supported"));
    }
    if (!value.is_object()) {
        return Result<Message, Error>::Err(MakeParseError("message is not a JSON object"));
    }
    auto version = value.find("jsonrpc");
    if (version == value.end() || !version->is_string() || *version != "2.0") {
        return Result<Message, Error>::Err(MakeParseError("missing jsonrpc \"2.0\" marker"));
    }

    auto method = value.find("method");
    auto id = value.find("id");

    if (method != value.end()) {
        if (!method->is_string() || method->get<std::string>().empty()) {
            return Result<Message, Error>::Err(MakeParseError("method must be a non-empty string"));
        }
        auto params = ParamsOrNull(value);
        if (!params.is_null() && !params.is_object() && !params.is_array()) {
            return Result<Message, Error>::Err(MakeParseError("params must be object or array"));
        }
        if (id == value.end()) {
            return Result<Message, Error>::Ok(
                Notification{method->get<std::string>(), std::move(params)});
        }
        if (!IsValidId(*id)) {
            return Result<Message, Error>::Err(MakeParseError("request id must be string or number"));
        }
        return Result<Message, Error>::Ok(
            Request{*id, method->get<std::string>(), std::move(params)});
    }

    auto error = value.find("error");
    if (error != value.end()) {
        if (!error->is_object()) {
            return Result<Message, Error>::Err(MakeParseError("error must be an object"));
        }
        ErrorResponse response;
        response.id = (id != value.end()) ? *id : nlohmann::json(nullptr);
        if (!response.id.is_null() && !IsValidId(response.id)) {
            return Result<Message, Error>::Err(MakeParseError("response id must be string or number"));
        }
        auto code = error->find("code");
        if (code != error->end() && code->is_number_integer()) {
            response.code = code->get<int>();
        }
        auto message = error->find("message");
        if (message != error->end() && message->is_string()) {
            response.message = message->get<std::string>();
        }
        auto data = error->find("data");
        if (data != error->end()) {
            response.data = *data;
        }
        return Result<Message, Error>::Ok(std::move(response));
    }

    auto result = value.find("result");
    if (result != value.end()) {
        if (id == value.end() || !IsValidId(*id)) {
            return Result<Message, Error>::Err(MakeParseError("response without a valid id"));
        }
        return Result<Message, Error>::Ok(Response{*id, *result});
    }

    return Result<Message, Error>::Err(
        MakeParseError("object is neither request, notification nor response"));
}

nlohmann::json ToJson(const Message& message) {
    return std::visit(Overloaded{
        [](const Request& m) {
            nlohmann::json j = {{"jsonrpc", "2.0"}, {"id", m.id}, {"method", m.method}};
            if (!m.params.is_null()) j["params"] = m.params;
            return j;
        },
        [](const Notification& m) {
            nlohmann::json j = {{"jsonrpc", "2.0"}, {"method", m.method}};
            if (!m.params.is_null()) j["params"] = m.params;
            return j;
        },
        [](const Response& m) {
            return nlohmann::json{{"jsonrpc", "2.0"}, {"id", m.id}, {"result", m.result}};
        },
        [](const ErrorResponse& m) {
            nlohmann::json error = {{"code", m.code}, {"message", m.message}};
            if (!m.data.is_null()) error["data"] = m.data;
            return nlohmann::json{{"jsonrpc", "2.0"}, {"id", m.id}, {"error", error}};
        },
    }, message);
}

std::string Encode(const Message& message) {
    // dump() never emits raw newlines, so one message is one line.
    return ToJson(message).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::string IdKey(const nlohmann::json& id) {
    return id.dump();
}

std::optional<std::string> IdKeyOf(const Message& message) {
    return std::visit(Overloaded{
        [](const Request& m) -> std::optional<std::string> { return IdKey(m.id); },
        [](const Notification&) -> std::optional<std::string> { return std::nullopt; },
        [](const Response& m) -> std::optional<std::string> { return IdKey(m.id); },
        [](const ErrorResponse& m) -> std::optional<std::string> {
            if (m.id.is_null()) return std::nullopt;
            return IdKey(m.id);
        },
    }, message);
}

std::optional<std::string> MethodOf(const Message& message) {
    if (const auto* request = std::get_if<Request>(&message)) {
        return request->method;
    }
    if (const auto* notification = std::get_if<Notification>(&message)) {
        return notification->method;
    }
    return std::nullopt;
}

bool IsRequest(const Message& message) {
    return std::holds_alternative<Request>(message);
}

bool IsNotification(const Message& message) {
    return std::holds_alternative<Notification>(message);
}

bool IsReply(const Message& message) {
    return std::holds_alternative<Response>(message) ||
           std::holds_alternative<ErrorResponse>(message);
}

} // namespace protocol
} // namespace mcp_fleet
