#include <mcp_fleet/core/result.hpp>

#include <nlohmann/json.hpp>

#include <sstream>

namespace mcp_fleet {

Error Error::Make(ErrorCategory category,
                  std::string operation,
                  std::string backend,
                  std::string message,
                  std::optional<std::string> detail) {
    return Error{std::move(operation), std::move(backend), std::move(message),
                 std::move(detail), category};
}

int Error::HttpStatus() const {
    switch (category) {
        case ErrorCategory::ProcessStartFailure: return 502;
        case ErrorCategory::SendFailure:         return 502;
        case ErrorCategory::ResponseTimeout:     return 504;
        case ErrorCategory::ProtocolParseError:  return 502;
        case ErrorCategory::BackendNotFound:     return 404;
        case ErrorCategory::ToolNotFound:        return 404;
        case ErrorCategory::CircuitOpen:         return 503;
        case ErrorCategory::SessionNotFound:     return 404;
        case ErrorCategory::BackendError:        return 502;
        case ErrorCategory::Unauthorized:        return 401;
        case ErrorCategory::InvalidRequest:      return 400;
        case ErrorCategory::Overloaded:          return 503;
        case ErrorCategory::Config:              return 500;
        case ErrorCategory::Internal:            return 500;
    }
    return 500;
}

int Error::ExitCode() const {
    switch (category) {
        case ErrorCategory::Config:              return 2;
        case ErrorCategory::ProcessStartFailure: return 3;
        case ErrorCategory::Unauthorized:        return 4;
        case ErrorCategory::InvalidRequest:      return 2;
        default:                                 return 1;
    }
}

std::string Error::CategoryName() const {
    switch (category) {
        case ErrorCategory::ProcessStartFailure: return "process_start_failure";
        case ErrorCategory::SendFailure:         return "send_failure";
        case ErrorCategory::ResponseTimeout:     return "response_timeout";
        case ErrorCategory::ProtocolParseError:  return "protocol_parse_error";
        case ErrorCategory::BackendNotFound:     return "backend_not_found";
        case ErrorCategory::ToolNotFound:        return "tool_not_found";
        case ErrorCategory::CircuitOpen:         return "circuit_open";
        case ErrorCategory::SessionNotFound:     return "session_not_found";
        case ErrorCategory::BackendError:        return "backend_error";
        case ErrorCategory::Unauthorized:        return "unauthorized";
        case ErrorCategory::InvalidRequest:      return "invalid_request";
        case ErrorCategory::Overloaded:          return "overloaded";
        case ErrorCategory::Config:              return "config";
        case ErrorCategory::Internal:            return "internal";
    }
    return "internal";
}

std::string Error::ToString() const {
    std::ostringstream oss;
    oss << operation;
    if (!backend.empty()) {
        oss << " [" << backend << "]";
    }
    oss << ": " << message;
    if (detail.has_value() && !detail->empty()) {
        oss << " (" << *detail << ")";
    }
    return oss.str();
}

nlohmann::json Error::ToJsonValue() const {
    nlohmann::json body = {
        {"category", CategoryName()},
        {"operation", operation},
        {"message", message},
    };
    if (!backend.empty()) {
        body["backend"] = backend;
    }
    if (detail.has_value() && !detail->empty()) {
        body["detail"] = *detail;
    }
    return nlohmann::json{{"error", std::move(body)}};
}

std::string Error::ToJson() const {
    // detail may carry raw backend stderr, which is not guaranteed UTF-8.
    return ToJsonValue().dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // namespace mcp_fleet
