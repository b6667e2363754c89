#pragma once

#include <cassert>
#include <cstddef>
#include <optional>
#include <ostream>
#include <string>
#include <utility>
#include <variant>

#include <nlohmann/json.hpp>

namespace mcp_fleet {

// ---------------------------------------------------------------------------
// ErrorCategory: failure taxonomy shared by every gateway component.
// ---------------------------------------------------------------------------
enum class ErrorCategory {
    ProcessStartFailure,
    SendFailure,
    ResponseTimeout,
    ProtocolParseError,
    BackendNotFound,
    ToolNotFound,
    CircuitOpen,
    SessionNotFound,
    BackendError,     // backend answered with a JSON-RPC error or an isError result
    Unauthorized,
    InvalidRequest,
    Overloaded,       // a transport is at its connection limit
    Config,
    Internal,
};

// ---------------------------------------------------------------------------
// Error: what failed, against which backend, and how a transport reports it.
// `backend` is empty for failures not scoped to one backend.
// ---------------------------------------------------------------------------
struct Error {
    std::string operation;
    std::string backend;
    std::string message;
    std::optional<std::string> detail;
    ErrorCategory category = ErrorCategory::Internal;

    static Error Make(ErrorCategory category,
                      std::string operation,
                      std::string backend,
                      std::string message,
                      std::optional<std::string> detail = std::nullopt);

    /// HTTP status a transport should answer with for this error.
    [[nodiscard]] int HttpStatus() const;

    [[nodiscard]] int ExitCode() const;

    /// snake_case tag, e.g. "circuit_open".
    [[nodiscard]] std::string CategoryName() const;

    [[nodiscard]] std::string ToString() const;

    /// {"error":{"category":..,"operation":..,"backend":..,"message":..,"detail":..}}
    [[nodiscard]] nlohmann::json ToJsonValue() const;

    /// ToJsonValue() serialized; invalid UTF-8 in the detail is replaced.
    [[nodiscard]] std::string ToJson() const;

    friend std::ostream& operator<<(std::ostream& os, const Error& e) {
        return os << e.ToString();
    }

    bool operator==(const Error& other) const {
        return category == other.category && operation == other.operation &&
               backend == other.backend && message == other.message &&
               detail == other.detail;
    }
};

// ---------------------------------------------------------------------------
// Result<T, E>: either the value of a fallible operation or its error.
// Accessing the wrong alternative is a programming error.
// ---------------------------------------------------------------------------
template <typename T, typename E = Error>
class Result {
public:
    static Result Ok(T value) { return Result(std::in_place_index<0>, std::move(value)); }
    static Result Err(E error) { return Result(std::in_place_index<1>, std::move(error)); }

    [[nodiscard]] bool IsOk() const noexcept { return state_.index() == 0; }
    [[nodiscard]] bool IsErr() const noexcept { return !IsOk(); }
    explicit operator bool() const noexcept { return IsOk(); }

    [[nodiscard]] const T& Value() const& {
        assert(IsOk());
        return std::get<0>(state_);
    }
    [[nodiscard]] T Value() && {
        assert(IsOk());
        return std::get<0>(std::move(state_));
    }

    [[nodiscard]] const E& Error() const& {
        assert(IsErr());
        return std::get<1>(state_);
    }
    [[nodiscard]] E Error() && {
        assert(IsErr());
        return std::get<1>(std::move(state_));
    }

private:
    template <std::size_t I, typename U>
    Result(std::in_place_index_t<I> which, U&& alternative)
        : state_(which, std::forward<U>(alternative)) {}

    std::variant<T, E> state_;
};

// Operations that either succeed with nothing to return or fail.
template <typename E>
class Result<void, E> {
public:
    static Result Ok() { return Result(std::nullopt); }
    static Result Err(E error) { return Result(std::move(error)); }

    [[nodiscard]] bool IsOk() const noexcept { return !error_; }
    [[nodiscard]] bool IsErr() const noexcept { return error_.has_value(); }
    explicit operator bool() const noexcept { return IsOk(); }

    [[nodiscard]] const E& Error() const& {
        assert(IsErr());
        return *error_;
    }
    [[nodiscard]] E Error() && {
        assert(IsErr());
        return std::move(*error_);
    }

private:
    explicit Result(std::optional<E> error) : error_(std::move(error)) {}

    std::optional<E> error_;
};

} // namespace mcp_fleet
