#pragma once

#include <cstddef>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

namespace toolhost {

/// Thrown when a Result is read on the wrong side (Value() of an error,
/// Error() of a success). Always a programming error in the caller.
class BadResultAccess : public std::logic_error {
public:
    explicit BadResultAccess(const char* what) : std::logic_error(what) {}
};

// ---------------------------------------------------------------------------
// Result<T, E>: either a T (success) or an E (failure). Every fallible
// operation in toolhost returns one; nothing below the CLI throws for
// expected failures.
//
//   auto r = loader.Load();
//   if (r.IsErr()) { LogError("loader", r.Error().ToString()); return; }
//   handle.Publish(std::move(r).Value());
// ---------------------------------------------------------------------------
template <typename T, typename E>
class Result {
    static constexpr std::size_t kValue = 0;
    static constexpr std::size_t kError = 1;

public:
    using value_type = T;
    using error_type = E;

    template <typename U = T>
    static Result Ok(U&& value) {
        return Result(std::in_place_index<kValue>, std::forward<U>(value));
    }

    template <typename G = E>
    static Result Err(G&& error) {
        return Result(std::in_place_index<kError>, std::forward<G>(error));
    }

    [[nodiscard]] bool IsOk() const noexcept { return state_.index() == kValue; }
    [[nodiscard]] bool IsErr() const noexcept { return state_.index() == kError; }
    explicit operator bool() const noexcept { return IsOk(); }

    [[nodiscard]] const T& Value() const& { return std::get<kValue>(Checked(kValue)); }
    [[nodiscard]] T Value() && { return std::get<kValue>(std::move(Checked(kValue))); }

    [[nodiscard]] const E& Error() const& { return std::get<kError>(Checked(kError)); }
    [[nodiscard]] E Error() && { return std::get<kError>(std::move(Checked(kError))); }

    [[nodiscard]] T ValueOr(T fallback) const& {
        if (IsErr()) {
            return fallback;
        }
        return std::get<kValue>(state_);
    }

    /// Continue with `fn(value)`, which returns another Result with the same
    /// error type. An error passes through untouched.
    template <typename Fn>
    auto AndThen(Fn&& fn) && -> std::invoke_result_t<Fn, T&&> {
        using Next = std::invoke_result_t<Fn, T&&>;
        if (IsErr()) {
            return Next::Err(std::get<kError>(std::move(state_)));
        }
        return std::forward<Fn>(fn)(std::get<kValue>(std::move(state_)));
    }

    template <typename Fn>
    auto Map(Fn&& fn) && -> Result<std::invoke_result_t<Fn, T&&>, E> {
        using Mapped = Result<std::invoke_result_t<Fn, T&&>, E>;
        if (IsErr()) {
            return Mapped::Err(std::get<kError>(std::move(state_)));
        }
        return Mapped::Ok(std::forward<Fn>(fn)(std::get<kValue>(std::move(state_))));
    }

    /// Rewrite the error, e.g. to add the operation that failed.
    template <typename Fn>
    Result MapError(Fn&& fn) && {
        if (IsOk()) {
            return std::move(*this);
        }
        return Err(std::forward<Fn>(fn)(std::get<kError>(std::move(state_))));
    }

private:
    template <std::size_t I, typename Arg>
    Result(std::in_place_index_t<I> side, Arg&& arg) : state_(side, std::forward<Arg>(arg)) {}

    const std::variant<T, E>& Checked(std::size_t side) const {
        if (state_.index() != side) {
            throw BadResultAccess(side == kValue ? "Value() called on a failed Result"
                                                 : "Error() called on a successful Result");
        }
        return state_;
    }

    std::variant<T, E>& Checked(std::size_t side) {
        static_cast<const Result&>(*this).Checked(side);
        return state_;
    }

    std::variant<T, E> state_;
};

// ---------------------------------------------------------------------------
// Result<void, E>: success carries nothing.
// ---------------------------------------------------------------------------
template <typename E>
class Result<void, E> {
public:
    using value_type = void;
    using error_type = E;

    static Result Ok() { return Result(); }

    template <typename G = E>
    static Result Err(G&& error) {
        Result r;
        r.error_.emplace(std::forward<G>(error));
        return r;
    }

    [[nodiscard]] bool IsOk() const noexcept { return !error_; }
    [[nodiscard]] bool IsErr() const noexcept { return error_.has_value(); }
    explicit operator bool() const noexcept { return IsOk(); }

    [[nodiscard]] const E& Error() const& {
        if (!error_) {
            throw BadResultAccess("Error() called on a successful Result");
        }
        return *error_;
    }

    [[nodiscard]] E Error() && {
        if (!error_) {
            throw BadResultAccess("Error() called on a successful Result");
        }
        return std::move(*error_);
    }

private:
    Result() = default;

    std::optional<E> error_;
};

// ---------------------------------------------------------------------------
// ErrorCategory: what went wrong. Each category has a wire code (see
// CategoryName) that is sent to clients in error responses and mapped back
// on the client side.
// ---------------------------------------------------------------------------
enum class ErrorCategory {
    Config,             // config_error
    Load,               // load_error
    Validation,         // validation_error
    UnknownRequestType, // unknown_request_type
    ToolNotFound,       // tool_not_found
    Execution,          // execution_error
    Connection,         // connection_error
    ConnectionClosed,   // connection_closed
    Timeout,            // timeout
    NotConnected,       // not_connected
    Internal,           // internal_error
};

// ---------------------------------------------------------------------------
// Error: the one error type of the server, the client and the CLI.
//
// `operation` names the component or step ("ToolLoader", "Client::Call"),
// `message` is the human-readable text that also goes on the wire.
// ---------------------------------------------------------------------------
struct Error {
    std::string operation;
    std::string message;
    ErrorCategory category = ErrorCategory::Internal;

    static Error Make(ErrorCategory category, std::string operation, std::string message) {
        Error e;
        e.operation = std::move(operation);
        e.message = std::move(message);
        e.category = category;
        return e;
    }

    /// Inverse of CategoryName(). nullopt for codes this build does not know.
    static std::optional<ErrorCategory> CategoryFromCode(std::string_view code);

    [[nodiscard]] std::string CategoryName() const;

    /// 1 connection, 2 config/load, 3 remote error, 99 internal.
    [[nodiscard]] int ExitCode() const;

    [[nodiscard]] std::string ToString() const;
    [[nodiscard]] std::string ToJson() const;

    friend std::ostream& operator<<(std::ostream& os, const Error& e) {
        return os << e.ToString();
    }

    friend bool operator==(const Error& a, const Error& b) {
        return a.category == b.category && a.operation == b.operation && a.message == b.message;
    }

    friend bool operator!=(const Error& a, const Error& b) { return !(a == b); }
};

} // namespace toolhost
