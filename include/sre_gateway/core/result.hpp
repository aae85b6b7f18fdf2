#pragma once

#include <nlohmann/json_fwd.hpp>

#include <cassert>
#include <optional>
#include <ostream>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace sre_gateway {

// ---------------------------------------------------------------------------
// Result<T, E> — holds either a value or an error, never both.
// ---------------------------------------------------------------------------
template <typename T, typename E>
class Result {
public:
    static Result Ok(T value) { return Result(std::in_place_index<0>, std::move(value)); }
    static Result Err(E error) { return Result(std::in_place_index<1>, std::move(error)); }

    [[nodiscard]] bool IsOk() const noexcept { return storage_.index() == 0; }
    [[nodiscard]] bool IsErr() const noexcept { return storage_.index() == 1; }
    explicit operator bool() const noexcept { return IsOk(); }

    [[nodiscard]] const T& Value() const& {
        assert(IsOk() && "Value() called on an Err Result");
        return std::get<0>(storage_);
    }

    [[nodiscard]] T Value() && {
        assert(IsOk() && "Value() called on an Err Result");
        return std::get<0>(std::move(storage_));
    }

    [[nodiscard]] const E& Error() const& {
        assert(IsErr() && "Error() called on an Ok Result");
        return std::get<1>(storage_);
    }

    [[nodiscard]] E Error() && {
        assert(IsErr() && "Error() called on an Ok Result");
        return std::get<1>(std::move(storage_));
    }

    [[nodiscard]] T ValueOr(T fallback) const& {
        return IsOk() ? std::get<0>(storage_) : std::move(fallback);
    }

    // fn: const T& -> Result<U, E>
    template <typename Fn>
    auto AndThen(Fn&& fn) const& -> std::invoke_result_t<Fn, const T&> {
        using Next = std::invoke_result_t<Fn, const T&>;
        if (IsErr()) {
            return Next::Err(std::get<1>(storage_));
        }
        return std::forward<Fn>(fn)(std::get<0>(storage_));
    }

    // fn: const T& -> U
    template <typename Fn>
    auto Map(Fn&& fn) const& -> Result<std::invoke_result_t<Fn, const T&>, E> {
        using U = std::invoke_result_t<Fn, const T&>;
        if (IsErr()) {
            return Result<U, E>::Err(std::get<1>(storage_));
        }
        return Result<U, E>::Ok(std::forward<Fn>(fn)(std::get<0>(storage_)));
    }

private:
    template <std::size_t I, typename V>
    Result(std::in_place_index_t<I> tag, V&& v) : storage_(tag, std::forward<V>(v)) {}

    std::variant<T, E> storage_;
};

// ---------------------------------------------------------------------------
// Result<void, E> — success carries no value.
// ---------------------------------------------------------------------------
template <typename E>
class Result<void, E> {
public:
    static Result Ok() { return Result(std::nullopt); }
    static Result Err(E error) { return Result(std::optional<E>(std::move(error))); }

    [[nodiscard]] bool IsOk() const noexcept { return !error_.has_value(); }
    [[nodiscard]] bool IsErr() const noexcept { return error_.has_value(); }
    explicit operator bool() const noexcept { return IsOk(); }

    [[nodiscard]] const E& Error() const& {
        assert(IsErr() && "Error() called on an Ok Result");
        return *error_;
    }

private:
    explicit Result(std::optional<E> error) : error_(std::move(error)) {}

    std::optional<E> error_;
};

// ---------------------------------------------------------------------------
// ErrorCategory — classifies errors for protocol codes and HTTP statuses.
// ---------------------------------------------------------------------------
enum class ErrorCategory {
    Config,
    Validation,
    NotFound,
    Unsupported,
    Spawn,
    Timeout,
    Transport,
    Internal,
};

// JSON-RPC 2.0 error codes.
namespace rpc_code {
constexpr int kParseError     = -32700;
constexpr int kInvalidRequest = -32600;
constexpr int kMethodNotFound = -32601;
constexpr int kInvalidParams  = -32602;
constexpr int kInternalError  = -32603;
} // namespace rpc_code

// ---------------------------------------------------------------------------
// Error — structured error for configuration, registry and tool operations.
// ---------------------------------------------------------------------------
struct Error {
    std::string operation;
    std::string message;
    std::optional<std::string> field;
    ErrorCategory category = ErrorCategory::Internal;

    static Error Validation(std::string operation, std::string field,
                            std::string message) {
        return Error{std::move(operation), std::move(message),
                     std::move(field), ErrorCategory::Validation};
    }

    static Error NotFound(std::string operation, std::string message) {
        return Error{std::move(operation), std::move(message),
                     std::nullopt, ErrorCategory::NotFound};
    }

    [[nodiscard]] std::string CategoryName() const;

    /// JSON-RPC error code reported to protocol peers.
    [[nodiscard]] int RpcCode() const;

    /// HTTP status used by the REST endpoints.
    [[nodiscard]] int HttpStatus() const;

    [[nodiscard]] std::string ToString() const;

    /// {"error": {"category", "operation", "message", "field"?}}
    [[nodiscard]] nlohmann::json ToJson() const;

    friend std::ostream& operator<<(std::ostream& os, const Error& e) {
        return os << e.ToString();
    }

    bool operator==(const Error& other) const {
        return operation == other.operation && message == other.message &&
               field == other.field && category == other.category;
    }

    bool operator!=(const Error& other) const { return !(*this == other); }
};

} // namespace sre_gateway
