#pragma once

/**
 * @file result.hpp
 * @brief Error and Result types shared by every mdwf operation
 *
 * Environment operations never throw across the public API. A fallible
 * call returns Result<T>; callers branch on the ErrorCode to tell an absent
 * resource from a corrupt or unsafe one.
 *
 * @example
 * ```cpp
 * auto wf = env.getWorkflow("job");
 * if (wf.isErr() && wf.error().code() == mdwf::ErrorCode::RESOURCE_NOT_FOUND) {
 *     // offer the list of available workflows
 * }
 * ```
 */

#include <optional>
#include <string>
#include <utility>

namespace mdwf {

// ============================================================================
// Error Handling
// ============================================================================

/**
 * @brief Error kinds reported by environments
 */
enum class ErrorCode {
    // Workflow/template/static/processor/converter absent
    RESOURCE_NOT_FOUND,

    // Present but schema-invalid, or archive failed aggregate/content checks
    VALIDATION_ERROR,

    // Path/filename/size violation
    SECURITY_ERROR,

    // Archive or file present but unreadable
    IO_ERROR,
};

const char* error_code_to_string(ErrorCode code);

/**
 * @brief Error type with code, message and the resource it concerns
 */
class Error {
public:
    Error(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    static Error not_found(const std::string& kind, const std::string& id,
                           const std::string& hint = "") {
        Error e(ErrorCode::RESOURCE_NOT_FOUND,
                kind + " not found: " + id + (hint.empty() ? std::string() : ". " + hint));
        e.resource_kind_ = kind;
        e.resource_id_ = id;
        return e;
    }
    static Error validation(std::string message) {
        return Error(ErrorCode::VALIDATION_ERROR, std::move(message));
    }
    static Error security(std::string message) {
        return Error(ErrorCode::SECURITY_ERROR, std::move(message));
    }
    static Error io(std::string message) {
        return Error(ErrorCode::IO_ERROR, std::move(message));
    }

    Error& withContext(const std::string& context) {
        message_ = context + ": " + message_;
        return *this;
    }

    ErrorCode code() const { return code_; }
    const std::string& message() const { return message_; }
    const std::string& resource_kind() const { return resource_kind_; }
    const std::string& resource_id() const { return resource_id_; }
    bool is_not_found() const { return code_ == ErrorCode::RESOURCE_NOT_FOUND; }
    std::string toString() const { return message_; }

private:
    ErrorCode code_;
    std::string message_;
    std::string resource_kind_;
    std::string resource_id_;
};

// ============================================================================
// Result Type
// ============================================================================

/**
 * @brief Result type for fallible operations
 * @tparam T The success value type
 * @tparam E The error type (default: Error)
 *
 * Check isOk() before accessing value(), or isErr() before error().
 */
template<typename T, typename E = Error>
class Result {
public:
    static Result ok(T value) { return Result(std::move(value)); }
    static Result err(E error) { return Result(std::move(error)); }

    bool isOk() const { return has_value_; }
    bool isErr() const { return !has_value_; }

    T& value() { return value_.value(); }
    const T& value() const { return value_.value(); }
    E& error() { return error_.value(); }
    const E& error() const { return error_.value(); }

    T valueOr(T default_value) const {
        if (has_value_) return value_.value();
        return default_value;
    }

    template<typename F>
    auto map(F func) -> Result<decltype(func(std::declval<T>())), E> {
        if (has_value_) {
            return Result<decltype(func(std::declval<T>())), E>::ok(func(value_.value()));
        }
        return Result<decltype(func(std::declval<T>())), E>::err(error_.value());
    }

private:
    explicit Result(T value) : has_value_(true), value_(std::move(value)) {}
    explicit Result(E error) : has_value_(false), error_(std::move(error)) {}

    bool has_value_;
    std::optional<T> value_;
    std::optional<E> error_;
};

template<typename E>
class Result<void, E> {
public:
    static Result ok() { return Result(true, std::nullopt); }
    static Result err(E error) { return Result(false, std::move(error)); }

    bool isOk() const { return has_value_; }
    bool isErr() const { return !has_value_; }

    void value() const {}
    E& error() { return error_.value(); }
    const E& error() const { return error_.value(); }

private:
    Result(bool hv, std::optional<E> err) : has_value_(hv), error_(std::move(err)) {}
    bool has_value_;
    std::optional<E> error_;
};

} // namespace mdwf
