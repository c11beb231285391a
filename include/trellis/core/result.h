// trellis - render graph execution engine
// Copyright (c) 2025 trellis Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <optional>
#include <source_location>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace trellis::core {

// Forward declaration
template<typename T>
class Result;

/**
 * @brief Classification of a failure.
 *
 * Structural kinds come from graph construction and are fatal at startup.
 * Per-frame kinds drop the current frame only. SurfaceOutdated is a soft backend
 * condition handled by resizing and retrying. FatalBackend and Headless mean the
 * backend cannot render at all.
 */
enum class ErrorKind {
    Generic,
    UnknownNode,
    CycleDetected,
    NodeDraw,
    MissingSharedResource,
    SurfaceOutdated,
    FatalBackend,
    Headless,
};

constexpr bool IsStructural(ErrorKind kind) noexcept {
    return kind == ErrorKind::UnknownNode || kind == ErrorKind::CycleDetected;
}

constexpr bool IsFatal(ErrorKind kind) noexcept {
    return kind == ErrorKind::FatalBackend || kind == ErrorKind::Headless;
}

constexpr bool IsRecoverable(ErrorKind kind) noexcept {
    return !IsStructural(kind) && !IsFatal(kind);
}

constexpr std::string_view ToString(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::Generic: return "generic";
        case ErrorKind::UnknownNode: return "unknown node";
        case ErrorKind::CycleDetected: return "cycle detected";
        case ErrorKind::NodeDraw: return "node draw";
        case ErrorKind::MissingSharedResource: return "missing shared resource";
        case ErrorKind::SurfaceOutdated: return "surface outdated";
        case ErrorKind::FatalBackend: return "fatal backend";
        case ErrorKind::Headless: return "headless";
    }
    return "generic";
}

// Error class - represents failures with context
class Error {
public:
    std::string Message;
    ErrorKind Kind = ErrorKind::Generic;
    // Node or resource the failure is about, when there is one
    std::optional<std::string> Subject;
    std::source_location Location;

    Error(std::string message,
          std::source_location location = std::source_location::current())
        : Message(std::move(message)), Location(location) {}

    Error(ErrorKind kind,
          std::string message,
          std::optional<std::string> subject = std::nullopt,
          std::source_location location = std::source_location::current())
        : Message(std::move(message)), Kind(kind), Subject(std::move(subject)), Location(location) {}

    const char* What() const noexcept { return Message.c_str(); }

    // Context addition (like anyhow's context)
    Error WithContext(const std::string& context) const {
        Error err(Kind, context + ": " + Message, Subject, Location);
        return err;
    }
};

// Helpers to create errors
inline Error MakeError(const std::string& message,
                       std::source_location location = std::source_location::current()) {
    return Error(message, location);
}

inline Error MakeError(ErrorKind kind,
                       const std::string& message,
                       std::optional<std::string> subject = std::nullopt,
                       std::source_location location = std::source_location::current()) {
    return Error(kind, message, std::move(subject), location);
}

// Result<T> - value or Error
template<typename T>
class Result {
private:
    std::variant<T, Error> data_;

public:
    // Constructors
    Result(T value) : data_(std::move(value)) {}
    Result(Error error) : data_(std::move(error)) {}

    // Factory methods
    static Result Ok(T value) { return Result(std::move(value)); }
    static Result Err(Error error) { return Result(std::move(error)); }
    static Result Err(const std::string& message) {
        return Result(MakeError(message));
    }

    // Check state
    bool IsOk() const noexcept { return std::holds_alternative<T>(data_); }
    bool IsErr() const noexcept { return std::holds_alternative<Error>(data_); }
    explicit operator bool() const noexcept { return IsOk(); }

    // Access value (throws if error)
    T& Value() & {
        if (IsErr()) {
            throw std::runtime_error(GetError().Message);
        }
        return std::get<T>(data_);
    }

    T&& Value() && {
        if (IsErr()) {
            throw std::runtime_error(GetError().Message);
        }
        return std::get<T>(std::move(data_));
    }

    const T& Value() const & {
        if (IsErr()) {
            throw std::runtime_error(GetError().Message);
        }
        return std::get<T>(data_);
    }

    // Access error (undefined if ok)
    Error& GetError() & { return std::get<Error>(data_); }
    const Error& GetError() const & { return std::get<Error>(data_); }
    Error&& GetError() && { return std::get<Error>(std::move(data_)); }

    // Get value or default
    T ValueOr(T default_value) const & {
        return IsOk() ? Value() : std::move(default_value);
    }

    T ValueOr(T default_value) && {
        return IsOk() ? std::move(*this).Value() : std::move(default_value);
    }

    // Unwrap (throws on error)
    T Unwrap() && {
        if (IsErr()) {
            throw std::runtime_error(GetError().Message);
        }
        return std::get<T>(std::move(data_));
    }

    // Expect with custom message
    T Expect(const std::string& message) && {
        if (IsErr()) {
            throw std::runtime_error(message + ": " + GetError().Message);
        }
        return std::get<T>(std::move(data_));
    }

    // Add context to error
    Result WithContext(const std::string& context) && {
        if (IsErr()) {
            return Result::Err(GetError().WithContext(context));
        }
        return std::move(*this);
    }
};

// Specialization for Result<void>
template<>
class Result<void> {
private:
    std::variant<std::monostate, Error> data_;

public:
    // Constructors
    Result() : data_(std::monostate{}) {}
    Result(Error error) : data_(std::move(error)) {}

    // Factory methods
    static Result Ok() { return Result(); }
    static Result Err(Error error) { return Result(std::move(error)); }
    static Result Err(const std::string& message) {
        return Result(MakeError(message));
    }

    // Check state
    bool IsOk() const noexcept { return std::holds_alternative<std::monostate>(data_); }
    bool IsErr() const noexcept { return std::holds_alternative<Error>(data_); }
    explicit operator bool() const noexcept { return IsOk(); }

    // Access error (undefined if ok)
    Error& GetError() & { return std::get<Error>(data_); }
    const Error& GetError() const & { return std::get<Error>(data_); }
    Error&& GetError() && { return std::get<Error>(std::move(data_)); }

    // Unwrap (throws on error)
    void Unwrap() const {
        if (IsErr()) {
            throw std::runtime_error(GetError().Message);
        }
    }

    // Expect with custom message
    void Expect(const std::string& message) const {
        if (IsErr()) {
            throw std::runtime_error(message + ": " + GetError().Message);
        }
    }

    // Add context to error
    Result WithContext(const std::string& context) && {
        if (IsErr()) {
            return Result::Err(GetError().WithContext(context));
        }
        return std::move(*this);
    }
};

// ENSURE - return an error of the given kind when the condition does not hold
#define TRELLIS_ENSURE(cond, kind, msg) \
    if (!(cond)) { \
        return ::trellis::core::MakeError((kind), (msg)); \
    }

} // namespace trellis::core
