/**
 * @file Error.hpp
 * @brief Structured error type with source location tracking.
 *
 * Defines the error codes raised by the simulation core and its session
 * and transport collaborators, and a lightweight Error value type carrying
 * the code, a human-readable message, and the source location where the
 * error was raised.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef PXV_CORE_ERROR_HPP
    #define PXV_CORE_ERROR_HPP

    #include "Types.hpp"

    #include <expected>
    #include <source_location>
    #include <string>
    #include <string_view>

namespace pxv::core {

/**
 * @brief Error code enumeration.
 */
enum class ErrorCode : u16 {
    kNone = 0,

    // Simulation
    kOutOfBounds,
    kInsufficientResource,
    kNotFound,
    kUnknownAction,
    kAlreadyExists,
    kInvalidArgument,
    kInvalidState,
    kInvariantViolation,

    // Sessions / transport
    kBufferOverflow,
    kChannelClosed,
    kIoError,
    kProtocolViolation,

    kInternalError,

    // Aliases (without k prefix) for convenience
    OutOfBounds          = kOutOfBounds,
    InsufficientResource = kInsufficientResource,
    NotFound             = kNotFound,
    UnknownAction        = kUnknownAction,
    AlreadyExists        = kAlreadyExists,
    InvalidArgument      = kInvalidArgument,
};

/**
 * @brief Returns a stable, upper-case name for an error code.
 */
[[nodiscard]] constexpr std::string_view toString(ErrorCode code) noexcept
{
    switch (code)
    {
    case ErrorCode::kNone:                 return "None";
    case ErrorCode::kOutOfBounds:          return "OutOfBounds";
    case ErrorCode::kInsufficientResource: return "InsufficientResource";
    case ErrorCode::kNotFound:             return "NotFound";
    case ErrorCode::kUnknownAction:        return "UnknownAction";
    case ErrorCode::kAlreadyExists:        return "AlreadyExists";
    case ErrorCode::kInvalidArgument:      return "InvalidArgument";
    case ErrorCode::kInvalidState:         return "InvalidState";
    case ErrorCode::kInvariantViolation:   return "InvariantViolation";
    case ErrorCode::kBufferOverflow:       return "BufferOverflow";
    case ErrorCode::kChannelClosed:        return "ChannelClosed";
    case ErrorCode::kIoError:              return "IoError";
    case ErrorCode::kProtocolViolation:    return "ProtocolViolation";
    case ErrorCode::kInternalError:        return "InternalError";
    }
    return "Unknown";
}

/**
 * @brief Structured error value carrying a code, message, and origin.
 *
 * Intended to be stored inside Expected<T>.
 */
class Error final {
public:
    /**
     * @brief Construct an error from a code and message.
     * @param code    Enumerated error code.
     * @param message Human-readable description.
     * @param loc     Source location (auto-filled by the compiler).
     */
    explicit Error(
        ErrorCode code,
        std::string message,
        std::source_location loc = std::source_location::current()
    ) : _code(code), _message(std::move(message)), _location(loc) {}

    [[nodiscard]] ErrorCode            code()     const { return _code; }
    [[nodiscard]] const std::string &  message()  const { return _message; }
    [[nodiscard]] std::source_location location() const { return _location; }

private:
    ErrorCode            _code;
    std::string          _message;
    std::source_location _location;
};

/// @brief Convenience alias for std::unexpected<Error>.
using Unexpected = std::unexpected<Error>;

/// @brief Factory function to create an unexpected error.
/// @param code Error code.
/// @param message Human-readable description.
/// @param loc Source location (auto-filled).
/// @return std::unexpected<Error>.
[[nodiscard]] inline auto makeError(
    ErrorCode code,
    std::string message,
    std::source_location loc = std::source_location::current())
{
    return std::unexpected<Error>(Error{code, std::move(message), loc});
}

} // namespace pxv::core

#endif // PXV_CORE_ERROR_HPP
