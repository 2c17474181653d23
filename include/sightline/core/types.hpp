#pragma once

#include <cstdint>
#include <string>
#include <expected>

namespace sightline::core {

// ============================================================================
// Result Type
// ============================================================================

template<typename T, typename E>
using Result = std::expected<T, E>;

// ============================================================================
// Error Types
// ============================================================================

/**
 * Error codes reported by the fallible edges of the library (map loading).
 * Geometry, lighting, vision and pathfinding never produce errors.
 */
enum class ErrorCode : std::uint32_t {
    Success = 0,

    // File I/O errors (100-199)
    FileNotFound = 100,
    FileReadError = 103,

    // Map document errors (400-499)
    ParseError = 400,
    InvalidFormat = 401,
};

/**
 * Error information structure
 */
struct Error {
    ErrorCode code = ErrorCode::Success;
    std::string message;
    std::string source_location; // File:Line where error occurred

    Error() = default;

    explicit Error(ErrorCode code_, std::string message_ = "", std::string location_ = "")
        : code(code_), message(std::move(message_)), source_location(std::move(location_)) {}

    bool is_success() const { return code == ErrorCode::Success; }
    bool is_error() const { return code != ErrorCode::Success; }

    std::string to_string() const {
        if (is_success()) return "Success";
        std::string result = "Error " + std::to_string(static_cast<std::uint32_t>(code));
        if (!message.empty()) result += ": " + message;
        if (!source_location.empty()) result += " at " + source_location;
        return result;
    }
};

} // namespace sightline::core

// Bring common types into global sightline namespace for convenience
namespace sightline {
    using sightline::core::Result;
    using sightline::core::Error;
    using sightline::core::ErrorCode;
} // namespace sightline
