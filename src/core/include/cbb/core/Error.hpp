/**
 * @file Error.hpp
 * @brief Structured error type with source location tracking.
 *
 * Defines the error codes of the inference pipeline and a lightweight
 * Error value type carrying the code, a human-readable message, and the
 * source location where the error was raised.
 *
 * Codes are grouped by the taxonomy the pipeline follows: configuration
 * errors abort construction, data errors are recovered locally, and
 * playback usage errors never reach this type (they are clamped).
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef CBB_CORE_ERROR_HPP
    #define CBB_CORE_ERROR_HPP

    #include "Types.hpp"

    #include <expected>
    #include <source_location>
    #include <string>
    #include <string_view>

namespace cbb::core {

/**
 * @brief Pipeline-wide error code enumeration.
 */
enum class ErrorCode : u16 {
    kNone = 0,

    // Configuration (fatal at startup)
    kFileNotFound,
    kFileParseError,
    kMissingColumn,
    kEmptyInput,
    kInvalidFeatureSpec,
    kWindowExceedsSeries,
    kArtifactMalformed,
    kLabelMappingMismatch,
    kSchemaMismatch,
    kInvalidRuleTable,
    kInvalidConfig,

    // Data (recovered locally)
    kMalformedRow,
    kOutOfOrderSample,
    kRowUnusable,

    // Generic
    kInvalidArgument,
    kInvalidState,
    kNotFound,
    kOutOfRange,
    kIoError,
    kInternalError,
};

/**
 * @brief Returns a short human-readable label for the given error code.
 */
[[nodiscard]] constexpr std::string_view errorCodeName(ErrorCode code) noexcept
{
    switch (code) {
        case ErrorCode::kNone:                 return "None";
        case ErrorCode::kFileNotFound:         return "FileNotFound";
        case ErrorCode::kFileParseError:       return "FileParseError";
        case ErrorCode::kMissingColumn:        return "MissingColumn";
        case ErrorCode::kEmptyInput:           return "EmptyInput";
        case ErrorCode::kInvalidFeatureSpec:   return "InvalidFeatureSpec";
        case ErrorCode::kWindowExceedsSeries:  return "WindowExceedsSeries";
        case ErrorCode::kArtifactMalformed:    return "ArtifactMalformed";
        case ErrorCode::kLabelMappingMismatch: return "LabelMappingMismatch";
        case ErrorCode::kSchemaMismatch:       return "SchemaMismatch";
        case ErrorCode::kInvalidRuleTable:     return "InvalidRuleTable";
        case ErrorCode::kInvalidConfig:        return "InvalidConfig";
        case ErrorCode::kMalformedRow:         return "MalformedRow";
        case ErrorCode::kOutOfOrderSample:     return "OutOfOrderSample";
        case ErrorCode::kRowUnusable:          return "RowUnusable";
        case ErrorCode::kInvalidArgument:      return "InvalidArgument";
        case ErrorCode::kInvalidState:         return "InvalidState";
        case ErrorCode::kNotFound:             return "NotFound";
        case ErrorCode::kOutOfRange:           return "OutOfRange";
        case ErrorCode::kIoError:              return "IoError";
        case ErrorCode::kInternalError:        return "InternalError";
    }
    return "Unknown";
}

/**
 * @brief Structured error value carrying a code, message, and origin.
 *
 * Error is a lightweight value type intended to be stored inside
 * Expected<T>.
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
    [[nodiscard]] const std::string   &message()  const { return _message; }
    [[nodiscard]] std::source_location location() const { return _location; }

    /**
     * @brief Formats the error as "[Code] message (file:line)".
     */
    [[nodiscard]] std::string format() const;

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

} // namespace cbb::core

#endif // CBB_CORE_ERROR_HPP
