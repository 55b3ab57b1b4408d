// =============================================================================
// vq-tiers - Error Handling Framework
// =============================================================================
// Error handling for the vq-tiers library.
//
// This module provides:
// - ErrorCode enum matching CLI exit codes
// - VqtException hierarchy for structured error handling
// - Result<T, E> type for functional error handling (using std::expected)
// - Error context and message support
//
// Exit Code Convention:
// - 0: Success
// - 1: Usage/argument error
// - 2: I/O error (file not found, read/write failure)
// - 3: Format error (malformed VCF or tranches file)
// - 4: Configuration error (no usable tranche)
// - 5: Join mismatch between input and recal records
// - 6: Coordinate order violation
//
// Naming Conventions:
// - Enums: PascalCase with kConstant values
// - Classes: PascalCase
// - Functions: camelCase
// - Constants: kConstant
// =============================================================================

#ifndef VQT_COMMON_ERROR_H
#define VQT_COMMON_ERROR_H

#include <cstdint>
#include <exception>
#include <expected>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>
#include <variant>

namespace vqt {

// =============================================================================
// Error Code Enumeration
// =============================================================================

/// @brief Error codes matching CLI exit codes.
/// @note These values are used as process exit codes.
enum class ErrorCode : std::uint8_t {
    /// @brief Operation completed successfully.
    kSuccess = 0,

    /// @brief Usage or argument error.
    kUsageError = 1,

    /// @brief I/O error.
    /// @note File not found, read/write failure, decompression failure.
    kIOError = 2,

    /// @brief Malformed input (VCF line, tranches row, score column).
    kFormatError = 3,

    /// @brief Unusable configuration, e.g. no tranche survives the filter level.
    kConfigurationError = 4,

    /// @brief Input record has no usable counterpart in the recal stream.
    kJoinMismatch = 5,

    /// @brief Coordinates went backwards in a stream or a seek.
    kSequenceOrder = 6
};

/// @brief Convert ErrorCode to its integer exit code value.
[[nodiscard]] constexpr int toExitCode(ErrorCode code) noexcept {
    return static_cast<int>(code);
}

/// @brief Convert ErrorCode to string representation.
[[nodiscard]] constexpr std::string_view errorCodeToString(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::kSuccess:
            return "success";
        case ErrorCode::kUsageError:
            return "usage error";
        case ErrorCode::kIOError:
            return "I/O error";
        case ErrorCode::kFormatError:
            return "format error";
        case ErrorCode::kConfigurationError:
            return "configuration error";
        case ErrorCode::kJoinMismatch:
            return "join mismatch";
        case ErrorCode::kSequenceOrder:
            return "sequence order violation";
    }
    return "unknown error";
}

/// @brief Check if an error code represents success.
[[nodiscard]] constexpr bool isSuccess(ErrorCode code) noexcept {
    return code == ErrorCode::kSuccess;
}

/// @brief Check if an error code represents an error.
[[nodiscard]] constexpr bool isError(ErrorCode code) noexcept {
    return code != ErrorCode::kSuccess;
}

// =============================================================================
// Error Context Structure
// =============================================================================

/// @brief Additional context information for errors.
struct ErrorContext {
    /// @brief Input name associated with the error (file path or source label).
    std::string sourceName;

    /// @brief Line number in the source (1-based, if applicable).
    std::optional<std::uint64_t> lineNumber;

    /// @brief Locus of the offending record, e.g. "chr1:100-100".
    std::string locus;

    /// @brief Source location where the error was created.
    std::source_location location;

    /// @brief Default constructor with current source location.
    ErrorContext(std::source_location loc = std::source_location::current()) : location(loc) {}

    /// @brief Construct with source name.
    explicit ErrorContext(std::string name,
                          std::source_location loc = std::source_location::current())
        : sourceName(std::move(name)), location(loc) {}

    /// @brief Set the source name.
    ErrorContext& withSource(std::string name) {
        sourceName = std::move(name);
        return *this;
    }

    /// @brief Set the line number.
    ErrorContext& withLine(std::uint64_t line) {
        lineNumber = line;
        return *this;
    }

    /// @brief Set the locus.
    ErrorContext& withLocus(std::string value) {
        locus = std::move(value);
        return *this;
    }

    /// @brief Format context as a string for error messages.
    [[nodiscard]] std::string format() const;
};

// =============================================================================
// Base Exception Class
// =============================================================================

/// @brief Base exception class for all vq-tiers errors.
class VqtException : public std::exception {
public:
    /// @brief Construct with error code and message.
    VqtException(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {
        formatWhat();
    }

    /// @brief Construct with error code, message, and context.
    VqtException(ErrorCode code, std::string message, ErrorContext context)
        : code_(code), message_(std::move(message)), context_(std::move(context)) {
        formatWhat();
    }

    ~VqtException() override = default;

    VqtException(const VqtException&) = default;
    VqtException(VqtException&&) noexcept = default;
    VqtException& operator=(const VqtException&) = default;
    VqtException& operator=(VqtException&&) noexcept = default;

    /// @brief Get the full error message including context.
    [[nodiscard]] const char* what() const noexcept override { return what_.c_str(); }

    /// @brief Get the error code.
    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    /// @brief Get the exit code for this error.
    [[nodiscard]] int exitCode() const noexcept { return toExitCode(code_); }

    /// @brief Get the error message (without context).
    [[nodiscard]] const std::string& message() const noexcept { return message_; }

    /// @brief Get the error context.
    [[nodiscard]] const std::optional<ErrorContext>& context() const noexcept { return context_; }

    /// @brief Check if this exception has context information.
    [[nodiscard]] bool hasContext() const noexcept { return context_.has_value(); }

protected:
    /// @brief Format the what() string from message and context.
    void formatWhat();

    ErrorCode code_;
    std::string message_;
    std::optional<ErrorContext> context_;
    std::string what_;
};

// =============================================================================
// Specific Exception Classes
// =============================================================================

/// @brief Exception for usage and argument errors (exit code 1).
class UsageError : public VqtException {
public:
    explicit UsageError(std::string message)
        : VqtException(ErrorCode::kUsageError, std::move(message)) {}

    UsageError(std::string message, ErrorContext context)
        : VqtException(ErrorCode::kUsageError, std::move(message), std::move(context)) {}
};

/// @brief Exception for I/O errors (exit code 2).
class IOError : public VqtException {
public:
    explicit IOError(std::string message)
        : VqtException(ErrorCode::kIOError, std::move(message)) {}

    IOError(std::string message, ErrorContext context)
        : VqtException(ErrorCode::kIOError, std::move(message), std::move(context)) {}

    /// @brief Construct from system error code.
    IOError(std::string message, std::error_code ec)
        : VqtException(ErrorCode::kIOError, formatWithSystemError(message, ec)),
          systemError_(ec) {}

    /// @brief Get the system error code (if available).
    [[nodiscard]] const std::optional<std::error_code>& systemError() const noexcept {
        return systemError_;
    }

private:
    static std::string formatWithSystemError(const std::string& message, std::error_code ec);

    std::optional<std::error_code> systemError_;
};

/// @brief Exception for malformed input (exit code 3).
class FormatError : public VqtException {
public:
    explicit FormatError(std::string message)
        : VqtException(ErrorCode::kFormatError, std::move(message)) {}

    FormatError(std::string message, ErrorContext context)
        : VqtException(ErrorCode::kFormatError, std::move(message), std::move(context)) {}
};

/// @brief Exception for unusable configuration (exit code 4).
/// @note Raised before any record is processed.
class ConfigurationError : public VqtException {
public:
    explicit ConfigurationError(std::string message)
        : VqtException(ErrorCode::kConfigurationError, std::move(message)) {}

    ConfigurationError(std::string message, ErrorContext context)
        : VqtException(ErrorCode::kConfigurationError, std::move(message), std::move(context)) {}
};

/// @brief Exception for an input record without a usable recal record (exit code 5).
class JoinMismatchError : public VqtException {
public:
    explicit JoinMismatchError(std::string message)
        : VqtException(ErrorCode::kJoinMismatch, std::move(message)) {}

    JoinMismatchError(std::string message, ErrorContext context)
        : VqtException(ErrorCode::kJoinMismatch, std::move(message), std::move(context)) {}
};

/// @brief Exception for a coordinate walk that went backwards (exit code 6).
class SequenceOrderViolation : public VqtException {
public:
    explicit SequenceOrderViolation(std::string message)
        : VqtException(ErrorCode::kSequenceOrder, std::move(message)) {}

    SequenceOrderViolation(std::string message, ErrorContext context)
        : VqtException(ErrorCode::kSequenceOrder, std::move(message), std::move(context)) {}
};

// =============================================================================
// Result Type (using std::expected)
// =============================================================================

/// @brief Error type for Result, wrapping ErrorCode and message.
class Error {
public:
    Error(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    /// @brief Construct from a VqtException.
    explicit Error(const VqtException& ex) : code_(ex.code()), message_(ex.message()) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    [[nodiscard]] const std::string& message() const noexcept { return message_; }

    [[nodiscard]] int exitCode() const noexcept { return toExitCode(code_); }

    /// @brief Throw the exception type matching the error code.
    [[noreturn]] void throwException() const;

private:
    ErrorCode code_;
    std::string message_;
};

/// @brief Result type for operations that can fail.
template <typename T, typename E = Error>
using Result = std::expected<T, E>;

/// @brief Create an error result.
template <typename T>
[[nodiscard]] Result<T> makeError(ErrorCode code, std::string message) {
    return std::unexpected(Error{code, std::move(message)});
}

/// @brief Result type for operations that return nothing on success.
using VoidResult = Result<std::monostate>;

/// @brief Create a success void result.
[[nodiscard]] inline VoidResult makeVoidSuccess() {
    return VoidResult{std::monostate{}};
}

/// @brief Create an error void result.
[[nodiscard]] inline VoidResult makeVoidError(ErrorCode code, std::string message) {
    return std::unexpected(Error{code, std::move(message)});
}

// =============================================================================
// Utility Functions
// =============================================================================

/// @brief Convert a Result to its value, throwing if it contains an error.
template <typename T>
[[nodiscard]] T unwrapOrThrow(Result<T> result) {
    if (result.has_value()) {
        return std::move(result.value());
    }
    result.error().throwException();
}

/// @brief Throw if a VoidResult contains an error.
inline void unwrapOrThrow(VoidResult result) {
    if (!result.has_value()) {
        result.error().throwException();
    }
}

/// @brief Execute a function and convert exceptions to Result.
template <typename F>
[[nodiscard]] auto tryExecute(F&& func) {
    using ReturnType = decltype(func());
    using ValueType = std::conditional_t<std::is_void_v<ReturnType>, std::monostate, ReturnType>;
    try {
        if constexpr (std::is_void_v<ReturnType>) {
            func();
            return Result<ValueType>{std::monostate{}};
        } else {
            return Result<ValueType>{func()};
        }
    } catch (const VqtException& ex) {
        return Result<ValueType>{std::unexpected(Error{ex})};
    } catch (const std::exception& ex) {
        return Result<ValueType>{std::unexpected(Error{ErrorCode::kIOError, ex.what()})};
    }
}

}  // namespace vqt

#endif  // VQT_COMMON_ERROR_H
