// =============================================================================
// rcp-packager - Error Handling Framework
// =============================================================================
// Error handling for the rcp-packager library.
//
// This module provides:
// - ErrorCode enum covering wire, compression, package and I/O failures
// - RCPException hierarchy for structured error handling
// - Result<T, E> type for functional error handling (using std::expected)
// - Error context (file path, field number, byte offset)
//
// Exit Code Convention:
// - 0: Success
// - 1: Usage/argument error
// - 2: I/O error (file not found, read/write failure)
// - 3: Format error (wire format, schema, column layout, JSON layout)
// - 4: Checksum verification failure
// - 5: Compression codec failure
//
// Naming Conventions:
// - Enums: PascalCase with kConstant values
// - Classes: PascalCase
// - Functions: camelCase
// - Constants: kConstant
// =============================================================================

#ifndef RCP_COMMON_ERROR_H
#define RCP_COMMON_ERROR_H

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

namespace rcp {

// =============================================================================
// Error Code Enumeration
// =============================================================================

/// @brief Error codes for every failure the library can report.
/// @note Use toExitCode() to map a code onto the CLI exit-code convention.
enum class ErrorCode : std::uint8_t {
    /// @brief Operation completed successfully.
    kSuccess = 0,

    /// @brief Usage or argument error.
    kUsageError = 1,

    /// @brief Filesystem failure (missing file, permission, disk full).
    kIOError = 2,

    /// @brief Structural format error (bad JSON layout, bad checksum file).
    kFormatError = 3,

    /// @brief Checksum verification failure.
    kChecksumError = 4,

    /// @brief Underlying compression library reported an error.
    kCompressionError = 5,

    /// @brief Wire buffer ended before a value was fully decodable.
    kTruncatedInput = 6,

    /// @brief Field number not part of the message schema.
    kUnknownField = 7,

    /// @brief Known field number paired with an unexpected wire type.
    kWireTypeMismatch = 8,

    /// @brief Channel columns of unequal length.
    kColumnLengthMismatch = 9,

    /// @brief Decompressed output exceeds the safety ceiling.
    kOutputTooLarge = 10
};

/// @brief Convert ErrorCode to its process exit code.
/// @param code The error code.
/// @return Integer exit code suitable for process exit.
[[nodiscard]] constexpr int toExitCode(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::kSuccess:
            return 0;
        case ErrorCode::kUsageError:
            return 1;
        case ErrorCode::kIOError:
            return 2;
        case ErrorCode::kFormatError:
        case ErrorCode::kTruncatedInput:
        case ErrorCode::kUnknownField:
        case ErrorCode::kWireTypeMismatch:
        case ErrorCode::kColumnLengthMismatch:
            return 3;
        case ErrorCode::kChecksumError:
            return 4;
        case ErrorCode::kCompressionError:
        case ErrorCode::kOutputTooLarge:
            return 5;
    }
    return 1;
}

/// @brief Convert ErrorCode to string representation.
/// @param code The error code.
/// @return Human-readable string describing the error category.
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
        case ErrorCode::kChecksumError:
            return "checksum error";
        case ErrorCode::kCompressionError:
            return "compression error";
        case ErrorCode::kTruncatedInput:
            return "truncated input";
        case ErrorCode::kUnknownField:
            return "unknown field";
        case ErrorCode::kWireTypeMismatch:
            return "wire type mismatch";
        case ErrorCode::kColumnLengthMismatch:
            return "column length mismatch";
        case ErrorCode::kOutputTooLarge:
            return "output too large";
    }
    return "unknown error";
}

// =============================================================================
// Error Context Structure
// =============================================================================

/// @brief Additional context information for errors.
struct ErrorContext {
    /// @brief File path associated with the error (if applicable).
    std::string filePath;

    /// @brief Wire field number involved (if applicable).
    std::optional<std::uint32_t> fieldNumber;

    /// @brief Byte offset in the buffer or file (if applicable).
    std::optional<std::uint64_t> byteOffset;

    /// @brief Source location where the error was created.
    std::source_location location;

    ErrorContext(std::source_location loc = std::source_location::current()) : location(loc) {}

    explicit ErrorContext(std::string path,
                          std::source_location loc = std::source_location::current())
        : filePath(std::move(path)), location(loc) {}

    ErrorContext& withField(std::uint32_t field) {
        fieldNumber = field;
        return *this;
    }

    ErrorContext& withOffset(std::uint64_t offset) {
        byteOffset = offset;
        return *this;
    }

    /// @brief Format context as a string for error messages.
    [[nodiscard]] std::string format() const;
};

// =============================================================================
// Base Exception Class
// =============================================================================

/// @brief Base exception class for all rcp-packager errors.
class RCPException : public std::exception {
public:
    RCPException(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {
        formatWhat();
    }

    RCPException(ErrorCode code, std::string message, ErrorContext context)
        : code_(code), message_(std::move(message)), context_(std::move(context)) {
        formatWhat();
    }

    ~RCPException() override = default;

    RCPException(const RCPException&) = default;
    RCPException(RCPException&&) noexcept = default;
    RCPException& operator=(const RCPException&) = default;
    RCPException& operator=(RCPException&&) noexcept = default;

    [[nodiscard]] const char* what() const noexcept override { return what_.c_str(); }

    /// @brief Get the error code.
    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    /// @brief Get the exit code for this error.
    [[nodiscard]] int exitCode() const noexcept { return toExitCode(code_); }

    /// @brief Get the error message (without context).
    [[nodiscard]] const std::string& message() const noexcept { return message_; }

    /// @brief Get the error context.
    [[nodiscard]] const std::optional<ErrorContext>& context() const noexcept { return context_; }

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
class UsageError : public RCPException {
public:
    explicit UsageError(std::string message)
        : RCPException(ErrorCode::kUsageError, std::move(message)) {}

    UsageError(std::string message, ErrorContext context)
        : RCPException(ErrorCode::kUsageError, std::move(message), std::move(context)) {}
};

/// @brief Exception for filesystem errors (exit code 2).
/// @note Always carries the offending path when raised by the package layer.
class IOError : public RCPException {
public:
    explicit IOError(std::string message)
        : RCPException(ErrorCode::kIOError, std::move(message)) {}

    IOError(std::string message, ErrorContext context)
        : RCPException(ErrorCode::kIOError, std::move(message), std::move(context)) {}

    IOError(std::string message, std::error_code ec)
        : RCPException(ErrorCode::kIOError, formatWithSystemError(message, ec)),
          systemError_(ec) {}

    IOError(std::string message, std::error_code ec, ErrorContext context)
        : RCPException(ErrorCode::kIOError, formatWithSystemError(message, ec),
                       std::move(context)),
          systemError_(ec) {}

    /// @brief Get the system error code (if available).
    [[nodiscard]] const std::optional<std::error_code>& systemError() const noexcept {
        return systemError_;
    }

private:
    static std::string formatWithSystemError(const std::string& message, std::error_code ec);

    std::optional<std::error_code> systemError_;
};

/// @brief Exception for structural format errors (exit code 3).
/// @note Base class of the wire and column layout errors below.
class FormatError : public RCPException {
public:
    explicit FormatError(std::string message)
        : RCPException(ErrorCode::kFormatError, std::move(message)) {}

    FormatError(std::string message, ErrorContext context)
        : RCPException(ErrorCode::kFormatError, std::move(message), std::move(context)) {}

protected:
    FormatError(ErrorCode code, std::string message)
        : RCPException(code, std::move(message)) {}

    FormatError(ErrorCode code, std::string message, ErrorContext context)
        : RCPException(code, std::move(message), std::move(context)) {}
};

/// @brief Wire buffer ended before a value was fully decodable.
class TruncatedInputError : public FormatError {
public:
    explicit TruncatedInputError(std::string message)
        : FormatError(ErrorCode::kTruncatedInput, std::move(message)) {}

    TruncatedInputError(std::string message, ErrorContext context)
        : FormatError(ErrorCode::kTruncatedInput, std::move(message), std::move(context)) {}
};

/// @brief Field number not defined by the message schema.
class UnknownFieldError : public FormatError {
public:
    UnknownFieldError(std::string_view messageName, std::uint32_t fieldNumber,
                      ErrorContext context = {})
        : FormatError(ErrorCode::kUnknownField,
                      formatUnknownField(messageName, fieldNumber),
                      std::move(context.withField(fieldNumber))),
          fieldNumber_(fieldNumber) {}

    [[nodiscard]] std::uint32_t fieldNumber() const noexcept { return fieldNumber_; }

private:
    static std::string formatUnknownField(std::string_view messageName, std::uint32_t fieldNumber);

    std::uint32_t fieldNumber_;
};

/// @brief Known field number encoded with an unexpected wire type.
class WireTypeMismatchError : public FormatError {
public:
    WireTypeMismatchError(std::string_view messageName, std::uint32_t fieldNumber,
                          std::uint32_t expected, std::uint32_t actual,
                          ErrorContext context = {})
        : FormatError(ErrorCode::kWireTypeMismatch,
                      formatMismatch(messageName, fieldNumber, expected, actual),
                      std::move(context.withField(fieldNumber))),
          fieldNumber_(fieldNumber),
          expected_(expected),
          actual_(actual) {}

    [[nodiscard]] std::uint32_t fieldNumber() const noexcept { return fieldNumber_; }
    [[nodiscard]] std::uint32_t expected() const noexcept { return expected_; }
    [[nodiscard]] std::uint32_t actual() const noexcept { return actual_; }

private:
    static std::string formatMismatch(std::string_view messageName, std::uint32_t fieldNumber,
                                      std::uint32_t expected, std::uint32_t actual);

    std::uint32_t fieldNumber_;
    std::uint32_t expected_;
    std::uint32_t actual_;
};

/// @brief Channel columns of unequal length.
class ColumnLengthMismatchError : public FormatError {
public:
    explicit ColumnLengthMismatchError(std::string message)
        : FormatError(ErrorCode::kColumnLengthMismatch, std::move(message)) {}

    ColumnLengthMismatchError(std::string message, ErrorContext context)
        : FormatError(ErrorCode::kColumnLengthMismatch, std::move(message), std::move(context)) {}
};

/// @brief Exception for checksum verification failures (exit code 4).
class ChecksumError : public RCPException {
public:
    explicit ChecksumError(std::string message)
        : RCPException(ErrorCode::kChecksumError, std::move(message)) {}

    ChecksumError(std::string message, ErrorContext context)
        : RCPException(ErrorCode::kChecksumError, std::move(message), std::move(context)) {}
};

/// @brief Exception for compression library failures (exit code 5).
/// @note The message is the library's own error text, passed through verbatim.
class CompressionError : public RCPException {
public:
    explicit CompressionError(std::string message)
        : RCPException(ErrorCode::kCompressionError, std::move(message)) {}

    CompressionError(std::string message, ErrorContext context)
        : RCPException(ErrorCode::kCompressionError, std::move(message), std::move(context)) {}
};

/// @brief Decompressed output would exceed the safety ceiling.
class OutputTooLargeError : public RCPException {
public:
    OutputTooLargeError(std::uint64_t requested, std::uint64_t limit)
        : RCPException(ErrorCode::kOutputTooLarge, formatTooLarge(requested, limit)),
          requested_(requested),
          limit_(limit) {}

    [[nodiscard]] std::uint64_t requested() const noexcept { return requested_; }
    [[nodiscard]] std::uint64_t limit() const noexcept { return limit_; }

private:
    static std::string formatTooLarge(std::uint64_t requested, std::uint64_t limit);

    std::uint64_t requested_;
    std::uint64_t limit_;
};

// =============================================================================
// Result Type (using std::expected)
// =============================================================================

/// @brief Error type for Result, wrapping ErrorCode and message.
class Error {
public:
    Error(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    explicit Error(const RCPException& ex) : code_(ex.code()), message_(ex.message()) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }
    [[nodiscard]] const std::string& message() const noexcept { return message_; }
    [[nodiscard]] int exitCode() const noexcept { return toExitCode(code_); }

    /// @brief Throw the exception class matching the error code.
    [[noreturn]] void throwException() const;

private:
    ErrorCode code_;
    std::string message_;
};

/// @brief Result type for operations that can fail.
template <typename T, typename E = Error>
using Result = std::expected<T, E>;

template <typename T>
[[nodiscard]] Result<T> makeError(ErrorCode code, std::string message) {
    return std::unexpected(Error{code, std::move(message)});
}

template <typename T>
[[nodiscard]] Result<T> makeError(Error error) {
    return std::unexpected(std::move(error));
}

template <typename T>
[[nodiscard]] Result<T> makeError(const RCPException& ex) {
    return std::unexpected(Error{ex});
}

// =============================================================================
// Utility Functions
// =============================================================================

/// @brief Return the value of a Result or throw the matching exception.
template <typename T>
[[nodiscard]] T unwrapOrThrow(Result<T> result) {
    if (result.has_value()) {
        return std::move(result.value());
    }
    result.error().throwException();
}

/// @brief Execute a function and convert RCP exceptions to Result.
/// @note Only RCPException is converted; anything else propagates.
template <typename F>
[[nodiscard]] auto tryExecute(F&& func) -> Result<std::conditional_t<
    std::is_void_v<decltype(func())>, std::monostate, decltype(func())>> {
    using ReturnType = decltype(func());
    try {
        if constexpr (std::is_void_v<ReturnType>) {
            func();
            return std::monostate{};
        } else {
            return func();
        }
    } catch (const RCPException& ex) {
        return std::unexpected(Error{ex});
    }
}

}  // namespace rcp

#endif  // RCP_COMMON_ERROR_H
