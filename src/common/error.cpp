// =============================================================================
// rcp-packager - Error Handling Framework Implementation
// =============================================================================

#include "rcp/common/error.h"

#include <sstream>

#include <fmt/format.h>

namespace rcp {

// =============================================================================
// ErrorContext Implementation
// =============================================================================

std::string ErrorContext::format() const {
    std::ostringstream oss;
    bool hasContent = false;

    if (!filePath.empty()) {
        oss << "file: " << filePath;
        hasContent = true;
    }

    if (fieldNumber.has_value()) {
        if (hasContent) {
            oss << ", ";
        }
        oss << "field: " << *fieldNumber;
        hasContent = true;
    }

    if (byteOffset.has_value()) {
        if (hasContent) {
            oss << ", ";
        }
        oss << "offset: 0x" << std::hex << *byteOffset;
        hasContent = true;
    }

#ifndef NDEBUG
    if (hasContent) {
        oss << " (at " << location.file_name() << ":" << std::dec << location.line() << ")";
    }
#endif

    return oss.str();
}

// =============================================================================
// RCPException Implementation
// =============================================================================

void RCPException::formatWhat() {
    std::ostringstream oss;
    oss << "[" << errorCodeToString(code_) << "] " << message_;

    if (context_.has_value()) {
        std::string contextStr = context_->format();
        if (!contextStr.empty()) {
            oss << " (" << contextStr << ")";
        }
    }

    what_ = oss.str();
}

// =============================================================================
// Message Formatting
// =============================================================================

std::string IOError::formatWithSystemError(const std::string& message, std::error_code ec) {
    return fmt::format("{}: {} (error code: {})", message, ec.message(), ec.value());
}

std::string UnknownFieldError::formatUnknownField(std::string_view messageName,
                                                  std::uint32_t fieldNumber) {
    return fmt::format("{}: unexpected field {}", messageName, fieldNumber);
}

std::string WireTypeMismatchError::formatMismatch(std::string_view messageName,
                                                  std::uint32_t fieldNumber,
                                                  std::uint32_t expected,
                                                  std::uint32_t actual) {
    return fmt::format("{}: field {} expects wire type {}, got {}", messageName, fieldNumber,
                       expected, actual);
}

std::string OutputTooLargeError::formatTooLarge(std::uint64_t requested, std::uint64_t limit) {
    return fmt::format("decompressed size {} exceeds limit of {} bytes", requested, limit);
}

// =============================================================================
// Error Implementation
// =============================================================================

[[noreturn]] void Error::throwException() const {
    switch (code_) {
        case ErrorCode::kUsageError:
            throw UsageError(message_);
        case ErrorCode::kIOError:
            throw IOError(message_);
        case ErrorCode::kFormatError:
            throw FormatError(message_);
        case ErrorCode::kChecksumError:
            throw ChecksumError(message_);
        case ErrorCode::kCompressionError:
            throw CompressionError(message_);
        case ErrorCode::kTruncatedInput:
            throw TruncatedInputError(message_);
        case ErrorCode::kColumnLengthMismatch:
            throw ColumnLengthMismatchError(message_);
        default:
            break;
    }
    // Codes whose exception types carry structured payloads are rethrown as the base type
    throw RCPException(code_, message_);
}

}  // namespace rcp
