// =============================================================================
// vq-tiers - Error Handling Framework Implementation
// =============================================================================

#include "vqt/common/error.h"

#include <sstream>

#include <fmt/format.h>

namespace vqt {

// =============================================================================
// ErrorContext Implementation
// =============================================================================

std::string ErrorContext::format() const {
    std::ostringstream oss;
    bool hasContent = false;

    if (!sourceName.empty()) {
        oss << "source: " << sourceName;
        hasContent = true;
    }

    if (lineNumber.has_value()) {
        if (hasContent) {
            oss << ", ";
        }
        oss << "line: " << *lineNumber;
        hasContent = true;
    }

    if (!locus.empty()) {
        if (hasContent) {
            oss << ", ";
        }
        oss << "at: " << locus;
        hasContent = true;
    }

#ifndef NDEBUG
    if (hasContent) {
        oss << " (at " << location.file_name() << ":" << location.line() << ")";
    }
#endif

    return oss.str();
}

// =============================================================================
// VqtException Implementation
// =============================================================================

void VqtException::formatWhat() {
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
// IOError Implementation
// =============================================================================

std::string IOError::formatWithSystemError(const std::string& message, std::error_code ec) {
    return fmt::format("{}: {} (error code: {})", message, ec.message(), ec.value());
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
        case ErrorCode::kConfigurationError:
            throw ConfigurationError(message_);
        case ErrorCode::kJoinMismatch:
            throw JoinMismatchError(message_);
        case ErrorCode::kSequenceOrder:
            throw SequenceOrderViolation(message_);
        case ErrorCode::kSuccess:
            throw VqtException(ErrorCode::kSuccess, message_);
    }
    throw VqtException(code_, message_);
}

}  // namespace vqt
