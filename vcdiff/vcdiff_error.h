#pragma once

#include <stdexcept>
#include <string>

namespace vcdelta {

enum class ErrorKind {
    BadMagic,
    UnsupportedVersion,
    UnsupportedFeature,
    InvalidIndicator,
    TruncatedInput,
    IntegerOverflow,
    LengthMismatch,
    InvalidAddress,
    ChecksumMismatch,
    LimitExceeded
};

inline const char* errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::BadMagic:           return "BadMagic";
        case ErrorKind::UnsupportedVersion: return "UnsupportedVersion";
        case ErrorKind::UnsupportedFeature: return "UnsupportedFeature";
        case ErrorKind::InvalidIndicator:   return "InvalidIndicator";
        case ErrorKind::TruncatedInput:     return "TruncatedInput";
        case ErrorKind::IntegerOverflow:    return "IntegerOverflow";
        case ErrorKind::LengthMismatch:     return "LengthMismatch";
        case ErrorKind::InvalidAddress:     return "InvalidAddress";
        case ErrorKind::ChecksumMismatch:   return "ChecksumMismatch";
        case ErrorKind::LimitExceeded:      return "LimitExceeded";
    }
    return "Unknown";
}

// Every decoding failure is reported as a VcdiffError; what() carries the
// kind name followed by the detail message.
class VcdiffError : public std::runtime_error {
public:
    VcdiffError(ErrorKind kind, const std::string& message)
        : std::runtime_error(std::string(errorKindName(kind)) + ": " + message),
          kind_(kind) {}

    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

}  // namespace vcdelta
