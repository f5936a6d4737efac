#pragma once

/// @file error_code.hpp
/// @brief Categorized error codes for the rating engine.

#include <cstdint>
#include <string_view>

namespace tre::foundation {

/// Error codes categorized by subsystem using hex ranges.
///
/// Each subsystem occupies a 256-value range (0x100), making it possible
/// to determine the error source from the code value alone.
enum class ErrorCode : uint32_t {
    // General (0x0000 - 0x00FF)
    Success = 0x0000,
    Unknown = 0x0001,
    InvalidArgument = 0x0002,

    // Config (0x0600 - 0x06FF)
    ConfigLoadFailed = 0x0600,
    ConfigKeyNotFound = 0x0601,
    ConfigTypeMismatch = 0x0602,
    InvalidYearRange = 0x0603,
    InvalidTestSize = 0x0604,
    UnknownTier = 0x0605,
    InvalidParameter = 0x0606,

    // Logger (0x0800 - 0x08FF)
    LoggerFlushFailed = 0x0801,

    // Feed (0x0900 - 0x09FF)
    FeedOpenFailed = 0x0900,
    FeedMalformedHeader = 0x0901,
    MatchOutOfOrder = 0x0902,

    // Rating (0x0A00 - 0x0AFF)
    InvalidPlayer = 0x0A00,

    // Export (0x0B00 - 0x0BFF)
    ExportFailed = 0x0B00,
};

/// Return the subsystem name for a given error code.
constexpr std::string_view errorSubsystem(ErrorCode code) {
    auto value = static_cast<uint32_t>(code);
    auto category = value & 0xFF00;
    switch (category) {
        case 0x0000: return "General";
        case 0x0600: return "Config";
        case 0x0800: return "Logger";
        case 0x0900: return "Feed";
        case 0x0A00: return "Rating";
        case 0x0B00: return "Export";
        default: return "Unknown";
    }
}

/// Configuration errors are fatal and must surface before the sweep starts.
constexpr bool isConfigurationError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xFF00) == 0x0600;
}

} // namespace tre::foundation
