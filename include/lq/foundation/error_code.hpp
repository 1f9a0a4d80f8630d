#pragma once

/// @file error_code.hpp
/// @brief Categorized error codes for the query library.

#include <cstdint>
#include <string_view>

namespace lq::foundation {

/// Error codes categorized by subsystem using hex ranges.
///
/// Each subsystem occupies a 256-value range (0x100), making it possible
/// to determine the error source from the code value alone.
enum class ErrorCode : uint32_t {
    // General (0x0000 - 0x00FF)
    Success = 0x0000,
    Unknown = 0x0001,
    InvalidArgument = 0x0002,

    // Object system (0x0100 - 0x01FF)
    MemberNotFound = 0x0100,
    NotCallable = 0x0101,

    // Source adapters (0x0200 - 0x02FF)
    ExpectedSequence = 0x0200,
    ExpectedMapping = 0x0201,
    ExpectedProducerFunction = 0x0202,

    // Query operators (0x0300 - 0x03FF)
    ExpectedPredicate = 0x0300,
    ExpectedSelector = 0x0301,

    // Config (0x0400 - 0x04FF)
    ConfigLoadFailed = 0x0400,
    ConfigKeyNotFound = 0x0401,
    ConfigTypeMismatch = 0x0402,

    // Logger (0x0500 - 0x05FF)
    LoggerError = 0x0500,
    LoggerFlushFailed = 0x0501,
};

/// Return the subsystem name for a given error code.
constexpr std::string_view errorSubsystem(ErrorCode code) {
    auto value = static_cast<uint32_t>(code);
    auto category = value & 0xFF00;
    switch (category) {
        case 0x0000: return "General";
        case 0x0100: return "Object";
        case 0x0200: return "Source";
        case 0x0300: return "Query";
        case 0x0400: return "Config";
        case 0x0500: return "Logger";
        default: return "Unknown";
    }
}

} // namespace lq::foundation
