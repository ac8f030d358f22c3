#pragma once

/// @file error_code.hpp
/// @brief Categorized error codes for the duel engine.

#include <cstdint>
#include <string_view>

namespace duel::foundation {

/// Error codes grouped by subsystem.
///
/// Each subsystem owns a 256-value range (0x100) so the source of an error
/// can be read off the code alone.
enum class ErrorCode : uint32_t {
    // General (0x0000 - 0x00FF)
    Success = 0x0000,
    Unknown = 0x0001,
    InvalidArgument = 0x0002,
    InvalidState = 0x0003,

    // Config (0x0100 - 0x01FF)
    ConfigLoadFailed = 0x0100,
    ConfigKeyNotFound = 0x0101,
    ConfigTypeMismatch = 0x0102,
    ConfigInvalidValue = 0x0103,

    // Persistence (0x0200 - 0x02FF)
    PersistenceReadFailed = 0x0200,
    PersistenceWriteFailed = 0x0201,

    // Battle (0x0300 - 0x03FF)
    NoActiveMatch = 0x0300,

    // Logger (0x0400 - 0x04FF)
    LoggerFlushFailed = 0x0400,
};

/// Return the subsystem name for a given error code.
constexpr std::string_view errorSubsystem(ErrorCode code) {
    auto value = static_cast<uint32_t>(code);
    switch (value & 0xFF00) {
        case 0x0000: return "General";
        case 0x0100: return "Config";
        case 0x0200: return "Persistence";
        case 0x0300: return "Battle";
        case 0x0400: return "Logger";
        default: return "Unknown";
    }
}

} // namespace duel::foundation
