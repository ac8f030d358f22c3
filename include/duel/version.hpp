#pragma once

/// @file version.hpp
/// @brief Project version information and core namespace definition.

#define DUEL_VERSION_MAJOR 1
#define DUEL_VERSION_MINOR 0
#define DUEL_VERSION_PATCH 0
#define DUEL_VERSION_STRING "1.0.0"

namespace duel {

/// Library version known at compile time.
struct Version {
    static constexpr int major = DUEL_VERSION_MAJOR;
    static constexpr int minor = DUEL_VERSION_MINOR;
    static constexpr int patch = DUEL_VERSION_PATCH;
    static constexpr const char* string = DUEL_VERSION_STRING;
};

} // namespace duel
