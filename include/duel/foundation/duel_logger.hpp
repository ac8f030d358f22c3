#pragma once

/// @file duel_logger.hpp
/// @brief DuelLogger wrapping the kcenon logger interfaces for category-based
/// structured logging.

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "duel/foundation/duel_result.hpp"

namespace duel::foundation {

/// Log severity levels.
///
/// Maps one-to-one onto kcenon::common::interfaces::log_level.
enum class LogLevel : uint8_t {
    Trace    = 0,
    Debug    = 1,
    Info     = 2,
    Warning  = 3,
    Error    = 4,
    Critical = 5,
    Off      = 6
};

/// Engine log categories, each with its own runtime minimum level.
enum class LogCategory : uint8_t {
    Core        = 0, ///< Startup, CLI, version
    Config      = 1, ///< Configuration loading and validation
    Stats       = 2, ///< Level -> stat derivation
    Combat      = 3, ///< Hit, damage, crit and heal rolls
    Turn        = 4, ///< Phase transitions
    Outcome     = 5, ///< Win/loss consequences
    Persistence = 6, ///< Progress store I/O
    Session     = 7  ///< Run flow (new game, retry, next battle)
};

inline constexpr std::size_t kLogCategoryCount = 8;

constexpr std::string_view logCategoryName(LogCategory cat) {
    constexpr std::array<std::string_view, kLogCategoryCount> names = {
        "Core", "Config", "Stats", "Combat", "Turn", "Outcome", "Persistence", "Session"
    };
    auto idx = static_cast<std::size_t>(cat);
    return idx < kLogCategoryCount ? names[idx] : "Unknown";
}

constexpr std::string_view logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return "TRACE";
        case LogLevel::Debug:    return "DEBUG";
        case LogLevel::Info:     return "INFO";
        case LogLevel::Warning:  return "WARNING";
        case LogLevel::Error:    return "ERROR";
        case LogLevel::Critical: return "CRITICAL";
        case LogLevel::Off:      return "OFF";
    }
    return "UNKNOWN";
}

/// Structured fields appended to a log line.
///
/// Example:
/// @code
///   LogContext ctx;
///   ctx.matchId = match.id();
///   ctx.side = "player";
///   ctx.extra["damage"] = "13";
///   logger.logWithContext(LogLevel::Debug, LogCategory::Combat,
///                         "Damage applied", ctx);
/// @endcode
struct LogContext {
    std::optional<uint64_t> matchId;
    std::optional<std::string> side;
    std::unordered_map<std::string, std::string> extra;
};

/// Category-filtered logger on top of the kcenon GlobalLoggerRegistry.
///
/// Each category resolves a named logger "duel.<Category>" and falls back
/// to the registry's default logger. The kcenon types stay behind PIMPL.
///
/// Default levels:
/// | Category    | Default Level |
/// |-------------|---------------|
/// | Core        | Info          |
/// | Config      | Info          |
/// | Stats       | Info          |
/// | Combat      | Debug         |
/// | Turn        | Debug         |
/// | Outcome     | Info          |
/// | Persistence | Info          |
/// | Session     | Info          |
class DuelLogger {
public:
    DuelLogger();
    ~DuelLogger();

    DuelLogger(const DuelLogger&) = delete;
    DuelLogger& operator=(const DuelLogger&) = delete;
    DuelLogger(DuelLogger&&) noexcept;
    DuelLogger& operator=(DuelLogger&&) noexcept;

    /// Log under a category; no-op below the category's minimum level.
    void log(LogLevel level, LogCategory cat, std::string_view msg);

    /// Log with context fields rendered as " {key=val, ...}".
    void logWithContext(LogLevel level, LogCategory cat,
                        std::string_view msg, const LogContext& ctx);

    void setCategoryLevel(LogCategory cat, LogLevel minLevel);

    [[nodiscard]] LogLevel getCategoryLevel(LogCategory cat) const;

    [[nodiscard]] bool isEnabled(LogLevel level, LogCategory cat) const;

    /// Flush the default kcenon logger.
    DuelResult<void> flush();

    /// Process-wide instance used by the DUEL_LOG macros.
    static DuelLogger& instance();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace duel::foundation

// ---------------------------------------------------------------------------
// Convenience macros (global scope)
// ---------------------------------------------------------------------------

/// Define DUEL_MIN_LOG_LEVEL before including this header to compile out
/// calls below the threshold (0=Trace ... 6=Off).
#ifndef DUEL_MIN_LOG_LEVEL
    #define DUEL_MIN_LOG_LEVEL 0
#endif

#define DUEL_LOG(level, cat, msg)                                                  \
    do {                                                                           \
        _Pragma("GCC diagnostic push")                                             \
        _Pragma("GCC diagnostic ignored \"-Wtype-limits\"")                        \
        if (static_cast<int>(level) >= DUEL_MIN_LOG_LEVEL &&                       \
            ::duel::foundation::DuelLogger::instance().isEnabled((level), (cat)))  \
        {                                                                          \
            ::duel::foundation::DuelLogger::instance().log((level), (cat), (msg)); \
        }                                                                          \
        _Pragma("GCC diagnostic pop")                                              \
    } while (0)

#define DUEL_LOG_DEBUG(cat, msg) \
    DUEL_LOG(::duel::foundation::LogLevel::Debug, (cat), (msg))

#define DUEL_LOG_INFO(cat, msg) \
    DUEL_LOG(::duel::foundation::LogLevel::Info, (cat), (msg))

#define DUEL_LOG_WARN(cat, msg) \
    DUEL_LOG(::duel::foundation::LogLevel::Warning, (cat), (msg))

#define DUEL_LOG_ERROR(cat, msg) \
    DUEL_LOG(::duel::foundation::LogLevel::Error, (cat), (msg))
