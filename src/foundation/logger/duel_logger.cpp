/// @file duel_logger.cpp
/// @brief DuelLogger implementation on the kcenon logger registry.

#include "duel/foundation/duel_logger.hpp"

#include <kcenon/common/interfaces/global_logger_registry.h>
#include <kcenon/common/interfaces/logger_interface.h>

#include <atomic>
#include <sstream>

namespace duel::foundation {

namespace kci = kcenon::common::interfaces;

// ---------------------------------------------------------------------------
// Level mapping: duel -> kcenon
// ---------------------------------------------------------------------------
static kci::log_level mapLevel(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return kci::log_level::trace;
        case LogLevel::Debug:    return kci::log_level::debug;
        case LogLevel::Info:     return kci::log_level::info;
        case LogLevel::Warning:  return kci::log_level::warning;
        case LogLevel::Error:    return kci::log_level::error;
        case LogLevel::Critical: return kci::log_level::critical;
        case LogLevel::Off:      return kci::log_level::off;
    }
    return kci::log_level::info;
}

static constexpr std::array<LogLevel, kLogCategoryCount> kDefaultCategoryLevels = {
    LogLevel::Info,   // Core
    LogLevel::Info,   // Config
    LogLevel::Info,   // Stats
    LogLevel::Debug,  // Combat
    LogLevel::Debug,  // Turn
    LogLevel::Info,   // Outcome
    LogLevel::Info,   // Persistence
    LogLevel::Info    // Session
};

static std::string formatContext(const LogContext& ctx) {
    std::ostringstream oss;
    bool first = true;

    auto append = [&](std::string_view key, std::string_view val) {
        if (!first) {
            oss << ", ";
        }
        oss << key << '=' << val;
        first = false;
    };

    if (ctx.matchId) {
        append("match_id", std::to_string(*ctx.matchId));
    }
    if (ctx.side && !ctx.side->empty()) {
        append("side", *ctx.side);
    }
    for (const auto& [key, val] : ctx.extra) {
        append(key, val);
    }
    return oss.str();
}

static std::string prefixed(LogCategory cat, std::string_view msg, std::size_t extra) {
    std::string formatted;
    formatted.reserve(msg.size() + extra + 16);
    formatted += '[';
    formatted += logCategoryName(cat);
    formatted += "] ";
    formatted += msg;
    return formatted;
}

// ---------------------------------------------------------------------------
// Impl
// ---------------------------------------------------------------------------
struct DuelLogger::Impl {
    std::array<std::atomic<LogLevel>, kLogCategoryCount> categoryLevels;
    std::array<std::string, kLogCategoryCount> loggerNames;

    Impl() {
        for (std::size_t i = 0; i < kLogCategoryCount; ++i) {
            categoryLevels[i].store(kDefaultCategoryLevels[i], std::memory_order_relaxed);
            loggerNames[i] = std::string("duel.") +
                std::string(logCategoryName(static_cast<LogCategory>(i)));
        }
    }

    std::shared_ptr<kci::ILogger> getLogger(LogCategory cat) const {
        auto idx = static_cast<std::size_t>(cat);
        if (idx >= kLogCategoryCount) {
            return kci::GlobalLoggerRegistry::null_logger();
        }
        auto& registry = kci::GlobalLoggerRegistry::instance();
        auto logger = registry.get_logger(loggerNames[idx]);
        // Unregistered category names resolve to the null logger.
        if (logger == kci::GlobalLoggerRegistry::null_logger()) {
            return registry.get_default_logger();
        }
        return logger;
    }
};

DuelLogger::DuelLogger() : impl_(std::make_unique<Impl>()) {}

DuelLogger::~DuelLogger() = default;

DuelLogger::DuelLogger(DuelLogger&&) noexcept = default;
DuelLogger& DuelLogger::operator=(DuelLogger&&) noexcept = default;

void DuelLogger::log(LogLevel level, LogCategory cat, std::string_view msg) {
    if (!isEnabled(level, cat)) {
        return;
    }
    auto logger = impl_->getLogger(cat);
    // Format: [Category] message
    logger->log(mapLevel(level), prefixed(cat, msg, 0));
}

void DuelLogger::logWithContext(LogLevel level, LogCategory cat,
                                std::string_view msg, const LogContext& ctx) {
    if (!isEnabled(level, cat)) {
        return;
    }
    auto logger = impl_->getLogger(cat);
    std::string ctxStr = formatContext(ctx);

    // Format: [Category] message {key=val, ...}
    std::string formatted = prefixed(cat, msg, ctxStr.size() + 4);
    if (!ctxStr.empty()) {
        formatted += " {";
        formatted += ctxStr;
        formatted += '}';
    }
    logger->log(mapLevel(level), formatted);
}

void DuelLogger::setCategoryLevel(LogCategory cat, LogLevel minLevel) {
    auto idx = static_cast<std::size_t>(cat);
    if (idx < kLogCategoryCount) {
        impl_->categoryLevels[idx].store(minLevel, std::memory_order_release);
    }
}

LogLevel DuelLogger::getCategoryLevel(LogCategory cat) const {
    auto idx = static_cast<std::size_t>(cat);
    if (idx < kLogCategoryCount) {
        return impl_->categoryLevels[idx].load(std::memory_order_acquire);
    }
    return LogLevel::Off;
}

bool DuelLogger::isEnabled(LogLevel level, LogCategory cat) const {
    auto idx = static_cast<std::size_t>(cat);
    if (idx >= kLogCategoryCount || level == LogLevel::Off) {
        return false;
    }
    auto minLevel = impl_->categoryLevels[idx].load(std::memory_order_acquire);
    return static_cast<uint8_t>(level) >= static_cast<uint8_t>(minLevel);
}

DuelResult<void> DuelLogger::flush() {
    auto logger = kci::GlobalLoggerRegistry::instance().get_default_logger();
    auto result = logger->flush();
    if (result.is_err()) {
        return DuelResult<void>::err(
            DuelError(ErrorCode::LoggerFlushFailed, "failed to flush logger"));
    }
    return DuelResult<void>::ok();
}

DuelLogger& DuelLogger::instance() {
    static DuelLogger inst;
    return inst;
}

} // namespace duel::foundation
