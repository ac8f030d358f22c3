#include <gtest/gtest.h>

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "duel/foundation/duel_logger.hpp"
#include "duel/foundation/error_code.hpp"

// kcenon headers for test infrastructure (mock logger registration)
#include <kcenon/common/interfaces/global_logger_registry.h>
#include <kcenon/common/interfaces/logger_interface.h>

using namespace duel::foundation;
using kcenon::common::interfaces::log_level;
using kcenon::common::interfaces::ILogger;
using kcenon::common::interfaces::GlobalLoggerRegistry;

// ---------------------------------------------------------------------------
// MockLogger: captures log messages for assertion
// ---------------------------------------------------------------------------

struct LogRecord {
    log_level level;
    std::string message;
};

class MockLogger : public ILogger {
public:
    kcenon::common::VoidResult log(log_level level,
                                    const std::string& message) override {
        std::lock_guard lock(mutex_);
        records_.push_back({level, message});
        logCount_.fetch_add(1, std::memory_order_relaxed);
        return kcenon::common::VoidResult::ok(std::monostate{});
    }

    kcenon::common::VoidResult log(
        log_level level, std::string_view message,
        const kcenon::common::interfaces::source_location& /*loc*/) override {
        return log(level, std::string(message));
    }

    kcenon::common::VoidResult log(
        const kcenon::common::interfaces::log_entry& entry) override {
        return log(entry.level, entry.message);
    }

    bool is_enabled(log_level level) const override {
        return level >= minLevel_.load(std::memory_order_acquire);
    }

    kcenon::common::VoidResult set_level(log_level level) override {
        minLevel_.store(level, std::memory_order_release);
        return kcenon::common::VoidResult::ok(std::monostate{});
    }

    log_level get_level() const override {
        return minLevel_.load(std::memory_order_acquire);
    }

    kcenon::common::VoidResult flush() override {
        flushed_.store(true, std::memory_order_release);
        return kcenon::common::VoidResult::ok(std::monostate{});
    }

    std::vector<LogRecord> records() const {
        std::lock_guard lock(mutex_);
        return records_;
    }

    std::size_t logCount() const {
        return logCount_.load(std::memory_order_relaxed);
    }

    bool wasFlushed() const {
        return flushed_.load(std::memory_order_acquire);
    }

    void reset() {
        std::lock_guard lock(mutex_);
        records_.clear();
        logCount_.store(0, std::memory_order_relaxed);
        flushed_.store(false, std::memory_order_relaxed);
    }

private:
    mutable std::mutex mutex_;
    std::vector<LogRecord> records_;
    std::atomic<std::size_t> logCount_{0};
    std::atomic<log_level> minLevel_{log_level::trace};
    std::atomic<bool> flushed_{false};
};

class DuelLoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto& registry = GlobalLoggerRegistry::instance();
        registry.clear();
        mockLogger_ = std::make_shared<MockLogger>();
        registry.set_default_logger(mockLogger_);
    }

    void TearDown() override {
        GlobalLoggerRegistry::instance().clear();
    }

    std::shared_ptr<MockLogger> mockLogger_;
};

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

TEST(LogCategoryTest, AllCategoryNamesAreValid) {
    EXPECT_EQ(logCategoryName(LogCategory::Core), "Core");
    EXPECT_EQ(logCategoryName(LogCategory::Config), "Config");
    EXPECT_EQ(logCategoryName(LogCategory::Stats), "Stats");
    EXPECT_EQ(logCategoryName(LogCategory::Combat), "Combat");
    EXPECT_EQ(logCategoryName(LogCategory::Turn), "Turn");
    EXPECT_EQ(logCategoryName(LogCategory::Outcome), "Outcome");
    EXPECT_EQ(logCategoryName(LogCategory::Persistence), "Persistence");
    EXPECT_EQ(logCategoryName(LogCategory::Session), "Session");
    EXPECT_EQ(kLogCategoryCount, 8u);
}

TEST(LogLevelTest, AllLevelNamesAreValid) {
    EXPECT_EQ(logLevelName(LogLevel::Trace), "TRACE");
    EXPECT_EQ(logLevelName(LogLevel::Warning), "WARNING");
    EXPECT_EQ(logLevelName(LogLevel::Off), "OFF");
}

// ---------------------------------------------------------------------------
// Category levels
// ---------------------------------------------------------------------------

TEST(DuelLoggerBasicTest, DefaultCategoryLevels) {
    DuelLogger logger;
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Core), LogLevel::Info);
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Config), LogLevel::Info);
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Stats), LogLevel::Info);
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Combat), LogLevel::Debug);
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Turn), LogLevel::Debug);
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Outcome), LogLevel::Info);
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Persistence), LogLevel::Info);
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Session), LogLevel::Info);
}

TEST(DuelLoggerBasicTest, SetCategoryLevelChangesFiltering) {
    DuelLogger logger;
    logger.setCategoryLevel(LogCategory::Turn, LogLevel::Trace);
    EXPECT_TRUE(logger.isEnabled(LogLevel::Trace, LogCategory::Turn));

    logger.setCategoryLevel(LogCategory::Turn, LogLevel::Error);
    EXPECT_FALSE(logger.isEnabled(LogLevel::Warning, LogCategory::Turn));
    EXPECT_TRUE(logger.isEnabled(LogLevel::Error, LogCategory::Turn));
}

TEST(DuelLoggerBasicTest, OffIsNeverEnabled) {
    DuelLogger logger;
    logger.setCategoryLevel(LogCategory::Core, LogLevel::Trace);
    EXPECT_FALSE(logger.isEnabled(LogLevel::Off, LogCategory::Core));

    logger.setCategoryLevel(LogCategory::Combat, LogLevel::Off);
    EXPECT_FALSE(logger.isEnabled(LogLevel::Critical, LogCategory::Combat));
}

TEST(DuelLoggerBasicTest, InvalidCategoryReturnsOff) {
    DuelLogger logger;
    auto invalid = static_cast<LogCategory>(42);
    EXPECT_EQ(logger.getCategoryLevel(invalid), LogLevel::Off);
    EXPECT_FALSE(logger.isEnabled(LogLevel::Critical, invalid));
}

// ---------------------------------------------------------------------------
// Logging through the registry
// ---------------------------------------------------------------------------

TEST_F(DuelLoggerTest, LogFormatsMessageWithCategory) {
    DuelLogger logger;
    logger.log(LogLevel::Info, LogCategory::Outcome, "player won");

    auto records = mockLogger_->records();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].level, log_level::info);
    EXPECT_EQ(records[0].message, "[Outcome] player won");
}

TEST_F(DuelLoggerTest, LogFiltersMessagesBelowLevel) {
    DuelLogger logger;
    logger.log(LogLevel::Debug, LogCategory::Persistence, "filtered");
    EXPECT_TRUE(mockLogger_->records().empty());
}

TEST_F(DuelLoggerTest, NamedCategoryLoggerTakesPrecedence) {
    auto combatLogger = std::make_shared<MockLogger>();
    (void)GlobalLoggerRegistry::instance().register_logger("duel.Combat", combatLogger);

    DuelLogger logger;
    logger.log(LogLevel::Info, LogCategory::Combat, "roll");
    logger.log(LogLevel::Info, LogCategory::Core, "boot");

    ASSERT_EQ(combatLogger->records().size(), 1u);
    EXPECT_EQ(combatLogger->records()[0].message, "[Combat] roll");
    ASSERT_EQ(mockLogger_->records().size(), 1u);
    EXPECT_EQ(mockLogger_->records()[0].message, "[Core] boot");
}

TEST_F(DuelLoggerTest, LogWithContextIncludesFields) {
    DuelLogger logger;

    LogContext ctx;
    ctx.matchId = 7;
    ctx.side = "enemy";
    ctx.extra["damage"] = "13";

    logger.logWithContext(LogLevel::Debug, LogCategory::Combat, "Damage applied", ctx);

    auto records = mockLogger_->records();
    ASSERT_EQ(records.size(), 1u);

    const auto& msg = records[0].message;
    EXPECT_NE(msg.find("[Combat] Damage applied {"), std::string::npos);
    EXPECT_NE(msg.find("match_id=7"), std::string::npos);
    EXPECT_NE(msg.find("side=enemy"), std::string::npos);
    EXPECT_NE(msg.find("damage=13"), std::string::npos);
}

TEST_F(DuelLoggerTest, LogWithEmptyContextOmitsBraces) {
    DuelLogger logger;
    LogContext ctx;
    logger.logWithContext(LogLevel::Info, LogCategory::Core, "No context", ctx);

    auto records = mockLogger_->records();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].message, "[Core] No context");
}

TEST_F(DuelLoggerTest, FlushDelegatesToLogger) {
    DuelLogger logger;
    auto result = logger.flush();
    EXPECT_TRUE(result.hasValue());
    EXPECT_TRUE(mockLogger_->wasFlushed());
}

TEST(DuelLoggerSingletonTest, InstanceReturnsSameObject) {
    EXPECT_EQ(&DuelLogger::instance(), &DuelLogger::instance());
}

// ---------------------------------------------------------------------------
// DUEL_LOG macros
// ---------------------------------------------------------------------------

TEST_F(DuelLoggerTest, MacroLogsWhenEnabled) {
    DuelLogger::instance().setCategoryLevel(LogCategory::Session, LogLevel::Debug);

    DUEL_LOG_DEBUG(LogCategory::Session, "macro test");

    bool found = false;
    for (const auto& r : mockLogger_->records()) {
        if (r.message == "[Session] macro test") {
            found = true;
        }
    }
    EXPECT_TRUE(found);
    DuelLogger::instance().setCategoryLevel(LogCategory::Session, LogLevel::Info);
}

TEST_F(DuelLoggerTest, MacroSkipsWhenDisabled) {
    DuelLogger::instance().setCategoryLevel(LogCategory::Session, LogLevel::Error);
    mockLogger_->reset();

    DUEL_LOG_WARN(LogCategory::Session, "should not appear");

    EXPECT_TRUE(mockLogger_->records().empty());
    DuelLogger::instance().setCategoryLevel(LogCategory::Session, LogLevel::Info);
}

TEST_F(DuelLoggerTest, ConcurrentLoggingIsSafe) {
    DuelLogger logger;

    constexpr int kThreads = 8;
    constexpr int kMessagesPerThread = 100;

    std::vector<std::thread> threads;
    threads.reserve(kThreads);
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&logger, t] {
            for (int i = 0; i < kMessagesPerThread; ++i) {
                logger.log(LogLevel::Info, LogCategory::Core,
                           "thread " + std::to_string(t) + " msg " + std::to_string(i));
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }

    EXPECT_EQ(mockLogger_->logCount(), static_cast<std::size_t>(kThreads * kMessagesPerThread));
}
