#include <gtest/gtest.h>

#include <atomic>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "ger/foundation/error_code.hpp"
#include "ger/foundation/game_error.hpp"
#include "ger/foundation/game_logger.hpp"

// kcenon headers for test infrastructure (mock logger registration)
#include <kcenon/common/interfaces/global_logger_registry.h>
#include <kcenon/common/interfaces/logger_interface.h>

using namespace ger::foundation;
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

// ---------------------------------------------------------------------------
// Test fixture: registers a MockLogger as the default logger
// ---------------------------------------------------------------------------

class GameLoggerTest : public ::testing::Test {
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
// ErrorCode: Logger subsystem lookup
// ---------------------------------------------------------------------------

TEST(LoggerErrorCodeTest, SubsystemLookup) {
    EXPECT_EQ(errorSubsystem(ErrorCode::LoggerError), "Logger");
    EXPECT_EQ(errorSubsystem(ErrorCode::LoggerFlushFailed), "Logger");
}

TEST(LoggerErrorCodeTest, GameErrorSubsystem) {
    GameError err(ErrorCode::LoggerFlushFailed, "test");
    EXPECT_EQ(err.subsystem(), "Logger");
}

// ---------------------------------------------------------------------------
// LogCategory / LogLevel helpers
// ---------------------------------------------------------------------------

TEST(LogCategoryTest, AllCategoryNamesAreValid) {
    EXPECT_EQ(logCategoryName(LogCategory::Core), "Core");
    EXPECT_EQ(logCategoryName(LogCategory::Registry), "Registry");
    EXPECT_EQ(logCategoryName(LogCategory::Entity), "Entity");
    EXPECT_EQ(logCategoryName(LogCategory::Serialization), "Serialization");
    EXPECT_EQ(logCategoryName(LogCategory::Config), "Config");
    EXPECT_EQ(logCategoryName(static_cast<LogCategory>(42)), "Unknown");
}

TEST(LogCategoryTest, CategoryCountIsFive) {
    EXPECT_EQ(kLogCategoryCount, 5u);
}

TEST(LogCategoryTest, ParseIsCaseInsensitive) {
    EXPECT_EQ(parseLogCategory("registry"), LogCategory::Registry);
    EXPECT_EQ(parseLogCategory("SERIALIZATION"), LogCategory::Serialization);
    EXPECT_EQ(parseLogCategory("Entity"), LogCategory::Entity);
    EXPECT_FALSE(parseLogCategory("network").has_value());
}

TEST(LogLevelTest, AllLevelNamesAreValid) {
    EXPECT_EQ(logLevelName(LogLevel::Trace), "TRACE");
    EXPECT_EQ(logLevelName(LogLevel::Debug), "DEBUG");
    EXPECT_EQ(logLevelName(LogLevel::Info), "INFO");
    EXPECT_EQ(logLevelName(LogLevel::Warning), "WARNING");
    EXPECT_EQ(logLevelName(LogLevel::Error), "ERROR");
    EXPECT_EQ(logLevelName(LogLevel::Critical), "CRITICAL");
    EXPECT_EQ(logLevelName(LogLevel::Off), "OFF");
}

TEST(LogLevelTest, ParseAcceptsAliases) {
    EXPECT_EQ(parseLogLevel("trace"), LogLevel::Trace);
    EXPECT_EQ(parseLogLevel("Debug"), LogLevel::Debug);
    EXPECT_EQ(parseLogLevel("warn"), LogLevel::Warning);
    EXPECT_EQ(parseLogLevel("WARNING"), LogLevel::Warning);
    EXPECT_EQ(parseLogLevel("off"), LogLevel::Off);
    EXPECT_FALSE(parseLogLevel("verbose").has_value());
    EXPECT_FALSE(parseLogLevel("").has_value());
}

// ---------------------------------------------------------------------------
// Construction
// ---------------------------------------------------------------------------

TEST(GameLoggerBasicTest, MoveConstruction) {
    GameLogger a;
    a.setCategoryLevel(LogCategory::Config, LogLevel::Error);
    GameLogger b(std::move(a));
    EXPECT_EQ(b.getCategoryLevel(LogCategory::Config), LogLevel::Error);
}

TEST(GameLoggerBasicTest, MoveAssignment) {
    GameLogger a;
    a.setCategoryLevel(LogCategory::Core, LogLevel::Trace);
    GameLogger b;
    b = std::move(a);
    EXPECT_EQ(b.getCategoryLevel(LogCategory::Core), LogLevel::Trace);
}

TEST(GameLoggerBasicTest, DefaultCategoryLevels) {
    GameLogger logger;
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Core), LogLevel::Info);
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Registry), LogLevel::Info);
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Entity), LogLevel::Debug);
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Serialization), LogLevel::Info);
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Config), LogLevel::Info);
}

// ---------------------------------------------------------------------------
// isEnabled / setCategoryLevel
// ---------------------------------------------------------------------------

TEST(GameLoggerBasicTest, IsEnabledRespectsDefaultLevels) {
    GameLogger logger;
    // Registry defaults to Info
    EXPECT_FALSE(logger.isEnabled(LogLevel::Debug, LogCategory::Registry));
    EXPECT_TRUE(logger.isEnabled(LogLevel::Info, LogCategory::Registry));

    // Entity defaults to Debug
    EXPECT_TRUE(logger.isEnabled(LogLevel::Debug, LogCategory::Entity));
    EXPECT_FALSE(logger.isEnabled(LogLevel::Trace, LogCategory::Entity));
}

TEST(GameLoggerBasicTest, SetCategoryLevelChangesFiltering) {
    GameLogger logger;
    logger.setCategoryLevel(LogCategory::Registry, LogLevel::Trace);
    EXPECT_TRUE(logger.isEnabled(LogLevel::Trace, LogCategory::Registry));

    logger.setCategoryLevel(LogCategory::Registry, LogLevel::Error);
    EXPECT_FALSE(logger.isEnabled(LogLevel::Warning, LogCategory::Registry));
    EXPECT_TRUE(logger.isEnabled(LogLevel::Error, LogCategory::Registry));
}

TEST(GameLoggerBasicTest, OffDisablesEverything) {
    GameLogger logger;
    logger.setCategoryLevel(LogCategory::Serialization, LogLevel::Off);
    EXPECT_FALSE(logger.isEnabled(LogLevel::Critical, LogCategory::Serialization));

    // "Off" is never a message level
    logger.setCategoryLevel(LogCategory::Core, LogLevel::Trace);
    EXPECT_FALSE(logger.isEnabled(LogLevel::Off, LogCategory::Core));
}

TEST(GameLoggerBasicTest, InvalidCategoryReturnsOff) {
    GameLogger logger;
    auto invalid = static_cast<LogCategory>(99);
    EXPECT_EQ(logger.getCategoryLevel(invalid), LogLevel::Off);
    EXPECT_FALSE(logger.isEnabled(LogLevel::Critical, invalid));
}

// ---------------------------------------------------------------------------
// Basic logging
// ---------------------------------------------------------------------------

TEST_F(GameLoggerTest, LogFormatsMessageWithCategory) {
    GameLogger logger;
    logger.log(LogLevel::Info, LogCategory::Registry, "Manager created");

    auto records = mockLogger_->records();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].level, log_level::info);
    EXPECT_EQ(records[0].message, "[Registry] Manager created");
}

TEST_F(GameLoggerTest, LogFiltersMessagesBelowLevel) {
    GameLogger logger;
    logger.setCategoryLevel(LogCategory::Core, LogLevel::Warning);
    logger.log(LogLevel::Info, LogCategory::Core, "Should be filtered");

    EXPECT_TRUE(mockLogger_->records().empty());
}

TEST_F(GameLoggerTest, LogAllLevels) {
    GameLogger logger;
    logger.setCategoryLevel(LogCategory::Core, LogLevel::Trace);

    logger.log(LogLevel::Trace, LogCategory::Core, "trace");
    logger.log(LogLevel::Debug, LogCategory::Core, "debug");
    logger.log(LogLevel::Info, LogCategory::Core, "info");
    logger.log(LogLevel::Warning, LogCategory::Core, "warn");
    logger.log(LogLevel::Error, LogCategory::Core, "error");
    logger.log(LogLevel::Critical, LogCategory::Core, "critical");

    auto records = mockLogger_->records();
    ASSERT_EQ(records.size(), 6u);
    EXPECT_EQ(records[0].level, log_level::trace);
    EXPECT_EQ(records[1].level, log_level::debug);
    EXPECT_EQ(records[2].level, log_level::info);
    EXPECT_EQ(records[3].level, log_level::warning);
    EXPECT_EQ(records[4].level, log_level::error);
    EXPECT_EQ(records[5].level, log_level::critical);
}

// ---------------------------------------------------------------------------
// Structured logging with context
// ---------------------------------------------------------------------------

TEST_F(GameLoggerTest, LogWithContextIncludesFields) {
    GameLogger logger;

    LogContext ctx;
    ctx.managerId = ManagerId(7);
    ctx.entityId = EntityId(0);
    ctx.extra["type"] = "PLAYER";

    logger.logWithContext(LogLevel::Info, LogCategory::Registry,
                          "Entity added", ctx);

    auto records = mockLogger_->records();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].message,
              "[Registry] Entity added {manager_id=7, entity_id=0, type=PLAYER}");
}

TEST_F(GameLoggerTest, LogWithEmptyContextOmitsBraces) {
    GameLogger logger;

    LogContext ctx;
    logger.logWithContext(LogLevel::Info, LogCategory::Core, "No context", ctx);

    auto records = mockLogger_->records();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].message, "[Core] No context");
}

TEST_F(GameLoggerTest, LogWithContextFilteredBelowLevel) {
    GameLogger logger;
    logger.setCategoryLevel(LogCategory::Entity, LogLevel::Warning);

    LogContext ctx;
    ctx.entityId = EntityId(1);
    logger.logWithContext(LogLevel::Debug, LogCategory::Entity, "filtered", ctx);

    EXPECT_TRUE(mockLogger_->records().empty());
}

// ---------------------------------------------------------------------------
// Flush
// ---------------------------------------------------------------------------

TEST_F(GameLoggerTest, FlushDelegatesToLogger) {
    GameLogger logger;
    auto result = logger.flush();
    EXPECT_TRUE(result.hasValue());
    EXPECT_TRUE(mockLogger_->wasFlushed());
}

// ---------------------------------------------------------------------------
// Singleton instance
// ---------------------------------------------------------------------------

TEST(GameLoggerSingletonTest, InstanceReturnsSameObject) {
    auto& a = GameLogger::instance();
    auto& b = GameLogger::instance();
    EXPECT_EQ(&a, &b);
}

// ---------------------------------------------------------------------------
// GER_LOG macros
// ---------------------------------------------------------------------------

TEST_F(GameLoggerTest, MacroLogsWhenEnabled) {
    GameLogger::instance().setCategoryLevel(LogCategory::Core, LogLevel::Debug);

    GER_LOG_DEBUG(LogCategory::Core, "macro test");

    auto records = mockLogger_->records();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].message, "[Core] macro test");

    GameLogger::instance().setCategoryLevel(LogCategory::Core, LogLevel::Info);
}

TEST_F(GameLoggerTest, MacroSkipsWhenDisabled) {
    GameLogger::instance().setCategoryLevel(LogCategory::Core, LogLevel::Error);

    GER_LOG_DEBUG(LogCategory::Core, "should not appear");
    GER_LOG_WARN(LogCategory::Core, "should not appear either");

    EXPECT_TRUE(mockLogger_->records().empty());

    GameLogger::instance().setCategoryLevel(LogCategory::Core, LogLevel::Info);
}

TEST_F(GameLoggerTest, ContextMacroCarriesIds) {
    LogContext ctx;
    ctx.managerId = ManagerId(3);
    GER_LOG_CTX(LogLevel::Error, LogCategory::Serialization, "decode failed", ctx);

    auto records = mockLogger_->records();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].level, log_level::error);
    EXPECT_EQ(records[0].message, "[Serialization] decode failed {manager_id=3}");
}

// ---------------------------------------------------------------------------
// Thread safety: concurrent logging from multiple threads
// ---------------------------------------------------------------------------

TEST_F(GameLoggerTest, ConcurrentLoggingIsSafe) {
    GameLogger logger;
    logger.setCategoryLevel(LogCategory::Registry, LogLevel::Trace);

    constexpr int kThreads = 8;
    constexpr int kMessagesPerThread = 100;

    std::vector<std::thread> threads;
    threads.reserve(kThreads);

    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&logger, t] {
            for (int i = 0; i < kMessagesPerThread; ++i) {
                logger.log(LogLevel::Info, LogCategory::Registry,
                           "thread " + std::to_string(t) + " msg " +
                               std::to_string(i));
            }
        });
    }

    for (auto& th : threads) {
        th.join();
    }

    EXPECT_EQ(mockLogger_->logCount(),
              static_cast<std::size_t>(kThreads * kMessagesPerThread));
}
