#include <gtest/gtest.h>

#include <array>
#include <atomic>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "lq/foundation/config_manager.hpp"
#include "lq/foundation/error_code.hpp"
#include "lq/foundation/logging_config.hpp"
#include "lq/foundation/query_logger.hpp"
#include "lq/query/sources.hpp"

// kcenon headers for test infrastructure (mock logger registration)
#include <kcenon/common/interfaces/global_logger_registry.h>
#include <kcenon/common/interfaces/logger_interface.h>

using namespace lq::foundation;
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

class QueryLoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto& registry = GlobalLoggerRegistry::instance();
        registry.clear();
        mockLogger_ = std::make_shared<MockLogger>();
        registry.set_default_logger(mockLogger_);
        saveSingletonLevels();
    }

    void TearDown() override {
        restoreSingletonLevels();
        GlobalLoggerRegistry::instance().clear();
    }

    bool recorded(std::string_view needle) const {
        for (const auto& r : mockLogger_->records()) {
            if (r.message.find(needle) != std::string::npos) {
                return true;
            }
        }
        return false;
    }

    std::shared_ptr<MockLogger> mockLogger_;

private:
    void saveSingletonLevels() {
        for (std::size_t i = 0; i < kLogCategoryCount; ++i) {
            saved_[i] = QueryLogger::instance().getCategoryLevel(static_cast<LogCategory>(i));
        }
    }

    void restoreSingletonLevels() {
        for (std::size_t i = 0; i < kLogCategoryCount; ++i) {
            QueryLogger::instance().setCategoryLevel(static_cast<LogCategory>(i), saved_[i]);
        }
    }

    std::array<LogLevel, kLogCategoryCount> saved_{};
};

// ---------------------------------------------------------------------------
// ErrorCode: Logger subsystem lookup
// ---------------------------------------------------------------------------

TEST(LoggerErrorCodeTest, SubsystemLookup) {
    EXPECT_EQ(errorSubsystem(ErrorCode::LoggerError), "Logger");
    EXPECT_EQ(errorSubsystem(ErrorCode::LoggerFlushFailed), "Logger");
}

// ---------------------------------------------------------------------------
// LogCategory / LogLevel helpers
// ---------------------------------------------------------------------------

TEST(LogCategoryTest, AllCategoryNamesAreValid) {
    EXPECT_EQ(logCategoryName(LogCategory::Core), "Core");
    EXPECT_EQ(logCategoryName(LogCategory::Object), "Object");
    EXPECT_EQ(logCategoryName(LogCategory::Source), "Source");
    EXPECT_EQ(logCategoryName(LogCategory::Query), "Query");
    EXPECT_EQ(logCategoryName(static_cast<LogCategory>(42)), "Unknown");
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

TEST(LogLevelTest, ParseIsCaseInsensitive) {
    EXPECT_EQ(parseLogLevel("trace"), LogLevel::Trace);
    EXPECT_EQ(parseLogLevel("DEBUG"), LogLevel::Debug);
    EXPECT_EQ(parseLogLevel("Info"), LogLevel::Info);
    EXPECT_EQ(parseLogLevel("warn"), LogLevel::Warning);
    EXPECT_EQ(parseLogLevel("Warning"), LogLevel::Warning);
    EXPECT_EQ(parseLogLevel("error"), LogLevel::Error);
    EXPECT_EQ(parseLogLevel("critical"), LogLevel::Critical);
    EXPECT_EQ(parseLogLevel("OFF"), LogLevel::Off);
    EXPECT_FALSE(parseLogLevel("verbose").has_value());
    EXPECT_FALSE(parseLogLevel("").has_value());
}

// ---------------------------------------------------------------------------
// Construction and levels
// ---------------------------------------------------------------------------

TEST(QueryLoggerBasicTest, MoveConstruction) {
    QueryLogger a;
    a.setCategoryLevel(LogCategory::Query, LogLevel::Trace);
    QueryLogger b(std::move(a));
    EXPECT_EQ(b.getCategoryLevel(LogCategory::Query), LogLevel::Trace);
}

TEST(QueryLoggerBasicTest, DefaultCategoryLevels) {
    QueryLogger logger;
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Core), LogLevel::Info);
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Object), LogLevel::Info);
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Source), LogLevel::Warning);
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Query), LogLevel::Warning);
}

TEST(QueryLoggerBasicTest, IsEnabledRespectsDefaultLevels) {
    QueryLogger logger;
    EXPECT_FALSE(logger.isEnabled(LogLevel::Debug, LogCategory::Core));
    EXPECT_TRUE(logger.isEnabled(LogLevel::Info, LogCategory::Core));

    EXPECT_FALSE(logger.isEnabled(LogLevel::Info, LogCategory::Query));
    EXPECT_TRUE(logger.isEnabled(LogLevel::Warning, LogCategory::Query));
}

TEST(QueryLoggerBasicTest, SetCategoryLevelChangesFiltering) {
    QueryLogger logger;
    logger.setCategoryLevel(LogCategory::Source, LogLevel::Trace);
    EXPECT_TRUE(logger.isEnabled(LogLevel::Trace, LogCategory::Source));

    logger.setCategoryLevel(LogCategory::Source, LogLevel::Error);
    EXPECT_FALSE(logger.isEnabled(LogLevel::Warning, LogCategory::Source));
    EXPECT_TRUE(logger.isEnabled(LogLevel::Error, LogCategory::Source));
}

TEST(QueryLoggerBasicTest, OffDisablesEverything) {
    QueryLogger logger;
    logger.setCategoryLevel(LogCategory::Object, LogLevel::Off);
    EXPECT_FALSE(logger.isEnabled(LogLevel::Critical, LogCategory::Object));

    // Off is a threshold, never a message level.
    logger.setCategoryLevel(LogCategory::Object, LogLevel::Trace);
    EXPECT_FALSE(logger.isEnabled(LogLevel::Off, LogCategory::Object));
}

TEST(QueryLoggerBasicTest, InvalidCategoryReturnsOff) {
    QueryLogger logger;
    auto invalid = static_cast<LogCategory>(99);
    EXPECT_EQ(logger.getCategoryLevel(invalid), LogLevel::Off);
    EXPECT_FALSE(logger.isEnabled(LogLevel::Critical, invalid));
}

TEST(QueryLoggerSingletonTest, InstanceReturnsSameObject) {
    EXPECT_EQ(&QueryLogger::instance(), &QueryLogger::instance());
}

// ---------------------------------------------------------------------------
// Emission
// ---------------------------------------------------------------------------

TEST_F(QueryLoggerTest, LogFormatsMessageWithCategory) {
    QueryLogger logger;
    logger.log(LogLevel::Info, LogCategory::Core, "library ready");

    auto records = mockLogger_->records();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].level, log_level::info);
    EXPECT_EQ(records[0].message, "[Core] library ready");
}

TEST_F(QueryLoggerTest, LogFiltersMessagesBelowLevel) {
    QueryLogger logger;
    logger.log(LogLevel::Info, LogCategory::Query, "filtered");
    EXPECT_TRUE(mockLogger_->records().empty());
}

TEST_F(QueryLoggerTest, LogAllLevels) {
    QueryLogger logger;
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

TEST_F(QueryLoggerTest, LogWithContextIncludesFields) {
    QueryLogger logger;
    logger.setCategoryLevel(LogCategory::Query, LogLevel::Trace);

    LogContext ctx;
    ctx.operation = "toMapping";
    ctx.itemIndex = 3;
    ctx.extra["kind"] = "integer";
    logger.logWithContext(LogLevel::Trace, LogCategory::Query, "skipped", ctx);

    auto records = mockLogger_->records();
    ASSERT_EQ(records.size(), 1u);
    const auto& msg = records[0].message;
    EXPECT_EQ(msg.rfind("[Query] skipped {", 0), 0u);
    EXPECT_NE(msg.find("operation=toMapping"), std::string::npos);
    EXPECT_NE(msg.find("item_index=3"), std::string::npos);
    EXPECT_NE(msg.find("kind=integer"), std::string::npos);
}

TEST_F(QueryLoggerTest, LogWithEmptyContextOmitsBraces) {
    QueryLogger logger;
    LogContext ctx;
    logger.logWithContext(LogLevel::Info, LogCategory::Core, "No context", ctx);

    auto records = mockLogger_->records();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].message, "[Core] No context");
}

TEST_F(QueryLoggerTest, FlushDelegatesToLogger) {
    QueryLogger logger;
    auto result = logger.flush();
    EXPECT_TRUE(result.hasValue());
    EXPECT_TRUE(mockLogger_->wasFlushed());
}

// ---------------------------------------------------------------------------
// LQ_LOG macros
// ---------------------------------------------------------------------------

TEST_F(QueryLoggerTest, MacroLogsWhenEnabled) {
    QueryLogger::instance().setCategoryLevel(LogCategory::Core, LogLevel::Debug);
    LQ_LOG_DEBUG(LogCategory::Core, "macro test");
    EXPECT_TRUE(recorded("macro test"));
}

TEST_F(QueryLoggerTest, MacroSkipsWhenDisabled) {
    QueryLogger::instance().setCategoryLevel(LogCategory::Core, LogLevel::Error);
    LQ_LOG_DEBUG(LogCategory::Core, "should not appear");
    EXPECT_TRUE(mockLogger_->records().empty());
}

TEST_F(QueryLoggerTest, MacroDoesNotEvaluateMessageWhenDisabled) {
    QueryLogger::instance().setCategoryLevel(LogCategory::Query, LogLevel::Error);
    int evaluated = 0;
    auto build = [&evaluated] {
        ++evaluated;
        return std::string("expensive");
    };
    LQ_LOG_INFO(LogCategory::Query, build());
    EXPECT_EQ(evaluated, 0);
}

// ---------------------------------------------------------------------------
// Library diagnostics
// ---------------------------------------------------------------------------

TEST_F(QueryLoggerTest, ToMappingTracesSkippedItems) {
    QueryLogger::instance().setCategoryLevel(LogCategory::Query, LogLevel::Trace);

    auto q = lq::query::fromSequence(lq::Value(lq::Sequence{1})).value();
    EXPECT_TRUE(q.toMapping().empty());

    EXPECT_TRUE(recorded("[Query] Skipped item that is not a key/value pair"));
    EXPECT_TRUE(recorded("operation=toMapping"));
    EXPECT_TRUE(recorded("item_index=0"));
    EXPECT_TRUE(recorded("kind=integer"));
}

TEST_F(QueryLoggerTest, NonFunctionProducerIsWarned) {
    auto factory = lq::Value::function([](lq::Arguments) { return lq::Value(5); });
    auto q = lq::query::fromFunction(factory).value();
    EXPECT_TRUE(q.toSequence().empty());
    EXPECT_TRUE(recorded("[Source] producer factory returned integer"));
}

TEST_F(QueryLoggerTest, RejectedSourceIsLoggedAtDebug) {
    QueryLogger::instance().setCategoryLevel(LogCategory::Source, LogLevel::Debug);
    auto rejected = lq::query::fromMapping(lq::Value(lq::Sequence{1}));
    ASSERT_TRUE(rejected.hasError());
    EXPECT_TRUE(recorded("[Source] fromMapping: Source: expected mapping, got sequence"));
}

TEST_F(QueryLoggerTest, DefaultLevelsKeepTraversalQuiet) {
    auto q = lq::query::fromSequence(lq::Value(lq::Sequence{1, 2})).value();
    (void)q.toMapping();
    (void)q.toSequence();
    EXPECT_TRUE(mockLogger_->records().empty());
}

// ---------------------------------------------------------------------------
// Configuration
// ---------------------------------------------------------------------------

TEST(LoggingConfigTest, KeysFollowCategoryNames) {
    EXPECT_EQ(logLevelKey(LogCategory::Core), "logging.level.core");
    EXPECT_EQ(logLevelKey(LogCategory::Query), "logging.level.query");
}

TEST(LoggingConfigTest, AppliesConfiguredLevels) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString(
        "logging:\n"
        "  level:\n"
        "    query: trace\n"
        "    source: ERROR\n").hasValue());

    QueryLogger logger;
    ASSERT_TRUE(applyLoggingConfig(config, logger).hasValue());
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Query), LogLevel::Trace);
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Source), LogLevel::Error);
    // Untouched categories keep their defaults.
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Core), LogLevel::Info);
}

TEST(LoggingConfigTest, RejectsUnknownLevel) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString("logging:\n  level:\n    object: loud\n").hasValue());

    QueryLogger logger;
    auto result = applyLoggingConfig(config, logger);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigTypeMismatch);
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Object), LogLevel::Info);
}

// ---------------------------------------------------------------------------
// Thread safety
// ---------------------------------------------------------------------------

TEST_F(QueryLoggerTest, ConcurrentLoggingIsSafe) {
    QueryLogger logger;
    logger.setCategoryLevel(LogCategory::Core, LogLevel::Trace);

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
