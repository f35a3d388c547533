#include <gtest/gtest.h>

#include <atomic>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "keyring/foundation/error_code.hpp"
#include "keyring/foundation/keyring_logger.hpp"

// kcenon headers for test infrastructure (mock logger registration)
#include <kcenon/common/interfaces/global_logger_registry.h>
#include <kcenon/common/interfaces/logger_interface.h>

using namespace keyring::foundation;
using kcenon::common::interfaces::GlobalLoggerRegistry;
using kcenon::common::interfaces::ILogger;
using kcenon::common::interfaces::log_level;

// ---------------------------------------------------------------------------
// MockLogger: captures log messages for assertion
// ---------------------------------------------------------------------------

struct LogRecord {
    log_level level;
    std::string message;
};

class MockLogger : public ILogger {
public:
    kcenon::common::VoidResult log(log_level level, const std::string& message) override {
        std::lock_guard lock(mutex_);
        records_.push_back({level, message});
        return kcenon::common::VoidResult::ok(std::monostate{});
    }

    kcenon::common::VoidResult log(
        log_level level, std::string_view message,
        const kcenon::common::interfaces::source_location& /*loc*/) override {
        return log(level, std::string(message));
    }

    kcenon::common::VoidResult log(const kcenon::common::interfaces::log_entry& entry) override {
        return log(entry.level, entry.message);
    }

    bool is_enabled(log_level level) const override {
        return level >= minLevel_.load(std::memory_order_acquire);
    }

    kcenon::common::VoidResult set_level(log_level level) override {
        minLevel_.store(level, std::memory_order_release);
        return kcenon::common::VoidResult::ok(std::monostate{});
    }

    log_level get_level() const override { return minLevel_.load(std::memory_order_acquire); }

    kcenon::common::VoidResult flush() override {
        flushed_.store(true, std::memory_order_release);
        return kcenon::common::VoidResult::ok(std::monostate{});
    }

    std::vector<LogRecord> records() const {
        std::lock_guard lock(mutex_);
        return records_;
    }

    bool wasFlushed() const { return flushed_.load(std::memory_order_acquire); }

private:
    mutable std::mutex mutex_;
    std::vector<LogRecord> records_;
    std::atomic<log_level> minLevel_{log_level::trace};
    std::atomic<bool> flushed_{false};
};

// ---------------------------------------------------------------------------
// Test fixture: registers a MockLogger as the default logger
// ---------------------------------------------------------------------------

class KeyringLoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto& registry = GlobalLoggerRegistry::instance();
        registry.clear();
        mockLogger_ = std::make_shared<MockLogger>();
        registry.set_default_logger(mockLogger_);
    }

    void TearDown() override { GlobalLoggerRegistry::instance().clear(); }

    std::shared_ptr<MockLogger> mockLogger_;
};

// ===========================================================================
// Name helpers
// ===========================================================================

TEST(LogCategoryTest, AllCategoryNamesAreValid) {
    EXPECT_EQ(logCategoryName(LogCategory::Core), "Core");
    EXPECT_EQ(logCategoryName(LogCategory::KeyGen), "KeyGen");
    EXPECT_EQ(logCategoryName(LogCategory::KeyStore), "KeyStore");
    EXPECT_EQ(logCategoryName(LogCategory::Rotation), "Rotation");
    EXPECT_EQ(logCategoryName(LogCategory::Token), "Token");
    EXPECT_EQ(logCategoryName(LogCategory::Config), "Config");
}

TEST(LogCategoryTest, CategoryCountIsSix) {
    EXPECT_EQ(kLogCategoryCount, 6u);
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

// ===========================================================================
// Level control (no backend needed)
// ===========================================================================

TEST(KeyringLoggerBasicTest, DefaultCategoryLevels) {
    KeyringLogger logger;
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Core), LogLevel::Info);
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::KeyGen), LogLevel::Info);
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::KeyStore), LogLevel::Info);
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Rotation), LogLevel::Info);
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Token), LogLevel::Warning);
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Config), LogLevel::Info);
}

TEST(KeyringLoggerBasicTest, TokenCategoryQuietByDefault) {
    KeyringLogger logger;
    EXPECT_FALSE(logger.isEnabled(LogLevel::Info, LogCategory::Token));
    EXPECT_TRUE(logger.isEnabled(LogLevel::Warning, LogCategory::Token));
}

TEST(KeyringLoggerBasicTest, SetCategoryLevelChangesFiltering) {
    KeyringLogger logger;
    logger.setCategoryLevel(LogCategory::Rotation, LogLevel::Trace);
    EXPECT_TRUE(logger.isEnabled(LogLevel::Trace, LogCategory::Rotation));

    logger.setCategoryLevel(LogCategory::Rotation, LogLevel::Error);
    EXPECT_FALSE(logger.isEnabled(LogLevel::Warning, LogCategory::Rotation));
    EXPECT_TRUE(logger.isEnabled(LogLevel::Error, LogCategory::Rotation));
}

TEST(KeyringLoggerBasicTest, OffDisablesEverything) {
    KeyringLogger logger;
    logger.setCategoryLevel(LogCategory::KeyStore, LogLevel::Off);
    EXPECT_FALSE(logger.isEnabled(LogLevel::Critical, LogCategory::KeyStore));
}

TEST(KeyringLoggerBasicTest, InvalidCategoryReturnsOff) {
    KeyringLogger logger;
    auto invalid = static_cast<LogCategory>(200);
    EXPECT_EQ(logger.getCategoryLevel(invalid), LogLevel::Off);
    EXPECT_FALSE(logger.isEnabled(LogLevel::Critical, invalid));
}

TEST(KeyringLoggerBasicTest, MoveConstruction) {
    KeyringLogger a;
    a.setCategoryLevel(LogCategory::Core, LogLevel::Error);
    KeyringLogger b(std::move(a));
    EXPECT_EQ(b.getCategoryLevel(LogCategory::Core), LogLevel::Error);
}

// ===========================================================================
// Output through the kcenon registry
// ===========================================================================

TEST_F(KeyringLoggerTest, LogFormatsMessageWithCategory) {
    KeyringLogger logger;
    logger.log(LogLevel::Info, LogCategory::Rotation, "Rotation scheduler started");

    auto records = mockLogger_->records();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].level, log_level::info);
    EXPECT_EQ(records[0].message, "[Rotation] Rotation scheduler started");
}

TEST_F(KeyringLoggerTest, LogFiltersMessagesBelowLevel) {
    KeyringLogger logger;
    logger.log(LogLevel::Debug, LogCategory::Core, "hidden");
    logger.log(LogLevel::Info, LogCategory::Token, "hidden too");
    EXPECT_TRUE(mockLogger_->records().empty());
}

TEST_F(KeyringLoggerTest, LogLevelsMapToBackend) {
    KeyringLogger logger;
    logger.setCategoryLevel(LogCategory::Core, LogLevel::Trace);
    logger.log(LogLevel::Trace, LogCategory::Core, "t");
    logger.log(LogLevel::Warning, LogCategory::Core, "w");
    logger.log(LogLevel::Critical, LogCategory::Core, "c");

    auto records = mockLogger_->records();
    ASSERT_EQ(records.size(), 3u);
    EXPECT_EQ(records[0].level, log_level::trace);
    EXPECT_EQ(records[1].level, log_level::warning);
    EXPECT_EQ(records[2].level, log_level::critical);
}

TEST_F(KeyringLoggerTest, LogWithContextIncludesKeyIdAndEpoch) {
    KeyringLogger logger;
    LogContext ctx;
    ctx.keyId = "kid-1";
    ctx.rotationEpoch = 4;
    logger.logWithContext(LogLevel::Info, LogCategory::KeyStore, "Standby promoted", ctx);

    auto records = mockLogger_->records();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].message, "[KeyStore] Standby promoted {kid=kid-1, epoch=4}");
}

TEST_F(KeyringLoggerTest, LogWithContextExtraFields) {
    KeyringLogger logger;
    LogContext ctx;
    ctx.extra["trigger"] = "forced";
    logger.logWithContext(LogLevel::Info, LogCategory::Rotation, "Rotation completed", ctx);

    auto records = mockLogger_->records();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_NE(records[0].message.find("trigger=forced"), std::string::npos);
}

TEST_F(KeyringLoggerTest, EmptyContextAddsNoBraces) {
    KeyringLogger logger;
    logger.logWithContext(LogLevel::Info, LogCategory::Core, "plain", LogContext{});

    auto records = mockLogger_->records();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].message, "[Core] plain");
}

TEST_F(KeyringLoggerTest, MacroRespectsCategoryLevel) {
    auto& logger = KeyringLogger::instance();
    auto previous = logger.getCategoryLevel(LogCategory::Config);
    logger.setCategoryLevel(LogCategory::Config, LogLevel::Warning);

    KEYRING_LOG_INFO(LogCategory::Config, "filtered");
    KEYRING_LOG_WARN(LogCategory::Config, "kept");

    logger.setCategoryLevel(LogCategory::Config, previous);

    auto records = mockLogger_->records();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].message, "[Config] kept");
}

TEST_F(KeyringLoggerTest, FlushReachesBackend) {
    KeyringLogger logger;
    auto result = logger.flush();
    EXPECT_TRUE(result.hasValue());
    EXPECT_TRUE(mockLogger_->wasFlushed());
}

TEST_F(KeyringLoggerTest, ConcurrentLoggingKeepsEveryRecord) {
    KeyringLogger logger;
    constexpr int kThreads = 4;
    constexpr int kPerThread = 50;

    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&logger]() {
            for (int i = 0; i < kPerThread; ++i) {
                logger.log(LogLevel::Info, LogCategory::Core, "tick");
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }
    EXPECT_EQ(mockLogger_->records().size(), static_cast<std::size_t>(kThreads * kPerThread));
}

TEST(LoggerErrorCodeTest, SubsystemLookup) {
    EXPECT_EQ(errorSubsystem(ErrorCode::LoggerError), "Logger");
    EXPECT_EQ(errorSubsystem(ErrorCode::LoggerFlushFailed), "Logger");
}
