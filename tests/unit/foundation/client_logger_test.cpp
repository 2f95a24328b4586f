#include <gtest/gtest.h>

#include <string>
#include <thread>
#include <vector>

#include "cgc/foundation/client_logger.hpp"
#include "cgc/foundation/error_code.hpp"
#include "support/mock_logger.hpp"

using namespace cgc::foundation;
using cgc::test::MockLoggerTest;
using kcenon::common::interfaces::log_level;

// ---------------------------------------------------------------------------
// Category / level helpers
// ---------------------------------------------------------------------------

TEST(LogCategoryTest, AllCategoryNamesAreValid) {
    EXPECT_EQ(logCategoryName(LogCategory::Core), "Core");
    EXPECT_EQ(logCategoryName(LogCategory::Connection), "Connection");
    EXPECT_EQ(logCategoryName(LogCategory::Transport), "Transport");
    EXPECT_EQ(logCategoryName(LogCategory::Codec), "Codec");
    EXPECT_EQ(logCategoryName(LogCategory::Health), "Health");
    EXPECT_EQ(logCategoryName(LogCategory::Reconnect), "Reconnect");
    EXPECT_EQ(logCategoryName(LogCategory::Scope), "Scope");
    EXPECT_EQ(logCategoryName(LogCategory::Events), "Events");
}

TEST(ClientLoggerBasicTest, IsEnabledRespectsDefaultLevels) {
    ClientLogger logger;
    EXPECT_FALSE(logger.isEnabled(LogLevel::Debug, LogCategory::Connection));
    EXPECT_TRUE(logger.isEnabled(LogLevel::Info, LogCategory::Connection));

    // Codec defaults to Warning
    EXPECT_FALSE(logger.isEnabled(LogLevel::Info, LogCategory::Codec));
    EXPECT_TRUE(logger.isEnabled(LogLevel::Warning, LogCategory::Codec));

    // Scope defaults to Debug
    EXPECT_TRUE(logger.isEnabled(LogLevel::Debug, LogCategory::Scope));
    EXPECT_FALSE(logger.isEnabled(LogLevel::Trace, LogCategory::Scope));
}

TEST(ClientLoggerBasicTest, SetCategoryLevelChangesFiltering) {
    ClientLogger logger;
    logger.setCategoryLevel(LogCategory::Health, LogLevel::Trace);
    EXPECT_TRUE(logger.isEnabled(LogLevel::Trace, LogCategory::Health));

    logger.setCategoryLevel(LogCategory::Health, LogLevel::Error);
    EXPECT_FALSE(logger.isEnabled(LogLevel::Warning, LogCategory::Health));
    EXPECT_TRUE(logger.isEnabled(LogLevel::Error, LogCategory::Health));
}

TEST(ClientLoggerBasicTest, InvalidCategoryReturnsOff) {
    ClientLogger logger;
    auto invalid = static_cast<LogCategory>(42);
    EXPECT_EQ(logger.getCategoryLevel(invalid), LogLevel::Off);
    EXPECT_FALSE(logger.isEnabled(LogLevel::Critical, invalid));
}

// ---------------------------------------------------------------------------
// Output through the kcenon registry
// ---------------------------------------------------------------------------

TEST_F(MockLoggerTest, LogPrefixesCategory) {
    ClientLogger logger;
    logger.log(LogLevel::Info, LogCategory::Connection, "connected to 10.0.0.4:4000");

    auto records = mockLogger_->records();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].level, log_level::info);
    EXPECT_EQ(records[0].message, "[Connection] connected to 10.0.0.4:4000");
}

TEST_F(MockLoggerTest, LogFiltersBelowCategoryLevel) {
    ClientLogger logger;
    logger.setCategoryLevel(LogCategory::Transport, LogLevel::Warning);
    logger.log(LogLevel::Info, LogCategory::Transport, "filtered");
    EXPECT_TRUE(mockLogger_->records().empty());
}

TEST_F(MockLoggerTest, ContextFieldsAreAppended) {
    ClientLogger logger;
    LogContext ctx;
    ctx.endpoint = "127.0.0.1:5000";
    ctx.attempt = 2;
    ctx.operation = "connect";
    logger.logWithContext(LogLevel::Warning, LogCategory::Connection, "attempt failed", ctx);

    auto records = mockLogger_->records();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].level, log_level::warning);
    EXPECT_EQ(records[0].message,
              "[Connection] attempt failed {endpoint=127.0.0.1:5000, attempt=2, op=connect}");
}

TEST_F(MockLoggerTest, EmptyContextOmitsBraces) {
    ClientLogger logger;
    logger.logWithContext(LogLevel::Error, LogCategory::Core, "plain", LogContext{});

    auto records = mockLogger_->records();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].message, "[Core] plain");
}

TEST_F(MockLoggerTest, FlushDelegatesToDefaultLogger) {
    ClientLogger logger;
    auto result = logger.flush();
    EXPECT_TRUE(result.hasValue());
    EXPECT_TRUE(mockLogger_->wasFlushed());
}

TEST_F(MockLoggerTest, MacroUsesProcessLogger) {
    CGC_LOG_ERROR(LogCategory::Reconnect, "giving up");
    EXPECT_TRUE(mockLogger_->contains("[Reconnect] giving up"));
}

TEST_F(MockLoggerTest, ConcurrentLoggingKeepsEveryRecord) {
    ClientLogger logger;
    constexpr int kThreads = 4;
    constexpr int kPerThread = 200;

    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&logger] {
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

// ---------------------------------------------------------------------------
// Error taxonomy
// ---------------------------------------------------------------------------

TEST(ErrorCodeTest, SubsystemFromRange) {
    EXPECT_EQ(errorSubsystem(ErrorCode::InvalidState), "General");
    EXPECT_EQ(errorSubsystem(ErrorCode::Backpressure), "Network");
    EXPECT_EQ(errorSubsystem(ErrorCode::FrameTooLarge), "Protocol");
    EXPECT_EQ(errorSubsystem(ErrorCode::InvalidConfig), "Config");
    EXPECT_EQ(errorSubsystem(ErrorCode::OperationCancelled), "Scope");
    EXPECT_EQ(errorSubsystem(ErrorCode::LoggerFlushFailed), "Logger");
}

TEST(ErrorCodeTest, ClassifiesFailureKinds) {
    EXPECT_EQ(classifyError(ErrorCode::ConnectionRefused), ErrorKind::Transient);
    EXPECT_EQ(classifyError(ErrorCode::ProbeTimeout), ErrorKind::Transient);
    EXPECT_EQ(classifyError(ErrorCode::MalformedFrame), ErrorKind::Protocol);
    EXPECT_EQ(classifyError(ErrorCode::HandshakeRejected), ErrorKind::Protocol);
    EXPECT_EQ(classifyError(ErrorCode::ConfigTypeMismatch), ErrorKind::Configuration);
    EXPECT_EQ(classifyError(ErrorCode::OperationCancelled), ErrorKind::Cancellation);
    EXPECT_EQ(classifyError(ErrorCode::AlreadyInProgress), ErrorKind::Usage);
    EXPECT_EQ(classifyError(ErrorCode::Success), ErrorKind::None);
}

TEST(ErrorCodeTest, ClientErrorDescribe) {
    ClientError error(ErrorCode::FrameTooLarge, "frame of 70000 bytes");
    EXPECT_EQ(error.describe(), "Protocol: frame of 70000 bytes");
    EXPECT_EQ(error.kind(), ErrorKind::Protocol);
    EXPECT_FALSE(error.isCancellation());
    EXPECT_TRUE(ClientError(ErrorCode::ScopeShutdown).isCancellation());
}

TEST(ErrorCodeTest, ContextIsTyped) {
    ClientError error(ErrorCode::ConnectionFailed, "refused", std::string("10.0.0.1:80"));
    ASSERT_TRUE(error.hasContext());
    ASSERT_NE(error.context<std::string>(), nullptr);
    EXPECT_EQ(*error.context<std::string>(), "10.0.0.1:80");
    EXPECT_EQ(error.context<int>(), nullptr);
}
