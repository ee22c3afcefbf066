/**
 * @file logger_adapter_test.cpp
 * @brief Unit tests for logger adapter implementations
 *
 * Tests for the console logger, level parsing, the JSON line format and,
 * when built with common_system, ILogger forwarding.
 *
 * @see include/clinic/opd/integration/logger_adapter.h
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "clinic/opd/integration/logger_adapter.h"

#include <nlohmann/json.hpp>

#ifdef CLINIC_OPD_HAS_COMMON_SYSTEM
#include <kcenon/common/interfaces/logger_interface.h>
#endif

#include <sstream>
#include <string>

namespace clinic::opd::integration {
namespace {

using namespace ::testing;

class LoggerTestBase : public Test {
protected:
    void TearDown() override { configure_logging(log_level::info, log_format::text); }
};

// =============================================================================
// Level Parsing
// =============================================================================

class LogLevelTest : public LoggerTestBase {};

TEST_F(LogLevelTest, ParsesNamesCaseInsensitively) {
    EXPECT_EQ(parse_log_level("trace"), log_level::trace);
    EXPECT_EQ(parse_log_level("DEBUG"), log_level::debug);
    EXPECT_EQ(parse_log_level("Info"), log_level::info);
    EXPECT_EQ(parse_log_level("warn"), log_level::warning);
    EXPECT_EQ(parse_log_level("warning"), log_level::warning);
    EXPECT_EQ(parse_log_level("error"), log_level::error);
    EXPECT_EQ(parse_log_level("fatal"), log_level::critical);
    EXPECT_EQ(parse_log_level("verbose"), std::nullopt);
}

TEST_F(LogLevelTest, ToStringIsNeverEmpty) {
    for (auto level : {log_level::trace, log_level::debug, log_level::info,
                       log_level::warning, log_level::error, log_level::critical}) {
        EXPECT_FALSE(to_string(level).empty());
    }
}

// =============================================================================
// Console Logger Adapter Tests
// =============================================================================

class ConsoleLoggerAdapterTest : public LoggerTestBase {};

TEST_F(ConsoleLoggerAdapterTest, CreateNamedLogger) {
    auto logger = create_logger("appointments");
    ASSERT_NE(logger, nullptr);
    EXPECT_EQ(logger->get_level(), log_level::info);
}

TEST_F(ConsoleLoggerAdapterTest, SetAndGetLevel) {
    auto logger = create_logger("test");

    logger->set_level(log_level::debug);
    EXPECT_EQ(logger->get_level(), log_level::debug);
    EXPECT_TRUE(logger->is_enabled(log_level::debug));
    EXPECT_FALSE(logger->is_enabled(log_level::trace));

    logger->set_level(log_level::error);
    EXPECT_FALSE(logger->is_enabled(log_level::warning));
}

TEST_F(ConsoleLoggerAdapterTest, FiltersBelowLevel) {
    auto logger = create_logger("queue_sync");
    logger->set_level(log_level::warning);

    testing::internal::CaptureStdout();
    logger->debug("hidden");
    logger->info("hidden too");
    logger->warning("slot released");
    std::string out = testing::internal::GetCapturedStdout();

    EXPECT_THAT(out, Not(HasSubstr("hidden")));
    EXPECT_THAT(out, HasSubstr("[WARN] [queue_sync] slot released"));
}

TEST_F(ConsoleLoggerAdapterTest, ErrorsGoToStderr) {
    auto logger = create_logger("schema");

    testing::internal::CaptureStderr();
    logger->error("bootstrap failed");
    std::string err = testing::internal::GetCapturedStderr();

    EXPECT_THAT(err, HasSubstr("bootstrap failed"));
}

TEST_F(ConsoleLoggerAdapterTest, JsonFormatEmitsOneObjectPerLine) {
    configure_logging(log_level::debug, log_format::json);
    auto logger = create_logger("appointments");

    testing::internal::CaptureStdout();
    logger->debug("Booked \"09:00\"");
    std::string out = testing::internal::GetCapturedStdout();

    auto line = out.substr(0, out.find('\n'));
    auto entry = nlohmann::json::parse(line);
    EXPECT_EQ(entry["logger"], "appointments");
    EXPECT_EQ(entry["message"], "Booked \"09:00\"");
    EXPECT_TRUE(entry.contains("timestamp"));
    EXPECT_TRUE(entry.contains("level"));
}

TEST_F(ConsoleLoggerAdapterTest, ConfigureLoggingAppliesToNewLoggers) {
    configure_logging(log_level::error, log_format::text);
    auto logger = create_logger("late");
    EXPECT_EQ(logger->get_level(), log_level::error);
}

TEST_F(ConsoleLoggerAdapterTest, FlushDoesNotThrow) {
    auto logger = create_logger("test");
    logger->info("message before flush");
    EXPECT_NO_THROW(logger->flush());
}

#ifdef CLINIC_OPD_HAS_COMMON_SYSTEM

// =============================================================================
// Mock ILogger for Testing
// =============================================================================

namespace ci = kcenon::common::interfaces;

class MockILogger : public ci::ILogger {
public:
    MOCK_METHOD(kcenon::common::VoidResult, log,
                (ci::log_level level, const std::string& message), (override));
    MOCK_METHOD(kcenon::common::VoidResult, log,
                (ci::log_level level, std::string_view message,
                 const kcenon::common::source_location& loc),
                (override));
    MOCK_METHOD(kcenon::common::VoidResult, log,
                (ci::log_level level, const std::string& message, const std::string& file,
                 int line, const std::string& function),
                (override));
    MOCK_METHOD(kcenon::common::VoidResult, log, (const ci::log_entry& entry), (override));
    MOCK_METHOD(bool, is_enabled, (ci::log_level level), (const, override));
    MOCK_METHOD(kcenon::common::VoidResult, set_level, (ci::log_level level), (override));
    MOCK_METHOD(ci::log_level, get_level, (), (const, override));
    MOCK_METHOD(kcenon::common::VoidResult, flush, (), (override));
};

// =============================================================================
// ILogger Adapter Tests
// =============================================================================

class ILoggerAdapterTest : public LoggerTestBase {
protected:
    void TearDown() override {
        reset_default_logger();
        LoggerTestBase::TearDown();
    }
};

TEST_F(ILoggerAdapterTest, ForwardsWithLoggerNamePrefix) {
    auto mock_logger = std::make_shared<MockILogger>();

    EXPECT_CALL(*mock_logger, get_level()).WillRepeatedly(Return(ci::log_level::trace));
    EXPECT_CALL(*mock_logger, log(ci::log_level::info, HasSubstr("[reconciliation] pass done")))
        .WillOnce(Return(kcenon::common::VoidResult(std::monostate{})));

    set_default_logger(mock_logger);
    auto adapter = create_logger("reconciliation");
    adapter->info("pass done");
}

TEST_F(ILoggerAdapterTest, SetLevelForwardsToILogger) {
    auto mock_logger = std::make_shared<MockILogger>();

    EXPECT_CALL(*mock_logger, get_level()).WillOnce(Return(ci::log_level::info));
    EXPECT_CALL(*mock_logger, set_level(ci::log_level::debug))
        .WillOnce(Return(kcenon::common::VoidResult(std::monostate{})));

    auto adapter = create_logger(mock_logger);
    adapter->set_level(log_level::debug);

    EXPECT_EQ(adapter->get_level(), log_level::debug);
}

TEST_F(ILoggerAdapterTest, NullILoggerHandledGracefully) {
    std::shared_ptr<ci::ILogger> null_logger;
    auto adapter = create_logger(null_logger);

    ASSERT_NE(adapter, nullptr);
    EXPECT_NO_THROW(adapter->info("message"));
    EXPECT_NO_THROW(adapter->flush());
}

#endif  // CLINIC_OPD_HAS_COMMON_SYSTEM

}  // namespace
}  // namespace clinic::opd::integration
