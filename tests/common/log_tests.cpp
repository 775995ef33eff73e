#include <gtest/gtest.h>
#include "stagedag/common/log.hpp"
#include "common/log_capture.hpp"

using namespace stagedag;

// =============================================================================
// Level Tests
// =============================================================================

TEST(LogTests, LevelName_IsUpperCase)
{
    EXPECT_STREQ(level_name(LogLevel::Trace), "TRACE");
    EXPECT_STREQ(level_name(LogLevel::Warn), "WARN");
    EXPECT_STREQ(level_name(LogLevel::Fatal), "FATAL");
}

TEST(LogTests, Verbosity_NoneIsWarn)
{
    EXPECT_EQ(level_from_verbosity(0), LogLevel::Warn);
}

TEST(LogTests, Verbosity_OneIsInfo)
{
    EXPECT_EQ(level_from_verbosity(1), LogLevel::Info);
}

TEST(LogTests, Verbosity_MoreIsDebug)
{
    EXPECT_EQ(level_from_verbosity(2), LogLevel::Debug);
    EXPECT_EQ(level_from_verbosity(5), LogLevel::Debug);
}

// =============================================================================
// Logger Tests
// =============================================================================

TEST(LogTests, Macro_RecordsModuleAndMessage)
{
    LogCapture capture;
    STAGEDAG_LOG_INFO("graph", "added " << 3 << " nodes");

    ASSERT_EQ(capture.records().size(), 1u);
    const LogRecord& record = capture.records()[0];
    EXPECT_EQ(record.level, LogLevel::Info);
    EXPECT_EQ(record.module, "graph");
    EXPECT_EQ(record.message, "added 3 nodes");
    EXPECT_GT(record.line, 0);
}

TEST(LogTests, Macro_FilteredLevelIsNotRecorded)
{
    LogCapture capture(LogLevel::Warn);
    STAGEDAG_LOG_DEBUG("keys", "hidden");
    STAGEDAG_LOG_WARN("keys", "shown");

    ASSERT_EQ(capture.records().size(), 1u);
    EXPECT_EQ(capture.records()[0].message, "shown");
}

TEST(LogTests, Macro_FilteredLevelSkipsMessageConstruction)
{
    LogCapture capture(LogLevel::Error);
    int evaluated = 0;
    auto side_effect = [&evaluated]() {
        ++evaluated;
        return "x";
    };
    STAGEDAG_LOG_INFO("keys", side_effect());
    EXPECT_EQ(evaluated, 0);
}

TEST(LogTests, OffLevel_RecordsNothing)
{
    LogCapture capture(LogLevel::Off);
    STAGEDAG_LOG_FATAL("eval", "nothing");
    EXPECT_TRUE(capture.records().empty());
}

TEST(LogTests, ClearSinks_SilencesLogger)
{
    LogCapture capture;
    Logger::instance().clear_sinks();
    STAGEDAG_LOG_ERROR("tool", "dropped");
    EXPECT_TRUE(capture.records().empty());
}

TEST(LogTests, Init_SetsLevel)
{
    LogCapture capture;
    Logger::init(LogConfig{LogLevel::Debug, false, false});
    EXPECT_EQ(Logger::instance().level(), LogLevel::Debug);
    EXPECT_TRUE(Logger::instance().should_log(LogLevel::Debug));
    EXPECT_FALSE(Logger::instance().should_log(LogLevel::Trace));
}

// =============================================================================
// Console Sink Tests
// =============================================================================

TEST(LogTests, ConsoleSink_NoColorsWhenStderrIsNotTerminal)
{
    testing::internal::CaptureStderr();
    ConsoleSink sink(true);
    sink.write(LogRecord{LogLevel::Info, "graph", "added node", __FILE__, __LINE__});
    sink.flush();
    std::string text = testing::internal::GetCapturedStderr();

    EXPECT_EQ(text, "INFO  [graph] added node\n");
    EXPECT_EQ(text.find("\033["), std::string::npos);
}
