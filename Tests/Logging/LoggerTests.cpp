#include <gtest/gtest.h>

#include <memory>
#include <sstream>
#include <string>

#include "FerryTestHelpers.h"
#include "Logging/CLogger.h"
#include "Logging/ConsoleSink.h"
#include "Logging/Logger.h"

using namespace Ferry::Core::Logging;
using ferry::test_helpers::CaptureSink;
using ferry::test_helpers::ScopedLogCapture;

TEST(Logger, DeliversToEverySink) {
    Logger logger(LogLevel::Trace);
    auto a = std::make_shared<CaptureSink>();
    auto b = std::make_shared<CaptureSink>();
    logger.addSink(a);
    logger.addSink(b);
    EXPECT_EQ(logger.sinkCount(), 2u);

    logger.info("Transfer", "copied 12 bytes");

    ASSERT_EQ(a->entries().size(), 1u);
    ASSERT_EQ(b->entries().size(), 1u);
    EXPECT_EQ(a->entries()[0].category, "Transfer");
    EXPECT_EQ(a->entries()[0].message, "copied 12 bytes");
    EXPECT_EQ(a->entries()[0].level, LogLevel::Info);
}

TEST(Logger, MinimumLevelFilters) {
    Logger logger(LogLevel::Warning);
    auto sink = std::make_shared<CaptureSink>();
    logger.addSink(sink);

    logger.debug("c", "hidden");
    logger.info("c", "hidden");
    logger.warning("c", "shown");
    logger.error("c", "shown");

    EXPECT_EQ(sink->entries().size(), 2u);
    EXPECT_FALSE(logger.isEnabled(LogLevel::Info));
    EXPECT_TRUE(logger.isEnabled(LogLevel::Fatal));

    logger.setMinLevel(LogLevel::Off);
    logger.fatal("c", "hidden");
    EXPECT_EQ(sink->entries().size(), 2u);
}

TEST(Logger, SinkLevelFilters) {
    Logger logger(LogLevel::Trace);
    auto sink = std::make_shared<CaptureSink>();
    sink->setMinLevel(LogLevel::Error);
    logger.addSink(sink);

    logger.warning("c", "dropped by sink");
    logger.error("c", "kept");
    ASSERT_EQ(sink->entries().size(), 1u);
    EXPECT_EQ(sink->entries()[0].message, "kept");
}

TEST(Logger, RemoveSink) {
    Logger logger(LogLevel::Trace);
    auto sink = std::make_shared<CaptureSink>();
    logger.addSink(sink);
    logger.removeSink(sink);
    logger.info("c", "nobody listens");
    EXPECT_TRUE(sink->entries().empty());
    EXPECT_EQ(logger.sinkCount(), 0u);
}

TEST(Logger, ParseLogLevel) {
    EXPECT_EQ(parseLogLevel("DEBUG"), LogLevel::Debug);
    EXPECT_EQ(parseLogLevel("warn"), LogLevel::Warning);
    EXPECT_EQ(parseLogLevel("Warning"), LogLevel::Warning);
    EXPECT_EQ(parseLogLevel("off"), LogLevel::Off);
    EXPECT_FALSE(parseLogLevel("loud").has_value());
}

TEST(Logger, MacrosUseGlobalLogger) {
    ScopedLogCapture capture;
    FERRY_LOG_INFO_CAT("MacroTest", "via macro");
    FERRY_LOG_DEBUG("with function category");

    auto entries = capture.sink().entries();
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].category, "MacroTest");
    EXPECT_EQ(entries[0].message, "via macro");
    EXPECT_EQ(entries[1].level, LogLevel::Debug);
    EXPECT_FALSE(entries[1].category.empty());
}

TEST(Logger, CShimFormatsPrintfStyle) {
    ScopedLogCapture capture;
    ferry_log_write_cat(FERRY_LOG_WARN_C, "CShim", "moved %d files to %s", 3, "/dst");

    auto entries = capture.sink().entries();
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].level, LogLevel::Warning);
    EXPECT_EQ(entries[0].category, "CShim");
    EXPECT_EQ(entries[0].message, "moved 3 files to /dst");
}

TEST(Logger, CShimLevelControlSharesTheGlobalThreshold) {
    ScopedLogCapture capture;
    ferry_log_set_level(FERRY_LOG_ERROR_C);
    EXPECT_EQ(ferry_log_get_level(), FERRY_LOG_ERROR_C);
    EXPECT_EQ(Logger::global().minLevel(), LogLevel::Error);
    EXPECT_EQ(ferry_log_is_enabled(FERRY_LOG_WARN_C), 0);
    EXPECT_EQ(ferry_log_is_enabled(FERRY_LOG_FATAL_C), 1);

    ferry_log_write(FERRY_LOG_INFO_C, "dropped %s", "quietly");
    ferry_log_write(FERRY_LOG_ERROR_C, "kept %d", 1);

    auto entries = capture.sink().entries();
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].category, "C");
    EXPECT_EQ(entries[0].message, "kept 1");
}

TEST(ConsoleSink, WritesWarningsToErrorStream) {
    std::ostringstream out;
    std::ostringstream err;
    Logger logger(LogLevel::Trace);
    logger.addSink(std::make_shared<ConsoleSink>(out, err));

    logger.info("Cat", "plain");
    logger.warning("Cat", "careful");

    EXPECT_NE(out.str().find("[INFO] [Cat] plain"), std::string::npos);
    EXPECT_NE(err.str().find("[WARN] [Cat] careful"), std::string::npos);
    EXPECT_EQ(out.str().find("careful"), std::string::npos);
}
