#include <gtest/gtest.h>
#include "fnr/logging.h"
#include <spdlog/sinks/ostream_sink.h>
#include <sstream>

using namespace fnr;

class LoggingTest : public ::testing::Test {
protected:
    std::ostringstream output;
    std::shared_ptr<spdlog::logger> logger;

    void SetUp() override {
        auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(output);
        sink->set_pattern("%l %v");
        logger = std::make_shared<spdlog::logger>("fnr_test", sink);
        logger->set_level(spdlog::level::trace);
    }
};

TEST_F(LoggingTest, RejectionIsLogged) {
    IdentifierValidator validator;
    EXPECT_FALSE(validator.check("01019912369", makeLoggerSink(logger)));

    logger->flush();
    EXPECT_EQ(output.str(), "info Identifier rejected: Control digits do not match identifier\n");
}

TEST_F(LoggingTest, LevelIsConfigurable) {
    EXPECT_FALSE(checkIdentifier("41019912351", false, false,
                                 makeLoggerSink(logger, spdlog::level::warn)));

    logger->flush();
    EXPECT_EQ(output.str(), "warning Identifier rejected: D-numbers are not accepted\n");
}

TEST_F(LoggingTest, ValidIdentifierLogsNothing) {
    EXPECT_TRUE(checkIdentifier("01019912368", true, false, makeLoggerSink(logger)));

    logger->flush();
    EXPECT_TRUE(output.str().empty());
}

TEST_F(LoggingTest, LevelBelowThresholdIsDropped) {
    logger->set_level(spdlog::level::warn);
    EXPECT_FALSE(checkIdentifier("00000000000", true, false,
                                 makeLoggerSink(logger, spdlog::level::debug)));

    logger->flush();
    EXPECT_TRUE(output.str().empty());
}

TEST_F(LoggingTest, DefaultLoggerSink) {
    // Keep the validator's own trace output out of the capture
    logger->set_level(spdlog::level::info);
    auto previous = spdlog::default_logger();
    spdlog::set_default_logger(logger);

    EXPECT_FALSE(checkIdentifier("00000000000", true, false, makeLoggerSink()));

    spdlog::set_default_logger(previous);
    logger->flush();
    EXPECT_EQ(output.str(), "info Identifier rejected: Day out of range in identifier\n");
}
