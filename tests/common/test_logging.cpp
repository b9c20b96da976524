#include "atlex/logging.hpp"

#include <iostream>
#include <sstream>

#include <gtest/gtest.h>

#define LEATHERMAN_LOGGING_NAMESPACE "atlex.test.logging"
#include <leatherman/logging/logging.hpp>

namespace atlex::util::test {

namespace lth_log = leatherman::logging;

class LoggingTest : public ::testing::Test
{
protected:
    void TearDown() override { setup_logging(std::cout, lth_log::log_level::fatal); }
};

TEST_F(LoggingTest, AcceptsKnownLevelLabels)
{
    std::ostringstream sink;
    for (const char* label : {"none", "trace", "debug", "info", "warning", "error", "fatal"}) {
        EXPECT_TRUE(setup_logging(sink, label)) << label;
    }
}

TEST_F(LoggingTest, RejectsUnknownLevelLabel)
{
    std::ostringstream sink;
    auto result = setup_logging(sink, "verbose");
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, "InvalidLogLevel");
}

TEST_F(LoggingTest, SetsLevel)
{
    std::ostringstream sink;
    ASSERT_TRUE(setup_logging(sink, "warning"));
    EXPECT_TRUE(lth_log::get_level() == lth_log::log_level::warning);

    ASSERT_TRUE(setup_logging(sink, "none"));
    EXPECT_TRUE(lth_log::get_level() == lth_log::log_level::none);
}

}  // namespace atlex::util::test
