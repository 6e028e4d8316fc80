#include "options.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <vector>

using namespace std::chrono_literals;

namespace {
Options Parse(std::vector<const char *> args) {
    args.insert(args.begin(), "focusblock");
    return ParseArgs(static_cast<int>(args.size()), args.data());
}
} // namespace

TEST(OptionsTest, DefaultsWithoutArguments) {
    const Options opts = Parse({});
    EXPECT_EQ(opts.interval, 1000ms);
    EXPECT_EQ(opts.log_level, LOG_INFO);
    EXPECT_FALSE(opts.help);
    EXPECT_TRUE(opts.task_log.empty());
}

TEST(OptionsTest, ParsesAllFlags) {
    const Options opts = Parse({"--interval", "0.25", "--config", "c.json", "--on-block-end",
                                "notify-send done", "--task-log", "work", "--log-level", "off"});
    EXPECT_EQ(opts.interval, 250ms);
    EXPECT_EQ(opts.config_path, "c.json");
    EXPECT_EQ(opts.on_block_end, "notify-send done");
    EXPECT_EQ(opts.task_log, "work");
    EXPECT_EQ(opts.log_level, LOG_OFF);
}

TEST(OptionsTest, IntervalBoundsAreInclusive) {
    EXPECT_EQ(Parse({"--interval", "0.001"}).interval, kMinInterval);
    EXPECT_EQ(Parse({"--interval", "3600"}).interval, kMaxInterval);
}

TEST(OptionsTest, IntervalOutsideBoundsIsRejected) {
    EXPECT_THROW(Parse({"--interval", "0.0001"}), std::invalid_argument);
    EXPECT_THROW(Parse({"--interval", "0"}), std::invalid_argument);
    EXPECT_THROW(Parse({"--interval", "-1"}), std::invalid_argument);
    EXPECT_THROW(Parse({"--interval", "1e300"}), std::invalid_argument);
    EXPECT_THROW(Parse({"--interval", "inf"}), std::invalid_argument);
    EXPECT_THROW(Parse({"--interval", "nan"}), std::invalid_argument);
    EXPECT_THROW(Parse({"--interval", "1s"}), std::invalid_argument);
}

TEST(OptionsTest, BadFlagsAreRejected) {
    EXPECT_THROW(Parse({"--bogus"}), std::invalid_argument);
    EXPECT_THROW(Parse({"--interval"}), std::invalid_argument);
    EXPECT_THROW(Parse({"--log-level", "trace"}), std::invalid_argument);
}
