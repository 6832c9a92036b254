#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "utils/cli.hpp"

namespace {

CLIOptions parse(std::vector<std::string> args) {
    args.insert(args.begin(), "wxanim");
    std::vector<char*> argv;
    for (auto& a : args) argv.push_back(&a[0]);
    return parse_cli(static_cast<int>(argv.size()), argv.data());
}

}  // namespace

TEST(CliTest, Defaults) {
    auto opts = parse({"--input", "series.csv"});
    EXPECT_EQ(opts.input, "series.csv");
    EXPECT_EQ(opts.out_dir, "Results");
    EXPECT_FALSE(opts.spec.missing_value.has_value());
    EXPECT_TRUE(opts.config.final_still);
    EXPECT_TRUE(opts.config.render.legend);
    EXPECT_EQ(opts.config.formats.size(), 2u);
}

TEST(CliTest, MissingSentinel) {
    auto opts = parse({"--input", "series.csv", "--missing", "-9999"});
    ASSERT_TRUE(opts.spec.missing_value.has_value());
    EXPECT_DOUBLE_EQ(*opts.spec.missing_value, -9999.0);
}

TEST(CliTest, FormatsFlagsAndTiming) {
    auto opts = parse({"--input", "a.csv", "--format", "gif,png", "--no-still", "--no-legend", "--duration", "12",
                       "--hold", "2", "--fps", "8", "--range", "-10:40", "--aspect", "vertical"});
    EXPECT_EQ(opts.config.formats, (std::vector<OutputFormat>{OutputFormat::Gif, OutputFormat::Png}));
    EXPECT_FALSE(opts.config.final_still);
    EXPECT_FALSE(opts.config.render.legend);
    EXPECT_DOUBLE_EQ(opts.config.timing.target_duration_seconds, 12.0);
    EXPECT_DOUBLE_EQ(opts.config.timing.hold_last_seconds, 2.0);
    EXPECT_EQ(opts.config.timing.frame_rate, 8);
    ASSERT_TRUE(opts.config.color_range.has_value());
    EXPECT_DOUBLE_EQ(opts.config.color_range->min, -10.0);
    EXPECT_DOUBLE_EQ(opts.config.color_range->max, 40.0);
    ASSERT_EQ(opts.config.aspect_ratios.size(), 1u);
    EXPECT_EQ(opts.config.aspect_ratios[0], AspectRatio::Vertical);
}

TEST(CliDeathTest, BadArgumentsExitWithUsage) {
    EXPECT_EXIT(parse({"--input", "a.csv", "--missing", "none"}), ::testing::ExitedWithCode(1), "");
    EXPECT_EXIT(parse({"--input", "a.csv", "--format", "avi"}), ::testing::ExitedWithCode(1), "");
    EXPECT_EXIT(parse({"--missing", "1"}), ::testing::ExitedWithCode(1), "");
}
