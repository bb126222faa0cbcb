#include <chartkit/chart_config.hpp>
#include <filesystem>
#include <gtest/gtest.h>

using namespace chartkit;

// ─── Defaults ────────────────────────────────────────────────────────────────

TEST(ChartConfigDefaults, Styles)
{
    ChartConfig config;
    EXPECT_DOUBLE_EQ(config.line_style().width, 800.0);
    EXPECT_DOUBLE_EQ(config.line_style().height, 200.0);
    EXPECT_DOUBLE_EQ(config.line_style().margin, 10.0);
    EXPECT_DOUBLE_EQ(config.sparkline_style().fill_ratio, 0.9);
    EXPECT_DOUBLE_EQ(config.donut_style().radius, 70.0);
    EXPECT_DOUBLE_EQ(config.donut_style().rotation, -90.0);
    EXPECT_DOUBLE_EQ(config.heatmap_style().thresholds[0], 0.25);
    EXPECT_DOUBLE_EQ(config.heatmap_style().thresholds[3], 1.0);
    EXPECT_EQ(config.tier_color_count(), 0u);
}

// ─── Tier colors ─────────────────────────────────────────────────────────────

TEST(ChartConfigTierColors, SetOverride)
{
    ChartConfig config;
    EXPECT_TRUE(config.set_tier_color("PREMIUM", "#FF0000"));
    EXPECT_EQ(config.tier_color_count(), 1u);
    EXPECT_TRUE(config.has_tier_color("PREMIUM"));
    EXPECT_FALSE(config.has_tier_color("BASIC"));
    EXPECT_EQ(config.tier_color_overrides()[0].color, "#ff0000");
}

TEST(ChartConfigTierColors, UpdateOverride)
{
    ChartConfig config;
    config.set_tier_color("PREMIUM", "#ff0000");
    config.set_tier_color("PREMIUM", "#0f0");
    EXPECT_EQ(config.tier_color_count(), 1u);
    EXPECT_EQ(config.tier_color_overrides()[0].color, "#00ff00");
}

TEST(ChartConfigTierColors, RejectsInvalidColor)
{
    ChartConfig config;
    EXPECT_FALSE(config.set_tier_color("PREMIUM", "purple"));
    EXPECT_FALSE(config.set_tier_color("PREMIUM", "#12345"));
    EXPECT_EQ(config.tier_color_count(), 0u);
}

TEST(ChartConfigTierColors, RemoveOverride)
{
    ChartConfig config;
    config.set_tier_color("FREE", "#000000");
    config.set_tier_color("BASIC", "#111111");
    config.remove_tier_color("FREE");
    EXPECT_EQ(config.tier_color_count(), 1u);
    EXPECT_FALSE(config.has_tier_color("FREE"));
    config.remove_tier_color("nonexistent");
    EXPECT_EQ(config.tier_color_count(), 1u);
}

TEST(ChartConfigTierColors, TableLayersOverridesOnDefaults)
{
    ChartConfig config;
    config.set_tier_color("PREMIUM", "#ff0000");
    config.set_tier_color("ENTERPRISE", "#123456");

    auto table = config.tier_colors();
    EXPECT_EQ(table.lookup("PREMIUM"), "#ff0000");
    EXPECT_EQ(table.lookup("ENTERPRISE"), "#123456");
    EXPECT_EQ(table.lookup("BASIC"), "#3b82f6");
    EXPECT_EQ(table.lookup("unknown"), ColorTable::kNeutral);
}

TEST(ChartConfigTierColors, ResetAll)
{
    ChartConfig config;
    config.set_tier_color("FREE", "#000000");
    LineChartStyle line;
    line.width = 1024;
    config.set_line_style(line);

    config.reset_all();
    EXPECT_EQ(config.tier_color_count(), 0u);
    EXPECT_DOUBLE_EQ(config.line_style().width, 800.0);
}

// ─── Serialization ───────────────────────────────────────────────────────────

TEST(ChartConfigSerialize, DefaultConfig)
{
    ChartConfig config;
    std::string json = config.serialize();
    EXPECT_NE(json.find("\"version\": 1"), std::string::npos);
    EXPECT_NE(json.find("\"thresholds\": [0.25, 0.5, 0.75, 1]"), std::string::npos);
    EXPECT_NE(json.find("\"tier_colors\""), std::string::npos);
}

TEST(ChartConfigSerialize, RoundTrip)
{
    ChartConfig config;
    LineChartStyle line;
    line.width         = 640;
    line.margin        = 12.5;
    line.marker_target = 8;
    config.set_line_style(line);

    SparklineStyle spark;
    spark.fill_ratio = 0.75;
    config.set_sparkline_style(spark);

    DonutStyle donut;
    donut.radius   = 90;
    donut.rotation = 0;
    config.set_donut_style(donut);

    HeatmapStyle heat;
    heat.thresholds = {0.1, 0.3, 0.6, 0.9};
    heat.cell_size  = 12;
    config.set_heatmap_style(heat);

    config.set_tier_color("PREMIUM", "#ff0000");
    config.set_tier_color("SCHOOL", "#00aa00");

    ChartConfig config2;
    ASSERT_TRUE(config2.deserialize(config.serialize()));

    EXPECT_DOUBLE_EQ(config2.line_style().width, 640.0);
    EXPECT_DOUBLE_EQ(config2.line_style().height, 200.0);
    EXPECT_DOUBLE_EQ(config2.line_style().margin, 12.5);
    EXPECT_EQ(config2.line_style().marker_target, 8u);
    EXPECT_EQ(config2.line_style().label_target, 6u);
    EXPECT_DOUBLE_EQ(config2.sparkline_style().fill_ratio, 0.75);
    EXPECT_DOUBLE_EQ(config2.donut_style().radius, 90.0);
    EXPECT_DOUBLE_EQ(config2.donut_style().rotation, 0.0);
    EXPECT_DOUBLE_EQ(config2.heatmap_style().thresholds[0], 0.1);
    EXPECT_DOUBLE_EQ(config2.heatmap_style().thresholds[2], 0.6);
    EXPECT_DOUBLE_EQ(config2.heatmap_style().cell_size, 12.0);
    EXPECT_EQ(config2.tier_color_count(), 2u);
    EXPECT_EQ(config2.tier_colors().lookup("SCHOOL"), "#00aa00");
}

TEST(ChartConfigSerialize, DeserializeEmpty)
{
    ChartConfig config;
    EXPECT_FALSE(config.deserialize(""));
}

TEST(ChartConfigSerialize, DeserializeFutureVersion)
{
    ChartConfig config;
    config.set_tier_color("FREE", "#000000");
    EXPECT_FALSE(config.deserialize(R"({"version": 99, "tier_colors": []})"));
    // Rejected documents leave the current settings alone
    EXPECT_EQ(config.tier_color_count(), 1u);
}

TEST(ChartConfigSerialize, HugeVersionIsRejected)
{
    ChartConfig config;
    EXPECT_FALSE(config.deserialize(R"({"version": 1e30, "line": {"width": 640}})"));
    EXPECT_FALSE(config.deserialize(R"({"version": 2.5})"));
    EXPECT_DOUBLE_EQ(config.line_style().width, 800.0);
}

TEST(ChartConfigSerialize, OlderVersionIsAccepted)
{
    ChartConfig config;
    EXPECT_TRUE(config.deserialize(R"({"version": 0, "line": {"width": 640}})"));
    EXPECT_DOUBLE_EQ(config.line_style().width, 640.0);
}

TEST(ChartConfigSerialize, HugeCountKeepsDefault)
{
    ChartConfig config;
    EXPECT_TRUE(config.deserialize(R"({"version": 1,
        "line": {"marker_target": 1e30, "label_target": -4},
        "heatmap": {"hours": 1e300}})"));
    EXPECT_EQ(config.line_style().marker_target, 10u);
    EXPECT_EQ(config.line_style().label_target, 6u);
    EXPECT_EQ(config.heatmap_style().hours, 24u);
}

TEST(ChartConfigSerialize, HoursRoundTrip)
{
    ChartConfig  config;
    HeatmapStyle heat;
    heat.hours = 12;
    config.set_heatmap_style(heat);

    ChartConfig config2;
    ASSERT_TRUE(config2.deserialize(config.serialize()));
    EXPECT_EQ(config2.heatmap_style().hours, 12u);
}

TEST(ChartConfigSerialize, MissingKeysKeepDefaults)
{
    ChartConfig config;
    EXPECT_TRUE(config.deserialize(R"({"version": 1, "donut": {"radius": 50}})"));
    EXPECT_DOUBLE_EQ(config.donut_style().radius, 50.0);
    EXPECT_DOUBLE_EQ(config.donut_style().stroke_width, 30.0);
    EXPECT_DOUBLE_EQ(config.line_style().width, 800.0);
    EXPECT_DOUBLE_EQ(config.heatmap_style().thresholds[1], 0.5);
}

TEST(ChartConfigSerialize, WrongThresholdCountIsIgnored)
{
    ChartConfig config;
    EXPECT_TRUE(config.deserialize(R"({"version": 1, "heatmap": {"thresholds": [0.2, 0.4]}})"));
    EXPECT_DOUBLE_EQ(config.heatmap_style().thresholds[0], 0.25);
    EXPECT_DOUBLE_EQ(config.heatmap_style().thresholds[3], 1.0);
}

TEST(ChartConfigSerialize, InvalidTierColorsAreSkipped)
{
    ChartConfig config;
    EXPECT_TRUE(config.deserialize(R"({"version": 1, "tier_colors": [
        {"label": "FREE", "color": "not-a-color"},
        {"label": "BASIC", "color": "#ABC"}
    ]})"));
    EXPECT_EQ(config.tier_color_count(), 1u);
    EXPECT_EQ(config.tier_colors().lookup("BASIC"), "#aabbcc");
}

TEST(ChartConfigSerialize, SpecialCharactersInLabel)
{
    ChartConfig config;
    config.set_tier_color("Tier \"Gold\"", "#ffd700");

    ChartConfig config2;
    ASSERT_TRUE(config2.deserialize(config.serialize()));
    EXPECT_TRUE(config2.has_tier_color("Tier \"Gold\""));
}

// ─── File I/O ────────────────────────────────────────────────────────────────

TEST(ChartConfigFile, SaveAndLoad)
{
    auto path     = std::filesystem::temp_directory_path() / "chartkit_test_chart.json";
    auto path_str = path.string();

    std::filesystem::remove(path);

    ChartConfig config;
    DonutStyle  donut;
    donut.radius = 55;
    config.set_donut_style(donut);
    config.set_tier_color("FAMILY", "#abcdef");
    EXPECT_TRUE(config.save(path_str));
    EXPECT_TRUE(std::filesystem::exists(path));

    ChartConfig config2;
    EXPECT_TRUE(config2.load(path_str));
    EXPECT_DOUBLE_EQ(config2.donut_style().radius, 55.0);
    EXPECT_EQ(config2.tier_color_count(), 1u);

    std::filesystem::remove(path);
}

TEST(ChartConfigFile, LoadNonexistent)
{
    ChartConfig config;
    EXPECT_FALSE(config.load("/nonexistent/path/chart.json"));
}

TEST(ChartConfigFile, SaveToInvalidPath)
{
    ChartConfig config;
    EXPECT_FALSE(config.save("/dev/null/impossible/path/chart.json"));
}

TEST(ChartConfigFile, WriteErrorIsReported)
{
    // /dev/full accepts the open but fails every write with ENOSPC
    if (!std::filesystem::exists("/dev/full"))
        GTEST_SKIP() << "/dev/full not available";

    ChartConfig config;
    EXPECT_FALSE(config.save("/dev/full"));
}

TEST(ChartConfigFile, DefaultPath)
{
    std::string path = ChartConfig::default_path();
    EXPECT_FALSE(path.empty());
    EXPECT_NE(path.find("chart.json"), std::string::npos);
}

// ─── Callback ────────────────────────────────────────────────────────────────

TEST(ChartConfigCallback, OnChangeCalledOnSet)
{
    ChartConfig config;
    int         change_count = 0;
    config.set_on_change([&]() { ++change_count; });

    config.set_tier_color("FREE", "#000000");
    EXPECT_EQ(change_count, 1);

    config.set_donut_style(DonutStyle{});
    EXPECT_EQ(change_count, 2);
}

TEST(ChartConfigCallback, NotCalledOnRejectedColor)
{
    ChartConfig config;
    int         change_count = 0;
    config.set_on_change([&]() { ++change_count; });

    config.set_tier_color("FREE", "bogus");
    EXPECT_EQ(change_count, 0);
}

TEST(ChartConfigCallback, OnChangeCalledOnReset)
{
    ChartConfig config;
    config.set_tier_color("FREE", "#000000");

    int change_count = 0;
    config.set_on_change([&]() { ++change_count; });
    config.reset_all();
    EXPECT_EQ(change_count, 1);
}

TEST(ChartConfigCallback, NoCallbackNoCrash)
{
    ChartConfig config;
    config.set_tier_color("FREE", "#000000");
    config.remove_tier_color("FREE");
    config.reset_all();
}
