#pragma once

#include <array>
#include <cstddef>
#include <string_view>

namespace chartkit
{

// Trend chart (user growth, revenue). The margin is reserved at top and
// bottom so peak and trough markers are not clipped.
struct LineChartStyle
{
    double width         = 800.0;
    double height        = 200.0;
    double margin        = 10.0;
    size_t marker_target = 10;   // markers drawn along the line
    size_t label_target  = 6;    // x-axis labels
};

// Compact "trend at a glance" widget.
struct SparklineStyle
{
    double width      = 200.0;
    double height     = 50.0;
    double fill_ratio = 0.9;   // share of the height used by the tallest value
};

struct DonutStyle
{
    double radius       = 70.0;
    double stroke_width = 30.0;
    double rotation     = -90.0;   // degrees; applied once by the renderer so segment 0 starts at 12 o'clock
};

struct HeatmapStyle
{
    // Band n (1..4) starts at thresholds[n-1] of the grid maximum.
    std::array<double, 4> thresholds = {0.25, 0.5, 0.75, 1.0};
    size_t                hours      = 24;   // columns banded; later grid columns are dropped
    double                cell_size  = 16.0;
    double                cell_gap   = 2.0;
};

inline constexpr int kHeatmapBandCount = 5;

inline constexpr std::array<std::string_view, 7> kHeatmapDays = {
    "Sun", "Mon", "Tue", "Wed", "Thu", "Fri", "Sat"};

}   // namespace chartkit
