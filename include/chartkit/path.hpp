#pragma once

#include <chartkit/chart_style.hpp>
#include <chartkit/series.hpp>
#include <span>
#include <vector>

namespace chartkit
{

// ─── Line / area paths ──────────────────────────────────────────────────────
// Point i of N sits at x = i / (N-1) * width, regardless of timestamp
// spacing. y = height - scale_value(v, max(values, 1), height - 2*margin) - margin.
// A single point sits at x = 0.

// Pixel coordinates for every point of the series. Both path builders and
// chart_points() go through this, so stroke, fill and markers stay aligned.
[[nodiscard]] std::vector<Point2D> line_points(std::span<const TimeSeriesPoint> series,
                                               double                           width,
                                               double                           height,
                                               const LineChartStyle&            style = {});

// "Mx0,y0 Lx1,y1 ..." with N-1 line segments. Empty input gives "", a single
// point gives a lone move instruction.
[[nodiscard]] PathString build_line_path(std::span<const TimeSeriesPoint> series,
                                         double                           width,
                                         double                           height,
                                         const LineChartStyle&            style = {});

[[nodiscard]] PathString build_line_path(std::span<const TimeSeriesPoint> series,
                                         const LineChartStyle&            style);

// The line path closed down to the baseline: "... L{width},{height} L0,{height} Z".
[[nodiscard]] PathString build_area_path(std::span<const TimeSeriesPoint> series,
                                         double                           width,
                                         double                           height,
                                         const LineChartStyle&            style = {});

[[nodiscard]] PathString build_area_path(std::span<const TimeSeriesPoint> series,
                                         const LineChartStyle&            style);

// ─── Sparkline ──────────────────────────────────────────────────────────────
// Same layout on a small canvas without the fixed margin:
// y = height - v / max(values, 1) * (fill_ratio * height).

[[nodiscard]] std::vector<Point2D> sparkline_points(std::span<const TimeSeriesPoint> series,
                                                    const SparklineStyle&            style = {});

[[nodiscard]] PathString build_sparkline(std::span<const TimeSeriesPoint> series,
                                         double                           width  = 200.0,
                                         double                           height = 50.0);

[[nodiscard]] PathString build_sparkline(std::span<const TimeSeriesPoint> series,
                                         const SparklineStyle&            style);

// ─── Path text ──────────────────────────────────────────────────────────────

// "M" + "x,y" pairs joined by " L". Empty input gives "".
[[nodiscard]] PathString points_to_path(std::span<const Point2D> points);

}   // namespace chartkit
