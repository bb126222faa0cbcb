#pragma once

#include <chartkit/chart_style.hpp>
#include <chartkit/series.hpp>
#include <cstddef>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace chartkit
{

// Evenly spaced subset of [0, n) for markers and axis labels.
//
// step = max(1, floor(n / target_count)); picks 0, step, 2*step, ... and
// always appends n-1 when it is not already on a step boundary, so the most
// recent point is never dropped. The result can therefore hold one index
// more than n / step. n <= target_count selects every index; a
// target_count of 0 is treated as 1.
[[nodiscard]] std::vector<size_t> sample_indices(size_t n, size_t target_count);

[[nodiscard]] std::vector<size_t> sample(std::span<const TimeSeriesPoint> series,
                                         size_t                           target_count);

// Marker positions for the sampled points, in the same pixel space as
// build_line_path(series, width, height, style).
[[nodiscard]] std::vector<Point2D> chart_points(std::span<const TimeSeriesPoint> series,
                                                double                           width,
                                                double                           height,
                                                size_t                target_count = 10,
                                                const LineChartStyle& style        = {});

// "Jan 5" style labels for the sampled points.
[[nodiscard]] std::vector<std::string> axis_labels(std::span<const TimeSeriesPoint> series,
                                                   size_t target_count = 6);

// "Mon D" from the leading YYYY-MM-DD of an ISO-8601 timestamp. Text whose
// date prefix does not parse is returned unchanged.
[[nodiscard]] std::string short_date_label(std::string_view timestamp);

}   // namespace chartkit
