#pragma once

#include <chartkit/series.hpp>
#include <span>

namespace chartkit::aggregate
{

// Headline totals and proportional bar widths shared by every chart type.
// All functions are total: empty input yields 0 (sum, latest) or the
// floor (max), and nothing divides by a value below 1.

[[nodiscard]] double sum(std::span<const double> values);
[[nodiscard]] double sum(std::span<const TimeSeriesPoint> series);
[[nodiscard]] double sum(std::span<const CategoryPoint> distribution);

// Largest value, but never less than floor.
[[nodiscard]] double max(std::span<const double> values, double floor = 1.0);
[[nodiscard]] double max(std::span<const TimeSeriesPoint> series, double floor = 1.0);
[[nodiscard]] double max(std::span<const CategoryPoint> distribution, double floor = 1.0);

// value / max(values) * 100, for horizontal bars sized against the largest entry.
[[nodiscard]] double bar_width_percent(double value, std::span<const double> values);
[[nodiscard]] double bar_width_percent(double value, std::span<const CategoryPoint> distribution);

// Most recent value, 0 for an empty series.
[[nodiscard]] double latest(std::span<const TimeSeriesPoint> series);

}   // namespace chartkit::aggregate
