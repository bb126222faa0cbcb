#include <chartkit/aggregate.hpp>
#include <chartkit/format.hpp>
#include <chartkit/logger.hpp>
#include <chartkit/path.hpp>
#include <chartkit/scale.hpp>

namespace chartkit
{

namespace
{

// x of point i on an evenly spaced index axis. A lone point sits at 0.
double index_x(size_t i, size_t n, double width)
{
    if (n < 2)
        return 0.0;
    return (static_cast<double>(i) / static_cast<double>(n - 1)) * width;
}

void append_pair(PathString& out, const Point2D& p)
{
    out += format_number(p.x);
    out += ',';
    out += format_number(p.y);
}

}   // namespace

// ─── Line / area ────────────────────────────────────────────────────────────

std::vector<Point2D> line_points(std::span<const TimeSeriesPoint> series,
                                 double                           width,
                                 double                           height,
                                 const LineChartStyle&            style)
{
    const size_t n = series.size();
    if (n == 0)
        return {};

    const double max_val    = aggregate::max(series);
    const double plot_range = height - 2.0 * style.margin;

    std::vector<Point2D> out;
    out.reserve(n);
    for (size_t i = 0; i < n; ++i)
    {
        const double y = height - scale_value(series[i].value, max_val, plot_range) - style.margin;
        out.push_back({index_x(i, n, width), y});
    }
    return out;
}

PathString build_line_path(std::span<const TimeSeriesPoint> series,
                           double                           width,
                           double                           height,
                           const LineChartStyle&            style)
{
    if (series.empty())
    {
        CHARTKIT_LOG_DEBUG("chartkit.path", "empty series, line path left blank");
        return {};
    }
    if (series.size() == 1)
        CHARTKIT_LOG_DEBUG("chartkit.path", "single-point series, emitting a lone move-to");

    return points_to_path(line_points(series, width, height, style));
}

PathString build_line_path(std::span<const TimeSeriesPoint> series, const LineChartStyle& style)
{
    return build_line_path(series, style.width, style.height, style);
}

PathString build_area_path(std::span<const TimeSeriesPoint> series,
                           double                           width,
                           double                           height,
                           const LineChartStyle&            style)
{
    if (series.empty())
    {
        CHARTKIT_LOG_DEBUG("chartkit.path", "empty series, area path left blank");
        return {};
    }

    PathString out = points_to_path(line_points(series, width, height, style));
    out += " L";
    append_pair(out, {width, height});
    out += " L";
    append_pair(out, {0.0, height});
    out += " Z";
    return out;
}

PathString build_area_path(std::span<const TimeSeriesPoint> series, const LineChartStyle& style)
{
    return build_area_path(series, style.width, style.height, style);
}

// ─── Sparkline ──────────────────────────────────────────────────────────────

std::vector<Point2D> sparkline_points(std::span<const TimeSeriesPoint> series,
                                      const SparklineStyle&            style)
{
    const size_t n = series.size();
    if (n == 0)
        return {};

    const double max_val = aggregate::max(series);
    const double span_y  = style.fill_ratio * style.height;

    std::vector<Point2D> out;
    out.reserve(n);
    for (size_t i = 0; i < n; ++i)
    {
        const double y = style.height - (series[i].value / max_val) * span_y;
        out.push_back({index_x(i, n, style.width), y});
    }
    return out;
}

PathString build_sparkline(std::span<const TimeSeriesPoint> series, double width, double height)
{
    SparklineStyle style;
    style.width  = width;
    style.height = height;
    return build_sparkline(series, style);
}

PathString build_sparkline(std::span<const TimeSeriesPoint> series, const SparklineStyle& style)
{
    if (series.empty())
    {
        CHARTKIT_LOG_DEBUG("chartkit.path", "empty series, sparkline left blank");
        return {};
    }
    return points_to_path(sparkline_points(series, style));
}

// ─── Path text ──────────────────────────────────────────────────────────────

PathString points_to_path(std::span<const Point2D> points)
{
    PathString out;
    if (points.empty())
        return out;

    // Roughly "123.456,78.9 L" per point
    out.reserve(points.size() * 24);
    out += 'M';
    append_pair(out, points[0]);
    for (size_t i = 1; i < points.size(); ++i)
    {
        out += " L";
        append_pair(out, points[i]);
    }
    return out;
}

}   // namespace chartkit
