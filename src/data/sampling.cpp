#include <chartkit/logger.hpp>
#include <chartkit/path.hpp>
#include <chartkit/sampling.hpp>

#include <algorithm>
#include <charconv>
#include <system_error>

namespace chartkit
{

std::vector<size_t> sample_indices(size_t n, size_t target_count)
{
    if (n == 0)
        return {};
    if (target_count == 0)
    {
        CHARTKIT_LOG_DEBUG("chartkit.sampling", "target_count 0 treated as 1 (n={})", n);
        target_count = 1;
    }

    const size_t step = std::max<size_t>(1, n / target_count);

    std::vector<size_t> out;
    out.reserve(n / step + 1);
    for (size_t i = 0; i < n; i += step)
        out.push_back(i);

    // Keep the most recent point even when it falls between steps
    if (out.back() != n - 1)
        out.push_back(n - 1);

    return out;
}

std::vector<size_t> sample(std::span<const TimeSeriesPoint> series, size_t target_count)
{
    return sample_indices(series.size(), target_count);
}

std::vector<Point2D> chart_points(std::span<const TimeSeriesPoint> series,
                                  double                           width,
                                  double                           height,
                                  size_t                           target_count,
                                  const LineChartStyle&            style)
{
    if (series.empty())
        return {};

    const auto all = line_points(series, width, height, style);

    std::vector<Point2D> out;
    for (size_t i : sample_indices(series.size(), target_count))
        out.push_back(all[i]);
    return out;
}

std::vector<std::string> axis_labels(std::span<const TimeSeriesPoint> series, size_t target_count)
{
    std::vector<std::string> out;
    for (size_t i : sample_indices(series.size(), target_count))
        out.push_back(short_date_label(series[i].timestamp));
    return out;
}

// ─── Date labels ────────────────────────────────────────────────────────────

namespace
{

constexpr const char* kMonthNames[] = {
    "Jan", "Feb", "Mar", "Apr", "May", "Jun", "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};

bool parse_fixed(std::string_view text, int& out)
{
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
    return ec == std::errc{} && ptr == text.data() + text.size();
}

}   // namespace

std::string short_date_label(std::string_view timestamp)
{
    // YYYY-MM-DD, optionally followed by a time part
    if (timestamp.size() < 10 || timestamp[4] != '-' || timestamp[7] != '-')
        return std::string(timestamp);

    int year = 0, month = 0, day = 0;
    if (!parse_fixed(timestamp.substr(0, 4), year) || !parse_fixed(timestamp.substr(5, 2), month)
        || !parse_fixed(timestamp.substr(8, 2), day))
        return std::string(timestamp);
    if (month < 1 || month > 12 || day < 1 || day > 31)
        return std::string(timestamp);

    return std::string(kMonthNames[month - 1]) + " " + std::to_string(day);
}

}   // namespace chartkit
