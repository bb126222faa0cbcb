#include <chartkit/aggregate.hpp>

namespace chartkit::aggregate
{

namespace
{

template <typename Range, typename Proj>
double sum_by(const Range& range, Proj proj)
{
    double total = 0.0;
    for (const auto& item : range)
        total += proj(item);
    return total;
}

template <typename Range, typename Proj>
double max_by(const Range& range, double floor, Proj proj)
{
    double best = floor;
    for (const auto& item : range)
    {
        double v = proj(item);
        if (v > best)
            best = v;
    }
    return best;
}

double point_value(const TimeSeriesPoint& p)
{
    return p.value;
}

double category_value(const CategoryPoint& c)
{
    return c.value;
}

}   // namespace

double sum(std::span<const double> values)
{
    return sum_by(values, [](double v) { return v; });
}

double sum(std::span<const TimeSeriesPoint> series)
{
    return sum_by(series, point_value);
}

double sum(std::span<const CategoryPoint> distribution)
{
    return sum_by(distribution, category_value);
}

double max(std::span<const double> values, double floor)
{
    return max_by(values, floor, [](double v) { return v; });
}

double max(std::span<const TimeSeriesPoint> series, double floor)
{
    return max_by(series, floor, point_value);
}

double max(std::span<const CategoryPoint> distribution, double floor)
{
    return max_by(distribution, floor, category_value);
}

double bar_width_percent(double value, std::span<const double> values)
{
    return (value / max(values)) * 100.0;
}

double bar_width_percent(double value, std::span<const CategoryPoint> distribution)
{
    return (value / max(distribution)) * 100.0;
}

double latest(std::span<const TimeSeriesPoint> series)
{
    return series.empty() ? 0.0 : series.back().value;
}

}   // namespace chartkit::aggregate
