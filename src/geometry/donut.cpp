#include <chartkit/aggregate.hpp>
#include <chartkit/donut.hpp>
#include <chartkit/format.hpp>
#include <chartkit/logger.hpp>

#include <numbers>
#include <utility>

namespace chartkit
{

std::string ArcSegment::dash_array() const
{
    return format_number(dash_length) + " " + format_number(dash_gap);
}

double circumference(double radius)
{
    return 2.0 * std::numbers::pi * radius;
}

std::vector<ArcSegment> encode_donut(std::span<const CategoryPoint> distribution,
                                     double                         radius,
                                     const ColorTable&              colors)
{
    const double total = aggregate::sum(distribution);
    const double circ  = circumference(radius);

    if (total == 0.0 && !distribution.empty())
        CHARTKIT_LOG_DEBUG("chartkit.donut",
                           "zero total across {} categories, segments left empty",
                           distribution.size());

    std::vector<ArcSegment> out;
    out.reserve(distribution.size());

    double offset = 0.0;
    for (const auto& item : distribution)
    {
        ArcSegment seg;
        seg.label       = item.label;
        seg.color       = colors.lookup(item.label);
        seg.dash_length = total == 0.0 ? 0.0 : (item.value / total) * circ;
        seg.dash_gap    = circ - seg.dash_length;
        seg.dash_offset = -offset;
        offset += seg.dash_length;
        out.push_back(std::move(seg));
    }
    return out;
}

}   // namespace chartkit
