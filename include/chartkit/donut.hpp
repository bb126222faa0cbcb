#pragma once

#include <chartkit/color.hpp>
#include <chartkit/series.hpp>
#include <span>
#include <string>
#include <vector>

namespace chartkit
{

// One wedge of a ring chart, encoded as a stroke dash pattern on a full
// circle rather than explicit arc endpoints.
struct ArcSegment
{
    std::string label;
    std::string color;
    double      dash_length = 0.0;   // visible arc length
    double      dash_gap    = 0.0;   // circumference - dash_length
    double      dash_offset = 0.0;   // minus the sum of all earlier dash lengths

    // "{dash_length} {dash_gap}", ready for a stroke-dasharray attribute.
    std::string dash_array() const;
};

// Segments in input order, tiling the ring without overlap. The starting
// rotation is the renderer's concern and is not folded into dash_offset.
//
// A zero total yields one zero-length segment per category. Negative values
// are not rejected; they produce negative dash lengths.
[[nodiscard]] std::vector<ArcSegment> encode_donut(std::span<const CategoryPoint> distribution,
                                                   double            radius = 70.0,
                                                   const ColorTable& colors = ColorTable::tiers());

[[nodiscard]] double circumference(double radius);

}   // namespace chartkit
