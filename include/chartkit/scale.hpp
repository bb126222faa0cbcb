#pragma once

namespace chartkit
{

// Linear map of [0, domain_max] onto [range_min, range_max].
//
// domain_max is floored to 1 before dividing, so an all-zero series maps
// every value to range_min (a flat baseline) instead of NaN. Values outside
// the domain are extrapolated, not clamped.
[[nodiscard]] double scale_value(double value,
                                 double domain_max,
                                 double range_max,
                                 double range_min = 0.0);

// The floored denominator used by scale_value.
[[nodiscard]] double safe_domain(double domain_max);

}   // namespace chartkit
