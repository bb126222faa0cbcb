#include <chartkit/scale.hpp>

namespace chartkit
{

double safe_domain(double domain_max)
{
    // NaN compares false and falls through unchanged; that is the caller's data.
    return domain_max < 1.0 ? 1.0 : domain_max;
}

double scale_value(double value, double domain_max, double range_max, double range_min)
{
    return range_min + (value / safe_domain(domain_max)) * (range_max - range_min);
}

}   // namespace chartkit
