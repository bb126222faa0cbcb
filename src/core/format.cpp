#include <chartkit/format.hpp>

#include <charconv>
#include <cmath>
#include <cstdio>
#include <system_error>

namespace chartkit
{

std::string format_number(double value)
{
    if (std::isnan(value))
        return "NaN";
    if (std::isinf(value))
        return value > 0.0 ? "Infinity" : "-Infinity";
    if (value == 0.0)
        return "0";

    // Fixed notation of the largest finite double needs 309 integer digits.
    char buf[512];
    auto [end, ec] = std::to_chars(buf, buf + sizeof(buf), value, std::chars_format::fixed);
    if (ec != std::errc{})
    {
        std::snprintf(buf, sizeof(buf), "%.17g", value);
        return buf;
    }
    return std::string(buf, end);
}

std::string format_kpi_value(double value)
{
    char buf[64];
    if (value >= 1'000'000.0)
    {
        std::snprintf(buf, sizeof(buf), "%.1fM", value / 1'000'000.0);
        return buf;
    }
    if (value >= 1'000.0)
    {
        std::snprintf(buf, sizeof(buf), "%.1fK", value / 1'000.0);
        return buf;
    }

    std::snprintf(buf, sizeof(buf), "%.3f", value);
    std::string out(buf);
    auto        dot = out.find('.');
    if (dot != std::string::npos)
    {
        auto last = out.find_last_not_of('0');
        out.erase(last == dot ? dot : last + 1);
    }
    if (out == "-0")
        out = "0";
    return out;
}

}   // namespace chartkit
