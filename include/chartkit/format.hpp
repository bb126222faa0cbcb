#pragma once

#include <string>

namespace chartkit
{

// Shortest decimal text that round-trips `value`, always in fixed notation.
// Integral values carry no decimal point and -0 prints as "0". For
// magnitudes in [1e-6, 1e21), which covers any pixel coordinate, this is the
// same text a browser produces when interpolating a number into a path;
// outside that range a browser switches to exponent notation and this does not.
// Non-finite input prints as "NaN", "Infinity" or "-Infinity".
std::string format_number(double value);

// Headline number for a KPI card: "1.2M", "45.3K", or the value itself
// rounded to at most three fraction digits.
std::string format_kpi_value(double value);

}   // namespace chartkit
