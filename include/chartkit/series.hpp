#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace chartkit
{

// ─── Input series ───────────────────────────────────────────────────────────
// Values are expected to be finite, and distribution values non-negative.
// None of this is validated: NaN, infinities or negative shares propagate
// into the output geometry unchanged.

struct TimeSeriesPoint
{
    std::string timestamp;   // ISO-8601, e.g. "2025-01-05T00:00:00Z"
    double      value = 0.0;
};

// Chronological; the engine is index-based and assumes a uniform cadence.
using TimeSeries = std::vector<TimeSeriesPoint>;

struct CategoryPoint
{
    std::string label;
    double      value = 0.0;
};

// Legend/draw order. Never re-sorted by the library.
using Distribution = std::vector<CategoryPoint>;

// Row key -> per-hour counts. Rows listed in row_keys but absent from rows,
// and columns past the end of a short row, read as zero.
struct HeatmapGrid
{
    std::vector<std::string>                                     row_keys;
    std::map<std::string, std::vector<std::uint32_t>, std::less<>> rows;
    size_t                                                       columns = 24;

    std::uint32_t value(std::string_view row_key, size_t col) const
    {
        auto it = rows.find(row_key);
        if (it == rows.end() || col >= columns || col >= it->second.size())
            return 0;
        return it->second[col];
    }

    std::uint32_t value(size_t row, size_t col) const
    {
        if (row >= row_keys.size())
            return 0;
        return value(row_keys[row], col);
    }
};

// ─── Output geometry ────────────────────────────────────────────────────────

// "M x,y L x,y ..." in the SVG path mini-language.
using PathString = std::string;

struct Point2D
{
    double x = 0.0;
    double y = 0.0;
};

}   // namespace chartkit
