#include <chartkit/heatmap.hpp>
#include <chartkit/logger.hpp>

#include <algorithm>
#include <utility>

namespace chartkit
{

int band_for(double value, double max_value, const std::array<double, 4>& thresholds)
{
    if (value == 0.0)
        return 0;

    const double intensity = value / (max_value > 0.0 ? max_value : 1.0);
    int          band      = 0;
    for (double t : thresholds)
    {
        if (intensity >= t)
            ++band;
    }
    return band;
}

// ─── HeatmapBands ───────────────────────────────────────────────────────────

HeatmapBands::HeatmapBands(std::vector<std::string> row_keys, size_t columns, double max_value)
    : row_keys_(std::move(row_keys)),
      columns_(columns),
      max_value_(max_value),
      bands_(row_keys_.size() * columns, 0)
{
}

int HeatmapBands::band(size_t row, size_t col) const
{
    if (row >= row_keys_.size() || col >= columns_)
        return 0;
    return bands_[row * columns_ + col];
}

int HeatmapBands::band(std::string_view row_key, size_t col) const
{
    auto it = std::find(row_keys_.begin(), row_keys_.end(), row_key);
    if (it == row_keys_.end())
        return 0;
    return band(static_cast<size_t>(it - row_keys_.begin()), col);
}

void HeatmapBands::set_band(size_t row, size_t col, int band)
{
    if (row >= row_keys_.size() || col >= columns_)
        return;
    bands_[row * columns_ + col] = static_cast<std::uint8_t>(std::clamp(band, 0, kHeatmapBandCount - 1));
}

// ─── bucketize ──────────────────────────────────────────────────────────────

namespace
{

// Largest cell over the first `columns` hours of every listed row.
std::uint32_t grid_max(const HeatmapGrid& grid, size_t columns)
{
    std::uint32_t best = 0;
    for (size_t r = 0; r < grid.row_keys.size(); ++r)
    {
        for (size_t c = 0; c < columns; ++c)
            best = std::max(best, grid.value(r, c));
    }
    return best;
}

}   // namespace

double heatmap_max(const HeatmapGrid& grid)
{
    std::uint32_t best = grid_max(grid, grid.columns);
    return best == 0 ? 1.0 : static_cast<double>(best);
}

HeatmapBands bucketize(const HeatmapGrid& grid, const HeatmapStyle& style)
{
    const size_t        columns   = std::min(grid.columns, style.hours);
    const std::uint32_t best      = grid_max(grid, columns);
    const double        max_value = best == 0 ? 1.0 : static_cast<double>(best);

    if (grid.row_keys.empty() || columns == 0)
        CHARTKIT_LOG_DEBUG("chartkit.heatmap", "empty grid, every cell is band 0");

    HeatmapBands out(grid.row_keys, columns, max_value);
    for (size_t r = 0; r < grid.row_keys.size(); ++r)
    {
        for (size_t c = 0; c < columns; ++c)
            out.set_band(r, c, band_for(grid.value(r, c), max_value, style.thresholds));
    }
    return out;
}

}   // namespace chartkit
