#pragma once

#include <array>
#include <chartkit/chart_style.hpp>
#include <chartkit/series.hpp>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace chartkit
{

// Band of a single cell: 0 for a zero value, otherwise the number of
// thresholds the intensity value / max_value reaches (0..4). A max_value
// that is not positive is replaced by 1.
[[nodiscard]] int band_for(double                       value,
                           double                       max_value,
                           const std::array<double, 4>& thresholds = HeatmapStyle{}.thresholds);

// Result of bucketize(): a dense rows x columns table of band indices.
class HeatmapBands
{
   public:
    HeatmapBands() = default;
    HeatmapBands(std::vector<std::string> row_keys, size_t columns, double max_value);

    // Out-of-range cells and unknown rows are band 0.
    int band(size_t row, size_t col) const;
    int band(std::string_view row_key, size_t col) const;

    void set_band(size_t row, size_t col, int band);

    const std::vector<std::string>& row_keys() const { return row_keys_; }
    size_t                          rows() const { return row_keys_.size(); }
    size_t                          columns() const { return columns_; }

    // Grid maximum used as the intensity denominator (1 for an empty or all-zero grid).
    double max_value() const { return max_value_; }

   private:
    std::vector<std::string>  row_keys_;
    size_t                    columns_   = 0;
    double                    max_value_ = 1.0;
    std::vector<std::uint8_t> bands_;
};

// Largest cell across every listed row, or 1 when there is none above zero.
[[nodiscard]] double heatmap_max(const HeatmapGrid& grid);

// Bands the first min(grid.columns, style.hours) columns of every row against
// the maximum over those cells. The cutoffs are fixed fractions of that
// maximum, so a single dominant outlier pushes every other cell into the low
// bands.
[[nodiscard]] HeatmapBands bucketize(const HeatmapGrid& grid, const HeatmapStyle& style = {});

}   // namespace chartkit
