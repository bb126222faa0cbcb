#pragma once

#include <chartkit/chart_style.hpp>
#include <chartkit/color.hpp>
#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace chartkit
{

// Persistent chart styling: canvas sizes, margins, donut radius, heatmap
// thresholds and tier-color overrides, saved as a small JSON document.
// Keys missing from a loaded document keep their defaults.
class ChartConfig
{
   public:
    ChartConfig() = default;

    struct TierColor
    {
        std::string label;   // e.g. "PREMIUM"
        std::string color;   // normalized "#rrggbb"
    };

    const LineChartStyle& line_style() const { return line_; }
    const SparklineStyle& sparkline_style() const { return sparkline_; }
    const DonutStyle&     donut_style() const { return donut_; }
    const HeatmapStyle&   heatmap_style() const { return heatmap_; }

    void set_line_style(const LineChartStyle& s);
    void set_sparkline_style(const SparklineStyle& s);
    void set_donut_style(const DonutStyle& s);
    void set_heatmap_style(const HeatmapStyle& s);

    // Override the color of one tier. Returns false (and changes nothing)
    // unless color is "#rgb" or "#rrggbb".
    bool set_tier_color(const std::string& label, const std::string& color);
    void remove_tier_color(const std::string& label);
    bool has_tier_color(const std::string& label) const;

    std::vector<TierColor> tier_color_overrides() const { return tier_colors_; }
    size_t                 tier_color_count() const { return tier_colors_.size(); }

    // ColorTable::tiers() with the overrides layered on top.
    ColorTable tier_colors() const;

    // Restore every style and drop all overrides.
    void reset_all();

    std::string serialize() const;

    // Returns false on empty input or a newer document version; the current
    // settings are kept in that case.
    bool deserialize(const std::string& json);

    bool save(const std::string& path) const;
    bool load(const std::string& path);

    // ~/.config/chartkit/chart.json
    static std::string default_path();

    using ChangeCallback = std::function<void()>;
    void set_on_change(ChangeCallback cb) { on_change_ = std::move(cb); }

    static constexpr int kVersion = 1;

   private:
    void notify_change();

    LineChartStyle         line_;
    SparklineStyle         sparkline_;
    DonutStyle             donut_;
    HeatmapStyle           heatmap_;
    std::vector<TierColor> tier_colors_;
    ChangeCallback         on_change_;
};

}   // namespace chartkit
