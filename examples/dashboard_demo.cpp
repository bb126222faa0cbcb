// Dashboard Demo
// Builds every chart on an admin analytics page from canned data and writes
// each one as a standalone SVG next to the working directory.
//
// This example shows:
// - Line and area paths with sampled markers and axis labels
// - Sparklines and KPI headline values
// - Subscription tiers as a donut
// - Weekly activity as a banded heatmap

#include <chartkit/chartkit.hpp>
#include <cmath>
#include <cstdio>
#include <iostream>

using namespace chartkit;

namespace
{

TimeSeries user_growth(int days)
{
    TimeSeries s;
    for (int d = 0; d < days; ++d)
    {
        char ts[32];
        std::snprintf(ts, sizeof(ts), "2025-%02d-%02dT00:00:00Z", 1 + d / 28, 1 + d % 28);
        double trend = 120.0 + 4.5 * d + 30.0 * std::sin(d * 0.4);
        s.push_back({ts, std::round(trend)});
    }
    return s;
}

HeatmapGrid weekly_activity()
{
    HeatmapGrid grid;
    for (size_t day = 0; day < kHeatmapDays.size(); ++day)
    {
        std::vector<std::uint32_t> hours(24, 0);
        for (size_t h = 7; h < 23; ++h)
        {
            // Weekday evenings peak, weekends are flat
            bool weekend = day == 0 || day == 6;
            hours[h]     = static_cast<std::uint32_t>(weekend ? 8 : (h >= 17 && h <= 20 ? 40 : 12));
        }
        grid.row_keys.emplace_back(kHeatmapDays[day]);
        grid.rows[std::string(kHeatmapDays[day])] = std::move(hours);
    }
    return grid;
}

void save(const std::string& file, const std::string& svg)
{
    if (SvgExporter::write_svg(file, svg))
        std::cout << "   saved " << file << "\n";
    else
        std::cout << "   failed to write " << file << "\n";
}

}   // namespace

int main()
{
    Logger::instance().set_level(LogLevel::Info);
    Logger::instance().add_sink(sinks::console_sink());

    ChartConfig config;
    if (!config.load(ChartConfig::default_path()))
        std::cout << "Using default chart styles\n";
    const auto tiers = config.tier_colors();

    std::cout << "=== User growth ===\n";
    auto growth = user_growth(90);
    std::cout << "   total: " << format_kpi_value(aggregate::sum(growth))
              << "  latest: " << format_kpi_value(aggregate::latest(growth)) << "\n";
    std::cout << "   labels:";
    for (const auto& label : axis_labels(growth, config.line_style().label_target))
        std::cout << " " << label;
    std::cout << "\n";
    save("user_growth.svg", SvgExporter::line_chart(growth, config.line_style()));

    std::cout << "=== Revenue sparkline ===\n";
    TimeSeries revenue(growth.end() - 30, growth.end());
    std::cout << "   d=\"" << build_sparkline(revenue, config.sparkline_style()) << "\"\n";

    std::cout << "=== Subscriptions ===\n";
    Distribution subs = {{"FREE", 1840}, {"BASIC", 420}, {"PREMIUM", 156}, {"FAMILY", 64}, {"SCHOOL", 21}};
    auto ring = encode_donut(subs, config.donut_style().radius, tiers);
    for (size_t i = 0; i < ring.size(); ++i)
    {
        const auto& seg = ring[i];
        std::cout << "   " << seg.label << " " << seg.color << " dasharray=" << seg.dash_array()
                  << " bar=" << format_kpi_value(aggregate::bar_width_percent(subs[i].value, subs))
                  << "%\n";
    }
    save("subscriptions.svg", SvgExporter::donut_chart(ring, config.donut_style()));

    std::cout << "=== Weekly activity ===\n";
    auto bands = bucketize(weekly_activity(), config.heatmap_style());
    std::cout << "   peak: " << format_kpi_value(bands.max_value())
              << "  Wed 18:00 band " << bands.band("Wed", 18) << "\n";
    save("activity.svg", SvgExporter::heatmap_chart(bands, config.heatmap_style()));

    return 0;
}
