// Chart Configuration Demo
// Demonstrates chart style persistence and tier color overrides
//
// This example shows:
// - Overriding tier colors and canvas sizes
// - Saving the configuration to a JSON file
// - Loading it back and rendering with the loaded styles
// - Callback system for configuration changes

#include <chartkit/chartkit.hpp>
#include <iostream>

int main()
{
    std::cout << "=== Chart Configuration Demo ===\n\n";

    chartkit::ChartConfig config;
    int                   changes = 0;
    config.set_on_change([&]() { ++changes; });

    std::cout << "1. Overriding styles...\n";
    chartkit::DonutStyle donut;
    donut.radius       = 90;
    donut.stroke_width = 24;
    config.set_donut_style(donut);

    config.set_tier_color("PREMIUM", "#d946ef");
    config.set_tier_color("ENTERPRISE", "#0ea5e9");
    if (!config.set_tier_color("FREE", "light grey"))
        std::cout << "   - rejected 'light grey' for FREE\n";
    std::cout << "   " << changes << " changes recorded\n";

    std::cout << "\n2. Saving to JSON file...\n";
    const std::string filename = "custom_chart.json";
    if (!config.save(filename))
    {
        std::cout << "   failed to save " << filename << "\n";
        return 1;
    }
    std::cout << config.serialize();

    std::cout << "\n3. Loading from JSON file...\n";
    chartkit::ChartConfig loaded;
    if (!loaded.load(filename))
    {
        std::cout << "   failed to load " << filename << "\n";
        return 1;
    }

    chartkit::Distribution subs = {{"FREE", 10}, {"PREMIUM", 4}, {"ENTERPRISE", 1}};
    for (const auto& seg :
         chartkit::encode_donut(subs, loaded.donut_style().radius, loaded.tier_colors()))
    {
        std::cout << "   " << seg.label << " -> " << seg.color << "\n";
    }

    std::cout << "\n4. Resetting...\n";
    loaded.reset_all();
    std::cout << "   overrides left: " << loaded.tier_color_count() << "\n";

    return 0;
}
