#pragma once

#include <chartkit/chart_style.hpp>
#include <chartkit/donut.hpp>
#include <chartkit/heatmap.hpp>
#include <chartkit/series.hpp>
#include <span>
#include <string>
#include <string_view>

namespace chartkit
{

// Wraps computed geometry in SVG markup. Nothing here rasterizes; the
// output is text for a browser or any other SVG consumer.
class SvgExporter
{
   public:
    // <path d="..." class="..." fill="..."/>
    static std::string path_element(std::string_view d,
                                    std::string_view css_class,
                                    std::string_view fill = "none");

    // One <circle> per segment, rotated by style.rotation about the center.
    static std::string donut_circles(std::span<const ArcSegment> segments,
                                     const DonutStyle&           style = {});

    // One <rect> per cell, filled with the band's palette color.
    static std::string heatmap_rects(const HeatmapBands& bands, const HeatmapStyle& style = {});

    // Standalone document: baseline-anchored area, stroke and sampled markers.
    static std::string line_chart(std::span<const TimeSeriesPoint> series,
                                  const LineChartStyle&            style = {});

    // Standalone ring chart document.
    static std::string donut_chart(std::span<const ArcSegment> segments,
                                   const DonutStyle&           style = {});

    // Standalone heatmap document.
    static std::string heatmap_chart(const HeatmapBands& bands, const HeatmapStyle& style = {});

    static bool write_svg(const std::string& path, std::string_view document);

    // XML-escape for attribute values and text content.
    static std::string xml_escape(std::string_view s);
};

}   // namespace chartkit
