#include <chartkit/color.hpp>
#include <chartkit/export.hpp>
#include <chartkit/format.hpp>
#include <chartkit/logger.hpp>
#include <chartkit/path.hpp>
#include <chartkit/sampling.hpp>

#include <fstream>
#include <sstream>

namespace chartkit
{

// ─── SVG Helpers ────────────────────────────────────────────────────────────

namespace
{

std::string fmt(double v)
{
    return format_number(v);
}

void open_document(std::ostringstream& svg, double w, double h)
{
    svg << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n";
    svg << "<svg xmlns=\"http://www.w3.org/2000/svg\" width=\"" << fmt(w) << "\" height=\""
        << fmt(h) << "\" viewBox=\"0 0 " << fmt(w) << " " << fmt(h) << "\">\n";
}

void close_document(std::ostringstream& svg)
{
    svg << "</svg>\n";
}

}   // anonymous namespace

// ─── SvgExporter ────────────────────────────────────────────────────────────

std::string SvgExporter::xml_escape(std::string_view s)
{
    std::string out;
    out.reserve(s.size());
    for (char c : s)
    {
        switch (c)
        {
            case '&':
                out += "&amp;";
                break;
            case '<':
                out += "&lt;";
                break;
            case '>':
                out += "&gt;";
                break;
            case '"':
                out += "&quot;";
                break;
            case '\'':
                out += "&apos;";
                break;
            default:
                out += c;
                break;
        }
    }
    return out;
}

std::string SvgExporter::path_element(std::string_view d,
                                      std::string_view css_class,
                                      std::string_view fill)
{
    std::string out = "<path d=\"" + xml_escape(d) + "\"";
    if (!css_class.empty())
        out += " class=\"" + xml_escape(css_class) + "\"";
    out += " fill=\"" + xml_escape(fill) + "\"/>";
    return out;
}

std::string SvgExporter::donut_circles(std::span<const ArcSegment> segments, const DonutStyle& style)
{
    // Center far enough in that the stroke never leaves the canvas
    const double c = style.radius + style.stroke_width;

    std::ostringstream svg;
    for (const auto& seg : segments)
    {
        svg << "<circle cx=\"" << fmt(c) << "\" cy=\"" << fmt(c) << "\" r=\"" << fmt(style.radius)
            << "\" fill=\"none\" stroke=\"" << xml_escape(seg.color) << "\" stroke-width=\""
            << fmt(style.stroke_width) << "\" stroke-dasharray=\"" << seg.dash_array()
            << "\" stroke-dashoffset=\"" << fmt(seg.dash_offset)
            << "\" transform=\"rotate(" << fmt(style.rotation) << " " << fmt(c) << " " << fmt(c)
            << ")\"><title>" << xml_escape(seg.label) << "</title></circle>\n";
    }
    return svg.str();
}

std::string SvgExporter::heatmap_rects(const HeatmapBands& bands, const HeatmapStyle& style)
{
    const double pitch = style.cell_size + style.cell_gap;

    std::ostringstream svg;
    for (size_t r = 0; r < bands.rows(); ++r)
    {
        for (size_t c = 0; c < bands.columns(); ++c)
        {
            svg << "<rect x=\"" << fmt(static_cast<double>(c) * pitch) << "\" y=\""
                << fmt(static_cast<double>(r) * pitch) << "\" width=\"" << fmt(style.cell_size)
                << "\" height=\"" << fmt(style.cell_size) << "\" rx=\"2\" fill=\""
                << xml_escape(palette::heatmap_band_color(bands.band(r, c))) << "\"><title>"
                << xml_escape(bands.row_keys()[r]) << " " << c << ":00</title></rect>\n";
        }
    }
    return svg.str();
}

std::string SvgExporter::line_chart(std::span<const TimeSeriesPoint> series,
                                    const LineChartStyle&            style)
{
    std::ostringstream svg;
    open_document(svg, style.width, style.height);

    if (series.empty())
    {
        CHARTKIT_LOG_DEBUG("chartkit.export", "line chart with no data, emitting empty canvas");
    }
    else
    {
        const auto area = build_area_path(series, style);
        svg << "  " << path_element(area, "chart-area", "rgba(0, 102, 70, 0.15)") << "\n";
        svg << "  " << path_element(build_line_path(series, style), "chart-line") << "\n";
        for (const auto& p :
             chart_points(series, style.width, style.height, style.marker_target, style))
        {
            svg << "  <circle class=\"chart-point\" cx=\"" << fmt(p.x) << "\" cy=\"" << fmt(p.y)
                << "\" r=\"4\"/>\n";
        }
    }

    close_document(svg);
    return svg.str();
}

std::string SvgExporter::donut_chart(std::span<const ArcSegment> segments, const DonutStyle& style)
{
    const double size = 2.0 * (style.radius + style.stroke_width);

    std::ostringstream svg;
    open_document(svg, size, size);
    svg << donut_circles(segments, style);
    close_document(svg);
    return svg.str();
}

std::string SvgExporter::heatmap_chart(const HeatmapBands& bands, const HeatmapStyle& style)
{
    const double pitch = style.cell_size + style.cell_gap;

    std::ostringstream svg;
    open_document(svg,
                  static_cast<double>(bands.columns()) * pitch,
                  static_cast<double>(bands.rows()) * pitch);
    svg << heatmap_rects(bands, style);
    close_document(svg);
    return svg.str();
}

bool SvgExporter::write_svg(const std::string& path, std::string_view document)
{
    std::ofstream f(path);
    if (!f.is_open())
    {
        CHARTKIT_LOG_ERROR("chartkit.export", "cannot open {} for writing", path);
        return false;
    }
    f << document;
    f.flush();
    return f.good();
}

}   // namespace chartkit
