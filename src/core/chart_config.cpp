#include <chartkit/chart_config.hpp>
#include <chartkit/format.hpp>
#include <chartkit/logger.hpp>

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <limits>
#include <sstream>
#include <system_error>

namespace chartkit
{

// ─── Style setters ──────────────────────────────────────────────────────────

void ChartConfig::set_line_style(const LineChartStyle& s)
{
    line_ = s;
    notify_change();
}

void ChartConfig::set_sparkline_style(const SparklineStyle& s)
{
    sparkline_ = s;
    notify_change();
}

void ChartConfig::set_donut_style(const DonutStyle& s)
{
    donut_ = s;
    notify_change();
}

void ChartConfig::set_heatmap_style(const HeatmapStyle& s)
{
    heatmap_ = s;
    notify_change();
}

// ─── Tier colors ────────────────────────────────────────────────────────────

bool ChartConfig::set_tier_color(const std::string& label, const std::string& color)
{
    auto parsed = Color::from_hex(color);
    if (!parsed)
    {
        CHARTKIT_LOG_WARN("chartkit.config", "ignoring tier color '{}' for {}", color, label);
        return false;
    }

    std::string normalized = parsed->to_hex();
    for (auto& t : tier_colors_)
    {
        if (t.label == label)
        {
            t.color = std::move(normalized);
            notify_change();
            return true;
        }
    }
    tier_colors_.push_back({label, std::move(normalized)});
    notify_change();
    return true;
}

void ChartConfig::remove_tier_color(const std::string& label)
{
    std::erase_if(tier_colors_, [&](const TierColor& t) { return t.label == label; });
    notify_change();
}

bool ChartConfig::has_tier_color(const std::string& label) const
{
    return std::any_of(tier_colors_.begin(),
                       tier_colors_.end(),
                       [&](const TierColor& t) { return t.label == label; });
}

ColorTable ChartConfig::tier_colors() const
{
    ColorTable table = ColorTable::tiers();
    for (const auto& t : tier_colors_)
        table.set(t.label, t.color);
    return table;
}

void ChartConfig::reset_all()
{
    line_      = {};
    sparkline_ = {};
    donut_     = {};
    heatmap_   = {};
    tier_colors_.clear();
    notify_change();
}

// ─── JSON serialization ─────────────────────────────────────────────────────

static std::string escape_json(const std::string& s)
{
    std::string out;
    out.reserve(s.size() + 8);
    for (char c : s)
    {
        switch (c)
        {
            case '"':
                out += "\\\"";
                break;
            case '\\':
                out += "\\\\";
                break;
            case '\n':
                out += "\\n";
                break;
            case '\t':
                out += "\\t";
                break;
            default:
                out += c;
                break;
        }
    }
    return out;
}

std::string ChartConfig::serialize() const
{
    std::ostringstream os;
    os << "{\n";
    os << "  \"version\": " << kVersion << ",\n";

    os << "  \"line\": {\n";
    os << "    \"width\": " << format_number(line_.width) << ",\n";
    os << "    \"height\": " << format_number(line_.height) << ",\n";
    os << "    \"margin\": " << format_number(line_.margin) << ",\n";
    os << "    \"marker_target\": " << line_.marker_target << ",\n";
    os << "    \"label_target\": " << line_.label_target << "\n";
    os << "  },\n";

    os << "  \"sparkline\": {\n";
    os << "    \"width\": " << format_number(sparkline_.width) << ",\n";
    os << "    \"height\": " << format_number(sparkline_.height) << ",\n";
    os << "    \"fill_ratio\": " << format_number(sparkline_.fill_ratio) << "\n";
    os << "  },\n";

    os << "  \"donut\": {\n";
    os << "    \"radius\": " << format_number(donut_.radius) << ",\n";
    os << "    \"stroke_width\": " << format_number(donut_.stroke_width) << ",\n";
    os << "    \"rotation\": " << format_number(donut_.rotation) << "\n";
    os << "  },\n";

    os << "  \"heatmap\": {\n";
    os << "    \"thresholds\": [";
    for (size_t i = 0; i < heatmap_.thresholds.size(); ++i)
    {
        if (i > 0)
            os << ", ";
        os << format_number(heatmap_.thresholds[i]);
    }
    os << "],\n";
    os << "    \"hours\": " << heatmap_.hours << ",\n";
    os << "    \"cell_size\": " << format_number(heatmap_.cell_size) << ",\n";
    os << "    \"cell_gap\": " << format_number(heatmap_.cell_gap) << "\n";
    os << "  },\n";

    os << "  \"tier_colors\": [\n";
    for (size_t i = 0; i < tier_colors_.size(); ++i)
    {
        const auto& t = tier_colors_[i];
        os << "    {\"label\": \"" << escape_json(t.label) << "\", \"color\": \""
           << escape_json(t.color) << "\"}";
        if (i + 1 < tier_colors_.size())
            os << ",";
        os << "\n";
    }
    os << "  ]\n";
    os << "}\n";
    return os.str();
}

// Minimal JSON reader for the document written above
static size_t find_value_start(const std::string& json, const std::string& key)
{
    std::string search = "\"" + key + "\"";
    auto        pos    = json.find(search);
    if (pos == std::string::npos)
        return std::string::npos;
    pos = json.find(':', pos + search.size());
    if (pos == std::string::npos)
        return std::string::npos;
    return json.find_first_not_of(" \t\n\r", pos + 1);
}

static std::string read_json_string(const std::string& json, const std::string& key)
{
    auto pos = find_value_start(json, key);
    if (pos == std::string::npos || json[pos] != '"')
        return "";

    std::string out;
    for (size_t i = pos + 1; i < json.size(); ++i)
    {
        char c = json[i];
        if (c == '"')
            break;
        if (c == '\\' && i + 1 < json.size())
        {
            char next = json[++i];
            out += next == 'n' ? '\n' : next == 't' ? '\t' : next;
            continue;
        }
        out += c;
    }
    return out;
}

static double read_json_number(const std::string& json, const std::string& key, double def)
{
    auto pos = find_value_start(json, key);
    if (pos == std::string::npos)
        return def;
    const char* begin = json.c_str() + pos;
    char*       end   = nullptr;
    double      v     = std::strtod(begin, &end);
    return end == begin ? def : v;
}

// Non-negative integer setting; anything outside the representable range keeps def.
static size_t read_json_count(const std::string& json, const std::string& key, size_t def)
{
    constexpr double kMaxCount = static_cast<double>(std::numeric_limits<size_t>::max() / 2);

    double v = read_json_number(json, key, static_cast<double>(def));
    if (!(v >= 0.0 && v <= kMaxCount))
        return def;
    return static_cast<size_t>(v);
}

// Text of the object or array that follows key, brackets included.
static std::string read_json_block(const std::string& json,
                                   const std::string& key,
                                   char               open,
                                   char               close)
{
    auto pos = find_value_start(json, key);
    if (pos == std::string::npos || json[pos] != open)
        return "";

    int depth = 0;
    for (size_t i = pos; i < json.size(); ++i)
    {
        if (json[i] == open)
            ++depth;
        else if (json[i] == close && --depth == 0)
            return json.substr(pos, i - pos + 1);
    }
    return "";
}

static std::vector<std::string> split_objects(const std::string& array)
{
    std::vector<std::string> objects;
    int                      depth     = 0;
    size_t                   obj_start = 0;
    for (size_t i = 0; i < array.size(); ++i)
    {
        if (array[i] == '{')
        {
            if (depth == 0)
                obj_start = i;
            ++depth;
        }
        else if (array[i] == '}')
        {
            if (--depth == 0)
                objects.push_back(array.substr(obj_start, i - obj_start + 1));
        }
    }
    return objects;
}

bool ChartConfig::deserialize(const std::string& json)
{
    if (json.empty())
        return false;

    // Compared as parsed; NaN and anything above kVersion are refused before any cast
    double version = read_json_number(json, "version", kVersion);
    if (!(version <= kVersion))
    {
        CHARTKIT_LOG_WARN("chartkit.config", "config version {} is newer than {}", version, kVersion);
        return false;
    }

    LineChartStyle line;
    if (auto obj = read_json_block(json, "line", '{', '}'); !obj.empty())
    {
        line.width         = read_json_number(obj, "width", line.width);
        line.height        = read_json_number(obj, "height", line.height);
        line.margin        = read_json_number(obj, "margin", line.margin);
        line.marker_target = read_json_count(obj, "marker_target", line.marker_target);
        line.label_target  = read_json_count(obj, "label_target", line.label_target);
    }

    SparklineStyle sparkline;
    if (auto obj = read_json_block(json, "sparkline", '{', '}'); !obj.empty())
    {
        sparkline.width      = read_json_number(obj, "width", sparkline.width);
        sparkline.height     = read_json_number(obj, "height", sparkline.height);
        sparkline.fill_ratio = read_json_number(obj, "fill_ratio", sparkline.fill_ratio);
    }

    DonutStyle donut;
    if (auto obj = read_json_block(json, "donut", '{', '}'); !obj.empty())
    {
        donut.radius       = read_json_number(obj, "radius", donut.radius);
        donut.stroke_width = read_json_number(obj, "stroke_width", donut.stroke_width);
        donut.rotation     = read_json_number(obj, "rotation", donut.rotation);
    }

    HeatmapStyle heatmap;
    if (auto obj = read_json_block(json, "heatmap", '{', '}'); !obj.empty())
    {
        heatmap.hours     = read_json_count(obj, "hours", heatmap.hours);
        heatmap.cell_size = read_json_number(obj, "cell_size", heatmap.cell_size);
        heatmap.cell_gap  = read_json_number(obj, "cell_gap", heatmap.cell_gap);

        // Exactly four cutoffs or none at all
        auto                  arr = read_json_block(obj, "thresholds", '[', ']');
        std::array<double, 4> parsed{};
        size_t                count  = 0;
        const char*           cursor = arr.c_str();
        while (!arr.empty() && count < parsed.size())
        {
            while (*cursor == '[' || *cursor == ',' || *cursor == ' ' || *cursor == '\n')
                ++cursor;
            char*  end = nullptr;
            double v   = std::strtod(cursor, &end);
            if (end == cursor)
                break;
            parsed[count++] = v;
            cursor          = end;
        }
        if (count == parsed.size())
            heatmap.thresholds = parsed;
        else if (!arr.empty())
            CHARTKIT_LOG_WARN("chartkit.config", "expected 4 heatmap thresholds, found {}", count);
    }

    std::vector<TierColor> tiers;
    for (const auto& obj : split_objects(read_json_block(json, "tier_colors", '[', ']')))
    {
        std::string label = read_json_string(obj, "label");
        auto        color = Color::from_hex(read_json_string(obj, "color"));
        if (label.empty() || !color)
            continue;
        std::erase_if(tiers, [&](const TierColor& t) { return t.label == label; });
        tiers.push_back({std::move(label), color->to_hex()});
    }

    line_        = line;
    sparkline_   = sparkline;
    donut_       = donut;
    heatmap_     = heatmap;
    tier_colors_ = std::move(tiers);
    notify_change();
    return true;
}

// ─── File I/O ───────────────────────────────────────────────────────────────

bool ChartConfig::save(const std::string& path) const
{
    auto dir = std::filesystem::path(path).parent_path();
    if (!dir.empty())
    {
        std::error_code ec;
        std::filesystem::create_directories(dir, ec);
        if (ec)
            CHARTKIT_LOG_WARN("chartkit.config", "cannot create {}: {}", dir.string(), ec.message());
    }

    std::ofstream f(path);
    if (!f.is_open())
    {
        CHARTKIT_LOG_WARN("chartkit.config", "cannot write {}", path);
        return false;
    }
    f << serialize();
    f.flush();
    return f.good();
}

bool ChartConfig::load(const std::string& path)
{
    std::ifstream f(path);
    if (!f.is_open())
    {
        CHARTKIT_LOG_DEBUG("chartkit.config", "no config at {}", path);
        return false;
    }
    std::string json((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    return deserialize(json);
}

std::string ChartConfig::default_path()
{
    const char* home = std::getenv("HOME");
    if (!home)
        home = std::getenv("USERPROFILE");
    if (!home)
        return "chart.json";

    std::filesystem::path dir = std::filesystem::path(home) / ".config" / "chartkit";
    return (dir / "chart.json").string();
}

void ChartConfig::notify_change()
{
    if (on_change_)
        on_change_();
}

}   // namespace chartkit
