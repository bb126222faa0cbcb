#include <chartkit/color.hpp>

#include <algorithm>
#include <cmath>
#include <cstdio>

namespace chartkit
{

namespace
{

int hex_digit(char c)
{
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    return -1;
}

int to_byte(float channel)
{
    return static_cast<int>(std::lround(std::clamp(channel, 0.0f, 1.0f) * 255.0f));
}

}   // namespace

// ─── Color ──────────────────────────────────────────────────────────────────

std::optional<Color> Color::from_hex(std::string_view hex)
{
    if (hex.empty() || hex.front() != '#')
        return std::nullopt;
    hex.remove_prefix(1);

    int channels[3];
    if (hex.size() == 6)
    {
        for (int i = 0; i < 3; ++i)
        {
            int hi = hex_digit(hex[i * 2]);
            int lo = hex_digit(hex[i * 2 + 1]);
            if (hi < 0 || lo < 0)
                return std::nullopt;
            channels[i] = hi * 16 + lo;
        }
    }
    else if (hex.size() == 3)
    {
        // #abc is shorthand for #aabbcc
        for (int i = 0; i < 3; ++i)
        {
            int d = hex_digit(hex[i]);
            if (d < 0)
                return std::nullopt;
            channels[i] = d * 17;
        }
    }
    else
    {
        return std::nullopt;
    }

    return Color{channels[0] / 255.0f, channels[1] / 255.0f, channels[2] / 255.0f, 1.0f};
}

std::string Color::to_hex() const
{
    char buf[8];
    std::snprintf(buf, sizeof(buf), "#%02x%02x%02x", to_byte(r), to_byte(g), to_byte(b));
    return buf;
}

// ─── ColorTable ─────────────────────────────────────────────────────────────

ColorTable& ColorTable::set(const std::string& label, const std::string& color)
{
    entries_.insert_or_assign(label, color);
    return *this;
}

bool ColorTable::remove(std::string_view label)
{
    auto it = entries_.find(label);
    if (it == entries_.end())
        return false;
    entries_.erase(it);
    return true;
}

const std::string& ColorTable::lookup(std::string_view label) const
{
    auto it = entries_.find(label);
    return it != entries_.end() ? it->second : fallback_;
}

bool ColorTable::contains(std::string_view label) const
{
    return entries_.find(label) != entries_.end();
}

ColorTable ColorTable::tiers()
{
    ColorTable table;
    table.set("FREE", "#94a3b8")
        .set("BASIC", "#3b82f6")
        .set("PREMIUM", "#8b5cf6")
        .set("FAMILY", "#f59e0b")
        .set("SCHOOL", "#10b981");
    return table;
}

// ─── Palettes ───────────────────────────────────────────────────────────────

namespace palette
{

std::string subject_color(size_t index)
{
    return subject_cycle[index % subject_cycle_size];
}

std::string heatmap_band_color(int band)
{
    const int last = static_cast<int>(heatmap_band_count) - 1;
    return heatmap_bands[std::clamp(band, 0, last)];
}

}   // namespace palette

}   // namespace chartkit
