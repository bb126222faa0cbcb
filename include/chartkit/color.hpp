#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace chartkit
{

struct Color
{
    float r = 0.0f;
    float g = 0.0f;
    float b = 0.0f;
    float a = 1.0f;

    constexpr Color() = default;
    constexpr Color(float r, float g, float b, float a = 1.0f) : r(r), g(g), b(b), a(a) {}

    // Parse "#rrggbb" or "#rgb" (case-insensitive). Anything else is nullopt.
    static std::optional<Color> from_hex(std::string_view hex);

    // Lower-case "#rrggbb"; alpha is not encoded.
    std::string to_hex() const;

    constexpr bool operator==(const Color&) const = default;
};

// Label -> CSS color lookup with a neutral fallback. Lookups never fail:
// labels that are not in the table resolve to fallback().
class ColorTable
{
   public:
    static constexpr std::string_view kNeutral = "#94a3b8";

    ColorTable() = default;
    explicit ColorTable(std::string fallback) : fallback_(std::move(fallback)) {}

    ColorTable& set(const std::string& label, const std::string& color);
    bool        remove(std::string_view label);

    const std::string& lookup(std::string_view label) const;
    bool               contains(std::string_view label) const;
    size_t             size() const { return entries_.size(); }

    const std::string& fallback() const { return fallback_; }
    const std::map<std::string, std::string, std::less<>>& entries() const { return entries_; }

    // Subscription tiers as shown on the admin dashboard.
    static ColorTable tiers();

   private:
    std::map<std::string, std::string, std::less<>> entries_;
    std::string                                     fallback_{kNeutral};
};

namespace palette
{

inline constexpr const char* subject_cycle[] = {
    "#006646",
    "#10b981",
    "#3b82f6",
    "#8b5cf6",
    "#f59e0b",
    "#ef4444",
    "#ec4899",
    "#06b6d4",
    "#84cc16",
    "#f97316",
};
inline constexpr size_t subject_cycle_size = sizeof(subject_cycle) / sizeof(subject_cycle[0]);

// Band 0 is the page background; bands 1-4 are increasingly opaque brand green.
inline constexpr const char* heatmap_bands[] = {
    "var(--background)",
    "rgba(0, 102, 70, 0.2)",
    "rgba(0, 102, 70, 0.4)",
    "rgba(0, 102, 70, 0.6)",
    "rgba(0, 102, 70, 0.9)",
};
inline constexpr size_t heatmap_band_count = sizeof(heatmap_bands) / sizeof(heatmap_bands[0]);

// Cycles through subject_cycle.
std::string subject_color(size_t index);

// Out-of-range bands clamp to the nearest valid entry.
std::string heatmap_band_color(int band);

}   // namespace palette

}   // namespace chartkit
