#include <benchmark/benchmark.h>
#include <chartkit/donut.hpp>
#include <chartkit/heatmap.hpp>
#include <chartkit/path.hpp>
#include <chartkit/sampling.hpp>
#include <cmath>
#include <string>
#include <vector>

// --- Helpers ---

static chartkit::TimeSeries make_daily(std::size_t n)
{
    chartkit::TimeSeries s(n);
    for (std::size_t i = 0; i < n; ++i)
    {
        s[i].timestamp = "2025-01-01";
        s[i].value     = 500.0 + std::sin(static_cast<double>(i) * 0.05) * 400.0;
    }
    return s;
}

static chartkit::HeatmapGrid make_week()
{
    chartkit::HeatmapGrid grid;
    for (auto day : chartkit::kHeatmapDays)
    {
        std::vector<std::uint32_t> hours(24);
        for (std::size_t h = 0; h < hours.size(); ++h)
            hours[h] = static_cast<std::uint32_t>((h * 37 + day.size() * 11) % 97);
        grid.row_keys.emplace_back(day);
        grid.rows[std::string(day)] = std::move(hours);
    }
    return grid;
}

// --- Path benchmarks ---

static void BM_LinePath_90Days(benchmark::State& state)
{
    auto s = make_daily(90);
    for (auto _ : state)
    {
        auto path = chartkit::build_line_path(s, 800, 200);
        benchmark::DoNotOptimize(path);
    }
    state.SetItemsProcessed(state.iterations() * 90);
}
BENCHMARK(BM_LinePath_90Days);

static void BM_AreaPath_Varying(benchmark::State& state)
{
    const auto n = static_cast<std::size_t>(state.range(0));
    auto       s = make_daily(n);
    for (auto _ : state)
    {
        auto path = chartkit::build_area_path(s, 800, 200);
        benchmark::DoNotOptimize(path);
    }
    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(n));
}
BENCHMARK(BM_AreaPath_Varying)->Arg(30)->Arg(365)->Arg(10'000);

static void BM_Sparkline_30Days(benchmark::State& state)
{
    auto s = make_daily(30);
    for (auto _ : state)
    {
        auto path = chartkit::build_sparkline(s);
        benchmark::DoNotOptimize(path);
    }
    state.SetItemsProcessed(state.iterations() * 30);
}
BENCHMARK(BM_Sparkline_30Days);

// --- Sampling ---

static void BM_ChartPoints_365Days(benchmark::State& state)
{
    auto s = make_daily(365);
    for (auto _ : state)
    {
        auto pts = chartkit::chart_points(s, 800, 200, 10);
        benchmark::DoNotOptimize(pts);
    }
    state.SetItemsProcessed(state.iterations() * 365);
}
BENCHMARK(BM_ChartPoints_365Days);

// --- Donut / heatmap ---

static void BM_EncodeDonut_Tiers(benchmark::State& state)
{
    chartkit::Distribution d = {
        {"FREE", 1200}, {"BASIC", 340}, {"PREMIUM", 95}, {"FAMILY", 60}, {"SCHOOL", 12}};
    for (auto _ : state)
    {
        auto segs = chartkit::encode_donut(d);
        benchmark::DoNotOptimize(segs);
    }
}
BENCHMARK(BM_EncodeDonut_Tiers);

static void BM_Bucketize_Week(benchmark::State& state)
{
    auto grid = make_week();
    for (auto _ : state)
    {
        auto bands = chartkit::bucketize(grid);
        benchmark::DoNotOptimize(bands);
    }
    state.SetItemsProcessed(state.iterations() * 7 * 24);
}
BENCHMARK(BM_Bucketize_Week);
