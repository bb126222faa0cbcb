#pragma once

#include <chartkit/aggregate.hpp>
#include <chartkit/chart_config.hpp>
#include <chartkit/chart_style.hpp>
#include <chartkit/color.hpp>
#include <chartkit/donut.hpp>
#include <chartkit/export.hpp>
#include <chartkit/format.hpp>
#include <chartkit/heatmap.hpp>
#include <chartkit/logger.hpp>
#include <chartkit/path.hpp>
#include <chartkit/sampling.hpp>
#include <chartkit/scale.hpp>
#include <chartkit/series.hpp>

// ─── chartkit ────────────────────────────────────────────────────────────────
// Stateless conversion of dashboard data into renderable geometry:
//
//   chartkit::TimeSeries growth = ...;
//   auto stroke = chartkit::build_line_path(growth, 800, 200);
//   auto fill   = chartkit::build_area_path(growth, 800, 200);
//   auto ring   = chartkit::encode_donut(subscriptions);
//   auto bands  = chartkit::bucketize(active_hours);
//
// Every function is pure and total: degenerate input yields an empty path,
// a zero-length dash or band 0, never an exception.
