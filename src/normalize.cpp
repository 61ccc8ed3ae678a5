/* MIT License
 *
 * Copyright (c) 2024 Andrew D Smith
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in
 * all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

#include "normalize.hpp"

#include "genomic_interval.hpp"
#include "logger.hpp"
#include "matrix_assembler.hpp"
#include "normalize_warning.hpp"
#include "normalized_matrix.hpp"
#include "overlap_aggregator.hpp"
#include "post_processor.hpp"
#include "region_sets.hpp"
#include "window_splitter.hpp"

#include <algorithm>
#include <cmath>  // for std::abs, std::nearbyint, std::fmod
#include <cstdint>
#include <iterator>  // for std::size
#include <limits>
#include <optional>
#include <ranges>
#include <string>
#include <system_error>
#include <tuple>
#include <utility>  // for std::move
#include <vector>

namespace enrichmat {

static constexpr auto ratio_tolerance = 1e-6;

[[nodiscard]] auto
check_extend_and_ratio(extend_t extend, double target_ratio)
  -> std::tuple<extend_t, double, std::vector<normalize_warning>> {
  std::vector<normalize_warning> warnings;
  const bool no_extend = extend[0] == 0 && extend[1] == 0;
  if (std::abs(target_ratio - 1.0) < ratio_tolerance ||
      std::abs(target_ratio) >= 1.0) {
    if (!no_extend)
      warnings.push_back(normalize_warning::extend_reset);
    extend = {0, 0};
  }
  else if (no_extend) {
    warnings.push_back(normalize_warning::target_ratio_reset);
    target_ratio = 1.0;
  }
  if (std::abs(target_ratio) > 1.0)
    target_ratio = 1.0;
  return {extend, target_ratio, warnings};
}

[[nodiscard]] auto
check_extend_divisible(extend_t extend, const double window_width)
  -> std::tuple<extend_t, std::vector<normalize_warning>> {
  std::vector<normalize_warning> warnings;
  if (window_width < 1.0)
    return {extend, warnings};
  const auto w = static_cast<std::int64_t>(window_width);
  constexpr normalize_warning side_warning[] = {
    normalize_warning::upstream_not_divisible,
    normalize_warning::downstream_not_divisible,
  };
  for (const auto i : {0, 1})
    if (extend[i] > 0 && extend[i] % w != 0) {
      warnings.push_back(side_warning[i]);
      extend[i] -= extend[i] % w;
    }
  return {extend, warnings};
}

[[nodiscard]] auto
check_include_target(const bool include_target, const bool single_point)
  -> std::tuple<bool, std::optional<normalize_warning>> {
  if (!single_point)
    return {include_target, std::nullopt};
  if (include_target)
    return {false, normalize_warning::include_target_disabled};
  return {false, std::nullopt};
}

namespace {

// everything left open by the caller, filled in and made consistent
struct resolved_config {
  extend_t extend{};
  double window_width{};
  double empty_value{};
  bool include_target{};
  double target_ratio{};
  std::uint32_t k{};
  bool single_point{};
  std::vector<normalize_warning> warnings;
};

[[nodiscard]] auto
default_k(const std::vector<genomic_interval> &targets) -> std::uint32_t {
  std::int64_t k = normalize_config::max_default_k;
  for (const auto &t : targets)
    k = std::min(k, t.width());
  return static_cast<std::uint32_t>(std::max(k, std::int64_t{0}));
}

[[nodiscard]] auto
resolve_config(const normalize_config &config,
               const std::vector<genomic_interval> &targets,
               std::error_code &error) -> resolved_config {
  if (config.extend[0] < 0 || config.extend[1] < 0) {
    error = normalize_error_code::negative_extend;
    return {};
  }
  resolved_config r;
  const bool no_extend = config.extend[0] == 0 && config.extend[1] == 0;
  r.window_width = config.window_width.value_or(
    std::ranges::max(config.extend) / normalize_config::default_width_divisor);
  r.empty_value = config.empty_value.value_or(
    config.smooth ? std::numeric_limits<double>::quiet_NaN() : 0.0);
  r.k = config.k.value_or(default_k(targets));

  auto [extend, ratio, ratio_warnings] = check_extend_and_ratio(
    config.extend, config.target_ratio.value_or(
                     no_extend ? 1.0 : normalize_config::default_target_ratio));
  r.target_ratio = ratio;
  r.warnings = std::move(ratio_warnings);

  r.single_point = genomic_interval::all_single_point(targets);
  const auto [include_target, include_warning] = check_include_target(
    config.include_target.value_or(!r.single_point), r.single_point);
  r.include_target = include_target;
  if (include_warning)
    r.warnings.push_back(*include_warning);

  const bool need_width = extend[0] > 0 || extend[1] > 0;
  if (need_width) {
    if (!(r.window_width > 0.0)) {
      error = normalize_error_code::window_width_unset;
      return {};
    }
    const auto [width, width_warning] =
      check_window_width(r.window_width, error);
    if (error)
      return {};
    r.window_width = width;
    if (width_warning)
      r.warnings.push_back(*width_warning);
    auto [divisible, divisible_warnings] =
      check_extend_divisible(extend, r.window_width);
    extend = divisible;
    std::ranges::copy(divisible_warnings, std::back_inserter(r.warnings));
  }
  r.extend = extend;
  return r;
}

// split each region, aggregate the signals in each window and place the
// values in a row per region
[[nodiscard]] auto
region_matrix(const signal_set &signals,
              const std::vector<genomic_interval> &regions,
              const split_params &params, const aggregate_options &options,
              std::error_code &error) -> normalized_matrix {
  const auto windows = make_windows(regions, params, error);
  if (error)
    return {};
  const auto values = aggregate(signals, windows, options, error);
  if (error)
    return {};
  return assemble(windows, values, regions, options.empty_value, error);
}

[[nodiscard]] auto
flanks(const std::vector<genomic_interval> &targets, const auto &make_flank)
  -> std::vector<genomic_interval> {
  return targets | std::views::transform(make_flank) |
         std::ranges::to<std::vector>();
}

}  // namespace

[[nodiscard]] auto
normalize_to_matrix(const signal_set &signals, const target_set &targets,
                    const normalize_config &config,
                    std::error_code &error) -> normalized_matrix {
  auto &lgr = logger::instance();
  // without targets the columns are laid out for one placeholder point
  // that no signal overlaps, and its row is dropped after assembly
  const std::vector<genomic_interval> placeholder{{"", 1, 1}};
  const auto &target_intervals =
    targets.intervals.empty() ? placeholder : targets.intervals;
  const auto n_targets =
    static_cast<std::uint32_t>(std::size(target_intervals));

  const auto r = resolve_config(config, targets.intervals, error);
  if (error)
    return {};
  for (const auto w : r.warnings)
    lgr.warning("{}", w);

  const aggregate_options options{
    config.value_column, config.mapping_column, targets.names,
    config.mean_mode,    r.empty_value,
  };
  const split_params flank_params{r.window_width, std::nullopt,
                                  split_direction::normal, false};
  const auto [up, down] = r.extend;

  normalized_matrix upstream(n_targets, 0, r.empty_value);
  normalized_matrix downstream(n_targets, 0, r.empty_value);
  if (r.single_point) {
    if (up + down > 0) {
      // one region across the point avoids a seam between the flanks
      const auto both = flanks(target_intervals, [&](const auto &t) {
        return promoter_flank(t, up, down);
      });
      const auto m = region_matrix(signals, both, flank_params, options, error);
      if (error)
        return {};
      const auto n_up = static_cast<std::uint32_t>(std::nearbyint(
        static_cast<double>(up) / static_cast<double>(up + down) * m.n_cols));
      upstream = m.subset_columns(
        std::views::iota(0u, n_up) | std::ranges::to<std::vector>(), error);
      if (error)
        return {};
      downstream = m.subset_columns(
        std::views::iota(n_up, m.n_cols) | std::ranges::to<std::vector>(),
        error);
      if (error)
        return {};
    }
  }
  else {
    if (up > 0) {
      const auto regions = flanks(target_intervals, [&](const auto &t) {
        return promoter_flank(t, up, 0);
      });
      upstream = region_matrix(signals, regions, flank_params, options, error);
      if (error)
        return {};
    }
    if (down > 0) {
      const auto regions = flanks(target_intervals, [&](const auto &t) {
        return promoter_flank(three_prime_neighbor(t), 0, down);
      });
      downstream =
        region_matrix(signals, regions, flank_params, options, error);
      if (error)
        return {};
    }
  }

  normalized_matrix target(n_targets, 0, r.empty_value);
  if (r.include_target) {
    auto k = r.k;
    if (up > 0 || down > 0) {
      const auto flank_cols = upstream.n_cols + downstream.n_cols;
      const auto n = std::nearbyint(flank_cols * r.target_ratio /
                                    (1.0 - r.target_ratio));
      k = static_cast<std::uint32_t>(std::max(n, 1.0));
    }
    if (k == 0) {
      error = normalize_error_code::window_count_unset;
      return {};
    }
    const split_params target_params{std::nullopt, k, split_direction::normal,
                                     false};
    target = region_matrix(signals, target_intervals, target_params, options,
                           error);
    if (error)
      return {};
  }

  auto m = concatenate(upstream, target, downstream, error);
  if (error)
    return {};
  if (targets.intervals.empty()) {
    m = m.subset_rows({}, error);
    if (error)
      return {};
  }

  m.failed_rows = post_process(m, config.smooth, config.smoother, config.trim,
                               error);
  if (error)
    return {};

  m.extend = r.extend;
  m.smooth = config.smooth;
  m.target_is_single_point = r.single_point;
  m.empty_value = r.empty_value;
  m.signal_name = config.signal_name;
  m.target_name = config.target_name;
  m.row_names = targets.names;
  m.col_names =
    make_column_names(std::size(m.upstream_index), std::size(m.target_index),
                      std::size(m.downstream_index));
  m.warnings = r.warnings;
  if (!m.failed_rows.empty())
    m.warnings.push_back(normalize_warning::smoothing_failed);

  lgr.debug("Normalized {} rows into {} columns", m.n_rows, m.n_cols);
  return m;
}

}  // namespace enrichmat
