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

#include "overlap_aggregator.hpp"

#include "genomic_interval.hpp"
#include "interval_overlap.hpp"
#include "region_sets.hpp"
#include "window_splitter.hpp"

#include <boost/describe.hpp>

#include <algorithm>
#include <cmath>  // for std::isnan
#include <cstdint>
#include <iterator>  // for std::size, std::cend
#include <limits>
#include <ranges>
#include <span>
#include <string>
#include <system_error>
#include <utility>  // for std::pair
#include <vector>

namespace enrichmat {

auto
operator<<(std::ostream &o, const mean_mode_t &m) -> std::ostream & {
  return o << boost::describe::enum_to_string(m, "unknown");
}

auto
operator>>(std::istream &in, mean_mode_t &m) -> std::istream & {
  std::string tmp;
  if (!(in >> tmp))
    return in;
  if (!boost::describe::enum_from_string(tmp.data(), m))
    in.setstate(std::ios::failbit);
  return in;
}

namespace {

static constexpr auto missing = std::numeric_limits<double>::quiet_NaN();

// Everything a summary needs for one window: the overlapping signals that
// survived the mapping restriction and have a value.
struct window_overlaps {
  const genomic_interval &win;
  std::span<const overlap_pair> pairs;
  const std::vector<genomic_interval> &signal_intervals;
  const std::vector<double> &values;
};

typedef double (*summary_fn)(const window_overlaps &);

[[nodiscard]] auto
sum_weighted(const window_overlaps &wo) -> std::pair<double, double> {
  double numer{};
  double denom{};
  for (const auto &p : wo.pairs) {
    numer += wo.values[p.query] * p.width;
    denom += p.width;
  }
  return {numer, denom};
}

// number of window bases covered by at least one signal
[[nodiscard]] auto
covered_bases(const window_overlaps &wo) -> std::int64_t {
  std::vector<std::pair<std::int64_t, std::int64_t>> parts;
  for (const auto &p : wo.pairs) {
    const auto &s = wo.signal_intervals[p.query];
    parts.emplace_back(std::max(s.start, wo.win.start),
                       std::min(s.stop, wo.win.stop));
  }
  std::ranges::sort(parts);
  std::int64_t covered{};
  std::int64_t reach = wo.win.start - 1;
  for (const auto &[start, stop] : parts) {
    if (stop > reach) {
      covered += stop - std::max(start, reach + 1) + 1;
      reach = stop;
    }
  }
  return covered;
}

[[nodiscard]] auto
summarize_absolute(const window_overlaps &wo) -> double {
  double total{};
  for (const auto &p : wo.pairs)
    total += wo.values[p.query];
  return total / std::size(wo.pairs);
}

[[nodiscard]] auto
summarize_weighted(const window_overlaps &wo) -> double {
  const auto [numer, denom] = sum_weighted(wo);
  return numer / denom;
}

[[nodiscard]] auto
summarize_w0(const window_overlaps &wo) -> double {
  const auto [numer, denom] = sum_weighted(wo);
  const auto uncovered = wo.win.width() - covered_bases(wo);
  return numer / (denom + uncovered);
}

[[nodiscard]] auto
summarize_coverage(const window_overlaps &wo) -> double {
  const auto [numer, denom] = sum_weighted(wo);
  return numer / wo.win.width();
}

[[nodiscard]] auto
get_summary_fn(const mean_mode_t mode) -> summary_fn {
  switch (mode) {
  case mean_mode_t::absolute:
    return &summarize_absolute;
  case mean_mode_t::weighted:
    return &summarize_weighted;
  case mean_mode_t::w0:
    return &summarize_w0;
  case mean_mode_t::coverage:
    return &summarize_coverage;
  }
  std::unreachable();
}

// remove pairs whose signal label does not name the window's owner; a
// numeric label is compared with the owner's 1-based row number
auto
apply_mapping(const signal_set &signals, const std::vector<window> &windows,
              const aggregate_options &options,
              std::vector<overlap_pair> &pairs, std::error_code &error) {
  const auto &column = options.mapping_column;
  if (const auto num = signals.values.find(column);
      num != std::cend(signals.values)) {
    const auto &mapping = num->second;
    std::erase_if(pairs, [&](const auto &p) {
      return mapping[p.query] != windows[p.subject].owner + 1.0;
    });
    return;
  }
  const auto txt = signals.labels.find(column);
  if (txt == std::cend(signals.labels)) {
    error = overlap_aggregator_error_code::mapping_column_not_found;
    return;
  }
  if (options.target_names.empty()) {
    error = overlap_aggregator_error_code::mapping_on_unnamed_targets;
    return;
  }
  const auto &mapping = txt->second;
  const auto &names = options.target_names;
  std::erase_if(pairs, [&](const auto &p) {
    const auto owner = windows[p.subject].owner;
    return owner >= std::size(names) || mapping[p.query] != names[owner];
  });
}

}  // namespace

[[nodiscard]] auto
aggregate(const signal_set &signals, const std::vector<window> &windows,
          const aggregate_options &options,
          std::error_code &error) -> std::vector<double> {
  if (!options.value_column.empty() &&
      !signals.values.contains(options.value_column)) {
    error = overlap_aggregator_error_code::value_column_not_found;
    return {};
  }
  const auto values = signals.get_values(options.value_column, error);
  if (error)
    return {};

  // overlap is computed on coordinates only
  std::vector<genomic_interval> window_intervals;
  window_intervals.reserve(std::size(windows));
  std::ranges::transform(windows, std::back_inserter(window_intervals),
                         [](const auto &w) { return w.interval; });

  auto pairs = find_overlaps(signals.intervals, window_intervals);

  if (!options.mapping_column.empty()) {
    apply_mapping(signals, windows, options, pairs, error);
    if (error)
      return {};
  }

  // windows overlapped only by signals with missing values: the mean over
  // no values is NaN, the sums in the other modes are 0
  const auto all_missing =
    options.mean_mode == mean_mode_t::absolute ? missing : 0.0;
  std::vector<double> result(std::size(windows), options.empty_value);
  for (const auto &p : pairs)
    result[p.subject] = all_missing;

  std::erase_if(pairs,
                [&](const auto &p) { return std::isnan(values[p.query]); });

  const auto summarize = get_summary_fn(options.mean_mode);
  const auto same_window = [](const auto &a, const auto &b) {
    return a.subject == b.subject;
  };
  for (const auto group : pairs | std::views::chunk_by(same_window)) {
    const auto subject = group.front().subject;
    const window_overlaps wo{
      // clang-format off
      window_intervals[subject],
      std::span<const overlap_pair>(std::ranges::data(group), std::ranges::size(group)),
      signals.intervals,
      values,
      // clang-format on
    };
    result[subject] = summarize(wo);
  }
  return result;
}

}  // namespace enrichmat
