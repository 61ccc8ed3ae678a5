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

#include "post_processor.hpp"
#include "post_processor_impl.hpp"

#include "logger.hpp"
#include "normalize_warning.hpp"
#include "normalized_matrix.hpp"
#include "smoother.hpp"

#include <algorithm>
#include <cmath>  // for std::isnan, std::floor
#include <cstdint>
#include <iterator>  // for std::size
#include <ranges>
#include <system_error>
#include <vector>

namespace enrichmat {

[[nodiscard]] STATIC auto
quantile(const std::vector<double> &sorted, const double p) -> double {
  const auto h = (std::size(sorted) - 1) * p;
  const auto lo = static_cast<std::size_t>(std::floor(h));
  if (lo + 1 >= std::size(sorted))
    return sorted.back();
  return sorted[lo] + (h - lo) * (sorted[lo + 1] - sorted[lo]);
}

[[nodiscard]] static auto
observed_values(const normalized_matrix &m) -> std::vector<double> {
  auto vals = m.v |
              std::views::filter([](const auto x) { return !std::isnan(x); }) |
              std::ranges::to<std::vector>();
  std::ranges::sort(vals);
  return vals;
}

[[nodiscard]] static auto
smooth_rows(normalized_matrix &m,
            const smoother_fn &smoother) -> std::vector<std::uint32_t> {
  std::vector<std::uint32_t> failed;
  for (const auto i : std::views::iota(0u, m.n_rows)) {
    auto r = m.row(i);
    std::error_code ec;
    const auto smoothed = smoother(std::vector<double>(r.begin(), r.end()), ec);
    if (!ec && std::size(smoothed) != std::size(r))
      ec = smoother_error_code::length_changed;
    if (ec) {
      // 1-based, as rows are labelled in output
      logger::instance().debug("Row {} not smoothed: {}", i + 1, ec.message());
      failed.push_back(i + 1);
      continue;
    }
    std::ranges::copy(smoothed, r.begin());
  }
  return failed;
}

static auto
clamp_values(normalized_matrix &m, const double lo, const double hi) {
  for (auto &x : m.v)
    if (!std::isnan(x))
      x = std::clamp(x, lo, hi);
}

[[nodiscard]] auto
post_process(normalized_matrix &m, const bool smooth,
             const smoother_fn &smoother, const trim_t trim,
             std::error_code &error) -> std::vector<std::uint32_t> {
  const auto [trim_lo, trim_hi] = trim;
  if (!(trim_lo >= 0.0 && trim_hi >= 0.0 && trim_lo + trim_hi < 1.0)) {
    error = post_processor_error_code::invalid_trim;
    return {};
  }
  if (smooth && !smoother) {
    error = post_processor_error_code::smoother_not_set;
    return {};
  }

  // range before smoothing; empty if every value is missing
  const auto before = observed_values(m);

  std::vector<std::uint32_t> failed;
  if (smooth) {
    failed = smooth_rows(m, smoother);
    if (!failed.empty())
      logger::instance().warning("{}: {} of {} rows",
                                 normalize_warning::smoothing_failed,
                                 std::size(failed), m.n_rows);
  }

  if (trim_lo > 0.0 || trim_hi > 0.0) {
    const auto vals = observed_values(m);
    if (!vals.empty())
      clamp_values(m, quantile(vals, trim_lo), quantile(vals, 1.0 - trim_hi));
  }

  if (!before.empty())
    clamp_values(m, before.front(), before.back());
  return failed;
}

}  // namespace enrichmat
