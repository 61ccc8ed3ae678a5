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

#include "window_splitter.hpp"

#include "genomic_interval.hpp"
#include "logger.hpp"
#include "normalize_warning.hpp"

#include <boost/describe.hpp>

#include <algorithm>
#include <cmath>  // for std::nearbyint, std::trunc
#include <cstdint>
#include <iterator>  // for std::size
#include <optional>
#include <ranges>
#include <string>
#include <system_error>
#include <tuple>
#include <vector>

namespace enrichmat {

auto
operator<<(std::ostream &o, const split_direction &d) -> std::ostream & {
  return o << boost::describe::enum_to_string(d, "unknown");
}

auto
operator>>(std::istream &in, split_direction &d) -> std::istream & {
  std::string tmp;
  if (!(in >> tmp))
    return in;
  if (!boost::describe::enum_from_string(tmp.data(), d))
    in.setstate(std::ios::failbit);
  return in;
}

[[nodiscard]] auto
check_window_width(const double width, std::error_code &error) noexcept
  -> std::tuple<double, std::optional<normalize_warning>> {
  // also rejects NaN
  if (!(width > 0.0)) {
    error = window_splitter_error_code::invalid_width;
    return {0.0, std::nullopt};
  }
  if (width >= 1.0 && std::trunc(width) != width)
    return {std::trunc(width), normalize_warning::window_width_truncated};
  return {width, std::nullopt};
}

// Boundaries x_i = start + i * (stop - start) / k, i = 0..k, are rounded
// half to even. Window i starts at x_i and ends one base before x_{i+1},
// or at x_{i+1} when the two coincide; the last window ends at stop.
[[nodiscard]] static auto
split_by_count(const genomic_interval &gi, const std::uint32_t k)
  -> std::vector<genomic_interval> {
  const auto span = static_cast<double>(gi.stop - gi.start);
  const auto boundary = [&](const std::uint32_t i) -> std::int64_t {
    return gi.start +
           static_cast<std::int64_t>(std::nearbyint(i * span / k));
  };
  std::vector<genomic_interval> windows;
  windows.reserve(k);
  for (const auto i : std::views::iota(0u, k)) {
    const auto start = boundary(i);
    const auto next = boundary(i + 1);
    // narrower than k: windows are one base wide and may repeat
    const auto stop = (i + 1 == k) ? gi.stop : (next > start ? next - 1 : next);
    windows.push_back({gi.chrom, start, stop, gi.strand});
  }
  return windows;
}

[[nodiscard]] static auto
split_by_width(const genomic_interval &gi, const std::int64_t w,
               const split_direction direction, const bool keep_short)
  -> std::vector<genomic_interval> {
  std::vector<genomic_interval> windows;
  if (direction == split_direction::normal) {
    for (auto start = gi.start; start <= gi.stop; start += w) {
      const auto stop = std::min(start + w - 1, gi.stop);
      if (keep_short || stop - start + 1 == w)
        windows.push_back({gi.chrom, start, stop, gi.strand});
    }
    return windows;
  }
  for (auto stop = gi.stop; stop >= gi.start; stop -= w) {
    const auto start = std::max(stop - w + 1, gi.start);
    if (keep_short || stop - start + 1 == w)
      windows.push_back({gi.chrom, start, stop, gi.strand});
  }
  std::ranges::reverse(windows);
  return windows;
}

// absolute width for this interval; relative widths are resolved against
// the interval's own width
[[nodiscard]] static inline auto
resolve_width(const genomic_interval &gi, const double width) -> std::int64_t {
  if (width >= 1.0)
    return static_cast<std::int64_t>(width);
  const auto w = static_cast<std::int64_t>(std::nearbyint(gi.width() * width));
  return std::max(w, std::int64_t{1});
}

[[nodiscard]] static auto
split_checked(const genomic_interval &gi, const split_params &params,
              const double width, std::error_code &error)
  -> std::vector<genomic_interval> {
  if (gi.width() < 1) {
    error = window_splitter_error_code::empty_interval;
    return {};
  }
  if (params.count)
    return split_by_count(gi, *params.count);
  return split_by_width(gi, resolve_width(gi, width), params.direction,
                        params.keep_short);
}

[[nodiscard]] static auto
check_params(const split_params &params, std::error_code &error)
  -> std::tuple<double, std::optional<normalize_warning>> {
  if (params.count) {
    if (*params.count == 0)
      error = window_splitter_error_code::invalid_count;
    return {0.0, std::nullopt};
  }
  if (!params.width) {
    error = window_splitter_error_code::width_and_count_unset;
    return {0.0, std::nullopt};
  }
  return check_window_width(*params.width, error);
}

[[nodiscard]] auto
split_interval(const genomic_interval &gi, const split_params &params,
               std::error_code &error) -> std::vector<genomic_interval> {
  const auto [width, warning] = check_params(params, error);
  if (error)
    return {};
  return split_checked(gi, params, width, error);
}

[[nodiscard]] auto
make_windows(const std::vector<genomic_interval> &intervals,
             const split_params &params,
             std::error_code &error) -> std::vector<window> {
  const auto [width, warning] = check_params(params, error);
  if (error)
    return {};
  if (warning)
    logger::instance().warning("{} ({} -> {})", *warning, *params.width,
                               width);

  std::vector<window> windows;
  for (const auto [owner, gi] : std::views::enumerate(intervals)) {
    const auto parts = split_checked(gi, params, width, error);
    if (error)
      return {};
    for (const auto [idx, part] : std::views::enumerate(parts))
      windows.push_back({part, static_cast<std::uint32_t>(owner),
                         static_cast<std::uint32_t>(idx)});
  }
  return windows;
}

}  // namespace enrichmat
