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

#include "signal_combiner.hpp"

#include "normalized_matrix.hpp"

#include <boost/describe.hpp>

#include <algorithm>
#include <cmath>  // for std::isnan
#include <cstdint>
#include <iterator>  // for std::size
#include <limits>
#include <numeric>  // for std::accumulate
#include <ranges>
#include <string>
#include <system_error>
#include <vector>

namespace enrichmat {

auto
operator<<(std::ostream &o, const combine_method &m) -> std::ostream & {
  return o << boost::describe::enum_to_string(m, "unknown");
}

auto
operator>>(std::istream &in, combine_method &m) -> std::istream & {
  std::string tmp;
  if (!(in >> tmp))
    return in;
  if (!boost::describe::enum_from_string(tmp.data(), m))
    in.setstate(std::ios::failbit);
  return in;
}

static constexpr auto missing = std::numeric_limits<double>::quiet_NaN();

[[nodiscard]] static auto
drop_missing(const std::vector<double> &x) -> std::vector<double> {
  return x | std::views::filter([](const auto v) { return !std::isnan(v); }) |
         std::ranges::to<std::vector>();
}

[[nodiscard]] static auto
mean_of(const std::vector<double> &x) -> double {
  const auto vals = drop_missing(x);
  if (vals.empty())
    return missing;
  return std::accumulate(std::cbegin(vals), std::cend(vals), 0.0) /
         std::size(vals);
}

[[nodiscard]] static auto
median_of(const std::vector<double> &x) -> double {
  auto vals = drop_missing(x);
  if (vals.empty())
    return missing;
  std::ranges::sort(vals);
  const auto n = std::size(vals);
  return n % 2 == 1 ? vals[n / 2] : (vals[n / 2 - 1] + vals[n / 2]) / 2.0;
}

[[nodiscard]] static auto
min_of(const std::vector<double> &x) -> double {
  const auto vals = drop_missing(x);
  return vals.empty() ? missing : std::ranges::min(vals);
}

[[nodiscard]] static auto
max_of(const std::vector<double> &x) -> double {
  const auto vals = drop_missing(x);
  return vals.empty() ? missing : std::ranges::max(vals);
}

[[nodiscard]] auto
get_reducer(const combine_method method) -> cell_reducer {
  switch (method) {
  case combine_method::mean:
    return mean_of;
  case combine_method::median:
    return median_of;
  case combine_method::min:
    return min_of;
  case combine_method::max:
    return max_of;
  }
  std::unreachable();
}

[[nodiscard]] auto
combine_matrices(const std::vector<normalized_matrix> &matrices,
                 const row_cell_reducer &reducer,
                 std::error_code &error) -> normalized_matrix {
  if (matrices.empty()) {
    error = signal_combiner_error_code::empty_input;
    return {};
  }
  const auto &first = matrices.front();
  if (std::ranges::any_of(matrices, [&](const auto &m) {
        return m.n_rows != first.n_rows || m.n_cols != first.n_cols;
      })) {
    error = signal_combiner_error_code::shape_mismatch;
    return {};
  }

  normalized_matrix result(first.n_rows, first.n_cols, missing);
  std::vector<double> cell(std::size(matrices));
  for (const auto i : std::views::iota(0u, first.n_rows))
    for (const auto j : std::views::iota(0u, first.n_cols)) {
      std::ranges::transform(matrices, std::begin(cell),
                             [&](const auto &m) { return m[i, j]; });
      result[i, j] = reducer(cell, i);
    }

  error = copy_attributes(first, result);
  if (error)
    return {};
  result.row_names = first.row_names;
  return result;
}

[[nodiscard]] auto
combine_matrices(const std::vector<normalized_matrix> &matrices,
                 const cell_reducer &reducer,
                 std::error_code &error) -> normalized_matrix {
  return combine_matrices(
    matrices,
    row_cell_reducer([&](const std::vector<double> &cell, const std::uint32_t) {
      return reducer(cell);
    }),
    error);
}

[[nodiscard]] auto
combine_matrices(const std::vector<normalized_matrix> &matrices,
                 const combine_method method,
                 std::error_code &error) -> normalized_matrix {
  return combine_matrices(matrices, get_reducer(method), error);
}

}  // namespace enrichmat
