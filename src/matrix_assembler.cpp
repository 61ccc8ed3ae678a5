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

#include "matrix_assembler.hpp"

#include "genomic_interval.hpp"
#include "normalized_matrix.hpp"
#include "window_splitter.hpp"

#include <algorithm>
#include <cstdint>
#include <iterator>  // for std::size, std::back_inserter
#include <ranges>
#include <system_error>
#include <vector>

namespace enrichmat {

[[nodiscard]] auto
assemble(const std::vector<window> &windows, const std::vector<double> &values,
         const std::vector<genomic_interval> &owners, const double empty_value,
         std::error_code &error) -> normalized_matrix {
  if (std::size(windows) != std::size(values)) {
    error = matrix_assembler_error_code::value_count_mismatch;
    return {};
  }
  const auto n_owners = static_cast<std::uint32_t>(std::size(owners));
  std::vector<std::uint32_t> counts(n_owners, 0);
  for (const auto &w : windows) {
    if (w.owner >= n_owners) {
      error = matrix_assembler_error_code::owner_out_of_range;
      return {};
    }
    ++counts[w.owner];
  }
  const auto n_cols = counts.empty() ? 0u : std::ranges::max(counts);
  if (std::ranges::any_of(
        counts, [&](const auto c) { return c != 0 && c != n_cols; })) {
    error = matrix_assembler_error_code::column_count_mismatch;
    return {};
  }

  normalized_matrix m(n_owners, n_cols, empty_value);
  for (const auto [w, x] : std::views::zip(windows, values)) {
    const auto col =
      owners[w.owner].is_reverse() ? n_cols - 1 - w.index : w.index;
    m[w.owner, col] = x;
  }
  return m;
}

[[nodiscard]] auto
concatenate(const normalized_matrix &upstream, const normalized_matrix &target,
            const normalized_matrix &downstream,
            std::error_code &error) -> normalized_matrix {
  if (upstream.n_rows != target.n_rows ||
      upstream.n_rows != downstream.n_rows) {
    error = matrix_assembler_error_code::row_count_mismatch;
    return {};
  }
  const auto n_cols = upstream.n_cols + target.n_cols + downstream.n_cols;
  normalized_matrix m;
  m.n_rows = upstream.n_rows;
  m.n_cols = n_cols;
  m.v.reserve(static_cast<std::size_t>(m.n_rows) * n_cols);
  for (const auto i : std::views::iota(0u, m.n_rows)) {
    std::ranges::copy(upstream.row(i), std::back_inserter(m.v));
    std::ranges::copy(target.row(i), std::back_inserter(m.v));
    std::ranges::copy(downstream.row(i), std::back_inserter(m.v));
  }

  const auto n_up = upstream.n_cols;
  const auto n_up_target = n_up + target.n_cols;
  m.upstream_index = std::views::iota(0u, n_up) | std::ranges::to<std::vector>();
  m.target_index =
    std::views::iota(n_up, n_up_target) | std::ranges::to<std::vector>();
  m.downstream_index =
    std::views::iota(n_up_target, n_cols) | std::ranges::to<std::vector>();
  return m;
}

}  // namespace enrichmat
