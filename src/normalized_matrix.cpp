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

#include "normalized_matrix.hpp"

#include "normalize_warning.hpp"

#include <boost/describe.hpp>
#include <boost/json.hpp>

#include <algorithm>
#include <cerrno>
#include <cmath>  // for std::isnan
#include <cstdint>
#include <format>
#include <fstream>
#include <iterator>  // for std::size, std::back_inserter
#include <optional>
#include <ostream>
#include <print>
#include <ranges>
#include <sstream>
#include <string>
#include <system_error>
#include <vector>

namespace enrichmat {

// 0: upstream, 1: target, 2: downstream
[[nodiscard]] static inline auto
segment_of(const normalized_matrix &m, const std::uint32_t col) -> int {
  const auto n_up = std::size(m.upstream_index);
  const auto n_target = std::size(m.target_index);
  if (col < n_up)
    return 0;
  return col < n_up + n_target ? 1 : 2;
}

[[nodiscard]] static inline auto
plural(const std::size_t n) -> const char * {
  return n > 1 ? "s" : "";
}

[[nodiscard]] auto
normalized_matrix::subset_rows(const std::vector<std::uint32_t> &rows,
                               std::error_code &error) const
  -> normalized_matrix {
  if (std::ranges::any_of(rows, [&](const auto i) { return i >= n_rows; })) {
    error = normalized_matrix_error_code::row_out_of_range;
    return {};
  }
  normalized_matrix m = *this;
  m.n_rows = static_cast<std::uint32_t>(std::size(rows));
  m.v.clear();
  m.v.reserve(static_cast<std::size_t>(m.n_rows) * n_cols);
  m.row_names.clear();
  m.failed_rows.clear();
  for (const auto [pos, i] : std::views::enumerate(rows)) {
    std::ranges::copy(row(i), std::back_inserter(m.v));
    if (!row_names.empty())
      m.row_names.push_back(row_names[i]);
    if (std::ranges::contains(failed_rows, i + 1))
      m.failed_rows.push_back(static_cast<std::uint32_t>(pos) + 1);
  }
  return m;
}

[[nodiscard]] auto
normalized_matrix::subset_columns(const std::vector<std::uint32_t> &cols,
                                  std::error_code &error) const
  -> normalized_matrix {
  if (std::ranges::any_of(cols, [&](const auto j) { return j >= n_cols; })) {
    error = normalized_matrix_error_code::column_out_of_range;
    return {};
  }
  const auto segments = cols | std::views::transform([&](const auto j) {
                          return segment_of(*this, j);
                        }) |
                        std::ranges::to<std::vector>();
  if (!std::ranges::is_sorted(segments)) {
    error = normalized_matrix_error_code::columns_out_of_order;
    return {};
  }

  normalized_matrix m = *this;
  m.n_cols = static_cast<std::uint32_t>(std::size(cols));
  m.v.clear();
  m.v.reserve(static_cast<std::size_t>(n_rows) * m.n_cols);
  for (const auto i : std::views::iota(0u, n_rows))
    for (const auto j : cols)
      m.v.push_back((*this)[i, j]);

  m.upstream_index.clear();
  m.target_index.clear();
  m.downstream_index.clear();
  std::vector<std::uint32_t> *index_lists[] = {
    &m.upstream_index,
    &m.target_index,
    &m.downstream_index,
  };
  for (const auto [pos, seg] : std::views::enumerate(segments))
    index_lists[seg]->push_back(static_cast<std::uint32_t>(pos));

  if (!col_names.empty())
    m.col_names = cols | std::views::transform([&](const auto j) {
                    return col_names[j];
                  }) |
                  std::ranges::to<std::vector>();
  return m;
}

[[nodiscard]] auto
normalized_matrix::rbind(const std::vector<normalized_matrix> &matrices,
                         std::error_code &error) -> normalized_matrix {
  if (matrices.empty()) {
    error = normalized_matrix_error_code::empty_input;
    return {};
  }
  const auto &first = matrices.front();
  for (const auto &m : matrices) {
    if (m.n_cols != first.n_cols) {
      error = normalized_matrix_error_code::column_count_mismatch;
      return {};
    }
    if (m.upstream_index != first.upstream_index ||
        m.target_index != first.target_index ||
        m.downstream_index != first.downstream_index) {
      error = normalized_matrix_error_code::column_layout_mismatch;
      return {};
    }
  }

  // row names survive only if every matrix has them
  const bool all_named = std::ranges::all_of(
    matrices, [](const auto &m) { return std::size(m.row_names) == m.n_rows; });

  normalized_matrix result = first;
  result.v.clear();
  result.row_names.clear();
  result.failed_rows.clear();
  std::uint32_t offset{};
  for (const auto &m : matrices) {
    std::ranges::copy(m.v, std::back_inserter(result.v));
    if (all_named)
      std::ranges::copy(m.row_names, std::back_inserter(result.row_names));
    for (const auto i : m.failed_rows)
      result.failed_rows.push_back(offset + i);
    offset += m.n_rows;
  }
  result.n_rows = offset;
  return result;
}

[[nodiscard]] auto
normalized_matrix::metadata() const -> matrix_metadata {
  return {
    signal_name,
    target_name,
    n_rows,
    n_cols,
    upstream_index,
    target_index,
    downstream_index,
    extend,
    smooth,
    target_is_single_point,
    std::isnan(empty_value) ? std::optional<double>{} : empty_value,
    failed_rows,
    warnings | std::views::transform([](const auto w) {
      return std::string{boost::describe::enum_to_string(w, "unknown")};
    }) | std::ranges::to<std::vector>(),
  };
}

[[nodiscard]] auto
normalized_matrix::describe() const -> std::string {
  const auto n_up = std::size(upstream_index);
  const auto n_target = std::size(target_index);
  const auto n_down = std::size(downstream_index);
  std::string s;
  auto out = std::back_inserter(s);
  std::format_to(out, "Normalize {} to {}:\n", signal_name, target_name);
  std::format_to(out, "  Upstream {} bp ({} window{})\n", extend[0], n_up,
                 plural(n_up));
  std::format_to(out, "  Downstream {} bp ({} window{})\n", extend[1], n_down,
                 plural(n_down));
  if (n_target == 0)
    std::format_to(out, "  Not include target regions\n");
  else if (target_is_single_point)
    std::format_to(out, "  Include target regions (width = 1)\n");
  else
    std::format_to(out, "  Include target regions ({} window{})\n", n_target,
                   plural(n_target));
  std::format_to(out, "  {} signal region{}\n", n_rows, plural(n_rows));
  return s;
}

[[nodiscard]] auto
normalized_matrix::write(const std::string &filename) const
  -> std::error_code {
  std::ofstream out(filename);
  if (!out)
    return std::make_error_code(std::errc(errno));

  const auto names =
    col_names.empty()
      ? make_column_names(std::size(upstream_index), std::size(target_index),
                          std::size(downstream_index))
      : col_names;
  std::print(out, "row");
  for (const auto &name : names)
    std::print(out, "\t{}", name);
  out << '\n';

  for (const auto i : std::views::iota(0u, n_rows)) {
    if (row_names.empty())
      std::print(out, "{}", i + 1);
    else
      std::print(out, "{}", row_names[i]);
    for (const auto x : row(i)) {
      if (std::isnan(x))
        std::print(out, "\tNA");
      else
        std::print(out, "\t{}", x);
    }
    out << '\n';
  }
  if (!out)
    return normalized_matrix_error_code::error_writing_file;
  return {};
}

[[nodiscard]] auto
normalized_matrix::write_metadata(const std::string &json_filename) const
  -> std::error_code {
  std::ofstream out(json_filename);
  if (!out)
    return std::make_error_code(std::errc(errno));
  if (!(out << boost::json::value_from(metadata())))
    return normalized_matrix_error_code::error_writing_file;
  return {};
}

[[nodiscard]] auto
normalized_matrix::tostring() const -> std::string {
  std::ostringstream o;
  if (!(o << boost::json::value_from(metadata())))
    o.clear();
  return o.str();
}

[[nodiscard]] auto
copy_attributes(const normalized_matrix &from,
                normalized_matrix &to) -> std::error_code {
  if (from.n_cols != to.n_cols)
    return normalized_matrix_error_code::column_count_mismatch;
  to.upstream_index = from.upstream_index;
  to.target_index = from.target_index;
  to.downstream_index = from.downstream_index;
  to.extend = from.extend;
  to.smooth = from.smooth;
  to.target_is_single_point = from.target_is_single_point;
  to.empty_value = from.empty_value;
  to.failed_rows = from.failed_rows;
  to.target_name = from.target_name;
  to.col_names = from.col_names;
  to.warnings = from.warnings;
  to.signal_name.clear();
  return {};
}

[[nodiscard]] auto
make_column_names(const std::size_t n_upstream, const std::size_t n_target,
                  const std::size_t n_downstream) -> std::vector<std::string> {
  std::vector<std::string> names;
  names.reserve(n_upstream + n_target + n_downstream);
  const auto add = [&](const char prefix, const std::size_t n) {
    for (const auto i : std::views::iota(std::size_t{1}, n + 1))
      names.push_back(std::format("{}{}", prefix, i));
  };
  add('u', n_upstream);
  add('t', n_target);
  add('d', n_downstream);
  return names;
}

}  // namespace enrichmat
