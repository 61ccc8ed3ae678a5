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

#ifndef SRC_NORMALIZED_MATRIX_HPP_
#define SRC_NORMALIZED_MATRIX_HPP_

#include "normalize_warning.hpp"

#include <boost/describe.hpp>  // for BOOST_DESCRIBE_STRUCT

#include <array>
#include <cstdint>
#include <format>
#include <iterator>  // for std::size
#include <optional>
#include <span>
#include <string>
#include <system_error>
#include <type_traits>  // for std::true_type
#include <utility>      // for std::to_underlying, std::unreachable
#include <vector>

namespace enrichmat {

/// Everything about a normalized matrix except its values, in the form it
/// is written to JSON.
struct matrix_metadata {
  std::string signal_name;
  std::string target_name;
  std::uint32_t n_rows{};
  std::uint32_t n_cols{};
  std::vector<std::uint32_t> upstream_index;
  std::vector<std::uint32_t> target_index;
  std::vector<std::uint32_t> downstream_index;
  std::array<std::int64_t, 2> extend{};
  bool smooth{};
  bool target_is_single_point{};
  // absent when the empty value is NaN
  std::optional<double> empty_value;
  std::vector<std::uint32_t> failed_rows;
  std::vector<std::string> warnings;
};

// clang-format off
BOOST_DESCRIBE_STRUCT(matrix_metadata, (),
(
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
 empty_value,
 failed_rows,
 warnings
))
// clang-format on

/// Row-major matrix of signal values, one row per target and one column
/// per window, with the column ranges of the upstream, target and
/// downstream segments. All indices are 0-based.
struct normalized_matrix {
  std::vector<double> v;
  std::uint32_t n_rows{};
  std::uint32_t n_cols{};

  // contiguous, in this order; any may be empty
  std::vector<std::uint32_t> upstream_index;
  std::vector<std::uint32_t> target_index;
  std::vector<std::uint32_t> downstream_index;

  // bases upstream and downstream
  std::array<std::int64_t, 2> extend{};
  bool smooth{};
  bool target_is_single_point{};
  double empty_value{};
  // 1-based numbers of rows where smoothing failed; their values are
  // unsmoothed
  std::vector<std::uint32_t> failed_rows;

  std::string signal_name;
  std::string target_name;
  // empty, or one per row
  std::vector<std::string> row_names;
  // empty, or one per column
  std::vector<std::string> col_names;
  std::vector<normalize_warning> warnings;

  normalized_matrix() = default;

  normalized_matrix(const std::uint32_t n_rows, const std::uint32_t n_cols,
                    const double fill) :
    v(static_cast<std::size_t>(n_rows) * n_cols, fill), n_rows{n_rows},
    n_cols{n_cols} {}

  [[nodiscard]] auto
  operator[](const std::uint32_t i, const std::uint32_t j) -> double & {
    return v[static_cast<std::size_t>(i) * n_cols + j];
  }

  [[nodiscard]] auto
  operator[](const std::uint32_t i, const std::uint32_t j) const -> double {
    return v[static_cast<std::size_t>(i) * n_cols + j];
  }

  [[nodiscard]] auto
  row(const std::uint32_t i) -> std::span<double> {
    return {v.data() + static_cast<std::size_t>(i) * n_cols, n_cols};
  }

  [[nodiscard]] auto
  row(const std::uint32_t i) const -> std::span<const double> {
    return {v.data() + static_cast<std::size_t>(i) * n_cols, n_cols};
  }

  [[nodiscard]] auto
  size() const noexcept -> std::size_t {
    return std::size(v);
  }

  /// Keep the given rows, in the given order. Column metadata is kept and
  /// failed rows are renumbered.
  [[nodiscard]] auto
  subset_rows(const std::vector<std::uint32_t> &rows,
              std::error_code &error) const -> normalized_matrix;

  /// Keep the given columns, in the given order. The kept columns must
  /// still be grouped as upstream, then target, then downstream.
  [[nodiscard]] auto
  subset_columns(const std::vector<std::uint32_t> &cols,
                 std::error_code &error) const -> normalized_matrix;

  /// Stack matrices with the same column layout; metadata comes from the
  /// first.
  [[nodiscard]] static auto
  rbind(const std::vector<normalized_matrix> &matrices,
        std::error_code &error) -> normalized_matrix;

  [[nodiscard]] auto
  metadata() const -> matrix_metadata;

  /// Human readable summary of the matrix layout.
  [[nodiscard]] auto
  describe() const -> std::string;

  /// Tab-separated values with a header of column names; each row starts
  /// with its name and missing values are written as NA.
  [[nodiscard]] auto
  write(const std::string &filename) const -> std::error_code;

  [[nodiscard]] auto
  write_metadata(const std::string &json_filename) const -> std::error_code;

  [[nodiscard]] auto
  tostring() const -> std::string;
};

/// Copy everything but the values and row names from one matrix to
/// another with the same number of columns. The signal name is cleared
/// since the values no longer come from the source signal.
[[nodiscard]] auto
copy_attributes(const normalized_matrix &from,
                normalized_matrix &to) -> std::error_code;

/// Column labels u1..un, t1..tk, d1..dm for the three segments.
[[nodiscard]] auto
make_column_names(const std::size_t n_upstream, const std::size_t n_target,
                  const std::size_t n_downstream) -> std::vector<std::string>;

}  // namespace enrichmat

template <>
struct std::formatter<enrichmat::normalized_matrix>
  : std::formatter<std::string> {
  auto
  format(const enrichmat::normalized_matrix &m,
         std::format_context &ctx) const {
    return std::format_to(ctx.out(), "{}", m.tostring());
  }
};

// normalized_matrix errors

enum class normalized_matrix_error_code : std::uint8_t {
  ok = 0,
  row_out_of_range = 1,
  column_out_of_range = 2,
  columns_out_of_order = 3,
  column_count_mismatch = 4,
  column_layout_mismatch = 5,
  empty_input = 6,
  error_writing_file = 7,
};

template <>
struct std::is_error_code_enum<normalized_matrix_error_code>
  : public std::true_type {};

struct normalized_matrix_error_category : std::error_category {
  // clang-format off
  auto name() const noexcept -> const char * override {return "normalized_matrix";}
  auto message(int code) const noexcept -> std::string override {
    using std::string_literals::operator""s;
    switch (code) {
    case 0: return "ok"s;
    case 1: return "row index out of range"s;
    case 2: return "column index out of range"s;
    case 3: return "columns not grouped as upstream, target, downstream"s;
    case 4: return "matrices have different numbers of columns"s;
    case 5: return "matrices have different column layouts"s;
    case 6: return "no matrices given"s;
    case 7: return "error writing file"s;
    }
    std::unreachable();
  }
  // clang-format on
};

inline auto
make_error_code(normalized_matrix_error_code e) noexcept -> std::error_code {
  static auto category = normalized_matrix_error_category{};
  return std::error_code(std::to_underlying(e), category);
}

#endif  // SRC_NORMALIZED_MATRIX_HPP_
