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

#ifndef SRC_SIGNAL_COMBINER_HPP_
#define SRC_SIGNAL_COMBINER_HPP_

#include "normalized_matrix.hpp"

#include <boost/describe.hpp>  // for BOOST_DESCRIBE_ENUM

#include <cstdint>
#include <functional>
#include <iostream>
#include <string>
#include <system_error>
#include <type_traits>  // for std::true_type
#include <utility>      // for std::to_underlying, std::unreachable
#include <vector>

namespace enrichmat {

enum class combine_method : std::uint8_t {
  mean,
  median,
  min,
  max,
};

// clang-format off
BOOST_DESCRIBE_ENUM(
  combine_method,
  mean,
  median,
  min,
  max
)
// clang-format on

auto
operator<<(std::ostream &o, const combine_method &m) -> std::ostream &;

auto
operator>>(std::istream &in, combine_method &m) -> std::istream &;

/// Reduces the values of one cell across matrices to a single value.
using cell_reducer = std::function<double(const std::vector<double> &)>;

/// As cell_reducer, also given the row of the cell, e.g. to relate the
/// signal at a target to some other per-target quantity.
using row_cell_reducer =
  std::function<double(const std::vector<double> &, const std::uint32_t)>;

/// Built-in reducers ignore missing values; a cell missing in every
/// matrix stays missing.
[[nodiscard]] auto
get_reducer(const combine_method method) -> cell_reducer;

/// Combine matrices of identical shape cell by cell. The result has the
/// column layout and row names of the first matrix.
[[nodiscard]] auto
combine_matrices(const std::vector<normalized_matrix> &matrices,
                 const row_cell_reducer &reducer,
                 std::error_code &error) -> normalized_matrix;

[[nodiscard]] auto
combine_matrices(const std::vector<normalized_matrix> &matrices,
                 const cell_reducer &reducer,
                 std::error_code &error) -> normalized_matrix;

[[nodiscard]] auto
combine_matrices(const std::vector<normalized_matrix> &matrices,
                 const combine_method method,
                 std::error_code &error) -> normalized_matrix;

}  // namespace enrichmat

// signal_combiner errors

enum class signal_combiner_error_code : std::uint8_t {
  ok = 0,
  empty_input = 1,
  shape_mismatch = 2,
};

template <>
struct std::is_error_code_enum<signal_combiner_error_code>
  : public std::true_type {};

struct signal_combiner_error_category : std::error_category {
  // clang-format off
  auto name() const noexcept -> const char * override {return "signal_combiner";}
  auto message(int code) const noexcept -> std::string override {
    using std::string_literals::operator""s;
    switch (code) {
    case 0: return "ok"s;
    case 1: return "no matrices to combine"s;
    case 2: return "matrices to combine differ in shape"s;
    }
    std::unreachable();
  }
  // clang-format on
};

inline auto
make_error_code(signal_combiner_error_code e) noexcept -> std::error_code {
  static auto category = signal_combiner_error_category{};
  return std::error_code(std::to_underlying(e), category);
}

#endif  // SRC_SIGNAL_COMBINER_HPP_
