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

#ifndef SRC_MATRIX_ASSEMBLER_HPP_
#define SRC_MATRIX_ASSEMBLER_HPP_

#include "genomic_interval.hpp"
#include "normalized_matrix.hpp"
#include "window_splitter.hpp"

#include <cstdint>
#include <string>
#include <system_error>
#include <type_traits>  // for std::true_type
#include <utility>      // for std::to_underlying, std::unreachable
#include <vector>

namespace enrichmat {

/// Scatter one value per window into a matrix with a row per owner and a
/// column per window. Columns of reverse-strand owners are reversed so
/// the first column is always nearest the 5' end. Every owner must have
/// the same number of windows; owners with none get a row of
/// `empty_value`.
[[nodiscard]] auto
assemble(const std::vector<window> &windows, const std::vector<double> &values,
         const std::vector<genomic_interval> &owners, const double empty_value,
         std::error_code &error) -> normalized_matrix;

/// Join the upstream, target and downstream matrices side by side and
/// record which columns came from each.
[[nodiscard]] auto
concatenate(const normalized_matrix &upstream, const normalized_matrix &target,
            const normalized_matrix &downstream,
            std::error_code &error) -> normalized_matrix;

}  // namespace enrichmat

// matrix_assembler errors

enum class matrix_assembler_error_code : std::uint8_t {
  ok = 0,
  value_count_mismatch = 1,
  owner_out_of_range = 2,
  column_count_mismatch = 3,
  row_count_mismatch = 4,
};

template <>
struct std::is_error_code_enum<matrix_assembler_error_code>
  : public std::true_type {};

struct matrix_assembler_error_category : std::error_category {
  // clang-format off
  auto name() const noexcept -> const char * override {return "matrix_assembler";}
  auto message(int code) const noexcept -> std::string override {
    using std::string_literals::operator""s;
    switch (code) {
    case 0: return "ok"s;
    case 1: return "number of values differs from number of windows"s;
    case 2: return "window owner out of range"s;
    case 3: return "regions were split into different numbers of windows"s;
    case 4: return "sub-matrices have different numbers of rows"s;
    }
    std::unreachable();
  }
  // clang-format on
};

inline auto
make_error_code(matrix_assembler_error_code e) noexcept -> std::error_code {
  static auto category = matrix_assembler_error_category{};
  return std::error_code(std::to_underlying(e), category);
}

#endif  // SRC_MATRIX_ASSEMBLER_HPP_
