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

#ifndef SRC_SMOOTHER_HPP_
#define SRC_SMOOTHER_HPP_

#include <cstdint>
#include <functional>
#include <string>
#include <system_error>
#include <type_traits>  // for std::true_type
#include <utility>      // for std::to_underlying, std::unreachable
#include <vector>

namespace enrichmat {

/// Smooths one matrix row. Must return a vector of the same length, or
/// set the error; missing values are NaN in the input and may be filled
/// in the output.
using smoother_fn = std::function<std::vector<double>(
  const std::vector<double> &, std::error_code &)>;

/// Local linear regression with tricube weights evaluated at every
/// position. The bandwidth at each position is at least 0.8 and wide
/// enough to weight the nearest tenth of the observed points. If some
/// position has too few points for a line, the whole row is refit with a
/// local quadratic over the nearest 75% of observed points. Needs at least
/// 2 observed points.
[[nodiscard]] auto
default_smoother(const std::vector<double> &x,
                 std::error_code &error) -> std::vector<double>;

}  // namespace enrichmat

// smoother errors

enum class smoother_error_code : std::uint8_t {
  ok = 0,
  too_few_points = 1,
  fit_failed = 2,
  length_changed = 3,
};

template <>
struct std::is_error_code_enum<smoother_error_code> : public std::true_type {};

struct smoother_error_category : std::error_category {
  // clang-format off
  auto name() const noexcept -> const char * override {return "smoother";}
  auto message(int code) const noexcept -> std::string override {
    using std::string_literals::operator""s;
    switch (code) {
    case 0: return "ok"s;
    case 1: return "too few data points to smooth"s;
    case 2: return "local regression failed"s;
    case 3: return "smoother changed the row length"s;
    }
    std::unreachable();
  }
  // clang-format on
};

inline auto
make_error_code(smoother_error_code e) noexcept -> std::error_code {
  static auto category = smoother_error_category{};
  return std::error_code(std::to_underlying(e), category);
}

#endif  // SRC_SMOOTHER_HPP_
