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

#ifndef SRC_POST_PROCESSOR_HPP_
#define SRC_POST_PROCESSOR_HPP_

#include "normalized_matrix.hpp"
#include "smoother.hpp"

#include <array>
#include <cstdint>
#include <string>
#include <system_error>
#include <type_traits>  // for std::true_type
#include <utility>      // for std::to_underlying, std::unreachable
#include <vector>

namespace enrichmat {

/// Quantile fractions cut from the low and the high end of the values.
typedef std::array<double, 2> trim_t;

/// Smooth each row if requested, trim the extreme quantiles and clamp
/// everything to the range the values had before smoothing. A row that
/// cannot be smoothed keeps its values and its 1-based number is returned.
/// Missing values stay missing unless the smoother fills them.
[[nodiscard]] auto
post_process(normalized_matrix &m, const bool smooth,
             const smoother_fn &smoother, const trim_t trim,
             std::error_code &error) -> std::vector<std::uint32_t>;

}  // namespace enrichmat

// post_processor errors

enum class post_processor_error_code : std::uint8_t {
  ok = 0,
  invalid_trim = 1,
  smoother_not_set = 2,
};

template <>
struct std::is_error_code_enum<post_processor_error_code>
  : public std::true_type {};

struct post_processor_error_category : std::error_category {
  // clang-format off
  auto name() const noexcept -> const char * override {return "post_processor";}
  auto message(int code) const noexcept -> std::string override {
    using std::string_literals::operator""s;
    switch (code) {
    case 0: return "ok"s;
    case 1: return "trim fractions must be in [0, 1) and sum to less than 1"s;
    case 2: return "smoothing requested without a smoother"s;
    }
    std::unreachable();
  }
  // clang-format on
};

inline auto
make_error_code(post_processor_error_code e) noexcept -> std::error_code {
  static auto category = post_processor_error_category{};
  return std::error_code(std::to_underlying(e), category);
}

#endif  // SRC_POST_PROCESSOR_HPP_
