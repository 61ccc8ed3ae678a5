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

#ifndef SRC_NORMALIZE_WARNING_HPP_
#define SRC_NORMALIZE_WARNING_HPP_

#include <boost/describe.hpp>  // for BOOST_DESCRIBE_ENUM

#include <array>
#include <cstdint>
#include <format>
#include <string>
#include <string_view>
#include <utility>  // std::to_underlying
#include <vector>

namespace enrichmat {

/// Non-fatal corrections applied to a configuration. Each one is
/// reported, logged, and the corrected value is used.
enum class normalize_warning : std::uint8_t {
  window_width_truncated,
  upstream_not_divisible,
  downstream_not_divisible,
  extend_reset,
  target_ratio_reset,
  include_target_disabled,
  smoothing_failed,
};

// clang-format off
BOOST_DESCRIBE_ENUM(
  normalize_warning,
  window_width_truncated,
  upstream_not_divisible,
  downstream_not_divisible,
  extend_reset,
  target_ratio_reset,
  include_target_disabled,
  smoothing_failed
)
// clang-format on

using std::literals::string_view_literals::operator""sv;

static constexpr auto normalize_warning_message = std::array{
  // clang-format off
  "window width is not an integer; truncated"sv,
  "length of upstream extension is not divisible by window width"sv,
  "length of downstream extension is not divisible by window width"sv,
  "extend reset to 0 because target ratio is at least 1"sv,
  "target ratio reset to 1 because extend is 0"sv,
  "all targets have width 1; include target set to false"sv,
  "smoothing failed for some rows"sv,
  // clang-format on
};

[[nodiscard]] constexpr auto
to_message(const normalize_warning w) -> std::string_view {
  return normalize_warning_message[std::to_underlying(w)];
}

}  // namespace enrichmat

template <>
struct std::formatter<enrichmat::normalize_warning>
  : std::formatter<std::string> {
  auto
  format(const enrichmat::normalize_warning &w,
         std::format_context &ctx) const {
    return std::format_to(ctx.out(), "{}", enrichmat::to_message(w));
  }
};

#endif  // SRC_NORMALIZE_WARNING_HPP_
