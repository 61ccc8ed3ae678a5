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

#ifndef SRC_WINDOW_SPLITTER_HPP_
#define SRC_WINDOW_SPLITTER_HPP_

#include "genomic_interval.hpp"
#include "normalize_warning.hpp"

#include <boost/describe.hpp>  // for BOOST_DESCRIBE_ENUM

#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <system_error>
#include <tuple>
#include <type_traits>
#include <utility>  // std::unreachable, std::to_underlying
#include <vector>

namespace enrichmat {

/// Where splitting by width starts: at the left end (normal) or at the
/// right end (reverse). A short remainder window, if any, ends up at the
/// opposite end.
enum class split_direction : std::uint8_t {
  normal,
  reverse,
};

// clang-format off
BOOST_DESCRIBE_ENUM(
  split_direction,
  normal,
  reverse
)
// clang-format on

auto
operator<<(std::ostream &o, const split_direction &d) -> std::ostream &;

auto
operator>>(std::istream &in, split_direction &d) -> std::istream &;

struct split_params {
  // absolute width if >= 1, fraction of each interval if in (0, 1)
  std::optional<double> width;
  // number of windows per interval; takes precedence over width
  std::optional<std::uint32_t> count;
  split_direction direction{split_direction::normal};
  bool keep_short{false};
};

struct window {
  genomic_interval interval;
  // index of the interval the window was generated from
  std::uint32_t owner{};
  // left-to-right position among the owner's windows
  std::uint32_t index{};

  auto
  operator<=>(const window &) const = default;
};

/// Validate a window width. Absolute widths are truncated to integers and
/// the truncation is reported as a warning.
[[nodiscard]] auto
check_window_width(const double width, std::error_code &error) noexcept
  -> std::tuple<double, std::optional<normalize_warning>>;

[[nodiscard]] auto
split_interval(const genomic_interval &gi, const split_params &params,
               std::error_code &error) -> std::vector<genomic_interval>;

[[nodiscard]] auto
make_windows(const std::vector<genomic_interval> &intervals,
             const split_params &params,
             std::error_code &error) -> std::vector<window>;

#ifndef ENRICHMAT_NOEXCEPT
[[nodiscard]] inline auto
make_windows(const std::vector<genomic_interval> &intervals,
             const split_params &params) -> std::vector<window> {
  std::error_code error;
  auto windows = make_windows(intervals, params, error);
  if (error)
    throw std::system_error(error);
  return windows;
}
#endif

}  // namespace enrichmat

// window_splitter errors

enum class window_splitter_error_code : std::uint8_t {
  ok = 0,
  width_and_count_unset = 1,
  invalid_width = 2,
  invalid_count = 3,
  empty_interval = 4,
};

template <>
struct std::is_error_code_enum<window_splitter_error_code>
  : public std::true_type {};

struct window_splitter_error_category : std::error_category {
  // clang-format off
  auto name() const noexcept -> const char * override {return "window_splitter";}
  auto message(int code) const noexcept -> std::string override {
    using std::string_literals::operator""s;
    switch (code) {
    case 0: return "ok"s;
    case 1: return "either window width or window count must be given"s;
    case 2: return "window width must be positive"s;
    case 3: return "window count must be positive"s;
    case 4: return "interval to split has width less than 1"s;
    }
    std::unreachable();
  }
  // clang-format on
};

inline auto
make_error_code(window_splitter_error_code e) noexcept -> std::error_code {
  static auto category = window_splitter_error_category{};
  return std::error_code(std::to_underlying(e), category);
}

#endif  // SRC_WINDOW_SPLITTER_HPP_
