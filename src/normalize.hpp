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

#ifndef SRC_NORMALIZE_HPP_
#define SRC_NORMALIZE_HPP_

#include "normalize_warning.hpp"
#include "normalized_matrix.hpp"
#include "overlap_aggregator.hpp"
#include "post_processor.hpp"
#include "region_sets.hpp"
#include "smoother.hpp"

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <system_error>
#include <tuple>
#include <type_traits>  // for std::true_type
#include <utility>      // for std::to_underlying, std::unreachable
#include <vector>

namespace enrichmat {

typedef std::array<std::int64_t, 2> extend_t;

/// Settings for normalize_to_matrix. Unset optional values are filled
/// from the targets and the other settings.
struct normalize_config {
  static constexpr std::int64_t default_extend{5000};
  static constexpr double default_width_divisor{50.0};
  static constexpr std::uint32_t max_default_k{20};
  static constexpr double default_target_ratio{0.1};

  // bases upstream and downstream of each target
  extend_t extend{default_extend, default_extend};
  // absolute if >= 1, relative if in (0, 1); default max(extend) / 50
  std::optional<double> window_width;
  std::string value_column;
  std::string mapping_column;
  // default NaN when smoothing, else 0
  std::optional<double> empty_value;
  mean_mode_t mean_mode{mean_mode_t::absolute};
  // default: any target wider than one base
  std::optional<bool> include_target;
  // fraction of the columns covering the target; default 1 if extend is
  // zero, else 0.1
  std::optional<double> target_ratio;
  // windows per target when extend is zero; default min(20, narrowest
  // target width)
  std::optional<std::uint32_t> k;
  bool smooth{};
  smoother_fn smoother{default_smoother};
  trim_t trim{};
  std::string signal_name{"signal"};
  std::string target_name{"target"};
};

/// Make extend and target ratio consistent: a ratio of 1 or more leaves
/// no room for flanks, and zero flanks leave only the target.
[[nodiscard]] auto
check_extend_and_ratio(extend_t extend, double target_ratio)
  -> std::tuple<extend_t, double, std::vector<normalize_warning>>;

/// Round each nonzero extend down to a multiple of an absolute window
/// width. Relative widths leave extend unchanged.
[[nodiscard]] auto
check_extend_divisible(extend_t extend, const double window_width)
  -> std::tuple<extend_t, std::vector<normalize_warning>>;

/// Targets of single bases have no interior to show.
[[nodiscard]] auto
check_include_target(const bool include_target, const bool single_point)
  -> std::tuple<bool, std::optional<normalize_warning>>;

/// Summarize the signals in windows upstream of, across, and downstream
/// of each target, one row per target. Configuration problems are errors;
/// automatic corrections are logged and listed in the result's warnings.
[[nodiscard]] auto
normalize_to_matrix(const signal_set &signals, const target_set &targets,
                    const normalize_config &config,
                    std::error_code &error) -> normalized_matrix;

#ifndef ENRICHMAT_NOEXCEPT
[[nodiscard]] inline auto
normalize_to_matrix(const signal_set &signals, const target_set &targets,
                    const normalize_config &config) -> normalized_matrix {
  std::error_code error;
  auto m = normalize_to_matrix(signals, targets, config, error);
  if (error)
    throw std::system_error(error);
  return m;
}
#endif

}  // namespace enrichmat

// normalize errors

enum class normalize_error_code : std::uint8_t {
  ok = 0,
  negative_extend = 1,
  window_width_unset = 2,
  window_count_unset = 3,
};

template <>
struct std::is_error_code_enum<normalize_error_code> : public std::true_type {
};

struct normalize_error_category : std::error_category {
  // clang-format off
  auto name() const noexcept -> const char * override {return "normalize";}
  auto message(int code) const noexcept -> std::string override {
    using std::string_literals::operator""s;
    switch (code) {
    case 0: return "ok"s;
    case 1: return "extend must not be negative"s;
    case 2: return "window width must be positive to split flanks"s;
    case 3: return "window count must be positive to split targets"s;
    }
    std::unreachable();
  }
  // clang-format on
};

inline auto
make_error_code(normalize_error_code e) noexcept -> std::error_code {
  static auto category = normalize_error_category{};
  return std::error_code(std::to_underlying(e), category);
}

#endif  // SRC_NORMALIZE_HPP_
