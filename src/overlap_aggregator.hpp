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

#ifndef SRC_OVERLAP_AGGREGATOR_HPP_
#define SRC_OVERLAP_AGGREGATOR_HPP_

#include "region_sets.hpp"
#include "window_splitter.hpp"

#include <boost/describe.hpp>  // for BOOST_DESCRIBE_ENUM

#include <cstdint>
#include <format>
#include <iostream>
#include <string>
#include <system_error>
#include <type_traits>
#include <utility>  // std::unreachable, std::to_underlying
#include <vector>

namespace enrichmat {

/*
  How signals that partly overlap a window are summarized. For a 17bp
  window overlapped by signals of value 40, 30, 50 and 20 over 4, 6, 3
  and 3 bases, with 4 bases covered by no signal:

  absolute: (40 + 30 + 50 + 20) / 4
  weighted: (40*4 + 30*6 + 50*3 + 20*3) / (4 + 6 + 3 + 3)
  w0:       (40*4 + 30*6 + 50*3 + 20*3) / (4 + 6 + 3 + 3 + 4)
  coverage: (40*4 + 30*6 + 50*3 + 20*3) / 17
*/
enum class mean_mode_t : std::uint8_t {
  absolute,
  weighted,
  w0,
  coverage,
};

// clang-format off
BOOST_DESCRIBE_ENUM(
  mean_mode_t,
  absolute,
  weighted,
  w0,
  coverage
)
// clang-format on

auto
operator<<(std::ostream &o, const mean_mode_t &m) -> std::ostream &;

auto
operator>>(std::istream &in, mean_mode_t &m) -> std::istream &;

struct aggregate_options {
  // numeric signal column to aggregate; empty means a constant 1
  std::string value_column;
  // signal column that must match the owning target; empty means none
  std::string mapping_column;
  // names of the targets that own the windows, needed only for a text
  // mapping column
  std::vector<std::string> target_names;
  mean_mode_t mean_mode{mean_mode_t::absolute};
  double empty_value{};
};

/// One value per window. Windows overlapped by no signal get the empty
/// value; windows whose overlapping signals all have missing values get
/// NaN.
[[nodiscard]] auto
aggregate(const signal_set &signals, const std::vector<window> &windows,
          const aggregate_options &options,
          std::error_code &error) -> std::vector<double>;

}  // namespace enrichmat

template <>
struct std::formatter<enrichmat::mean_mode_t> : std::formatter<std::string> {
  auto
  format(const enrichmat::mean_mode_t &m, std::format_context &ctx) const {
    return std::format_to(ctx.out(), "{}",
                          boost::describe::enum_to_string(m, "unknown"));
  }
};

// overlap_aggregator errors

enum class overlap_aggregator_error_code : std::uint8_t {
  ok = 0,
  value_column_not_found = 1,
  mapping_column_not_found = 2,
  mapping_on_unnamed_targets = 3,
};

template <>
struct std::is_error_code_enum<overlap_aggregator_error_code>
  : public std::true_type {};

struct overlap_aggregator_error_category : std::error_category {
  // clang-format off
  auto name() const noexcept -> const char * override {return "overlap_aggregator";}
  auto message(int code) const noexcept -> std::string override {
    using std::string_literals::operator""s;
    switch (code) {
    case 0: return "ok"s;
    case 1: return "value column not found in signals"s;
    case 2: return "mapping column not found in signals"s;
    case 3: return "text mapping column requires named targets"s;
    }
    std::unreachable();
  }
  // clang-format on
};

inline auto
make_error_code(overlap_aggregator_error_code e) noexcept -> std::error_code {
  static auto category = overlap_aggregator_error_category{};
  return std::error_code(std::to_underlying(e), category);
}

#endif  // SRC_OVERLAP_AGGREGATOR_HPP_
