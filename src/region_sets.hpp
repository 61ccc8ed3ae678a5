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

#ifndef SRC_REGION_SETS_HPP_
#define SRC_REGION_SETS_HPP_

#include "genomic_interval.hpp"

#include <cstddef>  // for std::size_t
#include <cstdint>
#include <iterator>  // for std::size
#include <map>
#include <string>
#include <system_error>
#include <type_traits>
#include <utility>  // std::unreachable, std::to_underlying
#include <vector>

namespace enrichmat {

/// Regions to analyze: one matrix row each, in this order. Names are
/// either given for every region or for none.
struct target_set {
  std::vector<genomic_interval> intervals;
  std::vector<std::string> names;

  [[nodiscard]] auto
  size() const noexcept -> std::size_t {
    return std::size(intervals);
  }

  [[nodiscard]] auto
  has_names() const noexcept -> bool {
    return !names.empty();
  }

  /// Read a BED file: chrom, start, end, and optionally name (column 4,
  /// '.' for none) and strand (column 6).
  [[nodiscard]] static auto
  read(const std::string &filename, std::error_code &ec) noexcept
    -> target_set;

#ifndef ENRICHMAT_NOEXCEPT
  [[nodiscard]] static auto
  read(const std::string &filename) -> target_set {
    std::error_code ec;
    auto targets = read(filename, ec);
    if (ec)
      throw std::system_error(ec);
    return targets;
  }
#endif
};

/// Signal regions with any number of named numeric value columns and
/// named text label columns, all parallel to `intervals`.
struct signal_set {
  std::vector<genomic_interval> intervals;
  std::map<std::string, std::vector<double>> values;
  std::map<std::string, std::vector<std::string>> labels;

  [[nodiscard]] auto
  size() const noexcept -> std::size_t {
    return std::size(intervals);
  }

  /// Values used for aggregation; an empty column name means every
  /// signal counts as 1.
  [[nodiscard]] auto
  get_values(const std::string &column, std::error_code &ec) const
    -> std::vector<double>;

  /// Read a BED-like file. Columns after the third are named by a leading
  /// '#' header line if present, otherwise col4, col5, ... A column where
  /// every entry is a number or NA is numeric, otherwise text.
  [[nodiscard]] static auto
  read(const std::string &filename, std::error_code &ec) noexcept
    -> signal_set;

#ifndef ENRICHMAT_NOEXCEPT
  [[nodiscard]] static auto
  read(const std::string &filename) -> signal_set {
    std::error_code ec;
    auto signals = read(filename, ec);
    if (ec)
      throw std::system_error(ec);
    return signals;
  }
#endif
};

}  // namespace enrichmat

// region_set errors

enum class region_set_error_code : std::uint8_t {
  ok = 0,
  error_parsing_bed_line = 1,
  invalid_interval = 2,
  invalid_strand = 3,
  inconsistent_column_count = 4,
  column_not_found = 5,
  names_incomplete = 6,
};

template <>
struct std::is_error_code_enum<region_set_error_code> : public std::true_type {
};

struct region_set_error_category : std::error_category {
  // clang-format off
  auto name() const noexcept -> const char * override {return "region_set";}
  auto message(int code) const noexcept -> std::string override {
    using std::string_literals::operator""s;
    switch (code) {
    case 0: return "ok"s;
    case 1: return "error parsing BED line"s;
    case 2: return "interval end precedes start"s;
    case 3: return "invalid strand"s;
    case 4: return "inconsistent number of columns"s;
    case 5: return "column not found"s;
    case 6: return "names given for some regions but not all"s;
    }
    std::unreachable();
  }
  // clang-format on
};

inline auto
make_error_code(region_set_error_code e) noexcept -> std::error_code {
  static auto category = region_set_error_category{};
  return std::error_code(std::to_underlying(e), category);
}

#endif  // SRC_REGION_SETS_HPP_
