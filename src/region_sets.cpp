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

#include "region_sets.hpp"
#include "region_sets_impl.hpp"

#include "genomic_interval.hpp"

#include <algorithm>
#include <cerrno>
#include <charconv>
#include <cstdint>
#include <format>
#include <fstream>
#include <iterator>  // for std::size, std::cbegin
#include <limits>
#include <ranges>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>  // for std::move
#include <vector>

namespace enrichmat {

[[nodiscard]] STATIC auto
split_fields(const std::string_view line) -> std::vector<std::string_view> {
  std::vector<std::string_view> fields;
  for (const auto f : line | std::views::split('\t'))
    fields.emplace_back(std::cbegin(f), std::cend(f));
  // a trailing carriage return belongs to the line ending, not the field
  if (!fields.empty() && fields.back().ends_with('\r'))
    fields.back().remove_suffix(1);
  return fields;
}

[[nodiscard]] STATIC auto
parse_number(const std::string_view field, double &value) noexcept -> bool {
  if (field == "NA" || field == "NaN" || field == "nan") {
    value = std::numeric_limits<double>::quiet_NaN();
    return true;
  }
  const auto field_end = field.data() + std::size(field);
  const auto [ptr, ec] = std::from_chars(field.data(), field_end, value);
  return ec == std::errc{} && ptr == field_end;
}

[[nodiscard]] STATIC auto
parse_strand(const std::string_view field, std::error_code &ec) noexcept
  -> strand_t {
  if (field == "+")
    return strand_t::forward;
  if (field == "-")
    return strand_t::reverse;
  if (field == "*" || field == ".")
    return strand_t::unstranded;
  ec = region_set_error_code::invalid_strand;
  return strand_t::unstranded;
}

[[nodiscard]] STATIC auto
parse_bed_interval(const std::vector<std::string_view> &fields,
                   std::error_code &ec) noexcept -> genomic_interval {
  if (std::size(fields) < 3 || fields[0].empty()) {
    ec = region_set_error_code::error_parsing_bed_line;
    return {};
  }
  std::int64_t start{};
  std::int64_t stop{};
  const auto parse_coord = [](const std::string_view f, std::int64_t &x) {
    const auto f_end = f.data() + std::size(f);
    const auto [ptr, err] = std::from_chars(f.data(), f_end, x);
    return err == std::errc{} && ptr == f_end;
  };
  if (!parse_coord(fields[1], start) || !parse_coord(fields[2], stop)) {
    ec = region_set_error_code::error_parsing_bed_line;
    return {};
  }
  if (stop <= start) {
    ec = region_set_error_code::invalid_interval;
    return {};
  }
  return {std::string(fields[0]), start + 1, stop, strand_t::unstranded};
}

[[nodiscard]] static inline auto
is_comment_or_track(const std::string_view line) noexcept -> bool {
  return line.starts_with("track") || line.starts_with("browser");
}

[[nodiscard]] auto
target_set::read(const std::string &filename, std::error_code &ec) noexcept
  -> target_set {
  static constexpr auto name_column = 3u;
  static constexpr auto strand_column = 5u;
  ec = std::error_code{};
  std::ifstream in{filename};
  if (!in) {
    ec = std::make_error_code(std::errc(errno));
    return {};
  }

  target_set targets;
  std::vector<std::string> names;
  std::size_t n_named{};
  std::string line;
  while (getline(in, line)) {
    if (line.empty() || line.front() == '#' || is_comment_or_track(line))
      continue;
    const auto fields = split_fields(line);
    auto gi = parse_bed_interval(fields, ec);
    if (ec)
      return {};
    if (std::size(fields) > strand_column) {
      gi.strand = parse_strand(fields[strand_column], ec);
      if (ec)
        return {};
    }
    std::string name;
    if (std::size(fields) > name_column && fields[name_column] != ".")
      name = std::string(fields[name_column]);
    n_named += !name.empty();
    names.push_back(std::move(name));
    targets.intervals.push_back(std::move(gi));
  }
  if (n_named > 0 && n_named != std::size(names)) {
    ec = region_set_error_code::names_incomplete;
    return {};
  }
  if (n_named > 0)
    targets.names = std::move(names);
  return targets;
}

[[nodiscard]] static auto
signal_column_names(const std::vector<std::string_view> &header,
                  const std::size_t n_extra) -> std::vector<std::string> {
  static constexpr auto n_coord_columns = 3u;
  std::vector<std::string> names;
  const bool with_coords = std::size(header) == n_extra + n_coord_columns;
  const bool use_header = with_coords || std::size(header) == n_extra;
  const std::size_t offset = with_coords ? n_coord_columns : 0;
  for (const auto j : std::views::iota(std::size_t{}, n_extra))
    names.push_back(use_header
                      ? std::string(header[offset + j])
                      : std::format("col{}", j + n_coord_columns + 1));
  return names;
}

[[nodiscard]] auto
signal_set::read(const std::string &filename, std::error_code &ec) noexcept
  -> signal_set {
  static constexpr auto n_coord_columns = 3u;
  ec = std::error_code{};
  std::ifstream in{filename};
  if (!in) {
    ec = std::make_error_code(std::errc(errno));
    return {};
  }

  signal_set signals;
  std::string header_line;
  std::vector<std::vector<std::string>> extra;
  bool seen_data{false};
  std::string line;
  while (getline(in, line)) {
    if (line.empty() || is_comment_or_track(line))
      continue;
    if (line.front() == '#') {
      if (!seen_data && header_line.empty())
        header_line = line.substr(1);
      continue;
    }
    const auto fields = split_fields(line);
    auto gi = parse_bed_interval(fields, ec);
    if (ec)
      return {};
    const auto n_extra = std::size(fields) - n_coord_columns;
    if (!seen_data)
      extra.resize(n_extra);
    else if (n_extra != std::size(extra)) {
      ec = region_set_error_code::inconsistent_column_count;
      return {};
    }
    seen_data = true;
    for (const auto j : std::views::iota(std::size_t{}, n_extra))
      extra[j].emplace_back(fields[n_coord_columns + j]);
    signals.intervals.push_back(std::move(gi));
  }

  const auto column_names =
    signal_column_names(split_fields(header_line), std::size(extra));

  for (const auto j : std::views::iota(std::size_t{}, std::size(extra))) {
    const auto n_rows = std::size(extra[j]);
    std::vector<double> numeric(n_rows);
    const bool is_numeric = std::ranges::all_of(
      std::views::iota(std::size_t{}, n_rows),
      [&](const auto i) { return parse_number(extra[j][i], numeric[i]); });
    if (is_numeric)
      signals.values.emplace(column_names[j], std::move(numeric));
    else
      signals.labels.emplace(column_names[j], std::move(extra[j]));
  }
  return signals;
}

[[nodiscard]] auto
signal_set::get_values(const std::string &column, std::error_code &ec) const
  -> std::vector<double> {
  if (column.empty())
    return std::vector<double>(std::size(intervals), 1.0);
  const auto itr = values.find(column);
  if (itr == std::cend(values)) {
    ec = region_set_error_code::column_not_found;
    return {};
  }
  return itr->second;
}

}  // namespace enrichmat
