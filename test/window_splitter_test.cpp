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

#include <window_splitter.hpp>

#include <genomic_interval.hpp>
#include <logger.hpp>
#include <normalize_warning.hpp>

#include <gtest/gtest.h>

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <iterator>
#include <limits>
#include <optional>
#include <ranges>
#include <sstream>
#include <system_error>
#include <tuple>
#include <vector>

using namespace enrichmat;  // NOLINT

class window_splitter_mock : public ::testing::Test {
protected:
  auto
  SetUp() -> void override {
    logger::instance(shared_from_cout(), "none", log_level_t::debug);
  }

  auto
  TearDown() -> void override {}

public:
  // 10 bases
  genomic_interval region{"chr1", 1, 10, strand_t::forward};
};

TEST_F(window_splitter_mock, split_by_width_exact) {
  // NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers)
  std::error_code ec;
  const auto w = split_interval(region, {2.0, std::nullopt}, ec);
  EXPECT_FALSE(ec);
  ASSERT_EQ(std::size(w), 5u);
  for (const auto [i, x] : std::views::enumerate(w)) {
    EXPECT_EQ(x.start, 2 * i + 1);
    EXPECT_EQ(x.stop, 2 * i + 2);
    EXPECT_EQ(x.strand, strand_t::forward);
  }
  // NOLINTEND(cppcoreguidelines-avoid-magic-numbers)
}

TEST_F(window_splitter_mock, split_by_width_remainder) {
  // NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers)
  std::error_code ec;
  const auto dropped = split_interval(region, {3.0, std::nullopt}, ec);
  EXPECT_FALSE(ec);
  ASSERT_EQ(std::size(dropped), 3u);
  EXPECT_EQ(dropped.back().stop, 9);
  EXPECT_TRUE(std::ranges::all_of(
    dropped, [](const auto &x) { return x.width() == 3; }));

  split_params keep{3.0, std::nullopt};
  keep.keep_short = true;
  const auto kept = split_interval(region, keep, ec);
  EXPECT_FALSE(ec);
  ASSERT_EQ(std::size(kept), 4u);
  EXPECT_EQ(kept.back().start, 10);
  EXPECT_EQ(kept.back().width(), 1);
  // NOLINTEND(cppcoreguidelines-avoid-magic-numbers)
}

TEST_F(window_splitter_mock, split_by_width_reverse) {
  // NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers)
  split_params params{3.0, std::nullopt};
  params.direction = split_direction::reverse;
  std::error_code ec;
  const auto dropped = split_interval(region, params, ec);
  EXPECT_FALSE(ec);
  ASSERT_EQ(std::size(dropped), 3u);
  EXPECT_EQ(dropped.front().start, 2);
  EXPECT_EQ(dropped.back().stop, 10);

  params.keep_short = true;
  const auto kept = split_interval(region, params, ec);
  ASSERT_EQ(std::size(kept), 4u);
  EXPECT_EQ(kept.front().start, 1);
  EXPECT_EQ(kept.front().stop, 1);
  EXPECT_EQ(kept[1].start, 2);
  // NOLINTEND(cppcoreguidelines-avoid-magic-numbers)
}

TEST_F(window_splitter_mock, split_by_relative_width) {
  // NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers)
  std::error_code ec;
  const auto w = split_interval(region, {0.2, std::nullopt}, ec);
  EXPECT_FALSE(ec);
  ASSERT_EQ(std::size(w), 5u);
  EXPECT_EQ(w.front().width(), 2);
  // never narrower than one base
  const auto tiny = split_interval(region, {0.01, std::nullopt}, ec);
  EXPECT_EQ(std::size(tiny), 10u);
  // NOLINTEND(cppcoreguidelines-avoid-magic-numbers)
}

TEST_F(window_splitter_mock, split_by_count_tiles_region) {
  // NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers)
  const genomic_interval gi{"chr1", 101, 207, strand_t::reverse};
  for (const std::uint32_t k : {1u, 3u, 7u, 20u}) {
    std::error_code ec;
    const auto w = split_interval(gi, {std::nullopt, k}, ec);
    EXPECT_FALSE(ec);
    ASSERT_EQ(std::size(w), k);
    EXPECT_EQ(w.front().start, gi.start);
    EXPECT_EQ(w.back().stop, gi.stop);
    for (const auto i : std::views::iota(1u, k))
      EXPECT_EQ(w[i].start, w[i - 1].stop + 1);
  }
  // NOLINTEND(cppcoreguidelines-avoid-magic-numbers)
}

TEST_F(window_splitter_mock, split_by_count_boundaries) {
  // NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers)
  std::error_code ec;
  const auto w = split_interval({"chr1", 1, 10}, {std::nullopt, 3u}, ec);
  EXPECT_FALSE(ec);
  ASSERT_EQ(std::size(w), 3u);
  EXPECT_EQ(std::tuple(w[0].start, w[0].stop), std::tuple(1, 3));
  EXPECT_EQ(std::tuple(w[1].start, w[1].stop), std::tuple(4, 6));
  EXPECT_EQ(std::tuple(w[2].start, w[2].stop), std::tuple(7, 10));

  // as many windows as bases: one rounded boundary pair coincides
  const genomic_interval gi{"chr1", 101, 207};
  const auto v = split_interval(gi, {std::nullopt, 107u}, ec);
  EXPECT_FALSE(ec);
  ASSERT_EQ(std::size(v), 107u);
  EXPECT_EQ(v.front().start, gi.start);
  EXPECT_EQ(v.back().stop, gi.stop);
  EXPECT_EQ(std::tuple(v[53].start, v[53].stop), std::tuple(154, 154));
  EXPECT_EQ(std::tuple(v[54].start, v[54].stop), std::tuple(154, 154));
  EXPECT_EQ(v.back().width(), 2);
  // NOLINTEND(cppcoreguidelines-avoid-magic-numbers)
}

TEST_F(window_splitter_mock, split_by_count_narrow_region) {
  // NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers)
  const genomic_interval gi{"chr1", 5, 7, strand_t::forward};
  std::error_code ec;
  const auto w = split_interval(gi, {std::nullopt, 5u}, ec);
  EXPECT_FALSE(ec);
  ASSERT_EQ(std::size(w), 5u);
  EXPECT_TRUE(std::ranges::all_of(w, [&](const auto &x) {
    return x.width() == 1 && x.start >= gi.start && x.stop <= gi.stop;
  }));
  // NOLINTEND(cppcoreguidelines-avoid-magic-numbers)
}

TEST_F(window_splitter_mock, count_takes_precedence) {
  std::error_code ec;
  const auto w = split_interval(region, {2.0, 4u}, ec);
  EXPECT_FALSE(ec);
  EXPECT_EQ(std::size(w), 4u);
}

TEST_F(window_splitter_mock, invalid_params) {
  std::error_code ec;
  [[maybe_unused]] auto w = split_interval(region, {}, ec);
  EXPECT_EQ(ec, window_splitter_error_code::width_and_count_unset);

  ec.clear();
  w = split_interval(region, {0.0, std::nullopt}, ec);
  EXPECT_EQ(ec, window_splitter_error_code::invalid_width);

  ec.clear();
  w = split_interval(region, {-3.0, std::nullopt}, ec);
  EXPECT_EQ(ec, window_splitter_error_code::invalid_width);

  ec.clear();
  w = split_interval(region, {std::numeric_limits<double>::quiet_NaN(),
                              std::nullopt},
                     ec);
  EXPECT_EQ(ec, window_splitter_error_code::invalid_width);

  ec.clear();
  w = split_interval(region, {std::nullopt, 0u}, ec);
  EXPECT_EQ(ec, window_splitter_error_code::invalid_count);
}

TEST_F(window_splitter_mock, check_window_width_truncates) {
  // NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers)
  std::error_code ec;
  const auto [w, warning] = check_window_width(2.7, ec);
  EXPECT_FALSE(ec);
  EXPECT_EQ(w, 2.0);
  ASSERT_TRUE(warning);
  EXPECT_EQ(*warning, normalize_warning::window_width_truncated);

  const auto [w_rel, warning_rel] = check_window_width(0.25, ec);
  EXPECT_EQ(w_rel, 0.25);
  EXPECT_FALSE(warning_rel);

  // a truncated width splits like the integer width
  const auto w_trunc = split_interval(region, {2.7, std::nullopt}, ec);
  EXPECT_EQ(std::size(w_trunc), 5u);
  // NOLINTEND(cppcoreguidelines-avoid-magic-numbers)
}

TEST_F(window_splitter_mock, make_windows_tags_owner_and_index) {
  // NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers)
  const std::vector<genomic_interval> intervals{
    {"chr1", 1, 10, strand_t::forward},
    {"chr2", 101, 110, strand_t::reverse},
  };
  std::error_code ec;
  const auto windows = make_windows(intervals, {5.0, std::nullopt}, ec);
  EXPECT_FALSE(ec);
  ASSERT_EQ(std::size(windows), 4u);
  EXPECT_EQ(windows[0].owner, 0u);
  EXPECT_EQ(windows[1].index, 1u);
  EXPECT_EQ(windows[2].owner, 1u);
  EXPECT_EQ(windows[2].index, 0u);
  EXPECT_EQ(windows[2].interval.start, 101);
  EXPECT_EQ(windows[3].interval.strand, strand_t::reverse);
  // NOLINTEND(cppcoreguidelines-avoid-magic-numbers)
}

TEST_F(window_splitter_mock, split_direction_names) {
  std::istringstream in("reverse");
  split_direction d{};
  in >> d;
  EXPECT_TRUE(in);
  EXPECT_EQ(d, split_direction::reverse);

  std::istringstream bad("sideways");
  bad >> d;
  EXPECT_FALSE(bad);

  std::ostringstream out;
  out << split_direction::normal;
  EXPECT_EQ(out.str(), "normal");
}
