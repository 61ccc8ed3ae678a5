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

#include <smoother.hpp>
#include <smoother_impl.hpp>

#include <gtest/gtest.h>

#include <algorithm>
#include <cmath>
#include <iterator>
#include <limits>
#include <ranges>
#include <system_error>
#include <vector>

using namespace enrichmat;  // NOLINT

static constexpr auto nan_value = std::numeric_limits<double>::quiet_NaN();

TEST(smoother_test, get_observed_skips_missing) {
  // NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers)
  const auto obs = get_observed({nan_value, 1.0, nan_value, 3.0});
  EXPECT_EQ(obs.pos, (std::vector<double>{1.0, 3.0}));
  EXPECT_EQ(obs.val, (std::vector<double>{1.0, 3.0}));
  // NOLINTEND(cppcoreguidelines-avoid-magic-numbers)
}

TEST(smoother_test, nearest_distance_test) {
  // NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers)
  const auto obs = get_observed({0.0, 0.0, nan_value, nan_value, 0.0, 0.0});
  EXPECT_EQ(nearest_distance(obs, 2.0, 1), 1.0);
  EXPECT_EQ(nearest_distance(obs, 2.0, 2), 2.0);
  EXPECT_EQ(nearest_distance(obs, 2.0, 4), 3.0);
  // more than available uses the farthest
  EXPECT_EQ(nearest_distance(obs, 2.0, 10), 3.0);
  // NOLINTEND(cppcoreguidelines-avoid-magic-numbers)
}

TEST(smoother_test, local_fit_test) {
  // NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers)
  const auto obs = get_observed({1.0, 3.0, 5.0, 7.0});
  // a line is reproduced exactly
  const auto fit = local_fit(obs, 1.5, 3.0, 1, 1);
  ASSERT_TRUE(fit);
  EXPECT_NEAR(*fit, 4.0, 1e-9);

  // a single point in the window cannot determine a slope
  EXPECT_FALSE(local_fit(obs, 0.0, 0.5, 1, 1));
  const auto constant = local_fit(obs, 0.0, 0.5, 1, 0);
  ASSERT_TRUE(constant);
  EXPECT_NEAR(*constant, 1.0, 1e-9);

  // nothing in the window
  EXPECT_FALSE(local_fit(obs, 10.0, 2.0, 1, 0));

  // two points cannot determine a quadratic; the line through them is used
  const auto two = get_observed({1.0, nan_value, 5.0});
  EXPECT_FALSE(local_fit(two, 1.0, 3.0, 2, 2));
  const auto lowered = local_fit(two, 1.0, 3.0, 2, 1);
  ASSERT_TRUE(lowered);
  EXPECT_NEAR(*lowered, 3.0, 1e-9);
  // NOLINTEND(cppcoreguidelines-avoid-magic-numbers)
}

TEST(smoother_test, keeps_length_and_linear_trend) {
  // NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers)
  const auto line = std::views::iota(0, 20) |
                    std::views::transform([](const auto i) {
                      return 2.0 * i + 1.0;
                    }) |
                    std::ranges::to<std::vector>();
  std::error_code ec;
  const auto smoothed = default_smoother(line, ec);
  EXPECT_FALSE(ec);
  ASSERT_EQ(std::size(smoothed), std::size(line));
  for (const auto i : std::views::iota(0u, 20u))
    EXPECT_NEAR(smoothed[i], line[i], 1e-8);
  // NOLINTEND(cppcoreguidelines-avoid-magic-numbers)
}

TEST(smoother_test, fills_missing_values) {
  // NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers)
  auto line = std::views::iota(0, 20) |
              std::views::transform([](const auto i) { return 0.5 * i; }) |
              std::ranges::to<std::vector>();
  line[7] = nan_value;
  line[8] = nan_value;
  std::error_code ec;
  const auto smoothed = default_smoother(line, ec);
  EXPECT_FALSE(ec);
  ASSERT_EQ(std::size(smoothed), 20u);
  EXPECT_TRUE(std::ranges::none_of(
    smoothed, [](const auto x) { return std::isnan(x); }));
  EXPECT_NEAR(smoothed[7], 3.5, 1e-8);
  EXPECT_NEAR(smoothed[8], 4.0, 1e-8);
  EXPECT_NEAR(smoothed[10], 5.0, 1e-8);
  // NOLINTEND(cppcoreguidelines-avoid-magic-numbers)
}

TEST(smoother_test, sparse_row_is_refit) {
  // NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers)
  // the ends see only one point within the nearest-neighbor bandwidth
  std::error_code ec;
  const auto smoothed =
    default_smoother({nan_value, nan_value, nan_value, 1.0, nan_value, 5.0, nan_value}, ec);
  EXPECT_FALSE(ec);
  ASSERT_EQ(std::size(smoothed), 7u);
  EXPECT_NEAR(smoothed[4], 3.0, 1e-8);
  EXPECT_NEAR(smoothed[0], -5.0, 1e-6);
  EXPECT_NEAR(smoothed[6], 7.0, 1e-6);
  // NOLINTEND(cppcoreguidelines-avoid-magic-numbers)
}

TEST(smoother_test, too_few_points) {
  // NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers)
  std::error_code ec;
  [[maybe_unused]] auto smoothed = default_smoother({nan_value, 4.0, nan_value}, ec);
  EXPECT_EQ(ec, smoother_error_code::too_few_points);

  ec.clear();
  smoothed = default_smoother({nan_value, nan_value}, ec);
  EXPECT_EQ(ec, smoother_error_code::too_few_points);

  ec.clear();
  smoothed = default_smoother({2.0, 4.0}, ec);
  EXPECT_FALSE(ec);
  EXPECT_EQ(std::size(smoothed), 2u);
  // NOLINTEND(cppcoreguidelines-avoid-magic-numbers)
}
