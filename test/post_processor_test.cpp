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

#include <post_processor.hpp>
#include <post_processor_impl.hpp>

#include <logger.hpp>
#include <normalized_matrix.hpp>
#include <smoother.hpp>

#include <gtest/gtest.h>

#include <cmath>
#include <cstdint>
#include <iterator>
#include <limits>
#include <ranges>
#include <system_error>
#include <vector>

using namespace enrichmat;  // NOLINT

class post_processor_mock : public ::testing::Test {
protected:
  auto
  SetUp() -> void override {
    logger::instance(shared_from_cout(), "none", log_level_t::debug);
    // NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers)
    m = normalized_matrix(3, 4, 0.0);
    m.v = {
      0.0, 1.0, 2.0, 3.0,
      4.0, 5.0, 6.0, 7.0,
      8.0, 9.0, 10.0, 11.0,
    };
    // NOLINTEND(cppcoreguidelines-avoid-magic-numbers)
  }

  auto
  TearDown() -> void override {}

public:
  normalized_matrix m;
};

TEST(post_processor_test, quantile_test) {
  // NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers)
  const std::vector<double> sorted{1.0, 2.0, 3.0, 4.0};
  EXPECT_EQ(quantile(sorted, 0.0), 1.0);
  EXPECT_EQ(quantile(sorted, 0.5), 2.5);
  EXPECT_EQ(quantile(sorted, 1.0), 4.0);
  EXPECT_DOUBLE_EQ(quantile(sorted, 0.1), 1.3);
  EXPECT_EQ(quantile({7.0}, 0.3), 7.0);
  // NOLINTEND(cppcoreguidelines-avoid-magic-numbers)
}

TEST_F(post_processor_mock, nothing_to_do) {
  const auto before = m.v;
  std::error_code ec;
  const auto failed = post_process(m, false, {}, {0.0, 0.0}, ec);
  EXPECT_FALSE(ec);
  EXPECT_TRUE(failed.empty());
  EXPECT_EQ(m.v, before);
}

TEST_F(post_processor_mock, trim_clamps_extremes) {
  // NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers)
  std::error_code ec;
  const auto failed = post_process(m, false, {}, {0.1, 0.1}, ec);
  EXPECT_FALSE(ec);
  EXPECT_TRUE(failed.empty());
  // 10% and 90% quantiles of 0..11
  EXPECT_DOUBLE_EQ(m.v.front(), 1.1);
  EXPECT_DOUBLE_EQ(m.v.back(), 9.9);
  EXPECT_EQ(m.v[5], 5.0);
  // NOLINTEND(cppcoreguidelines-avoid-magic-numbers)
}

TEST_F(post_processor_mock, missing_values_stay_missing) {
  // NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers)
  m.v[1] = std::numeric_limits<double>::quiet_NaN();
  std::error_code ec;
  [[maybe_unused]] const auto failed =
    post_process(m, false, {}, {0.0, 0.2}, ec);
  EXPECT_FALSE(ec);
  EXPECT_TRUE(std::isnan(m.v[1]));
  EXPECT_LT(m.v.back(), 11.0);
  // NOLINTEND(cppcoreguidelines-avoid-magic-numbers)
}

TEST_F(post_processor_mock, smoothed_values_clamped_to_original_range) {
  // NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers)
  const smoother_fn overshoot = [](const std::vector<double> &x,
                                   std::error_code &) {
    return x | std::views::transform([](const auto v) {
             return v < 5.0 ? v - 100.0 : v + 100.0;
           }) |
           std::ranges::to<std::vector>();
  };
  std::error_code ec;
  const auto failed = post_process(m, true, overshoot, {0.0, 0.0}, ec);
  EXPECT_FALSE(ec);
  EXPECT_TRUE(failed.empty());
  EXPECT_EQ((m[0, 0]), 0.0);
  EXPECT_EQ((m[2, 3]), 11.0);
  // NOLINTEND(cppcoreguidelines-avoid-magic-numbers)
}

TEST_F(post_processor_mock, failed_rows_keep_their_values) {
  // NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers)
  // fails on rows starting with an even value, shortens rows starting
  // with 4
  const smoother_fn picky = [](const std::vector<double> &x,
                               std::error_code &ec) -> std::vector<double> {
    if (x.front() == 4.0)
      return {x.front()};
    if (std::fmod(x.front(), 2.0) == 0.0) {
      ec = smoother_error_code::fit_failed;
      return {};
    }
    return std::vector<double>(std::size(x), x.front());
  };
  m.v[8] = 9.0;
  std::error_code ec;
  const auto failed = post_process(m, true, picky, {0.0, 0.0}, ec);
  EXPECT_FALSE(ec);
  EXPECT_EQ(failed, (std::vector<std::uint32_t>{1, 2}));
  EXPECT_EQ((m[0, 3]), 3.0);
  EXPECT_EQ((m[1, 3]), 7.0);
  EXPECT_EQ((m[2, 3]), 9.0);
  // NOLINTEND(cppcoreguidelines-avoid-magic-numbers)
}

TEST_F(post_processor_mock, invalid_arguments) {
  // NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers)
  std::error_code ec;
  [[maybe_unused]] auto failed = post_process(m, false, {}, {0.5, 0.5}, ec);
  EXPECT_EQ(ec, post_processor_error_code::invalid_trim);

  ec.clear();
  failed = post_process(m, false, {}, {-0.1, 0.0}, ec);
  EXPECT_EQ(ec, post_processor_error_code::invalid_trim);

  ec.clear();
  failed = post_process(m, true, {}, {0.0, 0.0}, ec);
  EXPECT_EQ(ec, post_processor_error_code::smoother_not_set);
  // NOLINTEND(cppcoreguidelines-avoid-magic-numbers)
}
