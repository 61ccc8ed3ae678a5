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

#include <matrix_assembler.hpp>

#include <genomic_interval.hpp>
#include <normalized_matrix.hpp>
#include <window_splitter.hpp>

#include <gtest/gtest.h>

#include <cstdint>
#include <iterator>
#include <optional>
#include <system_error>
#include <vector>

using namespace enrichmat;  // NOLINT

TEST(matrix_assembler_test, reverse_strand_rows_are_flipped) {
  // NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers)
  const std::vector<genomic_interval> owners{
    {"chr1", 1, 30, strand_t::forward},
    {"chr1", 101, 130, strand_t::reverse},
  };
  std::error_code ec;
  const auto windows = make_windows(owners, {10.0, std::nullopt}, ec);
  ASSERT_FALSE(ec);
  const std::vector<double> values{1.0, 2.0, 3.0, 4.0, 5.0, 6.0};
  const auto m = assemble(windows, values, owners, 0.0, ec);
  EXPECT_FALSE(ec);
  EXPECT_EQ(m.n_rows, 2u);
  EXPECT_EQ(m.n_cols, 3u);
  EXPECT_EQ(m.v, (std::vector<double>{1.0, 2.0, 3.0, 6.0, 5.0, 4.0}));
  // NOLINTEND(cppcoreguidelines-avoid-magic-numbers)
}

TEST(matrix_assembler_test, owner_without_windows_gets_empty_value) {
  // NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers)
  const std::vector<genomic_interval> owners{
    {"chr1", 1, 20, strand_t::forward},
    {"chr1", 101, 120, strand_t::forward},
  };
  const std::vector<window> windows{
    {{"chr1", 1, 10}, 0, 0},
    {{"chr1", 11, 20}, 0, 1},
  };
  std::error_code ec;
  const auto m = assemble(windows, {7.0, 8.0}, owners, -1.0, ec);
  EXPECT_FALSE(ec);
  EXPECT_EQ(m.v, (std::vector<double>{7.0, 8.0, -1.0, -1.0}));
  // NOLINTEND(cppcoreguidelines-avoid-magic-numbers)
}

TEST(matrix_assembler_test, assemble_errors) {
  // NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers)
  const std::vector<genomic_interval> owners{
    {"chr1", 1, 20, strand_t::forward},
    {"chr1", 101, 130, strand_t::forward},
  };
  const std::vector<window> windows{
    {{"chr1", 1, 10}, 0, 0},
    {{"chr1", 11, 20}, 0, 1},
    {{"chr1", 101, 110}, 1, 0},
  };
  std::error_code ec;
  [[maybe_unused]] auto m = assemble(windows, {1.0}, owners, 0.0, ec);
  EXPECT_EQ(ec, matrix_assembler_error_code::value_count_mismatch);

  ec.clear();
  m = assemble(windows, {1.0, 2.0, 3.0}, owners, 0.0, ec);
  EXPECT_EQ(ec, matrix_assembler_error_code::column_count_mismatch);

  ec.clear();
  m = assemble(windows, {1.0, 2.0, 3.0}, {owners[0]}, 0.0, ec);
  EXPECT_EQ(ec, matrix_assembler_error_code::owner_out_of_range);
  // NOLINTEND(cppcoreguidelines-avoid-magic-numbers)
}

TEST(matrix_assembler_test, concatenate_records_segments) {
  // NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers)
  const normalized_matrix up(2, 2, 1.0);
  const normalized_matrix target(2, 3, 2.0);
  const normalized_matrix down(2, 1, 3.0);
  std::error_code ec;
  const auto m = concatenate(up, target, down, ec);
  EXPECT_FALSE(ec);
  EXPECT_EQ(m.n_rows, 2u);
  EXPECT_EQ(m.n_cols, 6u);
  EXPECT_EQ(m.upstream_index, (std::vector<std::uint32_t>{0, 1}));
  EXPECT_EQ(m.target_index, (std::vector<std::uint32_t>{2, 3, 4}));
  EXPECT_EQ(m.downstream_index, (std::vector<std::uint32_t>{5}));
  EXPECT_EQ((m[1, 0]), 1.0);
  EXPECT_EQ((m[1, 4]), 2.0);
  EXPECT_EQ((m[1, 5]), 3.0);

  const normalized_matrix no_flank(2, 0, 0.0);
  const auto target_only = concatenate(no_flank, target, no_flank, ec);
  EXPECT_FALSE(ec);
  EXPECT_TRUE(target_only.upstream_index.empty());
  EXPECT_EQ(target_only.target_index, (std::vector<std::uint32_t>{0, 1, 2}));
  EXPECT_TRUE(target_only.downstream_index.empty());

  const normalized_matrix short_down(1, 1, 3.0);
  [[maybe_unused]] const auto bad = concatenate(up, target, short_down, ec);
  EXPECT_EQ(ec, matrix_assembler_error_code::row_count_mismatch);
  // NOLINTEND(cppcoreguidelines-avoid-magic-numbers)
}
