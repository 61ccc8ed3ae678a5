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

#include <genomic_interval.hpp>

#include <gtest/gtest.h>

#include <algorithm>
#include <format>
#include <vector>

using namespace enrichmat;  // NOLINT

TEST(genomic_interval_test, width_and_overlap) {
  // NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers)
  const genomic_interval a{"chr1", 1, 10, strand_t::forward};
  const genomic_interval b{"chr1", 8, 20, strand_t::reverse};
  const genomic_interval c{"chr2", 1, 10, strand_t::forward};
  EXPECT_EQ(a.width(), 10);
  EXPECT_TRUE(a.overlaps(b));
  EXPECT_FALSE(a.overlaps(c));
  EXPECT_EQ(a.intersection_width(b), 3);
  EXPECT_EQ(b.intersection_width(a), 3);
  EXPECT_EQ(a.intersection_width(c), 0);
  const genomic_interval d{"chr1", 11, 12, strand_t::unstranded};
  EXPECT_FALSE(a.overlaps(d));
  EXPECT_EQ(a.intersection_width(d), 0);
  // NOLINTEND(cppcoreguidelines-avoid-magic-numbers)
}

TEST(genomic_interval_test, ordering) {
  std::vector<genomic_interval> v{
    {"chr2", 1, 5, strand_t::forward},
    {"chr1", 7, 9, strand_t::forward},
    {"chr1", 1, 5, strand_t::reverse},
    {"chr1", 1, 5, strand_t::forward},
  };
  std::ranges::sort(v);
  EXPECT_EQ(v[0].strand, strand_t::forward);
  EXPECT_EQ(v[1].strand, strand_t::reverse);
  EXPECT_EQ(v[2].start, 7);
  EXPECT_EQ(v[3].chrom, "chr2");
}

TEST(genomic_interval_test, single_point_and_valid) {
  const std::vector<genomic_interval> points{
    {"chr1", 5, 5, strand_t::forward},
    {"chr1", 9, 9, strand_t::reverse},
  };
  EXPECT_TRUE(genomic_interval::all_single_point(points));
  EXPECT_TRUE(genomic_interval::are_valid(points));
  const std::vector<genomic_interval> mixed{
    {"chr1", 5, 5, strand_t::forward},
    {"chr1", 9, 12, strand_t::reverse},
  };
  EXPECT_FALSE(genomic_interval::all_single_point(mixed));
  const std::vector<genomic_interval> invalid{
    {"chr1", 9, 5, strand_t::forward},
  };
  EXPECT_FALSE(genomic_interval::are_valid(invalid));
}

TEST(genomic_interval_test, promoter_flank_forward) {
  // NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers)
  const genomic_interval gi{"chr1", 1001, 2000, strand_t::forward};
  const auto up = promoter_flank(gi, 100, 0);
  EXPECT_EQ(up.start, 901);
  EXPECT_EQ(up.stop, 1000);
  EXPECT_EQ(up.strand, strand_t::forward);
  const auto both = promoter_flank(gi, 100, 50);
  EXPECT_EQ(both.start, 901);
  EXPECT_EQ(both.stop, 1050);
  // NOLINTEND(cppcoreguidelines-avoid-magic-numbers)
}

TEST(genomic_interval_test, promoter_flank_reverse) {
  // NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers)
  const genomic_interval gi{"chr1", 1001, 2000, strand_t::reverse};
  const auto up = promoter_flank(gi, 100, 0);
  EXPECT_EQ(up.start, 2001);
  EXPECT_EQ(up.stop, 2100);
  const auto both = promoter_flank(gi, 100, 50);
  EXPECT_EQ(both.start, 1951);
  EXPECT_EQ(both.stop, 2100);
  EXPECT_EQ(both.width(), 150);
  // NOLINTEND(cppcoreguidelines-avoid-magic-numbers)
}

TEST(genomic_interval_test, three_prime_neighbor_by_strand) {
  // NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers)
  const genomic_interval fwd{"chr1", 1001, 2000, strand_t::forward};
  const auto f = three_prime_neighbor(fwd);
  EXPECT_EQ(f.start, 2001);
  EXPECT_EQ(f.stop, 2001);
  const auto down = promoter_flank(f, 0, 100);
  EXPECT_EQ(down.start, 2001);
  EXPECT_EQ(down.stop, 2100);

  const genomic_interval rev{"chr1", 1001, 2000, strand_t::reverse};
  const auto r = three_prime_neighbor(rev);
  EXPECT_EQ(r.start, 1000);
  EXPECT_EQ(r.stop, 1000);
  const auto rdown = promoter_flank(r, 0, 100);
  EXPECT_EQ(rdown.start, 901);
  EXPECT_EQ(rdown.stop, 1000);
  // NOLINTEND(cppcoreguidelines-avoid-magic-numbers)
}

TEST(genomic_interval_test, format) {
  const genomic_interval gi{"chrX", 3, 7, strand_t::reverse};
  EXPECT_EQ(std::format("{}", gi), "chrX:3-7:-");
}
