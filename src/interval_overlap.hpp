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

#ifndef SRC_INTERVAL_OVERLAP_HPP_
#define SRC_INTERVAL_OVERLAP_HPP_

#include "genomic_interval.hpp"

#include <cstdint>
#include <vector>

namespace enrichmat {

struct overlap_pair {
  std::uint32_t query{};
  std::uint32_t subject{};
  // number of bases shared by query and subject
  std::int64_t width{};

  auto
  operator<=>(const overlap_pair &) const = default;
};

/// All pairs of overlapping intervals, ignoring strand. Intervals are
/// bucketed by chrom and swept in start order: O((n + m) log(n + m) + p)
/// for p reported pairs, plus the scan of subjects still open at each
/// query. Pairs are ordered by subject, then query.
[[nodiscard]] auto
find_overlaps(const std::vector<genomic_interval> &queries,
              const std::vector<genomic_interval> &subjects)
  -> std::vector<overlap_pair>;

}  // namespace enrichmat

#endif  // SRC_INTERVAL_OVERLAP_HPP_
