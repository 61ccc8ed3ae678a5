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

#include "genomic_interval.hpp"

#include <cstdint>

namespace enrichmat {

[[nodiscard]] auto
promoter_flank(const genomic_interval &gi, const std::int64_t upstream,
               const std::int64_t downstream) -> genomic_interval {
  if (gi.is_reverse())
    return {gi.chrom, gi.stop - downstream + 1, gi.stop + upstream, gi.strand};
  return {gi.chrom, gi.start - upstream, gi.start + downstream - 1, gi.strand};
}

[[nodiscard]] auto
three_prime_neighbor(const genomic_interval &gi) -> genomic_interval {
  const auto pos = gi.is_reverse() ? gi.start - 1 : gi.stop + 1;
  return {gi.chrom, pos, pos, gi.strand};
}

}  // namespace enrichmat
