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

#ifndef SRC_GENOMIC_INTERVAL_HPP_
#define SRC_GENOMIC_INTERVAL_HPP_

#include <algorithm>
#include <cstdint>
#include <format>
#include <iostream>
#include <ranges>  // IWYU pragma: keep
#include <string>
#include <utility>  // std::to_underlying

namespace enrichmat {

enum class strand_t : std::uint8_t {
  unstranded,
  forward,
  reverse,
};

[[nodiscard]] constexpr auto
to_char(const strand_t s) noexcept -> char {
  constexpr char strand_chars[] = {'*', '+', '-'};
  return strand_chars[std::to_underlying(s)];
}

/// Coordinates are 1-based and inclusive on both ends, as genomic ranges
/// are usually reported; BED input is converted when it is read.
struct genomic_interval {
  std::string chrom;
  std::int64_t start{};
  std::int64_t stop{};
  strand_t strand{strand_t::unstranded};

  auto
  operator<=>(const genomic_interval &) const = default;

  [[nodiscard]] auto
  width() const noexcept -> std::int64_t {
    return stop - start + 1;
  }

  [[nodiscard]] auto
  is_reverse() const noexcept -> bool {
    return strand == strand_t::reverse;
  }

  [[nodiscard]] auto
  overlaps(const genomic_interval &rhs) const noexcept -> bool {
    return chrom == rhs.chrom && start <= rhs.stop && rhs.start <= stop;
  }

  [[nodiscard]] auto
  intersection_width(const genomic_interval &rhs) const noexcept
    -> std::int64_t {
    const auto w = std::min(stop, rhs.stop) - std::max(start, rhs.start) + 1;
    return chrom == rhs.chrom ? std::max(w, std::int64_t{0}) : 0;
  }

  [[nodiscard]] static auto
  are_valid(const auto &g) noexcept -> bool {
    return std::ranges::all_of(
      g, [](const auto &x) { return x.start <= x.stop; });
  }

  [[nodiscard]] static auto
  all_single_point(const auto &g) noexcept -> bool {
    return std::ranges::all_of(g,
                               [](const auto &x) { return x.width() <= 1; });
  }
};

// The region spanning `upstream` bases 5' of the interval's 5' end and
// `downstream` bases from the 5' end onward, oriented by strand. Either
// side may be zero; a result with both zero has width 0.
[[nodiscard]] auto
promoter_flank(const genomic_interval &gi, const std::int64_t upstream,
               const std::int64_t downstream) -> genomic_interval;

// The single base immediately 3' of the interval, oriented by strand.
[[nodiscard]] auto
three_prime_neighbor(const genomic_interval &gi) -> genomic_interval;

inline auto
operator<<(std::ostream &o, const strand_t s) -> std::ostream & {
  return o << to_char(s);
}

}  // namespace enrichmat

template <>
struct std::formatter<enrichmat::genomic_interval>
  : std::formatter<std::string> {
  auto
  format(const enrichmat::genomic_interval &gi,
         std::format_context &ctx) const {
    return std::format_to(ctx.out(), "{}:{}-{}:{}", gi.chrom, gi.start,
                          gi.stop, enrichmat::to_char(gi.strand));
  }
};

#endif  // SRC_GENOMIC_INTERVAL_HPP_
