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

#ifndef SRC_SMOOTHER_IMPL_HPP_
#define SRC_SMOOTHER_IMPL_HPP_

#ifdef UNIT_TEST
#define STATIC
#else
#define STATIC static
#endif

#include <cstdint>
#include <optional>
#include <vector>

namespace enrichmat {

// observed (non-missing) points of a row, positions counted from 0
struct observed_points {
  std::vector<double> pos;
  std::vector<double> val;
};

[[nodiscard]] STATIC auto
get_observed(const std::vector<double> &x) -> observed_points;

// distance from x0 to its q-th nearest observed point (q >= 1)
[[nodiscard]] STATIC auto
nearest_distance(const observed_points &obs, const double x0,
                 const std::size_t q) -> double;

// value at x0 of the polynomial fitted with tricube weights over points
// closer than h; the degree is lowered down to min_degree while the fit
// is singular
[[nodiscard]] STATIC auto
local_fit(const observed_points &obs, const double x0, const double h,
          const std::uint32_t degree,
          const std::uint32_t min_degree) -> std::optional<double>;

}  // namespace enrichmat

#endif  // SRC_SMOOTHER_IMPL_HPP_
