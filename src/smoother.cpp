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

#include "smoother.hpp"
#include "smoother_impl.hpp"

#include <Eigen/Dense>

#include <algorithm>
#include <cmath>  // for std::isnan, std::abs, std::ceil, std::pow
#include <cstdint>
#include <iterator>  // for std::size
#include <optional>
#include <ranges>
#include <system_error>
#include <vector>

namespace enrichmat {

static constexpr auto min_bandwidth = 0.8;
static constexpr auto nn_fraction = 0.1;
static constexpr auto fallback_span = 0.75;
static constexpr auto max_degree = 2u;
static constexpr auto singular_tolerance = 1e-10;
// positions are column indices
static constexpr auto column_spacing = 1.0;

[[nodiscard]] STATIC auto
get_observed(const std::vector<double> &x) -> observed_points {
  observed_points obs;
  for (const auto [i, v] : std::views::enumerate(x))
    if (!std::isnan(v)) {
      obs.pos.push_back(static_cast<double>(i));
      obs.val.push_back(v);
    }
  return obs;
}

[[nodiscard]] STATIC auto
nearest_distance(const observed_points &obs, const double x0,
                 const std::size_t q) -> double {
  auto d = obs.pos |
           std::views::transform([&](const auto p) { return std::abs(p - x0); }) |
           std::ranges::to<std::vector>();
  const auto k = std::min(q, std::size(d)) - 1;
  std::ranges::nth_element(d, std::begin(d) + k);
  return d[k];
}

[[nodiscard]] STATIC auto
local_fit(const observed_points &obs, const double x0, const double h,
          const std::uint32_t degree,
          const std::uint32_t min_degree) -> std::optional<double> {
  if (!(h > 0.0))
    return std::nullopt;
  // moments of the weights: sum w d^k for k = 0..2*degree, and sum w d^k y
  Eigen::VectorXd s = Eigen::VectorXd::Zero(2 * degree + 1);
  Eigen::VectorXd t = Eigen::VectorXd::Zero(degree + 1);
  for (const auto [p, y] : std::views::zip(obs.pos, obs.val)) {
    const auto d = p - x0;
    const auto u = std::abs(d) / h;
    if (u >= 1.0)
      continue;
    const auto w = std::pow(1.0 - u * u * u, 3);
    double dk = 1.0;
    for (const auto k : std::views::iota(0u, 2 * degree + 1)) {
      s(k) += w * dk;
      if (k <= degree)
        t(k) += w * dk * y;
      dk *= d;
    }
  }
  if (s(0) == 0.0)
    return std::nullopt;

  // the intercept of the normal equations is the fitted value at x0
  for (auto deg = degree + 1; deg-- > min_degree;) {
    const auto n = static_cast<Eigen::Index>(deg) + 1;
    Eigen::MatrixXd a(n, n);
    for (const auto r : std::views::iota(Eigen::Index{}, n))
      for (const auto c : std::views::iota(Eigen::Index{}, n))
        a(r, c) = s(r + c);
    Eigen::ColPivHouseholderQR<Eigen::MatrixXd> qr(a);
    qr.setThreshold(singular_tolerance);
    if (qr.rank() < n)
      continue;
    const Eigen::VectorXd coef = qr.solve(t.head(n));
    return coef(0);
  }
  return std::nullopt;
}

// fit every position with a bandwidth that gives the q nearest observed
// points positive weight
[[nodiscard]] static auto
fit_all(const observed_points &obs, const std::size_t n, const std::size_t q,
        const double h_min, const std::uint32_t degree,
        const std::uint32_t min_degree) -> std::optional<std::vector<double>> {
  std::vector<double> fitted(n);
  for (const auto i : std::views::iota(std::size_t{}, n)) {
    const auto x0 = static_cast<double>(i);
    const auto h =
      std::max(h_min, nearest_distance(obs, x0, q) + column_spacing);
    const auto fit = local_fit(obs, x0, h, degree, min_degree);
    if (!fit)
      return std::nullopt;
    fitted[i] = *fit;
  }
  return fitted;
}

[[nodiscard]] auto
default_smoother(const std::vector<double> &x,
                 std::error_code &error) -> std::vector<double> {
  const auto obs = get_observed(x);
  const auto m = std::size(obs.pos);
  if (m < 2) {
    error = smoother_error_code::too_few_points;
    return {};
  }
  const auto n = std::size(x);

  const auto q_nn = static_cast<std::size_t>(std::ceil(nn_fraction * m));
  if (auto fitted = fit_all(obs, n, std::max(q_nn, std::size_t{1}),
                            min_bandwidth, 1, 1))
    return *fitted;

  const auto q_span = static_cast<std::size_t>(std::ceil(fallback_span * m));
  if (auto fitted =
        fit_all(obs, n, std::max(q_span, std::size_t{2}), 0.0, max_degree, 1))
    return *fitted;

  error = smoother_error_code::fit_failed;
  return {};
}

}  // namespace enrichmat
