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

#ifndef SRC_REGION_SETS_IMPL_HPP_
#define SRC_REGION_SETS_IMPL_HPP_

#ifdef UNIT_TEST
#define STATIC
#else
#define STATIC static
#endif

#include "genomic_interval.hpp"

#include <string_view>
#include <system_error>
#include <vector>

namespace enrichmat {

[[nodiscard]] STATIC auto
split_fields(const std::string_view line) -> std::vector<std::string_view>;

[[nodiscard]] STATIC auto
parse_number(const std::string_view field, double &value) noexcept -> bool;

[[nodiscard]] STATIC auto
parse_strand(const std::string_view field, std::error_code &ec) noexcept
  -> strand_t;

// BED start is 0-based and the end is exclusive; the result is 1-based
// and inclusive
[[nodiscard]] STATIC auto
parse_bed_interval(const std::vector<std::string_view> &fields,
                   std::error_code &ec) noexcept -> genomic_interval;

}  // namespace enrichmat

#endif  // SRC_REGION_SETS_IMPL_HPP_
