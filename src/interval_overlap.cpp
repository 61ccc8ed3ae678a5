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

#include "interval_overlap.hpp"

#include "genomic_interval.hpp"

#include <algorithm>
#include <cstdint>
#include <iterator>  // for std::size, std::cend
#include <ranges>
#include <string>
#include <tuple>  // for std::tie
#include <unordered_map>
#include <vector>

namespace enrichmat {

// indices of intervals for each chrom, ordered by start position
[[nodiscard]] static auto
index_by_chrom(const std::vector<genomic_interval> &intervals)
  -> std::unordered_map<std::string, std::vector<std::uint32_t>> {
  std::unordered_map<std::string, std::vector<std::uint32_t>> idx;
  const auto n_intervals = static_cast<std::uint32_t>(std::size(intervals));
  for (const auto i : std::views::iota(0u, n_intervals))
    idx[intervals[i].chrom].push_back(i);
  for (auto &[chrom, ids] : idx)
    std::ranges::stable_sort(
      ids, {}, [&](const auto i) { return intervals[i].start; });
  return idx;
}

[[nodiscard]] auto
find_overlaps(const std::vector<genomic_interval> &queries,
              const std::vector<genomic_interval> &subjects)
  -> std::vector<overlap_pair> {
  const auto query_idx = index_by_chrom(queries);
  const auto subject_idx = index_by_chrom(subjects);

  std::vector<overlap_pair> pairs;
  for (const auto &[chrom, query_ids] : query_idx) {
    const auto s_itr = subject_idx.find(chrom);
    if (s_itr == std::cend(subject_idx))
      continue;
    const auto &subject_ids = s_itr->second;

    // subjects that started at or before the current query's end and have
    // not ended before the current query's start
    std::vector<std::uint32_t> open;
    std::size_t next_subject{};
    for (const auto q : query_ids) {
      const auto &qi = queries[q];
      while (next_subject < std::size(subject_ids) &&
             subjects[subject_ids[next_subject]].start <= qi.stop)
        open.push_back(subject_ids[next_subject++]);
      // queries come in start order, so these can never overlap again
      std::erase_if(open,
                    [&](const auto s) { return subjects[s].stop < qi.start; });
      for (const auto s : open)
        if (const auto w = qi.intersection_width(subjects[s]); w > 0)
          pairs.push_back({q, s, w});
    }
  }

  std::ranges::sort(pairs, {}, [](const auto &p) {
    return std::tie(p.subject, p.query);
  });
  return pairs;
}

}  // namespace enrichmat
