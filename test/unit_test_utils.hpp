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

#ifndef TEST_UNIT_TEST_UTILS_HPP_
#define TEST_UNIT_TEST_UTILS_HPP_

#include <fstream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <vector>

inline auto
write_file(const std::string &filename, const std::string &payload) -> void {
  std::ofstream out(filename);
  if (!out)
    throw std::runtime_error("failed to open file to write mock: " + filename);
  const auto sz = static_cast<std::streamsize>(std::size(payload));
  out.write(payload.data(), sz);
}

[[nodiscard]] inline auto
read_lines(const std::string &filename) -> std::vector<std::string> {
  std::ifstream in(filename);
  std::vector<std::string> lines;
  std::string line;
  while (getline(in, line))
    lines.push_back(line);
  return lines;
}

#endif  // TEST_UNIT_TEST_UTILS_HPP_
