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

#include "utilities.hpp"

#include <charconv>
#include <filesystem>
#include <fstream>
#include <iterator>  // for std::size
#include <string>
#include <system_error>
#include <vector>

[[nodiscard]] auto
parse_pair(const std::string &s, std::error_code &error) -> std::vector<double> {
  const auto parts = split_comma(s);
  if (std::size(parts) != 1 && std::size(parts) != 2) {
    error = std::make_error_code(std::errc::invalid_argument);
    return {};
  }
  std::vector<double> values;
  for (const auto &p : parts) {
    double x{};
    const auto last = p.data() + std::size(p);
    const auto [ptr, ec] = std::from_chars(p.data(), last, x);
    if (ec != std::errc{} || ptr != last) {
      error = std::make_error_code(std::errc::invalid_argument);
      return {};
    }
    values.push_back(x);
  }
  if (std::size(values) == 1)
    values.push_back(values.front());
  return values;
}

[[nodiscard]] auto
check_output_file(const std::string &filename) -> std::error_code {
  std::error_code ec;
  if (std::filesystem::is_directory(filename, ec))
    return output_file_error_code::is_a_directory;
  // only check that it can be opened; do not truncate an existing file
  std::ofstream out(filename, std::ios::app);
  if (!out)
    return output_file_error_code::failed_to_open;
  return {};
}
