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

#include <command_normalize.hpp>

#include "unit_test_utils.hpp"

#include <boost/json.hpp>

#include <gtest/gtest.h>

#include <cstdlib>  // for EXIT_SUCCESS, EXIT_FAILURE
#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>
#include <string>
#include <system_error>
#include <vector>

class command_normalize_mock : public ::testing::Test {
protected:
  auto
  SetUp() -> void override {
    dir = (std::filesystem::current_path() / "command_normalize_mock").string();
    std::filesystem::create_directories(dir);
    signals_file = dir + "/signals.bed";
    write_file(signals_file, "#chrom\tstart\tend\tscore\n"
                             "chr1\t950\t960\t5\n"
                             "chr1\t1000\t1500\t2\n"
                             "chr1\t6000\t6010\t7\n");
    targets_file = dir + "/targets.bed";
    write_file(targets_file, "chr1\t1000\t2000\tg1\t0\t+\n"
                             "chr1\t5000\t6000\tg2\t0\t-\n");
    output_file = dir + "/matrix.tsv";
    meta_file = dir + "/matrix.json";
  }

  auto
  TearDown() -> void override {
    std::error_code error;
    [[maybe_unused]] const auto n_removed =
      std::filesystem::remove_all(dir, error);
  }

public:
  std::string dir;
  std::string signals_file;
  std::string targets_file;
  std::string output_file;
  std::string meta_file;
};

TEST_F(command_normalize_mock, basic_test) {
  // Define command line arguments
  // NOLINTBEGIN(cppcoreguidelines-avoid-c-arrays)
  const char *command_argv[] = {
    // clang-format off
    "normalize",
    "-s",
    signals_file.data(),
    "-t",
    targets_file.data(),
    "-o",
    output_file.data(),
    "--meta",
    meta_file.data(),
    "-e",
    "100",
    "-w",
    "10",
    "--value-column",
    "score",
    "-v",
    "error",
    // clang-format on
  };
  // NOLINTEND(cppcoreguidelines-avoid-c-arrays)
  const int command_argc = sizeof(command_argv) / sizeof(command_argv[0]);

  // Run the main function
  // NOLINTBEGIN(cppcoreguidelines-pro-type-const-cast)
  const int result =
    command_normalize_main(command_argc, const_cast<char **>(command_argv));
  // NOLINTEND(cppcoreguidelines-pro-type-const-cast)
  EXPECT_EQ(result, EXIT_SUCCESS);

  const auto lines = read_lines(output_file);
  ASSERT_EQ(std::size(lines), 3u);
  EXPECT_TRUE(lines[0].starts_with("row\tu1\t"));
  EXPECT_TRUE(lines[0].ends_with("\td10"));
  EXPECT_TRUE(lines[1].starts_with("g1\t0\t0\t0\t0\t0\t5\t"));
  EXPECT_TRUE(lines[2].starts_with("g2\t"));

  std::ifstream in(meta_file);
  std::stringstream buffer;
  buffer << in.rdbuf();
  const auto meta = boost::json::parse(buffer.str()).as_object();
  EXPECT_EQ(meta.at("signal_name").as_string(), "signals");
  EXPECT_EQ(meta.at("target_name").as_string(), "targets");
  EXPECT_EQ(meta.at("n_cols").to_number<int>(), 22);
  EXPECT_EQ(meta.at("target_index").as_array().size(), 2u);
}

TEST_F(command_normalize_mock, target_only_test) {
  // NOLINTBEGIN(cppcoreguidelines-avoid-c-arrays)
  const char *command_argv[] = {
    // clang-format off
    "normalize",
    "-s",
    signals_file.data(),
    "-t",
    targets_file.data(),
    "-o",
    output_file.data(),
    "-e",
    "0",
    "-k",
    "4",
    "-v",
    "error",
    // clang-format on
  };
  // NOLINTEND(cppcoreguidelines-avoid-c-arrays)
  const int command_argc = sizeof(command_argv) / sizeof(command_argv[0]);

  // NOLINTBEGIN(cppcoreguidelines-pro-type-const-cast)
  const int result =
    command_normalize_main(command_argc, const_cast<char **>(command_argv));
  // NOLINTEND(cppcoreguidelines-pro-type-const-cast)
  EXPECT_EQ(result, EXIT_SUCCESS);

  const auto lines = read_lines(output_file);
  ASSERT_EQ(std::size(lines), 3u);
  EXPECT_EQ(lines[0], "row\tt1\tt2\tt3\tt4");
  // without a value column each signal counts 1; 1001-1500 reaches the
  // third window, 1500-1749
  EXPECT_EQ(lines[1], "g1\t1\t1\t1\t0");
}

TEST_F(command_normalize_mock, invalid_arguments_test) {
  const std::vector<std::vector<std::string>> bad_args{
    {"normalize", "-s", signals_file, "-t", targets_file},
    {"normalize", "-s", signals_file, "-t", targets_file, "-o", output_file,
     "-e", "abc"},
    {"normalize", "-s", signals_file, "-t", targets_file, "-o", output_file,
     "-e", "5000.7"},
    {"normalize", "-s", signals_file, "-t", targets_file, "-o", output_file,
     "-e", "100,1e300"},
    {"normalize", "-s", signals_file, "-t", targets_file, "-o", output_file,
     "--include-target", "--exclude-target"},
    {"normalize", "-s", dir + "/no_such_file.bed", "-t", targets_file, "-o",
     output_file},
    {"normalize", "-s", signals_file, "-t", targets_file, "-o", output_file,
     "--value-column", "signalValue"},
    {"normalize", "-s", signals_file, "-t", targets_file, "-o", output_file,
     "--trim", "0.6,0.6"},
  };
  for (const auto &args : bad_args) {
    std::vector<const char *> command_argv;
    for (const auto &a : args)
      command_argv.push_back(a.data());
    const int command_argc = static_cast<int>(std::size(command_argv));
    // NOLINTBEGIN(cppcoreguidelines-pro-type-const-cast)
    const int result = command_normalize_main(
      command_argc, const_cast<char **>(command_argv.data()));
    // NOLINTEND(cppcoreguidelines-pro-type-const-cast)
    EXPECT_EQ(result, EXIT_FAILURE) << args.back();
  }
}
