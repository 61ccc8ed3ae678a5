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

#include "command_windows.hpp"

static constexpr auto about = R"(
split genomic regions into windows
)";

static constexpr auto description = R"(
The windows command splits each region in a BED file into windows,
either of a given width or a given number per region. A width less than
1 is a fraction of each region's width. Splitting by width starts at the
left end of each region, or at the right end with --reverse, and a
shorter window left over at the other end is dropped unless
--keep-short is given. The output is BED with the name of the region
each window came from (or its line number if regions have no names)
and the window's position within its region in the score column.
)";

static constexpr auto examples = R"(
Examples:

enrichmat windows -i genes.bed -o windows.bed -w 100

enrichmat windows -i genes.bed -o windows.bed -k 20
)";

#include "arguments.hpp"
#include "logger.hpp"
#include "region_sets.hpp"
#include "utilities.hpp"
#include "window_splitter.hpp"

#include <boost/program_options.hpp>

#include <cerrno>
#include <chrono>
#include <cstdint>
#include <cstdlib>  // for EXIT_FAILURE, EXIT_SUCCESS
#include <format>
#include <fstream>
#include <iterator>  // for std::size
#include <memory>
#include <optional>
#include <print>
#include <string>
#include <system_error>
#include <tuple>
#include <vector>

namespace enrichmat {

struct windows_argset : argset_base<windows_argset> {
  static constexpr auto log_level_default{log_level_t::info};
  std::string log_filename;
  log_level_t log_level{};

  std::string intervals_file;
  std::string output_file;
  // 0 means unset for both
  double window_width{};
  std::uint32_t window_count{};
  bool reverse{};
  bool keep_short{};

  auto
  log_options_impl() const {
    log_args<log_level_t::info>(
      std::vector<std::tuple<std::string, std::string>>{
        // clang-format off
        {"log_filename", std::format("{}", log_filename)},
        {"log_level", std::format("{}", log_level)},
        {"intervals_file", std::format("{}", intervals_file)},
        {"output_file", std::format("{}", output_file)},
        {"window_width", std::format("{}", window_width)},
        {"window_count", std::format("{}", window_count)},
        {"reverse", std::format("{}", reverse)},
        {"keep_short", std::format("{}", keep_short)},
        // clang-format on
      });
  }

  [[nodiscard]] auto
  set_common_opts_impl() -> boost::program_options::options_description {
    namespace po = boost::program_options;
    using po::value;
    po::options_description opts("Command line or config file options");
    opts.add_options()
      // clang-format off
      ("log-level,v", value(&log_level)->default_value(log_level_default),
       "log level {debug,info,warning,error,critical}")
      ("log-file,l", value(&log_filename)->value_name("[arg]"),
       "log file name (defaults: print to screen)")
      // clang-format on
      ;
    return opts;
  }

  [[nodiscard]] auto
  set_cli_only_opts_impl() -> boost::program_options::options_description {
    namespace po = boost::program_options;
    using po::value;
    po::options_description opts("Command line options");
    opts.add_options()
      // clang-format off
      ("help,h", "print this message and exit")
      ("config-file,c", value(&config_file), "use specified config file")
      ("intervals,i", value(&intervals_file)->required(), "intervals file (BED)")
      ("output,o", value(&output_file)->required(), "output file (BED)")
      ("window-width,w", value(&window_width), "window width")
      ("window-count,k", value(&window_count), "windows per interval")
      ("reverse", po::bool_switch(&reverse),
       "split from the right end of each interval")
      ("keep-short", po::bool_switch(&keep_short),
       "keep a shorter window left over at the end")
      // clang-format on
      ;
    return opts;
  }
};

[[nodiscard]] static auto
write_windows(const std::string &filename, const target_set &intervals,
              const std::vector<window> &windows) -> std::error_code {
  std::ofstream out(filename);
  if (!out)
    return std::make_error_code(std::errc(errno));
  for (const auto &w : windows) {
    const auto &gi = w.interval;
    const auto name = intervals.has_names() ? intervals.names[w.owner]
                                            : std::format("{}", w.owner + 1);
    std::println(out, "{}\t{}\t{}\t{}\t{}\t{}", gi.chrom, gi.start - 1,
                 gi.stop, name, w.index + 1, to_char(gi.strand));
  }
  if (!out)
    return output_file_error_code::failed_to_open;
  return {};
}

}  // namespace enrichmat

auto
command_windows_main(int argc,
                     char *argv[])  // NOLINT(cppcoreguidelines-avoid-c-arrays)
  -> int {
  static constexpr auto command = "windows";
  static const auto usage =
    std::format("Usage: enrichmat {} [options]\n", command);
  static const auto about_msg =
    std::format("enrichmat {}: {}", command, rstrip(about));
  static const auto description_msg =
    std::format("{}\n{}", rstrip(description), rstrip(examples));

  using namespace enrichmat;  // NOLINT

  windows_argset args;
  const auto ecc = args.parse(argc, argv, usage, about_msg, description_msg);
  if (ecc == argument_error_code::help_requested)
    return EXIT_SUCCESS;
  if (ecc)
    return EXIT_FAILURE;

  std::shared_ptr<std::ostream> log_file =
    args.log_filename.empty()
      ? shared_from_cout()
      : std::make_shared<std::ofstream>(args.log_filename, std::ios::app);

  auto &lgr = logger::instance(log_file, command, args.log_level);
  if (!lgr) {
    std::println("Failure initializing logging: {}.", lgr.get_status());
    return EXIT_FAILURE;
  }

  args.log_options();

  split_params params;
  params.direction =
    args.reverse ? split_direction::reverse : split_direction::normal;
  params.keep_short = args.keep_short;
  if (args.window_width != 0.0)
    params.width = args.window_width;
  if (args.window_count != 0)
    params.count = args.window_count;

  std::error_code ec = check_output_file(args.output_file);
  if (ec) {
    lgr.error("Error: output file {}: {}", args.output_file, ec);
    return EXIT_FAILURE;
  }

  const auto intervals = target_set::read(args.intervals_file, ec);
  if (ec) {
    lgr.error("Error reading intervals file {}: {}", args.intervals_file, ec);
    return EXIT_FAILURE;
  }
  lgr.info("Number of intervals: {}", std::size(intervals));

  const auto split_start{std::chrono::high_resolution_clock::now()};
  const auto windows = make_windows(intervals.intervals, params, ec);
  const auto split_stop{std::chrono::high_resolution_clock::now()};
  lgr.debug("Elapsed time to split intervals: {:.3}s",
            duration(split_start, split_stop));
  if (ec) {
    lgr.error("Error splitting intervals: {}", ec);
    return EXIT_FAILURE;
  }
  lgr.info("Number of windows: {}", std::size(windows));

  ec = write_windows(args.output_file, intervals, windows);
  if (ec) {
    lgr.error("Error writing output {}: {}", args.output_file, ec);
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
