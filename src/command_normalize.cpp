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

#include "command_normalize.hpp"

static constexpr auto about = R"(
summarize signals around a set of target regions as a matrix
)";

static constexpr auto description = R"(
The normalize command accepts a file of signal regions and a file of
target regions, both in BED format. Each target is extended upstream
and downstream, the flanks and optionally the target itself are split
into windows, and the signals overlapping each window are summarized
as one value. The result has one row per target and one column per
window, ordered 5' to 3' for targets on either strand. Columns beyond
the third in the signals file are named by a header line starting with
'#', or col4, col5, ... otherwise. The matrix is written as
tab-separated values, and the layout of its columns, along with any
corrections made to the settings, can be written as JSON.
)";

static constexpr auto examples = R"(
Examples:

enrichmat normalize -s peaks.bed -t tss.bed -o matrix.tsv \
    -e 5000 -w 50 --value-column score --mean-mode w0

enrichmat normalize -s cpgs.bed -t genes.bed -o matrix.tsv \
    --meta matrix.json -e 2000,1000 --target-ratio 0.3 --smooth
)";

#include "arguments.hpp"
#include "logger.hpp"
#include "normalize.hpp"
#include "normalized_matrix.hpp"
#include "overlap_aggregator.hpp"
#include "region_sets.hpp"
#include "utilities.hpp"

#include <boost/program_options.hpp>

#include <chrono>
#include <cmath>
#include <cstdint>
#include <cstdlib>  // for EXIT_FAILURE, EXIT_SUCCESS
#include <filesystem>
#include <format>
#include <fstream>
#include <iterator>  // for std::size
#include <limits>
#include <memory>
#include <optional>
#include <print>
#include <ranges>
#include <string>
#include <system_error>
#include <tuple>
#include <vector>

namespace enrichmat {

struct normalize_argset : argset_base<normalize_argset> {
  static constexpr auto log_level_default{log_level_t::info};
  static constexpr auto extend_default{"5000"};
  static constexpr auto trim_default{"0"};
  std::string log_filename;
  log_level_t log_level{};

  std::string signals_file;
  std::string targets_file;
  std::string output_file;
  std::string metadata_file;
  std::string extend;
  // 0 means the default, max(extend) / 50
  double window_width{};
  std::string value_column;
  std::string mapping_column;
  std::string empty_value;
  mean_mode_t mean_mode{};
  bool include_target{};
  bool exclude_target{};
  std::string target_ratio;
  // 0 means the default, min(20, narrowest target)
  std::uint32_t k{};
  bool smooth{};
  std::string trim;

  auto
  log_options_impl() const {
    log_args<log_level_t::info>(
      std::vector<std::tuple<std::string, std::string>>{
        // clang-format off
        {"log_filename", std::format("{}", log_filename)},
        {"log_level", std::format("{}", log_level)},
        {"signals_file", std::format("{}", signals_file)},
        {"targets_file", std::format("{}", targets_file)},
        {"output_file", std::format("{}", output_file)},
        {"metadata_file", std::format("{}", metadata_file)},
        {"extend", std::format("{}", extend)},
        {"window_width", std::format("{}", window_width)},
        {"value_column", std::format("{}", value_column)},
        {"mapping_column", std::format("{}", mapping_column)},
        {"empty_value", std::format("{}", empty_value)},
        {"mean_mode", std::format("{}", mean_mode)},
        {"include_target", std::format("{}", include_target)},
        {"exclude_target", std::format("{}", exclude_target)},
        {"target_ratio", std::format("{}", target_ratio)},
        {"k", std::format("{}", k)},
        {"smooth", std::format("{}", smooth)},
        {"trim", std::format("{}", trim)},
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
      ("extend,e", value(&extend)->default_value(extend_default),
       "bases upstream and downstream (up[,down])")
      ("window-width,w", value(&window_width)->default_value(0.0, "auto"),
       "window width; a fraction of each region if less than 1")
      ("value-column", value(&value_column),
       "signal column to summarize (default: every signal counts 1)")
      ("mapping-column", value(&mapping_column),
       "signal column naming the target each signal belongs to")
      ("empty-value", value(&empty_value),
       "value for windows without signal, or NA (default: NA if smoothing, else 0)")
      ("mean-mode", value(&mean_mode)->default_value(mean_mode_t::absolute),
       "{absolute, weighted, w0, coverage}")
      ("target-ratio", value(&target_ratio),
       "fraction of columns covering the targets (default: 0.1, or 1 if extend is 0)")
      ("k,k", value(&k)->default_value(0, "auto"),
       "windows per target when extend is 0")
      ("smooth", po::bool_switch(&smooth), "smooth each row")
      ("trim", value(&trim)->default_value(trim_default),
       "quantiles to trim at the low and high ends (low[,high])")
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
      ("signals,s", value(&signals_file)->required(), "signals file (BED)")
      ("targets,t", value(&targets_file)->required(), "targets file (BED)")
      ("output,o", value(&output_file)->required(), "output matrix file")
      ("meta", value(&metadata_file), "output metadata file (JSON)")
      ("include-target", po::bool_switch(&include_target),
       "include windows inside the targets")
      ("exclude-target", po::bool_switch(&exclude_target),
       "only use the flanks of the targets")
      // clang-format on
      ;
    return opts;
  }
};

[[nodiscard]] static auto
parse_optional_number(const std::string &s,
                      std::error_code &error) -> std::optional<double> {
  if (s.empty())
    return std::nullopt;
  if (s == "NA" || s == "NaN" || s == "nan")
    return std::numeric_limits<double>::quiet_NaN();
  const auto values = parse_pair(s, error);
  if (error || values.front() != values.back()) {
    error = std::make_error_code(std::errc::invalid_argument);
    return std::nullopt;
  }
  return values.front();
}

// bases on each side; only whole numbers that fit a coordinate
[[nodiscard]] static auto
parse_extend(const std::string &s, std::error_code &error) -> extend_t {
  static constexpr auto max_extend =
    static_cast<double>(std::numeric_limits<std::int32_t>::max());
  const auto values = parse_pair(s, error);
  if (error)
    return {};
  const auto is_valid = [](const double x) {
    return std::isfinite(x) && std::trunc(x) == x && std::abs(x) <= max_extend;
  };
  if (!is_valid(values[0]) || !is_valid(values[1])) {
    error = std::make_error_code(std::errc::invalid_argument);
    return {};
  }
  return {static_cast<std::int64_t>(values[0]),
          static_cast<std::int64_t>(values[1])};
}

[[nodiscard]] static auto
make_config(const normalize_argset &args,
            std::error_code &error) -> normalize_config {
  auto &lgr = logger::instance();
  normalize_config config;

  config.extend = parse_extend(args.extend, error);
  if (error) {
    lgr.error("Invalid extend: {}", args.extend);
    return {};
  }

  const auto trim = parse_pair(args.trim, error);
  if (error) {
    lgr.error("Invalid trim: {}", args.trim);
    return {};
  }
  config.trim = {trim[0], trim[1]};

  config.empty_value = parse_optional_number(args.empty_value, error);
  if (error) {
    lgr.error("Invalid empty value: {}", args.empty_value);
    return {};
  }
  config.target_ratio = parse_optional_number(args.target_ratio, error);
  if (error) {
    lgr.error("Invalid target ratio: {}", args.target_ratio);
    return {};
  }

  if (args.window_width != 0.0)
    config.window_width = args.window_width;
  if (args.k != 0)
    config.k = args.k;
  if (args.include_target)
    config.include_target = true;
  if (args.exclude_target)
    config.include_target = false;

  config.value_column = args.value_column;
  config.mapping_column = args.mapping_column;
  config.mean_mode = args.mean_mode;
  config.smooth = args.smooth;
  config.signal_name = std::filesystem::path(args.signals_file).stem().string();
  config.target_name = std::filesystem::path(args.targets_file).stem().string();
  return config;
}

}  // namespace enrichmat

auto
command_normalize_main(int argc,
                       char *argv[])  // NOLINT(cppcoreguidelines-avoid-c-arrays)
  -> int {
  static constexpr auto command = "normalize";
  static const auto usage =
    std::format("Usage: enrichmat {} [options]\n", command);
  static const auto about_msg =
    std::format("enrichmat {}: {}", command, rstrip(about));
  static const auto description_msg =
    std::format("{}\n{}", rstrip(description), rstrip(examples));

  using namespace enrichmat;  // NOLINT

  normalize_argset args;
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

  if (args.include_target && args.exclude_target) {
    lgr.error("Only one of include-target and exclude-target can be given");
    return EXIT_FAILURE;
  }

  std::error_code ec;
  const auto config = make_config(args, ec);
  if (ec)
    return EXIT_FAILURE;

  for (const auto &filename : {args.output_file, args.metadata_file}) {
    if (filename.empty())
      continue;
    ec = check_output_file(filename);
    if (ec) {
      lgr.error("Error: output file {}: {}", filename, ec);
      return EXIT_FAILURE;
    }
  }

  const auto read_start{std::chrono::high_resolution_clock::now()};
  const auto targets = target_set::read(args.targets_file, ec);
  if (ec) {
    lgr.error("Error reading targets file {}: {}", args.targets_file, ec);
    return EXIT_FAILURE;
  }
  const auto signals = signal_set::read(args.signals_file, ec);
  if (ec) {
    lgr.error("Error reading signals file {}: {}", args.signals_file, ec);
    return EXIT_FAILURE;
  }
  const auto read_stop{std::chrono::high_resolution_clock::now()};
  lgr.info("Number of targets: {}", std::size(targets));
  lgr.info("Number of signals: {}", std::size(signals));
  lgr.debug("Elapsed time to read input: {:.3}s",
            duration(read_start, read_stop));

  const auto normalize_start{std::chrono::high_resolution_clock::now()};
  const auto matrix = normalize_to_matrix(signals, targets, config, ec);
  const auto normalize_stop{std::chrono::high_resolution_clock::now()};
  lgr.debug("Elapsed time to normalize: {:.3}s",
            duration(normalize_start, normalize_stop));
  if (ec) {
    lgr.error("Error normalizing signals: {}", ec);
    return EXIT_FAILURE;
  }

  for (const auto line : matrix.describe() | std::views::split('\n'))
    if (!line.empty())
      lgr.info("{}", std::string_view(line));

  ec = matrix.write(args.output_file);
  if (ec) {
    lgr.error("Error writing output {}: {}", args.output_file, ec);
    return EXIT_FAILURE;
  }
  if (!args.metadata_file.empty()) {
    ec = matrix.write_metadata(args.metadata_file);
    if (ec) {
      lgr.error("Error writing metadata {}: {}", args.metadata_file, ec);
      return EXIT_FAILURE;
    }
  }

  return EXIT_SUCCESS;
}
