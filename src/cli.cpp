/**
 * @file cli.cpp
 * @brief Argument handling, mode dispatch and exit codes
 */

#include "keyscan/cli.hpp"

#include <cstdio>
#include <exception>
#include <filesystem>
#include <string>

#include <fmt/core.h>
#include <nlohmann/json.hpp>

#include "keyscan/config.hpp"
#include "keyscan/error.hpp"
#include "keyscan/logging.hpp"
#include "keyscan/pipeline.hpp"
#include "keyscan/report.hpp"
#include "keyscan/system.hpp"

namespace keyscan {

namespace {

void print_usage(const char *prog) {
  LOG_WARN("Usage: {} <input> <output_dir>", prog);
  LOG_WARN("       {} --benchmark <input> <output_dir>", prog);
  LOG_WARN("       {} --system-info", prog);
  LOG_WARN("<input> is a video file, a raw gray8 file (.gray/.raw/.y) or - "
           "for stdin");
}

int exit_code(const Error &e) {
  return e.kind() == ErrorKind::IO ? EXIT_IO : EXIT_CONFIG;
}

int system_info() {
  size_t threads = Config::threads();
  if (threads == 0)
    threads = static_cast<size_t>(detect_cpu_limit());
  fmt::print("{}\n", system_info_json(threads).dump(2));
  return 0;
}

int benchmark(const char *input, const char *output_dir) {
  LOG_INFO("keyscan {} benchmark", KEYSCAN_VERSION);
  KeyframePipeline pipeline(PipelineOptions::from_env(input, output_dir));
  pipeline.benchmark(default_benchmark_configs());

  if (log_verbose.load())
    TimingCollector::print_summary();
  return 0;
}

int single_run(const char *input, const char *output_dir) {
  LOG_INFO("keyscan {}", KEYSCAN_VERSION);
  LOG_INFO("Input: {}", input);
  LOG_INFO("Output: {}", output_dir);

  KeyframePipeline pipeline(PipelineOptions::from_env(input, output_dir));
  PipelineResult result = pipeline.run();

  if (log_verbose.load())
    TimingCollector::print_summary();

  nlohmann::json report = result.report;
  fmt::print("{}\n", report.dump(2));
  return 0;
}

} // anonymous namespace

int run_cli(int argc, char *argv[]) {
  const char *prog = argc > 0 ? argv[0] : "keyscan";
  try {
    set_verbose(Config::verbose());

    std::string mode = argc > 1 ? argv[1] : "";
    if (argc == 2 && mode == "--system-info")
      return system_info();
    if (argc == 4 && mode == "--benchmark")
      return benchmark(argv[2], argv[3]);
    if (argc == 3 && mode.rfind("--", 0) != 0)
      return single_run(argv[1], argv[2]);

    print_usage(prog);
    return EXIT_USAGE;
  } catch (const Error &e) {
    LOG_ERROR("{}: {}", error_kind_name(e.kind()), e.what());
    return exit_code(e);
  } catch (const std::filesystem::filesystem_error &e) {
    LOG_ERROR("I/O error: {}", e.what());
    return EXIT_IO;
  } catch (const std::exception &e) {
    LOG_ERROR("unexpected error: {}", e.what());
    return EXIT_IO;
  }
}

} // namespace keyscan
