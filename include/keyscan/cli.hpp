/**
 * @file cli.hpp
 * @brief Command line front end of keyscan
 *
 * @details Three modes:
 *
 *          - keyscan <input> <output_dir>: detect keyframes, export stills,
 *            save processing_report_<ts>.json and print the report on stdout
 *
 *          - keyscan --benchmark <input> <output_dir>: compare the engine
 *            configurations and save benchmark_results_<ts>.json
 *
 *          - keyscan --system-info: print thread count and SIMD support
 *
 * @note Tuning comes from environment variables (see config.hpp).
 */

#ifndef KEYSCAN_CLI_HPP
#define KEYSCAN_CLI_HPP

namespace keyscan {

constexpr int EXIT_USAGE = 1;
constexpr int EXIT_CONFIG = 2;
constexpr int EXIT_IO = 3;

/**
 * @brief Run the tool on argv and return the process exit code.
 * @return 0 success, EXIT_USAGE, EXIT_CONFIG or EXIT_IO. Any other
 *         failure is logged and reported as EXIT_IO.
 */
int run_cli(int argc, char *argv[]);

} // namespace keyscan

#endif // KEYSCAN_CLI_HPP
