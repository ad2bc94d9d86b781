/**
 * @file main.cpp
 * @brief Entry point for the keyscan command line tool
 *
 * @note Exit codes: 0 success, 1 usage, 2 configuration error, 3 I/O error.
 */

#include "keyscan/cli.hpp"

int main(int argc, char *argv[]) { return keyscan::run_cli(argc, argv); }
