/**
 * @file main.cpp
 * @brief media-sanitizer command-line entry point
 *
 * Exit status follows cli::ExitCode.
 */

#include "cli/CliApplication.hpp"

auto main(int argc, char* argv[]) -> int {
    return cli::CliApplication{}.run(argc, argv);
}
