/**
 * @file main.cpp
 * @brief x12_delimiters CLI executable entrypoint
 *
 * Reports the delimiters declared by the ISA header of an X12 interchange.
 *
 * Usage:
 *   x12_delimiters [OPTIONS] [FILE]        Inspect FILE (or stdin)
 *   x12_delimiters --help                  Show help message
 *   x12_delimiters --version               Show version information
 */

#include "edi/x12/app/cli.h"

#include <cstdlib>
#include <iostream>

int main(int argc, char* argv[]) {
    using namespace edi::x12::app;

    auto opts = parse_args(argc, argv);
    return run(opts, std::getenv(LOG_LEVEL_ENV), std::cin, std::cout, std::cerr);
}
