#ifndef EDI_X12_APP_CLI_H
#define EDI_X12_APP_CLI_H

/**
 * @file cli.h
 * @brief Command line front end of the x12_delimiters executable
 *
 * Argument parsing, log level resolution and the inspect-and-print run are
 * kept here so that main() only wires them to the process streams and
 * environment.
 */

#include "edi/x12/integration/logger_adapter.h"
#include "edi/x12/protocol/isa_inspector.h"

#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>

namespace edi::x12::app {

inline constexpr std::string_view VERSION = "0.1.0";
inline constexpr std::string_view PROGRAM_NAME = "x12_delimiters";

/** Environment variable holding the default log level */
inline constexpr const char* LOG_LEVEL_ENV = "X12_DELIMITERS_LOG_LEVEL";

/** Level used when neither the environment nor --log-level names one */
inline constexpr integration::log_level DEFAULT_LOG_LEVEL =
    integration::log_level::warning;

/**
 * @brief Parsed command line
 *
 * An empty input_path means standard input.
 */
struct cli_options {
    std::optional<std::filesystem::path> input_path;
    inspector_options inspector;
    std::optional<integration::log_level> level;
    bool show_help = false;
    bool show_version = false;
    bool valid = true;
    std::string error_message;
};

/**
 * @brief Parse argv (argv[0] is the program name)
 *
 * Stops at the first -h/--help or -v/--version. Unknown options, a missing
 * or unknown --log-level value and more than one input (a path or "-") mark
 * the result invalid with an error_message.
 */
[[nodiscard]] cli_options parse_args(int argc, const char* const argv[]);

void print_usage(std::ostream& out);

void print_version(std::ostream& out);

/**
 * @brief Set the global logger level
 *
 * Precedence: --log-level, then env_level, then DEFAULT_LOG_LEVEL. An
 * unrecognised env_level is reported as a warning and ignored.
 *
 * @param opts Parsed command line
 * @param env_level Value of LOG_LEVEL_ENV, or nullptr when unset
 * @return The level that was applied
 */
integration::log_level configure_logging(const cli_options& opts,
                                         const char* env_level);

/**
 * @brief Execute a parsed command line
 *
 * Configures logging, reads the header from the input file or in, inspects
 * it and prints the report to out. Diagnostics go to err.
 *
 * @return EXIT_SUCCESS, or EXIT_FAILURE on a usage, I/O, extraction or
 *         strict-mode failure
 */
[[nodiscard]] int run(const cli_options& opts,
                      const char* env_level,
                      std::istream& in,
                      std::ostream& out,
                      std::ostream& err);

}  // namespace edi::x12::app

#endif  // EDI_X12_APP_CLI_H
