/**
 * @file cli.cpp
 * @brief x12_delimiters command line front end
 */

#include "edi/x12/app/cli.h"

#include <cstdlib>
#include <istream>
#include <ostream>

namespace edi::x12::app {

namespace {

void print_character(std::ostream& out, std::string_view label, char c) {
    auto code = static_cast<unsigned>(static_cast<unsigned char>(c));
    out << "  " << label << ": ";
    if (code >= 0x21 && code <= 0x7E) {
        out << "'" << c << "' ";
    }
    out << "(0x" << std::hex << code << std::dec << ")\n";
}

}  // namespace

cli_options parse_args(int argc, const char* const argv[]) {
    cli_options opts;
    bool has_input = false;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            opts.show_help = true;
            return opts;
        }

        if (arg == "-v" || arg == "--version") {
            opts.show_version = true;
            return opts;
        }

        if (arg == "--require-isa") {
            opts.inspector.require_isa_tag = true;
            continue;
        }

        if (arg == "--strict") {
            opts.inspector.require_valid_delimiters = true;
            continue;
        }

        if (arg == "--log-level") {
            if (i + 1 >= argc) {
                opts.valid = false;
                opts.error_message = "Missing argument for --log-level";
                return opts;
            }
            std::string_view value = argv[++i];
            opts.level = integration::parse_log_level(value);
            if (!opts.level) {
                opts.valid = false;
                opts.error_message = "Unknown log level: " + std::string(value);
                return opts;
            }
            continue;
        }

        if (arg.size() > 1 && arg.front() == '-') {
            opts.valid = false;
            opts.error_message = "Unknown argument: " + std::string(arg);
            return opts;
        }

        if (has_input) {
            opts.valid = false;
            opts.error_message = "Only one input file may be given";
            return opts;
        }
        has_input = true;

        if (arg != "-") {
            opts.input_path = std::filesystem::path(arg);
        }
    }

    return opts;
}

void print_version(std::ostream& out) {
    out << PROGRAM_NAME << " version " << VERSION << "\n";
    out << "X12 interchange delimiter extractor\n";
}

void print_usage(std::ostream& out) {
    out << "Usage: " << PROGRAM_NAME << " [OPTIONS] [FILE]\n\n";
    out << "Reads the ISA header of an X12 interchange and prints its\n";
    out << "segment terminator, element separator and sub-element separator.\n";
    out << "Reads standard input when FILE is omitted or '-'.\n\n";
    out << "Options:\n";
    out << "      --require-isa      Fail unless the header starts with ISA\n";
    out << "      --strict           Fail when delimiters are not distinct\n";
    out << "      --log-level <lvl>  trace, debug, info, warning, error, critical\n";
    out << "  -h, --help             Show this help message\n";
    out << "  -v, --version          Show version information\n";
    out << "\n";
    out << "Environment:\n";
    out << "  " << LOG_LEVEL_ENV << "  Default log level (overridden by --log-level)\n";
}

integration::log_level configure_logging(const cli_options& opts,
                                         const char* env_level) {
    auto logger = integration::get_logger();
    auto level = DEFAULT_LOG_LEVEL;

    if (env_level != nullptr) {
        if (auto parsed = integration::parse_log_level(env_level)) {
            level = *parsed;
        } else {
            logger->warning(std::string("Ignoring unknown ") + LOG_LEVEL_ENV +
                            " value: " + env_level);
        }
    }

    if (opts.level) {
        level = *opts.level;
    }

    logger->set_level(level);
    return level;
}

int run(const cli_options& opts,
        const char* env_level,
        std::istream& in,
        std::ostream& out,
        std::ostream& err) {
    if (!opts.valid) {
        err << "Error: " << opts.error_message << "\n\n";
        print_usage(err);
        return EXIT_FAILURE;
    }

    if (opts.show_version) {
        print_version(out);
        return EXIT_SUCCESS;
    }

    if (opts.show_help) {
        print_usage(out);
        return EXIT_SUCCESS;
    }

    configure_logging(opts, env_level);

    isa_inspector inspector(opts.inspector);

    auto header = opts.input_path ? inspector.read_header(*opts.input_path)
                                  : inspector.read_header(in);
    if (header.is_err()) {
        const auto& error = header.error();
        err << "Error: " << error.message;
        if (error.details) {
            err << ": " << *error.details;
        }
        err << "\n";
        return EXIT_FAILURE;
    }

    auto report = inspector.inspect(header.value());
    if (!report) {
        err << "Error: " << to_string(report.error()) << "\n";
        return EXIT_FAILURE;
    }

    out << "Delimiters:\n";
    print_character(out, "segment terminator   ", report->found.segment_terminator());
    print_character(out, "element separator    ", report->found.element_separator());
    print_character(out, "sub-element separator", report->found.sub_element_separator());
    out << "ISA tag:  " << (report->has_isa_tag ? "present" : "missing") << "\n";
    out << "Distinct: " << (report->delimiters_valid ? "yes" : "no") << "\n";

    integration::get_logger()->flush();
    return EXIT_SUCCESS;
}

}  // namespace edi::x12::app
