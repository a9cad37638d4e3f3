/**
 * @file cli_test.cpp
 * @brief Unit tests for the x12_delimiters command line front end
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "edi/x12/app/cli.h"
#include "edi/x12/integration/logger_adapter.h"

#include "test_helpers.h"

#include <cstdlib>
#include <initializer_list>
#include <sstream>
#include <string>
#include <vector>

namespace edi::x12::app {
namespace {

using namespace ::testing;
using namespace edi::x12::test;

cli_options parse(std::initializer_list<const char*> args) {
    std::vector<const char*> argv{"x12_delimiters"};
    argv.insert(argv.end(), args);
    return parse_args(static_cast<int>(argv.size()), argv.data());
}

class CliTest : public x12_test {
protected:
    void TearDown() override {
        integration::reset_default_logger();
        x12_test::TearDown();
    }

    /** Parse args and run against the given stdin contents */
    int run_cli(std::initializer_list<const char*> args,
                std::string_view stdin_contents = {},
                const char* env_level = "critical") {
        auto opts = parse(args);
        std::istringstream in{std::string(stdin_contents)};
        out_.str(std::string());
        err_.str(std::string());
        return run(opts, env_level, in, out_, err_);
    }

    std::ostringstream out_;
    std::ostringstream err_;
};

// =============================================================================
// parse_args()
// =============================================================================

TEST_F(CliTest, NoArgumentsReadsStdin) {
    auto opts = parse({});

    EXPECT_TRUE(opts.valid);
    EXPECT_FALSE(opts.input_path.has_value());
    EXPECT_FALSE(opts.inspector.require_isa_tag);
    EXPECT_FALSE(opts.inspector.require_valid_delimiters);
    EXPECT_FALSE(opts.level.has_value());
}

TEST_F(CliTest, DashMeansStdin) {
    auto opts = parse({"-"});

    EXPECT_TRUE(opts.valid);
    EXPECT_FALSE(opts.input_path.has_value());
}

TEST_F(CliTest, ParsesFlagsAndPath) {
    auto opts = parse({"--require-isa", "--strict", "--log-level", "DEBUG",
                       "interchange.x12"});

    ASSERT_TRUE(opts.valid) << opts.error_message;
    EXPECT_TRUE(opts.inspector.require_isa_tag);
    EXPECT_TRUE(opts.inspector.require_valid_delimiters);
    EXPECT_EQ(opts.level, integration::log_level::debug);
    ASSERT_TRUE(opts.input_path.has_value());
    EXPECT_EQ(*opts.input_path, std::filesystem::path("interchange.x12"));
}

TEST_F(CliTest, HelpAndVersionStopParsing) {
    EXPECT_TRUE(parse({"--help", "--bogus"}).show_help);
    EXPECT_TRUE(parse({"-h"}).show_help);
    EXPECT_TRUE(parse({"--version", "--bogus"}).show_version);
    EXPECT_TRUE(parse({"-v"}).show_version);
}

TEST_F(CliTest, RejectsUnknownArgument) {
    auto opts = parse({"--frobnicate"});

    EXPECT_FALSE(opts.valid);
    EXPECT_THAT(opts.error_message, HasSubstr("--frobnicate"));
}

TEST_F(CliTest, RejectsSecondInput) {
    EXPECT_FALSE(parse({"a.x12", "b.x12"}).valid);
    EXPECT_FALSE(parse({"a.x12", "-"}).valid);
    EXPECT_FALSE(parse({"-", "b.x12"}).valid);
}

TEST_F(CliTest, RejectsMissingOrUnknownLogLevel) {
    auto missing = parse({"--log-level"});
    EXPECT_FALSE(missing.valid);
    EXPECT_THAT(missing.error_message, HasSubstr("--log-level"));

    auto unknown = parse({"--log-level", "verbose"});
    EXPECT_FALSE(unknown.valid);
    EXPECT_THAT(unknown.error_message, HasSubstr("verbose"));
}

// =============================================================================
// configure_logging()
// =============================================================================

TEST_F(CliTest, LogLevelDefaultsToWarning) {
    EXPECT_EQ(configure_logging(parse({}), nullptr), DEFAULT_LOG_LEVEL);
    EXPECT_EQ(integration::get_logger()->get_level(),
              integration::log_level::warning);
}

TEST_F(CliTest, EnvironmentSetsLogLevel) {
    EXPECT_EQ(configure_logging(parse({}), "error"),
              integration::log_level::error);
    EXPECT_EQ(integration::get_logger()->get_level(),
              integration::log_level::error);
}

TEST_F(CliTest, FlagOverridesEnvironment) {
    auto opts = parse({"--log-level", "critical"});

    EXPECT_EQ(configure_logging(opts, "trace"), integration::log_level::critical);
    EXPECT_EQ(integration::get_logger()->get_level(),
              integration::log_level::critical);
}

TEST_F(CliTest, UnknownEnvironmentValueIgnored) {
    auto opts = parse({"--log-level", "critical"});
    EXPECT_EQ(configure_logging(opts, "loud"), integration::log_level::critical);

    // Keep the warning about "loud" out of the test output
    integration::get_logger()->set_level(integration::log_level::critical);
    EXPECT_EQ(configure_logging(parse({}), "loud"), DEFAULT_LOG_LEVEL);
}

// =============================================================================
// run()
// =============================================================================

TEST_F(CliTest, PrintsDelimitersFromStdin) {
    EXPECT_EQ(run_cli({}, isa_samples::STANDARD), EXIT_SUCCESS);

    auto output = out_.str();
    EXPECT_THAT(output, HasSubstr("segment terminator   : '~' (0x7e)"));
    EXPECT_THAT(output, HasSubstr("element separator    : '*' (0x2a)"));
    EXPECT_THAT(output, HasSubstr("sub-element separator: ':' (0x3a)"));
    EXPECT_THAT(output, HasSubstr("ISA tag:  present"));
    EXPECT_THAT(output, HasSubstr("Distinct: yes"));
    EXPECT_TRUE(err_.str().empty());
}

TEST_F(CliTest, DashReadsStdin) {
    EXPECT_EQ(run_cli({"-"}, isa_samples::ALTERNATIVE), EXIT_SUCCESS);
    EXPECT_THAT(out_.str(), HasSubstr("segment terminator   : '}'"));
}

TEST_F(CliTest, ReadsFileArgument) {
    temp_file file("cli_input.x12", isa_samples::ALTERNATIVE);
    auto path = file.path().string();

    EXPECT_EQ(run_cli({path.c_str()}, isa_samples::STANDARD), EXIT_SUCCESS);
    EXPECT_THAT(out_.str(), HasSubstr("element separator    : '^'"));
}

TEST_F(CliTest, UsageErrorExitsWithFailure) {
    EXPECT_EQ(run_cli({"--frobnicate"}), EXIT_FAILURE);
    EXPECT_THAT(err_.str(), HasSubstr("Unknown argument: --frobnicate"));
    EXPECT_THAT(err_.str(), HasSubstr("Usage:"));
    EXPECT_TRUE(out_.str().empty());
}

TEST_F(CliTest, HelpAndVersionSucceed) {
    EXPECT_EQ(run_cli({"--help"}), EXIT_SUCCESS);
    EXPECT_THAT(out_.str(), HasSubstr("Usage: x12_delimiters"));

    EXPECT_EQ(run_cli({"--version"}), EXIT_SUCCESS);
    EXPECT_THAT(out_.str(), HasSubstr("version 0.1.0"));
}

TEST_F(CliTest, MissingFileExitsWithFailure) {
    auto path = (std::filesystem::temp_directory_path() /
                 "edi_x12_cli_missing.x12").string();

    EXPECT_EQ(run_cli({path.c_str()}), EXIT_FAILURE);
    EXPECT_THAT(err_.str(), HasSubstr("edi_x12_cli_missing.x12"));
    EXPECT_TRUE(out_.str().empty());
}

TEST_F(CliTest, ShortHeaderExitsWithFailure) {
    EXPECT_EQ(run_cli({}, isa_samples::TOO_SHORT), EXIT_FAILURE);
    EXPECT_THAT(err_.str(), HasSubstr("106 bytes"));
    EXPECT_TRUE(out_.str().empty());
}

TEST_F(CliTest, MissingTagOnlyFailsWithRequireIsa) {
    std::string header(isa_samples::STANDARD);
    header.replace(0, 3, "GS*");

    EXPECT_EQ(run_cli({}, header), EXIT_SUCCESS);
    EXPECT_THAT(out_.str(), HasSubstr("ISA tag:  missing"));

    EXPECT_EQ(run_cli({"--require-isa"}, header), EXIT_FAILURE);
    EXPECT_FALSE(err_.str().empty());
}

TEST_F(CliTest, AmbiguousDelimitersOnlyFailWhenStrict) {
    auto header = make_isa_header('*', ':', '*');

    EXPECT_EQ(run_cli({}, header), EXIT_SUCCESS);
    EXPECT_THAT(out_.str(), HasSubstr("Distinct: no"));

    EXPECT_EQ(run_cli({"--strict"}, header), EXIT_FAILURE);
    EXPECT_FALSE(err_.str().empty());
}

TEST_F(CliTest, RunAppliesLogLevelPrecedence) {
    EXPECT_EQ(run_cli({"--log-level", "critical"}, isa_samples::STANDARD, "debug"),
              EXIT_SUCCESS);
    EXPECT_EQ(integration::get_logger()->get_level(),
              integration::log_level::critical);
}

}  // namespace
}  // namespace edi::x12::app
