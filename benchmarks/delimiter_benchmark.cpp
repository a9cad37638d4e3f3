/**
 * @file delimiter_benchmark.cpp
 * @brief Micro-benchmarks for X12 delimiter extraction
 *
 * Measures the per-call cost of:
 * - default and explicit construction
 * - extraction from standard and alternative ISA headers
 * - accessors
 * - are_valid() on valid and ambiguous sets
 */

#include "edi/x12/protocol/delimiters.h"

#include <chrono>
#include <cstdint>
#include <expected>
#include <iomanip>
#include <iostream>
#include <string>
#include <string_view>

namespace edi::x12::benchmark {

// =============================================================================
// Test Utilities
// =============================================================================

#define TEST_ASSERT(condition, message)                                        \
    do {                                                                       \
        if (!(condition)) {                                                    \
            std::cerr << "FAILED: " << message << " at " << __FILE__ << ":"   \
                      << __LINE__ << std::endl;                                \
            return false;                                                      \
        }                                                                      \
    } while (0)

#define RUN_TEST(test_func)                                                    \
    do {                                                                       \
        std::cout << "Running " << #test_func << "..." << std::endl;           \
        auto start = std::chrono::high_resolution_clock::now();                \
        if (test_func()) {                                                     \
            auto end = std::chrono::high_resolution_clock::now();              \
            auto duration =                                                    \
                std::chrono::duration_cast<std::chrono::milliseconds>(         \
                    end - start);                                              \
            std::cout << "  PASSED (" << duration.count() << "ms)"            \
                      << std::endl;                                            \
            passed++;                                                          \
        } else {                                                               \
            std::cout << "  FAILED" << std::endl;                              \
            failed++;                                                          \
        }                                                                      \
    } while (0)

constexpr std::size_t ITERATIONS = 1'000'000;

constexpr std::string_view SAMPLE_ISA_SEGMENT =
    "ISA*00*          *00*          *ZZ*SENDERID       *ZZ*RECEIVERID     "
    "*250403*0856*U*00501*000000001*0*P*:~";

constexpr std::string_view SAMPLE_ISA_ALT =
    "ISA^00^          ^00^          ^ZZ^SENDERID       ^ZZ^RECEIVERID     "
    "^250403^0856^U^00401^000000002^1^T^>}";

// Results are folded into a volatile sink so the measured calls are kept
volatile unsigned g_sink = 0;

void do_not_optimize(char value) {
    g_sink = g_sink + static_cast<unsigned char>(value);
}

void do_not_optimize(bool value) {
    g_sink = g_sink + (value ? 1u : 0u);
}

void do_not_optimize(const delimiters& value) {
    do_not_optimize(value.segment_terminator());
    do_not_optimize(value.element_separator());
    do_not_optimize(value.sub_element_separator());
}

void do_not_optimize(const std::expected<delimiters, x12_error>& value) {
    if (value) {
        do_not_optimize(*value);
    } else {
        g_sink = g_sink + static_cast<unsigned>(-to_error_code(value.error()));
    }
}

/**
 * @brief Average nanoseconds per call over ITERATIONS calls
 */
template <typename Func>
double measure_ns(Func&& func) {
    auto start = std::chrono::steady_clock::now();
    for (std::size_t i = 0; i < ITERATIONS; ++i) {
        func();
    }
    auto end = std::chrono::steady_clock::now();
    auto total = std::chrono::duration_cast<std::chrono::nanoseconds>(end - start);
    return static_cast<double>(total.count()) / static_cast<double>(ITERATIONS);
}

void print_measurement(std::string_view label, double ns) {
    std::cout << "    " << std::left << std::setw(28) << label << " | "
              << std::right << std::setw(8) << std::fixed
              << std::setprecision(2) << ns << " ns/op" << std::endl;
}

// =============================================================================
// Benchmarks
// =============================================================================

bool bench_default() {
    auto ns = measure_ns([] { do_not_optimize(delimiters::default_delimiters()); });
    print_measurement("delimiters::default", ns);
    TEST_ASSERT(delimiters::default_delimiters().are_valid(),
                "default delimiters should be valid");
    return true;
}

bool bench_new() {
    volatile char segment = '~';
    volatile char element = '*';
    volatile char sub_element = ':';

    auto ns = measure_ns([&] {
        do_not_optimize(delimiters(segment, element, sub_element));
    });
    print_measurement("delimiters::delimiters", ns);
    return true;
}

bool bench_from_isa_standard() {
    const std::string input(SAMPLE_ISA_SEGMENT);

    auto ns = measure_ns([&] { do_not_optimize(delimiters::from_isa(input)); });
    print_measurement("from_isa_standard", ns);

    auto result = delimiters::from_isa(input);
    TEST_ASSERT(result.has_value(), "standard header should extract");
    TEST_ASSERT(*result == delimiters('~', '*', ':'),
                "standard header should yield ~ * :");
    return true;
}

bool bench_from_isa_alternative() {
    const std::string input(SAMPLE_ISA_ALT);

    auto ns = measure_ns([&] { do_not_optimize(delimiters::from_isa(input)); });
    print_measurement("from_isa_alternative", ns);

    auto result = delimiters::from_isa(input);
    TEST_ASSERT(result.has_value(), "alternative header should extract");
    TEST_ASSERT(*result == delimiters('}', '^', '>'),
                "alternative header should yield } ^ >");
    return true;
}

bool bench_getters() {
    volatile char segment = '~';
    const delimiters d(segment, '*', ':');

    auto ns = measure_ns([&] {
        do_not_optimize(d.segment_terminator());
        do_not_optimize(d.element_separator());
        do_not_optimize(d.sub_element_separator());
    });
    print_measurement("delimiters_getters", ns);
    return true;
}

bool bench_are_valid() {
    volatile char segment = '~';
    const delimiters valid(segment, '*', ':');
    const delimiters invalid(segment, '~', ':');

    print_measurement("are_valid/valid",
                      measure_ns([&] { do_not_optimize(valid.are_valid()); }));
    print_measurement("are_valid/invalid",
                      measure_ns([&] { do_not_optimize(invalid.are_valid()); }));

    TEST_ASSERT(valid.are_valid(), "distinct set should be valid");
    TEST_ASSERT(!invalid.are_valid(), "duplicate set should be invalid");
    return true;
}

}  // namespace edi::x12::benchmark

// =============================================================================
// Main
// =============================================================================

int main() {
    using namespace edi::x12::benchmark;

    std::cout << "=============================================" << std::endl;
    std::cout << "X12 Delimiter Benchmarks" << std::endl;
    std::cout << "=============================================" << std::endl;

    int passed = 0;
    int failed = 0;

    std::cout << "\n--- Construction ---" << std::endl;
    RUN_TEST(bench_default);
    RUN_TEST(bench_new);

    std::cout << "\n--- ISA Extraction ---" << std::endl;
    RUN_TEST(bench_from_isa_standard);
    RUN_TEST(bench_from_isa_alternative);

    std::cout << "\n--- Queries ---" << std::endl;
    RUN_TEST(bench_getters);
    RUN_TEST(bench_are_valid);

    std::cout << "\n=============================================" << std::endl;
    std::cout << "Results: " << passed << " passed, " << failed << " failed"
              << std::endl;
    std::cout << "=============================================" << std::endl;

    return failed > 0 ? 1 : 0;
}
