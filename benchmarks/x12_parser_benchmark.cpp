/**
 * @file x12_parser_benchmark.cpp
 * @brief Throughput benchmarks for X12 parsing and serialization
 *
 * Measures:
 * - Tokenization of a large interchange
 * - Strict vs. loose parsing of the same document
 * - Serialization of the parsed tree
 */

#include "edi/x12/integration/logger_adapter.h"
#include "edi/x12/protocol/x12/x12_parser.h"
#include "edi/x12/protocol/x12/x12_tokenizer.h"

#include <chrono>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>

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

// =============================================================================
// Workload
// =============================================================================

constexpr size_t TRANSACTIONS_PER_GROUP = 500;
constexpr size_t LINE_ITEMS_PER_TRANSACTION = 20;

/**
 * @brief Build one interchange with a group of purchase orders
 */
std::string build_interchange() {
    std::string doc =
        "ISA*00*          *00*          *ZZ*SENDERISA      *14*0073268795005  "
        "*020226*1534*U*00401*000000001*0*T*>~"
        "GS*PO*SENDERGS*007326879*20020226*1534*1*X*004010~";

    for (size_t t = 0; t < TRANSACTIONS_PER_GROUP; ++t) {
        std::ostringstream control;
        control << std::setw(4) << std::setfill('0') << (t + 1);

        std::ostringstream txn;
        txn << "ST*850*" << control.str() << "~";
        txn << "BEG*00*SA*PO-" << (t + 1) << "**20020226~";
        for (size_t i = 0; i < LINE_ITEMS_PER_TRANSACTION; ++i) {
            txn << "PO1*" << (i + 1) << "*10*EA*9.95**VP*SKU-" << t << ">"
                << i << "~";
        }
        txn << "CTT*" << LINE_ITEMS_PER_TRANSACTION << "~";
        txn << "SE*" << (LINE_ITEMS_PER_TRANSACTION + 4) << "*"
            << control.str() << "~";
        doc += txn.str();
    }

    doc += "GE*" + std::to_string(TRANSACTIONS_PER_GROUP) + "*1~";
    doc += "IEA*1*000000001~";
    return doc;
}

struct throughput_result {
    std::string label;
    size_t iterations;
    size_t bytes;
    std::chrono::nanoseconds total;

    void print() const {
        double seconds = static_cast<double>(total.count()) / 1e9;
        double mb_per_s = seconds > 0
                              ? (static_cast<double>(bytes) * iterations) /
                                    (1024.0 * 1024.0) / seconds
                              : 0.0;
        std::cout << "    " << std::left << std::setw(24) << label << " | "
                  << std::right << std::setw(10) << std::fixed
                  << std::setprecision(0)
                  << static_cast<double>(total.count()) / iterations << " ns"
                  << " | " << std::setw(8) << std::setprecision(1) << mb_per_s
                  << " MB/s" << std::endl;
    }
};

template <typename Func>
throughput_result measure(std::string label, size_t iterations, size_t bytes,
                          Func&& func) {
    auto start = std::chrono::steady_clock::now();
    for (size_t i = 0; i < iterations; ++i) {
        func();
    }
    auto total = std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::steady_clock::now() - start);
    return {std::move(label), iterations, bytes, total};
}

// =============================================================================
// Benchmarks
// =============================================================================

bool test_tokenize_throughput() {
    const auto doc = build_interchange();
    const size_t iterations = 50;

    bool ok = true;
    auto result = measure("tokenize", iterations, doc.size(), [&] {
        auto segments = tokenize(doc);
        ok = ok && segments.has_value();
    });
    TEST_ASSERT(ok, "Tokenization should succeed");

    result.print();
    return true;
}

bool test_parse_strict_vs_loose() {
    const auto doc = build_interchange();
    const size_t iterations = 50;

    x12_parser strict_parser;
    x12_parser loose_parser(
        parser_options{.strict_envelope_validation = false});

    bool ok = true;
    auto strict = measure("parse (strict)", iterations, doc.size(), [&] {
        auto parsed = strict_parser.parse(doc);
        ok = ok && parsed.has_value() &&
             parsed->transaction_count() == TRANSACTIONS_PER_GROUP;
    });
    TEST_ASSERT(ok, "Strict parse should succeed");

    auto loose = measure("parse (loose)", iterations, doc.size(), [&] {
        auto parsed = loose_parser.parse(doc);
        ok = ok && parsed.has_value();
    });
    TEST_ASSERT(ok, "Loose parse should succeed");

    strict.print();
    loose.print();
    return true;
}

bool test_serialize_throughput() {
    const auto doc = build_interchange();
    const size_t iterations = 50;

    auto parsed = parse(doc);
    TEST_ASSERT(parsed.has_value(), "Parse should succeed");

    bool ok = true;
    auto result = measure("serialize", iterations, doc.size(), [&] {
        ok = ok && parsed->to_x12_string().size() == doc.size();
    });
    TEST_ASSERT(ok, "Serialization should reproduce the input size");

    result.print();
    return true;
}

}  // namespace edi::x12::benchmark

// =============================================================================
// Main
// =============================================================================

int main() {
    using namespace edi::x12::benchmark;

    // Keep per-parse debug logging out of the measurements
    edi::x12::integration::get_logger().set_level(
        edi::x12::integration::log_level::warning);

    std::cout << "=============================================" << std::endl;
    std::cout << "X12 EDI Parser Benchmarks" << std::endl;
    std::cout << "=============================================" << std::endl;

    int passed = 0;
    int failed = 0;

    std::cout << "\n--- Throughput ---" << std::endl;
    RUN_TEST(test_tokenize_throughput);
    RUN_TEST(test_parse_strict_vs_loose);
    RUN_TEST(test_serialize_throughput);

    std::cout << "\n=============================================" << std::endl;
    std::cout << "Results: " << passed << " passed, " << failed << " failed"
              << std::endl;
    std::cout << "=============================================" << std::endl;

    return failed > 0 ? 1 : 0;
}
