#include "test_utils.h"
#include "../src/cli.hpp"
#include "../src/memory_validator.hpp"
#include "../src/types.hpp"
#include <sstream>
#include <string>
#include <vector>

using namespace TestUtils;

namespace {

ParseResult parse(std::vector<std::string> args) {
    args.insert(args.begin(), "mmsolve");
    std::vector<char*> argv;
    for (std::string& a : args) {
        argv.push_back(&a[0]);
    }
    return parse_args(static_cast<int>(argv.size()), argv.data());
}

} // namespace

bool test_full_command_line() {
    ParseResult r = parse({"--seed=00ff", "--precision=int8", "--size=8x32x4",
                           "--output=out/r.json", "--verify", "--no-cache", "--force-scalar"});
    TEST_CHECK(r.success);
    TEST_CHECK(r.config.seed_hex == "00ff");
    TEST_CHECK(r.config.precision == Precision::INT8);
    TEST_CHECK(r.config.shape.M == 8 && r.config.shape.K == 32 && r.config.shape.N == 4);
    TEST_CHECK(r.config.output_path == "out/r.json");
    TEST_CHECK(r.config.verify && r.config.no_cache && r.config.force_scalar);
    return true;
}

bool test_defaults() {
    ParseResult r = parse({"--seed=", "--precision=u8i8"});
    TEST_CHECK(r.success);
    TEST_CHECK(r.config.seed_set && r.config.seed_hex.empty());
    TEST_CHECK(r.config.shape.M == 16 && r.config.shape.K == 50240 && r.config.shape.N == 16);
    TEST_CHECK(r.config.output_path == "outputs/output.json");
    TEST_CHECK(!r.config.verify && !r.config.no_cache && !r.config.force_scalar);
    return true;
}

bool test_missing_required() {
    ParseResult no_seed = parse({"--precision=fp32"});
    TEST_CHECK(!no_seed.success);
    TEST_CHECK(no_seed.error_message.find("--seed") != std::string::npos);

    ParseResult no_precision = parse({"--seed=ab"});
    TEST_CHECK(!no_precision.success);
    TEST_CHECK(no_precision.error_message.find("--precision") != std::string::npos);
    return true;
}

bool test_bad_values() {
    TEST_CHECK(!parse({"--seed=ab", "--precision=fp64"}).success);
    TEST_CHECK(!parse({"--seed=ab", "--precision=fp32", "--size=16x16"}).success);
    TEST_CHECK(!parse({"--seed=ab", "--precision=fp32", "--size=0x4x4"}).success);
    TEST_CHECK(!parse({"--seed=ab", "--precision=fp32", "--output="}).success);
    TEST_CHECK(!parse({"--seed=ab", "--precision=fp32", "--threads=4"}).success);

    ParseResult huge = parse({"--seed=ab", "--precision=fp32",
                              "--size=4294967296x4294967296x4294967296"});
    TEST_CHECK(!huge.success);
    TEST_CHECK(huge.error_message.find("overflow") != std::string::npos);
    return true;
}

bool test_info_flags() {
    TEST_CHECK(parse({"--help"}).show_help);
    TEST_CHECK(parse({"-h"}).show_help);
    TEST_CHECK(parse({"--version"}).show_version);
    TEST_CHECK(parse({"--info"}).show_info);
    return true;
}

bool test_shape_parse() {
    MatmulShape s = MatmulShape::parse("16x50240x16");
    TEST_CHECK(s.M == 16 && s.K == 50240 && s.N == 16);
    TEST_CHECK(s.to_string() == "16x50240x16");
    TEST_CHECK(s.total_elements() == 16 * 50240 + 50240 * 16 + 16 * 16);

    const char* bad[] = {"", "16", "16x16", "axbxc", "1x2x3x", "1,2,3"};
    for (const char* text : bad) {
        try {
            MatmulShape::parse(text);
            return false;
        } catch (const std::invalid_argument&) {
        }
    }
    return true;
}

bool test_precision_names() {
    const Precision all[] = {Precision::FP32, Precision::FP16, Precision::INT8, Precision::U8I8};
    for (Precision p : all) {
        TEST_CHECK(string_to_precision(precision_to_string(p)) == p);
    }
    try {
        string_to_precision("FP32");
        return false;
    } catch (const SolverError& e) {
        TEST_CHECK(e.kind() == ErrorKind::UnsupportedPrecision);
        TEST_CHECK(std::string(e.what()) == "Unsupported precision: FP32");
    }
    return true;
}

bool test_memory_estimate() {
    MatmulShape shape = {16, 50240, 16};
    const size_t elements = 16 * 50240 + 50240 * 16 + 16 * 16;
    const size_t expected = elements * 4 + (16 * 50240 + 50240 * 16) + 50240 * 16 * 4;
    TEST_CHECK(MemoryValidator::estimate_required_memory(shape) == expected);

    MemoryRequirement req = MemoryValidator::validate(shape);
    TEST_CHECK(req.required_bytes == expected);
    TEST_CHECK(req.sufficient || req.available_bytes < expected);

    TEST_CHECK(MemoryValidator::format_bytes(1536) == "1.50 KB");
    return true;
}

bool test_memory_reporting() {
    TEST_CHECK(MemoryValidator::format_bytes(0) == "0 B");
    TEST_CHECK(MemoryValidator::format_bytes(1023) == "1023 B");
    TEST_CHECK(MemoryValidator::format_bytes(1024) == "1.00 KB");
    TEST_CHECK(MemoryValidator::format_bytes(5u * 1024 * 1024) == "5.00 MB");
    TEST_CHECK(MemoryValidator::format_bytes(size_t(3) << 30) == "3.00 GB");

    std::istringstream meminfo("MemTotal:       16000000 kB\n"
                               "MemFree:         1000000 kB\n"
                               "MemAvailable:    8000000 kB\n");
    TEST_CHECK(MemoryValidator::parse_mem_available(meminfo) == size_t(8000000) * 1024);
    std::istringstream no_available("MemTotal: 16000000 kB\nMemFree: 1000 kB\n");
    TEST_CHECK(MemoryValidator::parse_mem_available(no_available) == 0);
    std::istringstream garbled("MemAvailable: lots\n");
    TEST_CHECK(MemoryValidator::parse_mem_available(garbled) == 0);

    MemoryRequirement short_req = {2048, 1024, false};
    TEST_CHECK(short_req.to_string() == "2.00 KB needed, 1.00 KB available (insufficient)");
    MemoryRequirement unknown = {2048, 0, true};
    TEST_CHECK(unknown.to_string() == "2.00 KB needed, available memory unknown (ok)");
    return true;
}

int main() {
    TestRunner runner("CLI and Configuration Tests");

    runner.run_test("Full command line", test_full_command_line());
    runner.run_test("Defaults", test_defaults());
    runner.run_test("Missing required options", test_missing_required());
    runner.run_test("Bad option values", test_bad_values());
    runner.run_test("Help, version and info flags", test_info_flags());
    runner.run_test("Shape parsing", test_shape_parse());
    runner.run_test("Precision names", test_precision_names());
    runner.run_test("Memory estimate", test_memory_estimate());
    runner.run_test("Memory reporting", test_memory_reporting());

    runner.print_summary();
    return runner.all_passed() ? 0 : 1;
}
