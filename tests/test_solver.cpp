#include "test_utils.h"
#include "../src/matmul_solver.hpp"
#include "../src/operand_cache.hpp"
#include "../src/output_json.hpp"
#include "../src/result_hash.hpp"
#include "../src/seeded_generator.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

using namespace TestUtils;

namespace {

Input make_input(const FlatMatrix& a, const FlatMatrix& b, const std::string& precision) {
    Input input;
    input.matrix_a = a;
    input.matrix_b = b;
    input.precision = precision;
    return input;
}

FlatMatrix small_a() { return FlatMatrix::from_rows({{1.0f, 2.0f}, {3.0f, 4.0f}}); }
FlatMatrix small_b() { return FlatMatrix::from_rows({{5.0f, 6.0f}, {7.0f, 8.0f}}); }

const float kSmallProduct[] = {19.0f, 22.0f, 43.0f, 50.0f};

bool cache_disabled_by_env() {
    const char* env = std::getenv("MMSOLVE_NO_CACHE");
    return env && env[0] != '\0' && env[0] != '0';
}

template<typename Fn>
bool throws_kind(Fn fn, ErrorKind kind, std::string* message = nullptr) {
    try {
        fn();
    } catch (const SolverError& e) {
        if (message) *message = e.what();
        return e.kind() == kind;
    }
    return false;
}

} // namespace

bool test_fp32_exact() {
    Output out = compute(make_input(small_a(), small_b(), "fp32"));
    TEST_CHECK(out.result_matrix.rows == 2 && out.result_matrix.cols == 2);
    for (size_t i = 0; i < 4; ++i) {
        TEST_CHECK(out.result_matrix.data[i] == kSmallProduct[i]);
    }
    TEST_CHECK(out.metadata.precision == "fp32");
    return true;
}

bool test_fp16_close() {
    // Pure-source dispatcher so the half-accumulating kernel runs in every build
    PrecisionDispatcher dispatcher(nullptr, nullptr);
    Output out = compute(make_input(small_a(), small_b(), "fp16"), dispatcher);
    for (size_t i = 0; i < 4; ++i) {
        TEST_CHECK(approx_equal(out.result_matrix.data[i], kSmallProduct[i], 0.1f));
    }
    TEST_CHECK(out.metadata.kernel_path == "fp16/generic-half");

    // The default backend must not change the fp16 answer
    TEST_CHECK(compute(make_input(small_a(), small_b(), "fp16")).result_hash == out.result_hash);
    return true;
}

bool test_int8_close() {
    Output out = compute(make_input(small_a(), small_b(), "int8"));
    for (size_t i = 0; i < 4; ++i) {
        TEST_CHECK(approx_equal(out.result_matrix.data[i], kSmallProduct[i], 1.0f));
    }
    return true;
}

bool test_u8i8_small() {
    // A truncates to u8 and B to i8 without rescaling
    FlatMatrix a = FlatMatrix::from_rows({{1.5f, 300.0f}, {-4.0f, 2.0f}});
    FlatMatrix b = FlatMatrix::from_rows({{-200.0f, 3.0f}, {1.0f, -1.0f}});
    Output out = compute(make_input(a, b, "u8i8"));
    // a -> [[1, 255], [0, 2]], b -> [[-128, 3], [1, -1]]
    const float expected[] = {127.0f, -252.0f, 2.0f, -2.0f};
    for (size_t i = 0; i < 4; ++i) {
        TEST_CHECK(out.result_matrix.data[i] == expected[i]);
    }
    return true;
}

bool test_u8i8_seeded_exact() {
    const size_t M = 16, K = 1000, N = 16;
    MatrixPair pair = generate_seeded_pair_hex("c0ffee", M, K, K, N);
    Output out = compute(make_input(pair.first, pair.second, "u8i8"));
    TEST_CHECK(out.metadata.kernel_path.find("u8i8/microkernel-16x16-") == 0);

    for (size_t i = 0; i < M; ++i) {
        for (size_t j = 0; j < N; ++j) {
            int64_t expected = 0;
            for (size_t k = 0; k < K; ++k) {
                expected += static_cast<int64_t>(pair.first.data[i * K + k]) *
                            static_cast<int64_t>(pair.second.data[k * N + j]);
            }
            TEST_CHECK(out.result_matrix.data[i * N + j] == static_cast<float>(expected));
        }
    }
    return true;
}

bool test_generic_u8i8_exact() {
    // Not a 16x16 output, so the blocked kernel runs
    const size_t M = 5, K = 700, N = 9;
    MatrixPair pair = generate_seeded_pair_hex("beef", M, K, K, N);
    Output out = compute(make_input(pair.first, pair.second, "u8i8"));
    TEST_CHECK(out.metadata.kernel_path == "u8i8/generic-blocked");
    for (size_t i = 0; i < M; ++i) {
        for (size_t j = 0; j < N; ++j) {
            int64_t expected = 0;
            for (size_t k = 0; k < K; ++k) {
                expected += static_cast<int64_t>(pair.first.data[i * K + k]) *
                            static_cast<int64_t>(pair.second.data[k * N + j]);
            }
            TEST_CHECK(out.result_matrix.data[i * N + j] == static_cast<float>(expected));
        }
    }
    return true;
}

bool test_deterministic_runs() {
    MatrixPair pair = generate_seeded_pair_hex("0102", 16, 333, 333, 16);
    const char* precisions[] = {"fp32", "fp16", "int8", "u8i8"};
    for (const char* p : precisions) {
        Input input = make_input(pair.first, pair.second, p);
        const std::string h1 = compute(input).result_hash;
        const std::string h2 = compute(input).result_hash;
        const std::string h3 = compute(input).result_hash;
        TEST_CHECK(h1 == h2 && h2 == h3);
    }
    return true;
}

bool test_microkernel_paths() {
    MatrixPair pair = generate_seeded_pair_hex("aa", 16, 40, 40, 16);
    TEST_CHECK(compute(make_input(pair.first, pair.second, "fp32")).metadata.kernel_path ==
               "fp32/microkernel-16x16");
    TEST_CHECK(compute(make_input(pair.first, pair.second, "fp16")).metadata.kernel_path ==
               "fp16/microkernel-16x16");
    TEST_CHECK(compute(make_input(pair.first, pair.second, "int8")).metadata.kernel_path ==
               "int8/microkernel-16x16");
    return true;
}

bool test_dimension_mismatch() {
    FlatMatrix a = small_a();
    FlatMatrix b = FlatMatrix::from_rows({{1.0f, 2.0f}});
    std::string message;
    TEST_CHECK(throws_kind([&]() { compute(make_input(a, b, "fp32")); },
                           ErrorKind::DimensionMismatch, &message));
    TEST_CHECK(message.find("2x2") != std::string::npos);
    TEST_CHECK(message.find("1x2") != std::string::npos);
    return true;
}

bool test_unsupported_precision() {
    std::string message;
    TEST_CHECK(throws_kind([]() { compute(make_input(small_a(), small_b(), "fp64")); },
                           ErrorKind::UnsupportedPrecision, &message));
    TEST_CHECK(message.find("fp64") != std::string::npos);
    TEST_CHECK(throws_kind([]() { verify(small_a(), small_b(), "bf16", ""); },
                           ErrorKind::UnsupportedPrecision));
    return true;
}

bool test_unsupported_workload() {
    Input input = make_input(small_a(), FlatMatrix::from_rows({{1.0f}}), "fp32");
    input.workload_type = "conv2d";
    std::string message;
    // Workload is rejected before shapes are checked
    TEST_CHECK(throws_kind([&]() { compute(input); }, ErrorKind::UnsupportedWorkload, &message));
    TEST_CHECK(message == "Unsupported workload type: conv2d. Currently only 'matmul' is supported.");
    return true;
}

bool test_verify() {
    MatrixPair pair = generate_seeded_pair_hex("1234", 16, 100, 100, 16);
    const char* precisions[] = {"fp32", "fp16", "int8", "u8i8"};
    for (const char* p : precisions) {
        Output out = compute(make_input(pair.first, pair.second, p));
        TEST_CHECK(verify(pair.first, pair.second, p, out.result_hash));
        TEST_CHECK(!verify(pair.first, pair.second, p, std::string(64, '0')));
    }
    return true;
}

bool test_verify_without_cache() {
    MatrixPair pair = generate_seeded_pair_hex("77", 16, 48, 48, 16);
    Input input = make_input(pair.first, pair.second, "int8");
    InputMetadata meta;
    meta.cache_enabled = false;
    input.metadata = meta;
    Output out = compute(input);

    const OperandCache::Stats before = OperandCache::global().stats();
    TEST_CHECK(verify(pair.first, pair.second, "int8", out.result_hash, false));
    TEST_CHECK(!verify(pair.first, pair.second, "int8", std::string(64, '0'), false));
    const OperandCache::Stats after = OperandCache::global().stats();
    TEST_CHECK(after.hits == before.hits && after.misses == before.misses);
    return true;
}

bool test_metrics() {
    Output out = compute(make_input(small_a(), small_b(), "fp32"));
    const Metrics& m = out.metrics;
    TEST_CHECK(m.latency_ms >= 0.0);
    TEST_CHECK(m.throughput_ops_per_sec == m.ops_per_second);
    TEST_CHECK(m.ops_per_second >= 0.0);
    TEST_CHECK(m.memory_usage_mb == 48.0 / (1024.0 * 1024.0));
    TEST_CHECK(m.kernel_time_ms.has_value());
    TEST_CHECK(*m.kernel_time_ms == m.latency_ms);
    TEST_CHECK(!m.parse_time_ms.has_value());
    TEST_CHECK(!m.serialize_time_ms.has_value());

    TEST_CHECK(matmul_ops(16, 50240, 16) == 16.0 * 50240.0 * 16.0);
    return true;
}

bool test_attach_timing() {
    Output out = compute(make_input(small_a(), small_b(), "fp32"));
    const double kernel = *out.metrics.kernel_time_ms;
    Output timed = attach_timing(out, 1.5, 0.25);
    TEST_CHECK(timed.metrics.parse_time_ms && *timed.metrics.parse_time_ms == 1.5);
    TEST_CHECK(timed.metrics.serialize_time_ms && *timed.metrics.serialize_time_ms == 0.25);
    TEST_CHECK(*timed.metrics.kernel_time_ms == kernel);
    TEST_CHECK(timed.result_hash == out.result_hash);

    Output cleared = attach_timing(timed, std::nullopt, std::nullopt);
    TEST_CHECK(!cleared.metrics.parse_time_ms && !cleared.metrics.serialize_time_ms);
    return true;
}

bool test_metadata_passthrough() {
    Input input = make_input(small_a(), small_b(), "int8");
    InputMetadata meta;
    meta.compiler_flags = std::string("-O3");
    meta.libraries = std::vector<std::string>{"blake3"};
    input.metadata = meta;

    Output out = compute(input);
    TEST_CHECK(out.metadata.compiler_flags && *out.metadata.compiler_flags == "-O3");
    TEST_CHECK(out.metadata.libraries && out.metadata.libraries->size() == 1);
    TEST_CHECK(out.metadata.matrix_a_shape.rows == 2 && out.metadata.matrix_a_shape.cols == 2);
    TEST_CHECK(out.metadata.result_shape.rows == 2 && out.metadata.result_shape.cols == 2);
    TEST_CHECK(!out.metadata.simd_level.empty());

    Output bare = compute(make_input(small_a(), small_b(), "int8"));
    TEST_CHECK(!bare.metadata.compiler_flags && !bare.metadata.libraries);
    return true;
}

bool test_cache_hit_and_disable() {
    MatrixPair pair = generate_seeded_pair_hex("5a5a", 16, 64, 64, 16);
    Input input = make_input(pair.first, pair.second, "u8i8");

    if (!cache_disabled_by_env()) {
        compute(input);
        TEST_CHECK(compute(input).metadata.cache_hit);
    }

    InputMetadata meta;
    meta.cache_enabled = false;
    input.metadata = meta;
    Output first = compute(input);
    Output second = compute(input);
    TEST_CHECK(!first.metadata.cache_hit);
    TEST_CHECK(!second.metadata.cache_hit);
    TEST_CHECK(first.result_hash == second.result_hash);
    return true;
}

bool test_ragged_rows_rejected() {
    return throws_kind([]() { FlatMatrix::from_rows({{1.0f, 2.0f}, {3.0f}}); },
                       ErrorKind::MalformedInput);
}

bool test_flat_buffer_length_checked() {
    return throws_kind([]() { FlatMatrix m(std::vector<float>(5), 2, 3); },
                       ErrorKind::MalformedInput);
}

bool test_zero_row_matrix_has_no_cols() {
    FlatMatrix m(std::vector<float>(), 0, 3);
    TEST_CHECK(m.rows == 0 && m.cols == 0 && m.empty());
    TEST_CHECK(m.shape_string() == "0x0");
    return true;
}

bool test_zero_size_inputs() {
    // Inner dimension 0: A is 2x0, B is 0x0, the product is 2x0
    FlatMatrix a(std::vector<float>(), 2, 0);
    FlatMatrix b(std::vector<float>(), 0, 0);
    const char* precisions[] = {"fp32", "fp16", "int8", "u8i8"};
    for (const char* p : precisions) {
        Output out = compute(make_input(a, b, p));
        TEST_CHECK(out.result_matrix.rows == 2 && out.result_matrix.cols == 0);
        TEST_CHECK(out.result_matrix.empty());
        TEST_CHECK(out.metadata.result_shape.rows == 2 && out.metadata.result_shape.cols == 0);
    }

    // No rows at all
    FlatMatrix empty;
    Output out = compute(make_input(empty, empty, "fp32"));
    TEST_CHECK(out.result_matrix.empty());
    TEST_CHECK(out.result_hash == sha256::hash(""));
    TEST_CHECK(out.metrics.ops_per_second == 0.0);
    return true;
}

bool test_result_shape_follows_result() {
    // Fields set directly: A has no rows while B still reports 5 columns
    FlatMatrix a;
    FlatMatrix b;
    b.cols = 5;
    Output out = compute(make_input(a, b, "fp32"));
    TEST_CHECK(out.result_matrix.rows == 0 && out.result_matrix.cols == 0);
    TEST_CHECK(out.metadata.result_shape.rows == out.result_matrix.rows);
    TEST_CHECK(out.metadata.result_shape.cols == out.result_matrix.cols);

    FlatMatrix wide = FlatMatrix::from_rows({{1.0f, 0.0f, 2.0f}, {0.0f, 1.0f, 3.0f}});
    Output small = compute(make_input(small_a(), wide, "fp32"));
    TEST_CHECK(small.metadata.result_shape.rows == 2 && small.metadata.result_shape.cols == 3);
    return true;
}

bool test_json_report() {
    Output out = compute(make_input(small_a(), small_b(), "fp32"));
    out = attach_timing(out, 2.0, std::nullopt);
    const std::string json = format_output_json(out);

    TEST_CHECK(json.find("\"result_hash\": \"" + out.result_hash + "\"") != std::string::npos);
    TEST_CHECK(json.find("[19, 22]") != std::string::npos);
    TEST_CHECK(json.find("[43, 50]") != std::string::npos);
    TEST_CHECK(json.find("\"parse_time_ms\": 2.000000000") != std::string::npos);
    TEST_CHECK(json.find("serialize_time_ms") == std::string::npos);
    TEST_CHECK(json.find("\"compiler_flags\": null") != std::string::npos);
    TEST_CHECK(json.find("\"matrix_a_shape\": [2, 2]") != std::string::npos);
    TEST_CHECK(json.find("\"precision\": \"fp32\"") != std::string::npos);
    return true;
}

bool test_json_write_creates_directories() {
    namespace fs = std::filesystem;
    const fs::path root = fs::temp_directory_path() / "mmsolve_test_output";
    const fs::path target = root / "nested" / "output.json";
    std::error_code ec;
    fs::remove_all(root, ec);

    write_output_json(target.string(), "{}\n");
    std::ifstream in(target);
    std::stringstream contents;
    contents << in.rdbuf();
    const bool ok = contents.str() == "{}\n";

    fs::remove_all(root, ec);
    return ok;
}

int main() {
    TestRunner runner("Matmul Solver Tests");

    runner.run_test("fp32 exact product", test_fp32_exact());
    runner.run_test("fp16 close to exact", test_fp16_close());
    runner.run_test("int8 close to exact", test_int8_close());
    runner.run_test("u8i8 saturating conversion", test_u8i8_small());
    runner.run_test("u8i8 seeded 16xKx16 exact", test_u8i8_seeded_exact());
    runner.run_test("u8i8 generic path exact", test_generic_u8i8_exact());
    runner.run_test("Three runs give one hash", test_deterministic_runs());
    runner.run_test("16x16 microkernel paths", test_microkernel_paths());
    runner.run_test("Dimension mismatch reported", test_dimension_mismatch());
    runner.run_test("Unsupported precision", test_unsupported_precision());
    runner.run_test("Unsupported workload", test_unsupported_workload());
    runner.run_test("Verify accepts and rejects hashes", test_verify());
    runner.run_test("Verify without the operand cache", test_verify_without_cache());
    runner.run_test("Metrics", test_metrics());
    runner.run_test("Attach timing", test_attach_timing());
    runner.run_test("Metadata passthrough", test_metadata_passthrough());
    runner.run_test("Cache hit and per-call disable", test_cache_hit_and_disable());
    runner.run_test("Ragged rows rejected", test_ragged_rows_rejected());
    runner.run_test("Flat buffer length checked", test_flat_buffer_length_checked());
    runner.run_test("Zero-row matrix has no columns", test_zero_row_matrix_has_no_cols());
    runner.run_test("Zero-size inputs", test_zero_size_inputs());
    runner.run_test("Result shape follows the result", test_result_shape_follows_result());
    runner.run_test("JSON report contents", test_json_report());
    runner.run_test("JSON write creates directories", test_json_write_creates_directories());

    runner.print_summary();
    return runner.all_passed() ? 0 : 1;
}
