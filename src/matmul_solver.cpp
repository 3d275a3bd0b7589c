// MatMul Solver - Public compute / verify API

#include "matmul_solver.hpp"
#include "matmul_backend.hpp"
#include "operand_cache.hpp"
#include "result_hash.hpp"
#include "runtime_dispatcher.hpp"
#include <cstdlib>
#include <utility>

namespace {

bool cache_disabled_by_env() {
    const char* env = std::getenv("MMSOLVE_NO_CACHE");
    return env && env[0] != '\0' && env[0] != '0';
}

void check_workload(const std::string& workload_type) {
    if (workload_type != "matmul") {
        throw SolverError(ErrorKind::UnsupportedWorkload,
            "Unsupported workload type: " + workload_type +
            ". Currently only 'matmul' is supported.");
    }
}

} // namespace

double matmul_ops(size_t rows_a, size_t cols_a, size_t cols_b) {
    return static_cast<double>(rows_a) * static_cast<double>(cols_a) * static_cast<double>(cols_b);
}

double estimate_memory_mb(size_t rows_a, size_t cols_a, size_t rows_b, size_t cols_b) {
    const double elements = static_cast<double>(rows_a) * static_cast<double>(cols_a) +
                            static_cast<double>(rows_b) * static_cast<double>(cols_b) +
                            static_cast<double>(rows_a) * static_cast<double>(cols_b);
    return elements * 4.0 / (1024.0 * 1024.0);
}

Output compute(const Input& input) {
    bool use_cache = !cache_disabled_by_env();
    if (input.metadata && !input.metadata->cache_enabled.value_or(true)) {
        use_cache = false;
    }

    PrecisionDispatcher dispatcher(use_cache ? &OperandCache::global() : nullptr, default_backend());
    return compute(input, dispatcher);
}

Output compute(const Input& input, const PrecisionDispatcher& dispatcher) {
    check_workload(input.workload_type);
    PrecisionDispatcher::check_dimensions(input.matrix_a, input.matrix_b);
    const Precision precision = string_to_precision(input.precision);

    const FlatMatrix& a = input.matrix_a;
    const FlatMatrix& b = input.matrix_b;

    KernelResult kernel = dispatcher.run(a, b, precision);

    Output output;
    output.result_hash = compute_result_hash(kernel.result);

    const double seconds = kernel.kernel_ms / 1000.0;
    const double ops = matmul_ops(a.rows, a.cols, b.cols);
    output.metrics.latency_ms = kernel.kernel_ms;
    output.metrics.ops_per_second = seconds > 0.0 ? ops / seconds : 0.0;
    output.metrics.throughput_ops_per_sec = output.metrics.ops_per_second;
    output.metrics.memory_usage_mb = estimate_memory_mb(a.rows, a.cols, b.rows, b.cols);
    output.metrics.kernel_time_ms = kernel.kernel_ms;

    OutputMetadata& meta = output.metadata;
    meta.precision = precision_to_string(precision);
    meta.matrix_a_shape = {a.rows, a.cols};
    meta.matrix_b_shape = {b.rows, b.cols};
    meta.result_shape = {kernel.result.rows, kernel.result.cols};
    if (input.metadata) {
        meta.compiler_flags = input.metadata->compiler_flags;
        meta.libraries = input.metadata->libraries;
    }
    meta.kernel_path = kernel.path;
    meta.simd_level = RuntimeDispatcher::get_active_level_name();
    meta.cache_hit = kernel.cache_hit;

    output.result_matrix = std::move(kernel.result);
    return output;
}

bool verify(const FlatMatrix& matrix_a, const FlatMatrix& matrix_b,
            const std::string& precision, const std::string& expected_hash,
            bool use_cache) {
    const Precision p = string_to_precision(precision);
    const bool cached = use_cache && !cache_disabled_by_env();
    PrecisionDispatcher dispatcher(cached ? &OperandCache::global() : nullptr, default_backend());
    KernelResult kernel = dispatcher.run(matrix_a, matrix_b, p);
    return compute_result_hash(kernel.result) == expected_hash;
}

Output attach_timing(Output output,
                     std::optional<double> parse_time_ms,
                     std::optional<double> serialize_time_ms) {
    output.metrics.parse_time_ms = parse_time_ms;
    output.metrics.serialize_time_ms = serialize_time_ms;
    return output;
}
