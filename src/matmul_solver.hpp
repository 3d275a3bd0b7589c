#pragma once
// MatMul Solver - Public compute / verify API

#include "flat_matrix.hpp"
#include "precision_kernels.hpp"
#include "types.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

struct InputMetadata {
    std::optional<std::string> compiler_flags;
    std::optional<std::vector<std::string>> libraries;
    std::optional<bool> cache_enabled;      // false bypasses the OperandCache for this call
};

struct Input {
    FlatMatrix matrix_a;
    FlatMatrix matrix_b;
    std::string workload_type = "matmul";
    std::string precision;          // "fp32", "fp16", "int8" or "u8i8"
    std::optional<InputMetadata> metadata;
};

struct Metrics {
    double latency_ms = 0.0;
    double throughput_ops_per_sec = 0.0;
    double ops_per_second = 0.0;
    double memory_usage_mb = 0.0;
    std::optional<double> parse_time_ms;
    std::optional<double> kernel_time_ms;
    std::optional<double> serialize_time_ms;
};

struct Shape2D {
    size_t rows;
    size_t cols;
};

struct OutputMetadata {
    std::string precision;
    Shape2D matrix_a_shape = {0, 0};
    Shape2D matrix_b_shape = {0, 0};
    Shape2D result_shape = {0, 0};
    std::optional<std::string> compiler_flags;
    std::optional<std::vector<std::string>> libraries;
    std::string kernel_path;
    std::string simd_level;
    bool cache_hit = false;
};

struct Output {
    FlatMatrix result_matrix;
    std::string result_hash;
    Metrics metrics;
    OutputMetadata metadata;
};

// Runs the workload with the process-wide OperandCache and default backend.
// MMSOLVE_NO_CACHE bypasses the cache for every call.
// Throws SolverError for an unknown workload or precision and for
// incompatible shapes.
Output compute(const Input& input);

// Same, on an explicit dispatcher (metadata.cache_enabled is not consulted)
Output compute(const Input& input, const PrecisionDispatcher& dispatcher);

// Recomputes the product and compares its hash with expected_hash.
// use_cache == false packs B afresh instead of reading the OperandCache.
// Throws SolverError for an unsupported precision or incompatible shapes
bool verify(const FlatMatrix& matrix_a, const FlatMatrix& matrix_b,
            const std::string& precision, const std::string& expected_hash,
            bool use_cache = true);

// Replaces the collaborator timings; kernel time is kept
Output attach_timing(Output output,
                     std::optional<double> parse_time_ms,
                     std::optional<double> serialize_time_ms);

// Multiply-add count and operand memory footprint
double matmul_ops(size_t rows_a, size_t cols_a, size_t cols_b);
double estimate_memory_mb(size_t rows_a, size_t cols_a, size_t rows_b, size_t cols_b);
