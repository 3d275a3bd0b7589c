#pragma once
// MatMul Solver - Precision Kernel Dispatcher
//
// Runs C = A * B at one of four precisions:
//   fp32  - f32 products, f32 accumulation
//   fp16  - operands rounded to IEEE half; the generic path multiplies and
//           accumulates in half, the 16x16 path accumulates in f32
//   int8  - symmetric per-tensor quantization (scale = 127 / max|x|),
//           int32 accumulation, dequantized by 1 / (scale_a * scale_b)
//   u8i8  - A read as u8 and B as i8 without rescaling, int32 accumulation
//
// Shapes with A.rows == 16 and B.cols == 16 take the 16x16 output
// microkernel, which reads a packed B^T through the OperandCache. Other
// shapes use the blocked generic kernels, or the native backend when one is
// attached (fp32 and small-K int8 only).

#include "flat_matrix.hpp"
#include "matmul_backend.hpp"
#include "operand_cache.hpp"
#include "types.hpp"
#include <cstddef>
#include <string>
#include <vector>

struct KernelResult {
    FlatMatrix result;
    double kernel_ms = 0.0;     // packing, quantization, cache lookup and compute
    std::string path;           // e.g. "int8/microkernel-16x16"
    bool cache_hit = false;
};

class PrecisionDispatcher {
public:
    static constexpr size_t MICRO_TILE = 16;

    // cache == nullptr packs B locally on every call;
    // backend == nullptr keeps every path in the pure-source kernels
    PrecisionDispatcher(OperandCache* cache, const MatmulBackend* backend);

    // Throws SolverError(DimensionMismatch) when a.cols != b.rows
    KernelResult run(const FlatMatrix& a, const FlatMatrix& b, Precision precision) const;

    static bool uses_microkernel(const FlatMatrix& a, const FlatMatrix& b) {
        return a.rows == MICRO_TILE && b.cols == MICRO_TILE;
    }

    static void check_dimensions(const FlatMatrix& a, const FlatMatrix& b);

private:
    OperandCache* cache_;
    const MatmulBackend* backend_;

    std::vector<float> run_fp32(const FlatMatrix& a, const FlatMatrix& b, KernelResult& out) const;
    std::vector<float> run_fp16(const FlatMatrix& a, const FlatMatrix& b, KernelResult& out) const;
    std::vector<float> run_int8(const FlatMatrix& a, const FlatMatrix& b, KernelResult& out) const;
    std::vector<float> run_u8i8(const FlatMatrix& a, const FlatMatrix& b, KernelResult& out) const;

    bool can_offload(size_t M, size_t K, size_t N) const;
};

// Pure-source kernels, exposed for tests. All take row-major operands and
// return the row-major M x N product.
namespace matmul {

std::vector<float> fp32_blocked(const float* A, const float* B, size_t M, size_t K, size_t N);
std::vector<float> fp32_micro16(const float* A, const float* B, size_t K);

std::vector<float> fp16_generic(const FlatMatrix& a, const FlatMatrix& b);

// Integer products as int32, before any dequantization
std::vector<int32_t> i8_blocked(const int8_t* A, const int8_t* B, size_t M, size_t K, size_t N);
std::vector<int32_t> u8i8_blocked(const uint8_t* A, const int8_t* B, size_t M, size_t K, size_t N);

} // namespace matmul
