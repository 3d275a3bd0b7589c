// MatMul Solver - Precision Kernel Dispatcher Implementation

#include "precision_kernels.hpp"
#include "half.hpp"
#include "quantization.hpp"
#include "runtime_dispatcher.hpp"
#include "kernels/dot_common.hpp"
#include <chrono>
#include <climits>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>
#include <utility>

namespace {
bool precision_debug_enabled() {
    const char* env = std::getenv("MMSOLVE_DEBUG");
    return env && env[0] != '\0' && env[0] != '0';
}

void precision_debug_log(const std::string& msg) {
    if (precision_debug_enabled()) {
        std::cerr << "[precision] " << msg << "\n";
    }
}

// Cache blocking for the generic kernels: a BLOCK_K x BLOCK_N panel of B
// (512 KB of f32) sits in L2 while BLOCK_M rows of A stream through L1
constexpr size_t BLOCK_M = 64;
constexpr size_t BLOCK_K = 256;
constexpr size_t BLOCK_N = 512;

// Largest K for which an int8 GEMM in f32 stays exact: |a * b| <= 2^14,
// so every partial sum stays within 2^24
constexpr size_t INT8_OFFLOAD_MAX_K = 1024;

inline size_t block_end(size_t begin, size_t block, size_t limit) {
    return (limit - begin < block) ? limit : begin + block;
}

// i-k-j traversal over cache blocks. For each C element the k index still
// runs in ascending order, so float sums match the unblocked loop exactly.
template<typename TA, typename TB, typename Acc, typename Fma>
void blocked_ikj(const TA* A, const TB* B, Acc* C, size_t M, size_t K, size_t N, Fma fma) {
    for (size_t i0 = 0; i0 < M; i0 += BLOCK_M) {
        const size_t i1 = block_end(i0, BLOCK_M, M);
        for (size_t k0 = 0; k0 < K; k0 += BLOCK_K) {
            const size_t k1 = block_end(k0, BLOCK_K, K);
            for (size_t j0 = 0; j0 < N; j0 += BLOCK_N) {
                const size_t j1 = block_end(j0, BLOCK_N, N);
                for (size_t i = i0; i < i1; ++i) {
                    Acc* c_row = C + i * N;
                    for (size_t k = k0; k < k1; ++k) {
                        const TA a_ik = A[i * K + k];
                        const TB* b_row = B + k * N;
                        for (size_t j = j0; j < j1; ++j) {
                            c_row[j] = fma(c_row[j], a_ik, b_row[j]);
                        }
                    }
                }
            }
        }
    }
}

} // namespace

// ============================================================================
// Pure-source kernels
// ============================================================================

namespace matmul {

std::vector<float> fp32_blocked(const float* A, const float* B, size_t M, size_t K, size_t N) {
    std::vector<float> C(M * N, 0.0f);
    blocked_ikj(A, B, C.data(), M, K, N, [](float c, float a, float b) {
        float p = a * b;
        return c + p;
    });
    return C;
}

std::vector<float> fp32_micro16(const float* A, const float* B, size_t K) {
    constexpr size_t T = PrecisionDispatcher::MICRO_TILE;
    alignas(64) float acc[T * T] = {};

    size_t k = 0;
    for (; k + 4 <= K; k += 4) {
        const float* b0 = B + k * T;
        const float* b1 = b0 + T;
        const float* b2 = b1 + T;
        const float* b3 = b2 + T;
        for (size_t i = 0; i < T; ++i) {
            const float* a = A + i * K + k;
            const float a0 = a[0], a1 = a[1], a2 = a[2], a3 = a[3];
            float* c = acc + i * T;
            for (size_t j = 0; j < T; ++j) {
                float s = c[j];
                s = s + a0 * b0[j];
                s = s + a1 * b1[j];
                s = s + a2 * b2[j];
                s = s + a3 * b3[j];
                c[j] = s;
            }
        }
    }
    for (; k < K; ++k) {
        const float* b = B + k * T;
        for (size_t i = 0; i < T; ++i) {
            const float a = A[i * K + k];
            float* c = acc + i * T;
            for (size_t j = 0; j < T; ++j) {
                c[j] = c[j] + a * b[j];
            }
        }
    }
    return std::vector<float>(acc, acc + T * T);
}

std::vector<float> fp16_generic(const FlatMatrix& a, const FlatMatrix& b) {
    const size_t M = a.rows;
    const size_t K = a.cols;
    const size_t N = b.cols;

    std::vector<half> a_half(M * K);
    for (size_t i = 0; i < a_half.size(); ++i) {
        a_half[i] = half(a.data[i]);
    }
    // B^T so the inner loop reads both operands contiguously
    std::vector<half> bt_half(N * K);
    for (size_t k = 0; k < K; ++k) {
        for (size_t j = 0; j < N; ++j) {
            bt_half[j * K + k] = half(b.data[k * N + j]);
        }
    }

    std::vector<float> C(M * N, 0.0f);
    for (size_t i = 0; i < M; ++i) {
        const half* a_row = a_half.data() + i * K;
        for (size_t j = 0; j < N; ++j) {
            const half* b_col = bt_half.data() + j * K;
            half sum(0.0f);
            for (size_t k = 0; k < K; ++k) {
                sum += a_row[k] * b_col[k];
            }
            C[i * N + j] = static_cast<float>(sum);
        }
    }
    return C;
}

std::vector<int32_t> i8_blocked(const int8_t* A, const int8_t* B, size_t M, size_t K, size_t N) {
    std::vector<int32_t> C(M * N, 0);
    blocked_ikj(A, B, C.data(), M, K, N, [](int32_t c, int8_t a, int8_t b) {
        return wrap_add_i32(c, static_cast<int32_t>(a) * static_cast<int32_t>(b));
    });
    return C;
}

std::vector<int32_t> u8i8_blocked(const uint8_t* A, const int8_t* B, size_t M, size_t K, size_t N) {
    std::vector<int32_t> C(M * N, 0);
    blocked_ikj(A, B, C.data(), M, K, N, [](int32_t c, uint8_t a, int8_t b) {
        return wrap_add_i32(c, static_cast<int32_t>(a) * static_cast<int32_t>(b));
    });
    return C;
}

} // namespace matmul

// ============================================================================
// PrecisionDispatcher
// ============================================================================

PrecisionDispatcher::PrecisionDispatcher(OperandCache* cache, const MatmulBackend* backend)
    : cache_(cache), backend_(backend) {
}

void PrecisionDispatcher::check_dimensions(const FlatMatrix& a, const FlatMatrix& b) {
    if (a.cols != b.rows) {
        throw SolverError(ErrorKind::DimensionMismatch,
            "Matrix dimensions incompatible: A is " + a.shape_string() +
            ", B is " + b.shape_string());
    }
}

bool PrecisionDispatcher::can_offload(size_t M, size_t K, size_t N) const {
    if (backend_ == nullptr) return false;
    if (M == 0 || K == 0 || N == 0) return false;
    const size_t limit = static_cast<size_t>(INT_MAX);
    return M <= limit && K <= limit && N <= limit;
}

KernelResult PrecisionDispatcher::run(const FlatMatrix& a, const FlatMatrix& b, Precision precision) const {
    check_dimensions(a, b);

    KernelResult out;
    const auto start = std::chrono::steady_clock::now();

    std::vector<float> c;
    switch (precision) {
        case Precision::FP32: c = run_fp32(a, b, out); break;
        case Precision::FP16: c = run_fp16(a, b, out); break;
        case Precision::INT8: c = run_int8(a, b, out); break;
        case Precision::U8I8: c = run_u8i8(a, b, out); break;
    }

    const auto end = std::chrono::steady_clock::now();
    out.kernel_ms = std::chrono::duration<double, std::milli>(end - start).count();

    out.result = FlatMatrix(std::move(c), a.rows, b.cols);

    if (precision_debug_enabled()) {
        std::ostringstream oss;
        oss << out.path << " " << a.shape_string() << " * " << b.shape_string()
            << " in " << std::fixed << std::setprecision(3) << out.kernel_ms << " ms"
            << (out.cache_hit ? " (cache hit)" : "");
        precision_debug_log(oss.str());
    }
    return out;
}

std::vector<float> PrecisionDispatcher::run_fp32(const FlatMatrix& a, const FlatMatrix& b, KernelResult& out) const {
    const size_t M = a.rows;
    const size_t K = a.cols;
    const size_t N = b.cols;

    if (uses_microkernel(a, b)) {
        out.path = "fp32/microkernel-16x16";
        return matmul::fp32_micro16(a.data.data(), b.data.data(), K);
    }

    if (can_offload(M, K, N)) {
        out.path = std::string("fp32/backend-") + backend_->name();
        std::vector<float> c(M * N, 0.0f);
        backend_->sgemm(a.data.data(), b.data.data(), c.data(), M, K, N);
        return c;
    }

    out.path = "fp32/generic-blocked";
    return matmul::fp32_blocked(a.data.data(), b.data.data(), M, K, N);
}

std::vector<float> PrecisionDispatcher::run_fp16(const FlatMatrix& a, const FlatMatrix& b, KernelResult& out) const {
    const size_t M = a.rows;
    const size_t K = a.cols;
    const size_t N = b.cols;

    if (uses_microkernel(a, b)) {
        out.path = "fp16/microkernel-16x16";

        AlignedBuffer<float> a_packed(M * K);
        for (size_t i = 0; i < M * K; ++i) {
            a_packed[i] = round_to_half(a.data[i]);
        }

        OperandCache::HalfPack bt;
        if (cache_) {
            bt = cache_->get_half_transposed(b, &out.cache_hit);
        } else {
            bt = std::make_shared<AlignedBuffer<float>>(pack_transposed_half(b));
        }

        const DotF32Fn dot = RuntimeDispatcher::get_dot_f32();
        std::vector<float> c(M * N);
        for (size_t i = 0; i < M; ++i) {
            const float* a_row = a_packed.data() + i * K;
            for (size_t j = 0; j < N; ++j) {
                c[i * N + j] = dot(a_row, bt->data() + j * K, K);
            }
        }
        return c;
    }

    // No backend offload: a BLAS sgemm would accumulate in f32
    out.path = "fp16/generic-half";
    return matmul::fp16_generic(a, b);
}

std::vector<float> PrecisionDispatcher::run_int8(const FlatMatrix& a, const FlatMatrix& b, KernelResult& out) const {
    const size_t M = a.rows;
    const size_t K = a.cols;
    const size_t N = b.cols;

    const float scale_a = compute_int8_scale(a);
    const float scale_b = compute_int8_scale(b);
    const float dequant = 1.0f / (scale_a * scale_b);

    std::vector<float> c(M * N);

    if (uses_microkernel(a, b)) {
        out.path = "int8/microkernel-16x16";

        AlignedBuffer<int8_t> a_q(M * K);
        quantize_int8_rows(a, scale_a, a_q.data());

        OperandCache::Int8Pack bt;
        if (cache_) {
            bt = cache_->get_int8_transposed(b, scale_b, &out.cache_hit);
        } else {
            bt = std::make_shared<AlignedBuffer<int8_t>>(pack_transposed_int8(b, scale_b));
        }

        const DotI8Fn dot = RuntimeDispatcher::get_dot_i8();
        for (size_t i = 0; i < M; ++i) {
            const int8_t* a_row = a_q.data() + i * K;
            for (size_t j = 0; j < N; ++j) {
                c[i * N + j] = static_cast<float>(dot(a_row, bt->data() + j * K, K)) * dequant;
            }
        }
        return c;
    }

    if (K <= INT8_OFFLOAD_MAX_K && can_offload(M, K, N)) {
        out.path = std::string("int8/backend-") + backend_->name();
        std::vector<float> a_q(a.data.size());
        std::vector<float> b_q(b.data.size());
        for (size_t i = 0; i < a_q.size(); ++i) a_q[i] = quantize_int8(a.data[i], scale_a);
        for (size_t i = 0; i < b_q.size(); ++i) b_q[i] = quantize_int8(b.data[i], scale_b);

        backend_->sgemm(a_q.data(), b_q.data(), c.data(), M, K, N);
        for (float& v : c) {
            v = v * dequant;
        }
        return c;
    }

    out.path = "int8/generic-blocked";
    std::vector<int8_t> a_q(a.data.size());
    std::vector<int8_t> b_q(b.data.size());
    quantize_int8_rows(a, scale_a, a_q.data());
    quantize_int8_rows(b, scale_b, b_q.data());

    const std::vector<int32_t> acc = matmul::i8_blocked(a_q.data(), b_q.data(), M, K, N);
    for (size_t i = 0; i < acc.size(); ++i) {
        c[i] = static_cast<float>(acc[i]) * dequant;
    }
    return c;
}

std::vector<float> PrecisionDispatcher::run_u8i8(const FlatMatrix& a, const FlatMatrix& b, KernelResult& out) const {
    const size_t M = a.rows;
    const size_t K = a.cols;
    const size_t N = b.cols;

    std::vector<float> c(M * N);

    if (uses_microkernel(a, b)) {
        out.path = std::string("u8i8/microkernel-16x16-") + RuntimeDispatcher::get_u8i8_kernel_name();

        AlignedBuffer<uint8_t> a_u8(M * K);
        saturate_rows_u8(a, a_u8.data());

        OperandCache::Int8Pack bt;
        if (cache_) {
            bt = cache_->get_saturated_i8_transposed(b, &out.cache_hit);
        } else {
            bt = std::make_shared<AlignedBuffer<int8_t>>(pack_transposed_saturated_i8(b));
        }

        const DotU8I8Fn dot = RuntimeDispatcher::get_dot_u8i8();
        for (size_t i = 0; i < M; ++i) {
            const uint8_t* a_row = a_u8.data() + i * K;
            for (size_t j = 0; j < N; ++j) {
                c[i * N + j] = static_cast<float>(dot(a_row, bt->data() + j * K, K));
            }
        }
        return c;
    }

    // Never offloaded: the integer result must stay exact for any K
    out.path = "u8i8/generic-blocked";
    std::vector<uint8_t> a_u8(a.data.size());
    std::vector<int8_t> b_i8(b.data.size());
    saturate_rows_u8(a, a_u8.data());
    for (size_t i = 0; i < b_i8.size(); ++i) {
        b_i8[i] = saturate_to_i8(b.data[i]);
    }

    const std::vector<int32_t> acc = matmul::u8i8_blocked(a_u8.data(), b_i8.data(), M, K, N);
    for (size_t i = 0; i < acc.size(); ++i) {
        c[i] = static_cast<float>(acc[i]);
    }
    return c;
}
