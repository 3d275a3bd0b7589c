#pragma once
// MatMul Solver - Native matrix-multiply backend interface

#include <cstddef>

// A native library that can run a dense single-precision GEMM.
// C (M x N) = A (M x K) * B (K x N), all row-major and contiguous.
class MatmulBackend {
public:
    virtual ~MatmulBackend() = default;

    virtual const char* name() const = 0;

    virtual void sgemm(const float* A, const float* B, float* C,
                       size_t M, size_t K, size_t N) const = 0;
};

// Backend compiled into this build, or nullptr when none is available or
// MMSOLVE_NO_BLAS is set
const MatmulBackend* default_backend();
