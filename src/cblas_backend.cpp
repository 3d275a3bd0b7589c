// MatMul Solver - CBLAS backend
// Built only when CMake finds a CBLAS (MMSOLVE_HAVE_CBLAS); the pure-source
// kernels are used otherwise.

#include "matmul_backend.hpp"
#include <cstdlib>

#ifdef MMSOLVE_HAVE_CBLAS

#include <cblas.h>

namespace {

class CblasBackend : public MatmulBackend {
public:
    const char* name() const override { return "cblas"; }

    void sgemm(const float* A, const float* B, float* C,
               size_t M, size_t K, size_t N) const override {
        cblas_sgemm(CblasRowMajor, CblasNoTrans, CblasNoTrans,
                    static_cast<int>(M), static_cast<int>(N), static_cast<int>(K),
                    1.0f, A, static_cast<int>(K),
                    B, static_cast<int>(N),
                    0.0f, C, static_cast<int>(N));
    }
};

} // namespace

#endif

const MatmulBackend* default_backend() {
    const char* env = std::getenv("MMSOLVE_NO_BLAS");
    if (env && env[0] != '\0' && env[0] != '0') {
        return nullptr;
    }
#ifdef MMSOLVE_HAVE_CBLAS
    static const CblasBackend backend;
    return &backend;
#else
    return nullptr;
#endif
}
