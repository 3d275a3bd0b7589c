// MatMul Solver - AVX2 Dot-Product Kernels
// This file must be compiled with -mavx2 (GCC/Clang) or /arch:AVX2 (MSVC).
// Multiplies and adds stay separate instructions; see dot_common.hpp.

#include "dot_common.hpp"

// Only compile AVX2 code on x86 platforms
#if defined(__x86_64__) || defined(_M_X64) || defined(__i386__) || defined(_M_IX86)

#ifdef _WIN32
    #include <intrin.h>
#else
    #include <immintrin.h>
#endif

namespace kernels {
namespace avx2 {

namespace {

inline int32_t hsum_epi32(__m256i v) {
    alignas(32) int32_t parts[8];
    _mm256_store_si256(reinterpret_cast<__m256i*>(parts), v);
    int32_t total = 0;
    for (int i = 0; i < 8; ++i) {
        total = wrap_add_i32(total, parts[i]);
    }
    return total;
}

} // namespace

float dot_f32(const float* a, const float* b, size_t n) {
    __m256 acc = _mm256_setzero_ps();

    size_t k = 0;
    for (; k + 8 <= n; k += 8) {
        __m256 prod = _mm256_mul_ps(_mm256_loadu_ps(a + k), _mm256_loadu_ps(b + k));
        acc = _mm256_add_ps(acc, prod);
    }

    alignas(32) float lanes[DOT_F32_LANES];
    _mm256_store_ps(lanes, acc);

    for (size_t l = 0; k < n; ++k, ++l) {
        float p = a[k] * b[k];
        lanes[l] = lanes[l] + p;
    }
    return reduce_lanes8(lanes);
}

// 16 bytes per step: sign-extend to 16-bit, pairwise multiply-add to 32-bit
int32_t dot_i8(const int8_t* a, const int8_t* b, size_t n) {
    __m256i acc = _mm256_setzero_si256();

    size_t k = 0;
    for (; k + 16 <= n; k += 16) {
        __m256i va = _mm256_cvtepi8_epi16(_mm_loadu_si128(reinterpret_cast<const __m128i*>(a + k)));
        __m256i vb = _mm256_cvtepi8_epi16(_mm_loadu_si128(reinterpret_cast<const __m128i*>(b + k)));
        acc = _mm256_add_epi32(acc, _mm256_madd_epi16(va, vb));
    }

    int32_t total = hsum_epi32(acc);
    for (; k < n; ++k) {
        total = wrap_add_i32(total, static_cast<int32_t>(a[k]) * static_cast<int32_t>(b[k]));
    }
    return total;
}

int32_t dot_u8i8(const uint8_t* a, const int8_t* b, size_t n) {
    __m256i acc = _mm256_setzero_si256();

    size_t k = 0;
    for (; k + 16 <= n; k += 16) {
        __m256i va = _mm256_cvtepu8_epi16(_mm_loadu_si128(reinterpret_cast<const __m128i*>(a + k)));
        __m256i vb = _mm256_cvtepi8_epi16(_mm_loadu_si128(reinterpret_cast<const __m128i*>(b + k)));
        acc = _mm256_add_epi32(acc, _mm256_madd_epi16(va, vb));
    }

    int32_t total = hsum_epi32(acc);
    for (; k < n; ++k) {
        total = wrap_add_i32(total, static_cast<int32_t>(a[k]) * static_cast<int32_t>(b[k]));
    }
    return total;
}

} // namespace avx2
} // namespace kernels

#else // Non-x86 platforms - provide stub implementations

namespace kernels {
namespace avx2 {

float dot_f32(const float* a, const float* b, size_t n) {
    return kernels::scalar::dot_f32(a, b, n);
}

int32_t dot_i8(const int8_t* a, const int8_t* b, size_t n) {
    return kernels::scalar::dot_i8(a, b, n);
}

int32_t dot_u8i8(const uint8_t* a, const int8_t* b, size_t n) {
    return kernels::scalar::dot_u8i8(a, b, n);
}

} // namespace avx2
} // namespace kernels

#endif
