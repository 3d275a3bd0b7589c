// MatMul Solver - AVX-512 Dot-Product Kernels
// This file must be compiled with -mavx512f -mavx512bw -mavx512vnni (GCC/Clang).
// dot_u8i8_vnni may only be selected when the CPU reports AVX-512 VNNI.
// The f32 dot product is served by the AVX2 kernel at this level to keep the
// eight-lane summation order.

#include "dot_common.hpp"

#if defined(__x86_64__) || defined(_M_X64) || defined(__i386__) || defined(_M_IX86)

#ifdef _WIN32
    #include <intrin.h>
#else
    #include <immintrin.h>
#endif

namespace kernels {
namespace avx512 {

// 32 bytes per step through the BW widening multiply-add
int32_t dot_i8(const int8_t* a, const int8_t* b, size_t n) {
    __m512i acc = _mm512_setzero_si512();

    size_t k = 0;
    for (; k + 32 <= n; k += 32) {
        __m512i va = _mm512_cvtepi8_epi16(_mm256_loadu_si256(reinterpret_cast<const __m256i*>(a + k)));
        __m512i vb = _mm512_cvtepi8_epi16(_mm256_loadu_si256(reinterpret_cast<const __m256i*>(b + k)));
        acc = _mm512_add_epi32(acc, _mm512_madd_epi16(va, vb));
    }

    int32_t total = _mm512_reduce_add_epi32(acc);
    for (; k < n; ++k) {
        total = wrap_add_i32(total, static_cast<int32_t>(a[k]) * static_cast<int32_t>(b[k]));
    }
    return total;
}

int32_t dot_u8i8(const uint8_t* a, const int8_t* b, size_t n) {
    __m512i acc = _mm512_setzero_si512();

    size_t k = 0;
    for (; k + 32 <= n; k += 32) {
        __m512i va = _mm512_cvtepu8_epi16(_mm256_loadu_si256(reinterpret_cast<const __m256i*>(a + k)));
        __m512i vb = _mm512_cvtepi8_epi16(_mm256_loadu_si256(reinterpret_cast<const __m256i*>(b + k)));
        acc = _mm512_add_epi32(acc, _mm512_madd_epi16(va, vb));
    }

    int32_t total = _mm512_reduce_add_epi32(acc);
    for (; k < n; ++k) {
        total = wrap_add_i32(total, static_cast<int32_t>(a[k]) * static_cast<int32_t>(b[k]));
    }
    return total;
}

// vpdpbusd: four u8*i8 products summed into each 32-bit lane, 64 bytes per step
int32_t dot_u8i8_vnni(const uint8_t* a, const int8_t* b, size_t n) {
    __m512i acc = _mm512_setzero_si512();

    size_t k = 0;
    for (; k + 64 <= n; k += 64) {
        __m512i va = _mm512_loadu_si512(a + k);
        __m512i vb = _mm512_loadu_si512(b + k);
        acc = _mm512_dpbusd_epi32(acc, va, vb);
    }

    int32_t total = _mm512_reduce_add_epi32(acc);
    for (; k < n; ++k) {
        total = wrap_add_i32(total, static_cast<int32_t>(a[k]) * static_cast<int32_t>(b[k]));
    }
    return total;
}

} // namespace avx512
} // namespace kernels

#else // Non-x86 platforms - provide stub implementations

namespace kernels {
namespace avx512 {

int32_t dot_i8(const int8_t* a, const int8_t* b, size_t n) {
    return kernels::scalar::dot_i8(a, b, n);
}

int32_t dot_u8i8(const uint8_t* a, const int8_t* b, size_t n) {
    return kernels::scalar::dot_u8i8(a, b, n);
}

int32_t dot_u8i8_vnni(const uint8_t* a, const int8_t* b, size_t n) {
    return kernels::scalar::dot_u8i8(a, b, n);
}

} // namespace avx512
} // namespace kernels

#endif
