// MatMul Solver - SSE2 Dot-Product Kernels
// This file must be compiled with -msse2 (GCC/Clang); SSE2 is the x86-64 baseline

#include "dot_common.hpp"

// Only compile SSE2 code on x86 platforms
#if defined(__x86_64__) || defined(_M_X64) || defined(__i386__) || defined(_M_IX86)

#ifdef _WIN32
    #include <intrin.h>
#else
    #include <emmintrin.h>
#endif

namespace kernels {
namespace sse2 {

namespace {

// Sign-extend the low/high 8 bytes of v to 16-bit lanes (no SSE4.1 pmovsx)
inline __m128i sext_lo_epi8(__m128i v) {
    return _mm_srai_epi16(_mm_unpacklo_epi8(v, v), 8);
}

inline __m128i sext_hi_epi8(__m128i v) {
    return _mm_srai_epi16(_mm_unpackhi_epi8(v, v), 8);
}

inline int32_t hsum_epi32(__m128i v) {
    alignas(16) int32_t parts[4];
    _mm_store_si128(reinterpret_cast<__m128i*>(parts), v);
    return wrap_add_i32(wrap_add_i32(parts[0], parts[1]), wrap_add_i32(parts[2], parts[3]));
}

} // namespace

// Two 4-wide accumulators hold lanes 0-3 and 4-7
float dot_f32(const float* a, const float* b, size_t n) {
    __m128 acc_lo = _mm_setzero_ps();
    __m128 acc_hi = _mm_setzero_ps();

    size_t k = 0;
    for (; k + 8 <= n; k += 8) {
        acc_lo = _mm_add_ps(acc_lo, _mm_mul_ps(_mm_loadu_ps(a + k), _mm_loadu_ps(b + k)));
        acc_hi = _mm_add_ps(acc_hi, _mm_mul_ps(_mm_loadu_ps(a + k + 4), _mm_loadu_ps(b + k + 4)));
    }

    alignas(16) float lanes[DOT_F32_LANES];
    _mm_store_ps(lanes, acc_lo);
    _mm_store_ps(lanes + 4, acc_hi);

    // Remainder goes into its lanes
    for (size_t l = 0; k < n; ++k, ++l) {
        float p = a[k] * b[k];
        lanes[l] = lanes[l] + p;
    }
    return reduce_lanes8(lanes);
}

int32_t dot_i8(const int8_t* a, const int8_t* b, size_t n) {
    __m128i acc = _mm_setzero_si128();

    size_t k = 0;
    for (; k + 16 <= n; k += 16) {
        __m128i va = _mm_loadu_si128(reinterpret_cast<const __m128i*>(a + k));
        __m128i vb = _mm_loadu_si128(reinterpret_cast<const __m128i*>(b + k));
        acc = _mm_add_epi32(acc, _mm_madd_epi16(sext_lo_epi8(va), sext_lo_epi8(vb)));
        acc = _mm_add_epi32(acc, _mm_madd_epi16(sext_hi_epi8(va), sext_hi_epi8(vb)));
    }

    int32_t total = hsum_epi32(acc);
    for (; k < n; ++k) {
        total = wrap_add_i32(total, static_cast<int32_t>(a[k]) * static_cast<int32_t>(b[k]));
    }
    return total;
}

int32_t dot_u8i8(const uint8_t* a, const int8_t* b, size_t n) {
    const __m128i zero = _mm_setzero_si128();
    __m128i acc = _mm_setzero_si128();

    size_t k = 0;
    for (; k + 16 <= n; k += 16) {
        __m128i va = _mm_loadu_si128(reinterpret_cast<const __m128i*>(a + k));
        __m128i vb = _mm_loadu_si128(reinterpret_cast<const __m128i*>(b + k));
        acc = _mm_add_epi32(acc, _mm_madd_epi16(_mm_unpacklo_epi8(va, zero), sext_lo_epi8(vb)));
        acc = _mm_add_epi32(acc, _mm_madd_epi16(_mm_unpackhi_epi8(va, zero), sext_hi_epi8(vb)));
    }

    int32_t total = hsum_epi32(acc);
    for (; k < n; ++k) {
        total = wrap_add_i32(total, static_cast<int32_t>(a[k]) * static_cast<int32_t>(b[k]));
    }
    return total;
}

} // namespace sse2
} // namespace kernels

#else // Non-x86 platforms - provide stub implementations

namespace kernels {
namespace sse2 {

float dot_f32(const float* a, const float* b, size_t n) {
    return kernels::scalar::dot_f32(a, b, n);
}

int32_t dot_i8(const int8_t* a, const int8_t* b, size_t n) {
    return kernels::scalar::dot_i8(a, b, n);
}

int32_t dot_u8i8(const uint8_t* a, const int8_t* b, size_t n) {
    return kernels::scalar::dot_u8i8(a, b, n);
}

} // namespace sse2
} // namespace kernels

#endif
