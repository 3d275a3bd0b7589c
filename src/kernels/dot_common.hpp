#pragma once
// MatMul Solver - Common Dot-Product Kernel Definitions
//
// Every f32 implementation follows one summation order so that all SIMD levels
// return bit-identical results: element k is accumulated into lane (k mod 8)
// with a separate multiply and add, then the eight lanes are reduced as
// ((l0 + l1) + (l2 + l3)) + ((l4 + l5) + (l6 + l7)).
// Integer kernels are exact, so their order is free.

#include <cstddef>
#include <cstdint>

constexpr size_t DOT_F32_LANES = 8;

// Function pointer types for kernels
using DotF32Fn = float(*)(const float* a, const float* b, size_t n);
using DotI8Fn = int32_t(*)(const int8_t* a, const int8_t* b, size_t n);
using DotU8I8Fn = int32_t(*)(const uint8_t* a, const int8_t* b, size_t n);

// Fixed pairwise reduction of the eight f32 lanes
inline float reduce_lanes8(const float* l) {
    return ((l[0] + l[1]) + (l[2] + l[3])) + ((l[4] + l[5]) + (l[6] + l[7]));
}

// Integer dot products wrap on int32 overflow in every implementation
inline int32_t wrap_add_i32(int32_t acc, int32_t v) {
    return static_cast<int32_t>(static_cast<uint32_t>(acc) + static_cast<uint32_t>(v));
}

// Forward declarations for kernel functions from each SIMD level
// These are implemented in separate .cpp files compiled with different flags

namespace kernels {

// Portable reference (always available)
namespace scalar {
    float dot_f32(const float* a, const float* b, size_t n);
    int32_t dot_i8(const int8_t* a, const int8_t* b, size_t n);
    int32_t dot_u8i8(const uint8_t* a, const int8_t* b, size_t n);
}

// SSE2 (x86-64 baseline)
namespace sse2 {
    float dot_f32(const float* a, const float* b, size_t n);
    int32_t dot_i8(const int8_t* a, const int8_t* b, size_t n);
    int32_t dot_u8i8(const uint8_t* a, const int8_t* b, size_t n);
}

// AVX2
namespace avx2 {
    float dot_f32(const float* a, const float* b, size_t n);
    int32_t dot_i8(const int8_t* a, const int8_t* b, size_t n);
    int32_t dot_u8i8(const uint8_t* a, const int8_t* b, size_t n);
}

// AVX-512 (F + BW); the VNNI variant needs AVX-512 VNNI as well
namespace avx512 {
    int32_t dot_i8(const int8_t* a, const int8_t* b, size_t n);
    int32_t dot_u8i8(const uint8_t* a, const int8_t* b, size_t n);
    int32_t dot_u8i8_vnni(const uint8_t* a, const int8_t* b, size_t n);
}

// ARM NEON
namespace neon {
    float dot_f32(const float* a, const float* b, size_t n);
    int32_t dot_i8(const int8_t* a, const int8_t* b, size_t n);
    int32_t dot_u8i8(const uint8_t* a, const int8_t* b, size_t n);
}

} // namespace kernels
