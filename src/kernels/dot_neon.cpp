// MatMul Solver - ARM NEON Dot-Product Kernels
// NEON is mandatory on AArch64, no extra flags needed.
// vmlaq/vfmaq are avoided so products and sums round separately.

#include "dot_common.hpp"

#if defined(__aarch64__) || defined(_M_ARM64) || defined(__ARM_NEON) || defined(__ARM_NEON__)

#include <arm_neon.h>

namespace kernels {
namespace neon {

float dot_f32(const float* a, const float* b, size_t n) {
    float32x4_t acc_lo = vdupq_n_f32(0.0f);
    float32x4_t acc_hi = vdupq_n_f32(0.0f);

    size_t k = 0;
    for (; k + 8 <= n; k += 8) {
        acc_lo = vaddq_f32(acc_lo, vmulq_f32(vld1q_f32(a + k), vld1q_f32(b + k)));
        acc_hi = vaddq_f32(acc_hi, vmulq_f32(vld1q_f32(a + k + 4), vld1q_f32(b + k + 4)));
    }

    float lanes[DOT_F32_LANES];
    vst1q_f32(lanes, acc_lo);
    vst1q_f32(lanes + 4, acc_hi);

    for (size_t l = 0; k < n; ++k, ++l) {
        float p = a[k] * b[k];
        lanes[l] = lanes[l] + p;
    }
    return reduce_lanes8(lanes);
}

int32_t dot_i8(const int8_t* a, const int8_t* b, size_t n) {
    int32x4_t acc = vdupq_n_s32(0);

    size_t k = 0;
    for (; k + 16 <= n; k += 16) {
        int8x16_t va = vld1q_s8(a + k);
        int8x16_t vb = vld1q_s8(b + k);
        acc = vpadalq_s16(acc, vmull_s8(vget_low_s8(va), vget_low_s8(vb)));
        acc = vpadalq_s16(acc, vmull_s8(vget_high_s8(va), vget_high_s8(vb)));
    }

    int32_t total = vaddvq_s32(acc);
    for (; k < n; ++k) {
        total = wrap_add_i32(total, static_cast<int32_t>(a[k]) * static_cast<int32_t>(b[k]));
    }
    return total;
}

// u8 does not fit a signed 8-bit multiply: widen both sides to 16-bit first
int32_t dot_u8i8(const uint8_t* a, const int8_t* b, size_t n) {
    int32x4_t acc = vdupq_n_s32(0);

    size_t k = 0;
    for (; k + 8 <= n; k += 8) {
        int16x8_t va = vreinterpretq_s16_u16(vmovl_u8(vld1_u8(a + k)));
        int16x8_t vb = vmovl_s8(vld1_s8(b + k));
        acc = vmlal_s16(acc, vget_low_s16(va), vget_low_s16(vb));
        acc = vmlal_s16(acc, vget_high_s16(va), vget_high_s16(vb));
    }

    int32_t total = vaddvq_s32(acc);
    for (; k < n; ++k) {
        total = wrap_add_i32(total, static_cast<int32_t>(a[k]) * static_cast<int32_t>(b[k]));
    }
    return total;
}

} // namespace neon
} // namespace kernels

#else // Non-ARM platforms - provide stub implementations

namespace kernels {
namespace neon {

float dot_f32(const float* a, const float* b, size_t n) {
    return kernels::scalar::dot_f32(a, b, n);
}

int32_t dot_i8(const int8_t* a, const int8_t* b, size_t n) {
    return kernels::scalar::dot_i8(a, b, n);
}

int32_t dot_u8i8(const uint8_t* a, const int8_t* b, size_t n) {
    return kernels::scalar::dot_u8i8(a, b, n);
}

} // namespace neon
} // namespace kernels

#endif
