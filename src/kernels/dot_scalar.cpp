// MatMul Solver - Scalar Dot-Product Kernels
// Reference implementations, compiled without ISA flags

#include "dot_common.hpp"

namespace kernels {
namespace scalar {

float dot_f32(const float* a, const float* b, size_t n) {
    float lanes[DOT_F32_LANES] = {0.0f, 0.0f, 0.0f, 0.0f, 0.0f, 0.0f, 0.0f, 0.0f};
    for (size_t k = 0; k < n; ++k) {
        float p = a[k] * b[k];
        lanes[k % DOT_F32_LANES] = lanes[k % DOT_F32_LANES] + p;
    }
    return reduce_lanes8(lanes);
}

int32_t dot_i8(const int8_t* a, const int8_t* b, size_t n) {
    int32_t acc = 0;
    for (size_t k = 0; k < n; ++k) {
        acc = wrap_add_i32(acc, static_cast<int32_t>(a[k]) * static_cast<int32_t>(b[k]));
    }
    return acc;
}

int32_t dot_u8i8(const uint8_t* a, const int8_t* b, size_t n) {
    int32_t acc = 0;
    for (size_t k = 0; k < n; ++k) {
        acc = wrap_add_i32(acc, static_cast<int32_t>(a[k]) * static_cast<int32_t>(b[k]));
    }
    return acc;
}

} // namespace scalar
} // namespace kernels
