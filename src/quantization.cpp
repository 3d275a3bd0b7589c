// MatMul Solver - Operand quantization and packing

#include "quantization.hpp"
#include "half.hpp"
#include <cmath>

float compute_int8_scale(const float* values, size_t n) {
    float max_abs = 0.0f;
    for (size_t i = 0; i < n; ++i) {
        float v = std::fabs(values[i]);
        if (v > max_abs) {      // false for NaN
            max_abs = v;
        }
    }
    if (max_abs == 0.0f) {
        return 1.0f;
    }
    return 127.0f / max_abs;
}

int8_t quantize_int8(float x, float scale) {
    float v = x * scale;
    if (std::isnan(v)) {
        return 0;
    }
    if (v < -128.0f) v = -128.0f;
    if (v > 127.0f) v = 127.0f;
    return static_cast<int8_t>(v);
}

uint8_t saturate_to_u8(float x) {
    if (std::isnan(x) || x <= 0.0f) {
        return 0;
    }
    if (x >= 255.0f) {
        return 255;
    }
    return static_cast<uint8_t>(x);
}

int8_t saturate_to_i8(float x) {
    if (std::isnan(x)) {
        return 0;
    }
    if (x <= -128.0f) return -128;
    if (x >= 127.0f) return 127;
    return static_cast<int8_t>(x);
}

void quantize_int8_rows(const FlatMatrix& m, float scale, int8_t* out) {
    for (size_t i = 0; i < m.data.size(); ++i) {
        out[i] = quantize_int8(m.data[i], scale);
    }
}

void saturate_rows_u8(const FlatMatrix& m, uint8_t* out) {
    for (size_t i = 0; i < m.data.size(); ++i) {
        out[i] = saturate_to_u8(m.data[i]);
    }
}

AlignedBuffer<float> pack_transposed_half(const FlatMatrix& b) {
    const size_t K = b.rows;
    const size_t N = b.cols;
    AlignedBuffer<float> packed(K * N);
    for (size_t k = 0; k < K; ++k) {
        const float* row = b.data.data() + k * N;
        for (size_t j = 0; j < N; ++j) {
            packed[j * K + k] = round_to_half(row[j]);
        }
    }
    return packed;
}

AlignedBuffer<int8_t> pack_transposed_int8(const FlatMatrix& b, float scale) {
    const size_t K = b.rows;
    const size_t N = b.cols;
    AlignedBuffer<int8_t> packed(K * N);
    for (size_t k = 0; k < K; ++k) {
        const float* row = b.data.data() + k * N;
        for (size_t j = 0; j < N; ++j) {
            packed[j * K + k] = quantize_int8(row[j], scale);
        }
    }
    return packed;
}

AlignedBuffer<int8_t> pack_transposed_saturated_i8(const FlatMatrix& b) {
    const size_t K = b.rows;
    const size_t N = b.cols;
    AlignedBuffer<int8_t> packed(K * N);
    for (size_t k = 0; k < K; ++k) {
        const float* row = b.data.data() + k * N;
        for (size_t j = 0; j < N; ++j) {
            packed[j * K + k] = saturate_to_i8(row[j]);
        }
    }
    return packed;
}
