#pragma once
// MatMul Solver - Operand quantization and packing

#include "aligned_buffer.hpp"
#include "flat_matrix.hpp"
#include <cstddef>
#include <cstdint>

// Symmetric per-tensor int8 scale: 127 / max|x|, or 1 when the maximum is 0.
// NaN elements are ignored when taking the maximum.
float compute_int8_scale(const float* values, size_t n);

inline float compute_int8_scale(const FlatMatrix& m) {
    return compute_int8_scale(m.data.data(), m.data.size());
}

// clamp(x * scale, -128, 127) truncated toward zero; NaN maps to 0
int8_t quantize_int8(float x, float scale);

// Float to integer by truncation toward zero, saturating at the type's range.
// NaN maps to 0. Used for u8i8 operands, which are not rescaled.
uint8_t saturate_to_u8(float x);
int8_t saturate_to_i8(float x);

// Row-major copies of a whole matrix
void quantize_int8_rows(const FlatMatrix& m, float scale, int8_t* out);
void saturate_rows_u8(const FlatMatrix& m, uint8_t* out);

// Transposed packings of a K x N matrix B into N rows of K elements each,
// so row j holds column j of B contiguously
AlignedBuffer<float> pack_transposed_half(const FlatMatrix& b);
AlignedBuffer<int8_t> pack_transposed_int8(const FlatMatrix& b, float scale);
AlignedBuffer<int8_t> pack_transposed_saturated_i8(const FlatMatrix& b);
