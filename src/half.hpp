#pragma once
// MatMul Solver - IEEE 754-2008 Half-Precision Floating-Point Type

#include <cstdint>
#include <cstring>

// IEEE 754-2008 half-precision floating-point
// Format: 1 sign bit, 5 exponent bits, 10 mantissa bits
// Range: ±65504 (max normal), ±6.10e-5 (min positive normal)
// Conversions round to nearest, ties to even.
struct half {
    uint16_t bits;

    constexpr half() : bits(0) {}

    static constexpr half from_bits(uint16_t raw) {
        half h;
        h.bits = raw;
        return h;
    }

    explicit half(float f) : bits(float_to_half_bits(f)) {}

    operator float() const {
        return half_bits_to_float(bits);
    }

    // Arithmetic operators (compute in float, store as half)
    half operator+(half other) const {
        return half(static_cast<float>(*this) + static_cast<float>(other));
    }

    half operator*(half other) const {
        return half(static_cast<float>(*this) * static_cast<float>(other));
    }

    half& operator+=(half other) {
        *this = *this + other;
        return *this;
    }

    static uint16_t float_to_half_bits(float f) {
        uint32_t fbits;
        std::memcpy(&fbits, &f, sizeof(fbits));

        uint16_t sign = static_cast<uint16_t>((fbits >> 16) & 0x8000);
        uint32_t abs = fbits & 0x7FFFFFFF;

        // Infinity or NaN
        if (abs >= 0x7F800000) {
            if (abs == 0x7F800000) {
                return static_cast<uint16_t>(sign | 0x7C00);
            }
            // Quiet NaN, keep the top payload bits
            return static_cast<uint16_t>(sign | 0x7E00 | ((abs >> 13) & 0x3FF));
        }

        // Rounds to infinity: >= 65520.0f
        if (abs >= 0x477FF000) {
            return static_cast<uint16_t>(sign | 0x7C00);
        }

        int32_t exp = static_cast<int32_t>(abs >> 23) - 127;

        // Subnormal half (or zero): value = mantissa * 2^-24
        if (exp < -14) {
            if (exp < -25) {
                return sign;
            }
            uint32_t mant = (abs & 0x7FFFFF) | 0x800000;
            uint32_t shift = static_cast<uint32_t>(-exp - 1);   // 14..24
            uint32_t result = mant >> shift;
            uint32_t rem = mant & ((1u << shift) - 1);
            uint32_t halfway = 1u << (shift - 1);
            if (rem > halfway || (rem == halfway && (result & 1))) {
                result++;
            }
            return static_cast<uint16_t>(sign | result);
        }

        // Normal: rebias exponent, round mantissa from 23 to 10 bits
        uint32_t result = ((static_cast<uint32_t>(exp + 15)) << 10) | ((abs >> 13) & 0x3FF);
        uint32_t rem = abs & 0x1FFF;
        if (rem > 0x1000 || (rem == 0x1000 && (result & 1))) {
            result++;   // carry into the exponent is the correct rounding
        }
        return static_cast<uint16_t>(sign | result);
    }

    static float half_bits_to_float(uint16_t h) {
        uint32_t sign = static_cast<uint32_t>(h & 0x8000) << 16;
        uint32_t exp = (h >> 10) & 0x1F;
        uint32_t mantissa = h & 0x3FF;

        uint32_t fbits;

        if (exp == 0) {
            if (mantissa == 0) {
                fbits = sign;
            } else {
                // Denormalized number - normalize it
                exp = 1;
                while ((mantissa & 0x400) == 0) {
                    mantissa <<= 1;
                    exp--;
                }
                mantissa &= 0x3FF;
                fbits = sign | ((exp + 127 - 15) << 23) | (mantissa << 13);
            }
        } else if (exp == 31) {
            fbits = sign | 0x7F800000 | (mantissa << 13);
        } else {
            fbits = sign | ((exp + 127 - 15) << 23) | (mantissa << 13);
        }

        float f;
        std::memcpy(&f, &fbits, sizeof(f));
        return f;
    }
};

static_assert(sizeof(half) == 2, "half must be 2 bytes");

// Round a float to the nearest representable half, returned as float
inline float round_to_half(float f) {
    return half::half_bits_to_float(half::float_to_half_bits(f));
}
