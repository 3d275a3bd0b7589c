#pragma once
// MatMul Solver - Result hashing

#include "flat_matrix.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

namespace sha256 {

// Incremental SHA-256 (FIPS 180-4)
class Hasher {
public:
    Hasher();

    void update(const void* data, size_t len);

    // Finishes the digest; the hasher must not be updated afterwards
    std::array<uint8_t, 32> finalize();

    // Lowercase hex of finalize()
    std::string hex_digest();

private:
    void process_block(const uint8_t* block);

    uint32_t h_[8];
    uint8_t buffer_[64];
    size_t buffer_len_;
    uint64_t total_len_;
};

// One-shot hex digest of a byte string
std::string hash(const std::string& input);

} // namespace sha256

// SHA-256 over the little-endian bytes of every f32 in row-major order,
// lowercase hex
std::string compute_result_hash(const FlatMatrix& m);
