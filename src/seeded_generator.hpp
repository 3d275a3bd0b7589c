#pragma once
// MatMul Solver - Seeded matrix generation
//
// The seed is hashed with BLAKE3 and rows_a*cols_a + rows_b*cols_b bytes are
// read from its extendable output. The first rows_a*cols_a bytes become A as
// unsigned values in [0, 255]; each remaining byte b becomes B as the signed
// 8-bit reinterpretation of (b - 128) mod 256, i.e. b - 128 in [-128, 127].

#include "flat_matrix.hpp"
#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

using MatrixPair = std::pair<FlatMatrix, FlatMatrix>;

// Throws SolverError(MalformedInput) if the element counts overflow
MatrixPair generate_seeded_pair(const uint8_t* seed, size_t seed_len,
                                size_t rows_a, size_t cols_a,
                                size_t rows_b, size_t cols_b);

MatrixPair generate_seeded_pair(const std::vector<uint8_t>& seed,
                                size_t rows_a, size_t cols_a,
                                size_t rows_b, size_t cols_b);

// Hex-seed variant. An empty string is the empty seed.
// Throws SolverError(InvalidSeed) on odd length or non-hex characters.
MatrixPair generate_seeded_pair_hex(const std::string& seed_hex,
                                    size_t rows_a, size_t cols_a,
                                    size_t rows_b, size_t cols_b);

// Throws SolverError(InvalidSeed) on odd length or non-hex characters
std::vector<uint8_t> decode_hex_seed(const std::string& seed_hex);
