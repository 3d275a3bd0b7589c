// MatMul Solver - Seeded matrix generation

#include "seeded_generator.hpp"
#include "types.hpp"
#include <blake3.h>

namespace {

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

std::vector<uint8_t> decode_hex_seed(const std::string& seed_hex) {
    if (seed_hex.size() % 2 != 0) {
        throw SolverError(ErrorKind::InvalidSeed,
            "Invalid seed: odd number of hex digits (" + std::to_string(seed_hex.size()) + ")");
    }

    std::vector<uint8_t> bytes;
    bytes.reserve(seed_hex.size() / 2);
    for (size_t i = 0; i < seed_hex.size(); i += 2) {
        int hi = hex_value(seed_hex[i]);
        int lo = hex_value(seed_hex[i + 1]);
        if (hi < 0 || lo < 0) {
            size_t bad = hi < 0 ? i : i + 1;
            throw SolverError(ErrorKind::InvalidSeed,
                "Invalid seed: non-hex character '" + std::string(1, seed_hex[bad]) +
                "' at position " + std::to_string(bad));
        }
        bytes.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }
    return bytes;
}

MatrixPair generate_seeded_pair(const uint8_t* seed, size_t seed_len,
                                size_t rows_a, size_t cols_a,
                                size_t rows_b, size_t cols_b) {
    const size_t len_a = MatmulShape::checked_mul(rows_a, cols_a);
    const size_t len_b = MatmulShape::checked_mul(rows_b, cols_b);
    if (len_a > SIZE_MAX - len_b) {
        throw SolverError(ErrorKind::MalformedInput,
            "Seeded matrices too large: " + std::to_string(len_a) + " + " +
            std::to_string(len_b) + " elements");
    }

    std::vector<uint8_t> stream(len_a + len_b);

    blake3_hasher hasher;
    blake3_hasher_init(&hasher);
    blake3_hasher_update(&hasher, seed, seed_len);
    blake3_hasher_finalize_seek(&hasher, 0, stream.data(), stream.size());

    std::vector<float> a(len_a);
    for (size_t i = 0; i < len_a; ++i) {
        a[i] = static_cast<float>(stream[i]);
    }

    std::vector<float> b(len_b);
    for (size_t i = 0; i < len_b; ++i) {
        b[i] = static_cast<float>(static_cast<int>(stream[len_a + i]) - 128);
    }

    return MatrixPair(FlatMatrix(std::move(a), rows_a, cols_a),
                      FlatMatrix(std::move(b), rows_b, cols_b));
}

MatrixPair generate_seeded_pair(const std::vector<uint8_t>& seed,
                                size_t rows_a, size_t cols_a,
                                size_t rows_b, size_t cols_b) {
    return generate_seeded_pair(seed.data(), seed.size(), rows_a, cols_a, rows_b, cols_b);
}

MatrixPair generate_seeded_pair_hex(const std::string& seed_hex,
                                    size_t rows_a, size_t cols_a,
                                    size_t rows_b, size_t cols_b) {
    const std::vector<uint8_t> seed = decode_hex_seed(seed_hex);
    return generate_seeded_pair(seed, rows_a, cols_a, rows_b, cols_b);
}
