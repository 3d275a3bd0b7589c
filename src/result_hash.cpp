// MatMul Solver - Result hashing

#include "result_hash.hpp"
#include <cstring>
#include <iomanip>
#include <sstream>

namespace sha256 {

namespace {

// SHA-256 constants
constexpr std::array<uint32_t, 64> K = {
    0x428a2f98, 0x71374491, 0xb5c0fbcf, 0xe9b5dba5, 0x3956c25b, 0x59f111f1, 0x923f82a4, 0xab1c5ed5,
    0xd807aa98, 0x12835b01, 0x243185be, 0x550c7dc3, 0x72be5d74, 0x80deb1fe, 0x9bdc06a7, 0xc19bf174,
    0xe49b69c1, 0xefbe4786, 0x0fc19dc6, 0x240ca1cc, 0x2de92c6f, 0x4a7484aa, 0x5cb0a9dc, 0x76f988da,
    0x983e5152, 0xa831c66d, 0xb00327c8, 0xbf597fc7, 0xc6e00bf3, 0xd5a79147, 0x06ca6351, 0x14292967,
    0x27b70a85, 0x2e1b2138, 0x4d2c6dfc, 0x53380d13, 0x650a7354, 0x766a0abb, 0x81c2c92e, 0x92722c85,
    0xa2bfe8a1, 0xa81a664b, 0xc24b8b70, 0xc76c51a3, 0xd192e819, 0xd6990624, 0xf40e3585, 0x106aa070,
    0x19a4c116, 0x1e376c08, 0x2748774c, 0x34b0bcb5, 0x391c0cb3, 0x4ed8aa4a, 0x5b9cca4f, 0x682e6ff3,
    0x748f82ee, 0x78a5636f, 0x84c87814, 0x8cc70208, 0x90befffa, 0xa4506ceb, 0xbef9a3f7, 0xc67178f2
};

inline uint32_t rotr(uint32_t x, uint32_t n) { return (x >> n) | (x << (32 - n)); }
inline uint32_t ch(uint32_t x, uint32_t y, uint32_t z) { return (x & y) ^ (~x & z); }
inline uint32_t maj(uint32_t x, uint32_t y, uint32_t z) { return (x & y) ^ (x & z) ^ (y & z); }
inline uint32_t sig0(uint32_t x) { return rotr(x, 2) ^ rotr(x, 13) ^ rotr(x, 22); }
inline uint32_t sig1(uint32_t x) { return rotr(x, 6) ^ rotr(x, 11) ^ rotr(x, 25); }
inline uint32_t gam0(uint32_t x) { return rotr(x, 7) ^ rotr(x, 18) ^ (x >> 3); }
inline uint32_t gam1(uint32_t x) { return rotr(x, 17) ^ rotr(x, 19) ^ (x >> 10); }

} // namespace

Hasher::Hasher()
    : h_{0x6a09e667, 0xbb67ae85, 0x3c6ef372, 0xa54ff53a,
         0x510e527f, 0x9b05688c, 0x1f83d9ab, 0x5be0cd19}
    , buffer_{}
    , buffer_len_(0)
    , total_len_(0) {
}

void Hasher::process_block(const uint8_t* block) {
    uint32_t w[64];
    for (int i = 0; i < 16; ++i) {
        w[i] = (static_cast<uint32_t>(block[i*4]) << 24) |
               (static_cast<uint32_t>(block[i*4 + 1]) << 16) |
               (static_cast<uint32_t>(block[i*4 + 2]) << 8) |
               static_cast<uint32_t>(block[i*4 + 3]);
    }
    for (int i = 16; i < 64; ++i) {
        w[i] = gam1(w[i-2]) + w[i-7] + gam0(w[i-15]) + w[i-16];
    }

    uint32_t a = h_[0], b = h_[1], c = h_[2], d = h_[3];
    uint32_t e = h_[4], f = h_[5], g = h_[6], hh = h_[7];

    for (int i = 0; i < 64; ++i) {
        uint32_t t1 = hh + sig1(e) + ch(e, f, g) + K[i] + w[i];
        uint32_t t2 = sig0(a) + maj(a, b, c);
        hh = g; g = f; f = e; e = d + t1;
        d = c; c = b; b = a; a = t1 + t2;
    }
    h_[0] += a; h_[1] += b; h_[2] += c; h_[3] += d;
    h_[4] += e; h_[5] += f; h_[6] += g; h_[7] += hh;
}

void Hasher::update(const void* data, size_t len) {
    const uint8_t* bytes = static_cast<const uint8_t*>(data);
    total_len_ += len;

    // Top up a partial block first
    if (buffer_len_ > 0) {
        size_t take = 64 - buffer_len_;
        if (take > len) take = len;
        std::memcpy(buffer_ + buffer_len_, bytes, take);
        buffer_len_ += take;
        bytes += take;
        len -= take;
        if (buffer_len_ < 64) {
            return;
        }
        process_block(buffer_);
        buffer_len_ = 0;
    }

    while (len >= 64) {
        process_block(bytes);
        bytes += 64;
        len -= 64;
    }

    if (len > 0) {
        std::memcpy(buffer_, bytes, len);
        buffer_len_ = len;
    }
}

std::array<uint8_t, 32> Hasher::finalize() {
    // Padding: 0x80, zeros up to 56 mod 64, then the bit length big-endian
    const uint64_t bit_len = total_len_ * 8;
    uint8_t pad[72] = {0x80};
    size_t pad_len = (buffer_len_ < 56) ? (56 - buffer_len_) : (120 - buffer_len_);
    for (int i = 0; i < 8; ++i) {
        pad[pad_len + i] = static_cast<uint8_t>((bit_len >> ((7 - i) * 8)) & 0xff);
    }
    update(pad, pad_len + 8);

    std::array<uint8_t, 32> digest{};
    for (int i = 0; i < 8; ++i) {
        digest[i*4] = static_cast<uint8_t>(h_[i] >> 24);
        digest[i*4 + 1] = static_cast<uint8_t>(h_[i] >> 16);
        digest[i*4 + 2] = static_cast<uint8_t>(h_[i] >> 8);
        digest[i*4 + 3] = static_cast<uint8_t>(h_[i]);
    }
    return digest;
}

std::string Hasher::hex_digest() {
    std::array<uint8_t, 32> digest = finalize();
    std::ostringstream oss;
    for (uint8_t byte : digest) {
        oss << std::hex << std::setfill('0') << std::setw(2) << static_cast<int>(byte);
    }
    return oss.str();
}

std::string hash(const std::string& input) {
    Hasher hasher;
    hasher.update(input.data(), input.size());
    return hasher.hex_digest();
}

} // namespace sha256

std::string compute_result_hash(const FlatMatrix& m) {
    sha256::Hasher hasher;
    uint8_t chunk[4 * 256];
    size_t filled = 0;
    for (float v : m.data) {
        uint32_t bits;
        std::memcpy(&bits, &v, sizeof(bits));
        chunk[filled++] = static_cast<uint8_t>(bits);
        chunk[filled++] = static_cast<uint8_t>(bits >> 8);
        chunk[filled++] = static_cast<uint8_t>(bits >> 16);
        chunk[filled++] = static_cast<uint8_t>(bits >> 24);
        if (filled == sizeof(chunk)) {
            hasher.update(chunk, filled);
            filled = 0;
        }
    }
    hasher.update(chunk, filled);
    return hasher.hex_digest();
}
