#pragma once
// MatMul Solver - Operand Cache
//
// Memoizes the packed (transposed, quantized) form of the B operand across
// calls. One slot per packing family, each replaced wholesale on key mismatch:
//   half slot  - fp16 transposed copy
//   int8 slot  - int8 transposed copy (scaled) or u8i8 transposed copy (raw)
// The key combines storage identity, shape, length, pack kind, the int8 scale
// and a 64-bit fingerprint of the operand's contents, so reusing the same
// storage for different data never returns stale packing.

#include "aligned_buffer.hpp"
#include "flat_matrix.hpp"
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>

enum class PackKind {
    HalfTransposed,
    Int8Transposed,
    SaturatedI8Transposed
};

struct OperandKey {
    const void* identity = nullptr;
    size_t rows = 0;
    size_t cols = 0;
    size_t length = 0;
    uint64_t fingerprint = 0;
    float scale = 0.0f;
    PackKind kind = PackKind::HalfTransposed;

    static OperandKey make(const FlatMatrix& m, PackKind kind, float scale = 0.0f);

    // Scales compare within float epsilon
    bool matches(const OperandKey& other) const;
};

// 64-bit non-cryptographic hash of a float buffer's bytes
uint64_t content_fingerprint(const float* data, size_t n);

class OperandCache {
public:
    using HalfPack = std::shared_ptr<const AlignedBuffer<float>>;
    using Int8Pack = std::shared_ptr<const AlignedBuffer<int8_t>>;

    struct Stats {
        uint64_t hits;
        uint64_t misses;
    };

    OperandCache();

    OperandCache(const OperandCache&) = delete;
    OperandCache& operator=(const OperandCache&) = delete;

    // Each getter returns the packed B, rebuilding the slot on a key miss.
    // The returned buffer stays valid for as long as the caller holds it,
    // even if another thread replaces the slot meanwhile.
    // 'hit' (optional) reports whether the slot was reused.
    HalfPack get_half_transposed(const FlatMatrix& b, bool* hit = nullptr);
    Int8Pack get_int8_transposed(const FlatMatrix& b, float scale, bool* hit = nullptr);
    Int8Pack get_saturated_i8_transposed(const FlatMatrix& b, bool* hit = nullptr);

    void clear();

    Stats stats() const;

    // Process-wide instance used by compute() and verify()
    static OperandCache& global();

private:
    template<typename T>
    struct Slot {
        std::mutex mutex;
        bool valid = false;
        OperandKey key;
        std::shared_ptr<const AlignedBuffer<T>> packed;
    };

    template<typename T, typename BuildFn>
    std::shared_ptr<const AlignedBuffer<T>> lookup(Slot<T>& slot, const OperandKey& key,
                                                   BuildFn build, bool* hit);

    Slot<float> half_slot_;
    Slot<int8_t> int8_slot_;
    std::atomic<uint64_t> hits_;
    std::atomic<uint64_t> misses_;
};
