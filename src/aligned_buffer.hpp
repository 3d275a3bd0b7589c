#pragma once
// MatMul Solver - Cache-line aligned buffers

#include "types.hpp"
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <string>

#ifdef _WIN32
    #include <malloc.h>
#endif

// Cache line size (64 bytes on x86-64 and most ARM64)
constexpr size_t CACHE_LINE_SIZE = 64;

// Allocate cache-aligned memory
// Returns nullptr on failure or for a zero-byte request
inline void* aligned_alloc_cache(size_t size) {
    if (size == 0) {
        return nullptr;
    }

#ifdef _WIN32
    return _aligned_malloc(size, CACHE_LINE_SIZE);
#else
    // Round up so the whole last line belongs to this block
    size_t aligned_size = ((size + CACHE_LINE_SIZE - 1) / CACHE_LINE_SIZE) * CACHE_LINE_SIZE;
    void* ptr = nullptr;
    if (posix_memalign(&ptr, CACHE_LINE_SIZE, aligned_size) != 0) {
        return nullptr;
    }
    return ptr;
#endif
}

inline void aligned_free_cache(void* ptr) {
    if (ptr == nullptr) {
        return;
    }

#ifdef _WIN32
    _aligned_free(ptr);
#else
    free(ptr);
#endif
}

inline bool is_cache_aligned(const void* ptr) {
    return (reinterpret_cast<uintptr_t>(ptr) % CACHE_LINE_SIZE) == 0;
}

// RAII owner of a 64-byte aligned block of 'count' elements of T.
// T must be trivially constructible; contents start zeroed.
// Throws SolverError(AllocationFailed) when the allocation cannot be satisfied.
template<typename T>
class AlignedBuffer {
public:
    AlignedBuffer() : data_(nullptr), count_(0) {}

    explicit AlignedBuffer(size_t count)
        : data_(nullptr)
        , count_(count)
    {
        if (count == 0) {
            return;
        }
        if (count > SIZE_MAX / sizeof(T)) {
            throw SolverError(ErrorKind::AllocationFailed,
                "Aligned allocation of " + std::to_string(count) + " elements overflows");
        }
        data_ = static_cast<T*>(aligned_alloc_cache(count * sizeof(T)));
        if (data_ == nullptr) {
            throw SolverError(ErrorKind::AllocationFailed,
                "Failed to allocate " + std::to_string(count * sizeof(T)) +
                " bytes aligned to " + std::to_string(CACHE_LINE_SIZE));
        }
        fill(T(0));
    }

    ~AlignedBuffer() {
        aligned_free_cache(data_);
    }

    // Non-copyable
    AlignedBuffer(const AlignedBuffer&) = delete;
    AlignedBuffer& operator=(const AlignedBuffer&) = delete;

    AlignedBuffer(AlignedBuffer&& other) noexcept
        : data_(other.data_)
        , count_(other.count_)
    {
        other.data_ = nullptr;
        other.count_ = 0;
    }

    AlignedBuffer& operator=(AlignedBuffer&& other) noexcept {
        if (this != &other) {
            aligned_free_cache(data_);
            data_ = other.data_;
            count_ = other.count_;
            other.data_ = nullptr;
            other.count_ = 0;
        }
        return *this;
    }

    T* data() { return data_; }
    const T* data() const { return data_; }

    T& operator[](size_t i) { return data_[i]; }
    const T& operator[](size_t i) const { return data_[i]; }

    size_t count() const { return count_; }
    size_t size_bytes() const { return count_ * sizeof(T); }
    bool is_aligned() const { return is_cache_aligned(data_); }

    void fill(T value) {
        for (size_t i = 0; i < count_; ++i) {
            data_[i] = value;
        }
    }

private:
    T* data_;
    size_t count_;
};
