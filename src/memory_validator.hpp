#pragma once
// MatMul Solver - Memory Validator

#include "types.hpp"
#include <cstddef>
#include <istream>
#include <string>

// Memory requirement result structure
struct MemoryRequirement {
    size_t required_bytes;      // Peak memory for generation plus compute
    size_t available_bytes;     // Available system memory, 0 if unknown
    bool sufficient;            // True if available >= required (or unknown)

    std::string to_string() const;
};

// Validates that a seeded workload fits in memory before anything is allocated
class MemoryValidator {
public:
    // Peak bytes for an (M x K) * (K x N) seeded workload:
    //   A, B and C as f32
    //   + the XOF byte stream (M*K + K*N bytes)
    //   + one packed copy of B (K*N f32, the widest packing)
    // Throws SolverError(MalformedInput) if the calculation would overflow
    static size_t estimate_required_memory(const MatmulShape& shape);

    // MemAvailable from /proc/meminfo, sysinfo freeram as fallback.
    // 0 when neither is readable or on platforms other than Linux.
    static size_t get_available_memory();

    // Bytes from the "MemAvailable: <n> kB" line of a /proc/meminfo stream, 0 if absent
    static size_t parse_mem_available(std::istream& meminfo);

    static MemoryRequirement validate(const MatmulShape& shape);

    // "512 B", "1.50 KB", "3.00 GB"
    static std::string format_bytes(size_t bytes);
};
