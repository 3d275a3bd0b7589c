#pragma once
// MatMul Solver - Core types and enums

#include <string>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <sstream>

// Numeric precision of a multiplication
enum class Precision {
    FP32,       // 32-bit floating-point
    FP16,       // IEEE half, half accumulation on the generic path
    INT8,       // symmetric per-tensor int8 quantization
    U8I8        // A as u8, B as i8, no quantization
};

// Error taxonomy for solver failures
enum class ErrorKind {
    DimensionMismatch,
    UnsupportedPrecision,
    UnsupportedWorkload,
    InvalidSeed,
    MalformedInput,
    AllocationFailed
};

inline const char* error_kind_to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::DimensionMismatch: return "DimensionMismatch";
        case ErrorKind::UnsupportedPrecision: return "UnsupportedPrecision";
        case ErrorKind::UnsupportedWorkload: return "UnsupportedWorkload";
        case ErrorKind::InvalidSeed: return "InvalidSeed";
        case ErrorKind::MalformedInput: return "MalformedInput";
        case ErrorKind::AllocationFailed: return "AllocationFailed";
    }
    return "Unknown";
}

// Exception type raised by every solver operation
class SolverError : public std::runtime_error {
public:
    SolverError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

// Process exit codes
enum class ErrorCode {
    Success = 0,
    InvalidArguments = 1,
    OutOfMemory = 2,
    ComputeFailed = 3,
    VerificationFailed = 4,
    OutputFailed = 5,
    UnknownError = 99
};

// Shape of a seeded workload: (M x K) * (K x N)
struct MatmulShape {
    size_t M;
    size_t K;
    size_t N;

    // Element count of A, B and C together
    // Throws SolverError(MalformedInput) if the count overflows size_t
    size_t total_elements() const {
        size_t a = checked_mul(M, K);
        size_t b = checked_mul(K, N);
        size_t c = checked_mul(M, N);
        if (a > SIZE_MAX - b || a + b > SIZE_MAX - c) {
            throw SolverError(ErrorKind::MalformedInput,
                "Size overflow: " + to_string() + " exceeds SIZE_MAX elements");
        }
        return a + b + c;
    }

    // Parse from string "MxKxN" format
    static MatmulShape parse(const std::string& s) {
        MatmulShape result{0, 0, 0};
        char sep1 = 0, sep2 = 0;
        std::istringstream iss(s);
        if (!(iss >> result.M >> sep1 >> result.K >> sep2 >> result.N) ||
            sep1 != 'x' || sep2 != 'x' || !iss.eof()) {
            throw std::invalid_argument("Invalid size format. Expected MxKxN");
        }
        return result;
    }

    std::string to_string() const {
        return std::to_string(M) + "x" + std::to_string(K) + "x" + std::to_string(N);
    }

    static size_t checked_mul(size_t a, size_t b) {
        if (a != 0 && b > SIZE_MAX / a) {
            throw SolverError(ErrorKind::MalformedInput,
                "Size overflow: " + std::to_string(a) + " * " + std::to_string(b) +
                " exceeds SIZE_MAX");
        }
        return a * b;
    }
};

// Command-line configuration
struct Config {
    std::string seed_hex;
    bool seed_set = false;
    MatmulShape shape = {16, 50240, 16};
    Precision precision = Precision::U8I8;
    bool precision_set = false;
    std::string output_path = "outputs/output.json";
    bool verify = false;
    bool no_cache = false;
    bool force_scalar = false;
};

// Helper functions for enum conversion
inline std::string precision_to_string(Precision p) {
    switch (p) {
        case Precision::FP32: return "fp32";
        case Precision::FP16: return "fp16";
        case Precision::INT8: return "int8";
        case Precision::U8I8: return "u8i8";
    }
    return "unknown";
}

// Throws SolverError(UnsupportedPrecision) for anything but the four tags
inline Precision string_to_precision(const std::string& s) {
    if (s == "fp32") return Precision::FP32;
    if (s == "fp16") return Precision::FP16;
    if (s == "int8") return Precision::INT8;
    if (s == "u8i8") return Precision::U8I8;
    throw SolverError(ErrorKind::UnsupportedPrecision, "Unsupported precision: " + s);
}
