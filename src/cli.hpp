#pragma once
// MatMul Solver - CLI parsing module

#include "types.hpp"
#include "version.hpp"
#include <string>
#include <iostream>
#include <cstring>

inline void print_version() {
    std::cout << version::get_full_version_string() << "\n";
}

inline void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " --seed=HEX --precision=P [options]\n\n";
    std::cout << "Options:\n";
    std::cout << "  --seed=HEX        Seed for BLAKE3 matrix generation (hex, may be empty)\n";
    std::cout << "  --precision=P     Precision: fp32, fp16, int8, u8i8\n";
    std::cout << "  --size=MxKxN      Workload shape (default: 16x50240x16)\n";
    std::cout << "  --output=FILE     JSON report path (default: outputs/output.json)\n";
    std::cout << "  --verify          Recompute the product and compare hashes\n";
    std::cout << "  --no-cache        Do not reuse packed operands\n";
    std::cout << "  --force-scalar    Use the scalar dot-product kernels\n";
    std::cout << "  --info            Show CPU and kernel selection details\n";
    std::cout << "  --version         Show version information\n";
    std::cout << "  --help            Show this help message\n";
    std::cout << "\nEnvironment:\n";
    std::cout << "  MMSOLVE_DEBUG=1         Diagnostic logging on stderr\n";
    std::cout << "  MMSOLVE_FORCE_SCALAR=1  Same as --force-scalar\n";
    std::cout << "  MMSOLVE_NO_BLAS=1       Ignore the native BLAS backend\n";
    std::cout << "  MMSOLVE_NO_CACHE=1      Same as --no-cache\n";
    std::cout << "\nExamples:\n";
    std::cout << "  " << program_name << " --seed=00ff --precision=u8i8 --verify\n";
    std::cout << "  " << program_name << " --seed=abcd --precision=fp32 --size=64x256x64\n";
}

struct ParseResult {
    Config config;
    bool success = true;
    bool show_help = false;
    bool show_version = false;
    bool show_info = false;
    std::string error_message;
};

// Helper to extract value from --key=value argument
inline bool extract_arg_value(const char* arg, const char* key, std::string& value) {
    size_t key_len = std::strlen(key);
    if (std::strncmp(arg, key, key_len) == 0 && arg[key_len] == '=') {
        value = arg + key_len + 1;
        return true;
    }
    return false;
}

inline bool validate_config(const Config& config, std::string& error) {
    if (!config.seed_set) {
        error = "--seed is required";
        return false;
    }
    if (!config.precision_set) {
        error = "--precision is required when using --seed";
        return false;
    }
    if (config.shape.M == 0 || config.shape.K == 0 || config.shape.N == 0) {
        error = "Size dimensions must be greater than 0";
        return false;
    }
    try {
        config.shape.total_elements();
    } catch (const SolverError& e) {
        error = "Size overflow: the specified dimensions are too large. " + std::string(e.what());
        return false;
    }
    if (config.output_path.empty()) {
        error = "--output must name a file";
        return false;
    }
    return true;
}

inline ParseResult parse_args(int argc, char* argv[]) {
    ParseResult result;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        std::string value;

        if (arg == "--help" || arg == "-h") {
            result.show_help = true;
            return result;
        }
        if (arg == "--version" || arg == "-v") {
            result.show_version = true;
            return result;
        }
        if (arg == "--info") {
            result.show_info = true;
            return result;
        }

        try {
            if (extract_arg_value(argv[i], "--seed", value)) {
                result.config.seed_hex = value;
                result.config.seed_set = true;
            }
            else if (extract_arg_value(argv[i], "--precision", value)) {
                result.config.precision = string_to_precision(value);
                result.config.precision_set = true;
            }
            else if (extract_arg_value(argv[i], "--size", value)) {
                result.config.shape = MatmulShape::parse(value);
            }
            else if (extract_arg_value(argv[i], "--output", value)) {
                result.config.output_path = value;
            }
            else if (arg == "--verify") {
                result.config.verify = true;
            }
            else if (arg == "--no-cache") {
                result.config.no_cache = true;
            }
            else if (arg == "--force-scalar") {
                result.config.force_scalar = true;
            }
            else {
                result.success = false;
                result.error_message = "Unknown argument: " + arg;
                return result;
            }
        } catch (const std::exception& e) {
            result.success = false;
            result.error_message = "Error parsing argument '" + arg + "': " + e.what();
            return result;
        }
    }

    std::string validation_error;
    if (!validate_config(result.config, validation_error)) {
        result.success = false;
        result.error_message = validation_error;
    }

    return result;
}
