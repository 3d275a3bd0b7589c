// MatMul Solver - Main entry point

#include "types.hpp"
#include "cli.hpp"
#include "cpu_capabilities.hpp"
#include "matmul_backend.hpp"
#include "matmul_solver.hpp"
#include "memory_validator.hpp"
#include "output_json.hpp"
#include "runtime_dispatcher.hpp"
#include "seeded_generator.hpp"
#include "version.hpp"

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <exception>
#include <iomanip>
#include <iostream>
#include <string>
#include <utility>

#ifdef _WIN32
#include <windows.h>
#endif

namespace {
bool debug_enabled() {
    const char* env = std::getenv("MMSOLVE_DEBUG");
    return env && env[0] != '\0' && env[0] != '0';
}

void debug_log(const std::string& msg) {
    if (debug_enabled()) {
        std::cerr << "[main] " << msg << "\n";
    }
}

void signal_handler(int sig) {
    std::cerr << "[fatal] signal " << sig << "\n";
    std::cerr.flush();
    std::abort();
}

void terminate_handler() {
    std::cerr << "[fatal] std::terminate called\n";
    std::cerr.flush();
    std::abort();
}

#ifdef _WIN32
LONG WINAPI unhandled_exception_filter(EXCEPTION_POINTERS* info) {
    if (info && info->ExceptionRecord) {
        std::cerr << "[fatal] unhandled exception 0x"
                  << std::hex << info->ExceptionRecord->ExceptionCode
                  << std::dec << "\n";
    } else {
        std::cerr << "[fatal] unhandled exception (unknown)\n";
    }
    std::cerr.flush();
    return EXCEPTION_EXECUTE_HANDLER;
}
#endif

void install_crash_handlers() {
    std::set_terminate(terminate_handler);
    std::signal(SIGSEGV, signal_handler);
    std::signal(SIGILL, signal_handler);
    std::signal(SIGFPE, signal_handler);
#ifdef _WIN32
    SetUnhandledExceptionFilter(unhandled_exception_filter);
#endif
}

double elapsed_ms(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
}

int exit_code(ErrorCode code) {
    return static_cast<int>(code);
}

ErrorCode error_code_for(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::InvalidSeed:
        case ErrorKind::UnsupportedPrecision:
        case ErrorKind::UnsupportedWorkload:
        case ErrorKind::MalformedInput:
            return ErrorCode::InvalidArguments;
        case ErrorKind::AllocationFailed:
            return ErrorCode::OutOfMemory;
        case ErrorKind::DimensionMismatch:
            return ErrorCode::ComputeFailed;
    }
    return ErrorCode::UnknownError;
}
} // namespace

void print_info() {
    const CpuCapabilities& caps = CpuCapabilities::get();
    std::cout << version::get_full_version_string() << "\n\n";
    std::cout << caps.to_string() << "\n\n";
    std::cout << RuntimeDispatcher::get_diagnostics();

    const MatmulBackend* backend = default_backend();
    std::cout << "  Native Backend: " << (backend ? backend->name() : "none") << "\n";
    std::cout << "  Available Memory: "
              << MemoryValidator::format_bytes(MemoryValidator::get_available_memory()) << "\n";
}

void print_summary(const Output& output) {
    const Metrics& metrics = output.metrics;
    std::cout << "Matrix multiplication completed successfully!\n";
    std::cout << std::fixed;
    std::cout << "Latency: " << std::setprecision(4) << metrics.latency_ms << " ms\n";
    std::cout << "Throughput: " << std::setprecision(2) << metrics.throughput_ops_per_sec << " ops/sec\n";
    std::cout << "Result hash: " << output.result_hash << "\n";
    std::cout << "Kernel: " << output.metadata.kernel_path
              << " (" << output.metadata.simd_level << ")\n";

    if (metrics.kernel_time_ms) {
        std::cout << "\nTiming Breakdown:\n";
        std::cout << std::setprecision(4);
        if (metrics.parse_time_ms) {
            std::cout << "  Parse time:     " << *metrics.parse_time_ms << " ms\n";
        }
        std::cout << "  Kernel time:    " << *metrics.kernel_time_ms << " ms (matmul computation)\n";
        if (metrics.serialize_time_ms) {
            std::cout << "  Serialize time: " << *metrics.serialize_time_ms << " ms\n";
        }
    }
}

int run(const Config& config) {
    if (config.force_scalar) {
        RuntimeDispatcher::force_level(SimdLevel::Scalar);
    }

    MemoryRequirement mem = MemoryValidator::validate(config.shape);
    debug_log("Memory check for " + config.shape.to_string() + ": " + mem.to_string());
    if (!mem.sufficient) {
        std::cerr << "Error: Insufficient memory for " << config.shape.to_string()
                  << " (" << mem.to_string() << ")\n";
        return exit_code(ErrorCode::OutOfMemory);
    }

    // Generation stands in for input parsing in the timing breakdown
    const auto parse_start = std::chrono::steady_clock::now();
    MatrixPair pair = generate_seeded_pair_hex(config.seed_hex,
                                               config.shape.M, config.shape.K,
                                               config.shape.K, config.shape.N);
    const double parse_time_ms = elapsed_ms(parse_start);

    Input input;
    input.matrix_a = std::move(pair.first);
    input.matrix_b = std::move(pair.second);
    input.precision = precision_to_string(config.precision);
    InputMetadata metadata;
    metadata.libraries = version::get_linked_libraries();
    metadata.cache_enabled = !config.no_cache;
    input.metadata = metadata;

    Output output = compute(input);
    output = attach_timing(std::move(output), parse_time_ms, std::nullopt);

    const auto serialize_start = std::chrono::steady_clock::now();
    std::string json = format_output_json(output);
    const double serialize_time_ms = elapsed_ms(serialize_start);

    output = attach_timing(std::move(output), parse_time_ms, serialize_time_ms);
    json = format_output_json(output);

    try {
        write_output_json(config.output_path, json);
    } catch (const std::runtime_error& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return exit_code(ErrorCode::OutputFailed);
    }
    debug_log("Wrote " + config.output_path);

    print_summary(output);

    if (config.verify) {
        if (verify(input.matrix_a, input.matrix_b, input.precision, output.result_hash,
                   !config.no_cache)) {
            std::cout << "\nCorrectness verified: Hash matches recomputed result\n";
        } else {
            std::cerr << "\nCorrectness check failed: Hash mismatch!\n";
            return exit_code(ErrorCode::VerificationFailed);
        }
    }

    std::cout << "\nNote: Latency may vary between runs due to system load, CPU scheduling, and cache effects.\n";
    return exit_code(ErrorCode::Success);
}

int main(int argc, char* argv[]) {
    install_crash_handlers();

    ParseResult parsed = parse_args(argc, argv);

    if (parsed.show_help) {
        print_usage(argv[0]);
        return exit_code(ErrorCode::Success);
    }
    if (parsed.show_version) {
        print_version();
        return exit_code(ErrorCode::Success);
    }
    if (parsed.show_info) {
        print_info();
        return exit_code(ErrorCode::Success);
    }
    if (!parsed.success) {
        std::cerr << "Error: " << parsed.error_message << "\n";
        std::cerr << "Run '" << argv[0] << " --help' for usage.\n";
        return exit_code(ErrorCode::InvalidArguments);
    }

    try {
        return run(parsed.config);
    } catch (const SolverError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        debug_log(std::string("Error kind: ") + error_kind_to_string(e.kind()));
        return exit_code(error_code_for(e.kind()));
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return exit_code(ErrorCode::UnknownError);
    }
}
