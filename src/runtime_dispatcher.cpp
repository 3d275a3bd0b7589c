// MatMul Solver - Runtime SIMD Dispatcher Implementation

#include "runtime_dispatcher.hpp"
#include <cstdlib>
#include <iostream>
#include <mutex>
#include <sstream>
#include <stdexcept>

namespace {
std::mutex dispatcher_mutex;

bool env_flag(const char* name) {
    const char* env = std::getenv(name);
    return env && env[0] != '\0' && env[0] != '0';
}

void dispatcher_debug_log(const std::string& msg) {
    if (env_flag("MMSOLVE_DEBUG")) {
        std::cerr << "[RuntimeDispatcher] " << msg << "\n";
    }
}
} // namespace

// Static member initialization
bool RuntimeDispatcher::initialized_ = false;
SimdLevel RuntimeDispatcher::active_level_ = SimdLevel::Scalar;
SimdLevel RuntimeDispatcher::detected_level_ = SimdLevel::Scalar;
bool RuntimeDispatcher::forced_ = false;

DotF32Fn RuntimeDispatcher::dot_f32_ = nullptr;
DotI8Fn RuntimeDispatcher::dot_i8_ = nullptr;
DotU8I8Fn RuntimeDispatcher::dot_u8i8_ = nullptr;
const char* RuntimeDispatcher::u8i8_name_ = "scalar";

void RuntimeDispatcher::initialize() {
    std::lock_guard<std::mutex> lock(dispatcher_mutex);
    initialize_locked();
}

void RuntimeDispatcher::initialize_locked() {
    if (initialized_) {
        return;
    }

    const auto& caps = CpuCapabilities::get();
    detected_level_ = caps.get_simd_level();
    active_level_ = detected_level_;

    if (env_flag("MMSOLVE_FORCE_SCALAR")) {
        active_level_ = SimdLevel::Scalar;
        forced_ = true;
    }

    select_kernels(active_level_);
    initialized_ = true;

    dispatcher_debug_log("Initialized with SIMD level: " + simd_level_to_string(active_level_) +
                         (forced_ ? " (forced)" : ""));
}

bool RuntimeDispatcher::is_initialized() {
    std::lock_guard<std::mutex> lock(dispatcher_mutex);
    return initialized_;
}

SimdLevel RuntimeDispatcher::get_active_level() {
    std::lock_guard<std::mutex> lock(dispatcher_mutex);
    initialize_locked();
    return active_level_;
}

const char* RuntimeDispatcher::get_active_level_name() {
    switch (get_active_level()) {
        case SimdLevel::Scalar: return "Scalar";
        case SimdLevel::SSE2: return "SSE2";
        case SimdLevel::AVX2: return "AVX2";
        case SimdLevel::AVX512: return "AVX-512";
        case SimdLevel::NEON: return "ARM NEON";
    }
    return "Unknown";
}

void RuntimeDispatcher::select_kernels(SimdLevel level) {
    // All cases are always compiled. Kernel functions for other architectures
    // are stubs that fall back to scalar.
    switch (level) {
        case SimdLevel::AVX512:
            dot_f32_ = kernels::avx2::dot_f32;     // same lane order as every level
            dot_i8_ = kernels::avx512::dot_i8;
            if (CpuCapabilities::get().has_avx512_vnni) {
                dot_u8i8_ = kernels::avx512::dot_u8i8_vnni;
                u8i8_name_ = "avx512-vnni";
            } else {
                dot_u8i8_ = kernels::avx512::dot_u8i8;
                u8i8_name_ = "avx512bw";
            }
            break;

        case SimdLevel::AVX2:
            dot_f32_ = kernels::avx2::dot_f32;
            dot_i8_ = kernels::avx2::dot_i8;
            dot_u8i8_ = kernels::avx2::dot_u8i8;
            u8i8_name_ = "avx2";
            break;

        case SimdLevel::SSE2:
            dot_f32_ = kernels::sse2::dot_f32;
            dot_i8_ = kernels::sse2::dot_i8;
            dot_u8i8_ = kernels::sse2::dot_u8i8;
            u8i8_name_ = "sse2";
            break;

        case SimdLevel::NEON:
            dot_f32_ = kernels::neon::dot_f32;
            dot_i8_ = kernels::neon::dot_i8;
            dot_u8i8_ = kernels::neon::dot_u8i8;
            u8i8_name_ = "neon";
            break;

        case SimdLevel::Scalar:
        default:
            dot_f32_ = kernels::scalar::dot_f32;
            dot_i8_ = kernels::scalar::dot_i8;
            dot_u8i8_ = kernels::scalar::dot_u8i8;
            u8i8_name_ = "scalar";
            break;
    }
}

DotF32Fn RuntimeDispatcher::get_dot_f32() {
    std::lock_guard<std::mutex> lock(dispatcher_mutex);
    initialize_locked();
    return dot_f32_;
}

DotI8Fn RuntimeDispatcher::get_dot_i8() {
    std::lock_guard<std::mutex> lock(dispatcher_mutex);
    initialize_locked();
    return dot_i8_;
}

DotU8I8Fn RuntimeDispatcher::get_dot_u8i8() {
    std::lock_guard<std::mutex> lock(dispatcher_mutex);
    initialize_locked();
    return dot_u8i8_;
}

const char* RuntimeDispatcher::get_u8i8_kernel_name() {
    std::lock_guard<std::mutex> lock(dispatcher_mutex);
    initialize_locked();
    return u8i8_name_;
}

bool RuntimeDispatcher::is_level_supported(SimdLevel level) {
    return CpuCapabilities::get().supports(level);
}

void RuntimeDispatcher::force_level(SimdLevel level) {
    if (!is_level_supported(level)) {
        throw std::invalid_argument("SIMD level not supported on this CPU: " +
                                    simd_level_to_string(level));
    }

    std::lock_guard<std::mutex> lock(dispatcher_mutex);
    initialize_locked();
    active_level_ = level;
    forced_ = true;
    select_kernels(level);

    dispatcher_debug_log("Forced SIMD level: " + simd_level_to_string(level));
}

void RuntimeDispatcher::reset_to_auto() {
    std::lock_guard<std::mutex> lock(dispatcher_mutex);
    initialize_locked();
    active_level_ = detected_level_;
    forced_ = false;
    select_kernels(active_level_);

    dispatcher_debug_log("Reset to auto-detected level: " + simd_level_to_string(active_level_));
}

std::string RuntimeDispatcher::get_diagnostics() {
    std::lock_guard<std::mutex> lock(dispatcher_mutex);
    initialize_locked();

    std::ostringstream oss;
    oss << "RuntimeDispatcher Diagnostics:\n";
    oss << "  Detected Level: " << simd_level_to_string(detected_level_) << "\n";
    oss << "  Active Level: " << simd_level_to_string(active_level_) << "\n";
    oss << "  Forced: " << (forced_ ? "Yes" : "No") << "\n";
    oss << "  u8i8 Kernel: " << u8i8_name_ << "\n";
    return oss.str();
}
