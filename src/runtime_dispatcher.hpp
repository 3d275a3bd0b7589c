#pragma once
// MatMul Solver - Runtime SIMD Dispatcher

// Provides runtime selection of dot-product kernels based on CPU capabilities

#include <string>
#include "cpu_capabilities.hpp"
#include "kernels/dot_common.hpp"

// Selects the dot-product implementations once, at first use.
// MMSOLVE_FORCE_SCALAR pins the scalar kernels at initialization.
class RuntimeDispatcher {
public:
    // Detect capabilities and select kernels; safe to call from several threads
    static void initialize();

    static bool is_initialized();

    static SimdLevel get_active_level();

    static const char* get_active_level_name();

    static DotF32Fn get_dot_f32();
    static DotI8Fn get_dot_i8();
    static DotU8I8Fn get_dot_u8i8();

    // Name of the u8i8 kernel in use, distinguishes the VNNI variant
    static const char* get_u8i8_kernel_name();

    static bool is_level_supported(SimdLevel level);

    // Force a specific SIMD level (tests, --force-scalar).
    // Throws std::invalid_argument if the CPU cannot run that level.
    // Process-wide; call while no kernel is running.
    static void force_level(SimdLevel level);

    static void reset_to_auto();

    static std::string get_diagnostics();

private:
    static bool initialized_;
    static SimdLevel active_level_;
    static SimdLevel detected_level_;
    static bool forced_;

    static DotF32Fn dot_f32_;
    static DotI8Fn dot_i8_;
    static DotU8I8Fn dot_u8i8_;
    static const char* u8i8_name_;

    static void select_kernels(SimdLevel level);
    static void initialize_locked();
};
