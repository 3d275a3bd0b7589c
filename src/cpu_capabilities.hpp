#pragma once
// MatMul Solver - CPU Capabilities Detection

#include <string>

// Platform-specific includes for CPUID
#ifdef _WIN32
    #include <intrin.h>
#elif defined(__linux__) || defined(__APPLE__)
    #if defined(__x86_64__) || defined(__i386__)
        #include <cpuid.h>
    #endif
#endif

#if defined(__x86_64__) || defined(_M_X64) || defined(__i386__) || defined(_M_IX86)
    #define MMSOLVE_ARCH_X86 1
#elif defined(__aarch64__) || defined(_M_ARM64)
    #define MMSOLVE_ARCH_ARM64 1
#endif

// Dot-product implementation levels, in ascending preference per architecture
enum class SimdLevel {
    Scalar = 0,
    SSE2 = 1,
    AVX2 = 2,
    AVX512 = 3,
    NEON = 10
};

inline std::string simd_level_to_string(SimdLevel level) {
    switch (level) {
        case SimdLevel::Scalar: return "Scalar";
        case SimdLevel::SSE2: return "SSE2";
        case SimdLevel::AVX2: return "AVX2";
        case SimdLevel::AVX512: return "AVX-512";
        case SimdLevel::NEON: return "ARM NEON";
    }
    return "Unknown";
}

struct CpuCapabilities {
    // x86-64 SIMD
    bool has_sse2;
    bool has_avx2;
    bool has_fma;
    bool has_avx512f;
    bool has_avx512bw;
    bool has_avx512_vnni;

    // ARM64 SIMD
    bool has_arm_neon;

    // Singleton accessor with caching
    static const CpuCapabilities& get();

    // Highest level whose kernels can run on this CPU
    SimdLevel get_simd_level() const;

    bool supports(SimdLevel level) const;

    std::string to_string() const;

private:
    CpuCapabilities();
    static CpuCapabilities detect();
};

#if defined(MMSOLVE_ARCH_X86)

struct CpuidRegs {
    unsigned int eax, ebx, ecx, edx;
};

// Returns false when the leaf is not available
inline bool read_cpuid(unsigned int leaf, unsigned int subleaf, CpuidRegs& regs) {
#ifdef _WIN32
    int info[4] = {0};
    __cpuid(info, 0);
    if (static_cast<unsigned int>(info[0]) < leaf) return false;
    __cpuidex(info, static_cast<int>(leaf), static_cast<int>(subleaf));
    regs.eax = static_cast<unsigned int>(info[0]);
    regs.ebx = static_cast<unsigned int>(info[1]);
    regs.ecx = static_cast<unsigned int>(info[2]);
    regs.edx = static_cast<unsigned int>(info[3]);
    return true;
#else
    if (static_cast<unsigned int>(__get_cpuid_max(0, nullptr)) < leaf) return false;
    __cpuid_count(leaf, subleaf, regs.eax, regs.ebx, regs.ecx, regs.edx);
    return true;
#endif
}

// XCR0 state mask the OS enables, 0 when OSXSAVE is off
inline unsigned long long read_xcr0() {
    CpuidRegs regs{};
    if (!read_cpuid(1, 0, regs)) return 0;
    if ((regs.ecx & (1u << 27)) == 0) return 0;
#ifdef _WIN32
    return _xgetbv(0);
#else
    unsigned int xcr0_lo, xcr0_hi;
    __asm__ __volatile__ (
        "xgetbv"
        : "=a"(xcr0_lo), "=d"(xcr0_hi)
        : "c"(0)
    );
    return (static_cast<unsigned long long>(xcr0_hi) << 32) | xcr0_lo;
#endif
}

#endif

inline CpuCapabilities CpuCapabilities::detect() {
    CpuCapabilities caps;

#if defined(MMSOLVE_ARCH_X86)
    CpuidRegs leaf1{};
    CpuidRegs leaf7{};
    bool have_leaf1 = read_cpuid(1, 0, leaf1);
    bool have_leaf7 = read_cpuid(7, 0, leaf7);

    unsigned long long xcr0 = read_xcr0();
    bool os_avx = (xcr0 & 0x6) == 0x6;          // XMM and YMM state
    bool os_avx512 = (xcr0 & 0xE6) == 0xE6;     // plus opmask and ZMM state

    if (have_leaf1) {
        caps.has_sse2 = (leaf1.edx & (1u << 26)) != 0;
        caps.has_fma = os_avx && (leaf1.ecx & (1u << 12)) != 0;
    }
    if (have_leaf7) {
        caps.has_avx2 = os_avx && (leaf7.ebx & (1u << 5)) != 0;
        caps.has_avx512f = os_avx512 && (leaf7.ebx & (1u << 16)) != 0;
        caps.has_avx512bw = os_avx512 && (leaf7.ebx & (1u << 30)) != 0;
        caps.has_avx512_vnni = os_avx512 && (leaf7.ecx & (1u << 11)) != 0;
    }
#elif defined(MMSOLVE_ARCH_ARM64) || defined(__ARM_NEON) || defined(__ARM_NEON__)
    // ARM64 always has NEON
    caps.has_arm_neon = true;
#endif

    return caps;
}

inline CpuCapabilities::CpuCapabilities()
    : has_sse2(false)
    , has_avx2(false)
    , has_fma(false)
    , has_avx512f(false)
    , has_avx512bw(false)
    , has_avx512_vnni(false)
    , has_arm_neon(false) {
}

// Thread-safe lazy initialization
inline const CpuCapabilities& CpuCapabilities::get() {
    static const CpuCapabilities instance = detect();
    return instance;
}

inline bool CpuCapabilities::supports(SimdLevel level) const {
    switch (level) {
        case SimdLevel::Scalar: return true;
        case SimdLevel::SSE2: return has_sse2;
        case SimdLevel::AVX2: return has_avx2;
        // The AVX-512 integer kernels need BW for byte/word lanes
        case SimdLevel::AVX512: return has_avx512f && has_avx512bw && has_avx2;
        case SimdLevel::NEON: return has_arm_neon;
    }
    return false;
}

inline SimdLevel CpuCapabilities::get_simd_level() const {
#if defined(MMSOLVE_ARCH_X86)
    if (supports(SimdLevel::AVX512)) return SimdLevel::AVX512;
    if (supports(SimdLevel::AVX2)) return SimdLevel::AVX2;
    if (supports(SimdLevel::SSE2)) return SimdLevel::SSE2;
    return SimdLevel::Scalar;
#else
    if (supports(SimdLevel::NEON)) return SimdLevel::NEON;
    return SimdLevel::Scalar;
#endif
}

inline std::string CpuCapabilities::to_string() const {
    std::string result = "SIMD Capabilities:\n";

#if defined(MMSOLVE_ARCH_X86)
    result += "  SSE2:         " + std::string(has_sse2 ? "Yes" : "No") + "\n";
    result += "  AVX2:         " + std::string(has_avx2 ? "Yes" : "No") + "\n";
    result += "  FMA:          " + std::string(has_fma ? "Yes" : "No") + "\n";
    result += "  AVX-512F:     " + std::string(has_avx512f ? "Yes" : "No") + "\n";
    result += "  AVX-512BW:    " + std::string(has_avx512bw ? "Yes" : "No") + "\n";
    result += "  AVX-512 VNNI: " + std::string(has_avx512_vnni ? "Yes" : "No") + "\n";
#else
    result += "  ARM NEON:     " + std::string(has_arm_neon ? "Yes" : "No") + "\n";
#endif

    result += "  Best Level:   " + simd_level_to_string(get_simd_level());
    return result;
}
