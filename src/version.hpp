#pragma once
// MatMul Solver - Version information

#include <string>
#include <sstream>
#include <vector>

namespace version {

constexpr int MAJOR = 0;
constexpr int MINOR = 3;
constexpr int PATCH = 0;

constexpr const char* VERSION_STRING = "0.3.0";

// Build date and time
constexpr const char* BUILD_DATE = __DATE__;
constexpr const char* BUILD_TIME = __TIME__;

inline std::string get_compiler_info() {
#if defined(_MSC_VER)
    std::ostringstream oss;
    oss << "MSVC " << _MSC_VER;
    return oss.str();
#elif defined(__clang__)
    std::ostringstream oss;
    oss << "Clang " << __clang_major__ << "." << __clang_minor__ << "." << __clang_patchlevel__;
    return oss.str();
#elif defined(__GNUC__)
    std::ostringstream oss;
    oss << "GCC " << __GNUC__ << "." << __GNUC_MINOR__ << "." << __GNUC_PATCHLEVEL__;
    return oss.str();
#else
    return "Unknown compiler";
#endif
}

// Libraries linked into this build, reported in the JSON metadata
inline std::vector<std::string> get_linked_libraries() {
#ifdef MMSOLVE_HAVE_CBLAS
    return {"blake3", "cblas"};
#else
    return {"blake3"};
#endif
}

// Format: "mmsolve X.Y.Z (built DATE TIME with COMPILER)"
inline std::string get_full_version_string() {
    std::ostringstream oss;
    oss << "mmsolve " << VERSION_STRING
        << " (built " << BUILD_DATE << " " << BUILD_TIME
        << " with " << get_compiler_info() << ")";
    return oss.str();
}

}
