// MatMul Solver - Memory Validator Implementation

#include "memory_validator.hpp"
#include <cstdint>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <string>

#ifdef __linux__
#include <sys/sysinfo.h>
#endif

std::string MemoryRequirement::to_string() const {
    std::ostringstream oss;
    oss << MemoryValidator::format_bytes(required_bytes) << " needed, ";
    if (available_bytes == 0) {
        oss << "available memory unknown";
    } else {
        oss << MemoryValidator::format_bytes(available_bytes) << " available";
    }
    oss << (sufficient ? " (ok)" : " (insufficient)");
    return oss.str();
}

size_t MemoryValidator::estimate_required_memory(const MatmulShape& shape) {
    const size_t matrices = shape.total_elements();
    const size_t stream = MatmulShape::checked_mul(shape.M, shape.K) +
                          MatmulShape::checked_mul(shape.K, shape.N);
    const size_t packed_b = MatmulShape::checked_mul(shape.K, shape.N);

    size_t total = MatmulShape::checked_mul(matrices, sizeof(float));
    const size_t packed_bytes = MatmulShape::checked_mul(packed_b, sizeof(float));
    if (stream > SIZE_MAX - total || packed_bytes > SIZE_MAX - total - stream) {
        throw SolverError(ErrorKind::MalformedInput,
            "Memory requirement overflow for shape " + shape.to_string());
    }
    total += stream + packed_bytes;
    return total;
}

size_t MemoryValidator::parse_mem_available(std::istream& meminfo) {
    const std::string key = "MemAvailable:";
    std::string line;
    while (std::getline(meminfo, line)) {
        if (line.compare(0, key.size(), key) != 0) continue;

        std::istringstream fields(line.substr(key.size()));
        unsigned long long kib = 0;
        std::string unit;
        if (!(fields >> kib >> unit) || unit != "kB") return 0;
        if (kib > SIZE_MAX / 1024) return SIZE_MAX;
        return static_cast<size_t>(kib) * 1024;
    }
    return 0;
}

size_t MemoryValidator::get_available_memory() {
#ifdef __linux__
    std::ifstream meminfo("/proc/meminfo");
    if (meminfo) {
        const size_t available = parse_mem_available(meminfo);
        if (available != 0) return available;
    }

    // Kernels without MemAvailable: free pages only
    struct sysinfo info;
    if (sysinfo(&info) == 0) {
        return static_cast<size_t>(info.freeram) * info.mem_unit;
    }
#endif
    return 0;
}

MemoryRequirement MemoryValidator::validate(const MatmulShape& shape) {
    MemoryRequirement result;
    result.required_bytes = estimate_required_memory(shape);
    result.available_bytes = get_available_memory();

    // 0 means the query failed, which never blocks a run
    result.sufficient = result.available_bytes == 0 ||
                        result.available_bytes >= result.required_bytes;
    return result;
}

std::string MemoryValidator::format_bytes(size_t bytes) {
    static const char* const units[] = {"KB", "MB", "GB", "TB"};

    if (bytes < 1024) {
        return std::to_string(bytes) + " B";
    }

    double value = static_cast<double>(bytes) / 1024.0;
    size_t unit = 0;
    while (value >= 1024.0 && unit + 1 < sizeof(units) / sizeof(units[0])) {
        value /= 1024.0;
        ++unit;
    }

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << value << " " << units[unit];
    return oss.str();
}
