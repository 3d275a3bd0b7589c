// MatMul Solver - JSON report

#include "output_json.hpp"
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <system_error>

namespace {

std::string json_escape(const std::string& s) {
    std::ostringstream oss;
    for (char c : s) {
        switch (c) {
            case '"': oss << "\\\""; break;
            case '\\': oss << "\\\\"; break;
            case '\b': oss << "\\b"; break;
            case '\f': oss << "\\f"; break;
            case '\n': oss << "\\n"; break;
            case '\r': oss << "\\r"; break;
            case '\t': oss << "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    oss << "\\u" << std::hex << std::setfill('0') << std::setw(4)
                        << static_cast<int>(c) << std::dec;
                } else {
                    oss << c;
                }
        }
    }
    return oss.str();
}

// JSON has no NaN or Infinity
void write_number(std::ostringstream& oss, double v) {
    if (std::isfinite(v)) {
        oss << v;
    } else {
        oss << "null";
    }
}

void write_shape(std::ostringstream& oss, const char* name, const Shape2D& shape) {
    oss << "    \"" << name << "\": [" << shape.rows << ", " << shape.cols << "],\n";
}

} // namespace

std::string format_output_json(const Output& output) {
    std::ostringstream oss;

    oss << "{\n";

    // Result matrix, one row per line
    oss << std::setprecision(9);
    oss << "  \"result_matrix\": [";
    const FlatMatrix& m = output.result_matrix;
    for (size_t i = 0; i < m.rows; ++i) {
        oss << (i == 0 ? "\n    [" : ",\n    [");
        for (size_t j = 0; j < m.cols; ++j) {
            if (j > 0) oss << ", ";
            write_number(oss, m.at(i, j));
        }
        oss << "]";
    }
    oss << (m.rows > 0 ? "\n  ],\n" : "],\n");

    oss << "  \"result_hash\": \"" << json_escape(output.result_hash) << "\",\n";

    // Metrics
    const Metrics& metrics = output.metrics;
    oss << std::fixed << std::setprecision(9);
    oss << "  \"metrics\": {\n";
    oss << "    \"latency_ms\": "; write_number(oss, metrics.latency_ms); oss << ",\n";
    oss << "    \"throughput_ops_per_sec\": "; write_number(oss, metrics.throughput_ops_per_sec); oss << ",\n";
    oss << "    \"ops_per_second\": "; write_number(oss, metrics.ops_per_second); oss << ",\n";
    oss << "    \"memory_usage_mb\": "; write_number(oss, metrics.memory_usage_mb);
    if (metrics.parse_time_ms) {
        oss << ",\n    \"parse_time_ms\": "; write_number(oss, *metrics.parse_time_ms);
    }
    if (metrics.kernel_time_ms) {
        oss << ",\n    \"kernel_time_ms\": "; write_number(oss, *metrics.kernel_time_ms);
    }
    if (metrics.serialize_time_ms) {
        oss << ",\n    \"serialize_time_ms\": "; write_number(oss, *metrics.serialize_time_ms);
    }
    oss << "\n  },\n";

    // Metadata
    const OutputMetadata& meta = output.metadata;
    oss << "  \"metadata\": {\n";
    oss << "    \"precision\": \"" << json_escape(meta.precision) << "\",\n";
    write_shape(oss, "matrix_a_shape", meta.matrix_a_shape);
    write_shape(oss, "matrix_b_shape", meta.matrix_b_shape);
    write_shape(oss, "result_shape", meta.result_shape);
    if (meta.compiler_flags) {
        oss << "    \"compiler_flags\": \"" << json_escape(*meta.compiler_flags) << "\",\n";
    } else {
        oss << "    \"compiler_flags\": null,\n";
    }
    if (meta.libraries) {
        oss << "    \"libraries\": [";
        for (size_t i = 0; i < meta.libraries->size(); ++i) {
            if (i > 0) oss << ", ";
            oss << "\"" << json_escape((*meta.libraries)[i]) << "\"";
        }
        oss << "],\n";
    } else {
        oss << "    \"libraries\": null,\n";
    }
    oss << "    \"kernel_path\": \"" << json_escape(meta.kernel_path) << "\",\n";
    oss << "    \"simd_level\": \"" << json_escape(meta.simd_level) << "\",\n";
    oss << "    \"cache_hit\": " << (meta.cache_hit ? "true" : "false") << "\n";
    oss << "  }\n";

    oss << "}\n";
    return oss.str();
}

void write_output_json(const std::string& path, const std::string& json) {
    const std::filesystem::path target(path);
    if (target.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(target.parent_path(), ec);
        if (ec) {
            throw std::runtime_error("Cannot create directory " +
                                     target.parent_path().string() + ": " + ec.message());
        }
    }

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw std::runtime_error("Cannot open " + path + " for writing");
    }
    out << json;
    out.flush();
    if (!out) {
        throw std::runtime_error("Failed to write " + path);
    }
}
