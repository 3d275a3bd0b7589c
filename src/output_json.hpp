#pragma once
// MatMul Solver - JSON report

#include "matmul_solver.hpp"
#include <string>

// Pretty-printed JSON of the Output record. Matrix values use 9 significant
// digits, enough to round-trip any f32; absent optional fields are omitted.
std::string format_output_json(const Output& output);

// Writes the report, creating missing parent directories.
// Throws std::runtime_error if the file cannot be written.
void write_output_json(const std::string& path, const std::string& json);
