#pragma once
// MatMul Solver - Flat row-major matrix

#include <cstddef>
#include <string>
#include <vector>

// Row-major matrix: element (i, j) lives at data[i * cols + j]
// Invariant: data.size() == rows * cols. A matrix with no rows has cols == 0.
struct FlatMatrix {
    std::vector<float> data;
    size_t rows = 0;
    size_t cols = 0;

    FlatMatrix() = default;

    // Takes ownership of data; throws SolverError(MalformedInput) if the
    // length does not match rows * cols. rows == 0 forces cols to 0.
    FlatMatrix(std::vector<float> values, size_t r, size_t c);

    // Build from nested rows
    // Throws SolverError(MalformedInput) when rows have different lengths
    static FlatMatrix from_rows(const std::vector<std::vector<float>>& nested);

    std::vector<std::vector<float>> to_rows() const;

    float at(size_t i, size_t j) const { return data[i * cols + j]; }
    size_t size() const { return data.size(); }
    bool empty() const { return data.empty(); }

    // "RxC"
    std::string shape_string() const;
};
