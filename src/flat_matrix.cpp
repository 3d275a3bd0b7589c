// MatMul Solver - Flat row-major matrix

#include "flat_matrix.hpp"
#include "types.hpp"

#include <utility>

FlatMatrix::FlatMatrix(std::vector<float> values, size_t r, size_t c)
    : data(std::move(values)), rows(r), cols(c)
{
    if (data.size() != MatmulShape::checked_mul(rows, cols)) {
        throw SolverError(ErrorKind::MalformedInput,
            "Matrix buffer holds " + std::to_string(data.size()) +
            " elements, expected " + shape_string());
    }
    if (rows == 0) {
        cols = 0;
    }
}

FlatMatrix FlatMatrix::from_rows(const std::vector<std::vector<float>>& nested) {
    FlatMatrix m;
    m.rows = nested.size();
    m.cols = nested.empty() ? 0 : nested[0].size();
    m.data.reserve(MatmulShape::checked_mul(m.rows, m.cols));

    for (size_t i = 0; i < nested.size(); ++i) {
        if (nested[i].size() != m.cols) {
            throw SolverError(ErrorKind::MalformedInput,
                "Ragged matrix: row " + std::to_string(i) + " has " +
                std::to_string(nested[i].size()) + " columns, expected " +
                std::to_string(m.cols));
        }
        m.data.insert(m.data.end(), nested[i].begin(), nested[i].end());
    }
    return m;
}

std::vector<std::vector<float>> FlatMatrix::to_rows() const {
    std::vector<std::vector<float>> nested;
    nested.reserve(rows);
    for (size_t i = 0; i < rows; ++i) {
        auto begin = data.begin() + static_cast<std::ptrdiff_t>(i * cols);
        nested.emplace_back(begin, begin + static_cast<std::ptrdiff_t>(cols));
    }
    return nested;
}

std::string FlatMatrix::shape_string() const {
    return std::to_string(rows) + "x" + std::to_string(cols);
}
