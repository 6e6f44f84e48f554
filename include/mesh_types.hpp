/**
 * @file mesh_types.hpp
 * @brief Batched block containers, error types and parameter snapshots
 *
 * Every representation of a photonic layer is batched over a grid of
 * independent k×k blocks. A grid cell is addressed by (row, col) and holds
 * one block-sized item:
 *
 *   BlockGrid   [rows, cols, k, k]   dense blocks, U/V unitaries, mesh layouts
 *   VectorGrid  [rows, cols, n]      S, deltas, condensed mesh phases, voltages
 *   ScalarGrid  [rows, cols, 1]      per-block S_scale
 *
 * Cells are stored row-major: cell (r, c) lives at cells[r * cols + c].
 * Batch elements never interact; every batched operation is a loop over cells.
 */

#ifndef MESH_TYPES_HPP
#define MESH_TYPES_HPP

#include <Eigen/Dense>

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

namespace photon_mesh {

using Matrix = Eigen::MatrixXd;
using Vector = Eigen::VectorXd;

//==============================================================================
// Error types
//==============================================================================

/// Raised when tensor shapes do not agree (vector length, block size, grid dims)
class ShapeMismatchError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

/// Raised for unknown modes, algorithms, names and undefined conversions
class NotSupportedError : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

//==============================================================================
// Grid container
//==============================================================================

template <typename T>
struct Grid {
    std::size_t rows = 0;     ///< Number of block rows
    std::size_t cols = 0;     ///< Number of block columns
    std::vector<T> cells;     ///< Row-major cell storage

    Grid() = default;
    Grid(std::size_t r, std::size_t c, const T& init)
        : rows(r), cols(c), cells(r * c, init) {}

    T& at(std::size_t r, std::size_t c) { return cells[r * cols + c]; }
    const T& at(std::size_t r, std::size_t c) const { return cells[r * cols + c]; }

    std::size_t size() const { return cells.size(); }
    bool empty() const { return cells.empty(); }
};

using BlockGrid = Grid<Matrix>;
using VectorGrid = Grid<Vector>;
using ScalarGrid = Grid<double>;

inline BlockGrid make_block_grid(std::size_t rows, std::size_t cols, std::size_t k) {
    return BlockGrid(rows, cols, Matrix::Zero(k, k));
}

inline VectorGrid make_vector_grid(std::size_t rows, std::size_t cols, std::size_t n) {
    return VectorGrid(rows, cols, Vector::Zero(n));
}

inline ScalarGrid make_scalar_grid(std::size_t rows, std::size_t cols) {
    return ScalarGrid(rows, cols, 0.0);
}

inline std::string grid_shape_string(std::size_t rows, std::size_t cols) {
    return std::to_string(rows) + "x" + std::to_string(cols);
}

/**
 * @brief Throw ShapeMismatchError unless both grids have the same dimensions
 * @param what Short description used in the error message
 */
template <typename A, typename B>
void check_same_grid(const Grid<A>& a, const Grid<B>& b, const std::string& what) {
    if (a.rows != b.rows || a.cols != b.cols) {
        throw ShapeMismatchError(what + ": grid mismatch " +
                                 grid_shape_string(a.rows, a.cols) + " vs " +
                                 grid_shape_string(b.rows, b.cols));
    }
}

/// Largest absolute element-wise difference between two block grids
inline double max_abs_diff(const BlockGrid& a, const BlockGrid& b) {
    check_same_grid(a, b, "max_abs_diff");
    double err = 0.0;
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (a.cells[i].rows() != b.cells[i].rows() || a.cells[i].cols() != b.cells[i].cols()) {
            throw ShapeMismatchError("max_abs_diff: block size mismatch");
        }
        if (a.cells[i].size() > 0) {
            err = std::max(err, (a.cells[i] - b.cells[i]).cwiseAbs().maxCoeff());
        }
    }
    return err;
}

inline double max_abs_diff(const VectorGrid& a, const VectorGrid& b) {
    check_same_grid(a, b, "max_abs_diff");
    double err = 0.0;
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (a.cells[i].size() != b.cells[i].size()) {
            throw ShapeMismatchError("max_abs_diff: vector length mismatch");
        }
        if (a.cells[i].size() > 0) {
            err = std::max(err, (a.cells[i] - b.cells[i]).cwiseAbs().maxCoeff());
        }
    }
    return err;
}

//==============================================================================
// Parameter snapshots
//==============================================================================

/**
 * @brief One named tensor of a parameter snapshot
 *
 * Values are flattened row-major over the full shape, e.g. a BlockGrid
 * [rows, cols, k, k] is stored as r, c, i, j with j fastest.
 * Scalars use an empty shape and a single value.
 */
struct ParameterTensor {
    std::vector<std::size_t> shape;
    std::vector<double> values;

    std::size_t numel() const {
        std::size_t n = 1;
        for (std::size_t d : shape) n *= d;
        return n;
    }
};

using ParameterDict = std::map<std::string, ParameterTensor>;

inline std::string shape_string(const std::vector<std::size_t>& shape) {
    std::string s = "[";
    for (std::size_t i = 0; i < shape.size(); ++i) {
        if (i) s += ", ";
        s += std::to_string(shape[i]);
    }
    return s + "]";
}

inline ParameterTensor to_parameter(const BlockGrid& grid, std::size_t k) {
    ParameterTensor t;
    t.shape = {grid.rows, grid.cols, k, k};
    t.values.reserve(grid.size() * k * k);
    for (const Matrix& block : grid.cells) {
        for (std::size_t i = 0; i < k; ++i) {
            for (std::size_t j = 0; j < k; ++j) {
                t.values.push_back(block(i, j));
            }
        }
    }
    return t;
}

inline ParameterTensor to_parameter(const VectorGrid& grid, std::size_t n) {
    ParameterTensor t;
    t.shape = {grid.rows, grid.cols, n};
    t.values.reserve(grid.size() * n);
    for (const Vector& v : grid.cells) {
        for (std::size_t i = 0; i < n; ++i) t.values.push_back(v[i]);
    }
    return t;
}

inline ParameterTensor to_parameter(const ScalarGrid& grid) {
    ParameterTensor t;
    t.shape = {grid.rows, grid.cols, 1};
    t.values = grid.cells;
    return t;
}

inline ParameterTensor scalar_parameter(double value) {
    ParameterTensor t;
    t.values = {value};
    return t;
}

inline void check_parameter_shape(const std::string& name, const ParameterTensor& t,
                                  const std::vector<std::size_t>& expected) {
    if (t.shape != expected || t.values.size() != t.numel()) {
        throw ShapeMismatchError("parameter '" + name + "' shape mismatch: expected " +
                                 shape_string(expected) + ", got " + shape_string(t.shape) +
                                 " with " + std::to_string(t.values.size()) + " values");
    }
}

inline void copy_parameter(const ParameterTensor& t, BlockGrid& grid, std::size_t k) {
    std::size_t idx = 0;
    for (Matrix& block : grid.cells) {
        for (std::size_t i = 0; i < k; ++i) {
            for (std::size_t j = 0; j < k; ++j) {
                block(i, j) = t.values[idx++];
            }
        }
    }
}

inline void copy_parameter(const ParameterTensor& t, VectorGrid& grid, std::size_t n) {
    std::size_t idx = 0;
    for (Vector& v : grid.cells) {
        for (std::size_t i = 0; i < n; ++i) v[i] = t.values[idx++];
    }
}

inline void copy_parameter(const ParameterTensor& t, ScalarGrid& grid) {
    std::copy(t.values.begin(), t.values.end(), grid.cells.begin());
}

} // namespace photon_mesh

#endif // MESH_TYPES_HPP
