/**
 * @file block_tiling.hpp
 * @brief Pad a dense (out, in) matrix and tile it into a grid of k×k blocks
 *
 * The photonic core only sees square k×k blocks. A layer weight of any shape
 * is zero-padded up to the next multiple of k in both dimensions and split
 * into a [grid_rows, grid_cols] grid; merging trims the padding back off.
 *
 * Example: 10×7 weight, k = 4  →  padded 12×8  →  3×2 block grid
 *   block (p, q) covers rows p·4 … p·4+3, columns q·4 … q·4+3
 *
 * Usage:
 *   TilingGeometry geo = make_tiling(10, 7, 4);
 *   BlockGrid grid = tile_to_grid(dense, 4);
 *   Matrix back = merge_from_grid(grid, 10, 7);
 *   validate_tiling(grid, geo);
 */

#ifndef BLOCK_TILING_HPP
#define BLOCK_TILING_HPP

#include "mesh_types.hpp"

#include <algorithm>
#include <cstddef>
#include <sstream>
#include <stdexcept>
#include <string>

namespace photon_mesh {

//==============================================================================
// Tiling Geometry
//==============================================================================

struct TilingGeometry {
    std::size_t rows;           ///< Original rows (out_features)
    std::size_t cols;           ///< Original columns (in_features)
    std::size_t block_size;     ///< k
    std::size_t grid_rows;      ///< ceil(rows / k)
    std::size_t grid_cols;      ///< ceil(cols / k)

    TilingGeometry() : rows(0), cols(0), block_size(0), grid_rows(0), grid_cols(0) {}

    std::size_t padded_rows() const { return grid_rows * block_size; }
    std::size_t padded_cols() const { return grid_cols * block_size; }
    std::size_t num_blocks() const { return grid_rows * grid_cols; }

    /// Fraction of grid entries that are padding
    double padding_ratio() const {
        const std::size_t padded = padded_rows() * padded_cols();
        if (padded == 0) return 0.0;
        return 1.0 - static_cast<double>(rows * cols) / static_cast<double>(padded);
    }
};

/**
 * @brief Validation result for a tiled grid
 */
struct ValidationResult {
    bool valid;              ///< True if the grid matches the geometry
    std::string message;     ///< Error message if invalid
    std::size_t error_index; ///< Offending cell (if applicable)

    ValidationResult() : valid(true), error_index(0) {}
    ValidationResult(bool v, const std::string& msg, std::size_t idx = 0)
        : valid(v), message(msg), error_index(idx) {}
};

/**
 * @brief Compute the grid geometry for a rows×cols matrix
 * @throws std::invalid_argument if block_size is 0
 */
inline TilingGeometry make_tiling(std::size_t rows, std::size_t cols, std::size_t block_size) {
    if (block_size == 0) {
        throw std::invalid_argument("make_tiling: block size must be positive");
    }
    TilingGeometry geo;
    geo.rows = rows;
    geo.cols = cols;
    geo.block_size = block_size;
    geo.grid_rows = (rows + block_size - 1) / block_size;
    geo.grid_cols = (cols + block_size - 1) / block_size;
    return geo;
}

//==============================================================================
// Tile / Merge
//==============================================================================

/**
 * @brief Zero-pad and split a dense matrix into k×k blocks
 *
 * Entries outside the original matrix (right and bottom edge) are zero.
 */
inline BlockGrid tile_to_grid(const Matrix& dense, std::size_t block_size) {
    const TilingGeometry geo = make_tiling(static_cast<std::size_t>(dense.rows()),
                                           static_cast<std::size_t>(dense.cols()), block_size);
    BlockGrid grid = make_block_grid(geo.grid_rows, geo.grid_cols, block_size);
    const auto k = static_cast<Eigen::Index>(block_size);

    for (std::size_t p = 0; p < geo.grid_rows; ++p) {
        for (std::size_t q = 0; q < geo.grid_cols; ++q) {
            const Eigen::Index r0 = static_cast<Eigen::Index>(p) * k;
            const Eigen::Index c0 = static_cast<Eigen::Index>(q) * k;
            const Eigen::Index h = std::min(k, dense.rows() - r0);
            const Eigen::Index w = std::min(k, dense.cols() - c0);
            grid.at(p, q).topLeftCorner(h, w) = dense.block(r0, c0, h, w);
        }
    }
    return grid;
}

/**
 * @brief Reassemble a grid into a dense matrix and trim it to rows×cols
 * @throws ShapeMismatchError if rows×cols does not fit the grid's padded extent
 */
inline Matrix merge_from_grid(const BlockGrid& grid, std::size_t rows, std::size_t cols) {
    if (grid.empty()) {
        if (rows == 0 || cols == 0) return Matrix(rows, cols);
        throw ShapeMismatchError("merge_from_grid: empty grid for " +
                                 grid_shape_string(rows, cols) + " matrix");
    }

    const auto k = grid.cells.front().rows();
    const auto ku = static_cast<std::size_t>(k);
    if (rows > grid.rows * ku || cols > grid.cols * ku ||
        (rows + ku - 1) / ku != grid.rows || (cols + ku - 1) / ku != grid.cols) {
        throw ShapeMismatchError("merge_from_grid: " + grid_shape_string(rows, cols) +
                                 " does not tile into a " +
                                 grid_shape_string(grid.rows, grid.cols) + " grid of " +
                                 std::to_string(k) + "x" + std::to_string(k) + " blocks");
    }

    Matrix padded(grid.rows * ku, grid.cols * ku);
    for (std::size_t p = 0; p < grid.rows; ++p) {
        for (std::size_t q = 0; q < grid.cols; ++q) {
            padded.block(static_cast<Eigen::Index>(p) * k, static_cast<Eigen::Index>(q) * k,
                         k, k) = grid.at(p, q);
        }
    }
    return padded.topLeftCorner(rows, cols);
}

//==============================================================================
// Validation and Statistics
//==============================================================================

/**
 * @brief Check that a grid has the geometry's shape and zero padding
 */
inline ValidationResult validate_tiling(const BlockGrid& grid, const TilingGeometry& geo) {
    if (grid.rows != geo.grid_rows || grid.cols != geo.grid_cols) {
        return ValidationResult(false,
            "grid shape mismatch: expected " + grid_shape_string(geo.grid_rows, geo.grid_cols) +
            ", got " + grid_shape_string(grid.rows, grid.cols));
    }

    const auto k = static_cast<Eigen::Index>(geo.block_size);
    for (std::size_t p = 0; p < grid.rows; ++p) {
        for (std::size_t q = 0; q < grid.cols; ++q) {
            const Matrix& block = grid.at(p, q);
            const std::size_t idx = p * grid.cols + q;
            if (block.rows() != k || block.cols() != k) {
                return ValidationResult(false,
                    "block " + std::to_string(idx) + " is " + std::to_string(block.rows()) +
                    "x" + std::to_string(block.cols()) + ", expected " +
                    std::to_string(k) + "x" + std::to_string(k), idx);
            }
            for (Eigen::Index i = 0; i < k; ++i) {
                for (Eigen::Index j = 0; j < k; ++j) {
                    const std::size_t r = p * geo.block_size + static_cast<std::size_t>(i);
                    const std::size_t c = q * geo.block_size + static_cast<std::size_t>(j);
                    if ((r >= geo.rows || c >= geo.cols) && block(i, j) != 0.0) {
                        return ValidationResult(false,
                            "non-zero padding at (" + std::to_string(r) + ", " +
                            std::to_string(c) + ")", idx);
                    }
                }
            }
        }
    }
    return ValidationResult(true, "Valid tiling");
}

inline std::string get_tiling_statistics(const TilingGeometry& geo) {
    std::ostringstream ss;
    ss << "Tiling Statistics:\n";
    ss << "  Original: " << geo.rows << " x " << geo.cols << "\n";
    ss << "  Padded: " << geo.padded_rows() << " x " << geo.padded_cols() << "\n";
    ss << "  Block size: " << geo.block_size << "\n";
    ss << "  Grid: " << geo.grid_rows << " x " << geo.grid_cols
       << " (" << geo.num_blocks() << " blocks)\n";
    ss << "  Padding: " << (geo.padding_ratio() * 100.0) << "%\n";
    return ss.str();
}

} // namespace photon_mesh

#endif // BLOCK_TILING_HPP
