/**
 * ╔═══════════════════════════════════════════════════════════════════════════╗
 * ║                           MESH_CODEC.HPP                                  ║
 * ╠═══════════════════════════════════════════════════════════════════════════╣
 * ║  Packing of condensed MZI mesh angles into their 2D mesh layout           ║
 * ╠═══════════════════════════════════════════════════════════════════════════╣
 * ║                                                                           ║
 * ║  A k-mode mesh holds k(k-1)/2 two-mode rotations (MZIs). The angles are  ║
 * ║  stored compactly as a vector; the 2D layout places each angle where its ║
 * ║  MZI physically sits, which is what crosstalk acts on.                   ║
 * ║                                                                           ║
 * ║  TRIANGLE (Reck):  strict upper triangle, row-major        (k = 4)       ║
 * ║                                                                           ║
 * ║        ┌───┬───┬───┬───┐                                                 ║
 * ║        │ . │ 0 │ 1 │ 2 │                                                 ║
 * ║        │ . │ . │ 3 │ 4 │                                                 ║
 * ║        │ . │ . │ . │ 5 │                                                 ║
 * ║        │ . │ . │ . │ . │                                                 ║
 * ║        └───┴───┴───┴───┘                                                 ║
 * ║                                                                           ║
 * ║  RECTANGLE (Clements): row = upper mode p of the MZI, column = layer l.  ║
 * ║  Layer l holds MZIs on modes (p, p+1) with p + l even, so occupied cells ║
 * ║  alternate along the diagonals. Row k-1 is never occupied.   (k = 4)     ║
 * ║                                                                           ║
 * ║        ┌───┬───┬───┬───┐                                                 ║
 * ║        │ 0 │ . │ 1 │ . │                                                 ║
 * ║        │ . │ 2 │ . │ 3 │                                                 ║
 * ║        │ 4 │ . │ 5 │ . │                                                 ║
 * ║        │ . │ . │ . │ . │                                                 ║
 * ║        └───┴───┴───┴───┘                                                 ║
 * ║                                                                           ║
 * ║  Both layouts read and write occupied cells in row-major order, so       ║
 * ║  to_vector(to_mesh_layout(v)) == v exactly.                              ║
 * ║                                                                           ║
 * ╚═══════════════════════════════════════════════════════════════════════════╝
 */

#ifndef MESH_CODEC_HPP
#define MESH_CODEC_HPP

#include "mesh_types.hpp"

#include <cstddef>
#include <memory>
#include <string_view>

namespace photon_mesh {

/// Physical arrangement of the phase shifters a quantizer or codec works on
enum class MeshLayout {
    TRIANGLE,   ///< Reck/Francis staircase mesh
    RECTANGLE,  ///< Clements rectangular mesh
    DIAGONAL    ///< Independent per-mode attenuators (the S path), no 2D layout
};

MeshLayout parse_mesh_layout(std::string_view name);
const char* to_string(MeshLayout layout);

/// Number of MZIs in a k-mode mesh
constexpr std::size_t num_mesh_angles(std::size_t k) {
    return k == 0 ? 0 : k * (k - 1) / 2;
}

/**
 * @brief Recover k from a condensed vector length
 * @throws ShapeMismatchError if n is not of the form k(k-1)/2
 */
std::size_t block_size_from_angles(std::size_t n);

//==============================================================================
// MeshTopology: packing strategy
//==============================================================================

/**
 * @brief Immutable packing policy for one mesh topology
 *
 * Selected once at construction by the decomposer and the quantizers and
 * shared between them. Derived classes only define which cells are occupied;
 * packing order is row-major over those cells for every topology.
 */
class MeshTopology {
public:
    virtual ~MeshTopology() = default;

    virtual MeshLayout layout() const = 0;
    virtual const char* name() const = 0;

    /// True if cell (row, col) of a k×k layout carries an angle
    virtual bool occupied(std::size_t row, std::size_t col, std::size_t k) const = 0;

    /// Default neighbour-coupling kernel size for crosstalk on this layout
    virtual std::size_t crosstalk_filter_size() const = 0;

    /**
     * @brief Scatter a condensed angle vector into the k×k mesh layout
     * @throws ShapeMismatchError if angles.size() != k(k-1)/2
     */
    Matrix to_mesh_layout(const Vector& angles, std::size_t k) const;

    /**
     * @brief Gather the occupied cells of a mesh layout back into a vector
     * @throws ShapeMismatchError if the layout is not square
     */
    Vector to_vector(const Matrix& mesh) const;

    BlockGrid to_mesh_layout(const VectorGrid& angles, std::size_t k) const;
    VectorGrid to_vector(const BlockGrid& meshes) const;
};

class TriangularMesh final : public MeshTopology {
public:
    MeshLayout layout() const override { return MeshLayout::TRIANGLE; }
    const char* name() const override { return "triangle"; }
    bool occupied(std::size_t row, std::size_t col, std::size_t k) const override {
        return row < k && col < k && col > row;
    }
    std::size_t crosstalk_filter_size() const override { return 3; }
};

class CheckerboardMesh final : public MeshTopology {
public:
    MeshLayout layout() const override { return MeshLayout::RECTANGLE; }
    const char* name() const override { return "rectangle"; }
    bool occupied(std::size_t row, std::size_t col, std::size_t k) const override {
        return row + 1 < k && col < k && (row + col) % 2 == 0;
    }
    std::size_t crosstalk_filter_size() const override { return 5; }
};

/**
 * @brief Create the shared packing policy for a layout
 * @throws NotSupportedError for MeshLayout::DIAGONAL, which has no mesh
 */
std::shared_ptr<const MeshTopology> make_topology(MeshLayout layout);

} // namespace photon_mesh

#endif // MESH_CODEC_HPP
