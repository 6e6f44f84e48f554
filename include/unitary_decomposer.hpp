/**
 * ╔═══════════════════════════════════════════════════════════════════════════╗
 * ║                        UNITARY_DECOMPOSER.HPP                             ║
 * ╠═══════════════════════════════════════════════════════════════════════════╣
 * ║  Real orthogonal k×k matrix  <->  (delta, MZI phase mesh)                 ║
 * ╠═══════════════════════════════════════════════════════════════════════════╣
 * ║                                                                           ║
 * ║  Every MZI is a real Givens rotation on adjacent modes (p, p+1):          ║
 * ║                                                                           ║
 * ║        R(θ) = │  cos θ   sin θ │                                          ║
 * ║               │ -sin θ   cos θ │                                          ║
 * ║                                                                           ║
 * ║  An orthogonal U factors into k(k-1)/2 rotations plus a diagonal of      ║
 * ║  ±1 signs (delta):                                                        ║
 * ║                                                                           ║
 * ║    RECK (triangular, a.k.a. francis):                                     ║
 * ║      Column by column, nulls the sub-diagonal from the bottom up with     ║
 * ║      row rotations. Angle for column c, row r lands in mesh[c][r].        ║
 * ║                                                                           ║
 * ║    CLEMENTS (rectangular):                                                ║
 * ║      Alternates column nulling (right side) and row nulling (left side)   ║
 * ║      along anti-diagonals, then commutes the left rotations through the   ║
 * ║      diagonal. Rotations are scheduled into k layers of depth, giving     ║
 * ║      the balanced checkerboard layout of CheckerboardMesh.               ║
 * ║                                                                           ║
 * ║  reconstruct(decompose(U)) == U up to floating point for any orthogonal  ║
 * ║  U. For a non-orthogonal input, decompose still returns finite values    ║
 * ║  but the round trip is not exact.                                         ║
 * ║                                                                           ║
 * ╚═══════════════════════════════════════════════════════════════════════════╝
 */

#ifndef UNITARY_DECOMPOSER_HPP
#define UNITARY_DECOMPOSER_HPP

#include "mesh_codec.hpp"
#include "mesh_types.hpp"

#include <memory>
#include <string_view>

namespace photon_mesh {

enum class DecomposeAlg {
    RECK,       ///< Triangular mesh ("reck" or "francis")
    CLEMENTS    ///< Rectangular mesh
};

/// "reck" and "francis" both select RECK
DecomposeAlg parse_decompose_alg(std::string_view name);
const char* to_string(DecomposeAlg alg);

/// Mesh layout produced by an algorithm
MeshLayout layout_for(DecomposeAlg alg);

struct MeshDecomposition {
    Vector delta;        ///< [k] diagonal signs
    Matrix phase_mesh;   ///< [k, k] angles in the algorithm's mesh layout
};

class UnitaryDecomposer {
public:
    explicit UnitaryDecomposer(DecomposeAlg alg = DecomposeAlg::CLEMENTS);

    DecomposeAlg algorithm() const { return alg_; }
    const MeshTopology& topology() const { return *topology_; }
    std::shared_ptr<const MeshTopology> shared_topology() const { return topology_; }

    /**
     * @brief Decompose one k×k block
     * @throws ShapeMismatchError if U is not square
     *
     * k = 1 yields delta = [U(0,0)] and an empty 1×1 mesh; k = 0 yields
     * empty outputs.
     */
    MeshDecomposition decompose(const Matrix& U) const;

    /**
     * @brief Rebuild the k×k matrix from delta and a mesh layout
     * @throws ShapeMismatchError if delta and phase_mesh disagree on k
     */
    Matrix reconstruct(const Vector& delta, const Matrix& phase_mesh) const;

    // Batched forms: one call per grid cell, cells are independent.
    void decompose(const BlockGrid& U, VectorGrid& delta, BlockGrid& phase_mesh) const;
    BlockGrid reconstruct(const VectorGrid& delta, const BlockGrid& phase_mesh) const;

    // Same as the batched forms, with the mesh condensed to k(k-1)/2 angles.
    void decompose_to_vector(const BlockGrid& U, VectorGrid& delta, VectorGrid& phases) const;
    BlockGrid reconstruct_from_vector(const VectorGrid& delta, const VectorGrid& phases) const;

private:
    MeshDecomposition decompose_reck(const Matrix& U) const;
    MeshDecomposition decompose_clements(const Matrix& U) const;
    Matrix reconstruct_reck(const Vector& delta, const Matrix& phase_mesh) const;
    Matrix reconstruct_clements(const Vector& delta, const Matrix& phase_mesh) const;

    DecomposeAlg alg_;
    std::shared_ptr<const MeshTopology> topology_;
};

/// Left-multiply by R(θ) acting on rows (p, p+1)
void rotate_rows(Matrix& m, Eigen::Index p, double theta);

/// Right-multiply by R(θ) acting on columns (p, p+1)
void rotate_cols(Matrix& m, Eigen::Index p, double theta);

/// Max |UᵀU - I| of a square matrix
double orthogonality_error(const Matrix& U);

} // namespace photon_mesh

#endif // UNITARY_DECOMPOSER_HPP
