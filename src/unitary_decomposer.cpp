/**
 * ╔═══════════════════════════════════════════════════════════════════════════╗
 * ║                        UNITARY_DECOMPOSER.CPP                             ║
 * ╠═══════════════════════════════════════════════════════════════════════════╣
 * ║  IMPLEMENTS: unitary_decomposer.hpp                                       ║
 * ╠═══════════════════════════════════════════════════════════════════════════╣
 * ║                                                                           ║
 * ║  ═══════════════════════════════════════════════════════════════════════  ║
 * ║  decompose_reck()                                                         ║
 * ║  ═══════════════════════════════════════════════════════════════════════  ║
 * ║    M = U                                                                  ║
 * ║    for c = 0 to k-2:                                                      ║
 * ║      for r = k-1 down to c+1:                                             ║
 * ║        θ = atan2(M[r][c], M[r-1][c])      // zeroes M[r][c]              ║
 * ║        M = R_{r-1}(θ) · M                                                 ║
 * ║        mesh[c][r] = θ                                                     ║
 * ║    delta = diag(M)                                                        ║
 * ║                                                                           ║
 * ║  ═══════════════════════════════════════════════════════════════════════  ║
 * ║  decompose_clements()                                                     ║
 * ║  ═══════════════════════════════════════════════════════════════════════  ║
 * ║    for i = 0 to k-2:                                                      ║
 * ║      i even: null (k-1-j, i-j) for j = 0..i with column rotations        ║
 * ║              on (c, c+1), θ = atan2(M[r][c], M[r][c+1])   -> right list  ║
 * ║      i odd:  null (k+j-i-2, j-1) for j = 1..i+1 with row rotations       ║
 * ║              on (r-1, r), θ = atan2(M[r][c], M[r-1][c])   -> left list   ║
 * ║                                                                           ║
 * ║    Now L·U·R = D. With s = sign(D), pushing every left rotation through  ║
 * ║    D flips it by s[p]·s[p+1], so                                          ║
 * ║                                                                           ║
 * ║      U = D · Π seq,   seq = [(p, -s[p]s[p+1]θ) for left]                  ║
 * ║                           + [(p, -θ) for right, reversed]                 ║
 * ║                                                                           ║
 * ║    The product is scheduled last-to-first, each rotation going to the    ║
 * ║    earliest layer l after both its modes are free with (p + l) even.     ║
 * ║    This packs exactly into k layers.                                      ║
 * ║                                                                           ║
 * ║  reconstruct_clements():  X = I; for l: X = Layer_l · X;  U = D · X      ║
 * ║                                                                           ║
 * ╚═══════════════════════════════════════════════════════════════════════════╝
 */

#include "unitary_decomposer.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>
#include <vector>

namespace photon_mesh {

namespace {

struct PlaneRotation {
    Eigen::Index mode;
    double theta;
};

double sign_of(double x) { return x >= 0.0 ? 1.0 : -1.0; }

void check_square(const Matrix& U, const char* what) {
    if (U.rows() != U.cols()) {
        throw ShapeMismatchError(std::string(what) + ": expected a square block, got " +
                                 std::to_string(U.rows()) + "x" + std::to_string(U.cols()));
    }
}

} // anonymous namespace

DecomposeAlg parse_decompose_alg(std::string_view name) {
    if (name == "clements") return DecomposeAlg::CLEMENTS;
    if (name == "reck" || name == "francis") return DecomposeAlg::RECK;
    throw NotSupportedError("unknown decomposition algorithm: " + std::string(name) +
                            " (expected clements, reck or francis)");
}

const char* to_string(DecomposeAlg alg) {
    return alg == DecomposeAlg::RECK ? "reck" : "clements";
}

MeshLayout layout_for(DecomposeAlg alg) {
    return alg == DecomposeAlg::RECK ? MeshLayout::TRIANGLE : MeshLayout::RECTANGLE;
}

void rotate_rows(Matrix& m, Eigen::Index p, double theta) {
    const double c = std::cos(theta);
    const double s = std::sin(theta);
    for (Eigen::Index j = 0; j < m.cols(); ++j) {
        const double a = m(p, j);
        const double b = m(p + 1, j);
        m(p, j) = c * a + s * b;
        m(p + 1, j) = -s * a + c * b;
    }
}

void rotate_cols(Matrix& m, Eigen::Index p, double theta) {
    const double c = std::cos(theta);
    const double s = std::sin(theta);
    for (Eigen::Index i = 0; i < m.rows(); ++i) {
        const double a = m(i, p);
        const double b = m(i, p + 1);
        m(i, p) = c * a - s * b;
        m(i, p + 1) = s * a + c * b;
    }
}

double orthogonality_error(const Matrix& U) {
    check_square(U, "orthogonality_error");
    if (U.size() == 0) return 0.0;
    const Matrix gram = U.transpose() * U;
    return (gram - Matrix::Identity(U.rows(), U.cols())).cwiseAbs().maxCoeff();
}

//==============================================================================
// UnitaryDecomposer
//==============================================================================

UnitaryDecomposer::UnitaryDecomposer(DecomposeAlg alg)
    : alg_(alg), topology_(make_topology(layout_for(alg))) {}

MeshDecomposition UnitaryDecomposer::decompose(const Matrix& U) const {
    check_square(U, "decompose");
    if (U.rows() <= 1) {
        MeshDecomposition out;
        out.delta = U.diagonal();
        out.phase_mesh = Matrix::Zero(U.rows(), U.cols());
        return out;
    }
    return alg_ == DecomposeAlg::RECK ? decompose_reck(U) : decompose_clements(U);
}

Matrix UnitaryDecomposer::reconstruct(const Vector& delta, const Matrix& phase_mesh) const {
    check_square(phase_mesh, "reconstruct");
    if (delta.size() != phase_mesh.rows()) {
        throw ShapeMismatchError("reconstruct: delta has " + std::to_string(delta.size()) +
                                 " entries but the mesh is " +
                                 std::to_string(phase_mesh.rows()) + "x" +
                                 std::to_string(phase_mesh.cols()));
    }
    if (delta.size() <= 1) {
        return Matrix(delta.asDiagonal());
    }
    return alg_ == DecomposeAlg::RECK ? reconstruct_reck(delta, phase_mesh)
                                      : reconstruct_clements(delta, phase_mesh);
}

MeshDecomposition UnitaryDecomposer::decompose_reck(const Matrix& U) const {
    const Eigen::Index k = U.rows();
    Matrix M = U;
    MeshDecomposition out;
    out.phase_mesh = Matrix::Zero(k, k);

    for (Eigen::Index c = 0; c < k - 1; ++c) {
        for (Eigen::Index r = k - 1; r > c; --r) {
            const double theta = std::atan2(M(r, c), M(r - 1, c));
            rotate_rows(M, r - 1, theta);
            out.phase_mesh(c, r) = theta;
        }
    }
    out.delta = M.diagonal();
    return out;
}

Matrix UnitaryDecomposer::reconstruct_reck(const Vector& delta, const Matrix& phase_mesh) const {
    const Eigen::Index k = delta.size();
    Matrix X = delta.asDiagonal();

    for (Eigen::Index c = k - 2; c >= 0; --c) {
        for (Eigen::Index r = c + 1; r < k; ++r) {
            rotate_rows(X, r - 1, -phase_mesh(c, r));
        }
    }
    return X;
}

MeshDecomposition UnitaryDecomposer::decompose_clements(const Matrix& U) const {
    const Eigen::Index k = U.rows();
    Matrix M = U;
    std::vector<PlaneRotation> left;
    std::vector<PlaneRotation> right;

    for (Eigen::Index i = 0; i < k - 1; ++i) {
        if (i % 2 == 0) {
            for (Eigen::Index j = 0; j <= i; ++j) {
                const Eigen::Index r = k - 1 - j;
                const Eigen::Index c = i - j;
                const double theta = std::atan2(M(r, c), M(r, c + 1));
                rotate_cols(M, c, theta);
                right.push_back({c, theta});
            }
        } else {
            for (Eigen::Index j = 1; j <= i + 1; ++j) {
                const Eigen::Index r = k + j - i - 2;
                const Eigen::Index c = j - 1;
                const double theta = std::atan2(M(r, c), M(r - 1, c));
                rotate_rows(M, r - 1, theta);
                left.push_back({r - 1, theta});
            }
        }
    }

    MeshDecomposition out;
    out.delta = M.diagonal();

    std::vector<PlaneRotation> sequence;
    sequence.reserve(left.size() + right.size());
    for (const PlaneRotation& rot : left) {
        const double flip = sign_of(out.delta[rot.mode]) * sign_of(out.delta[rot.mode + 1]);
        sequence.push_back({rot.mode, -flip * rot.theta});
    }
    for (auto it = right.rbegin(); it != right.rend(); ++it) {
        sequence.push_back({it->mode, -it->theta});
    }

    // Schedule into layers, last rotation of the product first
    out.phase_mesh = Matrix::Zero(k, k);
    std::vector<Eigen::Index> last(static_cast<std::size_t>(k), -1);
    for (auto it = sequence.rbegin(); it != sequence.rend(); ++it) {
        const auto p = static_cast<std::size_t>(it->mode);
        Eigen::Index layer = std::max(last[p], last[p + 1]) + 1;
        if ((layer + it->mode) % 2 != 0) ++layer;
        if (layer >= k) {
            throw std::runtime_error("clements schedule overflow at mode " +
                                     std::to_string(p) + " layer " + std::to_string(layer));
        }
        out.phase_mesh(it->mode, layer) = it->theta;
        last[p] = layer;
        last[p + 1] = layer;
    }
    return out;
}

Matrix UnitaryDecomposer::reconstruct_clements(const Vector& delta,
                                               const Matrix& phase_mesh) const {
    const Eigen::Index k = delta.size();
    Matrix X = Matrix::Identity(k, k);

    for (Eigen::Index layer = 0; layer < k; ++layer) {
        for (Eigen::Index p = layer % 2; p + 1 < k; p += 2) {
            rotate_rows(X, p, phase_mesh(p, layer));
        }
    }
    return delta.asDiagonal() * X;
}

//==============================================================================
// Batched forms
//==============================================================================

void UnitaryDecomposer::decompose(const BlockGrid& U, VectorGrid& delta,
                                  BlockGrid& phase_mesh) const {
    delta = VectorGrid(U.rows, U.cols, Vector());
    phase_mesh = BlockGrid(U.rows, U.cols, Matrix());
    for (std::size_t i = 0; i < U.size(); ++i) {
        MeshDecomposition d = decompose(U.cells[i]);
        delta.cells[i] = std::move(d.delta);
        phase_mesh.cells[i] = std::move(d.phase_mesh);
    }
}

BlockGrid UnitaryDecomposer::reconstruct(const VectorGrid& delta,
                                         const BlockGrid& phase_mesh) const {
    check_same_grid(delta, phase_mesh, "reconstruct");
    BlockGrid out(delta.rows, delta.cols, Matrix());
    for (std::size_t i = 0; i < delta.size(); ++i) {
        out.cells[i] = reconstruct(delta.cells[i], phase_mesh.cells[i]);
    }
    return out;
}

void UnitaryDecomposer::decompose_to_vector(const BlockGrid& U, VectorGrid& delta,
                                            VectorGrid& phases) const {
    BlockGrid mesh;
    decompose(U, delta, mesh);
    phases = topology_->to_vector(mesh);
}

BlockGrid UnitaryDecomposer::reconstruct_from_vector(const VectorGrid& delta,
                                                     const VectorGrid& phases) const {
    check_same_grid(delta, phases, "reconstruct_from_vector");
    BlockGrid out(delta.rows, delta.cols, Matrix());
    for (std::size_t i = 0; i < delta.size(); ++i) {
        const auto k = static_cast<std::size_t>(delta.cells[i].size());
        out.cells[i] = reconstruct(delta.cells[i], topology_->to_mesh_layout(phases.cells[i], k));
    }
    return out;
}

} // namespace photon_mesh
