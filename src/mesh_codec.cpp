/**
 * ╔═══════════════════════════════════════════════════════════════════════════╗
 * ║                           MESH_CODEC.CPP                                  ║
 * ╠═══════════════════════════════════════════════════════════════════════════╣
 * ║  IMPLEMENTS: mesh_codec.hpp                                               ║
 * ╠═══════════════════════════════════════════════════════════════════════════╣
 * ║                                                                           ║
 * ║  to_mesh_layout():                                                        ║
 * ║    mesh = zeros(k, k)                                                     ║
 * ║    idx = 0                                                                ║
 * ║    for row = 0 to k:                                                      ║
 * ║      for col = 0 to k:                                                    ║
 * ║        if occupied(row, col): mesh[row][col] = angles[idx++]              ║
 * ║                                                                           ║
 * ║  to_vector() walks the same cells in the same order, so the pair is an    ║
 * ║  exact bijection between R^(k(k-1)/2) and the occupied cells.             ║
 * ║                                                                           ║
 * ╚═══════════════════════════════════════════════════════════════════════════╝
 */

#include "mesh_codec.hpp"

#include <cmath>
#include <string>

namespace photon_mesh {

MeshLayout parse_mesh_layout(std::string_view name) {
    if (name == "triangle") return MeshLayout::TRIANGLE;
    if (name == "rectangle") return MeshLayout::RECTANGLE;
    if (name == "diagonal") return MeshLayout::DIAGONAL;
    throw NotSupportedError("unknown mesh layout: " + std::string(name));
}

const char* to_string(MeshLayout layout) {
    switch (layout) {
        case MeshLayout::TRIANGLE:  return "triangle";
        case MeshLayout::RECTANGLE: return "rectangle";
        case MeshLayout::DIAGONAL:  return "diagonal";
    }
    return "unknown";
}

std::size_t block_size_from_angles(std::size_t n) {
    // k(k-1)/2 = n  =>  k = (1 + sqrt(1 + 8n)) / 2
    const double root = (1.0 + std::sqrt(1.0 + 8.0 * static_cast<double>(n))) / 2.0;
    const auto k = static_cast<std::size_t>(std::llround(root));
    if (num_mesh_angles(k) != n) {
        throw ShapeMismatchError("vector length " + std::to_string(n) +
                                 " is not k(k-1)/2 for any block size k");
    }
    return k;
}

//==============================================================================
// MeshTopology
//==============================================================================

Matrix MeshTopology::to_mesh_layout(const Vector& angles, std::size_t k) const {
    if (static_cast<std::size_t>(angles.size()) != num_mesh_angles(k)) {
        throw ShapeMismatchError(std::string(name()) + " mesh: expected " +
                                 std::to_string(num_mesh_angles(k)) + " angles for k=" +
                                 std::to_string(k) + ", got " +
                                 std::to_string(angles.size()));
    }

    Matrix mesh = Matrix::Zero(k, k);
    Eigen::Index idx = 0;
    for (std::size_t row = 0; row < k; ++row) {
        for (std::size_t col = 0; col < k; ++col) {
            if (occupied(row, col, k)) {
                mesh(row, col) = angles[idx++];
            }
        }
    }
    return mesh;
}

Vector MeshTopology::to_vector(const Matrix& mesh) const {
    if (mesh.rows() != mesh.cols()) {
        throw ShapeMismatchError(std::string(name()) + " mesh layout must be square, got " +
                                 std::to_string(mesh.rows()) + "x" +
                                 std::to_string(mesh.cols()));
    }

    const auto k = static_cast<std::size_t>(mesh.rows());
    Vector angles(num_mesh_angles(k));
    Eigen::Index idx = 0;
    for (std::size_t row = 0; row < k; ++row) {
        for (std::size_t col = 0; col < k; ++col) {
            if (occupied(row, col, k)) {
                angles[idx++] = mesh(row, col);
            }
        }
    }
    return angles;
}

BlockGrid MeshTopology::to_mesh_layout(const VectorGrid& angles, std::size_t k) const {
    BlockGrid out = make_block_grid(angles.rows, angles.cols, k);
    for (std::size_t i = 0; i < angles.size(); ++i) {
        out.cells[i] = to_mesh_layout(angles.cells[i], k);
    }
    return out;
}

VectorGrid MeshTopology::to_vector(const BlockGrid& meshes) const {
    VectorGrid out(meshes.rows, meshes.cols, Vector());
    for (std::size_t i = 0; i < meshes.size(); ++i) {
        out.cells[i] = to_vector(meshes.cells[i]);
    }
    return out;
}

std::shared_ptr<const MeshTopology> make_topology(MeshLayout layout) {
    switch (layout) {
        case MeshLayout::TRIANGLE:
            return std::make_shared<TriangularMesh>();
        case MeshLayout::RECTANGLE:
            return std::make_shared<CheckerboardMesh>();
        case MeshLayout::DIAGONAL:
            break;
    }
    throw NotSupportedError(std::string("no mesh topology for layout '") +
                            to_string(layout) + "'");
}

} // namespace photon_mesh
