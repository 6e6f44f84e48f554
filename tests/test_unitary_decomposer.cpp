/**
 * ╔═══════════════════════════════════════════════════════════════════════════╗
 * ║                    TEST_UNITARY_DECOMPOSER.CPP                            ║
 * ╠═══════════════════════════════════════════════════════════════════════════╣
 * ║  UNIT TESTS: orthogonal block <-> (delta, Givens mesh) factorization      ║
 * ║  TESTS: unitary_decomposer.hpp / unitary_decomposer.cpp                   ║
 * ╠═══════════════════════════════════════════════════════════════════════════╣
 * ║                                                                           ║
 * ║  Round trips are checked for every k in 2..64 and both topologies, with   ║
 * ║  random orthogonal inputs of both determinant signs. Perturbed and zero   ║
 * ║  blocks check that non-orthogonal input degrades gracefully.              ║
 * ║                                                                           ║
 * ╚═══════════════════════════════════════════════════════════════════════════╝
 */

#include <iostream>
#include <vector>
#include <cmath>

#include "../include/unitary_decomposer.hpp"
#include "../include/test_utils.hpp"

using namespace photon_mesh;

// =============================================================================
// Test Utilities
// =============================================================================

#define TEST(name) \
    std::cout << "  " << #name << "... "; \
    if (name()) { std::cout << "PASS" << std::endl; passed++; } \
    else { std::cout << "FAIL" << std::endl; failed++; }

static int passed = 0;
static int failed = 0;

static const double TOL = 1e-9;

static bool round_trip(const UnitaryDecomposer& dec, const Matrix& U) {
    MeshDecomposition d = dec.decompose(U);
    Matrix back = dec.reconstruct(d.delta, d.phase_mesh);
    if (!test::compare_tolerant(U, back, TOL)) {
        test::DiffStats stats = test::compute_diff_stats(U, back);
        std::cout << "(" << to_string(dec.algorithm()) << " k=" << U.rows()
                  << " max_err=" << stats.max_error << ") " << std::endl;
        test::print_mismatches(U, back, TOL, 4);
        return false;
    }
    return true;
}

/// Mesh entries outside the topology's occupied cells must be zero
static bool mesh_respects_topology(const UnitaryDecomposer& dec, const Matrix& mesh) {
    const size_t k = static_cast<size_t>(mesh.rows());
    for (size_t r = 0; r < k; r++) {
        for (size_t c = 0; c < k; c++) {
            if (!dec.topology().occupied(r, c, k) &&
                mesh(static_cast<Eigen::Index>(r), static_cast<Eigen::Index>(c)) != 0.0) {
                return false;
            }
        }
    }
    return true;
}

// =============================================================================
// Test Cases
// =============================================================================

bool test_identity() {
    for (DecomposeAlg alg : {DecomposeAlg::CLEMENTS, DecomposeAlg::RECK}) {
        UnitaryDecomposer dec(alg);
        MeshDecomposition d = dec.decompose(Matrix::Identity(6, 6));
        if (d.phase_mesh.cwiseAbs().maxCoeff() > TOL) return false;
        if (!test::compare_tolerant(Vector(Vector::Ones(6)), d.delta, TOL)) return false;
    }
    return true;
}

bool test_clements_round_trip() {
    UnitaryDecomposer dec(DecomposeAlg::CLEMENTS);
    for (size_t k = 2; k <= 64; k++) {
        Matrix U = test::random_orthogonal(k, static_cast<uint32_t>(100 + k));
        if (!round_trip(dec, U)) return false;

        // Flip one column so det(U) = -1 is covered too
        U.col(0) *= -1.0;
        if (!round_trip(dec, U)) return false;
    }
    return true;
}

bool test_reck_round_trip() {
    UnitaryDecomposer dec(DecomposeAlg::RECK);
    for (size_t k = 2; k <= 64; k++) {
        Matrix U = test::random_orthogonal(k, static_cast<uint32_t>(200 + k));
        if (!round_trip(dec, U)) return false;

        U.col(k - 1) *= -1.0;
        if (!round_trip(dec, U)) return false;
    }
    return true;
}

bool test_delta_is_sign() {
    for (DecomposeAlg alg : {DecomposeAlg::CLEMENTS, DecomposeAlg::RECK}) {
        UnitaryDecomposer dec(alg);
        for (size_t k : {3u, 8u, 13u}) {
            MeshDecomposition d = dec.decompose(test::random_orthogonal(k, 7));
            for (Eigen::Index i = 0; i < d.delta.size(); i++) {
                if (std::abs(std::abs(d.delta[i]) - 1.0) > 1e-9) return false;
            }
        }
    }
    return true;
}

bool test_mesh_layout() {
    for (DecomposeAlg alg : {DecomposeAlg::CLEMENTS, DecomposeAlg::RECK}) {
        UnitaryDecomposer dec(alg);
        for (size_t k : {2u, 5u, 8u, 16u}) {
            MeshDecomposition d = dec.decompose(test::random_orthogonal(k, 11));
            if (!mesh_respects_topology(dec, d.phase_mesh)) return false;
        }
    }
    return true;
}

bool test_vector_form() {
    for (DecomposeAlg alg : {DecomposeAlg::CLEMENTS, DecomposeAlg::RECK}) {
        UnitaryDecomposer dec(alg);
        BlockGrid U(2, 3, Matrix());
        for (size_t i = 0; i < U.size(); i++) {
            U.cells[i] = test::random_orthogonal(8, static_cast<uint32_t>(300 + i));
        }

        VectorGrid delta, phases;
        dec.decompose_to_vector(U, delta, phases);
        if (phases.rows != 2 || phases.cols != 3) return false;
        if (static_cast<size_t>(phases.cells[0].size()) != num_mesh_angles(8)) return false;

        BlockGrid back = dec.reconstruct_from_vector(delta, phases);
        if (!test::compare_tolerant(U, back, TOL)) return false;
    }
    return true;
}

bool test_small_blocks() {
    UnitaryDecomposer dec;

    // k = 1: delta carries the sign, mesh is empty
    Matrix one(1, 1);
    one(0, 0) = -1.0;
    MeshDecomposition d = dec.decompose(one);
    if (d.delta.size() != 1 || d.delta[0] != -1.0) return false;
    if (dec.reconstruct(d.delta, d.phase_mesh)(0, 0) != -1.0) return false;

    // k = 0: everything empty
    MeshDecomposition e = dec.decompose(Matrix(0, 0));
    if (e.delta.size() != 0 || e.phase_mesh.size() != 0) return false;
    return dec.reconstruct(e.delta, e.phase_mesh).size() == 0;
}

static bool all_finite(const MeshDecomposition& d) {
    return d.delta.allFinite() && d.phase_mesh.allFinite();
}

bool test_non_orthogonal_input() {
    const size_t k = 8;
    const Matrix U = test::random_orthogonal(k, 91);
    const Matrix E = test::random_matrix(k, k, 92);
    const Matrix E_unit = E / E.cwiseAbs().maxCoeff();

    for (DecomposeAlg alg : {DecomposeAlg::CLEMENTS, DecomposeAlg::RECK}) {
        UnitaryDecomposer dec(alg);
        for (double eps : {1e-6, 1e-3, 1e-1}) {
            const Matrix noisy = U + eps * E_unit;
            MeshDecomposition d = dec.decompose(noisy);
            if (!all_finite(d)) return false;

            const Matrix back = dec.reconstruct(d.delta, d.phase_mesh);
            if (!back.allFinite()) return false;
            // Reconstruction is always orthogonal, and close to the input
            const Matrix gram = back.transpose() * back;
            if (!test::compare_tolerant(Matrix(Matrix::Identity(k, k)), gram, TOL)) return false;
            const double err = (back - noisy).cwiseAbs().maxCoeff();
            if (err > 10.0 * static_cast<double>(k) * eps) {
                std::cout << "(" << to_string(alg) << " eps=" << eps
                          << " err=" << err << ") ";
                return false;
            }
        }

        // All-zero block: no rotation has anything to null
        MeshDecomposition z = dec.decompose(Matrix::Zero(k, k));
        if (!all_finite(z)) return false;
        if (!dec.reconstruct(z.delta, z.phase_mesh).allFinite()) return false;
    }
    return true;
}

bool test_rotation_helpers() {
    Matrix m = test::random_matrix(4, 4, 5);
    Matrix r = m;
    rotate_rows(r, 1, 0.7);
    rotate_rows(r, 1, -0.7);
    if (!test::compare_tolerant(m, r, 1e-12)) return false;

    Matrix c = m;
    rotate_cols(c, 2, 1.3);
    rotate_cols(c, 2, -1.3);
    if (!test::compare_tolerant(m, c, 1e-12)) return false;

    Matrix q = test::random_orthogonal(10, 3);
    return orthogonality_error(q) < 1e-12 && orthogonality_error(2.0 * q) > 1.0;
}

bool test_errors() {
    UnitaryDecomposer dec;
    try {
        dec.decompose(Matrix::Zero(3, 4));
        return false;
    } catch (const ShapeMismatchError&) {}

    try {
        dec.reconstruct(Vector::Ones(3), Matrix::Zero(4, 4));
        return false;
    } catch (const ShapeMismatchError&) {}

    try {
        parse_decompose_alg("givens");
        return false;
    } catch (const NotSupportedError&) {}

    return parse_decompose_alg("francis") == DecomposeAlg::RECK &&
           parse_decompose_alg("clements") == DecomposeAlg::CLEMENTS &&
           layout_for(DecomposeAlg::RECK) == MeshLayout::TRIANGLE;
}

// =============================================================================
// Main
// =============================================================================

int main() {
    std::cout << "=== Unitary Decomposer Tests ===" << std::endl;

    TEST(test_identity);
    TEST(test_clements_round_trip);
    TEST(test_reck_round_trip);
    TEST(test_delta_is_sign);
    TEST(test_mesh_layout);
    TEST(test_vector_form);
    TEST(test_small_blocks);
    TEST(test_non_orthogonal_input);
    TEST(test_rotation_helpers);
    TEST(test_errors);

    std::cout << std::endl;
    std::cout << "Passed: " << passed << "/" << (passed + failed) << std::endl;

    return failed == 0 ? 0 : 1;
}
