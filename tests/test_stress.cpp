/**
 * ╔═══════════════════════════════════════════════════════════════════════════╗
 * ║                         TEST_STRESS.CPP                                   ║
 * ╠═══════════════════════════════════════════════════════════════════════════╣
 * ║  STRESS TESTS: Edge cases, extreme device settings, long random runs      ║
 * ║  TESTS: All components under extreme conditions                           ║
 * ╠═══════════════════════════════════════════════════════════════════════════╣
 * ║                                                                           ║
 * ║  1. test_one_bit_full_crosstalk()   1-bit DAC, crosstalk 1.0, γ noise     ║
 * ║  2. test_non_finite_phases()        inf / nan / 1e12 phases stay finite   ║
 * ║  3. test_zero_weights()             all-dark layer, output = bias         ║
 * ║  4. test_extreme_magnitudes()       1e6 and 1e-150 scaled weights         ║
 * ║  5. test_rank_deficient()           rank-1 and duplicated-row blocks      ║
 * ║  6. test_large_blocks()             k = 32 and k = 64 full mode graph     ║
 * ║  7. test_random_long_run()          random k / topology / mode            ║
 * ║  8. test_repeated_builds()          noisy builds are stable over time     ║
 * ║                                                                           ║
 * ╚═══════════════════════════════════════════════════════════════════════════╝
 */

#include <iostream>
#include <vector>
#include <random>
#include <chrono>
#include <cmath>
#include <limits>

#include "../include/photonic_layers.hpp"
#include "../include/phase_quantizer.hpp"
#include "../include/representation_sync.hpp"
#include "../include/test_utils.hpp"

using namespace photon_mesh;

// =============================================================================
// Test Utilities
// =============================================================================

#define TEST(name) \
    std::cout << "  " << #name << "... " << std::flush; \
    if (name()) { std::cout << "PASS" << std::endl; passed++; } \
    else { std::cout << "FAIL" << std::endl; failed++; }

static int passed = 0;
static int failed = 0;

static bool all_finite(const BlockGrid& grid) {
    for (const Matrix& m : grid.cells) {
        if (!m.allFinite()) return false;
    }
    return true;
}

static bool all_finite(const VectorGrid& grid) {
    for (const Vector& v : grid.cells) {
        if (!v.allFinite()) return false;
    }
    return true;
}

static double max_abs(const BlockGrid& grid) {
    double m = 0.0;
    for (const Matrix& block : grid.cells) {
        if (block.size() > 0) m = std::max(m, block.cwiseAbs().maxCoeff());
    }
    return m;
}

static RepresentationSync loaded_sync(Mode mode, const BlockGrid& weight, DecomposeAlg alg) {
    SyncConfig cfg;
    cfg.grid_rows = weight.rows;
    cfg.grid_cols = weight.cols;
    cfg.block_size = static_cast<size_t>(weight.cells.front().rows());
    cfg.mode = mode;
    cfg.algorithm = alg;
    RepresentationSync sync(cfg);
    sync.weight_blocks().weight = weight;
    sync.sync_parameters(Mode::WEIGHT);
    return sync;
}

// =============================================================================
// Test Cases
// =============================================================================

bool test_one_bit_full_crosstalk() {
    const BlockGrid W = test::random_block_grid(2, 2, 8, 1);
    for (DecomposeAlg alg : {DecomposeAlg::CLEMENTS, DecomposeAlg::RECK}) {
        for (Mode mode : {Mode::PHASE, Mode::VOLTAGE}) {
            RepresentationSync sync = loaded_sync(mode, W, alg);
            sync.set_weight_bitwidth(1);
            sync.set_crosstalk_factor(1.0);
            sync.set_gamma_noise(0.5, 7u);
            sync.set_phase_variation(0.3, 8u);

            const BlockGrid& out = sync.build_weight();
            if (!all_finite(out)) return false;

            // U, V stay orthogonal and |cos| <= 1, so entries never exceed S_scale <= k·max|W|
            const double bound = max_abs(W) * 8.0;
            if (max_abs(out) > bound) return false;
        }
    }
    return true;
}

bool test_non_finite_phases() {
    const double inf = std::numeric_limits<double>::infinity();
    const double nan = std::numeric_limits<double>::quiet_NaN();

    for (MeshLayout layout : {MeshLayout::TRIANGLE, MeshLayout::RECTANGLE, MeshLayout::DIAGONAL}) {
        QuantizerConfig cfg = QuantizerConfig::for_layout(layout, 1);
        cfg.crosstalk_factor = 1.0;
        PhaseQuantizer q(cfg);

        VectorGrid phases = make_vector_grid(1, 2, 6);
        phases.cells[0] << inf, -inf, nan, 1e12, -1e12, 1e-300;
        phases.cells[1] << 0.0, -0.0, 2.0 * 3.14159265358979323846, -1e-17, 1e308, -1e308;
        q.set_gamma_noise(1.0, 1, 2, 6, 3u);

        VectorGrid out = q.quantize(phases);
        if (!all_finite(out)) {
            std::cout << "(" << to_string(layout) << ") ";
            return false;
        }
    }
    return true;
}

bool test_zero_weights() {
    LinearLayerConfig cfg;
    cfg.mode = Mode::PHASE;
    cfg.block_size = 4;
    Vector b(6);
    b << 0.5, -1.0, 0.0, 2.0, 3.0, -0.25;
    MziBlockLinear layer = MziBlockLinear::from_dense(Matrix::Zero(6, 10), &b, cfg);

    // All-dark: S_scale = 0, reconstructed S exactly zero, no NaN anywhere
    const PhaseBlocks& p = layer.sync().phase_blocks();
    for (double s : p.S_scale.cells) {
        if (s != 0.0) return false;
    }
    if (!all_finite(p.phase_S)) return false;

    layer.sync().set_weight_bitwidth(4);
    layer.sync().set_gamma_noise(0.1, 1u);
    if (layer.dense_weight().cwiseAbs().maxCoeff() != 0.0) return false;

    Matrix x = Matrix::Constant(3, 10, 0.7);
    Matrix y = layer.forward(x);
    for (Eigen::Index i = 0; i < y.rows(); i++) {
        if (!test::compare_tolerant(Vector(y.row(i).transpose()), b, 0.0)) return false;
    }
    return true;
}

bool test_extreme_magnitudes() {
    for (double scale : {1e6, 1e-150}) {
        BlockGrid W = test::random_block_grid(2, 2, 6, 11);
        for (Matrix& m : W.cells) m *= scale;

        for (Mode mode : {Mode::FACTORED, Mode::PHASE, Mode::VOLTAGE}) {
            RepresentationSync sync = loaded_sync(mode, W, DecomposeAlg::CLEMENTS);
            const BlockGrid& out = sync.build_weight();
            if (!all_finite(out)) return false;
            const double rel = max_abs_diff(W, out) / max_abs(W);
            if (rel > 1e-9) {
                std::cout << "(scale=" << scale << " rel=" << rel << ") ";
                return false;
            }
        }
    }
    return true;
}

bool test_rank_deficient() {
    BlockGrid W = make_block_grid(1, 3, 5);
    const Matrix u = test::random_matrix(5, 1, 21);
    const Matrix v = test::random_matrix(1, 5, 22);
    W.cells[0] = u * v;                              // rank 1
    W.cells[1] = test::random_matrix(5, 5, 23);
    W.cells[1].row(4) = W.cells[1].row(0);           // duplicated row
    W.cells[2] = Matrix::Zero(5, 5);
    W.cells[2](2, 3) = -4.0;                         // single entry

    for (DecomposeAlg alg : {DecomposeAlg::CLEMENTS, DecomposeAlg::RECK}) {
        RepresentationSync sync = loaded_sync(Mode::PHASE, W, alg);
        if (!test::compare_tolerant(W, sync.build_weight(), 1e-9)) return false;
    }
    return true;
}

bool test_large_blocks() {
    for (size_t k : {32u, 64u}) {
        const BlockGrid W = test::random_block_grid(1, 2, k, static_cast<uint32_t>(k));
        for (DecomposeAlg alg : {DecomposeAlg::CLEMENTS, DecomposeAlg::RECK}) {
            RepresentationSync sync = loaded_sync(Mode::PHASE, W, alg);
            const double err = max_abs_diff(W, sync.build_weight());
            if (err > 1e-8) {
                std::cout << "(k=" << k << " " << to_string(alg) << " err=" << err << ") ";
                return false;
            }
        }
    }
    return true;
}

bool test_random_long_run() {
    std::mt19937 rng(42);
    std::uniform_int_distribution<int> k_dist(1, 12);
    std::uniform_int_distribution<int> grid_dist(1, 3);
    std::uniform_int_distribution<int> mode_dist(0, 3);
    const Mode modes[] = {Mode::WEIGHT, Mode::FACTORED, Mode::PHASE, Mode::VOLTAGE};

    const int NUM_ITERATIONS = 300;
    int errors = 0;
    double worst = 0.0;

    for (int iter = 0; iter < NUM_ITERATIONS; iter++) {
        const size_t k = static_cast<size_t>(k_dist(rng));
        const size_t rows = static_cast<size_t>(grid_dist(rng));
        const size_t cols = static_cast<size_t>(grid_dist(rng));
        const Mode mode = modes[mode_dist(rng)];
        const DecomposeAlg alg = (iter % 2 == 0) ? DecomposeAlg::CLEMENTS : DecomposeAlg::RECK;

        const BlockGrid W = test::random_block_grid(rows, cols, k, static_cast<uint32_t>(iter));
        RepresentationSync sync = loaded_sync(mode, W, alg);
        const double err = max_abs_diff(W, sync.build_weight());
        worst = std::max(worst, err);
        if (err > 1e-9) errors++;
    }

    if (errors > 0) {
        std::cerr << errors << " errors in " << NUM_ITERATIONS
                  << " iterations, worst " << worst << std::endl;
        return false;
    }
    return true;
}

bool test_repeated_builds() {
    const BlockGrid W = test::random_block_grid(2, 3, 6, 31);
    RepresentationSync sync = loaded_sync(Mode::PHASE, W, DecomposeAlg::CLEMENTS);
    sync.set_weight_bitwidth(6);
    sync.set_gamma_noise(0.02, 5u);
    sync.set_crosstalk_factor(0.3);
    sync.set_phase_variation(0.01, 6u);

    const BlockGrid first = sync.build_weight();
    if (!all_finite(first)) return false;
    const ConversionCounters before = sync.counters();

    auto start = std::chrono::high_resolution_clock::now();
    const int NUM_BUILDS = 200;
    for (int i = 0; i < NUM_BUILDS; i++) {
        if (max_abs_diff(first, sync.build_weight()) != 0.0) return false;
    }
    auto end = std::chrono::high_resolution_clock::now();
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(end - start);

    std::cout << NUM_BUILDS << " builds in " << ms.count() << "ms... ";
    const ConversionCounters delta = sync.counters() - before;
    return delta.materializations == NUM_BUILDS * W.size() && delta.svds == 0;
}

// =============================================================================
// Main
// =============================================================================

int main() {
    std::cout << "=== Stress Tests ===" << std::endl;

    TEST(test_one_bit_full_crosstalk);
    TEST(test_non_finite_phases);
    TEST(test_zero_weights);
    TEST(test_extreme_magnitudes);
    TEST(test_rank_deficient);
    TEST(test_large_blocks);
    TEST(test_random_long_run);
    TEST(test_repeated_builds);

    std::cout << std::endl;
    std::cout << "Passed: " << passed << "/" << (passed + failed) << std::endl;

    return failed == 0 ? 0 : 1;
}
