/**
 * ╔═══════════════════════════════════════════════════════════════════════════╗
 * ║                       TEST_PERFORMANCE.CPP                                ║
 * ╠═══════════════════════════════════════════════════════════════════════════╣
 * ║  PERFORMANCE TESTS: Decomposition, materialization and forward latency    ║
 * ╠═══════════════════════════════════════════════════════════════════════════╣
 * ║                                                                           ║
 * ║  Measures the cost of each edge of the mode graph so regressions in the   ║
 * ║  hot paths show up as numbers. Nothing here fails on timing; the only     ║
 * ║  checks are that every benchmark produced a finite result.                ║
 * ║                                                                           ║
 * ║  1. bench_decompose()           Clements vs Reck, k = 4..64               ║
 * ║  2. bench_reconstruct()         mesh -> orthogonal block                  ║
 * ║  3. bench_full_sync()           weight -> usv -> phase -> voltage         ║
 * ║  4. bench_materialize()         phase build, exact vs quantized           ║
 * ║  5. bench_update_list()         U+S+V rebuild vs S-only rebuild           ║
 * ║  6. bench_layer_forward()       MziBlockLinear / MziBlockConv2d           ║
 * ║                                                                           ║
 * ╚═══════════════════════════════════════════════════════════════════════════╝
 */

#include <iostream>
#include <vector>
#include <chrono>
#include <iomanip>
#include <cmath>

#include "../include/photonic_layers.hpp"
#include "../include/representation_sync.hpp"
#include "../include/unitary_decomposer.hpp"
#include "../include/test_utils.hpp"

using namespace photon_mesh;

// =============================================================================
// Configuration
// =============================================================================

static constexpr size_t GRID_ROWS = 8;
static constexpr size_t GRID_COLS = 8;

static bool all_ok = true;

static void check_finite(const std::string& name, double value) {
    if (!std::isfinite(value) || value < 0.0) {
        std::cout << "  " << name << ": bad timing " << value << std::endl;
        all_ok = false;
    }
}

static RepresentationSync loaded_sync(Mode mode, size_t k, uint32_t seed) {
    SyncConfig cfg;
    cfg.grid_rows = GRID_ROWS;
    cfg.grid_cols = GRID_COLS;
    cfg.block_size = k;
    cfg.mode = mode;
    RepresentationSync sync(cfg);
    sync.weight_blocks().weight = test::random_block_grid(GRID_ROWS, GRID_COLS, k, seed);
    sync.sync_parameters(Mode::WEIGHT);
    return sync;
}

// =============================================================================
// Benchmarks
// =============================================================================

void bench_decompose() {
    SECTION("Unitary Decomposition Benchmark");

    for (DecomposeAlg alg : {DecomposeAlg::CLEMENTS, DecomposeAlg::RECK}) {
        UnitaryDecomposer dec(alg);
        for (size_t k : {4u, 8u, 16u, 32u, 64u}) {
            const Matrix U = test::random_orthogonal(k, static_cast<uint32_t>(k));
            const size_t iters = k <= 16 ? 200 : 20;
            const double us = test::benchmark([&]() { dec.decompose(U); }, iters);

            std::string name = std::string(to_string(alg)) + " decompose k=" + std::to_string(k);
            // Each rotation touches two rows of k entries
            test::print_benchmark(name, us, num_mesh_angles(k) * 4 * k);
            check_finite(name, us);
        }
    }
}

void bench_reconstruct() {
    SECTION("Unitary Reconstruction Benchmark");

    for (DecomposeAlg alg : {DecomposeAlg::CLEMENTS, DecomposeAlg::RECK}) {
        UnitaryDecomposer dec(alg);
        for (size_t k : {4u, 16u, 64u}) {
            const MeshDecomposition d = dec.decompose(test::random_orthogonal(k, 5));
            const size_t iters = k <= 16 ? 200 : 20;
            const double us = test::benchmark(
                [&]() { dec.reconstruct(d.delta, d.phase_mesh); }, iters);

            std::string name = std::string(to_string(alg)) + " reconstruct k=" + std::to_string(k);
            test::print_benchmark(name, us, num_mesh_angles(k) * 4 * k);
            check_finite(name, us);
        }
    }
}

void bench_full_sync() {
    SECTION("Full Sync Benchmark (" + std::to_string(GRID_ROWS) + "x" +
            std::to_string(GRID_COLS) + " grid)");

    for (size_t k : {4u, 8u, 16u}) {
        RepresentationSync sync = loaded_sync(Mode::PHASE, k, 11);
        const double us = test::benchmark([&]() { sync.sync_parameters(Mode::WEIGHT); }, 10);

        std::string name = "sync_parameters(weight) k=" + std::to_string(k);
        test::print_benchmark(name, us);
        check_finite(name, us);
    }
}

void bench_materialize() {
    SECTION("Phase Materialization Benchmark");

    for (size_t k : {4u, 8u, 16u}) {
        RepresentationSync sync = loaded_sync(Mode::PHASE, k, 21);

        const double exact = test::benchmark([&]() { sync.build_weight(); }, 20);
        test::print_benchmark("exact build k=" + std::to_string(k), exact);
        check_finite("exact", exact);

        sync.set_weight_bitwidth(8);
        sync.set_crosstalk_factor(0.1);
        sync.set_gamma_noise(0.002, 1u);
        const double quantized = test::benchmark([&]() { sync.build_weight(); }, 20);
        test::print_benchmark("8-bit + crosstalk + noise k=" + std::to_string(k), quantized);
        check_finite("quantized", quantized);

        if (exact > 0.0) {
            std::cout << "    quantization overhead: " << std::fixed << std::setprecision(2)
                      << quantized / exact << "x" << std::defaultfloat << std::endl;
        }
    }
}

void bench_update_list() {
    SECTION("update_list Benchmark");

    RepresentationSync sync = loaded_sync(Mode::PHASE, 16, 31);
    sync.build_weight();

    const double full = test::benchmark([&]() { sync.build_weight(UpdateList::all()); }, 20);
    const double s_only = test::benchmark([&]() { sync.build_weight(UpdateList::only_s()); }, 20);
    test::print_benchmark("rebuild U, S, V (k=16)", full);
    test::print_benchmark("rebuild S only (k=16)", s_only);
    check_finite("full", full);
    check_finite("s_only", s_only);

    if (s_only > 0.0) {
        std::cout << "    speedup: " << std::fixed << std::setprecision(2)
                  << full / s_only << "x" << std::defaultfloat << std::endl;
    }
}

void bench_layer_forward() {
    SECTION("Layer Forward Benchmark");

    LinearLayerConfig lin;
    lin.in_features = 256;
    lin.out_features = 128;
    lin.block_size = 8;
    lin.mode = Mode::PHASE;
    MziBlockLinear linear(lin, 1);
    const Matrix x = Matrix::Constant(32, 256, 0.5);

    const double rebuild = test::benchmark([&]() { linear.forward(x); }, 10);
    linear.set_fast_forward(true);
    const double cached = test::benchmark([&]() { linear.forward(x); }, 10);
    test::print_benchmark("linear 256->128, batch 32", rebuild, 32 * 256 * 128);
    test::print_benchmark("  ... fast-forward", cached, 32 * 256 * 128);
    check_finite("linear", rebuild);
    check_finite("linear cached", cached);

    Conv2dLayerConfig conv;
    conv.in_channels = 16;
    conv.out_channels = 32;
    conv.kernel_size = 3;
    conv.padding = 1;
    conv.block_size = 8;
    conv.mode = Mode::PHASE;
    MziBlockConv2d conv_layer(conv, 2);
    conv_layer.set_fast_forward(true);

    compute::FeatureMap in(4, 16, 16, 16);
    for (size_t i = 0; i < in.size(); i++) in.data[i] = static_cast<double>(i % 7) / 7.0;
    const double us = test::benchmark([&]() { conv_layer.forward(in); }, 5);
    test::print_benchmark("conv 16->32 3x3 16x16, batch 4", us, 4 * 32 * 16 * 16 * 16 * 9);
    check_finite("conv", us);
}

// =============================================================================
// Main
// =============================================================================

int main() {
    std::cout << "╔══════════════════════════════════════════════════════════╗" << std::endl;
    std::cout << "║          PHOTONIC MESH PERFORMANCE BENCHMARKS            ║" << std::endl;
    std::cout << "╚══════════════════════════════════════════════════════════╝" << std::endl;

    bench_decompose();
    bench_reconstruct();
    bench_full_sync();
    bench_materialize();
    bench_update_list();
    bench_layer_forward();

    SECTION("Benchmark Complete");

    return all_ok ? 0 : 1;
}
