/**
 * IMPORT EXAMPLE
 * Shows how a pretrained dense layer is moved onto an MZI mesh and checked
 */

#include "photonic_layers.hpp"
#include "conversion_counters.hpp"
#include <cmath>
#include <iostream>
#include <random>

using namespace photon_mesh;

int main() {
    std::cout << "=== Photonic Mesh Import Example ===" << std::endl;

    // ========================================================================
    // 1. PRETRAINED WEIGHTS - stand-in for a trained 20 -> 12 dense layer
    // ========================================================================
    std::cout << "\n[1] Creating pretrained dense layer..." << std::endl;

    std::mt19937 rng(2024);
    std::normal_distribution<double> dist(0.0, 0.3);
    Matrix W(12, 20);
    for (Eigen::Index i = 0; i < W.rows(); i++) {
        for (Eigen::Index j = 0; j < W.cols(); j++) W(i, j) = dist(rng);
    }
    Vector b(12);
    for (Eigen::Index i = 0; i < b.size(); i++) b[i] = dist(rng) * 0.1;

    std::cout << "  ✅ Dense weight " << W.rows() << "x" << W.cols()
              << ", bias " << b.size() << std::endl;

    // ========================================================================
    // 2. IMPORT - zero-pad into 8x8 blocks, sync weight -> usv -> phase
    // ========================================================================
    std::cout << "\n[2] Importing into phase mode (k=8, Clements mesh)..." << std::endl;

    LinearLayerConfig cfg;
    cfg.block_size = 8;
    cfg.mode = Mode::PHASE;
    cfg.algorithm = DecomposeAlg::CLEMENTS;
    MziBlockLinear layer = MziBlockLinear::from_dense(W, &b, cfg);

    std::cout << get_tiling_statistics(layer.tiling());
    std::cout << "  ✅ Trainable: ";
    for (const std::string& name : layer.sync().trainable_parameter_names()) {
        std::cout << name << " ";
    }
    std::cout << std::endl;

    // ========================================================================
    // 3. VERIFY - full precision must match the dense layer
    // ========================================================================
    std::cout << "\n[3] Comparing against the dense layer..." << std::endl;

    Matrix x(4, 20);
    std::uniform_real_distribution<double> unit(0.0, 1.0);
    for (Eigen::Index i = 0; i < x.rows(); i++) {
        for (Eigen::Index j = 0; j < x.cols(); j++) x(i, j) = unit(rng);
    }
    Matrix reference = x * W.transpose();
    reference.rowwise() += b.transpose();

    const double exact_err = (layer.forward(x) - reference).cwiseAbs().maxCoeff();
    const bool match = exact_err < 1e-9;
    std::cout << "  " << (match ? "✅" : "❌") << " Max output error " << exact_err << std::endl;

    // ========================================================================
    // 4. HARDWARE - 8-bit phase DAC, device variation, crosstalk
    // ========================================================================
    std::cout << "\n[4] Applying hardware non-idealities..." << std::endl;

    layer.sync().set_weight_bitwidth(8);
    layer.sync().set_gamma_noise(0.002, 17u);
    layer.sync().set_crosstalk_factor(0.05);

    const Matrix noisy = layer.forward(x);
    const double rel = (noisy - reference).norm() / reference.norm();
    std::cout << "  ✅ Relative output error on hardware: " << rel << std::endl;

    // ========================================================================
    // 5. SNAPSHOT - copy the programmed phases into a fresh layer
    // ========================================================================
    std::cout << "\n[5] Saving and restoring parameters..." << std::endl;

    ParameterDict snapshot = layer.state_dict();
    cfg.in_features = 20;
    cfg.out_features = 12;
    MziBlockLinear restored(cfg, 1);
    restored.load_parameters(snapshot);

    const double restore_err = (restored.forward(x) - noisy).cwiseAbs().maxCoeff();
    std::cout << "  " << (restore_err < 1e-9 ? "✅" : "❌") << " Restored " << snapshot.size()
              << " tensors, output difference " << restore_err << std::endl;

    // ========================================================================
    // 6. COUNTERS
    // ========================================================================
    ConversionCounters::print_report(layer.sync().counters(), std::cout);

    std::cout << "=== Import Example Complete ===" << std::endl;
    return (match && restore_err < 1e-9) ? 0 : 1;
}
