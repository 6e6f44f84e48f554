/**
 * ╔═══════════════════════════════════════════════════════════════════════════╗
 * ║                       TEST_END_TO_END.CPP                                 ║
 * ╠═══════════════════════════════════════════════════════════════════════════╣
 * ║  INTEGRATION TESTS: dense weight import through to layer outputs          ║
 * ║  TESTS: photonic_layers.hpp + everything below it                         ║
 * ╠═══════════════════════════════════════════════════════════════════════════╣
 * ║                                                                           ║
 * ║  FLOW UNDER TEST:                                                         ║
 * ║    dense W ──tile──► grid ──svd──► usv ──decompose──► phase ──► voltage   ║
 * ║    active mode ──build_weight──► grid ──merge──► W' ──► forward(x)        ║
 * ║                                                                           ║
 * ║  At full precision W' must equal W for every mode and topology, so the    ║
 * ║  photonic layer must match a plain dense layer.                           ║
 * ║                                                                           ║
 * ╚═══════════════════════════════════════════════════════════════════════════╝
 */

#include <iostream>
#include <vector>
#include <cmath>

#include "../include/photonic_layers.hpp"
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

static Vector random_vector(size_t n, uint32_t seed) {
    test::RandomGenerator gen(seed);
    Vector v(n);
    for (size_t i = 0; i < n; i++) v[i] = gen.next_double();
    return v;
}

/// Inputs in [0, 1] so input quantization has nothing to clamp
static Matrix unit_inputs(size_t batch, size_t features, uint32_t seed) {
    test::RandomGenerator gen(seed);
    Matrix x(batch, features);
    for (Eigen::Index i = 0; i < x.rows(); i++) {
        for (Eigen::Index j = 0; j < x.cols(); j++) x(i, j) = gen.next_double(0.0, 1.0);
    }
    return x;
}

// =============================================================================
// Test Cases
// =============================================================================

bool test_linear_matches_dense_all_modes() {
    const Matrix W = test::random_matrix(10, 7, 1);
    const Vector b = random_vector(10, 2);
    const Matrix x = unit_inputs(5, 7, 3);
    Matrix expected = x * W.transpose();
    expected.rowwise() += b.transpose();

    for (Mode mode : {Mode::WEIGHT, Mode::FACTORED, Mode::PHASE, Mode::VOLTAGE}) {
        for (DecomposeAlg alg : {DecomposeAlg::CLEMENTS, DecomposeAlg::RECK}) {
            LinearLayerConfig cfg;
            cfg.mode = mode;
            cfg.algorithm = alg;
            MziBlockLinear layer = MziBlockLinear::from_dense(W, &b, cfg);

            if (layer.tiling().grid_rows != 3 || layer.tiling().grid_cols != 2) return false;
            if (!test::compare_tolerant(W, layer.dense_weight(), TOL)) {
                std::cout << "(" << to_string(mode) << "/" << to_string(alg) << ") ";
                return false;
            }
            if (!test::compare_tolerant(expected, layer.forward(x), TOL)) return false;
        }
    }
    return true;
}

bool test_linear_photodetect_order() {
    const Matrix W = test::random_matrix(4, 4, 11);
    const Vector b = random_vector(4, 12);
    const Matrix x = unit_inputs(3, 4, 13);

    LinearLayerConfig cfg;
    cfg.photodetect = true;
    MziBlockLinear layer = MziBlockLinear::from_dense(W, &b, cfg);

    // Square before the bias
    Matrix expected = (x * W.transpose()).array().square().matrix();
    expected.rowwise() += b.transpose();
    return test::compare_tolerant(expected, layer.forward(x), TOL);
}

bool test_conv_matches_dense() {
    Conv2dLayerConfig cfg;
    cfg.in_channels = 3;
    cfg.out_channels = 5;
    cfg.kernel_size = 3;
    cfg.padding = 1;
    cfg.mode = Mode::PHASE;

    const Matrix W = test::random_matrix(5, 27, 21);
    const Vector b = random_vector(5, 22);
    MziBlockConv2d layer = MziBlockConv2d::from_dense(W, &b, cfg);
    if (layer.tiling().grid_rows != 2 || layer.tiling().grid_cols != 7) return false;

    compute::FeatureMap x(2, 3, 6, 6);
    test::RandomGenerator gen(23);
    for (double& v : x.data) v = gen.next_double(0.0, 1.0);

    compute::FeatureMap expected = compute::conv2d(x, W, cfg.geometry());
    compute::add_bias(expected, b);
    compute::FeatureMap y = layer.forward(x);

    if (y.size() != expected.size()) return false;
    for (size_t i = 0; i < y.size(); i++) {
        if (std::abs(y.data[i] - expected.data[i]) > TOL) return false;
    }
    return true;
}

bool test_quantized_weight_error_shrinks() {
    const Matrix W = test::random_matrix(8, 8, 31);
    LinearLayerConfig cfg;
    cfg.mode = Mode::PHASE;
    cfg.bias = false;
    MziBlockLinear layer = MziBlockLinear::from_dense(W, nullptr, cfg);

    double previous = 1e9;
    for (unsigned bit : {4u, 8u, 12u}) {
        layer.sync().set_weight_bitwidth(bit);
        const double err = (layer.dense_weight() - W).cwiseAbs().maxCoeff();
        if (!std::isfinite(err) || err >= previous) {
            std::cout << "(bit=" << bit << " err=" << err << ") ";
            return false;
        }
        previous = err;
    }
    layer.sync().set_weight_bitwidth(32);
    return test::compare_tolerant(W, layer.dense_weight(), TOL);
}

bool test_fast_forward_cache() {
    const Matrix W = test::random_matrix(6, 6, 41);
    LinearLayerConfig cfg;
    cfg.mode = Mode::PHASE;
    cfg.bias = false;
    MziBlockLinear layer = MziBlockLinear::from_dense(W, nullptr, cfg);
    const Matrix x = unit_inputs(2, 6, 42);

    layer.set_fast_forward(true);
    const Matrix y1 = layer.forward(x);
    layer.sync().reset_counters();
    const Matrix y2 = layer.forward(x);
    if (layer.sync().counters().total() != 0) return false;
    if (!test::compare_tolerant(y1, y2, 0.0)) return false;

    // Turning it off rebuilds on every call
    layer.set_fast_forward(false);
    layer.forward(x);
    return layer.sync().counters().materializations == layer.tiling().num_blocks();
}

bool test_input_bitwidth() {
    const Matrix W = Matrix::Identity(4, 4);
    LinearLayerConfig cfg;
    cfg.bias = false;
    MziBlockLinear layer = MziBlockLinear::from_dense(W, nullptr, cfg);

    Matrix x(1, 4);
    x << 0.1, 0.4, 0.6, 1.7;
    layer.set_input_bitwidth(1);
    Matrix y = layer.forward(x);
    Matrix expected(1, 4);
    expected << 0.0, 0.0, 1.0, 1.0;
    if (!test::compare_tolerant(expected, y, TOL)) return false;

    try {
        layer.set_input_bitwidth(0);
        return false;
    } catch (const std::invalid_argument&) {}
    return true;
}

bool test_state_dict_with_bias() {
    const Matrix W = test::random_matrix(9, 5, 51);
    const Vector b = random_vector(9, 52);
    LinearLayerConfig cfg;
    cfg.mode = Mode::VOLTAGE;
    MziBlockLinear src = MziBlockLinear::from_dense(W, &b, cfg);
    ParameterDict dict = src.state_dict();
    if (dict.count("bias") != 1 || dict.count("voltage_U") != 1) return false;

    cfg.in_features = 5;
    cfg.out_features = 9;
    MziBlockLinear dst(cfg, 99);
    dst.load_parameters(dict);

    const Matrix x = unit_inputs(3, 5, 53);
    if (!test::compare_tolerant(src.forward(x), dst.forward(x), TOL)) return false;

    // A wrong-length bias is rejected before anything changes
    ParameterDict bad = dict;
    bad["bias"].shape = {4};
    bad["bias"].values.resize(4);
    try {
        dst.load_parameters(bad);
        return false;
    } catch (const ShapeMismatchError&) {}
    return test::compare_tolerant(b, dst.bias(), 0.0);
}

bool test_reset_parameters_seeded() {
    LinearLayerConfig cfg;
    cfg.in_features = 12;
    cfg.out_features = 8;
    cfg.mode = Mode::PHASE;

    MziBlockLinear a(cfg, 7), b(cfg, 7), c(cfg, 8);
    const Matrix wa = a.dense_weight();
    if (!test::compare_tolerant(wa, b.dense_weight(), 0.0)) return false;
    if (test::compare_tolerant(wa, c.dense_weight(), 1e-3)) return false;

    // Kaiming std = sqrt(2 / 12) ~ 0.41: sample std should land nearby
    const double mean = wa.mean();
    const double var = (wa.array() - mean).square().sum() / static_cast<double>(wa.size() - 1);
    if (std::sqrt(var) < 0.25 || std::sqrt(var) > 0.6) return false;

    // Plain amplitude output unless photodetection is asked for
    if (cfg.photodetect || Conv2dLayerConfig().photodetect) return false;

    // Bias starts at zero, even after a non-zero bias was loaded
    if (a.bias().size() != 8 || a.bias().cwiseAbs().maxCoeff() != 0.0) return false;
    a.set_bias(Vector::Constant(8, 0.5));
    a.reset_parameters(7);
    return a.bias().cwiseAbs().maxCoeff() == 0.0 &&
           test::compare_tolerant(wa, a.dense_weight(), 0.0);
}

bool test_errors() {
    LinearLayerConfig cfg;
    try {
        MziBlockLinear layer(cfg);      // zero features
        return false;
    } catch (const std::invalid_argument&) {}

    cfg.in_features = 4;
    cfg.out_features = 4;
    MziBlockLinear layer(cfg);
    try {
        layer.forward(Matrix::Ones(2, 5));
        return false;
    } catch (const ShapeMismatchError&) {}

    try {
        layer.load_dense(Matrix::Ones(4, 5), nullptr);
        return false;
    } catch (const ShapeMismatchError&) {}

    Conv2dLayerConfig conv;
    conv.in_channels = 2;
    conv.kernel_size = 3;
    try {
        MziBlockConv2d::from_dense(Matrix::Ones(4, 10), nullptr, conv);
        return false;
    } catch (const ShapeMismatchError&) {}

    cfg.bias = false;
    MziBlockLinear no_bias(cfg);
    try {
        no_bias.set_bias(Vector::Ones(4));
        return false;
    } catch (const NotSupportedError&) {}
    return true;
}

// =============================================================================
// Main
// =============================================================================

int main() {
    std::cout << "=== End-to-End Tests ===" << std::endl;

    TEST(test_linear_matches_dense_all_modes);
    TEST(test_linear_photodetect_order);
    TEST(test_conv_matches_dense);
    TEST(test_quantized_weight_error_shrinks);
    TEST(test_fast_forward_cache);
    TEST(test_input_bitwidth);
    TEST(test_state_dict_with_bias);
    TEST(test_reset_parameters_seeded);
    TEST(test_errors);

    std::cout << std::endl;
    std::cout << "Passed: " << passed << "/" << (passed + failed) << std::endl;

    return failed == 0 ? 0 : 1;
}
