/**
 * @file photonic_layers.cpp
 * @brief MziBlockLinear / MziBlockConv2d plumbing around RepresentationSync
 */

#include "photonic_layers.hpp"

#include <cmath>
#include <iostream>
#include <random>
#include <stdexcept>
#include <string>

namespace photon_mesh {

namespace {

SyncConfig make_sync_config(const TilingGeometry& geo, Mode mode, DecomposeAlg algorithm,
                            unsigned w_bit, double v_pi, double v_max) {
    SyncConfig cfg;
    cfg.grid_rows = geo.grid_rows;
    cfg.grid_cols = geo.grid_cols;
    cfg.block_size = geo.block_size;
    cfg.mode = mode;
    cfg.algorithm = algorithm;
    cfg.w_bit = w_bit;
    cfg.v_pi = v_pi;
    cfg.v_max = v_max;
    return cfg;
}

TilingGeometry checked_tiling(const char* name, std::size_t rows, std::size_t cols,
                              std::size_t block_size) {
    if (rows == 0 || cols == 0) {
        throw std::invalid_argument(std::string(name) + ": weight must be non-empty, got " +
                                    grid_shape_string(rows, cols));
    }
    return make_tiling(rows, cols, block_size);
}

} // anonymous namespace

//==============================================================================
// Configuration
//==============================================================================

void LinearLayerConfig::validate() const {
    if (in_features == 0 || out_features == 0) {
        throw std::invalid_argument("LinearLayerConfig: feature counts must be positive");
    }
    if (block_size == 0) {
        throw std::invalid_argument("LinearLayerConfig: block size must be positive");
    }
    if (in_bit == 0 || w_bit == 0) {
        throw std::invalid_argument("LinearLayerConfig: bit-widths must be positive");
    }
}

compute::Conv2dGeometry Conv2dLayerConfig::geometry() const {
    compute::Conv2dGeometry geo;
    geo.in_channels = in_channels;
    geo.out_channels = out_channels;
    geo.kernel_size = kernel_size;
    geo.stride = stride;
    geo.padding = padding;
    geo.dilation = dilation;
    return geo;
}

void Conv2dLayerConfig::validate() const {
    geometry().validate();
    if (block_size == 0) {
        throw std::invalid_argument("Conv2dLayerConfig: block size must be positive");
    }
    if (in_bit == 0 || w_bit == 0) {
        throw std::invalid_argument("Conv2dLayerConfig: bit-widths must be positive");
    }
}

//==============================================================================
// MziBlockLayer
//==============================================================================

MziBlockLayer::MziBlockLayer(const char* name, std::size_t rows, std::size_t cols,
                             std::size_t block_size, Mode mode, DecomposeAlg algorithm,
                             unsigned w_bit, double v_pi, double v_max,
                             bool bias, bool photodetect, unsigned in_bit)
    : name_(name)
    , tiling_(checked_tiling(name, rows, cols, block_size))
    , sync_(make_sync_config(tiling_, mode, algorithm, w_bit, v_pi, v_max))
    , bias_(Vector::Zero(bias ? static_cast<Eigen::Index>(rows) : 0))
    , has_bias_(bias)
    , photodetect_(photodetect)
    , in_bit_(in_bit)
    , fast_forward_(false)
    , cache_valid_(false)
    , verbose_(false)
{
}

void MziBlockLayer::log(const std::string& msg) const {
    if (verbose_) {
        std::cout << "[" << name_ << "] " << msg << std::endl;
    }
}

void MziBlockLayer::set_verbose(bool verbose) {
    verbose_ = verbose;
    sync_.set_verbose(verbose);
}

Matrix MziBlockLayer::dense_weight() {
    return merge_from_grid(sync_.build_weight(), tiling_.rows, tiling_.cols);
}

const Matrix& MziBlockLayer::forward_weight() {
    if (!fast_forward_ || !cache_valid_) {
        cached_weight_ = dense_weight();
        cache_valid_ = true;
    }
    return cached_weight_;
}

void MziBlockLayer::set_bias(const Vector& bias) {
    if (!has_bias_) {
        throw NotSupportedError(std::string(name_) + " was built without a bias");
    }
    if (bias.size() != bias_.size()) {
        throw ShapeMismatchError(std::string(name_) + ": bias has " +
                                 std::to_string(bias.size()) + " entries, expected " +
                                 std::to_string(bias_.size()));
    }
    bias_ = bias;
}

void MziBlockLayer::set_fast_forward(bool enabled) {
    fast_forward_ = enabled;
    cache_valid_ = false;
}

void MziBlockLayer::set_input_bitwidth(unsigned in_bit) {
    if (in_bit == 0) {
        throw std::invalid_argument(std::string(name_) + ": input bit-width must be positive");
    }
    in_bit_ = in_bit;
}

void MziBlockLayer::reset_parameters(std::uint32_t seed) {
    std::mt19937 rng(seed);
    const double fan_in = static_cast<double>(tiling_.cols);
    std::normal_distribution<double> weight_dist(0.0, std::sqrt(2.0 / fan_in));

    Matrix weight(tiling_.rows, tiling_.cols);
    for (Eigen::Index i = 0; i < weight.rows(); ++i) {
        for (Eigen::Index j = 0; j < weight.cols(); ++j) {
            weight(i, j) = weight_dist(rng);
        }
    }

    const Vector bias = Vector::Zero(bias_.size());
    load_dense(weight, has_bias_ ? &bias : nullptr);
    log("reset parameters (seed " + std::to_string(seed) + ")");
}

void MziBlockLayer::load_dense(const Matrix& weight, const Vector* bias) {
    if (static_cast<std::size_t>(weight.rows()) != tiling_.rows ||
        static_cast<std::size_t>(weight.cols()) != tiling_.cols) {
        throw ShapeMismatchError(std::string(name_) + ": weight is " +
                                 grid_shape_string(weight.rows(), weight.cols()) +
                                 ", expected " + grid_shape_string(tiling_.rows, tiling_.cols));
    }
    if (bias && has_bias_ && bias->size() != bias_.size()) {
        throw ShapeMismatchError(std::string(name_) + ": bias has " +
                                 std::to_string(bias->size()) + " entries, expected " +
                                 std::to_string(bias_.size()));
    }

    sync_.weight_blocks().weight = tile_to_grid(weight, tiling_.block_size);
    sync_.sync_parameters(Mode::WEIGHT);
    if (bias && has_bias_) bias_ = *bias;
    cache_valid_ = false;

    log("imported dense " + grid_shape_string(tiling_.rows, tiling_.cols) + " weight into " +
        grid_shape_string(tiling_.grid_rows, tiling_.grid_cols) + " grid, mode " +
        to_string(sync_.mode()));
}

ParameterDict MziBlockLayer::state_dict() const {
    ParameterDict dict = sync_.state_dict();
    if (has_bias_) {
        ParameterTensor t;
        t.shape = {static_cast<std::size_t>(bias_.size())};
        t.values.assign(bias_.data(), bias_.data() + bias_.size());
        dict["bias"] = t;
    }
    return dict;
}

void MziBlockLayer::load_parameters(const ParameterDict& params) {
    ParameterDict rest = params;
    const auto it = rest.find("bias");
    std::vector<double> bias_values;
    if (it != rest.end()) {
        if (!has_bias_) {
            throw NotSupportedError(std::string(name_) + " was built without a bias");
        }
        check_parameter_shape("bias", it->second, {static_cast<std::size_t>(bias_.size())});
        bias_values = it->second.values;
        rest.erase(it);
    }

    sync_.load_parameters(rest);
    if (!bias_values.empty()) {
        bias_ = Eigen::Map<const Vector>(bias_values.data(),
                                         static_cast<Eigen::Index>(bias_values.size()));
    }
    cache_valid_ = false;
}

//==============================================================================
// MziBlockLinear
//==============================================================================

MziBlockLinear::MziBlockLinear(const LinearLayerConfig& config, std::uint32_t seed)
    : MziBlockLayer("MziBlockLinear", config.out_features, config.in_features,
                    config.block_size, config.mode, config.algorithm, config.w_bit,
                    config.v_pi, config.v_max, config.bias, config.photodetect, config.in_bit)
    , config_(config)
{
    config_.validate();
    reset_parameters(seed);
}

MziBlockLinear MziBlockLinear::from_dense(const Matrix& weight, const Vector* bias,
                                          LinearLayerConfig config) {
    config.out_features = static_cast<std::size_t>(weight.rows());
    config.in_features = static_cast<std::size_t>(weight.cols());
    config.bias = bias != nullptr;
    MziBlockLinear layer(config);
    layer.load_dense(weight, bias);
    return layer;
}

Matrix MziBlockLinear::forward(const Matrix& x) {
    if (static_cast<std::size_t>(x.cols()) != config_.in_features) {
        throw ShapeMismatchError("MziBlockLinear: input has " + std::to_string(x.cols()) +
                                 " features, expected " + std::to_string(config_.in_features));
    }

    Matrix input = x;
    compute::quantize_input(input, in_bit_);
    Matrix y = compute::linear(input, forward_weight());
    if (photodetect_) compute::photodetect(y);
    if (has_bias_) compute::add_bias(y, bias_);
    return y;
}

//==============================================================================
// MziBlockConv2d
//==============================================================================

MziBlockConv2d::MziBlockConv2d(const Conv2dLayerConfig& config, std::uint32_t seed)
    : MziBlockLayer("MziBlockConv2d", config.out_channels, config.weight_cols(),
                    config.block_size, config.mode, config.algorithm, config.w_bit,
                    config.v_pi, config.v_max, config.bias, config.photodetect, config.in_bit)
    , config_(config)
{
    config_.validate();
    reset_parameters(seed);
}

MziBlockConv2d MziBlockConv2d::from_dense(const Matrix& weight, const Vector* bias,
                                          Conv2dLayerConfig config) {
    if (config.in_channels == 0 || config.kernel_size == 0 ||
        static_cast<std::size_t>(weight.cols()) != config.weight_cols()) {
        throw ShapeMismatchError("MziBlockConv2d: weight has " + std::to_string(weight.cols()) +
                                 " columns, expected in_channels*K*K = " +
                                 std::to_string(config.weight_cols()));
    }
    config.out_channels = static_cast<std::size_t>(weight.rows());
    config.bias = bias != nullptr;
    MziBlockConv2d layer(config);
    layer.load_dense(weight, bias);
    return layer;
}

compute::FeatureMap MziBlockConv2d::forward(const compute::FeatureMap& x) {
    compute::FeatureMap input = x;
    compute::quantize_input(input, in_bit_);
    compute::FeatureMap y = compute::conv2d(input, forward_weight(), config_.geometry());
    if (photodetect_) compute::photodetect(y);
    if (has_bias_) compute::add_bias(y, bias_);
    return y;
}

} // namespace photon_mesh
