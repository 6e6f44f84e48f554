/**
 * @file phase_quantizer.cpp
 * @brief Voltage-domain phase quantization, gamma noise and thermal crosstalk
 */

#include "phase_quantizer.hpp"

#include <algorithm>
#include <cmath>
#include <random>
#include <stdexcept>
#include <string>

namespace photon_mesh {

//==============================================================================
// Phase <-> voltage
//==============================================================================

double wrap_phase(double phase) {
    if (!std::isfinite(phase)) return 0.0;
    double wrapped = std::fmod(phase, TWO_PI);
    if (wrapped < 0.0) wrapped += TWO_PI;
    // fmod of a value just below 0 can round back up to exactly 2π
    if (wrapped >= TWO_PI) wrapped = 0.0;
    return wrapped;
}

double phase_to_voltage(double phase, double gamma) {
    return std::sqrt(wrap_phase(phase) / gamma);
}

double voltage_to_phase(double voltage, double gamma) {
    return gamma * voltage * voltage;
}

VectorGrid phase_to_voltage(const VectorGrid& phases, double gamma) {
    VectorGrid out = phases;
    for (Vector& v : out.cells) {
        for (Eigen::Index i = 0; i < v.size(); ++i) {
            v[i] = phase_to_voltage(v[i], gamma);
        }
    }
    return out;
}

VectorGrid voltage_to_phase(const VectorGrid& voltages, double gamma) {
    VectorGrid out = voltages;
    for (Vector& v : out.cells) {
        for (Eigen::Index i = 0; i < v.size(); ++i) {
            v[i] = voltage_to_phase(v[i], gamma);
        }
    }
    return out;
}

//==============================================================================
// Crosstalk
//==============================================================================

Matrix crosstalk_kernel(double factor, std::size_t size) {
    const auto n = static_cast<Eigen::Index>(size);
    const Eigen::Index radius = n / 2;
    Matrix kernel(n, n);
    for (Eigen::Index y = 0; y < n; ++y) {
        for (Eigen::Index x = 0; x < n; ++x) {
            const double dy = static_cast<double>(y - radius);
            const double dx = static_cast<double>(x - radius);
            kernel(y, x) = factor * std::exp(-(dy * dy + dx * dx) / 2.0);
        }
    }
    kernel(radius, radius) = 1.0;
    return kernel;
}

Matrix apply_crosstalk(const Matrix& mesh, const Matrix& kernel) {
    const Eigen::Index rows = mesh.rows();
    const Eigen::Index cols = mesh.cols();
    const Eigen::Index ry = kernel.rows() / 2;
    const Eigen::Index rx = kernel.cols() / 2;

    Matrix out = Matrix::Zero(rows, cols);
    for (Eigen::Index i = 0; i < rows; ++i) {
        for (Eigen::Index j = 0; j < cols; ++j) {
            double acc = 0.0;
            for (Eigen::Index ky = 0; ky < kernel.rows(); ++ky) {
                const Eigen::Index y = i + ky - ry;
                if (y < 0 || y >= rows) continue;
                for (Eigen::Index kx = 0; kx < kernel.cols(); ++kx) {
                    const Eigen::Index x = j + kx - rx;
                    if (x < 0 || x >= cols) continue;
                    acc += kernel(ky, kx) * mesh(y, x);
                }
            }
            out(i, j) = acc;
        }
    }
    return out;
}

//==============================================================================
// Noise
//==============================================================================

VectorGrid truncated_normal_grid(double std, std::size_t rows, std::size_t cols,
                                 std::size_t length, std::uint32_t seed) {
    std::mt19937 rng(seed);
    std::normal_distribution<double> dist(0.0, 1.0);

    VectorGrid out = make_vector_grid(rows, cols, length);
    for (Vector& v : out.cells) {
        for (Eigen::Index i = 0; i < v.size(); ++i) {
            double z = dist(rng);
            while (std::abs(z) > 2.0) z = dist(rng);
            v[i] = z * std;
        }
    }
    return out;
}

//==============================================================================
// QuantizerConfig
//==============================================================================

QuantizerConfig QuantizerConfig::for_layout(MeshLayout layout, unsigned bit,
                                            double v_pi, double v_max) {
    QuantizerConfig cfg;
    cfg.layout = layout;
    cfg.bit = bit;
    cfg.v_pi = v_pi;
    cfg.v_max = v_max;
    cfg.crosstalk_filter_size =
        layout == MeshLayout::DIAGONAL ? 1 : make_topology(layout)->crosstalk_filter_size();
    return cfg;
}

void QuantizerConfig::validate() const {
    if (bit == 0) {
        throw std::invalid_argument("QuantizerConfig: bit-width must be positive");
    }
    if (!(v_pi > 0.0)) {
        throw std::invalid_argument("QuantizerConfig: v_pi must be positive, got " +
                                    std::to_string(v_pi));
    }
    if (!(v_max > 0.0)) {
        throw std::invalid_argument("QuantizerConfig: v_max must be positive, got " +
                                    std::to_string(v_max));
    }
    if (!(gamma_noise_std >= 0.0)) {
        throw std::invalid_argument("QuantizerConfig: gamma noise std must be >= 0, got " +
                                    std::to_string(gamma_noise_std));
    }
    if (!(crosstalk_factor >= 0.0 && crosstalk_factor <= 1.0)) {
        throw std::invalid_argument("QuantizerConfig: crosstalk factor must be in [0, 1], got " +
                                    std::to_string(crosstalk_factor));
    }
    if (crosstalk_filter_size == 0 || crosstalk_filter_size % 2 == 0) {
        throw std::invalid_argument("QuantizerConfig: crosstalk filter size must be odd, got " +
                                    std::to_string(crosstalk_filter_size));
    }
}

//==============================================================================
// PhaseQuantizer
//==============================================================================

PhaseQuantizer::PhaseQuantizer(const QuantizerConfig& config)
    : config_(config)
    , gamma_(0.0)
{
    config_.validate();
    gamma_ = config_.gamma();
    if (config_.layout != MeshLayout::DIAGONAL) {
        topology_ = make_topology(config_.layout);
    }
    kernel_ = crosstalk_kernel(config_.crosstalk_factor, config_.crosstalk_filter_size);
}

void PhaseQuantizer::set_gamma_noise(double std, std::size_t rows, std::size_t cols,
                                     std::size_t length,
                                     std::optional<std::uint32_t> random_state) {
    if (!(std >= 0.0)) {
        throw std::invalid_argument("set_gamma_noise: std must be >= 0, got " +
                                    std::to_string(std));
    }
    config_.gamma_noise_std = std;
    if (random_state) config_.random_state = *random_state;

    if (!config_.has_gamma_noise()) {
        noisy_gamma_ = VectorGrid();
        return;
    }

    noisy_gamma_ = truncated_normal_grid(std, rows, cols, length, config_.random_state);
    for (Vector& g : noisy_gamma_.cells) {
        g = (g.array() + gamma_).cwiseMax(0.0).matrix();
    }
}

void PhaseQuantizer::set_crosstalk_factor(double factor) {
    if (!(factor >= 0.0 && factor <= 1.0)) {
        throw std::invalid_argument("set_crosstalk_factor: factor must be in [0, 1], got " +
                                    std::to_string(factor));
    }
    config_.crosstalk_factor = factor;
    kernel_ = crosstalk_kernel(factor, config_.crosstalk_filter_size);
}

void PhaseQuantizer::set_bitwidth(unsigned bit) {
    if (bit == 0) {
        throw std::invalid_argument("set_bitwidth: bit-width must be positive");
    }
    config_.bit = bit;
}

double PhaseQuantizer::quantize_phase(double phase, double gamma_i) const {
    double v = std::sqrt(wrap_phase(phase) / gamma_);
    v = std::min(std::max(v, 0.0), config_.v_max);

    if (config_.rounds()) {
        const double levels = std::ldexp(1.0, static_cast<int>(config_.bit)) - 1.0;
        // Round half to even under the default FE_TONEAREST mode
        v = std::nearbyint(v / config_.v_max * levels) / levels * config_.v_max;
    }
    return gamma_i * v * v;
}

VectorGrid PhaseQuantizer::quantize(const VectorGrid& phases) {
    if (is_identity()) return phases;

    const bool noisy = config_.has_gamma_noise();
    if (noisy) {
        const std::size_t length = phases.empty() ? 0
            : static_cast<std::size_t>(phases.cells.front().size());
        const bool shape_ok = noisy_gamma_.rows == phases.rows &&
                              noisy_gamma_.cols == phases.cols &&
                              (noisy_gamma_.empty() ||
                               static_cast<std::size_t>(noisy_gamma_.cells.front().size()) == length);
        if (!shape_ok || noisy_gamma_.empty()) {
            set_gamma_noise(config_.gamma_noise_std, phases.rows, phases.cols, length);
        }
    }

    VectorGrid out = phases;
    for (std::size_t cell = 0; cell < out.size(); ++cell) {
        Vector& v = out.cells[cell];
        if (noisy && noisy_gamma_.cells[cell].size() != v.size()) {
            throw ShapeMismatchError("quantize: cell " + std::to_string(cell) + " has " +
                                     std::to_string(v.size()) + " phases, gamma noise has " +
                                     std::to_string(noisy_gamma_.cells[cell].size()));
        }
        for (Eigen::Index i = 0; i < v.size(); ++i) {
            const double g = noisy ? noisy_gamma_.cells[cell][i] : gamma_;
            v[i] = quantize_phase(v[i], g);
        }

        if (config_.has_crosstalk()) {
            const std::size_t k = block_size_from_angles(static_cast<std::size_t>(v.size()));
            const Matrix mesh = topology_->to_mesh_layout(v, k);
            v = topology_->to_vector(apply_crosstalk(mesh, kernel_));
        }
    }
    return out;
}

} // namespace photon_mesh
