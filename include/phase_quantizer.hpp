/**
 * ╔═══════════════════════════════════════════════════════════════════════════╗
 * ║                         PHASE_QUANTIZER.HPP                               ║
 * ╠═══════════════════════════════════════════════════════════════════════════╣
 * ║  Hardware-fidelity model for thermo-optic phase shifters                  ║
 * ╠═══════════════════════════════════════════════════════════════════════════╣
 * ║                                                                           ║
 * ║  A heater driven at voltage v shifts the optical phase by γ·v², with      ║
 * ║  γ = π / v_pi². The DAC has a finite bit-width and a maximum output       ║
 * ║  v_max, each device has a slightly different γ, and neighbouring heaters  ║
 * ║  leak heat into each other. The quantizer maps an ideal phase through     ║
 * ║  that chain:                                                              ║
 * ║                                                                           ║
 * ║    phase ──wrap──► [0, 2π) ──sqrt(φ/γ)──► v ──clip──► [0, v_max]          ║
 * ║          ──round to 2^bit levels──► v_q ──γ_i·v_q²──► phase'              ║
 * ║          ──scatter──► mesh layout ──coupling kernel──► gather ──► out     ║
 * ║                                                                           ║
 * ║  Noise is drawn once per set_gamma_noise() call and kept, so repeated     ║
 * ║  quantization of the same input is deterministic. With bit >= 16, no      ║
 * ║  gamma noise and no crosstalk the quantizer returns its input unchanged.  ║
 * ║                                                                           ║
 * ║  Non-finite inputs are treated as phase 0. quantize() never throws on    ║
 * ║  numeric values.                                                          ║
 * ║                                                                           ║
 * ╚═══════════════════════════════════════════════════════════════════════════╝
 */

#ifndef PHASE_QUANTIZER_HPP
#define PHASE_QUANTIZER_HPP

#include "mesh_codec.hpp"
#include "mesh_types.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>

namespace photon_mesh {

//==============================================================================
// Device constants
//==============================================================================

constexpr double PI = 3.14159265358979323846;
constexpr double TWO_PI = 2.0 * PI;

constexpr double DEFAULT_V_PI = 4.36;        ///< Volts for a π phase shift
constexpr double DEFAULT_V_MAX = 10.8;       ///< DAC full-scale output, volts
constexpr unsigned DEFAULT_W_BIT = 32;
constexpr unsigned FULL_PRECISION_BITS = 16; ///< bit >= this means no rounding
constexpr double NOISE_EPSILON = 1e-5;       ///< Noise / crosstalk below this is off

/// Phase response coefficient γ = π / v_pi²
inline double gamma_from_vpi(double v_pi) { return PI / (v_pi * v_pi); }

/// Wrap any finite phase into [0, 2π); non-finite values map to 0
double wrap_phase(double phase);

/// v = sqrt(wrap(phase) / γ)
double phase_to_voltage(double phase, double gamma);

/// phase = γ · v²
double voltage_to_phase(double voltage, double gamma);

VectorGrid phase_to_voltage(const VectorGrid& phases, double gamma);
VectorGrid voltage_to_phase(const VectorGrid& voltages, double gamma);

/**
 * @brief Neighbour coupling kernel
 *
 * size×size, centre weight 1, offset (dy, dx) weighted by
 * factor · exp(-(dy² + dx²) / 2).
 */
Matrix crosstalk_kernel(double factor, std::size_t size);

/// Zero-padded same-size 2D correlation of a mesh layout with a kernel
Matrix apply_crosstalk(const Matrix& mesh, const Matrix& kernel);

//==============================================================================
// QuantizerConfig
//==============================================================================

struct QuantizerConfig {
    // -------------------------------------------------------------------------
    // DAC
    // -------------------------------------------------------------------------
    unsigned bit;                   ///< Voltage resolution in bits
    double v_pi;                    ///< Volts for a π shift
    double v_max;                   ///< Full-scale voltage

    // -------------------------------------------------------------------------
    // Device non-idealities
    // -------------------------------------------------------------------------
    double gamma_noise_std;         ///< Std of the per-device γ deviation
    double crosstalk_factor;        ///< Neighbour coupling strength in [0, 1]
    std::size_t crosstalk_filter_size;  ///< Odd kernel size
    std::uint32_t random_state;     ///< Seed for noise draws without an explicit seed

    MeshLayout layout;              ///< Where the phases physically sit

    QuantizerConfig()
        : bit(DEFAULT_W_BIT), v_pi(DEFAULT_V_PI), v_max(DEFAULT_V_MAX)
        , gamma_noise_std(0.0), crosstalk_factor(0.0), crosstalk_filter_size(5)
        , random_state(0), layout(MeshLayout::RECTANGLE)
    {}

    /// Config for a layout with the layout's default crosstalk kernel size
    static QuantizerConfig for_layout(MeshLayout layout, unsigned bit,
                                      double v_pi = DEFAULT_V_PI,
                                      double v_max = DEFAULT_V_MAX);

    double gamma() const { return gamma_from_vpi(v_pi); }

    bool rounds() const { return bit < FULL_PRECISION_BITS; }
    bool has_gamma_noise() const { return gamma_noise_std > NOISE_EPSILON; }
    bool has_crosstalk() const {
        return crosstalk_factor > NOISE_EPSILON && layout != MeshLayout::DIAGONAL;
    }

    /// @throws std::invalid_argument on values outside their domain
    void validate() const;
};

//==============================================================================
// PhaseQuantizer
//==============================================================================

class PhaseQuantizer {
public:
    explicit PhaseQuantizer(const QuantizerConfig& config = QuantizerConfig());

    /**
     * @brief Quantize a batch of phase vectors
     *
     * For TRIANGLE / RECTANGLE layouts each cell must hold k(k-1)/2 phases;
     * DIAGONAL accepts any length. When gamma noise is on and no noise of the
     * input's shape has been drawn yet, it is drawn from config().random_state.
     *
     * Gradients pass straight through: callers treat d(out)/d(in) as the identity.
     */
    VectorGrid quantize(const VectorGrid& phases);

    /// True when quantize() is exactly the identity
    bool is_identity() const {
        return !config_.rounds() && !config_.has_gamma_noise() && !config_.has_crosstalk();
    }

    /**
     * @brief Redraw per-device γ deviations
     * @param std       Deviation std; <= 1e-5 disables gamma noise
     * @param length    Phases per cell
     * @param random_state Seed; config().random_state when absent
     *
     * Samples follow a normal distribution truncated to ±2·std. Resulting
     * γ_i = γ + noise_i, clamped at 0.
     */
    void set_gamma_noise(double std, std::size_t rows, std::size_t cols, std::size_t length,
                         std::optional<std::uint32_t> random_state = std::nullopt);

    void set_crosstalk_factor(double factor);
    void set_bitwidth(unsigned bit);

    const QuantizerConfig& config() const { return config_; }
    const VectorGrid& noisy_gamma() const { return noisy_gamma_; }
    const Matrix& kernel() const { return kernel_; }

private:
    double quantize_phase(double phase, double gamma_i) const;

    QuantizerConfig config_;
    double gamma_;
    std::shared_ptr<const MeshTopology> topology_;  ///< null for DIAGONAL
    VectorGrid noisy_gamma_;
    Matrix kernel_;
};

/// Truncated normal samples in [-2·std, 2·std] from a seeded generator
VectorGrid truncated_normal_grid(double std, std::size_t rows, std::size_t cols,
                                 std::size_t length, std::uint32_t seed);

} // namespace photon_mesh

#endif // PHASE_QUANTIZER_HPP
