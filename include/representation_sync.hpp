/**
 * ╔═══════════════════════════════════════════════════════════════════════════╗
 * ║                       REPRESENTATION_SYNC.HPP                             ║
 * ╠═══════════════════════════════════════════════════════════════════════════╣
 * ║  Mode state machine over the four encodings of a blocked linear operator ║
 * ╠═══════════════════════════════════════════════════════════════════════════╣
 * ║                                                                           ║
 * ║  REPRESENTATIONS (all batched over a [rows, cols] grid of k×k blocks):    ║
 * ║                                                                           ║
 * ║    weight    W                                                            ║
 * ║    factored  U, S, V           W = U · diag(S) · V                        ║
 * ║    phase     delta_U, phase_U, phase_S, S_scale, phase_V, delta_V        ║
 * ║              U = mesh(delta_U, phase_U), S = S_scale · cos(phase_S)      ║
 * ║    voltage   voltage_U, voltage_S, voltage_V                              ║
 * ║              phase_X = γ_X · voltage_X²    (deltas, S_scale shared)       ║
 * ║                                                                           ║
 * ║  TRANSITIONS:                                                             ║
 * ║                                                                           ║
 * ║                 svd                 decompose                             ║
 * ║       weight ─────────► factored ─────────────► phase ◄────► voltage      ║
 * ║          ▲                 │    ◄─────────────                            ║
 * ║          └─────────────────┘      reconstruct                             ║
 * ║              U·diag(S)·V                                                  ║
 * ║                                                                           ║
 * ║  The active mode names the source of truth. The other three are scratch  ║
 * ║  buffers, allocated once at construction and refreshed on demand.        ║
 * ║                                                                           ║
 * ║  build_weight() is the read path for forward compute. In phase and       ║
 * ║  voltage mode it quantizes just in time (bit < 16, gamma noise or        ║
 * ║  crosstalk on) and never writes the quantized values back.               ║
 * ║                                                                           ║
 * ╚═══════════════════════════════════════════════════════════════════════════╝
 */

#ifndef REPRESENTATION_SYNC_HPP
#define REPRESENTATION_SYNC_HPP

#include "conversion_counters.hpp"
#include "mesh_types.hpp"
#include "phase_quantizer.hpp"
#include "unitary_decomposer.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace photon_mesh {

//==============================================================================
// Modes and conversion metadata
//==============================================================================

enum class Mode {
    WEIGHT,     ///< Dense blocks are trainable
    FACTORED,   ///< U, S, V are trainable ("usv")
    PHASE,      ///< Mesh phases and S_scale are trainable
    VOLTAGE     ///< Drive voltages and S_scale are trainable
};

/// "weight", "usv" / "factored", "phase", "voltage"
Mode parse_mode(std::string_view name);
const char* to_string(Mode mode);

struct ConversionInfo {
    bool defined;          ///< A direct conversion exists
    bool differentiable;   ///< Gradients flow through it
    const char* name;      ///< Short operation name
};

/**
 * @brief Metadata for the direct conversion from one mode to another
 *
 *   weight   -> factored   svd                differentiable
 *   factored -> phase      decompose          snapshot
 *   phase    -> factored   reconstruct        differentiable in phase_S
 *   factored -> weight     matmul             differentiable
 *   phase    -> voltage    phase_to_voltage   snapshot
 *   voltage  -> phase      voltage_to_phase   differentiable
 *   X        -> X          identity
 *
 * Any other pair is undefined and must be reached through intermediate modes.
 */
ConversionInfo conversion_info(Mode from, Mode to);

/**
 * @brief Selects which of the U, S and V paths a build touches
 *
 * Unselected paths keep their cached factored values.
 */
struct UpdateList {
    bool u = true;
    bool s = true;
    bool v = true;

    static UpdateList all() { return {true, true, true}; }
    static UpdateList none() { return {false, false, false}; }
    static UpdateList only_u() { return {true, false, false}; }
    static UpdateList only_s() { return {false, true, false}; }
    static UpdateList only_v() { return {false, false, true}; }

    /// Parameter names such as "phase_U", "voltage_S", "delta_list_V", "S_scale"
    static UpdateList from_names(const std::vector<std::string>& names);

    bool any() const { return u || s || v; }
};

//==============================================================================
// Representation payloads
//==============================================================================

struct WeightBlocks {
    BlockGrid weight;        ///< [rows, cols, k, k]
};

struct FactoredBlocks {
    BlockGrid U;             ///< [rows, cols, k, k] orthogonal
    VectorGrid S;            ///< [rows, cols, k]
    BlockGrid V;             ///< [rows, cols, k, k] orthogonal
};

struct PhaseBlocks {
    VectorGrid delta_U;      ///< [rows, cols, k]
    VectorGrid phase_U;      ///< [rows, cols, k(k-1)/2]
    VectorGrid phase_S;      ///< [rows, cols, k]
    ScalarGrid S_scale;      ///< [rows, cols, 1]
    VectorGrid phase_V;      ///< [rows, cols, k(k-1)/2]
    VectorGrid delta_V;      ///< [rows, cols, k]
};

struct VoltageBlocks {
    VectorGrid voltage_U;    ///< [rows, cols, k(k-1)/2]
    VectorGrid voltage_S;    ///< [rows, cols, k]
    VectorGrid voltage_V;    ///< [rows, cols, k(k-1)/2]
};

/// Device constants for the three voltage paths
struct VoltageGammas {
    double U;
    double S;
    double V;
};

//==============================================================================
// SyncConfig
//==============================================================================

struct SyncConfig {
    // -------------------------------------------------------------------------
    // Geometry
    // -------------------------------------------------------------------------
    std::size_t grid_rows;     ///< Block rows (padded out_features / k)
    std::size_t grid_cols;     ///< Block columns (padded in_features / k)
    std::size_t block_size;    ///< k

    // -------------------------------------------------------------------------
    // Representation
    // -------------------------------------------------------------------------
    Mode mode;                 ///< Source of truth, fixed per instance
    DecomposeAlg algorithm;    ///< Mesh topology for U and V

    // -------------------------------------------------------------------------
    // Device
    // -------------------------------------------------------------------------
    unsigned w_bit;            ///< Phase DAC bit-width
    double v_pi;
    double v_max;

    SyncConfig()
        : grid_rows(1), grid_cols(1), block_size(4)
        , mode(Mode::WEIGHT), algorithm(DecomposeAlg::CLEMENTS)
        , w_bit(DEFAULT_W_BIT), v_pi(DEFAULT_V_PI), v_max(DEFAULT_V_MAX)
    {}

    double gamma() const { return gamma_from_vpi(v_pi); }
    std::size_t num_blocks() const { return grid_rows * grid_cols; }
    std::size_t num_angles() const { return num_mesh_angles(block_size); }

    /// @throws std::invalid_argument on zero sizes or non-positive device constants
    void validate() const;
};

//==============================================================================
// Gradient helpers
//==============================================================================

/// dL/dU, dL/dS, dL/dV for W = U · diag(S) · V
struct FactoredGradients {
    BlockGrid U;
    VectorGrid S;
    BlockGrid V;
};

/// dL/dphase_S, dL/dS_scale for S = S_scale · cos(phase_S)
struct PhaseSGradients {
    VectorGrid phase_S;
    ScalarGrid S_scale;
};

//==============================================================================
// RepresentationSync
//==============================================================================

/**
 * @brief Owns the four representations of one blocked layer and keeps them in sync
 *
 * ## Example Usage
 * ```cpp
 * SyncConfig cfg;
 * cfg.grid_rows = 2; cfg.grid_cols = 3; cfg.block_size = 4;
 * cfg.mode = Mode::PHASE;
 * RepresentationSync sync(cfg);
 *
 * sync.weight_blocks().weight = tiled;   // import a dense weight
 * sync.sync_parameters(Mode::WEIGHT);     // weight -> factored -> phase -> voltage
 *
 * sync.set_weight_bitwidth(6);
 * const BlockGrid& w = sync.build_weight();   // quantized just in time
 * ```
 *
 * Quantization has a straight-through derivative: a host framework
 * differentiating through build_weight() must treat quantize() as the
 * identity.
 */
class RepresentationSync {
public:
    /**
     * @brief Allocate all representations for the configured grid
     * @throws std::invalid_argument if config.validate() fails
     *
     * The initial state is an all-dark layer: zero weight, identity U and V,
     * zero S, and the matching phase and voltage encodings.
     */
    explicit RepresentationSync(const SyncConfig& config);

    // -------------------------------------------------------------------------
    // Accessors
    // -------------------------------------------------------------------------

    Mode mode() const { return config_.mode; }
    const SyncConfig& config() const { return config_; }
    std::size_t block_size() const { return config_.block_size; }
    const UnitaryDecomposer& decomposer() const { return decomposer_; }

    WeightBlocks& weight_blocks() { return weight_; }
    const WeightBlocks& weight_blocks() const { return weight_; }
    FactoredBlocks& factored_blocks() { return factored_; }
    const FactoredBlocks& factored_blocks() const { return factored_; }
    PhaseBlocks& phase_blocks() { return phase_; }
    const PhaseBlocks& phase_blocks() const { return phase_; }
    VoltageBlocks& voltage_blocks() { return voltage_; }
    const VoltageBlocks& voltage_blocks() const { return voltage_; }

    // -------------------------------------------------------------------------
    // Direct transitions
    // -------------------------------------------------------------------------

    /// Full SVD of every block (Jacobi, tolerates rank-deficient blocks)
    void weight_to_factored();

    /**
     * @brief Decompose U and V into meshes and encode S as S_scale·cos(phase_S)
     *
     * S_scale = max|S| per block. A block with S_scale == 0 is all dark:
     * phase_S is set to π/2 so the reconstructed S is exactly zero.
     */
    void factored_to_phase();

    /// Rebuild the selected U / S / V paths from the stored (unquantized) phases
    void phase_to_factored(const UpdateList& update = UpdateList());

    /// W = U · diag(S) · V for every block
    const BlockGrid& factored_to_weight();

    void phase_to_voltage();
    void voltage_to_phase(const UpdateList& update = UpdateList());

    /**
     * @brief Run one direct transition
     * @throws NotSupportedError if conversion_info(from, to) is undefined
     */
    void convert(Mode from, Mode to, const UpdateList& update = UpdateList());

    // -------------------------------------------------------------------------
    // Materialization and sync
    // -------------------------------------------------------------------------

    /**
     * @brief Materialize the dense weight from the active mode
     *
     * phase / voltage: (voltage -> phase), quantize when needed, add phase
     * variation to U and V, reconstruct the selected paths, multiply.
     * factored: multiply. weight: return the stored weight.
     */
    const BlockGrid& build_weight(const UpdateList& update = UpdateList());

    /**
     * @brief Derive every other representation from src
     *
     *   weight:   weight -> factored -> phase -> voltage
     *   factored: factored -> phase -> voltage, factored -> weight
     *   phase:    phase -> factored -> weight (quantized when enabled), phase -> voltage
     *   voltage:  voltage -> phase, then phase -> factored -> weight
     */
    void sync_parameters(Mode src);

    // -------------------------------------------------------------------------
    // Hardware non-idealities
    // -------------------------------------------------------------------------

    /// Redraw γ noise for all three quantizers; fixed until the next call
    void set_gamma_noise(double std, std::optional<std::uint32_t> random_state = std::nullopt);
    void set_crosstalk_factor(double factor);
    void set_weight_bitwidth(unsigned w_bit);

    /// Additive truncated-normal noise on the U and V phases at every build
    void set_phase_variation(double std, std::optional<std::uint32_t> random_state = std::nullopt);

    void set_voltage_gamma(const VoltageGammas& gammas);
    const VoltageGammas& voltage_gamma() const { return voltage_gamma_; }

    double gamma_noise_std() const { return gamma_noise_std_; }
    double crosstalk_factor() const { return crosstalk_factor_; }
    double phase_noise_std() const { return phase_noise_std_; }
    std::uint32_t gamma_noise_seed() const { return gamma_noise_seed_; }
    std::uint32_t phase_noise_seed() const { return phase_noise_seed_; }
    unsigned weight_bitwidth() const { return config_.w_bit; }

    /// True when a phase/voltage build has to run the quantizers
    bool needs_quantization() const;

    // -------------------------------------------------------------------------
    // Parameters
    // -------------------------------------------------------------------------

    std::vector<std::string> trainable_parameter_names() const;
    std::vector<std::string> buffer_names() const;

    /// Representation buffers of the active mode plus configuration scalars and noise seeds
    ParameterDict state_dict() const;

    /**
     * @brief Copy named entries in, then rematerialize the touched paths
     * @throws NotSupportedError for unknown names
     * @throws ShapeMismatchError for entries of the wrong shape
     *
     * Every entry is validated before anything is copied.
     */
    void load_parameters(const ParameterDict& params);

    /// Tensor by name from any representation
    ParameterTensor parameter(const std::string& name) const;

    // -------------------------------------------------------------------------
    // Gradients
    // -------------------------------------------------------------------------

    /// Local backward of W = U · diag(S) · V at the current factored values
    FactoredGradients factored_backward(const BlockGrid& grad_weight) const;

    /// Local backward of S = S_scale · cos(phase_S) at the current phase values
    PhaseSGradients phase_s_backward(const VectorGrid& grad_S) const;

    // -------------------------------------------------------------------------
    // Diagnostics
    // -------------------------------------------------------------------------

    const ConversionCounters& counters() const { return counters_; }
    void reset_counters() { counters_ = ConversionCounters(); }

    void set_verbose(bool verbose) { verbose_ = verbose; }
    bool verbose() const { return verbose_; }

private:
    VectorGrid quantized_phase(PhaseQuantizer& quantizer, const VectorGrid& phase);
    void materialize_phase(const UpdateList& update);
    VectorGrid phase_to_s(const VectorGrid& phase_S) const;
    void check_weight_grid(const BlockGrid& grid, const std::string& what) const;
    void log(const std::string& msg) const;

    SyncConfig config_;
    UnitaryDecomposer decomposer_;

    WeightBlocks weight_;
    FactoredBlocks factored_;
    PhaseBlocks phase_;
    VoltageBlocks voltage_;

    PhaseQuantizer quantizer_U_;
    PhaseQuantizer quantizer_S_;
    PhaseQuantizer quantizer_V_;
    VoltageGammas voltage_gamma_;

    double gamma_noise_std_;
    std::uint32_t gamma_noise_seed_;
    double crosstalk_factor_;
    double phase_noise_std_;
    std::uint32_t phase_noise_seed_;
    VectorGrid phase_noise_U_;
    VectorGrid phase_noise_V_;

    ConversionCounters counters_;
    bool verbose_;
};

} // namespace photon_mesh

#endif // REPRESENTATION_SYNC_HPP
