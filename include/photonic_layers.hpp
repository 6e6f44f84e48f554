/**
 * ╔═══════════════════════════════════════════════════════════════════════════╗
 * ║                         PHOTONIC_LAYERS.HPP                               ║
 * ╠═══════════════════════════════════════════════════════════════════════════╣
 * ║  Blocked MZI linear and conv layers built on RepresentationSync           ║
 * ╠═══════════════════════════════════════════════════════════════════════════╣
 * ║                                                                           ║
 * ║  DATA FLOW (one forward call):                                            ║
 * ║                                                                           ║
 * ║    active representation ──build_weight()──► [R, C, k, k] grid            ║
 * ║        ──merge + trim──► dense W [out × in]                               ║
 * ║                                                                           ║
 * ║    x ──quantize_input──► linear / im2col conv with W                      ║
 * ║      ──photodetect (y²)──► + bias ──► y                                   ║
 * ║                                                                           ║
 * ║  With fast-forward on, the dense W is built once and reused until the    ║
 * ║  parameters change.                                                       ║
 * ║                                                                           ║
 * ║  USAGE:                                                                   ║
 * ║    LinearLayerConfig cfg;                                                 ║
 * ║    cfg.in_features = 10; cfg.out_features = 6; cfg.mode = Mode::PHASE;   ║
 * ║    MziBlockLinear layer = MziBlockLinear::from_dense(W, &b, cfg);         ║
 * ║    layer.sync().set_weight_bitwidth(8);                                   ║
 * ║    Matrix y = layer.forward(x);                                           ║
 * ║                                                                           ║
 * ╚═══════════════════════════════════════════════════════════════════════════╝
 */

#ifndef PHOTONIC_LAYERS_HPP
#define PHOTONIC_LAYERS_HPP

#include "block_tiling.hpp"
#include "forward_compute.hpp"
#include "mesh_types.hpp"
#include "representation_sync.hpp"

#include <cstddef>
#include <cstdint>
#include <string>

namespace photon_mesh {

//==============================================================================
// Layer configuration
//==============================================================================

struct LinearLayerConfig {
    std::size_t in_features;
    std::size_t out_features;
    std::size_t block_size;     ///< Mini-block size k
    bool bias;
    bool photodetect;           ///< Square the output amplitude
    Mode mode;
    DecomposeAlg algorithm;
    unsigned in_bit;            ///< Input activation bit-width
    unsigned w_bit;             ///< Phase DAC bit-width
    double v_pi;
    double v_max;

    LinearLayerConfig()
        : in_features(0), out_features(0), block_size(4)
        , bias(true), photodetect(false)
        , mode(Mode::WEIGHT), algorithm(DecomposeAlg::CLEMENTS)
        , in_bit(32), w_bit(DEFAULT_W_BIT), v_pi(DEFAULT_V_PI), v_max(DEFAULT_V_MAX)
    {}

    void validate() const;
};

struct Conv2dLayerConfig {
    std::size_t in_channels;
    std::size_t out_channels;
    std::size_t kernel_size;
    std::size_t stride;
    std::size_t padding;
    std::size_t dilation;
    std::size_t block_size;
    bool bias;
    bool photodetect;
    Mode mode;
    DecomposeAlg algorithm;
    unsigned in_bit;
    unsigned w_bit;
    double v_pi;
    double v_max;

    Conv2dLayerConfig()
        : in_channels(0), out_channels(0), kernel_size(3)
        , stride(1), padding(0), dilation(1), block_size(4)
        , bias(true), photodetect(false)
        , mode(Mode::WEIGHT), algorithm(DecomposeAlg::CLEMENTS)
        , in_bit(32), w_bit(DEFAULT_W_BIT), v_pi(DEFAULT_V_PI), v_max(DEFAULT_V_MAX)
    {}

    compute::Conv2dGeometry geometry() const;

    /// Columns of the flattened weight, in_channels·K·K
    std::size_t weight_cols() const { return in_channels * kernel_size * kernel_size; }

    void validate() const;
};

//==============================================================================
// MziBlockLayer: shared plumbing
//==============================================================================

class MziBlockLayer {
public:
    RepresentationSync& sync() { return sync_; }
    const RepresentationSync& sync() const { return sync_; }
    const TilingGeometry& tiling() const { return tiling_; }

    /// Materialize and trim the dense [out × in] weight
    Matrix dense_weight();

    bool has_bias() const { return has_bias_; }
    const Vector& bias() const { return bias_; }
    void set_bias(const Vector& bias);

    /// Changes made directly through sync() need another set_fast_forward(true) to show
    void set_fast_forward(bool enabled);
    bool fast_forward() const { return fast_forward_; }

    void set_input_bitwidth(unsigned in_bit);
    unsigned input_bitwidth() const { return in_bit_; }

    void set_verbose(bool verbose);

    /**
     * @brief Kaiming-normal weight from a seed and a zero bias, then a full sync
     *
     * The weight std is sqrt(2 / fan_in).
     */
    void reset_parameters(std::uint32_t seed);

    /**
     * @brief Import a pretrained dense weight
     * @param bias nullptr keeps the current bias
     * @throws ShapeMismatchError if weight is not [out × in]
     *
     * Zero-pads the weight into the grid and runs sync_parameters(weight).
     */
    void load_dense(const Matrix& weight, const Vector* bias);

    /// Sync snapshot plus "bias" when the layer has one
    ParameterDict state_dict() const;
    void load_parameters(const ParameterDict& params);

protected:
    MziBlockLayer(const char* name, std::size_t rows, std::size_t cols, std::size_t block_size,
                  Mode mode, DecomposeAlg algorithm, unsigned w_bit, double v_pi, double v_max,
                  bool bias, bool photodetect, unsigned in_bit);

    /// Dense weight for a forward call, cached when fast-forward is on
    const Matrix& forward_weight();

    void log(const std::string& msg) const;

    const char* name_;
    TilingGeometry tiling_;
    RepresentationSync sync_;
    Vector bias_;
    bool has_bias_;
    bool photodetect_;
    unsigned in_bit_;
    bool fast_forward_;
    bool cache_valid_;
    Matrix cached_weight_;
    bool verbose_;
};

//==============================================================================
// MziBlockLinear
//==============================================================================

/**
 * @brief y = x · Wᵀ (+ photodetection) + b with W held as MZI blocks
 */
class MziBlockLinear : public MziBlockLayer {
public:
    explicit MziBlockLinear(const LinearLayerConfig& config, std::uint32_t seed = 0);

    /// Layer sized from weight [out × in], populated from it
    static MziBlockLinear from_dense(const Matrix& weight, const Vector* bias,
                                     LinearLayerConfig config);

    /// @param x [batch × in_features]
    Matrix forward(const Matrix& x);

    const LinearLayerConfig& config() const { return config_; }

private:
    LinearLayerConfig config_;
};

//==============================================================================
// MziBlockConv2d
//==============================================================================

/**
 * @brief im2col convolution whose [C_out × C_in·K·K] weight is held as MZI blocks
 */
class MziBlockConv2d : public MziBlockLayer {
public:
    explicit MziBlockConv2d(const Conv2dLayerConfig& config, std::uint32_t seed = 0);

    /// @param weight [C_out × C_in·K·K] flattened kernel
    static MziBlockConv2d from_dense(const Matrix& weight, const Vector* bias,
                                     Conv2dLayerConfig config);

    compute::FeatureMap forward(const compute::FeatureMap& x);

    const Conv2dLayerConfig& config() const { return config_; }

private:
    Conv2dLayerConfig config_;
};

} // namespace photon_mesh

#endif // PHOTONIC_LAYERS_HPP
