/**
 * ╔═══════════════════════════════════════════════════════════════════════════╗
 * ║                         FORWARD_COMPUTE.HPP                               ║
 * ╠═══════════════════════════════════════════════════════════════════════════╣
 * ║  Dense reference arithmetic consuming a materialized layer weight         ║
 * ╠═══════════════════════════════════════════════════════════════════════════╣
 * ║                                                                           ║
 * ║  LINEAR:  y[B × out] = x[B × in] · Wᵀ                                     ║
 * ║                                                                           ║
 * ║  CONV2D:  im2col + GEMM                                                   ║
 * ║    input [N × C_in × H × W] ──im2col──► cols [C_in·K·K × H_out·W_out]     ║
 * ║    out[C_out × H_out·W_out] = W[C_out × C_in·K·K] · cols                  ║
 * ║                                                                           ║
 * ║    H_out = (H + 2·pad - dil·(K-1) - 1) / stride + 1                       ║
 * ║                                                                           ║
 * ║  PHOTODETECT:  intensity detection squares the optical amplitude, y = y²  ║
 * ║                                                                           ║
 * ║  INPUT QUANTIZATION:  x clamped to [0, 1], rounded half to even onto      ║
 * ║                       2^bits uniform levels; identity for bits >= 16      ║
 * ║                                                                           ║
 * ╚═══════════════════════════════════════════════════════════════════════════╝
 */

#ifndef FORWARD_COMPUTE_HPP
#define FORWARD_COMPUTE_HPP

#include "mesh_types.hpp"

#include <cstddef>
#include <vector>

namespace photon_mesh {
namespace compute {

//==============================================================================
// Tensors
//==============================================================================

/// NCHW activation tensor
struct FeatureMap {
    std::size_t batch = 0;
    std::size_t channels = 0;
    std::size_t height = 0;
    std::size_t width = 0;
    std::vector<double> data;

    FeatureMap() = default;
    FeatureMap(std::size_t n, std::size_t c, std::size_t h, std::size_t w)
        : batch(n), channels(c), height(h), width(w), data(n * c * h * w, 0.0) {}

    std::size_t size() const { return data.size(); }
    std::size_t plane() const { return height * width; }

    double& at(std::size_t n, std::size_t c, std::size_t h, std::size_t w) {
        return data[((n * channels + c) * height + h) * width + w];
    }
    double at(std::size_t n, std::size_t c, std::size_t h, std::size_t w) const {
        return data[((n * channels + c) * height + h) * width + w];
    }
};

struct Conv2dGeometry {
    std::size_t in_channels;
    std::size_t out_channels;
    std::size_t kernel_size;
    std::size_t stride;
    std::size_t padding;
    std::size_t dilation;

    Conv2dGeometry()
        : in_channels(0), out_channels(0), kernel_size(1)
        , stride(1), padding(0), dilation(1)
    {}

    /// Columns of the flattened weight, C_in·K·K
    std::size_t patch_size() const { return in_channels * kernel_size * kernel_size; }

    /// @throws ShapeMismatchError if the kernel does not fit the padded input
    std::size_t output_dim(std::size_t input_dim) const;

    /// @throws std::invalid_argument on zero sizes
    void validate() const;
};

//==============================================================================
// Linear / Conv
//==============================================================================

/**
 * @brief y = x · Wᵀ
 * @throws ShapeMismatchError if x.cols() != weight.cols()
 */
Matrix linear(const Matrix& x, const Matrix& weight);

/**
 * @brief Unfold one image into patch columns
 *
 * @param input  [C_in × H × W] single image
 * @param col    [C_in·K·K × H_out·W_out] output buffer, row-major
 */
void im2col(const double* input, double* col,
            std::size_t C_in, std::size_t H, std::size_t W,
            std::size_t K, std::size_t stride, std::size_t padding, std::size_t dilation,
            std::size_t H_out, std::size_t W_out);

/**
 * @brief 2D convolution with a flattened [C_out × C_in·K·K] weight
 * @throws ShapeMismatchError on channel or weight shape mismatch
 */
FeatureMap conv2d(const FeatureMap& input, const Matrix& weight, const Conv2dGeometry& geo);

//==============================================================================
// Element-wise
//==============================================================================

double quantize_input(double x, unsigned bits);
void quantize_input(Matrix& x, unsigned bits);
void quantize_input(FeatureMap& x, unsigned bits);

void photodetect(Matrix& y);
void photodetect(FeatureMap& y);

/// y[b][o] += bias[o]
void add_bias(Matrix& y, const Vector& bias);
/// y[n][c][h][w] += bias[c]
void add_bias(FeatureMap& y, const Vector& bias);

} // namespace compute
} // namespace photon_mesh

#endif // FORWARD_COMPUTE_HPP
