/**
 * @file forward_compute.cpp
 * @brief Linear, im2col convolution and element-wise helpers for the layers
 */

#include "forward_compute.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace photon_mesh {
namespace compute {

//==============================================================================
// Geometry
//==============================================================================

std::size_t Conv2dGeometry::output_dim(std::size_t input_dim) const {
    const std::size_t span = dilation * (kernel_size - 1) + 1;
    const std::size_t padded = input_dim + 2 * padding;
    if (padded < span) {
        throw ShapeMismatchError("conv2d: kernel span " + std::to_string(span) +
                                 " exceeds padded input " + std::to_string(padded));
    }
    return (padded - span) / stride + 1;
}

void Conv2dGeometry::validate() const {
    if (in_channels == 0 || out_channels == 0) {
        throw std::invalid_argument("Conv2dGeometry: channel counts must be positive");
    }
    if (kernel_size == 0 || stride == 0 || dilation == 0) {
        throw std::invalid_argument("Conv2dGeometry: kernel size, stride and dilation "
                                    "must be positive");
    }
}

//==============================================================================
// Linear
//==============================================================================

Matrix linear(const Matrix& x, const Matrix& weight) {
    if (x.cols() != weight.cols()) {
        throw ShapeMismatchError("linear: input has " + std::to_string(x.cols()) +
                                 " features, weight expects " + std::to_string(weight.cols()));
    }
    return x * weight.transpose();
}

//==============================================================================
// Convolution
//==============================================================================

void im2col(const double* input, double* col,
            std::size_t C_in, std::size_t H, std::size_t W,
            std::size_t K, std::size_t stride, std::size_t padding, std::size_t dilation,
            std::size_t H_out, std::size_t W_out) {
    const std::size_t num_cols = H_out * W_out;
    std::size_t row_idx = 0;

    for (std::size_t c_in = 0; c_in < C_in; ++c_in) {
        for (std::size_t kh = 0; kh < K; ++kh) {
            for (std::size_t kw = 0; kw < K; ++kw) {
                std::size_t col_idx = 0;
                for (std::size_t oh = 0; oh < H_out; ++oh) {
                    for (std::size_t ow = 0; ow < W_out; ++ow) {
                        const std::int64_t h = static_cast<std::int64_t>(oh * stride + kh * dilation) -
                                               static_cast<std::int64_t>(padding);
                        const std::int64_t w = static_cast<std::int64_t>(ow * stride + kw * dilation) -
                                               static_cast<std::int64_t>(padding);

                        double val = 0.0;
                        if (h >= 0 && h < static_cast<std::int64_t>(H) &&
                            w >= 0 && w < static_cast<std::int64_t>(W)) {
                            val = input[c_in * H * W + static_cast<std::size_t>(h) * W +
                                        static_cast<std::size_t>(w)];
                        }
                        col[row_idx * num_cols + col_idx] = val;
                        ++col_idx;
                    }
                }
                ++row_idx;
            }
        }
    }
}

FeatureMap conv2d(const FeatureMap& input, const Matrix& weight, const Conv2dGeometry& geo) {
    geo.validate();
    const std::size_t expected_size = input.batch * input.channels * input.height * input.width;
    if (input.data.size() != expected_size) {
        throw ShapeMismatchError("conv2d: feature map holds " + std::to_string(input.data.size()) +
                                 " values, expected " + std::to_string(expected_size));
    }
    if (input.channels != geo.in_channels) {
        throw ShapeMismatchError("conv2d: input has " + std::to_string(input.channels) +
                                 " channels, expected " + std::to_string(geo.in_channels));
    }
    if (static_cast<std::size_t>(weight.rows()) != geo.out_channels ||
        static_cast<std::size_t>(weight.cols()) != geo.patch_size()) {
        throw ShapeMismatchError("conv2d: weight is " + std::to_string(weight.rows()) + "x" +
                                 std::to_string(weight.cols()) + ", expected " +
                                 std::to_string(geo.out_channels) + "x" +
                                 std::to_string(geo.patch_size()));
    }

    const std::size_t H_out = geo.output_dim(input.height);
    const std::size_t W_out = geo.output_dim(input.width);
    const std::size_t patches = H_out * W_out;
    FeatureMap output(input.batch, geo.out_channels, H_out, W_out);

    // Row-major buffer so im2col writes [patch_size × patches] directly
    Eigen::Matrix<double, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor> cols(
        geo.patch_size(), patches);

    for (std::size_t n = 0; n < input.batch; ++n) {
        const double* image = input.data.data() + n * input.channels * input.plane();
        im2col(image, cols.data(), input.channels, input.height, input.width,
               geo.kernel_size, geo.stride, geo.padding, geo.dilation, H_out, W_out);

        const Matrix result = weight * cols;   // [C_out × patches]
        for (std::size_t c = 0; c < geo.out_channels; ++c) {
            for (std::size_t p = 0; p < patches; ++p) {
                output.data[(n * geo.out_channels + c) * patches + p] =
                    result(static_cast<Eigen::Index>(c), static_cast<Eigen::Index>(p));
            }
        }
    }
    return output;
}

//==============================================================================
// Element-wise
//==============================================================================

double quantize_input(double x, unsigned bits) {
    if (bits >= 16) return x;
    const double levels = std::ldexp(1.0, static_cast<int>(bits)) - 1.0;
    const double clamped = std::min(1.0, std::max(0.0, std::isfinite(x) ? x : 0.0));
    // nearbyint rounds half to even under the default FE_TONEAREST mode
    return std::nearbyint(clamped * levels) / levels;
}

void quantize_input(Matrix& x, unsigned bits) {
    if (bits >= 16) return;
    x = x.unaryExpr([bits](double v) { return quantize_input(v, bits); });
}

void quantize_input(FeatureMap& x, unsigned bits) {
    if (bits >= 16) return;
    for (double& v : x.data) v = quantize_input(v, bits);
}

void photodetect(Matrix& y) {
    y = y.array().square().matrix();
}

void photodetect(FeatureMap& y) {
    for (double& v : y.data) v = v * v;
}

void add_bias(Matrix& y, const Vector& bias) {
    if (y.cols() != bias.size()) {
        throw ShapeMismatchError("add_bias: output has " + std::to_string(y.cols()) +
                                 " features, bias has " + std::to_string(bias.size()));
    }
    y.rowwise() += bias.transpose();
}

void add_bias(FeatureMap& y, const Vector& bias) {
    if (y.channels != static_cast<std::size_t>(bias.size())) {
        throw ShapeMismatchError("add_bias: output has " + std::to_string(y.channels) +
                                 " channels, bias has " + std::to_string(bias.size()));
    }
    const std::size_t plane = y.plane();
    for (std::size_t n = 0; n < y.batch; ++n) {
        for (std::size_t c = 0; c < y.channels; ++c) {
            double* base = y.data.data() + (n * y.channels + c) * plane;
            const double b = bias[static_cast<Eigen::Index>(c)];
            for (std::size_t i = 0; i < plane; ++i) base[i] += b;
        }
    }
}

} // namespace compute
} // namespace photon_mesh
