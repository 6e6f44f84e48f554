/**
 * ╔═══════════════════════════════════════════════════════════════════════════╗
 * ║                       REPRESENTATION_SYNC.CPP                             ║
 * ╠═══════════════════════════════════════════════════════════════════════════╣
 * ║  IMPLEMENTS: representation_sync.hpp                                      ║
 * ╠═══════════════════════════════════════════════════════════════════════════╣
 * ║                                                                           ║
 * ║  BUILD PATH IN PHASE MODE (update = {U, S, V}):                           ║
 * ║                                                                           ║
 * ║    phase_U ──quantize?──+noise?──► reconstruct(delta_U) ──► U ─┐          ║
 * ║    phase_S ──quantize?───────────► S_scale · cos(·) ───────► S ─┼─► W     ║
 * ║    phase_V ──quantize?──+noise?──► reconstruct(delta_V) ──► V ─┘          ║
 * ║                                                                           ║
 * ║  Unselected paths keep their factored values from the previous build.    ║
 * ║  Counters are bumped once per block (SVD, decompose, reconstruct,        ║
 * ║  materialize) or once per grid (quantize).                                ║
 * ║                                                                           ║
 * ╚═══════════════════════════════════════════════════════════════════════════╝
 */

#include "representation_sync.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>

namespace photon_mesh {

namespace {

const char* const SCALAR_W_BIT = "w_bit";
const char* const SCALAR_GAMMA_NOISE = "gamma_noise_std";
const char* const SCALAR_CROSSTALK = "crosstalk_factor";
const char* const SCALAR_PHASE_NOISE = "phase_noise_std";
const char* const SCALAR_GAMMA_SEED = "gamma_noise_seed";
const char* const SCALAR_PHASE_SEED = "phase_noise_seed";

bool is_scalar_name(const std::string& name) {
    return name == SCALAR_W_BIT || name == SCALAR_GAMMA_NOISE ||
           name == SCALAR_CROSSTALK || name == SCALAR_PHASE_NOISE ||
           name == SCALAR_GAMMA_SEED || name == SCALAR_PHASE_SEED;
}

/// Scalar entry of a snapshot, or the fallback when the entry is absent
double scalar_or(const ParameterDict& params, const char* name, double fallback) {
    const auto it = params.find(name);
    return it == params.end() ? fallback : it->second.values.front();
}

/// Shape of a named representation buffer, empty optional for unknown names
std::optional<std::vector<std::size_t>> buffer_shape(const std::string& name,
                                                     const SyncConfig& cfg) {
    const std::size_t R = cfg.grid_rows;
    const std::size_t C = cfg.grid_cols;
    const std::size_t k = cfg.block_size;
    const std::size_t n = cfg.num_angles();

    if (name == "weight" || name == "U" || name == "V") {
        return std::vector<std::size_t>{R, C, k, k};
    }
    if (name == "S" || name == "delta_list_U" || name == "delta_list_V" ||
        name == "phase_S" || name == "voltage_S") {
        return std::vector<std::size_t>{R, C, k};
    }
    if (name == "phase_U" || name == "phase_V" || name == "voltage_U" || name == "voltage_V") {
        return std::vector<std::size_t>{R, C, n};
    }
    if (name == "S_scale") {
        return std::vector<std::size_t>{R, C, 1};
    }
    return std::nullopt;
}

const std::vector<std::string>& all_buffer_names() {
    static const std::vector<std::string> names = {
        "weight", "U", "S", "V",
        "delta_list_U", "phase_U", "phase_S", "phase_V", "delta_list_V", "S_scale",
        "voltage_U", "voltage_S", "voltage_V"
    };
    return names;
}

std::vector<std::string> mode_buffer_names(Mode mode) {
    switch (mode) {
        case Mode::WEIGHT:
            return {"weight"};
        case Mode::FACTORED:
            return {"U", "S", "V"};
        case Mode::PHASE:
            return {"delta_list_U", "phase_U", "phase_S", "phase_V", "delta_list_V", "S_scale"};
        case Mode::VOLTAGE:
            return {"delta_list_U", "voltage_U", "voltage_S", "voltage_V", "delta_list_V",
                    "S_scale"};
    }
    return {};
}

const SyncConfig& validated(const SyncConfig& config) {
    config.validate();
    return config;
}

} // anonymous namespace

//==============================================================================
// Modes and conversion metadata
//==============================================================================

Mode parse_mode(std::string_view name) {
    if (name == "weight") return Mode::WEIGHT;
    if (name == "usv" || name == "factored") return Mode::FACTORED;
    if (name == "phase") return Mode::PHASE;
    if (name == "voltage") return Mode::VOLTAGE;
    throw NotSupportedError("unknown mode: " + std::string(name) +
                            " (expected weight, usv, phase or voltage)");
}

const char* to_string(Mode mode) {
    switch (mode) {
        case Mode::WEIGHT:   return "weight";
        case Mode::FACTORED: return "usv";
        case Mode::PHASE:    return "phase";
        case Mode::VOLTAGE:  return "voltage";
    }
    return "unknown";
}

ConversionInfo conversion_info(Mode from, Mode to) {
    if (from == to) return {true, true, "identity"};

    if (from == Mode::WEIGHT && to == Mode::FACTORED) return {true, true, "svd"};
    if (from == Mode::FACTORED && to == Mode::PHASE) return {true, false, "decompose"};
    if (from == Mode::PHASE && to == Mode::FACTORED) return {true, true, "reconstruct"};
    if (from == Mode::FACTORED && to == Mode::WEIGHT) return {true, true, "matmul"};
    if (from == Mode::PHASE && to == Mode::VOLTAGE) return {true, false, "phase_to_voltage"};
    if (from == Mode::VOLTAGE && to == Mode::PHASE) return {true, true, "voltage_to_phase"};

    return {false, false, "undefined"};
}

UpdateList UpdateList::from_names(const std::vector<std::string>& names) {
    UpdateList update = none();
    for (const std::string& name : names) {
        if (name == "phase_U" || name == "voltage_U" || name == "delta_list_U" || name == "U") {
            update.u = true;
        } else if (name == "phase_S" || name == "voltage_S" || name == "S_scale" || name == "S") {
            update.s = true;
        } else if (name == "phase_V" || name == "voltage_V" || name == "delta_list_V" ||
                   name == "V") {
            update.v = true;
        } else {
            throw NotSupportedError("'" + name + "' does not select a U, S or V path");
        }
    }
    return update;
}

void SyncConfig::validate() const {
    if (grid_rows == 0 || grid_cols == 0) {
        throw std::invalid_argument("SyncConfig: grid must be non-empty, got " +
                                    grid_shape_string(grid_rows, grid_cols));
    }
    if (block_size == 0) {
        throw std::invalid_argument("SyncConfig: block size must be positive");
    }
    if (w_bit == 0) {
        throw std::invalid_argument("SyncConfig: w_bit must be positive");
    }
    if (!(v_pi > 0.0) || !(v_max > 0.0)) {
        throw std::invalid_argument("SyncConfig: v_pi and v_max must be positive");
    }
}

//==============================================================================
// Construction
//==============================================================================

RepresentationSync::RepresentationSync(const SyncConfig& config)
    : config_(validated(config))
    , decomposer_(config.algorithm)
    , quantizer_U_(QuantizerConfig::for_layout(layout_for(config.algorithm), config.w_bit,
                                               config.v_pi, config.v_max))
    , quantizer_S_(QuantizerConfig::for_layout(MeshLayout::DIAGONAL, config.w_bit,
                                               config.v_pi, config.v_max))
    , quantizer_V_(QuantizerConfig::for_layout(layout_for(config.algorithm), config.w_bit,
                                               config.v_pi, config.v_max))
    , voltage_gamma_{config.gamma(), config.gamma(), config.gamma()}
    , gamma_noise_std_(0.0)
    , gamma_noise_seed_(0)
    , crosstalk_factor_(0.0)
    , phase_noise_std_(0.0)
    , phase_noise_seed_(0)
    , verbose_(false)
{
    const std::size_t R = config_.grid_rows;
    const std::size_t C = config_.grid_cols;
    const std::size_t k = config_.block_size;
    const std::size_t n = config_.num_angles();

    weight_.weight = make_block_grid(R, C, k);

    factored_.U = BlockGrid(R, C, Matrix::Identity(k, k));
    factored_.S = make_vector_grid(R, C, k);
    factored_.V = BlockGrid(R, C, Matrix::Identity(k, k));

    phase_.delta_U = make_vector_grid(R, C, k);
    phase_.phase_U = make_vector_grid(R, C, n);
    phase_.phase_S = make_vector_grid(R, C, k);
    phase_.S_scale = make_scalar_grid(R, C);
    phase_.phase_V = make_vector_grid(R, C, n);
    phase_.delta_V = make_vector_grid(R, C, k);

    voltage_.voltage_U = make_vector_grid(R, C, n);
    voltage_.voltage_S = make_vector_grid(R, C, k);
    voltage_.voltage_V = make_vector_grid(R, C, n);

    factored_to_phase();
    phase_to_voltage();
    reset_counters();
}

void RepresentationSync::log(const std::string& msg) const {
    if (verbose_) {
        std::cout << "[RepresentationSync] " << msg << std::endl;
    }
}

void RepresentationSync::check_weight_grid(const BlockGrid& grid, const std::string& what) const {
    if (grid.rows != config_.grid_rows || grid.cols != config_.grid_cols) {
        throw ShapeMismatchError(what + ": expected grid " +
                                 grid_shape_string(config_.grid_rows, config_.grid_cols) +
                                 ", got " + grid_shape_string(grid.rows, grid.cols));
    }
    const auto k = static_cast<Eigen::Index>(config_.block_size);
    for (const Matrix& block : grid.cells) {
        if (block.rows() != k || block.cols() != k) {
            throw ShapeMismatchError(what + ": expected " + std::to_string(k) + "x" +
                                     std::to_string(k) + " blocks, got " +
                                     std::to_string(block.rows()) + "x" +
                                     std::to_string(block.cols()));
        }
    }
}

//==============================================================================
// Direct transitions
//==============================================================================

void RepresentationSync::weight_to_factored() {
    check_weight_grid(weight_.weight, "weight_to_factored");

    for (std::size_t i = 0; i < weight_.weight.size(); ++i) {
        Eigen::JacobiSVD<Matrix> svd(weight_.weight.cells[i],
                                     Eigen::ComputeFullU | Eigen::ComputeFullV);
        factored_.U.cells[i] = svd.matrixU();
        factored_.S.cells[i] = svd.singularValues();
        factored_.V.cells[i] = svd.matrixV().transpose();
    }
    counters_.svds += weight_.weight.size();

    log("weight -> usv (grid " + grid_shape_string(config_.grid_rows, config_.grid_cols) +
        ", k=" + std::to_string(config_.block_size) + ")");
}

void RepresentationSync::factored_to_phase() {
    check_weight_grid(factored_.U, "factored_to_phase(U)");
    check_weight_grid(factored_.V, "factored_to_phase(V)");
    check_same_grid(factored_.U, factored_.S, "factored_to_phase(S)");

    decomposer_.decompose_to_vector(factored_.U, phase_.delta_U, phase_.phase_U);
    decomposer_.decompose_to_vector(factored_.V, phase_.delta_V, phase_.phase_V);
    counters_.decompositions += factored_.U.size() + factored_.V.size();

    for (std::size_t i = 0; i < factored_.S.size(); ++i) {
        const Vector& S = factored_.S.cells[i];
        Vector& phase_S = phase_.phase_S.cells[i];
        if (S.size() != static_cast<Eigen::Index>(config_.block_size)) {
            throw ShapeMismatchError("factored_to_phase: S has " + std::to_string(S.size()) +
                                     " entries, expected " +
                                     std::to_string(config_.block_size));
        }

        const double scale = S.size() > 0 ? S.cwiseAbs().maxCoeff() : 0.0;
        phase_.S_scale.cells[i] = scale;
        if (scale == 0.0) {
            // All-dark block: cos(π/2) == 0 reproduces S exactly
            phase_S.setConstant(PI / 2.0);
            continue;
        }
        for (Eigen::Index j = 0; j < S.size(); ++j) {
            phase_S[j] = std::acos(std::min(1.0, std::max(-1.0, S[j] / scale)));
        }
    }

    log("usv -> phase (" + std::string(to_string(decomposer_.algorithm())) + ", " +
        std::to_string(factored_.U.size()) + " blocks)");
}

VectorGrid RepresentationSync::phase_to_s(const VectorGrid& phase_S) const {
    check_same_grid(phase_S, phase_.S_scale, "phase_to_s");
    VectorGrid S = phase_S;
    for (std::size_t i = 0; i < S.size(); ++i) {
        S.cells[i] = phase_.S_scale.cells[i] * phase_S.cells[i].array().cos().matrix();
    }
    return S;
}

void RepresentationSync::phase_to_factored(const UpdateList& update) {
    if (update.u) {
        factored_.U = decomposer_.reconstruct_from_vector(phase_.delta_U, phase_.phase_U);
        counters_.reconstructions += factored_.U.size();
    }
    if (update.s) {
        factored_.S = phase_to_s(phase_.phase_S);
    }
    if (update.v) {
        factored_.V = decomposer_.reconstruct_from_vector(phase_.delta_V, phase_.phase_V);
        counters_.reconstructions += factored_.V.size();
    }
    log("phase -> usv");
}

const BlockGrid& RepresentationSync::factored_to_weight() {
    check_same_grid(factored_.U, factored_.V, "factored_to_weight");
    check_same_grid(factored_.U, factored_.S, "factored_to_weight");

    BlockGrid weight(factored_.U.rows, factored_.U.cols, Matrix());
    for (std::size_t i = 0; i < weight.size(); ++i) {
        weight.cells[i] = factored_.U.cells[i] * factored_.S.cells[i].asDiagonal() *
                          factored_.V.cells[i];
    }
    check_weight_grid(weight, "factored_to_weight");
    weight_.weight = std::move(weight);
    counters_.materializations += weight_.weight.size();
    log("usv -> weight");
    return weight_.weight;
}

void RepresentationSync::phase_to_voltage() {
    voltage_.voltage_U = photon_mesh::phase_to_voltage(phase_.phase_U, voltage_gamma_.U);
    voltage_.voltage_S = photon_mesh::phase_to_voltage(phase_.phase_S, voltage_gamma_.S);
    voltage_.voltage_V = photon_mesh::phase_to_voltage(phase_.phase_V, voltage_gamma_.V);
    log("phase -> voltage");
}

void RepresentationSync::voltage_to_phase(const UpdateList& update) {
    if (update.u) {
        phase_.phase_U = photon_mesh::voltage_to_phase(voltage_.voltage_U, voltage_gamma_.U);
    }
    if (update.s) {
        phase_.phase_S = photon_mesh::voltage_to_phase(voltage_.voltage_S, voltage_gamma_.S);
    }
    if (update.v) {
        phase_.phase_V = photon_mesh::voltage_to_phase(voltage_.voltage_V, voltage_gamma_.V);
    }
    log("voltage -> phase");
}

void RepresentationSync::convert(Mode from, Mode to, const UpdateList& update) {
    const ConversionInfo info = conversion_info(from, to);
    if (!info.defined) {
        throw NotSupportedError(std::string("no direct conversion from ") + to_string(from) +
                                " to " + to_string(to));
    }

    if (from == to) return;
    if (from == Mode::WEIGHT) {
        weight_to_factored();
    } else if (from == Mode::FACTORED && to == Mode::PHASE) {
        factored_to_phase();
    } else if (from == Mode::FACTORED) {
        factored_to_weight();
    } else if (from == Mode::PHASE && to == Mode::FACTORED) {
        phase_to_factored(update);
    } else if (from == Mode::PHASE) {
        phase_to_voltage();
    } else {
        voltage_to_phase(update);
    }
}

//==============================================================================
// Materialization
//==============================================================================

bool RepresentationSync::needs_quantization() const {
    return config_.w_bit < FULL_PRECISION_BITS ||
           gamma_noise_std_ > NOISE_EPSILON ||
           crosstalk_factor_ > NOISE_EPSILON;
}

VectorGrid RepresentationSync::quantized_phase(PhaseQuantizer& quantizer,
                                               const VectorGrid& phase) {
    if (!needs_quantization() || quantizer.is_identity()) return phase;
    ++counters_.quantizations;
    return quantizer.quantize(phase);
}

void RepresentationSync::materialize_phase(const UpdateList& update) {
    const bool phase_noise = phase_noise_std_ > NOISE_EPSILON;

    if (update.u) {
        VectorGrid phase_U = quantized_phase(quantizer_U_, phase_.phase_U);
        if (phase_noise) {
            for (std::size_t i = 0; i < phase_U.size(); ++i) {
                phase_U.cells[i] += phase_noise_U_.cells[i];
            }
        }
        factored_.U = decomposer_.reconstruct_from_vector(phase_.delta_U, phase_U);
        counters_.reconstructions += factored_.U.size();
    }
    if (update.s) {
        factored_.S = phase_to_s(quantized_phase(quantizer_S_, phase_.phase_S));
    }
    if (update.v) {
        VectorGrid phase_V = quantized_phase(quantizer_V_, phase_.phase_V);
        if (phase_noise) {
            for (std::size_t i = 0; i < phase_V.size(); ++i) {
                phase_V.cells[i] += phase_noise_V_.cells[i];
            }
        }
        factored_.V = decomposer_.reconstruct_from_vector(phase_.delta_V, phase_V);
        counters_.reconstructions += factored_.V.size();
    }

    if (verbose_ && needs_quantization()) {
        std::ostringstream oss;
        oss << "quantized build: w_bit=" << config_.w_bit
            << " gamma_noise=" << gamma_noise_std_
            << " crosstalk=" << crosstalk_factor_;
        log(oss.str());
    }
}

const BlockGrid& RepresentationSync::build_weight(const UpdateList& update) {
    switch (config_.mode) {
        case Mode::WEIGHT:
            return weight_.weight;
        case Mode::FACTORED:
            return factored_to_weight();
        case Mode::VOLTAGE:
            voltage_to_phase(update);
            materialize_phase(update);
            return factored_to_weight();
        case Mode::PHASE:
            materialize_phase(update);
            return factored_to_weight();
    }
    throw NotSupportedError("build_weight: unsupported mode");
}

void RepresentationSync::sync_parameters(Mode src) {
    switch (src) {
        case Mode::WEIGHT:
            weight_to_factored();
            factored_to_phase();
            phase_to_voltage();
            break;
        case Mode::FACTORED:
            factored_to_phase();
            phase_to_voltage();
            factored_to_weight();
            break;
        case Mode::PHASE:
            materialize_phase(UpdateList::all());
            factored_to_weight();
            phase_to_voltage();
            break;
        case Mode::VOLTAGE:
            voltage_to_phase();
            materialize_phase(UpdateList::all());
            factored_to_weight();
            break;
    }
    log(std::string("synced all representations from ") + to_string(src));
}

//==============================================================================
// Hardware non-idealities
//==============================================================================

void RepresentationSync::set_gamma_noise(double std, std::optional<std::uint32_t> random_state) {
    const std::size_t R = config_.grid_rows;
    const std::size_t C = config_.grid_cols;
    const std::size_t k = config_.block_size;
    const std::size_t n = config_.num_angles();

    const std::uint32_t seed = random_state.value_or(0);
    quantizer_U_.set_gamma_noise(std, R, C, n, seed);
    quantizer_S_.set_gamma_noise(std, R, C, k, seed + 1);
    quantizer_V_.set_gamma_noise(std, R, C, n, seed + 2);
    gamma_noise_std_ = std;
    gamma_noise_seed_ = seed;
}

void RepresentationSync::set_crosstalk_factor(double factor) {
    quantizer_U_.set_crosstalk_factor(factor);
    quantizer_S_.set_crosstalk_factor(factor);
    quantizer_V_.set_crosstalk_factor(factor);
    crosstalk_factor_ = factor;
}

void RepresentationSync::set_weight_bitwidth(unsigned w_bit) {
    quantizer_U_.set_bitwidth(w_bit);
    quantizer_S_.set_bitwidth(w_bit);
    quantizer_V_.set_bitwidth(w_bit);
    config_.w_bit = w_bit;
}

void RepresentationSync::set_phase_variation(double std,
                                             std::optional<std::uint32_t> random_state) {
    if (!(std >= 0.0)) {
        throw std::invalid_argument("set_phase_variation: std must be >= 0, got " +
                                    std::to_string(std));
    }
    const std::uint32_t seed = random_state.value_or(0);
    phase_noise_std_ = std;
    phase_noise_seed_ = seed;
    if (std <= NOISE_EPSILON) {
        phase_noise_U_ = VectorGrid();
        phase_noise_V_ = VectorGrid();
        return;
    }
    const std::size_t n = config_.num_angles();
    phase_noise_U_ = truncated_normal_grid(std, config_.grid_rows, config_.grid_cols, n, seed);
    phase_noise_V_ = truncated_normal_grid(std, config_.grid_rows, config_.grid_cols, n, seed + 1);
}

void RepresentationSync::set_voltage_gamma(const VoltageGammas& gammas) {
    if (!(gammas.U > 0.0) || !(gammas.S > 0.0) || !(gammas.V > 0.0)) {
        throw std::invalid_argument("set_voltage_gamma: gammas must be positive");
    }
    voltage_gamma_ = gammas;
}

//==============================================================================
// Parameters
//==============================================================================

std::vector<std::string> RepresentationSync::trainable_parameter_names() const {
    switch (config_.mode) {
        case Mode::WEIGHT:   return {"weight"};
        case Mode::FACTORED: return {"U", "S", "V"};
        case Mode::PHASE:    return {"phase_U", "phase_S", "phase_V", "S_scale"};
        case Mode::VOLTAGE:  return {"voltage_U", "voltage_S", "voltage_V", "S_scale"};
    }
    return {};
}

std::vector<std::string> RepresentationSync::buffer_names() const {
    const std::vector<std::string> trainable = trainable_parameter_names();
    std::vector<std::string> buffers;
    for (const std::string& name : all_buffer_names()) {
        if (std::find(trainable.begin(), trainable.end(), name) == trainable.end()) {
            buffers.push_back(name);
        }
    }
    return buffers;
}

ParameterTensor RepresentationSync::parameter(const std::string& name) const {
    const std::size_t k = config_.block_size;
    const std::size_t n = config_.num_angles();

    if (name == "weight") return to_parameter(weight_.weight, k);
    if (name == "U") return to_parameter(factored_.U, k);
    if (name == "S") return to_parameter(factored_.S, k);
    if (name == "V") return to_parameter(factored_.V, k);
    if (name == "delta_list_U") return to_parameter(phase_.delta_U, k);
    if (name == "phase_U") return to_parameter(phase_.phase_U, n);
    if (name == "phase_S") return to_parameter(phase_.phase_S, k);
    if (name == "phase_V") return to_parameter(phase_.phase_V, n);
    if (name == "delta_list_V") return to_parameter(phase_.delta_V, k);
    if (name == "S_scale") return to_parameter(phase_.S_scale);
    if (name == "voltage_U") return to_parameter(voltage_.voltage_U, n);
    if (name == "voltage_S") return to_parameter(voltage_.voltage_S, k);
    if (name == "voltage_V") return to_parameter(voltage_.voltage_V, n);
    if (name == SCALAR_W_BIT) return scalar_parameter(config_.w_bit);
    if (name == SCALAR_GAMMA_NOISE) return scalar_parameter(gamma_noise_std_);
    if (name == SCALAR_CROSSTALK) return scalar_parameter(crosstalk_factor_);
    if (name == SCALAR_PHASE_NOISE) return scalar_parameter(phase_noise_std_);
    if (name == SCALAR_GAMMA_SEED) return scalar_parameter(gamma_noise_seed_);
    if (name == SCALAR_PHASE_SEED) return scalar_parameter(phase_noise_seed_);
    throw NotSupportedError("unknown parameter: " + name);
}

ParameterDict RepresentationSync::state_dict() const {
    ParameterDict dict;
    for (const std::string& name : mode_buffer_names(config_.mode)) {
        dict[name] = parameter(name);
    }
    for (const char* name : {SCALAR_W_BIT, SCALAR_GAMMA_NOISE, SCALAR_GAMMA_SEED,
                             SCALAR_CROSSTALK, SCALAR_PHASE_NOISE, SCALAR_PHASE_SEED}) {
        dict[name] = parameter(name);
    }
    return dict;
}

void RepresentationSync::load_parameters(const ParameterDict& params) {
    // Validate everything first so a bad entry leaves the layer untouched
    for (const auto& entry : params) {
        const std::string& name = entry.first;
        const ParameterTensor& t = entry.second;

        if (is_scalar_name(name)) {
            if (t.values.size() != 1 || t.numel() != 1) {
                throw ShapeMismatchError("parameter '" + name + "' must be a scalar, got " +
                                         shape_string(t.shape));
            }
            const double value = t.values.front();
            if (name == SCALAR_W_BIT && !(value >= 1.0)) {
                throw std::invalid_argument("w_bit must be >= 1, got " + std::to_string(value));
            }
            if ((name == SCALAR_GAMMA_NOISE || name == SCALAR_PHASE_NOISE) && !(value >= 0.0)) {
                throw std::invalid_argument(name + " must be >= 0, got " + std::to_string(value));
            }
            if ((name == SCALAR_GAMMA_SEED || name == SCALAR_PHASE_SEED) &&
                !(value >= 0.0 && value <= 4294967295.0 && value == std::floor(value))) {
                throw std::invalid_argument(name + " must be a 32-bit unsigned integer, got " +
                                            std::to_string(value));
            }
            if (name == SCALAR_CROSSTALK && !(value >= 0.0 && value <= 1.0)) {
                throw std::invalid_argument("crosstalk_factor must be in [0, 1], got " +
                                            std::to_string(value));
            }
            continue;
        }

        const auto expected = buffer_shape(name, config_);
        if (!expected) {
            throw NotSupportedError("unknown parameter: " + name);
        }
        check_parameter_shape(name, t, *expected);
    }

    const std::size_t k = config_.block_size;
    const std::size_t n = config_.num_angles();
    std::vector<std::string> touched;

    for (const auto& entry : params) {
        const std::string& name = entry.first;
        const ParameterTensor& t = entry.second;

        if (name == SCALAR_W_BIT) {
            set_weight_bitwidth(static_cast<unsigned>(std::lround(t.values.front())));
        } else if (name == SCALAR_CROSSTALK) {
            set_crosstalk_factor(t.values.front());
        } else if (is_scalar_name(name)) {
            // Noise std and seed pair up below
        } else {
            if (name == "weight") copy_parameter(t, weight_.weight, k);
            else if (name == "U") copy_parameter(t, factored_.U, k);
            else if (name == "S") copy_parameter(t, factored_.S, k);
            else if (name == "V") copy_parameter(t, factored_.V, k);
            else if (name == "delta_list_U") copy_parameter(t, phase_.delta_U, k);
            else if (name == "phase_U") copy_parameter(t, phase_.phase_U, n);
            else if (name == "phase_S") copy_parameter(t, phase_.phase_S, k);
            else if (name == "phase_V") copy_parameter(t, phase_.phase_V, n);
            else if (name == "delta_list_V") copy_parameter(t, phase_.delta_V, k);
            else if (name == "S_scale") copy_parameter(t, phase_.S_scale);
            else if (name == "voltage_U") copy_parameter(t, voltage_.voltage_U, n);
            else if (name == "voltage_S") copy_parameter(t, voltage_.voltage_S, k);
            else if (name == "voltage_V") copy_parameter(t, voltage_.voltage_V, n);
            if (name != "weight") touched.push_back(name);
        }
    }

    // Noise is redrawn from the saved std and seed
    if (params.count(SCALAR_GAMMA_NOISE) || params.count(SCALAR_GAMMA_SEED)) {
        set_gamma_noise(scalar_or(params, SCALAR_GAMMA_NOISE, gamma_noise_std_),
                        static_cast<std::uint32_t>(
                            scalar_or(params, SCALAR_GAMMA_SEED, gamma_noise_seed_)));
    }
    if (params.count(SCALAR_PHASE_NOISE) || params.count(SCALAR_PHASE_SEED)) {
        set_phase_variation(scalar_or(params, SCALAR_PHASE_NOISE, phase_noise_std_),
                            static_cast<std::uint32_t>(
                                scalar_or(params, SCALAR_PHASE_SEED, phase_noise_seed_)));
    }

    log("loaded " + std::to_string(params.size()) + " parameters");

    if (config_.mode == Mode::PHASE || config_.mode == Mode::VOLTAGE) {
        const UpdateList update = UpdateList::from_names(touched);
        if (update.any()) build_weight(update);
    } else if (config_.mode == Mode::FACTORED && !touched.empty()) {
        factored_to_weight();
    }
}

//==============================================================================
// Gradients
//==============================================================================

FactoredGradients RepresentationSync::factored_backward(const BlockGrid& grad_weight) const {
    check_weight_grid(grad_weight, "factored_backward");

    FactoredGradients grads;
    grads.U = BlockGrid(grad_weight.rows, grad_weight.cols, Matrix());
    grads.S = VectorGrid(grad_weight.rows, grad_weight.cols, Vector());
    grads.V = BlockGrid(grad_weight.rows, grad_weight.cols, Matrix());

    for (std::size_t i = 0; i < grad_weight.size(); ++i) {
        const Matrix& G = grad_weight.cells[i];
        const Matrix& U = factored_.U.cells[i];
        const Matrix& V = factored_.V.cells[i];
        const Vector& S = factored_.S.cells[i];

        grads.U.cells[i] = G * (S.asDiagonal() * V).transpose();
        grads.S.cells[i] = (U.transpose() * G * V.transpose()).diagonal();
        grads.V.cells[i] = (U * S.asDiagonal()).transpose() * G;
    }
    return grads;
}

PhaseSGradients RepresentationSync::phase_s_backward(const VectorGrid& grad_S) const {
    check_same_grid(grad_S, phase_.phase_S, "phase_s_backward");

    PhaseSGradients grads;
    grads.phase_S = VectorGrid(grad_S.rows, grad_S.cols, Vector());
    grads.S_scale = make_scalar_grid(grad_S.rows, grad_S.cols);

    for (std::size_t i = 0; i < grad_S.size(); ++i) {
        const Vector& g = grad_S.cells[i];
        const Vector& phase = phase_.phase_S.cells[i];
        if (g.size() != phase.size()) {
            throw ShapeMismatchError("phase_s_backward: gradient has " +
                                     std::to_string(g.size()) + " entries, expected " +
                                     std::to_string(phase.size()));
        }
        const double scale = phase_.S_scale.cells[i];
        grads.phase_S.cells[i] = (-scale * phase.array().sin() * g.array()).matrix();
        grads.S_scale.cells[i] = (phase.array().cos() * g.array()).sum();
    }
    return grads;
}

} // namespace photon_mesh
