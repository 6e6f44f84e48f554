/**
 * ╔═══════════════════════════════════════════════════════════════════════════╗
 * ║                             MAIN.CPP                                      ║
 * ╠═══════════════════════════════════════════════════════════════════════════╣
 * ║  CLI ENTRY POINT: Photonic MZI mesh simulator                             ║
 * ╠═══════════════════════════════════════════════════════════════════════════╣
 * ║                                                                           ║
 * ║  Exercises the representation core on random data: decomposition         ║
 * ║  accuracy, full mode-graph round trips, the weight error introduced by    ║
 * ║  phase quantization and device noise, and conversion timings.             ║
 * ║                                                                           ║
 * ╠═══════════════════════════════════════════════════════════════════════════╣
 * ║  USAGE:                                                                   ║
 * ║                                                                           ║
 * ║  ./photon_mesh_sim --help                                                 ║
 * ║  ./photon_mesh_sim decompose -k 16 -a reck -i 50                          ║
 * ║  ./photon_mesh_sim sync -r 4 -c 4 -k 8                                    ║
 * ║  ./photon_mesh_sim quantize -b 8 -n 0.002 -x 0.1                          ║
 * ║  ./photon_mesh_sim bench -k 16 -i 20                                      ║
 * ║                                                                           ║
 * ╚═══════════════════════════════════════════════════════════════════════════╝
 */

#include <iostream>
#include <iomanip>
#include <string>
#include <vector>
#include <chrono>
#include <cmath>
#include <random>
#include <stdexcept>
#include <getopt.h>

#include <Eigen/QR>

#include "include/conversion_counters.hpp"
#include "include/representation_sync.hpp"
#include "include/unitary_decomposer.hpp"

using namespace photon_mesh;

// =============================================================================
// Version Info
// =============================================================================

static constexpr const char* VERSION = "1.0.0";
static constexpr const char* PROJECT_NAME = "Photonic MZI Mesh Simulator";

// =============================================================================
// Command-Line Options
// =============================================================================

struct Options {
    std::string command;
    std::string algorithm;          // empty: run both topologies
    std::size_t block_size = 4;
    std::size_t rows = 2;
    std::size_t cols = 2;
    unsigned bits = 8;
    double noise = 0.0;
    double crosstalk = 0.0;
    std::uint32_t seed = 42;
    int iterations = 10;
    bool verbose = false;
    bool help = false;
};

void print_usage(const char* prog_name) {
    std::cout << R"(
╔══════════════════════════════════════════════════════════════════════════════╗
║                 PHOTONIC MZI MESH - REPRESENTATION SIMULATOR                 ║
╚══════════════════════════════════════════════════════════════════════════════╝

USAGE:
    )" << prog_name << R"( <command> [options]

COMMANDS:
    decompose   Decompose / reconstruct random orthogonal blocks
    sync        Round-trip a random weight grid through every mode
    quantize    Sweep phase bit-widths and report the weight error
    bench       Time decomposition, sync and materialization

OPTIONS:
    -h, --help              Show this help message
    -v, --verbose           Log every conversion
    -k, --block <N>         Block size k (default: 4)
    -r, --rows <N>          Grid rows (default: 2)
    -c, --cols <N>          Grid columns (default: 2)
    -a, --alg <name>        clements | reck (default: both)
    -b, --bits <N>          Largest bit-width in the quantize sweep (default: 8)
    -n, --noise <std>       Gamma noise std (default: 0)
    -x, --crosstalk <f>     Crosstalk factor in [0, 1] (default: 0)
    -s, --seed <N>          Random seed (default: 42)
    -i, --iterations <N>    Repetitions per measurement (default: 10)

EXAMPLES:
    )" << prog_name << R"( decompose -k 32 -i 20
    )" << prog_name << R"( sync -r 4 -c 8 -k 8 -a reck
    )" << prog_name << R"( quantize -b 10 -n 0.002 -x 0.2
    )" << prog_name << R"( bench -k 16 -i 50

)";
}

Options parse_args(int argc, char** argv) {
    Options opts;

    static struct option long_options[] = {
        {"help",       no_argument,       0, 'h'},
        {"verbose",    no_argument,       0, 'v'},
        {"block",      required_argument, 0, 'k'},
        {"rows",       required_argument, 0, 'r'},
        {"cols",       required_argument, 0, 'c'},
        {"alg",        required_argument, 0, 'a'},
        {"bits",       required_argument, 0, 'b'},
        {"noise",      required_argument, 0, 'n'},
        {"crosstalk",  required_argument, 0, 'x'},
        {"seed",       required_argument, 0, 's'},
        {"iterations", required_argument, 0, 'i'},
        {0, 0, 0, 0}
    };

    int opt;
    while ((opt = getopt_long(argc, argv, "hvk:r:c:a:b:n:x:s:i:", long_options, nullptr)) != -1) {
        switch (opt) {
            case 'h': opts.help = true; break;
            case 'v': opts.verbose = true; break;
            case 'k': opts.block_size = std::stoul(optarg); break;
            case 'r': opts.rows = std::stoul(optarg); break;
            case 'c': opts.cols = std::stoul(optarg); break;
            case 'a': opts.algorithm = optarg; break;
            case 'b': opts.bits = static_cast<unsigned>(std::stoul(optarg)); break;
            case 'n': opts.noise = std::stod(optarg); break;
            case 'x': opts.crosstalk = std::stod(optarg); break;
            case 's': opts.seed = static_cast<std::uint32_t>(std::stoul(optarg)); break;
            case 'i': opts.iterations = std::stoi(optarg); break;
            default:  opts.help = true; break;
        }
    }

    if (optind < argc) {
        opts.command = argv[optind];
    }
    if (opts.iterations < 1) {
        throw std::invalid_argument("--iterations must be at least 1");
    }
    return opts;
}

// =============================================================================
// Helpers
// =============================================================================

static std::vector<DecomposeAlg> selected_algorithms(const Options& opts) {
    if (opts.algorithm.empty()) return {DecomposeAlg::CLEMENTS, DecomposeAlg::RECK};
    return {parse_decompose_alg(opts.algorithm)};
}

static Matrix gaussian_matrix(std::size_t rows, std::size_t cols, std::mt19937& rng) {
    std::normal_distribution<double> dist(0.0, 1.0);
    Matrix m(rows, cols);
    for (Eigen::Index i = 0; i < m.rows(); ++i) {
        for (Eigen::Index j = 0; j < m.cols(); ++j) m(i, j) = dist(rng);
    }
    return m;
}

static Matrix random_orthogonal(std::size_t k, std::mt19937& rng) {
    Eigen::HouseholderQR<Matrix> qr(gaussian_matrix(k, k, rng));
    return qr.householderQ();
}

static BlockGrid random_weight_grid(const Options& opts) {
    std::mt19937 rng(opts.seed);
    BlockGrid grid = make_block_grid(opts.rows, opts.cols, opts.block_size);
    for (Matrix& block : grid.cells) {
        block = gaussian_matrix(opts.block_size, opts.block_size, rng);
    }
    return grid;
}

static RepresentationSync make_sync(const Options& opts, Mode mode, DecomposeAlg alg,
                                    const BlockGrid& weight) {
    SyncConfig cfg;
    cfg.grid_rows = opts.rows;
    cfg.grid_cols = opts.cols;
    cfg.block_size = opts.block_size;
    cfg.mode = mode;
    cfg.algorithm = alg;
    RepresentationSync sync(cfg);
    sync.set_verbose(opts.verbose);
    sync.weight_blocks().weight = weight;
    sync.sync_parameters(Mode::WEIGHT);
    return sync;
}

static double relative_error(const BlockGrid& ref, const BlockGrid& actual) {
    double num = 0.0, den = 0.0;
    for (std::size_t i = 0; i < ref.size(); ++i) {
        num += (ref.cells[i] - actual.cells[i]).squaredNorm();
        den += ref.cells[i].squaredNorm();
    }
    return den > 0.0 ? std::sqrt(num / den) : std::sqrt(num);
}

static double elapsed_us(std::chrono::high_resolution_clock::time_point start) {
    auto now = std::chrono::high_resolution_clock::now();
    return std::chrono::duration<double, std::micro>(now - start).count();
}

// =============================================================================
// Command Handlers
// =============================================================================

int cmd_decompose(const Options& opts) {
    std::cout << "=== Decompose (k=" << opts.block_size << ", " << opts.iterations
              << " matrices) ===" << std::endl;

    int status = 0;
    for (DecomposeAlg alg : selected_algorithms(opts)) {
        UnitaryDecomposer dec(alg);
        std::mt19937 rng(opts.seed);
        double worst = 0.0;
        double total_us = 0.0;

        for (int it = 0; it < opts.iterations; ++it) {
            const Matrix U = random_orthogonal(opts.block_size, rng);
            auto start = std::chrono::high_resolution_clock::now();
            const MeshDecomposition d = dec.decompose(U);
            total_us += elapsed_us(start);
            const Matrix back = dec.reconstruct(d.delta, d.phase_mesh);
            if (U.size() > 0) worst = std::max(worst, (U - back).cwiseAbs().maxCoeff());
        }

        std::cout << "  " << std::left << std::setw(10) << to_string(alg) << std::right
                  << " angles=" << num_mesh_angles(opts.block_size)
                  << "  max_err=" << std::scientific << std::setprecision(3) << worst
                  << "  decompose=" << std::fixed << std::setprecision(2)
                  << total_us / opts.iterations << " us" << std::defaultfloat << std::endl;
        if (worst > 1e-6) status = 1;
    }
    return status;
}

int cmd_sync(const Options& opts) {
    std::cout << "=== Sync round trip (grid " << opts.rows << "x" << opts.cols
              << ", k=" << opts.block_size << ") ===" << std::endl;

    const BlockGrid W = random_weight_grid(opts);
    int status = 0;
    for (DecomposeAlg alg : selected_algorithms(opts)) {
        for (Mode mode : {Mode::WEIGHT, Mode::FACTORED, Mode::PHASE, Mode::VOLTAGE}) {
            RepresentationSync sync = make_sync(opts, mode, alg, W);
            const double err = max_abs_diff(W, sync.build_weight());

            std::cout << "  " << std::left << std::setw(10) << to_string(alg)
                      << std::setw(9) << to_string(mode) << std::right
                      << " max_err=" << std::scientific << std::setprecision(3) << err
                      << std::defaultfloat << "   [" << sync.counters().summary() << "]"
                      << std::endl;
            if (err > 1e-6) status = 1;
        }
    }
    return status;
}

int cmd_quantize(const Options& opts) {
    std::cout << "=== Quantization sweep (noise=" << opts.noise
              << ", crosstalk=" << opts.crosstalk << ") ===" << std::endl;

    const BlockGrid W = random_weight_grid(opts);
    for (DecomposeAlg alg : selected_algorithms(opts)) {
        RepresentationSync sync = make_sync(opts, Mode::PHASE, alg, W);
        sync.set_crosstalk_factor(opts.crosstalk);
        sync.set_gamma_noise(opts.noise, opts.seed);

        std::cout << "  " << to_string(alg) << ":" << std::endl;
        std::vector<unsigned> sweep;
        for (unsigned b = 1; b <= opts.bits; b = (b < 4) ? b + 1 : b + 2) sweep.push_back(b);
        sweep.push_back(FULL_PRECISION_BITS * 2);

        for (unsigned bit : sweep) {
            sync.set_weight_bitwidth(bit);
            const BlockGrid& out = sync.build_weight();
            std::cout << "    w_bit=" << std::setw(2) << bit
                      << "  max_err=" << std::scientific << std::setprecision(3)
                      << max_abs_diff(W, out)
                      << "  rel_err=" << relative_error(W, out)
                      << std::defaultfloat << std::endl;
        }
    }
    return 0;
}

int cmd_bench(const Options& opts) {
    std::cout << "=== Running Benchmarks ===" << std::endl;
    std::cout << "Grid: " << opts.rows << "x" << opts.cols << ", k=" << opts.block_size
              << ", iterations: " << opts.iterations << std::endl;

    const BlockGrid W = random_weight_grid(opts);
    for (DecomposeAlg alg : selected_algorithms(opts)) {
        RepresentationSync sync = make_sync(opts, Mode::PHASE, alg, W);
        sync.reset_counters();

        auto start = std::chrono::high_resolution_clock::now();
        for (int it = 0; it < opts.iterations; ++it) sync.sync_parameters(Mode::WEIGHT);
        const double sync_us = elapsed_us(start) / opts.iterations;

        start = std::chrono::high_resolution_clock::now();
        for (int it = 0; it < opts.iterations; ++it) sync.build_weight();
        const double exact_us = elapsed_us(start) / opts.iterations;

        sync.set_weight_bitwidth(opts.bits);
        sync.set_crosstalk_factor(opts.crosstalk);
        sync.set_gamma_noise(opts.noise, opts.seed);
        start = std::chrono::high_resolution_clock::now();
        for (int it = 0; it < opts.iterations; ++it) sync.build_weight();
        const double quant_us = elapsed_us(start) / opts.iterations;

        std::cout << "\n  " << to_string(alg) << std::fixed << std::setprecision(2) << std::endl;
        std::cout << "    sync_parameters(weight): " << std::setw(12) << sync_us << " us" << std::endl;
        std::cout << "    build_weight (exact):    " << std::setw(12) << exact_us << " us" << std::endl;
        std::cout << "    build_weight (" << std::setw(2) << opts.bits << "-bit):   "
                  << std::setw(12) << quant_us << " us" << std::defaultfloat << std::endl;

        ConversionCounters::print_report(sync.counters(), std::cout);
    }
    return 0;
}

// =============================================================================
// Main
// =============================================================================

int main(int argc, char** argv) {
    try {
        Options opts = parse_args(argc, argv);

        if (opts.help || opts.command.empty()) {
            print_usage(argv[0]);
            return opts.help ? 0 : 1;
        }

        if (opts.verbose) {
            std::cout << PROJECT_NAME << " v" << VERSION << std::endl;
            std::cout << std::endl;
        }

        if (opts.command == "decompose") {
            return cmd_decompose(opts);
        } else if (opts.command == "sync") {
            return cmd_sync(opts);
        } else if (opts.command == "quantize") {
            return cmd_quantize(opts);
        } else if (opts.command == "bench") {
            return cmd_bench(opts);
        } else {
            std::cerr << "Unknown command: " << opts.command << std::endl;
            std::cerr << "Use --help for usage information" << std::endl;
            return 1;
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
