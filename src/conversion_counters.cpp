/**
 * @file conversion_counters.cpp
 * @brief Report formatting for ConversionCounters
 */

#include "conversion_counters.hpp"

#include <iomanip>
#include <ostream>
#include <sstream>

namespace photon_mesh {

void ConversionCounters::print_report(const ConversionCounters& counters, std::ostream& os) {
    os << "\n";
    os << "╔═══════════════════════════════════════════════════════════════╗\n";
    os << "║           CONVERSION REPORT                                   ║\n";
    os << "╠═══════════════════════════════════════════════════════════════╣\n";
    os << "║ SVDs:              " << std::setw(10) << counters.svds
       << " blocks                      ║\n";
    os << "║ Decompositions:    " << std::setw(10) << counters.decompositions
       << " blocks                      ║\n";
    os << "║ Reconstructions:   " << std::setw(10) << counters.reconstructions
       << " blocks                      ║\n";
    os << "╠═══════════════════════════════════════════════════════════════╣\n";
    os << "║ Quantizations:     " << std::setw(10) << counters.quantizations
       << " grids                       ║\n";
    os << "║ Materializations:  " << std::setw(10) << counters.materializations
       << " blocks                      ║\n";
    os << "╠═══════════════════════════════════════════════════════════════╣\n";
    os << "║ Total:             " << std::setw(10) << counters.total()
       << "                             ║\n";
    os << "╚═══════════════════════════════════════════════════════════════╝\n";
    os << std::endl;
}

std::string ConversionCounters::summary() const {
    std::ostringstream oss;
    oss << svds << " svd, ";
    oss << decompositions << " decomp, ";
    oss << reconstructions << " recon, ";
    oss << quantizations << " quant, ";
    oss << materializations << " weight";
    return oss.str();
}

} // namespace photon_mesh
