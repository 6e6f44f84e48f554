/**
 * @file conversion_counters.hpp
 * @brief Work counters for representation conversions
 *
 * RepresentationSync bumps these once per block touched, so a caller can
 * check that a restricted update_list really skipped the untouched
 * components, or measure how much work a sync did.
 *
 * ## Example Usage
 * ```cpp
 * ConversionCounters before = sync.counters();
 * sync.build_weight(UpdateList::only_s());
 * ConversionCounters delta = sync.counters() - before;
 * // delta.reconstructions == 0: U and V were not rebuilt
 * ConversionCounters::print_report(delta, std::cout);
 * ```
 */

#ifndef CONVERSION_COUNTERS_HPP
#define CONVERSION_COUNTERS_HPP

#include <cstdint>
#include <iosfwd>
#include <string>

namespace photon_mesh {

struct ConversionCounters {
    std::uint64_t svds = 0;              ///< Dense blocks factored by SVD
    std::uint64_t decompositions = 0;    ///< Unitary blocks decomposed into meshes
    std::uint64_t reconstructions = 0;   ///< Unitary blocks rebuilt from meshes
    std::uint64_t quantizations = 0;     ///< Phase grids passed through a quantizer
    std::uint64_t materializations = 0;  ///< Dense weight builds (U·diag(S)·V)

    /** @brief Subtract a snapshot to get the work done since it */
    ConversionCounters operator-(const ConversionCounters& start) const {
        return {
            svds - start.svds,
            decompositions - start.decompositions,
            reconstructions - start.reconstructions,
            quantizations - start.quantizations,
            materializations - start.materializations
        };
    }

    std::uint64_t total() const {
        return svds + decompositions + reconstructions + quantizations + materializations;
    }

    /// Boxed multi-line report
    static void print_report(const ConversionCounters& counters, std::ostream& os);

    /// One-line summary for log output
    std::string summary() const;
};

} // namespace photon_mesh

#endif // CONVERSION_COUNTERS_HPP
