#pragma once

#include "iit/core/types.hpp"
#include "iit/core/config.hpp"
#include "iit/core/errors.hpp"
#include "iit/data/repertoire.hpp"
#include "iit/metrics/emd.hpp"
#include <cmath>
#include <limits>
#include <stdexcept>

namespace iit {

inline void check_same_purview(const Repertoire& p, const Repertoire& q) {
    if (p.purview() != q.purview()) {
        throw std::invalid_argument("Repertoires must have same purview: " +
                                    bits::to_string(p.purview()) + " vs " +
                                    bits::to_string(q.purview()));
    }
}

// Sum of absolute differences
inline Real l1_distance(const Repertoire& p, const Repertoire& q) {
    check_same_purview(p, q);
    Real total = 0.0;
    for (StateIndex s = 0; s < p.num_states(); ++s) {
        total += std::abs(p[s] - q[s]);
    }
    return total;
}

/**
 * Kullback-Leibler divergence D(p || q) in bits.
 *
 * Infinite when q assigns zero probability to a state p supports.
 */
inline Real kld(const Repertoire& p, const Repertoire& q) {
    check_same_purview(p, q);
    Real total = 0.0;
    for (StateIndex s = 0; s < p.num_states(); ++s) {
        if (p[s] <= 0) continue;
        if (q[s] <= 0) return std::numeric_limits<Real>::infinity();
        total += p[s] * std::log2(p[s] / q[s]);
    }
    // Rounding can leave tiny negative totals for near-identical inputs
    return total < 0 ? 0.0 : total;
}

inline Real entropy_difference(const Repertoire& p, const Repertoire& q) {
    check_same_purview(p, q);
    return std::abs(p.entropy() - q.entropy());
}

/**
 * Distance between an unpartitioned and a partitioned repertoire under
 * the configured measure.
 *
 * Identical repertoires are at distance exactly 0. A NaN result raises
 * NumericalInstabilityError.
 */
inline Real repertoire_distance(DistanceMeasure measure, const Repertoire& unpartitioned,
                                const Repertoire& partitioned, Direction direction,
                                const EMDOptions& opts = EMDOptions{}) {
    check_same_purview(unpartitioned, partitioned);
    if (unpartitioned.approx_equal(partitioned, 0.0)) return 0.0;

    Real d = 0.0;
    switch (measure) {
        case DistanceMeasure::EMD:
            d = emd(unpartitioned, partitioned, direction, opts);
            break;
        case DistanceMeasure::L1:
            d = l1_distance(unpartitioned, partitioned);
            break;
        case DistanceMeasure::KLD:
            d = kld(unpartitioned, partitioned);
            break;
        case DistanceMeasure::ENTROPY_DIFFERENCE:
            d = entropy_difference(unpartitioned, partitioned);
            break;
    }
    if (std::isnan(d)) {
        throw NumericalInstabilityError(std::string(to_string(measure)) +
                                        " distance is NaN over purview " +
                                        bits::to_string(unpartitioned.purview()));
    }
    return d;
}

}  // namespace iit
