#pragma once

#include "iit/core/types.hpp"
#include "iit/core/config.hpp"
#include "iit/core/budget.hpp"
#include "iit/core/errors.hpp"
#include "iit/core/log.hpp"
#include "iit/data/repertoire.hpp"
#include "iit/data/subsystem.hpp"
#include "iit/partition/partition.hpp"
#include "iit/partition/system_cut.hpp"
#include "iit/metrics/distance.hpp"
#include "iit/cache/cache.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <string>
#include <vector>

namespace iit {

/**
 * Result of finding the Minimum Information Partition (MIP).
 */
struct MIPResult {
    Direction direction = Direction::CAUSE;
    NodeSet mechanism = 0;
    NodeSet purview = 0;
    Real phi = 0.0;              // Small phi value
    Partition partition;         // The MIP; empty for degenerate pairs
    Repertoire unpartitioned;
    Repertoire partitioned;      // Partitioned repertoire at MIP

    bool is_reducible(Real tol = EPSILON) const {
        return phi <= tol;
    }
};

/**
 * Maximally Irreducible Cause or Effect of a mechanism: the purview with
 * the largest small phi, its repertoire and its MIP.
 */
struct MICE {
    Direction direction = Direction::CAUSE;
    NodeSet mechanism = 0;
    NodeSet purview = 0;
    Real phi = 0.0;
    Repertoire repertoire;
    Partition partition;

    bool is_null(Real tol = EPSILON) const {
        return phi <= tol;
    }

    /**
     * Whether a system cut can change this MICE: it severs a connection
     * between purview and mechanism in the causal direction, or it runs
     * through the mechanism.
     */
    bool damaged_by_cut(const SystemCut& cut) const {
        bool severed = direction == Direction::CAUSE ? cut.cuts_connections(purview, mechanism)
                                                     : cut.cuts_connections(mechanism, purview);
        return severed || cut.splits_mechanism(mechanism);
    }

    std::string to_string() const {
        return std::string(iit::to_string(direction)) + " " + bits::to_string(mechanism) +
               " -> " + bits::to_string(purview) + " phi=" + std::to_string(phi);
    }

    static constexpr uint64_t CACHE_TAG = 0x4D494345;  // "MICE"

    CacheRecord encode() const {
        CacheRecord record;
        record.words = {CACHE_TAG, static_cast<uint64_t>(direction), mechanism, purview,
                        partition.parts.size()};
        for (const auto& part : partition.parts) {
            record.words.push_back(part.mechanism);
            record.words.push_back(part.purview);
        }
        record.values.push_back(phi);
        record.values.insert(record.values.end(), repertoire.vec().begin(),
                             repertoire.vec().end());
        return record;
    }

    static MICE decode(const CacheRecord& record) {
        const auto& w = record.words;
        if (w.size() < 5 || w[0] != CACHE_TAG || w[1] > 1 || w.size() != 5 + 2 * w[4]) {
            throw CacheCorruptionError("not a MICE record");
        }
        MICE mice;
        mice.direction = static_cast<Direction>(w[1]);
        mice.mechanism = w[2];
        mice.purview = w[3];

        std::vector<Part> parts;
        for (size_t i = 0; i < w[4]; ++i) {
            parts.emplace_back(w[5 + 2 * i], w[6 + 2 * i]);
        }
        mice.partition = Partition(std::move(parts));

        if (bits::popcount(mice.purview) > MAX_NODES ||
            record.values.size() != 1 + state::num_states(bits::popcount(mice.purview))) {
            throw CacheCorruptionError("MICE repertoire size does not match purview");
        }
        mice.phi = record.values[0];
        if (!std::isfinite(mice.phi) || mice.phi < 0) {
            throw CacheCorruptionError("MICE phi is not a non-negative number");
        }
        mice.repertoire = Repertoire(mice.purview, std::vector<Real>(record.values.begin() + 1,
                                                                     record.values.end()));
        return mice;
    }
};

/**
 * Compute the partitioned repertoire for a partition.
 *
 * Product of the repertoires of the parts, over the full purview.
 */
inline Repertoire partitioned_repertoire(const Subsystem& subsystem, Direction direction,
                                         const Partition& partition, NodeSet purview) {
    Repertoire result = subsystem.partitioned_repertoire(direction, partition);
    if (result.purview() != purview) {
        result = result.expand(purview);
    }
    return result;
}

/**
 * Find the MIP over an explicit candidate list.
 *
 * Candidates are evaluated in canonical order whatever order they are
 * given in, so ties resolve to the canonically first partition. The
 * search stops at the first zero-distance candidate.
 */
inline MIPResult find_mip(const Subsystem& subsystem, Direction direction, NodeSet mechanism,
                          NodeSet purview, std::vector<Partition> candidates,
                          const Config& config, const Budget& budget = Budget()) {
    MIPResult result;
    result.direction = direction;
    result.mechanism = mechanism;
    result.purview = purview;
    result.unpartitioned = subsystem.repertoire(direction, mechanism, purview);

    if (mechanism == 0 || purview == 0) {
        result.phi = 0.0;
        result.partitioned = result.unpartitioned;
        return result;
    }

    std::sort(candidates.begin(), candidates.end(),
              [](const Partition& a, const Partition& b) { return canonical_less(a, b); });

    EMDOptions emd_opts = EMDOptions::from(config);
    const Real tol = config.numerical_tolerance;
    bool found = false;

    for (auto& partition : candidates) {
        budget.check("MIP search");

        Repertoire part_rep = partitioned_repertoire(subsystem, direction, partition, purview);
        Real phi = repertoire_distance(config.distance_measure, result.unpartitioned, part_rep,
                                       direction, emd_opts);

        if (!found || phi < result.phi - tol) {
            found = true;
            result.phi = phi;
            result.partition = std::move(partition);
            result.partitioned = std::move(part_rep);
        }

        if (result.phi <= tol) {
            result.phi = 0.0;
            break;
        }
    }

    if (!found) {
        // No admissible partition: the pair cannot be reduced
        result.phi = 0.0;
        result.partitioned = result.unpartitioned;
    }
    return result;
}

/**
 * Find the Minimum Information Partition (MIP) for a mechanism-purview pair.
 *
 * MIP is the partition that minimizes the distance between unpartitioned
 * and partitioned repertoires.
 */
inline MIPResult find_mip(const Subsystem& subsystem, Direction direction, NodeSet mechanism,
                          NodeSet purview, const Config& config,
                          const Budget& budget = Budget()) {
    return find_mip(subsystem, direction, mechanism, purview,
                    mip_partitions(mechanism, purview, config.partition_scheme), config, budget);
}

/**
 * Candidate purviews for a mechanism, in canonical order.
 *
 * Purviews whose connectivity block with the mechanism is reducible have
 * zero phi and are skipped.
 */
inline std::vector<NodeSet> potential_purviews(const Subsystem& subsystem, Direction direction,
                                               NodeSet mechanism) {
    std::vector<NodeSet> purviews;
    for (NodeSet purview : bits::subsets(subsystem.nodes())) {
        bool reducible = direction == Direction::CAUSE
                             ? subsystem.cm().block_reducible(purview, mechanism)
                             : subsystem.cm().block_reducible(mechanism, purview);
        if (!reducible) {
            purviews.push_back(purview);
        }
    }
    return purviews;
}

/**
 * Find the MICE of a mechanism in one direction.
 *
 * Ties between purviews go to the canonically first one (SMALLEST) or to
 * the larger purview (LARGEST). Uncut subsystems store irreducible
 * results in the cache under the configuration's MICE digest; cut
 * subsystems reuse the uncut result when the cut cannot have changed it.
 */
inline MICE find_mice(const Subsystem& subsystem, Direction direction, NodeSet mechanism,
                      const Config& config, const Budget& budget = Budget()) {
    MICE result;
    result.direction = direction;
    result.mechanism = mechanism;

    if (mechanism == 0) {
        return result;
    }

    CacheContext* cache = subsystem.cache();
    CacheKey own{subsystem.parent_id(), CacheKey::Kind::MICE, direction, mechanism, 0,
                 config.mice_digest()};
    if (cache) {
        if (!subsystem.is_cut()) {
            if (auto hit = cache->lookup<MICE>(own, MICE::decode)) return *hit;
        } else if (config.reuse_unaffected_mice) {
            if (auto hit = cache->lookup<MICE>(own, MICE::decode)) {
                if (!hit->damaged_by_cut(subsystem.cut())) {
                    log::message(LogLevel::TRACE, "MICE", [&](std::ostream& os) {
                        os << "reusing " << hit->to_string() << " under "
                           << subsystem.cut().to_string();
                    });
                    return *hit;
                }
            }
        }
    }

    const Real tol = config.numerical_tolerance;
    bool prefer_larger = config.purview_tie_break == PurviewTieBreak::LARGEST;
    result.phi = -1.0;

    for (NodeSet purview : potential_purviews(subsystem, direction, mechanism)) {
        MIPResult mip = find_mip(subsystem, direction, mechanism, purview, config, budget);

        bool better = mip.phi > result.phi + tol;
        bool tie_larger = prefer_larger && std::abs(mip.phi - result.phi) <= tol &&
                          bits::popcount(purview) > bits::popcount(result.purview);

        if (better || tie_larger) {
            result.phi = mip.phi;
            result.purview = purview;
            result.repertoire = std::move(mip.unpartitioned);
            result.partition = std::move(mip.partition);
        }
    }

    if (result.phi < tol) {
        result.phi = 0.0;
    }

    if (cache && !subsystem.is_cut() && result.phi > 0) {
        cache->store(own, result.encode());
    }
    return result;
}

/**
 * Concept (distinction) formed by a mechanism.
 */
struct Concept {
    NodeSet mechanism = 0;
    MICE cause;
    MICE effect;

    Real phi() const {
        return std::min(cause.phi, effect.phi);
    }

    bool is_null(Real tol = EPSILON) const {
        return phi() <= tol;
    }

    std::string to_string() const {
        return "Concept" + bits::to_string(mechanism) + " phi=" + std::to_string(phi()) +
               " cause=" + bits::to_string(cause.purview) +
               " effect=" + bits::to_string(effect.purview);
    }
};

/**
 * Compute the concept of a mechanism.
 *
 * Both directions are searched independently; phi is the smaller of the
 * two. The concept is returned even when reducible (phi = 0).
 */
inline Concept compute_concept(const Subsystem& subsystem, NodeSet mechanism,
                               const Config& config, const Budget& budget = Budget()) {
    config.validate();
    if (mechanism == 0) {
        throw InvalidSubsystemError("empty mechanism");
    }
    if (!bits::is_subset(mechanism, subsystem.nodes())) {
        throw InvalidSubsystemError("mechanism " + bits::to_string(mechanism) +
                                    " is not within " + bits::to_string(subsystem.nodes()));
    }

    Concept cpt;
    cpt.mechanism = mechanism;
    cpt.cause = find_mice(subsystem, Direction::CAUSE, mechanism, config, budget);
    cpt.effect = find_mice(subsystem, Direction::EFFECT, mechanism, config, budget);

    log::message(LogLevel::DEBUG, "Concept", [&](std::ostream& os) {
        os << cpt.to_string();
    });
    return cpt;
}

}  // namespace iit
