#pragma once

#include "iit/core/types.hpp"
#include "iit/core/config.hpp"
#include "iit/core/budget.hpp"
#include "iit/core/errors.hpp"
#include "iit/core/log.hpp"
#include "iit/data/repertoire.hpp"
#include "iit/data/subsystem.hpp"
#include "iit/metrics/emd.hpp"
#include "iit/compute/small_phi.hpp"
#include "iit/parallel/executor.hpp"
#include <algorithm>
#include <optional>
#include <stdexcept>
#include <vector>

namespace iit {

/**
 * Cause-Effect Structure (CES): the irreducible concepts of a subsystem,
 * in canonical mechanism order.
 */
class CES {
public:
    CES() = default;

    void add(Concept&& cpt) {
        concepts_.push_back(std::move(cpt));
    }

    void add(const Concept& cpt) {
        concepts_.push_back(cpt);
    }

    const std::vector<Concept>& concepts() const { return concepts_; }
    size_t size() const { return concepts_.size(); }
    bool empty() const { return concepts_.empty(); }

    const Concept& operator[](size_t i) const { return concepts_[i]; }

    const Concept* find(NodeSet mechanism) const {
        for (const auto& c : concepts_) {
            if (c.mechanism == mechanism) return &c;
        }
        return nullptr;
    }

    std::vector<NodeSet> mechanisms() const {
        std::vector<NodeSet> result;
        result.reserve(concepts_.size());
        for (const auto& c : concepts_) result.push_back(c.mechanism);
        return result;
    }

    // Total phi (sum of concept phis)
    Real total_phi() const {
        Real total = 0.0;
        for (const auto& c : concepts_) {
            total += c.phi();
        }
        return total;
    }

private:
    std::vector<Concept> concepts_;
};

/**
 * Compute the concepts of the given mechanisms and keep the irreducible
 * ones. Mechanisms are evaluated on the executor; the CES keeps the order
 * they were given in.
 */
inline CES compute_ces(const Subsystem& subsystem, const std::vector<NodeSet>& mechanisms,
                       const Config& config, const Budget& budget = Budget()) {
    std::vector<std::optional<Concept>> concepts(mechanisms.size());
    Executor executor(config);

    executor.run(mechanisms.size(), [&](size_t i) {
        try {
            concepts[i] = compute_concept(subsystem, mechanisms[i], config, budget);
        } catch (const NumericalInstabilityError& e) {
            log::message(LogLevel::ERROR, "CES", [&](std::ostream& os) {
                os << "mechanism " << bits::to_string(mechanisms[i]) << " of "
                   << subsystem.to_string() << ": " << e.what();
            });
            throw;
        }
        return false;
    }, budget);

    CES ces;
    for (auto& c : concepts) {
        if (c && !c->is_null(config.numerical_tolerance)) {
            ces.add(std::move(*c));
        }
    }
    return ces;
}

/**
 * Compute the Cause-Effect Structure for a subsystem.
 *
 * Enumerates all non-empty mechanisms in canonical order.
 */
inline CES compute_ces(const Subsystem& subsystem, const Config& config,
                       const Budget& budget = Budget()) {
    return compute_ces(subsystem, bits::subsets(subsystem.nodes()), config, budget);
}

/**
 * Extend a concept repertoire to a wider purview. The added nodes take
 * their unconstrained distribution in the given subsystem: uniform for
 * causes, the unconstrained effect repertoire for effects.
 */
inline Repertoire expand_repertoire(const Repertoire& rep, NodeSet new_purview, Direction dir,
                                    const Subsystem& subsystem) {
    if (new_purview == rep.purview()) return rep;
    if (!bits::is_subset(rep.purview(), new_purview)) {
        throw std::invalid_argument("cannot expand " + bits::to_string(rep.purview()) +
                                    " to " + bits::to_string(new_purview));
    }

    NodeSet added = bits::difference(new_purview, rep.purview());
    Repertoire filler = dir == Direction::EFFECT ? subsystem.unconstrained_effect_repertoire(added)
                                                 : Repertoire::max_entropy(added);
    return Repertoire::product(rep, filler).normalized();
}

namespace detail {

// Hamming EMD between two repertoires of one direction over their joint purview
inline Real aligned_emd(const MICE& a, const MICE& b, const Subsystem& sa, const Subsystem& sb,
                        Direction dir, const EMDOptions& opts) {
    NodeSet joint = bits::unite(a.purview, b.purview);
    return hamming_emd(expand_repertoire(a.repertoire, joint, dir, sa),
                       expand_repertoire(b.repertoire, joint, dir, sb), opts);
}

}  // namespace detail

/**
 * Distance between two concepts in concept space: cause EMD plus effect
 * EMD, each over the union of the two purviews.
 */
inline Real concept_distance(const Concept& c1, const Concept& c2,
                             const Subsystem& subsystem1, const Subsystem& subsystem2,
                             const EMDOptions& opts = EMDOptions{}) {
    return detail::aligned_emd(c1.cause, c2.cause, subsystem1, subsystem2, Direction::CAUSE,
                               opts) +
           detail::aligned_emd(c1.effect, c2.effect, subsystem1, subsystem2, Direction::EFFECT,
                               opts);
}

/**
 * Distance from a concept to the null concept, whose repertoires are the
 * unconstrained ones of the concept's subsystem.
 */
inline Real null_concept_distance(const Concept& c, const Subsystem& subsystem,
                                  const EMDOptions& opts = EMDOptions{}) {
    Real cause = hamming_emd(c.cause.repertoire, Repertoire::max_entropy(c.cause.purview), opts);
    Real effect = hamming_emd(c.effect.repertoire,
                              subsystem.unconstrained_effect_repertoire(c.effect.purview), opts);
    return cause + effect;
}

// Same mechanism, phi and purviews, and zero distance in concept space
inline bool concepts_equal(const Concept& c1, const Concept& c2,
                           const Subsystem& subsystem1, const Subsystem& subsystem2,
                           const EMDOptions& opts = EMDOptions{}) {
    return c1.mechanism == c2.mechanism && fp::equal(c1.phi(), c2.phi(), opts.tolerance) &&
           c1.cause.purview == c2.cause.purview && c1.effect.purview == c2.effect.purview &&
           concept_distance(c1, c2, subsystem1, subsystem2, opts) < opts.tolerance;
}

/**
 * Extended EMD between the unpartitioned CES (ces1, concepts of
 * subsystem1) and the partitioned CES (ces2, concepts of the cut
 * subsystem2).
 *
 * Concepts present in both cancel. Each remaining concept is a site
 * holding its phi; a null-concept site takes up the difference in total
 * phi. Mass moves only between the two structures or through the null
 * concept, at concept-space distance.
 */
inline Real ces_distance_xemd(const CES& ces1, const CES& ces2,
                              const Subsystem& subsystem1, const Subsystem& subsystem2,
                              const EMDOptions& opts = EMDOptions{}) {
    struct Site {
        const Concept* cpt;
        const Subsystem* subsystem;
        int side;  // 1 unpartitioned, 2 partitioned
    };
    std::vector<Site> sites;
    std::vector<bool> paired(ces2.size(), false);

    for (const auto& c : ces1.concepts()) {
        bool kept = false;
        for (size_t j = 0; j < ces2.size() && !kept; ++j) {
            if (concepts_equal(c, ces2[j], subsystem1, subsystem2, opts)) {
                kept = true;
                paired[j] = true;
            }
        }
        if (!kept) sites.push_back({&c, &subsystem1, 1});
    }
    const size_t destroyed = sites.size();
    for (size_t j = 0; j < ces2.size(); ++j) {
        if (!paired[j]) sites.push_back({&ces2[j], &subsystem2, 2});
    }
    const size_t created = sites.size() - destroyed;

    // One-sided change: every unmatched concept goes to the null concept
    if (destroyed == 0 || created == 0) {
        Real dist = 0.0;
        for (const auto& s : sites) {
            dist += s.cpt->phi() * null_concept_distance(*s.cpt, *s.subsystem, opts);
        }
        return dist;
    }

    const size_t n = sites.size() + 1;
    const size_t null_site = n - 1;
    std::vector<Real> cost(n * n, 0.0);
    std::vector<bool> blocked(n * n, false);
    Real furthest = 0.0;

    auto set_cost = [&](size_t i, size_t j, Real d) {
        cost[i * n + j] = d;
        cost[j * n + i] = d;
        furthest = std::max(furthest, d);
    };

    for (size_t i = 0; i < sites.size(); ++i) {
        set_cost(i, null_site,
                 null_concept_distance(*sites[i].cpt, *sites[i].subsystem, opts));
        for (size_t j = 0; j < sites.size(); ++j) {
            if (sites[i].side == sites[j].side) {
                blocked[i * n + j] = true;
            } else if (sites[i].side == 1) {
                set_cost(i, j, concept_distance(*sites[i].cpt, *sites[j].cpt,
                                                subsystem1, subsystem2, opts));
            }
        }
    }
    // No mass moves within one structure
    for (size_t k = 0; k < cost.size(); ++k) {
        if (blocked[k]) cost[k] = furthest + 1.0;
    }

    std::vector<Real> supply(n, 0.0);
    std::vector<Real> demand(n, 0.0);
    for (size_t i = 0; i < sites.size(); ++i) {
        (sites[i].side == 1 ? supply : demand)[i] = sites[i].cpt->phi();
    }
    Real before = 0.0, after = 0.0;
    for (size_t i = 0; i < sites.size(); ++i) {
        before += supply[i];
        after += demand[i];
    }
    if (before >= after) {
        demand[null_site] = before - after;
    } else {
        supply[null_site] = after - before;
    }

    return exact_emd_ssp(supply, demand, cost, n, opts.tolerance);
}

// Difference of the summed small phi of the two structures
inline Real ces_distance_sum_small_phi(const CES& ces1, const CES& ces2) {
    return ces1.total_phi() - ces2.total_phi();
}

/**
 * Distance between the unpartitioned and the partitioned CES, by the
 * configured measure.
 */
inline Real ces_distance(const CES& ces1, const CES& ces2, const Subsystem& subsystem1,
                         const Subsystem& subsystem2, const Config& config) {
    switch (config.ces_distance) {
        case CESDistance::XEMD:
            return ces_distance_xemd(ces1, ces2, subsystem1, subsystem2,
                                     EMDOptions::from(config));
        case CESDistance::SUM_SMALL_PHI:
            return ces_distance_sum_small_phi(ces1, ces2);
    }
    throw std::logic_error("unhandled CES distance");
}

}  // namespace iit
