#pragma once

#include "iit/core/types.hpp"
#include "iit/core/config.hpp"
#include "iit/core/budget.hpp"
#include "iit/core/errors.hpp"
#include "iit/core/log.hpp"
#include "iit/data/tpm.hpp"
#include "iit/data/subsystem.hpp"
#include "iit/cache/cache.hpp"
#include "iit/compute/ces.hpp"
#include "iit/compute/big_phi.hpp"
#include "iit/parallel/executor.hpp"
#include <algorithm>
#include <optional>
#include <string>
#include <vector>

namespace iit {

namespace detail {

inline void check_network_state(const Network& network, StateIndex state) {
    if (state >= state::num_states(network.num_nodes())) {
        throw InvalidSubsystemError("state index " + std::to_string(state) + " out of range");
    }
}

// Higher phi first; equal phi goes to the larger system
inline bool outranks(const BigPhiResult& a, const BigPhiResult& b, Real tol) {
    if (!fp::equal(a.phi, b.phi, tol)) return a.phi > b.phi;
    return bits::popcount(a.nodes) > bits::popcount(b.nodes);
}

}  // namespace detail

/**
 * Nodes with at least one input and at least one output. Other nodes have
 * no causal link to the rest of any system they sit in.
 */
inline NodeSet causally_significant_nodes(const ConnectivityMatrix& cm) {
    NodeSet result = 0;
    for (NodeIndex n = 0; n < cm.num_nodes(); ++n) {
        if (cm.inputs_to(n) != 0 && cm.outputs_from(n) != 0) {
            result = bits::add(result, n);
        }
    }
    return result;
}

/**
 * Node sets of every subsystem whose state can be reached, in canonical
 * order.
 */
inline std::vector<NodeSet> subsystems(const Network& network, StateIndex state) {
    detail::check_network_state(network, state);
    std::vector<NodeSet> result;
    for (NodeSet nodes : bits::subsets(network.node_set())) {
        if (network.state_reachable(state, nodes)) {
            result.push_back(nodes);
        }
    }
    return result;
}

/**
 * Candidate complexes: reachable subsystems of the causally significant
 * nodes, largest first.
 */
inline std::vector<NodeSet> possible_complexes(const Network& network, StateIndex state) {
    detail::check_network_state(network, state);
    std::vector<NodeSet> result;
    NodeSet significant = causally_significant_nodes(network.cm());
    if (significant == 0) return result;

    std::vector<NodeSet> candidates = bits::subsets(significant);
    std::reverse(candidates.begin(), candidates.end());
    for (NodeSet nodes : candidates) {
        if (network.state_reachable(state, nodes)) {
            result.push_back(nodes);
        }
    }
    return result;
}

/**
 * Big-Phi of every possible complex, in possible_complexes() order.
 *
 * Subsystems are evaluated on the executor and share `cache` when one is
 * given. The budget covers the whole search.
 */
inline std::vector<BigPhiResult> all_complexes(const Network& network, StateIndex state,
                                               const Config& config, CacheContext* cache,
                                               const Budget& budget) {
    config.validate();
    std::vector<NodeSet> candidates = possible_complexes(network, state);
    std::vector<std::optional<BigPhiResult>> results(candidates.size());

    Executor executor(config);
    executor.run(candidates.size(), [&](size_t i) {
        results[i] = compute_big_phi(network, candidates[i], state, config, cache, budget);
        return false;
    }, budget);

    std::vector<BigPhiResult> out;
    out.reserve(results.size());
    for (auto& r : results) out.push_back(std::move(*r));
    log::message(LogLevel::DEBUG, "Network", [&](std::ostream& os) {
        os << "evaluated " << out.size() << " possible complexes";
    });
    return out;
}

inline std::vector<BigPhiResult> all_complexes(const Network& network, StateIndex state,
                                               const Config& config = Config(),
                                               CacheContext* cache = nullptr) {
    return all_complexes(network, state, config, cache, Budget(config.timeout));
}

// Irreducible possible complexes (Phi > 0)
inline std::vector<BigPhiResult> complexes(const Network& network, StateIndex state,
                                           const Config& config = Config(),
                                           CacheContext* cache = nullptr) {
    std::vector<BigPhiResult> result;
    for (auto& r : all_complexes(network, state, config, cache)) {
        if (!r.is_null(config.numerical_tolerance)) {
            result.push_back(std::move(r));
        }
    }
    return result;
}

/**
 * The complex with the greatest Phi. Ties go to the larger system, then
 * to the one evaluated first. With no irreducible complex the result is
 * null, with an empty node set.
 */
inline BigPhiResult major_complex(const Network& network, StateIndex state,
                                  const Config& config = Config(),
                                  CacheContext* cache = nullptr) {
    std::vector<BigPhiResult> found = complexes(network, state, config, cache);
    if (found.empty()) {
        BigPhiResult none;
        none.state = state;
        return none;
    }
    size_t best = 0;
    for (size_t i = 1; i < found.size(); ++i) {
        if (detail::outranks(found[i], found[best], config.numerical_tolerance)) {
            best = i;
        }
    }
    log::message(LogLevel::INFO, "Network", [&](std::ostream& os) {
        os << "major complex " << bits::to_string(found[best].nodes)
           << " Phi=" << found[best].phi;
    });
    return std::move(found[best]);
}

/**
 * Maximal non-overlapping complexes: complexes in descending order, each
 * kept unless it shares a node with one kept before it.
 */
inline std::vector<BigPhiResult> condensed(const Network& network, StateIndex state,
                                           const Config& config = Config(),
                                           CacheContext* cache = nullptr) {
    std::vector<BigPhiResult> found = complexes(network, state, config, cache);
    const Real tol = config.numerical_tolerance;
    std::stable_sort(found.begin(), found.end(), [tol](const BigPhiResult& a,
                                                       const BigPhiResult& b) {
        return detail::outranks(a, b, tol);
    });

    std::vector<BigPhiResult> result;
    NodeSet covered = 0;
    for (auto& r : found) {
        if (bits::intersect(r.nodes, covered) == 0) {
            covered |= r.nodes;
            result.push_back(std::move(r));
        }
    }
    return result;
}

/**
 * Conceptual information of a subsystem: the distance from its CES to the
 * empty CES.
 */
inline Real conceptual_info(const Network& network, NodeSet nodes, StateIndex state,
                            const Config& config = Config(), CacheContext* cache = nullptr) {
    config.validate();
    Budget budget(config.timeout);
    Subsystem subsystem(network, nodes, state, SystemCut(), cache);
    CES ces = compute_ces(subsystem, config, budget);
    return ces_distance(ces, CES(), subsystem, subsystem, config);
}

}  // namespace iit
