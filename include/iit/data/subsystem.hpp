#pragma once

#include "iit/core/types.hpp"
#include "iit/core/errors.hpp"
#include "iit/data/tpm.hpp"
#include "iit/data/node.hpp"
#include "iit/data/repertoire.hpp"
#include "iit/partition/partition.hpp"
#include "iit/partition/system_cut.hpp"
#include "iit/cache/cache.hpp"
#include <string>
#include <vector>

namespace iit {

/**
 * Subsystem representing a subset of nodes in a specific state.
 *
 * This is the main computation context for repertoires and phi values.
 * Background nodes (outside the subsystem) are fixed at their current
 * state. An optional system cut removes the severed edges from the
 * connectivity matrix; every repertoire is then computed under the cut.
 *
 * A Subsystem is an immutable view: the Network and the optional
 * CacheContext must outlive it.
 */
class Subsystem {
public:
    Subsystem(const Network& network, NodeSet nodes, StateIndex system_state,
              SystemCut cut = SystemCut(), CacheContext* cache = nullptr)
        : network_(&network)
        , nodes_(nodes)
        , system_state_(system_state)
        , cut_(cut)
        , cache_(cache)
    {
        validate();
        cm_ = cut_.apply(network.cm());
        node_tpms_.resize(network.num_nodes());
        bits::for_each(nodes_, [&](NodeIndex n) {
            node_tpms_[n] = NodeTPM(network.tpm(), cm_, n, nodes_, system_state_);
        });

        parent_id_ = hash::combine(network.id(), nodes_);
        parent_id_ = hash::combine(parent_id_, system_state_);
        id_ = hash::combine(parent_id_, cut_.from_nodes);
        id_ = hash::combine(id_, cut_.to_nodes);
    }

    const Network& network() const { return *network_; }
    const TPM& tpm() const { return network_->tpm(); }
    const ConnectivityMatrix& cm() const { return cm_; }
    NodeSet nodes() const { return nodes_; }
    StateIndex state() const { return system_state_; }
    size_t size() const { return bits::popcount(nodes_); }
    const SystemCut& cut() const { return cut_; }
    bool is_cut() const { return !cut_.is_null(); }
    CacheContext* cache() const { return cache_; }
    const NodeTPM& node_tpm(NodeIndex node) const { return node_tpms_[node]; }

    // Identity of this subsystem, including its cut
    uint64_t id() const { return id_; }
    // Identity of the same subsystem without a cut
    uint64_t parent_id() const { return parent_id_; }

    // Same nodes and state under another cut, sharing the cache
    Subsystem apply_cut(const SystemCut& cut) const {
        return Subsystem(*network_, nodes_, system_state_, cut, cache_);
    }

    /**
     * Cause repertoire: distribution over past purview states given the
     * mechanism in its current state. Product over mechanism nodes of
     * P(node state | purview state), normalized.
     */
    Repertoire cause_repertoire(NodeSet mechanism, NodeSet purview) const {
        check_subset(mechanism, purview);
        if (purview == 0) {
            return Repertoire();
        }
        if (mechanism == 0) {
            return Repertoire::max_entropy(purview);
        }
        return cached(Direction::CAUSE, mechanism, purview, [&] {
            Repertoire result = Repertoire::max_entropy(purview);
            bits::for_each(mechanism, [&](NodeIndex m) {
                Repertoire single = single_node_cause_repertoire(m, purview);
                for (StateIndex s = 0; s < result.num_states(); ++s) {
                    result[s] *= single[s];
                }
            });
            result.normalize();
            return result;
        });
    }

    /**
     * Effect repertoire: distribution over next purview states given the
     * mechanism in its current state. Product over purview nodes.
     */
    Repertoire effect_repertoire(NodeSet mechanism, NodeSet purview) const {
        check_subset(mechanism, purview);
        if (purview == 0) {
            return Repertoire();
        }
        return cached(Direction::EFFECT, mechanism, purview, [&] {
            Repertoire result;
            bits::for_each(purview, [&](NodeIndex p) {
                result = Repertoire::product(result, single_node_effect_repertoire(p, mechanism));
            });
            return result;
        });
    }

    Repertoire repertoire(Direction dir, NodeSet mechanism, NodeSet purview) const {
        if (dir == Direction::CAUSE) {
            return cause_repertoire(mechanism, purview);
        }
        return effect_repertoire(mechanism, purview);
    }

    Repertoire unconstrained_cause_repertoire(NodeSet purview) const {
        return cause_repertoire(0, purview);
    }

    Repertoire unconstrained_effect_repertoire(NodeSet purview) const {
        return effect_repertoire(0, purview);
    }

    Repertoire unconstrained_repertoire(Direction dir, NodeSet purview) const {
        return repertoire(dir, 0, purview);
    }

    /**
     * Product of the repertoires of each part of the partition.
     */
    Repertoire partitioned_repertoire(Direction dir, const Partition& partition) const {
        Repertoire result;
        for (const auto& part : partition.parts) {
            if (part.purview == 0) continue;
            result = Repertoire::product(result, repertoire(dir, part.mechanism, part.purview));
        }
        return result;
    }

    std::string to_string() const {
        std::string out = "Subsystem" + bits::to_string(nodes_) + " in state " +
                          state::to_string(system_state_, network_->num_nodes());
        if (is_cut()) out += " cut " + cut_.to_string();
        return out;
    }

private:
    const Network* network_;
    NodeSet nodes_;
    StateIndex system_state_;
    SystemCut cut_;
    CacheContext* cache_;
    ConnectivityMatrix cm_;
    std::vector<NodeTPM> node_tpms_;
    uint64_t id_ = 0;
    uint64_t parent_id_ = 0;

    void validate() const {
        size_t n = network_->num_nodes();
        if (nodes_ == 0) {
            throw InvalidSubsystemError("empty node set");
        }
        if (!bits::is_subset(nodes_, network_->node_set())) {
            throw InvalidSubsystemError("nodes " + bits::to_string(nodes_) +
                                        " out of range for a " + std::to_string(n) +
                                        "-node network");
        }
        if (system_state_ >= state::num_states(n)) {
            throw InvalidSubsystemError("state index " + std::to_string(system_state_) +
                                        " out of range");
        }
        if (!bits::is_subset(cut_.from_nodes | cut_.to_nodes, nodes_)) {
            throw InvalidSubsystemError("cut " + cut_.to_string() +
                                        " is not within the subsystem");
        }
        if (!network_->state_reachable(system_state_, nodes_)) {
            throw InvalidSubsystemError("state " + state::to_string(system_state_, n) +
                                        " cannot be reached by " + bits::to_string(nodes_));
        }
    }

    void check_subset(NodeSet mechanism, NodeSet purview) const {
        if (!bits::is_subset(mechanism | purview, nodes_)) {
            throw std::invalid_argument("mechanism " + bits::to_string(mechanism) +
                                        " / purview " + bits::to_string(purview) +
                                        " not within subsystem " + bits::to_string(nodes_));
        }
    }

    template<typename Compute>
    Repertoire cached(Direction dir, NodeSet mechanism, NodeSet purview, Compute&& compute) const {
        if (!cache_) return compute();

        CacheKey key{id_, CacheKey::Kind::REPERTOIRE, dir, mechanism, purview};
        if (auto hit = cache_->get_repertoire(key)) {
            return *hit;
        }
        Repertoire result = compute();
        cache_->put_repertoire(key, result);
        return result;
    }

    /**
     * P(mech_node = current state | purview state), as a function over the
     * purview. Inputs outside the purview are averaged uniformly; purview
     * nodes that are not inputs leave the factor flat.
     */
    Repertoire single_node_cause_repertoire(NodeIndex mech_node, NodeSet purview) const {
        const NodeTPM& node = node_tpms_[mech_node];
        uint8_t mech_state = state::get_bit(system_state_, mech_node);

        NodeSet effective_purview = bits::intersect(node.inputs(), purview);
        Repertoire eff_result(effective_purview);
        for (StateIndex eps = 0; eps < eff_result.num_states(); ++eps) {
            StateIndex assignment = state::expand_bits(eps, effective_purview);
            eff_result[eps] = node.marginal(mech_state, effective_purview, assignment);
        }

        if (effective_purview == purview) {
            return eff_result;
        }
        return eff_result.expand(purview);
    }

    /**
     * Next-state distribution of one purview node with its mechanism
     * inputs fixed at their current state and other inputs averaged.
     */
    Repertoire single_node_effect_repertoire(NodeIndex purview_node, NodeSet mechanism) const {
        const NodeTPM& node = node_tpms_[purview_node];
        Real p_on = node.marginal(1, mechanism, system_state_);
        return Repertoire(bits::add(0, purview_node), {1.0 - p_on, p_on});
    }
};

}  // namespace iit
