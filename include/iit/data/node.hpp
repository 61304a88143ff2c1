#pragma once

#include "iit/core/types.hpp"
#include "iit/data/tpm.hpp"
#include <vector>

namespace iit {

/**
 * Per-node transition table inside a subsystem.
 *
 * Holds P(node = ON at t+1) for every state of the node's inputs within
 * the subsystem, as given by the (possibly cut) connectivity matrix.
 * Background nodes are conditioned on their current state; subsystem
 * nodes that are not inputs, including inputs severed by a cut, are
 * averaged out with a uniform distribution.
 */
class NodeTPM {
public:
    NodeTPM() = default;

    NodeTPM(const TPM& tpm, const ConnectivityMatrix& cm, NodeIndex node,
            NodeSet subsystem, StateIndex system_state)
        : node_(node)
        , inputs_(bits::intersect(cm.inputs_to(node), subsystem))
        , p_on_(state::num_states(bits::popcount(inputs_)))
    {
        NodeSet marginalized = bits::difference(subsystem, inputs_);
        for (StateIndex s = 0; s < p_on_.size(); ++s) {
            StateIndex fixed = (system_state & ~static_cast<StateIndex>(inputs_)) |
                               state::expand_bits(s, inputs_);
            p_on_[s] = tpm.marginal_on(node, marginalized, fixed);
        }
    }

    NodeIndex node() const { return node_; }
    NodeSet inputs() const { return inputs_; }

    // P(ON) given the packed state of inputs()
    Real p_on(StateIndex input_state) const { return p_on_[input_state]; }

    Real prob(StateIndex input_state, uint8_t value) const {
        return value ? p_on_[input_state] : 1.0 - p_on_[input_state];
    }

    /**
     * P(node = value) with the inputs in `fixed_nodes` set from `network_state`
     * and every other input averaged uniformly.
     */
    Real marginal(uint8_t value, NodeSet fixed_nodes, StateIndex network_state) const {
        NodeSet fixed = bits::intersect(inputs_, fixed_nodes);
        NodeSet free = bits::difference(inputs_, fixed_nodes);
        size_t count = state::num_states(bits::popcount(free));

        Real sum = 0.0;
        for (StateIndex fs = 0; fs < count; ++fs) {
            StateIndex full = (network_state & static_cast<StateIndex>(fixed)) |
                              state::expand_bits(fs, free);
            sum += prob(state::extract_bits(full, inputs_), value);
        }
        return sum / static_cast<Real>(count);
    }

private:
    NodeIndex node_ = 0;
    NodeSet inputs_ = 0;
    std::vector<Real> p_on_;
};

}  // namespace iit
