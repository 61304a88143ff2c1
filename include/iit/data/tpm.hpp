#pragma once

#include "iit/core/types.hpp"
#include "iit/core/errors.hpp"
#include <vector>
#include <stdexcept>
#include <string>
#include <cmath>
#include <algorithm>
#include <utility>

namespace iit {

/**
 * Transition Probability Matrix in state-by-node format.
 *
 * Storage: Flat array of size 2^n * n
 * Layout: tpm[state * n + node] = P(node = ON at t+1 | state at t)
 *
 * State indexing is little-endian: state = s0 + 2*s1 + 4*s2 + ...
 * where s0 is the state of node 0, etc.
 */
class TPM {
public:
    TPM() : num_nodes_(0), num_states_(0) {}

    explicit TPM(size_t num_nodes)
        : num_nodes_(checked_size(num_nodes))
        , num_states_(state::num_states(num_nodes))
        , data_(num_states_ * num_nodes, 0.0)
    {}

    TPM(size_t num_nodes, std::vector<Real>&& data)
        : num_nodes_(checked_size(num_nodes))
        , num_states_(state::num_states(num_nodes))
        , data_(std::move(data))
    {
        if (data_.size() != num_states_ * num_nodes_) {
            throw std::invalid_argument("TPM data size mismatch");
        }
    }

    /**
     * Build from a 2^n x 2^n state-by-state matrix (row-major, rows are
     * current states, columns next states).
     *
     * Rows must sum to 1 and factor into independent per-node marginals,
     * both within tol; otherwise InvalidTPMError.
     */
    static TPM from_state_by_state(size_t num_nodes, const std::vector<Real>& sbs,
                                   Real tol = EPSILON) {
        checked_size(num_nodes);
        size_t ns = state::num_states(num_nodes);
        if (sbs.size() != ns * ns) {
            throw std::invalid_argument("state-by-state TPM size mismatch");
        }

        TPM result(num_nodes);
        for (StateIndex row = 0; row < ns; ++row) {
            const Real* r = &sbs[row * ns];
            Real total = 0.0;
            for (StateIndex col = 0; col < ns; ++col) {
                if (!std::isfinite(r[col]) || r[col] < -tol) {
                    throw InvalidTPMError("entry (" + std::to_string(row) + ", " +
                                          std::to_string(col) + ") is not a probability");
                }
                total += r[col];
            }
            if (!fp::equal(total, 1.0, tol)) {
                throw InvalidTPMError("row " + std::to_string(row) + " sums to " +
                                      std::to_string(total));
            }

            for (NodeIndex node = 0; node < num_nodes; ++node) {
                Real p_on = 0.0;
                for (StateIndex col = 0; col < ns; ++col) {
                    if (state::get_bit(col, node)) p_on += r[col];
                }
                result(row, node) = p_on;
            }

            // Conditional independence: the row is the product of its marginals
            for (StateIndex col = 0; col < ns; ++col) {
                Real product = 1.0;
                for (NodeIndex node = 0; node < num_nodes; ++node) {
                    product *= result.prob(row, node, state::get_bit(col, node));
                }
                if (!fp::equal(product, r[col], tol)) {
                    throw InvalidTPMError("row " + std::to_string(row) +
                                          " is not conditionally independent");
                }
            }
        }
        return result;
    }

    size_t num_nodes() const { return num_nodes_; }
    size_t num_states() const { return num_states_; }
    size_t size() const { return data_.size(); }

    // Access probability: P(node = ON | state)
    Real& operator()(StateIndex state, NodeIndex node) {
        return data_[state * num_nodes_ + node];
    }

    Real operator()(StateIndex state, NodeIndex node) const {
        return data_[state * num_nodes_ + node];
    }

    // Get probability that node takes value 'value' given state
    Real prob(StateIndex state, NodeIndex node, uint8_t value) const {
        Real p_on = (*this)(state, node);
        return value ? p_on : (1.0 - p_on);
    }

    const std::vector<Real>& vec() const { return data_; }

    /**
     * Probability that node is ON at t+1 when the nodes in `marginalized`
     * are averaged uniformly and every other node is fixed to its bit in
     * fixed_state.
     */
    Real marginal_on(NodeIndex node, NodeSet marginalized, StateIndex fixed_state) const {
        size_t count = state::num_states(bits::popcount(marginalized));
        Real sum = 0.0;
        for (StateIndex ms = 0; ms < count; ++ms) {
            StateIndex full = (fixed_state & ~static_cast<StateIndex>(marginalized)) |
                              state::expand_bits(ms, marginalized);
            sum += (*this)(full, node);
        }
        return sum / static_cast<Real>(count);
    }

    /**
     * Marginal conditional distribution over the states of `target` at t+1,
     * given fixed_state for every node outside `marginalized`.
     *
     * Nodes are conditionally independent, so this is the product of the
     * per-node marginals, indexed little-endian over target nodes.
     */
    std::vector<Real> conditional_distribution(NodeSet target, NodeSet marginalized,
                                               StateIndex fixed_state) const {
        std::vector<NodeIndex> nodes = bits::to_vector(target);
        std::vector<Real> p_on(nodes.size());
        for (size_t i = 0; i < nodes.size(); ++i) {
            p_on[i] = marginal_on(nodes[i], marginalized, fixed_state);
        }

        std::vector<Real> dist(state::num_states(nodes.size()), 1.0);
        for (StateIndex s = 0; s < dist.size(); ++s) {
            for (size_t i = 0; i < nodes.size(); ++i) {
                dist[s] *= ((s >> i) & 1) ? p_on[i] : (1.0 - p_on[i]);
            }
        }
        return dist;
    }

    /**
     * Throw InvalidTPMError unless every entry is a finite probability.
     */
    void validate(Real tol = EPSILON) const {
        if (data_.size() != num_states_ * num_nodes_) {
            throw InvalidTPMError("data size does not match node count");
        }
        for (size_t i = 0; i < data_.size(); ++i) {
            Real p = data_[i];
            if (!std::isfinite(p) || p < -tol || p > 1.0 + tol) {
                throw InvalidTPMError("P(node " + std::to_string(i % num_nodes_) +
                                      " | state " + std::to_string(i / num_nodes_) +
                                      ") = " + std::to_string(p) + " is not in [0, 1]");
            }
        }
    }

    // All probabilities are 0 or 1
    bool is_deterministic() const {
        for (Real p : data_) {
            if (!fp::is_zero(p) && !fp::equal(p, 1.0)) return false;
        }
        return true;
    }

private:
    size_t num_nodes_;
    StateIndex num_states_;
    std::vector<Real> data_;

    static size_t checked_size(size_t num_nodes) {
        if (num_nodes > MAX_NODES) {
            throw std::invalid_argument("TPM supports at most " + std::to_string(MAX_NODES) +
                                        " nodes");
        }
        return num_nodes;
    }
};

/**
 * Connectivity Matrix representing network structure.
 *
 * cm(i, j) = 1 if there is an edge from node i to node j.
 */
class ConnectivityMatrix {
public:
    ConnectivityMatrix() : num_nodes_(0) {}

    explicit ConnectivityMatrix(size_t num_nodes)
        : num_nodes_(num_nodes)
        , data_(num_nodes * num_nodes, 0)
    {}

    ConnectivityMatrix(size_t num_nodes, const std::vector<uint8_t>& data)
        : num_nodes_(num_nodes)
        , data_(data)
    {
        if (data_.size() != num_nodes * num_nodes) {
            throw std::invalid_argument("CM data size mismatch");
        }
    }

    // Every edge present, including self-loops
    static ConnectivityMatrix fully_connected(size_t num_nodes) {
        return ConnectivityMatrix(num_nodes, std::vector<uint8_t>(num_nodes * num_nodes, 1));
    }

    size_t num_nodes() const { return num_nodes_; }

    uint8_t& operator()(NodeIndex from, NodeIndex to) {
        return data_[from * num_nodes_ + to];
    }

    uint8_t operator()(NodeIndex from, NodeIndex to) const {
        return data_[from * num_nodes_ + to];
    }

    NodeSet inputs_to(NodeIndex node) const {
        NodeSet result = 0;
        for (NodeIndex i = 0; i < num_nodes_; ++i) {
            if ((*this)(i, node)) {
                result = bits::add(result, i);
            }
        }
        return result;
    }

    NodeSet outputs_from(NodeIndex node) const {
        NodeSet result = 0;
        for (NodeIndex j = 0; j < num_nodes_; ++j) {
            if ((*this)(node, j)) {
                result = bits::add(result, j);
            }
        }
        return result;
    }

    // Any edge from a node in `from` to a node in `to`
    bool any_edge(NodeSet from, NodeSet to) const {
        bool found = false;
        bits::for_each(from, [&](NodeIndex f) {
            if (bits::intersect(outputs_from(f), to)) found = true;
        });
        return found;
    }

    /**
     * True if the edges from `from` to `to` cannot support an irreducible
     * mechanism-purview pair: some source has no edge into `to`, some
     * target has no edge from `from`, or the bipartite block of edges
     * splits into independent components.
     */
    bool block_reducible(NodeSet from, NodeSet to) const {
        if (from == 0 || to == 0) return false;

        NodeSet reached_to = 0;
        NodeSet reached_from = 0;
        bool missing = false;
        bits::for_each(from, [&](NodeIndex f) {
            NodeSet out = bits::intersect(outputs_from(f), to);
            if (out == 0) missing = true;
            reached_to |= out;
        });
        if (missing || reached_to != to) return true;

        // Connected components of the bipartite graph from -> to
        NodeIndex start = bits::lowest_bit(from);
        reached_from = bits::add(0, start);
        reached_to = 0;
        bool grew = true;
        while (grew) {
            grew = false;
            bits::for_each(reached_from, [&](NodeIndex f) {
                NodeSet out = bits::intersect(outputs_from(f), to);
                if (bits::difference(out, reached_to)) {
                    reached_to |= out;
                    grew = true;
                }
            });
            bits::for_each(reached_to, [&](NodeIndex t) {
                NodeSet in = bits::intersect(inputs_to(t), from);
                if (bits::difference(in, reached_from)) {
                    reached_from |= in;
                    grew = true;
                }
            });
        }
        return reached_from != from || reached_to != to;
    }

    /**
     * Strong connectivity of the subgraph induced by `nodes`.
     *
     * A single node is strongly connected; the empty set is not.
     */
    bool is_strongly_connected(NodeSet nodes) const {
        if (nodes == 0) return false;
        NodeIndex start = bits::lowest_bit(nodes);
        auto reach = [&](bool forward) {
            NodeSet seen = bits::add(0, start);
            NodeSet frontier = seen;
            while (frontier) {
                NodeSet next = 0;
                bits::for_each(frontier, [&](NodeIndex n) {
                    next |= forward ? outputs_from(n) : inputs_to(n);
                });
                next = bits::difference(bits::intersect(next, nodes), seen);
                seen |= next;
                frontier = next;
            }
            return seen;
        };
        return reach(true) == nodes && reach(false) == nodes;
    }

    // Copy with every edge from `from` to `to` removed
    ConnectivityMatrix without_edges(NodeSet from, NodeSet to) const {
        ConnectivityMatrix result = *this;
        bits::for_each(from, [&](NodeIndex f) {
            bits::for_each(to, [&](NodeIndex t) { result(f, t) = 0; });
        });
        return result;
    }

    // Existing edges from `from` to `to`, in (from, to) order
    std::vector<std::pair<NodeIndex, NodeIndex>> edges_between(NodeSet from, NodeSet to) const {
        std::vector<std::pair<NodeIndex, NodeIndex>> result;
        bits::for_each(from, [&](NodeIndex f) {
            bits::for_each(to, [&](NodeIndex t) {
                if ((*this)(f, t)) result.emplace_back(f, t);
            });
        });
        return result;
    }

    const std::vector<uint8_t>& vec() const { return data_; }

private:
    size_t num_nodes_;
    std::vector<uint8_t> data_;
};

/**
 * Network combining TPM and connectivity matrix.
 *
 * Immutable once built. id() is a hash of the TPM and CM contents, stable
 * across processes, and is what cache keys refer to.
 */
class Network {
public:
    Network() = default;

    Network(TPM tpm, ConnectivityMatrix cm, Real tol = EPSILON)
        : tpm_(std::move(tpm))
        , cm_(std::move(cm))
    {
        if (tpm_.num_nodes() != cm_.num_nodes()) {
            throw std::invalid_argument("TPM and CM node count mismatch");
        }
        tpm_.validate(tol);

        id_ = hash::fnv1a(tpm_.vec().data(), tpm_.vec().size() * sizeof(Real));
        id_ = hash::fnv1a(cm_.vec().data(), cm_.vec().size(), id_);
        id_ = hash::combine(id_, tpm_.num_nodes());
    }

    const TPM& tpm() const { return tpm_; }
    const ConnectivityMatrix& cm() const { return cm_; }
    size_t num_nodes() const { return tpm_.num_nodes(); }
    NodeSet node_set() const { return bits::full_set(num_nodes()); }
    uint64_t id() const { return id_; }

    /**
     * Whether some state of `nodes` at t-1 can lead to `current` on `nodes`,
     * with every other node held at its value in `current`.
     */
    bool state_reachable(StateIndex current, NodeSet nodes) const {
        StateIndex background = current & ~static_cast<StateIndex>(nodes);
        for (StateIndex free = 0; free < state::num_states(bits::popcount(nodes)); ++free) {
            StateIndex prev = background | state::expand_bits(free, nodes);
            bool possible = true;
            bits::for_each(nodes, [&](NodeIndex n) {
                if (possible && fp::is_zero(tpm_.prob(prev, n, state::get_bit(current, n)))) {
                    possible = false;
                }
            });
            if (possible) return true;
        }
        return false;
    }

private:
    TPM tpm_;
    ConnectivityMatrix cm_;
    uint64_t id_ = 0;
};

}  // namespace iit
