#pragma once

#include "iit/core/types.hpp"
#include "iit/data/tpm.hpp"
#include <algorithm>
#include <set>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace iit {

/**
 * System-level cut for Big-Phi computation.
 *
 * Represents severing connections from 'from_nodes' to 'to_nodes'.
 * The default-constructed cut is the null cut, which severs nothing.
 */
struct SystemCut {
    NodeSet from_nodes;
    NodeSet to_nodes;

    SystemCut() : from_nodes(0), to_nodes(0) {}
    SystemCut(NodeSet from, NodeSet to) : from_nodes(from), to_nodes(to) {}

    bool is_null() const {
        return from_nodes == 0 || to_nodes == 0;
    }

    // Whether the connection from -> to is severed
    bool is_cut(NodeIndex from, NodeIndex to) const {
        return bits::contains(from_nodes, from) && bits::contains(to_nodes, to);
    }

    // Whether any connection from a node in `from` to a node in `to` is severed
    bool cuts_connections(NodeSet from, NodeSet to) const {
        return bits::intersect(from, from_nodes) != 0 && bits::intersect(to, to_nodes) != 0;
    }

    // Whether the cut runs through the mechanism itself
    bool splits_mechanism(NodeSet mechanism) const {
        return cuts_connections(mechanism, mechanism);
    }

    ConnectivityMatrix apply(const ConnectivityMatrix& cm) const {
        if (is_null()) return cm;
        return cm.without_edges(from_nodes, to_nodes);
    }

    bool operator==(const SystemCut& other) const {
        return from_nodes == other.from_nodes && to_nodes == other.to_nodes;
    }

    bool operator!=(const SystemCut& other) const { return !(*this == other); }

    std::string to_string() const {
        if (is_null()) return "null cut";
        return bits::to_string(from_nodes) + " -/-> " + bits::to_string(to_nodes);
    }
};

/**
 * Canonical cut order: increasing size of the smaller group, then
 * lexicographic from_nodes, then lexicographic to_nodes.
 */
inline bool canonical_less(const SystemCut& a, const SystemCut& b) {
    size_t sa = std::min(bits::popcount(a.from_nodes), bits::popcount(a.to_nodes));
    size_t sb = std::min(bits::popcount(b.from_nodes), bits::popcount(b.to_nodes));
    if (sa != sb) return sa < sb;
    if (a.from_nodes != b.from_nodes) return bits::lex_less(a.from_nodes, b.from_nodes);
    return bits::lex_less(a.to_nodes, b.to_nodes);
}

/**
 * Lazily enumerates the directional cuts of a node set: for each of the
 * 2^(n-1) - 1 undirected bipartitions {A, B} with both sides non-empty,
 * first A -> B and then B -> A.
 *
 * Single pass: once next() returns nullopt the generator is spent.
 */
class SystemCutGenerator {
public:
    explicit SystemCutGenerator(NodeSet nodes)
        : nodes_(nodes)
        , node_vec_(bits::to_vector(nodes))
        , end_(node_vec_.empty() ? 1 : size_t{1} << (node_vec_.size() - 1))
    {}

    // Number of cuts the generator yields in total
    size_t size() const { return 2 * (end_ - 1); }

    std::optional<SystemCut> next() {
        if (idx_ >= end_) return std::nullopt;

        NodeSet a = 0;
        for (size_t j = 0; j < node_vec_.size(); ++j) {
            if ((idx_ >> j) & 1) a = bits::add(a, node_vec_[j]);
        }
        NodeSet b = bits::difference(nodes_, a);

        if (!reverse_) {
            reverse_ = true;
            return SystemCut(a, b);
        }
        reverse_ = false;
        ++idx_;
        return SystemCut(b, a);
    }

private:
    NodeSet nodes_;
    std::vector<NodeIndex> node_vec_;
    size_t end_;
    size_t idx_ = 1;
    bool reverse_ = false;
};

/**
 * All system cuts of `nodes`, in canonical order.
 *
 * With prune_equivalent, cuts that sever exactly the same existing edges
 * of `cm` produce the same cut subsystem; only the canonically first cut
 * of each such class is kept.
 */
inline std::vector<SystemCut> system_cuts(NodeSet nodes, const ConnectivityMatrix& cm,
                                          bool prune_equivalent = true) {
    std::vector<SystemCut> result;
    SystemCutGenerator gen(nodes);
    while (auto cut = gen.next()) {
        result.push_back(*cut);
    }
    std::sort(result.begin(), result.end(),
              [](const SystemCut& a, const SystemCut& b) { return canonical_less(a, b); });

    if (!prune_equivalent) return result;

    std::vector<SystemCut> pruned;
    std::set<std::vector<std::pair<NodeIndex, NodeIndex>>> seen;
    for (const auto& cut : result) {
        auto severed = cm.edges_between(cut.from_nodes, cut.to_nodes);
        if (seen.insert(std::move(severed)).second) {
            pruned.push_back(cut);
        }
    }
    return pruned;
}

}  // namespace iit
