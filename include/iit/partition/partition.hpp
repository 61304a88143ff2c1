#pragma once

#include "iit/core/types.hpp"
#include "iit/core/config.hpp"
#include <algorithm>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace iit {

/**
 * A part of a mechanism partition: a mechanism subset paired with the
 * purview subset it keeps its influence over.
 */
struct Part {
    NodeSet mechanism;
    NodeSet purview;

    Part() : mechanism(0), purview(0) {}
    Part(NodeSet m, NodeSet p) : mechanism(m), purview(p) {}

    bool is_empty() const {
        return mechanism == 0 && purview == 0;
    }

    size_t size() const {
        return bits::popcount(mechanism) + bits::popcount(purview);
    }

    bool operator==(const Part& other) const {
        return mechanism == other.mechanism && purview == other.purview;
    }

    // Lexicographic on mechanism node list, then purview node list
    bool operator<(const Part& other) const {
        if (mechanism != other.mechanism) return bits::lex_less(mechanism, other.mechanism);
        return bits::lex_less(purview, other.purview);
    }

    std::string to_string() const {
        return bits::to_string(mechanism) + "/" + bits::to_string(purview);
    }
};

/**
 * Partition of a mechanism-purview pair into two or three parts.
 *
 * Parts are kept sorted, so equal partitions compare equal regardless of
 * the order they were generated in.
 */
struct Partition {
    std::vector<Part> parts;

    Partition() = default;

    explicit Partition(std::vector<Part> p) : parts(std::move(p)) {
        std::sort(parts.begin(), parts.end());
    }

    bool empty() const { return parts.empty(); }

    // Size (|mechanism| + |purview|) of the smallest non-empty part
    size_t smallest_part() const {
        size_t best = SIZE_MAX;
        for (const auto& part : parts) {
            if (!part.is_empty()) best = std::min(best, part.size());
        }
        return best;
    }

    bool operator==(const Partition& other) const {
        return parts == other.parts;
    }

    std::string to_string() const {
        std::string out;
        for (size_t i = 0; i < parts.size(); ++i) {
            if (i) out += " x ";
            out += parts[i].to_string();
        }
        return out;
    }
};

/**
 * Canonical partition order: increasing size of the smallest part, then
 * lexicographic over the sorted parts.
 */
inline bool canonical_less(const Partition& a, const Partition& b) {
    size_t sa = a.smallest_part();
    size_t sb = b.smallest_part();
    if (sa != sb) return sa < sb;
    return std::lexicographical_compare(a.parts.begin(), a.parts.end(),
                                        b.parts.begin(), b.parts.end());
}

namespace detail {

// i-th undirected bipartition of `nodes` (i in [0, 2^(n-1)))
inline std::pair<NodeSet, NodeSet> undirected_bipartition(NodeSet nodes, size_t i) {
    NodeSet part0 = 0;
    size_t j = 0;
    bits::for_each(nodes, [&](NodeIndex node) {
        if ((i >> j) & 1) part0 = bits::add(part0, node);
        ++j;
    });
    return {part0, bits::difference(nodes, part0)};
}

inline size_t num_undirected_bipartitions(NodeSet nodes) {
    size_t n = bits::popcount(nodes);
    return n == 0 ? 1 : size_t{1} << (n - 1);
}

}  // namespace detail

/**
 * Lazily enumerates mechanism-purview bipartitions: undirected
 * bipartitions of the mechanism times directed bipartitions of the
 * purview, skipping candidates where a part would be empty on both
 * sides.
 *
 * Single pass: once next() returns nullopt the generator is spent.
 */
class BipartitionGenerator {
public:
    BipartitionGenerator(NodeSet mechanism, NodeSet purview)
        : mechanism_(mechanism)
        , purview_(purview)
        , purview_nodes_(bits::to_vector(purview))
        , num_mech_(detail::num_undirected_bipartitions(mechanism))
        , num_purv_(size_t{1} << purview_nodes_.size())
    {}

    std::optional<Partition> next() {
        while (mech_idx_ < num_mech_) {
            auto [m0, m1] = detail::undirected_bipartition(mechanism_, mech_idx_);
            size_t k = purv_idx_++;
            if (purv_idx_ == num_purv_) {
                purv_idx_ = 0;
                ++mech_idx_;
            }

            NodeSet p0 = 0;
            for (size_t j = 0; j < purview_nodes_.size(); ++j) {
                if ((k >> j) & 1) p0 = bits::add(p0, purview_nodes_[j]);
            }
            NodeSet p1 = bits::difference(purview_, p0);

            if ((m0 || p0) && (m1 || p1)) {
                return Partition({Part(m0, p0), Part(m1, p1)});
            }
        }
        return std::nullopt;
    }

private:
    NodeSet mechanism_;
    NodeSet purview_;
    std::vector<NodeIndex> purview_nodes_;
    size_t num_mech_;
    size_t num_purv_;
    size_t mech_idx_ = 0;
    size_t purv_idx_ = 0;
};

/**
 * Lazily enumerates tripartitions: an undirected mechanism bipartition
 * (m0, m1) times a directed tripartition (d0, d1, d2) of the purview,
 * forming m0/d0 x m1/d1 x {}/d2.
 *
 * Skips candidates where the first two parts are empty, where both
 * mechanism halves are needed but missing, duplicates after sorting the
 * parts, and partitions two of whose non-empty parts could be merged
 * into one (both mechanisms empty, or both purviews empty).
 */
class TripartitionGenerator {
public:
    TripartitionGenerator(NodeSet mechanism, NodeSet purview)
        : mechanism_(mechanism)
        , purview_nodes_(bits::to_vector(purview))
        , num_mech_(detail::num_undirected_bipartitions(mechanism))
    {
        num_purv_ = 1;
        for (size_t i = 0; i < purview_nodes_.size(); ++i) num_purv_ *= 3;
    }

    std::optional<Partition> next() {
        while (mech_idx_ < num_mech_) {
            auto [m0, m1] = detail::undirected_bipartition(mechanism_, mech_idx_);
            size_t k = purv_idx_++;
            if (purv_idx_ == num_purv_) {
                purv_idx_ = 0;
                ++mech_idx_;
            }

            NodeSet d[3] = {0, 0, 0};
            for (NodeIndex node : purview_nodes_) {
                d[k % 3] = bits::add(d[k % 3], node);
                k /= 3;
            }

            bool valid = (m0 || d[0]) && (m1 || d[1]) && ((m0 && m1) || !d[0] || !d[1]);
            if (!valid) continue;

            Partition candidate({Part(m0, d[0]), Part(m1, d[1]), Part(0, d[2])});
            if (compressible(candidate)) continue;
            if (!seen_.insert(key(candidate)).second) continue;
            return candidate;
        }
        return std::nullopt;
    }

private:
    NodeSet mechanism_;
    std::vector<NodeIndex> purview_nodes_;
    size_t num_mech_;
    size_t num_purv_;
    size_t mech_idx_ = 0;
    size_t purv_idx_ = 0;
    std::set<std::vector<NodeSet>> seen_;

    static bool compressible(const Partition& p) {
        for (size_t i = 0; i < p.parts.size(); ++i) {
            for (size_t j = i + 1; j < p.parts.size(); ++j) {
                const Part& x = p.parts[i];
                const Part& y = p.parts[j];
                if (x.is_empty() || y.is_empty()) continue;
                if ((x.mechanism | y.mechanism) == 0 || (x.purview | y.purview) == 0) {
                    return true;
                }
            }
        }
        return false;
    }

    static std::vector<NodeSet> key(const Partition& p) {
        std::vector<NodeSet> k;
        for (const auto& part : p.parts) {
            k.push_back(part.mechanism);
            k.push_back(part.purview);
        }
        return k;
    }
};

/**
 * Partition generator selected by the configured scheme.
 */
class MechanismPartitionGenerator {
public:
    MechanismPartitionGenerator(PartitionScheme scheme, NodeSet mechanism, NodeSet purview)
        : impl_(make(scheme, mechanism, purview))
    {}

    std::optional<Partition> next() {
        return std::visit([](auto& gen) { return gen.next(); }, impl_);
    }

private:
    using Impl = std::variant<BipartitionGenerator, TripartitionGenerator>;
    Impl impl_;

    static Impl make(PartitionScheme scheme, NodeSet mechanism, NodeSet purview) {
        if (scheme == PartitionScheme::TRIPARTITION) {
            return TripartitionGenerator(mechanism, purview);
        }
        return BipartitionGenerator(mechanism, purview);
    }
};

/**
 * All candidate partitions of a mechanism-purview pair, in canonical order.
 */
inline std::vector<Partition> mip_partitions(NodeSet mechanism, NodeSet purview,
                                             PartitionScheme scheme = PartitionScheme::BIPARTITION) {
    std::vector<Partition> result;
    MechanismPartitionGenerator gen(scheme, mechanism, purview);
    while (auto p = gen.next()) {
        result.push_back(std::move(*p));
    }
    std::sort(result.begin(), result.end(),
              [](const Partition& a, const Partition& b) { return canonical_less(a, b); });
    return result;
}

}  // namespace iit
