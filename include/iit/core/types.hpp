#pragma once

#include <cstdint>
#include <cstddef>
#include <bit>
#include <vector>
#include <string>
#include <initializer_list>

namespace iit {

// Configurable precision via compile-time option
#ifdef IIT_REAL_TYPE
using Real = IIT_REAL_TYPE;
#else
using Real = double;
#endif

// Default numerical tolerance
constexpr Real EPSILON = 1e-10;

// Largest network the state indexing supports (2^31 states)
constexpr size_t MAX_NODES = 31;

// Node set represented as bitmask
using NodeSet = uint64_t;

// State index for 2^n state space
using StateIndex = uint32_t;

// Node index (0-63)
using NodeIndex = uint8_t;

// Direction for cause/effect computation
enum class Direction { CAUSE, EFFECT };

inline const char* to_string(Direction dir) {
    return dir == Direction::CAUSE ? "cause" : "effect";
}

// Bit manipulation utilities for NodeSet
namespace bits {

constexpr size_t popcount(NodeSet set) {
    return static_cast<size_t>(std::popcount(set));
}

constexpr bool contains(NodeSet set, NodeIndex node) {
    return (set >> node) & 1;
}

constexpr NodeSet add(NodeSet set, NodeIndex node) {
    return set | (NodeSet{1} << node);
}

constexpr NodeSet make_set(std::initializer_list<NodeIndex> nodes) {
    NodeSet result = 0;
    for (auto n : nodes) {
        result |= (NodeSet{1} << n);
    }
    return result;
}

// Get lowest set bit index (undefined if set == 0)
constexpr NodeIndex lowest_bit(NodeSet set) {
    return static_cast<NodeIndex>(std::countr_zero(set));
}

constexpr NodeSet clear_lowest(NodeSet set) {
    return set & (set - 1);
}

// Iterate over all set bits, calling f(node_index) for each
template<typename Func>
void for_each(NodeSet set, Func&& f) {
    while (set) {
        NodeIndex node = lowest_bit(set);
        f(node);
        set = clear_lowest(set);
    }
}

inline std::vector<NodeIndex> to_vector(NodeSet set) {
    std::vector<NodeIndex> result;
    result.reserve(popcount(set));
    for_each(set, [&](NodeIndex n) { result.push_back(n); });
    return result;
}

// Create full set of n nodes: {0, 1, ..., n-1}
constexpr NodeSet full_set(size_t n) {
    if (n >= 64) return ~NodeSet{0};
    return (NodeSet{1} << n) - 1;
}

constexpr NodeSet intersect(NodeSet a, NodeSet b) {
    return a & b;
}

constexpr NodeSet unite(NodeSet a, NodeSet b) {
    return a | b;
}

// Difference (a - b)
constexpr NodeSet difference(NodeSet a, NodeSet b) {
    return a & ~b;
}

constexpr bool is_subset(NodeSet a, NodeSet b) {
    return (a & b) == a;
}

/**
 * Lexicographic comparison of the sorted node lists of two sets.
 *
 * {0, 2} < {1}: the first differing element decides, and a proper
 * prefix sorts first ({0} < {0, 1}).
 */
constexpr bool lex_less(NodeSet a, NodeSet b) {
    while (a && b) {
        NodeIndex x = lowest_bit(a);
        NodeIndex y = lowest_bit(b);
        if (x != y) return x < y;
        a = clear_lowest(a);
        b = clear_lowest(b);
    }
    return a == 0 && b != 0;
}

// Canonical node-set order: smaller sets first, then lexicographic
constexpr bool canonical_less(NodeSet a, NodeSet b) {
    size_t pa = popcount(a);
    size_t pb = popcount(b);
    if (pa != pb) return pa < pb;
    return lex_less(a, b);
}

/**
 * All non-empty subsets of a set, in canonical order.
 *
 * This is the order in which mechanisms and purviews are enumerated.
 */
inline std::vector<NodeSet> subsets(NodeSet set) {
    std::vector<NodeIndex> nodes = to_vector(set);
    size_t n = nodes.size();
    std::vector<NodeSet> result;
    result.reserve((size_t{1} << n) - 1);

    // Grow by size; within a size, combinations come out lexicographically
    for (size_t k = 1; k <= n; ++k) {
        std::vector<size_t> idx(k);
        for (size_t i = 0; i < k; ++i) idx[i] = i;
        while (true) {
            NodeSet s = 0;
            for (size_t i : idx) s = add(s, nodes[i]);
            result.push_back(s);

            size_t i = k;
            while (i > 0 && idx[i - 1] == n - k + i - 1) --i;
            if (i == 0) break;
            ++idx[i - 1];
            for (size_t j = i; j < k; ++j) idx[j] = idx[j - 1] + 1;
        }
    }
    return result;
}

// Format as "{0,2,3}"
inline std::string to_string(NodeSet set) {
    std::string out = "{";
    bool first = true;
    for_each(set, [&](NodeIndex n) {
        if (!first) out += ",";
        out += std::to_string(n);
        first = false;
    });
    out += "}";
    return out;
}

}  // namespace bits

// State conversion utilities
namespace state {

inline std::vector<uint8_t> to_vector(StateIndex idx, size_t n) {
    std::vector<uint8_t> result(n);
    for (size_t i = 0; i < n; ++i) {
        result[i] = (idx >> i) & 1;
    }
    return result;
}

// Convert bit vector to state index (little-endian)
inline StateIndex from_vector(const std::vector<uint8_t>& state) {
    StateIndex idx = 0;
    for (size_t i = 0; i < state.size(); ++i) {
        idx |= (static_cast<StateIndex>(state[i] & 1) << i);
    }
    return idx;
}

constexpr uint8_t get_bit(StateIndex state, NodeIndex pos) {
    return (state >> pos) & 1;
}

constexpr StateIndex set_bit(StateIndex state, NodeIndex pos, uint8_t value) {
    if (value) {
        return state | (StateIndex{1} << pos);
    } else {
        return state & ~(StateIndex{1} << pos);
    }
}

// Extract bits at positions specified by mask, pack into lower bits
// Example: extract_bits(0b11010, 0b10110) = 0b101 (bits at positions 1,2,4)
inline StateIndex extract_bits(StateIndex state, NodeSet mask) {
    StateIndex result = 0;
    size_t out_pos = 0;
    bits::for_each(mask, [&](NodeIndex pos) {
        if ((state >> pos) & 1) {
            result |= (StateIndex{1} << out_pos);
        }
        ++out_pos;
    });
    return result;
}

// Expand packed bits into positions specified by mask
// Inverse of extract_bits
inline StateIndex expand_bits(StateIndex packed, NodeSet mask) {
    StateIndex result = 0;
    size_t in_pos = 0;
    bits::for_each(mask, [&](NodeIndex pos) {
        if ((packed >> in_pos) & 1) {
            result |= (StateIndex{1} << pos);
        }
        ++in_pos;
    });
    return result;
}

constexpr StateIndex num_states(size_t n) {
    return StateIndex{1} << n;
}

// Format as "(1,0,0)" in node order
inline std::string to_string(StateIndex idx, size_t n) {
    std::string out = "(";
    for (size_t i = 0; i < n; ++i) {
        if (i) out += ",";
        out += ((idx >> i) & 1) ? "1" : "0";
    }
    out += ")";
    return out;
}

}  // namespace state

// Stable (process-independent) hashing for identities and checksums
namespace hash {

// FNV-1a
constexpr uint64_t FNV_OFFSET = 1469598103934665603ULL;
constexpr uint64_t FNV_PRIME = 1099511628211ULL;

inline uint64_t fnv1a(const void* bytes, size_t len, uint64_t h = FNV_OFFSET) {
    const auto* p = static_cast<const unsigned char*>(bytes);
    for (size_t i = 0; i < len; ++i) {
        h ^= p[i];
        h *= FNV_PRIME;
    }
    return h;
}

inline uint64_t combine(uint64_t h, uint64_t value) {
    return fnv1a(&value, sizeof(value), h);
}

}  // namespace hash

// Floating point comparison utilities
namespace fp {

constexpr bool is_zero(Real x, Real tol = EPSILON) {
    return x >= -tol && x <= tol;
}

constexpr bool equal(Real a, Real b, Real tol = EPSILON) {
    Real diff = a - b;
    return diff >= -tol && diff <= tol;
}

constexpr bool less_than(Real a, Real b, Real tol = EPSILON) {
    return a < b - tol;
}

}  // namespace fp

}  // namespace iit
