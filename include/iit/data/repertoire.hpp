#pragma once

#include "iit/core/types.hpp"
#include <vector>
#include <stdexcept>
#include <string>
#include <algorithm>
#include <cmath>

namespace iit {

/**
 * Distribution over the joint states of a purview, as a flat vector
 * indexed little-endian over the purview nodes in increasing order.
 *
 * The empty purview has one state and the repertoire [1], which is the
 * identity for product().
 */
class Repertoire {
public:
    Repertoire() : Repertoire(0, std::vector<Real>{1.0}) {}

    // All-zero over the purview's states
    explicit Repertoire(NodeSet purview)
        : purview_(purview), data_(state::num_states(bits::popcount(purview)), 0.0) {}

    Repertoire(NodeSet purview, std::vector<Real> data)
        : purview_(purview), data_(std::move(data)) {
        if (data_.size() != state::num_states(bits::popcount(purview_))) {
            throw std::invalid_argument("repertoire over " + bits::to_string(purview_) +
                                        " needs " +
                                        std::to_string(state::num_states(bits::popcount(purview_))) +
                                        " entries, got " + std::to_string(data_.size()));
        }
    }

    NodeSet purview() const { return purview_; }
    size_t purview_size() const { return bits::popcount(purview_); }
    size_t num_states() const { return data_.size(); }

    Real& operator[](StateIndex i) { return data_[i]; }
    Real operator[](StateIndex i) const { return data_[i]; }

    const std::vector<Real>& vec() const { return data_; }

    Real sum() const {
        Real total = 0.0;
        for (Real p : data_) total += p;
        return total;
    }

    // Scale to sum 1; an all-zero repertoire is left as is
    void normalize() {
        Real s = sum();
        if (s > EPSILON) {
            for (Real& p : data_) {
                p /= s;
            }
        }
    }

    Repertoire normalized() const {
        Repertoire copy(*this);
        copy.normalize();
        return copy;
    }

    bool is_normalized(Real tol = EPSILON) const {
        for (Real p : data_) {
            if (!(p >= -tol)) return false;
        }
        return fp::equal(sum(), 1.0, tol * static_cast<Real>(data_.size()));
    }

    bool is_uniform(Real tol = EPSILON) const {
        const Real flat = 1.0 / static_cast<Real>(data_.size());
        return std::all_of(data_.begin(), data_.end(),
                           [&](Real p) { return fp::equal(p, flat, tol); });
    }

    // Elementwise comparison within tol
    bool approx_equal(const Repertoire& other, Real tol = EPSILON) const {
        if (purview_ != other.purview_) return false;
        for (size_t i = 0; i < data_.size(); ++i) {
            if (!fp::equal(data_[i], other.data_[i], tol)) return false;
        }
        return true;
    }

    // Uniform distribution over the purview
    static Repertoire max_entropy(NodeSet purview) {
        Repertoire flat(purview);
        std::fill(flat.data_.begin(), flat.data_.end(),
                  1.0 / static_cast<Real>(flat.data_.size()));
        return flat;
    }

    // Extend to a superset purview; the added nodes are uniform
    Repertoire expand(NodeSet wider) const {
        if (wider == purview_) return *this;
        if (!bits::is_subset(purview_, wider)) {
            throw std::invalid_argument("cannot expand " + bits::to_string(purview_) + " to " +
                                        bits::to_string(wider));
        }
        return product(*this, max_entropy(bits::difference(wider, purview_)));
    }

    /**
     * Joint repertoire of two independent repertoires over disjoint
     * purviews.
     */
    static Repertoire product(const Repertoire& a, const Repertoire& b) {
        if (bits::intersect(a.purview_, b.purview_) != 0) {
            throw std::invalid_argument("product of overlapping purviews " +
                                        bits::to_string(a.purview_) + " and " +
                                        bits::to_string(b.purview_));
        }

        Repertoire joint(bits::unite(a.purview_, b.purview_));
        for (StateIndex s = 0; s < joint.data_.size(); ++s) {
            // Spread the packed joint state over node positions, then repack per factor
            StateIndex spread = state::expand_bits(s, joint.purview_);
            joint.data_[s] = a.data_[state::extract_bits(spread, a.purview_)] *
                             b.data_[state::extract_bits(spread, b.purview_)];
        }
        return joint;
    }

    // P(k-th purview node is OFF), k counted in increasing node order
    Real marginal_off(size_t k) const {
        Real off = 0.0;
        for (StateIndex s = 0; s < data_.size(); ++s) {
            if (state::get_bit(s, static_cast<NodeIndex>(k)) == 0) off += data_[s];
        }
        return off;
    }

    // Shannon entropy in bits
    Real entropy() const {
        Real h = 0.0;
        for (Real p : data_) {
            if (p > 0) h -= p * std::log2(p);
        }
        return h;
    }

    std::string to_string() const {
        std::string out = bits::to_string(purview_) + " [";
        for (size_t i = 0; i < data_.size(); ++i) {
            if (i) out += ", ";
            out += std::to_string(data_[i]);
        }
        return out + "]";
    }

private:
    NodeSet purview_;
    std::vector<Real> data_;
};

}  // namespace iit
