#pragma once

#include "iit/core/types.hpp"
#include "iit/core/config.hpp"
#include "iit/core/errors.hpp"
#include "iit/core/log.hpp"
#include "iit/data/repertoire.hpp"
#include <vector>
#include <cmath>
#include <algorithm>
#include <limits>
#include <string>

namespace iit {

// Unrouted mass above this fails the exact solver
constexpr Real EMD_MASS_TOLERANCE = 1e-6;

/**
 * Solver settings for transportation problems, taken from Config.
 */
struct EMDOptions {
    bool allow_approximate = false;
    size_t exact_max_states = 256;
    Real regularization = 1e-3;
    int max_iterations = 10000;
    Real tolerance = EPSILON;

    static EMDOptions from(const Config& config) {
        EMDOptions opts;
        opts.allow_approximate = config.approximate_emd;
        opts.exact_max_states = config.exact_emd_max_states;
        opts.regularization = config.sinkhorn_regularization;
        opts.max_iterations = config.sinkhorn_max_iterations;
        opts.tolerance = config.numerical_tolerance;
        return opts;
    }
};

/**
 * Result of an approximate transport solve.
 *
 * |value - exact| <= error_bound.
 */
struct ApproximateEMD {
    Real value = 0.0;
    Real error_bound = 0.0;
    int iterations = 0;
};

// Number of node bits in which two states differ
inline size_t hamming_distance(StateIndex a, StateIndex b) {
    return bits::popcount(static_cast<NodeSet>(a ^ b));
}

// Ground-cost matrix over the 2^n states of n nodes, row-major
inline std::vector<Real> hamming_matrix(size_t num_nodes) {
    size_t num_states = state::num_states(num_nodes);
    std::vector<Real> matrix(num_states * num_states);

    for (StateIndex i = 0; i < num_states; ++i) {
        for (StateIndex j = 0; j < num_states; ++j) {
            matrix[i * num_states + j] = static_cast<Real>(hamming_distance(i, j));
        }
    }

    return matrix;
}

/**
 * Closed-form effect EMD. Effect repertoires factor over purview nodes, so
 * the EMD is the sum of the absolute differences of the OFF marginals.
 */
inline Real effect_emd(const Repertoire& p, const Repertoire& q) {
    if (p.purview() != q.purview()) {
        throw std::invalid_argument("EMD needs repertoires over one purview");
    }

    Real total = 0.0;
    for (size_t k = 0; k < p.purview_size(); ++k) {
        total += std::abs(p.marginal_off(k) - q.marginal_off(k));
    }
    return total;
}

/**
 * Exact transport cost by successive shortest paths on the flow network
 * source -> p states -> q states -> sink, with SPFA (Bellman-Ford) for the
 * augmenting paths. The cost matrix is n x n,
 * row-major. Throws NumericalInstabilityError if the masses differ, if a
 * negative cycle appears from rounding, or if flow cannot be routed.
 */
inline Real exact_emd_ssp(const std::vector<Real>& p, const std::vector<Real>& q,
                          const std::vector<Real>& cost, size_t n, Real tol = EPSILON) {
    const Real INF = std::numeric_limits<Real>::max() / 4;
    const size_t S = 2 * n;      // Source
    const size_t T = 2 * n + 1;  // Sink
    const size_t V = 2 * n + 2;

    struct Edge {
        size_t to;
        Real cap, cost;
        size_t rev;
    };
    std::vector<std::vector<Edge>> adj(V);

    auto add_edge = [&](size_t u, size_t v, Real cap, Real c) {
        adj[u].push_back({v, cap, c, adj[v].size()});
        adj[v].push_back({u, 0, -c, adj[u].size() - 1});
    };

    Real supply = 0.0;
    Real demand = 0.0;
    for (size_t i = 0; i < n; ++i) {
        if (p[i] > tol) {
            add_edge(S, i, p[i], 0);
            supply += p[i];
        }
    }
    for (size_t j = 0; j < n; ++j) {
        if (q[j] > tol) {
            add_edge(n + j, T, q[j], 0);
            demand += q[j];
        }
    }
    if (std::abs(supply - demand) > EMD_MASS_TOLERANCE) {
        throw NumericalInstabilityError("transport masses differ: " + std::to_string(supply) +
                                        " vs " + std::to_string(demand));
    }

    for (size_t i = 0; i < n; ++i) {
        for (size_t j = 0; j < n; ++j) {
            add_edge(i, n + j, INF, cost[i * n + j]);
        }
    }

    Real total_cost = 0.0;
    Real total_flow = 0.0;
    Real required_flow = std::min(supply, demand);

    while (total_flow < required_flow - tol) {
        std::vector<Real> dist(V, INF);
        std::vector<size_t> parent(V, V);
        std::vector<size_t> parent_edge(V, 0);
        std::vector<size_t> enqueued(V, 0);
        dist[S] = 0;

        std::vector<bool> in_queue(V, false);
        std::vector<size_t> queue_vec;
        queue_vec.push_back(S);
        in_queue[S] = true;

        size_t head = 0;
        while (head < queue_vec.size()) {
            size_t u = queue_vec[head++];
            in_queue[u] = false;

            for (size_t e = 0; e < adj[u].size(); ++e) {
                const auto& edge = adj[u][e];
                if (edge.cap > tol && dist[u] + edge.cost < dist[edge.to] - tol) {
                    dist[edge.to] = dist[u] + edge.cost;
                    parent[edge.to] = u;
                    parent_edge[edge.to] = e;
                    if (!in_queue[edge.to]) {
                        if (++enqueued[edge.to] > V) {
                            throw NumericalInstabilityError("negative cycle in residual network");
                        }
                        queue_vec.push_back(edge.to);
                        in_queue[edge.to] = true;
                    }
                }
            }
        }

        if (dist[T] >= INF) break;  // No augmenting path

        Real path_flow = INF;
        for (size_t v = T; v != S; v = parent[v]) {
            size_t u = parent[v];
            path_flow = std::min(path_flow, adj[u][parent_edge[v]].cap);
        }
        path_flow = std::min(path_flow, required_flow - total_flow);

        for (size_t v = T; v != S; v = parent[v]) {
            size_t u = parent[v];
            size_t e = parent_edge[v];
            adj[u][e].cap -= path_flow;
            adj[v][adj[u][e].rev].cap += path_flow;
        }

        total_flow += path_flow;
        total_cost += path_flow * dist[T];
    }

    if (required_flow - total_flow > EMD_MASS_TOLERANCE) {
        throw NumericalInstabilityError("could not route " +
                                        std::to_string(required_flow - total_flow) +
                                        " units of mass");
    }
    return total_cost;
}

/**
 * Entropically regularized transport (log-domain Sinkhorn).
 *
 * The entropic plan costs at most eps * (H(p) + H(q)) more than the exact
 * optimum (natural-log entropies), and a plan whose marginals are off by
 * delta in L1 can be repaired at cost at most max_cost * delta, so
 *
 *     |value - exact| <= eps * (H(p) + H(q)) + max_cost * delta.
 *
 * Throws NumericalInstabilityError if the marginals do not converge within
 * max_iterations.
 */
inline ApproximateEMD sinkhorn_emd(const std::vector<Real>& p, const std::vector<Real>& q,
                                   const std::vector<Real>& cost, size_t n,
                                   Real eps, int max_iterations, Real tol = EPSILON) {
    // Restrict to the supports; zero-mass states carry no plan entries
    std::vector<size_t> rows, cols;
    for (size_t i = 0; i < n; ++i) {
        if (p[i] > tol) rows.push_back(i);
        if (q[i] > tol) cols.push_back(i);
    }
    if (rows.empty() || cols.empty()) return {};

    auto entropy = [](const std::vector<Real>& v) {
        Real h = 0.0;
        for (Real x : v) {
            if (x > 0) h -= x * std::log(x);
        }
        return h;
    };

    size_t R = rows.size();
    size_t C = cols.size();
    std::vector<Real> f(R, 0.0), g(C, 0.0);
    std::vector<Real> log_p(R), log_q(C);
    for (size_t a = 0; a < R; ++a) log_p[a] = std::log(p[rows[a]]);
    for (size_t b = 0; b < C; ++b) log_q[b] = std::log(q[cols[b]]);

    auto c = [&](size_t a, size_t b) { return cost[rows[a] * n + cols[b]]; };

    Real max_cost = 0.0;
    for (size_t a = 0; a < R; ++a) {
        for (size_t b = 0; b < C; ++b) max_cost = std::max(max_cost, c(a, b));
    }

    // Converge the marginals well inside the regularization error
    const Real target = std::max(tol, eps * 1e-3);

    std::vector<Real> terms(std::max(R, C));
    Real delta = 0.0;
    int iter = 0;
    for (; iter < max_iterations; ++iter) {
        for (size_t a = 0; a < R; ++a) {
            Real m = -std::numeric_limits<Real>::infinity();
            for (size_t b = 0; b < C; ++b) {
                terms[b] = (g[b] - c(a, b)) / eps;
                m = std::max(m, terms[b]);
            }
            Real s = 0.0;
            for (size_t b = 0; b < C; ++b) s += std::exp(terms[b] - m);
            f[a] = eps * (log_p[a] - m - std::log(s));
        }
        for (size_t b = 0; b < C; ++b) {
            Real m = -std::numeric_limits<Real>::infinity();
            for (size_t a = 0; a < R; ++a) {
                terms[a] = (f[a] - c(a, b)) / eps;
                m = std::max(m, terms[a]);
            }
            Real s = 0.0;
            for (size_t a = 0; a < R; ++a) s += std::exp(terms[a] - m);
            g[b] = eps * (log_q[b] - m - std::log(s));
        }

        // Columns are exact after the g-update; measure the row violation
        delta = 0.0;
        for (size_t a = 0; a < R; ++a) {
            Real row = 0.0;
            for (size_t b = 0; b < C; ++b) row += std::exp((f[a] + g[b] - c(a, b)) / eps);
            delta += std::abs(row - p[rows[a]]);
        }
        if (!std::isfinite(delta)) {
            throw NumericalInstabilityError("Sinkhorn iteration diverged");
        }
        if (delta <= target) break;
    }
    if (delta > target) {
        throw NumericalInstabilityError("Sinkhorn did not converge in " +
                                        std::to_string(max_iterations) + " iterations (delta " +
                                        std::to_string(delta) + ")");
    }

    ApproximateEMD result;
    for (size_t a = 0; a < R; ++a) {
        for (size_t b = 0; b < C; ++b) {
            result.value += std::exp((f[a] + g[b] - c(a, b)) / eps) * c(a, b);
        }
    }
    result.error_bound = eps * (entropy(p) + entropy(q)) + max_cost * delta;
    result.iterations = iter + 1;
    return result;
}

/**
 * Earth mover's distance under Hamming ground cost.
 *
 * Exact min-cost flow up to opts.exact_max_states; above that, Sinkhorn
 * when opts.allow_approximate is set, exact otherwise.
 */
inline Real hamming_emd(const Repertoire& p, const Repertoire& q,
                        const EMDOptions& opts = EMDOptions{}) {
    if (p.purview() != q.purview()) {
        throw std::invalid_argument("EMD needs repertoires over one purview");
    }

    size_t num_states = p.num_states();

    if (num_states <= 1) return 0.0;
    if (num_states == 2) {
        // Hamming distance between 0 and 1 is 1
        return std::abs(p[0] - q[0]);
    }
    if (p.approx_equal(q, 0.0)) return 0.0;

    auto cost = hamming_matrix(p.purview_size());

    if (opts.allow_approximate && num_states > opts.exact_max_states) {
        ApproximateEMD approx = sinkhorn_emd(p.vec(), q.vec(), cost, num_states,
                                             opts.regularization, opts.max_iterations,
                                             opts.tolerance);
        log::message(LogLevel::DEBUG, "EMD", [&](std::ostream& os) {
            os << "Sinkhorn over " << num_states << " states: " << approx.value
               << " +/- " << approx.error_bound << " after "
               << approx.iterations << " iterations";
        });
        return approx.value;
    }

    return exact_emd_ssp(p.vec(), q.vec(), cost, num_states, opts.tolerance);
}

/**
 * EMD by direction: closed form for effects, transport for causes.
 */
inline Real emd(const Repertoire& p, const Repertoire& q, Direction direction,
                const EMDOptions& opts = EMDOptions{}) {
    if (direction == Direction::EFFECT) {
        return effect_emd(p, q);
    }
    return hamming_emd(p, q, opts);
}

}  // namespace iit
