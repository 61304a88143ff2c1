#pragma once

#include "iit/core/types.hpp"
#include "iit/core/config.hpp"
#include "iit/core/budget.hpp"
#include "iit/core/errors.hpp"
#include "iit/core/log.hpp"
#include "iit/data/tpm.hpp"
#include "iit/data/subsystem.hpp"
#include "iit/partition/system_cut.hpp"
#include "iit/cache/cache.hpp"
#include "iit/compute/small_phi.hpp"
#include "iit/compute/ces.hpp"
#include "iit/parallel/executor.hpp"
#include <chrono>
#include <limits>
#include <memory>
#include <optional>
#include <stdexcept>
#include <vector>

namespace iit {

/**
 * System Irreducibility Analysis result.
 */
struct BigPhiResult {
    Real phi = 0.0;              // BigPhi value
    SystemCut cut;               // Minimum Information Partition; null when reducible up front
    CES ces;                     // Unpartitioned CES
    CES partitioned_ces;         // CES under the winning cut
    NodeSet nodes = 0;           // System nodes
    StateIndex state = 0;        // System state (whole network)
    size_t cuts_evaluated = 0;
    bool approximate = false;    // Sinkhorn EMD was permitted

    bool is_null(Real tol = EPSILON) const {
        return phi <= tol;
    }
};

/**
 * Runs one Big-Phi computation through its stages.
 *
 * A calculator runs once; run() on a finished or failed calculator is a
 * logic error. When no cache context is supplied and the configured
 * backend is IN_MEMORY, the calculator owns a private one.
 */
class BigPhiCalculator {
public:
    enum class Stage { INITIALIZED, ENUMERATING_CUTS, EVALUATING, REDUCING, DONE, FAILED };

    BigPhiCalculator(const Network& network, NodeSet nodes, StateIndex state, Config config,
                     CacheContext* cache, Budget budget)
        : network_(network)
        , nodes_(nodes)
        , state_(state)
        , config_(std::move(config))
        , cache_(cache)
        , budget_(std::move(budget))
    {}

    BigPhiCalculator(const Network& network, NodeSet nodes, StateIndex state,
                     const Config& config, CacheContext* cache = nullptr)
        : BigPhiCalculator(network, nodes, state, config, cache, Budget(config.timeout))
    {}

    Stage stage() const { return stage_; }

    const BigPhiResult& result() const {
        if (stage_ != Stage::DONE) {
            throw std::logic_error("Big-Phi result requested before the computation finished");
        }
        return result_;
    }

    const BigPhiResult& run() {
        if (stage_ != Stage::INITIALIZED) {
            throw std::logic_error("BigPhiCalculator can only run once");
        }
        try {
            compute();
        } catch (const std::exception& e) {
            stage_ = Stage::FAILED;
            log::message(LogLevel::WARN, "BigPhi", [&](std::ostream& os) {
                os << "computation for " << bits::to_string(nodes_)
                   << " failed: " << e.what();
            });
            throw;
        }
        return result_;
    }

    static const char* stage_name(Stage stage) {
        switch (stage) {
            case Stage::INITIALIZED: return "INITIALIZED";
            case Stage::ENUMERATING_CUTS: return "ENUMERATING_CUTS";
            case Stage::EVALUATING: return "EVALUATING";
            case Stage::REDUCING: return "REDUCING";
            case Stage::DONE: return "DONE";
            case Stage::FAILED: return "FAILED";
        }
        return "?";
    }

private:
    const Network& network_;
    NodeSet nodes_;
    StateIndex state_;
    Config config_;
    CacheContext* cache_;
    Budget budget_;
    std::shared_ptr<CacheContext> owned_cache_;
    Stage stage_ = Stage::INITIALIZED;
    BigPhiResult result_;

    void enter(Stage stage) {
        log::message(LogLevel::TRACE, "BigPhi", [&](std::ostream& os) {
            os << stage_name(stage_) << " -> " << stage_name(stage);
        });
        stage_ = stage;
    }

    void finish(Real phi) {
        result_.phi = phi;
        enter(Stage::DONE);
    }

    CacheContext* resolve_cache() {
        if (config_.cache_backend == CacheBackend::NONE) return nullptr;
        if (cache_) return cache_;
        owned_cache_ = make_cache_context(config_);
        return owned_cache_.get();
    }

    // Some node lies in no cause purview or in no effect purview
    bool trivially_reducible(const CES& ces) const {
        NodeSet causes = 0;
        NodeSet effects = 0;
        for (const auto& c : ces.concepts()) {
            causes |= c.cause.purview;
            effects |= c.effect.purview;
        }
        return causes != nodes_ || effects != nodes_;
    }

    void compute() {
        config_.validate();
        CacheContext* cache = resolve_cache();

        Subsystem subsystem(network_, nodes_, state_, SystemCut(), cache);

        result_.nodes = nodes_;
        result_.state = state_;
        result_.approximate = config_.approximate_emd;

        const Real tol = config_.numerical_tolerance;

        if (subsystem.size() <= 1) {
            log::message(LogLevel::DEBUG, "BigPhi", [&](std::ostream& os) {
                os << subsystem.to_string() << " has a single node";
            });
            return finish(0.0);
        }
        if (!subsystem.cm().is_strongly_connected(nodes_)) {
            log::message(LogLevel::DEBUG, "BigPhi", [&](std::ostream& os) {
                os << subsystem.to_string() << " is not strongly connected";
            });
            return finish(0.0);
        }

        result_.ces = compute_ces(subsystem, config_, budget_);
        log::message(LogLevel::DEBUG, "BigPhi", [&](std::ostream& os) {
            os << subsystem.to_string() << ": " << result_.ces.size()
               << " concepts";
        });

        if (result_.ces.empty()) {
            return finish(0.0);
        }
        if (config_.check_trivial_reducibility && trivially_reducible(result_.ces)) {
            log::message(LogLevel::DEBUG, "BigPhi", [&](std::ostream& os) {
                os << subsystem.to_string() << " is trivially reducible";
            });
            return finish(0.0);
        }

        enter(Stage::ENUMERATING_CUTS);
        std::vector<SystemCut> cuts =
            system_cuts(nodes_, subsystem.cm(), config_.prune_equivalent_cuts);

        enter(Stage::EVALUATING);
        std::vector<NodeSet> uncut_mechanisms = result_.ces.mechanisms();
        std::vector<std::optional<CES>> partitioned(cuts.size());
        std::vector<Real> distances(cuts.size(), std::numeric_limits<Real>::quiet_NaN());

        Executor executor(config_);
        size_t stop = executor.run(cuts.size(), [&](size_t i) {
            try {
                Subsystem cut_subsystem = subsystem.apply_cut(cuts[i]);
                CES ces = config_.assume_cuts_cannot_create_new_concepts
                              ? compute_ces(cut_subsystem, uncut_mechanisms, config_, budget_)
                              : compute_ces(cut_subsystem, config_, budget_);
                distances[i] = ces_distance(result_.ces, ces, subsystem, cut_subsystem, config_);
                partitioned[i] = std::move(ces);
            } catch (const NumericalInstabilityError& e) {
                log::message(LogLevel::ERROR, "BigPhi", [&](std::ostream& os) {
                    os << "cut " << cuts[i].to_string() << ": " << e.what();
                });
                throw;
            }
            log::message(LogLevel::TRACE, "BigPhi", [&](std::ostream& os) {
                os << "cut " << cuts[i].to_string() << " distance "
                   << distances[i];
            });
            return distances[i] <= tol;
        }, budget_);

        enter(Stage::REDUCING);
        size_t evaluated = stop == cuts.size() ? cuts.size() : stop + 1;
        size_t best = 0;
        for (size_t i = 1; i < evaluated; ++i) {
            if (distances[i] < distances[best] - tol) {
                best = i;
            }
        }

        Real phi = distances[best];
        if (phi <= tol) {
            phi = 0.0;
        }
        result_.cut = cuts[best];
        result_.partitioned_ces = std::move(*partitioned[best]);
        result_.cuts_evaluated = evaluated;

        log::message(LogLevel::INFO, "BigPhi", [&](std::ostream& os) {
            os << subsystem.to_string() << " Phi=" << phi << " cut "
               << result_.cut.to_string() << " ("
               << evaluated << "/" << cuts.size()
               << " cuts)";
        });
        finish(phi);
    }
};

/**
 * Compute BigPhi (System Irreducibility Analysis).
 *
 * BigPhi measures how much a system is more than the sum of its parts:
 * the minimum distance between the unpartitioned CES and the CES under
 * any system cut.
 */
inline BigPhiResult compute_big_phi(const Network& network, NodeSet nodes, StateIndex state,
                                    const Config& config, CacheContext* cache,
                                    const Budget& budget) {
    BigPhiCalculator calculator(network, nodes, state, config, cache, budget);
    return calculator.run();
}

inline BigPhiResult compute_big_phi(const Network& network, NodeSet nodes, StateIndex state,
                                    const Config& config = Config(),
                                    CacheContext* cache = nullptr) {
    return compute_big_phi(network, nodes, state, config, cache, Budget(config.timeout));
}

/**
 * Convenience function: compute BigPhi for a whole network in given state.
 */
inline Real compute_phi(const Network& network, StateIndex state,
                        const Config& config = Config()) {
    return compute_big_phi(network, network.node_set(), state, config).phi;
}

}  // namespace iit
