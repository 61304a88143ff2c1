#pragma once

#include "iit/core/types.hpp"
#include <chrono>
#include <cstdlib>
#include <stdexcept>
#include <string>

namespace iit {

// Repertoire distance used by the mechanism-level MIP search
enum class DistanceMeasure { EMD, L1, KLD, ENTROPY_DIFFERENCE };

enum class PartitionScheme { BIPARTITION, TRIPARTITION };

// Distance between two cause-effect structures
enum class CESDistance { XEMD, SUM_SMALL_PHI };

enum class CacheBackend { NONE, IN_MEMORY, EXTERNAL };

enum class ParallelBackend { NONE, OPENMP };

// Which purview wins when several reach the same maximal phi
enum class PurviewTieBreak { SMALLEST, LARGEST };

/**
 * Options for a phi computation.
 *
 * Defaults follow the standard IIT 3.0 formulation. Every top-level entry
 * point validates its Config before any search begins.
 */
struct Config {
    DistanceMeasure distance_measure = DistanceMeasure::EMD;
    PartitionScheme partition_scheme = PartitionScheme::BIPARTITION;
    CESDistance ces_distance = CESDistance::XEMD;
    CacheBackend cache_backend = CacheBackend::IN_MEMORY;
    ParallelBackend parallel_backend = ParallelBackend::OPENMP;
    PurviewTieBreak purview_tie_break = PurviewTieBreak::SMALLEST;

    Real numerical_tolerance = EPSILON;

    // 0 = OpenMP default
    int num_threads = 0;
    // Iterations handed to a worker at a time
    int parallel_chunk_size = 1;

    // Zero means no deadline
    std::chrono::milliseconds timeout{0};

    // Sinkhorn is only used above exact_emd_max_states and only when enabled
    bool approximate_emd = false;
    size_t exact_emd_max_states = 256;
    Real sinkhorn_regularization = 1e-3;
    int sinkhorn_max_iterations = 10000;

    // Evaluate one representative of cuts severing the same edges
    bool prune_equivalent_cuts = true;
    // Cut subsystems reuse the parent's MICE when the cut cannot affect them
    bool reuse_unaffected_mice = true;
    // Under a cut, only re-evaluate mechanisms present in the uncut CES
    bool assume_cuts_cannot_create_new_concepts = false;
    // Zero phi when some node is in no cause or no effect purview
    bool check_trivial_reducibility = false;

    void validate() const;

    // Hash of the fields that decide a MICE: measure, partitions, tie-break, EMD settings
    uint64_t mice_digest() const;

    // Override fields from IIT_* environment variables
    void apply_environment();
};

inline const char* to_string(DistanceMeasure m) {
    switch (m) {
        case DistanceMeasure::EMD: return "EMD";
        case DistanceMeasure::L1: return "L1";
        case DistanceMeasure::KLD: return "KLD";
        case DistanceMeasure::ENTROPY_DIFFERENCE: return "ENTROPY_DIFFERENCE";
    }
    return "?";
}

inline const char* to_string(PartitionScheme s) {
    return s == PartitionScheme::BIPARTITION ? "BIPARTITION" : "TRIPARTITION";
}

inline const char* to_string(CESDistance d) {
    return d == CESDistance::XEMD ? "XEMD" : "SUM_SMALL_PHI";
}

inline const char* to_string(CacheBackend b) {
    switch (b) {
        case CacheBackend::NONE: return "NONE";
        case CacheBackend::IN_MEMORY: return "IN_MEMORY";
        case CacheBackend::EXTERNAL: return "EXTERNAL";
    }
    return "?";
}

inline const char* to_string(ParallelBackend b) {
    return b == ParallelBackend::NONE ? "NONE" : "OPENMP";
}

inline const char* to_string(PurviewTieBreak t) {
    return t == PurviewTieBreak::SMALLEST ? "SMALLEST" : "LARGEST";
}

namespace detail {

template<typename Enum, size_t N>
Enum parse_enum(const std::string& name, const Enum (&values)[N], const char* what) {
    for (Enum v : values) {
        if (name == to_string(v)) return v;
    }
    throw std::invalid_argument(std::string("unknown ") + what + ": " + name);
}

}  // namespace detail

inline DistanceMeasure parse_distance_measure(const std::string& name) {
    static const DistanceMeasure all[] = {DistanceMeasure::EMD, DistanceMeasure::L1,
                                          DistanceMeasure::KLD,
                                          DistanceMeasure::ENTROPY_DIFFERENCE};
    return detail::parse_enum(name, all, "distance measure");
}

inline PartitionScheme parse_partition_scheme(const std::string& name) {
    static const PartitionScheme all[] = {PartitionScheme::BIPARTITION,
                                          PartitionScheme::TRIPARTITION};
    return detail::parse_enum(name, all, "partition scheme");
}

inline CESDistance parse_ces_distance(const std::string& name) {
    static const CESDistance all[] = {CESDistance::XEMD, CESDistance::SUM_SMALL_PHI};
    return detail::parse_enum(name, all, "CES distance");
}

inline CacheBackend parse_cache_backend(const std::string& name) {
    static const CacheBackend all[] = {CacheBackend::NONE, CacheBackend::IN_MEMORY,
                                       CacheBackend::EXTERNAL};
    return detail::parse_enum(name, all, "cache backend");
}

inline ParallelBackend parse_parallel_backend(const std::string& name) {
    static const ParallelBackend all[] = {ParallelBackend::NONE, ParallelBackend::OPENMP};
    return detail::parse_enum(name, all, "parallel backend");
}

inline PurviewTieBreak parse_purview_tie_break(const std::string& name) {
    static const PurviewTieBreak all[] = {PurviewTieBreak::SMALLEST, PurviewTieBreak::LARGEST};
    return detail::parse_enum(name, all, "purview tie-break");
}

inline void Config::validate() const {
    if (!(numerical_tolerance > 0) || numerical_tolerance > 1e-2) {
        throw std::invalid_argument("numerical_tolerance must be in (0, 1e-2]");
    }
    if (num_threads < 0) {
        throw std::invalid_argument("num_threads must be >= 0");
    }
    if (parallel_chunk_size < 1) {
        throw std::invalid_argument("parallel_chunk_size must be >= 1");
    }
    if (timeout.count() < 0) {
        throw std::invalid_argument("timeout must be >= 0");
    }
    if (approximate_emd) {
        if (!(sinkhorn_regularization > 0)) {
            throw std::invalid_argument("sinkhorn_regularization must be > 0");
        }
        if (sinkhorn_max_iterations < 1) {
            throw std::invalid_argument("sinkhorn_max_iterations must be >= 1");
        }
    }
}

inline uint64_t Config::mice_digest() const {
    uint64_t h = hash::combine(hash::FNV_OFFSET, static_cast<uint64_t>(distance_measure));
    h = hash::combine(h, static_cast<uint64_t>(partition_scheme));
    h = hash::combine(h, static_cast<uint64_t>(purview_tie_break));
    h = hash::fnv1a(&numerical_tolerance, sizeof(Real), h);
    h = hash::combine(h, approximate_emd);
    if (approximate_emd) {
        h = hash::combine(h, exact_emd_max_states);
        h = hash::fnv1a(&sinkhorn_regularization, sizeof(Real), h);
        h = hash::combine(h, static_cast<uint64_t>(sinkhorn_max_iterations));
    }
    return h;
}

inline void Config::apply_environment() {
    if (const char* v = std::getenv("IIT_DISTANCE_MEASURE")) {
        distance_measure = parse_distance_measure(v);
    }
    if (const char* v = std::getenv("IIT_PARTITION_SCHEME")) {
        partition_scheme = parse_partition_scheme(v);
    }
    if (const char* v = std::getenv("IIT_CES_DISTANCE")) {
        ces_distance = parse_ces_distance(v);
    }
    if (const char* v = std::getenv("IIT_PARALLEL_BACKEND")) {
        parallel_backend = parse_parallel_backend(v);
    }
    if (const char* v = std::getenv("IIT_PURVIEW_TIE_BREAK")) {
        purview_tie_break = parse_purview_tie_break(v);
    }
    if (const char* v = std::getenv("IIT_NUM_THREADS")) {
        num_threads = std::stoi(v);
    }
    if (const char* v = std::getenv("IIT_TIMEOUT_MS")) {
        timeout = std::chrono::milliseconds(std::stoll(v));
    }
}

}  // namespace iit
