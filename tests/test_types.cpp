#include "iit/iit.hpp"
#include "test_support.hpp"
#include <chrono>
#include <cstdlib>
#include <thread>

using namespace iit;
using namespace iit_test;

void test_bits(TestRun& t) {
    NodeSet set = bits::make_set({0, 2, 3});
    t.check(set == 0b1101, "make_set");
    t.check(bits::popcount(set) == 3, "popcount");
    t.check(bits::contains(set, 2) && !bits::contains(set, 1), "contains");
    t.check(bits::to_string(set) == "{0,2,3}", "to_string", bits::to_string(set));
    t.check(bits::to_vector(set) == std::vector<NodeIndex>({0, 2, 3}), "to_vector");
    t.check(bits::full_set(3) == 0b111, "full_set");
    t.check(bits::difference(set, bits::make_set({2})) == 0b1001, "difference");
    t.check(bits::is_subset(0b0101, set) && !bits::is_subset(0b0010, set), "is_subset");
}

void test_canonical_order(TestRun& t) {
    t.check(bits::lex_less(bits::make_set({0, 2}), bits::make_set({1})), "lex {0,2} < {1}");
    t.check(bits::lex_less(bits::make_set({0}), bits::make_set({0, 1})), "lex prefix first");
    t.check(!bits::lex_less(bits::make_set({1}), bits::make_set({1})), "lex irreflexive");
    t.check(bits::canonical_less(bits::make_set({2}), bits::make_set({0, 1})),
            "canonical: smaller set first");

    std::vector<NodeSet> subsets = bits::subsets(0b111);
    std::vector<NodeSet> expected = {0b001, 0b010, 0b100, 0b011, 0b101, 0b110, 0b111};
    t.check(subsets == expected, "subsets in canonical order");

    std::vector<NodeSet> sparse = bits::subsets(bits::make_set({1, 4}));
    t.check(sparse == std::vector<NodeSet>({0b00010, 0b10000, 0b10010}),
            "subsets of a sparse set");
}

void test_state(TestRun& t) {
    StateIndex idx = state::from_vector({1, 0, 1});
    t.check(idx == 5, "from_vector little-endian");
    auto back = state::to_vector(idx, 3);
    t.check(back == std::vector<uint8_t>({1, 0, 1}), "to_vector");
    t.check(state::to_string(idx, 3) == "(1,0,1)", "state to_string");
    t.check(state::extract_bits(0b11010, 0b10110) == 0b101, "extract_bits");
    t.check(state::expand_bits(0b101, 0b10110) == 0b10010, "expand_bits");
    t.check(state::extract_bits(state::expand_bits(0b11, 0b1010), 0b1010) == 0b11,
            "extract inverts expand");
    t.check(state::set_bit(0b100, 0, 1) == 0b101 && state::set_bit(0b101, 2, 0) == 0b001,
            "set_bit");
}

void test_hash(TestRun& t) {
    uint64_t a = hash::combine(hash::FNV_OFFSET, 42);
    t.check(a == hash::combine(hash::FNV_OFFSET, 42), "hash deterministic");
    t.check(a != hash::combine(hash::FNV_OFFSET, 43), "hash separates values");
    t.check(hash::combine(a, 1) != hash::combine(hash::combine(hash::FNV_OFFSET, 1), 42),
            "hash is order sensitive");
}

void test_fp(TestRun& t) {
    t.check(fp::is_zero(1e-12) && !fp::is_zero(1e-6), "is_zero");
    t.check(fp::equal(0.1 + 0.2, 0.3), "equal within tolerance");
    t.check(fp::less_than(1.0, 2.0) && !fp::less_than(1.0, 1.0 + 1e-12), "less_than");
}

void test_config(TestRun& t) {
    Config config;
    t.check(config.distance_measure == DistanceMeasure::EMD &&
            config.partition_scheme == PartitionScheme::BIPARTITION &&
            config.ces_distance == CESDistance::XEMD &&
            config.purview_tie_break == PurviewTieBreak::SMALLEST,
            "defaults");

    t.check(parse_distance_measure("KLD") == DistanceMeasure::KLD, "parse distance measure");
    t.check(parse_partition_scheme("TRIPARTITION") == PartitionScheme::TRIPARTITION,
            "parse partition scheme");
    t.check(parse_purview_tie_break(to_string(PurviewTieBreak::LARGEST)) ==
            PurviewTieBreak::LARGEST, "tie-break name round trip");
    t.check_throws<std::invalid_argument>([] { parse_distance_measure("HAMMING"); },
                                          "unknown measure name");
    t.check_throws<std::invalid_argument>([] { parse_cache_backend("redis"); },
                                          "unknown cache backend");

    config.validate();
    t.check(true, "default config validates");

    Config bad;
    bad.numerical_tolerance = 0;
    t.check_throws<std::invalid_argument>([&] { bad.validate(); }, "zero tolerance rejected");

    bad = Config();
    bad.parallel_chunk_size = 0;
    t.check_throws<std::invalid_argument>([&] { bad.validate(); }, "zero chunk size rejected");

    bad = Config();
    bad.approximate_emd = true;
    bad.sinkhorn_regularization = -1;
    t.check_throws<std::invalid_argument>([&] { bad.validate(); },
                                          "negative regularization rejected");

    setenv("IIT_PURVIEW_TIE_BREAK", "LARGEST", 1);
    setenv("IIT_NUM_THREADS", "3", 1);
    Config env;
    env.apply_environment();
    unsetenv("IIT_PURVIEW_TIE_BREAK");
    unsetenv("IIT_NUM_THREADS");
    t.check(env.purview_tie_break == PurviewTieBreak::LARGEST && env.num_threads == 3,
            "environment overrides");

    setenv("IIT_CES_DISTANCE", "NOPE", 1);
    Config env_bad;
    t.check_throws<std::invalid_argument>([&] { env_bad.apply_environment(); },
                                          "bad environment value rejected");
    unsetenv("IIT_CES_DISTANCE");
}

void test_errors(TestRun& t) {
    InvalidTPMError e("row 3");
    t.check(std::string(e.what()) == "invalid TPM: row 3", "error message prefix");
    bool is_error = false;
    try {
        throw NumericalInstabilityError("x");
    } catch (const Error&) {
        is_error = true;
    }
    t.check(is_error, "errors share the iit::Error base");
}

void test_log(TestRun& t) {
    t.check(log::parse_level("DEBUG", LogLevel::WARN) == LogLevel::DEBUG, "parse level");
    t.check(log::parse_level("loud", LogLevel::WARN) == LogLevel::WARN, "unknown level falls back");

    LogLevel saved = log::level();
    log::set_level(LogLevel::ERROR);
    t.check(!log::enabled(LogLevel::WARN) && log::enabled(LogLevel::ERROR), "threshold");
    log::set_level(LogLevel::OFF);
    t.check(!log::enabled(LogLevel::ERROR), "OFF silences everything");
    log::set_level(saved);
}

void test_budget(TestRun& t) {
    Budget unlimited;
    unlimited.check();
    t.check(!unlimited.exhausted(), "no deadline by default");

    Budget shared;
    Budget copy = shared;
    copy.cancel();
    t.check(shared.cancelled(), "copies share the cancellation flag");
    t.check_throws<CancelledError>([&] { shared.check(); }, "cancelled budget throws");

    Budget tight(std::chrono::milliseconds(1));
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
    t.check_throws<TimeoutError>([&] { tight.check(); }, "expired budget throws");

    Budget zero(std::chrono::milliseconds(0));
    t.check(!zero.expired(), "zero timeout means no deadline");
}

int main() {
    TestRun t("Types, configuration and support");

    test_bits(t);
    test_canonical_order(t);
    test_state(t);
    test_hash(t);
    test_fp(t);
    test_config(t);
    test_errors(t);
    test_log(t);
    test_budget(t);

    return t.finish();
}
