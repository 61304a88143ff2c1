#include "iit/iit.hpp"
#include "test_support.hpp"
#include <algorithm>

using namespace iit;
using namespace iit_test;

void test_find_mip(TestRun& t) {
    Network net = basic_network();
    Subsystem sub(net, 0b111, 0b001);
    Config config = serial_config();

    MIPResult mip = find_mip(sub, Direction::CAUSE, 0b001, 0b110, config);
    t.check_near(mip.phi, 1.0 / 6, 1e-9, "cause MIP of A over BC");
    t.check(!mip.partition.empty() && !mip.is_reducible(), "MIP found");

    // Evaluation order is canonical whatever order the candidates arrive in
    auto candidates = mip_partitions(0b001, 0b110);
    std::reverse(candidates.begin(), candidates.end());
    MIPResult reversed = find_mip(sub, Direction::CAUSE, 0b001, 0b110, candidates, config);
    t.check(reversed.phi == mip.phi && reversed.partition == mip.partition,
            "candidate order does not change the MIP");

    MIPResult none = find_mip(sub, Direction::CAUSE, 0b001, 0b110, {}, config);
    t.check(none.phi == 0.0 && none.partition.empty(), "no candidates gives zero");

    MIPResult empty = find_mip(sub, Direction::EFFECT, 0, 0b110, config);
    t.check(empty.phi == 0.0, "empty mechanism gives zero");
}

void test_potential_purviews(TestRun& t) {
    Network net = basic_network();
    Subsystem sub(net, 0b111, 0b001);

    // Only C feeds B, and A feeds only C
    auto causes = potential_purviews(sub, Direction::CAUSE, 0b010);
    t.check(causes == std::vector<NodeSet>({0b100}), "cause purviews of B");

    auto effects = potential_purviews(sub, Direction::EFFECT, 0b001);
    t.check(effects == std::vector<NodeSet>({0b100}), "effect purviews of A");
}

void test_concepts(TestRun& t) {
    Network net = basic_network();
    Subsystem sub(net, 0b111, 0b001);
    Config config = serial_config();

    Concept b = compute_concept(sub, 0b010, config);
    t.check_near(b.phi(), 0.25, 1e-9, "concept of B");
    t.check(b.cause.purview == 0b100 && b.effect.purview == 0b001, "purviews of B",
            b.to_string());

    Concept c = compute_concept(sub, 0b100, config);
    t.check_near(c.phi(), 0.5, 1e-9, "concept of C");
    t.check(c.cause.purview == 0b011 && c.effect.purview == 0b010, "purviews of C",
            c.to_string());

    Concept ab = compute_concept(sub, 0b011, config);
    t.check_near(ab.phi(), 1.0 / 3, 1e-9, "concept of AB");
    t.check(ab.cause.purview == 0b110 && ab.effect.purview == 0b100, "purviews of AB",
            ab.to_string());

    Concept a = compute_concept(sub, 0b001, config);
    t.check(a.is_null(), "A alone is reducible", a.to_string());
    t.check(a.phi() == std::min(a.cause.phi, a.effect.phi), "concept phi is the minimum");
}

void test_tie_break(TestRun& t) {
    Network net = basic_network();
    Subsystem sub(net, 0b111, 0b001);

    Config smallest = serial_config();
    Concept first = compute_concept(sub, 0b111, smallest);
    t.check_near(first.phi(), 0.5, 1e-9, "concept of ABC");
    t.check(first.cause.purview == 0b111 && first.effect.purview == 0b101,
            "SMALLEST keeps the first maximal purview", first.to_string());

    Config largest = serial_config();
    largest.purview_tie_break = PurviewTieBreak::LARGEST;
    Concept wide = compute_concept(sub, 0b111, largest);
    t.check_near(wide.phi(), 0.5, 1e-9, "tie-break does not change phi");
    t.check(wide.effect.purview == 0b111, "LARGEST prefers the larger purview",
            wide.to_string());
}

void test_concept_errors(TestRun& t) {
    Network net = basic_network();
    Subsystem ac(net, 0b101, 0b001);
    Config config = serial_config();

    t.check_throws<InvalidSubsystemError>([&] { compute_concept(ac, 0, config); },
                                          "empty mechanism rejected");
    t.check_throws<InvalidSubsystemError>([&] { compute_concept(ac, 0b010, config); },
                                          "mechanism outside the subsystem rejected");

    Config bad = config;
    bad.numerical_tolerance = -1;
    t.check_throws<std::invalid_argument>([&] { compute_concept(ac, 0b001, bad); },
                                          "invalid configuration rejected");

    Budget cancelled;
    cancelled.cancel();
    Subsystem sub(net, 0b111, 0b001);
    t.check_throws<CancelledError>([&] { compute_concept(sub, 0b011, config, cancelled); },
                                   "cancelled budget stops the search");
}

void test_mice_reuse(TestRun& t) {
    Network net = basic_network();
    CacheContext cache(std::make_shared<InMemoryCacheStore>());
    Subsystem sub(net, 0b111, 0b001, SystemCut(), &cache);
    Config config = serial_config();

    MICE uncut = find_mice(sub, Direction::CAUSE, 0b010, config);
    t.check(uncut.purview == 0b100 && uncut.phi > 0, "cause MICE of B");

    // A -> BC does not touch C -> B
    Subsystem spared = sub.apply_cut(SystemCut(0b001, 0b110));
    t.check(!uncut.damaged_by_cut(spared.cut()), "cut leaves the MICE intact");
    uint64_t hits = cache.stats().hits;
    MICE reused = find_mice(spared, Direction::CAUSE, 0b010, config);
    t.check(cache.stats().hits == hits + 1 && reused.phi == uncut.phi &&
            reused.purview == uncut.purview, "undamaged MICE reused");

    // C -> AB removes the only input of B
    Subsystem severed = sub.apply_cut(SystemCut(0b100, 0b011));
    t.check(uncut.damaged_by_cut(severed.cut()), "cut damages the MICE");
    MICE recomputed = find_mice(severed, Direction::CAUSE, 0b010, config);
    t.check(recomputed.phi == 0.0, "damaged MICE recomputed under the cut");

    t.check(find_mice(sub, Direction::CAUSE, 0b010, config).phi == uncut.phi,
            "cut results never replace the uncut entry");
}

int main() {
    TestRun t("Small phi, MICE and concepts");

    test_find_mip(t);
    test_potential_purviews(t);
    test_concepts(t);
    test_tie_break(t);
    test_concept_errors(t);
    test_mice_reuse(t);

    return t.finish();
}
