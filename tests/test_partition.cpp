#include "iit/iit.hpp"
#include "test_support.hpp"
#include <algorithm>
#include <set>

using namespace iit;
using namespace iit_test;

static size_t drain(MechanismPartitionGenerator gen) {
    size_t count = 0;
    while (gen.next()) ++count;
    return count;
}

void test_parts(TestRun& t) {
    Part a(0b01, 0b10);
    t.check(a.size() == 2 && !a.is_empty() && Part().is_empty(), "part size");
    t.check(Part(0, 0b100) < Part(0b001, 0), "empty mechanism sorts first");
    t.check(Part(0b001, 0b010) < Part(0b001, 0b100), "then purview");

    Partition p({Part(0b10, 0b01), Part(0b01, 0b10)});
    Partition q({Part(0b01, 0b10), Part(0b10, 0b01)});
    t.check(p == q, "part order does not matter");
    t.check(p.smallest_part() == 2, "smallest part");

    Partition small({Part(0b01, 0), Part(0b10, 0b11)});
    t.check(canonical_less(small, p) && !canonical_less(p, small),
            "smaller smallest part first");
}

void test_bipartitions(TestRun& t) {
    t.check(drain(MechanismPartitionGenerator(PartitionScheme::BIPARTITION, 0b011, 0b111)) == 15,
            "bipartition count for |M|=2, |P|=3");

    BipartitionGenerator single(0b001, 0b010);
    auto only = single.next();
    t.check(only && *only == Partition({Part(0, 0b010), Part(0b001, 0)}),
            "single node pair has one bipartition");
    t.check(!single.next() && !single.next(), "generator is spent after the end");

    auto all = mip_partitions(0b011, 0b111);
    bool valid = true;
    for (const auto& p : all) {
        NodeSet mech = 0, purview = 0;
        for (const auto& part : p.parts) {
            if (part.is_empty()) valid = false;
            mech |= part.mechanism;
            purview |= part.purview;
        }
        if (p.parts.size() != 2 || mech != 0b011 || purview != 0b111) valid = false;
    }
    t.check(valid, "every bipartition covers mechanism and purview with non-empty parts");
    t.check(std::is_sorted(all.begin(), all.end(),
                           [](const Partition& a, const Partition& b) {
                               return canonical_less(a, b);
                           }),
            "mip_partitions in canonical order");
}

void test_tripartitions(TestRun& t) {
    TripartitionGenerator single(0b001, 0b010);
    auto only = single.next();
    t.check(only && !single.next(), "single node pair has one tripartition");

    auto all = mip_partitions(0b011, 0b111, PartitionScheme::TRIPARTITION);
    std::set<std::string> seen;
    bool unique = true;
    bool shaped = true;
    for (const auto& p : all) {
        unique = seen.insert(p.to_string()).second && unique;
        NodeSet mech = 0, purview = 0;
        for (const auto& part : p.parts) {
            mech |= part.mechanism;
            purview |= part.purview;
        }
        shaped = shaped && p.parts.size() == 3 && mech == 0b011 && purview == 0b111;
    }
    t.check(!all.empty(), "tripartitions generated");
    t.check(unique, "no duplicate tripartitions");
    t.check(shaped, "tripartitions cover mechanism and purview");
}

void test_system_cuts(TestRun& t) {
    SystemCut cut(0b001, 0b110);
    t.check(cut.is_cut(0, 1) && !cut.is_cut(1, 0), "is_cut is directional");
    t.check(cut.cuts_connections(0b011, 0b100) && !cut.cuts_connections(0b110, 0b001),
            "cuts_connections");
    t.check(cut.splits_mechanism(0b011) && !cut.splits_mechanism(0b110), "splits_mechanism");
    t.check(SystemCut().is_null() && !cut.is_null(), "null cut");
    t.check(cut.to_string() == "{0} -/-> {1,2}", "cut to_string", cut.to_string());

    SystemCutGenerator gen(0b111);
    t.check(gen.size() == 6, "generator size");
    size_t count = 0;
    while (gen.next()) ++count;
    t.check(count == 6, "three nodes have six directional cuts");

    auto cuts = system_cuts(0b111, ConnectivityMatrix::fully_connected(3));
    std::vector<SystemCut> expected = {
        {0b001, 0b110}, {0b011, 0b100}, {0b101, 0b010},
        {0b010, 0b101}, {0b110, 0b001}, {0b100, 0b011},
    };
    t.check(cuts == expected, "canonical cut order");

    // Chain 0 -> 1 -> 2: pairs of cuts sever the same edges
    ConnectivityMatrix chain(3);
    chain(0, 1) = 1;
    chain(1, 2) = 1;
    auto pruned = system_cuts(0b111, chain, true);
    std::vector<SystemCut> representatives = {{0b001, 0b110}, {0b011, 0b100}, {0b110, 0b001}};
    t.check(pruned == representatives, "equivalent cuts pruned to the first representative");
    t.check(system_cuts(0b111, chain, false).size() == 6, "pruning can be disabled");

    ConnectivityMatrix applied = cut.apply(ConnectivityMatrix::fully_connected(3));
    t.check(applied(0, 1) == 0 && applied(0, 2) == 0 && applied(1, 0) == 1 && applied(0, 0) == 1,
            "apply severs only from -> to");
}

int main() {
    TestRun t("Partitions and system cuts");

    test_parts(t);
    test_bipartitions(t);
    test_tripartitions(t);
    test_system_cuts(t);

    return t.finish();
}
