#include "iit/iit.hpp"
#include "test_support.hpp"
#include <vector>

using namespace iit;
using namespace iit_test;

void test_candidates(TestRun& t) {
    Network net = basic_network();

    t.check(causally_significant_nodes(net.cm()) == 0b111, "every node has inputs and outputs");

    // A alone cannot be ON with B = C = 0, C alone cannot be OFF with A = 1, B = 0
    auto all = subsystems(net, 0b001);
    t.check(all == std::vector<NodeSet>({0b010, 0b011, 0b101, 0b110, 0b111}),
            "reachable subsystems in canonical order");

    auto possible = possible_complexes(net, 0b001);
    t.check(possible == std::vector<NodeSet>({0b111, 0b110, 0b101, 0b011, 0b010}),
            "possible complexes largest first");

    t.check(possible_complexes(self_loop_pair(), 0b01).size() == 3,
            "self loops count as inputs and outputs");
    t.check_throws<InvalidSubsystemError>([&] { subsystems(net, 8); }, "state out of range");
}

void test_complexes(TestRun& t) {
    Network net = basic_network();
    Config config = serial_config();

    auto every = all_complexes(net, 0b001, config);
    t.check(every.size() == 5 && every[0].nodes == 0b111, "one result per possible complex");

    auto found = complexes(net, 0b001, config);
    t.check(found.size() == 3, "irreducible complexes");
    if (found.size() == 3) {
        t.check(found[0].nodes == 0b111 && found[1].nodes == 0b110 && found[2].nodes == 0b101,
                "complexes keep the possible-complex order");
        t.check_near(found[1].phi, 1.0, 1e-9, "subsystem BC");
        t.check_near(found[2].phi, 1.0, 1e-9, "subsystem AC");
    }

    BigPhiResult major = major_complex(net, 0b001, config);
    t.check(major.nodes == 0b111, "major complex is the whole network",
            bits::to_string(major.nodes));
    t.check_near(major.phi, 2.0625, 1e-6, "major complex Phi");

    auto kept = condensed(net, 0b001, config);
    t.check(kept.size() == 1 && kept[0].nodes == 0b111, "the major complex covers every node");

    Config threaded = config;
    threaded.parallel_backend = ParallelBackend::OPENMP;
    threaded.num_threads = 4;
    t.check_near(major_complex(net, 0b001, threaded).phi, major.phi, 1e-12,
                 "parallel search finds the same major complex");
}

void test_no_complex(TestRun& t) {
    BigPhiResult none = major_complex(uniform_network(3), 0b101, serial_config());
    t.check(none.is_null() && none.nodes == 0 && none.state == 0b101, "null major complex");
    t.check(condensed(uniform_network(3), 0b101, serial_config()).empty(), "nothing to condense");
}

void test_conceptual_info(TestRun& t) {
    Network net = basic_network();

    t.check_near(conceptual_info(net, 0b111, 0b001, serial_config()), 2.5625, 1e-9,
                 "conceptual information of the basic network");

    Config sum = serial_config();
    sum.ces_distance = CESDistance::SUM_SMALL_PHI;
    Subsystem sub(net, 0b111, 0b001);
    t.check_near(conceptual_info(net, 0b111, 0b001, sum), compute_ces(sub, sum).total_phi(),
                 1e-12, "SUM_SMALL_PHI gives the total small phi");
}

int main() {
    TestRun t("Complexes");

    test_candidates(t);
    test_complexes(t);
    test_no_complex(t);
    test_conceptual_info(t);

    return t.finish();
}
