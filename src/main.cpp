#include "iit/iit.hpp"
#include <iostream>
#include <iomanip>

using namespace iit;

/**
 * A = OR(B, C), B = COPY(C), C = XOR(A, B).
 *
 * The standard three-node example network of the IIT 3.0 literature.
 */
Network create_basic_network() {
    TPM tpm(3);
    for (StateIndex s = 0; s < 8; ++s) {
        uint8_t a = state::get_bit(s, 0);
        uint8_t b = state::get_bit(s, 1);
        uint8_t c = state::get_bit(s, 2);
        tpm(s, 0) = static_cast<Real>(b | c);
        tpm(s, 1) = static_cast<Real>(c);
        tpm(s, 2) = static_cast<Real>(a ^ b);
    }

    ConnectivityMatrix cm(3);
    cm(0, 2) = 1;  // A -> C
    cm(1, 0) = 1;  // B -> A
    cm(1, 2) = 1;  // B -> C
    cm(2, 0) = 1;  // C -> A
    cm(2, 1) = 1;  // C -> B

    return Network(std::move(tpm), std::move(cm));
}

/**
 * Every node takes the majority of all three at the previous step.
 */
Network create_majority_network() {
    TPM tpm(3);
    for (StateIndex s = 0; s < 8; ++s) {
        Real majority = bits::popcount(static_cast<NodeSet>(s)) >= 2 ? 1.0 : 0.0;
        for (NodeIndex node = 0; node < 3; ++node) {
            tpm(s, node) = majority;
        }
    }
    return Network(std::move(tpm), ConnectivityMatrix::fully_connected(3));
}

void print_result(const char* name, const BigPhiResult& result) {
    std::cout << name << " in state " << state::to_string(result.state, 3) << std::endl;
    std::cout << "  BigPhi = " << result.phi << std::endl;
    std::cout << "  MIP: " << result.cut.to_string() << " (" << result.cuts_evaluated
              << " cuts evaluated)" << std::endl;
    std::cout << "  CES has " << result.ces.size() << " concepts, total_phi="
              << result.ces.total_phi() << std::endl;

    for (size_t i = 0; i < result.ces.size(); ++i) {
        const auto& c = result.ces[i];
        std::cout << "    mechanism=" << bits::to_string(c.mechanism)
                  << " phi=" << c.phi()
                  << " (cause=" << c.cause.phi << " over " << bits::to_string(c.cause.purview)
                  << ", effect=" << c.effect.phi << " over " << bits::to_string(c.effect.purview)
                  << ")" << std::endl;
    }
    std::cout << std::endl;
}

int main() {
    std::cout << "IITPhi " << iit::VERSION << " (" << iit::VERSION_NAME << ")" << std::endl;
    std::cout << "========================================" << std::endl;
    std::cout << std::fixed << std::setprecision(6);

    Config config;
    try {
        config.apply_environment();
    } catch (const std::exception& e) {
        std::cerr << "bad configuration: " << e.what() << std::endl;
        return 2;
    }
    std::cout << "distance=" << to_string(config.distance_measure)
              << " ces_distance=" << to_string(config.ces_distance)
              << " tie_break=" << to_string(config.purview_tie_break)
              << " parallel=" << to_string(config.parallel_backend) << std::endl << std::endl;

    Network basic = create_basic_network();
    Network majority = create_majority_network();

    try {
        print_result("Basic OR/COPY/XOR network",
                     compute_big_phi(basic, basic.node_set(), state::from_vector({1, 0, 0}),
                                     config));
        print_result("Majority network",
                     compute_big_phi(majority, majority.node_set(), 0, config));
    } catch (const Error& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    }

    std::cout << "========================================" << std::endl;
    return 0;
}
