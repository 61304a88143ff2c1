#include "iit/iit.hpp"
#include "test_support.hpp"
#include "validation_data.hpp"
#include <iomanip>
#include <iostream>
#include <sstream>

using namespace iit;
using namespace iit_test;

int main() {
    TestRun t("IITPhi reference values");

    // Reference values are printed to six places
    const Real tolerance = 1e-4;

    for (const auto& tc : get_validation_cases()) {
        Network network(build_tpm(tc.n_nodes, tc.tpm_data), build_cm(tc.n_nodes, tc.cm_data));

        Config config;
        config.purview_tie_break = tc.tie_break;
        BigPhiResult result = compute_big_phi(network, tc.nodes, tc.state, config);

        SystemCut expected_cut(tc.expected_from, tc.expected_to);
        std::ostringstream detail;
        detail << std::fixed << std::setprecision(6) << "phi=" << result.phi << " (expected "
               << tc.expected_phi << "), concepts=" << result.ces.size() << " (expected "
               << tc.expected_n_concepts << "), cut " << result.cut.to_string() << " (expected "
               << expected_cut.to_string() << ")";

        bool ok = std::abs(result.phi - tc.expected_phi) < tolerance &&
                  result.ces.size() == tc.expected_n_concepts && result.cut == expected_cut;
        t.check(ok, tc.name, detail.str());
    }

    return t.finish();
}
