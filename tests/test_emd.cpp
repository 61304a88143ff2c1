#include "iit/iit.hpp"
#include "test_support.hpp"
#include <cmath>

using namespace iit;
using namespace iit_test;

void test_hamming(TestRun& t) {
    t.check(hamming_distance(0b101, 0b011) == 2, "hamming distance");
    auto m = hamming_matrix(2);
    t.check(m.size() == 16 && m[0 * 4 + 3] == 2 && m[1 * 4 + 2] == 2 && m[2 * 4 + 3] == 1,
            "hamming matrix");
}

void test_exact_emd(TestRun& t) {
    Repertoire p1(0b1, {1.0, 0.0});
    Repertoire q1(0b1, {0.0, 1.0});
    t.check_near(hamming_emd(p1, q1), 1.0, 1e-12, "single node flip");

    Repertoire delta(0b11, {1.0, 0.0, 0.0, 0.0});
    Repertoire far(0b11, {0.0, 0.0, 0.0, 1.0});
    Repertoire mid(0b11, {0.0, 0.5, 0.5, 0.0});
    t.check_near(hamming_emd(delta, far), 2.0, 1e-12, "two bit flip");
    t.check_near(hamming_emd(delta, mid), 1.0, 1e-12, "split mass");
    t.check_near(hamming_emd(mid, delta), hamming_emd(delta, mid), 1e-12, "symmetric");
    t.check(hamming_emd(mid, mid) == 0.0, "identical inputs give exactly zero");

    Repertoire uniform = Repertoire::max_entropy(0b111);
    Repertoire corner(0b111, {1, 0, 0, 0, 0, 0, 0, 0});
    t.check_near(hamming_emd(corner, uniform), 1.5, 1e-9, "corner to uniform");

    t.check_throws<std::invalid_argument>([&] { hamming_emd(p1, delta); }, "purview mismatch");
    t.check_throws<NumericalInstabilityError>(
        [] { exact_emd_ssp({1.0, 0.0}, {0.5, 0.0}, hamming_matrix(1), 2); },
        "unequal masses rejected");
}

void test_effect_emd(TestRun& t) {
    Repertoire delta(0b11, {1.0, 0.0, 0.0, 0.0});
    Repertoire uniform = Repertoire::max_entropy(0b11);
    t.check_near(effect_emd(delta, uniform), 1.0, 1e-12, "closed form");
    t.check_near(emd(delta, uniform, Direction::EFFECT),
                 emd(delta, uniform, Direction::CAUSE), 1e-9,
                 "closed form agrees with transport on product distributions");
}

void test_sinkhorn(TestRun& t) {
    std::vector<Real> p = {0.30, 0.05, 0.10, 0.05, 0.20, 0.10, 0.15, 0.05};
    std::vector<Real> q = {0.05, 0.20, 0.10, 0.15, 0.05, 0.25, 0.10, 0.10};
    auto cost = hamming_matrix(3);
    Real exact = exact_emd_ssp(p, q, cost, 8);

    ApproximateEMD approx = sinkhorn_emd(p, q, cost, 8, 0.1, 100000);
    t.check(std::abs(approx.value - exact) <= approx.error_bound, "Sinkhorn within its bound",
            std::to_string(approx.value) + " vs " + std::to_string(exact) + " +/- " +
            std::to_string(approx.error_bound));
    t.check(approx.iterations > 0, "Sinkhorn reports iterations");

    // A point mass forces the plan: the answer is exact
    std::vector<Real> corner = {1, 0, 0, 0, 0, 0, 0, 0};
    std::vector<Real> flat(8, 0.125);
    t.check_near(sinkhorn_emd(corner, flat, cost, 8, 0.1, 1000).value, 1.5, 1e-6,
                 "Sinkhorn on a point mass");

    t.check_throws<NumericalInstabilityError>(
        [&] { sinkhorn_emd(p, q, cost, 8, 0.1, 1); }, "non-convergence reported");

    // Routed through hamming_emd only when enabled and above the exact limit
    EMDOptions opts;
    opts.allow_approximate = true;
    opts.exact_max_states = 4;
    opts.regularization = 0.1;
    opts.max_iterations = 100000;
    Repertoire rp(0b111, p);
    Repertoire rq(0b111, q);
    Real routed = hamming_emd(rp, rq, opts);
    t.check(std::abs(routed - exact) <= 0.1 * 2 * std::log(8.0) + 1e-3,
            "approximate path used above the limit");

    opts.exact_max_states = 8;
    t.check_near(hamming_emd(rp, rq, opts), exact, 1e-9, "exact at or below the limit");
}

void test_distance_measures(TestRun& t) {
    Repertoire p(0b1, {1.0, 0.0});
    Repertoire q(0b1, {0.0, 1.0});
    Repertoire half(0b1, {0.5, 0.5});

    t.check_near(l1_distance(p, q), 2.0, 1e-12, "L1");
    t.check(std::isinf(kld(half, p)), "KLD infinite off the support");
    t.check_near(kld(p, half), 1.0, 1e-12, "KLD in bits");
    t.check(kld(half, half) == 0.0, "KLD of identical");
    t.check_near(entropy_difference(half, p), 1.0, 1e-12, "entropy difference");

    t.check(repertoire_distance(DistanceMeasure::EMD, half, half, Direction::CAUSE) == 0.0,
            "identical repertoires are at distance zero");
    t.check_near(repertoire_distance(DistanceMeasure::L1, p, half, Direction::CAUSE), 1.0,
                 1e-12, "dispatch L1");
    t.check_near(repertoire_distance(DistanceMeasure::EMD, p, half, Direction::EFFECT), 0.5,
                 1e-12, "dispatch EMD");

    Repertoire broken(0b1, {std::nan(""), 0.5});
    t.check_throws<NumericalInstabilityError>(
        [&] { repertoire_distance(DistanceMeasure::L1, broken, half, Direction::CAUSE); },
        "NaN distance rejected");
}

int main() {
    TestRun t("Earth mover's distance and repertoire distances");

    test_hamming(t);
    test_exact_emd(t);
    test_effect_emd(t);
    test_sinkhorn(t);
    test_distance_measures(t);

    return t.finish();
}
