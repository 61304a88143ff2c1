#include "iit/iit.hpp"
#include "test_support.hpp"
#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace iit;
using namespace iit_test;

static Config openmp_config(int threads) {
    Config config;
    config.parallel_backend = ParallelBackend::OPENMP;
    config.num_threads = threads;
    return config;
}

void test_short_circuit(TestRun& t, const Config& config, const std::string& label) {
    Executor executor(config);

    std::vector<std::atomic<int>> ran(100);
    for (auto& r : ran) r = 0;
    size_t stop = executor.run(100, [&](size_t i) {
        ran[i] = 1;
        return i == 40;
    }, Budget());

    bool prefix = true;
    for (size_t i = 0; i <= 40; ++i) prefix = prefix && ran[i] == 1;
    t.check(stop == 40, label + ": short-circuit index returned");
    t.check(prefix, label + ": every index below the stop ran");

    size_t none = executor.run(10, [](size_t) { return false; }, Budget());
    t.check(none == 10, label + ": count returned when nothing stops");
    t.check(executor.run(0, [](size_t) { return true; }, Budget()) == 0,
            label + ": empty run");
}

void test_errors(TestRun& t, const Config& config, const std::string& label) {
    Executor executor(config);

    try {
        executor.run(50, [](size_t i) {
            if (i == 3) throw std::runtime_error("three");
            if (i == 7) throw std::runtime_error("seven");
            return false;
        }, Budget());
        t.check(false, label + ": lowest failure rethrown", "nothing thrown");
    } catch (const std::runtime_error& e) {
        t.check(std::string(e.what()) == "three", label + ": lowest failure rethrown", e.what());
    }

    // A failure above the stop point never surfaces
    size_t stop = executor.run(50, [](size_t i) {
        if (i == 5) throw std::runtime_error("late");
        return i == 2;
    }, Budget());
    t.check(stop == 2, label + ": failures above the stop are discarded");

    Budget cancelled;
    cancelled.cancel();
    t.check_throws<CancelledError>(
        [&] { executor.run(20, [](size_t) { return false; }, cancelled); },
        label + ": cancelled budget stops the run");
}

void test_nested(TestRun& t) {
    Executor outer(openmp_config(2));
    std::atomic<int> total{0};
    outer.run(4, [&](size_t) {
        Executor inner(openmp_config(2));
        inner.run(5, [&](size_t) {
            ++total;
            return false;
        }, Budget());
        return false;
    }, Budget());
    t.check(total == 20, "nested runs execute every task");
}

void test_budget_in_big_phi(TestRun& t) {
    Network net = basic_network();

    Budget cancelled;
    cancelled.cancel();
    BigPhiCalculator calculator(net, 0b111, 0b001, serial_config(), nullptr, cancelled);
    t.check_throws<CancelledError>([&] { calculator.run(); }, "cancellation reaches Big-Phi");
    t.check(calculator.stage() == BigPhiCalculator::Stage::FAILED, "cancelled run is FAILED");

    Budget tight(std::chrono::milliseconds(1));
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
    t.check_throws<TimeoutError>(
        [&] { compute_big_phi(net, 0b111, 0b001, openmp_config(4), nullptr, tight); },
        "timeout reaches Big-Phi");

    Config timed = serial_config();
    timed.timeout = std::chrono::milliseconds(60000);
    t.check_near(compute_big_phi(net, 0b111, 0b001, timed).phi, 2.0625, 1e-6,
                 "generous timeout does not interfere");
}

void test_determinism(TestRun& t) {
    Network net = basic_network();
    BigPhiResult serial = compute_big_phi(net, 0b111, 0b001, serial_config());
    for (int threads : {1, 2, 4, 8}) {
        BigPhiResult parallel = compute_big_phi(net, 0b111, 0b001, openmp_config(threads));
        std::string label = std::to_string(threads) + " threads";
        t.check_near(parallel.phi, serial.phi, 1e-12, label + ": same Phi");
        t.check(parallel.cut == serial.cut && parallel.ces.size() == serial.ces.size() &&
                parallel.ces.mechanisms() == serial.ces.mechanisms(),
                label + ": same cut and concepts");
    }
}

int main() {
    TestRun t("Parallel execution and budgets");

    test_short_circuit(t, serial_config(), "serial");
    test_short_circuit(t, openmp_config(4), "openmp");
    test_errors(t, serial_config(), "serial");
    test_errors(t, openmp_config(4), "openmp");
    test_nested(t);
    test_budget_in_big_phi(t);
    test_determinism(t);

    return t.finish();
}
