#pragma once

#include "iit/core/budget.hpp"
#include "iit/core/config.hpp"
#include <omp.h>
#include <atomic>
#include <cstddef>
#include <exception>
#include <vector>

namespace iit {

/**
 * Fans independent indexed tasks out over OpenMP worker threads.
 *
 * A task returns true to short-circuit: every index above it is skipped,
 * every index below it still runs. A task that throws records its
 * exception and also stops higher indices. After all workers join, the
 * lowest-index failure below the final stop point is rethrown; failures
 * above it are discarded. The outcome therefore does not depend on
 * scheduling order.
 *
 * Calls made from inside a parallel region run inline on the calling
 * thread.
 */
class Executor {
public:
    explicit Executor(const Config& config)
        : backend_(config.parallel_backend)
        , num_threads_(config.num_threads)
        , chunk_size_(config.parallel_chunk_size)
    {}

    bool parallel() const {
        return backend_ == ParallelBackend::OPENMP && !omp_in_parallel();
    }

    /**
     * Run task(i) for i in [0, count). Returns the short-circuit index, or
     * count if no task short-circuited.
     */
    template<typename Task>
    size_t run(size_t count, Task&& task, const Budget& budget) const {
        // First index to skip; count + 1 while nothing has stopped the run
        std::atomic<size_t> stop{count + 1};
        std::vector<std::exception_ptr> errors(count);

        auto lower_stop = [&](size_t i) {
            size_t current = stop.load(std::memory_order_relaxed);
            while (i < current &&
                   !stop.compare_exchange_weak(current, i, std::memory_order_relaxed)) {
            }
        };

        auto body = [&](size_t i) {
            if (i >= stop.load(std::memory_order_relaxed)) return;
            try {
                budget.check();
                if (task(i)) lower_stop(i + 1);
            } catch (...) {
                errors[i] = std::current_exception();
                lower_stop(i + 1);
            }
        };

        if (parallel() && count > 1) {
            int threads = num_threads_ > 0 ? num_threads_ : omp_get_max_threads();
            long n = static_cast<long>(count);
            #pragma omp parallel for schedule(dynamic, chunk_size_) num_threads(threads)
            for (long i = 0; i < n; ++i) {
                body(static_cast<size_t>(i));
            }
        } else {
            for (size_t i = 0; i < count && i < stop.load(std::memory_order_relaxed); ++i) {
                body(i);
            }
        }

        size_t final_stop = stop.load();
        for (size_t i = 0; i < final_stop && i < count; ++i) {
            if (errors[i]) std::rethrow_exception(errors[i]);
        }
        return final_stop > count ? count : final_stop - 1;
    }

private:
    ParallelBackend backend_;
    int num_threads_;
    int chunk_size_;
};

}  // namespace iit
