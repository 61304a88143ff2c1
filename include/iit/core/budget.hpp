#pragma once

#include "iit/core/errors.hpp"
#include <atomic>
#include <chrono>
#include <memory>
#include <string>

namespace iit {

/**
 * Deadline plus cancellation flag shared by every task of one computation.
 *
 * Copies share the same flag, so cancel() on any copy (or on the token
 * handed to another thread) stops every outstanding evaluation at its next
 * check().
 */
class Budget {
public:
    using Clock = std::chrono::steady_clock;

    Budget() : cancelled_(std::make_shared<std::atomic<bool>>(false)) {}

    // A zero timeout means no deadline
    explicit Budget(std::chrono::milliseconds timeout) : Budget() {
        if (timeout.count() > 0) {
            has_deadline_ = true;
            deadline_ = Clock::now() + timeout;
        }
    }

    void cancel() { cancelled_->store(true, std::memory_order_relaxed); }

    bool cancelled() const { return cancelled_->load(std::memory_order_relaxed); }

    bool expired() const { return has_deadline_ && Clock::now() >= deadline_; }

    bool exhausted() const { return cancelled() || expired(); }

    // Throw CancelledError or TimeoutError if the computation must stop
    void check(const char* where = "computation") const {
        if (cancelled()) {
            throw CancelledError(std::string(where) + " was cancelled");
        }
        if (expired()) {
            throw TimeoutError(std::string(where) + " exceeded its time budget");
        }
    }

    // Shared handle to the cancellation flag, for a controlling thread
    std::shared_ptr<std::atomic<bool>> token() const { return cancelled_; }

private:
    std::shared_ptr<std::atomic<bool>> cancelled_;
    bool has_deadline_ = false;
    Clock::time_point deadline_{};
};

}  // namespace iit
