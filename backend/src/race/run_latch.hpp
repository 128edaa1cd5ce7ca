#pragma once
#include <atomic>
#include <cstddef>

// Counts runners reaching a terminal state. The arrival that brings the count
// to the configured endpoint count is the one that drives the final report.
class RunLatch {
public:
    explicit RunLatch(std::size_t expected) : expected_(expected) {}

    // True exactly once: for the arrival completing the set.
    bool arrive() noexcept {
        return arrived_.fetch_add(1, std::memory_order_acq_rel) + 1 == expected_;
    }

    std::size_t arrived() const noexcept { return arrived_.load(std::memory_order_acquire); }
    std::size_t expected() const noexcept { return expected_; }
    bool done() const noexcept { return arrived() >= expected_; }

private:
    const std::size_t expected_;
    std::atomic<std::size_t> arrived_{0};
};
