#pragma once

#include <atomic>
#include <cstddef>

namespace elevation_tuner::core {

// Progress and interruption state of one search invocation. Owned by the
// caller and passed into the harness; shared by its workers.
class SearchProgress {
public:
    SearchProgress() = default;
    SearchProgress(const SearchProgress&) = delete;
    SearchProgress& operator=(const SearchProgress&) = delete;

    void reset(size_t total) {
        total_.store(total, std::memory_order_relaxed);
        done_.store(0, std::memory_order_relaxed);
    }

    // Returns the new completed count.
    size_t complete_one() { return done_.fetch_add(1, std::memory_order_relaxed) + 1; }

    size_t done() const { return done_.load(std::memory_order_relaxed); }
    size_t total() const { return total_.load(std::memory_order_relaxed); }

    float fraction() const {
        const size_t t = total();
        return t == 0 ? 1.0f : static_cast<float>(done()) / static_cast<float>(t);
    }

    void request_stop() { stop_.store(true, std::memory_order_relaxed); }
    bool stop_requested() const { return stop_.load(std::memory_order_relaxed); }

private:
    std::atomic<size_t> done_{0};
    std::atomic<size_t> total_{0};
    std::atomic<bool> stop_{false};
};

} // namespace elevation_tuner::core
