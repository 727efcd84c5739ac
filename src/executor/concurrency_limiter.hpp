#pragma once

#include <condition_variable>
#include <cstddef>
#include <mutex>

namespace codebox::executor {

// Counting semaphore bounding in-flight executions. A limit of 0 never blocks.
class ConcurrencyLimiter {
public:
    explicit ConcurrencyLimiter(std::size_t limit);

    void Acquire();
    void Release();
    std::size_t InFlight() const;

    class Slot {
    public:
        explicit Slot(ConcurrencyLimiter& limiter) : limiter_(limiter) { limiter_.Acquire(); }
        ~Slot() { limiter_.Release(); }
        Slot(const Slot&) = delete;
        Slot& operator=(const Slot&) = delete;

    private:
        ConcurrencyLimiter& limiter_;
    };

private:
    const std::size_t limit_;
    std::size_t in_flight_ = 0;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
};

}  // namespace codebox::executor
