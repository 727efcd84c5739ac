#include "executor/concurrency_limiter.hpp"

namespace codebox::executor {

ConcurrencyLimiter::ConcurrencyLimiter(std::size_t limit)
    : limit_(limit) {}

void ConcurrencyLimiter::Acquire() {
    std::unique_lock<std::mutex> lock(mutex_);
    if (limit_ > 0) {
        cv_.wait(lock, [this] { return in_flight_ < limit_; });
    }
    ++in_flight_;
}

void ConcurrencyLimiter::Release() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (in_flight_ > 0) {
            --in_flight_;
        }
    }
    cv_.notify_one();
}

std::size_t ConcurrencyLimiter::InFlight() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return in_flight_;
}

}  // namespace codebox::executor
