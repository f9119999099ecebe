// ============================================================================
// AEGIS TRADE CORE - Rate Limiter
// ============================================================================
// Sliding-window request limiter shared by the REST client
// ============================================================================

#include "aegis/network/rest_client.hpp"

#include <deque>
#include <mutex>
#include <thread>

namespace aegis::network {

struct RateLimiter::Impl {
    int max_requests_;
    std::chrono::seconds window_;
    std::deque<std::chrono::steady_clock::time_point> requests_;
    mutable std::mutex mutex_;

    Impl(int max_requests, std::chrono::seconds window)
        : max_requests_(max_requests), window_(window) {}

    bool try_acquire() {
        std::lock_guard<std::mutex> lock(mutex_);
        evict_expired();

        if (static_cast<int>(requests_.size()) >= max_requests_) {
            return false;
        }

        requests_.push_back(std::chrono::steady_clock::now());
        return true;
    }

    void acquire() {
        while (!try_acquire()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    }

    int remaining() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return max_requests_ - static_cast<int>(requests_.size());
    }

    std::chrono::milliseconds time_until_reset() const {
        std::lock_guard<std::mutex> lock(mutex_);
        if (requests_.empty()) {
            return std::chrono::milliseconds(0);
        }

        const auto reset_time = requests_.front() + window_;
        const auto current = std::chrono::steady_clock::now();
        if (reset_time <= current) {
            return std::chrono::milliseconds(0);
        }
        return std::chrono::duration_cast<std::chrono::milliseconds>(reset_time - current);
    }

private:
    void evict_expired() {
        const auto cutoff = std::chrono::steady_clock::now() - window_;
        while (!requests_.empty() && requests_.front() < cutoff) {
            requests_.pop_front();
        }
    }
};

RateLimiter::RateLimiter(int max_requests, std::chrono::seconds window)
    : impl_(std::make_unique<Impl>(max_requests, window)) {}

RateLimiter::~RateLimiter() = default;

bool RateLimiter::try_acquire() {
    return impl_->try_acquire();
}

void RateLimiter::acquire() {
    impl_->acquire();
}

int RateLimiter::remaining() const {
    return impl_->remaining();
}

std::chrono::milliseconds RateLimiter::time_until_reset() const {
    return impl_->time_until_reset();
}

}  // namespace aegis::network
