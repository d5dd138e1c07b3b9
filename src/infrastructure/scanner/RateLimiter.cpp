#include "infrastructure/scanner/RateLimiter.hpp"

#include <spdlog/spdlog.h>

namespace channelscout::infra {

ProbeTimeoutError::ProbeTimeoutError(std::chrono::milliseconds timeout)
    : std::runtime_error("Operation timed out after " + std::to_string(timeout.count()) + " ms"),
      timeout_(timeout) {}

RateLimiter::RateLimiter(AsioContext& context, int maxConcurrency,
                         std::chrono::milliseconds timeout)
    : context_(context), capacity_(maxConcurrency), timeout_(timeout) {
    if (maxConcurrency < 1 || maxConcurrency > kMaxConcurrency) {
        throw std::invalid_argument("max_concurrency must be between 1 and " +
                                    std::to_string(kMaxConcurrency));
    }
    if (timeout.count() <= 0) {
        throw std::invalid_argument("timeout must be positive");
    }
    spdlog::debug("RateLimiter created: {} slots, {} ms default timeout", capacity_,
                  timeout_.count());
}

int RateLimiter::activeCount() const {
    std::lock_guard lock(slotMutex_);
    return active_;
}

void RateLimiter::acquire(std::stop_token cancel) {
    std::unique_lock lock(slotMutex_);
    if (!slotAvailable_.wait(lock, cancel, [this] { return active_ < capacity_; })) {
        throw core::OperationCancelled();
    }
    ++active_;
}

void RateLimiter::release() {
    {
        std::lock_guard lock(slotMutex_);
        --active_;
    }
    slotAvailable_.notify_one();
}

} // namespace channelscout::infra
