#include "infrastructure/scanner/RateLimitedValidator.hpp"

#include "infrastructure/media/StreamValidator.hpp"

#include <spdlog/spdlog.h>

namespace channelscout::infra {

RateLimitedValidator::RateLimitedValidator(std::shared_ptr<core::IStreamValidator> validator,
                                           std::shared_ptr<RateLimiter> limiter,
                                           std::chrono::seconds grace)
    : validator_(std::move(validator)), limiter_(std::move(limiter)), grace_(grace) {
    if (!validator_ || !limiter_) {
        throw std::invalid_argument("RateLimitedValidator requires a validator and a rate limiter");
    }
}

std::chrono::seconds RateLimitedValidator::effectiveTimeout(const std::string& url,
                                                            std::chrono::seconds requested) const {
    return validator_->effectiveTimeout(url, requested) + grace_;
}

core::ValidationResult RateLimitedValidator::validate(const std::string& url,
                                                      std::chrono::seconds timeout,
                                                      std::stop_token stopToken) {
    auto deadline = effectiveTimeout(url, timeout);
    try {
        return limiter_->execute(
            [validator = validator_, url, timeout](std::stop_token token) {
                return validator->validate(url, timeout, token);
            },
            std::chrono::duration_cast<std::chrono::milliseconds>(deadline), stopToken);
    } catch (const ProbeTimeoutError& e) {
        spdlog::warn("Probe of {} exceeded its deadline: {}", url, e.what());
        return core::ValidationResult::invalid(url,
                                               StreamValidator::detectProtocol(url).value_or("unknown"),
                                               core::ErrorCategory::Timeout, e.what());
    }
}

} // namespace channelscout::infra
