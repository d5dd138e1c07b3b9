#pragma once

#include "core/services/IStreamValidator.hpp"
#include "infrastructure/scanner/RateLimiter.hpp"

#include <memory>

namespace channelscout::infra {

/**
 * @brief Runs another validator's probes through a RateLimiter.
 *
 * The limiter deadline for each probe is the wrapped validator's effective timeout
 * for that URL plus a fixed grace period. A deadline overrun becomes a TIMEOUT result
 * instead of an exception; cancellation still propagates as core::OperationCancelled.
 */
class RateLimitedValidator : public core::IStreamValidator {
public:
    static constexpr std::chrono::seconds kDeadlineGrace{5};

    RateLimitedValidator(std::shared_ptr<core::IStreamValidator> validator,
                         std::shared_ptr<RateLimiter> limiter,
                         std::chrono::seconds grace = kDeadlineGrace);

    core::ValidationResult validate(const std::string& url,
                                    std::chrono::seconds timeout = kDefaultTimeout,
                                    std::stop_token stopToken = {}) override;

    std::chrono::seconds effectiveTimeout(const std::string& url,
                                          std::chrono::seconds requested) const override;

private:
    std::shared_ptr<core::IStreamValidator> validator_;
    std::shared_ptr<RateLimiter> limiter_;
    std::chrono::seconds grace_;
};

} // namespace channelscout::infra
