/**
 * @file IStreamValidator.hpp
 * @brief Interface for validating a single candidate stream.
 */

#pragma once

#include "core/types/ValidationResult.hpp"

#include <chrono>
#include <stop_token>
#include <string>

namespace channelscout::core {

/**
 * @brief Interface for stream validation.
 *
 * Implementations capture every failure mode in the returned result; the only
 * exceptions that may escape are OperationCancelled and ProbeTimeoutError raised
 * by concurrency wrappers around a validator.
 */
class IStreamValidator {
public:
    static constexpr std::chrono::seconds kDefaultTimeout{10};

    virtual ~IStreamValidator() = default;

    /**
     * @brief Validates the stream behind a URL.
     * @param url Candidate stream URL.
     * @param timeout Requested probe timeout.
     * @param stopToken Cooperative cancellation of an in-flight probe.
     * @return The validation result.
     */
    virtual ValidationResult validate(const std::string& url,
                                      std::chrono::seconds timeout = kDefaultTimeout,
                                      std::stop_token stopToken = {}) = 0;

    /**
     * @brief Returns the timeout actually applied to a probe of this URL.
     *
     * Some protocols enforce a floor above the requested value; callers that
     * impose an outer deadline use this to size it.
     */
    virtual std::chrono::seconds effectiveTimeout(const std::string& /*url*/,
                                                  std::chrono::seconds requested) const {
        return requested;
    }
};

} // namespace channelscout::core
