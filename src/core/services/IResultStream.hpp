/**
 * @file IResultStream.hpp
 * @brief Pull-based sequence of validation results produced by a scan.
 */

#pragma once

#include "core/types/ValidationResult.hpp"

#include <optional>
#include <stdexcept>

namespace channelscout::core {

/**
 * @brief Raised when an in-progress operation is aborted by a cancellation request.
 *
 * Cancellation is a normal outcome, not a failure; session code treats it as such.
 */
class OperationCancelled : public std::runtime_error {
public:
    OperationCancelled() : std::runtime_error("Operation cancelled") {}
};

/**
 * @brief Lazy, finite sequence of validation results.
 *
 * Each call to next() performs at most the work needed to produce one result,
 * and results come back in target generation order.
 */
class IResultStream {
public:
    virtual ~IResultStream() = default;

    /**
     * @brief Produces the next result.
     * @return The result, or nullopt once the scan is exhausted.
     * @throws OperationCancelled if cancel() interrupted the pending probe.
     */
    virtual std::optional<ValidationResult> next() = 0;

    /**
     * @brief Requests cooperative cancellation.
     *
     * Safe to call from any thread. An in-flight probe is asked to stop and the
     * next call to next() returns nullopt or throws OperationCancelled.
     */
    virtual void cancel() = 0;
};

} // namespace channelscout::core
