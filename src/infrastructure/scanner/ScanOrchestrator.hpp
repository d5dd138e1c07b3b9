#pragma once

#include "core/services/IScanOrchestrator.hpp"
#include "core/services/IStreamValidator.hpp"
#include "infrastructure/network/AsioContext.hpp"
#include "infrastructure/scanner/RateLimiter.hpp"

#include <memory>
#include <mutex>
#include <vector>

namespace channelscout::infra {

/**
 * @brief Drives a target strategy through a validator under a RateLimiter.
 *
 * Results are produced one per call to next(), in target order. After every result
 * the progress counters are updated and all progress observers are run on the
 * worker pool concurrently; next() returns only once every observer has finished.
 * An observer that throws is logged and skipped.
 */
class ScanOrchestrator : public core::IScanOrchestrator {
public:
    /**
     * @brief Constructs an orchestrator.
     * @param validator Validator for individual targets.
     * @param limiter Admission gate shared by every probe.
     * @param context Worker pool used for observer dispatch; must outlive returned streams.
     */
    ScanOrchestrator(std::shared_ptr<core::IStreamValidator> validator,
                     std::shared_ptr<RateLimiter> limiter, AsioContext& context);

    void onProgress(ProgressCallback callback) override;

    std::unique_ptr<core::IResultStream>
    executeScan(std::shared_ptr<const core::ITargetStrategy> strategy,
                std::chrono::seconds probeTimeout) override;

    std::unique_ptr<core::IResultStream>
    executeSmartScan(std::shared_ptr<const core::MulticastStrategy> strategy,
                     std::chrono::seconds probeTimeout,
                     std::chrono::seconds discoveryTimeout) override;

private:
    std::unique_ptr<core::IResultStream> withProgress(std::unique_ptr<core::IResultStream> inner,
                                                      size_t total);

    std::shared_ptr<core::IStreamValidator> limitedValidator_;
    AsioContext& context_;
    std::vector<ProgressCallback> callbacks_;
    std::mutex callbacksMutex_;
};

} // namespace channelscout::infra
