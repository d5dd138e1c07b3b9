/**
 * @file IScanOrchestrator.hpp
 * @brief Interface for running a target strategy through validation.
 */

#pragma once

#include "core/services/IResultStream.hpp"
#include "core/strategy/ITargetStrategy.hpp"
#include "core/strategy/MulticastStrategy.hpp"
#include "core/types/ScanSession.hpp"

#include <chrono>
#include <functional>
#include <memory>

namespace channelscout::core {

/**
 * @brief Interface for scan orchestration.
 */
class IScanOrchestrator {
public:
    /**
     * @brief Callback type for progress updates, invoked after each completed probe.
     */
    using ProgressCallback = std::function<void(const ScanProgress&)>;

    virtual ~IScanOrchestrator() = default;

    /**
     * @brief Registers a progress observer.
     */
    virtual void onProgress(ProgressCallback callback) = 0;

    /**
     * @brief Starts a scan over every target of a strategy.
     * @param strategy Strategy to enumerate. Kept alive by the returned stream.
     * @param probeTimeout Timeout handed to the validator for each probe.
     * @return Stream of results in target order.
     */
    virtual std::unique_ptr<IResultStream>
    executeScan(std::shared_ptr<const ITargetStrategy> strategy,
                std::chrono::seconds probeTimeout) = 0;

    /**
     * @brief Starts a multicast scan using smart port discovery.
     * @param strategy Multicast strategy to enumerate. Kept alive by the returned stream.
     * @param probeTimeout Timeout for follow-up probes.
     * @param discoveryTimeout Timeout for discovery-phase probes.
     * @return Stream of results, discovery results first.
     */
    virtual std::unique_ptr<IResultStream>
    executeSmartScan(std::shared_ptr<const MulticastStrategy> strategy,
                     std::chrono::seconds probeTimeout, std::chrono::seconds discoveryTimeout) = 0;
};

} // namespace channelscout::core
