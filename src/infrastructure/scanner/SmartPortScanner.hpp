#pragma once

#include "core/services/IResultStream.hpp"
#include "core/services/IStreamValidator.hpp"
#include "core/strategy/MulticastStrategy.hpp"

#include <chrono>
#include <memory>
#include <optional>

namespace channelscout::infra {

/**
 * @brief Multicast scanner that reuses the ports found on the first address.
 *
 * Providers usually enable the same port set across a whole multicast block. The
 * scanner probes every configured port on the first address only (discovery), then
 * probes just the ports that validated, sorted ascending, on every remaining address.
 * If discovery finds nothing, the remaining addresses get the full port list.
 *
 * With smart mode disabled, or a single address, every (address, port) pair is probed.
 */
class SmartPortScanner {
public:
    static constexpr std::chrono::seconds kDefaultDiscoveryTimeout{20};

    /**
     * @param strategy Multicast strategy providing addresses, ports and URL format.
     * @param validator Validator used for every probe.
     * @param enableSmartScan Set to false to always probe exhaustively.
     * @param discoveryTimeout Timeout for discovery probes; nullopt uses probeTimeout.
     * @param probeTimeout Timeout for all other probes.
     */
    SmartPortScanner(std::shared_ptr<const core::MulticastStrategy> strategy,
                     std::shared_ptr<core::IStreamValidator> validator, bool enableSmartScan = true,
                     std::optional<std::chrono::seconds> discoveryTimeout = kDefaultDiscoveryTimeout,
                     std::chrono::seconds probeTimeout = core::IStreamValidator::kDefaultTimeout);

    /**
     * @brief Starts the scan.
     * @return Stream of results, discovery results first. Each next() issues one probe.
     */
    [[nodiscard]] std::unique_ptr<core::IResultStream> scan() const;

private:
    std::shared_ptr<const core::MulticastStrategy> strategy_;
    std::shared_ptr<core::IStreamValidator> validator_;
    bool enableSmartScan_;
    std::optional<std::chrono::seconds> discoveryTimeout_;
    std::chrono::seconds probeTimeout_;
};

} // namespace channelscout::infra
