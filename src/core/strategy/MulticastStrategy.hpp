#pragma once

#include "core/strategy/ITargetStrategy.hpp"
#include "core/types/Ipv4Address.hpp"

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace channelscout::core {

/**
 * @brief Inclusive range of multicast addresses.
 */
struct MulticastRange {
    Ipv4Address start;
    Ipv4Address end;

    [[nodiscard]] size_t size() const {
        return static_cast<size_t>(end.value()) - start.value() + 1;
    }

    bool operator==(const MulticastRange& other) const = default;
};

/**
 * @brief Enumerates protocol://address:port targets over multicast ranges.
 *
 * Targets are produced range by range, address by address, and for each address
 * every configured port in configuration order.
 */
class MulticastStrategy : public ITargetStrategy {
public:
    /**
     * @brief Constructs and validates a multicast strategy.
     * @param protocol "udp" or "rtp" (case-insensitive).
     * @param ipRanges Range definitions, either "start-end" or a single address.
     * @param ports Ports to probe on every address, each in [1, 65535].
     * @throws std::invalid_argument on an unsupported protocol, empty ranges or ports,
     *         malformed or inverted ranges, addresses outside 224.0.0.0/4, or bad ports.
     */
    MulticastStrategy(const std::string& protocol, const std::vector<std::string>& ipRanges,
                      const std::vector<int>& ports);

    ScanMode mode() const override { return ScanMode::Multicast; }
    size_t estimateTargetCount() const override;
    std::unique_ptr<TargetCursor> generateTargets() const override;

    const std::string& protocol() const { return protocol_; }
    const std::vector<uint16_t>& ports() const { return ports_; }
    const std::vector<MulticastRange>& ranges() const { return ranges_; }

    /**
     * @brief Total number of addresses across all ranges.
     */
    [[nodiscard]] size_t addressCount() const;

    /**
     * @brief Expands every range into its addresses, in configuration order.
     */
    [[nodiscard]] std::vector<Ipv4Address> addresses() const;

    /**
     * @brief Formats a target URL for this strategy's protocol.
     */
    [[nodiscard]] std::string buildUrl(Ipv4Address address, uint16_t port) const;

    /**
     * @brief Parses a "start-end" or single-address range definition.
     * @throws std::invalid_argument if the range is malformed, inverted or not multicast.
     */
    static MulticastRange parseRange(const std::string& definition);

private:
    std::string protocol_;
    std::vector<MulticastRange> ranges_;
    std::vector<uint16_t> ports_;
};

} // namespace channelscout::core
