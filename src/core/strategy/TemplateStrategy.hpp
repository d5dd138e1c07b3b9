#pragma once

#include "core/strategy/ITargetStrategy.hpp"
#include "core/types/Ipv4Address.hpp"

#include <string>

namespace channelscout::core {

/**
 * @brief Generates URLs by substituting each address of a private range into a pattern.
 *
 * The pattern must contain the "{ip}" placeholder exactly once. Both ends of the
 * range must be RFC1918 addresses and the range may hold at most kMaxRange addresses.
 */
class TemplateStrategy : public ITargetStrategy {
public:
    static constexpr const char* kPlaceholder = "{ip}";
    static constexpr size_t kMaxRange = 1024;

    /**
     * @brief Constructs and validates a template strategy.
     * @param baseUrl URL pattern containing "{ip}".
     * @param startIp First address of the range (inclusive).
     * @param endIp Last address of the range (inclusive).
     * @throws std::invalid_argument on a missing placeholder, malformed or non-private
     *         addresses, an inverted range, or a range larger than kMaxRange.
     */
    TemplateStrategy(std::string baseUrl, const std::string& startIp, const std::string& endIp);

    ScanMode mode() const override { return ScanMode::Template; }
    size_t estimateTargetCount() const override;
    std::unique_ptr<TargetCursor> generateTargets() const override;

    const std::string& baseUrl() const { return baseUrl_; }
    Ipv4Address startAddress() const { return start_; }
    Ipv4Address endAddress() const { return end_; }

    /**
     * @brief Substitutes an address into the pattern.
     */
    [[nodiscard]] std::string buildUrl(Ipv4Address address) const;

private:
    std::string baseUrl_;
    Ipv4Address start_;
    Ipv4Address end_;
};

} // namespace channelscout::core
