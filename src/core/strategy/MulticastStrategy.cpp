#include "core/strategy/MulticastStrategy.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace channelscout::core {

namespace {

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

class MulticastCursor : public TargetCursor {
public:
    explicit MulticastCursor(const MulticastStrategy& strategy) : strategy_(strategy) {
        if (!strategy_.ranges().empty()) {
            address_ = strategy_.ranges().front().start.value();
        }
    }

    std::optional<std::string> next() override {
        const auto& ranges = strategy_.ranges();
        const auto& ports = strategy_.ports();

        while (rangeIndex_ < ranges.size()) {
            if (address_ > ranges[rangeIndex_].end.value()) {
                ++rangeIndex_;
                if (rangeIndex_ < ranges.size()) {
                    address_ = ranges[rangeIndex_].start.value();
                }
                continue;
            }

            auto url = strategy_.buildUrl(Ipv4Address(static_cast<uint32_t>(address_)),
                                          ports[portIndex_]);
            if (++portIndex_ == ports.size()) {
                portIndex_ = 0;
                ++address_;
            }
            return url;
        }
        return std::nullopt;
    }

private:
    const MulticastStrategy& strategy_;
    size_t rangeIndex_{0};
    uint64_t address_{0};
    size_t portIndex_{0};
};

} // namespace

MulticastStrategy::MulticastStrategy(const std::string& protocol,
                                     const std::vector<std::string>& ipRanges,
                                     const std::vector<int>& ports)
    : protocol_(toLower(protocol)) {
    if (protocol_ != "udp" && protocol_ != "rtp") {
        throw std::invalid_argument("Unsupported protocol '" + protocol +
                                    "'. Supported multicast protocols: rtp, udp");
    }
    if (ipRanges.empty()) {
        throw std::invalid_argument("At least one multicast IP range must be provided.");
    }
    if (ports.empty()) {
        throw std::invalid_argument("At least one port must be provided for multicast scanning.");
    }

    ranges_.reserve(ipRanges.size());
    for (const auto& definition : ipRanges) {
        ranges_.push_back(parseRange(definition));
    }

    ports_.reserve(ports.size());
    for (int port : ports) {
        if (port < 1 || port > 65535) {
            throw std::invalid_argument("Port '" + std::to_string(port) +
                                        "' is out of valid range (1-65535).");
        }
        ports_.push_back(static_cast<uint16_t>(port));
    }
}

MulticastRange MulticastStrategy::parseRange(const std::string& definition) {
    MulticastRange range;
    try {
        auto dash = definition.find('-');
        if (dash != std::string::npos) {
            range.start = Ipv4Address::parse(definition.substr(0, dash));
            range.end = Ipv4Address::parse(definition.substr(dash + 1));
        } else {
            range.start = range.end = Ipv4Address::parse(definition);
        }
    } catch (const std::invalid_argument&) {
        throw std::invalid_argument("Invalid multicast IP range '" + definition + "'.");
    }

    if (range.start > range.end) {
        throw std::invalid_argument("Multicast IP range start must be <= end: '" + definition +
                                    "'.");
    }
    // 224.0.0.0/4 is contiguous, so both ends inside it means the whole range is.
    if (!range.start.isMulticast() || !range.end.isMulticast()) {
        throw std::invalid_argument("IP range '" + definition +
                                    "' must be within the multicast block (224.0.0.0/4).");
    }
    return range;
}

size_t MulticastStrategy::addressCount() const {
    size_t total = 0;
    for (const auto& range : ranges_) {
        total += range.size();
    }
    return total;
}

size_t MulticastStrategy::estimateTargetCount() const {
    return addressCount() * ports_.size();
}

std::unique_ptr<TargetCursor> MulticastStrategy::generateTargets() const {
    return std::make_unique<MulticastCursor>(*this);
}

std::vector<Ipv4Address> MulticastStrategy::addresses() const {
    std::vector<Ipv4Address> result;
    result.reserve(addressCount());
    for (const auto& range : ranges_) {
        for (uint64_t value = range.start.value(); value <= range.end.value(); ++value) {
            result.emplace_back(static_cast<uint32_t>(value));
        }
    }
    return result;
}

std::string MulticastStrategy::buildUrl(Ipv4Address address, uint16_t port) const {
    return protocol_ + "://" + address.toString() + ":" + std::to_string(port);
}

} // namespace channelscout::core
