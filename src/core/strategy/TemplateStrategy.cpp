#include "core/strategy/TemplateStrategy.hpp"

#include <stdexcept>

namespace channelscout::core {

namespace {

class TemplateCursor : public TargetCursor {
public:
    TemplateCursor(const TemplateStrategy& strategy, uint64_t first, uint64_t last)
        : strategy_(strategy), current_(first), last_(last) {}

    std::optional<std::string> next() override {
        if (current_ > last_) {
            return std::nullopt;
        }
        auto address = Ipv4Address(static_cast<uint32_t>(current_++));
        return strategy_.buildUrl(address);
    }

private:
    const TemplateStrategy& strategy_;
    uint64_t current_;
    uint64_t last_;
};

} // namespace

TemplateStrategy::TemplateStrategy(std::string baseUrl, const std::string& startIp,
                                   const std::string& endIp)
    : baseUrl_(std::move(baseUrl)) {
    auto first = baseUrl_.find(kPlaceholder);
    if (first == std::string::npos) {
        throw std::invalid_argument(std::string("base_url must contain placeholder ") +
                                    kPlaceholder);
    }
    if (baseUrl_.find(kPlaceholder, first + 1) != std::string::npos) {
        throw std::invalid_argument(std::string("base_url must contain placeholder ") +
                                    kPlaceholder + " exactly once");
    }

    start_ = Ipv4Address::parse(startIp);
    end_ = Ipv4Address::parse(endIp);

    if (start_ > end_) {
        throw std::invalid_argument("start_ip must be less than or equal to end_ip");
    }

    if (estimateTargetCount() > kMaxRange) {
        throw std::invalid_argument("IP range exceeds maximum allowed size of " +
                                    std::to_string(kMaxRange));
    }
    for (uint64_t value = start_.value(); value <= end_.value(); ++value) {
        if (!Ipv4Address(static_cast<uint32_t>(value)).isPrivate()) {
            throw std::invalid_argument("Only RFC1918 private IP ranges are supported.");
        }
    }
}

size_t TemplateStrategy::estimateTargetCount() const {
    return static_cast<size_t>(end_.value()) - start_.value() + 1;
}

std::unique_ptr<TargetCursor> TemplateStrategy::generateTargets() const {
    return std::make_unique<TemplateCursor>(*this, start_.value(), end_.value());
}

std::string TemplateStrategy::buildUrl(Ipv4Address address) const {
    auto url = baseUrl_;
    auto pos = url.find(kPlaceholder);
    url.replace(pos, std::string(kPlaceholder).size(), address.toString());
    return url;
}

} // namespace channelscout::core
