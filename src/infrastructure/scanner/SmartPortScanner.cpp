#include "infrastructure/scanner/SmartPortScanner.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/fmt/ranges.h>

#include <set>
#include <stop_token>
#include <vector>

namespace channelscout::infra {

namespace {

class SmartScanStream : public core::IResultStream {
public:
    enum class Phase { Exhaustive, Discovery, FollowUp };

    SmartScanStream(std::shared_ptr<const core::MulticastStrategy> strategy,
                    std::shared_ptr<core::IStreamValidator> validator, bool smart,
                    std::chrono::seconds discoveryTimeout, std::chrono::seconds probeTimeout)
        : strategy_(std::move(strategy)),
          validator_(std::move(validator)),
          addressCount_(strategy_->addressCount()),
          activePorts_(strategy_->ports()),
          discoveryTimeout_(discoveryTimeout),
          probeTimeout_(probeTimeout) {
        phase_ = (smart && addressCount_ > 1) ? Phase::Discovery : Phase::Exhaustive;
    }

    std::optional<core::ValidationResult> next() override {
        if (stop_.stop_requested()) {
            throw core::OperationCancelled();
        }

        while (addressIndex_ < addressCount_) {
            if (portIndex_ >= activePorts_.size()) {
                if (phase_ == Phase::Discovery) {
                    finishDiscovery();
                } else {
                    ++addressIndex_;
                    portIndex_ = 0;
                }
                continue;
            }

            auto port = activePorts_[portIndex_++];
            auto url = strategy_->buildUrl(addressAt(addressIndex_), port);
            auto timeout = phase_ == Phase::Discovery ? discoveryTimeout_ : probeTimeout_;

            auto result = validator_->validate(url, timeout, stop_.get_token());
            if (phase_ == Phase::Discovery && result.isValid) {
                discovered_.insert(port);
            }
            return result;
        }
        return std::nullopt;
    }

    void cancel() override { stop_.request_stop(); }

private:
    void finishDiscovery() {
        auto first = addressAt(0).toString();
        spdlog::debug("SmartPortScanner: discovered ports [{}] on {}",
                      fmt::join(discovered_, ", "), first);

        phase_ = Phase::FollowUp;
        addressIndex_ = 1;
        portIndex_ = 0;
        if (discovered_.empty()) {
            spdlog::warn("SmartPortScanner: no ports discovered on {}; falling back to full scan.",
                         first);
            activePorts_ = strategy_->ports();
        } else {
            activePorts_.assign(discovered_.begin(), discovered_.end());
        }
    }

    core::Ipv4Address addressAt(size_t index) const {
        for (const auto& range : strategy_->ranges()) {
            if (index < range.size()) {
                return core::Ipv4Address(range.start.value() + static_cast<uint32_t>(index));
            }
            index -= range.size();
        }
        throw std::out_of_range("multicast address index out of range");
    }

    std::shared_ptr<const core::MulticastStrategy> strategy_;
    std::shared_ptr<core::IStreamValidator> validator_;
    size_t addressCount_;
    std::vector<uint16_t> activePorts_;
    std::set<uint16_t> discovered_;
    std::chrono::seconds discoveryTimeout_;
    std::chrono::seconds probeTimeout_;
    Phase phase_;
    size_t addressIndex_{0};
    size_t portIndex_{0};
    std::stop_source stop_;
};

} // namespace

SmartPortScanner::SmartPortScanner(std::shared_ptr<const core::MulticastStrategy> strategy,
                                   std::shared_ptr<core::IStreamValidator> validator,
                                   bool enableSmartScan,
                                   std::optional<std::chrono::seconds> discoveryTimeout,
                                   std::chrono::seconds probeTimeout)
    : strategy_(std::move(strategy)),
      validator_(std::move(validator)),
      enableSmartScan_(enableSmartScan),
      discoveryTimeout_(discoveryTimeout),
      probeTimeout_(probeTimeout) {
    if (!strategy_ || !validator_) {
        throw std::invalid_argument("SmartPortScanner requires a strategy and a validator");
    }
}

std::unique_ptr<core::IResultStream> SmartPortScanner::scan() const {
    return std::make_unique<SmartScanStream>(strategy_, validator_, enableSmartScan_,
                                             discoveryTimeout_.value_or(probeTimeout_),
                                             probeTimeout_);
}

} // namespace channelscout::infra
