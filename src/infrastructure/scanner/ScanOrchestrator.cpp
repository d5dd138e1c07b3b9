#include "infrastructure/scanner/ScanOrchestrator.hpp"

#include "infrastructure/scanner/RateLimitedValidator.hpp"
#include "infrastructure/scanner/SmartPortScanner.hpp"

#include <spdlog/spdlog.h>

#include <future>
#include <stop_token>

namespace channelscout::infra {

namespace {

class StrategyStream : public core::IResultStream {
public:
    StrategyStream(std::shared_ptr<const core::ITargetStrategy> strategy,
                   std::shared_ptr<core::IStreamValidator> validator,
                   std::chrono::seconds probeTimeout)
        : strategy_(std::move(strategy)),
          validator_(std::move(validator)),
          cursor_(strategy_->generateTargets()),
          probeTimeout_(probeTimeout) {}

    std::optional<core::ValidationResult> next() override {
        if (stop_.stop_requested()) {
            throw core::OperationCancelled();
        }
        auto url = cursor_->next();
        if (!url) {
            return std::nullopt;
        }
        return validator_->validate(*url, probeTimeout_, stop_.get_token());
    }

    void cancel() override { stop_.request_stop(); }

private:
    std::shared_ptr<const core::ITargetStrategy> strategy_;
    std::shared_ptr<core::IStreamValidator> validator_;
    std::unique_ptr<core::TargetCursor> cursor_;
    std::chrono::seconds probeTimeout_;
    std::stop_source stop_;
};

class ProgressStream : public core::IResultStream {
public:
    ProgressStream(std::unique_ptr<core::IResultStream> inner, size_t total,
                   std::vector<core::IScanOrchestrator::ProgressCallback> callbacks,
                   AsioContext& context)
        : inner_(std::move(inner)), callbacks_(std::move(callbacks)), context_(context) {
        progress_.total = total;
        progress_.startedAt = std::chrono::system_clock::now();
    }

    std::optional<core::ValidationResult> next() override {
        auto result = inner_->next();
        if (!result) {
            return std::nullopt;
        }

        progress_.completed++;
        if (result->isValid) {
            progress_.valid++;
        } else {
            progress_.invalid++;
        }

        dispatchProgress();
        return result;
    }

    void cancel() override { inner_->cancel(); }

private:
    void dispatchProgress() {
        if (callbacks_.empty()) {
            return;
        }

        std::vector<std::future<void>> pending;
        pending.reserve(callbacks_.size());
        for (const auto& callback : callbacks_) {
            pending.push_back(context_.submit([callback, snapshot = progress_]() { callback(snapshot); }));
        }

        for (auto& future : pending) {
            try {
                future.get();
            } catch (const std::exception& e) {
                spdlog::warn("Progress observer failed: {}", e.what());
            } catch (...) {
                spdlog::warn("Progress observer failed with a non-standard exception");
            }
        }
    }

    std::unique_ptr<core::IResultStream> inner_;
    std::vector<core::IScanOrchestrator::ProgressCallback> callbacks_;
    AsioContext& context_;
    core::ScanProgress progress_;
};

} // namespace

ScanOrchestrator::ScanOrchestrator(std::shared_ptr<core::IStreamValidator> validator,
                                   std::shared_ptr<RateLimiter> limiter, AsioContext& context)
    : limitedValidator_(
          std::make_shared<RateLimitedValidator>(std::move(validator), std::move(limiter))),
      context_(context) {}

void ScanOrchestrator::onProgress(ProgressCallback callback) {
    std::lock_guard lock(callbacksMutex_);
    callbacks_.push_back(std::move(callback));
}

std::unique_ptr<core::IResultStream>
ScanOrchestrator::executeScan(std::shared_ptr<const core::ITargetStrategy> strategy,
                              std::chrono::seconds probeTimeout) {
    auto total = strategy->estimateTargetCount();
    auto stream = std::make_unique<StrategyStream>(std::move(strategy), limitedValidator_,
                                                   probeTimeout);
    return withProgress(std::move(stream), total);
}

std::unique_ptr<core::IResultStream>
ScanOrchestrator::executeSmartScan(std::shared_ptr<const core::MulticastStrategy> strategy,
                                   std::chrono::seconds probeTimeout,
                                   std::chrono::seconds discoveryTimeout) {
    auto total = strategy->estimateTargetCount();
    SmartPortScanner scanner(std::move(strategy), limitedValidator_, true, discoveryTimeout,
                             probeTimeout);
    return withProgress(scanner.scan(), total);
}

std::unique_ptr<core::IResultStream>
ScanOrchestrator::withProgress(std::unique_ptr<core::IResultStream> inner, size_t total) {
    std::vector<ProgressCallback> callbacks;
    {
        std::lock_guard lock(callbacksMutex_);
        callbacks = callbacks_;
    }
    return std::make_unique<ProgressStream>(std::move(inner), total, std::move(callbacks),
                                            context_);
}

} // namespace channelscout::infra
