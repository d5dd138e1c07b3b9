#include "infrastructure/network/AsioContext.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace channelscout::infra {

AsioContext::AsioContext(size_t threadCount) : threadCount_(std::max<size_t>(threadCount, 1)) {}

AsioContext::~AsioContext() {
    stop();
}

void AsioContext::start() {
    if (running_.exchange(true)) {
        return;
    }

    workGuard_.emplace(asio::make_work_guard(ioContext_));
    threads_.reserve(threadCount_);
    for (size_t i = 0; i < threadCount_; ++i) {
        threads_.emplace_back(&AsioContext::runWorker, this, i);
    }

    spdlog::info("Probe worker pool started with {} threads", threadCount_);
}

void AsioContext::runWorker(size_t index) {
    spdlog::debug("Probe worker {} started", index);

    // A handler that throws unwinds out of run(); keep serving the queue.
    while (true) {
        try {
            ioContext_.run();
            break;
        } catch (const std::exception& e) {
            spdlog::error("Probe worker {}: unhandled exception in posted task: {}", index,
                          e.what());
        }
    }

    spdlog::debug("Probe worker {} stopped", index);
}

void AsioContext::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    workGuard_.reset();
    ioContext_.stop();
    for (auto& thread : threads_) {
        thread.join();
    }
    threads_.clear();

    // Allow a later start() on the same context.
    ioContext_.restart();
    spdlog::info("Probe worker pool stopped");
}

} // namespace channelscout::infra
