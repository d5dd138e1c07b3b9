#include "infrastructure/scanner/ScanSessionManager.hpp"

#include "core/strategy/MulticastStrategy.hpp"
#include "core/strategy/TemplateStrategy.hpp"

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <spdlog/spdlog.h>

namespace channelscout::infra {

ScanSessionManager::ScanSessionManager(OrchestratorFactory orchestratorFactory,
                                       std::shared_ptr<const PresetCatalog> presets,
                                       std::chrono::seconds discoveryTimeout,
                                       bool allowSmartScan)
    : orchestratorFactory_(std::move(orchestratorFactory)),
      presets_(std::move(presets)),
      discoveryTimeout_(discoveryTimeout),
      allowSmartScan_(allowSmartScan) {
    if (!orchestratorFactory_) {
        throw std::invalid_argument("ScanSessionManager requires an orchestrator factory");
    }
}

ScanSessionManager::~ScanSessionManager() {
    std::vector<std::string> active;
    {
        std::lock_guard lock(mutex_);
        for (const auto& [id, session] : sessions_) {
            if (!core::isTerminal(session->state.status)) {
                active.push_back(id);
            }
        }
    }
    for (const auto& id : active) {
        cancelScan(id);
    }

    std::vector<std::shared_ptr<Session>> sessions;
    {
        std::lock_guard lock(mutex_);
        for (auto& [id, session] : sessions_) {
            sessions.push_back(session);
        }
    }
    for (auto& session : sessions) {
        if (session->worker.joinable()) {
            session->worker.join();
        }
    }
}

std::shared_ptr<const core::ITargetStrategy>
ScanSessionManager::buildStrategy(const core::ScanRequest& request) const {
    try {
        if (request.mode == core::ScanMode::Template) {
            return std::make_shared<core::TemplateStrategy>(*request.baseUrl, *request.startIp,
                                                            *request.endIp);
        }

        if (request.presetId) {
            auto preset = presets_ ? presets_->findById(*request.presetId) : std::nullopt;
            if (!preset) {
                throw PresetNotFound(*request.presetId);
            }
            return preset->toStrategy();
        }

        return std::make_shared<core::MulticastStrategy>(*request.protocol, *request.ipRanges,
                                                         *request.ports);
    } catch (const PresetNotFound&) {
        throw;
    } catch (const core::InvalidScanRequest&) {
        throw;
    } catch (const std::invalid_argument& e) {
        throw core::InvalidScanRequest(e.what());
    }
}

core::ScanSessionSnapshot ScanSessionManager::startScan(const core::ScanRequest& request) {
    request.validate();
    auto strategy = buildStrategy(request);

    size_t total = 0;
    try {
        total = strategy->estimateTargetCount();
    } catch (const std::exception& e) {
        spdlog::warn("Failed to estimate target count: {}", e.what());
    }

    auto session = std::make_shared<Session>();
    session->state.id = generateId();
    session->state.mode = core::scanModeToString(request.mode);
    session->state.status = core::ScanStatus::Pending;
    session->state.total = total;
    session->state.timeoutSeconds = request.timeoutSeconds;
    session->state.startedAt = std::chrono::system_clock::now();
    session->strategy = std::move(strategy);
    session->smartScan = allowSmartScan_ && request.smartScan &&
                         request.mode == core::ScanMode::Multicast;

    core::ScanSessionSnapshot snapshot;
    {
        std::lock_guard lock(mutex_);
        sessions_[session->state.id] = session;
        try {
            session->worker = std::thread([this, session] { runScan(session); });
        } catch (const std::system_error&) {
            sessions_.erase(session->state.id);
            throw;
        }
        snapshot = session->state;
    }

    spdlog::info("Started scan {} using mode {} ({} targets{})", snapshot.id, snapshot.mode,
                 total, session->smartScan ? ", smart port discovery" : "");
    return snapshot;
}

std::optional<core::ScanSessionSnapshot> ScanSessionManager::getScan(const std::string& scanId) const {
    std::lock_guard lock(mutex_);
    auto it = sessions_.find(scanId);
    if (it == sessions_.end()) {
        return std::nullopt;
    }
    return it->second->state;
}

std::optional<core::ScanCancelAck> ScanSessionManager::cancelScan(const std::string& scanId) {
    std::shared_ptr<core::IResultStream> stream;
    core::ScanCancelAck ack;
    {
        std::lock_guard lock(mutex_);
        auto it = sessions_.find(scanId);
        if (it == sessions_.end()) {
            return std::nullopt;
        }

        auto& session = *it->second;
        session.cancelRequested = true;
        if (core::canTransition(session.state.status, core::ScanStatus::Cancelled)) {
            session.state.status = core::ScanStatus::Cancelled;
            session.state.completedAt = std::chrono::system_clock::now();
            spdlog::info("Cancelled scan {} after {} of {} targets", scanId,
                         session.state.progress, session.state.total);
        }
        stream = session.stream;

        ack.id = scanId;
        ack.status = session.state.status;
        ack.cancelled = session.state.status == core::ScanStatus::Cancelled;
    }

    if (stream) {
        stream->cancel();
    }
    stateChanged_.notify_all();
    return ack;
}

std::vector<core::ScanSessionSnapshot> ScanSessionManager::listScans() const {
    std::lock_guard lock(mutex_);
    std::vector<core::ScanSessionSnapshot> snapshots;
    snapshots.reserve(sessions_.size());
    for (const auto& [id, session] : sessions_) {
        snapshots.push_back(session->state);
    }
    return snapshots;
}

bool ScanSessionManager::removeScan(const std::string& scanId) {
    std::thread worker;
    {
        std::lock_guard lock(mutex_);
        auto it = sessions_.find(scanId);
        if (it == sessions_.end() || !core::isTerminal(it->second->state.status)) {
            return false;
        }
        worker = std::move(it->second->worker);
        sessions_.erase(it);
    }

    if (worker.joinable()) {
        if (worker.get_id() == std::this_thread::get_id()) {
            worker.detach();
        } else {
            worker.join();
        }
    }
    spdlog::debug("Removed scan {}", scanId);
    return true;
}

void ScanSessionManager::addResultObserver(ResultObserver observer) {
    std::lock_guard lock(observersMutex_);
    observers_.push_back(std::move(observer));
}

bool ScanSessionManager::waitForCompletion(const std::string& scanId,
                                           std::chrono::milliseconds timeout) const {
    std::unique_lock lock(mutex_);
    return stateChanged_.wait_for(lock, timeout, [this, &scanId] {
        auto it = sessions_.find(scanId);
        if (it == sessions_.end()) {
            return true;
        }
        // A cancelled session may still be delivering its last counted result.
        return core::isTerminal(it->second->state.status) && it->second->taskExited;
    });
}

void ScanSessionManager::runScan(const std::shared_ptr<Session>& session) {
    executeSession(session);
    {
        std::lock_guard lock(mutex_);
        session->taskExited = true;
    }
    stateChanged_.notify_all();
}

void ScanSessionManager::executeSession(const std::shared_ptr<Session>& session) {
    const auto& id = session->state.id;
    try {
        // Setup runs while the session is still PENDING.
        auto orchestrator = orchestratorFactory_();
        {
            std::lock_guard lock(mutex_);
            if (session->cancelRequested || core::isTerminal(session->state.status)) {
                spdlog::debug("Scan {} cancelled before it started", id);
                return;
            }
            session->state.status = core::ScanStatus::Running;
        }
        stateChanged_.notify_all();

        auto probeTimeout = std::chrono::seconds(session->state.timeoutSeconds);

        std::shared_ptr<core::IResultStream> stream;
        auto multicast =
            std::dynamic_pointer_cast<const core::MulticastStrategy>(session->strategy);
        if (session->smartScan && multicast) {
            stream = orchestrator->executeSmartScan(multicast, probeTimeout, discoveryTimeout_);
        } else {
            stream = orchestrator->executeScan(session->strategy, probeTimeout);
        }

        {
            std::lock_guard lock(mutex_);
            session->stream = stream;
        }
        if (session->cancelRequested) {
            stream->cancel();
        }

        while (!session->cancelRequested) {
            auto result = stream->next();
            if (!result) {
                break;
            }

            {
                std::lock_guard lock(mutex_);
                if (core::isTerminal(session->state.status)) {
                    break;
                }
                session->state.progress++;
                if (result->isValid) {
                    session->state.valid++;
                } else {
                    session->state.invalid++;
                }
            }
            // Every counted result reaches the observers, even if a cancel lands now.
            notifyObservers(id, *result);
        }

        finish(session, session->cancelRequested ? core::ScanStatus::Cancelled
                                                 : core::ScanStatus::Completed);
    } catch (const core::OperationCancelled&) {
        finish(session, core::ScanStatus::Cancelled);
    } catch (const std::exception& e) {
        fail(session, e.what());
    } catch (...) {
        fail(session, "Unknown error");
    }
}

void ScanSessionManager::fail(const std::shared_ptr<Session>& session, std::string error) {
    spdlog::error("Scan {} failed: {}", session->state.id, error);
    {
        std::lock_guard lock(mutex_);
        if (session->state.status == core::ScanStatus::Pending) {
            session->state.status = core::ScanStatus::Running;
        }
    }
    finish(session, core::ScanStatus::Failed, std::move(error));
}

void ScanSessionManager::finish(const std::shared_ptr<Session>& session, core::ScanStatus status,
                                std::optional<std::string> error) {
    {
        std::lock_guard lock(mutex_);
        auto& state = session->state;
        if (!core::canTransition(state.status, status)) {
            return;
        }
        state.status = status;
        state.error = std::move(error);
        state.completedAt = std::chrono::system_clock::now();
        session->stream.reset();

        if (status == core::ScanStatus::Completed) {
            spdlog::info("Scan {} completed: {} targets, {} valid, {} invalid", state.id,
                         state.progress, state.valid, state.invalid);
        } else if (status == core::ScanStatus::Cancelled) {
            spdlog::info("Scan {} cancelled after {} targets", state.id, state.progress);
        }
    }
    stateChanged_.notify_all();
}

void ScanSessionManager::notifyObservers(const std::string& scanId,
                                         const core::ValidationResult& result) {
    std::vector<ResultObserver> observers;
    {
        std::lock_guard lock(observersMutex_);
        observers = observers_;
    }
    for (const auto& observer : observers) {
        try {
            observer(scanId, result);
        } catch (const std::exception& e) {
            spdlog::warn("Result observer failed for scan {}: {}", scanId, e.what());
        } catch (...) {
            spdlog::warn("Result observer failed for scan {} with a non-standard exception",
                         scanId);
        }
    }
}

std::string ScanSessionManager::generateId() {
    boost::uuids::random_generator generator;
    return boost::uuids::to_string(generator());
}

} // namespace channelscout::infra
