#pragma once

#include "core/services/IScanOrchestrator.hpp"
#include "core/types/ScanRequest.hpp"
#include "core/types/ScanSession.hpp"
#include "infrastructure/config/PresetCatalog.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace channelscout::infra {

/**
 * @brief Owns scan sessions and runs each one on its own background thread.
 *
 * Sessions move through PENDING -> RUNNING -> {COMPLETED, CANCELLED, FAILED}.
 * The session table is guarded by a single mutex; the background task of a
 * session is the only writer of its counters. Cancellation is cooperative: the
 * session is marked CANCELLED immediately and the task stops at the next target
 * boundary, aborting any probe in flight.
 */
class ScanSessionManager {
public:
    using OrchestratorFactory = std::function<std::unique_ptr<core::IScanOrchestrator>()>;
    using ResultObserver =
        std::function<void(const std::string& scanId, const core::ValidationResult& result)>;

    /**
     * @brief Constructs the manager.
     * @param orchestratorFactory Creates one orchestrator per session.
     * @param presets Catalog used to resolve preset ids; may be null if presets are unused.
     * @param discoveryTimeout Discovery-phase timeout for smart multicast scans.
     * @param allowSmartScan Set to false to ignore smart_scan in requests.
     */
    ScanSessionManager(OrchestratorFactory orchestratorFactory,
                       std::shared_ptr<const PresetCatalog> presets,
                       std::chrono::seconds discoveryTimeout = std::chrono::seconds(20),
                       bool allowSmartScan = true);

    /**
     * @brief Destructor. Cancels every unfinished session and joins all tasks.
     */
    ~ScanSessionManager();

    ScanSessionManager(const ScanSessionManager&) = delete;
    ScanSessionManager& operator=(const ScanSessionManager&) = delete;

    /**
     * @brief Validates a request and starts a session for it.
     * @return Snapshot of the new session, normally still PENDING.
     * @throws core::InvalidScanRequest if the request or its strategy is malformed.
     * @throws PresetNotFound if the request names an unknown preset.
     */
    core::ScanSessionSnapshot startScan(const core::ScanRequest& request);

    /**
     * @brief Returns the current state of a session, or nullopt if unknown.
     */
    std::optional<core::ScanSessionSnapshot> getScan(const std::string& scanId) const;

    /**
     * @brief Requests cancellation of a session.
     * @return Acknowledgment with the resulting status, or nullopt if unknown.
     */
    std::optional<core::ScanCancelAck> cancelScan(const std::string& scanId);

    /**
     * @brief Returns snapshots of every retained session.
     */
    std::vector<core::ScanSessionSnapshot> listScans() const;

    /**
     * @brief Forgets a finished session.
     * @return False if the session is unknown or not in a terminal state.
     */
    bool removeScan(const std::string& scanId);

    /**
     * @brief Registers a consumer of every result of every session.
     *
     * Observers run on the session's task thread; exceptions are logged and ignored.
     */
    void addResultObserver(ResultObserver observer);

    /**
     * @brief Blocks until a session reaches a terminal state and its task has
     * stopped delivering results.
     * @return True if it did within the timeout.
     */
    bool waitForCompletion(const std::string& scanId, std::chrono::milliseconds timeout) const;

    /**
     * @brief Builds the target strategy a request describes.
     * @throws core::InvalidScanRequest if the strategy rejects its parameters.
     * @throws PresetNotFound if the preset is unknown.
     */
    std::shared_ptr<const core::ITargetStrategy> buildStrategy(const core::ScanRequest& request) const;

private:
    struct Session {
        core::ScanSessionSnapshot state;
        std::shared_ptr<const core::ITargetStrategy> strategy;
        bool smartScan{false};
        std::atomic<bool> cancelRequested{false};
        bool taskExited{false};
        std::shared_ptr<core::IResultStream> stream;
        std::thread worker;
    };

    void runScan(const std::shared_ptr<Session>& session);
    void executeSession(const std::shared_ptr<Session>& session);
    void fail(const std::shared_ptr<Session>& session, std::string error);
    void finish(const std::shared_ptr<Session>& session, core::ScanStatus status,
                std::optional<std::string> error = std::nullopt);
    void notifyObservers(const std::string& scanId, const core::ValidationResult& result);
    std::string generateId();

    OrchestratorFactory orchestratorFactory_;
    std::shared_ptr<const PresetCatalog> presets_;
    std::chrono::seconds discoveryTimeout_;
    bool allowSmartScan_;

    std::map<std::string, std::shared_ptr<Session>> sessions_;
    mutable std::mutex mutex_;
    mutable std::condition_variable stateChanged_;

    std::vector<ResultObserver> observers_;
    std::mutex observersMutex_;
};

} // namespace channelscout::infra
