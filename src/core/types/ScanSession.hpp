/**
 * @file ScanSession.hpp
 * @brief Scan session lifecycle types and progress snapshots.
 *
 * This file defines the session state machine, the progress snapshot
 * broadcast to observers, and the read-only view of a session handed to
 * callers of the session manager.
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace channelscout::core {

/**
 * @brief Lifecycle state of a scan session.
 *
 * Allowed transitions: Pending -> Running, Pending -> Cancelled,
 * Running -> Completed | Cancelled | Failed. Terminal states never change.
 */
enum class ScanStatus : int {
    Pending = 0,
    Running = 1,
    Completed = 2,
    Cancelled = 3,
    Failed = 4
};

/**
 * @brief Converts a ScanStatus to its wire name (e.g. "running").
 */
std::string scanStatusToString(ScanStatus status);

/**
 * @brief Parses a wire name into a ScanStatus.
 * @return The status, or nullopt for an unknown name.
 */
std::optional<ScanStatus> scanStatusFromString(const std::string& str);

/**
 * @brief Checks whether a status is terminal (Completed, Cancelled or Failed).
 */
bool isTerminal(ScanStatus status);

/**
 * @brief Checks whether the state machine allows moving from one status to another.
 */
bool canTransition(ScanStatus from, ScanStatus to);

/**
 * @brief Point-in-time counters of an orchestrator run.
 */
struct ScanProgress {
    size_t total{0};      ///< Estimated number of targets
    size_t completed{0};  ///< Targets probed so far
    size_t valid{0};      ///< Targets that validated
    size_t invalid{0};    ///< Targets that failed validation
    std::chrono::system_clock::time_point startedAt; ///< When the run started

    /**
     * @brief Calculates the completion percentage.
     * @return Percentage of targets probed (0-100).
     */
    [[nodiscard]] double percentComplete() const {
        return total > 0 ? (static_cast<double>(completed) / total) * 100.0 : 0.0;
    }
};

/**
 * @brief Read-only view of a scan session.
 */
struct ScanSessionSnapshot {
    std::string id;
    std::string mode;
    ScanStatus status{ScanStatus::Pending};
    size_t progress{0};
    size_t total{0};
    size_t valid{0};
    size_t invalid{0};
    int timeoutSeconds{10};
    std::chrono::system_clock::time_point startedAt;
    std::optional<std::chrono::system_clock::time_point> completedAt;
    std::optional<std::string> error;

    /**
     * @brief Serializes the status fields exposed to API callers.
     */
    [[nodiscard]] nlohmann::json toJson() const;
};

/**
 * @brief Acknowledgment returned by a cancellation request.
 */
struct ScanCancelAck {
    std::string id;
    ScanStatus status{ScanStatus::Pending};
    bool cancelled{false};
};

} // namespace channelscout::core
