#include "core/types/ScanSession.hpp"

#include <ctime>

namespace channelscout::core {

namespace {

std::string toIso8601(std::chrono::system_clock::time_point tp) {
    auto time = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&time, &tm);
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return buffer;
}

} // namespace

std::string scanStatusToString(ScanStatus status) {
    switch (status) {
    case ScanStatus::Pending:
        return "pending";
    case ScanStatus::Running:
        return "running";
    case ScanStatus::Completed:
        return "completed";
    case ScanStatus::Cancelled:
        return "cancelled";
    case ScanStatus::Failed:
        return "failed";
    }
    return "pending";
}

std::optional<ScanStatus> scanStatusFromString(const std::string& str) {
    if (str == "pending")
        return ScanStatus::Pending;
    if (str == "running")
        return ScanStatus::Running;
    if (str == "completed")
        return ScanStatus::Completed;
    if (str == "cancelled")
        return ScanStatus::Cancelled;
    if (str == "failed")
        return ScanStatus::Failed;
    return std::nullopt;
}

bool isTerminal(ScanStatus status) {
    return status == ScanStatus::Completed || status == ScanStatus::Cancelled ||
           status == ScanStatus::Failed;
}

bool canTransition(ScanStatus from, ScanStatus to) {
    switch (from) {
    case ScanStatus::Pending:
        return to == ScanStatus::Running || to == ScanStatus::Cancelled;
    case ScanStatus::Running:
        return to == ScanStatus::Completed || to == ScanStatus::Cancelled ||
               to == ScanStatus::Failed;
    case ScanStatus::Completed:
    case ScanStatus::Cancelled:
    case ScanStatus::Failed:
        return false;
    }
    return false;
}

nlohmann::json ScanSessionSnapshot::toJson() const {
    nlohmann::json j;
    j["scan_id"] = id;
    j["mode"] = mode;
    j["status"] = scanStatusToString(status);
    j["progress"] = progress;
    j["total"] = total;
    j["valid"] = valid;
    j["invalid"] = invalid;
    j["started_at"] = toIso8601(startedAt);
    j["completed_at"] = completedAt ? nlohmann::json(toIso8601(*completedAt)) : nlohmann::json(nullptr);
    j["error"] = error ? nlohmann::json(*error) : nlohmann::json(nullptr);
    return j;
}

} // namespace channelscout::core
