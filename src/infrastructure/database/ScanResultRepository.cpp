#include "infrastructure/database/ScanResultRepository.hpp"

#include <spdlog/spdlog.h>

#include <ctime>

namespace channelscout::infra {

namespace {

std::string timePointToString(const std::chrono::system_clock::time_point& tp) {
    auto time = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&time, &tm);
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S", &tm);
    return buffer;
}

std::chrono::system_clock::time_point stringToTimePoint(const std::string& str) {
    std::tm tm{};
    strptime(str.c_str(), "%Y-%m-%d %H:%M:%S", &tm);
    return std::chrono::system_clock::from_time_t(timegm(&tm));
}

constexpr const char* kResultColumns =
    "url, protocol, is_valid, resolution, codec_video, codec_audio, error_category, "
    "error_message, timestamp";

core::ValidationResult readResult(const Statement& stmt) {
    core::ValidationResult result;
    result.url = stmt.columnText(0);
    result.protocol = stmt.columnText(1);
    result.isValid = stmt.columnInt(2) != 0;
    result.resolution = stmt.columnOptionalText(3);
    result.videoCodec = stmt.columnOptionalText(4);
    result.audioCodec = stmt.columnOptionalText(5);
    if (auto category = stmt.columnOptionalText(6)) {
        result.errorCategory = core::ValidationResult::categoryFromString(*category);
    }
    result.errorMessage = stmt.columnOptionalText(7);
    result.timestamp = stringToTimePoint(stmt.columnText(8));
    return result;
}

constexpr const char* kSessionColumns =
    "scan_id, mode, status, total, progress, valid, invalid, timeout_seconds, started_at, "
    "completed_at, error";

core::ScanSessionSnapshot readSession(const Statement& stmt) {
    core::ScanSessionSnapshot snapshot;
    snapshot.id = stmt.columnText(0);
    snapshot.mode = stmt.columnText(1);
    snapshot.status = core::scanStatusFromString(stmt.columnText(2)).value_or(core::ScanStatus::Failed);
    snapshot.total = static_cast<size_t>(stmt.columnInt64(3));
    snapshot.progress = static_cast<size_t>(stmt.columnInt64(4));
    snapshot.valid = static_cast<size_t>(stmt.columnInt64(5));
    snapshot.invalid = static_cast<size_t>(stmt.columnInt64(6));
    snapshot.timeoutSeconds = stmt.columnInt(7);
    snapshot.startedAt = stringToTimePoint(stmt.columnText(8));
    if (auto completed = stmt.columnOptionalText(9)) {
        snapshot.completedAt = stringToTimePoint(*completed);
    }
    snapshot.error = stmt.columnOptionalText(10);
    return snapshot;
}

} // namespace

ScanResultRepository::ScanResultRepository(std::shared_ptr<Database> db) : db_(std::move(db)) {
    if (!db_) {
        throw std::invalid_argument("ScanResultRepository requires a database");
    }
    db_->runMigrations();
}

int64_t ScanResultRepository::insert(const std::string& scanId,
                                     const core::ValidationResult& result) {
    std::lock_guard lock(mutex_);
    auto stmt = db_->prepare(R"(
        INSERT INTO scan_results (scan_id, url, protocol, is_valid, resolution, codec_video,
                                  codec_audio, error_category, error_message, timestamp)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
    )");

    stmt.bind(1, scanId);
    stmt.bind(2, result.url);
    stmt.bind(3, result.protocol);
    stmt.bind(4, result.isValid ? 1 : 0);
    stmt.bind(5, result.resolution);
    stmt.bind(6, result.videoCodec);
    stmt.bind(7, result.audioCodec);
    if (result.errorCategory) {
        stmt.bind(8, core::ValidationResult::categoryToString(*result.errorCategory));
    } else {
        stmt.bindNull(8);
    }
    stmt.bind(9, result.errorMessage);
    stmt.bind(10, timePointToString(result.timestamp));

    stmt.step();
    return db_->lastInsertRowId();
}

std::vector<core::ValidationResult> ScanResultRepository::getByScan(const std::string& scanId) {
    std::vector<core::ValidationResult> results;
    auto stmt = db_->prepare(std::string("SELECT ") + kResultColumns +
                             " FROM scan_results WHERE scan_id = ? ORDER BY id");
    stmt.bind(1, scanId);

    while (stmt.step()) {
        results.push_back(readResult(stmt));
    }
    return results;
}

std::vector<core::ValidationResult> ScanResultRepository::getValidStreams(int limit) {
    std::vector<core::ValidationResult> results;
    auto stmt = db_->prepare(std::string("SELECT ") + kResultColumns +
                             " FROM scan_results WHERE is_valid = 1 ORDER BY id DESC LIMIT ?");
    stmt.bind(1, limit);

    while (stmt.step()) {
        results.push_back(readResult(stmt));
    }
    return results;
}

int ScanResultRepository::countByScan(const std::string& scanId) {
    auto stmt = db_->prepare("SELECT COUNT(*) FROM scan_results WHERE scan_id = ?");
    stmt.bind(1, scanId);
    return stmt.step() ? stmt.columnInt(0) : 0;
}

void ScanResultRepository::saveSession(const core::ScanSessionSnapshot& snapshot) {
    std::lock_guard lock(mutex_);
    auto stmt = db_->prepare(R"(
        INSERT OR REPLACE INTO scan_sessions (scan_id, mode, status, total, progress, valid,
                                              invalid, timeout_seconds, started_at,
                                              completed_at, error)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
    )");

    stmt.bind(1, snapshot.id);
    stmt.bind(2, snapshot.mode);
    stmt.bind(3, core::scanStatusToString(snapshot.status));
    stmt.bind(4, static_cast<int64_t>(snapshot.total));
    stmt.bind(5, static_cast<int64_t>(snapshot.progress));
    stmt.bind(6, static_cast<int64_t>(snapshot.valid));
    stmt.bind(7, static_cast<int64_t>(snapshot.invalid));
    stmt.bind(8, snapshot.timeoutSeconds);
    stmt.bind(9, timePointToString(snapshot.startedAt));
    if (snapshot.completedAt) {
        stmt.bind(10, timePointToString(*snapshot.completedAt));
    } else {
        stmt.bindNull(10);
    }
    stmt.bind(11, snapshot.error);

    stmt.step();
}

std::optional<core::ScanSessionSnapshot> ScanResultRepository::getSession(const std::string& scanId) {
    auto stmt = db_->prepare(std::string("SELECT ") + kSessionColumns +
                             " FROM scan_sessions WHERE scan_id = ?");
    stmt.bind(1, scanId);
    if (stmt.step()) {
        return readSession(stmt);
    }
    return std::nullopt;
}

std::vector<core::ScanSessionSnapshot> ScanResultRepository::getSessions(int limit) {
    std::vector<core::ScanSessionSnapshot> sessions;
    auto stmt = db_->prepare(std::string("SELECT ") + kSessionColumns +
                             " FROM scan_sessions ORDER BY started_at DESC LIMIT ?");
    stmt.bind(1, limit);
    while (stmt.step()) {
        sessions.push_back(readSession(stmt));
    }
    return sessions;
}

int ScanResultRepository::cleanupOlderThan(std::chrono::hours maxAge) {
    std::lock_guard lock(mutex_);
    auto cutoff = timePointToString(std::chrono::system_clock::now() - maxAge);
    int deleted = 0;

    db_->transaction([&] {
        auto results = db_->prepare("DELETE FROM scan_results WHERE timestamp < ?");
        results.bind(1, cutoff);
        results.step();
        deleted = db_->changes();

        auto sessions = db_->prepare("DELETE FROM scan_sessions WHERE started_at < ?");
        sessions.bind(1, cutoff);
        sessions.step();
    });

    spdlog::info("Cleaned up {} scan results older than {} hours", deleted, maxAge.count());
    return deleted;
}

std::string ScanResultRepository::exportToJson(const std::string& scanId) {
    nlohmann::json j;
    j["scan_id"] = scanId;

    auto session = getSession(scanId);
    j["session"] = session ? session->toJson() : nlohmann::json(nullptr);

    auto results = nlohmann::json::array();
    for (const auto& result : getByScan(scanId)) {
        results.push_back(result.toJson());
    }
    j["results"] = std::move(results);

    return j.dump(2);
}

} // namespace channelscout::infra
