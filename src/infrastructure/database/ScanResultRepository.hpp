#pragma once

#include "core/types/ScanSession.hpp"
#include "core/types/ValidationResult.hpp"
#include "infrastructure/database/Database.hpp"

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace channelscout::infra {

/**
 * @brief Repository for scan history (validation results and session summaries).
 *
 * Safe to use from several session threads at once.
 */
class ScanResultRepository {
public:
    /**
     * @brief Constructs the repository and migrates the schema.
     * @param db Shared database connection.
     */
    explicit ScanResultRepository(std::shared_ptr<Database> db);

    /**
     * @brief Stores one validation result.
     * @param scanId Session the result belongs to.
     * @param result Result to store.
     * @return Row id of the stored result.
     */
    int64_t insert(const std::string& scanId, const core::ValidationResult& result);

    /**
     * @brief Returns every result of a session in insertion order.
     */
    std::vector<core::ValidationResult> getByScan(const std::string& scanId);

    /**
     * @brief Returns the most recent valid results across all sessions.
     * @param limit Maximum number of results.
     */
    std::vector<core::ValidationResult> getValidStreams(int limit = 100);

    /**
     * @brief Counts the stored results of a session.
     */
    int countByScan(const std::string& scanId);

    /**
     * @brief Stores or replaces a session summary.
     */
    void saveSession(const core::ScanSessionSnapshot& snapshot);

    std::optional<core::ScanSessionSnapshot> getSession(const std::string& scanId);

    /**
     * @brief Returns session summaries, most recently started first.
     */
    std::vector<core::ScanSessionSnapshot> getSessions(int limit = 50);

    /**
     * @brief Deletes results and session summaries older than the given age.
     * @return Number of deleted results.
     */
    int cleanupOlderThan(std::chrono::hours maxAge);

    /**
     * @brief Exports a session and its results as a JSON document.
     */
    std::string exportToJson(const std::string& scanId);

private:
    std::shared_ptr<Database> db_;
    std::mutex mutex_;
};

} // namespace channelscout::infra
