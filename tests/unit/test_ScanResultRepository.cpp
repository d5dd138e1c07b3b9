#include <catch2/catch_test_macros.hpp>

#include "infrastructure/database/Database.hpp"
#include "infrastructure/database/ScanResultRepository.hpp"

#include <filesystem>

using namespace channelscout::core;
using namespace channelscout::infra;
using namespace std::chrono_literals;

namespace {

class TestDatabase {
public:
    TestDatabase() : dbPath_(std::filesystem::temp_directory_path() / "channelscout_test.db") {
        cleanup();
        db_ = std::make_shared<Database>(dbPath_.string());
    }

    ~TestDatabase() {
        db_.reset();
        cleanup();
    }

    std::shared_ptr<Database> get() { return db_; }

private:
    void cleanup() {
        for (const auto* suffix : {"", "-wal", "-shm"}) {
            std::filesystem::remove(dbPath_.string() + suffix);
        }
    }

    std::filesystem::path dbPath_;
    std::shared_ptr<Database> db_;
};

ScanSessionSnapshot makeSession(const std::string& id, ScanStatus status) {
    ScanSessionSnapshot snapshot;
    snapshot.id = id;
    snapshot.mode = "multicast";
    snapshot.status = status;
    snapshot.total = 6;
    snapshot.progress = 4;
    snapshot.valid = 1;
    snapshot.invalid = 3;
    snapshot.timeoutSeconds = 12;
    snapshot.startedAt = std::chrono::system_clock::now();
    return snapshot;
}

} // namespace

TEST_CASE("Database operations", "[Database]") {
    TestDatabase testDb;
    auto db = testDb.get();

    SECTION("Migrations reach the latest schema") {
        db->runMigrations();
        REQUIRE(db->schemaVersion() == 2);

        db->runMigrations();
        REQUIRE(db->schemaVersion() == 2);
    }

    SECTION("Transaction commit") {
        db->execute("CREATE TABLE t (value INTEGER)");
        db->transaction([&] { db->execute("INSERT INTO t VALUES (1)"); });

        auto stmt = db->prepare("SELECT COUNT(*) FROM t");
        REQUIRE(stmt.step());
        REQUIRE(stmt.columnInt(0) == 1);
    }

    SECTION("Transaction rollback") {
        db->execute("CREATE TABLE t (value INTEGER)");
        REQUIRE_THROWS(db->transaction([&] {
            db->execute("INSERT INTO t VALUES (1)");
            db->execute("INSERT INTO missing_table VALUES (1)");
        }));

        auto stmt = db->prepare("SELECT COUNT(*) FROM t");
        REQUIRE(stmt.step());
        REQUIRE(stmt.columnInt(0) == 0);
    }

    SECTION("Invalid SQL throws") {
        REQUIRE_THROWS_AS(db->prepare("SELEC nonsense"), std::runtime_error);
    }
}

TEST_CASE("ScanResultRepository results", "[Database][ScanResultRepository]") {
    TestDatabase testDb;
    ScanResultRepository repo(testDb.get());

    auto valid = ValidationResult::valid("udp://239.1.1.1:5000", "udp", "720x576", "mpeg2video",
                                         "mp2");
    auto invalid = ValidationResult::invalid("udp://239.1.1.1:5001", "udp",
                                             ErrorCategory::Timeout, "Probe timed out");

    SECTION("Insert returns increasing ids") {
        auto first = repo.insert("scan-a", valid);
        auto second = repo.insert("scan-a", invalid);
        REQUIRE(first > 0);
        REQUIRE(second > first);
    }

    SECTION("Results round-trip per scan in insertion order") {
        repo.insert("scan-a", valid);
        repo.insert("scan-a", invalid);
        repo.insert("scan-b", valid);

        auto results = repo.getByScan("scan-a");
        REQUIRE(results.size() == 2);
        REQUIRE(repo.countByScan("scan-a") == 2);
        REQUIRE(repo.countByScan("scan-c") == 0);

        REQUIRE(results[0].isValid);
        REQUIRE(results[0].resolution == "720x576");
        REQUIRE(results[0].audioCodec == "mp2");
        REQUIRE_FALSE(results[0].errorCategory.has_value());

        REQUIRE_FALSE(results[1].isValid);
        REQUIRE(results[1].errorCategory == ErrorCategory::Timeout);
        REQUIRE(results[1].errorMessage == "Probe timed out");
        REQUIRE_FALSE(results[1].videoCodec.has_value());
    }

    SECTION("Valid streams newest first") {
        repo.insert("scan-a", valid);
        repo.insert("scan-a", invalid);
        repo.insert("scan-b", ValidationResult::valid("http://10.0.0.1/", "http", std::nullopt,
                                                      "h264", std::nullopt));

        auto streams = repo.getValidStreams();
        REQUIRE(streams.size() == 2);
        REQUIRE(streams[0].url == "http://10.0.0.1/");
        REQUIRE(repo.getValidStreams(1).size() == 1);
    }
}

TEST_CASE("ScanResultRepository sessions", "[Database][ScanResultRepository]") {
    TestDatabase testDb;
    ScanResultRepository repo(testDb.get());

    SECTION("Save and load a session") {
        auto snapshot = makeSession("scan-1", ScanStatus::Completed);
        snapshot.completedAt = snapshot.startedAt + 30s;
        repo.saveSession(snapshot);

        auto loaded = repo.getSession("scan-1");
        REQUIRE(loaded.has_value());
        REQUIRE(loaded->mode == "multicast");
        REQUIRE(loaded->status == ScanStatus::Completed);
        REQUIRE(loaded->total == 6);
        REQUIRE(loaded->progress == 4);
        REQUIRE(loaded->timeoutSeconds == 12);
        REQUIRE(loaded->completedAt.has_value());
        REQUIRE_FALSE(loaded->error.has_value());
    }

    SECTION("Saving again replaces the summary") {
        repo.saveSession(makeSession("scan-1", ScanStatus::Running));
        auto failed = makeSession("scan-1", ScanStatus::Failed);
        failed.error = "validator crashed";
        repo.saveSession(failed);

        auto loaded = repo.getSession("scan-1");
        REQUIRE(loaded->status == ScanStatus::Failed);
        REQUIRE(loaded->error == "validator crashed");
        REQUIRE(repo.getSessions().size() == 1);
    }

    SECTION("Unknown session") {
        REQUIRE_FALSE(repo.getSession("nope").has_value());
    }
}

TEST_CASE("ScanResultRepository retention and export", "[Database][ScanResultRepository]") {
    TestDatabase testDb;
    ScanResultRepository repo(testDb.get());

    auto old = ValidationResult::valid("udp://239.1.1.1:5000", "udp", std::nullopt, "h264",
                                       std::nullopt);
    old.timestamp = std::chrono::system_clock::now() - 48h;
    repo.insert("scan-old", old);
    repo.insert("scan-new", ValidationResult::invalid("http://10.0.0.1/", "http",
                                                      ErrorCategory::NetworkUnreachable,
                                                      "Connection refused"));

    auto oldSession = makeSession("scan-old", ScanStatus::Completed);
    oldSession.startedAt -= 48h;
    repo.saveSession(oldSession);
    repo.saveSession(makeSession("scan-new", ScanStatus::Completed));

    SECTION("Cleanup removes expired history only") {
        REQUIRE(repo.cleanupOlderThan(24h) == 1);
        REQUIRE(repo.countByScan("scan-old") == 0);
        REQUIRE(repo.countByScan("scan-new") == 1);
        REQUIRE_FALSE(repo.getSession("scan-old").has_value());
        REQUIRE(repo.getSession("scan-new").has_value());
    }

    SECTION("Export bundles the session and its results") {
        auto j = nlohmann::json::parse(repo.exportToJson("scan-new"));

        REQUIRE(j["scan_id"] == "scan-new");
        REQUIRE(j["session"]["status"] == "completed");
        REQUIRE(j["results"].size() == 1);
        REQUIRE(j["results"][0]["error_category"] == "network_unreachable");
    }

    SECTION("Export of an unknown scan has no session") {
        auto j = nlohmann::json::parse(repo.exportToJson("missing"));
        REQUIRE(j["session"].is_null());
        REQUIRE(j["results"].empty());
    }
}

TEST_CASE("ScanResultRepository requires a database", "[ScanResultRepository]") {
    REQUIRE_THROWS_AS(ScanResultRepository(nullptr), std::invalid_argument);
}
