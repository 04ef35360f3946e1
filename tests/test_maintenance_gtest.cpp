// ==============================================================================
// test_maintenance_gtest.cpp - Тесты команд управления кэшем (GoogleTest)
// ==============================================================================

#include "dds/maintenance.hpp"

#include "dds/output.hpp"
#include "dds/work_queue.hpp"

#include "test_support.hpp"

#include <functional>
#include <gtest/gtest.h>
#include <rapidjson/document.h>
#include <string>
#include <vector>

namespace dds::maintenance::test {

class MaintenanceTest : public dds::test::TempDirTest {
protected:
    void SetUp() override {
        TempDirTest::SetUp();
        db_ = open_db();
        output::OutputConfig oc;
        oc.color = false;
        writer_ = std::make_unique<output::Writer>(oc);
    }

    void TearDown() override {
        writer_.reset();
        db_.reset();
        TempDirTest::TearDown();
    }

    /// Кэш: два завершённых каталога (в одном найден и удалён файл),
    /// один незавершённый с ошибкой
    void seed_cache() {
        db_->exec(
            "INSERT INTO directory_cache "
            "(path, last_searched, completed, target_found, target_deleted, error) VALUES "
            "('/r', 300, 1, 1, 1, NULL), "
            "('/r/a', 200, 1, 0, 0, NULL), "
            "('/r/b', 100, 0, 0, 0, 'permission denied')");
    }

    session::Session make_session(const std::string& root, session::Status status) {
        session::SessionRegistry sessions(*db_);
        session::SessionParams params;
        params.root = root;
        params.recursive = true;
        session::Session s = sessions.create(params);
        if (status != session::Status::Active) {
            s = sessions.transition(s.id, status);
        }
        return s;
    }

    std::string capture_stdout(const std::function<void()>& fn) {
        ::testing::internal::CaptureStdout();
        fn();
        return ::testing::internal::GetCapturedStdout();
    }

    std::unique_ptr<store::Database> db_;
    std::unique_ptr<output::Writer> writer_;
};

// ==============================================================================
// --cache-status
// ==============================================================================

TEST_F(MaintenanceTest, Status_ListsIncompleteAndResumable) {
    // Arrange
    seed_cache();
    db_->exec(
        "INSERT INTO directory_cache (path, last_searched, completed) VALUES ('/r/c', 400, 0)");
    session::Session interrupted = make_session("/r", session::Status::Interrupted);
    make_session("/done", session::Status::Completed);
    queue::WorkQueue queue(*db_);
    queue.enqueue(interrupted.id, {"/r/b", "/r/c"});

    // Act
    CacheStatus status = cache_status(*db_, 24);

    // Assert: новые первыми
    EXPECT_EQ(status.incomplete_paths, (std::vector<std::string>{"/r/c", "/r/b"}));
    ASSERT_EQ(status.sessions.size(), 1u);
    EXPECT_EQ(status.sessions[0].id, interrupted.id);
    EXPECT_EQ(status.sessions[0].status, session::Status::Interrupted);
    EXPECT_EQ(status.sessions[0].pending, 2u);
    EXPECT_EQ(status.window_hours, 24u);
    EXPECT_EQ(status.database_path, db_->path());
}

TEST_F(MaintenanceTest, PrintStatus_EmptyCache) {
    CacheStatus status = cache_status(*db_, 24);

    const std::string out = capture_stdout([&] { print_status(*writer_, status, false); });

    EXPECT_EQ(out.rfind("Cache Status\n============\n", 0), 0u);
    EXPECT_NE(out.find("Cache window: 24 hours"), std::string::npos);
    EXPECT_NE(out.find("No incomplete searches found."), std::string::npos);
    EXPECT_EQ(out.find("Resumable sessions:"), std::string::npos);
}

TEST_F(MaintenanceTest, PrintStatus_TextWithSessions) {
    // Arrange
    seed_cache();
    session::Session s = make_session("/r", session::Status::Interrupted);
    CacheStatus status = cache_status(*db_, 12);

    // Act
    const std::string out = capture_stdout([&] { print_status(*writer_, status, false); });

    // Assert
    EXPECT_NE(out.find("Incomplete searches (1 total):\n  - /r/b\n"), std::string::npos);
    EXPECT_NE(out.find("Resumable sessions:"), std::string::npos);
    EXPECT_NE(out.find(s.id), std::string::npos);
    EXPECT_NE(out.find("interrupted"), std::string::npos);
}

TEST_F(MaintenanceTest, PrintStatus_Json) {
    // Arrange
    seed_cache();
    session::Session s = make_session("/r", session::Status::Interrupted);
    CacheStatus status = cache_status(*db_, 24);

    // Act
    const std::string out = capture_stdout([&] { print_status(*writer_, status, true); });

    // Assert
    rapidjson::Document doc;
    doc.Parse(out.c_str());
    ASSERT_FALSE(doc.HasParseError());
    EXPECT_EQ(doc["cache_window_hours"].GetUint64(), 24u);
    ASSERT_TRUE(doc["incomplete"].IsArray());
    ASSERT_EQ(doc["incomplete"].Size(), 1u);
    EXPECT_STREQ(doc["incomplete"][0].GetString(), "/r/b");
    ASSERT_EQ(doc["sessions"].Size(), 1u);
    EXPECT_EQ(std::string(doc["sessions"][0]["id"].GetString()), s.id);
    EXPECT_STREQ(doc["sessions"][0]["status"].GetString(), "interrupted");
    EXPECT_EQ(doc["sessions"][0]["pending"].GetUint64(), 0u);
}

// ==============================================================================
// --cache-stats
// ==============================================================================

TEST_F(MaintenanceTest, Stats_Aggregates) {
    // Arrange
    seed_cache();
    make_session("/r", session::Status::Interrupted);
    make_session("/x", session::Status::Completed);
    make_session("/y", session::Status::Completed);

    // Act
    CacheStats stats = cache_stats(*db_, 24);

    // Assert
    EXPECT_EQ(stats.total, 3u);
    EXPECT_EQ(stats.completed, 2u);
    EXPECT_EQ(stats.incomplete, 1u);
    EXPECT_EQ(stats.with_target, 1u);
    EXPECT_EQ(stats.targets_deleted, 1u);
    EXPECT_EQ(stats.with_error, 1u);
    ASSERT_TRUE(stats.hit_rate().has_value());
    EXPECT_NEAR(*stats.hit_rate(), 66.67, 0.01);
    ASSERT_EQ(stats.sessions.size(), 4u);
    EXPECT_EQ(stats.sessions[1].first, session::Status::Completed);
    EXPECT_EQ(stats.sessions[1].second, 2u);
    EXPECT_EQ(stats.sessions[2].second, 1u);
}

TEST_F(MaintenanceTest, Stats_EmptyCacheHasNoHitRate) {
    CacheStats stats = cache_stats(*db_, 24);

    EXPECT_EQ(stats.total, 0u);
    EXPECT_FALSE(stats.hit_rate().has_value());

    const std::string out = capture_stdout([&] { print_stats(*writer_, stats, false); });
    EXPECT_EQ(out.find("Cache hit rate"), std::string::npos);
    EXPECT_NE(out.find("Total entries:"), std::string::npos);
}

TEST_F(MaintenanceTest, PrintStats_Text) {
    seed_cache();
    CacheStats stats = cache_stats(*db_, 24);

    const std::string out = capture_stdout([&] { print_stats(*writer_, stats, false); });

    EXPECT_EQ(out.rfind("Cache Statistics\n================\n", 0), 0u);
    EXPECT_NE(out.find("Total entries:                3\n"), std::string::npos);
    EXPECT_NE(out.find("Directories with errors:      1\n"), std::string::npos);
    EXPECT_NE(out.find("Cache hit rate: 66.7%"), std::string::npos);
    EXPECT_NE(out.find("Sessions:"), std::string::npos);
    EXPECT_NE(out.find("  interrupted:"), std::string::npos);
}

TEST_F(MaintenanceTest, PrintStats_Json) {
    // Arrange
    seed_cache();
    make_session("/r", session::Status::Interrupted);
    CacheStats stats = cache_stats(*db_, 24);

    // Act
    const std::string out = capture_stdout([&] { print_stats(*writer_, stats, true); });

    // Assert
    rapidjson::Document doc;
    doc.Parse(out.c_str());
    ASSERT_FALSE(doc.HasParseError());
    EXPECT_EQ(doc["total_entries"].GetUint64(), 3u);
    EXPECT_EQ(doc["completed"].GetUint64(), 2u);
    EXPECT_EQ(doc["incomplete"].GetUint64(), 1u);
    EXPECT_EQ(doc["directories_with_target"].GetUint64(), 1u);
    EXPECT_EQ(doc["targets_deleted"].GetUint64(), 1u);
    EXPECT_EQ(doc["errors"].GetUint64(), 1u);
    ASSERT_TRUE(doc.HasMember("hit_rate"));
    EXPECT_NEAR(doc["hit_rate"].GetDouble(), 66.67, 0.01);
    ASSERT_TRUE(doc["sessions"].IsObject());
    EXPECT_EQ(doc["sessions"]["interrupted"].GetUint64(), 1u);
    EXPECT_EQ(doc["sessions"]["failed"].GetUint64(), 0u);
}

// ==============================================================================
// --cache-clear-incomplete
// ==============================================================================

TEST_F(MaintenanceTest, ClearIncomplete_RemovesRowsAndClosesSessions) {
    // Arrange
    seed_cache();
    session::Session interrupted = make_session("/r", session::Status::Interrupted);
    session::Session active = make_session("/x", session::Status::Active);

    // Act
    ClearReport report = clear_incomplete(*db_);

    // Assert
    EXPECT_EQ(report.cache_rows_removed, 1u);
    EXPECT_EQ(report.sessions_closed, 1u);
    CacheStats stats = cache_stats(*db_, 24);
    EXPECT_EQ(stats.total, 2u);
    EXPECT_EQ(stats.incomplete, 0u);
    session::SessionRegistry sessions(*db_);
    EXPECT_EQ(sessions.find(interrupted.id)->status, session::Status::Completed);
    EXPECT_EQ(sessions.find(active.id)->status, session::Status::Active);
}

TEST_F(MaintenanceTest, PrintClear_Messages) {
    ClearReport nothing;
    ClearReport some;
    some.cache_rows_removed = 3;
    some.sessions_closed = 1;

    const std::string empty_out = capture_stdout([&] { print_clear(*writer_, nothing, false); });
    const std::string some_out = capture_stdout([&] { print_clear(*writer_, some, false); });

    EXPECT_EQ(empty_out, "No incomplete search entries to clear.\n");
    EXPECT_EQ(some_out,
              "Cleared 3 incomplete search entries.\nClosed 1 interrupted session(s).\n");
}

TEST_F(MaintenanceTest, PrintClear_Json) {
    ClearReport report;
    report.cache_rows_removed = 2;

    const std::string out = capture_stdout([&] { print_clear(*writer_, report, true); });

    rapidjson::Document doc;
    doc.Parse(out.c_str());
    ASSERT_FALSE(doc.HasParseError());
    EXPECT_EQ(doc["cache_rows_removed"].GetUint64(), 2u);
    EXPECT_EQ(doc["sessions_closed"].GetUint64(), 0u);
}

// ==============================================================================
// Целостность
// ==============================================================================

TEST_F(MaintenanceTest, CheckIntegrity_RepairsInconsistentRows) {
    db_->exec(
        "INSERT INTO directory_cache (path, last_searched, completed, target_found, "
        "target_deleted) VALUES ('/odd', 1, 1, 0, 1)");

    IntegrityReport report = check_integrity(*db_);

    EXPECT_TRUE(report.ok);
    EXPECT_EQ(report.message, "ok");
    EXPECT_EQ(report.repaired, 1u);
}

TEST(FormatTimestampTest, Utc) {
    EXPECT_EQ(format_timestamp(0), "1970-01-01 00:00:00");
    EXPECT_EQ(format_timestamp(1706702400), "2024-01-31 12:00:00");
}

}  // namespace dds::maintenance::test
