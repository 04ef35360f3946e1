// ==============================================================================
// test_directory_cache_gtest.cpp - Тесты кэша каталогов (GoogleTest)
// ==============================================================================

#include "dds/directory_cache.hpp"

#include "test_support.hpp"

#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <vector>

namespace dds::cache::test {

constexpr std::int64_t HOUR = 3600;
constexpr std::int64_t T0 = 1700000000;

class DirectoryCacheTest : public dds::test::TempDirTest {
protected:
    void SetUp() override {
        TempDirTest::SetUp();
        db_ = open_db();
        now_ = std::make_shared<std::int64_t>(T0);
    }

    void TearDown() override {
        db_.reset();
        TempDirTest::TearDown();
    }

    /// Кэш с управляемым временем
    DirectoryCache make_cache(std::uint32_t window_hours = 24, bool force = false) {
        CacheOptions opts;
        opts.window_hours = window_hours;
        opts.force_refresh = force;
        auto now = now_;
        return DirectoryCache(*db_, opts, nullptr, [now] { return *now; });
    }

    void advance(std::int64_t secs) { *now_ += secs; }

    std::unique_ptr<store::Database> db_;
    std::shared_ptr<std::int64_t> now_;
};

// ==============================================================================
// status_of: вычисляемая свежесть
// ==============================================================================

TEST_F(DirectoryCacheTest, Status_NotCachedWhenAbsent) {
    auto cache = make_cache();

    EXPECT_EQ(cache.status_of("/a"), DirectoryStatus::NotCached);
}

TEST_F(DirectoryCacheTest, Status_FreshAfterCompletedWrite) {
    // Arrange
    auto cache = make_cache();

    // Act
    cache.record_result("s1", "/a", true);

    // Assert
    EXPECT_EQ(cache.status_of("/a"), DirectoryStatus::Fresh);
}

TEST_F(DirectoryCacheTest, Status_IncompleteAfterPartialWrite) {
    auto cache = make_cache();

    cache.record_result("s1", "/a", false);

    EXPECT_EQ(cache.status_of("/a"), DirectoryStatus::Incomplete);
}

TEST_F(DirectoryCacheTest, Status_StaleAfterWindow) {
    // Arrange
    {
        auto writer = make_cache();
        writer.record_result("s1", "/a", true);
        writer.record_result("s1", "/b", false);
    }
    advance(24 * HOUR);

    // Act: новый экземпляр, индекс свежести пуст
    auto cache = make_cache();

    // Assert: окно включает границу
    EXPECT_EQ(cache.status_of("/a"), DirectoryStatus::Stale);
    EXPECT_EQ(cache.status_of("/b"), DirectoryStatus::Stale);
}

TEST_F(DirectoryCacheTest, Status_FreshJustInsideWindow) {
    {
        auto writer = make_cache();
        writer.record_result("s1", "/a", true);
    }
    advance(24 * HOUR - 1);
    auto cache = make_cache();

    EXPECT_EQ(cache.status_of("/a"), DirectoryStatus::Fresh);
}

TEST_F(DirectoryCacheTest, Status_ZeroWindowNeverFresh) {
    auto cache = make_cache(0);

    cache.record_result("s1", "/a", true);

    EXPECT_EQ(cache.status_of("/a"), DirectoryStatus::Stale);
}

// ==============================================================================
// Force refresh: чтение обходится, запись сохраняется
// ==============================================================================

TEST_F(DirectoryCacheTest, Force_ReadsBypassedWritesKept) {
    // Arrange
    {
        auto normal = make_cache();
        normal.record_result("s1", "/a", true);
    }
    auto forced = make_cache(24, true);

    // Act
    const DirectoryStatus status = forced.status_of("/a");
    advance(10);
    forced.record_result("s2", "/a", true);

    // Assert
    EXPECT_EQ(status, DirectoryStatus::NotCached);
    EXPECT_EQ(forced.warm(), 0u);
    auto row = forced.entry("/a");
    ASSERT_TRUE(row.has_value());
    EXPECT_EQ(row->last_searched, T0 + 10);
    EXPECT_EQ(row->session_id, std::optional<std::string>("s2"));
}

// ==============================================================================
// Upsert
// ==============================================================================

TEST_F(DirectoryCacheTest, Upsert_OneRowPerPath) {
    // Arrange
    auto cache = make_cache();

    // Act
    cache.record_result("s1", "/a", false);
    advance(5);
    cache.record_result("s2", "/a", true);

    // Assert
    auto row = cache.entry("/a");
    ASSERT_TRUE(row.has_value());
    EXPECT_TRUE(row->completed);
    EXPECT_EQ(row->last_searched, T0 + 5);
    EXPECT_EQ(row->session_id, std::optional<std::string>("s2"));

    store::Statement stmt = db_->prepare("SELECT COUNT(*) FROM directory_cache");
    ASSERT_TRUE(stmt.step());
    EXPECT_EQ(stmt.column_int64(0), 1);
}

TEST_F(DirectoryCacheTest, Upsert_OlderWriteDoesNotClobberNewer) {
    // Arrange
    auto cache = make_cache();
    advance(100);
    cache.record_result("s2", "/a", true);

    // Act: запись с более ранним временем
    *now_ = T0;
    cache.record_result("s1", "/a", false);

    // Assert
    auto row = cache.entry("/a");
    ASSERT_TRUE(row.has_value());
    EXPECT_TRUE(row->completed);
    EXPECT_EQ(row->last_searched, T0 + 100);
}

TEST_F(DirectoryCacheTest, RecordResults_BatchWithDetails) {
    // Arrange
    auto cache = make_cache();
    std::vector<CacheUpdate> updates(2);
    updates[0].path = "/a";
    updates[0].completed = true;
    updates[0].target_found = true;
    updates[1].path = "/b";
    updates[1].completed = false;
    updates[1].error = "permission denied";

    // Act
    cache.record_results("s1", updates);

    // Assert
    auto a = cache.entry("/a");
    auto b = cache.entry("/b");
    ASSERT_TRUE(a && b);
    EXPECT_TRUE(a->target_found);
    EXPECT_FALSE(a->target_deleted);
    EXPECT_FALSE(a->error.has_value());
    EXPECT_FALSE(b->completed);
    EXPECT_EQ(b->error, std::optional<std::string>("permission denied"));
}

TEST_F(DirectoryCacheTest, MarkDeleted_OnlyWhenTargetFound) {
    // Arrange
    auto cache = make_cache();
    CacheUpdate with;
    with.path = "/with";
    with.completed = true;
    with.target_found = true;
    CacheUpdate without;
    without.path = "/without";
    without.completed = true;
    cache.record_results("s1", {with, without});

    // Act
    cache.mark_deleted("/with");
    cache.mark_deleted("/without");

    // Assert
    EXPECT_TRUE(cache.entry("/with")->target_deleted);
    EXPECT_FALSE(cache.entry("/without")->target_deleted);
}

// ==============================================================================
// warm / FreshnessIndex
// ==============================================================================

TEST_F(DirectoryCacheTest, Warm_LoadsOnlyFreshCompletedRows) {
    // Arrange
    {
        auto writer = make_cache();
        writer.record_result("s1", "/old", true);
        advance(20 * HOUR);
        writer.record_result("s1", "/fresh", true);
        writer.record_result("s1", "/partial", false);
    }
    advance(5 * HOUR);

    // Act
    auto cache = make_cache();
    const std::size_t loaded = cache.warm();

    // Assert
    EXPECT_EQ(loaded, 1u);
    EXPECT_TRUE(cache.freshness().contains("/fresh"));
    EXPECT_FALSE(cache.freshness().contains("/old"));
    EXPECT_FALSE(cache.freshness().contains("/partial"));
}

TEST_F(DirectoryCacheTest, FreshnessIndex_BasicOperations) {
    FreshnessIndex idx;
    idx.insert("/a");
    idx.insert("/a");
    idx.insert("/b");

    EXPECT_EQ(idx.size(), 2u);
    idx.erase("/a");
    EXPECT_FALSE(idx.contains("/a"));
    idx.clear();
    EXPECT_EQ(idx.size(), 0u);
}

// ==============================================================================
// prune
// ==============================================================================

TEST_F(DirectoryCacheTest, Prune_RemovesRowsPastRetention) {
    // Arrange
    auto cache = make_cache();
    cache.record_result("s1", "/old", true);
    advance(49 * HOUR);
    cache.record_result("s1", "/new", true);

    // Act
    const std::size_t removed = cache.prune(48 * HOUR);

    // Assert
    EXPECT_EQ(removed, 1u);
    EXPECT_FALSE(cache.entry("/old").has_value());
    EXPECT_TRUE(cache.entry("/new").has_value());
}

TEST_F(DirectoryCacheTest, Prune_DeletesInBatches) {
    // Arrange: больше одной пачки
    auto cache = make_cache();
    const std::size_t total = DirectoryCache::PRUNE_BATCH + 5;
    {
        store::Transaction tx(*db_);
        store::Statement stmt = db_->prepare(
            "INSERT INTO directory_cache (path, last_searched, completed) VALUES (?1, ?2, 1)");
        for (std::size_t i = 0; i < total; ++i) {
            stmt.reset();
            stmt.bind(1, std::string_view("/d/" + std::to_string(i)));
            stmt.bind(2, T0);
            stmt.execute();
        }
        tx.commit();
    }
    advance(100 * HOUR);

    // Act
    const std::size_t removed = cache.prune(HOUR);

    // Assert
    EXPECT_EQ(removed, total);
}

// ==============================================================================
// undeleted_targets / repair_inconsistent
// ==============================================================================

TEST_F(DirectoryCacheTest, UndeletedTargets_RespectsRootBoundary) {
    // Arrange
    auto cache = make_cache();
    std::vector<CacheUpdate> updates;
    for (const char* p : {"/r", "/r/sub", "/rx", "/other"}) {
        CacheUpdate u;
        u.path = p;
        u.completed = true;
        u.target_found = true;
        updates.push_back(u);
    }
    cache.record_results("s1", updates);
    cache.mark_deleted("/r/sub");

    // Act
    auto recursive = cache.undeleted_targets("/r", true, ".DS_Store");
    auto flat = cache.undeleted_targets("/r", false, ".DS_Store");

    // Assert
    ASSERT_EQ(recursive.size(), 1u);
    EXPECT_EQ(recursive[0], "/r/.DS_Store");
    ASSERT_EQ(flat.size(), 1u);
    EXPECT_EQ(flat[0], "/r/.DS_Store");

    // После новой записи без находки каталог выпадает из списка
    advance(1);
    cache.record_result("s2", "/r", true);
    EXPECT_TRUE(cache.undeleted_targets("/r", true, ".DS_Store").empty());
}

TEST_F(DirectoryCacheTest, RepairInconsistent_ResetsDeletedWithoutFound) {
    // Arrange
    auto cache = make_cache();
    db_->exec(
        "INSERT INTO directory_cache (path, last_searched, completed, target_found, "
        "target_deleted) VALUES ('/bad', 1, 1, 0, 1), ('/good', 1, 1, 1, 1)");

    // Act
    const std::size_t repaired = cache.repair_inconsistent();

    // Assert
    EXPECT_EQ(repaired, 1u);
    EXPECT_FALSE(cache.entry("/bad")->target_deleted);
    EXPECT_TRUE(cache.entry("/good")->target_deleted);
}

// ==============================================================================
// Деградация при ошибке хранилища
// ==============================================================================

TEST_F(DirectoryCacheTest, StoreError_DegradesToNotCached) {
    // Arrange
    auto cache = make_cache();
    cache.record_result("s1", "/a", false);
    db_->exec("DROP TABLE directory_cache");

    // Act
    const DirectoryStatus status = cache.status_of("/a");
    cache.record_result("s1", "/b", true);

    // Assert
    EXPECT_EQ(status, DirectoryStatus::NotCached);
    EXPECT_TRUE(cache.degraded());
}

TEST(DirectoryStatusTest, ToString) {
    EXPECT_EQ(to_string(DirectoryStatus::Fresh), "fresh");
    EXPECT_EQ(to_string(DirectoryStatus::NotCached), "not-cached");
}

}  // namespace dds::cache::test
