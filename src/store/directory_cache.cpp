// ==============================================================================
// directory_cache.cpp - Кэш свежести каталогов
// ==============================================================================

#include "dds/directory_cache.hpp"

#include "dds/output.hpp"
#include "dds/platform.hpp"

#include <filesystem>
#include <utility>

namespace dds::cache {

std::string_view to_string(DirectoryStatus status) {
    switch (status) {
        case DirectoryStatus::NotCached:
            return "not-cached";
        case DirectoryStatus::Incomplete:
            return "incomplete";
        case DirectoryStatus::Stale:
            return "stale";
        case DirectoryStatus::Fresh:
            return "fresh";
    }
    return "unknown";
}

// ----------------------------------------------------------------------------
// FreshnessIndex
// ----------------------------------------------------------------------------

void FreshnessIndex::insert(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    paths_.insert(path);
}

bool FreshnessIndex::contains(const std::string& path) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return paths_.count(path) != 0;
}

void FreshnessIndex::erase(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    paths_.erase(path);
}

void FreshnessIndex::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    paths_.clear();
}

std::size_t FreshnessIndex::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return paths_.size();
}

// ----------------------------------------------------------------------------
// DirectoryCache
// ----------------------------------------------------------------------------

DirectoryCache::DirectoryCache(store::Database& db, CacheOptions options, output::Writer* log,
                               Clock clock)
    : db_(db), options_(options), log_(log), clock_(std::move(clock)) {
    if (!clock_) {
        clock_ = &platform::unix_now;
    }
}

std::int64_t DirectoryCache::now() const {
    return clock_();
}

std::int64_t DirectoryCache::window_secs() const {
    return static_cast<std::int64_t>(options_.window_hours) * 3600;
}

void DirectoryCache::degrade(std::string_view operation, const store::StoreError& e) {
    degraded_.store(true);
    if (log_ != nullptr) {
        std::string msg = "directory cache ";
        msg += operation;
        msg += " failed, continuing without cache - ";
        msg += e.what();
        log_->warn(msg);
    }
}

std::size_t DirectoryCache::warm() {
    if (options_.force_refresh || options_.window_hours == 0) {
        return 0;
    }
    try {
        auto guard = db_.lock();
        store::Statement stmt = db_.prepare(
            "SELECT path FROM directory_cache WHERE completed = 1 AND last_searched > ?1");
        stmt.bind(1, now() - window_secs());
        std::size_t loaded = 0;
        while (stmt.step()) {
            freshness_.insert(stmt.column_text(0));
            ++loaded;
        }
        return loaded;
    } catch (const store::StoreError& e) {
        degrade("warm-up", e);
        return 0;
    }
}

DirectoryStatus DirectoryCache::status_of(const std::string& path) {
    if (options_.force_refresh) {
        return DirectoryStatus::NotCached;
    }
    if (freshness_.contains(path)) {
        return DirectoryStatus::Fresh;
    }

    try {
        auto guard = db_.lock();
        store::Statement stmt =
            db_.prepare("SELECT last_searched, completed FROM directory_cache WHERE path = ?1");
        stmt.bind(1, std::string_view(path));
        if (!stmt.step()) {
            return DirectoryStatus::NotCached;
        }
        const std::int64_t last_searched = stmt.column_int64(0);
        const bool completed = stmt.column_bool(1);

        if (now() - last_searched >= window_secs()) {
            return DirectoryStatus::Stale;
        }
        if (!completed) {
            return DirectoryStatus::Incomplete;
        }
        freshness_.insert(path);
        return DirectoryStatus::Fresh;
    } catch (const store::StoreError& e) {
        degrade("lookup", e);
        return DirectoryStatus::NotCached;
    }
}

void DirectoryCache::record_result(const std::string& session_id, const std::string& path,
                                   bool completed) {
    CacheUpdate update;
    update.path = path;
    update.completed = completed;
    record_results(session_id, {update});
}

void DirectoryCache::record_results(const std::string& session_id,
                                    const std::vector<CacheUpdate>& updates) {
    if (updates.empty()) {
        return;
    }
    try {
        store::Transaction tx(db_);
        // Более ранняя запись не затирает более позднюю
        store::Statement stmt = db_.prepare(R"SQL(
            INSERT INTO directory_cache
                (path, last_searched, completed, session_id, target_found, target_deleted, error)
            VALUES (?1, ?2, ?3, ?4, ?5, 0, ?6)
            ON CONFLICT(path) DO UPDATE SET
                last_searched  = excluded.last_searched,
                completed      = excluded.completed,
                session_id     = excluded.session_id,
                target_found   = excluded.target_found,
                target_deleted = 0,
                error          = excluded.error
            WHERE excluded.last_searched >= directory_cache.last_searched
        )SQL");

        const std::int64_t ts = now();
        for (const auto& u : updates) {
            stmt.reset();
            stmt.bind(1, std::string_view(u.path));
            stmt.bind(2, ts);
            stmt.bind(3, u.completed);
            stmt.bind(4, std::string_view(session_id));
            stmt.bind(5, u.target_found);
            stmt.bind(6, u.error);
            stmt.execute();
        }
        tx.commit();
    } catch (const store::StoreError& e) {
        degrade("write", e);
    }
}

void DirectoryCache::mark_deleted(const std::string& path) {
    try {
        auto guard = db_.lock();
        store::Statement stmt = db_.prepare(
            "UPDATE directory_cache SET target_deleted = 1 WHERE path = ?1 AND target_found = 1");
        stmt.bind(1, std::string_view(path));
        stmt.execute();
    } catch (const store::StoreError& e) {
        degrade("write", e);
    }
}

std::size_t DirectoryCache::prune(std::int64_t older_than_secs) {
    const std::int64_t cutoff = now() - older_than_secs;
    std::size_t removed = 0;
    try {
        while (true) {
            store::Transaction tx(db_);
            store::Statement stmt = db_.prepare(R"SQL(
                DELETE FROM directory_cache WHERE rowid IN (
                    SELECT rowid FROM directory_cache WHERE last_searched < ?1 LIMIT ?2)
            )SQL");
            stmt.bind(1, cutoff);
            stmt.bind(2, static_cast<std::int64_t>(PRUNE_BATCH));
            const int changed = stmt.execute();
            tx.commit();

            removed += static_cast<std::size_t>(changed);
            if (static_cast<std::size_t>(changed) < PRUNE_BATCH) {
                break;
            }
        }
    } catch (const store::StoreError& e) {
        degrade("prune", e);
    }
    return removed;
}

std::vector<std::string> DirectoryCache::undeleted_targets(const std::string& root,
                                                          bool recursive,
                                                          const std::string& target_name) {
    std::vector<std::string> out;
    try {
        auto guard = db_.lock();
        std::string sql =
            "SELECT path FROM directory_cache "
            "WHERE target_found = 1 AND target_deleted = 0 AND (path = ?1";
        if (recursive) {
            sql += " OR substr(path, 1, length(?2)) = ?2";
        }
        sql += ") ORDER BY path";

        store::Statement stmt = db_.prepare(sql);
        stmt.bind(1, std::string_view(root));
        if (recursive) {
            // Граница компонента: /a не захватывает /ab
            const std::string prefix = (!root.empty() && root.back() == '/') ? root : root + "/";
            stmt.bind(2, std::string_view(prefix));
        }
        while (stmt.step()) {
            const std::filesystem::path dir = platform::path_from_utf8(stmt.column_text(0));
            out.push_back(platform::path_to_utf8(dir / platform::path_from_utf8(target_name)));
        }
    } catch (const store::StoreError& e) {
        degrade("lookup", e);
    }
    return out;
}

std::size_t DirectoryCache::repair_inconsistent() {
    try {
        auto guard = db_.lock();
        store::Statement stmt = db_.prepare(
            "UPDATE directory_cache SET target_deleted = 0 "
            "WHERE target_deleted = 1 AND target_found = 0");
        return static_cast<std::size_t>(stmt.execute());
    } catch (const store::StoreError& e) {
        degrade("repair", e);
        return 0;
    }
}

std::optional<CacheEntry> DirectoryCache::entry(const std::string& path) {
    try {
        auto guard = db_.lock();
        store::Statement stmt = db_.prepare(
            "SELECT path, last_searched, completed, session_id, target_found, target_deleted, "
            "error FROM directory_cache WHERE path = ?1");
        stmt.bind(1, std::string_view(path));
        if (!stmt.step()) {
            return std::nullopt;
        }
        CacheEntry e;
        e.path = stmt.column_text(0);
        e.last_searched = stmt.column_int64(1);
        e.completed = stmt.column_bool(2);
        e.session_id = stmt.column_optional_text(3);
        e.target_found = stmt.column_bool(4);
        e.target_deleted = stmt.column_bool(5);
        e.error = stmt.column_optional_text(6);
        return e;
    } catch (const store::StoreError& e) {
        degrade("lookup", e);
        return std::nullopt;
    }
}

}  // namespace dds::cache
