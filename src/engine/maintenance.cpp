// ==============================================================================
// maintenance.cpp - Управление кэшем
// ==============================================================================

#include "dds/maintenance.hpp"

#include "dds/directory_cache.hpp"
#include "dds/output.hpp"
#include "dds/platform.hpp"
#include "dds/work_queue.hpp"

#include <rapidjson/document.h>

#include <cstdio>
#include <ctime>

namespace dds::maintenance {

namespace {

rapidjson::Value json_string(const std::string& s, rapidjson::Document::AllocatorType& a) {
    return rapidjson::Value(s.c_str(), static_cast<rapidjson::SizeType>(s.size()), a);
}

std::string pad_right(const std::string& s, std::size_t width) {
    if (s.size() >= width) {
        return s;
    }
    return s + std::string(width - s.size(), ' ');
}

}  // namespace

std::optional<double> CacheStats::hit_rate() const {
    if (total == 0) {
        return std::nullopt;
    }
    return static_cast<double>(completed) / static_cast<double>(total) * 100.0;
}

std::string format_timestamp(std::int64_t unix_secs) {
    const std::time_t t = static_cast<std::time_t>(unix_secs);
    std::tm tm{};
#ifdef _WIN32
    gmtime_s(&tm, &t);
#else
    gmtime_r(&t, &tm);
#endif
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
    return buf;
}

// ----------------------------------------------------------------------------
// Операции
// ----------------------------------------------------------------------------

CacheStatus cache_status(store::Database& db, std::uint32_t window_hours) {
    CacheStatus status;
    status.database_path = db.path();
    status.window_hours = window_hours;

    {
        auto guard = db.lock();
        store::Statement stmt = db.prepare(
            "SELECT path FROM directory_cache WHERE completed = 0 "
            "ORDER BY last_searched DESC, path");
        while (stmt.step()) {
            status.incomplete_paths.push_back(stmt.column_text(0));
        }
    }

    session::SessionRegistry sessions(db);
    queue::WorkQueue queue(db);
    for (auto status_filter : {session::Status::Interrupted, session::Status::Active}) {
        for (const auto& s : sessions.list(status_filter)) {
            ResumableSession r;
            r.id = s.id;
            r.root = s.params.root;
            r.status = s.status;
            r.pending = queue.pending_count(s.id);
            r.updated_at = s.updated_at;
            status.sessions.push_back(std::move(r));
        }
    }
    return status;
}

CacheStats cache_stats(store::Database& db, std::uint32_t window_hours) {
    CacheStats stats;
    stats.database_path = db.path();
    stats.window_hours = window_hours;

    {
        auto guard = db.lock();
        // Один проход по таблице вместо пяти COUNT
        store::Statement stmt = db.prepare(R"SQL(
            SELECT
                COUNT(*),
                COALESCE(SUM(CASE WHEN completed = 1 THEN 1 ELSE 0 END), 0),
                COALESCE(SUM(CASE WHEN completed = 0 THEN 1 ELSE 0 END), 0),
                COALESCE(SUM(CASE WHEN target_found = 1 THEN 1 ELSE 0 END), 0),
                COALESCE(SUM(CASE WHEN target_deleted = 1 THEN 1 ELSE 0 END), 0),
                COALESCE(SUM(CASE WHEN error IS NOT NULL THEN 1 ELSE 0 END), 0)
            FROM directory_cache
        )SQL");
        if (stmt.step()) {
            stats.total = static_cast<std::uint64_t>(stmt.column_int64(0));
            stats.completed = static_cast<std::uint64_t>(stmt.column_int64(1));
            stats.incomplete = static_cast<std::uint64_t>(stmt.column_int64(2));
            stats.with_target = static_cast<std::uint64_t>(stmt.column_int64(3));
            stats.targets_deleted = static_cast<std::uint64_t>(stmt.column_int64(4));
            stats.with_error = static_cast<std::uint64_t>(stmt.column_int64(5));
        }
    }

    session::SessionRegistry sessions(db);
    stats.sessions = sessions.count_by_status();
    return stats;
}

ClearReport clear_incomplete(store::Database& db) {
    ClearReport report;
    store::Transaction tx(db);
    {
        store::Statement stmt = db.prepare("DELETE FROM directory_cache WHERE completed = 0");
        report.cache_rows_removed = static_cast<std::size_t>(stmt.execute());
    }
    session::SessionRegistry sessions(db);
    report.sessions_closed = sessions.close_interrupted();
    tx.commit();
    return report;
}

IntegrityReport check_integrity(store::Database& db) {
    IntegrityReport report;
    report.message = db.integrity_check();
    report.ok = (report.message == "ok");
    if (!report.ok) {
        return report;
    }
    cache::DirectoryCache cache(db, cache::CacheOptions{});
    report.repaired = cache.repair_inconsistent();
    return report;
}

// ----------------------------------------------------------------------------
// Вывод
// ----------------------------------------------------------------------------

void print_status(output::Writer& out, const CacheStatus& status, bool json) {
    if (json) {
        rapidjson::Document doc;
        doc.SetObject();
        auto& a = doc.GetAllocator();
        doc.AddMember("database", json_string(platform::path_to_utf8(status.database_path), a), a);
        doc.AddMember("cache_window_hours", static_cast<std::uint64_t>(status.window_hours), a);

        rapidjson::Value incomplete(rapidjson::kArrayType);
        for (const auto& p : status.incomplete_paths) {
            incomplete.PushBack(json_string(p, a), a);
        }
        doc.AddMember("incomplete", incomplete, a);

        rapidjson::Value sessions(rapidjson::kArrayType);
        for (const auto& s : status.sessions) {
            rapidjson::Value obj(rapidjson::kObjectType);
            obj.AddMember("id", json_string(s.id, a), a);
            obj.AddMember("root", json_string(s.root, a), a);
            obj.AddMember("status", json_string(std::string(session::to_string(s.status)), a), a);
            obj.AddMember("pending", static_cast<std::uint64_t>(s.pending), a);
            obj.AddMember("updated_at", static_cast<std::int64_t>(s.updated_at), a);
            sessions.PushBack(obj, a);
        }
        doc.AddMember("sessions", sessions, a);
        out.write_json_pretty(doc);
        return;
    }

    out.write_line(output::Stream::Stdout, "Cache Status");
    out.write_line(output::Stream::Stdout, "============");
    out.write_line(output::Stream::Stdout,
                   "Database: " + platform::path_to_utf8(status.database_path));
    out.write_line(output::Stream::Stdout,
                   "Cache window: " + std::to_string(status.window_hours) + " hours");
    out.write_line(output::Stream::Stdout, "");

    if (status.incomplete_paths.empty()) {
        out.write_line(output::Stream::Stdout, "No incomplete searches found.");
    } else {
        out.write_line(output::Stream::Stdout,
                       "Incomplete searches (" + std::to_string(status.incomplete_paths.size()) +
                           " total):");
        for (const auto& p : status.incomplete_paths) {
            out.write_line(output::Stream::Stdout, "  - " + p);
        }
    }

    if (!status.sessions.empty()) {
        out.write_line(output::Stream::Stdout, "");
        out.write_line(output::Stream::Stdout, "Resumable sessions:");
        output::Table table;
        table.set_headers({"Session", "Root", "Status", "Pending", "Updated (UTC)"});
        for (const auto& s : status.sessions) {
            table.add_row({s.id, s.root, std::string(session::to_string(s.status)),
                           std::to_string(s.pending), format_timestamp(s.updated_at)});
        }
        table.print(out);
    }
}

void print_stats(output::Writer& out, const CacheStats& stats, bool json) {
    if (json) {
        rapidjson::Document doc;
        doc.SetObject();
        auto& a = doc.GetAllocator();
        doc.AddMember("database", json_string(platform::path_to_utf8(stats.database_path), a), a);
        doc.AddMember("cache_window_hours", static_cast<std::uint64_t>(stats.window_hours), a);
        doc.AddMember("total_entries", stats.total, a);
        doc.AddMember("completed", stats.completed, a);
        doc.AddMember("incomplete", stats.incomplete, a);
        doc.AddMember("directories_with_target", stats.with_target, a);
        doc.AddMember("targets_deleted", stats.targets_deleted, a);
        doc.AddMember("errors", stats.with_error, a);
        if (auto rate = stats.hit_rate()) {
            doc.AddMember("hit_rate", *rate, a);
        }
        rapidjson::Value sessions(rapidjson::kObjectType);
        for (const auto& kv : stats.sessions) {
            rapidjson::Value name = json_string(std::string(session::to_string(kv.first)), a);
            rapidjson::Value count(static_cast<std::uint64_t>(kv.second));
            sessions.AddMember(name, count, a);
        }
        doc.AddMember("sessions", sessions, a);
        out.write_json_pretty(doc);
        return;
    }

    auto row = [&out](const std::string& label, std::uint64_t value) {
        out.write_line(output::Stream::Stdout, pad_right(label, 30) + std::to_string(value));
    };

    out.write_line(output::Stream::Stdout, "Cache Statistics");
    out.write_line(output::Stream::Stdout, "================");
    out.write_line(output::Stream::Stdout,
                   "Database: " + platform::path_to_utf8(stats.database_path));
    out.write_line(output::Stream::Stdout,
                   "Cache window: " + std::to_string(stats.window_hours) + " hours");
    out.write_line(output::Stream::Stdout, "");
    row("Total entries:", stats.total);
    row("Completed searches:", stats.completed);
    row("Incomplete searches:", stats.incomplete);
    row("Directories with target:", stats.with_target);
    row("Targets deleted:", stats.targets_deleted);
    row("Directories with errors:", stats.with_error);

    if (auto rate = stats.hit_rate()) {
        char buf[32];
        std::snprintf(buf, sizeof(buf), "%.1f%%", *rate);
        out.write_line(output::Stream::Stdout, "");
        out.write_line(output::Stream::Stdout, std::string("Cache hit rate: ") + buf);
    }

    out.write_line(output::Stream::Stdout, "");
    out.write_line(output::Stream::Stdout, "Sessions:");
    for (const auto& kv : stats.sessions) {
        row("  " + std::string(session::to_string(kv.first)) + ":", kv.second);
    }
}

void print_clear(output::Writer& out, const ClearReport& report, bool json) {
    if (json) {
        rapidjson::Document doc;
        doc.SetObject();
        auto& a = doc.GetAllocator();
        doc.AddMember("cache_rows_removed", static_cast<std::uint64_t>(report.cache_rows_removed),
                      a);
        doc.AddMember("sessions_closed", static_cast<std::uint64_t>(report.sessions_closed), a);
        out.write_json_pretty(doc);
        return;
    }

    if (report.cache_rows_removed == 0) {
        out.write_line(output::Stream::Stdout, "No incomplete search entries to clear.");
    } else {
        out.write_line(output::Stream::Stdout,
                       "Cleared " + std::to_string(report.cache_rows_removed) +
                           " incomplete search entries.");
    }
    if (report.sessions_closed > 0) {
        out.write_line(output::Stream::Stdout,
                       "Closed " + std::to_string(report.sessions_closed) +
                           " interrupted session(s).");
    }
}

}  // namespace dds::maintenance
