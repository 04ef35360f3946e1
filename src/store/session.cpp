// ==============================================================================
// session.cpp - Реестр сессий поиска
// ==============================================================================

#include "dds/session.hpp"

#include "dds/platform.hpp"

#include <algorithm>

namespace dds::session {

namespace {

constexpr const char* kSelectColumns =
    "SELECT id, root, is_recursive, is_dry_run, force_refresh, status, created_at, updated_at, "
    "dirs_new, dirs_resumed, dirs_skipped, dirs_errored, files_found, files_deleted "
    "FROM search_sessions ";

Session read_session(const store::Statement& stmt) {
    Session s;
    s.id = stmt.column_text(0);
    s.params.root = stmt.column_text(1);
    s.params.recursive = stmt.column_bool(2);
    s.params.dry_run = stmt.column_bool(3);
    s.params.force_refresh = stmt.column_bool(4);
    s.status = parse_status(stmt.column_text(5)).value_or(Status::Failed);
    s.created_at = stmt.column_int64(6);
    s.updated_at = stmt.column_int64(7);
    s.counters.dirs_new = static_cast<std::uint64_t>(stmt.column_int64(8));
    s.counters.dirs_resumed = static_cast<std::uint64_t>(stmt.column_int64(9));
    s.counters.dirs_skipped = static_cast<std::uint64_t>(stmt.column_int64(10));
    s.counters.dirs_errored = static_cast<std::uint64_t>(stmt.column_int64(11));
    s.counters.files_found = static_cast<std::uint64_t>(stmt.column_int64(12));
    s.counters.files_deleted = static_cast<std::uint64_t>(stmt.column_int64(13));
    return s;
}

void delete_session_rows(store::Database& db, const std::string& id) {
    for (const char* sql : {"DELETE FROM work_queue WHERE session_id = ?1",
                            "DELETE FROM found_files WHERE session_id = ?1",
                            "DELETE FROM search_sessions WHERE id = ?1"}) {
        store::Statement stmt = db.prepare(sql);
        stmt.bind(1, std::string_view(id));
        stmt.execute();
    }
}

}  // namespace

// ----------------------------------------------------------------------------
// Состояния
// ----------------------------------------------------------------------------

std::string_view to_string(Status status) {
    switch (status) {
        case Status::Active:
            return "active";
        case Status::Completed:
            return "completed";
        case Status::Interrupted:
            return "interrupted";
        case Status::Failed:
            return "failed";
    }
    return "failed";
}

std::optional<Status> parse_status(std::string_view s) {
    if (s == "active") return Status::Active;
    if (s == "completed") return Status::Completed;
    if (s == "interrupted") return Status::Interrupted;
    if (s == "failed") return Status::Failed;
    return std::nullopt;
}

bool can_transition(Status from, Status to) {
    switch (from) {
        case Status::Active:
            return to == Status::Completed || to == Status::Interrupted || to == Status::Failed;
        case Status::Interrupted:
            return to == Status::Active || to == Status::Completed;
        case Status::Completed:
        case Status::Failed:
            return false;
    }
    return false;
}

bool is_terminal(Status status) {
    return status == Status::Completed || status == Status::Failed;
}

InvalidTransition::InvalidTransition(Status from, Status to)
    : std::logic_error("invalid session transition: " + std::string(to_string(from)) + " -> " +
                       std::string(to_string(to))) {}

SessionNotFound::SessionNotFound(const std::string& id)
    : std::runtime_error("session not found: " + id) {}

// ----------------------------------------------------------------------------
// SessionRegistry
// ----------------------------------------------------------------------------

SessionRegistry::SessionRegistry(store::Database& db) : db_(db) {}

Session SessionRegistry::create(const SessionParams& params) {
    Session s;
    s.id = platform::generate_session_id();
    s.params = params;
    s.status = Status::Active;
    s.created_at = platform::unix_now();
    s.updated_at = s.created_at;

    auto guard = db_.lock();
    store::Statement stmt = db_.prepare(
        "INSERT INTO search_sessions "
        "(id, root, is_recursive, is_dry_run, force_refresh, status, created_at, updated_at) "
        "VALUES (?1, ?2, ?3, ?4, ?5, 'active', ?6, ?6)");
    stmt.bind(1, std::string_view(s.id));
    stmt.bind(2, std::string_view(params.root));
    stmt.bind(3, params.recursive);
    stmt.bind(4, params.dry_run);
    stmt.bind(5, params.force_refresh);
    stmt.bind(6, s.created_at);
    stmt.execute();
    return s;
}

std::optional<Session> SessionRegistry::find(const std::string& id) {
    auto guard = db_.lock();
    store::Statement stmt = db_.prepare(std::string(kSelectColumns) + "WHERE id = ?1");
    stmt.bind(1, std::string_view(id));
    if (!stmt.step()) {
        return std::nullopt;
    }
    return read_session(stmt);
}

std::optional<Session> SessionRegistry::find_resumable(const SessionParams& params,
                                                       std::int64_t active_grace_secs) {
    auto guard = db_.lock();
    store::Statement stmt = db_.prepare(
        std::string(kSelectColumns) +
        "WHERE root = ?1 AND is_recursive = ?2 AND is_dry_run = ?3 "
        "AND (status = 'interrupted' OR (status = 'active' AND updated_at <= ?4)) "
        "ORDER BY updated_at DESC, created_at DESC, rowid DESC LIMIT 1");
    stmt.bind(1, std::string_view(params.root));
    stmt.bind(2, params.recursive);
    stmt.bind(3, params.dry_run);
    stmt.bind(4, platform::unix_now() - std::max<std::int64_t>(active_grace_secs, 0));
    if (!stmt.step()) {
        return std::nullopt;
    }
    return read_session(stmt);
}

Session SessionRegistry::transition(const std::string& id, Status to) {
    store::Transaction tx(db_);
    auto current = find(id);
    if (!current) {
        throw SessionNotFound(id);
    }
    if (!can_transition(current->status, to)) {
        throw InvalidTransition(current->status, to);
    }

    const std::int64_t ts = platform::unix_now();
    store::Statement stmt =
        db_.prepare("UPDATE search_sessions SET status = ?2, updated_at = ?3 WHERE id = ?1");
    stmt.bind(1, std::string_view(id));
    stmt.bind(2, to_string(to));
    stmt.bind(3, ts);
    stmt.execute();
    tx.commit();

    current->status = to;
    current->updated_at = ts;
    return *current;
}

void SessionRegistry::write_counters(const std::string& id, const Counters& c) {
    auto guard = db_.lock();
    store::Statement stmt = db_.prepare(
        "UPDATE search_sessions SET dirs_new = ?2, dirs_resumed = ?3, dirs_skipped = ?4, "
        "dirs_errored = ?5, files_found = ?6, files_deleted = ?7, updated_at = ?8 "
        "WHERE id = ?1");
    stmt.bind(1, std::string_view(id));
    stmt.bind(2, static_cast<std::int64_t>(c.dirs_new));
    stmt.bind(3, static_cast<std::int64_t>(c.dirs_resumed));
    stmt.bind(4, static_cast<std::int64_t>(c.dirs_skipped));
    stmt.bind(5, static_cast<std::int64_t>(c.dirs_errored));
    stmt.bind(6, static_cast<std::int64_t>(c.files_found));
    stmt.bind(7, static_cast<std::int64_t>(c.files_deleted));
    stmt.bind(8, platform::unix_now());
    if (stmt.execute() == 0) {
        throw SessionNotFound(id);
    }
}

std::vector<Session> SessionRegistry::list(std::optional<Status> status) {
    auto guard = db_.lock();
    std::string sql = kSelectColumns;
    if (status) {
        sql += "WHERE status = ?1 ";
    }
    sql += "ORDER BY updated_at DESC, rowid DESC";

    store::Statement stmt = db_.prepare(sql);
    if (status) {
        stmt.bind(1, to_string(*status));
    }
    std::vector<Session> out;
    while (stmt.step()) {
        out.push_back(read_session(stmt));
    }
    return out;
}

std::vector<std::pair<Status, std::size_t>> SessionRegistry::count_by_status() {
    std::vector<std::pair<Status, std::size_t>> out = {
        {Status::Active, 0},
        {Status::Completed, 0},
        {Status::Interrupted, 0},
        {Status::Failed, 0},
    };

    auto guard = db_.lock();
    store::Statement stmt =
        db_.prepare("SELECT status, COUNT(*) FROM search_sessions GROUP BY status");
    while (stmt.step()) {
        auto st = parse_status(stmt.column_text(0));
        if (!st) {
            continue;
        }
        for (auto& kv : out) {
            if (kv.first == *st) {
                kv.second = static_cast<std::size_t>(stmt.column_int64(1));
            }
        }
    }
    return out;
}

void SessionRegistry::delete_session(const std::string& id) {
    store::Transaction tx(db_);
    delete_session_rows(db_, id);
    tx.commit();
}

std::size_t SessionRegistry::cleanup_stale(std::int64_t max_age_secs,
                                           const std::string& except_id) {
    store::Transaction tx(db_);
    store::Statement select = db_.prepare(
        "SELECT id FROM search_sessions WHERE status != 'completed' AND updated_at < ?1 "
        "AND id != ?2");
    select.bind(1, platform::unix_now() - max_age_secs);
    select.bind(2, std::string_view(except_id));

    std::vector<std::string> ids;
    while (select.step()) {
        ids.push_back(select.column_text(0));
    }
    for (const auto& id : ids) {
        delete_session_rows(db_, id);
    }
    tx.commit();
    return ids.size();
}

std::size_t SessionRegistry::close_interrupted() {
    store::Transaction tx(db_);
    store::Statement select =
        db_.prepare("SELECT id FROM search_sessions WHERE status = 'interrupted'");
    std::vector<std::string> ids;
    while (select.step()) {
        ids.push_back(select.column_text(0));
    }

    for (const auto& id : ids) {
        store::Statement del = db_.prepare("DELETE FROM work_queue WHERE session_id = ?1");
        del.bind(1, std::string_view(id));
        del.execute();
        transition(id, Status::Completed);
    }
    tx.commit();
    return ids.size();
}

}  // namespace dds::session
