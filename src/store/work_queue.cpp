// ==============================================================================
// work_queue.cpp - Персистентная очередь каталогов
// ==============================================================================

#include "dds/work_queue.hpp"

#include "dds/platform.hpp"

#include <stdexcept>

namespace dds::queue {

namespace {

QueueEntry read_entry(const store::Statement& stmt) {
    QueueEntry e;
    e.session_id = stmt.column_text(0);
    e.path = stmt.column_text(1);
    e.state = parse_state(stmt.column_text(2)).value_or(EntryState::Pending);
    e.enqueued_at = stmt.column_int64(3);
    e.error = stmt.column_optional_text(4);
    return e;
}

constexpr const char* kSelectColumns =
    "SELECT session_id, path, state, enqueued_at, error FROM work_queue ";

}  // namespace

std::string_view to_string(EntryState state) {
    switch (state) {
        case EntryState::Pending:
            return "pending";
        case EntryState::InProgress:
            return "in_progress";
        case EntryState::Completed:
            return "completed";
        case EntryState::Failed:
            return "failed";
    }
    return "pending";
}

std::optional<EntryState> parse_state(std::string_view s) {
    if (s == "pending") return EntryState::Pending;
    if (s == "in_progress") return EntryState::InProgress;
    if (s == "completed") return EntryState::Completed;
    if (s == "failed") return EntryState::Failed;
    return std::nullopt;
}

// ----------------------------------------------------------------------------
// plan_resume
// ----------------------------------------------------------------------------

ResumePlan plan_resume(const std::vector<QueueEntry>& entries) {
    ResumePlan plan;
    for (const auto& e : entries) {
        switch (e.state) {
            case EntryState::Pending:
                ++plan.pending;
                break;
            case EntryState::InProgress:
                // Выдана, но завершение не подтверждено - повторить
                plan.reset_to_pending.push_back(e.path);
                break;
            case EntryState::Completed:
                ++plan.completed;
                break;
            case EntryState::Failed:
                ++plan.failed;
                break;
        }
    }
    return plan;
}

// ----------------------------------------------------------------------------
// WorkQueue
// ----------------------------------------------------------------------------

WorkQueue::WorkQueue(store::Database& db) : db_(db) {}

std::size_t WorkQueue::enqueue(const std::string& session_id,
                               const std::vector<std::string>& paths) {
    if (paths.empty()) {
        return 0;
    }
    store::Transaction tx(db_);
    store::Statement stmt = db_.prepare(
        "INSERT OR IGNORE INTO work_queue (session_id, path, state, enqueued_at) "
        "VALUES (?1, ?2, 'pending', ?3)");

    const std::int64_t ts = platform::unix_now();
    std::size_t inserted = 0;
    for (const auto& path : paths) {
        stmt.reset();
        stmt.bind(1, std::string_view(session_id));
        stmt.bind(2, std::string_view(path));
        stmt.bind(3, ts);
        inserted += static_cast<std::size_t>(stmt.execute());
    }
    tx.commit();
    return inserted;
}

DequeueResult WorkQueue::dequeue_batch(const std::string& session_id, std::size_t limit,
                                       const FreshnessProbe& probe) {
    DequeueResult result;
    if (limit == 0) {
        return result;
    }

    store::Transaction tx(db_);
    store::Statement select = db_.prepare(
        "SELECT path FROM work_queue WHERE session_id = ?1 AND state = 'pending' "
        "ORDER BY enqueued_at, rowid LIMIT ?2");
    store::Statement take = db_.prepare(
        "UPDATE work_queue SET state = 'in_progress' "
        "WHERE session_id = ?1 AND path = ?2 AND state = 'pending'");
    store::Statement skip = db_.prepare(
        "UPDATE work_queue SET state = 'completed', error = NULL "
        "WHERE session_id = ?1 AND path = ?2 AND state = 'pending'");

    // Свежие строки не занимают слот: выбираем, пока не наберём limit
    while (result.dispatched.size() < limit) {
        const std::size_t want = limit - result.dispatched.size();

        std::vector<std::string> candidates;
        select.reset();
        select.bind(1, std::string_view(session_id));
        select.bind(2, static_cast<std::int64_t>(want));
        while (select.step()) {
            candidates.push_back(select.column_text(0));
        }
        if (candidates.empty()) {
            break;
        }

        for (const auto& path : candidates) {
            const bool fresh = probe && probe(path);
            store::Statement& stmt = fresh ? skip : take;
            stmt.reset();
            stmt.bind(1, std::string_view(session_id));
            stmt.bind(2, std::string_view(path));
            if (stmt.execute() != 1) {
                continue;
            }
            if (fresh) {
                result.skipped_fresh.push_back(path);
            } else {
                result.dispatched.push_back(path);
            }
        }

        if (candidates.size() < want) {
            break;
        }
    }

    tx.commit();
    return result;
}

void WorkQueue::complete(const std::string& session_id, const std::string& path,
                         EntryState outcome, const std::optional<std::string>& error) {
    Completion c;
    c.path = path;
    c.outcome = outcome;
    c.error = error;
    complete_batch(session_id, {c});
}

void WorkQueue::complete_batch(const std::string& session_id,
                               const std::vector<Completion>& completions) {
    if (completions.empty()) {
        return;
    }
    for (const auto& c : completions) {
        if (c.outcome != EntryState::Completed && c.outcome != EntryState::Failed) {
            throw std::invalid_argument("queue completion must be completed or failed: " +
                                        c.path);
        }
    }

    store::Transaction tx(db_);
    store::Statement stmt = db_.prepare(
        "UPDATE work_queue SET state = ?3, error = ?4 "
        "WHERE session_id = ?1 AND path = ?2 AND state = 'in_progress'");
    for (const auto& c : completions) {
        stmt.reset();
        stmt.bind(1, std::string_view(session_id));
        stmt.bind(2, std::string_view(c.path));
        stmt.bind(3, to_string(c.outcome));
        stmt.bind(4, c.error);
        stmt.execute();
    }
    tx.commit();
}

std::size_t WorkQueue::requeue(const std::string& session_id,
                               const std::vector<std::string>& paths) {
    if (paths.empty()) {
        return 0;
    }
    store::Transaction tx(db_);
    store::Statement stmt = db_.prepare(
        "UPDATE work_queue SET state = 'pending' "
        "WHERE session_id = ?1 AND path = ?2 AND state = 'in_progress'");
    std::size_t changed = 0;
    for (const auto& path : paths) {
        stmt.reset();
        stmt.bind(1, std::string_view(session_id));
        stmt.bind(2, std::string_view(path));
        changed += static_cast<std::size_t>(stmt.execute());
    }
    tx.commit();
    return changed;
}

std::size_t WorkQueue::apply_resume(const std::string& session_id, const ResumePlan& plan) {
    return requeue(session_id, plan.reset_to_pending);
}

std::size_t WorkQueue::pending_count(const std::string& session_id) {
    auto guard = db_.lock();
    store::Statement stmt = db_.prepare(
        "SELECT COUNT(*) FROM work_queue "
        "WHERE session_id = ?1 AND state IN ('pending', 'in_progress')");
    stmt.bind(1, std::string_view(session_id));
    stmt.step();
    return static_cast<std::size_t>(stmt.column_int64(0));
}

std::size_t WorkQueue::count(const std::string& session_id, EntryState state) {
    auto guard = db_.lock();
    store::Statement stmt =
        db_.prepare("SELECT COUNT(*) FROM work_queue WHERE session_id = ?1 AND state = ?2");
    stmt.bind(1, std::string_view(session_id));
    stmt.bind(2, to_string(state));
    stmt.step();
    return static_cast<std::size_t>(stmt.column_int64(0));
}

std::vector<QueueEntry> WorkQueue::incomplete_entries(const std::string& session_id) {
    auto guard = db_.lock();
    store::Statement stmt = db_.prepare(
        std::string(kSelectColumns) +
        "WHERE session_id = ?1 AND state IN ('pending', 'in_progress') "
        "ORDER BY enqueued_at, rowid");
    stmt.bind(1, std::string_view(session_id));

    std::vector<QueueEntry> out;
    while (stmt.step()) {
        out.push_back(read_entry(stmt));
    }
    return out;
}

std::vector<QueueEntry> WorkQueue::entries(const std::string& session_id) {
    auto guard = db_.lock();
    store::Statement stmt = db_.prepare(std::string(kSelectColumns) +
                                        "WHERE session_id = ?1 ORDER BY enqueued_at, rowid");
    stmt.bind(1, std::string_view(session_id));

    std::vector<QueueEntry> out;
    while (stmt.step()) {
        out.push_back(read_entry(stmt));
    }
    return out;
}

std::optional<QueueEntry> WorkQueue::find(const std::string& session_id,
                                          const std::string& path) {
    auto guard = db_.lock();
    store::Statement stmt =
        db_.prepare(std::string(kSelectColumns) + "WHERE session_id = ?1 AND path = ?2");
    stmt.bind(1, std::string_view(session_id));
    stmt.bind(2, std::string_view(path));
    if (!stmt.step()) {
        return std::nullopt;
    }
    return read_entry(stmt);
}

std::size_t WorkQueue::delete_session(const std::string& session_id) {
    auto guard = db_.lock();
    store::Statement stmt = db_.prepare("DELETE FROM work_queue WHERE session_id = ?1");
    stmt.bind(1, std::string_view(session_id));
    return static_cast<std::size_t>(stmt.execute());
}

}  // namespace dds::queue
