// ==============================================================================
// found_files.cpp - Журнал найденных файлов
// ==============================================================================

#include "dds/found_files.hpp"

#include "dds/platform.hpp"

#include <stdexcept>
#include <utility>

namespace dds::ledger {

namespace {

// NULL в колонке outcome = Pending
std::optional<std::string> outcome_column(DeletionOutcome outcome) {
    if (outcome == DeletionOutcome::Pending) {
        return std::nullopt;
    }
    return std::string(to_string(outcome));
}

DeletionOutcome parse_outcome(const std::optional<std::string>& s) {
    if (!s) return DeletionOutcome::Pending;
    if (*s == "deleted") return DeletionOutcome::Deleted;
    if (*s == "dry_run_skipped") return DeletionOutcome::DryRunSkipped;
    if (*s == "delete_failed") return DeletionOutcome::DeleteFailed;
    return DeletionOutcome::Pending;
}

}  // namespace

std::string_view to_string(DeletionOutcome outcome) {
    switch (outcome) {
        case DeletionOutcome::Pending:
            return "pending";
        case DeletionOutcome::Deleted:
            return "deleted";
        case DeletionOutcome::DryRunSkipped:
            return "dry_run_skipped";
        case DeletionOutcome::DeleteFailed:
            return "delete_failed";
    }
    return "pending";
}

FoundFilesLedger::FoundFilesLedger(store::Database& db) : db_(db) {}

std::size_t FoundFilesLedger::record(const std::string& session_id,
                                     const std::vector<std::string>& paths) {
    if (paths.empty()) {
        return 0;
    }
    store::Transaction tx(db_);
    store::Statement stmt = db_.prepare(
        "INSERT OR IGNORE INTO found_files (session_id, path, found_at) VALUES (?1, ?2, ?3)");
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

bool FoundFilesLedger::set_outcome(const std::string& session_id, const std::string& path,
                                   DeletionOutcome outcome,
                                   const std::optional<std::string>& note) {
    if (outcome == DeletionOutcome::Pending) {
        throw std::invalid_argument("deletion outcome cannot be reset to pending: " + path);
    }
    auto guard = db_.lock();
    store::Statement stmt = db_.prepare(
        "UPDATE found_files SET outcome = ?3, note = ?4 "
        "WHERE session_id = ?1 AND path = ?2 AND outcome IS NULL");
    stmt.bind(1, std::string_view(session_id));
    stmt.bind(2, std::string_view(path));
    stmt.bind(3, outcome_column(outcome));
    stmt.bind(4, note);
    return stmt.execute() == 1;
}

std::vector<FoundFile> FoundFilesLedger::select(const std::string& session_id,
                                                bool only_pending) {
    auto guard = db_.lock();
    std::string sql =
        "SELECT session_id, path, found_at, outcome, note FROM found_files WHERE session_id = ?1 ";
    if (only_pending) {
        sql += "AND outcome IS NULL ";
    }
    sql += "ORDER BY found_at, rowid";

    store::Statement stmt = db_.prepare(sql);
    stmt.bind(1, std::string_view(session_id));
    std::vector<FoundFile> out;
    while (stmt.step()) {
        FoundFile f;
        f.session_id = stmt.column_text(0);
        f.path = stmt.column_text(1);
        f.found_at = stmt.column_int64(2);
        f.outcome = parse_outcome(stmt.column_optional_text(3));
        f.note = stmt.column_optional_text(4);
        out.push_back(std::move(f));
    }
    return out;
}

std::vector<FoundFile> FoundFilesLedger::list(const std::string& session_id) {
    return select(session_id, false);
}

std::vector<FoundFile> FoundFilesLedger::pending(const std::string& session_id) {
    return select(session_id, true);
}

std::size_t FoundFilesLedger::count(const std::string& session_id) {
    auto guard = db_.lock();
    store::Statement stmt =
        db_.prepare("SELECT COUNT(*) FROM found_files WHERE session_id = ?1");
    stmt.bind(1, std::string_view(session_id));
    stmt.step();
    return static_cast<std::size_t>(stmt.column_int64(0));
}

std::size_t FoundFilesLedger::count(const std::string& session_id, DeletionOutcome outcome) {
    auto guard = db_.lock();
    store::Statement stmt = db_.prepare(
        outcome == DeletionOutcome::Pending
            ? "SELECT COUNT(*) FROM found_files WHERE session_id = ?1 AND outcome IS NULL"
            : "SELECT COUNT(*) FROM found_files WHERE session_id = ?1 AND outcome = ?2");
    stmt.bind(1, std::string_view(session_id));
    if (outcome != DeletionOutcome::Pending) {
        stmt.bind(2, to_string(outcome));
    }
    stmt.step();
    return static_cast<std::size_t>(stmt.column_int64(0));
}

}  // namespace dds::ledger
