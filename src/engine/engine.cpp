// ==============================================================================
// engine.cpp - Оркестратор поиска
// ==============================================================================

#include "dds/engine.hpp"

#include "dds/output.hpp"
#include "dds/platform.hpp"

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <system_error>
#include <thread>

namespace dds::engine {

using SteadyClock = std::chrono::steady_clock;

namespace {

// Верхняя граница ожидания: отмена по сигналу не будит condition_variable
constexpr auto POLL_INTERVAL = std::chrono::milliseconds(50);

std::string format_timeout(std::chrono::milliseconds timeout) {
    if (timeout.count() % 1000 == 0) {
        return std::to_string(timeout.count() / 1000) + "s";
    }
    return std::to_string(timeout.count()) + "ms";
}

/// Сколько живая сессия может не обновлять updated_at: задача успевает
/// упереться в таймаут, а буфер - несколько раз сброситься
std::int64_t active_grace_secs(const config::SearchConfig& cfg) {
    const auto quiet = cfg.task_timeout + 3 * cfg.flush_interval;
    return std::chrono::ceil<std::chrono::seconds>(quiet).count() + 1;
}

session::Status to_status(SessionOutcome outcome) {
    switch (outcome) {
        case SessionOutcome::Completed:
            return session::Status::Completed;
        case SessionOutcome::Interrupted:
            return session::Status::Interrupted;
        case SessionOutcome::Failed:
            return session::Status::Failed;
    }
    return session::Status::Failed;
}

// ----------------------------------------------------------------------------
// ProgressReporter - поток, перерисовывающий строку прогресса
// ----------------------------------------------------------------------------

class ProgressReporter {
public:
    ProgressReporter(output::Writer& out, const SearchStats& stats, std::string_view label)
        : out_(out), stats_(stats) {
        out_.progress_begin(label);
        if (!out_.progress_active()) {
            return;
        }
        try {
            thread_ = std::thread([this] { loop(); });
        } catch (const std::system_error& e) {
            out_.progress_end();
            out_.debug(std::string("progress display disabled - ") + e.what());
        }
    }

    ~ProgressReporter() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stop_ = true;
        }
        cv_.notify_all();
        if (thread_.joinable()) {
            thread_.join();
        }
        out_.progress_end();
    }

    ProgressReporter(const ProgressReporter&) = delete;
    ProgressReporter& operator=(const ProgressReporter&) = delete;

private:
    void loop() {
        std::unique_lock<std::mutex> lock(mutex_);
        while (!stop_) {
            lock.unlock();
            out_.progress_tick(format_progress(stats_.snapshot()));
            lock.lock();
            cv_.wait_for(lock, std::chrono::milliseconds(output::TICK_MS), [this] { return stop_; });
        }
    }

    output::Writer& out_;
    const SearchStats& stats_;
    std::thread thread_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool stop_ = false;
};

}  // namespace

// ----------------------------------------------------------------------------
// SearchStats
// ----------------------------------------------------------------------------

StatsSnapshot SearchStats::snapshot() const noexcept {
    StatsSnapshot s;
    s.dirs_new = dirs_new_.load(std::memory_order_relaxed);
    s.dirs_resumed = dirs_resumed_.load(std::memory_order_relaxed);
    s.dirs_skipped = dirs_skipped_.load(std::memory_order_relaxed);
    s.files_found = files_found_.load(std::memory_order_relaxed);
    s.files_deleted = files_deleted_.load(std::memory_order_relaxed);
    s.errors = dirs_errored_.load(std::memory_order_relaxed) +
               delete_errors_.load(std::memory_order_relaxed);
    s.queue_depth = queue_depth_.load(std::memory_order_relaxed);
    return s;
}

session::Counters SearchStats::to_counters() const noexcept {
    session::Counters c;
    c.dirs_new = dirs_new_.load(std::memory_order_relaxed);
    c.dirs_resumed = dirs_resumed_.load(std::memory_order_relaxed);
    c.dirs_skipped = dirs_skipped_.load(std::memory_order_relaxed);
    c.dirs_errored = dirs_errored_.load(std::memory_order_relaxed);
    c.files_found = files_found_.load(std::memory_order_relaxed);
    c.files_deleted = files_deleted_.load(std::memory_order_relaxed);
    return c;
}

void SearchStats::restore(const session::Counters& c) noexcept {
    dirs_new_.store(c.dirs_new, std::memory_order_relaxed);
    dirs_resumed_.store(c.dirs_resumed, std::memory_order_relaxed);
    dirs_skipped_.store(c.dirs_skipped, std::memory_order_relaxed);
    dirs_errored_.store(c.dirs_errored, std::memory_order_relaxed);
    files_found_.store(c.files_found, std::memory_order_relaxed);
    files_deleted_.store(c.files_deleted, std::memory_order_relaxed);
}

std::string format_progress(const StatsSnapshot& s) {
    std::string out = "dirs ";
    out += std::to_string(s.dirs_new) + " new, ";
    out += std::to_string(s.dirs_resumed) + " resumed, ";
    out += std::to_string(s.dirs_skipped) + " skipped | found ";
    out += std::to_string(s.files_found) + ", deleted ";
    out += std::to_string(s.files_deleted) + " | errors ";
    out += std::to_string(s.errors) + " | queue ";
    out += std::to_string(s.queue_depth);
    return out;
}

void WriteBuffer::clear() {
    completions.clear();
    children.clear();
    found.clear();
    cache_updates.clear();
    requeue.clear();
}

std::string_view to_string(SessionOutcome outcome) {
    switch (outcome) {
        case SessionOutcome::Completed:
            return "completed";
        case SessionOutcome::Interrupted:
            return "interrupted";
        case SessionOutcome::Failed:
            return "failed";
    }
    return "failed";
}

// ----------------------------------------------------------------------------
// Внутреннее состояние
// ----------------------------------------------------------------------------

struct Orchestrator::Signal {
    std::mutex mutex;
    std::condition_variable cv;
    std::size_t completions = 0;
};

/// Задача живёт в shared_ptr: брошенная по таймауту задача может
/// пережить и оркестратор, и сессию
struct Orchestrator::Task {
    std::string path;
    CancellationToken token;
    SteadyClock::time_point deadline;
    bool resumed = false;
    std::atomic<bool> done{false};
    walker::WalkResult result;  // пишется до done = true
};

/// Состояние одной сессии: создаётся в run() и отбрасывается по её окончании
struct Orchestrator::SessionContext {
    session::Session session;
    bool resumed_session = false;
    SearchStats stats;
    WriteBuffer buffer;
    /// Каталоги, незавершённые в прошлый раз: их обход считается resumed
    std::unordered_set<std::string> resumed;
    /// Оценка числа Pending строк в хранилище
    std::uint64_t db_pending = 0;
    SteadyClock::time_point last_flush;
    std::vector<std::string> report_lines;
};

// ----------------------------------------------------------------------------
// Orchestrator
// ----------------------------------------------------------------------------

Orchestrator::Orchestrator(store::Database& db, config::SearchConfig cfg, output::Writer& out,
                           CancellationToken cancel)
    : db_(db),
      cfg_(std::move(cfg)),
      out_(out),
      cancel_(std::move(cancel)),
      walk_(&walker::walk_directory),
      queue_(db),
      sessions_(db),
      ledger_(db) {
    walk_options_.target_name = cfg_.target_name;
    walk_options_.exclusions.prefixes = cfg_.exclude_prefixes;
    walk_options_.exclusions.names = cfg_.exclude_names;
    walk_options_.emit_children = cfg_.recursive;
    if (cfg_.concurrency_limit == 0) {
        cfg_.concurrency_limit = 1;
    }
    if (cfg_.dequeue_batch_size == 0) {
        cfg_.dequeue_batch_size = 1;
    }
}

RunSummary Orchestrator::run() {
    RunSummary summary;
    SessionContext ctx;

    cache::CacheOptions cache_options;
    cache_options.window_hours = cfg_.cache_window_hours;
    cache_options.force_refresh = cfg_.force_refresh;
    cache::DirectoryCache cache(db_, cache_options, &out_);

    // Обслуживание и открытие сессии
    try {
        if (cfg_.cache_window_secs() > 0) {
            const std::size_t stale = sessions_.cleanup_stale(cfg_.cache_window_secs());
            if (stale > 0) {
                out_.debug("removed " + std::to_string(stale) + " stale session(s)");
            }
        }
        if (cfg_.retention_secs() > 0) {
            const std::size_t pruned = cache.prune(cfg_.retention_secs());
            if (pruned > 0) {
                out_.debug("pruned " + std::to_string(pruned) + " old cache entries");
            }
        }
        const std::size_t warm = cache.warm();
        if (out_.debug_enabled()) {
            out_.debug("loaded " + std::to_string(warm) + " fresh directories from cache");
        }
        open_session(ctx);
    } catch (const store::StoreError& e) {
        summary.failure = std::string("failed to start search session - ") + e.what();
        summary.stats = ctx.stats.snapshot();
        return summary;
    } catch (const session::InvalidTransition& e) {
        // Сессию перехватил другой процесс между поиском и переходом
        summary.failure = std::string("failed to start search session - ") + e.what();
        summary.stats = ctx.stats.snapshot();
        return summary;
    } catch (const session::SessionNotFound& e) {
        summary.failure = std::string("failed to start search session - ") + e.what();
        summary.stats = ctx.stats.snapshot();
        return summary;
    }

    summary.session_id = ctx.session.id;
    summary.resumed = ctx.resumed_session;

    SessionOutcome outcome = SessionOutcome::Completed;
    {
        ProgressReporter reporter(out_, ctx.stats, "Searching " + cfg_.root.string());
        try {
            scan(ctx, cache);
            if (cancel_.is_cancelled() && queue_.pending_count(ctx.session.id) > 0) {
                outcome = SessionOutcome::Interrupted;
            } else {
                if (!cfg_.dry_run && !cancel_.is_cancelled()) {
                    adopt_undeleted(ctx, cache);
                }
                delete_found(ctx, cache);
                // Отмена во время удаления: оставшиеся файлы удалит resume
                if (ledger_.count(ctx.session.id, ledger::DeletionOutcome::Pending) > 0) {
                    outcome = SessionOutcome::Interrupted;
                }
            }
        } catch (const store::StoreError& e) {
            outcome = SessionOutcome::Failed;
            summary.failure = e.what();
        } catch (const std::system_error& e) {
            outcome = SessionOutcome::Failed;
            summary.failure = std::string("failed to start worker thread - ") + e.what();
        } catch (const session::SessionNotFound& e) {
            // Сессию удалили извне посреди поиска
            outcome = SessionOutcome::Failed;
            summary.failure = e.what();
        } catch (const session::InvalidTransition& e) {
            outcome = SessionOutcome::Failed;
            summary.failure = e.what();
        }
        ctx.stats.set_queue_depth(0);
    }

    for (const auto& line : ctx.report_lines) {
        out_.write_line(output::Stream::Stdout, line);
    }

    summary.outcome = finish(ctx, outcome, summary.failure);
    summary.stats = ctx.stats.snapshot();
    return summary;
}

// ----------------------------------------------------------------------------
// Открытие / возобновление сессии
// ----------------------------------------------------------------------------

void Orchestrator::open_session(SessionContext& ctx) {
    session::SessionParams params;
    params.root = platform::path_to_utf8(cfg_.root);
    params.recursive = cfg_.recursive;
    params.dry_run = cfg_.dry_run;
    params.force_refresh = cfg_.force_refresh;

    if (auto prior = sessions_.find_resumable(params, active_grace_secs(cfg_))) {
        if (prior->status == session::Status::Active) {
            // Процесс завершился, не закрыв сессию
            out_.debug("session " + prior->id + " was not closed cleanly");
            *prior = sessions_.transition(prior->id, session::Status::Interrupted);
        }

        const auto entries = queue_.incomplete_entries(prior->id);
        const queue::ResumePlan plan = queue::plan_resume(entries);
        const std::size_t undeleted =
            ledger_.count(prior->id, ledger::DeletionOutcome::Pending);

        if (plan.work_remaining() > 0 || undeleted > 0) {
            store::Transaction tx(db_);
            queue_.apply_resume(prior->id, plan);
            ctx.session = sessions_.transition(prior->id, session::Status::Active);
            tx.commit();

            for (const auto& e : entries) {
                ctx.resumed.insert(e.path);
            }
            ctx.stats.restore(prior->counters);
            ctx.resumed_session = true;
            out_.info("Resuming interrupted session " + ctx.session.id + " (" +
                      std::to_string(plan.work_remaining()) + " directories pending, " +
                      std::to_string(plan.reset_to_pending.size()) + " recovered)");
        } else {
            sessions_.transition(prior->id, session::Status::Completed);
            out_.debug("session " + prior->id + " had no remaining work, closed");
        }
    }

    if (!ctx.resumed_session) {
        store::Transaction tx(db_);
        ctx.session = sessions_.create(params);
        queue_.enqueue(ctx.session.id, {params.root});
        tx.commit();
        out_.debug("started session " + ctx.session.id);
    }

    ctx.db_pending = queue_.count(ctx.session.id, queue::EntryState::Pending);
    ctx.stats.set_queue_depth(ctx.db_pending);
}

// ----------------------------------------------------------------------------
// Основной цикл
// ----------------------------------------------------------------------------

std::shared_ptr<Orchestrator::Task> Orchestrator::spawn(SessionContext& ctx,
                                                        const std::string& path,
                                                        const std::shared_ptr<Signal>& signal) {
    auto task = std::make_shared<Task>();
    task->path = path;
    task->token = cancel_.child();
    task->deadline = SteadyClock::now() + cfg_.task_timeout;
    task->resumed = ctx.resumed.count(path) != 0;

    // Поток получает копии: после таймаута оркестратор о задаче забывает
    std::thread([task, signal, walk = walk_, options = walk_options_]() {
        walker::WalkResult result;
        try {
            result = walk(platform::path_from_utf8(task->path), options, task->token);
        } catch (const std::exception& e) {
            result.directory = platform::path_from_utf8(task->path);
            result.error = walker::WalkError{walker::WalkErrorKind::Io, e.what()};
        }
        task->result = std::move(result);
        task->done.store(true, std::memory_order_release);
        {
            std::lock_guard<std::mutex> lock(signal->mutex);
            ++signal->completions;
        }
        signal->cv.notify_one();
    }).detach();

    return task;
}

void Orchestrator::scan(SessionContext& ctx, cache::DirectoryCache& cache) {
    const std::string& session_id = ctx.session.id;
    const std::size_t limit = cfg_.concurrency_limit;
    auto signal = std::make_shared<Signal>();
    std::vector<std::shared_ptr<Task>> live;

    // Свежесть проверяется один раз - при выдаче из очереди
    const queue::FreshnessProbe probe = [&ctx, &cache](const std::string& path) {
        const cache::DirectoryStatus status = cache.status_of(path);
        if (status == cache::DirectoryStatus::Incomplete) {
            ctx.resumed.insert(path);
        }
        return status == cache::DirectoryStatus::Fresh;
    };

    ctx.last_flush = SteadyClock::now();

    try {
        while (true) {
            // 1. Завершённые и просроченные задачи освобождают слот сразу
            const auto now = SteadyClock::now();
            for (auto it = live.begin(); it != live.end();) {
                Task& task = **it;
                if (task.done.load(std::memory_order_acquire)) {
                    handle_result(ctx, task);
                    it = live.erase(it);
                } else if (now >= task.deadline) {
                    task.token.cancel();
                    handle_timeout(ctx, task);
                    it = live.erase(it);
                } else {
                    ++it;
                }
            }

            // 2. Выдача новых задач
            bool more_work = false;
            if (cancel_.is_cancelled()) {
                if (live.empty()) {
                    break;
                }
            } else if (live.size() < limit) {
                const std::size_t free = limit - live.size();
                if (!ctx.buffer.children.empty() && ctx.db_pending < free) {
                    flush(ctx, cache);
                }

                const std::size_t want =
                    std::min<std::size_t>(free, cfg_.dequeue_batch_size);
                const queue::DequeueResult batch = queue_.dequeue_batch(session_id, want, probe);
                const std::size_t taken = batch.dispatched.size() + batch.skipped_fresh.size();

                if (batch.dispatched.size() < want) {
                    ctx.db_pending = 0;
                } else {
                    ctx.db_pending -= std::min<std::uint64_t>(ctx.db_pending, taken);
                }

                if (!batch.skipped_fresh.empty()) {
                    ctx.stats.add_skipped(batch.skipped_fresh.size());
                    if (out_.config().verbose > 1) {
                        for (const auto& path : batch.skipped_fresh) {
                            out_.trace("fresh in cache, skipping " + path);
                        }
                    }
                }

                for (const auto& path : batch.dispatched) {
                    try {
                        live.push_back(spawn(ctx, path, signal));
                    } catch (const std::system_error& e) {
                        // Потоков не хватило: вернуть в очередь и подождать освобождения
                        ctx.buffer.requeue.push_back(path);
                        if (live.empty()) {
                            throw;
                        }
                        out_.debug(std::string("could not start task - ") + e.what());
                    }
                }

                if (taken == 0 && live.empty()) {
                    if (ctx.buffer.children.empty() && ctx.buffer.requeue.empty()) {
                        break;
                    }
                    flush(ctx, cache);
                    more_work = true;
                } else {
                    more_work = live.size() < limit && (ctx.db_pending > 0 || taken > 0);
                }
            }

            ctx.stats.set_queue_depth(ctx.db_pending + ctx.buffer.children.size());

            // 3. Сброс по размеру буфера или по интервалу
            if (ctx.buffer.size() >= cfg_.flush_batch_size ||
                SteadyClock::now() - ctx.last_flush >= cfg_.flush_interval) {
                flush(ctx, cache);
            }

            if (more_work) {
                continue;
            }

            // 4. Ожидание: завершение задачи, ближайший дедлайн или опрос отмены
            auto wake = SteadyClock::now() + POLL_INTERVAL;
            for (const auto& task : live) {
                wake = std::min(wake, task->deadline);
            }
            std::unique_lock<std::mutex> lock(signal->mutex);
            signal->cv.wait_until(lock, wake, [&signal] { return signal->completions > 0; });
            signal->completions = 0;
        }
    } catch (...) {
        for (const auto& task : live) {
            task->token.cancel();
        }
        throw;
    }

    flush(ctx, cache);
}

// ----------------------------------------------------------------------------
// Результаты задач
// ----------------------------------------------------------------------------

void Orchestrator::handle_result(SessionContext& ctx, const Task& task) {
    const walker::WalkResult& r = task.result;
    const std::string& path = task.path;

    // Прерванный обход повторяется целиком; найденное в нём будет найдено снова
    if (r.error && r.error->kind == walker::WalkErrorKind::Cancelled) {
        ctx.buffer.requeue.push_back(path);
        ctx.buffer.cache_updates.push_back({path, false, false, std::nullopt});
        return;
    }

    for (const auto& child : r.children) {
        ctx.buffer.children.push_back(platform::path_to_utf8(child));
    }
    for (const auto& match : r.matches) {
        std::string m = platform::path_to_utf8(match);
        out_.debug("found " + m);
        ctx.buffer.found.push_back(std::move(m));
    }
    ctx.stats.add_found(r.matches.size());

    for (const auto& s : r.skipped) {
        ctx.stats.add_skipped();
        if (out_.debug_enabled()) {
            out_.debug("skipped " + platform::path_to_utf8(s.path) + " (" +
                       std::string(walker::to_string(s.reason)) + ")");
        }
    }

    queue::Completion completion;
    completion.path = path;
    completion.outcome = queue::EntryState::Completed;

    cache::CacheUpdate update;
    update.path = path;
    update.target_found = !r.matches.empty();

    if (!r.error) {
        // Нерекурсивный обход не видел поддерево: строка не станет Fresh
        update.completed = cfg_.recursive;
        if (task.resumed) {
            ctx.stats.add_resumed();
        } else {
            ctx.stats.add_new();
        }
    } else {
        const walker::WalkError& err = *r.error;
        out_.debug(err.message);
        update.error = std::string(walker::to_string(err.kind));

        if (err.kind == walker::WalkErrorKind::Excluded ||
            err.kind == walker::WalkErrorKind::SymlinkSkipped) {
            completion.error = err.message;
            update.completed = true;
            ctx.stats.add_skipped();
        } else {
            completion.outcome = queue::EntryState::Failed;
            completion.error = err.message;
            // Частично прочитанный каталог стоит перечитать в следующий раз
            update.completed = !r.partial;
            ctx.stats.add_dir_error();
        }
    }

    ctx.buffer.completions.push_back(std::move(completion));
    ctx.buffer.cache_updates.push_back(std::move(update));
}

void Orchestrator::handle_timeout(SessionContext& ctx, const Task& task) {
    const std::string note = "timed out after " + format_timeout(cfg_.task_timeout);
    out_.debug(note + " - " + task.path);

    queue::Completion completion;
    completion.path = task.path;
    completion.outcome = queue::EntryState::Failed;
    completion.error = note;
    ctx.buffer.completions.push_back(std::move(completion));

    cache::CacheUpdate update;
    update.path = task.path;
    update.completed = true;
    update.error = std::string(walker::to_string(walker::WalkErrorKind::Timeout));
    ctx.buffer.cache_updates.push_back(std::move(update));

    ctx.stats.add_dir_error();
}

// ----------------------------------------------------------------------------
// Сброс буфера
// ----------------------------------------------------------------------------

void Orchestrator::flush(SessionContext& ctx, cache::DirectoryCache& cache) {
    ctx.last_flush = SteadyClock::now();
    if (ctx.buffer.empty()) {
        // updated_at - признак жизни сессии для других процессов
        sessions_.write_counters(ctx.session.id, ctx.stats.to_counters());
        return;
    }

    WriteBuffer batch;
    std::swap(batch, ctx.buffer);
    const std::string& session_id = ctx.session.id;

    // Очередь, журнал и счётчики: всё или ничего
    {
        store::Transaction tx(db_);
        ledger_.record(session_id, batch.found);
        const std::size_t added = queue_.enqueue(session_id, batch.children);
        queue_.complete_batch(session_id, batch.completions);
        const std::size_t requeued = queue_.requeue(session_id, batch.requeue);
        sessions_.write_counters(session_id, ctx.stats.to_counters());
        tx.commit();
        ctx.db_pending += added + requeued;
    }

    // Кэш после очереди; его ошибки не фатальны
    cache.record_results(session_id, batch.cache_updates);

    if (out_.config().verbose > 1) {
        out_.trace("flushed " + std::to_string(batch.size()) + " buffered records");
    }
}

// ----------------------------------------------------------------------------
// Фаза удаления
// ----------------------------------------------------------------------------

void Orchestrator::adopt_undeleted(SessionContext& ctx, cache::DirectoryCache& cache) {
    // Свежие каталоги не обходятся заново, но найденное в них раньше
    // (например, при dry-run) всё ещё нужно удалить
    std::vector<std::string> carried;
    for (auto& path : cache.undeleted_targets(platform::path_to_utf8(cfg_.root), cfg_.recursive,
                                              cfg_.target_name)) {
        std::error_code ec;
        const auto st = std::filesystem::symlink_status(platform::path_from_utf8(path), ec);
        if (!ec && std::filesystem::is_regular_file(st)) {
            carried.push_back(std::move(path));
        }
    }
    if (carried.empty()) {
        return;
    }
    const std::size_t added = ledger_.record(ctx.session.id, carried);
    ctx.stats.add_found(added);
    if (added > 0) {
        out_.debug("carried over " + std::to_string(added) + " file(s) found by earlier runs");
    }
}

void Orchestrator::delete_found(SessionContext& ctx, cache::DirectoryCache& cache) {
    const std::string& session_id = ctx.session.id;
    const std::vector<ledger::FoundFile> pending = ledger_.pending(session_id);
    if (pending.empty() || cancel_.is_cancelled()) {
        return;
    }

    struct Result {
        ledger::DeletionOutcome outcome = ledger::DeletionOutcome::Pending;
        std::optional<std::string> note;
    };
    std::vector<Result> results(pending.size());
    std::atomic<std::size_t> next{0};
    const bool dry_run = cfg_.dry_run;

    // Удаления независимы друг от друга: простой пул с общим счётчиком
    auto worker = [&]() {
        while (!cancel_.is_cancelled()) {
            const std::size_t i = next.fetch_add(1);
            if (i >= pending.size()) {
                return;
            }
            Result& r = results[i];
            if (dry_run) {
                r.outcome = ledger::DeletionOutcome::DryRunSkipped;
                continue;
            }
            std::error_code ec;
            const bool removed = std::filesystem::remove(platform::path_from_utf8(pending[i].path), ec);
            if (ec) {
                r.outcome = ledger::DeletionOutcome::DeleteFailed;
                r.note = ec.message();
            } else if (!removed) {
                r.outcome = ledger::DeletionOutcome::DeleteFailed;
                r.note = "file no longer exists";
            } else {
                r.outcome = ledger::DeletionOutcome::Deleted;
            }
        }
    };

    const std::size_t workers =
        std::min<std::size_t>(cfg_.concurrency_limit, pending.size());
    std::vector<std::thread> threads;
    for (std::size_t i = 1; i < workers; ++i) {
        try {
            threads.emplace_back(worker);
        } catch (const std::system_error& e) {
            out_.debug(std::string("deletion runs with fewer workers - ") + e.what());
            break;
        }
    }
    worker();
    for (auto& t : threads) {
        t.join();
    }

    store::Transaction tx(db_);
    for (std::size_t i = 0; i < pending.size(); ++i) {
        const Result& r = results[i];
        const std::string& path = pending[i].path;
        switch (r.outcome) {
            case ledger::DeletionOutcome::Pending:
                continue;
            case ledger::DeletionOutcome::Deleted:
                ctx.stats.add_deleted();
                out_.debug("deleted " + path);
                cache.mark_deleted(
                    platform::path_to_utf8(platform::path_from_utf8(path).parent_path()));
                break;
            case ledger::DeletionOutcome::DryRunSkipped:
                ctx.report_lines.push_back("[dry-run] would delete " + path);
                break;
            case ledger::DeletionOutcome::DeleteFailed:
                ctx.stats.add_delete_error();
                out_.debug("failed to delete " + path + " - " + r.note.value_or(""));
                break;
        }
        ledger_.set_outcome(session_id, path, r.outcome, r.note);
    }
    sessions_.write_counters(session_id, ctx.stats.to_counters());
    tx.commit();
}

// ----------------------------------------------------------------------------
// Завершение сессии
// ----------------------------------------------------------------------------

SessionOutcome Orchestrator::finish(SessionContext& ctx, SessionOutcome outcome,
                                    std::string& failure) {
    const std::string& session_id = ctx.session.id;
    try {
        store::Transaction tx(db_);
        sessions_.write_counters(session_id, ctx.stats.to_counters());
        sessions_.transition(session_id, to_status(outcome));
        tx.commit();
        return outcome;
    } catch (const store::StoreError& e) {
        if (failure.empty()) {
            failure = e.what();
        }
        if (outcome == SessionOutcome::Failed) {
            out_.error(std::string("failed to record session failure - ") + e.what());
            return SessionOutcome::Failed;
        }
    } catch (const session::SessionNotFound& e) {
        // Записать Failed некуда: строки сессии больше нет
        if (failure.empty()) {
            failure = e.what();
        }
        return SessionOutcome::Failed;
    } catch (const session::InvalidTransition& e) {
        // Сессию уже закрыли извне; её статус не перезаписывается
        if (failure.empty()) {
            failure = e.what();
        }
        return SessionOutcome::Failed;
    }

    try {
        sessions_.transition(session_id, session::Status::Failed);
    } catch (const store::StoreError& e) {
        out_.error(std::string("failed to record session failure - ") + e.what());
    } catch (const session::SessionNotFound& e) {
        out_.error(std::string("failed to record session failure - ") + e.what());
    } catch (const session::InvalidTransition& e) {
        out_.error(std::string("failed to record session failure - ") + e.what());
    }
    return SessionOutcome::Failed;
}

}  // namespace dds::engine
