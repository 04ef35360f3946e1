// ==============================================================================
// dds/engine.hpp - Оркестратор поиска
// ==============================================================================
//
// Назначение:
// - Запуск или возобновление сессии, посев очереди корнем
// - До C параллельных задач обхода (по одному потоку на задачу),
//   у каждой задачи свой дедлайн
// - Пакетная запись результатов: по интервалу или по размеру буфера
// - Кооперативная отмена: новые задачи не выдаются, текущие завершаются
//   или упираются в таймаут, буфер сбрасывается, сессия -> Interrupted
// - Фаза удаления: ограниченный параллельный обход журнала найденных файлов
//
// Порядок сброса буфера: сначала очередь, журнал и счётчики сессии одной
// транзакцией (ошибка -> сессия Failed), затем кэш (ошибка -> предупреждение).
// Поэтому после аварии не бывает свежей строки кэша, чьи дочерние каталоги
// так и не попали в очередь.
//
// ==============================================================================

#ifndef DDS_ENGINE_HPP
#define DDS_ENGINE_HPP

#include "dds/cancellation.hpp"
#include "dds/config.hpp"
#include "dds/directory_cache.hpp"
#include "dds/found_files.hpp"
#include "dds/session.hpp"
#include "dds/store.hpp"
#include "dds/walker.hpp"
#include "dds/work_queue.hpp"

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_set>
#include <utility>
#include <vector>

namespace dds::output {
class Writer;
}

namespace dds::engine {

// ----------------------------------------------------------------------------
// Статистика
// ----------------------------------------------------------------------------

struct StatsSnapshot {
    std::uint64_t dirs_new = 0;
    std::uint64_t dirs_resumed = 0;
    std::uint64_t dirs_skipped = 0;
    std::uint64_t files_found = 0;
    std::uint64_t files_deleted = 0;
    std::uint64_t errors = 0;
    std::uint64_t queue_depth = 0;
};

/// Счётчики сессии. Обновляются из нескольких потоков, читаются
/// репортером прогресса без блокировок.
class SearchStats {
public:
    void add_new(std::uint64_t n = 1) { dirs_new_.fetch_add(n, std::memory_order_relaxed); }
    void add_resumed(std::uint64_t n = 1) {
        dirs_resumed_.fetch_add(n, std::memory_order_relaxed);
    }
    void add_skipped(std::uint64_t n = 1) {
        dirs_skipped_.fetch_add(n, std::memory_order_relaxed);
    }
    void add_dir_error(std::uint64_t n = 1) {
        dirs_errored_.fetch_add(n, std::memory_order_relaxed);
    }
    void add_found(std::uint64_t n = 1) { files_found_.fetch_add(n, std::memory_order_relaxed); }
    void add_deleted(std::uint64_t n = 1) {
        files_deleted_.fetch_add(n, std::memory_order_relaxed);
    }
    void add_delete_error(std::uint64_t n = 1) {
        delete_errors_.fetch_add(n, std::memory_order_relaxed);
    }
    void set_queue_depth(std::uint64_t n) { queue_depth_.store(n, std::memory_order_relaxed); }

    StatsSnapshot snapshot() const noexcept;

    /// Счётчики для записи в search_sessions
    session::Counters to_counters() const noexcept;

    /// Продолжить счёт с сохранённых значений (возобновление сессии)
    void restore(const session::Counters& counters) noexcept;

private:
    std::atomic<std::uint64_t> dirs_new_{0};
    std::atomic<std::uint64_t> dirs_resumed_{0};
    std::atomic<std::uint64_t> dirs_skipped_{0};
    std::atomic<std::uint64_t> dirs_errored_{0};
    std::atomic<std::uint64_t> files_found_{0};
    std::atomic<std::uint64_t> files_deleted_{0};
    std::atomic<std::uint64_t> delete_errors_{0};
    std::atomic<std::uint64_t> queue_depth_{0};
};

/// Строка прогресса: "dirs 12 new, 3 resumed, 40 skipped | found 2, deleted 1 | ..."
std::string format_progress(const StatsSnapshot& s);

// ----------------------------------------------------------------------------
// Буфер записи
// ----------------------------------------------------------------------------

struct WriteBuffer {
    std::vector<queue::Completion> completions;
    std::vector<std::string> children;
    std::vector<std::string> found;
    std::vector<cache::CacheUpdate> cache_updates;
    std::vector<std::string> requeue;

    std::size_t size() const {
        return completions.size() + children.size() + found.size() + cache_updates.size() +
               requeue.size();
    }
    bool empty() const { return size() == 0; }
    void clear();
};

// ----------------------------------------------------------------------------
// Итог запуска
// ----------------------------------------------------------------------------

enum class SessionOutcome { Completed, Interrupted, Failed };

std::string_view to_string(SessionOutcome outcome);

struct RunSummary {
    SessionOutcome outcome = SessionOutcome::Failed;
    std::string session_id;
    bool resumed = false;
    StatsSnapshot stats;
    std::string failure;  // текст ошибки для Failed
};

/// Функция обхода одного каталога; подменяется в тестах
using WalkFunction = std::function<walker::WalkResult(
    const std::filesystem::path&, const walker::WalkOptions&, const CancellationToken&)>;

// ----------------------------------------------------------------------------
// Orchestrator
// ----------------------------------------------------------------------------

class Orchestrator {
public:
    Orchestrator(store::Database& db, config::SearchConfig cfg, output::Writer& out,
                 CancellationToken cancel);

    void set_walk_function(WalkFunction fn) { walk_ = std::move(fn); }

    /// Провести сессию от старта (или возобновления) до Completed,
    /// Interrupted или Failed. Ошибки хранилища и сессии (StoreError,
    /// SessionNotFound, InvalidTransition) наружу не выходят: они дают Failed.
    RunSummary run();

private:
    struct Task;
    struct Signal;
    struct SessionContext;

    void open_session(SessionContext& ctx);
    void scan(SessionContext& ctx, cache::DirectoryCache& cache);
    std::shared_ptr<Task> spawn(SessionContext& ctx, const std::string& path,
                                const std::shared_ptr<Signal>& signal);
    void handle_result(SessionContext& ctx, const Task& task);
    void handle_timeout(SessionContext& ctx, const Task& task);
    void flush(SessionContext& ctx, cache::DirectoryCache& cache);
    void adopt_undeleted(SessionContext& ctx, cache::DirectoryCache& cache);
    void delete_found(SessionContext& ctx, cache::DirectoryCache& cache);
    SessionOutcome finish(SessionContext& ctx, SessionOutcome outcome, std::string& failure);

    store::Database& db_;
    config::SearchConfig cfg_;
    output::Writer& out_;
    CancellationToken cancel_;
    WalkFunction walk_;
    walker::WalkOptions walk_options_;

    queue::WorkQueue queue_;
    session::SessionRegistry sessions_;
    ledger::FoundFilesLedger ledger_;
};

}  // namespace dds::engine

#endif  // DDS_ENGINE_HPP
