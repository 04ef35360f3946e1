// ==============================================================================
// dds/work_queue.hpp - Персистентная очередь каталогов
// ==============================================================================
//
// Назначение:
// - Очередь каталогов сессии: Pending -> InProgress -> Completed | Failed
// - Не более одной строки на (session, path): повторный enqueue игнорируется
// - Атомарный dequeue: выбор и перевод Pending -> InProgress в одной
//   транзакции; строка выдаётся, только если UPDATE действительно изменил её
// - Свежесть кэша проверяется здесь, перед выдачей: свежий каталог сразу
//   становится Completed и до Walker-а не доходит
// - Чистая функция plan_resume(): какие строки вернуть в Pending при
//   возобновлении сессии
//
// Ошибки хранилища (StoreError) пробрасываются: потеря очереди - это
// потеря корректности, сессия переводится в Failed.
//
// ==============================================================================

#ifndef DDS_WORK_QUEUE_HPP
#define DDS_WORK_QUEUE_HPP

#include "dds/store.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace dds::queue {

// ----------------------------------------------------------------------------
// Состояние строки очереди
// ----------------------------------------------------------------------------

enum class EntryState { Pending, InProgress, Completed, Failed };

std::string_view to_string(EntryState state);

std::optional<EntryState> parse_state(std::string_view s);

struct QueueEntry {
    std::string session_id;
    std::string path;
    EntryState state = EntryState::Pending;
    std::int64_t enqueued_at = 0;
    std::optional<std::string> error;
};

// ----------------------------------------------------------------------------
// Dequeue
// ----------------------------------------------------------------------------

/// true - каталог свежий и сканировать его не нужно
using FreshnessProbe = std::function<bool(const std::string& path)>;

struct DequeueResult {
    std::vector<std::string> dispatched;     // Pending -> InProgress, отдать Walker-у
    std::vector<std::string> skipped_fresh;  // Pending -> Completed без сканирования
};

/// Итог обработки одного каталога
struct Completion {
    std::string path;
    EntryState outcome = EntryState::Completed;  // Completed или Failed
    std::optional<std::string> error;
};

// ----------------------------------------------------------------------------
// Возобновление
// ----------------------------------------------------------------------------

struct ResumePlan {
    std::vector<std::string> reset_to_pending;  // InProgress прошлого запуска
    std::size_t pending = 0;                    // уже Pending
    std::size_t completed = 0;
    std::size_t failed = 0;

    /// Число строк, которые будут Pending после применения плана
    std::size_t work_remaining() const { return pending + reset_to_pending.size(); }
};

/// Чистая сверка: по сохранённым строкам вычислить, что вернуть в Pending
ResumePlan plan_resume(const std::vector<QueueEntry>& entries);

// ----------------------------------------------------------------------------
// WorkQueue
// ----------------------------------------------------------------------------

class WorkQueue {
public:
    explicit WorkQueue(store::Database& db);

    /// Добавить Pending строки; уже известные сессии пути игнорируются.
    /// Возвращает число реально добавленных строк.
    std::size_t enqueue(const std::string& session_id, const std::vector<std::string>& paths);

    /// Атомарно выбрать до limit строк Pending и перевести их в InProgress.
    /// Строки, для которых probe вернул true, переводятся в Completed.
    DequeueResult dequeue_batch(const std::string& session_id, std::size_t limit,
                                const FreshnessProbe& probe = {});

    /// InProgress -> Completed | Failed
    /// @throws std::invalid_argument если outcome не терминальный
    void complete(const std::string& session_id, const std::string& path, EntryState outcome,
                  const std::optional<std::string>& error = std::nullopt);

    void complete_batch(const std::string& session_id, const std::vector<Completion>& completions);

    /// InProgress -> Pending (задача прервана отменой и не завершила обход)
    std::size_t requeue(const std::string& session_id, const std::vector<std::string>& paths);

    /// Применить план возобновления; возвращает число сброшенных строк
    std::size_t apply_resume(const std::string& session_id, const ResumePlan& plan);

    /// Pending + InProgress
    std::size_t pending_count(const std::string& session_id);

    std::size_t count(const std::string& session_id, EntryState state);

    /// Строки Pending и InProgress
    std::vector<QueueEntry> incomplete_entries(const std::string& session_id);

    /// Все строки сессии в порядке постановки
    std::vector<QueueEntry> entries(const std::string& session_id);

    std::optional<QueueEntry> find(const std::string& session_id, const std::string& path);

    /// Удалить все строки сессии
    std::size_t delete_session(const std::string& session_id);

private:
    store::Database& db_;
};

}  // namespace dds::queue

#endif  // DDS_WORK_QUEUE_HPP
