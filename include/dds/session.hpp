// ==============================================================================
// dds/session.hpp - Реестр сессий поиска
// ==============================================================================
//
// Назначение:
// - Сессия = одна возобновляемая попытка обхода (единица resume)
// - Машина состояний:
//
//     Active -----> Completed
//       |  \
//       |   \----> Failed
//       v
//   Interrupted --> Active      (resume)
//       \---------> Completed   (clear-incomplete)
//
//   Completed и Failed терминальны; любой другой переход -> InvalidTransition
// - Поиск сессии для возобновления (тот же root, recursive, dry_run)
// - Итоговые счётчики сессии
//
// Ошибки хранилища (StoreError) пробрасываются.
//
// ==============================================================================

#ifndef DDS_SESSION_HPP
#define DDS_SESSION_HPP

#include "dds/store.hpp"

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace dds::session {

enum class Status { Active, Completed, Interrupted, Failed };

std::string_view to_string(Status status);

std::optional<Status> parse_status(std::string_view s);

/// Разрешён ли переход from -> to
bool can_transition(Status from, Status to);

/// Терминальное ли состояние (Completed, Failed)
bool is_terminal(Status status);

class InvalidTransition : public std::logic_error {
public:
    InvalidTransition(Status from, Status to);
};

class SessionNotFound : public std::runtime_error {
public:
    explicit SessionNotFound(const std::string& id);
};

// ----------------------------------------------------------------------------
// Счётчики и запись сессии
// ----------------------------------------------------------------------------

struct Counters {
    std::uint64_t dirs_new = 0;
    std::uint64_t dirs_resumed = 0;
    std::uint64_t dirs_skipped = 0;
    std::uint64_t dirs_errored = 0;
    std::uint64_t files_found = 0;
    std::uint64_t files_deleted = 0;
};

struct SessionParams {
    std::string root;
    bool recursive = false;
    bool dry_run = false;
    bool force_refresh = false;
};

struct Session {
    std::string id;
    SessionParams params;
    Status status = Status::Active;
    std::int64_t created_at = 0;
    std::int64_t updated_at = 0;
    Counters counters;
};

// ----------------------------------------------------------------------------
// SessionRegistry
// ----------------------------------------------------------------------------

class SessionRegistry {
public:
    explicit SessionRegistry(store::Database& db);

    /// Новая сессия в состоянии Active
    Session create(const SessionParams& params);

    std::optional<Session> find(const std::string& id);

    /// Последняя Interrupted (или зависшая Active) сессия с теми же
    /// root / recursive / dry_run; force не участвует. Active считается
    /// зависшей, если не обновлялась active_grace_secs и дольше: иначе
    /// её ещё ведёт другой процесс.
    std::optional<Session> find_resumable(const SessionParams& params,
                                          std::int64_t active_grace_secs = 0);

    /// Переход состояния; обновляет updated_at
    /// @throws InvalidTransition, SessionNotFound
    Session transition(const std::string& id, Status to);

    void write_counters(const std::string& id, const Counters& counters);

    /// Все сессии (новые первыми); с фильтром по статусу - только такие
    std::vector<Session> list(std::optional<Status> status = std::nullopt);

    /// Число сессий по каждому статусу
    std::vector<std::pair<Status, std::size_t>> count_by_status();

    /// Удалить сессию вместе со строками очереди и найденных файлов
    void delete_session(const std::string& id);

    /// Удалить незавершённые сессии, не обновлявшиеся дольше max_age_secs
    /// (кроме except_id). Возвращает число удалённых.
    std::size_t cleanup_stale(std::int64_t max_age_secs, const std::string& except_id = {});

    /// Interrupted -> Completed для всех прерванных сессий, их строки
    /// очереди удаляются. Возвращает число закрытых сессий.
    std::size_t close_interrupted();

private:
    store::Database& db_;
};

}  // namespace dds::session

#endif  // DDS_SESSION_HPP
