// ==============================================================================
// dds/maintenance.hpp - Управление кэшем
// ==============================================================================
//
// Назначение:
// - --cache-status: незавершённые каталоги и возобновляемые сессии
// - --cache-stats: агрегаты по directory_cache и сессиям
// - --cache-clear-incomplete: удаление незавершённых строк кэша,
//   закрытие прерванных сессий
// - Проверка целостности хранилища при открытии
//
// Работает напрямую с хранилищем, в обход оркестратора.
//
// ==============================================================================

#ifndef DDS_MAINTENANCE_HPP
#define DDS_MAINTENANCE_HPP

#include "dds/session.hpp"
#include "dds/store.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace dds::output {
class Writer;
}

namespace dds::maintenance {

// ----------------------------------------------------------------------------
// Отчёты
// ----------------------------------------------------------------------------

struct ResumableSession {
    std::string id;
    std::string root;
    session::Status status = session::Status::Interrupted;
    std::size_t pending = 0;
    std::int64_t updated_at = 0;
};

struct CacheStatus {
    std::filesystem::path database_path;
    std::uint32_t window_hours = 0;
    std::vector<std::string> incomplete_paths;  // новые первыми
    std::vector<ResumableSession> sessions;
};

struct CacheStats {
    std::filesystem::path database_path;
    std::uint32_t window_hours = 0;
    std::uint64_t total = 0;
    std::uint64_t completed = 0;
    std::uint64_t incomplete = 0;
    std::uint64_t with_target = 0;
    std::uint64_t targets_deleted = 0;
    std::uint64_t with_error = 0;
    std::vector<std::pair<session::Status, std::size_t>> sessions;

    /// completed / total * 100; нет значения при пустом кэше
    std::optional<double> hit_rate() const;
};

struct ClearReport {
    std::size_t cache_rows_removed = 0;
    std::size_t sessions_closed = 0;
};

struct IntegrityReport {
    bool ok = true;
    std::string message;       // "ok" или описание повреждения
    std::size_t repaired = 0;  // строк с исправленным target_deleted
};

// ----------------------------------------------------------------------------
// Операции
// ----------------------------------------------------------------------------

CacheStatus cache_status(store::Database& db, std::uint32_t window_hours);

CacheStats cache_stats(store::Database& db, std::uint32_t window_hours);

/// @throws store::StoreError
ClearReport clear_incomplete(store::Database& db);

/// PRAGMA integrity_check + исправление строк "удалено, но не найдено"
IntegrityReport check_integrity(store::Database& db);

// ----------------------------------------------------------------------------
// Вывод
// ----------------------------------------------------------------------------

void print_status(output::Writer& out, const CacheStatus& status, bool json);
void print_stats(output::Writer& out, const CacheStats& stats, bool json);
void print_clear(output::Writer& out, const ClearReport& report, bool json);

/// "2024-01-31 12:00:00" (UTC)
std::string format_timestamp(std::int64_t unix_secs);

}  // namespace dds::maintenance

#endif  // DDS_MAINTENANCE_HPP
