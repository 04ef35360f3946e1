// ==============================================================================
// dds/directory_cache.hpp - Кэш свежести каталогов
// ==============================================================================
//
// Назначение:
// - Ответ на вопрос "нужно ли (пере)сканировать каталог?"
// - Upsert результата сканирования (одна строка на путь)
// - Очистка строк старше горизонта хранения
// - In-memory индекс свежих путей (ускоритель, не источник истины)
//
// Статус вычисляется, а не хранится:
//   now - last_searched <  window, completed  -> Fresh
//   now - last_searched <  window, !completed -> Incomplete
//   now - last_searched >= window             -> Stale
//   строки нет                                -> NotCached
//
// Любая ошибка хранилища в этом компоненте деградирует: чтение -> NotCached,
// запись отбрасывается с предупреждением. Кэш никогда не прерывает обход.
//
// ==============================================================================

#ifndef DDS_DIRECTORY_CACHE_HPP
#define DDS_DIRECTORY_CACHE_HPP

#include "dds/store.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace dds::output {
class Writer;
}

namespace dds::cache {

// ----------------------------------------------------------------------------
// Статус каталога
// ----------------------------------------------------------------------------

enum class DirectoryStatus { NotCached, Incomplete, Stale, Fresh };

std::string_view to_string(DirectoryStatus status);

/// Источник времени (unix seconds); подменяется в тестах
using Clock = std::function<std::int64_t()>;

// ----------------------------------------------------------------------------
// FreshnessIndex - множество путей, известных как Fresh в этой сессии
// ----------------------------------------------------------------------------

class FreshnessIndex {
public:
    void insert(const std::string& path);
    bool contains(const std::string& path) const;
    void erase(const std::string& path);
    void clear();
    std::size_t size() const;

private:
    mutable std::mutex mutex_;
    std::unordered_set<std::string> paths_;
};

// ----------------------------------------------------------------------------
// Запись кэша
// ----------------------------------------------------------------------------

struct CacheEntry {
    std::string path;
    std::int64_t last_searched = 0;
    bool completed = false;
    std::optional<std::string> session_id;
    bool target_found = false;
    bool target_deleted = false;
    std::optional<std::string> error;
};

/// Результат одной попытки сканирования (для пакетной записи)
struct CacheUpdate {
    std::string path;
    bool completed = false;
    bool target_found = false;
    std::optional<std::string> error;
};

struct CacheOptions {
    std::uint32_t window_hours = 24;
    bool force_refresh = false;
};

// ----------------------------------------------------------------------------
// DirectoryCache
// ----------------------------------------------------------------------------

class DirectoryCache {
public:
    /// @param log  куда писать предупреждения о деградации (может быть nullptr)
    DirectoryCache(store::Database& db, CacheOptions options, output::Writer* log = nullptr,
                   Clock clock = {});

    /// Загрузить в индекс все пути, свежие на момент старта сессии
    /// (без force). Возвращает число загруженных путей.
    std::size_t warm();

    /// Статус пути; при force всегда NotCached
    DirectoryStatus status_of(const std::string& path);

    /// Upsert с текущим временем
    void record_result(const std::string& session_id, const std::string& path, bool completed);

    /// Пакетный upsert в одной транзакции
    void record_results(const std::string& session_id, const std::vector<CacheUpdate>& updates);

    /// Пометить, что найденный в каталоге файл удалён
    void mark_deleted(const std::string& path);

    /// Удалить строки, не обновлявшиеся дольше older_than_secs.
    /// Удаление идёт пачками по PRUNE_BATCH строк.
    std::size_t prune(std::int64_t older_than_secs);

    /// Файлы, найденные прошлыми обходами, но так и не удалённые
    /// (например, после dry-run): root и, при recursive, всё под ним
    std::vector<std::string> undeleted_targets(const std::string& root, bool recursive,
                                               const std::string& target_name);

    /// Сбросить target_deleted у строк, где цель не была найдена
    std::size_t repair_inconsistent();

    /// Прочитать строку целиком (для отчётов и тестов)
    std::optional<CacheEntry> entry(const std::string& path);

    FreshnessIndex& freshness() { return freshness_; }

    const CacheOptions& options() const { return options_; }

    /// Была ли хоть одна деградация из-за ошибки хранилища
    bool degraded() const { return degraded_.load(); }

    static constexpr std::size_t PRUNE_BATCH = 10000;

private:
    std::int64_t now() const;
    std::int64_t window_secs() const;
    void degrade(std::string_view operation, const store::StoreError& e);

    store::Database& db_;
    CacheOptions options_;
    output::Writer* log_;
    Clock clock_;
    FreshnessIndex freshness_;
    std::atomic<bool> degraded_{false};
};

}  // namespace dds::cache

#endif  // DDS_DIRECTORY_CACHE_HPP
