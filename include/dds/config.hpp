// ==============================================================================
// dds/config.hpp - Конфигурация
// ==============================================================================
//
// yaml-cpp для чтения/записи $HOME/.dds/config.yaml.
//
// Назначение:
// - Config: значения из файла (или значения по умолчанию)
// - SearchConfig: итоговая неизменяемая конфигурация одной сессии
//   (файл + переопределения из CLI)
// - ConfigError: неверный тип значения, нечитаемый файл
//
// ==============================================================================

#ifndef DDS_CONFIG_HPP
#define DDS_CONFIG_HPP

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

namespace dds::config {

// ----------------------------------------------------------------------------
// Значения по умолчанию
// ----------------------------------------------------------------------------

constexpr std::uint32_t DEFAULT_CACHE_WINDOW_HOURS = 24;
constexpr std::uint32_t DEFAULT_CONCURRENCY_LIMIT = 100;
constexpr std::uint32_t DEFAULT_TASK_TIMEOUT_SECS = 30;
constexpr std::uint32_t DEFAULT_FLUSH_INTERVAL_SECS = 5;
constexpr std::uint32_t DEFAULT_FLUSH_BATCH_SIZE = 500;
constexpr std::uint32_t DEFAULT_DEQUEUE_BATCH_SIZE = 256;
constexpr std::uint32_t DEFAULT_RETENTION_MULTIPLIER = 2;
constexpr const char* DEFAULT_TARGET_NAME = ".DS_Store";

/// Системные пути, которые никогда не обходятся
std::vector<std::string> default_exclude_prefixes();

/// Имена компонентов пути (корзины, индексы), исключаемые на любой глубине
std::vector<std::string> default_exclude_names();

// ----------------------------------------------------------------------------
// ConfigError
// ----------------------------------------------------------------------------

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// ----------------------------------------------------------------------------
// Config - содержимое config.yaml
// ----------------------------------------------------------------------------

struct Config {
    std::filesystem::path database_path;
    std::uint32_t cache_window_hours = DEFAULT_CACHE_WINDOW_HOURS;
    std::uint32_t concurrency_limit = DEFAULT_CONCURRENCY_LIMIT;
    std::uint32_t task_timeout_secs = DEFAULT_TASK_TIMEOUT_SECS;
    std::uint32_t flush_interval_secs = DEFAULT_FLUSH_INTERVAL_SECS;
    std::uint32_t flush_batch_size = DEFAULT_FLUSH_BATCH_SIZE;
    std::uint32_t dequeue_batch_size = DEFAULT_DEQUEUE_BATCH_SIZE;
    std::uint32_t retention_multiplier = DEFAULT_RETENTION_MULTIPLIER;
    std::string target_name = DEFAULT_TARGET_NAME;
    std::vector<std::string> exclude_prefixes;
    std::vector<std::string> exclude_names;
};

/// Конфигурация по умолчанию; database_path = <home>/.dds/cache.sqlite
Config default_config(const std::filesystem::path& home);

/// Путь к файлу конфигурации по умолчанию: <home>/.dds/config.yaml
std::filesystem::path default_config_path(const std::filesystem::path& home);

/// Прочитать файл. Отсутствующие ключи берутся из default_config(home),
/// неизвестные ключи попадают в warnings.
/// @throws ConfigError
Config load_file(const std::filesystem::path& path, const std::filesystem::path& home,
                 std::vector<std::string>& warnings);

/// Прочитать файл, а если его нет - создать со значениями по умолчанию
/// @throws ConfigError
Config load_or_create(const std::filesystem::path& path, const std::filesystem::path& home,
                      std::vector<std::string>& warnings);

/// Сохранить конфигурацию в YAML (родительский каталог создаётся)
/// @throws ConfigError
void save(const Config& cfg, const std::filesystem::path& path);

// ----------------------------------------------------------------------------
// SearchConfig - конфигурация сессии поиска
// ----------------------------------------------------------------------------

struct SearchConfig {
    std::filesystem::path root;
    bool recursive = false;
    bool dry_run = false;
    bool force_refresh = false;
    std::uint32_t cache_window_hours = DEFAULT_CACHE_WINDOW_HOURS;
    int verbosity = 0;
    std::uint32_t concurrency_limit = DEFAULT_CONCURRENCY_LIMIT;
    std::chrono::milliseconds task_timeout{DEFAULT_TASK_TIMEOUT_SECS * 1000};
    std::chrono::milliseconds flush_interval{DEFAULT_FLUSH_INTERVAL_SECS * 1000};
    std::uint32_t flush_batch_size = DEFAULT_FLUSH_BATCH_SIZE;
    std::uint32_t dequeue_batch_size = DEFAULT_DEQUEUE_BATCH_SIZE;
    std::uint32_t retention_multiplier = DEFAULT_RETENTION_MULTIPLIER;
    std::string target_name = DEFAULT_TARGET_NAME;
    std::vector<std::string> exclude_prefixes;
    std::vector<std::string> exclude_names;

    std::int64_t cache_window_secs() const {
        return static_cast<std::int64_t>(cache_window_hours) * 3600;
    }

    /// Горизонт хранения строк кэша (окно * множитель, с насыщением до INT64_MAX)
    std::int64_t retention_secs() const {
        const std::int64_t window = cache_window_secs();
        const auto multiplier = static_cast<std::int64_t>(retention_multiplier);
        if (window != 0 && multiplier > std::numeric_limits<std::int64_t>::max() / window) {
            return std::numeric_limits<std::int64_t>::max();
        }
        return window * multiplier;
    }
};

/// SearchConfig из Config (root и флаги заполняет вызывающий)
SearchConfig make_search_config(const Config& cfg);

}  // namespace dds::config

#endif  // DDS_CONFIG_HPP
