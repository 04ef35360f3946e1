// ==============================================================================
// config.cpp - Конфигурация (yaml-cpp)
// ==============================================================================

#include "dds/config.hpp"

#include "dds/platform.hpp"

#include <yaml-cpp/yaml.h>

#include <fstream>
#include <set>
#include <system_error>

namespace dds::config {

namespace {

const std::set<std::string>& known_keys() {
    static const std::set<std::string> keys = {
        "database_path",      "cache_window_hours", "concurrency_limit",
        "task_timeout_secs",  "flush_interval_secs", "flush_batch_size",
        "dequeue_batch_size", "retention_multiplier", "target_name",
        "exclude_prefixes",   "exclude_names",
    };
    return keys;
}

std::uint32_t read_uint(const YAML::Node& root, const char* key, std::uint32_t fallback,
                        bool allow_zero) {
    const YAML::Node node = root[key];
    if (!node) {
        return fallback;
    }
    if (!node.IsScalar()) {
        throw ConfigError(std::string("config key '") + key + "' must be a non-negative integer");
    }
    std::uint32_t value = 0;
    try {
        value = node.as<std::uint32_t>();
    } catch (const YAML::Exception&) {
        throw ConfigError(std::string("config key '") + key +
                          "' must be a non-negative integer, got '" + node.Scalar() + "'");
    }
    if (value == 0 && !allow_zero) {
        throw ConfigError(std::string("config key '") + key + "' must be greater than zero");
    }
    return value;
}

std::string read_string(const YAML::Node& root, const char* key, const std::string& fallback) {
    const YAML::Node node = root[key];
    if (!node) {
        return fallback;
    }
    if (!node.IsScalar()) {
        throw ConfigError(std::string("config key '") + key + "' must be a string");
    }
    return node.Scalar();
}

std::vector<std::string> read_string_list(const YAML::Node& root, const char* key,
                                          const std::vector<std::string>& fallback) {
    const YAML::Node node = root[key];
    if (!node) {
        return fallback;
    }
    if (node.IsNull()) {
        return {};
    }
    if (!node.IsSequence()) {
        throw ConfigError(std::string("config key '") + key + "' must be a list of strings");
    }
    std::vector<std::string> out;
    for (const auto& item : node) {
        if (!item.IsScalar()) {
            throw ConfigError(std::string("config key '") + key + "' must be a list of strings");
        }
        out.push_back(item.Scalar());
    }
    return out;
}

}  // namespace

// ----------------------------------------------------------------------------
// Значения по умолчанию
// ----------------------------------------------------------------------------

std::vector<std::string> default_exclude_prefixes() {
    return {
        "/.Trashes",        "/.Spotlight-V100",      "/.fseventsd",
        "/.DocumentRevisions-V100", "/.TemporaryItems", "/System/Volumes",
        "/private/var/folders", "/private/tmp",     "/Volumes/.timemachine",
    };
}

std::vector<std::string> default_exclude_names() {
    return {
        ".Trash",          ".Trashes",        ".Spotlight-V100",
        ".fseventsd",      ".TemporaryItems", ".DocumentRevisions-V100",
    };
}

Config default_config(const std::filesystem::path& home) {
    Config cfg;
    cfg.database_path = home / ".dds" / "cache.sqlite";
    cfg.exclude_prefixes = default_exclude_prefixes();
    cfg.exclude_names = default_exclude_names();
    return cfg;
}

std::filesystem::path default_config_path(const std::filesystem::path& home) {
    return home / ".dds" / "config.yaml";
}

// ----------------------------------------------------------------------------
// Чтение
// ----------------------------------------------------------------------------

Config load_file(const std::filesystem::path& path, const std::filesystem::path& home,
                 std::vector<std::string>& warnings) {
    const std::string path_str = platform::path_to_utf8(path);

    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigError("cannot open config file: " + path_str);
    }

    YAML::Node root;
    try {
        root = YAML::Load(file);
    } catch (const YAML::Exception& e) {
        throw ConfigError("failed to parse config file " + path_str + " - " + e.what());
    }

    Config cfg = default_config(home);

    // Пустой файл - всё по умолчанию
    if (root.IsNull()) {
        return cfg;
    }
    if (!root.IsMap()) {
        throw ConfigError("config file " + path_str + " must contain a mapping");
    }

    for (const auto& kv : root) {
        const std::string key = kv.first.as<std::string>();
        if (known_keys().count(key) == 0) {
            warnings.push_back("unknown config key '" + key + "' in " + path_str);
        }
    }

    const std::string db = read_string(root, "database_path", "");
    if (!db.empty()) {
        std::filesystem::path db_path = platform::path_from_utf8(db);
        // "~/..." раскрывается относительно домашнего каталога
        if (db.size() >= 2 && db[0] == '~' && (db[1] == '/' || db[1] == '\\')) {
            db_path = home / platform::path_from_utf8(db.substr(2));
        }
        cfg.database_path = db_path;
    }

    cfg.cache_window_hours =
        read_uint(root, "cache_window_hours", cfg.cache_window_hours, true);
    cfg.concurrency_limit = read_uint(root, "concurrency_limit", cfg.concurrency_limit, false);
    cfg.task_timeout_secs = read_uint(root, "task_timeout_secs", cfg.task_timeout_secs, false);
    cfg.flush_interval_secs =
        read_uint(root, "flush_interval_secs", cfg.flush_interval_secs, false);
    cfg.flush_batch_size = read_uint(root, "flush_batch_size", cfg.flush_batch_size, false);
    cfg.dequeue_batch_size =
        read_uint(root, "dequeue_batch_size", cfg.dequeue_batch_size, false);
    cfg.retention_multiplier =
        read_uint(root, "retention_multiplier", cfg.retention_multiplier, false);

    cfg.target_name = read_string(root, "target_name", cfg.target_name);
    if (cfg.target_name.empty()) {
        throw ConfigError("config key 'target_name' must not be empty");
    }

    cfg.exclude_prefixes = read_string_list(root, "exclude_prefixes", cfg.exclude_prefixes);
    cfg.exclude_names = read_string_list(root, "exclude_names", cfg.exclude_names);

    return cfg;
}

Config load_or_create(const std::filesystem::path& path, const std::filesystem::path& home,
                      std::vector<std::string>& warnings) {
    std::error_code ec;
    if (std::filesystem::exists(path, ec)) {
        return load_file(path, home, warnings);
    }

    Config cfg = default_config(home);
    try {
        save(cfg, path);
    } catch (const ConfigError& e) {
        // Без файла конфигурации можно работать на значениях по умолчанию
        warnings.push_back(e.what());
    }
    return cfg;
}

// ----------------------------------------------------------------------------
// Запись
// ----------------------------------------------------------------------------

void save(const Config& cfg, const std::filesystem::path& path) {
    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "database_path" << YAML::Value
        << platform::path_to_utf8(cfg.database_path);
    out << YAML::Key << "cache_window_hours" << YAML::Value << cfg.cache_window_hours;
    out << YAML::Key << "concurrency_limit" << YAML::Value << cfg.concurrency_limit;
    out << YAML::Key << "task_timeout_secs" << YAML::Value << cfg.task_timeout_secs;
    out << YAML::Key << "flush_interval_secs" << YAML::Value << cfg.flush_interval_secs;
    out << YAML::Key << "flush_batch_size" << YAML::Value << cfg.flush_batch_size;
    out << YAML::Key << "dequeue_batch_size" << YAML::Value << cfg.dequeue_batch_size;
    out << YAML::Key << "retention_multiplier" << YAML::Value << cfg.retention_multiplier;
    out << YAML::Key << "target_name" << YAML::Value << cfg.target_name;
    out << YAML::Key << "exclude_prefixes" << YAML::Value << YAML::BeginSeq;
    for (const auto& p : cfg.exclude_prefixes) {
        out << p;
    }
    out << YAML::EndSeq;
    out << YAML::Key << "exclude_names" << YAML::Value << YAML::BeginSeq;
    for (const auto& n : cfg.exclude_names) {
        out << n;
    }
    out << YAML::EndSeq;
    out << YAML::EndMap;

    const std::string path_str = platform::path_to_utf8(path);
    if (path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            throw ConfigError("cannot create config directory for " + path_str + " - " +
                              ec.message());
        }
    }

    std::ofstream file(path, std::ios::out | std::ios::trunc);
    if (!file.is_open()) {
        throw ConfigError("cannot write config file: " + path_str);
    }
    file << out.c_str() << "\n";
    if (!file) {
        throw ConfigError("failed to write config file: " + path_str);
    }
}

// ----------------------------------------------------------------------------
// SearchConfig
// ----------------------------------------------------------------------------

SearchConfig make_search_config(const Config& cfg) {
    SearchConfig sc;
    sc.cache_window_hours = cfg.cache_window_hours;
    sc.concurrency_limit = cfg.concurrency_limit;
    sc.task_timeout = std::chrono::milliseconds(
        static_cast<std::int64_t>(cfg.task_timeout_secs) * 1000);
    sc.flush_interval = std::chrono::milliseconds(
        static_cast<std::int64_t>(cfg.flush_interval_secs) * 1000);
    sc.flush_batch_size = cfg.flush_batch_size;
    sc.dequeue_batch_size = cfg.dequeue_batch_size;
    sc.retention_multiplier = cfg.retention_multiplier;
    sc.target_name = cfg.target_name;
    sc.exclude_prefixes = cfg.exclude_prefixes;
    sc.exclude_names = cfg.exclude_names;
    return sc;
}

}  // namespace dds::config
