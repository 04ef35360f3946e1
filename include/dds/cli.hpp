// ==============================================================================
// dds/cli.hpp - Парсинг командной строки
// ==============================================================================
//
// Назначение:
// - Парсинг argv: dds [OPTIONS] [DIR]
// - Генерация --help / --version
// - Выбор действия: поиск или одна из команд управления кэшем
// - Диагностические ошибки CLI (exit code 2)
//
// ==============================================================================

#ifndef DDS_CLI_HPP
#define DDS_CLI_HPP

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <variant>

namespace dds::cli {

// ----------------------------------------------------------------------------
// Глобальные опции
// ----------------------------------------------------------------------------

struct GlobalOptions {
    int verbose = 0;                                   // -v (повторяемый)
    bool quiet = false;                                // -q
    std::optional<std::filesystem::path> config_path;  // --config
};

// ----------------------------------------------------------------------------
// Действия
// ----------------------------------------------------------------------------

/// Поиск и удаление (действие по умолчанию)
struct SearchCommand {
    std::filesystem::path dir = ".";
    bool recursive = false;                     // -r, --recursive
    bool dry = false;                           // -d, --dry
    bool force = false;                         // -f, --force
    std::optional<std::uint32_t> cache_hours;   // --cache-hours
    std::optional<std::uint32_t> concurrency;   // -j, --concurrency
    std::optional<std::uint32_t> timeout_secs;  // --timeout
};

/// --cache-status
struct CacheStatusCommand {
    bool json = false;
    std::optional<std::uint32_t> cache_hours;  // --cache-hours
};

/// --cache-stats
struct CacheStatsCommand {
    bool json = false;
    std::optional<std::uint32_t> cache_hours;  // --cache-hours
};

/// --cache-clear-incomplete
struct CacheClearIncompleteCommand {
    bool json = false;
};

struct HelpCommand {};

struct VersionCommand {};

using Command = std::variant<SearchCommand, CacheStatusCommand, CacheStatsCommand,
                             CacheClearIncompleteCommand, HelpCommand, VersionCommand>;

// ----------------------------------------------------------------------------
// Диагностика CLI
// ----------------------------------------------------------------------------

struct CliDiagnostic {
    int exit_code = 2;
    std::string stderr_message;
};

struct ParseResult {
    bool ok = false;
    GlobalOptions global;
    Command command;
    CliDiagnostic diagnostic;
};

// ----------------------------------------------------------------------------
// API
// ----------------------------------------------------------------------------

/// Парсить аргументы командной строки
ParseResult parse(int argc, char** argv);

std::string render_help();

/// "dds v0.2.0\n"
std::string render_version();

// ----------------------------------------------------------------------------
// Константы
// ----------------------------------------------------------------------------

constexpr const char* VERSION = "v0.2.0";

constexpr const char* ABOUT =
    "A command line tool that deletes the `.DS_Store` system files commonly found around MacOS "
    "filesystems. Please note that Finder may behave differently after running `dds`.";

}  // namespace dds::cli

#endif  // DDS_CLI_HPP
