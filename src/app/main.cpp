// ==============================================================================
// main.cpp - Точка входа приложения
// ==============================================================================
//
// Точка входа:
// 1. Парсинг argv
// 2. Создание Writer
// 3. Загрузка конфигурации (файл + переопределения CLI)
// 4. Открытие хранилища и проверка целостности
// 5. Dispatch: поиск или команда управления кэшем
// 6. Возврат exit code (0 / 130 / 1 / 2)
//
// ==============================================================================

#include "dds/cancellation.hpp"
#include "dds/cli.hpp"
#include "dds/config.hpp"
#include "dds/engine.hpp"
#include "dds/maintenance.hpp"
#include "dds/output.hpp"
#include "dds/platform.hpp"
#include "dds/store.hpp"

#include <csignal>
#include <exception>
#include <iostream>
#include <memory>
#include <system_error>
#include <type_traits>
#include <variant>

namespace {

constexpr int EXIT_OK = 0;
constexpr int EXIT_FAILURE_CODE = 1;
constexpr int EXIT_INTERRUPTED = 130;

// ----------------------------------------------------------------------------
// Сигналы
// ----------------------------------------------------------------------------

// Токен живёт в run() дольше, чем установленные обработчики
dds::CancellationToken* g_cancel = nullptr;

extern "C" void on_signal(int) {
    if (g_cancel != nullptr) {
        g_cancel->cancel();
    }
}

class SignalScope {
public:
    explicit SignalScope(dds::CancellationToken& token) {
        g_cancel = &token;
        prev_int_ = std::signal(SIGINT, on_signal);
        prev_term_ = std::signal(SIGTERM, on_signal);
    }
    ~SignalScope() {
        std::signal(SIGINT, prev_int_);
        std::signal(SIGTERM, prev_term_);
        g_cancel = nullptr;
    }
    SignalScope(const SignalScope&) = delete;
    SignalScope& operator=(const SignalScope&) = delete;

private:
    using Handler = void (*)(int);
    Handler prev_int_ = SIG_DFL;
    Handler prev_term_ = SIG_DFL;
};

// ----------------------------------------------------------------------------
// Конфигурация
// ----------------------------------------------------------------------------

dds::config::Config load_config(const dds::cli::GlobalOptions& global,
                                dds::output::Writer& writer) {
    using namespace dds;

    const std::filesystem::path home = platform::home_dir();
    std::vector<std::string> warnings;
    config::Config cfg;

    if (global.config_path) {
        std::error_code ec;
        if (!std::filesystem::exists(*global.config_path, ec)) {
            throw config::ConfigError("config file not found - " +
                                      platform::path_to_utf8(*global.config_path));
        }
        cfg = config::load_file(*global.config_path, home, warnings);
    } else {
        cfg = config::load_or_create(config::default_config_path(home), home, warnings);
    }

    for (const auto& w : warnings) {
        writer.warn(w);
    }
    return cfg;
}

std::unique_ptr<dds::store::Database> open_store(const dds::config::Config& cfg,
                                                 dds::output::Writer& writer) {
    using namespace dds;

    writer.debug("Opening cache database " + platform::path_to_utf8(cfg.database_path));
    auto db = store::Database::open(cfg.database_path);

    const maintenance::IntegrityReport integrity = maintenance::check_integrity(*db);
    if (!integrity.ok) {
        writer.warn("Cache database integrity check failed - " + integrity.message);
    } else if (integrity.repaired > 0) {
        writer.debug("Repaired " + std::to_string(integrity.repaired) +
                     " inconsistent cache entries");
    }
    return db;
}

// ----------------------------------------------------------------------------
// Поиск
// ----------------------------------------------------------------------------

void print_summary(dds::output::Writer& writer, const dds::engine::RunSummary& summary,
                   bool dry_run) {
    using namespace dds;
    const engine::StatsSnapshot& s = summary.stats;

    switch (summary.outcome) {
        case engine::SessionOutcome::Completed:
            writer.green_line("Search complete");
            break;
        case engine::SessionOutcome::Interrupted:
            writer.write_line(output::Stream::Stdout, "Search interrupted");
            break;
        case engine::SessionOutcome::Failed:
            writer.write_line(output::Stream::Stdout, "Search failed");
            break;
    }

    auto row = [&writer](const std::string& label, std::uint64_t value) {
        std::string line = "  " + label;
        if (line.size() < 28) {
            line.append(28 - line.size(), ' ');
        }
        writer.write_line(output::Stream::Stdout, line + std::to_string(value));
    };

    row("Directories searched:", s.dirs_new);
    row("Directories resumed:", s.dirs_resumed);
    row("Directories skipped:", s.dirs_skipped);
    row("Files found:", s.files_found);
    row(dry_run ? "Files deleted (dry run):" : "Files deleted:", s.files_deleted);
    row("Errors:", s.errors);

    if (summary.resumed) {
        writer.write_line(output::Stream::Stdout, "  Resumed session " + summary.session_id);
    }
}

int run_search(const dds::cli::SearchCommand& cmd, const dds::cli::GlobalOptions& global,
               dds::output::Writer& writer) {
    using namespace dds;

    std::error_code ec;
    std::filesystem::path dir = cmd.dir;
    if (!std::filesystem::is_directory(dir, ec) || !platform::can_read_directory(dir)) {
        writer.error("The provided search directory, " + platform::path_to_utf8(cmd.dir) +
                     ", does not exist on the user's system or is outside of user permissions");
        return EXIT_FAILURE_CODE;
    }

    const config::Config cfg = load_config(global, writer);

    config::SearchConfig search = config::make_search_config(cfg);
    search.root = platform::normalize(std::filesystem::absolute(dir));
    search.recursive = cmd.recursive;
    search.dry_run = cmd.dry;
    search.force_refresh = cmd.force;
    search.verbosity = global.verbose;
    if (cmd.cache_hours) {
        search.cache_window_hours = *cmd.cache_hours;
    }
    if (cmd.concurrency) {
        search.concurrency_limit = *cmd.concurrency;
    }
    if (cmd.timeout_secs) {
        search.task_timeout = std::chrono::milliseconds(
            static_cast<std::int64_t>(*cmd.timeout_secs) * 1000);
    }

    std::unique_ptr<store::Database> db;
    try {
        db = open_store(cfg, writer);
    } catch (const store::StoreError& e) {
        writer.error(std::string("failed to open cache database - ") + e.what());
        return EXIT_FAILURE_CODE;
    }

    writer.info("Searching " + platform::path_to_utf8(search.root) +
                (search.recursive ? " recursively" : "") + (search.dry_run ? " (dry run)" : ""));

    CancellationToken cancel;
    SignalScope signals(cancel);

    engine::Orchestrator orchestrator(*db, search, writer, cancel);
    const engine::RunSummary summary = orchestrator.run();

    print_summary(writer, summary, search.dry_run);

    switch (summary.outcome) {
        case engine::SessionOutcome::Completed:
            return EXIT_OK;
        case engine::SessionOutcome::Interrupted:
            writer.info("Run dds again with the same arguments to resume");
            return EXIT_INTERRUPTED;
        case engine::SessionOutcome::Failed:
            writer.error(summary.failure);
            return EXIT_FAILURE_CODE;
    }
    return EXIT_FAILURE_CODE;
}

// ----------------------------------------------------------------------------
// Управление кэшем
// ----------------------------------------------------------------------------

template <typename Fn>
int run_cache_command(const dds::cli::GlobalOptions& global, dds::output::Writer& writer, Fn fn) {
    using namespace dds;

    const config::Config cfg = load_config(global, writer);
    try {
        auto db = open_store(cfg, writer);
        fn(*db, cfg);
    } catch (const store::StoreError& e) {
        writer.error(std::string("cache operation failed - ") + e.what());
        return EXIT_FAILURE_CODE;
    }
    return EXIT_OK;
}

// ----------------------------------------------------------------------------
// Главная функция выполнения (run)
// ----------------------------------------------------------------------------

int run(int argc, char** argv) {
    using namespace dds;

    cli::ParseResult parse_result = cli::parse(argc, argv);

    output::OutputConfig out_cfg;
    out_cfg.quiet = parse_result.global.quiet;
    out_cfg.verbose = parse_result.global.verbose;
    output::Writer writer(out_cfg);

    // Сообщение об ошибке парсинга выводится как есть, без [x]
    if (!parse_result.ok) {
        writer.write(output::Stream::Stderr, parse_result.diagnostic.stderr_message);
        return parse_result.diagnostic.exit_code;
    }

    const cli::GlobalOptions& global = parse_result.global;

    return std::visit(
        [&](auto&& cmd) -> int {
            using T = std::decay_t<decltype(cmd)>;

            if constexpr (std::is_same_v<T, cli::HelpCommand>) {
                writer.write(output::Stream::Stdout, cli::render_help());
                return EXIT_OK;
            } else if constexpr (std::is_same_v<T, cli::VersionCommand>) {
                writer.write(output::Stream::Stdout, cli::render_version());
                return EXIT_OK;
            } else if constexpr (std::is_same_v<T, cli::SearchCommand>) {
                return run_search(cmd, global, writer);
            } else if constexpr (std::is_same_v<T, cli::CacheStatusCommand>) {
                return run_cache_command(
                    global, writer, [&](store::Database& db, const config::Config& cfg) {
                        maintenance::print_status(
                            writer,
                            maintenance::cache_status(
                                db, cmd.cache_hours.value_or(cfg.cache_window_hours)),
                            cmd.json);
                    });
            } else if constexpr (std::is_same_v<T, cli::CacheStatsCommand>) {
                return run_cache_command(
                    global, writer, [&](store::Database& db, const config::Config& cfg) {
                        maintenance::print_stats(
                            writer,
                            maintenance::cache_stats(
                                db, cmd.cache_hours.value_or(cfg.cache_window_hours)),
                            cmd.json);
                    });
            } else {
                static_assert(std::is_same_v<T, cli::CacheClearIncompleteCommand>);
                return run_cache_command(global, writer,
                                         [&](store::Database& db, const config::Config&) {
                                             maintenance::print_clear(
                                                 writer, maintenance::clear_incomplete(db),
                                                 cmd.json);
                                         });
            }
        },
        parse_result.command);
}

}  // anonymous namespace

// ----------------------------------------------------------------------------
// main
// ----------------------------------------------------------------------------

int main(int argc, char** argv) {
    try {
        return run(argc, argv);
    } catch (const std::exception& e) {
        // Формат ошибки "[x] <err>"
        std::cerr << "[x] " << e.what() << "\n";
        return EXIT_FAILURE_CODE;
    }
}
