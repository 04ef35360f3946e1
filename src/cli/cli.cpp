// ==============================================================================
// cli.cpp - Парсинг командной строки
// ==============================================================================
//
// Формат ошибок повторяет clap: "error: ...", пустая строка, Usage,
// подсказка про --help. Код выхода 2.
//
// ==============================================================================

#include "dds/cli.hpp"

#include "dds/platform.hpp"

#include <charconv>
#include <cstring>
#include <string_view>

namespace dds::cli {

namespace {

constexpr const char* USAGE = "Usage: dds [OPTIONS] [DIR]";

bool str_eq(const char* a, const char* b) {
    return std::strcmp(a, b) == 0;
}

bool starts_with(const char* str, const char* prefix) {
    return std::strncmp(str, prefix, std::strlen(prefix)) == 0;
}

std::string render_usage_error(const std::string& error_msg) {
    return "error: " + error_msg + "\n\n" + USAGE + "\n\nFor more information, try '--help'.\n";
}

std::optional<std::uint32_t> parse_u32(std::string_view s) {
    std::uint32_t value = 0;
    const char* first = s.data();
    const char* last = s.data() + s.size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc() || ptr != last || s.empty()) {
        return std::nullopt;
    }
    return value;
}

/// Опция со значением: "--name VALUE" или "--name=VALUE"
struct ValueOption {
    const char* long_name;
    const char* short_name;  // может быть nullptr
};

constexpr ValueOption OPT_CACHE_HOURS{"--cache-hours", nullptr};
constexpr ValueOption OPT_CONCURRENCY{"--concurrency", "-j"};
constexpr ValueOption OPT_TIMEOUT{"--timeout", nullptr};
constexpr ValueOption OPT_CONFIG{"--config", nullptr};

enum class Match { No, Yes, MissingValue };

/// Проверить argv[i] на опцию со значением; сдвигает i при форме с пробелом
Match take_value(const ValueOption& opt, int argc, char** argv, int& i, std::string& value) {
    const char* arg = argv[i];
    if (str_eq(arg, opt.long_name) || (opt.short_name && str_eq(arg, opt.short_name))) {
        if (i + 1 >= argc) {
            return Match::MissingValue;
        }
        ++i;
        value = argv[i];
        return Match::Yes;
    }
    const std::string eq = std::string(opt.long_name) + "=";
    if (starts_with(arg, eq.c_str())) {
        value = arg + eq.size();
        return Match::Yes;
    }
    return Match::No;
}

std::string missing_value_error(const ValueOption& opt, const char* metavar) {
    return render_usage_error(std::string("a value is required for '") + opt.long_name + " <" +
                              metavar + ">' but none was supplied");
}

std::string invalid_value_error(const ValueOption& opt, const char* metavar,
                                const std::string& value, const char* reason) {
    return render_usage_error("invalid value '" + value + "' for '" + opt.long_name + " <" +
                              metavar + ">': " + reason);
}

enum class CacheAction { None, Status, Stats, ClearIncomplete };

}  // namespace

// ----------------------------------------------------------------------------
// render_version / render_help
// ----------------------------------------------------------------------------

std::string render_version() {
    return std::string("dds ") + VERSION + "\n";
}

std::string render_help() {
    return std::string(ABOUT) +
           "\n"
           "\n"
           "Usage: dds [OPTIONS] [DIR]\n"
           "\n"
           "Arguments:\n"
           "  [DIR]  The directory to search within for `.DS_Store` files [default: .]\n"
           "\n"
           "Options:\n"
           "  -v, --verbose                  Increase the logging of detailed information as "
           "`dds` progresses\n"
           "  -q, --quiet                    Reduce the logging of detailed information as "
           "`dds` progresses\n"
           "  -r, --recursive                Whether to search recursively in subdirectories of "
           "the provided search directory\n"
           "  -d, --dry                      Whether to perform a dry run where `.DS_Store` files "
           "are found but not deleted\n"
           "  -f, --force                    Ignore the cache and search every directory again\n"
           "      --cache-hours <HOURS>      How long a searched directory stays fresh "
           "(0 disables the cache)\n"
           "  -j, --concurrency <N>          Maximum number of directories searched at once\n"
           "      --timeout <SECS>           Per-directory search timeout\n"
           "      --config <PATH>            Configuration file [default: ~/.dds/config.yaml]\n"
           "      --cache-status             Show incomplete searches and resumable sessions\n"
           "      --cache-stats              Show cache statistics\n"
           "      --cache-clear-incomplete   Remove incomplete cache entries and close "
           "interrupted sessions\n"
           "      --json                     Output cache information as JSON\n"
           "  -h, --help                     Print help\n"
           "  -V, --version                  Print version\n";
}

// ----------------------------------------------------------------------------
// parse
// ----------------------------------------------------------------------------

ParseResult parse(int argc, char** argv) {
    ParseResult result;
    result.ok = false;
    result.command = HelpCommand{};

    SearchCommand search;
    bool dir_seen = false;
    bool json = false;
    CacheAction action = CacheAction::None;
    const char* action_flag = nullptr;

    auto fail = [&result](std::string message) {
        result.ok = false;
        result.diagnostic.exit_code = 2;
        result.diagnostic.stderr_message = std::move(message);
        return result;
    };

    auto set_action = [&](CacheAction a, const char* flag) -> bool {
        if (action != CacheAction::None && action != a) {
            return false;
        }
        action = a;
        action_flag = flag;
        return true;
    };

    bool options_done = false;
    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];

        if (options_done || arg[0] != '-' || str_eq(arg, "-")) {
            if (dir_seen) {
                return fail(render_usage_error(std::string("unexpected argument '") + arg +
                                               "' found"));
            }
            search.dir = platform::path_from_utf8(arg);
            dir_seen = true;
            continue;
        }

        if (str_eq(arg, "--")) {
            options_done = true;
            continue;
        }

        if (str_eq(arg, "-h") || str_eq(arg, "--help")) {
            result.ok = true;
            result.command = HelpCommand{};
            return result;
        }
        if (str_eq(arg, "-V") || str_eq(arg, "--version")) {
            result.ok = true;
            result.command = VersionCommand{};
            return result;
        }

        if (str_eq(arg, "--verbose")) {
            result.global.verbose++;
            continue;
        }
        if (str_eq(arg, "--quiet")) {
            result.global.quiet = true;
            continue;
        }
        if (str_eq(arg, "--recursive")) {
            search.recursive = true;
            continue;
        }
        if (str_eq(arg, "--dry")) {
            search.dry = true;
            continue;
        }
        if (str_eq(arg, "--force")) {
            search.force = true;
            continue;
        }
        if (str_eq(arg, "--json")) {
            json = true;
            continue;
        }
        if (str_eq(arg, "--cache-status") || str_eq(arg, "--cache-stats") ||
            str_eq(arg, "--cache-clear-incomplete")) {
            const CacheAction a = str_eq(arg, "--cache-status")  ? CacheAction::Status
                                  : str_eq(arg, "--cache-stats") ? CacheAction::Stats
                                                                 : CacheAction::ClearIncomplete;
            if (!set_action(a, arg)) {
                return fail(render_usage_error(std::string("the argument '") + arg +
                                               "' cannot be used with '" + action_flag + "'"));
            }
            continue;
        }

        std::string value;
        Match m = take_value(OPT_CACHE_HOURS, argc, argv, i, value);
        if (m == Match::MissingValue) {
            return fail(missing_value_error(OPT_CACHE_HOURS, "HOURS"));
        }
        if (m == Match::Yes) {
            auto hours = parse_u32(value);
            if (!hours) {
                return fail(invalid_value_error(OPT_CACHE_HOURS, "HOURS", value,
                                                "expected a non-negative integer"));
            }
            search.cache_hours = *hours;
            continue;
        }

        m = take_value(OPT_CONCURRENCY, argc, argv, i, value);
        if (m == Match::MissingValue) {
            return fail(missing_value_error(OPT_CONCURRENCY, "N"));
        }
        if (m == Match::Yes) {
            auto n = parse_u32(value);
            if (!n || *n == 0) {
                return fail(invalid_value_error(OPT_CONCURRENCY, "N", value,
                                                "expected a positive integer"));
            }
            search.concurrency = *n;
            continue;
        }

        m = take_value(OPT_TIMEOUT, argc, argv, i, value);
        if (m == Match::MissingValue) {
            return fail(missing_value_error(OPT_TIMEOUT, "SECS"));
        }
        if (m == Match::Yes) {
            auto secs = parse_u32(value);
            if (!secs || *secs == 0) {
                return fail(invalid_value_error(OPT_TIMEOUT, "SECS", value,
                                                "expected a positive integer"));
            }
            search.timeout_secs = *secs;
            continue;
        }

        m = take_value(OPT_CONFIG, argc, argv, i, value);
        if (m == Match::MissingValue) {
            return fail(missing_value_error(OPT_CONFIG, "PATH"));
        }
        if (m == Match::Yes) {
            result.global.config_path = platform::path_from_utf8(value);
            continue;
        }

        if (arg[1] != '-') {
            // Склеенные короткие флаги: -rd, -vv
            for (const char* c = arg + 1; *c != '\0'; ++c) {
                switch (*c) {
                    case 'v':
                        result.global.verbose++;
                        break;
                    case 'q':
                        result.global.quiet = true;
                        break;
                    case 'r':
                        search.recursive = true;
                        break;
                    case 'd':
                        search.dry = true;
                        break;
                    case 'f':
                        search.force = true;
                        break;
                    case 'h':
                        result.ok = true;
                        result.command = HelpCommand{};
                        return result;
                    case 'V':
                        result.ok = true;
                        result.command = VersionCommand{};
                        return result;
                    default:
                        return fail(render_usage_error(std::string("unexpected argument '-") +
                                                       *c + "' found"));
                }
            }
            continue;
        }

        return fail(render_usage_error(std::string("unexpected argument '") + arg + "' found"));
    }

    result.ok = true;
    switch (action) {
        case CacheAction::Status:
            result.command = CacheStatusCommand{json, search.cache_hours};
            break;
        case CacheAction::Stats:
            result.command = CacheStatsCommand{json, search.cache_hours};
            break;
        case CacheAction::ClearIncomplete:
            result.command = CacheClearIncompleteCommand{json};
            break;
        case CacheAction::None:
            result.command = search;
            break;
    }
    return result;
}

}  // namespace dds::cli
