// ==============================================================================
// walker.cpp - Обход одного каталога
// ==============================================================================

#include "dds/walker.hpp"

#include "dds/platform.hpp"

#include <algorithm>
#include <system_error>

namespace dds::walker {

namespace {

WalkErrorKind classify(const std::error_code& ec) {
    if (ec == std::errc::permission_denied || ec == std::errc::operation_not_permitted) {
        return WalkErrorKind::PermissionDenied;
    }
    if (ec == std::errc::no_such_file_or_directory) {
        return WalkErrorKind::NotFound;
    }
    if (ec == std::errc::not_a_directory) {
        return WalkErrorKind::NotADirectory;
    }
    return WalkErrorKind::Io;
}

WalkError make_error(WalkErrorKind kind, const std::string& what,
                     const std::filesystem::path& path) {
    WalkError e;
    e.kind = kind;
    e.message = what + " - " + platform::path_to_utf8(path);
    return e;
}

bool has_prefix(const std::string& path, const std::string& prefix) {
    if (prefix.empty()) {
        return false;
    }
    std::string p = prefix;
    while (p.size() > 1 && p.back() == '/') {
        p.pop_back();
    }
    if (path.compare(0, p.size(), p) != 0) {
        return false;
    }
    // Граница компонента: /tmp не совпадает с /tmpfiles
    return path.size() == p.size() || path[p.size()] == '/' || p == "/";
}

}  // namespace

std::string_view to_string(WalkErrorKind kind) {
    switch (kind) {
        case WalkErrorKind::PermissionDenied:
            return "permission denied";
        case WalkErrorKind::NotFound:
            return "not found";
        case WalkErrorKind::NotADirectory:
            return "not a directory";
        case WalkErrorKind::SymlinkSkipped:
            return "symlink skipped";
        case WalkErrorKind::Excluded:
            return "excluded system path";
        case WalkErrorKind::Io:
            return "io error";
        case WalkErrorKind::Cancelled:
            return "cancelled";
        case WalkErrorKind::Timeout:
            return "timeout";
    }
    return "io error";
}

// ----------------------------------------------------------------------------
// ExclusionRules
// ----------------------------------------------------------------------------

bool ExclusionRules::is_excluded(const std::filesystem::path& path) const {
    const std::string generic = path.generic_string();
    for (const auto& prefix : prefixes) {
        if (has_prefix(generic, prefix)) {
            return true;
        }
    }
    if (!names.empty()) {
        for (const auto& component : path) {
            const std::string name = platform::path_to_utf8(component);
            if (std::find(names.begin(), names.end(), name) != names.end()) {
                return true;
            }
        }
    }
    return false;
}

// ----------------------------------------------------------------------------
// walk_directory
// ----------------------------------------------------------------------------

WalkResult walk_directory(const std::filesystem::path& dir, const WalkOptions& options,
                          const CancellationToken& cancel) {
    WalkResult result;
    result.directory = dir;

    if (cancel.is_cancelled()) {
        result.error = make_error(WalkErrorKind::Cancelled, "walk cancelled", dir);
        return result;
    }

    // Сам каталог: symlink_status не следует по ссылке
    std::error_code ec;
    const auto self = std::filesystem::symlink_status(dir, ec);
    if (ec || !std::filesystem::exists(self)) {
        const WalkErrorKind kind = ec ? classify(ec) : WalkErrorKind::NotFound;
        result.error = make_error(kind, "directory vanished", dir);
        return result;
    }
    if (std::filesystem::is_symlink(self)) {
        result.error = make_error(WalkErrorKind::SymlinkSkipped, "symlink not followed", dir);
        return result;
    }
    if (!std::filesystem::is_directory(self)) {
        result.error = make_error(WalkErrorKind::NotADirectory, "not a directory", dir);
        return result;
    }
    if (options.exclusions.is_excluded(dir)) {
        result.error = make_error(WalkErrorKind::Excluded, "excluded system path", dir);
        return result;
    }

    std::filesystem::directory_iterator it(dir, ec);
    if (ec) {
        result.error = make_error(classify(ec), "failed to read directory (" + ec.message() + ")",
                                  dir);
        return result;
    }

    bool seen_any = false;
    for (; it != std::filesystem::directory_iterator(); it.increment(ec)) {
        if (cancel.is_cancelled()) {
            result.error = make_error(WalkErrorKind::Cancelled, "walk cancelled", dir);
            result.partial = seen_any;
            break;
        }
        seen_any = true;

        const std::filesystem::directory_entry& entry = *it;
        const std::filesystem::path entry_path = entry.path();

        std::error_code entry_ec;
        const auto st = entry.symlink_status(entry_ec);
        if (entry_ec) {
            // Запись исчезла между readdir и stat - не ошибка каталога
            result.skipped.push_back({entry_path, classify(entry_ec)});
            continue;
        }

        if (std::filesystem::is_symlink(st)) {
            // В отчёт попадают только ссылки на каталоги; stat цели не означает обход
            std::error_code target_ec;
            if (options.emit_children && std::filesystem::is_directory(entry_path, target_ec)) {
                result.skipped.push_back({entry_path, WalkErrorKind::SymlinkSkipped});
            }
            continue;
        }

        if (std::filesystem::is_directory(st)) {
            if (!options.emit_children) {
                continue;
            }
            if (options.exclusions.is_excluded(entry_path)) {
                result.skipped.push_back({entry_path, WalkErrorKind::Excluded});
                continue;
            }
            if (!platform::can_read_directory(entry_path)) {
                result.skipped.push_back({entry_path, WalkErrorKind::PermissionDenied});
                continue;
            }
            result.children.push_back(entry_path);
            continue;
        }

        if (std::filesystem::is_regular_file(st) &&
            platform::path_to_utf8(entry_path.filename()) == options.target_name) {
            result.matches.push_back(entry_path);
        }
        // Прочие типы (сокеты, устройства, FIFO) игнорируются
    }

    if (ec && !result.error) {
        result.error = make_error(classify(ec), "failed to list directory (" + ec.message() + ")",
                                  dir);
        result.partial = true;
    }

    std::sort(result.matches.begin(), result.matches.end());
    std::sort(result.children.begin(), result.children.end());
    return result;
}

}  // namespace dds::walker
