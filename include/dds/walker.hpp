// ==============================================================================
// dds/walker.hpp - Обход одного каталога
// ==============================================================================
//
// Назначение:
// - Перечислить непосредственные записи одного каталога
// - Классифицировать: совпадение с целевым именем, дочерний каталог,
//   аномалия (symlink, исключённый системный путь, нет прав)
// - Ошибки каталога - значения (WalkError), а не исключения: один
//   недоступный каталог никогда не прерывает обход
//
// Symlink-и не разыменовываются никогда (symlink_status), поэтому циклы
// через ссылки невозможны.
//
// Walker ничего не знает о сессиях и очереди: чистая функция
// каталог -> (matches, children, error).
//
// ==============================================================================

#ifndef DDS_WALKER_HPP
#define DDS_WALKER_HPP

#include "dds/cancellation.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace dds::walker {

// ----------------------------------------------------------------------------
// Ошибки и аномалии
// ----------------------------------------------------------------------------

enum class WalkErrorKind {
    PermissionDenied,
    NotFound,
    NotADirectory,
    SymlinkSkipped,
    Excluded,
    Io,
    Cancelled,
    Timeout,
};

std::string_view to_string(WalkErrorKind kind);

struct WalkError {
    WalkErrorKind kind = WalkErrorKind::Io;
    std::string message;
};

// ----------------------------------------------------------------------------
// Исключения системных путей
// ----------------------------------------------------------------------------

struct ExclusionRules {
    /// Абсолютные префиксы (совпадение по границе компонента пути)
    std::vector<std::string> prefixes;
    /// Имена компонентов, исключаемые на любой глубине
    std::vector<std::string> names;

    bool is_excluded(const std::filesystem::path& path) const;
};

// ----------------------------------------------------------------------------
// Параметры и результат
// ----------------------------------------------------------------------------

struct WalkOptions {
    std::string target_name = ".DS_Store";
    ExclusionRules exclusions;
    /// false - дочерние каталоги не собираются (нерекурсивный поиск)
    bool emit_children = true;
};

struct SkippedEntry {
    std::filesystem::path path;
    WalkErrorKind reason = WalkErrorKind::Excluded;
};

struct WalkResult {
    std::filesystem::path directory;
    std::vector<std::filesystem::path> matches;   // отсортированы
    std::vector<std::filesystem::path> children;  // отсортированы
    std::vector<SkippedEntry> skipped;
    std::optional<WalkError> error;
    /// Ошибка возникла после того, как часть записей уже была прочитана
    bool partial = false;

    bool ok() const { return !error.has_value(); }
};

// ----------------------------------------------------------------------------
// walk_directory
// ----------------------------------------------------------------------------

/// Обойти один каталог. Токен проверяется перед каждой записью;
/// при отмене возвращается то, что успели прочитать, с ошибкой Cancelled.
WalkResult walk_directory(const std::filesystem::path& dir, const WalkOptions& options,
                          const CancellationToken& cancel);

}  // namespace dds::walker

#endif  // DDS_WALKER_HPP
