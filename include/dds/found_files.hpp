// ==============================================================================
// dds/found_files.hpp - Журнал найденных файлов
// ==============================================================================
//
// Назначение:
// - Запись о каждом найденном файле сессии (session, path)
// - Исход удаления выставляется ровно один раз: Pending -> Deleted |
//   DryRunSkipped | DeleteFailed
// - Источник для фазы удаления и для отчёта dry-run
//
// ==============================================================================

#ifndef DDS_FOUND_FILES_HPP
#define DDS_FOUND_FILES_HPP

#include "dds/store.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace dds::ledger {

enum class DeletionOutcome { Pending, Deleted, DryRunSkipped, DeleteFailed };

std::string_view to_string(DeletionOutcome outcome);

struct FoundFile {
    std::string session_id;
    std::string path;
    std::int64_t found_at = 0;
    DeletionOutcome outcome = DeletionOutcome::Pending;
    std::optional<std::string> note;
};

class FoundFilesLedger {
public:
    explicit FoundFilesLedger(store::Database& db);

    /// Записать найденные файлы (повторная запись того же пути игнорируется).
    /// Возвращает число новых записей.
    std::size_t record(const std::string& session_id, const std::vector<std::string>& paths);

    /// Выставить исход удаления; только из Pending.
    /// Возвращает false, если исход уже был выставлен (или записи нет).
    bool set_outcome(const std::string& session_id, const std::string& path,
                     DeletionOutcome outcome, const std::optional<std::string>& note = std::nullopt);

    /// Все записи сессии в порядке обнаружения
    std::vector<FoundFile> list(const std::string& session_id);

    /// Записи, ожидающие удаления
    std::vector<FoundFile> pending(const std::string& session_id);

    std::size_t count(const std::string& session_id);

    std::size_t count(const std::string& session_id, DeletionOutcome outcome);

private:
    std::vector<FoundFile> select(const std::string& session_id, bool only_pending);

    store::Database& db_;
};

}  // namespace dds::ledger

#endif  // DDS_FOUND_FILES_HPP
