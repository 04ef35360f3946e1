// ==============================================================================
// dds/platform.hpp - Платформенные абстракции
// ==============================================================================
//
// Назначение:
// - Преобразования path <-> UTF-8 (единый тип путей std::filesystem::path)
// - Определение TTY для цветного вывода
// - Домашний каталог пользователя, часы (unix time)
// - Генерация идентификаторов сессий
// - Временные каталоги (для тестов и отладочных прогонов)
//
// Вся платформенная специфика (#ifdef _WIN32) изолирована в platform.cpp.
//
// ==============================================================================

#ifndef DDS_PLATFORM_HPP
#define DDS_PLATFORM_HPP

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

namespace dds::platform {

// ----------------------------------------------------------------------------
// Преобразования путей
// ----------------------------------------------------------------------------

/// UTF-8 строка -> native path
std::filesystem::path path_from_utf8(std::string_view u8str);

/// native path -> UTF-8 строка (ключ в SQLite хранится в UTF-8)
std::string path_to_utf8(const std::filesystem::path& p);

/// Абсолютный нормализованный путь без разрешения symlink-ов.
/// Используется для ключей кэша: один каталог - одна строка.
std::filesystem::path normalize(const std::filesystem::path& p);

// ----------------------------------------------------------------------------
// TTY detection
// ----------------------------------------------------------------------------

bool is_tty_stdout();
bool is_tty_stderr();

// ----------------------------------------------------------------------------
// Окружение
// ----------------------------------------------------------------------------

/// Домашний каталог ($HOME / %USERPROFILE%)
/// @throws std::runtime_error если определить не удалось
std::filesystem::path home_dir();

/// Проверка права на чтение и обход каталога (без следования symlink)
bool can_read_directory(const std::filesystem::path& dir);

// ----------------------------------------------------------------------------
// Время и идентификаторы
// ----------------------------------------------------------------------------

/// Текущее время в секундах unix epoch
std::int64_t unix_now();

/// Случайный UUID v4 в каноническом виде (8-4-4-4-12)
std::string generate_session_id();

}  // namespace dds::platform

#endif  // DDS_PLATFORM_HPP
