// ==============================================================================
// dds/output.hpp - Пользовательский вывод
// ==============================================================================
//
// RapidJSON для JSON сериализации. Только этот модуль пишет в stdout/stderr.
//
// Назначение:
// - Единственная точка записи в stdout/stderr (журнал [+]/[!]/[x]/[*]/[~])
// - Цветной вывод (ANSI escape codes) при TTY
// - Таблицы (Unicode box-drawing)
// - JSON вывод для команд управления кэшем
// - Строка прогресса (перерисовывается через '\r')
//
// Writer потокобезопасен: все байты одного вызова пишутся под одним mutex,
// поэтому сообщения параллельных задач не перемешиваются.
//
// ==============================================================================

#ifndef DDS_OUTPUT_HPP
#define DDS_OUTPUT_HPP

#include <cstdio>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

// Forward declarations для JSON
namespace rapidjson {
class CrtAllocator;
template <typename BaseAllocator>
class MemoryPoolAllocator;
template <typename Encoding, typename Allocator>
class GenericValue;
template <typename CharType>
struct UTF8;
using Value = GenericValue<UTF8<char>, MemoryPoolAllocator<CrtAllocator>>;
}  // namespace rapidjson

namespace dds::output {

// ----------------------------------------------------------------------------
// Потоки вывода
// ----------------------------------------------------------------------------

enum class Stream { Stdout, Stderr };

// ----------------------------------------------------------------------------
// ANSI цвета для терминала
// ----------------------------------------------------------------------------

enum class Color {
    Default,
    Green,   // Успех, информация
    Yellow,  // Предупреждения
    Red,     // Ошибки
    Cyan,    // Отладка
    Magenta  // Трассировка
};

// ----------------------------------------------------------------------------
// Конфигурация вывода
// ----------------------------------------------------------------------------

struct OutputConfig {
    bool quiet = false;  // -q: подавить informational stderr
    int verbose = 0;     // -v: уровень подробности (0..2+)
    bool color = true;   // false = никогда не выводить ANSI коды
};

#ifdef _WIN32
constexpr const char* TICK_CHARS = "-\\|/";
constexpr int TICK_MS = 200;
#else
// Braille spinner, 10 кадров по 3 байта UTF-8
constexpr const char* TICK_CHARS = "\xe2\xa0\x8b\xe2\xa0\x99\xe2\xa0\xb9\xe2\xa0\xb8\xe2\xa0\xbc"
                                   "\xe2\xa0\xb4\xe2\xa0\xa6\xe2\xa0\xa7\xe2\xa0\x87\xe2\xa0\x8f";
constexpr int TICK_MS = 80;
#endif

// ----------------------------------------------------------------------------
// Writer - единый слой вывода
// ----------------------------------------------------------------------------

class Writer {
public:
    explicit Writer(const OutputConfig& cfg);
    ~Writer();

    Writer(const Writer&) = delete;
    Writer& operator=(const Writer&) = delete;

    // Базовый вывод
    // -------------------------------------------------------------------------

    /// Записать байты в поток
    void write(Stream s, std::string_view bytes);

    /// Записать строку с переводом строки
    void write_line(Stream s, std::string_view bytes);

    // Сообщения с префиксами
    // -------------------------------------------------------------------------

    /// "[+] <message>" в stderr (если не quiet)
    void info(std::string_view message);

    /// "[!] <message>" в stderr (если не quiet)
    void warn(std::string_view message);

    /// "[x] <message>" в stderr (всегда)
    void error(std::string_view message);

    /// "[*] <message>" в stderr (только при verbose > 0)
    void debug(std::string_view message);

    /// "[~] <message>" в stderr (только при verbose > 1)
    void trace(std::string_view message);

    /// Будет ли debug() что-то печатать (чтобы не собирать строки впустую)
    bool debug_enabled() const { return config_.verbose > 0; }

    // Цветной вывод
    // -------------------------------------------------------------------------

    void green_line(std::string_view message);

    // JSON вывод (stdout)
    // -------------------------------------------------------------------------

    void write_json_pretty(const rapidjson::Value& value);

    // Прогресс-индикатор (stderr)
    // -------------------------------------------------------------------------

    /// Начать прогресс-индикатор; скрыт при quiet, verbose или не-TTY
    void progress_begin(std::string_view label);

    /// Перерисовать строку прогресса с новым статусом
    void progress_tick(std::string_view status);

    /// Завершить прогресс-индикатор (стереть строку)
    void progress_end();

    bool progress_active() const;

    // Управление
    // -------------------------------------------------------------------------

    void flush();

    const OutputConfig& config() const { return config_; }

private:
    /// Запись без блокировки; вызывающий держит mutex_
    void write_unlocked(Stream s, std::string_view bytes);

    /// Сообщение с цветным префиксом; стирает строку прогресса перед выводом
    void prefixed(std::string_view prefix, Color color, std::string_view message);

    std::string colored(Stream s, std::string_view message, Color color) const;

    FILE* get_file(Stream s) const;

    OutputConfig config_;
    mutable std::mutex mutex_;

    // Состояние прогресс-бара
    std::string progress_label_;
    std::string progress_status_;
    size_t progress_frame_ = 0;
    bool progress_active_ = false;
};

// ----------------------------------------------------------------------------
// Table - форматирование таблиц (Unicode box-drawing)
// ----------------------------------------------------------------------------

class Table {
public:
    Table();

    void set_headers(const std::vector<std::string>& headers);
    void add_row(const std::vector<std::string>& cells);

    /// Вывести таблицу через Writer в stdout
    void print(Writer& w);

    std::string to_string() const;

    size_t row_count() const { return rows_.size(); }

private:
    std::string format_line(char left, char middle, char right) const;
    std::string format_row(const std::vector<std::string>& cells) const;
    void calculate_widths();

    std::vector<std::string> headers_;
    std::vector<std::vector<std::string>> rows_;
    std::vector<size_t> col_widths_;
    bool widths_calculated_ = false;
};

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

std::string ansi_color_code(Color color);

/// Поддерживает ли поток цвета (TTY check)
bool supports_color(Stream s);

/// Длина строки в символах UTF-8 (для выравнивания таблиц)
size_t display_width(std::string_view s);

}  // namespace dds::output

#endif  // DDS_OUTPUT_HPP
