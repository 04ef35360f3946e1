// ==============================================================================
// output.cpp - Пользовательский вывод
// ==============================================================================
//
// RapidJSON для JSON сериализации. Байты первичны, std::endl не используется.
//
// ==============================================================================

#include "dds/output.hpp"

#include "dds/platform.hpp"

#include <algorithm>
#include <cstdio>
#include <cstring>
#include <rapidjson/document.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

namespace dds::output {

// ----------------------------------------------------------------------------
// ANSI Escape Codes
// ----------------------------------------------------------------------------

namespace {

// ANSI SGR (Select Graphic Rendition) коды
constexpr const char* ANSI_RESET = "\x1b[0m";
constexpr const char* ANSI_GREEN = "\x1b[32m";
constexpr const char* ANSI_YELLOW = "\x1b[33m";
constexpr const char* ANSI_RED = "\x1b[31m";
constexpr const char* ANSI_CYAN = "\x1b[36m";
constexpr const char* ANSI_MAGENTA = "\x1b[35m";

// Возврат каретки + очистка строки до конца
constexpr const char* CLEAR_LINE = "\r\x1b[2K";

// Unicode box-drawing characters (UTF-8)
constexpr const char* BOX_V = "\xe2\x94\x82";      // │ U+2502
constexpr const char* BOX_H = "\xe2\x94\x80";      // ─ U+2500
constexpr const char* BOX_TL = "\xe2\x94\x8c";     // ┌ U+250C
constexpr const char* BOX_TR = "\xe2\x94\x90";     // ┐ U+2510
constexpr const char* BOX_BL = "\xe2\x94\x94";     // └ U+2514
constexpr const char* BOX_BR = "\xe2\x94\x98";     // ┘ U+2518
constexpr const char* BOX_LT = "\xe2\x94\x9c";     // ├ U+251C
constexpr const char* BOX_RT = "\xe2\x94\xa4";     // ┤ U+2524
constexpr const char* BOX_TT = "\xe2\x94\xac";     // ┬ U+252C
constexpr const char* BOX_BT = "\xe2\x94\xb4";     // ┴ U+2534
constexpr const char* BOX_CROSS = "\xe2\x94\xbc";  // ┼ U+253C

#ifdef _WIN32
constexpr size_t TICK_FRAME_BYTES = 1;
#else
constexpr size_t TICK_FRAME_BYTES = 3;
#endif

}  // namespace

// ----------------------------------------------------------------------------
// Writer
// ----------------------------------------------------------------------------

Writer::Writer(const OutputConfig& cfg) : config_(cfg) {}

Writer::~Writer() {
    progress_end();
    flush();
}

void Writer::write(Stream s, std::string_view bytes) {
    std::lock_guard<std::mutex> lock(mutex_);
    write_unlocked(s, bytes);
}

void Writer::write_line(Stream s, std::string_view bytes) {
    std::lock_guard<std::mutex> lock(mutex_);
    write_unlocked(s, bytes);
    write_unlocked(s, "\n");
}

void Writer::write_unlocked(Stream s, std::string_view bytes) {
    FILE* f = get_file(s);
    if (f != nullptr) {
        std::fwrite(bytes.data(), 1, bytes.size(), f);
    }
}

FILE* Writer::get_file(Stream s) const {
    return (s == Stream::Stdout) ? stdout : stderr;
}

void Writer::prefixed(std::string_view prefix, Color color, std::string_view message) {
    std::string line;
    line.reserve(prefix.size() + message.size() + 16);
    line += colored(Stream::Stderr, prefix, color);
    line += ' ';
    line.append(message);
    line += '\n';

    std::lock_guard<std::mutex> lock(mutex_);
    // Строка прогресса стирается; следующий tick её перерисует
    if (progress_active_) {
        write_unlocked(Stream::Stderr, CLEAR_LINE);
    }
    write_unlocked(Stream::Stderr, line);
}

void Writer::info(std::string_view message) {
    if (config_.quiet) {
        return;
    }
    prefixed("[+]", Color::Green, message);
}

void Writer::warn(std::string_view message) {
    if (config_.quiet) {
        return;
    }
    prefixed("[!]", Color::Yellow, message);
}

void Writer::error(std::string_view message) {
    // Ошибки печатаются всегда, даже при --quiet
    prefixed("[x]", Color::Red, message);
}

void Writer::debug(std::string_view message) {
    if (config_.verbose <= 0) {
        return;
    }
    prefixed("[*]", Color::Cyan, message);
}

void Writer::trace(std::string_view message) {
    if (config_.verbose <= 1) {
        return;
    }
    prefixed("[~]", Color::Magenta, message);
}

void Writer::green_line(std::string_view message) {
    std::string line = colored(Stream::Stdout, message, Color::Green);
    line += '\n';
    write(Stream::Stdout, line);
}

std::string Writer::colored(Stream s, std::string_view message, Color color) const {
    if (!config_.color || !supports_color(s) || color == Color::Default) {
        return std::string(message);
    }
    std::string result = ansi_color_code(color);
    result.append(message);
    result += ANSI_RESET;
    return result;
}

void Writer::write_json_pretty(const rapidjson::Value& value) {
    rapidjson::StringBuffer buffer;
    rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
    writer.SetIndent(' ', 2);
    value.Accept(writer);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        write_unlocked(Stream::Stdout, std::string_view(buffer.GetString(), buffer.GetSize()));
        write_unlocked(Stream::Stdout, "\n");
    }
    flush();
}

void Writer::progress_begin(std::string_view label) {
    // Прогресс скрыт при verbose или quiet, и когда stderr не терминал
    if (config_.verbose > 0 || config_.quiet || !platform::is_tty_stderr()) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    progress_label_ = std::string(label);
    progress_status_.clear();
    progress_frame_ = 0;
    progress_active_ = true;
}

void Writer::progress_tick(std::string_view status) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!progress_active_) {
        return;
    }

    const size_t frames = std::strlen(TICK_CHARS) / TICK_FRAME_BYTES;
    const size_t frame = progress_frame_++ % frames;
    progress_status_ = std::string(status);

    std::string line = CLEAR_LINE;
    line.append(TICK_CHARS + frame * TICK_FRAME_BYTES, TICK_FRAME_BYTES);
    line += ' ';
    line += progress_label_;
    if (!progress_status_.empty()) {
        line += "  ";
        line += progress_status_;
    }
    write_unlocked(Stream::Stderr, line);
    std::fflush(stderr);
}

void Writer::progress_end() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!progress_active_) {
        return;
    }

    write_unlocked(Stream::Stderr, CLEAR_LINE);
    progress_active_ = false;
    progress_label_.clear();
    progress_status_.clear();
}

bool Writer::progress_active() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return progress_active_;
}

void Writer::flush() {
    std::fflush(stdout);
    std::fflush(stderr);
}

// ----------------------------------------------------------------------------
// Table
// ----------------------------------------------------------------------------

Table::Table() = default;

void Table::set_headers(const std::vector<std::string>& headers) {
    headers_ = headers;
    widths_calculated_ = false;
}

void Table::add_row(const std::vector<std::string>& cells) {
    rows_.push_back(cells);
    widths_calculated_ = false;
}

void Table::calculate_widths() {
    if (widths_calculated_) {
        return;
    }

    size_t num_cols = headers_.size();
    for (const auto& row : rows_) {
        num_cols = std::max(num_cols, row.size());
    }

    if (col_widths_.size() < num_cols) {
        col_widths_.resize(num_cols, 0);
    }

    for (size_t i = 0; i < headers_.size(); ++i) {
        col_widths_[i] = std::max(col_widths_[i], display_width(headers_[i]));
    }

    for (const auto& row : rows_) {
        for (size_t i = 0; i < row.size(); ++i) {
            col_widths_[i] = std::max(col_widths_[i], display_width(row[i]));
        }
    }

    widths_calculated_ = true;
}

std::string Table::format_line(char left, char middle, char right) const {
    std::string line;

    if (left == 'T') {
        line += BOX_TL;
    } else if (left == 'M') {
        line += BOX_LT;
    } else if (left == 'B') {
        line += BOX_BL;
    }

    for (size_t i = 0; i < col_widths_.size(); ++i) {
        // padding (1 пробел с каждой стороны) + ширина содержимого
        for (size_t j = 0; j < col_widths_[i] + 2; ++j) {
            line += BOX_H;
        }

        if (i < col_widths_.size() - 1) {
            if (middle == 'T') {
                line += BOX_TT;
            } else if (middle == 'M') {
                line += BOX_CROSS;
            } else if (middle == 'B') {
                line += BOX_BT;
            }
        }
    }

    if (right == 'T') {
        line += BOX_TR;
    } else if (right == 'M') {
        line += BOX_RT;
    } else if (right == 'B') {
        line += BOX_BR;
    }

    return line;
}

std::string Table::format_row(const std::vector<std::string>& cells) const {
    std::string line;
    line += BOX_V;

    for (size_t i = 0; i < col_widths_.size(); ++i) {
        line += ' ';

        std::string cell = (i < cells.size()) ? cells[i] : "";
        line += cell;

        const size_t width = display_width(cell);
        if (width < col_widths_[i]) {
            line.append(col_widths_[i] - width, ' ');
        }

        line += ' ';
        line += BOX_V;
    }

    return line;
}

std::string Table::to_string() const {
    // Ширины вычисляются лениво
    const_cast<Table*>(this)->calculate_widths();

    std::string result;

    result += format_line('T', 'T', 'T');
    result += '\n';

    if (!headers_.empty()) {
        result += format_row(headers_);
        result += '\n';
        result += format_line('M', 'M', 'M');
        result += '\n';
    }

    for (const auto& row : rows_) {
        result += format_row(row);
        result += '\n';
    }

    result += format_line('B', 'B', 'B');
    result += '\n';

    return result;
}

void Table::print(Writer& w) {
    w.write(Stream::Stdout, to_string());
}

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

std::string ansi_color_code(Color color) {
    switch (color) {
    case Color::Green:
        return ANSI_GREEN;
    case Color::Yellow:
        return ANSI_YELLOW;
    case Color::Red:
        return ANSI_RED;
    case Color::Cyan:
        return ANSI_CYAN;
    case Color::Magenta:
        return ANSI_MAGENTA;
    case Color::Default:
    default:
        return "";
    }
}

bool supports_color(Stream s) {
    if (s == Stream::Stdout) {
        return platform::is_tty_stdout();
    } else {
        return platform::is_tty_stderr();
    }
}

size_t display_width(std::string_view s) {
    // Считаем только ведущие байты UTF-8 (не 10xxxxxx)
    size_t width = 0;
    for (char c : s) {
        if ((static_cast<unsigned char>(c) & 0xC0) != 0x80) {
            ++width;
        }
    }
    return width;
}

}  // namespace dds::output
