// ==============================================================================
// platform.cpp - Платформенные абстракции
// ==============================================================================

#include "dds/platform.hpp"

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <random>
#include <stdexcept>
#include <system_error>
#include <vector>

#ifdef _WIN32
#include <io.h>
#define NOMINMAX
#include <windows.h>
#else
#include <unistd.h>
#endif

namespace dds::platform {

// ----------------------------------------------------------------------------
// Преобразования путей
// ----------------------------------------------------------------------------

std::filesystem::path path_from_utf8(std::string_view u8str) {
#ifdef _WIN32
    // Windows: конвертируем UTF-8 -> UTF-16 для native path
    if (u8str.empty()) {
        return {};
    }
    int len =
        MultiByteToWideChar(CP_UTF8, 0, u8str.data(), static_cast<int>(u8str.size()), nullptr, 0);
    if (len <= 0) {
        return std::filesystem::path(u8str);
    }
    std::wstring wstr(static_cast<size_t>(len), L'\0');
    MultiByteToWideChar(CP_UTF8, 0, u8str.data(), static_cast<int>(u8str.size()), wstr.data(), len);
    return std::filesystem::path(wstr);
#else
    return std::filesystem::path(u8str);
#endif
}

std::string path_to_utf8(const std::filesystem::path& p) {
#ifdef _WIN32
    const std::wstring& wstr = p.native();
    if (wstr.empty()) {
        return {};
    }
    int len = WideCharToMultiByte(CP_UTF8, 0, wstr.data(), static_cast<int>(wstr.size()), nullptr,
                                  0, nullptr, nullptr);
    if (len <= 0) {
        return p.string();
    }
    std::string result(static_cast<size_t>(len), '\0');
    WideCharToMultiByte(CP_UTF8, 0, wstr.data(), static_cast<int>(wstr.size()), result.data(), len,
                        nullptr, nullptr);
    return result;
#else
    return p.string();
#endif
}

std::filesystem::path normalize(const std::filesystem::path& p) {
    std::error_code ec;
    std::filesystem::path abs = std::filesystem::absolute(p, ec);
    if (ec) {
        abs = p;
    }
    abs = abs.lexically_normal();

    // "/a/b/" -> "/a/b": завершающий разделитель даёт пустой filename
    std::string s = abs.string();
    while (s.size() > 1 && (s.back() == '/' || s.back() == '\\') && abs.has_relative_path()) {
        s.pop_back();
        abs = std::filesystem::path(s);
    }
    return abs;
}

// ----------------------------------------------------------------------------
// TTY detection
// ----------------------------------------------------------------------------

bool is_tty_stdout() {
#ifdef _WIN32
    return _isatty(_fileno(stdout)) != 0;
#else
    return isatty(fileno(stdout)) != 0;
#endif
}

bool is_tty_stderr() {
#ifdef _WIN32
    return _isatty(_fileno(stderr)) != 0;
#else
    return isatty(fileno(stderr)) != 0;
#endif
}

// ----------------------------------------------------------------------------
// Окружение
// ----------------------------------------------------------------------------

std::filesystem::path home_dir() {
#ifdef _WIN32
    const char* home = std::getenv("USERPROFILE");
#else
    const char* home = std::getenv("HOME");
#endif
    if (home == nullptr || home[0] == '\0') {
        throw std::runtime_error("Could not determine home directory");
    }
    return path_from_utf8(home);
}

bool can_read_directory(const std::filesystem::path& dir) {
#ifdef _WIN32
    std::error_code ec;
    std::filesystem::directory_iterator it(dir, ec);
    return !ec;
#else
    // R_OK - список имён, X_OK - обход (stat потомков)
    return ::access(dir.c_str(), R_OK | X_OK) == 0;
#endif
}

// ----------------------------------------------------------------------------
// Время и идентификаторы
// ----------------------------------------------------------------------------

std::int64_t unix_now() {
    return std::chrono::duration_cast<std::chrono::seconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

std::string generate_session_id() {
    static const char hex[] = "0123456789abcdef";
    std::random_device rd;
    std::mt19937_64 gen((static_cast<std::uint64_t>(rd()) << 32) ^ rd());
    std::uniform_int_distribution<int> dis(0, 15);

    std::string result;
    result.reserve(36);
    for (int i = 0; i < 32; ++i) {
        if (i == 8 || i == 12 || i == 16 || i == 20) {
            result += '-';
        }
        int nibble = dis(gen);
        if (i == 12) {
            nibble = 4;  // версия
        } else if (i == 16) {
            nibble = 8 | (nibble & 0x3);  // вариант RFC 4122
        }
        result += hex[nibble];
    }
    return result;
}

}  // namespace dds::platform
