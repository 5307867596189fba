// ==============================================================================
// platform.cpp - Платформенные абстракции
// ==============================================================================
//
// std::filesystem::path + явные преобразования path <-> UTF-8.
// Вся платформенная специфика изолирована здесь.
//
// ==============================================================================

#include "lfstrack/platform.hpp"

#include <cerrno>
#include <cstdio>

#ifdef _WIN32
#include <io.h>
#define NOMINMAX
#include <windows.h>
#else
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#endif

namespace lfstrack::platform {

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
        // Fallback: просто используем как есть
        return std::filesystem::path(u8str);
    }
    std::wstring wstr(static_cast<size_t>(len), L'\0');
    MultiByteToWideChar(CP_UTF8, 0, u8str.data(), static_cast<int>(u8str.size()), wstr.data(), len);
    return std::filesystem::path(wstr);
#else
    // Unix: пути уже в UTF-8 (или native encoding)
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

std::string generic_utf8(const std::filesystem::path& p) {
#ifdef _WIN32
    std::string result = path_to_utf8(p);
    for (char& c : result) {
        if (c == '\\') {
            c = '/';
        }
    }
    return result;
#else
    return p.generic_string();
#endif
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
// Файловая система
// ----------------------------------------------------------------------------

bool touch_now(const std::filesystem::path& p, std::error_code& ec) {
    ec.clear();
#ifdef _WIN32
    // Windows: через std::filesystem доступен только mtime
    std::filesystem::last_write_time(p, std::filesystem::file_time_type::clock::now(), ec);
    return !ec;
#else
    // times == nullptr: atime и mtime = текущее время
    if (utimensat(AT_FDCWD, p.c_str(), nullptr, 0) != 0) {
        ec = std::error_code(errno, std::generic_category());
        return false;
    }
    return true;
#endif
}

std::filesystem::path current_directory() {
    return std::filesystem::current_path();
}

}  // namespace lfstrack::platform
