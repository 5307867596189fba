// ==============================================================================
// lfstrack/platform.hpp - Платформенные абстракции
// ==============================================================================
//
// Назначение:
// - Явные преобразования path <-> UTF-8
// - Определение TTY для цветного вывода
// - Обновление временных меток файла (access + modification)
// - Текущая рабочая директория
//
// Платформенная специфика изолирована в platform.cpp.
//
// ==============================================================================

#ifndef LFSTRACK_PLATFORM_HPP
#define LFSTRACK_PLATFORM_HPP

#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

namespace lfstrack::platform {

// ----------------------------------------------------------------------------
// Преобразования путей
// ----------------------------------------------------------------------------

/// UTF-8 строка -> native path
std::filesystem::path path_from_utf8(std::string_view u8str);

/// native path -> UTF-8 строка
std::string path_to_utf8(const std::filesystem::path& p);

/// native path -> UTF-8 строка с разделителями '/'
std::string generic_utf8(const std::filesystem::path& p);

// ----------------------------------------------------------------------------
// TTY detection
// ----------------------------------------------------------------------------

bool is_tty_stdout();
bool is_tty_stderr();

// ----------------------------------------------------------------------------
// Файловая система
// ----------------------------------------------------------------------------

/// Установить atime и mtime файла в текущее время.
/// @return false и заполненный ec при ошибке
bool touch_now(const std::filesystem::path& p, std::error_code& ec);

/// Текущая директория процесса (абсолютный путь)
/// @throws std::filesystem::filesystem_error
std::filesystem::path current_directory();

}  // namespace lfstrack::platform

#endif  // LFSTRACK_PLATFORM_HPP
