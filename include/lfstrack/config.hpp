// ==============================================================================
// lfstrack/config.hpp - Конфигурация (YAML)
// ==============================================================================
//
// Назначение:
// - Загрузка необязательного YAML файла с настройками по умолчанию
// - Выбор файла: --config, $LFSTRACK_CONFIG, <git-dir>/lfstrack.yml
// - Наложение флагов командной строки поверх файла
//
// Пример:
//   verbose: true
//   lockable: false
//   dry_run: false
//   git: /usr/bin/git
//   install_hooks: true
//
// ==============================================================================

#ifndef LFSTRACK_CONFIG_HPP
#define LFSTRACK_CONFIG_HPP

#include <filesystem>
#include <optional>
#include <string>

namespace lfstrack::config {

/// Имя файла по умолчанию внутри git-директории
constexpr const char* DEFAULT_FILE_NAME = "lfstrack.yml";

/// Переменная окружения с путём к файлу
constexpr const char* CONFIG_ENV = "LFSTRACK_CONFIG";

/// Значения из файла; nullopt - ключ не задан
struct Config {
    std::optional<bool> verbose;
    std::optional<bool> dry_run;
    std::optional<bool> lockable;
    std::optional<bool> install_hooks;
    std::optional<std::string> git;
};

/// Ошибка загрузки конфигурации
struct Error {
    std::string message;
    std::string path;

    std::string format() const;
};

struct LoadResult {
    bool ok = false;
    Config config;
    Error error;

    explicit operator bool() const { return ok; }
};

/// Загрузить YAML файл. Отсутствующий файл - ошибка.
LoadResult load(const std::filesystem::path& path);

/// Разобрать YAML из строки (path используется только в сообщениях)
LoadResult parse(const std::string& text, const std::string& path = {});

/// Явно заданный файл: --config, затем $LFSTRACK_CONFIG
std::optional<std::filesystem::path> explicit_path(
    const std::optional<std::filesystem::path>& cli_path);

/// <git_dir>/lfstrack.yml
std::filesystem::path default_path(const std::filesystem::path& git_dir);

/// Имя исполняемого файла git (по умолчанию "git")
std::string git_program(const Config& cfg);

}  // namespace lfstrack::config

#endif  // LFSTRACK_CONFIG_HPP
