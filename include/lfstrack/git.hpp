// ==============================================================================
// lfstrack/git.hpp - Взаимодействие с git
// ==============================================================================
//
// Назначение:
// - Запуск git как дочернего процесса с перехватом stdout/stderr
// - Проверка минимальной версии git
// - Поиск корня рабочего дерева и git-директории (git rev-parse)
// - Перечисление отслеживаемых файлов по паттерну (git ls-files)
// - Установка pre-push хука
//
// ==============================================================================

#ifndef LFSTRACK_GIT_HPP
#define LFSTRACK_GIT_HPP

#include "lfstrack/track.hpp"

#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace lfstrack::git {

// ----------------------------------------------------------------------------
// Запуск команд
// ----------------------------------------------------------------------------

/// Ошибка запуска или выполнения git
class Error : public std::runtime_error {
public:
    explicit Error(const std::string& message) : std::runtime_error(message) {}
};

struct CommandResult {
    int exit_code = -1;
    std::string out;
    std::string err;

    bool ok() const { return exit_code == 0; }
};

/// Выполнить program с аргументами в директории cwd.
/// @throws Error если процесс не удалось запустить
CommandResult run(const std::string& program, const std::vector<std::string>& args,
                  const std::filesystem::path& cwd);

// ----------------------------------------------------------------------------
// Окружение
// ----------------------------------------------------------------------------

/// Минимальная поддерживаемая версия git
constexpr const char* MINIMUM_VERSION = "1.8.2";

/// Версия из вывода "git version 2.39.2" ("2.39.2").
/// @throws Error если git не запустился или завершился с ошибкой
std::string version(const std::string& program, const std::filesystem::path& cwd);

/// Сравнение по числовым компонентам: "2.39.2.windows.1" >= "1.8.2".
/// Версия без числовых компонентов не удовлетворяет ни одному минимуму.
bool version_at_least(const std::string& actual, const std::string& minimum);

/// Корень рабочего дерева; nullopt вне рабочего дерева
std::optional<std::filesystem::path> locate_work_tree(const std::string& program,
                                                      const std::filesystem::path& cwd);

/// Абсолютный путь git-директории; nullopt вне репозитория
std::optional<std::filesystem::path> locate_git_dir(const std::string& program,
                                                    const std::filesystem::path& cwd);

// ----------------------------------------------------------------------------
// GitRepository
// ----------------------------------------------------------------------------

/// Перечисление отслеживаемых файлов через git ls-files в директории cwd
class GitRepository : public track::Repository {
public:
    GitRepository(std::string program, std::filesystem::path cwd);

    /// @throws Error при ненулевом коде выхода git
    std::vector<std::string> tracked_files(const std::string& pattern) override;

private:
    std::string program_;
    std::filesystem::path cwd_;
};

/// Убрать ведущие '/' (git ls-files их не понимает)
std::string sanitize_pattern(const std::string& pattern);

/// Разобрать вывод git ls-files. root_wildcard: оставить только файлы
/// без '/' (паттерн вида "/*.bin" действует только на корень)
std::vector<std::string> parse_ls_files(const std::string& output, bool root_wildcard);

// ----------------------------------------------------------------------------
// Хуки
// ----------------------------------------------------------------------------

/// Содержимое pre-push хука
extern const char* const PRE_PUSH_HOOK;

struct HookResult {
    bool installed = false;  // хук записан (или уже был актуален)
    bool conflict = false;   // существующий хук с другим содержимым не тронут
    std::filesystem::path path;
    std::string message;
};

/// Установить pre-push хук в <git_dir>/hooks. Идемпотентна.
/// Существующий хук с другим содержимым перезаписывается только при force.
HookResult install_hooks(const std::filesystem::path& git_dir, bool force = false);

}  // namespace lfstrack::git

#endif  // LFSTRACK_GIT_HPP
