// ==============================================================================
// lfstrack/cli.hpp - CLI парсинг
// ==============================================================================
//
// Назначение:
// - Парсинг argv
// - Генерация --help / --version
// - Диагностические ошибки CLI (exit code 2)
// - Наложение флагов на значения из конфигурации
//
// ==============================================================================

#ifndef LFSTRACK_CLI_HPP
#define LFSTRACK_CLI_HPP

#include "lfstrack/config.hpp"
#include "lfstrack/track.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace lfstrack::cli {

// ----------------------------------------------------------------------------
// Команды
// ----------------------------------------------------------------------------

/// lfstrack [OPTIONS] [PATTERN]...
struct TrackCommand {
    std::vector<std::string> patterns;            // пусто = листинг
    bool verbose = false;                         // -v, --verbose
    bool quiet = false;                           // -q, --quiet
    bool dry_run = false;                         // -d, --dry-run
    std::optional<bool> lockable;                 // -l, --lockable / --not-lockable
    bool json = false;                            // -j, --json
    std::optional<std::filesystem::path> config;  // -c, --config
};

/// help - показать справку
struct HelpCommand {};

/// version - показать версию
struct VersionCommand {};

using Command = std::variant<TrackCommand, HelpCommand, VersionCommand>;

// ----------------------------------------------------------------------------
// Диагностика CLI
// ----------------------------------------------------------------------------

struct CliDiagnostic {
    int exit_code = 2;
    std::string stderr_message;
};

struct ParseResult {
    bool ok = false;
    Command command;
    CliDiagnostic diagnostic;
};

// ----------------------------------------------------------------------------
// API
// ----------------------------------------------------------------------------

/// Парсить аргументы командной строки
ParseResult parse(int argc, char** argv);

std::string render_help();

std::string render_version();

/// Итоговые настройки запуска: флаги CLI поверх конфигурации
struct ResolvedOptions {
    track::TrackOptions track;
    bool install_hooks = true;
    std::string git = "git";
};

ResolvedOptions resolve(const TrackCommand& cmd, const config::Config& cfg);

// ----------------------------------------------------------------------------
// Константы
// ----------------------------------------------------------------------------

constexpr const char* VERSION = "0.1.0";

constexpr const char* ABOUT = "View or add Git LFS paths to Git attributes";

}  // namespace lfstrack::cli

#endif  // LFSTRACK_CLI_HPP
