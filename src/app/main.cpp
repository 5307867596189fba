// ==============================================================================
// main.cpp - Точка входа приложения
// ==============================================================================
//
// 1. Парсинг argv
// 2. Создание Writer
// 3. Окружение: версия git, git-директория, рабочее дерево, конфигурация, хуки
// 4. Поиск rule-файлов и построение индекса
// 5. Листинг или согласование паттернов
//
// Исключения перехватываются на границе app.
//
// ==============================================================================

#include "lfstrack/cli.hpp"
#include "lfstrack/config.hpp"
#include "lfstrack/discovery.hpp"
#include "lfstrack/git.hpp"
#include "lfstrack/index.hpp"
#include "lfstrack/output.hpp"
#include "lfstrack/platform.hpp"
#include "lfstrack/track.hpp"

#include <exception>
#include <filesystem>
#include <iostream>
#include <string>
#include <type_traits>
#include <variant>

namespace {

/// Код выхода вне репозитория / рабочего дерева
constexpr int EXIT_ENVIRONMENT = 128;

/// Код выхода фатальной ошибки
constexpr int EXIT_FATAL = 2;

// ----------------------------------------------------------------------------
// Конфигурация
// ----------------------------------------------------------------------------

/// Загрузить конфигурацию, если файл существует (или задан явно)
bool load_config(const std::filesystem::path& path, bool required, lfstrack::config::Config& cfg,
                 lfstrack::output::Writer& writer) {
    std::error_code ec;
    if (!required && !std::filesystem::exists(path, ec)) {
        return true;
    }
    auto loaded = lfstrack::config::load(path);
    if (!loaded) {
        writer.error(loaded.error.format());
        return false;
    }
    cfg = loaded.config;
    writer.debug("Loaded configuration from " + lfstrack::platform::path_to_utf8(path));
    return true;
}

// ----------------------------------------------------------------------------
// track
// ----------------------------------------------------------------------------

int run_track(const lfstrack::cli::TrackCommand& cmd, lfstrack::output::Writer& writer) {
    using namespace lfstrack;

    std::filesystem::path cwd = platform::current_directory();

    // Явный файл читается до git: он может задать сам git
    config::Config cfg;
    auto explicit_config = config::explicit_path(cmd.config);
    if (explicit_config && !load_config(*explicit_config, true, cfg, writer)) {
        return EXIT_FATAL;
    }

    const std::string git_program = config::git_program(cfg);

    const std::string git_version = git::version(git_program, cwd);
    if (!git::version_at_least(git_version, git::MINIMUM_VERSION)) {
        writer.error(std::string("git version >= ") + git::MINIMUM_VERSION +
                     " is required, your version: " + git_version);
        return EXIT_FATAL;
    }

    auto git_dir = git::locate_git_dir(git_program, cwd);
    if (!git_dir) {
        writer.print("Not a git repository.");
        return EXIT_ENVIRONMENT;
    }

    auto work_tree = git::locate_work_tree(git_program, cwd);
    if (!work_tree) {
        writer.print("This operation must be run in a work tree.");
        return EXIT_ENVIRONMENT;
    }

    if (!explicit_config && !load_config(config::default_path(*git_dir), false, cfg, writer)) {
        return EXIT_FATAL;
    }

    const cli::ResolvedOptions opts = cli::resolve(cmd, cfg);

    if (opts.install_hooks) {
        git::HookResult hook = git::install_hooks(*git_dir, false);
        if (!hook.message.empty()) {
            writer.warn(hook.message);
        }
    }

    // Сравнение путей cwd и корня - по каноническим формам
    std::filesystem::path tree_root = std::filesystem::weakly_canonical(*work_tree);
    std::filesystem::path current = std::filesystem::weakly_canonical(cwd);

    auto rule_files = io::locate_rule_files(tree_root, *git_dir);
    writer.debug("Found " + std::to_string(rule_files.size()) + " attribute files");
    index::KnownPatterns known = index::build_index(rule_files);

    if (cmd.patterns.empty()) {
        if (cmd.json) {
            track::print_listing_json(writer, known);
        } else {
            track::print_listing(writer, known);
        }
        return 0;
    }

    git::GitRepository repo(opts.git, current);
    track::Tracker tracker(repo, writer, tree_root, current, opts.track);
    track::TrackResult result = tracker.track(cmd.patterns, known);

    if (!result.ok) {
        if (result.error) {
            writer.debug(*result.error);
        }
        return 1;
    }
    return 0;
}

// ----------------------------------------------------------------------------
// Главная функция выполнения (run)
// ----------------------------------------------------------------------------

int run(int argc, char** argv) {
    using namespace lfstrack;

    cli::ParseResult parse_result = cli::parse(argc, argv);

    output::OutputConfig out_cfg;
    if (auto* track_cmd = std::get_if<cli::TrackCommand>(&parse_result.command)) {
        out_cfg.verbose = track_cmd->verbose ? 1 : 0;
        out_cfg.quiet = track_cmd->quiet;
    }
    output::Writer writer(out_cfg);

    // Ошибка парсинга печатается без префикса [x]
    if (!parse_result.ok) {
        writer.write(output::Stream::Stderr, parse_result.diagnostic.stderr_message);
        return parse_result.diagnostic.exit_code;
    }

    return std::visit(
        [&](auto&& cmd) -> int {
            using T = std::decay_t<decltype(cmd)>;

            if constexpr (std::is_same_v<T, cli::HelpCommand>) {
                writer.write(output::Stream::Stdout, cli::render_help());
                return 0;
            } else if constexpr (std::is_same_v<T, cli::VersionCommand>) {
                writer.write(output::Stream::Stdout, cli::render_version());
                return 0;
            } else {
                return run_track(cmd, writer);
            }
        },
        parse_result.command);
}

}  // anonymous namespace

// ----------------------------------------------------------------------------
// main
// ----------------------------------------------------------------------------

int main(int argc, char** argv) {
    try {
        return run(argc, argv);
    } catch (const std::exception& e) {
        // Фатальные ошибки: обход дерева, git ls-files, запуск git
        std::cerr << "[x] " << e.what() << "\n";
        return EXIT_FATAL;
    }
}
