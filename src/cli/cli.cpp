// ==============================================================================
// cli.cpp - CLI парсинг
// ==============================================================================
//
// Собственный слой CLI: формат help/ошибок в стиле clap.
//
// ==============================================================================

#include "lfstrack/cli.hpp"

#include "lfstrack/platform.hpp"

#include <cstring>

namespace lfstrack::cli {

namespace {

bool str_eq(const char* a, const char* b) {
    return std::strcmp(a, b) == 0;
}

bool starts_with(const char* str, const char* prefix) {
    return std::strncmp(str, prefix, std::strlen(prefix)) == 0;
}

/// Ошибка парсинга: error + usage + hint
std::string render_usage_error(const std::string& error_msg) {
    return "error: " + error_msg +
           "\n\n"
           "Usage: lfstrack [OPTIONS] [PATTERN]...\n\n"
           "For more information, try '--help'.\n";
}

ParseResult usage_error(const std::string& error_msg) {
    ParseResult result;
    result.ok = false;
    result.command = HelpCommand{};
    result.diagnostic.exit_code = 2;
    result.diagnostic.stderr_message = render_usage_error(error_msg);
    return result;
}

}  // anonymous namespace

// ----------------------------------------------------------------------------
// render_version / render_help
// ----------------------------------------------------------------------------

std::string render_version() {
    return std::string("lfstrack ") + VERSION + "\n";
}

std::string render_help() {
    return std::string(ABOUT) +
           "\n"
           "\n"
           "Usage: lfstrack [OPTIONS] [PATTERN]...\n"
           "\n"
           "Arguments:\n"
           "  [PATTERN]...  File patterns to track; lists tracked patterns when omitted\n"
           "\n"
           "Options:\n"
           "  -v, --verbose        Log which files are being tracked and modified\n"
           "  -q, --quiet          Suppress progress and warning lines\n"
           "  -d, --dry-run        Preview results without touching matched files\n"
           "  -l, --lockable       Make pattern lockable, i.e. read-only unless locked\n"
           "      --not-lockable   Remove lockable attribute from pattern\n"
           "  -j, --json           List tracked patterns as JSON\n"
           "  -c, --config <PATH>  Read defaults from a YAML configuration file\n"
           "  -h, --help           Print help\n"
           "  -V, --version        Print version\n"
           "\n"
           "Examples:\n"
           "\n"
           "    Track Photoshop files and mark them lockable:\n"
           "        lfstrack --lockable '*.psd'\n"
           "\n"
           "    List tracked patterns:\n"
           "        lfstrack\n";
}

// ----------------------------------------------------------------------------
// parse
// ----------------------------------------------------------------------------

ParseResult parse(int argc, char** argv) {
    ParseResult result;
    TrackCommand cmd;
    bool want_lockable = false;
    bool want_not_lockable = false;
    bool options_done = false;

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];

        if (options_done || arg[0] != '-' || str_eq(arg, "-")) {
            // Пустой паттерн ничего не описывает
            if (arg[0] != '\0') {
                cmd.patterns.emplace_back(arg);
            }
            continue;
        }

        if (str_eq(arg, "--")) {
            options_done = true;
        } else if (str_eq(arg, "-h") || str_eq(arg, "--help")) {
            result.ok = true;
            result.command = HelpCommand{};
            return result;
        } else if (str_eq(arg, "-V") || str_eq(arg, "--version")) {
            result.ok = true;
            result.command = VersionCommand{};
            return result;
        } else if (str_eq(arg, "-v") || str_eq(arg, "--verbose")) {
            cmd.verbose = true;
        } else if (str_eq(arg, "-q") || str_eq(arg, "--quiet")) {
            cmd.quiet = true;
        } else if (str_eq(arg, "-d") || str_eq(arg, "--dry-run")) {
            cmd.dry_run = true;
        } else if (str_eq(arg, "-l") || str_eq(arg, "--lockable")) {
            want_lockable = true;
        } else if (str_eq(arg, "--not-lockable")) {
            want_not_lockable = true;
        } else if (str_eq(arg, "-j") || str_eq(arg, "--json")) {
            cmd.json = true;
        } else if (str_eq(arg, "-c") || str_eq(arg, "--config")) {
            // --config требует следующий аргумент
            if (i + 1 >= argc) {
                return usage_error("a value is required for '--config <PATH>' but none was "
                                   "supplied");
            }
            ++i;
            cmd.config = platform::path_from_utf8(argv[i]);
        } else if (starts_with(arg, "--config=")) {
            cmd.config = platform::path_from_utf8(arg + std::strlen("--config="));
        } else {
            return usage_error(std::string("unexpected argument '") + arg + "' found");
        }
    }

    if (want_lockable && want_not_lockable) {
        return usage_error("the argument '--lockable' cannot be used with '--not-lockable'");
    }
    // --json описывает только листинг
    if (cmd.json && !cmd.patterns.empty()) {
        return usage_error("the argument '--json' cannot be used with '[PATTERN]...'");
    }
    if (want_lockable) {
        cmd.lockable = true;
    } else if (want_not_lockable) {
        cmd.lockable = false;
    }

    result.ok = true;
    result.command = std::move(cmd);
    return result;
}

// ----------------------------------------------------------------------------
// resolve
// ----------------------------------------------------------------------------

ResolvedOptions resolve(const TrackCommand& cmd, const config::Config& cfg) {
    ResolvedOptions opts;
    opts.track.verbose = cmd.verbose || cfg.verbose.value_or(false);
    opts.track.dry_run = cmd.dry_run || cfg.dry_run.value_or(false);
    opts.track.lockable = cmd.lockable.has_value() ? *cmd.lockable : cfg.lockable.value_or(false);
    opts.install_hooks = cfg.install_hooks.value_or(true);
    opts.git = config::git_program(cfg);
    return opts;
}

}  // namespace lfstrack::cli
