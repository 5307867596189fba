// ==============================================================================
// config.cpp - Конфигурация (YAML)
// ==============================================================================

#include "lfstrack/config.hpp"

#include "lfstrack/platform.hpp"

#include <cstdlib>
#include <sstream>
#include <stdexcept>
#include <yaml-cpp/yaml.h>

namespace lfstrack::config {

namespace {

std::optional<bool> read_bool(const YAML::Node& root, const char* key) {
    const YAML::Node node = root[key];
    if (!node || node.IsNull()) {
        return std::nullopt;
    }
    if (!node.IsScalar()) {
        throw std::invalid_argument(std::string("'") + key + "' must be a boolean");
    }
    try {
        return node.as<bool>();
    } catch (const YAML::BadConversion&) {
        throw std::invalid_argument(std::string("'") + key + "' must be a boolean");
    }
}

std::optional<std::string> read_string(const YAML::Node& root, const char* key) {
    const YAML::Node node = root[key];
    if (!node || node.IsNull()) {
        return std::nullopt;
    }
    if (!node.IsScalar()) {
        throw std::invalid_argument(std::string("'") + key + "' must be a string");
    }
    std::string value = node.as<std::string>();
    if (value.empty()) {
        throw std::invalid_argument(std::string("'") + key + "' must not be empty");
    }
    return value;
}

Config parse_config(const YAML::Node& root) {
    Config cfg;
    // Пустой документ - конфигурация без значений
    if (!root || root.IsNull()) {
        return cfg;
    }
    if (!root.IsMap()) {
        throw std::invalid_argument("configuration must be a mapping");
    }

    cfg.verbose = read_bool(root, "verbose");
    cfg.dry_run = read_bool(root, "dry_run");
    cfg.lockable = read_bool(root, "lockable");
    cfg.install_hooks = read_bool(root, "install_hooks");
    cfg.git = read_string(root, "git");
    return cfg;
}

}  // namespace

// ============================================================================
// Error formatting
// ============================================================================

std::string Error::format() const {
    std::ostringstream oss;
    oss << "config error";
    if (!path.empty()) {
        oss << " [" << path << "]";
    }
    oss << ": " << message;
    return oss.str();
}

// ============================================================================
// Загрузка
// ============================================================================

LoadResult load(const std::filesystem::path& path) {
    LoadResult result;
    const std::string path_str = platform::path_to_utf8(path);

    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        result.error = Error{"file does not exist", path_str};
        return result;
    }

    try {
        result.config = parse_config(YAML::LoadFile(path_str));
        result.ok = true;
    } catch (const YAML::Exception& e) {
        result.error = Error{e.what(), path_str};
    } catch (const std::invalid_argument& e) {
        result.error = Error{e.what(), path_str};
    }
    return result;
}

LoadResult parse(const std::string& text, const std::string& path) {
    LoadResult result;
    try {
        result.config = parse_config(YAML::Load(text));
        result.ok = true;
    } catch (const YAML::Exception& e) {
        result.error = Error{e.what(), path};
    } catch (const std::invalid_argument& e) {
        result.error = Error{e.what(), path};
    }
    return result;
}

std::optional<std::filesystem::path> explicit_path(
    const std::optional<std::filesystem::path>& cli_path) {
    if (cli_path.has_value()) {
        return cli_path;
    }
    const char* env = std::getenv(CONFIG_ENV);
    if (env != nullptr && env[0] != '\0') {
        return platform::path_from_utf8(env);
    }
    return std::nullopt;
}

std::filesystem::path default_path(const std::filesystem::path& git_dir) {
    return git_dir / DEFAULT_FILE_NAME;
}

std::string git_program(const Config& cfg) {
    return cfg.git.value_or("git");
}

}  // namespace lfstrack::config
