// ==============================================================================
// discovery.cpp - Поиск rule-файлов рабочего дерева
// ==============================================================================

#include "lfstrack/discovery.hpp"

#include "lfstrack/platform.hpp"

#include <algorithm>
#include <stdexcept>
#include <system_error>

namespace lfstrack::io {

namespace {

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

/// Путь относительно корня с разделителями '/'; "" для самого корня
std::string tree_relative(const std::filesystem::path& path, const std::filesystem::path& root) {
    std::filesystem::path rel = path.lexically_relative(root);
    std::string result = platform::generic_utf8(rel);
    if (result == ".") {
        return {};
    }
    return result;
}

/// Рекурсивно обходит директорию и собирает rule-файлы (depth-first)
void collect_rule_files(const std::filesystem::path& dir, const std::filesystem::path& root,
                        std::size_t depth, std::vector<RuleFile>& result) {
    std::error_code ec;
    std::filesystem::directory_iterator dir_iter(dir, ec);
    if (ec) {
        throw std::runtime_error("failed to read directory " + platform::path_to_utf8(dir) +
                                 " - " + ec.message());
    }

    // Детерминированный порядок обхода
    std::vector<std::filesystem::path> entries;
    for (auto it = dir_iter; it != std::filesystem::directory_iterator();) {
        entries.push_back(it->path());
        it.increment(ec);
        if (ec) {
            break;
        }
    }
    if (ec) {
        throw std::runtime_error("failed to read directory " + platform::path_to_utf8(dir) +
                                 " - " + ec.message());
    }
    std::sort(entries.begin(), entries.end());

    for (const auto& entry : entries) {
        // symlink_status: ссылки не разыменовываем
        std::filesystem::file_status status = std::filesystem::symlink_status(entry, ec);
        if (ec) {
            throw std::runtime_error("failed to get metadata for " +
                                     platform::path_to_utf8(entry) + " - " + ec.message());
        }

        if (std::filesystem::is_directory(status)) {
            collect_rule_files(entry, root, depth + 1, result);
        } else if (std::filesystem::is_regular_file(status) &&
                   entry.filename() == RULE_FILE_NAME) {
            RuleFile file;
            file.path = entry;
            file.source = tree_relative(entry, root);
            file.scope = tree_relative(dir, root);
            file.depth = depth;
            result.push_back(std::move(file));
        }
    }
}

}  // namespace

// ----------------------------------------------------------------------------
// Публичный API
// ----------------------------------------------------------------------------

std::vector<RuleFile> locate_rule_files(const std::filesystem::path& work_tree,
                                        const std::filesystem::path& git_dir) {
    std::error_code ec;
    std::filesystem::file_status root_status = std::filesystem::status(work_tree, ec);
    if (ec || !std::filesystem::is_directory(root_status)) {
        throw std::runtime_error("working tree is not a readable directory - " +
                                 platform::path_to_utf8(work_tree));
    }

    std::vector<RuleFile> result;
    collect_rule_files(work_tree, work_tree, 0, result);

    // Более глубокие файлы первыми, при равной глубине - порядок обнаружения
    std::stable_sort(result.begin(), result.end(), [](const RuleFile& a, const RuleFile& b) {
        return a.depth > b.depth;
    });

    std::filesystem::path metadata = git_dir / METADATA_RULE_FILE;
    std::filesystem::file_status meta_status = std::filesystem::status(metadata, ec);
    if (!ec && std::filesystem::is_regular_file(meta_status)) {
        RuleFile file;
        file.path = metadata;
        file.source = tree_relative(metadata, work_tree);
        file.scope.clear();
        file.depth = 0;
        result.push_back(std::move(file));
    }

    return result;
}

}  // namespace lfstrack::io
