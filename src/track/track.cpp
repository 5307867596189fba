// ==============================================================================
// track.cpp - Согласование запрошенных паттернов с .gitattributes
// ==============================================================================

#include "lfstrack/track.hpp"

#include "lfstrack/platform.hpp"

#include <algorithm>
#include <fstream>
#include <rapidjson/document.h>
#include <sstream>
#include <system_error>

namespace lfstrack::track {

namespace {

bool starts_with(std::string_view s, std::string_view prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

}  // namespace

// ----------------------------------------------------------------------------
// Blocklist
// ----------------------------------------------------------------------------

std::optional<std::string> blocklist_item(std::string_view file_name) {
    while (file_name.size() > 1 && file_name.back() == '/') {
        file_name.remove_suffix(1);
    }

    // Базовое имя: проверка префикса
    size_t slash = file_name.rfind('/');
    std::string_view base =
        slash == std::string_view::npos ? file_name : file_name.substr(slash + 1);
    for (const char* prefix : PREFIX_BLOCKLIST) {
        if (starts_with(base, prefix)) {
            return std::string(prefix);
        }
    }
    if (slash == std::string_view::npos) {
        return std::nullopt;
    }

    // Директории: только точное совпадение (.github, .gitlab разрешены)
    std::string_view dirs = file_name.substr(0, slash);
    size_t pos = 0;
    while (pos <= dirs.size()) {
        size_t next = dirs.find('/', pos);
        if (next == std::string_view::npos) {
            next = dirs.size();
        }
        std::string_view component = dirs.substr(pos, next - pos);
        pos = next + 1;

        for (const char* prefix : PREFIX_BLOCKLIST) {
            if (component == prefix) {
                return std::string(prefix);
            }
        }
    }
    return std::nullopt;
}

// ----------------------------------------------------------------------------
// merge_rule_lines
// ----------------------------------------------------------------------------

MergeResult merge_rule_lines(std::string_view existing, std::vector<PendingLine> pending) {
    MergeResult result;
    result.content.reserve(existing.size());

    size_t pos = 0;
    while (pos < existing.size()) {
        size_t eol = existing.find('\n', pos);
        if (eol == std::string_view::npos) {
            eol = existing.size();
        }
        std::string_view line = existing.substr(pos, eol - pos);
        pos = eol + 1;

        std::string key = pattern::decode_pattern(pattern::first_field(line));
        auto it = std::find_if(pending.begin(), pending.end(),
                               [&key](const PendingLine& p) { return p.pattern == key; });
        if (!key.empty() && it != pending.end()) {
            // Замена на месте, запись потреблена
            result.content.append(it->line);
            pending.erase(it);
        } else {
            result.content.append(line);
            result.content.push_back('\n');
        }
    }

    result.appended = std::move(pending);
    return result;
}

// ----------------------------------------------------------------------------
// clean_root_path
// ----------------------------------------------------------------------------

std::string clean_root_path(std::string_view pattern, const std::filesystem::path& work_tree) {
    std::string root = platform::generic_utf8(work_tree);
    while (root.size() > 1 && root.back() == '/') {
        root.pop_back();
    }
    if (root.empty() || root == "/") {
        return std::string(pattern);
    }

    // Абсолютный путь внутри дерева -> паттерн от корня
    if (pattern == root) {
        return "/";
    }
    if (starts_with(pattern, root) && pattern.size() > root.size() &&
        pattern[root.size()] == '/') {
        return std::string(pattern.substr(root.size()));
    }
    return std::string(pattern);
}

// ----------------------------------------------------------------------------
// Tracker
// ----------------------------------------------------------------------------

Tracker::Tracker(Repository& repo, output::Writer& writer, std::filesystem::path work_tree,
                 std::filesystem::path cwd, TrackOptions options)
    : repo_(repo),
      writer_(writer),
      work_tree_(std::move(work_tree)),
      cwd_(std::move(cwd)),
      options_(options) {
    std::filesystem::path rel = cwd_.lexically_relative(work_tree_);
    std::string rel_str = platform::generic_utf8(rel);
    if (rel.empty() || rel_str == ".." || starts_with(rel_str, "../")) {
        throw Error("Current directory \"" + platform::path_to_utf8(cwd_) +
                    "\" outside of git working directory \"" +
                    platform::path_to_utf8(work_tree_) + "\".");
    }
    relative_cwd_ = rel_str;
}

std::filesystem::path Tracker::rule_file() const {
    return cwd_ / io::RULE_FILE_NAME;
}

TrackResult Tracker::track(const std::vector<std::string>& patterns,
                           const index::KnownPatterns& known) const {
    TrackResult result;
    std::vector<PendingLine> pending;

    for (const auto& requested : patterns) {
        std::string pattern = clean_root_path(requested, work_tree_);

        std::string tree_path = pattern::join_tree_path(relative_cwd_, pattern);
        if (index::contains(known, tree_path, options_.lockable)) {
            writer_.print(pattern + " already supported");
            result.already_supported.push_back(pattern);
            continue;
        }

        bool repeated = std::any_of(pending.begin(), pending.end(),
                                    [&pattern](const PendingLine& p) { return p.pattern == pattern; });
        if (repeated) {
            // Строка уже в pending, сообщение печатается на каждый аргумент
            writer_.print("Tracking " + pattern);
            continue;
        }

        pending.push_back(PendingLine{pattern, pattern::render_line(pattern, options_.lockable)});
        result.tracking.push_back(pattern);
        writer_.print("Tracking " + pattern);
    }

    // Нечего менять: файл остаётся байт-в-байт
    if (pending.empty()) {
        return result;
    }

    const std::filesystem::path path = rule_file();

    // Отсутствие файла - не ошибка
    std::string existing;
    std::error_code ec;
    bool exists = std::filesystem::exists(path, ec);
    if (ec) {
        writer_.print("Error reading .gitattributes file");
        result.ok = false;
        result.error = "failed to check " + platform::path_to_utf8(path) + " - " + ec.message();
        return result;
    }
    if (exists) {
        std::ifstream in(path, std::ios::binary);
        std::ostringstream buffer;
        if (in) {
            buffer << in.rdbuf();
        }
        if (!in || in.bad()) {
            writer_.print("Error reading .gitattributes file");
            result.ok = false;
            result.error = "failed to read " + platform::path_to_utf8(path);
            return result;
        }
        existing = buffer.str();
    }

    MergeResult merged = merge_rule_lines(existing, std::move(pending));

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        writer_.print("Error opening .gitattributes file");
        result.ok = false;
        result.error = "failed to open " + platform::path_to_utf8(path) + " for writing";
        return result;
    }
    out << merged.content;
    for (const auto& entry : merged.appended) {
        out << entry.line;
    }
    out.flush();
    if (!out) {
        writer_.print("Error writing .gitattributes file");
        result.ok = false;
        result.error = "failed to write " + platform::path_to_utf8(path);
        return result;
    }
    out.close();

    // Поиск отслеживаемых файлов - только для дописанных паттернов
    for (const auto& entry : merged.appended) {
        result.appended.push_back(entry.pattern);
        reconcile_tracked_files(entry.pattern, result);
    }

    return result;
}

void Tracker::reconcile_tracked_files(const std::string& pattern, TrackResult& result) const {
    if (options_.verbose) {
        writer_.print("Searching for files matching pattern: " + pattern);
    }

    std::vector<std::string> files;
    try {
        files = repo_.tracked_files(pattern);
    } catch (const std::exception& e) {
        throw Error("Error getting tracked files for \"" + pattern + "\": " + e.what());
    }

    if (options_.verbose) {
        writer_.print("Found " + std::to_string(files.size()) +
                      " files previously added to Git matching pattern: " + pattern);
    }

    // Один запрещённый файл отменяет touch для всех файлов паттерна
    bool matched_blocklist = false;
    for (const auto& file : files) {
        if (auto forbidden = blocklist_item(file)) {
            writer_.print("Pattern " + pattern + " matches forbidden file " + file +
                          ". If you would like to track " + file +
                          ", modify .gitattributes manually.");
            result.conflicts.push_back(Conflict{pattern, file, *forbidden});
            matched_blocklist = true;
        }
    }
    if (matched_blocklist) {
        return;
    }

    for (const auto& file : files) {
        if (options_.verbose || options_.dry_run) {
            writer_.print("Git LFS: touching " + file);
        }
        result.touched.push_back(file);

        if (options_.dry_run) {
            continue;
        }

        std::error_code ec;
        if (!platform::touch_now(cwd_ / platform::path_from_utf8(file), ec)) {
            writer_.error("Error marking \"" + file + "\" modified: " + ec.message());
            result.touch_errors.push_back(TouchError{file, ec.message()});
        }
    }
}

// ----------------------------------------------------------------------------
// Листинг
// ----------------------------------------------------------------------------

void print_listing(output::Writer& writer, const index::KnownPatterns& known) {
    writer.print("Listing tracked paths");
    for (const auto& entry : known) {
        if (entry.lockable) {
            writer.print("    " + entry.path + " [lockable] (" + entry.source + ")");
        } else {
            writer.print("    " + entry.path + " (" + entry.source + ")");
        }
    }
}

void print_listing_json(output::Writer& writer, const index::KnownPatterns& known) {
    rapidjson::Document doc;
    doc.SetObject();
    auto& alloc = doc.GetAllocator();

    rapidjson::Value patterns(rapidjson::kArrayType);
    for (const auto& entry : known) {
        rapidjson::Value path_value(entry.path.c_str(), alloc);
        rapidjson::Value source_value(entry.source.c_str(), alloc);

        rapidjson::Value item(rapidjson::kObjectType);
        item.AddMember("pattern", path_value, alloc);
        item.AddMember("source", source_value, alloc);
        item.AddMember("lockable", entry.lockable, alloc);
        patterns.PushBack(item, alloc);
    }
    doc.AddMember("patterns", patterns, alloc);

    writer.write_json_line(doc);
}

}  // namespace lfstrack::track
