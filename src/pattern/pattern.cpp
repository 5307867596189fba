// ==============================================================================
// pattern.cpp - Кодек строк .gitattributes
// ==============================================================================

#include "lfstrack/pattern.hpp"

#include <cctype>
#include <vector>

namespace lfstrack::pattern {

namespace {

bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

/// Разбить строку на поля по пробельным символам
std::vector<std::string_view> split_fields(std::string_view line) {
    std::vector<std::string_view> fields;
    size_t i = 0;
    while (i < line.size()) {
        while (i < line.size() && is_space(line[i])) {
            ++i;
        }
        size_t start = i;
        while (i < line.size() && !is_space(line[i])) {
            ++i;
        }
        if (i > start) {
            fields.push_back(line.substr(start, i - start));
        }
    }
    return fields;
}

/// Заменить все вхождения from на to
std::string replace_all(std::string_view input, std::string_view from, std::string_view to) {
    std::string result;
    result.reserve(input.size());
    size_t pos = 0;
    while (pos < input.size()) {
        size_t found = input.find(from, pos);
        if (found == std::string_view::npos) {
            result.append(input.substr(pos));
            break;
        }
        result.append(input.substr(pos, found - pos));
        result.append(to);
        pos = found + from.size();
    }
    return result;
}

}  // namespace

// ----------------------------------------------------------------------------
// Кодек
// ----------------------------------------------------------------------------

std::optional<PatternDescriptor> parse_line(std::string_view line) {
    if (line.find(FILTER_MARKER) == std::string_view::npos) {
        return std::nullopt;
    }

    auto fields = split_fields(line);
    if (fields.empty()) {
        return std::nullopt;
    }

    PatternDescriptor desc;
    desc.path = decode_pattern(fields[0]);
    // Первое поле - сам паттерн, атрибут ищем среди остальных
    for (size_t i = 1; i < fields.size(); ++i) {
        if (fields[i] == LOCKABLE_ATTRIBUTE) {
            desc.lockable = true;
            break;
        }
    }
    return desc;
}

std::string render_line(std::string_view pattern, bool lockable) {
    std::string line = encode_pattern(pattern);
    line.append(ATTRIBUTE_SUFFIX);
    if (lockable) {
        line.push_back(' ');
        line.append(LOCKABLE_ATTRIBUTE);
    }
    line.push_back('\n');
    return line;
}

std::string encode_pattern(std::string_view pattern) {
    return replace_all(pattern, " ", SPACE_ESCAPE);
}

std::string decode_pattern(std::string_view encoded) {
    return replace_all(encoded, SPACE_ESCAPE, " ");
}

std::string_view first_field(std::string_view line) {
    size_t start = 0;
    while (start < line.size() && is_space(line[start])) {
        ++start;
    }
    size_t end = start;
    while (end < line.size() && !is_space(line[end])) {
        ++end;
    }
    return line.substr(start, end - start);
}

// ----------------------------------------------------------------------------
// Пути
// ----------------------------------------------------------------------------

std::string join_tree_path(std::string_view dir, std::string_view pattern) {
    std::vector<std::string_view> parts;

    auto push_segments = [&parts](std::string_view s) {
        size_t pos = 0;
        while (pos <= s.size()) {
            size_t next = s.find('/', pos);
            if (next == std::string_view::npos) {
                next = s.size();
            }
            std::string_view seg = s.substr(pos, next - pos);
            pos = next + 1;

            if (seg.empty() || seg == ".") {
                continue;
            }
            if (seg == "..") {
                // ".." в начале пути сохраняется
                if (!parts.empty() && parts.back() != "..") {
                    parts.pop_back();
                } else {
                    parts.push_back(seg);
                }
                continue;
            }
            parts.push_back(seg);
        }
    };

    push_segments(dir);
    push_segments(pattern);

    if (parts.empty()) {
        return ".";
    }

    std::string result;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) {
            result.push_back('/');
        }
        result.append(parts[i]);
    }
    return result;
}

}  // namespace lfstrack::pattern
