// ==============================================================================
// lfstrack/pattern.hpp - Кодек строк .gitattributes
// ==============================================================================
//
// Назначение:
// - Разбор строки rule-файла в PatternDescriptor
// - Формирование строки rule-файла из паттерна
// - Экранирование пробелов внутри паттерна
// - Лексическое соединение путей относительно корня рабочего дерева
//
// Формат распознаваемой строки:
//   <pattern> filter=lfs diff=lfs merge=lfs -text[ lockable]
//
// ==============================================================================

#ifndef LFSTRACK_PATTERN_HPP
#define LFSTRACK_PATTERN_HPP

#include <optional>
#include <string>
#include <string_view>

namespace lfstrack::pattern {

// ----------------------------------------------------------------------------
// Константы формата
// ----------------------------------------------------------------------------

/// Маркер, по которому строка считается LFS-правилом
constexpr const char* FILTER_MARKER = "filter=lfs";

/// Суффикс, добавляемый к каждой формируемой строке
constexpr const char* ATTRIBUTE_SUFFIX = " filter=lfs diff=lfs merge=lfs -text";

/// Вторичный атрибут
constexpr const char* LOCKABLE_ATTRIBUTE = "lockable";

/// Замена пробела внутри паттерна
constexpr const char* SPACE_ESCAPE = "[[:space:]]";

// ----------------------------------------------------------------------------
// PatternDescriptor
// ----------------------------------------------------------------------------

/// Одно объявленное правило
struct PatternDescriptor {
    std::string path;       // паттерн относительно корня дерева (пробелы раскодированы)
    std::string source;     // rule-файл, объявивший правило (относительно корня)
    bool lockable = false;  // атрибут lockable

    bool operator==(const PatternDescriptor& other) const {
        return path == other.path && source == other.source && lockable == other.lockable;
    }
};

// ----------------------------------------------------------------------------
// Кодек
// ----------------------------------------------------------------------------

/// Разобрать строку rule-файла.
///
/// @return nullopt, если строка не содержит FILTER_MARKER.
///         Иначе path = первое поле (раскодированное), lockable = наличие
///         токена lockable в любом месте строки. source не заполняется.
std::optional<PatternDescriptor> parse_line(std::string_view line);

/// Сформировать строку rule-файла (с завершающим '\n')
std::string render_line(std::string_view pattern, bool lockable);

/// Экранировать пробелы: ' ' -> "[[:space:]]"
std::string encode_pattern(std::string_view pattern);

/// Обратное преобразование: "[[:space:]]" -> ' '
std::string decode_pattern(std::string_view encoded);

/// Первое поле строки, разделённой пробельными символами ("" для пустой строки)
std::string_view first_field(std::string_view line);

// ----------------------------------------------------------------------------
// Пути
// ----------------------------------------------------------------------------

/// Лексически соединить директорию и паттерн с разделителем '/' и нормализовать.
///
/// dir == "" или "." означает корень дерева. Ведущий '/' паттерна не делает
/// его абсолютным: join_tree_path("sub", "/a") == "sub/a".
/// Нормализация: "." удаляется, "x/.." сворачивается, повторные и
/// завершающие '/' удаляются. Пустой результат -> ".".
std::string join_tree_path(std::string_view dir, std::string_view pattern);

}  // namespace lfstrack::pattern

#endif  // LFSTRACK_PATTERN_HPP
