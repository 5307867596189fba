// ==============================================================================
// lfstrack/discovery.hpp - Поиск rule-файлов рабочего дерева
// ==============================================================================
//
// Назначение:
// - Рекурсивный обход рабочего дерева в поиске .gitattributes
// - Подключение <git-dir>/info/attributes
// - Упорядочивание по приоритету: более глубокие файлы первыми
// - Ошибка обхода фатальна (частичный результат занизил бы набор паттернов)
//
// ==============================================================================

#ifndef LFSTRACK_DISCOVERY_HPP
#define LFSTRACK_DISCOVERY_HPP

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace lfstrack::io {

/// Имя rule-файла в рабочем дереве
constexpr const char* RULE_FILE_NAME = ".gitattributes";

/// rule-файл внутри git-директории
constexpr const char* METADATA_RULE_FILE = "info/attributes";

// ----------------------------------------------------------------------------
// RuleFile
// ----------------------------------------------------------------------------

/// Найденный rule-файл
struct RuleFile {
    /// Путь к файлу (как получен при обходе)
    std::filesystem::path path;

    /// Путь относительно корня дерева, разделители '/'
    std::string source;

    /// Директория, относительно которой действуют паттерны файла ("" = корень)
    std::string scope;

    /// Глубина scope (число компонентов)
    std::size_t depth = 0;
};

// ----------------------------------------------------------------------------
// locate_rule_files
// ----------------------------------------------------------------------------

/// Найти все rule-файлы рабочего дерева.
///
/// @param work_tree Корень рабочего дерева
/// @param git_dir   git-директория (может лежать вне дерева)
/// @return Файлы обхода, отсортированные по глубине (глубже - раньше,
///         при равной глубине - в порядке обнаружения), затем
///         <git_dir>/info/attributes, если он существует и является
///         обычным файлом. Его паттерны действуют от корня дерева.
///
/// Дочерние элементы директории посещаются в отсортированном порядке.
/// Символические ссылки не разыменовываются.
///
/// @throws std::runtime_error при любой ошибке обхода
std::vector<RuleFile> locate_rule_files(const std::filesystem::path& work_tree,
                                        const std::filesystem::path& git_dir);

}  // namespace lfstrack::io

#endif  // LFSTRACK_DISCOVERY_HPP
