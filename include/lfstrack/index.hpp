// ==============================================================================
// lfstrack/index.hpp - Индекс уже объявленных паттернов
// ==============================================================================
//
// Назначение:
// - Сбор PatternDescriptor из всех rule-файлов в порядке приоритета
// - Проверка членства по ключу (path, lockable)
// - Поиск объявления с наивысшим приоритетом
//
// Индекс строится заново при каждом запуске и не дедуплицируется:
// одинаковые объявления из разных файлов присутствуют оба.
//
// ==============================================================================

#ifndef LFSTRACK_INDEX_HPP
#define LFSTRACK_INDEX_HPP

#include "lfstrack/discovery.hpp"
#include "lfstrack/pattern.hpp"

#include <string_view>
#include <vector>

namespace lfstrack::index {

using KnownPatterns = std::vector<pattern::PatternDescriptor>;

/// Построить индекс по списку rule-файлов (порядок файлов, затем порядок строк).
/// Файлы, которые не удалось открыть, пропускаются.
KnownPatterns build_index(const std::vector<io::RuleFile>& rule_files);

/// Есть ли объявление с указанными path и lockable
bool contains(const KnownPatterns& known, std::string_view path, bool lockable);

}  // namespace lfstrack::index

#endif  // LFSTRACK_INDEX_HPP
