// ==============================================================================
// index.cpp - Индекс уже объявленных паттернов
// ==============================================================================

#include "lfstrack/index.hpp"

#include <algorithm>
#include <fstream>
#include <string>

namespace lfstrack::index {

KnownPatterns build_index(const std::vector<io::RuleFile>& rule_files) {
    KnownPatterns known;

    for (const auto& file : rule_files) {
        std::ifstream in(file.path, std::ios::binary);
        if (!in) {
            // Недоступный файл не прерывает команду
            continue;
        }

        std::string line;
        while (std::getline(in, line)) {
            auto desc = pattern::parse_line(line);
            if (!desc) {
                continue;
            }
            desc->path = pattern::join_tree_path(file.scope, desc->path);
            desc->source = file.source;
            known.push_back(std::move(*desc));
        }
    }

    return known;
}

bool contains(const KnownPatterns& known, std::string_view path, bool lockable) {
    return std::any_of(known.begin(), known.end(), [&](const pattern::PatternDescriptor& d) {
        return d.path == path && d.lockable == lockable;
    });
}

}  // namespace lfstrack::index
