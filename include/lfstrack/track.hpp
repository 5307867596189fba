// ==============================================================================
// lfstrack/track.hpp - Согласование запрошенных паттернов с .gitattributes
// ==============================================================================
//
// Назначение:
// - Фильтрация уже объявленных паттернов по ключу (path, lockable)
// - Слияние изменённых/новых строк в основной rule-файл с сохранением
//   порядка и содержимого остальных строк
// - Для новых паттернов: поиск отслеживаемых файлов, проверка blocklist,
//   обновление временных меток (кроме dry-run)
// - Листинг индекса (текст или JSON)
//
// Ошибки:
// - Error (std::runtime_error) - фатальные: ошибка git ls-files, cwd вне дерева
// - ввод-вывод rule-файла, конфликты blocklist, ошибки touch - в TrackResult
//
// ==============================================================================

#ifndef LFSTRACK_TRACK_HPP
#define LFSTRACK_TRACK_HPP

#include "lfstrack/index.hpp"
#include "lfstrack/output.hpp"

#include <array>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace lfstrack::track {

// ----------------------------------------------------------------------------
// Blocklist
// ----------------------------------------------------------------------------

/// Запрещённые префиксы имён (служебные директории git и git-lfs)
constexpr std::array<const char*, 2> PREFIX_BLOCKLIST = {".git", ".lfs"};

/// Префикс blocklist, запрещающий файл, или nullopt.
/// Базовое имя проверяется по префиксу, директории пути - на точное
/// совпадение (".git/info/x" запрещён, ".github/x" нет).
std::optional<std::string> blocklist_item(std::string_view file_name);

// ----------------------------------------------------------------------------
// Error
// ----------------------------------------------------------------------------

/// Фатальная ошибка согласования
class Error : public std::runtime_error {
public:
    explicit Error(const std::string& message) : std::runtime_error(message) {}
};

// ----------------------------------------------------------------------------
// Repository - внешний источник отслеживаемых файлов
// ----------------------------------------------------------------------------

class Repository {
public:
    virtual ~Repository() = default;

    /// Отслеживаемые файлы, соответствующие паттерну. Пути относительно
    /// текущей директории.
    /// @throws std::runtime_error при ошибке перечисления
    virtual std::vector<std::string> tracked_files(const std::string& pattern) = 0;
};

// ----------------------------------------------------------------------------
// Слияние строк rule-файла
// ----------------------------------------------------------------------------

/// Ожидающая запись: сырой паттерн -> готовая строка
struct PendingLine {
    std::string pattern;  // ключ (без экранирования)
    std::string line;     // render_line(...), заканчивается '\n'
};

struct MergeResult {
    std::string content;               // новое содержимое файла (без хвоста)
    std::vector<PendingLine> appended;  // не нашедшие строки в файле, в исходном порядке
};

/// Свёртка существующего содержимого с набором ожидающих строк.
///
/// Строка, чьё первое поле (раскодированное) совпадает с ключом, заменяется
/// на месте, ключ потребляется. Остальные строки сохраняются как есть с
/// ровно одним '\n'. Непотреблённые записи возвращаются в appended и
/// должны быть дописаны в конец.
MergeResult merge_rule_lines(std::string_view existing, std::vector<PendingLine> pending);

// ----------------------------------------------------------------------------
// Опции и результат
// ----------------------------------------------------------------------------

struct TrackOptions {
    bool lockable = false;  // объявлять паттерны с атрибутом lockable
    bool dry_run = false;   // не менять временные метки файлов
    bool verbose = false;   // подробные сообщения о поиске и touch
};

/// Файл, попавший под blocklist
struct Conflict {
    std::string pattern;
    std::string file;
    std::string prefix;
};

/// Ошибка обновления временной метки
struct TouchError {
    std::string file;
    std::string message;
};

struct TrackResult {
    /// false - ошибка чтения/записи rule-файла
    bool ok = true;
    std::optional<std::string> error;

    std::vector<std::string> already_supported;
    std::vector<std::string> tracking;  // новые или изменённые паттерны
    std::vector<std::string> appended;  // дописанные в конец файла
    std::vector<Conflict> conflicts;
    std::vector<std::string> touched;  // файлы, попавшие в шаг touch
    std::vector<TouchError> touch_errors;
};

// ----------------------------------------------------------------------------
// Tracker
// ----------------------------------------------------------------------------

class Tracker {
public:
    /// @param work_tree Корень рабочего дерева (абсолютный)
    /// @param cwd       Текущая директория (абсолютная, внутри дерева);
    ///                  в ней находится основной rule-файл
    /// @throws Error если cwd вне рабочего дерева
    Tracker(Repository& repo, output::Writer& writer, std::filesystem::path work_tree,
            std::filesystem::path cwd, TrackOptions options);

    /// Согласовать запрошенные паттерны с индексом и основным rule-файлом.
    /// @throws Error при ошибке перечисления отслеживаемых файлов
    TrackResult track(const std::vector<std::string>& patterns,
                      const index::KnownPatterns& known) const;

    /// Путь основного rule-файла
    std::filesystem::path rule_file() const;

    /// cwd относительно корня ("." для корня)
    const std::string& relative_cwd() const { return relative_cwd_; }

private:
    void reconcile_tracked_files(const std::string& pattern, TrackResult& result) const;

    Repository& repo_;
    output::Writer& writer_;
    std::filesystem::path work_tree_;
    std::filesystem::path cwd_;
    std::string relative_cwd_;
    TrackOptions options_;
};

/// Привести аргумент к виду относительно корня: абсолютный путь внутри
/// дерева -> "/<путь от корня>". Прочее без изменений.
std::string clean_root_path(std::string_view pattern, const std::filesystem::path& work_tree);

// ----------------------------------------------------------------------------
// Листинг
// ----------------------------------------------------------------------------

/// "Listing tracked paths" + по строке на запись индекса
void print_listing(output::Writer& writer, const index::KnownPatterns& known);

/// {"patterns":[{"pattern":..,"source":..,"lockable":..}]}
void print_listing_json(output::Writer& writer, const index::KnownPatterns& known);

}  // namespace lfstrack::track

#endif  // LFSTRACK_TRACK_HPP
