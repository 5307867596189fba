// ==============================================================================
// lfstrack/output.hpp - Пользовательский вывод
// ==============================================================================
//
// Назначение:
// - Единственная точка записи в stdout/stderr
// - Простые текстовые строки прогресса и конфликтов
// - Диагностика с префиксами ([x], [!], [*])
// - JSON вывод (RapidJSON)
// - Вывод stdout в файл (используется тестами для перехвата)
//
// ==============================================================================

#ifndef LFSTRACK_OUTPUT_HPP
#define LFSTRACK_OUTPUT_HPP

#include <cstdio>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

// Forward declarations для JSON
namespace rapidjson {
class CrtAllocator;
template <typename BaseAllocator>
class MemoryPoolAllocator;
template <typename Encoding, typename Allocator>
class GenericValue;
template <typename CharType>
struct UTF8;
using Value = GenericValue<UTF8<char>, MemoryPoolAllocator<CrtAllocator>>;
}  // namespace rapidjson

namespace lfstrack::output {

// ----------------------------------------------------------------------------
// Потоки вывода
// ----------------------------------------------------------------------------

enum class Stream { Stdout, Stderr };

// ----------------------------------------------------------------------------
// ANSI цвета для терминала
// ----------------------------------------------------------------------------

enum class Color {
    Default,
    Yellow,  // Предупреждения
    Red,     // Ошибки
    Cyan     // Отладка
};

// ----------------------------------------------------------------------------
// Конфигурация вывода
// ----------------------------------------------------------------------------

struct OutputConfig {
    bool quiet = false;  // подавить print/warn
    int verbose = 0;     // уровень подробности (debug при > 0)

    // Путь для stdout (если задан, stdout пишется в файл)
    std::optional<std::filesystem::path> output_path;
};

// ----------------------------------------------------------------------------
// Writer - единый слой вывода
// ----------------------------------------------------------------------------

class Writer {
public:
    explicit Writer(const OutputConfig& cfg);
    ~Writer();

    Writer(const Writer&) = delete;
    Writer& operator=(const Writer&) = delete;

    /// Записать байты в поток
    void write(Stream s, std::string_view bytes);

    /// Записать строку с переводом строки
    void write_line(Stream s, std::string_view bytes);

    /// Простая строка в stdout без префикса (если не quiet)
    void print(std::string_view message);

    /// Предупреждение в stderr: "[!] <message>" (если не quiet)
    void warn(std::string_view message);

    /// Ошибка в stderr: "[x] <message>" (всегда)
    void error(std::string_view message);

    /// Отладка в stderr: "[*] <message>" (только при verbose > 0)
    void debug(std::string_view message);

    /// Записать компактный JSON + newline в stdout
    void write_json_line(const rapidjson::Value& value);

    void flush();

    const OutputConfig& config() const { return config_; }

    bool has_output_file() const { return output_file_ != nullptr; }

private:
    bool open_output_file();
    void close_output_file();

    void write_impl(Stream s, std::string_view bytes);
    void write_prefixed(Stream s, std::string_view prefix, Color color, std::string_view message);
    FILE* get_file(Stream s) const;

    OutputConfig config_;
    FILE* output_file_ = nullptr;
};

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

std::string ansi_color_code(Color color);

/// Поддерживает ли поток цвета (TTY)
bool supports_color(Stream s);

}  // namespace lfstrack::output

#endif  // LFSTRACK_OUTPUT_HPP
