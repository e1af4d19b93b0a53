// ==============================================================================
// reghive/output.hpp - Пользовательский вывод
// ==============================================================================
//
// Назначение:
// - Единственная точка записи в stdout/stderr
// - Сообщения с префиксами уровней ([+] [!] [x] [*] [~])
// - Цветной вывод (ANSI escape codes) на TTY
// - JSON вывод (RapidJSON)
// - Таблицы с box-drawing символами
// - Вывод в файл (-o/--output)
//
// Библиотека разбора сама ничего не печатает: всё, что она сообщает,
// идёт через диагностики и выводится здесь.
//
// ==============================================================================

#ifndef REGHIVE_OUTPUT_HPP
#define REGHIVE_OUTPUT_HPP

#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

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

namespace reghive::output {

enum class Stream { Stdout, Stderr };

enum class Format {
    Std,  // таблицы/текст
    Json  // один pretty JSON документ
};

enum class Color { Default, Green, Yellow, Red, Cyan, Magenta };

struct OutputConfig {
    bool quiet = false;  // -q: подавить [+] и [!]
    int verbose = 0;     // -v: [*], -vv: [~]
    Format format = Format::Std;
    std::optional<std::filesystem::path> output_path;  // -o
};

// ----------------------------------------------------------------------------
// Writer
// ----------------------------------------------------------------------------

class Writer {
public:
    explicit Writer(const OutputConfig& cfg);
    ~Writer();

    Writer(const Writer&) = delete;
    Writer& operator=(const Writer&) = delete;

    void write(Stream s, std::string_view bytes);
    void write_line(Stream s, std::string_view bytes);

    /// "[+] <message>" в stderr (кроме quiet)
    void info(std::string_view message);

    /// "[!] <message>" в stderr (кроме quiet)
    void warn(std::string_view message);

    /// "[x] <message>" в stderr (всегда)
    void error(std::string_view message);

    /// "[*] <message>" в stderr (verbose > 0)
    void debug(std::string_view message);

    /// "[~] <message>" в stderr (verbose > 1)
    void trace(std::string_view message);

    void write_json_pretty(const rapidjson::Value& value);

    void flush();

    const OutputConfig& config() const { return config_; }

    bool open_output_file();
    void close_output_file();
    bool has_output_file() const { return output_file_ != nullptr; }

private:
    void write_prefixed(std::string_view prefix, Color color, std::string_view message);
    FILE* get_file(Stream s) const;

    OutputConfig config_;
    FILE* output_file_ = nullptr;
};

// ----------------------------------------------------------------------------
// Table
// ----------------------------------------------------------------------------

class Table {
public:
    Table();

    void set_headers(const std::vector<std::string>& headers);
    void add_row(const std::vector<std::string>& cells);

    std::string to_string() const;

    size_t row_count() const { return rows_.size(); }

private:
    std::string format_line(char position) const;
    std::string format_row(const std::vector<std::string>& cells) const;
    void calculate_widths();

    std::vector<std::string> headers_;
    std::vector<std::vector<std::string>> rows_;
    std::vector<size_t> col_widths_;
    bool widths_calculated_ = false;
};

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

/// Привести поле к одной строке и обрезать до limit символов ("..." в конце)
std::string format_field_length(std::string_view field, size_t limit);

/// Байты в hex ("de ad be ef"), не больше limit байт
std::string format_hex(const std::vector<std::uint8_t>& bytes, size_t limit);

std::string ansi_color_code(Color color);

/// Поддерживает ли поток цвета (TTY)
bool supports_color(Stream s);

}  // namespace reghive::output

#endif  // REGHIVE_OUTPUT_HPP
