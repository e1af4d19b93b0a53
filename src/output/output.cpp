// ==============================================================================
// output.cpp - Пользовательский вывод
// ==============================================================================
//
// Байты первичны: без std::endl и iostream, только fwrite.
//
// ==============================================================================

#include "reghive/output.hpp"

#include "reghive/platform.hpp"

#include <algorithm>
#include <cstdint>
#include <cstdio>
#include <rapidjson/document.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>

namespace reghive::output {

namespace {

constexpr const char* ANSI_RESET = "\x1b[0m";
constexpr const char* ANSI_GREEN = "\x1b[32m";
constexpr const char* ANSI_YELLOW = "\x1b[33m";
constexpr const char* ANSI_RED = "\x1b[31m";
constexpr const char* ANSI_CYAN = "\x1b[36m";
constexpr const char* ANSI_MAGENTA = "\x1b[35m";

// UTF-8 box-drawing
constexpr const char* BOX_V = "\xe2\x94\x82";      // │
constexpr const char* BOX_H = "\xe2\x94\x80";      // ─
constexpr const char* BOX_TL = "\xe2\x94\x8c";     // ┌
constexpr const char* BOX_TR = "\xe2\x94\x90";     // ┐
constexpr const char* BOX_BL = "\xe2\x94\x94";     // └
constexpr const char* BOX_BR = "\xe2\x94\x98";     // ┘
constexpr const char* BOX_LT = "\xe2\x94\x9c";     // ├
constexpr const char* BOX_RT = "\xe2\x94\xa4";     // ┤
constexpr const char* BOX_TT = "\xe2\x94\xac";     // ┬
constexpr const char* BOX_BT = "\xe2\x94\xb4";     // ┴
constexpr const char* BOX_CROSS = "\xe2\x94\xbc";  // ┼

/// Количество кодовых точек UTF-8 (ширина столбца таблицы)
size_t display_width(std::string_view text) {
    size_t width = 0;
    for (char c : text) {
        if ((static_cast<unsigned char>(c) & 0xC0) != 0x80) {
            ++width;
        }
    }
    return width;
}

}  // namespace

// ----------------------------------------------------------------------------
// Writer
// ----------------------------------------------------------------------------

Writer::Writer(const OutputConfig& cfg) : config_(cfg) {
    if (config_.output_path.has_value()) {
        open_output_file();
    }
}

Writer::~Writer() {
    close_output_file();
    flush();
}

void Writer::write(Stream s, std::string_view bytes) {
    FILE* f = (s == Stream::Stdout && output_file_ != nullptr) ? output_file_ : get_file(s);
    if (f != nullptr) {
        std::fwrite(bytes.data(), 1, bytes.size(), f);
    }
}

void Writer::write_line(Stream s, std::string_view bytes) {
    write(s, bytes);
    write(s, "\n");
}

FILE* Writer::get_file(Stream s) const {
    return (s == Stream::Stdout) ? stdout : stderr;
}

void Writer::write_prefixed(std::string_view prefix, Color color, std::string_view message) {
    if (supports_color(Stream::Stderr)) {
        write(Stream::Stderr, ansi_color_code(color));
        write(Stream::Stderr, prefix);
        write(Stream::Stderr, ANSI_RESET);
    } else {
        write(Stream::Stderr, prefix);
    }
    write_line(Stream::Stderr, message);
}

void Writer::info(std::string_view message) {
    if (config_.quiet) {
        return;
    }
    write_prefixed("[+] ", Color::Green, message);
}

void Writer::warn(std::string_view message) {
    if (config_.quiet) {
        return;
    }
    write_prefixed("[!] ", Color::Yellow, message);
}

void Writer::error(std::string_view message) {
    // Ошибки печатаются и при --quiet
    write_prefixed("[x] ", Color::Red, message);
}

void Writer::debug(std::string_view message) {
    if (config_.verbose <= 0) {
        return;
    }
    write_prefixed("[*] ", Color::Cyan, message);
}

void Writer::trace(std::string_view message) {
    if (config_.verbose <= 1) {
        return;
    }
    write_prefixed("[~] ", Color::Magenta, message);
}

void Writer::write_json_pretty(const rapidjson::Value& value) {
    rapidjson::StringBuffer buffer;
    rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
    writer.SetIndent(' ', 2);
    value.Accept(writer);

    write(Stream::Stdout, std::string_view(buffer.GetString(), buffer.GetSize()));
    write(Stream::Stdout, "\n");
    flush();
}

void Writer::flush() {
    std::fflush(stdout);
    std::fflush(stderr);
    if (output_file_ != nullptr) {
        std::fflush(output_file_);
    }
}

bool Writer::open_output_file() {
    if (!config_.output_path.has_value()) {
        return false;
    }
    const auto& path = config_.output_path.value();

#ifdef _WIN32
    output_file_ = _wfopen(path.c_str(), L"wb");
#else
    output_file_ = std::fopen(platform::path_to_utf8(path).c_str(), "wb");
#endif

    return output_file_ != nullptr;
}

void Writer::close_output_file() {
    if (output_file_ != nullptr) {
        std::fflush(output_file_);
        std::fclose(output_file_);
        output_file_ = nullptr;
    }
}

// ----------------------------------------------------------------------------
// Table
// ----------------------------------------------------------------------------

Table::Table() = default;

void Table::set_headers(const std::vector<std::string>& headers) {
    headers_ = headers;
    widths_calculated_ = false;
}

void Table::add_row(const std::vector<std::string>& cells) {
    rows_.push_back(cells);
    widths_calculated_ = false;
}

void Table::calculate_widths() {
    if (widths_calculated_) {
        return;
    }

    size_t num_cols = headers_.size();
    for (const auto& row : rows_) {
        num_cols = std::max(num_cols, row.size());
    }
    if (col_widths_.size() < num_cols) {
        col_widths_.resize(num_cols, 0);
    }

    for (size_t i = 0; i < headers_.size(); ++i) {
        col_widths_[i] = std::max(col_widths_[i], display_width(headers_[i]));
    }
    for (const auto& row : rows_) {
        for (size_t i = 0; i < row.size(); ++i) {
            col_widths_[i] = std::max(col_widths_[i], display_width(row[i]));
        }
    }

    widths_calculated_ = true;
}

std::string Table::format_line(char position) const {
    const char* left = position == 'T' ? BOX_TL : (position == 'M' ? BOX_LT : BOX_BL);
    const char* middle = position == 'T' ? BOX_TT : (position == 'M' ? BOX_CROSS : BOX_BT);
    const char* right = position == 'T' ? BOX_TR : (position == 'M' ? BOX_RT : BOX_BR);

    std::string line = left;
    for (size_t i = 0; i < col_widths_.size(); ++i) {
        for (size_t j = 0; j < col_widths_[i] + 2; ++j) {
            line += BOX_H;
        }
        if (i + 1 < col_widths_.size()) {
            line += middle;
        }
    }
    line += right;
    return line;
}

std::string Table::format_row(const std::vector<std::string>& cells) const {
    std::string line = BOX_V;

    for (size_t i = 0; i < col_widths_.size(); ++i) {
        const std::string cell = (i < cells.size()) ? cells[i] : "";
        line += ' ';
        line += cell;
        size_t width = display_width(cell);
        if (width < col_widths_[i]) {
            line.append(col_widths_[i] - width, ' ');
        }
        line += ' ';
        line += BOX_V;
    }

    return line;
}

std::string Table::to_string() const {
    const_cast<Table*>(this)->calculate_widths();

    std::string result = format_line('T');
    result += '\n';

    if (!headers_.empty()) {
        result += format_row(headers_);
        result += '\n';
        result += format_line('M');
        result += '\n';
    }

    for (const auto& row : rows_) {
        result += format_row(row);
        result += '\n';
    }

    result += format_line('B');
    result += '\n';
    return result;
}

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

std::string format_field_length(std::string_view field, size_t limit) {
    std::string result;
    result.reserve(field.size());

    bool prev_space = false;
    for (char c : field) {
        if (c == '\n' || c == '\r' || c == '\t' || c == ' ') {
            if (!prev_space) {
                result += ' ';
                prev_space = true;
            }
            continue;
        }
        result += c;
        prev_space = false;
    }

    if (limit > 0 && result.size() > limit) {
        // Не резать посреди UTF-8 последовательности
        size_t cut = limit;
        while (cut > 0 && (static_cast<unsigned char>(result[cut]) & 0xC0) == 0x80) {
            --cut;
        }
        result.resize(cut);
        result += "...";
    }
    return result;
}

std::string format_hex(const std::vector<std::uint8_t>& bytes, size_t limit) {
    static const char digits[] = "0123456789abcdef";

    std::string result;
    const size_t n = std::min(bytes.size(), limit);
    result.reserve(n * 3 + 3);
    for (size_t i = 0; i < n; ++i) {
        if (i > 0) {
            result += ' ';
        }
        result += digits[bytes[i] >> 4];
        result += digits[bytes[i] & 0x0F];
    }
    if (bytes.size() > n) {
        result += " ...";
    }
    return result;
}

std::string ansi_color_code(Color color) {
    switch (color) {
    case Color::Green:
        return ANSI_GREEN;
    case Color::Yellow:
        return ANSI_YELLOW;
    case Color::Red:
        return ANSI_RED;
    case Color::Cyan:
        return ANSI_CYAN;
    case Color::Magenta:
        return ANSI_MAGENTA;
    case Color::Default:
    default:
        return "";
    }
}

bool supports_color(Stream s) {
    return s == Stream::Stdout ? platform::is_tty_stdout() : platform::is_tty_stderr();
}

}  // namespace reghive::output
