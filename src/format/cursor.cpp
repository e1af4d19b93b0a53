// ==============================================================================
// cursor.cpp - Байтовый курсор и декодирование строк
// ==============================================================================

#include "reghive/cursor.hpp"

#include <cstdio>
#include <cstring>
#include <ctime>

namespace reghive::format {

namespace {

constexpr std::uint32_t REPLACEMENT_CHAR = 0xFFFD;

/// Добавить кодовую точку в UTF-8
void append_utf8(std::string& out, std::uint32_t cp) {
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

/// Свернуть регистр одного байта UTF-8 последовательности (ASCII only)
char fold_ascii(char c) {
    if (c >= 'a' && c <= 'z') {
        return static_cast<char>(c - 'a' + 'A');
    }
    return c;
}

}  // anonymous namespace

// ============================================================================
// ByteCursor
// ============================================================================

std::optional<std::uint8_t> ByteCursor::u8(std::size_t offset) const {
    if (!has(offset, 1)) {
        return std::nullopt;
    }
    return data_[offset];
}

std::optional<std::uint16_t> ByteCursor::u16(std::size_t offset) const {
    if (!has(offset, 2)) {
        return std::nullopt;
    }
    return read_u16_le(data_ + offset);
}

std::optional<std::uint32_t> ByteCursor::u32(std::size_t offset) const {
    if (!has(offset, 4)) {
        return std::nullopt;
    }
    return read_u32_le(data_ + offset);
}

std::optional<std::int32_t> ByteCursor::i32(std::size_t offset) const {
    if (!has(offset, 4)) {
        return std::nullopt;
    }
    return read_i32_le(data_ + offset);
}

std::optional<std::uint64_t> ByteCursor::u64(std::size_t offset) const {
    if (!has(offset, 8)) {
        return std::nullopt;
    }
    return read_u64_le(data_ + offset);
}

std::optional<ByteCursor> ByteCursor::sub(std::size_t offset, std::size_t len) const {
    if (!has(offset, len)) {
        return std::nullopt;
    }
    return ByteCursor(data_ + offset, len);
}

ByteCursor ByteCursor::sub_clamped(std::size_t offset, std::size_t len) const {
    if (offset >= size_) {
        return ByteCursor();
    }
    std::size_t available = size_ - offset;
    return ByteCursor(data_ + offset, len < available ? len : available);
}

bool ByteCursor::matches(std::size_t offset, std::string_view signature) const {
    if (!has(offset, signature.size())) {
        return false;
    }
    return std::memcmp(data_ + offset, signature.data(), signature.size()) == 0;
}

std::vector<std::uint8_t> ByteCursor::copy(std::size_t offset, std::size_t len) const {
    ByteCursor view = sub_clamped(offset, len);
    if (view.empty()) {
        return {};
    }
    return std::vector<std::uint8_t>(view.data(), view.data() + view.size());
}

// ============================================================================
// Строки
// ============================================================================

DecodedString decode_utf16le(ByteCursor bytes, bool stop_at_nul) {
    DecodedString result;
    std::size_t len = bytes.size();
    if (len % 2 != 0) {
        result.lossy = true;
        --len;
    }
    result.text.reserve(len / 2);

    const std::uint8_t* data = bytes.data();
    for (std::size_t i = 0; i < len; i += 2) {
        std::uint16_t unit = read_u16_le(data + i);

        if (unit == 0 && stop_at_nul) {
            break;
        }

        if (unit >= 0xD800 && unit <= 0xDBFF) {
            if (i + 4 <= len) {
                std::uint16_t low = read_u16_le(data + i + 2);
                if (low >= 0xDC00 && low <= 0xDFFF) {
                    std::uint32_t cp = 0x10000 + ((static_cast<std::uint32_t>(unit - 0xD800) << 10) |
                                                  static_cast<std::uint32_t>(low - 0xDC00));
                    append_utf8(result.text, cp);
                    i += 2;
                    continue;
                }
            }
            append_utf8(result.text, REPLACEMENT_CHAR);
            result.lossy = true;
            continue;
        }

        if (unit >= 0xDC00 && unit <= 0xDFFF) {
            // Одиночный low surrogate
            append_utf8(result.text, REPLACEMENT_CHAR);
            result.lossy = true;
            continue;
        }

        append_utf8(result.text, unit);
    }

    return result;
}

DecodedString decode_latin1(ByteCursor bytes) {
    DecodedString result;
    result.text.reserve(bytes.size());
    for (std::size_t i = 0; i < bytes.size(); ++i) {
        append_utf8(result.text, bytes.data()[i]);
    }
    return result;
}

bool iequals(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) {
        return false;
    }
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (fold_ascii(a[i]) != fold_ascii(b[i])) {
            return false;
        }
    }
    return true;
}

// ============================================================================
// Время
// ============================================================================

std::chrono::system_clock::time_point filetime_to_timepoint(std::uint64_t filetime) {
    // Разница между 1601-01-01 и 1970-01-01 в интервалах по 100 нс
    constexpr std::uint64_t EPOCH_DIFF = 116444736000000000ULL;

    if (filetime < EPOCH_DIFF) {
        return std::chrono::system_clock::time_point{};
    }

    auto unix_100ns = filetime - EPOCH_DIFF;
    auto unix_seconds = unix_100ns / 10000000ULL;
    auto unix_micros = (unix_100ns % 10000000ULL) / 10;

    return std::chrono::system_clock::time_point{std::chrono::seconds{unix_seconds} +
                                                 std::chrono::microseconds{unix_micros}};
}

std::string format_filetime(std::uint64_t filetime) {
    auto tp = filetime_to_timepoint(filetime);
    auto since_epoch = tp.time_since_epoch();
    auto secs = std::chrono::duration_cast<std::chrono::seconds>(since_epoch);
    auto micros = std::chrono::duration_cast<std::chrono::microseconds>(since_epoch - secs);

    std::time_t t = static_cast<std::time_t>(secs.count());
    std::tm tm_utc{};
#ifdef _WIN32
    gmtime_s(&tm_utc, &t);
#else
    gmtime_r(&t, &tm_utc);
#endif

    char buf[40];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%06lldZ",
                  tm_utc.tm_year + 1900, tm_utc.tm_mon + 1, tm_utc.tm_mday, tm_utc.tm_hour,
                  tm_utc.tm_min, tm_utc.tm_sec, static_cast<long long>(micros.count()));
    return buf;
}

}  // namespace reghive::format
