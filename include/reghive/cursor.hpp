// ==============================================================================
// reghive/cursor.hpp - Байтовый курсор с проверкой границ
// ==============================================================================
//
// Назначение:
// - Безопасное чтение little-endian целых из недоверенного буфера
// - Подвиды (sub-view) без копирования
// - Декодирование строк реестра (UTF-16LE, Latin-1) с пометкой потерь
// - Преобразование FILETIME
//
// Любое чтение за границей буфера возвращает nullopt, а не UB.
//
// ==============================================================================

#ifndef REGHIVE_CURSOR_HPP
#define REGHIVE_CURSOR_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace reghive::format {

// ----------------------------------------------------------------------------
// Низкоуровневое чтение (без проверок, только после has())
// ----------------------------------------------------------------------------

inline std::uint16_t read_u16_le(const std::uint8_t* data) {
    return static_cast<std::uint16_t>(data[0] | (data[1] << 8));
}

inline std::uint32_t read_u32_le(const std::uint8_t* data) {
    return static_cast<std::uint32_t>(data[0]) | (static_cast<std::uint32_t>(data[1]) << 8) |
           (static_cast<std::uint32_t>(data[2]) << 16) |
           (static_cast<std::uint32_t>(data[3]) << 24);
}

inline std::int32_t read_i32_le(const std::uint8_t* data) {
    return static_cast<std::int32_t>(read_u32_le(data));
}

inline std::uint64_t read_u64_le(const std::uint8_t* data) {
    return static_cast<std::uint64_t>(read_u32_le(data)) |
           (static_cast<std::uint64_t>(read_u32_le(data + 4)) << 32);
}

inline void write_u32_le(std::uint8_t* data, std::uint32_t value) {
    data[0] = static_cast<std::uint8_t>(value);
    data[1] = static_cast<std::uint8_t>(value >> 8);
    data[2] = static_cast<std::uint8_t>(value >> 16);
    data[3] = static_cast<std::uint8_t>(value >> 24);
}

// ----------------------------------------------------------------------------
// ByteCursor
// ----------------------------------------------------------------------------

/// Неизменяемый вид на диапазон байт. Не владеет памятью.
class ByteCursor {
public:
    ByteCursor() = default;
    ByteCursor(const std::uint8_t* data, std::size_t size) : data_(data), size_(size) {}
    explicit ByteCursor(const std::vector<std::uint8_t>& bytes)
        : data_(bytes.data()), size_(bytes.size()) {}

    const std::uint8_t* data() const { return data_; }
    std::size_t size() const { return size_; }
    bool empty() const { return size_ == 0; }

    /// Есть ли len байт начиная с offset
    bool has(std::size_t offset, std::size_t len) const {
        return offset <= size_ && len <= size_ - offset;
    }

    std::optional<std::uint8_t> u8(std::size_t offset) const;
    std::optional<std::uint16_t> u16(std::size_t offset) const;
    std::optional<std::uint32_t> u32(std::size_t offset) const;
    std::optional<std::int32_t> i32(std::size_t offset) const;
    std::optional<std::uint64_t> u64(std::size_t offset) const;

    /// Подвид [offset, offset + len) или nullopt при выходе за границы
    std::optional<ByteCursor> sub(std::size_t offset, std::size_t len) const;

    /// Подвид, усечённый до конца буфера (пустой, если offset за концом)
    ByteCursor sub_clamped(std::size_t offset, std::size_t len) const;

    /// Совпадает ли сигнатура по смещению
    bool matches(std::size_t offset, std::string_view signature) const;

    /// Скопировать диапазон (усечённый до конца буфера)
    std::vector<std::uint8_t> copy(std::size_t offset, std::size_t len) const;

    /// Скопировать весь вид
    std::vector<std::uint8_t> to_vector() const { return copy(0, size_); }

private:
    const std::uint8_t* data_ = nullptr;
    std::size_t size_ = 0;
};

// ----------------------------------------------------------------------------
// Строки
// ----------------------------------------------------------------------------

/// Результат декодирования строки. lossy = были невосстановимые байты.
struct DecodedString {
    std::string text;
    bool lossy = false;
};

/// UTF-16LE -> UTF-8.
/// Нечётная длина: последний байт отбрасывается, lossy.
/// Непарные суррогаты заменяются на U+FFFD, lossy.
/// @param stop_at_nul остановиться на первом U+0000
DecodedString decode_utf16le(ByteCursor bytes, bool stop_at_nul = false);

/// Latin-1 (сжатые имена ключей и значений) -> UTF-8
DecodedString decode_latin1(ByteCursor bytes);

/// Сравнение без учёта регистра (только ASCII буквы)
bool iequals(std::string_view a, std::string_view b);

// ----------------------------------------------------------------------------
// Время
// ----------------------------------------------------------------------------

/// FILETIME (100 нс от 1601-01-01) -> time_point.
/// Значения до Unix epoch отображаются в epoch.
std::chrono::system_clock::time_point filetime_to_timepoint(std::uint64_t filetime);

/// FILETIME -> "YYYY-MM-DDTHH:MM:SS.ffffffZ"
std::string format_filetime(std::uint64_t filetime);

}  // namespace reghive::format

#endif  // REGHIVE_CURSOR_HPP
