// ==============================================================================
// reghive/value_data.hpp - Типизированная интерпретация данных значений
// ==============================================================================
//
// Назначение:
// - Коды типов REG_* и их имена
// - Преобразование сырых байт значения в типизированное представление
//   (строки, числа, списки строк, бинарные данные)
//
// Сырые байты остаются первичными: интерпретация ничего не теряет,
// при несоответствии длины типу возвращается Binary + диагностика.
//
// ==============================================================================

#ifndef REGHIVE_VALUE_DATA_HPP
#define REGHIVE_VALUE_DATA_HPP

#include <reghive/diagnostics.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace reghive::format {

// ----------------------------------------------------------------------------
// Коды типов (winnt.h)
// ----------------------------------------------------------------------------

constexpr std::uint32_t REG_NONE = 0;
constexpr std::uint32_t REG_SZ = 1;
constexpr std::uint32_t REG_EXPAND_SZ = 2;
constexpr std::uint32_t REG_BINARY = 3;
constexpr std::uint32_t REG_DWORD = 4;
constexpr std::uint32_t REG_DWORD_BIG_ENDIAN = 5;
constexpr std::uint32_t REG_LINK = 6;
constexpr std::uint32_t REG_MULTI_SZ = 7;
constexpr std::uint32_t REG_RESOURCE_LIST = 8;
constexpr std::uint32_t REG_FULL_RESOURCE_DESCRIPTOR = 9;
constexpr std::uint32_t REG_RESOURCE_REQUIREMENTS_LIST = 10;
constexpr std::uint32_t REG_QWORD = 11;

// ----------------------------------------------------------------------------
// ValueType
// ----------------------------------------------------------------------------

enum class ValueType {
    None,
    String,
    ExpandString,
    Binary,
    Dword,
    DwordBigEndian,
    Link,
    MultiString,
    ResourceList,
    FullResourceDescriptor,
    ResourceRequirementsList,
    Qword,
    Unknown
};

ValueType value_type_from_raw(std::uint32_t raw);

/// "REG_SZ", "REG_DWORD", ... ("REG_UNKNOWN" для неизвестных)
const char* value_type_to_string(ValueType type);

// ----------------------------------------------------------------------------
// ValueData
// ----------------------------------------------------------------------------

/// Типизированные данные значения
struct ValueData {
    ValueType type = ValueType::None;

    std::variant<std::monostate,             // REG_NONE без данных
                 std::vector<std::uint8_t>,  // Binary / ресурсы / неизвестный тип
                 std::uint32_t,              // Dword / DwordBigEndian
                 std::uint64_t,              // Qword
                 std::string,                // String / ExpandString / Link
                 std::vector<std::string>    // MultiString
                 >
        data;

    const std::vector<std::uint8_t>* as_binary() const;
    std::optional<std::uint32_t> as_u32() const;
    std::optional<std::uint64_t> as_u64() const;
    const std::string* as_string() const;
    const std::vector<std::string>* as_multi_string() const;
};

/// Интерпретировать сырые байты по коду типа
/// @param offset смещение value node (для диагностик)
ValueData interpret_value_data(std::uint32_t raw_type, const std::vector<std::uint8_t>& raw,
                               std::uint32_t offset, std::vector<Diagnostic>& diagnostics);

}  // namespace reghive::format

#endif  // REGHIVE_VALUE_DATA_HPP
