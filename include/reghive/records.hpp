// ==============================================================================
// reghive/records.hpp - Декодеры записей ячеек (nk, vk, lf/lh/li/ri, sk, db)
// ==============================================================================
//
// Назначение:
// - Чистые функции: полезная нагрузка ячейки -> типизированная запись
// - Неизвестная сигнатура -> DecodeStatus::UnrecognizedSignature
// - Усечённые записи -> частичный результат + TruncatedRecord
//
// Смещения полей ниже даны относительно полезной нагрузки
// (после 4-байтового поля size ячейки).
//
// Key node (nk):                       Value node (vk):
//   0x00 "nk"     0x28 values list       0x00 "vk"
//   0x02 flags    0x2C security          0x02 name length
//   0x04 written  0x30 class offset      0x04 data size (бит 31: inline)
//   0x0C access   0x34 max name/flags    0x08 data offset / inline data
//   0x10 parent   0x38 max class         0x0C type
//   0x14 subkeys  0x3C max value name    0x10 flags (бит 0: ASCII имя)
//   0x18 volatile 0x40 max value data    0x14 name
//   0x1C list     0x44 work var
//   0x20 vol list 0x48 name length
//   0x24 values   0x4A class length
//                 0x4C name
//
// ==============================================================================

#ifndef REGHIVE_RECORDS_HPP
#define REGHIVE_RECORDS_HPP

#include <reghive/cursor.hpp>
#include <reghive/diagnostics.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace reghive::format {

// ----------------------------------------------------------------------------
// Константы формата
// ----------------------------------------------------------------------------

constexpr std::size_t KEY_NODE_FIXED_SIZE = 0x4C;
constexpr std::size_t VALUE_NODE_FIXED_SIZE = 0x14;
constexpr std::size_t SECURITY_KEY_FIXED_SIZE = 0x14;
constexpr std::size_t BIG_DATA_FIXED_SIZE = 0x08;
constexpr std::size_t LIST_HEADER_SIZE = 4;

/// Максимальный объём данных в одной ячейке при big data
constexpr std::uint32_t BIG_DATA_SEGMENT_SIZE = 16344;

constexpr std::uint32_t VALUE_DATA_INLINE_FLAG = 0x80000000;

// Флаги key node
constexpr std::uint16_t KEY_VOLATILE = 0x0001;
constexpr std::uint16_t KEY_HIVE_EXIT = 0x0002;
constexpr std::uint16_t KEY_HIVE_ENTRY = 0x0004;
constexpr std::uint16_t KEY_NO_DELETE = 0x0008;
constexpr std::uint16_t KEY_SYM_LINK = 0x0010;
constexpr std::uint16_t KEY_COMP_NAME = 0x0020;
constexpr std::uint16_t KEY_PREDEF_HANDLE = 0x0040;
constexpr std::uint16_t KEY_VIRT_MIRRORED = 0x0080;
constexpr std::uint16_t KEY_VIRT_TARGET = 0x0100;
constexpr std::uint16_t KEY_VIRT_STORE = 0x0200;
constexpr std::uint16_t KEY_KNOWN_FLAGS = 0x03FF;

// Флаги value node
constexpr std::uint16_t VALUE_COMP_NAME = 0x0001;
constexpr std::uint16_t VALUE_TOMBSTONE = 0x0002;

// ----------------------------------------------------------------------------
// Decoded<T>
// ----------------------------------------------------------------------------

enum class DecodeStatus {
    Ok,
    UnrecognizedSignature,
    Truncated  // фиксированная часть записи не помещается в ячейку
};

const char* decode_status_to_string(DecodeStatus status);

template <typename T>
struct Decoded {
    std::optional<T> record;
    DecodeStatus status = DecodeStatus::Ok;
    std::vector<Diagnostic> diagnostics;

    bool ok() const { return record.has_value(); }
};

// ----------------------------------------------------------------------------
// KeyNode
// ----------------------------------------------------------------------------

struct KeyNode {
    std::uint32_t offset = 0;  // смещение ячейки
    std::uint16_t flags = 0;
    std::uint64_t last_written = 0;  // FILETIME
    std::uint32_t access_bits = 0;
    std::uint32_t parent_offset = 0;
    std::uint32_t subkey_count = 0;
    std::uint32_t volatile_subkey_count = 0;
    std::uint32_t subkey_list_offset = 0;
    std::uint32_t volatile_subkey_list_offset = 0;
    std::uint32_t value_count = 0;
    std::uint32_t value_list_offset = 0;
    std::uint32_t security_offset = 0;
    std::uint32_t class_name_offset = 0;
    std::uint32_t largest_subkey_name = 0;  // младшие 16 бит + user/virt флаги
    std::uint32_t largest_subkey_class = 0;
    std::uint32_t largest_value_name = 0;
    std::uint32_t largest_value_data = 0;
    std::uint32_t work_var = 0;
    std::uint16_t name_length = 0;
    std::uint16_t class_name_length = 0;
    std::string name;
    bool name_lossy = false;

    /// Длина структурной части записи (фиксированная часть + имя)
    std::uint32_t record_length = 0;

    bool is_root() const { return (flags & KEY_HIVE_ENTRY) != 0; }
    bool is_symlink() const { return (flags & KEY_SYM_LINK) != 0; }
    bool is_volatile() const { return (flags & KEY_VOLATILE) != 0; }
    bool compressed_name() const { return (flags & KEY_COMP_NAME) != 0; }
    bool has_class_name() const {
        return class_name_offset != 0xFFFFFFFF && class_name_length > 0;
    }
};

Decoded<KeyNode> decode_key_node(ByteCursor payload, std::uint32_t cell_offset);

// ----------------------------------------------------------------------------
// ValueNode
// ----------------------------------------------------------------------------

enum class DataStorage {
    Inline,    // данные в поле data offset (<= 4 байт)
    Resident,  // одна ячейка данных
    BigData    // кандидат на db (длина > 16344); окончательно по сигнатуре ячейки
};

struct ValueNode {
    std::uint32_t offset = 0;
    std::uint16_t name_length = 0;
    std::uint32_t data_size_raw = 0;
    std::uint32_t data_offset = 0;
    std::uint32_t data_type = 0;
    std::uint16_t flags = 0;
    std::string name;  // пустое имя = значение по умолчанию
    bool name_lossy = false;
    std::uint32_t record_length = 0;

    bool is_inline() const { return (data_size_raw & VALUE_DATA_INLINE_FLAG) != 0; }
    std::uint32_t data_length() const { return data_size_raw & ~VALUE_DATA_INLINE_FLAG; }
    bool compressed_name() const { return (flags & VALUE_COMP_NAME) != 0; }

    DataStorage storage() const {
        if (is_inline()) {
            return DataStorage::Inline;
        }
        if (data_length() > BIG_DATA_SEGMENT_SIZE) {
            return DataStorage::BigData;
        }
        return DataStorage::Resident;
    }

    /// Байты inline данных (data_length() <= 4)
    std::vector<std::uint8_t> inline_data() const;
};

Decoded<ValueNode> decode_value_node(ByteCursor payload, std::uint32_t cell_offset);

// ----------------------------------------------------------------------------
// SubkeyList
// ----------------------------------------------------------------------------

enum class SubkeyListKind {
    FastLeaf,   // lf: offset + первые 4 символа имени
    HashLeaf,   // lh: offset + хэш имени
    IndexLeaf,  // li: только offsets
    IndexRoot   // ri: offsets подсписков
};

const char* subkey_list_kind_to_string(SubkeyListKind kind);

struct SubkeyList {
    std::uint32_t offset = 0;
    SubkeyListKind kind = SubkeyListKind::IndexLeaf;
    std::uint16_t declared_count = 0;
    std::vector<std::uint32_t> offsets;
    std::vector<std::uint32_t> hints;  // только lf/lh, параллельно offsets
};

Decoded<SubkeyList> decode_subkey_list(ByteCursor payload, std::uint32_t cell_offset);

/// Хэш имени для lh: h = h * 37 + upcase(c) по UTF-16 кодовым единицам.
/// Для не-ASCII имён возвращает nullopt (регистр зависит от таблицы ОС).
std::optional<std::uint32_t> lh_name_hash(std::string_view name);

/// Подсказка lf: первые 4 символа имени (ASCII), дополненные нулями
std::optional<std::uint32_t> lf_name_hint(std::string_view name);

// ----------------------------------------------------------------------------
// ValueList
// ----------------------------------------------------------------------------

struct ValueList {
    std::uint32_t offset = 0;
    std::vector<std::uint32_t> offsets;
};

/// Список значений не имеет сигнатуры; длина берётся из key node
Decoded<ValueList> decode_value_list(ByteCursor payload, std::uint32_t cell_offset,
                                     std::uint32_t count);

// ----------------------------------------------------------------------------
// SecurityKey
// ----------------------------------------------------------------------------

struct SecurityKey {
    std::uint32_t offset = 0;
    std::uint32_t flink = 0;
    std::uint32_t blink = 0;
    std::uint32_t reference_count = 0;
    std::uint32_t descriptor_length = 0;
    std::vector<std::uint8_t> descriptor;
};

Decoded<SecurityKey> decode_security_key(ByteCursor payload, std::uint32_t cell_offset);

// ----------------------------------------------------------------------------
// BigData
// ----------------------------------------------------------------------------

struct BigData {
    std::uint32_t offset = 0;
    std::uint16_t segment_count = 0;
    std::uint32_t segment_list_offset = 0;
};

Decoded<BigData> decode_big_data(ByteCursor payload, std::uint32_t cell_offset);

/// Список сегментов big data: массив offsets ячеек данных
Decoded<std::vector<std::uint32_t>> decode_segment_list(ByteCursor payload,
                                                        std::uint32_t cell_offset,
                                                        std::uint16_t count);

// ----------------------------------------------------------------------------
// Диспетчер по сигнатуре
// ----------------------------------------------------------------------------

using CellRecord = std::variant<KeyNode, ValueNode, SubkeyList, SecurityKey, BigData>;

/// Декодировать ячейку по её сигнатуре
Decoded<CellRecord> decode_cell(ByteCursor payload, std::uint32_t cell_offset);

// ----------------------------------------------------------------------------
// Правдоподобие (для восстановления удалённых записей)
// ----------------------------------------------------------------------------

/// Проверка key node, найденного вне дерева
/// @param region_size размер области hive bins для проверки смещений
bool plausible_key_node(const KeyNode& key, std::uint32_t region_size);

/// Проверка value node, найденного вне дерева
bool plausible_value_node(const ValueNode& value, std::uint32_t region_size);

}  // namespace reghive::format

#endif  // REGHIVE_RECORDS_HPP
