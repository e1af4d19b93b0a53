// ==============================================================================
// records.cpp - Декодеры записей ячеек
// ==============================================================================
//
// Все декодеры чистые: только разбирают поля полезной нагрузки.
// Разрешение ссылок (ячейки списков, данные, sk) выполняет дерево.
//
// ==============================================================================

#include "reghive/records.hpp"

#include <cstdio>

namespace reghive::format {

namespace {

// Сигнатуры ячеек
constexpr char NK_SIGNATURE[] = "nk";
constexpr char VK_SIGNATURE[] = "vk";
constexpr char LF_SIGNATURE[] = "lf";
constexpr char LH_SIGNATURE[] = "lh";
constexpr char LI_SIGNATURE[] = "li";
constexpr char RI_SIGNATURE[] = "ri";
constexpr char SK_SIGNATURE[] = "sk";
constexpr char DB_SIGNATURE[] = "db";

// Диапазон правдоподобных временных меток: 1990-01-01 .. 2100-01-01
constexpr std::uint64_t FILETIME_MIN_PLAUSIBLE = 122756256000000000ULL;
constexpr std::uint64_t FILETIME_MAX_PLAUSIBLE = 157469184000000000ULL;

constexpr std::uint16_t MAX_KEY_NAME_BYTES = 512;
constexpr std::uint16_t MAX_VALUE_NAME_BYTES = 32767;
constexpr std::uint32_t MAX_PLAUSIBLE_COUNT = 0x100000;
constexpr std::uint32_t MAX_PLAUSIBLE_DATA = 0x40000000;

std::string found_signature(ByteCursor payload) {
    if (payload.size() < 2) {
        return "<none>";
    }
    std::string sig;
    for (std::size_t i = 0; i < 2; ++i) {
        auto c = payload.data()[i];
        if (c >= 0x20 && c < 0x7F) {
            sig.push_back(static_cast<char>(c));
        } else {
            char buf[8];
            std::snprintf(buf, sizeof(buf), "\\x%02x", c);
            sig += buf;
        }
    }
    return "'" + sig + "'";
}

template <typename T>
Decoded<T> unrecognized(ByteCursor payload, std::uint32_t offset, const char* expected) {
    Decoded<T> result;
    result.status = DecodeStatus::UnrecognizedSignature;
    result.diagnostics.push_back(make_diagnostic(
        DiagnosticKind::UnrecognizedSignature, offset,
        std::string("expected '") + expected + "', found " + found_signature(payload)));
    return result;
}

template <typename T>
Decoded<T> truncated(std::uint32_t offset, const char* what, std::size_t need, std::size_t have) {
    Decoded<T> result;
    result.status = DecodeStatus::Truncated;
    result.diagnostics.push_back(make_diagnostic(
        DiagnosticKind::TruncatedRecord, offset,
        std::string(what) + " needs " + std::to_string(need) + " bytes, cell has " +
            std::to_string(have)));
    return result;
}

/// Декодировать имя записи (сжатое Latin-1 либо UTF-16LE)
DecodedString decode_name(ByteCursor payload, std::size_t name_offset, std::uint16_t name_length,
                          bool compressed, std::uint32_t cell_offset, const char* what,
                          std::vector<Diagnostic>& diagnostics) {
    ByteCursor raw = payload.sub_clamped(name_offset, name_length);
    if (raw.size() < name_length) {
        diagnostics.push_back(make_diagnostic(
            DiagnosticKind::TruncatedRecord, cell_offset,
            std::string(what) + " name length " + std::to_string(name_length) +
                " exceeds cell, " + std::to_string(raw.size()) + " bytes available"));
    }

    DecodedString name = compressed ? decode_latin1(raw) : decode_utf16le(raw);
    if (name.lossy) {
        diagnostics.push_back(make_diagnostic(DiagnosticKind::InvalidStringEncoding, cell_offset,
                                              std::string(what) + " name is not valid UTF-16"));
    }
    return name;
}

bool plausible_offset(std::uint32_t offset, std::uint32_t region_size) {
    if (offset == 0xFFFFFFFF) {
        return true;
    }
    return offset < region_size && offset % 8 == 0;
}

template <typename T>
Decoded<CellRecord> lift(Decoded<T>&& decoded) {
    Decoded<CellRecord> result;
    result.status = decoded.status;
    result.diagnostics = std::move(decoded.diagnostics);
    if (decoded.record) {
        result.record = CellRecord(std::move(*decoded.record));
    }
    return result;
}

}  // anonymous namespace

const char* decode_status_to_string(DecodeStatus status) {
    switch (status) {
    case DecodeStatus::Ok:
        return "ok";
    case DecodeStatus::UnrecognizedSignature:
        return "unrecognized-signature";
    case DecodeStatus::Truncated:
        return "truncated";
    }
    return "unknown";
}

// ============================================================================
// Key node
// ============================================================================

Decoded<KeyNode> decode_key_node(ByteCursor payload, std::uint32_t cell_offset) {
    if (!payload.matches(0, NK_SIGNATURE)) {
        return unrecognized<KeyNode>(payload, cell_offset, NK_SIGNATURE);
    }
    if (payload.size() < KEY_NODE_FIXED_SIZE) {
        return truncated<KeyNode>(cell_offset, "key node", KEY_NODE_FIXED_SIZE, payload.size());
    }

    Decoded<KeyNode> result;
    const std::uint8_t* p = payload.data();

    KeyNode key;
    key.offset = cell_offset;
    key.flags = read_u16_le(p + 0x02);
    key.last_written = read_u64_le(p + 0x04);
    key.access_bits = read_u32_le(p + 0x0C);
    key.parent_offset = read_u32_le(p + 0x10);
    key.subkey_count = read_u32_le(p + 0x14);
    key.volatile_subkey_count = read_u32_le(p + 0x18);
    key.subkey_list_offset = read_u32_le(p + 0x1C);
    key.volatile_subkey_list_offset = read_u32_le(p + 0x20);
    key.value_count = read_u32_le(p + 0x24);
    key.value_list_offset = read_u32_le(p + 0x28);
    key.security_offset = read_u32_le(p + 0x2C);
    key.class_name_offset = read_u32_le(p + 0x30);
    key.largest_subkey_name = read_u32_le(p + 0x34);
    key.largest_subkey_class = read_u32_le(p + 0x38);
    key.largest_value_name = read_u32_le(p + 0x3C);
    key.largest_value_data = read_u32_le(p + 0x40);
    key.work_var = read_u32_le(p + 0x44);
    key.name_length = read_u16_le(p + 0x48);
    key.class_name_length = read_u16_le(p + 0x4A);

    auto name = decode_name(payload, KEY_NODE_FIXED_SIZE, key.name_length, key.compressed_name(),
                            cell_offset, "key", result.diagnostics);
    key.name = std::move(name.text);
    key.name_lossy = name.lossy;
    key.record_length = static_cast<std::uint32_t>(
        KEY_NODE_FIXED_SIZE + payload.sub_clamped(KEY_NODE_FIXED_SIZE, key.name_length).size());

    result.record = std::move(key);
    return result;
}

// ============================================================================
// Value node
// ============================================================================

std::vector<std::uint8_t> ValueNode::inline_data() const {
    std::uint32_t len = data_length();
    if (len > 4) {
        len = 4;
    }
    std::vector<std::uint8_t> bytes(len);
    for (std::uint32_t i = 0; i < len; ++i) {
        bytes[i] = static_cast<std::uint8_t>(data_offset >> (8 * i));
    }
    return bytes;
}

Decoded<ValueNode> decode_value_node(ByteCursor payload, std::uint32_t cell_offset) {
    if (!payload.matches(0, VK_SIGNATURE)) {
        return unrecognized<ValueNode>(payload, cell_offset, VK_SIGNATURE);
    }
    if (payload.size() < VALUE_NODE_FIXED_SIZE) {
        return truncated<ValueNode>(cell_offset, "value node", VALUE_NODE_FIXED_SIZE,
                                    payload.size());
    }

    Decoded<ValueNode> result;
    const std::uint8_t* p = payload.data();

    ValueNode value;
    value.offset = cell_offset;
    value.name_length = read_u16_le(p + 0x02);
    value.data_size_raw = read_u32_le(p + 0x04);
    value.data_offset = read_u32_le(p + 0x08);
    value.data_type = read_u32_le(p + 0x0C);
    value.flags = read_u16_le(p + 0x10);

    auto name = decode_name(payload, VALUE_NODE_FIXED_SIZE, value.name_length,
                            value.compressed_name(), cell_offset, "value", result.diagnostics);
    value.name = std::move(name.text);
    value.name_lossy = name.lossy;
    value.record_length = static_cast<std::uint32_t>(
        VALUE_NODE_FIXED_SIZE +
        payload.sub_clamped(VALUE_NODE_FIXED_SIZE, value.name_length).size());

    result.record = std::move(value);
    return result;
}

// ============================================================================
// Subkey lists
// ============================================================================

const char* subkey_list_kind_to_string(SubkeyListKind kind) {
    switch (kind) {
    case SubkeyListKind::FastLeaf:
        return "lf";
    case SubkeyListKind::HashLeaf:
        return "lh";
    case SubkeyListKind::IndexLeaf:
        return "li";
    case SubkeyListKind::IndexRoot:
        return "ri";
    }
    return "??";
}

Decoded<SubkeyList> decode_subkey_list(ByteCursor payload, std::uint32_t cell_offset) {
    SubkeyList list;
    list.offset = cell_offset;

    if (payload.matches(0, LF_SIGNATURE)) {
        list.kind = SubkeyListKind::FastLeaf;
    } else if (payload.matches(0, LH_SIGNATURE)) {
        list.kind = SubkeyListKind::HashLeaf;
    } else if (payload.matches(0, LI_SIGNATURE)) {
        list.kind = SubkeyListKind::IndexLeaf;
    } else if (payload.matches(0, RI_SIGNATURE)) {
        list.kind = SubkeyListKind::IndexRoot;
    } else {
        return unrecognized<SubkeyList>(payload, cell_offset, "lf/lh/li/ri");
    }

    if (payload.size() < LIST_HEADER_SIZE) {
        return truncated<SubkeyList>(cell_offset, "subkey list", LIST_HEADER_SIZE,
                                     payload.size());
    }

    Decoded<SubkeyList> result;
    list.declared_count = read_u16_le(payload.data() + 2);

    const bool with_hints =
        list.kind == SubkeyListKind::FastLeaf || list.kind == SubkeyListKind::HashLeaf;
    const std::size_t stride = with_hints ? 8 : 4;
    const std::size_t available = (payload.size() - LIST_HEADER_SIZE) / stride;

    std::size_t count = list.declared_count;
    if (count > available) {
        result.diagnostics.push_back(make_diagnostic(
            DiagnosticKind::TruncatedRecord, cell_offset,
            std::string(subkey_list_kind_to_string(list.kind)) + " list declares " +
                std::to_string(count) + " entries, cell holds " + std::to_string(available)));
        count = available;
    }

    list.offsets.reserve(count);
    if (with_hints) {
        list.hints.reserve(count);
    }
    for (std::size_t i = 0; i < count; ++i) {
        const std::uint8_t* entry = payload.data() + LIST_HEADER_SIZE + i * stride;
        list.offsets.push_back(read_u32_le(entry));
        if (with_hints) {
            list.hints.push_back(read_u32_le(entry + 4));
        }
    }

    result.record = std::move(list);
    return result;
}

std::optional<std::uint32_t> lh_name_hash(std::string_view name) {
    std::uint32_t hash = 0;
    for (char ch : name) {
        auto c = static_cast<unsigned char>(ch);
        if (c >= 0x80) {
            return std::nullopt;
        }
        if (c >= 'a' && c <= 'z') {
            c = static_cast<unsigned char>(c - 'a' + 'A');
        }
        hash = hash * 37 + c;
    }
    return hash;
}

std::optional<std::uint32_t> lf_name_hint(std::string_view name) {
    std::uint32_t hint = 0;
    for (std::size_t i = 0; i < name.size() && i < 4; ++i) {
        auto c = static_cast<unsigned char>(name[i]);
        if (c >= 0x80) {
            return std::nullopt;
        }
        hint |= static_cast<std::uint32_t>(c) << (8 * i);
    }
    return hint;
}

// ============================================================================
// Value list
// ============================================================================

Decoded<ValueList> decode_value_list(ByteCursor payload, std::uint32_t cell_offset,
                                     std::uint32_t count) {
    Decoded<ValueList> result;
    ValueList list;
    list.offset = cell_offset;

    std::size_t available = payload.size() / 4;
    std::size_t n = count;
    if (n > available) {
        result.diagnostics.push_back(make_diagnostic(
            DiagnosticKind::TruncatedRecord, cell_offset,
            "value list expects " + std::to_string(count) + " entries, cell holds " +
                std::to_string(available)));
        n = available;
    }

    list.offsets.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        list.offsets.push_back(read_u32_le(payload.data() + i * 4));
    }

    result.record = std::move(list);
    return result;
}

// ============================================================================
// Security key
// ============================================================================

Decoded<SecurityKey> decode_security_key(ByteCursor payload, std::uint32_t cell_offset) {
    if (!payload.matches(0, SK_SIGNATURE)) {
        return unrecognized<SecurityKey>(payload, cell_offset, SK_SIGNATURE);
    }
    if (payload.size() < SECURITY_KEY_FIXED_SIZE) {
        return truncated<SecurityKey>(cell_offset, "security key", SECURITY_KEY_FIXED_SIZE,
                                      payload.size());
    }

    Decoded<SecurityKey> result;
    const std::uint8_t* p = payload.data();

    SecurityKey sk;
    sk.offset = cell_offset;
    sk.flink = read_u32_le(p + 0x04);
    sk.blink = read_u32_le(p + 0x08);
    sk.reference_count = read_u32_le(p + 0x0C);
    sk.descriptor_length = read_u32_le(p + 0x10);

    sk.descriptor = payload.copy(SECURITY_KEY_FIXED_SIZE, sk.descriptor_length);
    if (sk.descriptor.size() < sk.descriptor_length) {
        result.diagnostics.push_back(make_diagnostic(
            DiagnosticKind::TruncatedRecord, cell_offset,
            "security descriptor length " + std::to_string(sk.descriptor_length) +
                " exceeds cell, " + std::to_string(sk.descriptor.size()) + " bytes available"));
    }

    result.record = std::move(sk);
    return result;
}

// ============================================================================
// Big data
// ============================================================================

Decoded<BigData> decode_big_data(ByteCursor payload, std::uint32_t cell_offset) {
    if (!payload.matches(0, DB_SIGNATURE)) {
        return unrecognized<BigData>(payload, cell_offset, DB_SIGNATURE);
    }
    if (payload.size() < BIG_DATA_FIXED_SIZE) {
        return truncated<BigData>(cell_offset, "big data", BIG_DATA_FIXED_SIZE, payload.size());
    }

    Decoded<BigData> result;
    BigData db;
    db.offset = cell_offset;
    db.segment_count = read_u16_le(payload.data() + 2);
    db.segment_list_offset = read_u32_le(payload.data() + 4);
    result.record = db;
    return result;
}

Decoded<std::vector<std::uint32_t>> decode_segment_list(ByteCursor payload,
                                                        std::uint32_t cell_offset,
                                                        std::uint16_t count) {
    Decoded<std::vector<std::uint32_t>> result;
    std::size_t available = payload.size() / 4;
    std::size_t n = count;
    if (n > available) {
        result.diagnostics.push_back(make_diagnostic(
            DiagnosticKind::TruncatedRecord, cell_offset,
            "segment list expects " + std::to_string(count) + " entries, cell holds " +
                std::to_string(available)));
        n = available;
    }

    std::vector<std::uint32_t> segments;
    segments.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        segments.push_back(read_u32_le(payload.data() + i * 4));
    }
    result.record = std::move(segments);
    return result;
}

// ============================================================================
// Диспетчер
// ============================================================================

Decoded<CellRecord> decode_cell(ByteCursor payload, std::uint32_t cell_offset) {
    if (payload.matches(0, NK_SIGNATURE)) {
        return lift(decode_key_node(payload, cell_offset));
    }
    if (payload.matches(0, VK_SIGNATURE)) {
        return lift(decode_value_node(payload, cell_offset));
    }
    if (payload.matches(0, LF_SIGNATURE) || payload.matches(0, LH_SIGNATURE) ||
        payload.matches(0, LI_SIGNATURE) || payload.matches(0, RI_SIGNATURE)) {
        return lift(decode_subkey_list(payload, cell_offset));
    }
    if (payload.matches(0, SK_SIGNATURE)) {
        return lift(decode_security_key(payload, cell_offset));
    }
    if (payload.matches(0, DB_SIGNATURE)) {
        return lift(decode_big_data(payload, cell_offset));
    }
    return unrecognized<CellRecord>(payload, cell_offset, "nk/vk/lf/lh/li/ri/sk/db");
}

// ============================================================================
// Правдоподобие
// ============================================================================

bool plausible_key_node(const KeyNode& key, std::uint32_t region_size) {
    if (key.name_length == 0 || key.name_length > MAX_KEY_NAME_BYTES || key.name_lossy) {
        return false;
    }
    if (key.record_length != KEY_NODE_FIXED_SIZE + key.name_length) {
        return false;
    }
    if ((key.flags & ~KEY_KNOWN_FLAGS) != 0) {
        return false;
    }
    if (key.last_written < FILETIME_MIN_PLAUSIBLE || key.last_written > FILETIME_MAX_PLAUSIBLE) {
        return false;
    }
    if (key.subkey_count > MAX_PLAUSIBLE_COUNT || key.value_count > MAX_PLAUSIBLE_COUNT) {
        return false;
    }
    if (!plausible_offset(key.parent_offset, region_size) ||
        !plausible_offset(key.security_offset, region_size)) {
        return false;
    }
    if (key.subkey_count > 0 && !plausible_offset(key.subkey_list_offset, region_size)) {
        return false;
    }
    if (key.value_count > 0 && !plausible_offset(key.value_list_offset, region_size)) {
        return false;
    }
    if (key.class_name_length > 0 && !plausible_offset(key.class_name_offset, region_size)) {
        return false;
    }
    return true;
}

bool plausible_value_node(const ValueNode& value, std::uint32_t region_size) {
    if (value.name_length > MAX_VALUE_NAME_BYTES || value.name_lossy) {
        return false;
    }
    if (value.record_length != VALUE_NODE_FIXED_SIZE + value.name_length) {
        return false;
    }
    if ((value.flags & ~(VALUE_COMP_NAME | VALUE_TOMBSTONE)) != 0) {
        return false;
    }
    if (value.data_type > 0xFFFF) {
        return false;
    }
    if (value.is_inline()) {
        return value.data_length() <= 4;
    }
    if (value.data_length() == 0) {
        return true;
    }
    if (value.data_length() > MAX_PLAUSIBLE_DATA) {
        return false;
    }
    return value.data_offset != 0xFFFFFFFF && plausible_offset(value.data_offset, region_size);
}

}  // namespace reghive::format
