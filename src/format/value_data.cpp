// ==============================================================================
// value_data.cpp - Типизированная интерпретация данных значений
// ==============================================================================

#include "reghive/value_data.hpp"

#include "reghive/cursor.hpp"

namespace reghive::format {

namespace {

std::vector<std::string> split_multi_sz(const std::vector<std::uint8_t>& raw, bool& lossy) {
    std::vector<std::string> strings;

    std::size_t len = raw.size() & ~static_cast<std::size_t>(1);
    if (len != raw.size()) {
        lossy = true;
    }

    std::size_t pos = 0;
    while (pos + 2 <= len) {
        std::size_t end = pos;
        while (end + 2 <= len && read_u16_le(raw.data() + end) != 0) {
            end += 2;
        }

        if (end == pos) {
            // Пустая строка = конец списка
            break;
        }

        auto s = decode_utf16le(ByteCursor(raw.data() + pos, end - pos));
        lossy = lossy || s.lossy;
        strings.push_back(std::move(s.text));
        pos = end + 2;
    }

    return strings;
}

}  // anonymous namespace

ValueType value_type_from_raw(std::uint32_t raw) {
    switch (raw) {
    case REG_NONE:
        return ValueType::None;
    case REG_SZ:
        return ValueType::String;
    case REG_EXPAND_SZ:
        return ValueType::ExpandString;
    case REG_BINARY:
        return ValueType::Binary;
    case REG_DWORD:
        return ValueType::Dword;
    case REG_DWORD_BIG_ENDIAN:
        return ValueType::DwordBigEndian;
    case REG_LINK:
        return ValueType::Link;
    case REG_MULTI_SZ:
        return ValueType::MultiString;
    case REG_RESOURCE_LIST:
        return ValueType::ResourceList;
    case REG_FULL_RESOURCE_DESCRIPTOR:
        return ValueType::FullResourceDescriptor;
    case REG_RESOURCE_REQUIREMENTS_LIST:
        return ValueType::ResourceRequirementsList;
    case REG_QWORD:
        return ValueType::Qword;
    default:
        return ValueType::Unknown;
    }
}

const char* value_type_to_string(ValueType type) {
    switch (type) {
    case ValueType::None:
        return "REG_NONE";
    case ValueType::String:
        return "REG_SZ";
    case ValueType::ExpandString:
        return "REG_EXPAND_SZ";
    case ValueType::Binary:
        return "REG_BINARY";
    case ValueType::Dword:
        return "REG_DWORD";
    case ValueType::DwordBigEndian:
        return "REG_DWORD_BIG_ENDIAN";
    case ValueType::Link:
        return "REG_LINK";
    case ValueType::MultiString:
        return "REG_MULTI_SZ";
    case ValueType::ResourceList:
        return "REG_RESOURCE_LIST";
    case ValueType::FullResourceDescriptor:
        return "REG_FULL_RESOURCE_DESCRIPTOR";
    case ValueType::ResourceRequirementsList:
        return "REG_RESOURCE_REQUIREMENTS_LIST";
    case ValueType::Qword:
        return "REG_QWORD";
    case ValueType::Unknown:
        return "REG_UNKNOWN";
    }
    return "REG_UNKNOWN";
}

// ============================================================================
// ValueData accessors
// ============================================================================

const std::vector<std::uint8_t>* ValueData::as_binary() const {
    return std::get_if<std::vector<std::uint8_t>>(&data);
}

std::optional<std::uint32_t> ValueData::as_u32() const {
    if (auto* v = std::get_if<std::uint32_t>(&data)) {
        return *v;
    }
    return std::nullopt;
}

std::optional<std::uint64_t> ValueData::as_u64() const {
    if (auto* v = std::get_if<std::uint64_t>(&data)) {
        return *v;
    }
    if (auto* v = std::get_if<std::uint32_t>(&data)) {
        return static_cast<std::uint64_t>(*v);
    }
    return std::nullopt;
}

const std::string* ValueData::as_string() const {
    return std::get_if<std::string>(&data);
}

const std::vector<std::string>* ValueData::as_multi_string() const {
    return std::get_if<std::vector<std::string>>(&data);
}

// ============================================================================
// interpret_value_data
// ============================================================================

ValueData interpret_value_data(std::uint32_t raw_type, const std::vector<std::uint8_t>& raw,
                               std::uint32_t offset, std::vector<Diagnostic>& diagnostics) {
    ValueData value;
    value.type = value_type_from_raw(raw_type);

    auto length_mismatch = [&](std::size_t expected) {
        diagnostics.push_back(make_diagnostic(
            DiagnosticKind::DataLengthMismatch, offset,
            std::string(value_type_to_string(value.type)) + " expects " +
                std::to_string(expected) + " bytes, got " + std::to_string(raw.size())));
        value.data = raw;
    };

    switch (value.type) {
    case ValueType::None:
        if (!raw.empty()) {
            value.data = raw;
        }
        break;

    case ValueType::String:
    case ValueType::ExpandString:
    case ValueType::Link: {
        auto s = decode_utf16le(ByteCursor(raw), true);
        if (s.lossy) {
            diagnostics.push_back(make_diagnostic(DiagnosticKind::InvalidStringEncoding, offset,
                                                  "string data is not valid UTF-16"));
        }
        value.data = std::move(s.text);
        break;
    }

    case ValueType::MultiString: {
        bool lossy = false;
        value.data = split_multi_sz(raw, lossy);
        if (lossy) {
            diagnostics.push_back(make_diagnostic(DiagnosticKind::InvalidStringEncoding, offset,
                                                  "multi-string data is not valid UTF-16"));
        }
        break;
    }

    case ValueType::Dword:
        if (raw.size() < 4) {
            length_mismatch(4);
        } else {
            value.data = read_u32_le(raw.data());
        }
        break;

    case ValueType::DwordBigEndian:
        if (raw.size() < 4) {
            length_mismatch(4);
        } else {
            value.data = static_cast<std::uint32_t>((static_cast<std::uint32_t>(raw[0]) << 24) |
                                                    (static_cast<std::uint32_t>(raw[1]) << 16) |
                                                    (static_cast<std::uint32_t>(raw[2]) << 8) |
                                                    static_cast<std::uint32_t>(raw[3]));
        }
        break;

    case ValueType::Qword:
        if (raw.size() < 8) {
            length_mismatch(8);
        } else {
            value.data = read_u64_le(raw.data());
        }
        break;

    case ValueType::Binary:
    case ValueType::ResourceList:
    case ValueType::FullResourceDescriptor:
    case ValueType::ResourceRequirementsList:
    case ValueType::Unknown:
        value.data = raw;
        break;
    }

    return value;
}

}  // namespace reghive::format
