// ==============================================================================
// security.cpp - Разбор self-relative security descriptor
// ==============================================================================
//
// SECURITY_DESCRIPTOR_RELATIVE:
//   0 revision  1 sbz1  2 control  4 owner  8 group  12 sacl  16 dacl
// SID:
//   0 revision  1 sub-authority count  2 authority (6 байт, big-endian)
//   8 sub-authorities (u32 LE)
// ACL:
//   0 revision  2 size  4 ace count, ACE с offset 8
//
// ==============================================================================

#include "reghive/security.hpp"

namespace reghive::format {

namespace {

constexpr std::size_t DESCRIPTOR_HEADER_SIZE = 20;
constexpr std::size_t ACL_HEADER_SIZE = 8;
constexpr std::size_t ACE_HEADER_SIZE = 4;
constexpr std::size_t GUID_SIZE = 16;

constexpr std::uint32_t ACE_OBJECT_TYPE_PRESENT = 0x1;
constexpr std::uint32_t ACE_INHERITED_OBJECT_TYPE_PRESENT = 0x2;

bool is_basic_ace(std::uint8_t type) {
    return type <= SYSTEM_ALARM_ACE_TYPE;
}

bool is_object_ace(std::uint8_t type) {
    return type >= ACCESS_ALLOWED_OBJECT_ACE_TYPE && type <= SYSTEM_ALARM_OBJECT_ACE_TYPE;
}

}  // anonymous namespace

std::optional<std::string> parse_sid(ByteCursor bytes, std::size_t offset) {
    auto revision = bytes.u8(offset);
    auto count = bytes.u8(offset + 1);
    if (!revision || !count || !bytes.has(offset, 8 + static_cast<std::size_t>(*count) * 4)) {
        return std::nullopt;
    }

    std::uint64_t authority = 0;
    for (std::size_t i = 0; i < 6; ++i) {
        authority = (authority << 8) | bytes.data()[offset + 2 + i];
    }

    std::string sid = "S-" + std::to_string(*revision) + "-" + std::to_string(authority);
    for (std::size_t i = 0; i < *count; ++i) {
        sid += "-";
        sid += std::to_string(read_u32_le(bytes.data() + offset + 8 + i * 4));
    }
    return sid;
}

std::optional<Acl> parse_acl(ByteCursor bytes, std::size_t offset) {
    if (!bytes.has(offset, ACL_HEADER_SIZE)) {
        return std::nullopt;
    }

    Acl acl;
    acl.revision = bytes.data()[offset];
    std::uint16_t acl_size = read_u16_le(bytes.data() + offset + 2);
    acl.declared_count = read_u16_le(bytes.data() + offset + 4);

    ByteCursor view = bytes.sub_clamped(offset, acl_size);
    std::size_t pos = ACL_HEADER_SIZE;
    for (std::uint16_t i = 0; i < acl.declared_count; ++i) {
        if (!view.has(pos, ACE_HEADER_SIZE)) {
            break;
        }
        Ace ace;
        ace.type = view.data()[pos];
        ace.flags = view.data()[pos + 1];
        std::uint16_t ace_size = read_u16_le(view.data() + pos + 2);
        if (ace_size < ACE_HEADER_SIZE || !view.has(pos, ace_size)) {
            break;
        }

        ByteCursor body = view.sub_clamped(pos, ace_size);
        if (auto mask = body.u32(4)) {
            ace.access_mask = *mask;
        }
        if (is_basic_ace(ace.type)) {
            ace.sid = parse_sid(body, 8).value_or("");
        } else if (is_object_ace(ace.type)) {
            std::size_t sid_offset = 12;
            std::uint32_t object_flags = body.u32(8).value_or(0);
            if (object_flags & ACE_OBJECT_TYPE_PRESENT) {
                sid_offset += GUID_SIZE;
            }
            if (object_flags & ACE_INHERITED_OBJECT_TYPE_PRESENT) {
                sid_offset += GUID_SIZE;
            }
            ace.sid = parse_sid(body, sid_offset).value_or("");
        }

        acl.aces.push_back(std::move(ace));
        pos += ace_size;
    }

    return acl;
}

std::optional<SecurityDescriptor> parse_security_descriptor(ByteCursor bytes) {
    if (bytes.size() < DESCRIPTOR_HEADER_SIZE) {
        return std::nullopt;
    }

    const std::uint8_t* p = bytes.data();
    SecurityDescriptor sd;
    sd.revision = p[0];
    sd.control = read_u16_le(p + 2);
    if (sd.revision != 1) {
        return std::nullopt;
    }

    std::uint32_t owner_offset = read_u32_le(p + 4);
    std::uint32_t group_offset = read_u32_le(p + 8);
    std::uint32_t sacl_offset = read_u32_le(p + 12);
    std::uint32_t dacl_offset = read_u32_le(p + 16);

    if (owner_offset != 0) {
        sd.owner = parse_sid(bytes, owner_offset);
    }
    if (group_offset != 0) {
        sd.group = parse_sid(bytes, group_offset);
    }
    if ((sd.control & SE_SACL_PRESENT) != 0 && sacl_offset != 0) {
        sd.sacl = parse_acl(bytes, sacl_offset);
    }
    if ((sd.control & SE_DACL_PRESENT) != 0 && dacl_offset != 0) {
        sd.dacl = parse_acl(bytes, dacl_offset);
    }

    return sd;
}

const char* ace_type_to_string(std::uint8_t type) {
    switch (type) {
    case ACCESS_ALLOWED_ACE_TYPE:
        return "ACCESS_ALLOWED";
    case ACCESS_DENIED_ACE_TYPE:
        return "ACCESS_DENIED";
    case SYSTEM_AUDIT_ACE_TYPE:
        return "SYSTEM_AUDIT";
    case SYSTEM_ALARM_ACE_TYPE:
        return "SYSTEM_ALARM";
    case ACCESS_ALLOWED_OBJECT_ACE_TYPE:
        return "ACCESS_ALLOWED_OBJECT";
    case ACCESS_DENIED_OBJECT_ACE_TYPE:
        return "ACCESS_DENIED_OBJECT";
    case SYSTEM_AUDIT_OBJECT_ACE_TYPE:
        return "SYSTEM_AUDIT_OBJECT";
    case SYSTEM_ALARM_OBJECT_ACE_TYPE:
        return "SYSTEM_ALARM_OBJECT";
    default:
        return "UNKNOWN";
    }
}

}  // namespace reghive::format
