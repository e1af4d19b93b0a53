// ==============================================================================
// reghive/security.hpp - Self-relative security descriptor из sk записей
// ==============================================================================
//
// Назначение:
// - Разбор SECURITY_DESCRIPTOR_RELATIVE (owner, group, DACL, SACL)
// - SID -> строка "S-1-5-21-..."
// - Список ACE с типом, флагами, маской доступа и SID
//
// ==============================================================================

#ifndef REGHIVE_SECURITY_HPP
#define REGHIVE_SECURITY_HPP

#include <reghive/cursor.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace reghive::format {

// Биты control
constexpr std::uint16_t SE_OWNER_DEFAULTED = 0x0001;
constexpr std::uint16_t SE_GROUP_DEFAULTED = 0x0002;
constexpr std::uint16_t SE_DACL_PRESENT = 0x0004;
constexpr std::uint16_t SE_DACL_DEFAULTED = 0x0008;
constexpr std::uint16_t SE_SACL_PRESENT = 0x0010;
constexpr std::uint16_t SE_SELF_RELATIVE = 0x8000;

// Типы ACE
constexpr std::uint8_t ACCESS_ALLOWED_ACE_TYPE = 0x00;
constexpr std::uint8_t ACCESS_DENIED_ACE_TYPE = 0x01;
constexpr std::uint8_t SYSTEM_AUDIT_ACE_TYPE = 0x02;
constexpr std::uint8_t SYSTEM_ALARM_ACE_TYPE = 0x03;
constexpr std::uint8_t ACCESS_ALLOWED_OBJECT_ACE_TYPE = 0x05;
constexpr std::uint8_t ACCESS_DENIED_OBJECT_ACE_TYPE = 0x06;
constexpr std::uint8_t SYSTEM_AUDIT_OBJECT_ACE_TYPE = 0x07;
constexpr std::uint8_t SYSTEM_ALARM_OBJECT_ACE_TYPE = 0x08;

struct Ace {
    std::uint8_t type = 0;
    std::uint8_t flags = 0;
    std::uint32_t access_mask = 0;
    std::string sid;  // пусто для неизвестных типов ACE
};

struct Acl {
    std::uint8_t revision = 0;
    std::uint16_t declared_count = 0;
    std::vector<Ace> aces;
};

struct SecurityDescriptor {
    std::uint8_t revision = 0;
    std::uint16_t control = 0;
    std::optional<std::string> owner;
    std::optional<std::string> group;
    std::optional<Acl> dacl;
    std::optional<Acl> sacl;
};

/// Разобрать SID по смещению; nullopt если не помещается
std::optional<std::string> parse_sid(ByteCursor bytes, std::size_t offset);

/// Разобрать ACL по смещению. ACE, выходящие за границы, отбрасываются.
std::optional<Acl> parse_acl(ByteCursor bytes, std::size_t offset);

/// Разобрать self-relative security descriptor
std::optional<SecurityDescriptor> parse_security_descriptor(ByteCursor bytes);

/// Имя типа ACE ("ACCESS_ALLOWED", ...)
const char* ace_type_to_string(std::uint8_t type);

}  // namespace reghive::format

#endif  // REGHIVE_SECURITY_HPP
