// ==============================================================================
// header.cpp - Декодирование base block REGF
// ==============================================================================

#include "reghive/header.hpp"

#include <cstdio>

namespace reghive::format {

namespace {

constexpr char REGF_SIGNATURE[] = "regf";
constexpr char RMTM_SIGNATURE[] = "rmtm";

constexpr std::size_t FILE_NAME_OFFSET = 0x30;
constexpr std::size_t FILE_NAME_SIZE = 64;

// Windows 10 reserved area
constexpr std::size_t RM_ID_OFFSET = 0x200;
constexpr std::size_t LOG_ID_OFFSET = 0x210;
constexpr std::size_t FLAGS_OFFSET = 0x220;
constexpr std::size_t TM_ID_OFFSET = 0x224;
constexpr std::size_t RMTM_OFFSET = 0x234;
constexpr std::size_t LAST_REORGANIZED_OFFSET = 0x238;
constexpr std::size_t BOOT_TYPE_OFFSET = 0xFF8;
constexpr std::size_t BOOT_RECOVER_OFFSET = 0xFFC;

FileType file_type_from_raw(std::uint32_t raw) {
    switch (raw) {
    case 0:
        return FileType::Primary;
    case 1:
        return FileType::TransactionLog;
    case 2:
        return FileType::TransactionLogVolatile;
    case 6:
        return FileType::TransactionLogNew;
    default:
        return FileType::Unknown;
    }
}

/// GUID в mixed-endian раскладке -> "xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx"
std::string format_guid(const std::uint8_t* p) {
    char buf[40];
    std::snprintf(buf, sizeof(buf), "%08x-%04x-%04x-%02x%02x-%02x%02x%02x%02x%02x%02x",
                  read_u32_le(p), read_u16_le(p + 4), read_u16_le(p + 6), p[8], p[9], p[10],
                  p[11], p[12], p[13], p[14], p[15]);
    return buf;
}

}  // anonymous namespace

const char* file_type_to_string(FileType type) {
    switch (type) {
    case FileType::Primary:
        return "primary";
    case FileType::TransactionLog:
        return "transaction-log";
    case FileType::TransactionLogVolatile:
        return "transaction-log-volatile";
    case FileType::TransactionLogNew:
        return "transaction-log-new";
    case FileType::Unknown:
        return "unknown";
    }
    return "unknown";
}

std::string HeaderError::format() const {
    return message;
}

std::uint32_t calculate_checksum(ByteCursor bytes) {
    if (!bytes.has(0, CHECKSUM_OFFSET)) {
        return 0;
    }

    std::uint32_t checksum = 0;
    for (std::size_t off = 0; off < CHECKSUM_OFFSET; off += 4) {
        checksum ^= read_u32_le(bytes.data() + off);
    }

    if (checksum == 0) {
        return 1;
    }
    if (checksum == 0xFFFFFFFF) {
        return 0xFFFFFFFE;
    }
    return checksum;
}

void update_checksum(std::vector<std::uint8_t>& bytes) {
    if (bytes.size() < CHECKSUM_OFFSET + 4) {
        return;
    }
    write_u32_le(bytes.data() + CHECKSUM_OFFSET, calculate_checksum(ByteCursor(bytes)));
}

HeaderResult decode_header(ByteCursor bytes) {
    HeaderResult result;

    if (bytes.size() < BASE_BLOCK_MIN_SIZE) {
        result.error = HeaderError{HeaderErrorKind::TooShort,
                                   "base block too short: " + std::to_string(bytes.size()) +
                                       " bytes"};
        return result;
    }

    if (!bytes.matches(0, REGF_SIGNATURE)) {
        result.error = HeaderError{HeaderErrorKind::MalformedHeader, "missing 'regf' signature"};
        return result;
    }

    const std::uint8_t* p = bytes.data();
    HiveHeader h;
    h.primary_sequence = read_u32_le(p + 0x04);
    h.secondary_sequence = read_u32_le(p + 0x08);
    h.last_written = read_u64_le(p + 0x0C);
    h.major_version = read_u32_le(p + 0x14);
    h.minor_version = read_u32_le(p + 0x18);
    h.file_type_raw = read_u32_le(p + 0x1C);
    h.file_type = file_type_from_raw(h.file_type_raw);
    h.file_format_raw = read_u32_le(p + 0x20);
    h.file_format = h.file_format_raw == 1 ? FileFormat::DirectMemoryLoad : FileFormat::Unknown;
    h.root_cell_offset = read_u32_le(p + 0x24);
    h.hive_bins_data_size = read_u32_le(p + 0x28);
    h.clustering_factor = read_u32_le(p + 0x2C);

    auto name = decode_utf16le(ByteCursor(p + FILE_NAME_OFFSET, FILE_NAME_SIZE), true);
    h.file_name = std::move(name.text);

    h.stored_checksum = read_u32_le(p + CHECKSUM_OFFSET);
    h.computed_checksum = calculate_checksum(bytes);

    if (bytes.size() >= BASE_BLOCK_SIZE) {
        h.has_extended_fields = true;
        h.rm_id = format_guid(p + RM_ID_OFFSET);
        h.log_id = format_guid(p + LOG_ID_OFFSET);
        h.flags = read_u32_le(p + FLAGS_OFFSET);
        h.tm_id = format_guid(p + TM_ID_OFFSET);
        h.has_rmtm_signature = bytes.matches(RMTM_OFFSET, RMTM_SIGNATURE);
        h.last_reorganized = read_u64_le(p + LAST_REORGANIZED_OFFSET);
        h.boot_type = read_u32_le(p + BOOT_TYPE_OFFSET);
        h.boot_recover = read_u32_le(p + BOOT_RECOVER_OFFSET);
    }

    if (!h.checksum_valid()) {
        char buf[96];
        std::snprintf(buf, sizeof(buf), "stored 0x%08x, computed 0x%08x", h.stored_checksum,
                      h.computed_checksum);
        result.diagnostics.push_back(make_diagnostic(DiagnosticKind::ChecksumMismatch,
                                                     static_cast<std::uint32_t>(CHECKSUM_OFFSET),
                                                     buf, DiagnosticSource::Header));
    }

    result.header = std::move(h);
    return result;
}

}  // namespace reghive::format
