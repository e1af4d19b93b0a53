// ==============================================================================
// reghive/header.hpp - Base block (заголовок REGF)
// ==============================================================================
//
// Назначение:
// - Декодирование 4096-байтового base block файла hive и журналов
// - Проверка XOR-32 контрольной суммы первых 508 байт
// - Поля Windows 10 (RM/Log/TM GUID, флаги, last reorganized)
//
// Раскладка base block:
//   0x000 "regf"               0x024 root cell offset
//   0x004 primary sequence     0x028 hive bins data size
//   0x008 secondary sequence   0x02C clustering factor
//   0x00C last written         0x030 file name (UTF-16, 64 байта)
//   0x014 major version        0x1FC checksum
//   0x018 minor version        0x200 reserved (RM/Log/TM, "rmtm")
//   0x01C file type            0xFF8 boot type
//   0x020 file format          0xFFC boot recover
//
// ==============================================================================

#ifndef REGHIVE_HEADER_HPP
#define REGHIVE_HEADER_HPP

#include <reghive/cursor.hpp>
#include <reghive/diagnostics.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace reghive::format {

// ----------------------------------------------------------------------------
// Константы
// ----------------------------------------------------------------------------

constexpr std::size_t BASE_BLOCK_SIZE = 4096;
constexpr std::size_t BASE_BLOCK_MIN_SIZE = 512;  // журналы нового формата
constexpr std::size_t CHECKSUM_OFFSET = 0x1FC;
constexpr std::uint32_t HIVE_BINS_OFFSET = 4096;  // начало hive bins в файле hive

// ----------------------------------------------------------------------------
// Перечисления
// ----------------------------------------------------------------------------

enum class FileType {
    Primary,                 // 0
    TransactionLog,          // 1 (старый формат, DIRT)
    TransactionLogVolatile,  // 2
    TransactionLogNew,       // 6 (HvLE)
    Unknown
};

enum class FileFormat {
    DirectMemoryLoad,  // 1
    Unknown
};

const char* file_type_to_string(FileType type);

// ----------------------------------------------------------------------------
// HiveHeader
// ----------------------------------------------------------------------------

struct HiveHeader {
    std::uint32_t primary_sequence = 0;
    std::uint32_t secondary_sequence = 0;
    std::uint64_t last_written = 0;  // FILETIME
    std::uint32_t major_version = 0;
    std::uint32_t minor_version = 0;
    std::uint32_t file_type_raw = 0;
    FileType file_type = FileType::Unknown;
    std::uint32_t file_format_raw = 0;
    FileFormat file_format = FileFormat::Unknown;
    std::uint32_t root_cell_offset = 0;
    std::uint32_t hive_bins_data_size = 0;
    std::uint32_t clustering_factor = 0;
    std::string file_name;

    std::uint32_t stored_checksum = 0;
    std::uint32_t computed_checksum = 0;

    // Только при полном base block (4096 байт)
    bool has_extended_fields = false;
    std::string rm_id;
    std::string log_id;
    std::uint32_t flags = 0;
    std::string tm_id;
    bool has_rmtm_signature = false;
    std::uint64_t last_reorganized = 0;
    std::uint32_t boot_type = 0;
    std::uint32_t boot_recover = 0;

    bool checksum_valid() const { return stored_checksum == computed_checksum; }

    /// Незавершённая запись: primary != secondary
    bool is_dirty() const { return primary_sequence != secondary_sequence; }

    /// Последний зафиксированный sequence (порог для журналов)
    std::uint32_t committed_sequence() const {
        return primary_sequence < secondary_sequence ? primary_sequence : secondary_sequence;
    }
};

// ----------------------------------------------------------------------------
// Ошибки
// ----------------------------------------------------------------------------

enum class HeaderErrorKind {
    TooShort,        // меньше 512 байт
    MalformedHeader  // нет сигнатуры "regf"
};

struct HeaderError {
    HeaderErrorKind kind = HeaderErrorKind::MalformedHeader;
    std::string message;

    std::string format() const;
};

/// Результат декодирования: header либо error; diagnostics всегда заполнены
struct HeaderResult {
    std::optional<HiveHeader> header;
    std::optional<HeaderError> error;
    std::vector<Diagnostic> diagnostics;

    bool ok() const { return header.has_value(); }
};

// ----------------------------------------------------------------------------
// API
// ----------------------------------------------------------------------------

/// XOR-32 по первым 508 байтам. 0 -> 1, 0xFFFFFFFF -> 0xFFFFFFFE.
/// Требует минимум 508 байт, иначе 0.
std::uint32_t calculate_checksum(ByteCursor bytes);

/// Декодировать base block
HeaderResult decode_header(ByteCursor bytes);

/// Перезаписать контрольную сумму в буфере (после изменения полей)
void update_checksum(std::vector<std::uint8_t>& bytes);

}  // namespace reghive::format

#endif  // REGHIVE_HEADER_HPP
