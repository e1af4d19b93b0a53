// ==============================================================================
// reghive/txlog.hpp - Журналы транзакций (.LOG1/.LOG2) и их применение
// ==============================================================================
//
// Назначение:
// - Разбор журналов нового формата (base block type 6 + записи "HvLE")
// - Проверка целостности записей (Marvin32 hash-1 / hash-2)
// - Проверка последовательности (sequence number)
// - Слияние двух журналов и применение dirty pages к копии hive
//
// Запись HvLE (выровнена на 512 байт, первая запись с offset 512):
//   0x00 "HvLE"              0x14 dirty page count
//   0x04 size                0x18 hash-1 = Marvin32(bytes[40, size))
//   0x08 flags               0x20 hash-2 = Marvin32(bytes[0, 32))
//   0x0C sequence number     0x28 dirty page refs (offset, size) x count
//   0x10 hive bins data size      затем данные страниц подряд
//
// Журналы старого формата (DIRT) не поддерживаются: файл отклоняется
// с диагностикой LogFileInvalid.
//
// ==============================================================================

#ifndef REGHIVE_TXLOG_HPP
#define REGHIVE_TXLOG_HPP

#include <reghive/cursor.hpp>
#include <reghive/diagnostics.hpp>
#include <reghive/header.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace reghive::txlog {

// ----------------------------------------------------------------------------
// Константы
// ----------------------------------------------------------------------------

constexpr std::uint64_t LOG_ENTRY_HASH_SEED = 0x82EF4D887A4E55C5ULL;
constexpr std::size_t LOG_ENTRIES_OFFSET = 512;
constexpr std::size_t LOG_ENTRY_ALIGNMENT = 512;
constexpr std::size_t LOG_ENTRY_HEADER_SIZE = 40;
constexpr std::size_t LOG_ENTRY_HASH2_SPAN = 32;

// ----------------------------------------------------------------------------
// Marvin32
// ----------------------------------------------------------------------------

/// Marvin32 (64-битный результат)
std::uint64_t marvin32(const std::uint8_t* data, std::size_t length, std::uint64_t seed);

// ----------------------------------------------------------------------------
// Перечисления
// ----------------------------------------------------------------------------

/// Позиция журнала: первый (.LOG1 / .LOG) или второй (.LOG2)
enum class LogSlot { Primary, Secondary };

enum class LogFileState { Unvalidated, Parsed, Applied, Rejected };

enum class EntryState {
    Pending,
    Accepted,    // прошёл все проверки файла
    Stale,       // sequence <= зафиксированного в hive, отброшен
    Rejected,    // повреждён / нарушен порядок / после точки разрыва
    Superseded,  // тот же sequence применён из другого журнала
    Applied
};

enum class TieBreak { PreferSecondary, PreferPrimary };

enum class ReplayStatus { Applied, NoLogApplied };

const char* log_slot_to_string(LogSlot slot);
const char* log_file_state_to_string(LogFileState state);
const char* entry_state_to_string(EntryState state);
const char* tie_break_to_string(TieBreak tie_break);

// ----------------------------------------------------------------------------
// Записи журнала
// ----------------------------------------------------------------------------

struct DirtyPage {
    std::uint32_t offset = 0;  // относительно начала hive bins
    std::uint32_t size = 0;
    std::vector<std::uint8_t> bytes;
};

struct LogEntry {
    LogSlot slot = LogSlot::Primary;
    std::uint32_t file_offset = 0;
    std::uint32_t size = 0;
    std::uint32_t flags = 0;
    std::uint32_t sequence = 0;
    std::uint32_t hive_bins_data_size = 0;
    std::uint32_t dirty_page_count = 0;
    std::uint64_t hash1 = 0;
    std::uint64_t hash2 = 0;
    std::vector<DirtyPage> pages;

    EntryState state = EntryState::Pending;
    std::string reason;  // причина Stale/Rejected/Superseded

    /// Одинаковые ли изменения несут записи
    bool same_payload(const LogEntry& other) const;
};

struct TransactionLog {
    LogSlot slot = LogSlot::Primary;
    LogFileState state = LogFileState::Unvalidated;
    std::optional<format::HiveHeader> header;
    std::vector<LogEntry> entries;

    /// Sequence, начиная с которого ничего нельзя применять (из-за повреждения)
    std::optional<std::uint32_t> break_sequence;

    std::vector<format::Diagnostic> diagnostics;

    std::size_t count(EntryState state) const;
};

/// Разобрать и проверить один журнал
/// @param committed_sequence зафиксированный sequence основного hive
TransactionLog parse_transaction_log(format::ByteCursor bytes, LogSlot slot,
                                     std::uint32_t committed_sequence);

// ----------------------------------------------------------------------------
// Replay
// ----------------------------------------------------------------------------

struct ReplayOptions {
    TieBreak tie_break = TieBreak::PreferSecondary;
};

/// Диапазон hive bins, перезаписанный страницей журнала
struct PatchedRange {
    std::uint32_t offset = 0;
    std::uint32_t length = 0;
    std::uint32_t sequence = 0;
};

struct ReplayResult {
    ReplayStatus status = ReplayStatus::NoLogApplied;
    std::vector<TransactionLog> logs;
    std::vector<std::uint32_t> applied_sequences;
    std::vector<PatchedRange> patched_ranges;
    std::optional<std::uint32_t> break_sequence;
    std::vector<format::Diagnostic> diagnostics;

    bool applied() const { return status == ReplayStatus::Applied; }

    /// Лежит ли смещение hive bins внутри применённой страницы
    bool in_patched_range(std::uint32_t offset) const;
};

/// Проверить журналы и применить их к hive
/// @param hive_bytes полный буфер hive (>= 4096 байт), изменяется на месте
/// @param base декодированный заголовок исходного hive
/// @param logs журналы в порядке [.LOG1, .LOG2]
ReplayResult replay_logs(std::vector<std::uint8_t>& hive_bytes, const format::HiveHeader& base,
                         const std::vector<format::ByteCursor>& logs,
                         const ReplayOptions& options = {});

}  // namespace reghive::txlog

#endif  // REGHIVE_TXLOG_HPP
