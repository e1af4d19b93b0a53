// ==============================================================================
// txlog.cpp - Разбор и применение журналов транзакций
// ==============================================================================
//
// Порядок проверки каждой записи HvLE:
// 1. сигнатура (её отсутствие = конец журнала)
// 2. структура (размер, ссылки на страницы внутри записи и hive bins)
// 3. hash-2 (заголовок), затем hash-1 (тело)
// 4. sequence: <= зафиксированного -> Stale; не возрастает -> Rejected
//
// Повреждение записи отклоняет её и весь остаток файла, а также задаёт
// глобальную точку разрыва: записи обоих журналов с sequence >= этой
// точки не применяются. Нарушение порядка отклоняет только остаток файла.
//
// ==============================================================================

#include "reghive/txlog.hpp"

#include <algorithm>
#include <cstring>

namespace reghive::txlog {

namespace {

using format::ByteCursor;
using format::DiagnosticKind;
using format::DiagnosticSource;
using format::make_diagnostic;
using format::read_u32_le;
using format::read_u64_le;

constexpr char HVLE_SIGNATURE[] = "HvLE";
constexpr std::uint32_t MAX_DIRTY_PAGES = 0x100000;

DiagnosticSource source_for(LogSlot slot) {
    return slot == LogSlot::Primary ? DiagnosticSource::PrimaryLog
                                    : DiagnosticSource::SecondaryLog;
}

/// Проверка структуры записи и разбор страниц. Пустая строка = успех.
std::string parse_entry_body(ByteCursor entry_bytes, LogEntry& entry) {
    if (entry.size < LOG_ENTRY_HEADER_SIZE || entry.size % LOG_ENTRY_ALIGNMENT != 0) {
        return "invalid entry size " + std::to_string(entry.size);
    }
    if (entry.dirty_page_count > MAX_DIRTY_PAGES) {
        return "implausible dirty page count " + std::to_string(entry.dirty_page_count);
    }

    const std::size_t refs_end =
        LOG_ENTRY_HEADER_SIZE + static_cast<std::size_t>(entry.dirty_page_count) * 8;
    if (refs_end > entry.size) {
        return "dirty page references overrun entry";
    }

    std::size_t data_pos = refs_end;
    entry.pages.reserve(entry.dirty_page_count);
    for (std::uint32_t i = 0; i < entry.dirty_page_count; ++i) {
        const std::uint8_t* ref = entry_bytes.data() + LOG_ENTRY_HEADER_SIZE + i * 8;
        DirtyPage page;
        page.offset = read_u32_le(ref);
        page.size = read_u32_le(ref + 4);

        if (page.size == 0 || !entry_bytes.has(data_pos, page.size) ||
            data_pos + page.size > entry.size) {
            return "dirty page " + std::to_string(i) + " data overruns entry";
        }
        if (static_cast<std::uint64_t>(page.offset) + page.size > entry.hive_bins_data_size) {
            return "dirty page " + std::to_string(i) + " lies outside hive bins data size";
        }

        page.bytes = entry_bytes.copy(data_pos, page.size);
        data_pos += page.size;
        entry.pages.push_back(std::move(page));
    }
    return {};
}

void set_state(LogEntry& entry, EntryState state, std::string reason) {
    entry.state = state;
    entry.reason = std::move(reason);
}

}  // anonymous namespace

// ============================================================================
// Строковые имена
// ============================================================================

const char* log_slot_to_string(LogSlot slot) {
    return slot == LogSlot::Primary ? "log1" : "log2";
}

const char* log_file_state_to_string(LogFileState state) {
    switch (state) {
    case LogFileState::Unvalidated:
        return "unvalidated";
    case LogFileState::Parsed:
        return "parsed";
    case LogFileState::Applied:
        return "applied";
    case LogFileState::Rejected:
        return "rejected";
    }
    return "unknown";
}

const char* entry_state_to_string(EntryState state) {
    switch (state) {
    case EntryState::Pending:
        return "pending";
    case EntryState::Accepted:
        return "accepted";
    case EntryState::Stale:
        return "stale";
    case EntryState::Rejected:
        return "rejected";
    case EntryState::Superseded:
        return "superseded";
    case EntryState::Applied:
        return "applied";
    }
    return "unknown";
}

const char* tie_break_to_string(TieBreak tie_break) {
    return tie_break == TieBreak::PreferSecondary ? "secondary" : "primary";
}

// ============================================================================
// LogEntry / TransactionLog
// ============================================================================

bool LogEntry::same_payload(const LogEntry& other) const {
    if (hive_bins_data_size != other.hive_bins_data_size || pages.size() != other.pages.size()) {
        return false;
    }
    for (std::size_t i = 0; i < pages.size(); ++i) {
        if (pages[i].offset != other.pages[i].offset || pages[i].bytes != other.pages[i].bytes) {
            return false;
        }
    }
    return true;
}

std::size_t TransactionLog::count(EntryState state) const {
    return static_cast<std::size_t>(std::count_if(
        entries.begin(), entries.end(), [state](const LogEntry& e) { return e.state == state; }));
}

bool ReplayResult::in_patched_range(std::uint32_t offset) const {
    for (const auto& range : patched_ranges) {
        if (offset >= range.offset && offset - range.offset < range.length) {
            return true;
        }
    }
    return false;
}

// ============================================================================
// parse_transaction_log
// ============================================================================

TransactionLog parse_transaction_log(ByteCursor bytes, LogSlot slot,
                                     std::uint32_t committed_sequence) {
    TransactionLog log;
    log.slot = slot;
    const DiagnosticSource source = source_for(slot);

    auto header = format::decode_header(bytes);
    if (!header.ok()) {
        log.state = LogFileState::Rejected;
        log.diagnostics.push_back(make_diagnostic(DiagnosticKind::LogFileInvalid, 0,
                                                  header.error->format(), source));
        return log;
    }
    for (auto d : header.diagnostics) {
        d.source = source;
        log.diagnostics.push_back(std::move(d));
    }
    log.header = std::move(header.header);

    switch (log.header->file_type) {
    case format::FileType::TransactionLogNew:
        break;
    case format::FileType::TransactionLog:
    case format::FileType::TransactionLogVolatile:
        log.state = LogFileState::Rejected;
        log.diagnostics.push_back(make_diagnostic(
            DiagnosticKind::LogFileInvalid, 0x1C,
            "old-format (DIRT) transaction log is not supported", source));
        return log;
    default:
        log.state = LogFileState::Rejected;
        log.diagnostics.push_back(make_diagnostic(
            DiagnosticKind::LogFileInvalid, 0x1C,
            "unexpected file type " + std::to_string(log.header->file_type_raw), source));
        return log;
    }

    log.state = LogFileState::Parsed;

    std::optional<std::uint32_t> last_accepted;
    bool broken = false;
    std::string broken_reason;

    std::size_t pos = LOG_ENTRIES_OFFSET;
    while (bytes.has(pos, LOG_ENTRY_HEADER_SIZE) && bytes.matches(pos, HVLE_SIGNATURE)) {
        const std::uint8_t* p = bytes.data() + pos;

        LogEntry entry;
        entry.slot = slot;
        entry.file_offset = static_cast<std::uint32_t>(pos);
        entry.size = read_u32_le(p + 0x04);
        entry.flags = read_u32_le(p + 0x08);
        entry.sequence = read_u32_le(p + 0x0C);
        entry.hive_bins_data_size = read_u32_le(p + 0x10);
        entry.dirty_page_count = read_u32_le(p + 0x14);
        entry.hash1 = read_u64_le(p + 0x18);
        entry.hash2 = read_u64_le(p + 0x20);

        const bool size_usable = entry.size >= LOG_ENTRY_HEADER_SIZE &&
                                 entry.size % LOG_ENTRY_ALIGNMENT == 0 &&
                                 bytes.has(pos, entry.size);

        auto reject = [&](std::string reason) {
            log.diagnostics.push_back(make_diagnostic(
                DiagnosticKind::LogEntryRejected, entry.file_offset,
                "sequence " + std::to_string(entry.sequence) + ": " + reason, source));
            set_state(entry, EntryState::Rejected, std::move(reason));
        };

        auto mark_broken = [&](std::uint32_t break_at, const std::string& reason) {
            broken = true;
            broken_reason = reason;
            if (!log.break_sequence || break_at < *log.break_sequence) {
                log.break_sequence = break_at;
            }
        };

        const std::uint32_t fallback_break =
            last_accepted ? *last_accepted + 1 : committed_sequence + 1;

        if (broken) {
            reject("follows rejected entry (" + broken_reason + ")");
        } else if (!size_usable) {
            std::string reason = "invalid entry size " + std::to_string(entry.size);
            reject(reason);
            mark_broken(fallback_break, reason);
        } else {
            ByteCursor entry_bytes = bytes.sub_clamped(pos, entry.size);

            std::uint64_t hash2 = marvin32(entry_bytes.data(), LOG_ENTRY_HASH2_SPAN,
                                           LOG_ENTRY_HASH_SEED);
            std::uint64_t hash1 =
                marvin32(entry_bytes.data() + LOG_ENTRY_HEADER_SIZE,
                         entry.size - LOG_ENTRY_HEADER_SIZE, LOG_ENTRY_HASH_SEED);

            std::string structure_error;
            if (hash2 == entry.hash2) {
                structure_error = parse_entry_body(entry_bytes, entry);
            }

            if (hash2 != entry.hash2) {
                reject("header hash mismatch");
                mark_broken(fallback_break, "header hash mismatch");
            } else if (hash1 != entry.hash1) {
                entry.pages.clear();
                reject("payload hash mismatch");
                mark_broken(std::max(entry.sequence, committed_sequence + 1),
                            "payload hash mismatch");
            } else if (!structure_error.empty()) {
                entry.pages.clear();
                reject(structure_error);
                mark_broken(std::max(entry.sequence, committed_sequence + 1), structure_error);
            } else if (last_accepted && entry.sequence <= *last_accepted) {
                // Откат после принятой записи рвёт цепочку, даже если номер уже в hive
                reject("out-of-order sequence after " + std::to_string(*last_accepted));
                // Нарушение порядка не задаёт глобальную точку разрыва
                broken = true;
                broken_reason = "out-of-order sequence";
            } else if (entry.sequence <= committed_sequence) {
                log.diagnostics.push_back(make_diagnostic(
                    DiagnosticKind::LogEntryStale, entry.file_offset,
                    "sequence " + std::to_string(entry.sequence) +
                        " is not newer than hive sequence " + std::to_string(committed_sequence),
                    source));
                set_state(entry, EntryState::Stale, "already committed to hive");
            } else {
                set_state(entry, EntryState::Accepted, {});
                last_accepted = entry.sequence;
            }
        }

        log.entries.push_back(std::move(entry));

        if (!size_usable) {
            break;
        }
        pos += log.entries.back().size;
    }

    return log;
}

// ============================================================================
// replay_logs
// ============================================================================

ReplayResult replay_logs(std::vector<std::uint8_t>& hive_bytes, const format::HiveHeader& base,
                         const std::vector<ByteCursor>& logs, const ReplayOptions& options) {
    ReplayResult result;
    const std::uint32_t committed = base.committed_sequence();

    for (std::size_t i = 0; i < logs.size(); ++i) {
        LogSlot slot = i == 0 ? LogSlot::Primary : LogSlot::Secondary;
        result.logs.push_back(parse_transaction_log(logs[i], slot, committed));
    }

    for (const auto& log : result.logs) {
        if (log.break_sequence &&
            (!result.break_sequence || *log.break_sequence < *result.break_sequence)) {
            result.break_sequence = log.break_sequence;
        }
    }

    // Кандидаты: принятые записи до точки разрыва
    std::vector<LogEntry*> candidates;
    for (auto& log : result.logs) {
        for (auto& entry : log.entries) {
            if (entry.state != EntryState::Accepted) {
                continue;
            }
            if (result.break_sequence && entry.sequence >= *result.break_sequence) {
                std::string reason = "at or after broken point (sequence " +
                                     std::to_string(*result.break_sequence) + ")";
                log.diagnostics.push_back(make_diagnostic(
                    DiagnosticKind::LogEntryRejected, entry.file_offset,
                    "sequence " + std::to_string(entry.sequence) + ": " + reason,
                    source_for(log.slot)));
                set_state(entry, EntryState::Rejected, std::move(reason));
                continue;
            }
            candidates.push_back(&entry);
        }
    }

    std::stable_sort(candidates.begin(), candidates.end(),
                     [](const LogEntry* a, const LogEntry* b) {
                         if (a->sequence != b->sequence) {
                             return a->sequence < b->sequence;
                         }
                         return a->slot < b->slot;
                     });

    const LogSlot preferred =
        options.tie_break == TieBreak::PreferSecondary ? LogSlot::Secondary : LogSlot::Primary;

    std::vector<LogEntry*> chosen;
    for (std::size_t i = 0; i < candidates.size();) {
        std::size_t j = i + 1;
        while (j < candidates.size() && candidates[j]->sequence == candidates[i]->sequence) {
            ++j;
        }

        LogEntry* pick = candidates[i];
        for (std::size_t k = i; k < j; ++k) {
            if (candidates[k]->slot == preferred) {
                pick = candidates[k];
            }
        }

        for (std::size_t k = i; k < j; ++k) {
            LogEntry* other = candidates[k];
            if (other == pick) {
                continue;
            }
            set_state(*other, EntryState::Superseded,
                      std::string("same sequence applied from ") + log_slot_to_string(pick->slot));
            if (!other->same_payload(*pick)) {
                result.diagnostics.push_back(make_diagnostic(
                    DiagnosticKind::LogSequenceConflict, pick->file_offset,
                    "sequence " + std::to_string(pick->sequence) +
                        " differs between logs, using " + log_slot_to_string(pick->slot),
                    source_for(pick->slot)));
            }
        }

        chosen.push_back(pick);
        i = j;
    }

    // Применение страниц
    for (LogEntry* entry : chosen) {
        for (const auto& page : entry->pages) {
            std::size_t dest = format::HIVE_BINS_OFFSET + static_cast<std::size_t>(page.offset);
            if (dest + page.bytes.size() > hive_bytes.size()) {
                hive_bytes.resize(dest + page.bytes.size(), 0);
            }
            std::memcpy(hive_bytes.data() + dest, page.bytes.data(), page.bytes.size());
            result.patched_ranges.push_back(
                PatchedRange{page.offset, static_cast<std::uint32_t>(page.bytes.size()),
                             entry->sequence});
        }
        set_state(*entry, EntryState::Applied, {});
        result.applied_sequences.push_back(entry->sequence);
    }

    for (auto& log : result.logs) {
        if (log.state != LogFileState::Parsed) {
            continue;
        }
        log.state = log.count(EntryState::Applied) > 0 ? LogFileState::Applied
                                                       : LogFileState::Rejected;
    }

    if (chosen.empty()) {
        result.status = ReplayStatus::NoLogApplied;
        if (!logs.empty()) {
            result.diagnostics.push_back(make_diagnostic(
                DiagnosticKind::NoLogApplied, 0,
                "no transaction log entry was applied, using hive as stored",
                DiagnosticSource::Header));
        }
    } else {
        result.status = ReplayStatus::Applied;

        // Заголовок копии: размер hive bins и sequence последней записи
        const LogEntry* last = chosen.back();
        if (hive_bytes.size() >= format::BASE_BLOCK_SIZE) {
            format::write_u32_le(hive_bytes.data() + 0x04, last->sequence);
            format::write_u32_le(hive_bytes.data() + 0x08, last->sequence);
            format::write_u32_le(hive_bytes.data() + 0x28, last->hive_bins_data_size);
            format::update_checksum(hive_bytes);
        }
    }

    for (const auto& log : result.logs) {
        result.diagnostics.insert(result.diagnostics.end(), log.diagnostics.begin(),
                                  log.diagnostics.end());
    }

    return result;
}

}  // namespace reghive::txlog
