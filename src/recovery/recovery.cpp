// ==============================================================================
// recovery.cpp - Сканер удалённых записей
// ==============================================================================
//
// Кандидаты:
// - занятая ячейка со статусом Ok, на которую не ссылается дерево
// - внутри свободной ячейки: каждая позиция с шагом 8, где лежит
//   правдоподобное старое поле size и нужная сигнатура
//
// Диагностики декодеров для кандидатов не сохраняются: мусор в свободном
// пространстве не является повреждением hive.
//
// ==============================================================================

#include "reghive/recovery.hpp"

#include <cstring>
#include <limits>

namespace reghive::recovery {

namespace {

using format::ByteCursor;
using format::CELL_ALIGNMENT;
using format::CELL_SIZE_FIELD;
using format::INVALID_OFFSET;

constexpr char NK_SIGNATURE[] = "nk";
constexpr char VK_SIGNATURE[] = "vk";

constexpr std::uint64_t FNV_OFFSET_BASIS = 0xcbf29ce484222325ULL;
constexpr std::uint64_t FNV_PRIME = 0x100000001b3ULL;

}  // anonymous namespace

const char* orphan_kind_to_string(OrphanKind kind) {
    return kind == OrphanKind::Key ? "key" : "value";
}

const char* orphan_origin_to_string(OrphanOrigin origin) {
    return origin == OrphanOrigin::FreeCell ? "free-cell" : "unreachable-allocated";
}

std::uint64_t fnv1a64(const std::uint8_t* data, std::size_t length) {
    std::uint64_t hash = FNV_OFFSET_BASIS;
    for (std::size_t i = 0; i < length; ++i) {
        hash ^= data[i];
        hash *= FNV_PRIME;
    }
    return hash;
}

// ============================================================================
// OrphanCursor
// ============================================================================

OrphanCursor::OrphanCursor(const tree::Hive& hive, std::vector<txlog::PatchedRange> patched_ranges)
    : hive_(&hive), region_(hive.region()), patched_(std::move(patched_ranges)) {}

void OrphanCursor::initialize() {
    initialized_ = true;
    refs_ = hive_->collect_references();

    // Структурные байты связанных записей
    const format::CellIndex& index = hive_->cells();
    std::uint64_t hash = 0;
    for (std::uint32_t offset : refs_.cells) {
        const format::Cell* cell = index.find(offset);
        if (cell == nullptr || !cell->ok() || !cell->allocated) {
            continue;
        }
        ByteCursor payload = format::cell_payload(region_, *cell);
        if (payload.matches(0, NK_SIGNATURE)) {
            auto key = format::decode_key_node(payload, offset);
            if (key.record) {
                remember(payload, key.record->record_length, hash);
            }
        } else if (payload.matches(0, VK_SIGNATURE)) {
            auto value = format::decode_value_node(payload, offset);
            if (value.record) {
                remember(payload, value.record->record_length, hash);
            }
        }
    }
}

bool OrphanCursor::next(OrphanRecord& out) {
    if (!initialized_) {
        initialize();
    }

    while (true) {
        if (!pending_.empty()) {
            out = std::move(pending_.front());
            pending_.pop_front();
            ++emitted_;
            return true;
        }

        Candidate candidate;
        if (phase_ == Phase::Keys) {
            if (next_candidate(NK_SIGNATURE, candidate)) {
                try_key(candidate);
                continue;
            }
            phase_ = Phase::Values;
            cell_index_ = 0;
            scan_pos_ = 0;
            continue;
        }
        if (phase_ == Phase::Values) {
            if (next_candidate(VK_SIGNATURE, candidate)) {
                if (auto record = try_value(candidate, std::nullopt)) {
                    pending_.push_back(std::move(*record));
                }
                continue;
            }
            phase_ = Phase::Done;
        }
        return false;
    }
}

std::vector<OrphanRecord> OrphanCursor::collect() {
    std::vector<OrphanRecord> records;
    OrphanRecord record;
    while (next(record)) {
        records.push_back(std::move(record));
    }
    return records;
}

// ----------------------------------------------------------------------------
// Кандидаты
// ----------------------------------------------------------------------------

void OrphanCursor::next_cell() {
    ++cell_index_;
    scan_pos_ = 0;
}

bool OrphanCursor::next_candidate(const char* signature, Candidate& out) {
    const auto& cells = hive_->cells().cells();

    while (cell_index_ < cells.size()) {
        const format::Cell& cell = cells[cell_index_];

        if (cell.status == format::CellStatus::Unparsed) {
            next_cell();
            continue;
        }

        if (cell.allocated) {
            next_cell();
            if (!cell.ok() || refs_.contains(cell.offset)) {
                continue;
            }
            ByteCursor payload = format::cell_payload(region_, cell);
            if (!payload.matches(0, signature)) {
                continue;
            }
            out = Candidate{cell.offset, payload, OrphanOrigin::UnreachableAllocated};
            return true;
        }

        if (scan_pos_ < cell.offset) {
            scan_pos_ = cell.offset;
        }
        while (static_cast<std::uint64_t>(scan_pos_) + CELL_SIZE_FIELD + 2 <= cell.end()) {
            const std::uint32_t pos = scan_pos_;
            scan_pos_ += CELL_ALIGNMENT;

            if (refs_.contains(pos)) {
                continue;
            }
            auto payload = old_cell_payload(pos, cell.end());
            if (!payload || !payload->matches(0, signature)) {
                continue;
            }
            out = Candidate{pos, *payload, OrphanOrigin::FreeCell};
            return true;
        }
        next_cell();
    }
    return false;
}

std::optional<ByteCursor> OrphanCursor::old_cell_payload(std::uint32_t offset,
                                                         std::uint32_t limit) const {
    auto size = region_.i32(offset);
    if (!size || *size == 0 || *size == std::numeric_limits<std::int32_t>::min()) {
        return std::nullopt;
    }
    const std::uint32_t length = static_cast<std::uint32_t>(*size < 0 ? -*size : *size);
    if (length < CELL_SIZE_FIELD + 2 || length % CELL_ALIGNMENT != 0 ||
        static_cast<std::uint64_t>(offset) + length > limit) {
        return std::nullopt;
    }
    return region_.sub_clamped(offset + CELL_SIZE_FIELD, length - CELL_SIZE_FIELD);
}

OrphanOrigin OrphanCursor::origin_at(std::uint32_t offset) const {
    const format::Cell* cell = hive_->cells().find(offset);
    if (cell != nullptr && cell->allocated) {
        return OrphanOrigin::UnreachableAllocated;
    }
    return OrphanOrigin::FreeCell;
}

// ----------------------------------------------------------------------------
// Ключи и значения
// ----------------------------------------------------------------------------

void OrphanCursor::try_key(const Candidate& candidate) {
    auto decoded = format::decode_key_node(candidate.payload, candidate.offset);
    if (!decoded.record || !format::plausible_key_node(*decoded.record, region_.size())) {
        return;
    }
    const format::KeyNode& key = *decoded.record;

    std::uint64_t hash = 0;
    if (!remember(candidate.payload, key.record_length, hash)) {
        return;
    }

    OrphanRecord record;
    record.kind = OrphanKind::Key;
    record.offset = candidate.offset;
    record.origin = candidate.origin;
    record.content_hash = hash;
    record.in_log_patched_region = in_patched(candidate.offset, key.record_length + CELL_SIZE_FIELD);

    if (key.parent_offset != INVALID_OFFSET && key.parent_offset != candidate.offset) {
        auto parent = old_cell_payload(key.parent_offset, static_cast<std::uint32_t>(region_.size()));
        if (parent && parent->matches(0, NK_SIGNATURE)) {
            record.parent_offset = key.parent_offset;
        }
    }

    // Значения из собственного списка ключа
    std::vector<std::uint32_t> value_offsets;
    if (key.value_count != 0 && key.value_list_offset != INVALID_OFFSET) {
        auto list_payload =
            old_cell_payload(key.value_list_offset, static_cast<std::uint32_t>(region_.size()));
        if (list_payload) {
            auto list =
                format::decode_value_list(*list_payload, key.value_list_offset, key.value_count);
            if (list.record) {
                value_offsets = std::move(list.record->offsets);
            }
        }
    }

    const std::uint32_t key_offset = candidate.offset;
    record.record = std::move(*decoded.record);
    pending_.push_back(std::move(record));

    for (std::uint32_t offset : value_offsets) {
        if (offset == INVALID_OFFSET || refs_.contains(offset)) {
            continue;
        }
        auto payload = old_cell_payload(offset, static_cast<std::uint32_t>(region_.size()));
        if (!payload || !payload->matches(0, VK_SIGNATURE)) {
            continue;
        }
        Candidate value_candidate{offset, *payload, origin_at(offset)};
        if (auto value = try_value(value_candidate, key_offset)) {
            pending_.push_back(std::move(*value));
        }
    }
}

std::optional<OrphanRecord> OrphanCursor::try_value(const Candidate& candidate,
                                                    std::optional<std::uint32_t> parent) {
    auto decoded = format::decode_value_node(candidate.payload, candidate.offset);
    if (!decoded.record || !format::plausible_value_node(*decoded.record, region_.size())) {
        return std::nullopt;
    }

    std::uint64_t hash = 0;
    if (!remember(candidate.payload, decoded.record->record_length, hash)) {
        return std::nullopt;
    }

    OrphanRecord record;
    record.kind = OrphanKind::Value;
    record.offset = candidate.offset;
    record.origin = candidate.origin;
    record.parent_offset = parent;
    record.content_hash = hash;
    record.in_log_patched_region =
        in_patched(candidate.offset, decoded.record->record_length + CELL_SIZE_FIELD);
    record.record = std::move(*decoded.record);
    return record;
}

// ----------------------------------------------------------------------------
// Дубликаты / журналы
// ----------------------------------------------------------------------------

bool OrphanCursor::remember(ByteCursor payload, std::uint32_t length, std::uint64_t& hash) {
    ByteCursor bytes = payload.sub_clamped(0, length);
    hash = fnv1a64(bytes.data(), bytes.size());

    const auto start = static_cast<std::uint32_t>(bytes.data() - region_.data());
    auto& spans = seen_[hash];
    for (const Span& span : spans) {
        if (span.length == bytes.size() &&
            std::memcmp(region_.data() + span.start, bytes.data(), bytes.size()) == 0) {
            return false;
        }
    }
    spans.push_back(Span{start, static_cast<std::uint32_t>(bytes.size())});
    return true;
}

bool OrphanCursor::in_patched(std::uint32_t offset, std::uint32_t length) const {
    const std::uint64_t end = static_cast<std::uint64_t>(offset) + length;
    for (const auto& range : patched_) {
        const std::uint64_t range_end = static_cast<std::uint64_t>(range.offset) + range.length;
        if (offset < range_end && range.offset < end) {
            return true;
        }
    }
    return false;
}

}  // namespace reghive::recovery
