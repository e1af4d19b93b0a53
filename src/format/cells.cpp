// ==============================================================================
// cells.cpp - Модель аллокатора ячеек
// ==============================================================================
//
// Обход:
// - bin начинается с "hbin"; поле size кратно 4096
// - ячейки внутри bin идут вплотную с bin+32 до конца bin
// - при отсутствии "hbin" ищем следующую границу 4096 с сигнатурой,
//   пропущенный диапазон становится псевдо-bin с одной Unparsed ячейкой
//
// ==============================================================================

#include "reghive/cells.hpp"

#include <algorithm>
#include <cstdio>

namespace reghive::format {

namespace {

constexpr char HBIN_SIGNATURE[] = "hbin";

std::string hex32(std::uint32_t value) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "0x%x", value);
    return buf;
}

}  // anonymous namespace

// ----------------------------------------------------------------------------
// CellIndexBuilder - заполняет приватные поля CellIndex
// ----------------------------------------------------------------------------

struct CellIndexBuilder {
    ByteCursor region;
    CellIndex index;
    std::vector<Diagnostic> diagnostics;

    void push_cell(const Cell& cell) {
        index.by_offset_.emplace(cell.offset, index.cells_.size());
        index.cells_.push_back(cell);
    }

    void scan_cells(const HiveBin& bin) {
        std::uint32_t pos = bin.cells_begin;
        while (pos < bin.cells_end) {
            std::uint32_t remaining = bin.cells_end - pos;

            Cell cell;
            cell.offset = pos;
            cell.bin_offset = bin.offset;

            if (remaining < CELL_SIZE_FIELD) {
                cell.length = remaining;
                cell.status = CellStatus::InvalidSize;
                push_cell(cell);
                diagnostics.push_back(make_diagnostic(DiagnosticKind::InvalidCellSize, pos,
                                                      "cell size field does not fit in bin"));
                break;
            }

            std::int32_t size = read_i32_le(region.data() + pos);
            cell.declared_size = size;

            if (size == 0) {
                cell.length = remaining;
                cell.status = CellStatus::ZeroSize;
                push_cell(cell);
                diagnostics.push_back(make_diagnostic(
                    DiagnosticKind::ZeroSizeCell, pos,
                    "zero-size cell, skipping " + std::to_string(remaining) + " bytes of bin"));
                break;
            }

            std::int64_t abs_size = size < 0 ? -static_cast<std::int64_t>(size) : size;
            cell.allocated = size < 0;

            if (abs_size > static_cast<std::int64_t>(remaining)) {
                cell.length = remaining;
                cell.status = CellStatus::Truncated;
                diagnostics.push_back(make_diagnostic(
                    DiagnosticKind::TruncatedCell, pos,
                    "cell size " + std::to_string(abs_size) + " overruns bin at " +
                        hex32(bin.offset) + " (" + std::to_string(remaining) + " bytes left)"));
            } else {
                cell.length = static_cast<std::uint32_t>(abs_size);
                if (abs_size % CELL_ALIGNMENT != 0) {
                    cell.status = CellStatus::InvalidSize;
                    diagnostics.push_back(make_diagnostic(
                        DiagnosticKind::InvalidCellSize, pos,
                        "cell size " + std::to_string(abs_size) + " is not a multiple of 8"));
                }
            }

            push_cell(cell);
            pos += cell.length;
        }
    }

    /// Следующая граница 4096 после pos, на которой стоит "hbin"
    std::uint32_t resync(std::uint32_t pos, std::uint32_t end) const {
        std::uint64_t next = (static_cast<std::uint64_t>(pos) / HBIN_ALIGNMENT + 1) * HBIN_ALIGNMENT;
        while (next < end && !region.matches(static_cast<std::size_t>(next), HBIN_SIGNATURE)) {
            next += HBIN_ALIGNMENT;
        }
        return static_cast<std::uint32_t>(std::min<std::uint64_t>(next, end));
    }

    void run() {
        const std::uint32_t end =
            static_cast<std::uint32_t>(std::min<std::size_t>(region.size(), 0xFFFFFFF0u));
        index.region_size_ = end;

        std::uint32_t pos = 0;
        while (pos < end) {
            std::uint32_t remaining = end - pos;

            if (!region.matches(pos, HBIN_SIGNATURE)) {
                std::uint32_t next = resync(pos, end);

                HiveBin pseudo;
                pseudo.offset = pos;
                pseudo.size = next - pos;
                pseudo.valid_signature = false;
                pseudo.cells_begin = pos;
                pseudo.cells_end = next;
                index.bins_.push_back(pseudo);

                Cell cell;
                cell.offset = pos;
                cell.length = next - pos;
                cell.status = CellStatus::Unparsed;
                cell.bin_offset = pos;
                if (auto raw = region.i32(pos)) {
                    cell.declared_size = *raw;
                }
                push_cell(cell);

                diagnostics.push_back(make_diagnostic(
                    DiagnosticKind::InvalidHiveBin, pos,
                    "missing 'hbin' signature, skipped " + std::to_string(next - pos) + " bytes"));
                pos = next;
                continue;
            }

            HiveBin bin;
            bin.offset = pos;
            bin.declared_offset = region.u32(pos + 4).value_or(0);
            bin.declared_size = region.u32(pos + 8).value_or(0);
            bin.timestamp = region.u64(pos + 0x14).value_or(0);

            std::uint32_t bin_size = bin.declared_size;
            if (bin_size < HBIN_ALIGNMENT || bin_size % HBIN_ALIGNMENT != 0) {
                diagnostics.push_back(make_diagnostic(
                    DiagnosticKind::InvalidHiveBin, pos,
                    "invalid bin size " + std::to_string(bin_size) + ", assuming 4096"));
                bin_size = HBIN_ALIGNMENT;
            }
            if (bin.declared_offset != pos) {
                diagnostics.push_back(make_diagnostic(
                    DiagnosticKind::InvalidHiveBin, pos,
                    "bin self-offset " + hex32(bin.declared_offset) + " does not match position"));
            }
            if (bin_size > remaining) {
                diagnostics.push_back(make_diagnostic(
                    DiagnosticKind::HiveBinsTruncated, pos,
                    "bin size " + std::to_string(bin_size) + " exceeds remaining " +
                        std::to_string(remaining) + " bytes"));
                bin_size = remaining;
            }

            bin.size = bin_size;
            bin.cells_begin = pos + std::min(HBIN_HEADER_SIZE, bin_size);
            bin.cells_end = pos + bin_size;
            index.bins_.push_back(bin);

            scan_cells(bin);
            pos += bin_size;
        }
    }
};

// ============================================================================
// CellIndex
// ============================================================================

const char* cell_status_to_string(CellStatus status) {
    switch (status) {
    case CellStatus::Ok:
        return "ok";
    case CellStatus::Truncated:
        return "truncated";
    case CellStatus::ZeroSize:
        return "zero-size";
    case CellStatus::InvalidSize:
        return "invalid-size";
    case CellStatus::Unparsed:
        return "unparsed";
    }
    return "unknown";
}

const Cell* CellIndex::find(std::uint32_t offset) const {
    auto it = by_offset_.find(offset);
    if (it == by_offset_.end()) {
        return nullptr;
    }
    return &cells_[it->second];
}

const Cell* CellIndex::containing(std::uint32_t offset) const {
    auto it = std::upper_bound(cells_.begin(), cells_.end(), offset,
                               [](std::uint32_t off, const Cell& c) { return off < c.offset; });
    if (it == cells_.begin()) {
        return nullptr;
    }
    --it;
    if (offset < it->end()) {
        return &*it;
    }
    return nullptr;
}

std::size_t CellIndex::allocated_count() const {
    return static_cast<std::size_t>(
        std::count_if(cells_.begin(), cells_.end(), [](const Cell& c) { return c.allocated; }));
}

std::size_t CellIndex::free_count() const {
    return static_cast<std::size_t>(
        std::count_if(cells_.begin(), cells_.end(), [](const Cell& c) {
            return !c.allocated && c.status != CellStatus::Unparsed;
        }));
}

CellIndexResult build_cell_index(ByteCursor region) {
    CellIndexBuilder builder;
    builder.region = region;
    builder.run();

    CellIndexResult result;
    result.index = std::move(builder.index);
    result.diagnostics = std::move(builder.diagnostics);
    return result;
}

ByteCursor cell_payload(ByteCursor region, const Cell& cell) {
    return region.sub_clamped(cell.payload_offset(), cell.payload_length());
}

std::string cell_signature(ByteCursor region, const Cell& cell) {
    if (cell.payload_length() < 2) {
        return {};
    }
    auto a = region.u8(cell.payload_offset());
    auto b = region.u8(cell.payload_offset() + 1);
    if (!a || !b) {
        return {};
    }
    return std::string{static_cast<char>(*a), static_cast<char>(*b)};
}

}  // namespace reghive::format
