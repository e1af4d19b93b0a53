// ==============================================================================
// reghive/cells.hpp - Модель аллокатора ячеек (hive bins / cells)
// ==============================================================================
//
// Назначение:
// - Обход hive bins начиная с file offset 4096
// - Разбиение каждого bin на ячейки (занятые: size < 0, свободные: size > 0)
// - Индекс ячеек: O(1) поиск по начальному смещению,
//   O(log n) поиск ячейки, содержащей смещение
//
// Инвариант покрытия: объединение ячеек каждого bin ровно покрывает
// [cells_begin, cells_end) этого bin, без пересечений и пропусков.
// Повреждения не прерывают разбор: ячейка получает статус и диагностику.
//
// Все смещения относительны началу области hive bins.
//
// ==============================================================================

#ifndef REGHIVE_CELLS_HPP
#define REGHIVE_CELLS_HPP

#include <reghive/cursor.hpp>
#include <reghive/diagnostics.hpp>

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace reghive::format {

// ----------------------------------------------------------------------------
// Константы
// ----------------------------------------------------------------------------

constexpr std::uint32_t HBIN_HEADER_SIZE = 32;
constexpr std::uint32_t HBIN_ALIGNMENT = 4096;
constexpr std::uint32_t CELL_ALIGNMENT = 8;
constexpr std::uint32_t CELL_SIZE_FIELD = 4;
constexpr std::uint32_t INVALID_OFFSET = 0xFFFFFFFF;

// ----------------------------------------------------------------------------
// HiveBin
// ----------------------------------------------------------------------------

struct HiveBin {
    std::uint32_t offset = 0;          // начало bin
    std::uint32_t size = 0;            // фактический размер экстента
    std::uint32_t declared_size = 0;   // поле size из заголовка bin
    std::uint32_t declared_offset = 0; // поле offset из заголовка bin
    std::uint64_t timestamp = 0;       // FILETIME (только у первого bin)
    bool valid_signature = true;       // false: псевдо-bin поверх мусора
    std::uint32_t cells_begin = 0;
    std::uint32_t cells_end = 0;
};

// ----------------------------------------------------------------------------
// Cell
// ----------------------------------------------------------------------------

enum class CellStatus {
    Ok,
    Truncated,    // экстент усечён до границы bin
    ZeroSize,     // size == 0: остаток bin одним экстентом
    InvalidSize,  // |size| не кратен 8
    Unparsed      // байты вне валидного bin
};

const char* cell_status_to_string(CellStatus status);

struct Cell {
    std::uint32_t offset = 0;        // начало ячейки (поле size)
    std::uint32_t length = 0;        // фактическая длина экстента
    std::int32_t declared_size = 0;  // как записано в файле
    bool allocated = false;
    CellStatus status = CellStatus::Ok;
    std::uint32_t bin_offset = 0;

    bool ok() const { return status == CellStatus::Ok; }

    /// Смещение полезной нагрузки (после 4-байтового поля size)
    std::uint32_t payload_offset() const { return offset + CELL_SIZE_FIELD; }

    /// Длина полезной нагрузки
    std::uint32_t payload_length() const {
        return length > CELL_SIZE_FIELD ? length - CELL_SIZE_FIELD : 0;
    }

    std::uint32_t end() const { return offset + length; }
};

// ----------------------------------------------------------------------------
// CellIndex
// ----------------------------------------------------------------------------

class CellIndex {
public:
    CellIndex() = default;

    const std::vector<HiveBin>& bins() const { return bins_; }
    const std::vector<Cell>& cells() const { return cells_; }

    /// Размер обработанной области hive bins
    std::uint32_t region_size() const { return region_size_; }

    /// Ячейка, начинающаяся ровно с offset
    const Cell* find(std::uint32_t offset) const;

    /// Ячейка, содержащая offset
    const Cell* containing(std::uint32_t offset) const;

    /// Количество занятых ячеек
    std::size_t allocated_count() const;

    /// Количество свободных ячеек
    std::size_t free_count() const;

private:
    friend struct CellIndexBuilder;

    std::vector<HiveBin> bins_;
    std::vector<Cell> cells_;  // по возрастанию offset
    std::unordered_map<std::uint32_t, std::size_t> by_offset_;
    std::uint32_t region_size_ = 0;
};

struct CellIndexResult {
    CellIndex index;
    std::vector<Diagnostic> diagnostics;
};

/// Построить индекс ячеек по области hive bins
/// @param region байты начиная с file offset 4096, уже ограниченные
///        hive_bins_data_size
CellIndexResult build_cell_index(ByteCursor region);

/// Полезная нагрузка ячейки внутри области
ByteCursor cell_payload(ByteCursor region, const Cell& cell);

/// Двухсимвольная сигнатура полезной нагрузки ("nk", "vk", ...) или ""
std::string cell_signature(ByteCursor region, const Cell& cell);

}  // namespace reghive::format

#endif  // REGHIVE_CELLS_HPP
