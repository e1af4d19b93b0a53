// ==============================================================================
// reghive/recovery.hpp - Восстановление удалённых и недостижимых записей
// ==============================================================================
//
// Назначение:
// - Поиск key/value nodes вне логического дерева
//   (свободные ячейки и занятые, но недостижимые ячейки)
// - Проверка правдоподобия кандидатов
// - Устранение дубликатов по содержимому (FNV-1a 64 + сравнение байт)
// - Предполагаемый родитель для восстановленных записей
//
// Порядок выдачи:
// 1. восстановленные ключи, за каждым значения из его собственного списка
// 2. оставшиеся одиночные значения
//
// ==============================================================================

#ifndef REGHIVE_RECOVERY_HPP
#define REGHIVE_RECOVERY_HPP

#include <reghive/cursor.hpp>
#include <reghive/hive.hpp>
#include <reghive/records.hpp>
#include <reghive/txlog.hpp>

#include <cstdint>
#include <deque>
#include <optional>
#include <unordered_map>
#include <variant>
#include <vector>

namespace reghive::recovery {

enum class OrphanKind { Key, Value };

enum class OrphanOrigin {
    FreeCell,             // найдено внутри свободной ячейки
    UnreachableAllocated  // занятая ячейка без ссылок из дерева
};

const char* orphan_kind_to_string(OrphanKind kind);
const char* orphan_origin_to_string(OrphanOrigin origin);

/// FNV-1a 64
std::uint64_t fnv1a64(const std::uint8_t* data, std::size_t length);

// ----------------------------------------------------------------------------
// OrphanRecord
// ----------------------------------------------------------------------------

struct OrphanRecord {
    OrphanKind kind = OrphanKind::Key;
    std::uint32_t offset = 0;  // начало (бывшей) ячейки
    bool unlinked = true;
    OrphanOrigin origin = OrphanOrigin::FreeCell;
    std::optional<std::uint32_t> parent_offset;
    std::uint64_t content_hash = 0;
    std::variant<format::KeyNode, format::ValueNode> record;

    /// Запись лежит в диапазоне, перезаписанном журналом транзакций
    bool in_log_patched_region = false;

    const format::KeyNode* key() const { return std::get_if<format::KeyNode>(&record); }
    const format::ValueNode* value() const { return std::get_if<format::ValueNode>(&record); }
};

// ----------------------------------------------------------------------------
// OrphanCursor
// ----------------------------------------------------------------------------

/// Ленивый сканер. Однопроходный: для повторного обхода создать новый.
class OrphanCursor {
public:
    explicit OrphanCursor(const tree::Hive& hive,
                          std::vector<txlog::PatchedRange> patched_ranges = {});

    /// Следующая восстановленная запись; false когда сканирование завершено
    bool next(OrphanRecord& out);

    /// Выбрать все оставшиеся записи
    std::vector<OrphanRecord> collect();

    std::size_t emitted() const { return emitted_; }

private:
    enum class Phase { Keys, Values, Done };

    struct Candidate {
        std::uint32_t offset = 0;
        format::ByteCursor payload;
        OrphanOrigin origin = OrphanOrigin::FreeCell;
    };

    struct Span {
        std::uint32_t start = 0;  // смещение в области hive bins
        std::uint32_t length = 0;
    };

    void initialize();
    bool next_candidate(const char* signature, Candidate& out);
    void next_cell();

    void try_key(const Candidate& candidate);
    std::optional<OrphanRecord> try_value(const Candidate& candidate,
                                          std::optional<std::uint32_t> parent);

    /// Ячейка по её (возможно устаревшему) полю size
    std::optional<format::ByteCursor> old_cell_payload(std::uint32_t offset,
                                                       std::uint32_t limit) const;
    OrphanOrigin origin_at(std::uint32_t offset) const;

    /// Проверить и запомнить структурные байты записи
    bool remember(format::ByteCursor payload, std::uint32_t length, std::uint64_t& hash);
    bool in_patched(std::uint32_t offset, std::uint32_t length) const;

    const tree::Hive* hive_;
    format::ByteCursor region_;
    std::vector<txlog::PatchedRange> patched_;

    bool initialized_ = false;
    tree::ReferenceSet refs_;
    std::unordered_map<std::uint64_t, std::vector<Span>> seen_;

    Phase phase_ = Phase::Keys;
    std::size_t cell_index_ = 0;
    std::uint32_t scan_pos_ = 0;
    std::deque<OrphanRecord> pending_;
    std::size_t emitted_ = 0;
};

}  // namespace reghive::recovery

#endif  // REGHIVE_RECOVERY_HPP
