// ==============================================================================
// references.cpp - Множество ячеек, достижимых из дерева
// ==============================================================================
//
// Учитываются: key nodes, списки подключей (включая подсписки ri),
// списки значений, value nodes, ячейки данных (включая db и сегменты),
// sk кольцо, class name. Всё остальное сканер восстановления считает
// кандидатом в удалённые записи.
//
// ==============================================================================

#include "reghive/hive.hpp"

#include <unordered_set>
#include <vector>

namespace reghive::tree {

namespace {

using format::INVALID_OFFSET;

void add_subkey_lists(const Hive& hive, std::uint32_t offset, std::uint32_t depth,
                      ReferenceSet& refs) {
    if (offset == INVALID_OFFSET || refs.contains(offset)) {
        return;
    }
    auto list = hive.subkey_list_at(offset);
    if (!list) {
        return;
    }
    refs.cells.insert(offset);

    if (list->kind != format::SubkeyListKind::IndexRoot ||
        depth >= hive.options().max_index_root_depth) {
        return;
    }
    for (std::uint32_t sub : list->offsets) {
        add_subkey_lists(hive, sub, depth + 1, refs);
    }
}

void add_data_cells(const Hive& hive, const format::ValueNode& value, ReferenceSet& refs) {
    if (value.is_inline() || value.data_length() == 0 || value.data_offset == INVALID_OFFSET) {
        return;
    }
    refs.cells.insert(value.data_offset);

    if (value.storage() != format::DataStorage::BigData) {
        return;
    }
    auto payload = hive.payload_at(value.data_offset);
    if (!payload || !payload->matches(0, "db")) {
        return;
    }
    auto db = format::decode_big_data(*payload, value.data_offset);
    hive.diagnostics().add_all(db.diagnostics);
    if (!db.record || db.record->segment_list_offset == INVALID_OFFSET) {
        return;
    }

    refs.cells.insert(db.record->segment_list_offset);
    auto list_payload = hive.payload_at(db.record->segment_list_offset);
    if (!list_payload) {
        return;
    }
    auto segments = format::decode_segment_list(*list_payload, db.record->segment_list_offset,
                                                db.record->segment_count);
    hive.diagnostics().add_all(segments.diagnostics);
    if (segments.record) {
        for (std::uint32_t segment : *segments.record) {
            refs.cells.insert(segment);
        }
    }
}

}  // anonymous namespace

ReferenceSet Hive::collect_references() const {
    ReferenceSet refs;

    // Каждый ключ раскрывается один раз: повторные ссылки на подключ
    // (DAG из списков) не размножают обход по путям
    std::unordered_set<std::uint32_t> visited;
    std::vector<KeyHandle> pending;
    if (auto start = root()) {
        pending.push_back(std::move(*start));
    }

    while (!pending.empty()) {
        KeyHandle key = std::move(pending.back());
        pending.pop_back();
        if (!visited.insert(key.offset()).second) {
            continue;
        }

        const format::KeyNode& node = key.node;
        ++refs.key_count;
        refs.cells.insert(node.offset);

        add_subkey_lists(*this, node.subkey_list_offset, 0, refs);

        if (node.security_offset != INVALID_OFFSET && !refs.contains(node.security_offset)) {
            for (std::uint32_t sk : security_chain(node)) {
                refs.cells.insert(sk);
            }
        }

        if (node.has_class_name()) {
            refs.cells.insert(node.class_name_offset);
        }

        if (node.value_count != 0 && node.value_list_offset != INVALID_OFFSET) {
            refs.cells.insert(node.value_list_offset);
        }
        for (const auto& value : values(node)) {
            if (!refs.cells.insert(value.offset).second) {
                continue;
            }
            ++refs.value_count;
            add_data_cells(*this, value, refs);
        }

        for (const auto& child : children(key)) {
            if (visited.count(child.offset()) == 0) {
                pending.push_back(child);
            }
        }
    }

    return refs;
}

}  // namespace reghive::tree
