// ==============================================================================
// report.cpp - Сводка по разобранному hive
// ==============================================================================

#include "reghive/report.hpp"

#include "reghive/cursor.hpp"
#include "reghive/output.hpp"
#include "reghive/platform.hpp"

#include <cstdio>
#include <map>

namespace reghive::output {

namespace {

using Allocator = rapidjson::Document::AllocatorType;
using rapidjson::Value;

std::string hex32(std::uint32_t value) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "0x%08x", value);
    return buf;
}

Value json_string(const std::string& text, Allocator& a) {
    return Value(text.c_str(), static_cast<rapidjson::SizeType>(text.size()), a);
}

Value json_u64(std::size_t value) {
    return Value(static_cast<std::uint64_t>(value));
}

std::string value_display_name(const format::ValueNode& value) {
    return value.name.empty() ? "(default)" : value.name;
}

// ----------------------------------------------------------------------------
// JSON: части отчёта
// ----------------------------------------------------------------------------

Value value_data_json(const format::ValueData& data, Allocator& a) {
    if (const auto* s = data.as_string()) {
        return json_string(*s, a);
    }
    if (const auto* list = data.as_multi_string()) {
        Value arr(rapidjson::kArrayType);
        for (const auto& item : *list) {
            arr.PushBack(json_string(item, a), a);
        }
        return arr;
    }
    if (auto v = data.as_u32()) {
        return Value(*v);
    }
    if (auto v = data.as_u64()) {
        return Value(*v);
    }
    if (const auto* bytes = data.as_binary()) {
        return json_string(format_hex(*bytes, bytes->size()), a);
    }
    return Value(rapidjson::kNullType);
}

Value header_json(const HiveParser& parser, Allocator& a) {
    const auto& header = parser.hive()->header();
    const auto& original = *parser.original_header();

    Value obj(rapidjson::kObjectType);
    obj.AddMember("primary_sequence", header.primary_sequence, a);
    obj.AddMember("secondary_sequence", header.secondary_sequence, a);
    obj.AddMember("dirty", original.is_dirty(), a);
    obj.AddMember("last_written", json_string(format::format_filetime(header.last_written), a),
                  a);
    obj.AddMember("version",
                  json_string(std::to_string(header.major_version) + "." +
                                  std::to_string(header.minor_version),
                              a),
                  a);
    obj.AddMember("file_type", json_string(format::file_type_to_string(header.file_type), a), a);
    obj.AddMember("root_cell_offset", header.root_cell_offset, a);
    obj.AddMember("hive_bins_data_size", header.hive_bins_data_size, a);
    obj.AddMember("file_name", json_string(header.file_name, a), a);

    Value checksum(rapidjson::kObjectType);
    checksum.AddMember("stored", original.stored_checksum, a);
    checksum.AddMember("computed", original.computed_checksum, a);
    checksum.AddMember("valid", original.checksum_valid(), a);
    obj.AddMember("checksum", checksum, a);
    return obj;
}

Value transaction_logs_json(const HiveParser& parser, Allocator& a) {
    const auto& replay = parser.replay_result();

    Value obj(rapidjson::kObjectType);
    obj.AddMember("status", json_string(replay.applied() ? "Applied" : "NoLogApplied", a), a);

    if (replay.break_sequence) {
        obj.AddMember("break_sequence", *replay.break_sequence, a);
    } else {
        obj.AddMember("break_sequence", Value(rapidjson::kNullType), a);
    }

    Value applied(rapidjson::kArrayType);
    for (auto seq : replay.applied_sequences) {
        applied.PushBack(seq, a);
    }
    obj.AddMember("applied_sequences", applied, a);

    Value logs(rapidjson::kArrayType);
    for (std::size_t i = 0; i < replay.logs.size(); ++i) {
        const auto& log = replay.logs[i];

        Value entry_obj(rapidjson::kObjectType);
        entry_obj.AddMember("slot", json_string(txlog::log_slot_to_string(log.slot), a), a);
        if (i < parser.log_paths().size()) {
            entry_obj.AddMember("path",
                                json_string(platform::path_to_utf8(parser.log_paths()[i]), a), a);
        }
        entry_obj.AddMember("state", json_string(txlog::log_file_state_to_string(log.state), a),
                            a);

        Value entries(rapidjson::kArrayType);
        for (const auto& entry : log.entries) {
            Value e(rapidjson::kObjectType);
            e.AddMember("sequence", entry.sequence, a);
            e.AddMember("file_offset", entry.file_offset, a);
            e.AddMember("size", entry.size, a);
            e.AddMember("dirty_pages", entry.dirty_page_count, a);
            e.AddMember("state", json_string(txlog::entry_state_to_string(entry.state), a), a);
            if (!entry.reason.empty()) {
                e.AddMember("reason", json_string(entry.reason, a), a);
            }
            entries.PushBack(e, a);
        }
        entry_obj.AddMember("entries", entries, a);
        logs.PushBack(entry_obj, a);
    }
    obj.AddMember("logs", logs, a);
    return obj;
}

Value key_json(const KeySummary& key, Allocator& a) {
    Value obj(rapidjson::kObjectType);
    obj.AddMember("path", json_string(key.path, a), a);
    obj.AddMember("offset", key.offset, a);
    obj.AddMember("last_written", json_string(format::format_filetime(key.last_written), a), a);
    if (key.class_name) {
        obj.AddMember("class_name", json_string(*key.class_name, a), a);
    }
    if (key.owner) {
        obj.AddMember("owner", json_string(*key.owner, a), a);
    }

    Value subkeys(rapidjson::kArrayType);
    for (const auto& name : key.subkeys) {
        subkeys.PushBack(json_string(name, a), a);
    }
    obj.AddMember("subkeys", subkeys, a);

    Value values(rapidjson::kArrayType);
    for (const auto& value : key.values) {
        Value v(rapidjson::kObjectType);
        v.AddMember("name", json_string(value.name, a), a);
        v.AddMember("type", json_string(value.type, a), a);
        v.AddMember("length", value.length, a);
        if (value.data) {
            v.AddMember("data", value_data_json(*value.data, a), a);
        } else {
            v.AddMember("data", Value(rapidjson::kNullType), a);
        }
        values.PushBack(v, a);
    }
    obj.AddMember("values", values, a);
    return obj;
}

Value orphan_json(const recovery::OrphanRecord& orphan, Allocator& a) {
    Value obj(rapidjson::kObjectType);
    obj.AddMember("kind", json_string(recovery::orphan_kind_to_string(orphan.kind), a), a);
    obj.AddMember("offset", orphan.offset, a);
    obj.AddMember("origin", json_string(recovery::orphan_origin_to_string(orphan.origin), a), a);
    if (orphan.parent_offset) {
        obj.AddMember("parent_offset", *orphan.parent_offset, a);
    } else {
        obj.AddMember("parent_offset", Value(rapidjson::kNullType), a);
    }

    if (const auto* key = orphan.key()) {
        obj.AddMember("name", json_string(key->name, a), a);
        obj.AddMember("last_written", json_string(format::format_filetime(key->last_written), a),
                      a);
        obj.AddMember("subkey_count", key->subkey_count, a);
        obj.AddMember("value_count", key->value_count, a);
    } else if (const auto* value = orphan.value()) {
        obj.AddMember("name", json_string(value_display_name(*value), a), a);
        obj.AddMember(
            "type",
            json_string(format::value_type_to_string(format::value_type_from_raw(value->data_type)),
                        a),
            a);
        obj.AddMember("length", value->data_length(), a);
    }

    obj.AddMember("in_log_patched_region", orphan.in_log_patched_region, a);
    return obj;
}

Value diagnostic_json(const format::Diagnostic& diagnostic, Allocator& a) {
    Value obj(rapidjson::kObjectType);
    obj.AddMember("kind", json_string(format::diagnostic_kind_to_string(diagnostic.kind), a), a);
    obj.AddMember("severity", json_string(format::severity_to_string(diagnostic.severity()), a),
                  a);
    obj.AddMember("source",
                  json_string(format::diagnostic_source_to_string(diagnostic.source), a), a);
    obj.AddMember("offset", diagnostic.offset, a);
    obj.AddMember("message", json_string(diagnostic.message, a), a);
    return obj;
}

}  // namespace

// ============================================================================
// Сводка
// ============================================================================

KeySummary summarize_key(const tree::Hive& hive, const tree::KeyHandle& key) {
    KeySummary summary;
    summary.path = key.path;
    summary.offset = key.offset();
    summary.last_written = key.node.last_written;
    summary.class_name = hive.class_name(key.node);

    if (auto security = hive.resolve_security(key.node)) {
        if (security->descriptor && security->descriptor->owner) {
            summary.owner = *security->descriptor->owner;
        }
    }

    for (const auto& child : hive.children(key)) {
        summary.subkeys.push_back(child.name());
    }

    for (const auto& value : hive.values(key)) {
        ValueSummary v;
        v.offset = value.offset;
        v.name = value_display_name(value);
        v.type = format::value_type_to_string(format::value_type_from_raw(value.data_type));
        v.length = value.data_length();
        v.data = hive.typed_value(value);
        summary.values.push_back(std::move(v));
    }

    return summary;
}

HiveSummary summarize(const HiveParser& parser, const std::optional<tree::KeyHandle>& key) {
    HiveSummary summary;
    const tree::Hive* hive = parser.hive();
    if (hive == nullptr) {
        return summary;
    }

    const auto& cells = hive->cells();
    summary.bin_count = cells.bins().size();
    summary.cell_count = cells.cells().size();
    summary.allocated_cells = cells.allocated_count();
    summary.free_cells = cells.free_count();

    const auto refs = hive->collect_references();
    summary.key_count = refs.key_count;
    summary.value_count = refs.value_count;

    if (auto cursor = parser.orphans()) {
        summary.recovery_enabled = true;
        summary.orphans = cursor->collect();
        for (const auto& orphan : summary.orphans) {
            if (orphan.kind == recovery::OrphanKind::Key) {
                ++summary.orphan_keys;
            } else {
                ++summary.orphan_values;
            }
        }
    }

    if (key) {
        summary.key = summarize_key(*hive, *key);
    }

    summary.diagnostics = parser.diagnostics();
    return summary;
}

std::string render_value_data(const format::ValueData& data, std::size_t binary_limit) {
    if (const auto* s = data.as_string()) {
        return *s;
    }
    if (const auto* list = data.as_multi_string()) {
        std::string result;
        for (std::size_t i = 0; i < list->size(); ++i) {
            if (i > 0) {
                result += "; ";
            }
            result += (*list)[i];
        }
        return result;
    }
    if (auto v = data.as_u32()) {
        return std::to_string(*v) + " (" + hex32(*v) + ")";
    }
    if (auto v = data.as_u64()) {
        return std::to_string(*v);
    }
    if (const auto* bytes = data.as_binary()) {
        return format_hex(*bytes, binary_limit);
    }
    return "";
}

// ============================================================================
// JSON
// ============================================================================

void build_json_report(const HiveParser& parser, const HiveSummary& summary,
                       rapidjson::Document& doc) {
    doc.SetObject();
    auto& a = doc.GetAllocator();

    doc.AddMember("file", json_string(platform::path_to_utf8(parser.path()), a), a);
    if (parser.hive() == nullptr) {
        return;
    }

    doc.AddMember("header", header_json(parser, a), a);
    doc.AddMember("transaction_logs", transaction_logs_json(parser, a), a);

    Value counts(rapidjson::kObjectType);
    counts.AddMember("hive_bins", json_u64(summary.bin_count), a);
    counts.AddMember("cells", json_u64(summary.cell_count), a);
    counts.AddMember("allocated_cells", json_u64(summary.allocated_cells), a);
    counts.AddMember("free_cells", json_u64(summary.free_cells), a);
    counts.AddMember("keys", json_u64(summary.key_count), a);
    counts.AddMember("values", json_u64(summary.value_count), a);
    counts.AddMember("orphan_keys", json_u64(summary.orphan_keys), a);
    counts.AddMember("orphan_values", json_u64(summary.orphan_values), a);
    counts.AddMember("diagnostics", json_u64(summary.diagnostics.size()), a);
    doc.AddMember("counts", counts, a);

    if (summary.key) {
        doc.AddMember("key", key_json(*summary.key, a), a);
    }

    if (summary.recovery_enabled) {
        Value orphans(rapidjson::kArrayType);
        for (const auto& orphan : summary.orphans) {
            orphans.PushBack(orphan_json(orphan, a), a);
        }
        doc.AddMember("orphans", orphans, a);
    }

    Value diagnostics(rapidjson::kArrayType);
    for (const auto& diagnostic : summary.diagnostics) {
        diagnostics.PushBack(diagnostic_json(diagnostic, a), a);
    }
    doc.AddMember("diagnostics", diagnostics, a);
}

// ============================================================================
// Текст
// ============================================================================

std::string render_text_report(const HiveParser& parser, const HiveSummary& summary, bool full) {
    std::string out;
    const tree::Hive* hive = parser.hive();
    if (hive == nullptr) {
        return out;
    }

    const auto& header = hive->header();
    const auto& original = *parser.original_header();

    // --- Заголовок ---
    Table header_table;
    header_table.set_headers({"Field", "Value"});
    header_table.add_row({"File", platform::path_to_utf8(parser.path())});
    header_table.add_row({"File name", header.file_name});
    header_table.add_row({"Version", std::to_string(header.major_version) + "." +
                                         std::to_string(header.minor_version)});
    header_table.add_row({"Last written", format::format_filetime(header.last_written)});
    header_table.add_row({"Sequence", std::to_string(original.primary_sequence) + " / " +
                                          std::to_string(original.secondary_sequence) +
                                          (original.is_dirty() ? " (dirty)" : "")});
    if (parser.transaction_logs_applied()) {
        header_table.add_row({"Sequence after replay", std::to_string(header.primary_sequence)});
    }
    header_table.add_row({"Root cell", hex32(header.root_cell_offset)});
    header_table.add_row({"Checksum", hex32(original.stored_checksum) +
                                          (original.checksum_valid() ? " (valid)" : " (invalid)")});
    out += header_table.to_string();

    // --- Журналы ---
    const auto& replay = parser.replay_result();
    if (!replay.logs.empty()) {
        Table log_table;
        log_table.set_headers(
            {"Log", "State", "Entries", "Applied", "Stale", "Rejected", "Superseded"});
        for (std::size_t i = 0; i < replay.logs.size(); ++i) {
            const auto& log = replay.logs[i];
            std::string name = i < parser.log_paths().size()
                                   ? platform::path_to_utf8(parser.log_paths()[i].filename())
                                   : txlog::log_slot_to_string(log.slot);
            log_table.add_row({name, txlog::log_file_state_to_string(log.state),
                               std::to_string(log.entries.size()),
                               std::to_string(log.count(txlog::EntryState::Applied)),
                               std::to_string(log.count(txlog::EntryState::Stale)),
                               std::to_string(log.count(txlog::EntryState::Rejected)),
                               std::to_string(log.count(txlog::EntryState::Superseded))});
        }
        out += log_table.to_string();
    }

    // --- Счётчики ---
    Table counts;
    counts.set_headers({"Item", "Count"});
    counts.add_row({"Hive bins", std::to_string(summary.bin_count)});
    counts.add_row({"Cells (allocated / free)", std::to_string(summary.allocated_cells) + " / " +
                                                    std::to_string(summary.free_cells)});
    counts.add_row({"Keys", std::to_string(summary.key_count)});
    counts.add_row({"Values", std::to_string(summary.value_count)});
    if (summary.recovery_enabled) {
        counts.add_row({"Deleted keys", std::to_string(summary.orphan_keys)});
        counts.add_row({"Deleted values", std::to_string(summary.orphan_values)});
    }
    counts.add_row({"Diagnostics", std::to_string(summary.diagnostics.size())});
    out += counts.to_string();

    // --- Ключ ---
    if (summary.key) {
        const auto& key = *summary.key;
        out += "\n" + key.path + "\n";
        out += "  Last written: " + format::format_filetime(key.last_written) + "\n";
        if (key.class_name) {
            out += "  Class: " + *key.class_name + "\n";
        }
        if (key.owner) {
            out += "  Owner: " + *key.owner + "\n";
        }
        for (const auto& name : key.subkeys) {
            out += "  [" + name + "]\n";
        }
        if (!key.values.empty()) {
            Table values;
            values.set_headers({"Name", "Type", "Size", "Data"});
            for (const auto& value : key.values) {
                values.add_row({value.name, value.type, std::to_string(value.length),
                                value.data ? format_field_length(
                                                 render_value_data(*value.data, TEXT_BINARY_LIMIT),
                                                 80)
                                           : "<unavailable>"});
            }
            out += values.to_string();
        }
    }

    // --- Удалённые записи ---
    if (!summary.orphans.empty()) {
        Table orphans;
        orphans.set_headers({"Kind", "Offset", "Origin", "Name", "Parent", "Log patched"});
        std::size_t shown = 0;
        for (const auto& orphan : summary.orphans) {
            if (!full && shown == TEXT_ROW_LIMIT) {
                break;
            }
            std::string name;
            if (const auto* k = orphan.key()) {
                name = k->name;
            } else if (const auto* v = orphan.value()) {
                name = value_display_name(*v);
            }
            orphans.add_row({recovery::orphan_kind_to_string(orphan.kind), hex32(orphan.offset),
                             recovery::orphan_origin_to_string(orphan.origin),
                             format_field_length(name, 40),
                             orphan.parent_offset ? hex32(*orphan.parent_offset) : "-",
                             orphan.in_log_patched_region ? "yes" : "no"});
            ++shown;
        }
        out += orphans.to_string();
        if (shown < summary.orphans.size()) {
            out += "... " + std::to_string(summary.orphans.size() - shown) +
                   " more deleted records (use -v to list all)\n";
        }
    }

    // --- Диагностики ---
    if (!summary.diagnostics.empty()) {
        std::map<std::string, std::size_t> by_kind;
        for (const auto& d : summary.diagnostics) {
            ++by_kind[format::diagnostic_kind_to_string(d.kind)];
        }

        if (full) {
            Table diagnostics;
            diagnostics.set_headers({"Kind", "Severity", "Source", "Offset", "Message"});
            for (const auto& d : summary.diagnostics) {
                diagnostics.add_row({format::diagnostic_kind_to_string(d.kind),
                                     format::severity_to_string(d.severity()),
                                     format::diagnostic_source_to_string(d.source),
                                     hex32(d.offset), format_field_length(d.message, 80)});
            }
            out += diagnostics.to_string();
        } else {
            Table diagnostics;
            diagnostics.set_headers({"Diagnostic", "Count"});
            for (const auto& [kind, count] : by_kind) {
                diagnostics.add_row({kind, std::to_string(count)});
            }
            out += diagnostics.to_string();
        }
    }

    return out;
}

}  // namespace reghive::output
