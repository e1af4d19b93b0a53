// ==============================================================================
// hive.cpp - Логическое дерево: ключи, значения, данные, security
// ==============================================================================

#include "reghive/hive.hpp"

#include <algorithm>
#include <cstdio>
#include <mutex>
#include <unordered_map>

namespace reghive::tree {

using format::ByteCursor;
using format::DiagnosticKind;
using format::INVALID_OFFSET;

// ============================================================================
// Hive::Impl
// ============================================================================

struct Hive::Impl {
    std::vector<std::uint8_t> bytes;
    format::HiveHeader header;
    TreeOptions options;
    ByteCursor region;
    format::CellIndex index;

    mutable format::DiagnosticLog diagnostics;

    mutable std::mutex security_mutex;
    mutable std::unordered_map<std::uint32_t, std::shared_ptr<const SecurityInfo>>
        security_cache;
};

namespace {

std::string hex(std::uint32_t value) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "0x%08x", value);
    return buf;
}

void report(const Hive& hive, DiagnosticKind kind, std::uint32_t offset, std::string message) {
    hive.diagnostics().add(format::make_diagnostic(kind, offset, std::move(message)));
}

template <typename T>
std::optional<T> take(const Hive& hive, format::Decoded<T>&& decoded) {
    hive.diagnostics().add_all(decoded.diagnostics);
    return std::move(decoded.record);
}

}  // anonymous namespace

// ============================================================================
// KeyHandle
// ============================================================================

bool KeyHandle::on_path(std::uint32_t offset) const {
    if (offset == node.offset) {
        return true;
    }
    return std::find(ancestors.begin(), ancestors.end(), offset) != ancestors.end();
}

// ============================================================================
// Hive: построение
// ============================================================================

Hive::Hive(std::vector<std::uint8_t> bytes, format::HiveHeader header, TreeOptions options,
           const std::vector<format::Diagnostic>& diagnostics)
    : impl_(std::make_unique<Impl>()) {
    impl_->bytes = std::move(bytes);
    impl_->header = std::move(header);
    impl_->options = options;
    impl_->diagnostics.add_all(diagnostics);

    ByteCursor whole(impl_->bytes);
    const std::size_t available =
        whole.size() > format::HIVE_BINS_OFFSET ? whole.size() - format::HIVE_BINS_OFFSET : 0;
    const std::size_t declared = impl_->header.hive_bins_data_size;

    if (declared > available) {
        impl_->diagnostics.add(format::make_diagnostic(
            DiagnosticKind::HiveBinsTruncated, 0x28,
            "hive bins data size " + hex(static_cast<std::uint32_t>(declared)) +
                " exceeds file, " + hex(static_cast<std::uint32_t>(available)) +
                " bytes available",
            format::DiagnosticSource::Header));
    }

    impl_->region = whole.sub_clamped(format::HIVE_BINS_OFFSET, std::min(declared, available));

    auto built = format::build_cell_index(impl_->region);
    impl_->index = std::move(built.index);
    impl_->diagnostics.add_all(built.diagnostics);
}

Hive::~Hive() = default;
Hive::Hive(Hive&&) noexcept = default;
Hive& Hive::operator=(Hive&&) noexcept = default;

const format::HiveHeader& Hive::header() const {
    return impl_->header;
}

const format::CellIndex& Hive::cells() const {
    return impl_->index;
}

const TreeOptions& Hive::options() const {
    return impl_->options;
}

ByteCursor Hive::bytes() const {
    return ByteCursor(impl_->bytes);
}

ByteCursor Hive::region() const {
    return impl_->region;
}

format::DiagnosticLog& Hive::diagnostics() const {
    return impl_->diagnostics;
}

// ============================================================================
// Записи по смещению
// ============================================================================

std::optional<ByteCursor> Hive::payload_at(std::uint32_t offset) const {
    const format::Cell* cell = impl_->index.find(offset);
    if (cell == nullptr) {
        report(*this, DiagnosticKind::InvalidOffset, offset, "no cell starts at offset");
        return std::nullopt;
    }
    if (!cell->ok()) {
        report(*this, DiagnosticKind::InvalidOffset, offset,
               std::string("referenced cell is ") + format::cell_status_to_string(cell->status));
        return std::nullopt;
    }
    return format::cell_payload(impl_->region, *cell);
}

std::optional<format::KeyNode> Hive::key_at(std::uint32_t offset) const {
    auto payload = payload_at(offset);
    if (!payload) {
        return std::nullopt;
    }
    return take(*this, format::decode_key_node(*payload, offset));
}

std::optional<format::ValueNode> Hive::value_at(std::uint32_t offset) const {
    auto payload = payload_at(offset);
    if (!payload) {
        return std::nullopt;
    }
    return take(*this, format::decode_value_node(*payload, offset));
}

std::optional<format::SubkeyList> Hive::subkey_list_at(std::uint32_t offset) const {
    auto payload = payload_at(offset);
    if (!payload) {
        return std::nullopt;
    }
    return take(*this, format::decode_subkey_list(*payload, offset));
}

// ============================================================================
// Дерево
// ============================================================================

std::optional<KeyHandle> Hive::root() const {
    auto node = key_at(impl_->header.root_cell_offset);
    if (!node) {
        return std::nullopt;
    }
    KeyHandle root;
    root.path = "\\" + node->name;
    root.node = std::move(*node);
    return root;
}

ChildRange Hive::children(const KeyHandle& key) const {
    return ChildRange(this, key);
}

ValueRange Hive::values(const format::KeyNode& key) const {
    return ValueRange(this, key);
}

KeyWalker Hive::walk() const {
    return KeyWalker(this, root());
}

KeyWalker Hive::walk(const KeyHandle& start) const {
    return KeyWalker(this, start);
}

std::optional<KeyHandle> Hive::find_key(std::string_view path, bool path_has_root) const {
    std::vector<std::string_view> parts;
    std::size_t pos = 0;
    while (pos <= path.size()) {
        std::size_t next = path.find('\\', pos);
        if (next == std::string_view::npos) {
            next = path.size();
        }
        if (next > pos) {
            parts.push_back(path.substr(pos, next - pos));
        }
        pos = next + 1;
    }

    auto current = root();
    if (!current) {
        return std::nullopt;
    }

    std::size_t first = 0;
    if (path_has_root) {
        if (parts.empty() || !format::iequals(parts[0], current->name())) {
            return std::nullopt;
        }
        first = 1;
    }

    for (std::size_t i = first; i < parts.size(); ++i) {
        std::optional<KeyHandle> found;
        for (const auto& child : children(*current)) {
            if (format::iequals(child.name(), parts[i])) {
                found = child;
                break;
            }
        }
        if (!found) {
            return std::nullopt;
        }
        current = std::move(found);
    }
    return current;
}

// ============================================================================
// Данные значений
// ============================================================================

std::optional<std::vector<std::uint8_t>> Hive::value_data(const format::ValueNode& value) const {
    const std::uint32_t length = value.data_length();

    if (value.is_inline()) {
        if (length > 4) {
            report(*this, DiagnosticKind::DataLengthMismatch, value.offset,
                   "inline value declares " + std::to_string(length) + " bytes");
        }
        return value.inline_data();
    }
    if (length == 0) {
        return std::vector<std::uint8_t>{};
    }
    if (value.data_offset == INVALID_OFFSET) {
        report(*this, DiagnosticKind::InvalidOffset, value.offset,
               "value declares " + std::to_string(length) + " bytes without data cell");
        return std::nullopt;
    }

    auto payload = payload_at(value.data_offset);
    if (!payload) {
        return std::nullopt;
    }

    if (value.storage() == format::DataStorage::BigData && payload->matches(0, "db")) {
        return resolve_big_data(value);
    }

    if (payload->size() < length) {
        report(*this, DiagnosticKind::DataLengthMismatch, value.offset,
               "value declares " + std::to_string(length) + " bytes, data cell holds " +
                   std::to_string(payload->size()));
        return payload->to_vector();
    }
    return payload->copy(0, length);
}

std::optional<format::ValueData> Hive::typed_value(const format::ValueNode& value) const {
    auto raw = value_data(value);
    if (!raw) {
        return std::nullopt;
    }
    std::vector<format::Diagnostic> diagnostics;
    auto typed = format::interpret_value_data(value.data_type, *raw, value.offset, diagnostics);
    impl_->diagnostics.add_all(diagnostics);
    return typed;
}

std::optional<std::vector<std::uint8_t>>
Hive::resolve_big_data(const format::ValueNode& value) const {
    if (value.is_inline() || value.data_offset == INVALID_OFFSET) {
        return std::nullopt;
    }

    auto payload = payload_at(value.data_offset);
    if (!payload || !payload->matches(0, "db")) {
        return std::nullopt;
    }

    auto db = take(*this, format::decode_big_data(*payload, value.data_offset));
    if (!db) {
        return std::nullopt;
    }

    auto list_payload = payload_at(db->segment_list_offset);
    if (!list_payload) {
        return std::nullopt;
    }
    auto segments = take(*this, format::decode_segment_list(
                                    *list_payload, db->segment_list_offset, db->segment_count));
    if (!segments) {
        return std::nullopt;
    }

    const std::uint32_t length = value.data_length();
    std::vector<std::uint8_t> data;
    data.reserve(length);

    std::uint32_t remaining = length;
    for (std::uint32_t segment : *segments) {
        if (remaining == 0) {
            break;
        }
        auto seg = payload_at(segment);
        if (!seg) {
            break;
        }
        std::size_t n = std::min<std::size_t>(
            {remaining, format::BIG_DATA_SEGMENT_SIZE, seg->size()});
        data.insert(data.end(), seg->data(), seg->data() + n);
        remaining -= static_cast<std::uint32_t>(n);
    }

    if (data.size() != length) {
        report(*this, DiagnosticKind::BigDataLengthMismatch, value.offset,
               "big data declares " + std::to_string(length) + " bytes, " +
                   std::to_string(db->segment_count) + " segments hold " +
                   std::to_string(data.size()));
    }
    return data;
}

// ============================================================================
// Security / class name
// ============================================================================

namespace {

std::shared_ptr<const SecurityInfo>
security_at(const Hive& hive, std::uint32_t offset, std::mutex& mutex,
            std::unordered_map<std::uint32_t, std::shared_ptr<const SecurityInfo>>& cache) {
    {
        std::lock_guard<std::mutex> lock(mutex);
        auto it = cache.find(offset);
        if (it != cache.end()) {
            return it->second;
        }
    }

    auto payload = hive.payload_at(offset);
    if (!payload) {
        return nullptr;
    }
    auto sk = take(hive, format::decode_security_key(*payload, offset));
    if (!sk) {
        return nullptr;
    }

    auto info = std::make_shared<SecurityInfo>();
    info->key = std::move(*sk);
    info->descriptor = format::parse_security_descriptor(ByteCursor(info->key.descriptor));

    std::lock_guard<std::mutex> lock(mutex);
    auto inserted = cache.emplace(offset, std::move(info));
    return inserted.first->second;
}

}  // anonymous namespace

std::shared_ptr<const SecurityInfo> Hive::resolve_security(const format::KeyNode& key) const {
    if (key.security_offset == INVALID_OFFSET) {
        return nullptr;
    }
    return security_at(*this, key.security_offset, impl_->security_mutex,
                       impl_->security_cache);
}

std::vector<std::uint32_t> Hive::security_chain(const format::KeyNode& key) const {
    std::vector<std::uint32_t> chain;
    const std::uint32_t start = key.security_offset;
    if (start == INVALID_OFFSET) {
        return chain;
    }

    std::unordered_set<std::uint32_t> visited;
    std::uint32_t current = start;
    std::optional<std::uint32_t> previous;

    while (true) {
        auto info =
            security_at(*this, current, impl_->security_mutex, impl_->security_cache);
        if (!info) {
            if (previous) {
                report(*this, DiagnosticKind::SecurityChainBroken, *previous,
                       "flink " + hex(current) + " does not resolve to a security key");
            }
            break;
        }
        if (previous && info->key.blink != *previous) {
            report(*this, DiagnosticKind::SecurityChainBroken, current,
                   "blink " + hex(info->key.blink) + " does not point back to " +
                       hex(*previous));
        }

        chain.push_back(current);
        visited.insert(current);

        const std::uint32_t next = info->key.flink;
        if (next == start) {
            break;
        }
        if (visited.count(next) != 0) {
            report(*this, DiagnosticKind::SecurityChainBroken, current,
                   "flink " + hex(next) + " loops without returning to " + hex(start));
            break;
        }
        previous = current;
        current = next;
    }
    return chain;
}

std::optional<std::string> Hive::class_name(const format::KeyNode& key) const {
    if (!key.has_class_name()) {
        return std::nullopt;
    }
    auto payload = payload_at(key.class_name_offset);
    if (!payload) {
        return std::nullopt;
    }

    ByteCursor raw = payload->sub_clamped(0, key.class_name_length);
    if (raw.size() < key.class_name_length) {
        report(*this, DiagnosticKind::TruncatedRecord, key.class_name_offset,
               "class name length " + std::to_string(key.class_name_length) +
                   " exceeds cell, " + std::to_string(raw.size()) + " bytes available");
    }
    auto decoded = format::decode_utf16le(raw);
    if (decoded.lossy) {
        report(*this, DiagnosticKind::InvalidStringEncoding, key.class_name_offset,
               "class name is not valid UTF-16");
    }
    return decoded.text;
}

// ============================================================================
// ChildRange
// ============================================================================

ChildRange::ChildRange(const Hive* hive, KeyHandle parent)
    : hive_(hive), parent_(std::make_shared<const KeyHandle>(std::move(parent))) {}

ChildRange::iterator ChildRange::begin() const {
    return iterator(hive_, parent_);
}

ChildRange::iterator::iterator(const Hive* hive, std::shared_ptr<const KeyHandle> parent)
    : hive_(hive), parent_(std::move(parent)) {
    const format::KeyNode& node = parent_->node;

    if (node.subkey_list_offset == INVALID_OFFSET) {
        if (node.subkey_count != 0) {
            report(*hive_, DiagnosticKind::CountMismatch, node.offset,
                   "key declares " + std::to_string(node.subkey_count) +
                       " subkeys without subkey list");
        }
        hive_ = nullptr;
        return;
    }

    auto list = hive_->subkey_list_at(node.subkey_list_offset);
    if (!list) {
        hive_ = nullptr;
        return;
    }
    push_list(*list);
    advance();
}

void ChildRange::iterator::push_list(const format::SubkeyList& list) {
    ListFrame frame;
    frame.list_offset = list.offset;
    frame.kind = list.kind;
    frame.offsets = list.offsets;
    frame.hints = list.hints;
    if (list.kind == format::SubkeyListKind::IndexRoot) {
        ++index_root_depth_;
    }
    frames_.push_back(std::move(frame));
}

ChildRange::iterator& ChildRange::iterator::operator++() {
    advance();
    return *this;
}

bool ChildRange::iterator::operator==(const iterator& other) const {
    if (hive_ != other.hive_) {
        return false;
    }
    return hive_ == nullptr ||
           (current_.offset() == other.current_.offset() && listed_ == other.listed_);
}

void ChildRange::iterator::advance() {
    const TreeOptions& options = hive_->options();

    while (!frames_.empty()) {
        ListFrame& frame = frames_.back();
        if (frame.pos >= frame.offsets.size()) {
            if (frame.kind == format::SubkeyListKind::IndexRoot) {
                --index_root_depth_;
            }
            frames_.pop_back();
            continue;
        }

        const std::size_t i = frame.pos++;
        const std::uint32_t offset = frame.offsets[i];

        if (frame.kind == format::SubkeyListKind::IndexRoot) {
            const std::uint32_t owner = frame.list_offset;
            bool looped = std::any_of(frames_.begin(), frames_.end(), [offset](const ListFrame& f) {
                return f.list_offset == offset;
            });
            if (looped) {
                report(*hive_, DiagnosticKind::CycleDetected, owner,
                       "index root refers back to list " + hex(offset));
                continue;
            }
            auto sub = hive_->subkey_list_at(offset);
            if (!sub) {
                continue;
            }
            if (sub->kind == format::SubkeyListKind::IndexRoot &&
                index_root_depth_ >= options.max_index_root_depth) {
                report(*hive_, DiagnosticKind::DepthExceeded, offset,
                       "index root nesting exceeds " +
                           std::to_string(options.max_index_root_depth));
                continue;
            }
            push_list(*sub);
            continue;
        }

        ++listed_;
        const format::SubkeyListKind kind = frame.kind;
        const std::uint32_t hint = i < frame.hints.size() ? frame.hints[i] : 0;

        if (parent_->on_path(offset)) {
            report(*hive_, DiagnosticKind::CycleDetected, offset,
                   "subkey of " + hex(parent_->offset()) + " is already on path " +
                       parent_->path);
            continue;
        }
        if (parent_->depth + 1 > options.max_depth) {
            report(*hive_, DiagnosticKind::DepthExceeded, offset,
                   "key depth exceeds " + std::to_string(options.max_depth) + " under " +
                       parent_->path);
            continue;
        }

        auto child = hive_->key_at(offset);
        if (!child) {
            continue;
        }

        if (child->parent_offset != parent_->offset()) {
            report(*hive_, DiagnosticKind::ParentMismatch, offset,
                   "parent field " + hex(child->parent_offset) + " differs from listing key " +
                       hex(parent_->offset()));
        }
        check_hint(*child, kind, hint);

        current_.ancestors = parent_->ancestors;
        current_.ancestors.push_back(parent_->offset());
        current_.path = parent_->path + "\\" + child->name;
        current_.depth = parent_->depth + 1;
        current_.node = std::move(*child);
        return;
    }

    finish();
}

void ChildRange::iterator::check_hint(const format::KeyNode& child, format::SubkeyListKind kind,
                                      std::uint32_t hint) const {
    std::optional<std::uint32_t> expected;
    if (kind == format::SubkeyListKind::HashLeaf) {
        expected = format::lh_name_hash(child.name);
    } else if (kind == format::SubkeyListKind::FastLeaf) {
        expected = format::lf_name_hint(child.name);
    }
    if (expected && *expected != hint) {
        report(*hive_, DiagnosticKind::SubkeyHashMismatch, child.offset,
               std::string(format::subkey_list_kind_to_string(kind)) + " entry " + hex(hint) +
                   " does not match name '" + child.name + "' (" + hex(*expected) + ")");
    }
}

void ChildRange::iterator::finish() {
    if (listed_ != parent_->node.subkey_count) {
        report(*hive_, DiagnosticKind::CountMismatch, parent_->offset(),
               "key declares " + std::to_string(parent_->node.subkey_count) +
                   " subkeys, lists " + std::to_string(listed_));
    }
    frames_.clear();
    hive_ = nullptr;
}

// ============================================================================
// ValueRange
// ============================================================================

ValueRange::ValueRange(const Hive* hive, const format::KeyNode& key) : hive_(hive) {
    auto offsets = std::make_shared<std::vector<std::uint32_t>>();

    if (key.value_count != 0) {
        if (key.value_list_offset == INVALID_OFFSET) {
            report(*hive_, DiagnosticKind::CountMismatch, key.offset,
                   "key declares " + std::to_string(key.value_count) +
                       " values without value list");
        } else if (auto payload = hive_->payload_at(key.value_list_offset)) {
            auto list = take(*hive_, format::decode_value_list(*payload, key.value_list_offset,
                                                               key.value_count));
            if (list) {
                *offsets = std::move(list->offsets);
            }
            if (offsets->size() != key.value_count) {
                report(*hive_, DiagnosticKind::CountMismatch, key.offset,
                       "key declares " + std::to_string(key.value_count) + " values, lists " +
                           std::to_string(offsets->size()));
            }
        }
    }

    offsets_ = std::move(offsets);
}

ValueRange::iterator ValueRange::begin() const {
    return iterator(hive_, offsets_);
}

ValueRange::iterator::iterator(const Hive* hive,
                               std::shared_ptr<const std::vector<std::uint32_t>> offsets)
    : hive_(hive), offsets_(std::move(offsets)) {
    advance();
}

ValueRange::iterator& ValueRange::iterator::operator++() {
    advance();
    return *this;
}

bool ValueRange::iterator::operator==(const iterator& other) const {
    if (hive_ != other.hive_) {
        return false;
    }
    return hive_ == nullptr || pos_ == other.pos_;
}

void ValueRange::iterator::advance() {
    while (pos_ < offsets_->size()) {
        auto value = hive_->value_at((*offsets_)[pos_++]);
        if (value) {
            current_ = std::move(*value);
            return;
        }
    }
    hive_ = nullptr;
}

// ============================================================================
// KeyWalker
// ============================================================================

KeyWalker::KeyWalker(const Hive* hive, std::optional<KeyHandle> start)
    : hive_(hive), pending_(std::move(start)) {}

bool KeyWalker::next(KeyHandle& out) {
    if (pending_) {
        out = std::move(*pending_);
        pending_.reset();
        stack_.push_back(hive_->children(out).begin());
        return true;
    }

    while (!stack_.empty()) {
        auto& top = stack_.back();
        if (top.at_end()) {
            stack_.pop_back();
            continue;
        }
        out = *top;
        ++top;
        stack_.push_back(hive_->children(out).begin());
        return true;
    }
    return false;
}

}  // namespace reghive::tree
