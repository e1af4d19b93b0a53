// ==============================================================================
// reghive/hive.hpp - Логическое дерево ключей и значений
// ==============================================================================
//
// Назначение:
// - Владение (возможно исправленным журналами) буфером hive и индексом ячеек
// - Ленивый обход: корень -> подключи -> значения -> данные
// - Разрешение big data, security descriptor, class name
// - Поиск ключа по пути без учёта регистра
// - Множество ячеек, достижимых из дерева (для восстановления)
//
// Политика обхода:
// - подключ, смещение которого уже есть на пути от корня, пропускается
//   (CycleDetected); соседние подключи продолжают обрабатываться
// - глубина больше max_depth пропускается (DepthExceeded)
// - вложенность ri ограничена max_index_root_depth
//
// После построения Hive неизменяем (кроме журнала диагностик и кэша
// security), обход из нескольких потоков безопасен.
//
// ==============================================================================

#ifndef REGHIVE_HIVE_HPP
#define REGHIVE_HIVE_HPP

#include <reghive/cells.hpp>
#include <reghive/cursor.hpp>
#include <reghive/diagnostics.hpp>
#include <reghive/header.hpp>
#include <reghive/records.hpp>
#include <reghive/security.hpp>
#include <reghive/value_data.hpp>

#include <cstddef>
#include <cstdint>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace reghive::tree {

class Hive;

// ----------------------------------------------------------------------------
// Параметры обхода
// ----------------------------------------------------------------------------

constexpr std::uint32_t DEFAULT_MAX_DEPTH = 512;
constexpr std::uint32_t DEFAULT_MAX_INDEX_ROOT_DEPTH = 8;

struct TreeOptions {
    std::uint32_t max_depth = DEFAULT_MAX_DEPTH;
    std::uint32_t max_index_root_depth = DEFAULT_MAX_INDEX_ROOT_DEPTH;
};

// ----------------------------------------------------------------------------
// KeyHandle
// ----------------------------------------------------------------------------

/// Ключ в контексте пути от корня
struct KeyHandle {
    format::KeyNode node;
    std::vector<std::uint32_t> ancestors;  // смещения от корня до родителя
    std::string path;                      // "\ROOT\Software\..."
    std::uint32_t depth = 0;               // корень = 0

    std::uint32_t offset() const { return node.offset; }
    const std::string& name() const { return node.name; }

    /// Лежит ли смещение на пути от корня до этого ключа (включительно)
    bool on_path(std::uint32_t offset) const;
};

/// Разобранная sk запись вместе с дескриптором
struct SecurityInfo {
    format::SecurityKey key;
    std::optional<format::SecurityDescriptor> descriptor;
};

// ----------------------------------------------------------------------------
// ChildRange
// ----------------------------------------------------------------------------

/// Ленивая последовательность подключей. ri раскрывается прозрачно.
/// Каждый вызов begin() начинает обход заново.
class ChildRange {
public:
    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = KeyHandle;
        using difference_type = std::ptrdiff_t;
        using pointer = const KeyHandle*;
        using reference = const KeyHandle&;

        iterator() = default;

        reference operator*() const { return current_; }
        pointer operator->() const { return &current_; }

        iterator& operator++();

        bool at_end() const { return hive_ == nullptr; }

        bool operator==(const iterator& other) const;
        bool operator!=(const iterator& other) const { return !(*this == other); }

    private:
        friend class ChildRange;

        struct ListFrame {
            std::uint32_t list_offset = 0;
            format::SubkeyListKind kind = format::SubkeyListKind::IndexLeaf;
            std::vector<std::uint32_t> offsets;
            std::vector<std::uint32_t> hints;
            std::size_t pos = 0;
        };

        iterator(const Hive* hive, std::shared_ptr<const KeyHandle> parent);

        void advance();
        void push_list(const format::SubkeyList& list);
        void finish();
        void check_hint(const format::KeyNode& child, format::SubkeyListKind kind,
                        std::uint32_t hint) const;

        const Hive* hive_ = nullptr;
        std::shared_ptr<const KeyHandle> parent_;
        std::vector<ListFrame> frames_;
        std::uint32_t listed_ = 0;
        std::uint32_t index_root_depth_ = 0;
        KeyHandle current_;
    };

    ChildRange(const Hive* hive, KeyHandle parent);

    iterator begin() const;
    iterator end() const { return iterator(); }

    const KeyHandle& parent() const { return *parent_; }

private:
    const Hive* hive_ = nullptr;
    std::shared_ptr<const KeyHandle> parent_;
};

// ----------------------------------------------------------------------------
// ValueRange
// ----------------------------------------------------------------------------

/// Ленивая последовательность значений ключа
class ValueRange {
public:
    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = format::ValueNode;
        using difference_type = std::ptrdiff_t;
        using pointer = const format::ValueNode*;
        using reference = const format::ValueNode&;

        iterator() = default;

        reference operator*() const { return current_; }
        pointer operator->() const { return &current_; }

        iterator& operator++();

        bool at_end() const { return hive_ == nullptr; }

        bool operator==(const iterator& other) const;
        bool operator!=(const iterator& other) const { return !(*this == other); }

    private:
        friend class ValueRange;

        iterator(const Hive* hive, std::shared_ptr<const std::vector<std::uint32_t>> offsets);

        void advance();

        const Hive* hive_ = nullptr;
        std::shared_ptr<const std::vector<std::uint32_t>> offsets_;
        std::size_t pos_ = 0;
        format::ValueNode current_;
    };

    ValueRange(const Hive* hive, const format::KeyNode& key);

    iterator begin() const;
    iterator end() const { return iterator(); }

    /// Смещения vk из списка значений (после усечения по ячейке)
    const std::vector<std::uint32_t>& offsets() const { return *offsets_; }

private:
    const Hive* hive_ = nullptr;
    std::shared_ptr<const std::vector<std::uint32_t>> offsets_;
};

// ----------------------------------------------------------------------------
// KeyWalker
// ----------------------------------------------------------------------------

/// Обход в глубину (pre-order) от заданного ключа
class KeyWalker {
public:
    KeyWalker(const Hive* hive, std::optional<KeyHandle> start);

    /// Следующий ключ; false когда обход завершён
    bool next(KeyHandle& out);

private:
    const Hive* hive_ = nullptr;
    std::optional<KeyHandle> pending_;
    std::vector<ChildRange::iterator> stack_;
};

// ----------------------------------------------------------------------------
// ReferenceSet
// ----------------------------------------------------------------------------

/// Ячейки, на которые ссылается достижимое дерево
struct ReferenceSet {
    std::unordered_set<std::uint32_t> cells;
    std::size_t key_count = 0;
    std::size_t value_count = 0;

    bool contains(std::uint32_t offset) const { return cells.count(offset) != 0; }
};

// ----------------------------------------------------------------------------
// Hive
// ----------------------------------------------------------------------------

class Hive {
public:
    /// @param bytes полный буфер файла (base block + hive bins)
    /// @param header декодированный заголовок этого буфера
    /// @param diagnostics диагностики предыдущих стадий (заголовок, журналы)
    Hive(std::vector<std::uint8_t> bytes, format::HiveHeader header, TreeOptions options = {},
         const std::vector<format::Diagnostic>& diagnostics = {});
    ~Hive();

    Hive(const Hive&) = delete;
    Hive& operator=(const Hive&) = delete;
    Hive(Hive&&) noexcept;
    Hive& operator=(Hive&&) noexcept;

    const format::HiveHeader& header() const;
    const format::CellIndex& cells() const;
    const TreeOptions& options() const;

    /// Весь буфер файла
    format::ByteCursor bytes() const;

    /// Область hive bins (смещения ячеек отсчитываются от её начала)
    format::ByteCursor region() const;

    /// Журнал диагностик (общий для всех стадий разбора)
    format::DiagnosticLog& diagnostics() const;

    // --- Записи по смещению (ячейка должна быть со статусом Ok) ---

    std::optional<format::ByteCursor> payload_at(std::uint32_t offset) const;
    std::optional<format::KeyNode> key_at(std::uint32_t offset) const;
    std::optional<format::ValueNode> value_at(std::uint32_t offset) const;
    std::optional<format::SubkeyList> subkey_list_at(std::uint32_t offset) const;

    // --- Дерево ---

    std::optional<KeyHandle> root() const;
    ChildRange children(const KeyHandle& key) const;
    ValueRange values(const format::KeyNode& key) const;
    ValueRange values(const KeyHandle& key) const { return values(key.node); }
    KeyWalker walk() const;
    KeyWalker walk(const KeyHandle& start) const;

    /// Поиск ключа по пути ("Software\Microsoft"), регистр не учитывается
    /// @param path_has_root путь начинается с имени корневого ключа
    std::optional<KeyHandle> find_key(std::string_view path, bool path_has_root = false) const;

    // --- Данные значений ---

    /// Сырые байты значения (inline / одна ячейка / big data)
    std::optional<std::vector<std::uint8_t>> value_data(const format::ValueNode& value) const;

    /// Данные, интерпретированные по типу значения
    std::optional<format::ValueData> typed_value(const format::ValueNode& value) const;

    /// Собрать big data; nullopt, если ячейка данных не db
    std::optional<std::vector<std::uint8_t>>
    resolve_big_data(const format::ValueNode& value) const;

    // --- Security / class name ---

    /// sk запись ключа (кэшируется по смещению sk)
    std::shared_ptr<const SecurityInfo> resolve_security(const format::KeyNode& key) const;

    /// Смещения sk кольца по flink, начиная с sk ключа
    std::vector<std::uint32_t> security_chain(const format::KeyNode& key) const;

    std::optional<std::string> class_name(const format::KeyNode& key) const;

    // --- Ссылки ---

    /// Все ячейки, на которые ссылается достижимое дерево
    ReferenceSet collect_references() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace reghive::tree

#endif  // REGHIVE_HIVE_HPP
