// ==============================================================================
// reghive/report.hpp - Сводка по разобранному hive
// ==============================================================================
//
// Назначение:
// - Счётчики (bins, ячейки, ключи, значения, удалённые записи)
// - Отчёт о применении журналов транзакций
// - Содержимое одного ключа (подключи, значения, владелец)
// - JSON (RapidJSON) и текстовое (таблицы) представление
//
// ==============================================================================

#ifndef REGHIVE_REPORT_HPP
#define REGHIVE_REPORT_HPP

#include <reghive/diagnostics.hpp>
#include <reghive/hive.hpp>
#include <reghive/parser.hpp>
#include <reghive/recovery.hpp>
#include <reghive/value_data.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <rapidjson/document.h>
#include <string>
#include <vector>

namespace reghive::output {

/// Сколько байт binary данных показывать в тексте
constexpr std::size_t TEXT_BINARY_LIMIT = 32;

/// Сколько строк удалённых записей/диагностик в тексте без -v
constexpr std::size_t TEXT_ROW_LIMIT = 50;

struct ValueSummary {
    std::uint32_t offset = 0;
    std::string name;  // "(default)" для пустого имени
    std::string type;
    std::uint32_t length = 0;
    std::optional<format::ValueData> data;  // nullopt если данные недоступны
};

struct KeySummary {
    std::string path;
    std::uint32_t offset = 0;
    std::uint64_t last_written = 0;
    std::optional<std::string> class_name;
    std::optional<std::string> owner;
    std::vector<std::string> subkeys;
    std::vector<ValueSummary> values;
};

struct HiveSummary {
    std::size_t bin_count = 0;
    std::size_t cell_count = 0;
    std::size_t allocated_cells = 0;
    std::size_t free_cells = 0;
    std::size_t key_count = 0;
    std::size_t value_count = 0;

    bool recovery_enabled = false;
    std::size_t orphan_keys = 0;
    std::size_t orphan_values = 0;
    std::vector<recovery::OrphanRecord> orphans;

    std::optional<KeySummary> key;

    /// Снимок после обхода дерева и сканирования
    std::vector<format::Diagnostic> diagnostics;
};

/// Содержимое ключа
KeySummary summarize_key(const tree::Hive& hive, const tree::KeyHandle& key);

/// Обойти дерево, просканировать удалённые записи, собрать диагностики
/// @param key ключ для подробного вывода (опционально)
HiveSummary summarize(const HiveParser& parser, const std::optional<tree::KeyHandle>& key);

/// Данные значения одной строкой
std::string render_value_data(const format::ValueData& data, std::size_t binary_limit);

/// JSON отчёт (doc становится объектом)
void build_json_report(const HiveParser& parser, const HiveSummary& summary,
                       rapidjson::Document& doc);

/// Текстовый отчёт (таблицы)
/// @param full не ограничивать списки удалённых записей и диагностик
std::string render_text_report(const HiveParser& parser, const HiveSummary& summary, bool full);

}  // namespace reghive::output

#endif  // REGHIVE_REPORT_HPP
