// ==============================================================================
// reghive/config.hpp - Настройки разбора (YAML)
// ==============================================================================
//
// Назначение:
// - Параметры обхода дерева, восстановления и применения журналов
// - Загрузка из YAML файла (yaml-cpp)
//
// Пример:
//   max_depth: 512
//   max_index_root_depth: 8
//   recover_deleted: true
//   apply_transaction_logs: true
//   find_transaction_logs: true
//   log_tie_break: secondary     # secondary | primary
//
// ==============================================================================

#ifndef REGHIVE_CONFIG_HPP
#define REGHIVE_CONFIG_HPP

#include <reghive/hive.hpp>
#include <reghive/txlog.hpp>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace reghive {

struct ParserConfig {
    std::uint32_t max_depth = tree::DEFAULT_MAX_DEPTH;
    std::uint32_t max_index_root_depth = tree::DEFAULT_MAX_INDEX_ROOT_DEPTH;
    bool recover_deleted = true;
    bool apply_transaction_logs = true;
    bool find_transaction_logs = true;  // искать .LOG1/.LOG2/.LOG рядом с hive
    txlog::TieBreak log_tie_break = txlog::TieBreak::PreferSecondary;

    tree::TreeOptions tree_options() const {
        return tree::TreeOptions{max_depth, max_index_root_depth};
    }

    txlog::ReplayOptions replay_options() const { return txlog::ReplayOptions{log_tie_break}; }
};

/// Результат загрузки конфигурации
struct ConfigResult {
    bool ok = false;
    ParserConfig config;
    std::string error;
};

/// "secondary" / "primary"
std::optional<txlog::TieBreak> parse_tie_break(std::string_view text);

/// Загрузить конфигурацию из YAML файла
ConfigResult load_config(const std::filesystem::path& path);

/// Загрузить конфигурацию из YAML текста
ConfigResult load_config_from_string(const std::string& text);

}  // namespace reghive

#endif  // REGHIVE_CONFIG_HPP
