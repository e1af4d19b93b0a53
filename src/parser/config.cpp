// ==============================================================================
// config.cpp - Загрузка настроек разбора из YAML
// ==============================================================================

#include "reghive/config.hpp"

#include "reghive/platform.hpp"

#include <yaml-cpp/yaml.h>

#include <fstream>

namespace reghive {

namespace {

constexpr const char* KNOWN_KEYS[] = {
    "max_depth",       "max_index_root_depth", "recover_deleted", "apply_transaction_logs",
    "find_transaction_logs", "log_tie_break",
};

bool is_known_key(const std::string& key) {
    for (const char* known : KNOWN_KEYS) {
        if (key == known) {
            return true;
        }
    }
    return false;
}

bool read_limit(const YAML::Node& root, const char* key, std::uint32_t& out, std::string& error) {
    if (!root[key]) {
        return true;
    }
    auto value = root[key].as<long long>();
    if (value < 1 || value > 0xFFFF) {
        error = std::string("'") + key + "' must be between 1 and 65535";
        return false;
    }
    out = static_cast<std::uint32_t>(value);
    return true;
}

void read_flag(const YAML::Node& root, const char* key, bool& out) {
    if (root[key]) {
        out = root[key].as<bool>();
    }
}

ConfigResult parse_config(const YAML::Node& root) {
    ConfigResult result;

    if (root.IsNull()) {
        result.ok = true;
        return result;
    }
    if (!root.IsMap()) {
        result.error = "config must be a mapping";
        return result;
    }

    for (const auto& entry : root) {
        auto key = entry.first.as<std::string>();
        if (!is_known_key(key)) {
            result.error = "unknown config key '" + key + "'";
            return result;
        }
    }

    ParserConfig& config = result.config;
    if (!read_limit(root, "max_depth", config.max_depth, result.error) ||
        !read_limit(root, "max_index_root_depth", config.max_index_root_depth, result.error)) {
        return result;
    }

    read_flag(root, "recover_deleted", config.recover_deleted);
    read_flag(root, "apply_transaction_logs", config.apply_transaction_logs);
    read_flag(root, "find_transaction_logs", config.find_transaction_logs);

    if (root["log_tie_break"]) {
        auto text = root["log_tie_break"].as<std::string>();
        auto tie_break = parse_tie_break(text);
        if (!tie_break) {
            result.error = "invalid log_tie_break '" + text + "' (expected secondary or primary)";
            return result;
        }
        config.log_tie_break = *tie_break;
    }

    result.ok = true;
    return result;
}

}  // anonymous namespace

std::optional<txlog::TieBreak> parse_tie_break(std::string_view text) {
    if (text == "secondary") {
        return txlog::TieBreak::PreferSecondary;
    }
    if (text == "primary") {
        return txlog::TieBreak::PreferPrimary;
    }
    return std::nullopt;
}

ConfigResult load_config(const std::filesystem::path& path) {
    ConfigResult result;

    try {
        std::ifstream file(path);
        if (!file.is_open()) {
            result.error = "cannot open config file: " + platform::path_to_utf8(path);
            return result;
        }
        result = parse_config(YAML::Load(file));
    } catch (const YAML::Exception& e) {
        result.ok = false;
        result.error = "failed to parse config " + platform::path_to_utf8(path) + ": " + e.what();
    }

    return result;
}

ConfigResult load_config_from_string(const std::string& text) {
    ConfigResult result;

    try {
        result = parse_config(YAML::Load(text));
    } catch (const YAML::Exception& e) {
        result.ok = false;
        result.error = std::string("failed to parse config: ") + e.what();
    }

    return result;
}

}  // namespace reghive
