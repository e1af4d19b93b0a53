// ==============================================================================
// reghive/cli.hpp - Разбор командной строки
// ==============================================================================
//
// Назначение:
// - Парсинг argv
// - Генерация --help / --version
// - Диагностические ошибки CLI (exit code 2)
//
// Команды:
//   reghive inspect <HIVE> [OPTIONS]
//   reghive help [COMMAND]
//   reghive --version
//
// ==============================================================================

#ifndef REGHIVE_CLI_HPP
#define REGHIVE_CLI_HPP

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace reghive::cli {

// ----------------------------------------------------------------------------
// Глобальные опции
// ----------------------------------------------------------------------------

struct GlobalOptions {
    int verbose = 0;     // -v (повторяемый)
    bool quiet = false;  // -q
};

// ----------------------------------------------------------------------------
// Подкоманды
// ----------------------------------------------------------------------------

/// inspect - разобрать hive и вывести сводку
struct InspectCommand {
    std::filesystem::path hive;
    std::vector<std::filesystem::path> logs;      // --log (до двух)
    bool no_logs = false;                         // --no-logs
    bool no_recover = false;                      // --no-recover
    std::optional<std::filesystem::path> config;  // --config
    std::optional<std::uint32_t> max_depth;       // --max-depth
    std::optional<std::string> key;               // --key
    bool json = false;                            // -j, --json
    std::optional<std::filesystem::path> output;  // -o, --output
};

/// help - показать справку
struct HelpCommand {
    std::optional<std::string> command;
};

/// version - показать версию
struct VersionCommand {};

using Command = std::variant<InspectCommand, HelpCommand, VersionCommand>;

// ----------------------------------------------------------------------------
// Диагностика CLI
// ----------------------------------------------------------------------------

struct CliDiagnostic {
    int exit_code = 2;
    std::string stderr_message;
};

struct ParseResult {
    bool ok = false;
    GlobalOptions global;
    Command command;
    CliDiagnostic diagnostic;
};

// ----------------------------------------------------------------------------
// API
// ----------------------------------------------------------------------------

ParseResult parse(int argc, char** argv);

/// Текст --help (для конкретной команды или общий)
std::string render_help(const std::optional<std::string>& command = std::nullopt);

/// Текст --version
std::string render_version();

/// Ошибка разбора: сообщение + Usage + подсказка
std::string render_usage_error(const std::string& error_msg,
                               const std::string& usage = "reghive [OPTIONS] <COMMAND>");

// ----------------------------------------------------------------------------
// Константы
// ----------------------------------------------------------------------------

constexpr const char* VERSION = "0.1.0";

constexpr const char* ABOUT = "Inspect offline Windows Registry hives and their transaction logs";

}  // namespace reghive::cli

#endif  // REGHIVE_CLI_HPP
