// ==============================================================================
// cli.cpp - Разбор командной строки
// ==============================================================================
//
// Формат сообщений об ошибках повторяет clap:
//   error: <что не так>
//
//   Usage: reghive inspect [OPTIONS] <HIVE>
//
//   For more information, try '--help'.
//
// ==============================================================================

#include "reghive/cli.hpp"

#include "reghive/platform.hpp"

#include <cstring>
#include <limits>
#include <string_view>

namespace reghive::cli {

namespace {

constexpr const char* INSPECT_USAGE = "reghive inspect [OPTIONS] <HIVE>";

bool str_eq(const char* a, const char* b) {
    return std::strcmp(a, b) == 0;
}

bool starts_with(const char* str, const char* prefix) {
    return std::strncmp(str, prefix, std::strlen(prefix)) == 0;
}

/// -v, -vv, -vvv
bool is_verbose_flag(const char* arg, int& count) {
    if (arg[0] != '-' || arg[1] != 'v') {
        return false;
    }
    int n = 0;
    for (const char* p = arg + 1; *p != '\0'; ++p) {
        if (*p != 'v') {
            return false;
        }
        ++n;
    }
    count += n;
    return true;
}

/// Значение опции: "--opt value" или "--opt=value"
/// @return false если значение не передано
bool take_value(int argc, char** argv, int& i, const char* long_name, const char* short_name,
                std::string& out, bool& matched) {
    const char* arg = argv[i];
    matched = false;

    if (str_eq(arg, long_name) || (short_name != nullptr && str_eq(arg, short_name))) {
        matched = true;
        if (i + 1 >= argc) {
            return false;
        }
        ++i;
        out = argv[i];
        return true;
    }

    const std::size_t n = std::strlen(long_name);
    if (std::strncmp(arg, long_name, n) == 0 && arg[n] == '=') {
        matched = true;
        out = arg + n + 1;
        return true;
    }
    return false;
}

std::string missing_value(const char* placeholder) {
    return std::string("error: a value is required for '") + placeholder +
           "' but none was supplied";
}

bool parse_u32(const std::string& text, std::uint32_t& out) {
    if (text.empty() || text.size() > 10) {
        return false;
    }
    std::uint64_t value = 0;
    for (char c : text) {
        if (c < '0' || c > '9') {
            return false;
        }
        value = value * 10 + static_cast<std::uint64_t>(c - '0');
    }
    if (value > std::numeric_limits<std::uint32_t>::max()) {
        return false;
    }
    out = static_cast<std::uint32_t>(value);
    return true;
}

ParseResult usage_error(ParseResult result, const std::string& message, const char* usage) {
    result.ok = false;
    result.diagnostic.exit_code = 2;
    result.diagnostic.stderr_message = render_usage_error(message, usage);
    return result;
}

ParseResult parse_inspect(ParseResult result, int argc, char** argv, int first) {
    InspectCommand cmd;
    bool have_hive = false;

    for (int i = first; i < argc; ++i) {
        const char* arg = argv[i];
        std::string value;
        bool matched = false;

        if (str_eq(arg, "-h") || str_eq(arg, "--help")) {
            result.ok = true;
            result.command = HelpCommand{"inspect"};
            return result;
        }
        if (is_verbose_flag(arg, result.global.verbose)) {
            continue;
        }
        if (str_eq(arg, "-q") || str_eq(arg, "--quiet")) {
            result.global.quiet = true;
            continue;
        }
        if (str_eq(arg, "-j") || str_eq(arg, "--json")) {
            cmd.json = true;
            continue;
        }
        if (str_eq(arg, "--no-logs")) {
            cmd.no_logs = true;
            continue;
        }
        if (str_eq(arg, "--no-recover")) {
            cmd.no_recover = true;
            continue;
        }

        if (take_value(argc, argv, i, "--log", nullptr, value, matched)) {
            cmd.logs.push_back(platform::path_from_utf8(value));
            continue;
        } else if (matched) {
            return usage_error(std::move(result), missing_value("--log <LOG>"), INSPECT_USAGE);
        }

        if (take_value(argc, argv, i, "--config", nullptr, value, matched)) {
            cmd.config = platform::path_from_utf8(value);
            continue;
        } else if (matched) {
            return usage_error(std::move(result), missing_value("--config <CONFIG>"),
                               INSPECT_USAGE);
        }

        if (take_value(argc, argv, i, "--max-depth", nullptr, value, matched)) {
            std::uint32_t depth = 0;
            if (!parse_u32(value, depth) || depth == 0) {
                return usage_error(std::move(result),
                                   "error: invalid value '" + value +
                                       "' for '--max-depth <MAX_DEPTH>': expected a positive "
                                       "integer",
                                   INSPECT_USAGE);
            }
            cmd.max_depth = depth;
            continue;
        } else if (matched) {
            return usage_error(std::move(result), missing_value("--max-depth <MAX_DEPTH>"),
                               INSPECT_USAGE);
        }

        if (take_value(argc, argv, i, "--key", "-k", value, matched)) {
            cmd.key = value;
            continue;
        } else if (matched) {
            return usage_error(std::move(result), missing_value("--key <KEY>"), INSPECT_USAGE);
        }

        if (take_value(argc, argv, i, "--output", "-o", value, matched)) {
            cmd.output = platform::path_from_utf8(value);
            continue;
        } else if (matched) {
            return usage_error(std::move(result), missing_value("--output <OUTPUT>"),
                               INSPECT_USAGE);
        }

        if (arg[0] == '-' && arg[1] != '\0') {
            return usage_error(std::move(result),
                               std::string("error: unexpected argument '") + arg + "' found",
                               INSPECT_USAGE);
        }
        if (have_hive) {
            return usage_error(std::move(result),
                               std::string("error: unexpected argument '") + arg + "' found",
                               INSPECT_USAGE);
        }
        cmd.hive = platform::path_from_utf8(arg);
        have_hive = true;
    }

    if (!have_hive) {
        return usage_error(std::move(result),
                           "error: the following required arguments were not provided:\n"
                           "  <HIVE>",
                           INSPECT_USAGE);
    }
    if (cmd.no_logs && !cmd.logs.empty()) {
        return usage_error(std::move(result),
                           "error: the argument '--no-logs' cannot be used with '--log <LOG>'",
                           INSPECT_USAGE);
    }

    result.ok = true;
    result.command = std::move(cmd);
    return result;
}

}  // namespace

// ----------------------------------------------------------------------------
// render_version / render_help
// ----------------------------------------------------------------------------

std::string render_version() {
    return std::string("reghive ") + VERSION + "\n";
}

std::string render_help(const std::optional<std::string>& command) {
    if (!command.has_value()) {
        return std::string(ABOUT) +
               "\n"
               "\n"
               "Usage: reghive [OPTIONS] <COMMAND>\n"
               "\n"
               "Commands:\n"
               "  inspect  Parse a hive, replay its transaction logs and report the result\n"
               "  help     Print this message or the help of the given subcommand(s)\n"
               "\n"
               "Options:\n"
               "  -v...          Print verbose output\n"
               "  -q             Suppress informational output\n"
               "  -h, --help     Print help\n"
               "  -V, --version  Print version\n"
               "\n"
               "Examples:\n"
               "\n"
               "    Summarise a SYSTEM hive, picking up SYSTEM.LOG1/SYSTEM.LOG2 next to it:\n"
               "        ./reghive inspect SYSTEM\n"
               "\n"
               "    List a key and its values as JSON:\n"
               "        ./reghive inspect NTUSER.DAT --key Software\\Microsoft --json\n";
    }
    if (*command == "inspect") {
        return "Parse a hive, replay its transaction logs and report the result\n"
               "\n"
               "Usage: reghive inspect [OPTIONS] <HIVE>\n"
               "\n"
               "Arguments:\n"
               "  <HIVE>  Path to the primary hive file\n"
               "\n"
               "Options:\n"
               "      --log <LOG>              Transaction log to apply (.LOG1 first, then .LOG2)\n"
               "      --no-logs                Do not look for or apply transaction logs\n"
               "      --no-recover             Do not scan for deleted keys and values\n"
               "      --config <CONFIG>        Parser settings (YAML)\n"
               "      --max-depth <MAX_DEPTH>  Maximum key nesting depth\n"
               "  -k, --key <KEY>              Show a key (path relative to the root key)\n"
               "  -j, --json                   Output as JSON\n"
               "  -o, --output <OUTPUT>        Save output to a file\n"
               "  -q                           Suppress informational output\n"
               "  -v...                        Print verbose output\n"
               "  -h, --help                   Print help\n";
    }
    if (*command == "help") {
        return "Print this message or the help of the given subcommand(s)\n"
               "\n"
               "Usage: reghive help [COMMAND]\n";
    }
    return "error: unrecognized subcommand '" + *command + "'\n";
}

std::string render_usage_error(const std::string& error_msg, const std::string& usage) {
    return error_msg + "\n\nUsage: " + usage + "\n\nFor more information, try '--help'.\n";
}

// ----------------------------------------------------------------------------
// parse
// ----------------------------------------------------------------------------

ParseResult parse(int argc, char** argv) {
    ParseResult result;
    result.command = HelpCommand{};

    if (argc < 2) {
        // Без аргументов: справка в stderr, exit code 2
        result.diagnostic.exit_code = 2;
        result.diagnostic.stderr_message = render_help(std::nullopt);
        return result;
    }

    int cmd_idx = argc;
    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];

        if (is_verbose_flag(arg, result.global.verbose)) {
            continue;
        }
        if (str_eq(arg, "-q") || str_eq(arg, "--quiet")) {
            result.global.quiet = true;
        } else if (str_eq(arg, "-h") || str_eq(arg, "--help")) {
            result.ok = true;
            result.command = HelpCommand{};
            return result;
        } else if (str_eq(arg, "-V") || str_eq(arg, "--version")) {
            result.ok = true;
            result.command = VersionCommand{};
            return result;
        } else if (starts_with(arg, "-")) {
            return usage_error(std::move(result),
                               std::string("error: unexpected argument '") + arg + "' found",
                               "reghive [OPTIONS] <COMMAND>");
        } else {
            cmd_idx = i;
            break;
        }
    }

    if (cmd_idx >= argc) {
        result.diagnostic.exit_code = 2;
        result.diagnostic.stderr_message = render_help(std::nullopt);
        return result;
    }

    const char* cmd = argv[cmd_idx];

    if (str_eq(cmd, "inspect")) {
        return parse_inspect(std::move(result), argc, argv, cmd_idx + 1);
    }
    if (str_eq(cmd, "help")) {
        result.ok = true;
        if (cmd_idx + 1 < argc) {
            result.command = HelpCommand{std::string(argv[cmd_idx + 1])};
        } else {
            result.command = HelpCommand{};
        }
        return result;
    }

    return usage_error(std::move(result),
                       std::string("error: unrecognized subcommand '") + cmd + "'",
                       "reghive [OPTIONS] <COMMAND>");
}

}  // namespace reghive::cli
