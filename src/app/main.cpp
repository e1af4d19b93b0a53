// ==============================================================================
// main.cpp - Точка входа приложения
// ==============================================================================
//
// 1. Парсинг argv (cli)
// 2. Создание Writer (output)
// 3. Выполнение команды
// 4. Возврат exit code: 0 успех, 1 ошибка выполнения, 2 ошибка использования
//
// ==============================================================================

#include "reghive/cli.hpp"
#include "reghive/config.hpp"
#include "reghive/output.hpp"
#include "reghive/parser.hpp"
#include "reghive/platform.hpp"
#include "reghive/report.hpp"

#include <exception>
#include <iostream>
#include <memory>
#include <optional>
#include <rapidjson/document.h>
#include <type_traits>
#include <variant>

namespace {

// ----------------------------------------------------------------------------
// inspect
// ----------------------------------------------------------------------------

int run_inspect(const reghive::cli::InspectCommand& cmd, reghive::output::Writer& writer) {
    using namespace reghive;

    // Настройки: файл, затем флаги командной строки
    ParserConfig config;
    if (cmd.config) {
        auto loaded = load_config(*cmd.config);
        if (!loaded.ok) {
            writer.error(loaded.error);
            return 1;
        }
        config = loaded.config;
        writer.debug("Loaded parser settings from " + platform::path_to_utf8(*cmd.config));
    }
    if (cmd.max_depth) {
        config.max_depth = *cmd.max_depth;
    }
    if (cmd.no_logs) {
        config.apply_transaction_logs = false;
    }
    if (cmd.no_recover) {
        config.recover_deleted = false;
    }

    writer.debug("Platform: " + platform::os_name());
    writer.info("Loading hive: " + platform::path_to_utf8(cmd.hive));

    HiveParser parser(config);
    bool ok = cmd.logs.empty() ? parser.load(cmd.hive) : parser.load(cmd.hive, cmd.logs);
    if (!ok) {
        writer.error(parser.last_error()->format());
        return 1;
    }

    for (const auto& log : parser.log_paths()) {
        writer.debug("Transaction log: " + platform::path_to_utf8(log));
    }
    if (parser.transaction_logs_applied()) {
        const auto& applied = parser.replay_result().applied_sequences;
        writer.info("Applied " + std::to_string(applied.size()) +
                    " transaction log entries (sequence " + std::to_string(applied.front()) +
                    " to " + std::to_string(applied.back()) + ")");
    } else if (parser.original_header()->is_dirty()) {
        writer.warn("Hive is dirty and no transaction log entries were applied");
    }

    std::optional<tree::KeyHandle> key;
    if (cmd.key) {
        key = parser.get_key(*cmd.key);
        if (!key) {
            writer.error("Key not found: " + *cmd.key);
            return 1;
        }
    }

    auto summary = output::summarize(parser, key);

    for (const auto& diagnostic : summary.diagnostics) {
        writer.trace(diagnostic.format());
    }
    if (!summary.diagnostics.empty()) {
        writer.warn(std::to_string(summary.diagnostics.size()) +
                    " diagnostics reported while parsing");
    }

    // Отчёт в stdout или в файл
    std::unique_ptr<output::Writer> file_writer;
    output::Writer* out = &writer;
    if (cmd.output) {
        output::OutputConfig out_cfg = writer.config();
        out_cfg.output_path = cmd.output;
        file_writer = std::make_unique<output::Writer>(out_cfg);
        if (!file_writer->has_output_file()) {
            writer.error("Unable to write to output file: " + platform::path_to_utf8(*cmd.output));
            return 1;
        }
        out = file_writer.get();
    }

    if (out->config().format == output::Format::Json) {
        rapidjson::Document doc;
        output::build_json_report(parser, summary, doc);
        out->write_json_pretty(doc);
    } else {
        out->write(output::Stream::Stdout,
                   output::render_text_report(parser, summary, writer.config().verbose > 0));
    }

    if (cmd.output) {
        writer.info("Report written to " + platform::path_to_utf8(*cmd.output));
    }
    return 0;
}

// ----------------------------------------------------------------------------
// run
// ----------------------------------------------------------------------------

int run(int argc, char** argv) {
    using namespace reghive;

    cli::ParseResult parse_result = cli::parse(argc, argv);

    output::OutputConfig out_cfg;
    out_cfg.quiet = parse_result.global.quiet;
    out_cfg.verbose = parse_result.global.verbose;
    if (const auto* inspect = std::get_if<cli::InspectCommand>(&parse_result.command)) {
        if (inspect->json) {
            out_cfg.format = output::Format::Json;
        }
    }
    output::Writer writer(out_cfg);

    // Ошибки разбора argv выводятся как есть, без [x]
    if (!parse_result.ok) {
        writer.write(output::Stream::Stderr, parse_result.diagnostic.stderr_message);
        return parse_result.diagnostic.exit_code;
    }

    return std::visit(
        [&](auto&& cmd) -> int {
            using T = std::decay_t<decltype(cmd)>;

            if constexpr (std::is_same_v<T, cli::HelpCommand>) {
                writer.write(output::Stream::Stdout, cli::render_help(cmd.command));
                return 0;
            } else if constexpr (std::is_same_v<T, cli::VersionCommand>) {
                writer.write(output::Stream::Stdout, cli::render_version());
                return 0;
            } else {
                return run_inspect(cmd, writer);
            }
        },
        parse_result.command);
}

}  // namespace

// ----------------------------------------------------------------------------
// main
// ----------------------------------------------------------------------------

int main(int argc, char** argv) {
    try {
        return run(argc, argv);
    } catch (const std::exception& e) {
        // Граница приложения: формат ошибки "[x] <err>"
        std::cerr << "[x] " << e.what() << "\n";
        return 1;
    } catch (...) {
        std::cerr << "[x] Unknown error occurred\n";
        return 1;
    }
}
