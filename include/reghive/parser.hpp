// ==============================================================================
// reghive/parser.hpp - Разбор hive файла целиком
// ==============================================================================
//
// Назначение:
// - Конвейер: заголовок -> журналы транзакций -> индекс ячеек -> дерево
// - Поиск .LOG1/.LOG2/.LOG рядом с hive
// - Доступ к дереву, восстановленным записям и диагностикам
// - Параллельный разбор независимых hive
//
// Ошибки уровня файла (нет файла, нет сигнатуры, слишком короткий)
// возвращаются через load() == false и last_error(). Всё остальное
// попадает в диагностики, разбор продолжается.
//
// ==============================================================================

#ifndef REGHIVE_PARSER_HPP
#define REGHIVE_PARSER_HPP

#include <reghive/config.hpp>
#include <reghive/diagnostics.hpp>
#include <reghive/header.hpp>
#include <reghive/hive.hpp>
#include <reghive/recovery.hpp>
#include <reghive/txlog.hpp>

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace reghive {

// ----------------------------------------------------------------------------
// ParseError
// ----------------------------------------------------------------------------

enum class ParseErrorKind {
    FileNotFound,
    IoError,
    TooShort,         // меньше 512 байт
    MalformedHeader,  // нет сигнатуры "regf"
    TooManyLogs       // больше двух журналов
};

const char* parse_error_kind_to_string(ParseErrorKind kind);

struct ParseError {
    ParseErrorKind kind = ParseErrorKind::IoError;
    std::string message;

    std::string format() const;
};

/// Максимальное количество журналов на один hive
constexpr std::size_t MAX_TRANSACTION_LOGS = 2;

/// Найти журналы транзакций рядом с hive: [.LOG1 (или .LOG), .LOG2]
std::vector<std::filesystem::path> find_transaction_logs(const std::filesystem::path& hive_path);

// ----------------------------------------------------------------------------
// HiveParser
// ----------------------------------------------------------------------------

class HiveParser {
public:
    explicit HiveParser(ParserConfig config = {});
    ~HiveParser();

    HiveParser(const HiveParser&) = delete;
    HiveParser& operator=(const HiveParser&) = delete;

    HiveParser(HiveParser&&) noexcept;
    HiveParser& operator=(HiveParser&&) noexcept;

    // -------------------------------------------------------------------------
    // Загрузка
    // -------------------------------------------------------------------------

    /// Загрузить hive; журналы ищутся рядом, если включено find_transaction_logs
    bool load(const std::filesystem::path& path);

    /// Загрузить hive с явно заданными журналами (порядок: .LOG1, .LOG2)
    bool load(const std::filesystem::path& path, const std::vector<std::filesystem::path>& logs);

    /// Загрузить hive из памяти
    bool load_from_bytes(std::vector<std::uint8_t> hive,
                         const std::vector<std::vector<std::uint8_t>>& logs = {});

    const std::optional<ParseError>& last_error() const { return error_; }

    bool loaded() const { return loaded_; }

    const std::filesystem::path& path() const { return path_; }

    /// Журналы, использованные при загрузке
    const std::vector<std::filesystem::path>& log_paths() const { return log_paths_; }

    const ParserConfig& config() const;

    // -------------------------------------------------------------------------
    // Результаты
    // -------------------------------------------------------------------------

    /// Дерево (nullptr, если не загружено)
    const tree::Hive* hive() const;

    /// Заголовок файла до применения журналов
    const std::optional<format::HiveHeader>& original_header() const;

    /// Отчёт о применении журналов
    const txlog::ReplayResult& replay_result() const;

    /// Были ли применены записи журналов
    bool transaction_logs_applied() const;

    std::optional<tree::KeyHandle> get_root_key() const;

    /// Ключ по пути относительно корня ("Software\Microsoft")
    std::optional<tree::KeyHandle> get_key(std::string_view key_path) const;

    /// Сканер удалённых записей; nullopt если не загружено или
    /// восстановление выключено
    std::optional<recovery::OrphanCursor> orphans() const;

    /// Снимок диагностик
    std::vector<format::Diagnostic> diagnostics() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;

    std::filesystem::path path_;
    std::vector<std::filesystem::path> log_paths_;
    std::optional<ParseError> error_;
    bool loaded_ = false;
};

// ----------------------------------------------------------------------------
// Параллельный разбор
// ----------------------------------------------------------------------------

/// Разобрать независимые hive на пуле потоков.
/// Результаты в порядке paths; ошибки в last_error() каждого парсера.
/// @param threads 0 = по числу ядер
std::vector<HiveParser> parse_hives_parallel(const std::vector<std::filesystem::path>& paths,
                                             const ParserConfig& config = {},
                                             unsigned threads = 0);

}  // namespace reghive

#endif  // REGHIVE_PARSER_HPP
