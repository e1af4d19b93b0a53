// ==============================================================================
// reghive/diagnostics.hpp - Канал диагностик разбора
// ==============================================================================
//
// Назначение:
// - Типизированные диагностики (вид, источник, смещение, сообщение)
// - Классификация: advisory / fatal-to-branch
// - Потокобезопасный журнал с устранением точных дубликатов
//
// Ошибки разбора не теряются молча: всё, что было пропущено или
// интерпретировано приблизительно, попадает сюда.
//
// ==============================================================================

#ifndef REGHIVE_DIAGNOSTICS_HPP
#define REGHIVE_DIAGNOSTICS_HPP

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <set>
#include <string>
#include <tuple>
#include <vector>

namespace reghive::format {

// ----------------------------------------------------------------------------
// DiagnosticKind
// ----------------------------------------------------------------------------

enum class DiagnosticKind {
    // Заголовок
    ChecksumMismatch,
    DirtyHive,

    // Аллокатор ячеек
    InvalidHiveBin,
    HiveBinsTruncated,
    TruncatedCell,
    ZeroSizeCell,
    InvalidCellSize,

    // Записи
    UnrecognizedSignature,
    InvalidOffset,
    TruncatedRecord,
    InvalidStringEncoding,
    DataLengthMismatch,
    BigDataLengthMismatch,

    // Дерево
    CountMismatch,
    ParentMismatch,
    SubkeyHashMismatch,
    CycleDetected,
    DepthExceeded,
    SecurityChainBroken,

    // Журналы транзакций
    NoLogApplied,
    LogFileInvalid,
    LogEntryRejected,
    LogEntryStale,
    LogSequenceConflict
};

/// Строковое имя вида диагностики
const char* diagnostic_kind_to_string(DiagnosticKind kind);

// ----------------------------------------------------------------------------
// Severity
// ----------------------------------------------------------------------------

enum class Severity {
    Advisory,     // данные возвращены, возможно приблизительно
    BranchFatal   // ветвь дерева/запись пропущена
};

/// Классификация вида диагностики
Severity diagnostic_severity(DiagnosticKind kind);

const char* severity_to_string(Severity severity);

// ----------------------------------------------------------------------------
// Источник
// ----------------------------------------------------------------------------

/// Откуда отсчитывается offset диагностики
enum class DiagnosticSource {
    Header,        // смещение в base block
    HiveBins,      // смещение ячейки относительно начала hive bins
    PrimaryLog,    // смещение в первом журнале (.LOG1)
    SecondaryLog   // смещение во втором журнале (.LOG2)
};

const char* diagnostic_source_to_string(DiagnosticSource source);

// ----------------------------------------------------------------------------
// Diagnostic
// ----------------------------------------------------------------------------

struct Diagnostic {
    DiagnosticKind kind = DiagnosticKind::UnrecognizedSignature;
    DiagnosticSource source = DiagnosticSource::HiveBins;
    std::uint32_t offset = 0;
    std::string message;

    Severity severity() const { return diagnostic_severity(kind); }

    /// "<kind> @ <source>:0x<offset>: <message>"
    std::string format() const;
};

/// Удобный конструктор для диагностик hive bins
Diagnostic make_diagnostic(DiagnosticKind kind, std::uint32_t offset, std::string message,
                           DiagnosticSource source = DiagnosticSource::HiveBins);

// ----------------------------------------------------------------------------
// DiagnosticLog
// ----------------------------------------------------------------------------

/// Журнал диагностик. Запись из нескольких потоков безопасна.
/// Точные повторы (вид, источник, смещение, сообщение) сохраняются один раз,
/// порядок первой регистрации сохраняется.
class DiagnosticLog {
public:
    DiagnosticLog() = default;

    DiagnosticLog(const DiagnosticLog&) = delete;
    DiagnosticLog& operator=(const DiagnosticLog&) = delete;

    /// Добавить диагностику
    void add(Diagnostic diagnostic);

    /// Добавить пачку диагностик
    void add_all(const std::vector<Diagnostic>& diagnostics);

    /// Снимок текущего содержимого
    std::vector<Diagnostic> snapshot() const;

    /// Количество записей
    std::size_t size() const;

    /// Количество записей данного вида
    std::size_t count(DiagnosticKind kind) const;

    /// Есть ли хотя бы одна запись данного вида
    bool contains(DiagnosticKind kind) const { return count(kind) > 0; }

private:
    using Key = std::tuple<int, int, std::uint32_t, std::string>;

    mutable std::mutex mutex_;
    std::vector<Diagnostic> entries_;
    std::set<Key> seen_;
};

}  // namespace reghive::format

#endif  // REGHIVE_DIAGNOSTICS_HPP
