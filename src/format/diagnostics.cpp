// ==============================================================================
// diagnostics.cpp - Канал диагностик разбора
// ==============================================================================

#include "reghive/diagnostics.hpp"

#include <algorithm>
#include <cstdio>

namespace reghive::format {

const char* diagnostic_kind_to_string(DiagnosticKind kind) {
    switch (kind) {
    case DiagnosticKind::ChecksumMismatch:
        return "ChecksumMismatch";
    case DiagnosticKind::DirtyHive:
        return "DirtyHive";
    case DiagnosticKind::InvalidHiveBin:
        return "InvalidHiveBin";
    case DiagnosticKind::HiveBinsTruncated:
        return "HiveBinsTruncated";
    case DiagnosticKind::TruncatedCell:
        return "TruncatedCell";
    case DiagnosticKind::ZeroSizeCell:
        return "ZeroSizeCell";
    case DiagnosticKind::InvalidCellSize:
        return "InvalidCellSize";
    case DiagnosticKind::UnrecognizedSignature:
        return "UnrecognizedSignature";
    case DiagnosticKind::InvalidOffset:
        return "InvalidOffset";
    case DiagnosticKind::TruncatedRecord:
        return "TruncatedRecord";
    case DiagnosticKind::InvalidStringEncoding:
        return "InvalidStringEncoding";
    case DiagnosticKind::DataLengthMismatch:
        return "DataLengthMismatch";
    case DiagnosticKind::BigDataLengthMismatch:
        return "BigDataLengthMismatch";
    case DiagnosticKind::CountMismatch:
        return "CountMismatch";
    case DiagnosticKind::ParentMismatch:
        return "ParentMismatch";
    case DiagnosticKind::SubkeyHashMismatch:
        return "SubkeyHashMismatch";
    case DiagnosticKind::CycleDetected:
        return "CycleDetected";
    case DiagnosticKind::DepthExceeded:
        return "DepthExceeded";
    case DiagnosticKind::SecurityChainBroken:
        return "SecurityChainBroken";
    case DiagnosticKind::NoLogApplied:
        return "NoLogApplied";
    case DiagnosticKind::LogFileInvalid:
        return "LogFileInvalid";
    case DiagnosticKind::LogEntryRejected:
        return "LogEntryRejected";
    case DiagnosticKind::LogEntryStale:
        return "LogEntryStale";
    case DiagnosticKind::LogSequenceConflict:
        return "LogSequenceConflict";
    }
    return "Unknown";
}

Severity diagnostic_severity(DiagnosticKind kind) {
    switch (kind) {
    case DiagnosticKind::TruncatedCell:
    case DiagnosticKind::UnrecognizedSignature:
    case DiagnosticKind::InvalidOffset:
    case DiagnosticKind::CycleDetected:
    case DiagnosticKind::DepthExceeded:
    case DiagnosticKind::LogEntryRejected:
        return Severity::BranchFatal;
    default:
        return Severity::Advisory;
    }
}

const char* severity_to_string(Severity severity) {
    return severity == Severity::BranchFatal ? "branch-fatal" : "advisory";
}

const char* diagnostic_source_to_string(DiagnosticSource source) {
    switch (source) {
    case DiagnosticSource::Header:
        return "header";
    case DiagnosticSource::HiveBins:
        return "hbin";
    case DiagnosticSource::PrimaryLog:
        return "log1";
    case DiagnosticSource::SecondaryLog:
        return "log2";
    }
    return "unknown";
}

std::string Diagnostic::format() const {
    char offset_buf[16];
    std::snprintf(offset_buf, sizeof(offset_buf), "0x%08x", offset);

    std::string result = diagnostic_kind_to_string(kind);
    result += " @ ";
    result += diagnostic_source_to_string(source);
    result += ':';
    result += offset_buf;
    if (!message.empty()) {
        result += ": ";
        result += message;
    }
    return result;
}

Diagnostic make_diagnostic(DiagnosticKind kind, std::uint32_t offset, std::string message,
                           DiagnosticSource source) {
    Diagnostic d;
    d.kind = kind;
    d.source = source;
    d.offset = offset;
    d.message = std::move(message);
    return d;
}

// ============================================================================
// DiagnosticLog
// ============================================================================

void DiagnosticLog::add(Diagnostic diagnostic) {
    Key key{static_cast<int>(diagnostic.kind), static_cast<int>(diagnostic.source),
            diagnostic.offset, diagnostic.message};

    std::lock_guard<std::mutex> lock(mutex_);
    if (!seen_.insert(std::move(key)).second) {
        return;
    }
    entries_.push_back(std::move(diagnostic));
}

void DiagnosticLog::add_all(const std::vector<Diagnostic>& diagnostics) {
    for (const auto& d : diagnostics) {
        add(d);
    }
}

std::vector<Diagnostic> DiagnosticLog::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_;
}

std::size_t DiagnosticLog::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

std::size_t DiagnosticLog::count(DiagnosticKind kind) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<std::size_t>(std::count_if(
        entries_.begin(), entries_.end(), [kind](const Diagnostic& d) { return d.kind == kind; }));
}

}  // namespace reghive::format
