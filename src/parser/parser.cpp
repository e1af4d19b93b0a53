// ==============================================================================
// parser.cpp - Конвейер разбора hive
// ==============================================================================

#include "reghive/parser.hpp"

#include "reghive/platform.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <system_error>
#include <thread>

namespace reghive {

// ============================================================================
// ParseError
// ============================================================================

const char* parse_error_kind_to_string(ParseErrorKind kind) {
    switch (kind) {
    case ParseErrorKind::FileNotFound:
        return "FileNotFound";
    case ParseErrorKind::IoError:
        return "IoError";
    case ParseErrorKind::TooShort:
        return "TooShort";
    case ParseErrorKind::MalformedHeader:
        return "MalformedHeader";
    case ParseErrorKind::TooManyLogs:
        return "TooManyLogs";
    }
    return "Unknown";
}

std::string ParseError::format() const {
    return std::string(parse_error_kind_to_string(kind)) + ": " + message;
}

// ============================================================================
// Поиск журналов
// ============================================================================

std::vector<std::filesystem::path> find_transaction_logs(const std::filesystem::path& hive_path) {
    std::optional<std::filesystem::path> log, log1, log2;

    std::error_code ec;
    auto parent = hive_path.parent_path();
    if (parent.empty()) {
        parent = ".";
    }
    const std::string hive_name = platform::path_to_utf8(hive_path.filename());

    // increment(ec) вместо ++: обход не бросает filesystem_error
    std::filesystem::directory_iterator it(parent, ec);
    for (; !ec && it != std::filesystem::directory_iterator(); it.increment(ec)) {
        const auto& entry = *it;
        std::error_code entry_ec;
        if (!entry.is_regular_file(entry_ec) || entry_ec) {
            continue;
        }

        const auto& path = entry.path();
        if (!format::iequals(platform::path_to_utf8(path.stem()), hive_name)) {
            continue;
        }

        std::string ext = platform::path_to_utf8(path.extension());
        for (auto& c : ext) {
            c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        }

        if (ext == ".LOG1") {
            log1 = path;
        } else if (ext == ".LOG2") {
            log2 = path;
        } else if (ext == ".LOG") {
            log = path;
        }
    }

    std::vector<std::filesystem::path> logs;
    if (log1) {
        logs.push_back(*log1);
    } else if (log) {
        logs.push_back(*log);
    }
    if (log2) {
        logs.push_back(*log2);
    }
    return logs;
}

// ============================================================================
// HiveParser::Impl
// ============================================================================

struct HiveParser::Impl {
    ParserConfig config;
    std::optional<format::HiveHeader> original_header;
    txlog::ReplayResult replay;
    std::unique_ptr<tree::Hive> hive;

    void reset() {
        original_header.reset();
        replay = txlog::ReplayResult{};
        hive.reset();
    }
};

HiveParser::HiveParser(ParserConfig config) : impl_(std::make_unique<Impl>()) {
    impl_->config = config;
}

HiveParser::~HiveParser() = default;
HiveParser::HiveParser(HiveParser&&) noexcept = default;
HiveParser& HiveParser::operator=(HiveParser&&) noexcept = default;

const ParserConfig& HiveParser::config() const {
    return impl_->config;
}

// ============================================================================
// Загрузка
// ============================================================================

bool HiveParser::load(const std::filesystem::path& path) {
    std::vector<std::filesystem::path> logs;
    if (impl_->config.apply_transaction_logs && impl_->config.find_transaction_logs) {
        logs = find_transaction_logs(path);
    }
    return load(path, logs);
}

bool HiveParser::load(const std::filesystem::path& path,
                      const std::vector<std::filesystem::path>& logs) {
    path_ = path;
    log_paths_.clear();
    loaded_ = false;
    error_.reset();
    impl_->reset();

    std::error_code ec;
    if (!std::filesystem::exists(path, ec) || ec) {
        error_ = ParseError{ParseErrorKind::FileNotFound,
                            "file not found: " + platform::path_to_utf8(path)};
        return false;
    }
    if (logs.size() > MAX_TRANSACTION_LOGS) {
        error_ = ParseError{ParseErrorKind::TooManyLogs,
                            std::to_string(logs.size()) + " transaction logs given, at most " +
                                std::to_string(MAX_TRANSACTION_LOGS) + " supported"};
        return false;
    }

    auto hive_bytes = platform::read_file_bytes(path);
    if (!hive_bytes) {
        error_ = ParseError{ParseErrorKind::IoError,
                            "could not read file: " + platform::path_to_utf8(path)};
        return false;
    }

    std::vector<std::vector<std::uint8_t>> log_bytes;
    for (const auto& log_path : logs) {
        if (!std::filesystem::exists(log_path, ec) || ec) {
            error_ = ParseError{ParseErrorKind::FileNotFound,
                                "transaction log not found: " + platform::path_to_utf8(log_path)};
            return false;
        }
        auto bytes = platform::read_file_bytes(log_path);
        if (!bytes) {
            error_ = ParseError{ParseErrorKind::IoError, "could not read transaction log: " +
                                                             platform::path_to_utf8(log_path)};
            return false;
        }
        log_bytes.push_back(std::move(*bytes));
    }

    bool ok = load_from_bytes(std::move(*hive_bytes), log_bytes);
    path_ = path;
    if (ok) {
        log_paths_ = logs;
    }
    return ok;
}

bool HiveParser::load_from_bytes(std::vector<std::uint8_t> hive,
                                 const std::vector<std::vector<std::uint8_t>>& logs) {
    path_.clear();
    log_paths_.clear();
    loaded_ = false;
    error_.reset();
    impl_->reset();

    if (logs.size() > MAX_TRANSACTION_LOGS) {
        error_ = ParseError{ParseErrorKind::TooManyLogs,
                            std::to_string(logs.size()) + " transaction logs given, at most " +
                                std::to_string(MAX_TRANSACTION_LOGS) + " supported"};
        return false;
    }

    // Заголовок
    auto decoded = format::decode_header(format::ByteCursor(hive));
    if (!decoded.ok()) {
        const auto kind = decoded.error->kind == format::HeaderErrorKind::TooShort
                              ? ParseErrorKind::TooShort
                              : ParseErrorKind::MalformedHeader;
        error_ = ParseError{kind, decoded.error->message};
        return false;
    }
    impl_->original_header = *decoded.header;

    std::vector<format::Diagnostic> diagnostics = std::move(decoded.diagnostics);
    format::HiveHeader header = *decoded.header;

    // Журналы транзакций
    if (impl_->config.apply_transaction_logs && !logs.empty()) {
        std::vector<format::ByteCursor> cursors;
        cursors.reserve(logs.size());
        for (const auto& log : logs) {
            cursors.emplace_back(log);
        }

        impl_->replay =
            txlog::replay_logs(hive, header, cursors, impl_->config.replay_options());
        diagnostics.insert(diagnostics.end(), impl_->replay.diagnostics.begin(),
                           impl_->replay.diagnostics.end());

        if (impl_->replay.applied()) {
            auto patched = format::decode_header(format::ByteCursor(hive));
            if (patched.ok()) {
                header = *patched.header;
            }
        }
    }

    if (impl_->original_header->is_dirty() && !impl_->replay.applied()) {
        diagnostics.push_back(format::make_diagnostic(
            format::DiagnosticKind::DirtyHive, 0x04,
            "primary sequence " + std::to_string(impl_->original_header->primary_sequence) +
                " differs from secondary sequence " +
                std::to_string(impl_->original_header->secondary_sequence) +
                ", hive may be missing uncommitted changes",
            format::DiagnosticSource::Header));
    }

    impl_->hive = std::make_unique<tree::Hive>(std::move(hive), std::move(header),
                                               impl_->config.tree_options(), diagnostics);
    loaded_ = true;
    return true;
}

// ============================================================================
// Результаты
// ============================================================================

const tree::Hive* HiveParser::hive() const {
    return impl_->hive.get();
}

const std::optional<format::HiveHeader>& HiveParser::original_header() const {
    return impl_->original_header;
}

const txlog::ReplayResult& HiveParser::replay_result() const {
    return impl_->replay;
}

bool HiveParser::transaction_logs_applied() const {
    return impl_->replay.applied();
}

std::optional<tree::KeyHandle> HiveParser::get_root_key() const {
    if (!loaded_) {
        return std::nullopt;
    }
    return impl_->hive->root();
}

std::optional<tree::KeyHandle> HiveParser::get_key(std::string_view key_path) const {
    if (!loaded_) {
        return std::nullopt;
    }
    return impl_->hive->find_key(key_path);
}

std::optional<recovery::OrphanCursor> HiveParser::orphans() const {
    if (!loaded_ || !impl_->config.recover_deleted) {
        return std::nullopt;
    }
    return recovery::OrphanCursor(*impl_->hive, impl_->replay.patched_ranges);
}

std::vector<format::Diagnostic> HiveParser::diagnostics() const {
    if (!loaded_) {
        return {};
    }
    return impl_->hive->diagnostics().snapshot();
}

// ============================================================================
// Параллельный разбор
// ============================================================================

std::vector<HiveParser> parse_hives_parallel(const std::vector<std::filesystem::path>& paths,
                                             const ParserConfig& config, unsigned threads) {
    std::vector<HiveParser> parsers;
    parsers.reserve(paths.size());
    for (std::size_t i = 0; i < paths.size(); ++i) {
        parsers.emplace_back(config);
    }

    if (threads == 0) {
        threads = std::max(1u, std::thread::hardware_concurrency());
    }
    threads = static_cast<unsigned>(std::min<std::size_t>(threads, paths.size()));

    std::atomic<std::size_t> next{0};
    auto worker = [&]() {
        while (true) {
            std::size_t i = next.fetch_add(1);
            if (i >= paths.size()) {
                break;
            }
            parsers[i].load(paths[i]);
        }
    };

    std::vector<std::thread> pool;
    pool.reserve(threads);
    for (unsigned t = 0; t < threads; ++t) {
        pool.emplace_back(worker);
    }
    for (auto& thread : pool) {
        thread.join();
    }

    return parsers;
}

}  // namespace reghive
