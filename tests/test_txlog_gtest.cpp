// ==============================================================================
// test_txlog_gtest.cpp - Тесты журналов транзакций (GoogleTest)
// ==============================================================================

#include "reghive/txlog.hpp"

#include "hive_builder.hpp"

#include <gtest/gtest.h>
#include <vector>

namespace reghive::txlog::test {

using format::ByteCursor;
using format::DiagnosticKind;
using format::DiagnosticSource;
using reghive::test::get_u32;
using reghive::test::HiveBuilder;
using reghive::test::LogBuilder;
using reghive::test::LogPage;

namespace {

constexpr std::uint32_t BINS_SIZE = 4096;

std::size_t count_kind(const std::vector<format::Diagnostic>& diagnostics, DiagnosticKind kind) {
    std::size_t n = 0;
    for (const auto& d : diagnostics) {
        if (d.kind == kind) {
            ++n;
        }
    }
    return n;
}

LogPage page_of(std::uint32_t offset, std::uint8_t fill, std::size_t size = 8) {
    return LogPage{offset, std::vector<std::uint8_t>(size, fill)};
}

}  // anonymous namespace

// ==============================================================================
// Marvin32
// ==============================================================================

TEST(MarvinTest, ReferenceVectors) {
    const std::uint64_t seed = 0x004FB61A001BDBCCULL;

    EXPECT_EQ(marvin32(nullptr, 0, seed), 0x30ed35c100cd3c7dULL);

    const std::uint8_t one[] = {0xaf};
    EXPECT_EQ(marvin32(one, sizeof(one), seed), 0x48e73fc77d75ddc1ULL);

    const std::uint8_t two[] = {0xe7, 0x0f};
    EXPECT_EQ(marvin32(two, sizeof(two), seed), 0xb5f6e1fc485dbff8ULL);

    const std::uint8_t three[] = {0x37, 0xf4, 0x95};
    EXPECT_EQ(marvin32(three, sizeof(three), seed), 0xf0b07c789b8cf7e8ULL);

    const std::uint8_t four[] = {0x86, 0x42, 0xdc, 0x59};
    EXPECT_EQ(marvin32(four, sizeof(four), seed), 0x7008f2e87e9cf556ULL);
}

TEST(MarvinTest, LogEntrySeed) {
    EXPECT_EQ(marvin32(nullptr, 0, LOG_ENTRY_HASH_SEED), 0xb39efca403966e08ULL);

    std::vector<std::uint8_t> counter(32);
    for (std::size_t i = 0; i < counter.size(); ++i) {
        counter[i] = static_cast<std::uint8_t>(i);
    }
    EXPECT_EQ(marvin32(counter.data(), counter.size(), LOG_ENTRY_HASH_SEED),
              0xc64feee425c2e24cULL);

    const std::uint8_t abc[] = {'a', 'b', 'c'};
    EXPECT_EQ(marvin32(abc, sizeof(abc), LOG_ENTRY_HASH_SEED), 0xb9cf3dfca41914f7ULL);
}

// ==============================================================================
// parse_transaction_log
// ==============================================================================

TEST(TxlogParseTest, ValidEntries_Accepted) {
    LogBuilder log;
    log.add_entry(2, BINS_SIZE, {page_of(0x100, 0x11)});
    log.add_entry(3, BINS_SIZE, {page_of(0x200, 0x22, 16), page_of(0x300, 0x33)});

    auto parsed = parse_transaction_log(ByteCursor(log.bytes()), LogSlot::Primary, 1);

    EXPECT_EQ(parsed.state, LogFileState::Parsed);
    EXPECT_TRUE(parsed.diagnostics.empty());
    EXPECT_FALSE(parsed.break_sequence.has_value());
    ASSERT_EQ(parsed.entries.size(), 2u);

    const LogEntry& first = parsed.entries[0];
    EXPECT_EQ(first.state, EntryState::Accepted);
    EXPECT_EQ(first.file_offset, 512u);
    EXPECT_EQ(first.size, 512u);
    EXPECT_EQ(first.sequence, 2u);
    ASSERT_EQ(first.pages.size(), 1u);
    EXPECT_EQ(first.pages[0].offset, 0x100u);
    EXPECT_EQ(first.pages[0].bytes, std::vector<std::uint8_t>(8, 0x11));

    const LogEntry& second = parsed.entries[1];
    EXPECT_EQ(second.file_offset, log.entry_offset(1));
    ASSERT_EQ(second.pages.size(), 2u);
    EXPECT_EQ(second.pages[0].size, 16u);
    EXPECT_EQ(second.pages[1].bytes[0], 0x33);
    EXPECT_EQ(parsed.count(EntryState::Accepted), 2u);
}

TEST(TxlogParseTest, CommittedEntries_Stale) {
    LogBuilder log;
    log.add_entry(4, BINS_SIZE, {page_of(0x100, 1)});
    log.add_entry(5, BINS_SIZE, {page_of(0x100, 2)});

    auto parsed = parse_transaction_log(ByteCursor(log.bytes()), LogSlot::Secondary, 4);

    ASSERT_EQ(parsed.entries.size(), 2u);
    EXPECT_EQ(parsed.entries[0].state, EntryState::Stale);
    EXPECT_EQ(parsed.entries[1].state, EntryState::Accepted);
    ASSERT_EQ(count_kind(parsed.diagnostics, DiagnosticKind::LogEntryStale), 1u);
    EXPECT_EQ(parsed.diagnostics[0].source, DiagnosticSource::SecondaryLog);
    EXPECT_EQ(parsed.diagnostics[0].offset, 512u);
}

TEST(TxlogParseTest, PayloadCorruption_RejectsRestOfFile) {
    LogBuilder log;
    log.add_entry(2, BINS_SIZE, {page_of(0x100, 1)});
    log.add_entry(3, BINS_SIZE, {page_of(0x100, 2)});
    log.add_entry(4, BINS_SIZE, {page_of(0x100, 3)});
    log.corrupt_payload(1);

    auto parsed = parse_transaction_log(ByteCursor(log.bytes()), LogSlot::Primary, 1);

    ASSERT_EQ(parsed.entries.size(), 3u);
    EXPECT_EQ(parsed.entries[0].state, EntryState::Accepted);
    EXPECT_EQ(parsed.entries[1].state, EntryState::Rejected);
    EXPECT_TRUE(parsed.entries[1].pages.empty());
    EXPECT_EQ(parsed.entries[2].state, EntryState::Rejected);
    ASSERT_TRUE(parsed.break_sequence.has_value());
    EXPECT_EQ(*parsed.break_sequence, 3u);
    EXPECT_EQ(count_kind(parsed.diagnostics, DiagnosticKind::LogEntryRejected), 2u);
}

TEST(TxlogParseTest, HeaderCorruption_BreaksAfterLastAccepted) {
    LogBuilder log;
    log.add_entry(2, BINS_SIZE, {page_of(0x100, 1)});
    log.add_entry(3, BINS_SIZE, {page_of(0x100, 2)});
    log.corrupt_header(0);

    auto parsed = parse_transaction_log(ByteCursor(log.bytes()), LogSlot::Primary, 1);

    ASSERT_EQ(parsed.entries.size(), 2u);
    EXPECT_EQ(parsed.entries[0].state, EntryState::Rejected);
    EXPECT_EQ(parsed.entries[0].reason, "header hash mismatch");
    EXPECT_EQ(parsed.entries[1].state, EntryState::Rejected);
    ASSERT_TRUE(parsed.break_sequence.has_value());
    EXPECT_EQ(*parsed.break_sequence, 2u);
}

TEST(TxlogParseTest, OutOfOrder_RejectsRestWithoutBreakPoint) {
    LogBuilder log;
    log.add_entry(3, BINS_SIZE, {page_of(0x100, 1)});
    log.add_entry(2, BINS_SIZE, {page_of(0x100, 2)});
    log.add_entry(5, BINS_SIZE, {page_of(0x100, 3)});

    auto parsed = parse_transaction_log(ByteCursor(log.bytes()), LogSlot::Primary, 1);

    ASSERT_EQ(parsed.entries.size(), 3u);
    EXPECT_EQ(parsed.entries[0].state, EntryState::Accepted);
    EXPECT_EQ(parsed.entries[1].state, EntryState::Rejected);
    EXPECT_EQ(parsed.entries[2].state, EntryState::Rejected);
    EXPECT_FALSE(parsed.break_sequence.has_value());
}

TEST(TxlogParseTest, OutOfOrderBelowHiveSequence_StopsAcceptance) {
    LogBuilder log;
    log.add_entry(5, BINS_SIZE, {page_of(0x100, 1)});
    log.add_entry(6, BINS_SIZE, {page_of(0x100, 2)});
    log.add_entry(3, BINS_SIZE, {page_of(0x100, 3)});
    log.add_entry(7, BINS_SIZE, {page_of(0x100, 4)});

    auto parsed = parse_transaction_log(ByteCursor(log.bytes()), LogSlot::Primary, 4);

    ASSERT_EQ(parsed.entries.size(), 4u);
    EXPECT_EQ(parsed.entries[0].state, EntryState::Accepted);
    EXPECT_EQ(parsed.entries[1].state, EntryState::Accepted);
    EXPECT_EQ(parsed.entries[2].state, EntryState::Rejected);
    EXPECT_EQ(parsed.entries[3].state, EntryState::Rejected);
    EXPECT_EQ(parsed.count(EntryState::Accepted), 2u);
    EXPECT_EQ(parsed.count(EntryState::Stale), 0u);
    EXPECT_EQ(count_kind(parsed.diagnostics, DiagnosticKind::LogEntryStale), 0u);
    EXPECT_FALSE(parsed.break_sequence.has_value());
}

TEST(TxlogParseTest, PageOutsideBinsSize_Rejected) {
    LogBuilder log;
    log.add_entry(2, BINS_SIZE, {page_of(BINS_SIZE - 4, 1)});

    auto parsed = parse_transaction_log(ByteCursor(log.bytes()), LogSlot::Primary, 1);

    ASSERT_EQ(parsed.entries.size(), 1u);
    EXPECT_EQ(parsed.entries[0].state, EntryState::Rejected);
    ASSERT_TRUE(parsed.break_sequence.has_value());
    EXPECT_EQ(*parsed.break_sequence, 2u);
}

TEST(TxlogParseTest, InvalidEntrySize_StopsScan) {
    LogBuilder log;
    log.add_entry(2, BINS_SIZE, {page_of(0x100, 1)});
    log.add_entry(3, BINS_SIZE, {page_of(0x100, 2)});
    log.rewrite_u32(0, 0x04, 100);

    auto parsed = parse_transaction_log(ByteCursor(log.bytes()), LogSlot::Primary, 1);

    ASSERT_EQ(parsed.entries.size(), 1u);
    EXPECT_EQ(parsed.entries[0].state, EntryState::Rejected);
    EXPECT_EQ(*parsed.break_sequence, 2u);
}

TEST(TxlogParseTest, NoEntries_Parsed) {
    LogBuilder log;
    auto parsed = parse_transaction_log(ByteCursor(log.bytes()), LogSlot::Primary, 1);
    EXPECT_EQ(parsed.state, LogFileState::Parsed);
    EXPECT_TRUE(parsed.entries.empty());
}

TEST(TxlogParseTest, OldFormatLog_Rejected) {
    LogBuilder log;
    log.set_file_type(1);

    auto parsed = parse_transaction_log(ByteCursor(log.bytes()), LogSlot::Secondary, 1);

    EXPECT_EQ(parsed.state, LogFileState::Rejected);
    ASSERT_EQ(parsed.diagnostics.size(), 1u);
    EXPECT_EQ(parsed.diagnostics[0].kind, DiagnosticKind::LogFileInvalid);
    EXPECT_EQ(parsed.diagnostics[0].offset, 0x1Cu);
    EXPECT_EQ(parsed.diagnostics[0].source, DiagnosticSource::SecondaryLog);
}

TEST(TxlogParseTest, GarbageFile_Rejected) {
    std::vector<std::uint8_t> bytes(1024, 0x41);
    auto parsed = parse_transaction_log(ByteCursor(bytes), LogSlot::Primary, 1);
    EXPECT_EQ(parsed.state, LogFileState::Rejected);
    EXPECT_EQ(count_kind(parsed.diagnostics, DiagnosticKind::LogFileInvalid), 1u);
}

// ==============================================================================
// replay_logs
// ==============================================================================

class ReplayTest : public ::testing::Test {
protected:
    void SetUp() override {
        HiveBuilder builder;
        builder.add_key({"ROOT", format::KEY_COMP_NAME | format::KEY_HIVE_ENTRY});
        hive_ = builder.build();
        auto decoded = format::decode_header(ByteCursor(hive_));
        ASSERT_TRUE(decoded.ok());
        base_ = *decoded.header;
    }

    ReplayResult replay(const std::vector<const LogBuilder*>& logs,
                        TieBreak tie_break = TieBreak::PreferSecondary) {
        std::vector<ByteCursor> cursors;
        for (const auto* log : logs) {
            cursors.emplace_back(log->bytes());
        }
        ReplayOptions options;
        options.tie_break = tie_break;
        return replay_logs(hive_, base_, cursors, options);
    }

    std::uint8_t bins_byte(std::uint32_t offset) const {
        return hive_[format::HIVE_BINS_OFFSET + offset];
    }

    std::vector<std::uint8_t> hive_;
    format::HiveHeader base_;
};

TEST_F(ReplayTest, AppliesPagesAndUpdatesHeader) {
    LogBuilder log1;
    log1.add_entry(2, BINS_SIZE, {page_of(0x800, 0xAA)});
    log1.add_entry(3, BINS_SIZE, {page_of(0x808, 0xBB)});

    auto result = replay({&log1});

    EXPECT_TRUE(result.applied());
    EXPECT_EQ(result.applied_sequences, (std::vector<std::uint32_t>{2, 3}));
    EXPECT_EQ(bins_byte(0x800), 0xAA);
    EXPECT_EQ(bins_byte(0x808), 0xBB);
    EXPECT_EQ(result.logs[0].state, LogFileState::Applied);
    EXPECT_EQ(result.logs[0].count(EntryState::Applied), 2u);

    ASSERT_EQ(result.patched_ranges.size(), 2u);
    EXPECT_TRUE(result.in_patched_range(0x807));
    EXPECT_FALSE(result.in_patched_range(0x810));
    EXPECT_FALSE(result.in_patched_range(0x20));

    auto header = format::decode_header(ByteCursor(hive_));
    ASSERT_TRUE(header.ok());
    EXPECT_EQ(header.header->primary_sequence, 3u);
    EXPECT_EQ(header.header->secondary_sequence, 3u);
    EXPECT_TRUE(header.header->checksum_valid());
}

TEST_F(ReplayTest, SameSequence_PrefersSecondaryByDefault) {
    LogBuilder log1;
    LogBuilder log2;
    log1.add_entry(2, BINS_SIZE, {page_of(0x800, 0x01)});
    log2.add_entry(2, BINS_SIZE, {page_of(0x800, 0x02)});

    auto result = replay({&log1, &log2});

    EXPECT_EQ(bins_byte(0x800), 0x02);
    EXPECT_EQ(result.logs[0].entries[0].state, EntryState::Superseded);
    EXPECT_EQ(result.logs[1].entries[0].state, EntryState::Applied);
    EXPECT_EQ(count_kind(result.diagnostics, DiagnosticKind::LogSequenceConflict), 1u);
}

TEST_F(ReplayTest, SameSequence_PrimaryTieBreak) {
    LogBuilder log1;
    LogBuilder log2;
    log1.add_entry(2, BINS_SIZE, {page_of(0x800, 0x01)});
    log2.add_entry(2, BINS_SIZE, {page_of(0x800, 0x02)});

    auto result = replay({&log1, &log2}, TieBreak::PreferPrimary);

    EXPECT_EQ(bins_byte(0x800), 0x01);
    EXPECT_EQ(result.logs[1].entries[0].state, EntryState::Superseded);
}

TEST_F(ReplayTest, IdenticalDuplicates_NoConflict) {
    LogBuilder log1;
    LogBuilder log2;
    log1.add_entry(2, BINS_SIZE, {page_of(0x800, 0x07)});
    log2.add_entry(2, BINS_SIZE, {page_of(0x800, 0x07)});

    auto result = replay({&log1, &log2});

    EXPECT_EQ(result.applied_sequences, (std::vector<std::uint32_t>{2}));
    EXPECT_EQ(count_kind(result.diagnostics, DiagnosticKind::LogSequenceConflict), 0u);
}

TEST_F(ReplayTest, BreakPointAppliesAcrossLogs) {
    LogBuilder log1;
    LogBuilder log2;
    log1.add_entry(2, BINS_SIZE, {page_of(0x800, 0x02)});
    log1.add_entry(3, BINS_SIZE, {page_of(0x800, 0x03)});
    log1.corrupt_payload(1);
    log2.add_entry(3, BINS_SIZE, {page_of(0x900, 0x33)});
    log2.add_entry(4, BINS_SIZE, {page_of(0x900, 0x44)});
    const std::uint8_t untouched = bins_byte(0x900);

    auto result = replay({&log1, &log2});

    ASSERT_TRUE(result.break_sequence.has_value());
    EXPECT_EQ(*result.break_sequence, 3u);
    EXPECT_EQ(result.applied_sequences, (std::vector<std::uint32_t>{2}));
    EXPECT_EQ(bins_byte(0x800), 0x02);
    EXPECT_EQ(bins_byte(0x900), untouched);
    EXPECT_EQ(result.logs[1].entries[0].state, EntryState::Rejected);
    EXPECT_EQ(result.logs[1].entries[1].state, EntryState::Rejected);
    EXPECT_EQ(result.logs[1].state, LogFileState::Rejected);
}

TEST_F(ReplayTest, NothingApplicable_NoLogApplied) {
    LogBuilder log1;
    log1.add_entry(1, BINS_SIZE, {page_of(0x800, 0x01)});
    auto before = hive_;

    auto result = replay({&log1});

    EXPECT_FALSE(result.applied());
    EXPECT_EQ(result.status, ReplayStatus::NoLogApplied);
    EXPECT_EQ(count_kind(result.diagnostics, DiagnosticKind::NoLogApplied), 1u);
    EXPECT_EQ(hive_, before);
}

TEST_F(ReplayTest, NoLogs_NoDiagnostic) {
    auto result = replay({});
    EXPECT_EQ(result.status, ReplayStatus::NoLogApplied);
    EXPECT_TRUE(result.diagnostics.empty());
}

TEST_F(ReplayTest, GrowsHiveBinsSize) {
    LogBuilder log1;
    log1.add_entry(2, BINS_SIZE * 2, {page_of(BINS_SIZE, 0x68, 4096)});

    auto result = replay({&log1});

    ASSERT_TRUE(result.applied());
    EXPECT_EQ(hive_.size(), format::HIVE_BINS_OFFSET + 2 * BINS_SIZE);
    EXPECT_EQ(get_u32(hive_, 0x28), 2 * BINS_SIZE);
}

TEST(TxlogNamesTest, StateNames) {
    EXPECT_STREQ(log_slot_to_string(LogSlot::Primary), "log1");
    EXPECT_STREQ(log_slot_to_string(LogSlot::Secondary), "log2");
    EXPECT_STREQ(entry_state_to_string(EntryState::Superseded), "superseded");
    EXPECT_STREQ(log_file_state_to_string(LogFileState::Applied), "applied");
    EXPECT_STREQ(tie_break_to_string(TieBreak::PreferPrimary), "primary");
}

}  // namespace reghive::txlog::test
