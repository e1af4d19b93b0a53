// ==============================================================================
// test_records_gtest.cpp - Тесты декодеров записей ячеек (GoogleTest)
// ==============================================================================

#include "reghive/records.hpp"

#include "hive_builder.hpp"

#include <gtest/gtest.h>
#include <vector>

namespace reghive::format::test {

using reghive::test::HiveBuilder;
using reghive::test::KeySpec;
using reghive::test::put_u16;
using reghive::test::put_u32;
using reghive::test::TEST_FILETIME;
using reghive::test::ValueSpec;

namespace {

constexpr std::uint32_t REGION = 0x10000;

KeySpec sample_key() {
    KeySpec spec;
    spec.name = "Software";
    spec.parent = 0x20;
    spec.subkey_count = 3;
    spec.subkey_list = 0x180;
    spec.value_count = 2;
    spec.value_list = 0x200;
    spec.security = 0x300;
    return spec;
}

ValueSpec sample_value() {
    ValueSpec spec;
    spec.name = "Version";
    spec.type = 4;
    spec.data_size_raw = 4 | VALUE_DATA_INLINE_FLAG;
    spec.data_offset = 0x0A0B0C0D;
    return spec;
}

bool has_kind(const std::vector<Diagnostic>& diagnostics, DiagnosticKind kind) {
    for (const auto& d : diagnostics) {
        if (d.kind == kind) {
            return true;
        }
    }
    return false;
}

}  // anonymous namespace

// ==============================================================================
// Key node
// ==============================================================================

TEST(RecordsTest, KeyNode_DecodesAllFields) {
    auto payload = HiveBuilder::key_payload(sample_key());
    auto decoded = decode_key_node(ByteCursor(payload), 0x1000);

    ASSERT_TRUE(decoded.ok());
    EXPECT_EQ(decoded.status, DecodeStatus::Ok);
    EXPECT_TRUE(decoded.diagnostics.empty());

    const KeyNode& key = *decoded.record;
    EXPECT_EQ(key.offset, 0x1000u);
    EXPECT_EQ(key.flags, KEY_COMP_NAME);
    EXPECT_EQ(key.last_written, TEST_FILETIME);
    EXPECT_EQ(key.parent_offset, 0x20u);
    EXPECT_EQ(key.subkey_count, 3u);
    EXPECT_EQ(key.subkey_list_offset, 0x180u);
    EXPECT_EQ(key.volatile_subkey_list_offset, 0xFFFFFFFFu);
    EXPECT_EQ(key.value_count, 2u);
    EXPECT_EQ(key.value_list_offset, 0x200u);
    EXPECT_EQ(key.security_offset, 0x300u);
    EXPECT_EQ(key.class_name_offset, 0xFFFFFFFFu);
    EXPECT_EQ(key.name_length, 8u);
    EXPECT_EQ(key.name, "Software");
    EXPECT_EQ(key.record_length, KEY_NODE_FIXED_SIZE + 8);
    EXPECT_TRUE(key.compressed_name());
    EXPECT_FALSE(key.is_root());
    EXPECT_FALSE(key.has_class_name());
}

TEST(RecordsTest, KeyNode_Utf16Name) {
    KeySpec spec;
    spec.flags = 0;
    spec.name = std::string("S\0W\0", 4);
    auto payload = HiveBuilder::key_payload(spec);

    auto decoded = decode_key_node(ByteCursor(payload), 0x20);
    ASSERT_TRUE(decoded.ok());
    EXPECT_EQ(decoded.record->name, "SW");
    EXPECT_FALSE(decoded.record->name_lossy);
}

TEST(RecordsTest, KeyNode_InvalidUtf16Name_Reported) {
    KeySpec spec;
    spec.flags = 0;
    spec.name = std::string("\x00\xD8", 2);
    auto payload = HiveBuilder::key_payload(spec);

    auto decoded = decode_key_node(ByteCursor(payload), 0x20);
    ASSERT_TRUE(decoded.ok());
    EXPECT_TRUE(decoded.record->name_lossy);
    EXPECT_TRUE(has_kind(decoded.diagnostics, DiagnosticKind::InvalidStringEncoding));
}

TEST(RecordsTest, KeyNode_NameOverrunsCell_Truncated) {
    auto payload = HiveBuilder::key_payload(sample_key());
    put_u16(payload, 0x48, 40);

    auto decoded = decode_key_node(ByteCursor(payload), 0x20);
    ASSERT_TRUE(decoded.ok());
    EXPECT_EQ(decoded.record->name, "Software");
    EXPECT_EQ(decoded.record->record_length, KEY_NODE_FIXED_SIZE + 8);
    EXPECT_TRUE(has_kind(decoded.diagnostics, DiagnosticKind::TruncatedRecord));
}

TEST(RecordsTest, KeyNode_FixedPartMissing) {
    auto payload = HiveBuilder::key_payload(sample_key());
    payload.resize(0x30);

    auto decoded = decode_key_node(ByteCursor(payload), 0x20);
    EXPECT_FALSE(decoded.ok());
    EXPECT_EQ(decoded.status, DecodeStatus::Truncated);
    EXPECT_TRUE(has_kind(decoded.diagnostics, DiagnosticKind::TruncatedRecord));
}

TEST(RecordsTest, KeyNode_WrongSignature) {
    auto payload = HiveBuilder::value_payload(sample_value());
    auto decoded = decode_key_node(ByteCursor(payload), 0x40);

    EXPECT_FALSE(decoded.ok());
    EXPECT_EQ(decoded.status, DecodeStatus::UnrecognizedSignature);
    ASSERT_EQ(decoded.diagnostics.size(), 1u);
    EXPECT_EQ(decoded.diagnostics[0].kind, DiagnosticKind::UnrecognizedSignature);
    EXPECT_EQ(decoded.diagnostics[0].offset, 0x40u);
}

// ==============================================================================
// Value node
// ==============================================================================

TEST(RecordsTest, ValueNode_InlineData) {
    auto payload = HiveBuilder::value_payload(sample_value());
    auto decoded = decode_value_node(ByteCursor(payload), 0x80);

    ASSERT_TRUE(decoded.ok());
    const ValueNode& value = *decoded.record;
    EXPECT_EQ(value.name, "Version");
    EXPECT_EQ(value.data_type, 4u);
    EXPECT_TRUE(value.is_inline());
    EXPECT_EQ(value.data_length(), 4u);
    EXPECT_EQ(value.storage(), DataStorage::Inline);
    EXPECT_EQ(value.inline_data(), (std::vector<std::uint8_t>{0x0D, 0x0C, 0x0B, 0x0A}));
    EXPECT_EQ(value.record_length, VALUE_NODE_FIXED_SIZE + 7);
}

TEST(RecordsTest, ValueNode_StorageByLength) {
    ValueNode value;
    value.data_size_raw = 100;
    EXPECT_EQ(value.storage(), DataStorage::Resident);
    value.data_size_raw = BIG_DATA_SEGMENT_SIZE;
    EXPECT_EQ(value.storage(), DataStorage::Resident);
    value.data_size_raw = BIG_DATA_SEGMENT_SIZE + 1;
    EXPECT_EQ(value.storage(), DataStorage::BigData);
    value.data_size_raw = 2 | VALUE_DATA_INLINE_FLAG;
    EXPECT_EQ(value.storage(), DataStorage::Inline);
    EXPECT_EQ(value.inline_data().size(), 2u);
}

TEST(RecordsTest, ValueNode_DefaultValueHasEmptyName) {
    ValueSpec spec = sample_value();
    spec.name.clear();
    auto payload = HiveBuilder::value_payload(spec);

    auto decoded = decode_value_node(ByteCursor(payload), 0x80);
    ASSERT_TRUE(decoded.ok());
    EXPECT_TRUE(decoded.record->name.empty());
}

// ==============================================================================
// Списки подключей
// ==============================================================================

TEST(RecordsTest, SubkeyList_HashLeaf) {
    HiveBuilder builder;
    std::uint32_t list = builder.add_subkey_list(reghive::test::ListKind::Lh, {0x100, 0x200},
                                                 {"Alpha", "Beta"});
    auto payload = ByteCursor(builder.region()).sub_clamped(list + 4, 4 + 2 * 8);

    auto decoded = decode_subkey_list(payload, list);
    ASSERT_TRUE(decoded.ok());
    EXPECT_EQ(decoded.record->kind, SubkeyListKind::HashLeaf);
    EXPECT_EQ(decoded.record->declared_count, 2u);
    EXPECT_EQ(decoded.record->offsets, (std::vector<std::uint32_t>{0x100, 0x200}));
    ASSERT_EQ(decoded.record->hints.size(), 2u);
    EXPECT_EQ(decoded.record->hints[0], lh_name_hash("Alpha").value());
    EXPECT_EQ(decoded.record->hints[1], lh_name_hash("beta").value());
}

TEST(RecordsTest, SubkeyList_IndexLeafAndRoot) {
    std::vector<std::uint8_t> li = {'l', 'i', 3, 0, 0x10, 0, 0, 0, 0x20, 0, 0, 0, 0x30, 0, 0, 0};
    auto decoded = decode_subkey_list(ByteCursor(li), 0x40);
    ASSERT_TRUE(decoded.ok());
    EXPECT_EQ(decoded.record->kind, SubkeyListKind::IndexLeaf);
    EXPECT_EQ(decoded.record->offsets, (std::vector<std::uint32_t>{0x10, 0x20, 0x30}));
    EXPECT_TRUE(decoded.record->hints.empty());

    li[0] = 'r';
    decoded = decode_subkey_list(ByteCursor(li), 0x40);
    ASSERT_TRUE(decoded.ok());
    EXPECT_EQ(decoded.record->kind, SubkeyListKind::IndexRoot);
}

TEST(RecordsTest, SubkeyList_CountExceedsCell_Truncated) {
    std::vector<std::uint8_t> lf = {'l', 'f', 5, 0, 0x10, 0, 0, 0, 'A', 0, 0, 0};
    auto decoded = decode_subkey_list(ByteCursor(lf), 0x40);

    ASSERT_TRUE(decoded.ok());
    EXPECT_EQ(decoded.record->declared_count, 5u);
    EXPECT_EQ(decoded.record->offsets.size(), 1u);
    EXPECT_TRUE(has_kind(decoded.diagnostics, DiagnosticKind::TruncatedRecord));
}

TEST(RecordsTest, SubkeyList_UnknownSignature) {
    std::vector<std::uint8_t> bytes = {'x', 'y', 0, 0};
    auto decoded = decode_subkey_list(ByteCursor(bytes), 0x40);
    EXPECT_EQ(decoded.status, DecodeStatus::UnrecognizedSignature);
}

TEST(RecordsTest, NameHash_KnownValues) {
    EXPECT_EQ(lh_name_hash("ab").value(), 65u * 37u + 66u);
    EXPECT_EQ(lh_name_hash("AB"), lh_name_hash("ab"));
    EXPECT_EQ(lh_name_hash("").value(), 0u);
    EXPECT_FALSE(lh_name_hash("\xC3\xA9").has_value());
}

TEST(RecordsTest, NameHint_FirstFourCharacters) {
    const std::uint32_t expected = 'S' | ('o' << 8) | ('f' << 16) | (static_cast<std::uint32_t>('t') << 24);
    EXPECT_EQ(lf_name_hint("Software").value(), expected);
    EXPECT_EQ(lf_name_hint("Ab").value(), static_cast<std::uint32_t>('A' | ('b' << 8)));
}

// ==============================================================================
// Прочие записи
// ==============================================================================

TEST(RecordsTest, ValueList_TruncatedByCell) {
    std::vector<std::uint8_t> bytes(8, 0);
    put_u32(bytes, 0, 0x100);
    put_u32(bytes, 4, 0x200);

    auto decoded = decode_value_list(ByteCursor(bytes), 0x40, 3);
    ASSERT_TRUE(decoded.ok());
    EXPECT_EQ(decoded.record->offsets, (std::vector<std::uint32_t>{0x100, 0x200}));
    EXPECT_TRUE(has_kind(decoded.diagnostics, DiagnosticKind::TruncatedRecord));
}

TEST(RecordsTest, SecurityKey_Decodes) {
    HiveBuilder builder;
    auto descriptor = reghive::test::sample_descriptor();
    std::uint32_t sk = builder.add_sk(0x20, 0x30, 5, descriptor);

    auto payload = ByteCursor(builder.region()).sub_clamped(sk + 4, 0x14 + descriptor.size());
    auto decoded = decode_security_key(payload, sk);

    ASSERT_TRUE(decoded.ok());
    EXPECT_EQ(decoded.record->flink, 0x20u);
    EXPECT_EQ(decoded.record->blink, 0x30u);
    EXPECT_EQ(decoded.record->reference_count, 5u);
    EXPECT_EQ(decoded.record->descriptor, descriptor);
    EXPECT_TRUE(decoded.diagnostics.empty());
}

TEST(RecordsTest, SecurityKey_DescriptorOverrunsCell) {
    std::vector<std::uint8_t> bytes(0x18, 0);
    bytes[0] = 's';
    bytes[1] = 'k';
    put_u32(bytes, 0x10, 100);

    auto decoded = decode_security_key(ByteCursor(bytes), 0x40);
    ASSERT_TRUE(decoded.ok());
    EXPECT_EQ(decoded.record->descriptor.size(), 4u);
    EXPECT_TRUE(has_kind(decoded.diagnostics, DiagnosticKind::TruncatedRecord));
}

TEST(RecordsTest, BigDataAndSegmentList) {
    std::vector<std::uint8_t> db = {'d', 'b', 3, 0, 0x40, 0x01, 0, 0};
    auto decoded = decode_big_data(ByteCursor(db), 0x80);
    ASSERT_TRUE(decoded.ok());
    EXPECT_EQ(decoded.record->segment_count, 3u);
    EXPECT_EQ(decoded.record->segment_list_offset, 0x140u);

    std::vector<std::uint8_t> list(12, 0);
    put_u32(list, 0, 0x1000);
    put_u32(list, 4, 0x5000);
    put_u32(list, 8, 0x9000);
    auto segments = decode_segment_list(ByteCursor(list), 0x140, 3);
    ASSERT_TRUE(segments.ok());
    EXPECT_EQ(*segments.record, (std::vector<std::uint32_t>{0x1000, 0x5000, 0x9000}));
}

TEST(RecordsTest, DecodeCell_DispatchesBySignature) {
    auto key_payload = HiveBuilder::key_payload(sample_key());
    auto key = decode_cell(ByteCursor(key_payload), 0x20);
    ASSERT_TRUE(key.ok());
    EXPECT_TRUE(std::holds_alternative<KeyNode>(*key.record));

    auto value_payload = HiveBuilder::value_payload(sample_value());
    auto value = decode_cell(ByteCursor(value_payload), 0x80);
    ASSERT_TRUE(value.ok());
    EXPECT_TRUE(std::holds_alternative<ValueNode>(*value.record));

    std::vector<std::uint8_t> junk = {'z', 'z', 0, 0};
    auto unknown = decode_cell(ByteCursor(junk), 0x90);
    EXPECT_FALSE(unknown.ok());
    EXPECT_EQ(unknown.status, DecodeStatus::UnrecognizedSignature);
}

TEST(RecordsTest, Decoders_AreDeterministic) {
    auto payload = HiveBuilder::key_payload(sample_key());
    auto first = decode_key_node(ByteCursor(payload), 0x20);
    auto second = decode_key_node(ByteCursor(payload), 0x20);
    ASSERT_TRUE(first.ok());
    ASSERT_TRUE(second.ok());
    EXPECT_EQ(first.record->name, second.record->name);
    EXPECT_EQ(first.record->subkey_list_offset, second.record->subkey_list_offset);
    EXPECT_EQ(first.record->record_length, second.record->record_length);
}

// ==============================================================================
// Правдоподобие
// ==============================================================================

TEST(PlausibilityTest, KeyNode_ValidPasses) {
    auto payload = HiveBuilder::key_payload(sample_key());
    auto key = *decode_key_node(ByteCursor(payload), 0x400).record;
    EXPECT_TRUE(plausible_key_node(key, REGION));
}

TEST(PlausibilityTest, KeyNode_Rejections) {
    auto payload = HiveBuilder::key_payload(sample_key());
    const KeyNode base = *decode_key_node(ByteCursor(payload), 0x400).record;

    KeyNode key = base;
    key.name_length = 0;
    key.record_length = KEY_NODE_FIXED_SIZE;
    EXPECT_FALSE(plausible_key_node(key, REGION));

    key = base;
    key.flags = 0x8000;
    EXPECT_FALSE(plausible_key_node(key, REGION));

    key = base;
    key.last_written = 0;
    EXPECT_FALSE(plausible_key_node(key, REGION));

    key = base;
    key.parent_offset = 0x21;
    EXPECT_FALSE(plausible_key_node(key, REGION));

    key = base;
    key.subkey_list_offset = REGION + 8;
    EXPECT_FALSE(plausible_key_node(key, REGION));

    key = base;
    key.value_count = 0x200000;
    EXPECT_FALSE(plausible_key_node(key, REGION));

    key = base;
    key.record_length -= 1;
    EXPECT_FALSE(plausible_key_node(key, REGION));
}

TEST(PlausibilityTest, KeyNode_UnusedListOffsetIgnored) {
    KeySpec spec = sample_key();
    spec.subkey_count = 0;
    spec.subkey_list = 0x12345;
    auto payload = HiveBuilder::key_payload(spec);
    auto key = *decode_key_node(ByteCursor(payload), 0x400).record;
    EXPECT_TRUE(plausible_key_node(key, REGION));
}

TEST(PlausibilityTest, ValueNode_Checks) {
    auto payload = HiveBuilder::value_payload(sample_value());
    const ValueNode base = *decode_value_node(ByteCursor(payload), 0x400).record;
    EXPECT_TRUE(plausible_value_node(base, REGION));

    ValueNode value = base;
    value.data_size_raw = 8 | VALUE_DATA_INLINE_FLAG;
    EXPECT_FALSE(plausible_value_node(value, REGION));

    value = base;
    value.flags = 0x0004;
    EXPECT_FALSE(plausible_value_node(value, REGION));

    value = base;
    value.data_size_raw = 100;
    value.data_offset = 0xFFFFFFFF;
    EXPECT_FALSE(plausible_value_node(value, REGION));

    value.data_offset = 0x800;
    EXPECT_TRUE(plausible_value_node(value, REGION));

    value.data_size_raw = 0;
    value.data_offset = 0xFFFFFFFF;
    EXPECT_TRUE(plausible_value_node(value, REGION));

    value = base;
    value.data_type = 0x10000;
    EXPECT_FALSE(plausible_value_node(value, REGION));
}

}  // namespace reghive::format::test
