// ==============================================================================
// test_platform_gtest.cpp - Тесты платформенного модуля (GoogleTest)
// ==============================================================================

#include "reghive/platform.hpp"

#include <filesystem>
#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace reghive::platform::test {

// ==============================================================================
// Идентификация платформы
// ==============================================================================

TEST(PlatformTest, OsName_Known) {
    std::string name = os_name();
    EXPECT_TRUE(name == "Windows" || name == "Linux" || name == "macOS");
    EXPECT_EQ(name, os_name());
}

TEST(PlatformTest, IsTty_Consistent) {
    EXPECT_EQ(is_tty_stdout(), is_tty_stdout());
    EXPECT_EQ(is_tty_stderr(), is_tty_stderr());
}

// ==============================================================================
// Пути и UTF-8
// ==============================================================================

TEST(PlatformTest, PathConversion_Roundtrip) {
    // "Реестр/NTUSER.DAT"
    const std::string cyrillic = "\xd0\xa0\xd0\xb5\xd0\xb5\xd1\x81\xd1\x82\xd1\x80/NTUSER.DAT";
    for (const std::string& original :
         {std::string("hives/SYSTEM"), std::string("Config Backup/SOFTWARE.LOG1"), cyrillic}) {
        EXPECT_EQ(path_to_utf8(path_from_utf8(original)), original);
    }
}

TEST(PlatformTest, PathConversion_Empty) {
    EXPECT_TRUE(path_from_utf8("").empty());
    EXPECT_EQ(path_to_utf8(std::filesystem::path()), "");
}

TEST(PlatformTest, PathFromUtf8_KeepsExtension) {
    auto path = path_from_utf8("SYSTEM.LOG2");
    EXPECT_EQ(path_to_utf8(path.stem()), "SYSTEM");
    EXPECT_EQ(path_to_utf8(path.extension()), ".LOG2");
}

// ==============================================================================
// Файлы
// ==============================================================================

TEST(PlatformTest, MakeTempFile_UniqueAndExisting) {
    auto first = make_temp_file("reghive_platform");
    auto second = make_temp_file("reghive_platform");

    EXPECT_TRUE(std::filesystem::exists(first));
    EXPECT_TRUE(std::filesystem::exists(second));
    EXPECT_NE(first, second);
    EXPECT_NE(path_to_utf8(first.filename()).find("reghive_platform"), std::string::npos);

    std::filesystem::remove(first);
    std::filesystem::remove(second);
}

TEST(PlatformTest, WriteAndReadBytes) {
    auto path = make_temp_file("reghive_bytes");
    std::vector<std::uint8_t> bytes = {'r', 'e', 'g', 'f', 0x00, 0xFF, 0x10};

    ASSERT_TRUE(write_file_bytes(path, bytes));
    auto read = read_file_bytes(path);
    std::filesystem::remove(path);

    ASSERT_TRUE(read.has_value());
    EXPECT_EQ(*read, bytes);
}

TEST(PlatformTest, ReadBytes_EmptyFile) {
    auto path = make_temp_file("reghive_empty");
    auto read = read_file_bytes(path);
    std::filesystem::remove(path);

    ASSERT_TRUE(read.has_value());
    EXPECT_TRUE(read->empty());
}

TEST(PlatformTest, ReadBytes_MissingFile) {
    EXPECT_FALSE(read_file_bytes("/nonexistent/reghive/SYSTEM").has_value());
}

TEST(PlatformTest, WriteBytes_MissingDirectory) {
    EXPECT_FALSE(write_file_bytes("/nonexistent/reghive/out.bin", {1, 2, 3}));
}

}  // namespace reghive::platform::test
