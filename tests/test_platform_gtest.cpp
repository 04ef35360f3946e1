// ==============================================================================
// test_platform_gtest.cpp - Тесты платформенного модуля (GoogleTest)
// ==============================================================================

#include "dds/platform.hpp"

#include "test_support.hpp"

#include <filesystem>
#include <gtest/gtest.h>
#include <set>
#include <string>

namespace dds::platform::test {

// ==============================================================================
// Преобразование путей UTF-8 <-> path
// ==============================================================================

TEST(PlatformTest, PathConversion_Roundtrip) {
    // Arrange
    const std::string original = "/Users/anna/Documents/.DS_Store";

    // Act
    std::string back = path_to_utf8(path_from_utf8(original));

    // Assert
    EXPECT_EQ(back, original);
}

TEST(PlatformTest, PathConversion_RoundtripWithUnicode) {
    // Arrange
    const std::string original = "/Users/test/Фото/日本語 folder";

    // Act
    std::string back = path_to_utf8(path_from_utf8(original));

    // Assert
    EXPECT_EQ(back, original);
}

TEST(PlatformTest, PathFromUtf8_EmptyString) {
    EXPECT_TRUE(path_from_utf8("").empty());
    EXPECT_TRUE(path_to_utf8(std::filesystem::path()).empty());
}

// ==============================================================================
// normalize
// ==============================================================================

TEST(PlatformTest, Normalize_MakesAbsolute) {
    // Arrange & Act
    auto p = normalize("relative/dir");

    // Assert
    EXPECT_TRUE(p.is_absolute());
    EXPECT_EQ(p.filename(), "dir");
}

TEST(PlatformTest, Normalize_DropsDotsAndTrailingSlash) {
#ifndef _WIN32
    EXPECT_EQ(path_to_utf8(normalize("/a/./b/../c/")), "/a/c");
    EXPECT_EQ(path_to_utf8(normalize("/a//b")), "/a/b");
    EXPECT_EQ(path_to_utf8(normalize("/")), "/");
#endif
}

TEST(PlatformTest, Normalize_SameDirectorySameKey) {
#ifndef _WIN32
    EXPECT_EQ(normalize("/tmp/x/"), normalize("/tmp/x"));
#endif
}

// ==============================================================================
// Время и идентификаторы
// ==============================================================================

TEST(PlatformTest, UnixNow_IsPlausible) {
    // 2020-01-01 < now
    EXPECT_GT(unix_now(), 1577836800);
}

TEST(PlatformTest, SessionId_IsUuidV4) {
    // Arrange & Act
    std::string id = generate_session_id();

    // Assert
    ASSERT_EQ(id.size(), 36u);
    EXPECT_EQ(id[8], '-');
    EXPECT_EQ(id[13], '-');
    EXPECT_EQ(id[18], '-');
    EXPECT_EQ(id[23], '-');
    EXPECT_EQ(id[14], '4');
    EXPECT_NE(std::string("89ab").find(id[19]), std::string::npos);
}

TEST(PlatformTest, SessionId_IsUnique) {
    std::set<std::string> ids;
    for (int i = 0; i < 200; ++i) {
        ids.insert(generate_session_id());
    }
    EXPECT_EQ(ids.size(), 200u);
}

class PlatformDirTest : public dds::test::TempDirTest {};

TEST_F(PlatformDirTest, CanReadDirectory_ExistingDirectory) {
    EXPECT_TRUE(can_read_directory(root()));
}

TEST_F(PlatformDirTest, CanReadDirectory_MissingDirectory) {
    EXPECT_FALSE(can_read_directory(root() / "missing"));
}

#ifndef _WIN32
TEST_F(PlatformDirTest, CanReadDirectory_NoPermission) {
    // Arrange
    auto locked = make_dir("locked");
    std::filesystem::permissions(locked, std::filesystem::perms::none);

    // Act & Assert (root читает всё - проверка не имеет смысла)
    if (::geteuid() != 0) {
        EXPECT_FALSE(can_read_directory(locked));
    }
    std::filesystem::permissions(locked, std::filesystem::perms::owner_all);
}
#endif

}  // namespace dds::platform::test
