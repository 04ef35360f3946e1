// ==============================================================================
// test_output_gtest.cpp - Тесты модуля вывода (GoogleTest)
// ==============================================================================

#include "dds/output.hpp"

#include <gtest/gtest.h>
#include <rapidjson/document.h>
#include <string>
#include <thread>
#include <vector>

namespace dds::output::test {

namespace {

OutputConfig plain(bool quiet = false, int verbose = 0) {
    OutputConfig cfg;
    cfg.quiet = quiet;
    cfg.verbose = verbose;
    cfg.color = false;
    return cfg;
}

}  // namespace

// ==============================================================================
// Уровни: quiet / verbose
// ==============================================================================

TEST(OutputTest, Writer_Info_WritesToStderr) {
    // Arrange
    Writer writer(plain());

    // Act
    ::testing::internal::CaptureStderr();
    writer.info("hello");
    std::string err = ::testing::internal::GetCapturedStderr();

    // Assert
    EXPECT_EQ(err, "[+] hello\n");
}

TEST(OutputTest, Writer_QuietMode_InfoAndWarnSuppressed) {
    Writer writer(plain(true));

    ::testing::internal::CaptureStderr();
    writer.info("info");
    writer.warn("warn");
    std::string err = ::testing::internal::GetCapturedStderr();

    EXPECT_TRUE(err.empty());
}

TEST(OutputTest, Writer_QuietMode_ErrorNotSuppressed) {
    Writer writer(plain(true));

    ::testing::internal::CaptureStderr();
    writer.error("fatal");
    std::string err = ::testing::internal::GetCapturedStderr();

    EXPECT_EQ(err, "[x] fatal\n");
}

TEST(OutputTest, Writer_Verbose0_DebugSuppressed) {
    Writer writer(plain(false, 0));

    ::testing::internal::CaptureStderr();
    writer.debug("dbg");
    std::string err = ::testing::internal::GetCapturedStderr();

    EXPECT_TRUE(err.empty());
    EXPECT_FALSE(writer.debug_enabled());
}

TEST(OutputTest, Writer_Verbose1_DebugEnabledTraceSuppressed) {
    Writer writer(plain(false, 1));

    ::testing::internal::CaptureStderr();
    writer.debug("dbg");
    writer.trace("trc");
    std::string err = ::testing::internal::GetCapturedStderr();

    EXPECT_EQ(err, "[*] dbg\n");
}

TEST(OutputTest, Writer_Verbose2_TraceEnabled) {
    Writer writer(plain(false, 2));

    ::testing::internal::CaptureStderr();
    writer.trace("trc");
    std::string err = ::testing::internal::GetCapturedStderr();

    EXPECT_EQ(err, "[~] trc\n");
}

TEST(OutputTest, Writer_ConcurrentLines_AreNotInterleaved) {
    // Arrange
    Writer writer(plain());
    const std::string line(64, 'a');

    // Act
    ::testing::internal::CaptureStdout();
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&writer, &line] {
            for (int i = 0; i < 50; ++i) {
                writer.write_line(Stream::Stdout, line);
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }
    std::string out = ::testing::internal::GetCapturedStdout();

    // Assert: 200 целых строк
    std::size_t lines = 0;
    std::size_t pos = 0;
    while (pos < out.size()) {
        const auto nl = out.find('\n', pos);
        ASSERT_NE(nl, std::string::npos);
        EXPECT_EQ(out.substr(pos, nl - pos), line);
        ++lines;
        pos = nl + 1;
    }
    EXPECT_EQ(lines, 200u);
}

// ==============================================================================
// JSON
// ==============================================================================

TEST(OutputTest, WriteJsonPretty_ParsesBack) {
    // Arrange
    Writer writer(plain());
    rapidjson::Document doc;
    doc.SetObject();
    doc.AddMember("total_entries", 3, doc.GetAllocator());
    doc.AddMember("database", "/tmp/cache.sqlite", doc.GetAllocator());

    // Act
    ::testing::internal::CaptureStdout();
    writer.write_json_pretty(doc);
    std::string out = ::testing::internal::GetCapturedStdout();

    // Assert
    rapidjson::Document parsed;
    parsed.Parse(out.c_str());
    ASSERT_FALSE(parsed.HasParseError());
    EXPECT_EQ(parsed["total_entries"].GetInt(), 3);
    EXPECT_STREQ(parsed["database"].GetString(), "/tmp/cache.sqlite");
    EXPECT_EQ(out.back(), '\n');
}

// ==============================================================================
// Table
// ==============================================================================

TEST(OutputTest, Table_ToString_ContainsBoxDrawingAndData) {
    // Arrange
    Table table;
    table.set_headers({"Session", "Status"});
    table.add_row({"abc", "interrupted"});

    // Act
    std::string s = table.to_string();

    // Assert
    EXPECT_NE(s.find("\xe2\x94\x8c"), std::string::npos);  // ┌
    EXPECT_NE(s.find("Session"), std::string::npos);
    EXPECT_NE(s.find("interrupted"), std::string::npos);
    EXPECT_EQ(table.row_count(), 1u);
}

TEST(OutputTest, Table_Columns_AlignedByDisplayWidth) {
    // Arrange
    Table table;
    table.set_headers({"Root"});
    table.add_row({"/Фото"});
    table.add_row({"/photos"});

    // Act
    std::string s = table.to_string();

    // Assert: все строки одинаковой видимой ширины
    std::size_t width = 0;
    std::size_t pos = 0;
    while (pos < s.size()) {
        const auto nl = s.find('\n', pos);
        const std::size_t w = display_width(std::string_view(s).substr(pos, nl - pos));
        if (width == 0) {
            width = w;
        }
        EXPECT_EQ(w, width);
        pos = nl + 1;
    }
}

TEST(OutputTest, DisplayWidth_CountsCodePoints) {
    EXPECT_EQ(display_width("abc"), 3u);
    EXPECT_EQ(display_width("Фото"), 4u);
    EXPECT_EQ(display_width(""), 0u);
}

// ==============================================================================
// Прогресс
// ==============================================================================

TEST(OutputTest, Progress_HiddenWhenVerbose) {
    Writer writer(plain(false, 1));

    writer.progress_begin("Searching");
    writer.progress_tick("dirs 1 new");

    EXPECT_FALSE(writer.progress_active());
    writer.progress_end();
}

TEST(OutputTest, Progress_HiddenWhenQuiet) {
    Writer writer(plain(true));

    writer.progress_begin("Searching");

    EXPECT_FALSE(writer.progress_active());
}

TEST(OutputTest, TickMs_Positive) {
    EXPECT_GT(TICK_MS, 0);
}

}  // namespace dds::output::test
