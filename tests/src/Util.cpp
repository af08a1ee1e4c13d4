#include "Util.h"

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>
#include <gtest/gtest.h>

using namespace std::string_view_literals;

TEST(UtilTest, ToLowerCase) {
    EXPECT_EQ(ToLowerCase("Hello WORLD"), "hello world");
    EXPECT_EQ(ToLowerCase(""), "");
    EXPECT_EQ(ToLowerCase("123-abc"), "123-abc");
}

TEST(UtilTest, Trim) {
    EXPECT_EQ(Trim("  key \t"), "key"sv);
    EXPECT_EQ(Trim("value"), "value"sv);
    EXPECT_EQ(Trim(" a b "), "a b"sv);
    EXPECT_EQ(Trim(" \t "), ""sv);
    EXPECT_EQ(Trim(""), ""sv);
}

TEST(UtilTest, SplitString) {
    EXPECT_EQ(SplitString("a,b,,c", ','), (std::vector<std::string_view>{"a", "b", "", "c"}));
    EXPECT_TRUE(SplitString("", ',').empty());
}

TEST(UtilTest, GetLinesStripsCarriageReturns) {
    EXPECT_EQ(GetLines("one\r\ntwo\nthree"), (std::vector<std::string_view>{"one", "two", "three"}));
    EXPECT_EQ(GetLines("one\n\ntwo\n"), (std::vector<std::string_view>{"one", "", "two"}));
}

class ReadFileTest : public ::testing::Test {
protected:
    std::filesystem::path path;

    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        path = std::filesystem::temp_directory_path() / ("corpus_count_util_" + std::string{info->name()} + ".txt");
    }

    void TearDown() override { std::filesystem::remove(path); }
};

TEST_F(ReadFileTest, ReadsWholeFile) {
    std::string contents;
    for (int i = 0; i < 20000; ++i) {
        contents += "line " + std::to_string(i) + "\n";
    }
    {
        std::ofstream out(path, std::ios::binary);
        out << contents;
    }

    EXPECT_EQ(ReadFile(path.c_str()), contents);
}

TEST_F(ReadFileTest, ReadsEmptyFile) {
    { std::ofstream out(path); }
    EXPECT_EQ(ReadFile(path.c_str()), "");
}

TEST_F(ReadFileTest, MissingFileThrows) {
    try {
        ReadFile(path.c_str());
        FAIL() << "expected std::runtime_error";
    } catch (const std::runtime_error& e) {
        EXPECT_NE(std::string{e.what()}.find(path.string()), std::string::npos) << e.what();
    }
}

TEST_F(ReadFileTest, ReadStream) {
    {
        std::ofstream out(path);
        out << "streamed text";
    }
    FILE* f = fopen(path.c_str(), "rb");
    ASSERT_NE(f, nullptr);
    EXPECT_EQ(ReadStream(f, "test"), "streamed text");
    fclose(f);
}
