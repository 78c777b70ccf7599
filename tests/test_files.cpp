#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "../src/files.hpp"

TEST(Files, Utf8Validation) {
    EXPECT_TRUE(is_valid_utf8(""));
    EXPECT_TRUE(is_valid_utf8("plain ascii\n"));
    EXPECT_TRUE(is_valid_utf8("h\xC3\xA9llo \xE2\x82\xAC \xF0\x9F\x98\x80"));
    EXPECT_FALSE(is_valid_utf8("\xff\xfe"));
    EXPECT_FALSE(is_valid_utf8("\xC3"));              // truncated
    EXPECT_FALSE(is_valid_utf8("\xC0\xAF"));          // overlong '/'
    EXPECT_FALSE(is_valid_utf8("\xED\xA0\x80"));      // surrogate
}

TEST(Files, FromBytesPicksEncoding) {
    auto text = FileContent::from_bytes("hello\n");
    EXPECT_TRUE(text.is_text());
    EXPECT_EQ(text.data, "hello\n");

    auto bin = FileContent::from_bytes(std::string("\x89PNG\r\n\x1a\n\xff", 9));
    EXPECT_TRUE(bin.is_binary());
    EXPECT_EQ(bin.bytes(), std::string("\x89PNG\r\n\x1a\n\xff", 9));
}

TEST(Files, JsonMapping) {
    Files files = {{"a.txt", FileContent::text("1")}, {"img.bin", FileContent::base64("//4=")}};
    nlohmann::json j = files;
    EXPECT_EQ(j["a.txt"], "1");
    EXPECT_EQ(j["img.bin"]["base64"], "//4=");
    EXPECT_EQ(j.get<Files>(), files);
}

TEST(Files, JsonRejectsOtherShapes) {
    nlohmann::json j = {{"a.txt", 42}};
    EXPECT_THROW(j.get<Files>(), std::invalid_argument);
}
