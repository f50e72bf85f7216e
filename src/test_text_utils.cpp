#include "text_utils.hpp"
#include <gtest/gtest.h>

using namespace summarizer;

TEST(TextUtils, DecodesMixedScripts) {
    std::u32string decoded = decode_utf8("a\xC3\xA9\xD8\xB3\xE2\x80\xA6");
    ASSERT_EQ(decoded.size(), 4u);
    EXPECT_EQ(decoded[0], U'a');
    EXPECT_EQ(decoded[1], char32_t(0x00E9));
    EXPECT_EQ(decoded[2], char32_t(0x0633));
    EXPECT_EQ(decoded[3], char32_t(0x2026));
}

TEST(TextUtils, EncodeReversesDecode) {
    std::string text = "Caf\xC3\xA9 \xD9\x85\xD8\xB1\xD8\xAD\xD8\xA8\xD8\xA7 \xF0\x9F\x98\x80";
    EXPECT_EQ(encode_utf8(decode_utf8(text)), text);
}

TEST(TextUtils, InvalidBytesBecomeReplacementChar) {
    std::u32string decoded = decode_utf8("a\xFF" "b\xC3");
    ASSERT_EQ(decoded.size(), 4u);
    EXPECT_EQ(decoded[1], char32_t(0xFFFD));
    EXPECT_EQ(decoded[2], U'b');
    EXPECT_EQ(decoded[3], char32_t(0xFFFD));
}

TEST(TextUtils, LengthCountsCodePoints) {
    EXPECT_EQ(utf8_length(""), 0u);
    EXPECT_EQ(utf8_length("abc"), 3u);
    // "سلام" is four letters, eight bytes
    EXPECT_EQ(utf8_length("\xD8\xB3\xD9\x84\xD8\xA7\xD9\x85"), 4u);
}

TEST(TextUtils, LowercasesLatinOnly) {
    EXPECT_EQ(to_lower("HeLLo \xC3\x89T\xC3\x89"), "hello \xC3\xA9t\xC3\xA9");
    // × stays as is
    EXPECT_EQ(to_lower("\xC3\x97"), "\xC3\x97");
    EXPECT_EQ(to_lower("\xD9\x83\xD8\xAA\xD8\xA7\xD8\xA8"), "\xD9\x83\xD8\xAA\xD8\xA7\xD8\xA8");
}

TEST(TextUtils, LowercasesKelvinAndAngstromSigns) {
    EXPECT_EQ(to_lower(char32_t(0x212A)), U'k');
    EXPECT_EQ(to_lower(char32_t(0x212B)), char32_t(0xE5));
    EXPECT_EQ(to_lower("\xE2\x84\xAA"), "k");
    EXPECT_EQ(to_lower("\xE2\x84\xAB"), "\xC3\xA5");
}

TEST(TextUtils, RecognizesUnicodeWhitespace) {
    EXPECT_TRUE(is_whitespace(U' '));
    EXPECT_TRUE(is_whitespace(U'\n'));
    EXPECT_TRUE(is_whitespace(U'\t'));
    EXPECT_TRUE(is_whitespace(0x00A0));
    EXPECT_TRUE(is_whitespace(0x2003));
    EXPECT_TRUE(is_whitespace(0x3000));
    EXPECT_FALSE(is_whitespace(U'a'));
    EXPECT_FALSE(is_whitespace(0x200B));
}

TEST(Normalizer, CollapsesWhitespaceRuns) {
    EXPECT_EQ(normalize_whitespace("  one \n\n two\t\tthree  "), "one two three");
}

TEST(Normalizer, HandlesNonBreakingSpace) {
    EXPECT_EQ(normalize_whitespace("a\xC2\xA0\xC2\xA0" "b"), "a b");
}

TEST(Normalizer, EmptyAndBlankInput) {
    EXPECT_EQ(normalize_whitespace(""), "");
    EXPECT_EQ(normalize_whitespace(" \n\t \r\n"), "");
}

TEST(Normalizer, IsIdempotent) {
    const char* samples[] = {
        "  Hello,\n world!  How are   you? ",
        "\xD9\x85\xD8\xB1\xD8\xAD\xD8\xA8\xD8\xA7\n\n\xD8\xA8\xD9\x83",
        "single",
        ""
    };
    for (const char* sample : samples) {
        std::string once = normalize_whitespace(sample);
        EXPECT_EQ(normalize_whitespace(once), once);
    }
}

TEST(TextUtils, TrimKeepsInnerWhitespace) {
    EXPECT_EQ(trim("  a  b \n"), "a  b");
    EXPECT_EQ(trim("   "), "");
}
