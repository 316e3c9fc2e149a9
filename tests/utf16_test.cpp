#include <docdelta-cpp/utf16.hpp>

#include <gtest/gtest.h>

#include <string>

using namespace docdelta_cpp;

// -- utf16_len ----------------------------------------------------------------

TEST(Utf16Len, empty_string_is_zero) {
    EXPECT_EQ(utf16_len(""), 0u);
}

TEST(Utf16Len, ascii_counts_one_per_byte) {
    EXPECT_EQ(utf16_len("Hello"), 5u);
    EXPECT_EQ(utf16_len("a\nb"), 3u);
}

TEST(Utf16Len, bmp_characters_count_one) {
    EXPECT_EQ(utf16_len("\xC3\xA9"), 1u);          // é
    EXPECT_EQ(utf16_len("\xE4\xB8\xAD\xE6\x96\x87"), 2u);  // 中文
    EXPECT_EQ(utf16_len("\xEF\xBF\xBC"), 1u);      // object replacement character
}

TEST(Utf16Len, astral_characters_count_two) {
    EXPECT_EQ(utf16_len("\xF0\x9F\x8E\x89"), 2u);  // 🎉
    EXPECT_EQ(utf16_len("a\xF0\x9F\x8E\x89" "b"), 4u);
}

TEST(Utf16Len, malformed_bytes_count_one_each) {
    EXPECT_EQ(utf16_len("\xFF"), 1u);
    EXPECT_EQ(utf16_len("a\x80" "b"), 3u);
    EXPECT_EQ(utf16_len("\xF0\x9F"), 2u);  // truncated 4-byte sequence
}

// -- Transcoding --------------------------------------------------------------

TEST(ToUtf16, encodes_surrogate_pairs) {
    const auto units = to_utf16("\xF0\x9F\x8E\x89");
    ASSERT_EQ(units.size(), 2u);
    EXPECT_EQ(units[0], u'\xD83C');
    EXPECT_EQ(units[1], u'\xDF89');
}

TEST(ToUtf16, malformed_byte_becomes_replacement) {
    const auto units = to_utf16("x\xFFy");
    ASSERT_EQ(units.size(), 3u);
    EXPECT_EQ(units[1], u'\xFFFD');
}

TEST(ToUtf16, length_agrees_with_utf16_len) {
    const auto text = std::string{"caf\xC3\xA9 \xF0\x9F\x8E\x89 \xE4\xB8\xAD"};
    EXPECT_EQ(to_utf16(text).size(), utf16_len(text));
}

TEST(ToUtf8, restores_valid_text) {
    const auto text = std::string{"caf\xC3\xA9 \xF0\x9F\x8E\x89"};
    EXPECT_EQ(to_utf8(to_utf16(text)), text);
}

TEST(ToUtf8, unpaired_surrogate_becomes_replacement) {
    const auto units = std::u16string{u'a', char16_t{0xD800}, u'b'};
    EXPECT_EQ(to_utf8(units), "a\xEF\xBF\xBD" "b");
}
